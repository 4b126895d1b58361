/**
 * @file event.hpp
 * @brief Classification of source-control webhook event types.
 */

#ifndef AUTOWEBHOOKDEPLOY_EVENT_HPP
#define AUTOWEBHOOKDEPLOY_EVENT_HPP

#include <optional>
#include <string>

namespace awd {

/// Event type that triggers a deployment.
inline constexpr const char *kDeployEvent = "push";

/** \brief What the gateway does with a verified delivery. */
enum class EventAction {
  Deploy, ///< Run the deploy procedure
  Ignore  ///< Acknowledge without acting
};

/**
 * Classify a declared event type.
 *
 * Only an exact, case-sensitive `push` deploys; anything else, including a
 * missing or empty header, is ignored.
 */
EventAction classify_event(const std::optional<std::string> &event_type);

} // namespace awd

#endif // AUTOWEBHOOKDEPLOY_EVENT_HPP
