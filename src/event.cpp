#include "event.hpp"

namespace awd {

EventAction classify_event(const std::optional<std::string> &event_type) {
  if (event_type && *event_type == kDeployEvent) {
    return EventAction::Deploy;
  }
  return EventAction::Ignore;
}

} // namespace awd
