/**
 * @file deploy.hpp
 * @brief Fire-and-forget launching of the external deploy procedure.
 *
 * Declares the deploy invocation record, the handle returned to callers, the
 * abstract deployer seam used by the webhook handler, and the process-backed
 * implementation.
 */

#ifndef AUTOWEBHOOKDEPLOY_DEPLOY_HPP
#define AUTOWEBHOOKDEPLOY_DEPLOY_HPP

#include <atomic>
#include <chrono>
#include <cstdint>
#include <future>
#include <list>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

#include <sys/types.h>

namespace awd {

/** \brief Lifecycle state of a deploy attempt. */
enum class DeployStatus {
  Pending,  ///< Spawned, or queued behind a running deploy
  Success,  ///< Exited with status 0
  Failure,  ///< Exited non-zero or was killed by a signal
  ExecError ///< Could not be started at all
};

/// Lowercase name of a deploy status, for logging.
const char *to_string(DeployStatus status) noexcept;

/** \brief Ephemeral record of one triggered deploy attempt. */
struct DeployInvocation {
  std::uint64_t id{0}; ///< Sequence number within this process
  std::chrono::system_clock::time_point started{}; ///< Spawn time
  DeployStatus status{DeployStatus::Pending};
  std::optional<int> exit_code; ///< Set when the process exited normally
  std::optional<int> signal;    ///< Set when the process was killed
  std::string error;            ///< Reason for ExecError / wait failures
  std::string event;            ///< Event type of the originating delivery
};

/**
 * Completion handle for a deploy attempt.
 *
 * Request handling never waits on it; it exists so that logging and tests can
 * observe the final outcome.
 */
class DeployHandle {
public:
  DeployHandle() = default;
  explicit DeployHandle(std::shared_future<DeployInvocation> future)
      : future_(std::move(future)) {}

  /// True when the handle refers to an invocation.
  bool valid() const { return future_.valid(); }

  /// True once the invocation reached a final status.
  bool ready() const;

  /// Block until the invocation finished, or until @p timeout elapses.
  /// @return The final record, or `std::nullopt` on timeout.
  std::optional<DeployInvocation>
  wait_for(std::chrono::milliseconds timeout) const;

private:
  std::shared_future<DeployInvocation> future_;
};

/**
 * Seam between the webhook handler and whatever runs deployments.
 */
class Deployer {
public:
  virtual ~Deployer() = default;

  /**
   * Start a deployment for a delivery of @p event_type.
   *
   * Must return as soon as the deployment has been started; completion is
   * reported through the handle and the log only.
   */
  virtual DeployHandle invoke(const std::string &event_type) = 0;

  /// Human-readable description of what invoke() runs, for logging.
  virtual std::string target() const = 0;
};

/** \brief Settings for launching the deploy script. */
struct DeploySettings {
  std::string script_path;         ///< Deploy script, run with no arguments
  std::string interpreter{"bash"}; ///< Program used to run the script
  bool single_flight{false}; ///< Keep at most one deploy process running
  std::vector<std::string> scrubbed_env{
      "AWD_WEBHOOK_SECRET",
      "NODE1_WEBHOOK_SECRET"}; ///< Variables removed from the child env
};

/**
 * Runs the deploy script as a detached child process.
 *
 * Each spawned process gets a monitor thread that waits for it, logs the
 * outcome and resolves the handle. Without single-flight, overlapping
 * invocations run concurrently. With single-flight, invocations that arrive
 * while a deploy runs coalesce into one follow-up run.
 */
class DeployInvoker : public Deployer {
public:
  explicit DeployInvoker(DeploySettings settings);

  /// Waits for running deploys and their monitors; never kills them.
  ~DeployInvoker() override;

  DeployInvoker(const DeployInvoker &) = delete;
  DeployInvoker &operator=(const DeployInvoker &) = delete;

  DeployHandle invoke(const std::string &event_type) override;

  std::string target() const override;

  /// Number of deploy processes currently running.
  int active() const;

  const DeploySettings &settings() const { return settings_; }

private:
  struct Monitor {
    std::thread thread;
    std::shared_ptr<std::atomic<bool>> done;
  };

  void start_locked(const std::string &event_type,
                    std::promise<DeployInvocation> promise);
  void monitor(pid_t pid, DeployInvocation invocation,
               std::promise<DeployInvocation> promise,
               std::shared_ptr<std::atomic<bool>> done);
  void reap_finished_locked();
  std::vector<std::string> child_environment() const;

  DeploySettings settings_;
  mutable std::mutex mutex_;
  std::list<Monitor> monitors_;
  std::uint64_t next_id_{0};
  int active_{0};
  std::optional<std::promise<DeployInvocation>> pending_promise_;
  std::shared_future<DeployInvocation> pending_future_;
  std::string pending_event_;
};

} // namespace awd

#endif // AUTOWEBHOOKDEPLOY_DEPLOY_HPP
