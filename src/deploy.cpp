#include "deploy.hpp"
#include "log.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <utility>

#include <signal.h>
#include <spawn.h>
#include <sys/wait.h>
#include <unistd.h>

extern char **environ;

namespace awd {

namespace {

std::shared_ptr<spdlog::logger> deploy_log() {
  static auto logger = [] {
    ensure_default_logger();
    return category_logger("deploy");
  }();
  return logger;
}

double seconds_since(std::chrono::system_clock::time_point start) {
  return std::chrono::duration<double>(std::chrono::system_clock::now() -
                                       start)
      .count();
}

/// Owns a posix_spawnattr_t for the duration of one spawn.
class SpawnAttributes {
public:
  SpawnAttributes() {
    int rc = posix_spawnattr_init(&attr_);
    if (rc != 0) {
      throw std::system_error(rc, std::generic_category(),
                              "posix_spawnattr_init");
    }
    short flags = 0;
#ifdef POSIX_SPAWN_SETSID
    flags |= POSIX_SPAWN_SETSID;
#else
    flags |= POSIX_SPAWN_SETPGROUP;
    posix_spawnattr_setpgroup(&attr_, 0);
#endif
    posix_spawnattr_setflags(&attr_, flags);
  }
  ~SpawnAttributes() { posix_spawnattr_destroy(&attr_); }

  SpawnAttributes(const SpawnAttributes &) = delete;
  SpawnAttributes &operator=(const SpawnAttributes &) = delete;

  const posix_spawnattr_t *get() const { return &attr_; }

private:
  posix_spawnattr_t attr_{};
};

std::vector<char *> to_argv(std::vector<std::string> &values) {
  std::vector<char *> out;
  out.reserve(values.size() + 1);
  for (auto &value : values) {
    out.push_back(value.data());
  }
  out.push_back(nullptr);
  return out;
}

} // namespace

const char *to_string(DeployStatus status) noexcept {
  switch (status) {
  case DeployStatus::Pending:
    return "pending";
  case DeployStatus::Success:
    return "success";
  case DeployStatus::Failure:
    return "failure";
  case DeployStatus::ExecError:
    return "exec_error";
  }
  return "unknown";
}

bool DeployHandle::ready() const {
  return future_.valid() && future_.wait_for(std::chrono::seconds(0)) ==
                                std::future_status::ready;
}

std::optional<DeployInvocation>
DeployHandle::wait_for(std::chrono::milliseconds timeout) const {
  if (!future_.valid() ||
      future_.wait_for(timeout) != std::future_status::ready) {
    return std::nullopt;
  }
  return future_.get();
}

DeployInvoker::DeployInvoker(DeploySettings settings)
    : settings_(std::move(settings)) {
  if (settings_.interpreter.empty()) {
    settings_.interpreter = "bash";
  }
}

DeployInvoker::~DeployInvoker() {
  while (true) {
    std::list<Monitor> running;
    {
      std::lock_guard<std::mutex> lk(mutex_);
      if (monitors_.empty()) {
        break;
      }
      running.splice(running.end(), monitors_);
    }
    if (std::any_of(running.begin(), running.end(),
                    [](const Monitor &m) { return !m.done->load(); })) {
      deploy_log()->info("Waiting for running deploy to finish");
    }
    for (auto &m : running) {
      if (m.thread.joinable()) {
        m.thread.join();
      }
    }
  }
}

std::string DeployInvoker::target() const {
  return settings_.interpreter + " " + settings_.script_path;
}

int DeployInvoker::active() const {
  std::lock_guard<std::mutex> lk(mutex_);
  return active_;
}

DeployHandle DeployInvoker::invoke(const std::string &event_type) {
  std::lock_guard<std::mutex> lk(mutex_);
  reap_finished_locked();
  if (settings_.single_flight && active_ > 0) {
    if (!pending_promise_) {
      pending_promise_.emplace();
      pending_future_ = pending_promise_->get_future().share();
      pending_event_ = event_type;
      deploy_log()->info(
          "Deploy already running; queued one follow-up run (event={})",
          event_type);
    } else {
      deploy_log()->info("Deploy already running and follow-up queued; "
                         "coalescing delivery (event={})",
                         event_type);
    }
    return DeployHandle(pending_future_);
  }
  std::promise<DeployInvocation> promise;
  DeployHandle handle(promise.get_future().share());
  start_locked(event_type, std::move(promise));
  return handle;
}

void DeployInvoker::start_locked(const std::string &event_type,
                                 std::promise<DeployInvocation> promise) {
  DeployInvocation invocation;
  invocation.id = ++next_id_;
  invocation.started = std::chrono::system_clock::now();
  invocation.event = event_type;

  auto exec_error = [&](const std::string &reason) {
    invocation.status = DeployStatus::ExecError;
    invocation.error = reason;
    deploy_log()->error("Deploy #{} could not be started: {}", invocation.id,
                        reason);
    promise.set_value(std::move(invocation));
  };

  std::error_code ec;
  if (settings_.script_path.empty()) {
    exec_error("no deploy script configured");
    return;
  }
  if (!std::filesystem::is_regular_file(settings_.script_path, ec)) {
    exec_error("deploy script not found: " + settings_.script_path);
    return;
  }

  std::vector<std::string> args{settings_.interpreter, settings_.script_path};
  auto argv = to_argv(args);
  auto env_values = child_environment();
  auto envp = to_argv(env_values);

  pid_t pid = -1;
  int rc = 0;
  try {
    SpawnAttributes attributes;
    rc = posix_spawnp(&pid, settings_.interpreter.c_str(), nullptr,
                      attributes.get(), argv.data(), envp.data());
  } catch (const std::system_error &e) {
    exec_error(e.what());
    return;
  }
  if (rc != 0) {
    exec_error("failed to spawn '" + settings_.interpreter +
               "': " + std::strerror(rc));
    return;
  }

  ++active_;
  deploy_log()->info("Deploy #{} started: {} {} (pid {}, event={})",
                     invocation.id, settings_.interpreter,
                     settings_.script_path, pid, invocation.event);
  auto done = std::make_shared<std::atomic<bool>>(false);
  Monitor entry;
  entry.done = done;
  entry.thread = std::thread(
      [this, pid, invocation = std::move(invocation),
       promise = std::move(promise), done]() mutable {
        monitor(pid, std::move(invocation), std::move(promise), done);
      });
  monitors_.push_back(std::move(entry));
}

void DeployInvoker::monitor(pid_t pid, DeployInvocation invocation,
                            std::promise<DeployInvocation> promise,
                            std::shared_ptr<std::atomic<bool>> done) {
  int status = 0;
  pid_t waited = -1;
  do {
    waited = ::waitpid(pid, &status, 0);
  } while (waited < 0 && errno == EINTR);

  const double elapsed = seconds_since(invocation.started);
  if (waited < 0) {
    invocation.status = DeployStatus::Failure;
    invocation.error = std::string("waitpid failed: ") + std::strerror(errno);
    deploy_log()->error("Deploy #{} could not be awaited: {}", invocation.id,
                        invocation.error);
  } else if (WIFEXITED(status)) {
    invocation.exit_code = WEXITSTATUS(status);
    if (*invocation.exit_code == 0) {
      invocation.status = DeployStatus::Success;
      deploy_log()->info("Deploy #{} succeeded in {:.1f}s", invocation.id,
                         elapsed);
    } else {
      invocation.status = DeployStatus::Failure;
      deploy_log()->error("Deploy #{} failed with exit code {} after {:.1f}s",
                          invocation.id, *invocation.exit_code, elapsed);
    }
  } else if (WIFSIGNALED(status)) {
    invocation.signal = WTERMSIG(status);
    invocation.status = DeployStatus::Failure;
    deploy_log()->error("Deploy #{} terminated by signal {} after {:.1f}s",
                        invocation.id, *invocation.signal, elapsed);
  } else {
    invocation.status = DeployStatus::Failure;
    invocation.error = "unexpected wait status";
    deploy_log()->error("Deploy #{} ended with unexpected wait status {}",
                        invocation.id, status);
  }

  {
    std::lock_guard<std::mutex> lk(mutex_);
    --active_;
    if (pending_promise_) {
      auto follow_up = std::move(*pending_promise_);
      pending_promise_.reset();
      pending_future_ = {};
      deploy_log()->info("Starting queued follow-up deploy");
      start_locked(pending_event_, std::move(follow_up));
    }
  }
  promise.set_value(std::move(invocation));
  done->store(true);
}

void DeployInvoker::reap_finished_locked() {
  for (auto it = monitors_.begin(); it != monitors_.end();) {
    if (it->done->load()) {
      if (it->thread.joinable()) {
        it->thread.join();
      }
      it = monitors_.erase(it);
    } else {
      ++it;
    }
  }
}

std::vector<std::string> DeployInvoker::child_environment() const {
  std::vector<std::string> env;
  for (char **entry = environ; entry != nullptr && *entry != nullptr;
       ++entry) {
    std::string value(*entry);
    auto eq = value.find('=');
    std::string name = value.substr(0, eq);
    if (std::find(settings_.scrubbed_env.begin(), settings_.scrubbed_env.end(),
                  name) != settings_.scrubbed_env.end()) {
      continue;
    }
    env.push_back(std::move(value));
  }
  return env;
}

} // namespace awd
