#include "log.hpp"
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <memory>
#include <mutex>
#include <string>
#include <system_error>
#include <unordered_map>
#include <vector>
#include <zlib.h>

#include <spdlog/async.h>
#include <spdlog/async_logger.h>
#include <spdlog/details/os.h>
#include <spdlog/sinks/basic_file_sink.h>
#include <spdlog/sinks/dist_sink.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

namespace {
constexpr const char *kRootLoggerName = "awd";
constexpr std::size_t kMaxLogFileBytes = 1024 * 1024 * 5;

std::weak_ptr<spdlog::logger> g_logger;
/// Single sink shared by every `awd` logger; its children can be replaced.
std::shared_ptr<spdlog::sinks::dist_sink_mt> g_dist_sink;
std::string g_log_file;
std::mutex g_logger_mutex;
std::mutex g_thread_pool_mutex;

/// Create the shared async pool, again if spdlog::shutdown() released it.
void ensure_thread_pool() {
  std::lock_guard<std::mutex> lk(g_thread_pool_mutex);
  if (!spdlog::thread_pool()) {
    constexpr std::size_t queue_size = 8192;
    constexpr std::size_t num_threads = 1;
    spdlog::init_thread_pool(queue_size, num_threads);
  }
}

namespace fs = std::filesystem;

/**
 * Compute the filesystem path of a rotated log file.
 *
 * `gateway.log` rotated once becomes `gateway.1.log`, matching the naming of
 * spdlog's rotating sink.
 */
fs::path rotated_path(const std::string &base, std::size_t index) {
  fs::path base_path(base);
  if (index == 0) {
    return base_path;
  }
  fs::path parent = base_path.parent_path();
  std::string stem = base_path.stem().string();
  std::string ext = base_path.extension().string();
  if (stem.empty()) {
    stem = base_path.filename().string();
    ext.clear();
  }
  std::string rotated = stem + "." + std::to_string(index) + ext;
  return parent.empty() ? fs::path(rotated) : parent / rotated;
}

/// Shift existing `.gz` archives one slot up, dropping the oldest.
void shift_compressed_logs(const std::string &base, std::size_t max_files) {
  if (max_files == 0) {
    return;
  }
  std::error_code ec;
  fs::remove(rotated_path(base, max_files).string() + ".gz", ec);
  for (std::size_t i = max_files; i > 1; --i) {
    fs::path src_gz(rotated_path(base, i - 1).string() + ".gz");
    if (!fs::exists(src_gz, ec)) {
      continue;
    }
    fs::path target_gz(rotated_path(base, i).string() + ".gz");
    fs::remove(target_gz, ec);
    fs::rename(src_gz, target_gz, ec);
  }
}

/**
 * Gzip a rotated log file in place.
 *
 * The logging system itself is mid-rotation when this runs, so failures are
 * reported on stderr instead of through a logger.
 *
 * @return `true` if the archive was written and the source removed.
 */
bool gzip_file(const std::string &path) {
  std::ifstream input(path, std::ios::binary);
  if (!input) {
    return false;
  }
  const std::string gz_path = path + ".gz";
  gzFile gz = gzopen(gz_path.c_str(), "wb");
  if (gz == nullptr) {
    return false;
  }
  char buffer[16 * 1024];
  bool ok = true;
  while (ok && input) {
    input.read(buffer, sizeof(buffer));
    std::streamsize read = input.gcount();
    if (read > 0) {
      int written = gzwrite(gz, buffer, static_cast<unsigned>(read));
      ok = written == read;
    }
  }
  gzclose(gz);
  input.close();
  std::error_code ec;
  if (!ok) {
    fs::remove(fs::path(gz_path), ec);
    std::fputs("awd: failed to compress rotated log\n", stderr);
    return false;
  }
  fs::remove(fs::path(path), ec);
  return true;
}

std::vector<spdlog::sink_ptr> make_sinks(const std::string &file,
                                        std::size_t rotate_files,
                                        bool compress_rotations) {
  std::vector<spdlog::sink_ptr> sinks;
  sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  if (file.empty()) {
    return sinks;
  }
  if (rotate_files == 0) {
    sinks.push_back(
        std::make_shared<spdlog::sinks::basic_file_sink_mt>(file, false));
    return sinks;
  }
  spdlog::file_event_handlers handlers;
  if (compress_rotations) {
    handlers.before_open = [rotate_files](const spdlog::filename_t &filename) {
      const auto base = spdlog::details::os::filename_to_str(filename);
      shift_compressed_logs(base, rotate_files);
      fs::path newest = rotated_path(base, 1);
      std::error_code ec;
      if (fs::exists(newest, ec)) {
        gzip_file(newest.string());
      }
    };
  }
  sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
      file, kMaxLogFileBytes, rotate_files, false, handlers));
  return sinks;
}

std::shared_ptr<spdlog::logger>
make_async_logger(const std::string &name,
                  const std::vector<spdlog::sink_ptr> &sinks) {
  ensure_thread_pool();
  auto pool = spdlog::thread_pool();
  return std::make_shared<spdlog::async_logger>(
      name, sinks.begin(), sinks.end(), pool,
      spdlog::async_overflow_policy::block);
}
} // namespace

namespace awd {

void init_logger(spdlog::level::level_enum level, const std::string &pattern,
                 const std::string &file, std::size_t rotate_files,
                 bool compress_rotations) {
  ensure_thread_pool();
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(kRootLoggerName);
  if (!logger || !g_dist_sink) {
    g_dist_sink = std::make_shared<spdlog::sinks::dist_sink_mt>();
    g_dist_sink->set_sinks(make_sinks(file, rotate_files, compress_rotations));
    g_log_file = file;
    logger = make_async_logger(kRootLoggerName, {g_dist_sink});
    spdlog::set_default_logger(logger);
    g_logger = logger;
  } else if (file != g_log_file) {
    // Loggers created before this call (e.g. while parsing the command line)
    // share the distributing sink, so they pick up the file as well.
    g_dist_sink->set_sinks(make_sinks(file, rotate_files, compress_rotations));
    g_log_file = file;
  }
  lock.unlock();
  const std::string prefix = std::string(kRootLoggerName) + ".";
  spdlog::apply_all([&](const std::shared_ptr<spdlog::logger> &l) {
    if (l->name() == kRootLoggerName || l->name().rfind(prefix, 0) == 0) {
      l->set_level(level);
    }
  });
  if (!pattern.empty()) {
    spdlog::set_pattern(pattern);
  }
  logger->debug("Logger initialised (level={}, file='{}', rotate={}, "
                "compress={})",
                spdlog::level::to_string_view(level), file, rotate_files,
                compress_rotations ? "true" : "false");
}

void ensure_default_logger() {
  auto logger = spdlog::default_logger();
  auto locked = g_logger.lock();
  if (!logger || !locked || logger.get() != locked.get()) {
    init_logger(spdlog::level::info);
  }
}

std::shared_ptr<spdlog::logger> category_logger(const std::string &category) {
  ensure_thread_pool();
  const std::string name = std::string(kRootLoggerName) + "." + category;
  std::unique_lock<std::mutex> lock(g_logger_mutex);
  auto logger = spdlog::get(name);
  if (logger) {
    return logger;
  }
  auto root = g_logger.lock();
  if (!root) {
    lock.unlock();
    init_logger(spdlog::level::info);
    lock.lock();
    logger = spdlog::get(name);
    if (logger) {
      return logger;
    }
    root = g_logger.lock();
  }
  std::vector<spdlog::sink_ptr> sinks;
  if (root) {
    sinks = root->sinks();
  } else {
    sinks.push_back(std::make_shared<spdlog::sinks::stdout_color_sink_mt>());
  }
  auto created = make_async_logger(name, sinks);
  created->set_level(root ? root->level() : spdlog::level::info);
  spdlog::register_logger(created);
  return created;
}

void configure_log_categories(
    const std::unordered_map<std::string, spdlog::level::level_enum>
        &overrides) {
  if (overrides.empty()) {
    return;
  }
  for (const auto &[category, level] : overrides) {
    auto logger = category_logger(category);
    logger->set_level(level);
    logger->debug("Category '{}' set to level {}", category,
                  spdlog::level::to_string_view(level));
  }
  category_logger("logging")->info("Applied {} log category override(s)",
                                   overrides.size());
}

const char *log_category_help_text() {
  return "Log categories: app, config, http, webhook, security, deploy, "
         "client, logging";
}

} // namespace awd
