#include "common/logging/log.hpp"

#include <map>
#include <mutex>
#include <vector>

#include <gflags/gflags.h>
#include <spdlog/async.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

DECLARE_string(log_level);
DECLARE_string(log_file);
DECLARE_int32(log_max_size);
DECLARE_int32(log_max_files);
DECLARE_bool(log_to_stderr);
DECLARE_string(log_flush_level);

namespace {

constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e] [%l] [t%t] %v";

auto parse_log_level(const std::string& level, spdlog::level::level_enum fallback) -> spdlog::level::level_enum {
  if (level == "trace") return spdlog::level::trace;
  if (level == "debug") return spdlog::level::debug;
  if (level == "info") return spdlog::level::info;
  if (level == "warn") return spdlog::level::warn;
  if (level == "error") return spdlog::level::err;
  if (level == "critical") return spdlog::level::critical;
  if (level == "off") return spdlog::level::off;
  return fallback;
}

auto needs_quotes(const std::string& value) -> bool {
  return value.empty() || value.find_first_of(" \t\"=") != std::string::npos;
}

// key="value with spaces" keeps structured lines splittable on whitespace.
auto quote(const std::string& value) -> std::string {
  std::string out = "\"";
  for (char c : value) {
    if (c == '"' || c == '\\') {
      out += '\\';
    }
    out += c;
  }
  out += '"';
  return out;
}

}  // namespace

namespace wf::log {

namespace {
  std::mutex g_mutex;
  std::shared_ptr<spdlog::async_logger> g_logger;
}

void init() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_logger) {
    return;
  }

  std::vector<std::shared_ptr<spdlog::sinks::sink>> sinks;
  if (!FLAGS_log_file.empty()) {
    const auto max_size = static_cast<size_t>(std::max(FLAGS_log_max_size, 1024));
    const auto max_files = static_cast<size_t>(std::max(FLAGS_log_max_files, 1));
    sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(FLAGS_log_file, max_size, max_files));
  }
  if (FLAGS_log_to_stderr) {
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
  }

  const auto level = parse_log_level(FLAGS_log_level, spdlog::level::info);
  spdlog::init_thread_pool(8192, 1);
  g_logger = std::make_shared<spdlog::async_logger>(
      "wf_engine", sinks.begin(), sinks.end(), spdlog::thread_pool(),
      spdlog::async_overflow_policy::block);
  g_logger->set_level(level);
  g_logger->flush_on(parse_log_level(FLAGS_log_flush_level, spdlog::level::warn));

  spdlog::set_default_logger(g_logger);
  spdlog::set_pattern(kPattern);
  spdlog::info("Logger initialized: file={}, level={}, stderr={}",
               FLAGS_log_file.empty() ? "-" : FLAGS_log_file, FLAGS_log_level, FLAGS_log_to_stderr);
}

void shutdown() {
  std::lock_guard<std::mutex> lock(g_mutex);
  if (g_logger) {
    g_logger->flush();
    spdlog::shutdown();
    g_logger.reset();
  }
}

void info(std::string_view event, std::unordered_map<std::string, std::string> fields) {
  std::map<std::string, std::string> ordered(fields.begin(), fields.end());
  std::string msg{event};
  for (const auto& [key, value] : ordered) {
    msg += " " + key + "=" + (needs_quotes(value) ? quote(value) : value);
  }
  spdlog::info(msg);
}

}  // namespace wf::log
