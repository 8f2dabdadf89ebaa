#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace wf::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Install the process-wide async logger from the --log_* flags (idempotent).
/// Sinks: rotating file unless --log_file is empty, stderr with --log_to_stderr.
void init();

void shutdown();

/// Emit a structured "event key=value ..." line at info level. Keys are sorted;
/// values with whitespace, quotes or '=' are quoted.
void info(std::string_view event, std::unordered_map<std::string, std::string> fields);

}  // namespace wf::log
