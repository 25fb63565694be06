#pragma once

#include <spdlog/spdlog.h>
#include <memory>
#include <string>
#include <string_view>
#include <unordered_map>

namespace gp::log {

using spdlog::trace;
using spdlog::debug;
using spdlog::info;
using spdlog::warn;
using spdlog::error;
using spdlog::critical;

/// Install the process logger configured by --log_* flags. Idempotent.
void init();

void shutdown();

void info(std::string_view event, std::unordered_map<std::string, std::string> fields);

}  // namespace gp::log
