#pragma once

#include "core/logger.h"

#include <memory>
#include <string>

namespace dagrun::infra {

/// Create the spdlog-backed console logger.
/// Format: [ts] [level] [trace_id] [component] event: msg
/// `level` is an spdlog level name ("trace", "debug", "info", "warn",
/// "error", "critical", "off"); unknown names fall back to "info".
std::unique_ptr<core::ILogger> create_console_logger(const std::string &level = "info");

} // namespace dagrun::infra
