#pragma once

#include <string>

#include <spdlog/spdlog.h>

namespace mbdb {

// ── Logger façade ─────────────────────────────────────────────────────────────

// Initialize the global default logger used by the loader, the formatter and
// the command-line tools. Output goes to stderr so that listings written to
// stdout can be piped without interleaved diagnostics.
// Call once at program start before any logging.
void init_default_logger(spdlog::level::level_enum level = spdlog::level::warn);

// Parse a log-level string from CLI args ("trace", "debug", "info", …).
// Returns spdlog::level::info on unrecognised input.
spdlog::level::level_enum parse_log_level(const std::string& s);

} // namespace mbdb
