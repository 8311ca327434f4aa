#pragma once

#include <cstddef>
#include <filesystem>
#include <optional>

#include "tw/diagnostics/event.h"

namespace tw {

inline constexpr std::size_t kDefaultLogMaxBytes = 10 * 1024 * 1024; // 10 MiB

// Process configuration, read from TW_* environment variables. Malformed
// values fall back to the defaults below.
struct Config {
  std::optional<std::filesystem::path> log_path;                      // TW_LOG_PATH
  diagnostics::EventSeverity log_level{diagnostics::EventSeverity::kInfo}; // TW_LOG_LEVEL
  std::size_t log_max_bytes{kDefaultLogMaxBytes};                     // TW_LOG_MAX_SIZE
  bool trace_traversal{false};                                        // TW_TRACE_TRAVERSAL
  int max_depth{-1};                                                  // TW_MAX_DEPTH
};

Config LoadConfigFromEnvironment();

// Copy of the process configuration, loaded from the environment on first use.
Config ActiveConfig();

// Replaces the active configuration; nullopt re-reads the environment on the
// next ActiveConfig() call.
void SetActiveConfigForTesting(std::optional<Config> config);

// Subscribes a JsonLineLogger to the event bus when a log path is configured.
// Returns false when there is nothing to install.
bool InstallDefaultLogging(const Config& config);

} // namespace tw
