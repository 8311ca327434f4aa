#pragma once

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <fstream>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include "tw/diagnostics/event.h"

namespace tw::diagnostics {

// Lowercase hex SHA-256 of the input; empty input yields an empty string.
std::string HashForTelemetry(std::string_view input);

// "hash:<digest>" replacement used for paths and hashed fields.
std::string HashTag(std::string_view value);

std::string EscapeJson(std::string_view text);

// One JSON object, no trailing newline. Field privacy is applied here.
std::string FormatEventJson(const Event& event, const std::string& timestamp);

class JsonLineLogger {
 public:
  // Opens (appending) the log file, creating its parent directory.
  // Throws IO/kLogOpenFailed when the file cannot be opened.
  JsonLineLogger(std::filesystem::path path, std::size_t max_bytes,
                 EventSeverity min_severity = EventSeverity::kInfo);

  JsonLineLogger(const JsonLineLogger&) = delete;
  JsonLineLogger& operator=(const JsonLineLogger&) = delete;

  void Log(const Event& event);

  const std::filesystem::path& path() const noexcept { return log_path_; }
  EventSeverity min_severity() const noexcept { return min_severity_; }

 private:
  static std::string FormatTimestamp(std::chrono::system_clock::time_point tp);
  bool EnsureOpen();
  void RotateIfNeeded(std::size_t incoming_bytes);

  std::mutex mutex_;
  std::ofstream stream_;
  std::filesystem::path log_path_;
  std::size_t max_bytes_;
  EventSeverity min_severity_;
  static constexpr std::size_t kMaxFiles = 3;
};

// Process-wide synchronous publisher. Subscribers run on the publishing
// thread, in subscription order.
class EventBus {
 public:
  using Subscriber = std::function<void(const Event&)>;

  static EventBus& Instance();

  void Publish(const Event& event);
  void Subscribe(Subscriber fn);
  std::size_t SubscriberCount() const;

 private:
  using SubscriberList = std::vector<Subscriber>;

  std::shared_ptr<const SubscriberList> subscribers_snapshot_;
  mutable std::mutex subscribers_mutex_;
};

// Drops the singleton together with every subscriber.
void ResetEventBusForTesting();

} // namespace tw::diagnostics
