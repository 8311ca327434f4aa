#pragma once

#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace tw::diagnostics {

// Structured logging primitives.
enum class EventSeverity { kDebug, kInfo, kWarning, kError, kCritical };

enum class EventCategory { kTelemetry, kLifecycle, kDiagnostics };

enum class FieldPrivacy { kPublic, kRedact, kHash };

struct EventField {
  std::string key;
  std::string value;
  FieldPrivacy privacy{FieldPrivacy::kPublic};
  bool numeric{false};

  EventField(std::string k, std::string v, FieldPrivacy p = FieldPrivacy::kPublic,
             bool is_numeric = false)
      : key(std::move(k)), value(std::move(v)), privacy(p), numeric(is_numeric) {}
};

struct Event {
  EventCategory category{EventCategory::kDiagnostics};
  EventSeverity severity{EventSeverity::kInfo};
  std::string event_id;
  std::string message;
  std::vector<EventField> fields;
};

const char* SeverityToString(EventSeverity severity);
const char* CategoryToString(EventCategory category);

// Accepts the names produced by SeverityToString, case-insensitively.
std::optional<EventSeverity> ParseSeverity(std::string_view text);

} // namespace tw::diagnostics
