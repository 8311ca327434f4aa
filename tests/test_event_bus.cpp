#include "tw/diagnostics/event_bus.h"

#include <cassert>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <utility>
#include <vector>

#include "test_support.h"
#include "tw/error.h"

namespace {

using tw::diagnostics::Event;
using tw::diagnostics::EventBus;
using tw::diagnostics::EventSeverity;
using tw::diagnostics::FieldPrivacy;

std::vector<std::string> ReadLines(const std::filesystem::path& path) {
  std::ifstream in(path);
  std::vector<std::string> lines;
  for (std::string line; std::getline(in, line);) {
    lines.push_back(line);
  }
  return lines;
}

Event MakeEvent(EventSeverity severity, std::string id) {
  Event event;
  event.severity = severity;
  event.event_id = std::move(id);
  return event;
}

void TestHashing() {
  assert(tw::diagnostics::HashForTelemetry("abc") ==
         "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
  assert(tw::diagnostics::HashForTelemetry("").empty());
  assert(tw::diagnostics::HashTag("abc").rfind("hash:ba7816bf", 0) == 0);
}

void TestEscapeJson() {
  assert(tw::diagnostics::EscapeJson("a\"b\\c") == "a\\\"b\\\\c");
  assert(tw::diagnostics::EscapeJson("line\nnext\t") == "line\\nnext\\t");
  assert(tw::diagnostics::EscapeJson(std::string("\x01", 1)) == "\\u0001");
}

void TestFieldPrivacy() {
  Event event = MakeEvent(EventSeverity::kWarning, "sample");
  event.message = "plain message";
  event.fields.emplace_back("count", "3", FieldPrivacy::kPublic, true);
  event.fields.emplace_back("secret", "s3cr3t", FieldPrivacy::kRedact);
  event.fields.emplace_back("digest", "abc", FieldPrivacy::kHash);
  event.fields.emplace_back("where", "/etc/passwd");
  event.fields.emplace_back("path", "relative");
  const auto json = tw::diagnostics::FormatEventJson(event, "2026-01-01T00:00:00.000000Z");
  assert(json.rfind("{\"ts\":\"2026-01-01T00:00:00.000000Z\",\"severity\":\"warning\"", 0) == 0);
  assert(json.find("\"event_id\":\"sample\"") != std::string::npos);
  assert(json.find("\"message\":\"plain message\"") != std::string::npos);
  assert(json.find("\"count\":3") != std::string::npos && "numeric fields are unquoted");
  assert(json.find("\"secret\":\"[REDACTED]\"") != std::string::npos);
  assert(json.find("\"digest\":\"hash:ba7816bf") != std::string::npos);
  assert(json.find("/etc/passwd") == std::string::npos && "path-like values are hashed");
  assert(json.find("relative") == std::string::npos && "path-named fields are hashed");
  assert(json.back() == '}');

  Event failure = MakeEvent(EventSeverity::kError, "failure");
  failure.message = "detail that may leak";
  const auto failure_json = tw::diagnostics::FormatEventJson(failure, "t");
  assert(failure_json.find("detail that may leak") == std::string::npos);
  assert(failure_json.find("\"message\":\"hash:") != std::string::npos);
}

void TestSubscribersRunInOrder() {
  tw::diagnostics::ResetEventBusForTesting();
  auto& bus = EventBus::Instance();
  std::vector<std::string> seen;
  bus.Subscribe([&seen](const Event& event) { seen.push_back("first:" + event.event_id); });
  bus.Subscribe([&seen](const Event& event) { seen.push_back("second:" + event.event_id); });
  assert(bus.SubscriberCount() == 2);
  bus.Publish(MakeEvent(EventSeverity::kInfo, "ping"));
  assert((seen == std::vector<std::string>{"first:ping", "second:ping"}));

  tw::diagnostics::ResetEventBusForTesting();
  assert(EventBus::Instance().SubscriberCount() == 0);
  EventBus::Instance().Publish(MakeEvent(EventSeverity::kInfo, "ignored"));
  assert(seen.size() == 2);
}

void TestRecursivePublishIsSuppressed() {
  tw::diagnostics::ResetEventBusForTesting();
  int calls = 0;
  EventBus::Instance().Subscribe([&calls](const Event& event) {
    ++calls;
    EventBus::Instance().Publish(event);
  });
  EventBus::Instance().Publish(MakeEvent(EventSeverity::kInfo, "loop"));
  assert(calls == 1);
  tw::diagnostics::ResetEventBusForTesting();
}

void TestJsonLineLoggerFiltersAndRotates() {
  tw::test::TempDir dir("tw_event_bus_");
  const auto log_path = dir.path() / "logs" / "treewalk.log";
  tw::diagnostics::JsonLineLogger logger(log_path, 400, EventSeverity::kInfo);
  assert(std::filesystem::exists(log_path.parent_path()) && "parent directory is created");

  logger.Log(MakeEvent(EventSeverity::kDebug, "too_quiet"));
  logger.Log(MakeEvent(EventSeverity::kInfo, "kept"));
  auto lines = ReadLines(log_path);
  assert(lines.size() == 1);
  assert(lines[0].find("\"event_id\":\"kept\"") != std::string::npos);

  for (int i = 0; i < 10; ++i) {
    logger.Log(MakeEvent(EventSeverity::kWarning, "filler_" + std::to_string(i)));
  }
  assert(std::filesystem::exists(log_path.string() + ".1") && "log rotates at the size limit");
  assert(std::filesystem::file_size(log_path) <= 400);
}

void TestLoggerOpenFailure() {
  tw::test::TempDir dir("tw_event_bus_fail_");
  tw::test::WriteFile(dir.path() / "blocker", "x");
  bool threw = false;
  try {
    tw::diagnostics::JsonLineLogger logger(dir.path() / "blocker" / "log.jsonl", 1024);
  } catch (const tw::Error& err) {
    threw = true;
    assert(err.domain == tw::ErrorDomain::IO);
    assert(err.code == tw::errors::io::kLogOpenFailed);
  }
  assert(threw);
}

void TestSeverityParsing() {
  assert(tw::diagnostics::ParseSeverity("WARNING") == EventSeverity::kWarning);
  assert(tw::diagnostics::ParseSeverity("debug") == EventSeverity::kDebug);
  assert(!tw::diagnostics::ParseSeverity("loud").has_value());
}

} // namespace

int main() {
  TestHashing();
  TestEscapeJson();
  TestFieldPrivacy();
  TestSubscribersRunInOrder();
  TestRecursivePublishIsSuppressed();
  TestJsonLineLoggerFiltersAndRotates();
  TestLoggerOpenFailure();
  TestSeverityParsing();
  std::cout << "event bus test ok\n";
  return 0;
}
