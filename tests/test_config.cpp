#include "tw/config.h"

#include <cassert>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <optional>
#include <string>

#include "test_support.h"
#include "tw/diagnostics/event_bus.h"

namespace {

const char* const kVariables[] = {"TW_LOG_PATH", "TW_LOG_LEVEL", "TW_LOG_MAX_SIZE",
                                  "TW_TRACE_TRAVERSAL", "TW_MAX_DEPTH"};

void ClearEnvironment() {
  for (const char* name : kVariables) {
#if defined(_WIN32)
    _putenv_s(name, "");
#else
    ::unsetenv(name);
#endif
  }
}

void SetEnv(const char* name, const char* value) {
#if defined(_WIN32)
  _putenv_s(name, value);
#else
  ::setenv(name, value, 1);
#endif
}

void TestDefaults() {
  ClearEnvironment();
  const auto config = tw::LoadConfigFromEnvironment();
  assert(!config.log_path.has_value());
  assert(config.log_level == tw::diagnostics::EventSeverity::kInfo);
  assert(config.log_max_bytes == tw::kDefaultLogMaxBytes);
  assert(!config.trace_traversal);
  assert(config.max_depth == -1);
}

void TestValuesAreParsed() {
  ClearEnvironment();
  SetEnv("TW_LOG_PATH", "/tmp/treewalk.log");
  SetEnv("TW_LOG_LEVEL", "Error");
  SetEnv("TW_LOG_MAX_SIZE", "2048");
  SetEnv("TW_TRACE_TRAVERSAL", "yes");
  SetEnv("TW_MAX_DEPTH", "3");
  const auto config = tw::LoadConfigFromEnvironment();
  assert(config.log_path && *config.log_path == std::filesystem::path("/tmp/treewalk.log"));
  assert(config.log_level == tw::diagnostics::EventSeverity::kError);
  assert(config.log_max_bytes == 2048);
  assert(config.trace_traversal);
  assert(config.max_depth == 3);
  ClearEnvironment();
}

void TestMalformedValuesFallBack() {
  ClearEnvironment();
  SetEnv("TW_LOG_LEVEL", "chatty");
  SetEnv("TW_LOG_MAX_SIZE", "12kb");
  SetEnv("TW_TRACE_TRAVERSAL", "maybe");
  SetEnv("TW_MAX_DEPTH", "-4");
  auto config = tw::LoadConfigFromEnvironment();
  assert(config.log_level == tw::diagnostics::EventSeverity::kInfo);
  assert(config.log_max_bytes == tw::kDefaultLogMaxBytes);
  assert(!config.trace_traversal);
  assert(config.max_depth == -1);

  SetEnv("TW_LOG_MAX_SIZE", "0");
  SetEnv("TW_MAX_DEPTH", "two");
  config = tw::LoadConfigFromEnvironment();
  assert(config.log_max_bytes == tw::kDefaultLogMaxBytes);
  assert(config.max_depth == -1);
  ClearEnvironment();
}

void TestActiveConfigOverride() {
  ClearEnvironment();
  tw::Config override_config;
  override_config.max_depth = 9;
  tw::SetActiveConfigForTesting(override_config);
  assert(tw::ActiveConfig().max_depth == 9);

  SetEnv("TW_MAX_DEPTH", "5");
  tw::SetActiveConfigForTesting(std::nullopt);
  assert(tw::ActiveConfig().max_depth == 5 && "reset re-reads the environment");
  ClearEnvironment();
  assert(tw::ActiveConfig().max_depth == 5 && "loaded once until reset");
  tw::SetActiveConfigForTesting(std::nullopt);
}

void TestHeldConfigSurvivesOverride() {
  tw::Config first;
  first.max_depth = 2;
  first.log_path = std::filesystem::path("/tmp/first.log");
  tw::SetActiveConfigForTesting(first);
  const auto& held = tw::ActiveConfig();

  tw::Config second;
  second.max_depth = 7;
  tw::SetActiveConfigForTesting(second);
  assert(held.max_depth == 2 && "a held configuration is unaffected by later overrides");
  assert(held.log_path && *held.log_path == std::filesystem::path("/tmp/first.log"));
  assert(tw::ActiveConfig().max_depth == 7);
  tw::SetActiveConfigForTesting(std::nullopt);
}

void TestInstallDefaultLogging() {
  tw::diagnostics::ResetEventBusForTesting();
  tw::Config config;
  assert(!tw::InstallDefaultLogging(config) && "no path, no logger");
  assert(tw::diagnostics::EventBus::Instance().SubscriberCount() == 0);

  tw::test::TempDir dir("tw_config_logging_");
  config.log_path = dir.path() / "treewalk.log";
  config.log_level = tw::diagnostics::EventSeverity::kWarning;
  assert(tw::InstallDefaultLogging(config));

  tw::diagnostics::Event quiet;
  quiet.severity = tw::diagnostics::EventSeverity::kInfo;
  quiet.event_id = "quiet";
  tw::diagnostics::Event loud;
  loud.severity = tw::diagnostics::EventSeverity::kWarning;
  loud.event_id = "loud";
  tw::diagnostics::EventBus::Instance().Publish(quiet);
  tw::diagnostics::EventBus::Instance().Publish(loud);
  tw::diagnostics::ResetEventBusForTesting();

  std::ifstream in(*config.log_path);
  std::string contents((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
  assert(contents.find("\"event_id\":\"loud\"") != std::string::npos);
  assert(contents.find("quiet") == std::string::npos);
}

} // namespace

int main() {
  TestDefaults();
  TestValuesAreParsed();
  TestMalformedValuesFallBack();
  TestActiveConfigOverride();
  TestHeldConfigSurvivesOverride();
  TestInstallDefaultLogging();
  std::cout << "config test ok\n";
  return 0;
}
