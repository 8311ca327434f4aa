#include "tw/config.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdlib>
#include <cstring>
#include <limits>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

#include "tw/diagnostics/event_bus.h"

namespace tw {
namespace {

std::optional<std::string_view> ReadEnv(const char* name) {
  const char* env = std::getenv(name);
  if (!env || *env == '\0') {
    return std::nullopt;
  }
  return std::string_view(env, std::strlen(env));
}

std::size_t ResolveMaxBytes() {
  auto env = ReadEnv("TW_LOG_MAX_SIZE");
  if (!env) {
    return kDefaultLogMaxBytes;
  }
  unsigned long long value = 0;
  auto [ptr, ec] = std::from_chars(env->data(), env->data() + env->size(), value);
  if (ec != std::errc() || ptr != env->data() + env->size() || value == 0) {
    return kDefaultLogMaxBytes;
  }
  return static_cast<std::size_t>(
      std::min<unsigned long long>(value, std::numeric_limits<std::size_t>::max()));
}

int ResolveMaxDepth() {
  auto env = ReadEnv("TW_MAX_DEPTH");
  if (!env) {
    return -1;
  }
  int value = 0;
  auto [ptr, ec] = std::from_chars(env->data(), env->data() + env->size(), value);
  if (ec != std::errc() || ptr != env->data() + env->size()) {
    return -1;
  }
  return value < 0 ? -1 : value;
}

bool ResolveFlag(const char* name) {
  auto env = ReadEnv(name);
  if (!env) {
    return false;
  }
  std::string lowered;
  for (char ch : *env) {
    lowered.push_back(static_cast<char>(std::tolower(static_cast<unsigned char>(ch))));
  }
  return lowered == "1" || lowered == "true" || lowered == "yes" || lowered == "on";
}

struct ActiveConfigStorage {
  std::mutex mutex;
  std::optional<Config> config;
};

ActiveConfigStorage& ActiveConfigSingleton() {
  static ActiveConfigStorage storage;
  return storage;
}

} // namespace

Config LoadConfigFromEnvironment() {
  Config config;
  if (auto path = ReadEnv("TW_LOG_PATH")) {
    config.log_path = std::filesystem::path(std::string(*path));
  }
  if (auto level = ReadEnv("TW_LOG_LEVEL")) {
    if (auto parsed = diagnostics::ParseSeverity(*level)) {
      config.log_level = *parsed;
    }
  }
  config.log_max_bytes = ResolveMaxBytes();
  config.trace_traversal = ResolveFlag("TW_TRACE_TRAVERSAL");
  config.max_depth = ResolveMaxDepth();
  return config;
}

Config ActiveConfig() {
  auto& storage = ActiveConfigSingleton();
  std::lock_guard<std::mutex> guard(storage.mutex);
  if (!storage.config) {
    storage.config = LoadConfigFromEnvironment();
  }
  return *storage.config;
}

void SetActiveConfigForTesting(std::optional<Config> config) {
  auto& storage = ActiveConfigSingleton();
  std::lock_guard<std::mutex> guard(storage.mutex);
  storage.config = std::move(config);
}

bool InstallDefaultLogging(const Config& config) {
  if (!config.log_path) {
    return false;
  }
  auto logger = std::make_shared<diagnostics::JsonLineLogger>(*config.log_path, config.log_max_bytes,
                                                              config.log_level);
  diagnostics::EventBus::Instance().Subscribe(
      [logger](const diagnostics::Event& event) { logger->Log(event); });
  return true;
}

} // namespace tw
