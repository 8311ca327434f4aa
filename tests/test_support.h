#pragma once

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include "tw/core/recursive_node.h"
#include "tw/core/value.h"

namespace tw::test {

class TempDir {
 public:
  explicit TempDir(const std::string& prefix) {
    auto base = std::filesystem::temp_directory_path();
    auto name = prefix + std::to_string(static_cast<unsigned long long>(
                             std::chrono::steady_clock::now().time_since_epoch().count()));
    path_ = base / name;
    std::filesystem::create_directories(path_);
  }

  ~TempDir() {
    std::error_code ec;
    std::filesystem::remove_all(path_, ec);
  }

  TempDir(const TempDir&) = delete;
  TempDir& operator=(const TempDir&) = delete;

  const std::filesystem::path& path() const noexcept { return path_; }

 private:
  std::filesystem::path path_{};
};

inline void WriteFile(const std::filesystem::path& path, const std::string& contents) {
  std::ofstream out(path, std::ios::binary | std::ios::trunc);
  out << contents;
}

// (key, current) as strings for every visible position, from Rewind() on.
inline std::vector<std::pair<std::string, std::string>> Collect(core::Iterator& it) {
  std::vector<std::pair<std::string, std::string>> seen;
  for (it.Rewind(); it.Valid(); it.Next()) {
    seen.emplace_back(it.Key().ToString(), it.Current().ToString());
  }
  return seen;
}

inline std::vector<std::string> CollectKeys(core::Iterator& it) {
  std::vector<std::string> keys;
  for (it.Rewind(); it.Valid(); it.Next()) {
    keys.push_back(it.Key().ToString());
  }
  return keys;
}

// {a:1, b:{b1:2, b2:3}, c:4}
inline core::Array SampleTree() {
  return core::Array{{"a", 1}, {"b", core::Array{{"b1", 2}, {"b2", 3}}}, {"c", 4}};
}

} // namespace tw::test
