#pragma once
#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>

namespace tw {

inline constexpr char kPathSeparator = '/';

inline std::string PathToUtf8String(const std::filesystem::path& path) {
#if defined(_WIN32)
  const std::u8string u8 = path.u8string();
  std::string result;
  result.reserve(u8.size());
  for (auto ch : u8) {
    result.push_back(static_cast<char>(ch));
  }
  return result;
#else
  return path.string();
#endif
}

[[nodiscard]] inline bool IsDotName(std::string_view name) noexcept {
  return name == "." || name == "..";
}

// Drops trailing separators but keeps a bare root ("/") intact.
inline std::string StripTrailingSeparators(std::string path) {
  while (path.size() > 1 && path.back() == kPathSeparator) {
    path.pop_back();
  }
  return path;
}

inline std::string JoinEntryPath(std::string_view directory, std::string_view name) {
  std::string joined;
  joined.reserve(directory.size() + 1 + name.size());
  joined.append(directory);
  if (joined.empty() || joined.back() != kPathSeparator) {
    joined.push_back(kPathSeparator);
  }
  joined.append(name);
  return joined;
}

} // namespace tw
