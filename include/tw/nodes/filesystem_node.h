#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#include "tw/core/recursive_node.h"
#include "tw/core/value.h"

namespace tw::nodes {

// Behavior bits for FilesystemNode. The numeric values are stable and may be
// combined with bitwise or.
struct FilesystemFlags {
  static constexpr std::uint32_t kCurrentAsFileInfo = 0;
  static constexpr std::uint32_t kCurrentAsSelf = 16;
  static constexpr std::uint32_t kCurrentAsPathname = 32;
  static constexpr std::uint32_t kCurrentModeMask = 240;
  static constexpr std::uint32_t kKeyAsPathname = 0;
  static constexpr std::uint32_t kKeyAsFilename = 256;
  static constexpr std::uint32_t kFollowSymlinks = 512;
  static constexpr std::uint32_t kKeyModeMask = 3840;
  static constexpr std::uint32_t kNewCurrentAndKey = kKeyAsFilename | kCurrentAsFileInfo;
  static constexpr std::uint32_t kSkipDots = 4096;
  static constexpr std::uint32_t kUnixPaths = 8192;
};

// Recursive node over one directory. The listing is read exactly once, in
// the constructor, and iterated in the order the OS returned it. Unless
// kSkipDots is set, synthetic "." and ".." entries come first.
class FilesystemNode : public core::RecursiveNode {
 public:
  // Throws tw::Error (IO domain) when the directory cannot be listed, and
  // Validation/kEmptyPath for an empty path. A warning event is published
  // before any IO failure is raised.
  explicit FilesystemNode(std::string path, std::uint32_t flags = 0, std::string sub_path = {});

  core::Value Current() const override;
  core::Value Key() const override;
  bool Valid() const override { return position_ < entries_.size(); }
  void Next() override;
  void Rewind() override { position_ = 0; }
  bool HasChildren() const override;
  core::NodePtr GetChildren() const override;

  const std::string& GetPath() const noexcept { return path_; }
  std::string GetFilename() const;
  std::string GetPathname() const;
  bool IsDot() const;

  std::uint32_t GetFlags() const noexcept { return flags_; }
  // Only the current-mode and key-mode bits are replaced.
  void SetFlags(std::uint32_t flags) noexcept;

  const std::string& GetSubPath() const noexcept { return sub_path_; }
  std::string GetSubPathname() const;

  std::size_t Count() const noexcept { return entries_.size(); }

 private:
  struct Entry {
    std::string name;
    bool is_directory{false};
    bool is_regular_file{false};
    bool is_symlink{false};
    bool is_dot{false};
    std::uint64_t size{0};
  };

  void ReadDirectory();
  core::FileInfo MakeFileInfo(const Entry& entry) const;

  std::string path_;
  std::uint32_t flags_;
  std::string sub_path_;
  std::vector<Entry> entries_;
  std::size_t position_{0};
};

} // namespace tw::nodes
