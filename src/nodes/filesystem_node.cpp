#include "tw/nodes/filesystem_node.h"

#include <filesystem>
#include <memory>
#include <system_error>
#include <utility>

#include "tw/common.h"
#include "tw/diagnostics/event_bus.h"
#include "tw/error.h"
#include "tw/errors.h"

namespace tw::nodes {
namespace {

void PublishOpenFailure(const std::string& path, const tw::Error& error) {
  diagnostics::Event event;
  event.category = diagnostics::EventCategory::kDiagnostics;
  event.severity = diagnostics::EventSeverity::kWarning;
  event.event_id = "fs_node_open_failed";
  event.message = error.what();
  event.fields.emplace_back("path", path, diagnostics::FieldPrivacy::kHash);
  event.fields.emplace_back("error_code", std::to_string(error.code),
                            diagnostics::FieldPrivacy::kPublic, true);
  if (error.native_code) {
    event.fields.emplace_back("native_code", std::to_string(*error.native_code),
                              diagnostics::FieldPrivacy::kPublic, true);
  }
  diagnostics::EventBus::Instance().Publish(event);
}

[[noreturn]] void RaiseOpenFailure(const std::string& path, const std::error_code& ec,
                                   bool while_listing) {
  int code = tw::errors::io::kDirectoryReadFailed;
  std::string message;
  if (ec == std::errc::no_such_file_or_directory) {
    code = tw::errors::io::kNotFound;
    message = std::string(tw::errors::msg::kNoSuchDirectory);
  } else if (ec == std::errc::not_a_directory) {
    code = tw::errors::io::kNotADirectory;
    message = std::string(tw::errors::msg::kNotADirectory);
  } else if (ec == std::errc::permission_denied) {
    code = tw::errors::io::kPermissionDenied;
    message = std::string(tw::errors::msg::kPermissionDenied);
  } else if (while_listing) {
    message = std::string(tw::errors::msg::kFailedToReadDirectory) + ": " + ec.message();
  } else {
    message = std::string(tw::errors::msg::kFailedToStatDirectory) + ": " + ec.message();
  }
  tw::Error error{tw::ErrorDomain::IO, code, std::move(message), ec.value(),
                  tw::Retryability::kFatal, {path}};
  PublishOpenFailure(path, error);
  throw error;
}

} // namespace

FilesystemNode::FilesystemNode(std::string path, std::uint32_t flags, std::string sub_path)
    : path_(tw::StripTrailingSeparators(std::move(path))), flags_(flags),
      sub_path_(std::move(sub_path)) {
  if (path_.empty()) {
    throw tw::Error{tw::ErrorDomain::Validation, tw::errors::validation::kEmptyPath,
                    std::string(tw::errors::msg::kPathEmpty)};
  }
  ReadDirectory();
}

void FilesystemNode::ReadDirectory() {
  const std::filesystem::path dir(path_);
  std::error_code ec;
  const auto status = std::filesystem::status(dir, ec);
  if (ec) {
    RaiseOpenFailure(path_, ec, false);
  }
  if (!std::filesystem::is_directory(status)) {
    RaiseOpenFailure(path_, std::make_error_code(std::errc::not_a_directory), false);
  }

  if ((flags_ & FilesystemFlags::kSkipDots) == 0) {
    for (const char* dot : {".", ".."}) {
      Entry entry;
      entry.name = dot;
      entry.is_directory = true;
      entry.is_dot = true;
      entries_.push_back(std::move(entry));
    }
  }

  std::filesystem::directory_iterator it(dir, ec);
  if (ec) {
    RaiseOpenFailure(path_, ec, true);
  }
  const std::filesystem::directory_iterator end{};
  for (; it != end; it.increment(ec)) {
    if (ec) {
      RaiseOpenFailure(path_, ec, true);
    }
    const auto& dirent = *it;
    Entry entry;
    entry.name = tw::PathToUtf8String(dirent.path().filename());
    std::error_code entry_ec;
    // Broken links and races with deletion leave the entry as a plain name.
    entry.is_symlink = dirent.is_symlink(entry_ec);
    entry.is_directory = dirent.is_directory(entry_ec);
    entry.is_regular_file = dirent.is_regular_file(entry_ec);
    if (entry.is_regular_file) {
      const auto size = dirent.file_size(entry_ec);
      entry.size = entry_ec ? 0 : static_cast<std::uint64_t>(size);
    }
    entries_.push_back(std::move(entry));
  }
  if (ec) {
    RaiseOpenFailure(path_, ec, true);
  }
}

core::FileInfo FilesystemNode::MakeFileInfo(const Entry& entry) const {
  core::FileInfo info;
  info.path = tw::JoinEntryPath(path_, entry.name);
  info.name = entry.name;
  info.is_directory = entry.is_directory;
  info.is_regular_file = entry.is_regular_file;
  info.is_symlink = entry.is_symlink;
  info.size = entry.size;
  return info;
}

core::Value FilesystemNode::Current() const {
  if (!Valid()) {
    return {};
  }
  if (flags_ & FilesystemFlags::kCurrentAsPathname) {
    return core::Value(GetPathname());
  }
  if (flags_ & FilesystemFlags::kCurrentAsSelf) {
    return core::Value::FromNode(this);
  }
  return core::Value(MakeFileInfo(entries_[position_]));
}

core::Value FilesystemNode::Key() const {
  if (!Valid()) {
    return {};
  }
  if (flags_ & FilesystemFlags::kKeyAsFilename) {
    return core::Value(GetFilename());
  }
  return core::Value(GetPathname());
}

void FilesystemNode::Next() {
  if (position_ < entries_.size()) {
    ++position_;
  }
}

bool FilesystemNode::HasChildren() const {
  if (!Valid()) {
    return false;
  }
  const auto& entry = entries_[position_];
  if (entry.is_dot || !entry.is_directory) {
    return false;
  }
  return !entry.is_symlink || (flags_ & FilesystemFlags::kFollowSymlinks) != 0;
}

core::NodePtr FilesystemNode::GetChildren() const {
  if (!HasChildren()) {
    throw tw::Error{tw::ErrorDomain::Validation, tw::errors::validation::kNoChildren,
                    std::string(tw::errors::msg::kNoChildrenAtPosition)};
  }
  return std::make_unique<FilesystemNode>(GetPathname(), flags_, GetSubPathname());
}

std::string FilesystemNode::GetFilename() const {
  if (!Valid()) {
    return {};
  }
  return entries_[position_].name;
}

std::string FilesystemNode::GetPathname() const {
  if (!Valid()) {
    return {};
  }
  return tw::JoinEntryPath(path_, entries_[position_].name);
}

bool FilesystemNode::IsDot() const { return Valid() && entries_[position_].is_dot; }

void FilesystemNode::SetFlags(std::uint32_t flags) noexcept {
  constexpr std::uint32_t kModeMask = FilesystemFlags::kCurrentModeMask | FilesystemFlags::kKeyModeMask;
  flags_ = (flags_ & ~kModeMask) | (flags & kModeMask);
}

std::string FilesystemNode::GetSubPathname() const {
  if (sub_path_.empty()) {
    return GetFilename();
  }
  return tw::JoinEntryPath(sub_path_, GetFilename());
}

} // namespace tw::nodes
