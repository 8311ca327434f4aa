#pragma once

#include <cstddef>
#include <cstdint>
#include <initializer_list>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace tw::core {

class Array;
class RecursiveNode;

using ArrayPtr = std::shared_ptr<const Array>;

// Container keys are either integers or strings, never both.
using ArrayKey = std::variant<std::int64_t, std::string>;

std::string KeyToString(const ArrayKey& key);

// Snapshot of one directory entry, taken when the directory was listed.
struct FileInfo {
  std::string path;
  std::string name;
  bool is_directory{false};
  bool is_regular_file{false};
  bool is_symlink{false};
  std::uint64_t size{0};

  bool operator==(const FileInfo&) const = default;
};

enum class ValueKind { kNull, kBool, kInt, kDouble, kString, kArray, kFileInfo, kNode };

class Value {
 public:
  Value() = default;
  Value(std::nullptr_t) noexcept {}
  Value(bool flag) : data_(std::in_place_type<bool>, flag) {}
  Value(int number) : data_(std::in_place_type<std::int64_t>, number) {}
  Value(std::int64_t number) : data_(std::in_place_type<std::int64_t>, number) {}
  Value(double number) : data_(std::in_place_type<double>, number) {}
  Value(const char* text) : data_(std::in_place_type<std::string>, text) {}
  Value(std::string text) : data_(std::in_place_type<std::string>, std::move(text)) {}
  Value(ArrayPtr array);
  Value(Array array);
  Value(FileInfo info) : data_(std::in_place_type<FileInfo>, std::move(info)) {}

  static Value FromKey(const ArrayKey& key);
  // Non-owning handle; the node must outlive the value.
  static Value FromNode(const RecursiveNode* node);

  ValueKind kind() const noexcept;
  bool IsNull() const noexcept { return kind() == ValueKind::kNull; }
  bool IsArray() const noexcept { return kind() == ValueKind::kArray; }
  bool IsString() const noexcept { return kind() == ValueKind::kString; }
  bool IsInt() const noexcept { return kind() == ValueKind::kInt; }

  bool AsBool() const;
  std::int64_t AsInt() const;
  double AsDouble() const;
  // The reference accessors point into this Value. On a temporary (such as
  // node.Current()) the rvalue overloads return a copy instead.
  const std::string& AsString() const&;
  std::string AsString() &&;
  const Array& AsArray() const&;
  Array AsArray() &&;
  const ArrayPtr& AsArrayPtr() const&;
  ArrayPtr AsArrayPtr() &&;
  const FileInfo& AsFileInfo() const&;
  FileInfo AsFileInfo() &&;
  const RecursiveNode* AsNode() const;

  std::string ToString() const;

  bool operator==(const Value& other) const;

 private:
  struct NodeHandle {
    const RecursiveNode* node{nullptr};
    bool operator==(const NodeHandle&) const = default;
  };

  std::variant<std::monostate, bool, std::int64_t, double, std::string, ArrayPtr, FileInfo,
               NodeHandle>
      data_;
};

using ArrayEntry = std::pair<ArrayKey, Value>;

// Insertion-ordered map from ArrayKey to Value.
class Array {
 public:
  using const_iterator = std::vector<ArrayEntry>::const_iterator;

  Array() = default;
  Array(std::initializer_list<ArrayEntry> entries);

  void Set(ArrayKey key, Value value);
  void Append(Value value);

  const Value* Find(const ArrayKey& key) const;
  bool Contains(const ArrayKey& key) const { return Find(key) != nullptr; }

  std::size_t Size() const noexcept { return entries_.size(); }
  bool Empty() const noexcept { return entries_.empty(); }
  const std::vector<ArrayEntry>& Entries() const noexcept { return entries_; }

  const_iterator begin() const noexcept { return entries_.begin(); }
  const_iterator end() const noexcept { return entries_.end(); }

  bool operator==(const Array& other) const;

 private:
  std::vector<ArrayEntry> entries_;
  std::map<ArrayKey, std::size_t> index_;
  std::optional<std::int64_t> max_int_key_;
};

inline ArrayPtr MakeArray(Array array) {
  return std::make_shared<const Array>(std::move(array));
}

} // namespace tw::core
