#include "tw/core/value.h"

#include <sstream>
#include <string>
#include <type_traits>

#include "tw/error.h"
#include "tw/errors.h"

namespace tw::core {

namespace {

[[noreturn]] void ThrowKindMismatch(const char* requested) {
  throw tw::Error{tw::ErrorDomain::Validation, tw::errors::validation::kValueKindMismatch,
                  std::string(tw::errors::msg::kValueKindMismatch) + " (" + requested + ")"};
}

template <class T>
const T& Require(const auto& data, const char* requested) {
  const auto* held = std::get_if<T>(&data);
  if (!held) {
    ThrowKindMismatch(requested);
  }
  return *held;
}

std::string FormatDouble(double number) {
  std::ostringstream oss;
  oss.precision(14);
  oss << number;
  return oss.str();
}

} // namespace

std::string KeyToString(const ArrayKey& key) {
  if (const auto* number = std::get_if<std::int64_t>(&key)) {
    return std::to_string(*number);
  }
  return std::get<std::string>(key);
}

Value::Value(ArrayPtr array) {
  if (array) {
    data_.emplace<ArrayPtr>(std::move(array));
  }
}

Value::Value(Array array) : data_(std::in_place_type<ArrayPtr>, MakeArray(std::move(array))) {}

Value Value::FromKey(const ArrayKey& key) {
  if (const auto* number = std::get_if<std::int64_t>(&key)) {
    return Value(*number);
  }
  return Value(std::get<std::string>(key));
}

Value Value::FromNode(const RecursiveNode* node) {
  Value value;
  if (node) {
    value.data_.emplace<NodeHandle>(NodeHandle{node});
  }
  return value;
}

ValueKind Value::kind() const noexcept {
  switch (data_.index()) {
  case 1:
    return ValueKind::kBool;
  case 2:
    return ValueKind::kInt;
  case 3:
    return ValueKind::kDouble;
  case 4:
    return ValueKind::kString;
  case 5:
    return ValueKind::kArray;
  case 6:
    return ValueKind::kFileInfo;
  case 7:
    return ValueKind::kNode;
  default:
    return ValueKind::kNull;
  }
}

bool Value::AsBool() const { return Require<bool>(data_, "bool"); }

std::int64_t Value::AsInt() const { return Require<std::int64_t>(data_, "int"); }

double Value::AsDouble() const {
  if (const auto* number = std::get_if<std::int64_t>(&data_)) {
    return static_cast<double>(*number);
  }
  return Require<double>(data_, "double");
}

const std::string& Value::AsString() const& { return Require<std::string>(data_, "string"); }

std::string Value::AsString() && { return Require<std::string>(data_, "string"); }

const Array& Value::AsArray() const& { return *Require<ArrayPtr>(data_, "array"); }

Array Value::AsArray() && { return *Require<ArrayPtr>(data_, "array"); }

const ArrayPtr& Value::AsArrayPtr() const& { return Require<ArrayPtr>(data_, "array"); }

ArrayPtr Value::AsArrayPtr() && { return Require<ArrayPtr>(data_, "array"); }

const FileInfo& Value::AsFileInfo() const& { return Require<FileInfo>(data_, "file info"); }

FileInfo Value::AsFileInfo() && { return Require<FileInfo>(data_, "file info"); }

const RecursiveNode* Value::AsNode() const { return Require<NodeHandle>(data_, "node").node; }

std::string Value::ToString() const {
  return std::visit(
      [](const auto& held) -> std::string {
        using T = std::decay_t<decltype(held)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return {};
        } else if constexpr (std::is_same_v<T, bool>) {
          return held ? "1" : "";
        } else if constexpr (std::is_same_v<T, std::int64_t>) {
          return std::to_string(held);
        } else if constexpr (std::is_same_v<T, double>) {
          return FormatDouble(held);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return held;
        } else if constexpr (std::is_same_v<T, ArrayPtr>) {
          return "Array";
        } else if constexpr (std::is_same_v<T, FileInfo>) {
          return held.path;
        } else {
          return "Node";
        }
      },
      data_);
}

bool Value::operator==(const Value& other) const {
  if (data_.index() != other.data_.index()) {
    return false;
  }
  if (const auto* lhs = std::get_if<ArrayPtr>(&data_)) {
    const auto& rhs = std::get<ArrayPtr>(other.data_);
    return lhs->get() == rhs.get() || **lhs == *rhs;
  }
  return data_ == other.data_;
}

Array::Array(std::initializer_list<ArrayEntry> entries) {
  for (const auto& entry : entries) {
    Set(entry.first, entry.second);
  }
}

void Array::Set(ArrayKey key, Value value) {
  auto it = index_.find(key);
  if (it != index_.end()) {
    entries_[it->second].second = std::move(value);
    return;
  }
  if (const auto* number = std::get_if<std::int64_t>(&key)) {
    if (!max_int_key_ || *number > *max_int_key_) {
      max_int_key_ = *number;
    }
  }
  index_.emplace(key, entries_.size());
  entries_.emplace_back(std::move(key), std::move(value));
}

void Array::Append(Value value) {
  const std::int64_t next = max_int_key_ ? *max_int_key_ + 1 : 0;
  Set(ArrayKey{next}, std::move(value));
}

const Value* Array::Find(const ArrayKey& key) const {
  auto it = index_.find(key);
  if (it == index_.end()) {
    return nullptr;
  }
  return &entries_[it->second].second;
}

bool Array::operator==(const Array& other) const { return entries_ == other.entries_; }

} // namespace tw::core
