#include "tw/nodes/array_node.h"

#include <algorithm>
#include <cstdint>
#include <iterator>
#include <memory>
#include <string>
#include <variant>

#include "tw/error.h"
#include "tw/errors.h"

namespace tw::nodes {

std::vector<core::ArrayEntry> SortedEntries(const core::Array& array) {
  std::vector<core::ArrayEntry> integers;
  std::vector<core::ArrayEntry> strings;
  for (const auto& entry : array) {
    if (std::holds_alternative<std::int64_t>(entry.first)) {
      integers.push_back(entry);
    } else {
      strings.push_back(entry);
    }
  }
  std::sort(integers.begin(), integers.end(), [](const auto& lhs, const auto& rhs) {
    return std::get<std::int64_t>(lhs.first) < std::get<std::int64_t>(rhs.first);
  });
  std::sort(strings.begin(), strings.end(), [](const auto& lhs, const auto& rhs) {
    return std::get<std::string>(lhs.first) < std::get<std::string>(rhs.first);
  });
  integers.reserve(integers.size() + strings.size());
  std::move(strings.begin(), strings.end(), std::back_inserter(integers));
  return integers;
}

ArrayNode::ArrayNode(const core::Array& array) : entries_(SortedEntries(array)) {}

ArrayNode::ArrayNode(const core::ArrayPtr& array) {
  if (array) {
    entries_ = SortedEntries(*array);
  }
}

core::Value ArrayNode::Current() const {
  if (!Valid()) {
    return {};
  }
  return entries_[position_].second;
}

core::Value ArrayNode::Key() const {
  if (!Valid()) {
    return {};
  }
  return core::Value::FromKey(entries_[position_].first);
}

void ArrayNode::Next() {
  if (position_ < entries_.size()) {
    ++position_;
  }
}

bool ArrayNode::HasChildren() const {
  return Valid() && entries_[position_].second.IsArray();
}

core::NodePtr ArrayNode::GetChildren() const {
  if (!HasChildren()) {
    throw tw::Error{tw::ErrorDomain::Validation, tw::errors::validation::kNoChildren,
                    std::string(tw::errors::msg::kNoChildrenAtPosition)};
  }
  return std::make_unique<ArrayNode>(entries_[position_].second.AsArrayPtr());
}

void ArrayNode::Seek(std::size_t position) {
  if (position >= entries_.size()) {
    throw tw::Error{tw::ErrorDomain::Validation, tw::errors::validation::kSeekOutOfRange,
                    std::string(tw::errors::msg::kSeekOutOfRange) + ": " + std::to_string(position)};
  }
  position_ = position;
}

} // namespace tw::nodes
