#include "tw/traversal/tree_iterator.h"

#include <memory>
#include <utility>

#include "tw/error.h"
#include "tw/errors.h"
#include "tw/nodes/caching_node.h"

namespace tw::traversal {

TreeIterator::TreeIterator(core::RecursiveNode& root, std::uint32_t flags, TraversalMode mode)
    : TraversalIterator(std::make_unique<nodes::CachingNode>(root), mode, flags) {}

TreeIterator::TreeIterator(core::NodePtr root, std::uint32_t flags, TraversalMode mode)
    : TraversalIterator(std::make_unique<nodes::CachingNode>(std::move(root)), mode, flags) {}

core::Value TreeIterator::Current() const {
  if (!Valid()) {
    return {};
  }
  if (GetFlags() & kBypassCurrent) {
    return TraversalIterator::Current();
  }
  return core::Value(GetPrefix() + GetEntry() + postfix_);
}

core::Value TreeIterator::Key() const {
  if (!Valid()) {
    return {};
  }
  auto key = TraversalIterator::Key();
  if (GetFlags() & kBypassKey) {
    return key;
  }
  return core::Value(GetPrefix() + key.ToString() + postfix_);
}

void TreeIterator::SetPrefixPart(int part, std::string value) {
  if (part < kPrefixLeft || part > kPrefixRight) {
    throw tw::Error{tw::ErrorDomain::Validation, tw::errors::validation::kInvalidPrefixPart,
                    std::string(tw::errors::msg::kInvalidPrefixPart)};
  }
  prefix_[static_cast<std::size_t>(part)] = std::move(value);
}

bool TreeIterator::LevelHasNext(int level) const {
  const auto* node = dynamic_cast<const nodes::CachingNode*>(GetSubNode(level));
  return node && node->HasNext();
}

std::string TreeIterator::GetPrefix() const {
  if (!Valid()) {
    return {};
  }
  std::string prefix = prefix_[kPrefixLeft];
  const int depth = GetDepth();
  for (int level = 0; level < depth; ++level) {
    prefix += LevelHasNext(level) ? prefix_[kPrefixMidHasNext] : prefix_[kPrefixMidLast];
  }
  prefix += LevelHasNext(depth) ? prefix_[kPrefixEndHasNext] : prefix_[kPrefixEndLast];
  prefix += prefix_[kPrefixRight];
  return prefix;
}

std::string TreeIterator::GetEntry() const {
  if (!Valid()) {
    return {};
  }
  return TraversalIterator::Current().ToString();
}

} // namespace tw::traversal
