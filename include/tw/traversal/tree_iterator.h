#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <utility>

#include "tw/core/recursive_node.h"
#include "tw/core/value.h"
#include "tw/traversal/traversal_iterator.h"

namespace tw::traversal {

// ASCII-art view of a traversal:
//
//   |-a
//   |-b
//   | |-b1
//   | \-b2
//   \-c
//
// The root is wrapped in a CachingNode so every level knows whether another
// sibling follows. Current() yields prefix + entry + postfix and Key() yields
// prefix + key + postfix unless the matching bypass flag is set.
class TreeIterator : public TraversalIterator {
 public:
  static constexpr std::uint32_t kBypassCurrent = 4;
  static constexpr std::uint32_t kBypassKey = 8;

  enum PrefixPart : int {
    kPrefixLeft = 0,
    kPrefixMidHasNext = 1,
    kPrefixMidLast = 2,
    kPrefixEndHasNext = 3,
    kPrefixEndLast = 4,
    kPrefixRight = 5,
  };

  explicit TreeIterator(core::RecursiveNode& root, std::uint32_t flags = kBypassKey,
                        TraversalMode mode = TraversalMode::kSelfFirst);
  explicit TreeIterator(core::NodePtr root, std::uint32_t flags = kBypassKey,
                        TraversalMode mode = TraversalMode::kSelfFirst);

  core::Value Current() const override;
  core::Value Key() const override;

  // Throws Validation/kInvalidPrefixPart unless 0 <= part <= 5.
  void SetPrefixPart(int part, std::string value);
  std::string GetPrefix() const;
  std::string GetEntry() const;
  void SetPostfix(std::string postfix) { postfix_ = std::move(postfix); }
  const std::string& GetPostfix() const noexcept { return postfix_; }

 private:
  bool LevelHasNext(int level) const;

  std::array<std::string, 6> prefix_{"", "| ", "  ", "|-", "\\-", ""};
  std::string postfix_;
};

} // namespace tw::traversal
