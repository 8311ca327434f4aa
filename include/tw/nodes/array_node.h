#pragma once

#include <cstddef>
#include <vector>

#include "tw/core/recursive_node.h"
#include "tw/core/value.h"

namespace tw::nodes {

// Orders container entries for iteration: every integer key ascending, then
// every string key in byte-wise lexicographic order. Storage order is ignored.
std::vector<core::ArrayEntry> SortedEntries(const core::Array& array);

// Recursive node over an in-memory container. The entries are copied and
// ordered once at construction; nested containers are shared read-only and
// become child nodes on demand.
class ArrayNode : public core::RecursiveNode {
 public:
  explicit ArrayNode(const core::Array& array);
  explicit ArrayNode(const core::ArrayPtr& array);

  core::Value Current() const override;
  core::Value Key() const override;
  bool Valid() const override { return position_ < entries_.size(); }
  void Next() override;
  void Rewind() override { position_ = 0; }
  bool HasChildren() const override;
  core::NodePtr GetChildren() const override;

  std::size_t Count() const noexcept { return entries_.size(); }
  std::size_t Position() const noexcept { return position_; }
  void Seek(std::size_t position);

 private:
  std::vector<core::ArrayEntry> entries_;
  std::size_t position_{0};
};

} // namespace tw::nodes
