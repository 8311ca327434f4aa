#pragma once

#include "tw/core/recursive_node.h"
#include "tw/core/value.h"

namespace tw::nodes {

// Look-ahead wrapper. Each fetch copies the inner node's current position
// (value, key, HasChildren() and the children node itself) and then advances
// the inner node, so HasNext() can tell whether another sibling follows.
//
// The cached children can be taken once per position; a second
// GetChildren() raises State/kChildrenConsumed. Errors from the eager
// children read surface from Rewind()/Next().
class CachingNode : public core::RecursiveNode {
 public:
  explicit CachingNode(core::RecursiveNode& inner);
  explicit CachingNode(core::NodePtr inner);

  core::Value Current() const override { return current_; }
  core::Value Key() const override { return key_; }
  bool Valid() const override { return valid_; }
  void Next() override { Fetch(); }
  void Rewind() override;
  bool HasChildren() const override { return valid_ && has_children_; }
  core::NodePtr GetChildren() const override;

  bool HasNext() const { return inner_->Valid(); }

  core::RecursiveNode& GetInnerNode() const noexcept { return *inner_; }

 private:
  void Fetch();

  core::NodePtr owned_inner_;
  core::RecursiveNode* inner_;
  core::Value current_;
  core::Value key_;
  bool valid_{false};
  bool has_children_{false};
  mutable core::NodePtr children_;
};

} // namespace tw::nodes
