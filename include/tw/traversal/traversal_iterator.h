#pragma once

#include <cstddef>
#include <cstdint>

#include "tw/core/recursive_node.h"
#include "tw/core/value.h"
#include "tw/traversal/traversal_stack.h"

namespace tw::traversal {

enum class TraversalMode { kLeavesOnly = 0, kSelfFirst = 1, kChildFirst = 2 };

const char* TraversalModeToString(TraversalMode mode);

// Depth-first walk over a RecursiveNode tree, flattened into the Iterator
// protocol.
//
//   kLeavesOnly  positions without children; containers are only descended
//   kSelfFirst   pre-order
//   kChildFirst  post-order; a container follows all of its descendants
//
// Containers whose children node is empty never produce a position of their
// own in kLeavesOnly. A descent that would pass the maximum depth is treated
// as "no children", so containers at the limit are emitted as leaves.
//
// The walk starts on Rewind(). If GetChildren() or the child's Rewind()
// throws, the iterator becomes exhausted at the parent's depth and the
// exception propagates unchanged.
class TraversalIterator : public core::Iterator {
 public:
  // Borrows |root|; it must outlive the iterator.
  explicit TraversalIterator(core::RecursiveNode& root, TraversalMode mode = TraversalMode::kLeavesOnly,
                             std::uint32_t flags = 0);
  // Takes ownership. Throws Validation/kNullNode when |root| is null.
  explicit TraversalIterator(core::NodePtr root, TraversalMode mode = TraversalMode::kLeavesOnly,
                             std::uint32_t flags = 0);
  ~TraversalIterator() override = default;

  TraversalIterator(const TraversalIterator&) = delete;
  TraversalIterator& operator=(const TraversalIterator&) = delete;

  core::Value Current() const override;
  core::Value Key() const override;
  bool Valid() const override { return state_ == State::kPositioned; }
  void Next() override;
  void Rewind() override;

  int GetDepth() const noexcept { return stack_.Depth(); }
  // Negative means unlimited. Takes effect at the next descent decision.
  void SetMaxDepth(int max_depth) noexcept { stack_.SetMaxDepth(max_depth); }
  int GetMaxDepth() const noexcept { return stack_.MaxDepth(); }

  TraversalMode GetMode() const noexcept { return mode_; }
  std::uint32_t GetFlags() const noexcept { return flags_; }

  // Node consumed at |level|, or null when no frame exists there.
  core::RecursiveNode* GetSubNode(int level) const noexcept;
  // Node of the current frame (the root before the first Rewind()).
  core::RecursiveNode& GetInnerNode() const noexcept;
  core::RecursiveNode& GetRootNode() const noexcept { return *root_; }

  std::size_t PositionsVisited() const noexcept { return positions_visited_; }

 protected:
  // Hooks, in call order: BeginIteration() on every Rewind(); BeginChildren()
  // right after a descent and EndChildren() right before the matching pop
  // (both at the child depth); NextElement() whenever a position becomes
  // visible; EndIteration() once when the walk is exhausted.
  virtual void BeginIteration() {}
  virtual void BeginChildren() {}
  virtual void EndChildren() {}
  virtual void NextElement() {}
  virtual void EndIteration() {}

  virtual bool CallHasChildren();
  virtual core::NodePtr CallGetChildren();

 private:
  enum class State { kUninitialized, kPositioned, kExhausted };

  void Advance(bool resume);
  bool CanDescend();
  void Descend();
  void DropFailedChild(int parent_depth) noexcept;
  void Emit();
  void Finish();

  core::NodePtr owned_root_;
  core::RecursiveNode* root_;
  TraversalMode mode_;
  std::uint32_t flags_;
  TraversalStack stack_;
  State state_{State::kUninitialized};
  std::size_t positions_visited_{0};
  int deepest_depth_{0};
};

} // namespace tw::traversal
