#pragma once

#include <cstddef>
#include <vector>

#include "tw/core/recursive_node.h"

namespace tw::traversal {

// kArrived: the frame's current position has not been emitted or descended
// into yet. kChildrenDone: the subtree below the current position has been
// fully walked (post-order emits the position in this phase).
enum class FramePhase { kArrived, kChildrenDone };

struct TraversalFrame {
  core::RecursiveNode* node{nullptr};
  core::NodePtr owned;
  FramePhase phase{FramePhase::kArrived};
};

// Frames of an in-progress traversal, depth 0 being the root. Frames pushed
// for descents own their node and release it when popped.
class TraversalStack {
 public:
  TraversalStack() = default;
  TraversalStack(const TraversalStack&) = delete;
  TraversalStack& operator=(const TraversalStack&) = delete;

  // Drops every frame and seeds depth 0 with the borrowed root.
  void Reset(core::RecursiveNode& root);
  void Clear() noexcept { frames_.clear(); }

  void Push(core::NodePtr node);
  // False (and no change) when only the root frame is left.
  bool Pop();

  TraversalFrame& Top() { return frames_.back(); }
  const TraversalFrame& Top() const { return frames_.back(); }
  // Null when |level| is out of range.
  core::RecursiveNode* NodeAt(std::size_t level) const noexcept;

  bool Empty() const noexcept { return frames_.empty(); }
  // Depth of the top frame; 0 for an empty stack.
  int Depth() const noexcept;

  int MaxDepth() const noexcept { return max_depth_; }
  // Negative values mean unlimited and are stored as -1.
  void SetMaxDepth(int max_depth) noexcept { max_depth_ = max_depth < 0 ? -1 : max_depth; }
  bool ExceedsMaxDepth() const noexcept { return max_depth_ >= 0 && Depth() >= max_depth_; }

 private:
  std::vector<TraversalFrame> frames_;
  int max_depth_{-1};
};

} // namespace tw::traversal
