#include "tw/traversal/traversal_stack.h"

#include <string>
#include <utility>

#include "tw/error.h"
#include "tw/errors.h"

namespace tw::traversal {

void TraversalStack::Reset(core::RecursiveNode& root) {
  frames_.clear();
  TraversalFrame frame;
  frame.node = &root;
  frames_.push_back(std::move(frame));
}

void TraversalStack::Push(core::NodePtr node) {
  if (!node) {
    throw tw::Error{tw::ErrorDomain::Validation, tw::errors::validation::kNullNode,
                    std::string(tw::errors::msg::kNullInnerNode)};
  }
  TraversalFrame frame;
  frame.node = node.get();
  frame.owned = std::move(node);
  frames_.push_back(std::move(frame));
}

bool TraversalStack::Pop() {
  if (frames_.size() <= 1) {
    return false;
  }
  frames_.pop_back();
  return true;
}

core::RecursiveNode* TraversalStack::NodeAt(std::size_t level) const noexcept {
  if (level >= frames_.size()) {
    return nullptr;
  }
  return frames_[level].node;
}

int TraversalStack::Depth() const noexcept {
  return frames_.empty() ? 0 : static_cast<int>(frames_.size()) - 1;
}

} // namespace tw::traversal
