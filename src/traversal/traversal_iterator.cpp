#include "tw/traversal/traversal_iterator.h"

#include <algorithm>
#include <exception>
#include <string>
#include <utility>

#include "tw/config.h"
#include "tw/diagnostics/event_bus.h"
#include "tw/error.h"
#include "tw/errors.h"

namespace tw::traversal {
namespace {

core::RecursiveNode* RequireRoot(const core::NodePtr& root) {
  if (!root) {
    throw tw::Error{tw::ErrorDomain::Validation, tw::errors::validation::kNullNode,
                    std::string(tw::errors::msg::kNullRootNode)};
  }
  return root.get();
}

void PublishDescentFailure(TraversalMode mode, int depth, const std::string& what,
                           const tw::Error* error) {
  diagnostics::Event event;
  event.category = diagnostics::EventCategory::kDiagnostics;
  event.severity = diagnostics::EventSeverity::kError;
  event.event_id = "traversal_descent_failed";
  event.message = what;
  event.fields.emplace_back("mode", TraversalModeToString(mode));
  event.fields.emplace_back("depth", std::to_string(depth), diagnostics::FieldPrivacy::kPublic, true);
  if (error) {
    event.fields.emplace_back("error_code", std::to_string(error->code),
                              diagnostics::FieldPrivacy::kPublic, true);
  }
  diagnostics::EventBus::Instance().Publish(event);
}

} // namespace

const char* TraversalModeToString(TraversalMode mode) {
  switch (mode) {
  case TraversalMode::kLeavesOnly:
    return "leaves_only";
  case TraversalMode::kSelfFirst:
    return "self_first";
  case TraversalMode::kChildFirst:
    return "child_first";
  }
  return "leaves_only";
}

TraversalIterator::TraversalIterator(core::RecursiveNode& root, TraversalMode mode,
                                     std::uint32_t flags)
    : root_(&root), mode_(mode), flags_(flags) {}

TraversalIterator::TraversalIterator(core::NodePtr root, TraversalMode mode, std::uint32_t flags)
    : owned_root_(std::move(root)), root_(RequireRoot(owned_root_)), mode_(mode), flags_(flags) {}

core::Value TraversalIterator::Current() const {
  if (!Valid()) {
    return {};
  }
  return stack_.Top().node->Current();
}

core::Value TraversalIterator::Key() const {
  if (!Valid()) {
    return {};
  }
  return stack_.Top().node->Key();
}

void TraversalIterator::Rewind() {
  state_ = State::kExhausted;
  positions_visited_ = 0;
  deepest_depth_ = 0;
  stack_.Reset(*root_);
  try {
    root_->Rewind();
    BeginIteration();
    Advance(false);
  } catch (...) {
    state_ = State::kExhausted;
    throw;
  }
}

void TraversalIterator::Next() {
  if (state_ != State::kPositioned) {
    return;
  }
  try {
    Advance(true);
  } catch (...) {
    state_ = State::kExhausted;
    throw;
  }
}

core::RecursiveNode* TraversalIterator::GetSubNode(int level) const noexcept {
  if (level < 0) {
    return nullptr;
  }
  return stack_.NodeAt(static_cast<std::size_t>(level));
}

core::RecursiveNode& TraversalIterator::GetInnerNode() const noexcept {
  if (stack_.Empty()) {
    return *root_;
  }
  return *stack_.Top().node;
}

bool TraversalIterator::CallHasChildren() { return stack_.Top().node->HasChildren(); }

core::NodePtr TraversalIterator::CallGetChildren() { return stack_.Top().node->GetChildren(); }

// One step of the walk. With |resume| the current position has already been
// emitted and is moved past first; then frames are advanced, descended into
// and popped until a position is visible under the active mode or the root
// frame runs out.
void TraversalIterator::Advance(bool resume) {
  if (resume) {
    auto& top = stack_.Top();
    if (mode_ == TraversalMode::kSelfFirst && top.phase == FramePhase::kArrived && CanDescend()) {
      Descend();
    } else {
      top.node->Next();
      top.phase = FramePhase::kArrived;
    }
  }

  while (true) {
    auto& top = stack_.Top();
    if (!top.node->Valid()) {
      if (stack_.Depth() == 0) {
        Finish();
        return;
      }
      EndChildren();
      stack_.Pop();
      auto& parent = stack_.Top();
      parent.phase = FramePhase::kChildrenDone;
      if (mode_ == TraversalMode::kChildFirst) {
        Emit();
        return;
      }
      parent.node->Next();
      parent.phase = FramePhase::kArrived;
      continue;
    }
    if (top.phase == FramePhase::kChildrenDone) {
      top.node->Next();
      top.phase = FramePhase::kArrived;
      continue;
    }
    if (!CanDescend() || mode_ == TraversalMode::kSelfFirst) {
      Emit();
      return;
    }
    Descend();
  }
}

bool TraversalIterator::CanDescend() { return !stack_.ExceedsMaxDepth() && CallHasChildren(); }

void TraversalIterator::Descend() {
  const int parent_depth = stack_.Depth();
  try {
    stack_.Push(CallGetChildren());
    stack_.Top().node->Rewind();
  } catch (const tw::Error& error) {
    DropFailedChild(parent_depth);
    PublishDescentFailure(mode_, parent_depth + 1, error.what(), &error);
    throw;
  } catch (const std::exception& ex) {
    DropFailedChild(parent_depth);
    PublishDescentFailure(mode_, parent_depth + 1, ex.what(), nullptr);
    throw;
  }
  BeginChildren();
}

// A child whose Rewind() threw must not stay on the stack.
void TraversalIterator::DropFailedChild(int parent_depth) noexcept {
  while (stack_.Depth() > parent_depth && stack_.Pop()) {
  }
}

void TraversalIterator::Emit() {
  state_ = State::kPositioned;
  ++positions_visited_;
  deepest_depth_ = std::max(deepest_depth_, stack_.Depth());
  NextElement();
}

void TraversalIterator::Finish() {
  state_ = State::kExhausted;
  EndIteration();
  if (!tw::ActiveConfig().trace_traversal) {
    return;
  }
  diagnostics::Event event;
  event.category = diagnostics::EventCategory::kTelemetry;
  event.severity = diagnostics::EventSeverity::kDebug;
  event.event_id = "traversal_complete";
  event.fields.emplace_back("mode", TraversalModeToString(mode_));
  event.fields.emplace_back("positions", std::to_string(positions_visited_),
                            diagnostics::FieldPrivacy::kPublic, true);
  event.fields.emplace_back("deepest_depth", std::to_string(deepest_depth_),
                            diagnostics::FieldPrivacy::kPublic, true);
  diagnostics::EventBus::Instance().Publish(event);
}

} // namespace tw::traversal
