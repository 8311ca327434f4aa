#include "tw/nodes/caching_node.h"

#include <memory>
#include <string>
#include <utility>

#include "tw/error.h"
#include "tw/errors.h"

namespace tw::nodes {
namespace {

core::RecursiveNode* RequireInner(const core::NodePtr& inner) {
  if (!inner) {
    throw tw::Error{tw::ErrorDomain::Validation, tw::errors::validation::kNullNode,
                    std::string(tw::errors::msg::kNullInnerNode)};
  }
  return inner.get();
}

} // namespace

CachingNode::CachingNode(core::RecursiveNode& inner) : inner_(&inner) {}

CachingNode::CachingNode(core::NodePtr inner)
    : owned_inner_(std::move(inner)), inner_(RequireInner(owned_inner_)) {}

void CachingNode::Rewind() {
  inner_->Rewind();
  Fetch();
}

void CachingNode::Fetch() {
  children_.reset();
  if (!inner_->Valid()) {
    valid_ = false;
    has_children_ = false;
    current_ = core::Value();
    key_ = core::Value();
    return;
  }
  valid_ = true;
  current_ = inner_->Current();
  key_ = inner_->Key();
  has_children_ = inner_->HasChildren();
  if (has_children_) {
    children_ = inner_->GetChildren();
  }
  inner_->Next();
}

core::NodePtr CachingNode::GetChildren() const {
  if (!HasChildren()) {
    throw tw::Error{tw::ErrorDomain::Validation, tw::errors::validation::kNoChildren,
                    std::string(tw::errors::msg::kNoChildrenAtPosition)};
  }
  if (!children_) {
    throw tw::Error{tw::ErrorDomain::State, tw::errors::state::kChildrenConsumed,
                    std::string(tw::errors::msg::kChildrenAlreadyConsumed)};
  }
  return std::make_unique<CachingNode>(std::move(children_));
}

} // namespace tw::nodes
