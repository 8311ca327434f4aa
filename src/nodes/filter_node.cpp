#include "tw/nodes/filter_node.h"

#include <memory>
#include <regex>
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

CallbackFilter::Predicate RequirePredicate(CallbackFilter::Predicate predicate) {
  if (!predicate) {
    throw tw::Error{tw::ErrorDomain::Validation, tw::errors::validation::kNullNode,
                    std::string(tw::errors::msg::kNullPredicate)};
  }
  return predicate;
}

std::regex CompilePattern(const std::string& pattern) {
  try {
    return std::regex(pattern, std::regex::ECMAScript);
  } catch (const std::regex_error& ex) {
    throw tw::Error{tw::ErrorDomain::Validation, tw::errors::validation::kInvalidPattern,
                    std::string(tw::errors::msg::kInvalidPattern) + ": " + ex.what(),
                    static_cast<int>(ex.code()), tw::Retryability::kFatal, {pattern}};
  }
}

core::Array GroupsOf(const std::smatch& match) {
  core::Array groups;
  for (const auto& group : match) {
    groups.Append(core::Value(group.str()));
  }
  return groups;
}

} // namespace

FilterNode::FilterNode(core::RecursiveNode& inner) : inner_(&inner) {}

FilterNode::FilterNode(core::NodePtr inner)
    : owned_inner_(std::move(inner)), inner_(RequireInner(owned_inner_)) {}

core::Value FilterNode::Current() const {
  if (!Valid()) {
    return {};
  }
  return inner_->Current();
}

core::Value FilterNode::Key() const {
  if (!Valid()) {
    return {};
  }
  return inner_->Key();
}

bool FilterNode::Valid() const { return positioned_ && inner_->Valid(); }

void FilterNode::Rewind() {
  inner_->Rewind();
  positioned_ = true;
  FetchAccepted();
}

void FilterNode::Next() {
  inner_->Next();
  positioned_ = true;
  FetchAccepted();
}

bool FilterNode::HasChildren() const { return Valid() && inner_->HasChildren(); }

core::NodePtr FilterNode::GetChildren() const {
  if (!Valid()) {
    throw tw::Error{tw::ErrorDomain::Validation, tw::errors::validation::kNoChildren,
                    std::string(tw::errors::msg::kNoChildrenAtPosition)};
  }
  return MakeChild(inner_->GetChildren());
}

void FilterNode::FetchAccepted() {
  while (inner_->Valid() && !Accept()) {
    inner_->Next();
  }
}

bool ParentFilter::Accept() const { return GetInnerNode().HasChildren(); }

core::NodePtr ParentFilter::MakeChild(core::NodePtr inner_children) const {
  return std::make_unique<ParentFilter>(std::move(inner_children));
}

CallbackFilter::CallbackFilter(core::RecursiveNode& inner, Predicate predicate)
    : FilterNode(inner), predicate_(RequirePredicate(std::move(predicate))) {}

CallbackFilter::CallbackFilter(core::NodePtr inner, Predicate predicate)
    : FilterNode(std::move(inner)), predicate_(RequirePredicate(std::move(predicate))) {}

bool CallbackFilter::Accept() const {
  const auto& inner = GetInnerNode();
  return predicate_(inner.Current(), inner.Key(), inner);
}

core::NodePtr CallbackFilter::MakeChild(core::NodePtr inner_children) const {
  return std::make_unique<CallbackFilter>(std::move(inner_children), predicate_);
}

RegexFilter::RegexFilter(core::RecursiveNode& inner, const std::string& pattern, Mode mode,
                         std::uint32_t flags)
    : FilterNode(inner), pattern_(pattern), regex_(CompilePattern(pattern)), mode_(mode),
      flags_(flags) {}

RegexFilter::RegexFilter(core::NodePtr inner, const std::string& pattern, Mode mode,
                         std::uint32_t flags)
    : FilterNode(std::move(inner)), pattern_(pattern), regex_(CompilePattern(pattern)), mode_(mode),
      flags_(flags) {}

bool RegexFilter::Accept() const {
  const auto& inner = GetInnerNode();
  const std::string subject = (flags_ & kUseKey) ? inner.Key().ToString() : inner.Current().ToString();
  return std::regex_search(subject, regex_);
}

core::Value RegexFilter::Current() const {
  auto current = FilterNode::Current();
  if (!Valid() || mode_ == kMatch) {
    return current;
  }
  const std::string text = current.ToString();
  switch (mode_) {
  case kGetMatch: {
    std::smatch match;
    if (!std::regex_search(text, match, regex_)) {
      return core::Value(core::Array{});
    }
    return core::Value(GroupsOf(match));
  }
  case kAllMatches: {
    core::Array all;
    for (std::sregex_iterator it(text.begin(), text.end(), regex_), end; it != end; ++it) {
      all.Append(core::Value(GroupsOf(*it)));
    }
    return core::Value(std::move(all));
  }
  case kSplit: {
    core::Array pieces;
    for (std::sregex_token_iterator it(text.begin(), text.end(), regex_, -1), end; it != end; ++it) {
      pieces.Append(core::Value(it->str()));
    }
    return core::Value(std::move(pieces));
  }
  case kReplace:
    return core::Value(std::regex_replace(text, regex_, replacement_));
  case kMatch:
    break;
  }
  return current;
}

core::NodePtr RegexFilter::MakeChild(core::NodePtr inner_children) const {
  auto child = std::make_unique<RegexFilter>(std::move(inner_children), pattern_, mode_, flags_);
  child->SetReplacement(replacement_);
  return child;
}

} // namespace tw::nodes
