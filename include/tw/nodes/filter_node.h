#pragma once

#include <cstdint>
#include <functional>
#include <regex>
#include <string>
#include <utility>

#include "tw/core/recursive_node.h"
#include "tw/core/value.h"

namespace tw::nodes {

// Admission-filtered view over another recursive node.
//
// Rewind() and Next() always leave the filter either exhausted or parked on a
// position for which Accept() holds; rejected positions are never visible.
// Before the first Rewind() (or Next()) the filter reports Valid() == false.
// GetChildren() wraps the inner node's children in a filter of the same
// kind, so the filter applies at every depth.
class FilterNode : public core::RecursiveNode {
 public:
  // Borrows |inner|; it must outlive the filter.
  explicit FilterNode(core::RecursiveNode& inner);
  // Takes ownership. Throws Validation/kNullNode when |inner| is null.
  explicit FilterNode(core::NodePtr inner);

  core::Value Current() const override;
  core::Value Key() const override;
  bool Valid() const override;
  void Next() override;
  void Rewind() override;
  bool HasChildren() const override;
  core::NodePtr GetChildren() const override;

  // Evaluated against the inner node's current position.
  virtual bool Accept() const = 0;

  core::RecursiveNode& GetInnerNode() const noexcept { return *inner_; }

 protected:
  // Builds a filter of the concrete kind that owns |inner_children|.
  virtual core::NodePtr MakeChild(core::NodePtr inner_children) const = 0;

 private:
  void FetchAccepted();

  core::NodePtr owned_inner_;
  core::RecursiveNode* inner_;
  bool positioned_{false};
};

// Keeps only positions that have children.
class ParentFilter : public FilterNode {
 public:
  using FilterNode::FilterNode;

  bool Accept() const override;

 protected:
  core::NodePtr MakeChild(core::NodePtr inner_children) const override;
};

// Admission decided by a caller-supplied predicate, which is shared with
// every child filter.
class CallbackFilter : public FilterNode {
 public:
  using Predicate =
      std::function<bool(const core::Value& current, const core::Value& key, const core::RecursiveNode& inner)>;

  // Both constructors throw Validation/kNullNode for an empty predicate.
  CallbackFilter(core::RecursiveNode& inner, Predicate predicate);
  CallbackFilter(core::NodePtr inner, Predicate predicate);

  bool Accept() const override;

 protected:
  core::NodePtr MakeChild(core::NodePtr inner_children) const override;

 private:
  Predicate predicate_;
};

// Admission by regular expression (ECMAScript grammar, searched anywhere in
// the text) against the string form of the current value, or of the key with
// kUseKey. Outside kMatch, Current() is rewritten from the matched text:
//
//   kGetMatch    array of the first match and its groups
//   kAllMatches  array of every match, each an array of groups
//   kSplit       array of the pieces between matches
//   kReplace     the text with every match replaced by the replacement
//
// Children are filtered with the same pattern, mode, flags and replacement.
class RegexFilter : public FilterNode {
 public:
  enum Mode : int { kMatch = 0, kGetMatch = 1, kAllMatches = 2, kSplit = 3, kReplace = 4 };
  static constexpr std::uint32_t kUseKey = 1;

  // Throws Validation/kInvalidPattern when |pattern| does not compile.
  RegexFilter(core::RecursiveNode& inner, const std::string& pattern, Mode mode = kMatch,
              std::uint32_t flags = 0);
  RegexFilter(core::NodePtr inner, const std::string& pattern, Mode mode = kMatch,
              std::uint32_t flags = 0);

  core::Value Current() const override;
  bool Accept() const override;

  const std::string& GetPattern() const noexcept { return pattern_; }
  Mode GetMode() const noexcept { return mode_; }
  std::uint32_t GetFlags() const noexcept { return flags_; }
  void SetReplacement(std::string replacement) { replacement_ = std::move(replacement); }
  const std::string& GetReplacement() const noexcept { return replacement_; }

 protected:
  core::NodePtr MakeChild(core::NodePtr inner_children) const override;

 private:
  std::string pattern_;
  std::regex regex_;
  Mode mode_;
  std::uint32_t flags_;
  std::string replacement_;
};

} // namespace tw::nodes
