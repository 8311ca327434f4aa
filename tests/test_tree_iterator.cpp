#include "tw/traversal/tree_iterator.h"

#include <cassert>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include "test_support.h"
#include "tw/config.h"
#include "tw/error.h"
#include "tw/nodes/array_node.h"

namespace {

using tw::core::Array;
using tw::nodes::ArrayNode;
using tw::traversal::TraversalMode;
using tw::traversal::TreeIterator;

std::vector<std::string> Lines(TreeIterator& it) {
  std::vector<std::string> lines;
  for (it.Rewind(); it.Valid(); it.Next()) {
    lines.push_back(it.Current().ToString());
  }
  return lines;
}

void TestDefaultRendering() {
  ArrayNode root(tw::test::SampleTree());
  TreeIterator it(root);
  const std::vector<std::string> expected{"|-1", "|-Array", "| |-2", "| \\-3", "\\-4"};
  assert(Lines(it) == expected);

  it.Rewind();
  assert(it.Key().AsString() == "a" && "keys bypass the prefix by default");
  assert(it.GetEntry() == "1");
  assert(it.GetPrefix() == "|-");
}

void TestKeyRendering() {
  TreeIterator it(std::make_unique<ArrayNode>(tw::test::SampleTree()), TreeIterator::kBypassCurrent);
  std::vector<std::string> keys;
  for (it.Rewind(); it.Valid(); it.Next()) {
    keys.push_back(it.Key().ToString());
    assert(!it.Current().IsString() && "current bypasses the prefix");
  }
  const std::vector<std::string> expected{"|-a", "|-b", "| |-b1", "| \\-b2", "\\-c"};
  assert(keys == expected);
}

void TestPrefixPartsAndPostfix() {
  ArrayNode root(Array{{"x", Array{{"y", 1}}}, {"z", 2}});
  TreeIterator it(root);
  it.SetPrefixPart(TreeIterator::kPrefixLeft, "[");
  it.SetPrefixPart(TreeIterator::kPrefixMidHasNext, "! ");
  it.SetPrefixPart(TreeIterator::kPrefixEndHasNext, "+ ");
  it.SetPrefixPart(TreeIterator::kPrefixEndLast, "` ");
  it.SetPrefixPart(TreeIterator::kPrefixRight, "]");
  it.SetPostfix(";");
  assert(it.GetPostfix() == ";");
  const std::vector<std::string> expected{"[+ ]Array;", "[! ` ]1;", "[` ]2;"};
  assert(Lines(it) == expected);

  bool threw = false;
  try {
    it.SetPrefixPart(6, "?");
  } catch (const tw::Error& err) {
    threw = true;
    assert(err.code == tw::errors::validation::kInvalidPrefixPart);
  }
  assert(threw);
}

void TestChildFirstTree() {
  ArrayNode root(tw::test::SampleTree());
  TreeIterator it(root, TreeIterator::kBypassKey, TraversalMode::kChildFirst);
  std::vector<std::string> keys;
  for (it.Rewind(); it.Valid(); it.Next()) {
    keys.push_back(it.Key().ToString());
  }
  assert((keys == std::vector<std::string>{"a", "b1", "b2", "b", "c"}));
}

void TestInvalidIteratorRendersNothing() {
  ArrayNode root(Array{});
  TreeIterator it(root);
  it.Rewind();
  assert(!it.Valid());
  assert(it.Current().IsNull());
  assert(it.GetPrefix().empty());
  assert(it.GetEntry().empty());
}

} // namespace

int main() {
  tw::SetActiveConfigForTesting(tw::Config{});
  TestDefaultRendering();
  TestKeyRendering();
  TestPrefixPartsAndPostfix();
  TestChildFirstTree();
  TestInvalidIteratorRendersNothing();
  std::cout << "tree iterator test ok\n";
  return 0;
}
