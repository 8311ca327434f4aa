#pragma once

#include <memory>

#include "tw/core/value.h"

namespace tw::core {

// Flat iteration protocol. Current() and Key() return a null Value whenever
// Valid() is false.
class Iterator {
 public:
  virtual ~Iterator() = default;

  virtual Value Current() const = 0;
  virtual Value Key() const = 0;
  virtual bool Valid() const = 0;
  virtual void Next() = 0;
  virtual void Rewind() = 0;
};

class RecursiveNode;
using NodePtr = std::unique_ptr<RecursiveNode>;

// Capability every traversable container implements.
//
// HasChildren() must not move the cursor. GetChildren() returns a fresh node
// over the nested content of the current position, with its own cursor; it
// raises Validation/kNoChildren when HasChildren() is false.
class RecursiveNode : public Iterator {
 public:
  virtual bool HasChildren() const = 0;
  virtual NodePtr GetChildren() const = 0;
};

} // namespace tw::core
