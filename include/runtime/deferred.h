#ifndef CELLFORGE_RUNTIME_DEFERRED_H_
#define CELLFORGE_RUNTIME_DEFERRED_H_

#include <utility>

#include "runtime/value.h"

namespace cellforge::runtime {

/// An argument whose value is produced on demand. Forcing twice yields the same value.
class Deferred {
 public:
  virtual ~Deferred() = default;
  virtual Value Force() = 0;
};

/// A deferred value that has already been computed.
class ResolvedValue : public Deferred {
 public:
  explicit ResolvedValue(Value value) : value_(std::move(value)) {}
  Value Force() override { return value_; }

 private:
  Value value_;
};

}  // namespace cellforge::runtime

#endif  // CELLFORGE_RUNTIME_DEFERRED_H_
