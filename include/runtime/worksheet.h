#ifndef CELLFORGE_RUNTIME_WORKSHEET_H_
#define CELLFORGE_RUNTIME_WORKSHEET_H_

#include <map>
#include <string_view>
#include <utility>

#include "runtime/address.h"
#include "runtime/value.h"

namespace cellforge::runtime {

/// Cell storage the engine reads from. Implementations own synchronization.
class Worksheet {
 public:
  virtual ~Worksheet() = default;

  /// Value stored at `address`; unset cells read as Empty.
  virtual Value GetCellValue(const Address& address) const = 0;

  /// Stores a value. Used by hosts and tests, never by formula evaluation.
  virtual void SetCellValue(const Address& address, const Value& value) = 0;
};

/// Sparse in-memory grid.
class MemoryWorksheet : public Worksheet {
 public:
  Value GetCellValue(const Address& address) const override;
  void SetCellValue(const Address& address, const Value& value) override;

  /// Convenience setter taking A1 text; throws std::invalid_argument on a malformed address.
  void Set(std::string_view a1, const Value& value);

  /// Removes every stored value.
  void Clear() { cells_.clear(); }
  size_t size() const { return cells_.size(); }

 private:
  std::map<std::pair<int, int>, Value> cells_;
};

}  // namespace cellforge::runtime

#endif  // CELLFORGE_RUNTIME_WORKSHEET_H_
