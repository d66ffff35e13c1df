#include "runtime/worksheet.h"

#include <stdexcept>
#include <string>

namespace cellforge::runtime {

Value MemoryWorksheet::GetCellValue(const Address& address) const {
  auto it = cells_.find({address.row, address.col});
  if (it == cells_.end()) {
    return Value::Empty();
  }
  return it->second;
}

void MemoryWorksheet::SetCellValue(const Address& address, const Value& value) {
  if (value.IsEmpty()) {
    cells_.erase({address.row, address.col});
    return;
  }
  cells_[{address.row, address.col}] = value;
}

void MemoryWorksheet::Set(std::string_view a1, const Value& value) {
  auto address = ParseA1(a1);
  if (!address) {
    throw std::invalid_argument("invalid cell address '" + std::string(a1) + "'");
  }
  SetCellValue(*address, value);
}

}  // namespace cellforge::runtime
