#include "builtin/criteria.h"

#include <utility>

#include "builtin/wildcard.h"
#include "runtime/coerce.h"
#include "util/string.h"

namespace cellforge::builtin {

using runtime::Scalar;

std::optional<Criterion> Criterion::Parse(const Scalar& criterion) {
  Criterion out;
  switch (criterion.kind) {
    case runtime::ValueKind::kError:
      return std::nullopt;
    case runtime::ValueKind::kNumber:
      out.number_ = criterion.number;
      return out;
    case runtime::ValueKind::kBoolean:
      out.boolean_ = criterion.boolean;
      return out;
    case runtime::ValueKind::kEmpty:
      return out;
    default:
      break;
  }
  std::string rest = criterion.text;
  static const std::pair<const char*, Op> kPrefixes[] = {
      {"<=", Op::kLe}, {">=", Op::kGe}, {"<>", Op::kNe}, {"<", Op::kLt}, {">", Op::kGt},
      {"=", Op::kEq}};
  for (const auto& prefix : kPrefixes) {
    const std::string p = prefix.first;
    if (rest.compare(0, p.size(), p) == 0) {
      out.op_ = prefix.second;
      rest = rest.substr(p.size());
      break;
    }
  }
  if (auto number = runtime::ParseNumberText(rest)) {
    out.number_ = *number;
    return out;
  }
  if (util::EqualsIgnoreCase(rest, "TRUE") || util::EqualsIgnoreCase(rest, "FALSE")) {
    out.boolean_ = util::EqualsIgnoreCase(rest, "TRUE");
    return out;
  }
  out.text_ = rest;
  out.wildcard_ = (out.op_ == Op::kEq || out.op_ == Op::kNe) && HasWildcards(rest);
  return out;
}

bool Criterion::Matches(const Scalar& cell) const {
  if (cell.IsError()) {
    return false;
  }
  auto apply = [this](int cmp) {
    switch (op_) {
      case Op::kEq:
        return cmp == 0;
      case Op::kNe:
        return cmp != 0;
      case Op::kLt:
        return cmp < 0;
      case Op::kLe:
        return cmp <= 0;
      case Op::kGt:
        return cmp > 0;
      case Op::kGe:
        return cmp >= 0;
    }
    return false;
  };

  if (number_) {
    std::optional<double> value;
    if (cell.IsNumber()) {
      value = cell.number;
    } else if (cell.IsText()) {
      value = runtime::ParseNumberText(cell.text);
    }
    if (!value) {
      return op_ == Op::kNe;
    }
    int cmp = *value < *number_ ? -1 : (*value > *number_ ? 1 : 0);
    return apply(cmp);
  }
  if (boolean_) {
    if (!cell.IsBoolean()) {
      return op_ == Op::kNe;
    }
    return apply(cell.boolean == *boolean_ ? 0 : (cell.boolean ? 1 : -1));
  }
  const bool blank = cell.IsEmpty() || (cell.IsText() && cell.text.empty());
  if (text_.empty()) {
    // "" or "=" match blanks; "<>" matches anything non-blank.
    if (op_ == Op::kEq) return blank;
    if (op_ == Op::kNe) return !blank;
    return false;
  }
  if (wildcard_) {
    bool hit = cell.IsText() && !cell.text.empty() && WildcardMatch(text_, cell.text);
    return op_ == Op::kEq ? hit : !hit;
  }
  if (op_ == Op::kEq || op_ == Op::kNe) {
    bool equal = !blank && util::EqualsIgnoreCase(cell.ToString(), text_);
    return op_ == Op::kEq ? equal : !equal;
  }
  if (!cell.IsText()) {
    return false;
  }
  return apply(runtime::CompareText(cell.text, text_));
}

}  // namespace cellforge::builtin
