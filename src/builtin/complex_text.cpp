#include "builtin/complex_text.h"

#include <cctype>
#include <cmath>
#include <cstdlib>

#include "runtime/value.h"
#include "util/string.h"

namespace cellforge::builtin {

namespace {

bool IsDigit(char ch) {
  return std::isdigit(static_cast<unsigned char>(ch)) != 0;
}

// Scans an unsigned decimal number (digits, optional fraction, optional exponent) at `pos`.
bool ScanNumber(std::string_view text, size_t* pos, double* out) {
  size_t start = *pos;
  size_t i = start;
  size_t digits = 0;
  while (i < text.size() && IsDigit(text[i])) {
    ++i;
    ++digits;
  }
  if (i < text.size() && text[i] == '.') {
    ++i;
    while (i < text.size() && IsDigit(text[i])) {
      ++i;
      ++digits;
    }
  }
  if (digits == 0) {
    return false;
  }
  if (i < text.size() && (text[i] == 'e' || text[i] == 'E')) {
    size_t j = i + 1;
    if (j < text.size() && (text[j] == '+' || text[j] == '-')) ++j;
    if (j < text.size() && IsDigit(text[j])) {
      while (j < text.size() && IsDigit(text[j])) ++j;
      i = j;
    }
  }
  *out = std::strtod(std::string(text.substr(start, i - start)).c_str(), nullptr);
  *pos = i;
  return true;
}

std::string FormatPart(double v) {
  return runtime::FormatNumber(v);
}

}  // namespace

std::optional<ComplexText> ParseComplex(std::string_view raw) {
  const std::string text = util::Trim(raw);
  if (text.empty()) {
    return std::nullopt;
  }
  size_t pos = 0;
  double first_sign = 1.0;
  if (text[pos] == '+' || text[pos] == '-') {
    first_sign = text[pos] == '-' ? -1.0 : 1.0;
    ++pos;
  }
  double first = 1.0;
  const bool has_first = ScanNumber(text, &pos, &first);
  if (pos == text.size()) {
    if (!has_first) return std::nullopt;
    return ComplexText{{first_sign * first, 0.0}, '\0'};
  }
  if (text[pos] == 'i' || text[pos] == 'j') {
    if (pos + 1 != text.size()) return std::nullopt;
    return ComplexText{{0.0, first_sign * first}, text[pos]};
  }
  if (!has_first || (text[pos] != '+' && text[pos] != '-')) {
    return std::nullopt;
  }
  const double second_sign = text[pos] == '-' ? -1.0 : 1.0;
  ++pos;
  double second = 1.0;
  ScanNumber(text, &pos, &second);
  if (pos + 1 != text.size() || (text[pos] != 'i' && text[pos] != 'j')) {
    return std::nullopt;
  }
  return ComplexText{{first_sign * first, second_sign * second}, text[pos]};
}

std::string FormatComplex(const std::complex<double>& value, char suffix) {
  if (suffix != 'i' && suffix != 'j') {
    suffix = 'i';
  }
  const double re = std::fabs(value.real()) < 1e-15 ? 0.0 : value.real();
  const double im = std::fabs(value.imag()) < 1e-15 ? 0.0 : value.imag();
  if (im == 0.0) {
    return FormatPart(re);
  }
  std::string imag;
  if (im == 1.0) {
    imag = std::string(1, suffix);
  } else if (im == -1.0) {
    imag = "-" + std::string(1, suffix);
  } else {
    imag = FormatPart(im) + suffix;
  }
  if (re == 0.0) {
    return imag;
  }
  return FormatPart(re) + (im > 0 ? "+" : "") + imag;
}

}  // namespace cellforge::builtin
