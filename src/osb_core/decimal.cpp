#include "osb/core/decimal.hpp"

#include <cctype>
#include <cmath>
#include <limits>

namespace osb::core {
namespace {

constexpr uint32_t kMaxScale = 28;

bool IsDigit(char ch) { return std::isdigit(static_cast<unsigned char>(ch)) != 0; }

void StripTrailingZeros(uint64_t* magnitude, uint32_t* scale) {
  while (*scale > 0 && *magnitude % 10U == 0U) {
    *magnitude /= 10U;
    --*scale;
  }
}

}  // namespace

Decimal::Decimal(int64_t integer) : negative_(integer < 0) {
  magnitude_ = integer < 0 ? static_cast<uint64_t>(-(integer + 1)) + 1U : static_cast<uint64_t>(integer);
}

Decimal Decimal::FromParts(uint64_t magnitude, uint32_t scale, bool negative) {
  Decimal out;
  out.magnitude_ = magnitude;
  out.scale_ = scale;
  out.negative_ = negative;
  return out;
}

std::optional<Decimal> Decimal::Parse(std::string_view text) {
  size_t i = 0;
  bool negative = false;
  if (i < text.size() && (text[i] == '+' || text[i] == '-')) {
    negative = text[i] == '-';
    ++i;
  }

  uint64_t magnitude = 0;
  uint32_t scale = 0;
  bool seen_digit = false;
  bool seen_point = false;
  for (; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '.') {
      if (seen_point) {
        return std::nullopt;
      }
      seen_point = true;
      continue;
    }
    if (!IsDigit(ch)) {
      return std::nullopt;
    }
    const uint64_t digit = static_cast<uint64_t>(ch - '0');
    if (magnitude > (std::numeric_limits<uint64_t>::max() - digit) / 10U) {
      return std::nullopt;
    }
    magnitude = magnitude * 10U + digit;
    seen_digit = true;
    if (seen_point) {
      if (++scale > kMaxScale) {
        return std::nullopt;
      }
    }
  }
  if (!seen_digit) {
    return std::nullopt;
  }
  return FromParts(magnitude, scale, negative);
}

double Decimal::ToDouble() const {
  const double value = static_cast<double>(magnitude_) / std::pow(10.0, static_cast<double>(scale_));
  return negative_ ? -value : value;
}

std::string Decimal::ToString() const {
  std::string digits = std::to_string(magnitude_);
  if (scale_ > 0) {
    if (digits.size() <= scale_) {
      digits.insert(0, scale_ + 1 - digits.size(), '0');
    }
    digits.insert(digits.size() - scale_, 1, '.');
  }
  if (negative_) {
    digits.insert(0, 1, '-');
  }
  return digits;
}

bool operator==(const Decimal& a, const Decimal& b) {
  uint64_t a_magnitude = a.magnitude_;
  uint32_t a_scale = a.scale_;
  uint64_t b_magnitude = b.magnitude_;
  uint32_t b_scale = b.scale_;
  StripTrailingZeros(&a_magnitude, &a_scale);
  StripTrailingZeros(&b_magnitude, &b_scale);
  if (a_magnitude == 0U && b_magnitude == 0U) {
    return true;
  }
  return a.negative_ == b.negative_ && a_magnitude == b_magnitude && a_scale == b_scale;
}

}  // namespace osb::core
