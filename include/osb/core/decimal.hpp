#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace osb::core {

// Exact decimal that remembers how many fractional digits it was written with,
// so "0.50" renders back as "0.50" while still comparing equal to 0.5.
class Decimal {
 public:
  Decimal() = default;
  Decimal(int64_t integer);

  static Decimal FromParts(uint64_t magnitude, uint32_t scale, bool negative);
  static std::optional<Decimal> Parse(std::string_view text);

  [[nodiscard]] uint64_t magnitude() const { return magnitude_; }
  [[nodiscard]] uint32_t scale() const { return scale_; }
  [[nodiscard]] bool negative() const { return negative_; }
  [[nodiscard]] bool IsZero() const { return magnitude_ == 0U; }

  [[nodiscard]] double ToDouble() const;
  [[nodiscard]] std::string ToString() const;

  friend bool operator==(const Decimal& a, const Decimal& b);
  friend bool operator!=(const Decimal& a, const Decimal& b) { return !(a == b); }

 private:
  uint64_t magnitude_ = 0;
  uint32_t scale_ = 0;
  bool negative_ = false;
};

}  // namespace osb::core
