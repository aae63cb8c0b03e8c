#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "osb/core/decimal.hpp"
#include "osb/core/error.hpp"
#include "osb/core/types.hpp"

namespace osb::core {

std::optional<Integer> ParseInteger(std::string_view text);
std::optional<uint32_t> ParseUnsigned(std::string_view text);
std::optional<Decimal> ParseDecimal(std::string_view text);
std::optional<bool> ParseZeroOneBool(std::string_view text);

inline std::string FormatZeroOneBool(bool value) { return value ? "1" : "0"; }

[[nodiscard]] inline bool CheckFlagAtBit(uint32_t value, unsigned bit) { return ((value >> bit) & 1U) == 1U; }

[[nodiscard]] inline uint32_t WithFlagAtBit(uint32_t value, unsigned bit, bool enabled) {
  return enabled ? (value | (1U << bit)) : (value & ~(1U << bit));
}

// `a:b:c` integer sets as used by hit-sample and edge-set fields.
std::optional<std::vector<Integer>> ParseColonSet(std::string_view text, size_t expected_length);
std::string FormatColonSet(const std::vector<Integer>& values);

std::vector<std::string_view> SplitFields(std::string_view text, char separator);

// Walks the comma separated fields of one line, turning an absent field into
// `Missing` and a field that fails its codec into `Invalid` for the named field.
class FieldReader {
 public:
  explicit FieldReader(std::string_view line) : fields_(SplitFields(line, ',')) {}

  [[nodiscard]] bool AtEnd() const { return index_ >= fields_.size(); }
  [[nodiscard]] size_t Remaining() const { return AtEnd() ? 0 : fields_.size() - index_; }
  [[nodiscard]] std::string_view Peek() const { return AtEnd() ? std::string_view{} : fields_[index_]; }

  std::string_view Consume() { return AtEnd() ? std::string_view{} : fields_[index_++]; }

  bool Next(const char* field, std::string_view* out, Error* error);
  bool NextInteger(const char* field, Integer* out, Error* error);
  bool NextUnsigned(const char* field, uint32_t* out, Error* error);
  bool NextDecimal(const char* field, Decimal* out, Error* error);
  // Present but empty text yields nullopt.
  bool NextOptionalInteger(const char* field, std::optional<Integer>* out, Error* error);
  bool NextByte(const char* field, uint8_t* out, Error* error);

  // Extra trailing fields make the last consumed field invalid.
  bool ExpectEnd(const char* last_field, Error* error) const;

 private:
  std::vector<std::string_view> fields_;
  size_t index_ = 0;
};

}  // namespace osb::core
