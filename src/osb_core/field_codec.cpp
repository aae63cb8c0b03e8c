#include "osb/core/field_codec.hpp"

#include <charconv>
#include <limits>

namespace osb::core {
namespace {

template <typename T>
std::optional<T> ParseWhole(std::string_view text) {
  if (!text.empty() && text.front() == '+') {
    text.remove_prefix(1);
    if (!text.empty() && text.front() == '-') {
      return std::nullopt;
    }
  }
  if (text.empty()) {
    return std::nullopt;
  }
  T value{};
  const char* begin = text.data();
  const char* end = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(begin, end, value);
  if (ec != std::errc() || ptr != end) {
    return std::nullopt;
  }
  return value;
}

}  // namespace

std::optional<Integer> ParseInteger(std::string_view text) { return ParseWhole<Integer>(text); }

std::optional<uint32_t> ParseUnsigned(std::string_view text) { return ParseWhole<uint32_t>(text); }

std::optional<Decimal> ParseDecimal(std::string_view text) { return Decimal::Parse(text); }

std::optional<bool> ParseZeroOneBool(std::string_view text) {
  const auto value = ParseInteger(text);
  if (!value.has_value()) {
    return std::nullopt;
  }
  if (*value == 0) {
    return false;
  }
  if (*value == 1) {
    return true;
  }
  return std::nullopt;
}

std::optional<std::vector<Integer>> ParseColonSet(std::string_view text, size_t expected_length) {
  std::vector<Integer> out;
  for (const std::string_view item : SplitFields(text, ':')) {
    const auto value = ParseInteger(item);
    if (!value.has_value()) {
      return std::nullopt;
    }
    out.push_back(*value);
  }
  if (out.size() != expected_length) {
    return std::nullopt;
  }
  return out;
}

std::string FormatColonSet(const std::vector<Integer>& values) {
  std::string out;
  for (size_t i = 0; i < values.size(); ++i) {
    if (i > 0) {
      out += ':';
    }
    out += std::to_string(values[i]);
  }
  return out;
}

std::vector<std::string_view> SplitFields(std::string_view text, char separator) {
  std::vector<std::string_view> out;
  size_t start = 0;
  while (true) {
    const size_t pos = text.find(separator, start);
    if (pos == std::string_view::npos) {
      out.push_back(text.substr(start));
      break;
    }
    out.push_back(text.substr(start, pos - start));
    start = pos + 1;
  }
  return out;
}

bool FieldReader::Next(const char* field, std::string_view* out, Error* error) {
  if (AtEnd()) {
    *error = Error::Missing(field);
    return false;
  }
  *out = Consume();
  return true;
}

bool FieldReader::NextInteger(const char* field, Integer* out, Error* error) {
  std::string_view text;
  if (!Next(field, &text, error)) {
    return false;
  }
  const auto value = ParseInteger(text);
  if (!value.has_value()) {
    *error = Error::Invalid(field, std::string(text));
    return false;
  }
  *out = *value;
  return true;
}

bool FieldReader::NextUnsigned(const char* field, uint32_t* out, Error* error) {
  std::string_view text;
  if (!Next(field, &text, error)) {
    return false;
  }
  const auto value = ParseUnsigned(text);
  if (!value.has_value()) {
    *error = Error::Invalid(field, std::string(text));
    return false;
  }
  *out = *value;
  return true;
}

bool FieldReader::NextDecimal(const char* field, Decimal* out, Error* error) {
  std::string_view text;
  if (!Next(field, &text, error)) {
    return false;
  }
  const auto value = ParseDecimal(text);
  if (!value.has_value()) {
    *error = Error::Invalid(field, std::string(text));
    return false;
  }
  *out = *value;
  return true;
}

bool FieldReader::NextOptionalInteger(const char* field, std::optional<Integer>* out, Error* error) {
  std::string_view text;
  if (!Next(field, &text, error)) {
    return false;
  }
  if (text.empty()) {
    *out = std::nullopt;
    return true;
  }
  const auto value = ParseInteger(text);
  if (!value.has_value()) {
    *error = Error::Invalid(field, std::string(text));
    return false;
  }
  *out = value;
  return true;
}

bool FieldReader::NextByte(const char* field, uint8_t* out, Error* error) {
  std::string_view text;
  if (!Next(field, &text, error)) {
    return false;
  }
  const auto value = ParseUnsigned(text);
  if (!value.has_value() || *value > std::numeric_limits<uint8_t>::max()) {
    *error = Error::Invalid(field, std::string(text));
    return false;
  }
  *out = static_cast<uint8_t>(*value);
  return true;
}

bool FieldReader::ExpectEnd(const char* last_field, Error* error) const {
  if (AtEnd()) {
    return true;
  }
  *error = Error::Invalid(last_field, std::string(Peek()));
  return false;
}

}  // namespace osb::core
