#pragma once

#include <cstdint>
#include <string>

#include "osb/core/decimal.hpp"

namespace osb::core {

using Integer = int32_t;

struct Position {
  Integer x = 0;
  Integer y = 0;

  friend bool operator==(const Position& a, const Position& b) { return a.x == b.x && a.y == b.y; }
};

struct DecimalPosition {
  Decimal x;
  Decimal y;

  friend bool operator==(const DecimalPosition& a, const DecimalPosition& b) { return a.x == b.x && a.y == b.y; }
};

// Path field exactly as written, surrounding quotes included.
struct FilePath {
  std::string text;

  [[nodiscard]] std::string Unquoted() const {
    if (text.size() >= 2 && text.front() == '"' && text.back() == '"') {
      return text.substr(1, text.size() - 2);
    }
    return text;
  }

  friend bool operator==(const FilePath& a, const FilePath& b) { return a.text == b.text; }
};

}  // namespace osb::core
