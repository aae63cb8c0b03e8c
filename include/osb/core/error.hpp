#pragma once

#include <cstddef>
#include <string>
#include <utility>

namespace osb::core {

enum class ErrorCode {
  // Unrecognised leading tokens.
  kUnknownEventType,
  kUnknownObjectType,
  kUnknownCommandType,
  // Field level.
  kMissingField,
  kInvalidField,
  kInvalidContinuingField,
  kOmittedFieldNotLast,
  kValueOutOfRange,
  kUnknownEasing,
  // Trigger type sub-grammar.
  kUnknownTriggerType,
  kUnknownHitSoundType,
  kTooManyHitSoundFields,
  // Structure.
  kInvalidIndentation,
  kCommandWithNoObject,
  kUnsupportedVersion,
};

struct Error {
  ErrorCode code = ErrorCode::kInvalidField;
  // Stable field tag such as "start_time"; empty for structural errors.
  std::string field;
  // Offending token, when there is one.
  std::string value;
  size_t expected = 0;
  size_t actual = 0;

  static Error Missing(std::string field_name) { return Error{ErrorCode::kMissingField, std::move(field_name), {}, 0, 0}; }

  static Error Invalid(std::string field_name, std::string token) {
    return Error{ErrorCode::kInvalidField, std::move(field_name), std::move(token), 0, 0};
  }

  static Error Of(ErrorCode code, std::string token = {}) { return Error{code, {}, std::move(token), 0, 0}; }

  [[nodiscard]] std::string Message() const;
};

struct LineError {
  // 0-based physical line, blank lines included.
  size_t line_index = 0;
  Error error;

  [[nodiscard]] std::string Message() const;
};

[[nodiscard]] const char* ErrorCodeName(ErrorCode code);

}  // namespace osb::core
