#include "osb/core/error.hpp"

#include <sstream>

namespace osb::core {

const char* ErrorCodeName(ErrorCode code) {
  switch (code) {
    case ErrorCode::kUnknownEventType:
      return "UnknownEventType";
    case ErrorCode::kUnknownObjectType:
      return "UnknownObjectType";
    case ErrorCode::kUnknownCommandType:
      return "UnknownCommandType";
    case ErrorCode::kMissingField:
      return "MissingField";
    case ErrorCode::kInvalidField:
      return "InvalidField";
    case ErrorCode::kInvalidContinuingField:
      return "InvalidContinuingField";
    case ErrorCode::kOmittedFieldNotLast:
      return "OmittedFieldNotLast";
    case ErrorCode::kValueOutOfRange:
      return "ValueOutOfRange";
    case ErrorCode::kUnknownEasing:
      return "UnknownEasing";
    case ErrorCode::kUnknownTriggerType:
      return "UnknownTriggerType";
    case ErrorCode::kUnknownHitSoundType:
      return "UnknownHitSoundType";
    case ErrorCode::kTooManyHitSoundFields:
      return "TooManyHitSoundFields";
    case ErrorCode::kInvalidIndentation:
      return "InvalidIndentation";
    case ErrorCode::kCommandWithNoObject:
      return "StoryboardCmdWithNoSprite";
    case ErrorCode::kUnsupportedVersion:
      return "UnsupportedVersion";
  }
  return "Unknown";
}

std::string Error::Message() const {
  std::ostringstream oss;
  switch (code) {
    case ErrorCode::kUnknownEventType:
      oss << "Unknown event type";
      break;
    case ErrorCode::kUnknownObjectType:
      oss << "Unknown object type " << value;
      break;
    case ErrorCode::kUnknownCommandType:
      oss << "Unknown command type";
      break;
    case ErrorCode::kMissingField:
      oss << "Missing `" << field << "` field";
      break;
    case ErrorCode::kInvalidField:
      oss << "Invalid `" << field << "` value";
      break;
    case ErrorCode::kInvalidContinuingField:
      oss << "Invalid continuing " << field << " value";
      break;
    case ErrorCode::kOmittedFieldNotLast:
      oss << "continuing fields " << field
          << " field is none without it being the last item in the continuing fields";
      break;
    case ErrorCode::kValueOutOfRange:
      oss << "`" << field << "` value " << value << " is out of range";
      break;
    case ErrorCode::kUnknownEasing:
      oss << "Unknown easing type " << value;
      break;
    case ErrorCode::kUnknownTriggerType:
      oss << "Unknown trigger type " << value;
      break;
    case ErrorCode::kUnknownHitSoundType:
      oss << "Unknown `HitSound` type " << value;
      break;
    case ErrorCode::kTooManyHitSoundFields:
      oss << "There are too many `HitSound` fields: " << actual;
      break;
    case ErrorCode::kInvalidIndentation:
      oss << "Invalid indentation, expected " << expected << ", got " << actual;
      break;
    case ErrorCode::kCommandWithNoObject:
      oss << "Storyboard command found without a preceding sprite or animation";
      break;
    case ErrorCode::kUnsupportedVersion:
      oss << "Unsupported format version " << value;
      break;
  }
  return oss.str();
}

std::string LineError::Message() const { return "line " + std::to_string(line_index) + ": " + error.Message(); }

}  // namespace osb::core
