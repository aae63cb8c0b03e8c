#include "osb/events/command_parser.hpp"

#include <cctype>
#include <sstream>
#include <vector>

#include "osb/core/field_codec.hpp"

namespace osb::events {
namespace {

using core::Error;
using core::ErrorCode;
using core::FieldReader;

Error ContinuingError(const char* tag, std::string_view text) {
  Error error = Error::Of(ErrorCode::kInvalidContinuingField, std::string(text));
  error.field = tag;
  return error;
}

bool ParseTiming(FieldReader& reader, CommandTiming* out, Error* error) {
  Integer easing_code = 0;
  if (!reader.NextInteger("easing", &easing_code, error)) {
    return false;
  }
  const auto easing = EasingFromCode(easing_code);
  if (!easing.has_value()) {
    *error = Error::Of(ErrorCode::kUnknownEasing, std::to_string(easing_code));
    error->field = "easing";
    return false;
  }
  out->easing = *easing;
  if (!reader.NextInteger("start_time", &out->start_time, error)) {
    return false;
  }
  return reader.NextOptionalInteger("end_time", &out->end_time, error);
}

bool ParseContinuingDecimal(std::string_view text, const char* tag, Decimal* out, Error* error) {
  const auto value = core::ParseDecimal(text);
  if (!value.has_value()) {
    *error = ContinuingError(tag, text);
    return false;
  }
  *out = *value;
  return true;
}

bool ParseContinuingByte(std::string_view text, uint8_t* out, Error* error) {
  const auto value = core::ParseUnsigned(text);
  if (!value.has_value() || *value > 255U) {
    *error = ContinuingError("colour", text);
    return false;
  }
  *out = static_cast<uint8_t>(*value);
  return true;
}

bool ParseScalarKeyframes(FieldReader& reader, const char* start_field, const char* tag, Decimal* start,
                          std::vector<Decimal>* continuing, Error* error) {
  if (!reader.NextDecimal(start_field, start, error)) {
    return false;
  }
  while (!reader.AtEnd()) {
    Decimal value;
    if (!ParseContinuingDecimal(reader.Consume(), tag, &value, error)) {
      return false;
    }
    continuing->push_back(value);
  }
  return true;
}

bool ParseVectorKeyframes(FieldReader& reader, const char* x_field, const char* y_field, const char* tag,
                          Vector2* start, std::vector<ContinuingVector2>* continuing, Error* error) {
  if (!reader.NextDecimal(x_field, &start->x, error) || !reader.NextDecimal(y_field, &start->y, error)) {
    return false;
  }
  while (!reader.AtEnd()) {
    ContinuingVector2 group;
    if (!ParseContinuingDecimal(reader.Consume(), tag, &group.x, error)) {
      return false;
    }
    if (!reader.AtEnd()) {
      Decimal y;
      if (!ParseContinuingDecimal(reader.Consume(), tag, &y, error)) {
        return false;
      }
      group.y = y;
    }
    continuing->push_back(group);
  }
  return true;
}

bool ParseColourKeyframes(FieldReader& reader, Rgb* start, std::vector<ContinuingRgb>* continuing, Error* error) {
  if (!reader.NextByte("red", &start->red, error) || !reader.NextByte("green", &start->green, error) ||
      !reader.NextByte("blue", &start->blue, error)) {
    return false;
  }
  while (!reader.AtEnd()) {
    ContinuingRgb group;
    if (!ParseContinuingByte(reader.Consume(), &group.red, error)) {
      return false;
    }
    for (std::optional<uint8_t>* component : {&group.green, &group.blue}) {
      if (reader.AtEnd()) {
        break;
      }
      uint8_t value = 0;
      if (!ParseContinuingByte(reader.Consume(), &value, error)) {
        return false;
      }
      *component = value;
    }
    continuing->push_back(group);
  }
  return true;
}

bool ParseParameterKeyframes(FieldReader& reader, Parameter* out, Error* error) {
  std::string_view text;
  if (!reader.Next("parameter_type", &text, error)) {
    return false;
  }
  const auto parameter = ParseParameterType(text);
  if (!parameter.has_value()) {
    *error = Error::Invalid("parameter_type", std::string(text));
    return false;
  }
  out->parameter = *parameter;
  while (!reader.AtEnd()) {
    const std::string_view next = reader.Consume();
    const auto continuing = ParseParameterType(next);
    if (!continuing.has_value()) {
      *error = ContinuingError("parameter", next);
      return false;
    }
    out->continuing_parameters.push_back(*continuing);
  }
  return true;
}

bool ParseLoop(FieldReader& reader, Command* out, Error* error) {
  Loop loop;
  if (!reader.NextInteger("start_time", &loop.start_time, error) ||
      !reader.NextInteger("loop_count", &loop.loop_count, error) || !reader.ExpectEnd("loop_count", error)) {
    return false;
  }
  out->properties = std::move(loop);
  return true;
}

// T,<trigger_type>,<start_time>,<end_time>[,<group_number>]
bool ParseTrigger(FieldReader& reader, Command* out, Error* error) {
  Trigger trigger;
  std::string_view type_text;
  if (!reader.Next("trigger_type", &type_text, error) || !ParseTriggerType(type_text, &trigger.trigger_type, error)) {
    return false;
  }
  if (!reader.NextInteger("start_time", &trigger.start_time, error) ||
      !reader.NextInteger("end_time", &trigger.end_time, error)) {
    return false;
  }
  if (!reader.AtEnd()) {
    Integer group_number = 0;
    if (!reader.NextInteger("group_number", &group_number, error) || !reader.ExpectEnd("group_number", error)) {
      return false;
    }
    trigger.group_number = group_number;
  }
  out->properties = std::move(trigger);
  return true;
}

std::optional<SampleSet> SampleSetFromWord(std::string_view word) {
  if (word == "All") {
    return SampleSet::kAll;
  }
  if (word == "Normal") {
    return SampleSet::kNormal;
  }
  if (word == "Soft") {
    return SampleSet::kSoft;
  }
  if (word == "Drum") {
    return SampleSet::kDrum;
  }
  return std::nullopt;
}

std::optional<Addition> AdditionFromWord(std::string_view word) {
  if (word == "Whistle") {
    return Addition::kWhistle;
  }
  if (word == "Finish") {
    return Addition::kFinish;
  }
  if (word == "Clap") {
    return Addition::kClap;
  }
  return std::nullopt;
}

const char* SampleSetWord(SampleSet set) {
  switch (set) {
    case SampleSet::kAll:
      return "All";
    case SampleSet::kNormal:
      return "Normal";
    case SampleSet::kSoft:
      return "Soft";
    case SampleSet::kDrum:
      return "Drum";
  }
  return "All";
}

const char* AdditionWord(Addition addition) {
  switch (addition) {
    case Addition::kWhistle:
      return "Whistle";
    case Addition::kFinish:
      return "Finish";
    case Addition::kClap:
      return "Clap";
  }
  return "Whistle";
}

// "SoftWhistle3" -> {"Soft", "Whistle", "3"}.
bool SplitHitSoundWords(std::string_view text, std::vector<std::string_view>* words) {
  size_t i = 0;
  while (i < text.size()) {
    const size_t start = i;
    const auto ch = static_cast<unsigned char>(text[i]);
    if (std::isdigit(ch) != 0) {
      while (i < text.size() && std::isdigit(static_cast<unsigned char>(text[i])) != 0) {
        ++i;
      }
    } else if (std::isupper(ch) != 0) {
      ++i;
      while (i < text.size() && std::islower(static_cast<unsigned char>(text[i])) != 0) {
        ++i;
      }
    } else {
      return false;
    }
    words->push_back(text.substr(start, i - start));
  }
  return true;
}

void AppendTimingPrefix(std::ostringstream& oss, const char* token, const CommandTiming& timing) {
  oss << token << ',' << EasingCode(timing.easing) << ',' << timing.start_time << ',';
  if (timing.end_time.has_value()) {
    oss << *timing.end_time;
  }
}

void AppendContinuingVectors(std::ostringstream& oss, const std::vector<ContinuingVector2>& continuing) {
  for (const ContinuingVector2& group : continuing) {
    oss << ',' << group.x.ToString();
    if (group.y.has_value()) {
      oss << ',' << group.y->ToString();
    }
  }
}

void AppendDecimals(std::ostringstream& oss, const std::vector<Decimal>& values) {
  for (const Decimal& value : values) {
    oss << ',' << value.ToString();
  }
}

bool ValidateContinuingVectors(const std::vector<ContinuingVector2>& continuing, Error* error) {
  for (size_t i = 0; i + 1 < continuing.size(); ++i) {
    if (!continuing[i].y.has_value()) {
      *error = Error::Of(ErrorCode::kOmittedFieldNotLast);
      error->field = "y";
      return false;
    }
  }
  return true;
}

}  // namespace

std::optional<Easing> EasingFromCode(core::Integer code) {
  if (code < 0 || code >= kEasingCount) {
    return std::nullopt;
  }
  return static_cast<Easing>(code);
}

std::optional<ParameterType> ParseParameterType(std::string_view text) {
  if (text == "H") {
    return ParameterType::kHorizontalFlip;
  }
  if (text == "V") {
    return ParameterType::kVerticalFlip;
  }
  if (text == "A") {
    return ParameterType::kAdditiveBlending;
  }
  return std::nullopt;
}

const char* FormatParameterType(ParameterType parameter) {
  switch (parameter) {
    case ParameterType::kHorizontalFlip:
      return "H";
    case ParameterType::kVerticalFlip:
      return "V";
    case ParameterType::kAdditiveBlending:
      return "A";
  }
  return "H";
}

bool ParseTriggerType(std::string_view text, TriggerType* out, core::Error* error) {
  if (text == "Passing") {
    *out = TriggerType::Passing();
    return true;
  }
  if (text == "Failing") {
    *out = TriggerType::Failing();
    return true;
  }
  constexpr std::string_view kHitSound = "HitSound";
  if (text.substr(0, kHitSound.size()) != kHitSound) {
    *error = Error::Of(ErrorCode::kUnknownTriggerType, std::string(text));
    error->field = "trigger_type";
    return false;
  }

  const std::string_view rest = text.substr(kHitSound.size());
  std::vector<std::string_view> words;
  if (!SplitHitSoundWords(rest, &words)) {
    *error = Error::Of(ErrorCode::kUnknownHitSoundType, std::string(rest));
    error->field = "trigger_type";
    return false;
  }
  if (words.size() > 4) {
    *error = Error::Of(ErrorCode::kTooManyHitSoundFields, std::string(rest));
    error->field = "trigger_type";
    error->actual = words.size();
    return false;
  }

  TriggerType trigger;
  for (size_t i = 0; i < words.size(); ++i) {
    const std::string_view word = words[i];
    bool accepted = false;
    if (std::isdigit(static_cast<unsigned char>(word.front())) != 0) {
      // The custom sample set closes the trigger name.
      const auto custom = core::ParseUnsigned(word);
      accepted = custom.has_value() && i + 1 == words.size();
      trigger.custom_sample_set = custom;
    } else if (const auto set = SampleSetFromWord(word); set.has_value()) {
      if (!trigger.addition.has_value()) {
        if (!trigger.sample_set.has_value()) {
          trigger.sample_set = set;
          accepted = true;
        } else if (!trigger.additions_sample_set.has_value()) {
          trigger.additions_sample_set = set;
          accepted = true;
        }
      }
    } else if (const auto addition = AdditionFromWord(word); addition.has_value()) {
      accepted = !trigger.addition.has_value();
      trigger.addition = addition;
    }
    if (!accepted) {
      *error = Error::Of(ErrorCode::kUnknownHitSoundType, std::string(word));
      error->field = "trigger_type";
      return false;
    }
  }
  *out = trigger;
  return true;
}

std::string FormatTriggerType(const TriggerType& trigger_type) {
  switch (trigger_type.kind) {
    case TriggerType::Kind::kPassing:
      return "Passing";
    case TriggerType::Kind::kFailing:
      return "Failing";
    case TriggerType::Kind::kHitSound:
      break;
  }
  std::string out = "HitSound";
  if (trigger_type.sample_set.has_value()) {
    out += SampleSetWord(*trigger_type.sample_set);
  }
  if (trigger_type.additions_sample_set.has_value()) {
    out += SampleSetWord(*trigger_type.additions_sample_set);
  }
  if (trigger_type.addition.has_value()) {
    out += AdditionWord(*trigger_type.addition);
  }
  if (trigger_type.custom_sample_set.has_value()) {
    out += std::to_string(*trigger_type.custom_sample_set);
  }
  return out;
}

const char* CommandToken(const CommandProperties& properties) {
  if (std::holds_alternative<Fade>(properties)) {
    return "F";
  }
  if (std::holds_alternative<Move>(properties)) {
    return "M";
  }
  if (std::holds_alternative<MoveX>(properties)) {
    return "MX";
  }
  if (std::holds_alternative<MoveY>(properties)) {
    return "MY";
  }
  if (std::holds_alternative<Scale>(properties)) {
    return "S";
  }
  if (std::holds_alternative<VectorScale>(properties)) {
    return "V";
  }
  if (std::holds_alternative<Rotate>(properties)) {
    return "R";
  }
  if (std::holds_alternative<Colour>(properties)) {
    return "C";
  }
  if (std::holds_alternative<Parameter>(properties)) {
    return "P";
  }
  if (std::holds_alternative<Loop>(properties)) {
    return "L";
  }
  return "T";
}

bool ParseCommand(std::string_view line, Command* out, core::Error* error) {
  FieldReader reader(line);
  const std::string_view type = reader.Consume();

  if (type == "L") {
    return ParseLoop(reader, out, error);
  }
  if (type == "T") {
    return ParseTrigger(reader, out, error);
  }

  const bool keyframed = type == "F" || type == "M" || type == "MX" || type == "MY" || type == "S" || type == "V" ||
                         type == "R" || type == "C" || type == "P";
  if (!keyframed) {
    *error = Error::Of(ErrorCode::kUnknownCommandType, std::string(type));
    return false;
  }

  CommandTiming timing;
  if (!ParseTiming(reader, &timing, error)) {
    return false;
  }

  if (type == "F") {
    Fade fade{timing, {}, {}};
    if (!ParseScalarKeyframes(reader, "start_opacity", "opacity", &fade.start_opacity, &fade.continuing_opacities,
                              error)) {
      return false;
    }
    out->properties = std::move(fade);
  } else if (type == "M") {
    Move move{timing, {}, {}};
    if (!ParseVectorKeyframes(reader, "move_x", "move_y", "move", &move.start_position, &move.continuing_positions,
                              error)) {
      return false;
    }
    out->properties = std::move(move);
  } else if (type == "MX") {
    MoveX move_x{timing, {}, {}};
    if (!ParseScalarKeyframes(reader, "move_x", "move_x", &move_x.start_x, &move_x.continuing_x, error)) {
      return false;
    }
    out->properties = std::move(move_x);
  } else if (type == "MY") {
    MoveY move_y{timing, {}, {}};
    if (!ParseScalarKeyframes(reader, "move_y", "move_y", &move_y.start_y, &move_y.continuing_y, error)) {
      return false;
    }
    out->properties = std::move(move_y);
  } else if (type == "S") {
    Scale scale{timing, {}, {}};
    if (!ParseScalarKeyframes(reader, "start_scale", "scale", &scale.start_scale, &scale.continuing_scales, error)) {
      return false;
    }
    out->properties = std::move(scale);
  } else if (type == "V") {
    VectorScale scale{timing, {}, {}};
    if (!ParseVectorKeyframes(reader, "scale_x", "scale_y", "scale", &scale.start_scale, &scale.continuing_scales,
                              error)) {
      return false;
    }
    out->properties = std::move(scale);
  } else if (type == "R") {
    Rotate rotate{timing, {}, {}};
    if (!ParseScalarKeyframes(reader, "start_rotation", "rotation", &rotate.start_rotation,
                              &rotate.continuing_rotations, error)) {
      return false;
    }
    out->properties = std::move(rotate);
  } else if (type == "C") {
    Colour colour{timing, {}, {}};
    if (!ParseColourKeyframes(reader, &colour.start_colour, &colour.continuing_colours, error)) {
      return false;
    }
    out->properties = std::move(colour);
  } else {
    Parameter parameter{timing, ParameterType::kHorizontalFlip, {}};
    if (!ParseParameterKeyframes(reader, &parameter, error)) {
      return false;
    }
    out->properties = std::move(parameter);
  }
  return true;
}

bool ValidateCommand(const Command& command, core::Error* error) {
  const CommandProperties& properties = command.properties;
  if (const auto* move = std::get_if<Move>(&properties)) {
    return ValidateContinuingVectors(move->continuing_positions, error);
  }
  if (const auto* scale = std::get_if<VectorScale>(&properties)) {
    return ValidateContinuingVectors(scale->continuing_scales, error);
  }
  if (const auto* colour = std::get_if<Colour>(&properties)) {
    const auto& continuing = colour->continuing_colours;
    for (size_t i = 0; i < continuing.size(); ++i) {
      const bool last = i + 1 == continuing.size();
      const ContinuingRgb& group = continuing[i];
      if (!group.green.has_value() && (!last || group.blue.has_value())) {
        *error = Error::Of(ErrorCode::kOmittedFieldNotLast);
        error->field = "green";
        return false;
      }
      if (!group.blue.has_value() && !last) {
        *error = Error::Of(ErrorCode::kOmittedFieldNotLast);
        error->field = "blue";
        return false;
      }
    }
  }
  return true;
}

std::optional<std::string> RenderCommand(const Command& command) {
  core::Error error;
  if (!ValidateCommand(command, &error)) {
    return std::nullopt;
  }

  const CommandProperties& properties = command.properties;
  const char* token = CommandToken(properties);
  std::ostringstream oss;
  if (const auto* loop = std::get_if<Loop>(&properties)) {
    oss << token << ',' << loop->start_time << ',' << loop->loop_count;
  } else if (const auto* trigger = std::get_if<Trigger>(&properties)) {
    oss << token << ',' << FormatTriggerType(trigger->trigger_type) << ',' << trigger->start_time << ','
        << trigger->end_time;
    if (trigger->group_number.has_value()) {
      oss << ',' << *trigger->group_number;
    }
  } else if (const auto* fade = std::get_if<Fade>(&properties)) {
    AppendTimingPrefix(oss, token, fade->timing);
    oss << ',' << fade->start_opacity.ToString();
    AppendDecimals(oss, fade->continuing_opacities);
  } else if (const auto* move = std::get_if<Move>(&properties)) {
    AppendTimingPrefix(oss, token, move->timing);
    oss << ',' << move->start_position.x.ToString() << ',' << move->start_position.y.ToString();
    AppendContinuingVectors(oss, move->continuing_positions);
  } else if (const auto* move_x = std::get_if<MoveX>(&properties)) {
    AppendTimingPrefix(oss, token, move_x->timing);
    oss << ',' << move_x->start_x.ToString();
    AppendDecimals(oss, move_x->continuing_x);
  } else if (const auto* move_y = std::get_if<MoveY>(&properties)) {
    AppendTimingPrefix(oss, token, move_y->timing);
    oss << ',' << move_y->start_y.ToString();
    AppendDecimals(oss, move_y->continuing_y);
  } else if (const auto* scale = std::get_if<Scale>(&properties)) {
    AppendTimingPrefix(oss, token, scale->timing);
    oss << ',' << scale->start_scale.ToString();
    AppendDecimals(oss, scale->continuing_scales);
  } else if (const auto* vector_scale = std::get_if<VectorScale>(&properties)) {
    AppendTimingPrefix(oss, token, vector_scale->timing);
    oss << ',' << vector_scale->start_scale.x.ToString() << ',' << vector_scale->start_scale.y.ToString();
    AppendContinuingVectors(oss, vector_scale->continuing_scales);
  } else if (const auto* rotate = std::get_if<Rotate>(&properties)) {
    AppendTimingPrefix(oss, token, rotate->timing);
    oss << ',' << rotate->start_rotation.ToString();
    AppendDecimals(oss, rotate->continuing_rotations);
  } else if (const auto* colour = std::get_if<Colour>(&properties)) {
    AppendTimingPrefix(oss, token, colour->timing);
    const Rgb& start = colour->start_colour;
    oss << ',' << static_cast<int>(start.red) << ',' << static_cast<int>(start.green) << ','
        << static_cast<int>(start.blue);
    for (const ContinuingRgb& group : colour->continuing_colours) {
      oss << ',' << static_cast<int>(group.red);
      if (group.green.has_value()) {
        oss << ',' << static_cast<int>(*group.green);
      }
      if (group.blue.has_value()) {
        oss << ',' << static_cast<int>(*group.blue);
      }
    }
  } else if (const auto* parameter = std::get_if<Parameter>(&properties)) {
    AppendTimingPrefix(oss, token, parameter->timing);
    oss << ',' << FormatParameterType(parameter->parameter);
    for (const ParameterType continuing : parameter->continuing_parameters) {
      oss << ',' << FormatParameterType(continuing);
    }
  }
  return oss.str();
}

}  // namespace osb::events
