#include "osb/events/normal_event.hpp"

#include <sstream>

#include "osb/core/field_codec.hpp"

namespace osb::events {
namespace {

using core::Error;
using core::ErrorCode;
using core::FieldReader;
using core::Position;

// Optional trailing `x,y`. A lone `x` is reported as a missing `y`.
bool ParseOptionalPosition(FieldReader& reader, core::Version version, std::optional<Position>* out,
                           Error* error) {
  if (reader.AtEnd()) {
    if (core::PolicyFor(version).position_materialized) {
      *out = Position{};
    } else {
      out->reset();
    }
    return true;
  }
  Position position;
  if (!reader.NextInteger("x", &position.x, error) || !reader.NextInteger("y", &position.y, error)) {
    return false;
  }
  if (!reader.ExpectEnd("y", error)) {
    return false;
  }
  *out = position;
  return true;
}

// Reads a time field and applies the legacy offset; a time pushed out of range
// by the offset is reported against the field.
bool NextEventTime(FieldReader& reader, const char* field, core::Version version, Integer* out, Error* error) {
  const std::string token(reader.Peek());
  Integer time = 0;
  if (!reader.NextInteger(field, &time, error)) {
    return false;
  }
  const auto shifted = core::ApplyTimeOffset(time, version);
  if (!shifted.has_value()) {
    *error = Error::Invalid(field, token);
    return false;
  }
  *out = *shifted;
  return true;
}

bool ParseFileName(FieldReader& reader, FilePath* out, Error* error) {
  std::string_view text;
  if (!reader.Next("file_name", &text, error)) {
    return false;
  }
  out->text = std::string(text);
  return true;
}

void RenderPosition(std::ostringstream& oss, const std::optional<Position>& position, core::Version version) {
  if (position.has_value()) {
    oss << ',' << position->x << ',' << position->y;
  } else if (core::PolicyFor(version).position_materialized) {
    oss << ",0,0";
  }
}

}  // namespace

bool ParseNormalEvent(std::string_view line, core::Version version, NormalEvent* out, core::Error* error) {
  FieldReader reader(line);
  const std::string_view header = reader.Consume();

  enum class Kind { kBackground, kVideo, kBreak, kColourTransformation, kSample };
  Kind kind = Kind::kBackground;
  bool short_hand = true;
  if (header == "0") {
    kind = Kind::kBackground;
  } else if (header == "1" || header == "Video") {
    kind = Kind::kVideo;
    short_hand = header == "1";
  } else if (header == "2" || header == "Break") {
    kind = Kind::kBreak;
    short_hand = header == "2";
  } else if (header == "3") {
    kind = Kind::kColourTransformation;
  } else if (header == "5" || header == "Sample") {
    kind = Kind::kSample;
    short_hand = header == "5";
  } else {
    *error = Error::Of(ErrorCode::kUnknownEventType, std::string(header));
    return false;
  }

  NormalEvent event;
  if (!NextEventTime(reader, "start_time", version, &event.start_time, error)) {
    return false;
  }

  switch (kind) {
    case Kind::kBackground: {
      Background background;
      if (!ParseFileName(reader, &background.file_name, error) ||
          !ParseOptionalPosition(reader, version, &background.position, error)) {
        return false;
      }
      event.params = std::move(background);
      break;
    }
    case Kind::kVideo: {
      Video video;
      video.short_hand = short_hand;
      if (!ParseFileName(reader, &video.file_name, error) ||
          !ParseOptionalPosition(reader, version, &video.position, error)) {
        return false;
      }
      event.params = std::move(video);
      break;
    }
    case Kind::kBreak: {
      Break brk;
      brk.short_hand = short_hand;
      if (!NextEventTime(reader, "end_time", version, &brk.end_time, error) || !reader.ExpectEnd("end_time", error)) {
        return false;
      }
      event.params = brk;
      break;
    }
    case Kind::kColourTransformation: {
      ColourTransformation colour;
      if (!reader.NextByte("red", &colour.red, error) || !reader.NextByte("green", &colour.green, error) ||
          !reader.NextByte("blue", &colour.blue, error) || !reader.ExpectEnd("blue", error)) {
        return false;
      }
      event.params = colour;
      break;
    }
    case Kind::kSample: {
      Sample sample;
      sample.short_hand = short_hand;
      if (!reader.NextInteger("layer", &sample.layer, error) || !ParseFileName(reader, &sample.file_name, error)) {
        return false;
      }
      if (!reader.AtEnd()) {
        const std::string token(reader.Peek());
        if (!reader.NextOptionalInteger("volume", &sample.volume, error)) {
          return false;
        }
        if (sample.volume.has_value() && (*sample.volume < 0 || *sample.volume > kMaxSampleVolume)) {
          *error = Error::Of(ErrorCode::kValueOutOfRange, token);
          error->field = "volume";
          return false;
        }
        if (!reader.ExpectEnd("volume", error)) {
          return false;
        }
      }
      event.params = std::move(sample);
      break;
    }
  }

  *out = std::move(event);
  return true;
}

std::optional<std::string> RenderNormalEvent(const NormalEvent& event, core::Version version) {
  std::ostringstream oss;
  const auto start_time = core::RemoveTimeOffset(event.start_time, version);
  if (!start_time.has_value()) {
    return std::nullopt;
  }

  if (std::holds_alternative<Background>(event.params)) {
    const auto& background = std::get<Background>(event.params);
    oss << "0," << *start_time << ',' << background.file_name.text;
    RenderPosition(oss, background.position, version);
  } else if (std::holds_alternative<Video>(event.params)) {
    const auto& video = std::get<Video>(event.params);
    oss << (video.short_hand ? "1" : "Video") << ',' << *start_time << ',' << video.file_name.text;
    RenderPosition(oss, video.position, version);
  } else if (std::holds_alternative<Break>(event.params)) {
    const auto& brk = std::get<Break>(event.params);
    const auto end_time = core::RemoveTimeOffset(brk.end_time, version);
    if (!end_time.has_value()) {
      return std::nullopt;
    }
    oss << (brk.short_hand ? "2" : "Break") << ',' << *start_time << ',' << *end_time;
  } else if (std::holds_alternative<ColourTransformation>(event.params)) {
    if (!core::PolicyFor(version).colour_transformation) {
      return std::nullopt;
    }
    const auto& colour = std::get<ColourTransformation>(event.params);
    oss << "3," << *start_time << ',' << static_cast<int>(colour.red) << ',' << static_cast<int>(colour.green) << ','
        << static_cast<int>(colour.blue);
  } else {
    const auto& sample = std::get<Sample>(event.params);
    oss << (sample.short_hand ? "5" : "Sample") << ',' << *start_time << ',' << sample.layer << ','
        << sample.file_name.text;
    if (sample.volume.has_value()) {
      oss << ',' << *sample.volume;
    }
  }
  return oss.str();
}

}  // namespace osb::events
