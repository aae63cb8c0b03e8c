#include "osb/events/object_parser.hpp"

#include <array>
#include <sstream>

#include "osb/core/field_codec.hpp"

namespace osb::events {
namespace {

using core::Error;
using core::ErrorCode;
using core::FieldReader;

constexpr std::array<const char*, 5> kLayerNames = {"Background", "Fail", "Pass", "Foreground", "Overlay"};

constexpr std::array<const char*, 10> kOriginNames = {"TopLeft",      "Centre",    "CentreLeft", "TopRight",
                                                      "BottomCentre", "TopCentre", "Custom",     "CentreRight",
                                                      "BottomLeft",   "BottomRight"};

constexpr std::array<const char*, 2> kLoopTypeNames = {"LoopForever", "LoopOnce"};

// Index of `text` in `names`, either spelled out or as its numeric code.
template <size_t N>
std::optional<size_t> LookupEnum(std::string_view text, const std::array<const char*, N>& names) {
  for (size_t i = 0; i < N; ++i) {
    if (text == names[i]) {
      return i;
    }
  }
  const auto code = core::ParseUnsigned(text);
  if (code.has_value() && *code < N) {
    return static_cast<size_t>(*code);
  }
  return std::nullopt;
}

template <size_t N>
std::string FormatEnum(size_t index, const std::array<const char*, N>& names, core::Version version) {
  if (core::PolicyFor(version).named_enums) {
    return names[index];
  }
  return std::to_string(index);
}

bool NextEnumField(FieldReader& reader, const char* field, std::optional<size_t> (*lookup)(std::string_view),
                   size_t* out, Error* error) {
  std::string_view text;
  if (!reader.Next(field, &text, error)) {
    return false;
  }
  const auto index = lookup(text);
  if (!index.has_value()) {
    *error = Error::Invalid(field, std::string(text));
    return false;
  }
  *out = *index;
  return true;
}

std::optional<size_t> LookupLayer(std::string_view text) { return LookupEnum(text, kLayerNames); }
std::optional<size_t> LookupOrigin(std::string_view text) { return LookupEnum(text, kOriginNames); }

}  // namespace

std::optional<Layer> ParseLayer(std::string_view text) {
  const auto index = LookupLayer(text);
  if (!index.has_value()) {
    return std::nullopt;
  }
  return static_cast<Layer>(*index);
}

std::optional<Origin> ParseOrigin(std::string_view text) {
  const auto index = LookupOrigin(text);
  if (!index.has_value()) {
    return std::nullopt;
  }
  return static_cast<Origin>(*index);
}

std::optional<LoopType> ParseLoopType(std::string_view text) {
  const auto index = LookupEnum(text, kLoopTypeNames);
  if (!index.has_value()) {
    return std::nullopt;
  }
  return static_cast<LoopType>(*index);
}

std::string FormatLayer(Layer layer, core::Version version) {
  return FormatEnum(static_cast<size_t>(layer), kLayerNames, version);
}

std::string FormatOrigin(Origin origin, core::Version version) {
  return FormatEnum(static_cast<size_t>(origin), kOriginNames, version);
}

std::string FormatLoopType(LoopType loop_type, core::Version version) {
  return FormatEnum(static_cast<size_t>(loop_type), kLoopTypeNames, version);
}

bool ParseObject(std::string_view line, Object* out, core::Error* error) {
  FieldReader reader(line);
  const std::string_view header = reader.Consume();
  const bool is_sprite = header == "Sprite";
  if (!is_sprite && header != "Animation") {
    *error = Error::Of(ErrorCode::kUnknownObjectType, std::string(header));
    return false;
  }

  Object object;
  size_t layer = 0;
  size_t origin = 0;
  if (!NextEnumField(reader, "layer", &LookupLayer, &layer, error) ||
      !NextEnumField(reader, "origin", &LookupOrigin, &origin, error)) {
    return false;
  }
  object.layer = static_cast<Layer>(layer);
  object.origin = static_cast<Origin>(origin);

  std::string_view filepath;
  if (!reader.Next("filepath", &filepath, error)) {
    return false;
  }
  if (!reader.NextDecimal("x", &object.position.x, error) || !reader.NextDecimal("y", &object.position.y, error)) {
    return false;
  }

  if (is_sprite) {
    if (!reader.ExpectEnd("y", error)) {
      return false;
    }
    object.object_type = Sprite{FilePath{std::string(filepath)}};
  } else {
    Animation animation;
    animation.filepath = FilePath{std::string(filepath)};
    if (!reader.NextUnsigned("frame_count", &animation.frame_count, error) ||
        !reader.NextDecimal("frame_delay", &animation.frame_delay, error)) {
      return false;
    }
    if (!reader.AtEnd()) {
      std::string_view loop_text;
      if (!reader.Next("loop_type", &loop_text, error)) {
        return false;
      }
      animation.loop_type = ParseLoopType(loop_text);
      if (!animation.loop_type.has_value()) {
        *error = Error::Invalid("loop_type", std::string(loop_text));
        return false;
      }
      if (!reader.ExpectEnd("loop_type", error)) {
        return false;
      }
    }
    object.object_type = std::move(animation);
  }

  *out = std::move(object);
  return true;
}

std::string RenderObjectHeader(const Object& object, core::Version version) {
  std::ostringstream oss;
  const bool is_animation = std::holds_alternative<Animation>(object.object_type);
  oss << (is_animation ? "Animation" : "Sprite") << ',' << FormatLayer(object.layer, version) << ','
      << FormatOrigin(object.origin, version) << ',' << object.filepath().text << ',' << object.position.x.ToString()
      << ',' << object.position.y.ToString();
  if (is_animation) {
    const auto& animation = std::get<Animation>(object.object_type);
    oss << ',' << animation.frame_count << ',' << animation.frame_delay.ToString();
    if (animation.loop_type.has_value()) {
      oss << ',' << FormatLoopType(*animation.loop_type, version);
    }
  }
  return oss.str();
}

}  // namespace osb::events
