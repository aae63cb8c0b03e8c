#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "osb/core/error.hpp"
#include "osb/core/version.hpp"
#include "osb/events/model.hpp"

namespace osb::events {

// Sprite/Animation header line. A leading token that names neither yields
// ErrorCode::kUnknownObjectType, which callers use to try a normal event.
bool ParseObject(std::string_view line, Object* out, core::Error* error);

// Header line only; commands are flattened separately.
std::string RenderObjectHeader(const Object& object, core::Version version);

// Both the legacy numeric code and the name are accepted on input.
std::optional<Layer> ParseLayer(std::string_view text);
std::optional<Origin> ParseOrigin(std::string_view text);
std::optional<LoopType> ParseLoopType(std::string_view text);

// Names from version 5 on, legacy numeric codes before.
std::string FormatLayer(Layer layer, core::Version version);
std::string FormatOrigin(Origin origin, core::Version version);
std::string FormatLoopType(LoopType loop_type, core::Version version);

}  // namespace osb::events
