#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "osb/core/error.hpp"
#include "osb/core/version.hpp"
#include "osb/events/model.hpp"

namespace osb::events {

inline constexpr core::Integer kMaxSampleVolume = 100;

// Parses a timeline event line (Background, Video, Break, ColourTransformation
// or Sample). Times are shifted by the legacy offset for versions 3 and 4.
bool ParseNormalEvent(std::string_view line, core::Version version, NormalEvent* out, core::Error* error);

// nullopt when the event cannot be written at `version`.
std::optional<std::string> RenderNormalEvent(const NormalEvent& event, core::Version version);

}  // namespace osb::events
