#pragma once

#include <optional>
#include <string>

#include "osb/core/error.hpp"
#include "osb/core/version.hpp"
#include "osb/events/model.hpp"

namespace osb::events {

struct EventsParseResult {
  bool ok = false;
  Events events;
  core::LineError error;
};

bool ValidateVersion(core::Version version, core::Error* error);

// Parses the body of an `[Events]` section (header line excluded). Stops at
// the first error; `error.line_index` is the 0-based physical line.
EventsParseResult ParseEvents(const std::string& text, core::Version version);

std::optional<std::string> RenderEvent(const Event& event, core::Version version);

// Lines joined by '\n'. nullopt if any event has no textual form at `version`.
std::optional<std::string> RenderEvents(const Events& events, core::Version version);

}  // namespace osb::events
