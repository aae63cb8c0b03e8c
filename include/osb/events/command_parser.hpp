#pragma once

#include <optional>
#include <string>
#include <string_view>

#include "osb/core/error.hpp"
#include "osb/events/model.hpp"

namespace osb::events {

// Parses one command line with its indentation already removed. Loop and
// Trigger come back with an empty child list.
bool ParseCommand(std::string_view line, Command* out, core::Error* error);

// Renders the command's own line, without indentation or children. Returns
// nullopt when the command cannot be written back (see ValidateCommand).
std::optional<std::string> RenderCommand(const Command& command);

// Only the final continuing group of a line may leave trailing components out.
bool ValidateCommand(const Command& command, core::Error* error);

std::optional<Easing> EasingFromCode(core::Integer code);
inline core::Integer EasingCode(Easing easing) { return static_cast<core::Integer>(easing); }

bool ParseTriggerType(std::string_view text, TriggerType* out, core::Error* error);
std::string FormatTriggerType(const TriggerType& trigger_type);

std::optional<ParameterType> ParseParameterType(std::string_view text);
const char* FormatParameterType(ParameterType parameter);

// Leading token of the command's line, e.g. "F" or "MX".
const char* CommandToken(const CommandProperties& properties);

}  // namespace osb::events
