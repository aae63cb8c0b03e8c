#include "osb/events/events.hpp"

#include <string_view>
#include <utility>

#include "osb/events/command_parser.hpp"
#include "osb/events/command_tree.hpp"
#include "osb/events/normal_event.hpp"
#include "osb/events/object_parser.hpp"

namespace osb::events {
namespace {

using core::Error;
using core::ErrorCode;

bool IsIndentChar(char c) { return c == ' ' || c == '_'; }

bool IsBlank(std::string_view line) {
  for (char c : line) {
    if (c != ' ' && c != '\t') {
      return false;
    }
  }
  return true;
}

// Object first; only an unrecognised object header falls through to the
// timeline events, whose error then wins.
bool ParseTopLevel(std::string_view line, core::Version version, Event* out, Error* error) {
  Object object;
  Error object_error;
  if (ParseObject(line, &object, &object_error)) {
    *out = std::move(object);
    return true;
  }
  if (object_error.code != ErrorCode::kUnknownObjectType) {
    *error = std::move(object_error);
    return false;
  }
  NormalEvent normal;
  if (!ParseNormalEvent(line, version, &normal, error)) {
    return false;
  }
  *out = std::move(normal);
  return true;
}

}  // namespace

bool ValidateVersion(core::Version version, core::Error* error) {
  if (!core::IsSupportedVersion(version)) {
    *error = Error::Of(ErrorCode::kUnsupportedVersion, std::to_string(version));
    return false;
  }
  return true;
}

EventsParseResult ParseEvents(const std::string& text, core::Version version) {
  EventsParseResult result;
  if (!ValidateVersion(version, &result.error.error)) {
    return result;
  }

  std::optional<CommandTreeBuilder> builder;
  size_t line_index = 0;
  size_t begin = 0;
  while (begin <= text.size()) {
    size_t end = text.find('\n', begin);
    if (end == std::string::npos) {
      end = text.size();
    }
    std::string_view line(text.data() + begin, end - begin);
    if (!line.empty() && line.back() == '\r') {
      line.remove_suffix(1);
    }

    if (!IsBlank(line)) {
      Error error;
      bool ok = true;
      size_t indent = 0;
      while (indent < line.size() && IsIndentChar(line[indent])) {
        ++indent;
      }

      if (indent == 0 && line.substr(0, 2) == "//") {
        builder.reset();
        result.events.events.push_back(Comment{std::string(line.substr(2))});
      } else if (indent == 0) {
        builder.reset();
        Event event;
        ok = ParseTopLevel(line, version, &event, &error);
        if (ok) {
          result.events.events.push_back(std::move(event));
          if (auto* object = std::get_if<Object>(&result.events.events.back())) {
            builder.emplace(&object->commands);
          }
        }
      } else if (!builder.has_value()) {
        error = Error::Of(ErrorCode::kCommandWithNoObject);
        ok = false;
      } else {
        Command command;
        ok = ParseCommand(line.substr(indent), &command, &error) && builder->Push(std::move(command), indent, &error);
      }

      if (!ok) {
        result.error.line_index = line_index;
        result.error.error = std::move(error);
        return result;
      }
    }

    if (end == text.size()) {
      break;
    }
    begin = end + 1;
    ++line_index;
  }

  result.ok = true;
  return result;
}

std::optional<std::string> RenderEvent(const Event& event, core::Version version) {
  if (std::holds_alternative<Comment>(event)) {
    return "//" + std::get<Comment>(event).text;
  }
  if (std::holds_alternative<NormalEvent>(event)) {
    return RenderNormalEvent(std::get<NormalEvent>(event), version);
  }

  const auto& object = std::get<Object>(event);
  std::string out = RenderObjectHeader(object, version);
  const auto lines = FlattenCommands(object.commands);
  if (!lines.has_value()) {
    return std::nullopt;
  }
  for (const std::string& line : *lines) {
    out += '\n';
    out += line;
  }
  return out;
}

std::optional<std::string> RenderEvents(const Events& events, core::Version version) {
  std::string out;
  bool first = true;
  for (const Event& event : events.events) {
    const auto rendered = RenderEvent(event, version);
    if (!rendered.has_value()) {
      return std::nullopt;
    }
    if (!first) {
      out += '\n';
    }
    out += *rendered;
    first = false;
  }
  return out;
}

}  // namespace osb::events
