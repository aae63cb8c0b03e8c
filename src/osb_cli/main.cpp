#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include "osb/core/field_codec.hpp"
#include "osb/core/version.hpp"
#include "osb/events/command_tree.hpp"
#include "osb/events/events.hpp"

namespace {

struct CliOptions {
  std::optional<osb::core::Version> version;
  bool lossy = false;
};

// Body of the `[Events]` section and the 0-based file line it starts on.
struct EventsSection {
  bool found = false;
  std::string body;
  size_t first_line = 0;
};

void PrintUsage() {
  std::cerr << "Usage:\n";
  std::cerr << "  osb check <file.osu|file.osb> [--format-version N]\n";
  std::cerr << "  osb dump <file.osu|file.osb> [--format-version N]\n";
  std::cerr << "  osb roundtrip <file.osu|file.osb> [--format-version N] [--lossy]\n";
}

bool ParseArgs(int argc, char** argv, std::filesystem::path* file, CliOptions* options, std::string* error) {
  if (argc < 3) {
    *error = "Missing beatmap or storyboard file path.";
    return false;
  }
  *file = std::filesystem::path(argv[2]);
  for (int i = 3; i < argc; ++i) {
    const std::string arg = argv[i];
    if (arg == "--format-version") {
      if (i + 1 >= argc) {
        *error = "Expected value after --format-version";
        return false;
      }
      const auto version = osb::core::ParseInteger(argv[++i]);
      if (!version.has_value()) {
        *error = std::string("Invalid format version: ") + argv[i];
        return false;
      }
      options->version = *version;
      continue;
    }
    if (arg == "--lossy") {
      options->lossy = true;
      continue;
    }
    *error = "Unknown argument: " + arg;
    return false;
  }
  return true;
}

std::string ReadFile(const std::filesystem::path& path) {
  std::ifstream in(path, std::ios::binary);
  if (!in.is_open()) {
    return {};
  }
  return std::string((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
}

std::string_view TrimLine(std::string_view line) {
  while (!line.empty() && (line.back() == '\r' || line.back() == ' ' || line.back() == '\t')) {
    line.remove_suffix(1);
  }
  return line;
}

// `osu file format vN` on the first line. Storyboard files carry no header.
std::optional<osb::core::Version> DetectVersion(const std::string& source) {
  constexpr std::string_view kHeader = "osu file format v";
  std::string_view first(source.data(), std::min(source.find('\n'), source.size()));
  if (first.substr(0, 3) == "\xEF\xBB\xBF") {
    first.remove_prefix(3);
  }
  first = TrimLine(first);
  if (first.substr(0, kHeader.size()) != kHeader) {
    return std::nullopt;
  }
  const auto version = osb::core::ParseInteger(first.substr(kHeader.size()));
  if (!version.has_value()) {
    return std::nullopt;
  }
  return *version;
}

EventsSection ExtractEventsSection(const std::string& source) {
  EventsSection section;
  size_t begin = 0;
  size_t line = 0;
  while (begin < source.size()) {
    size_t end = source.find('\n', begin);
    if (end == std::string::npos) {
      end = source.size();
    }
    const std::string_view text = TrimLine(std::string_view(source.data() + begin, end - begin));
    if (!section.found) {
      if (text == "[Events]") {
        section.found = true;
        section.first_line = line + 1;
      }
    } else {
      if (!text.empty() && text.front() == '[') {
        break;
      }
      section.body.append(source, begin, end - begin);
      section.body += '\n';
    }
    begin = end + 1;
    ++line;
  }
  if (!section.body.empty()) {
    section.body.pop_back();
  }
  return section;
}

std::string DescribeEvent(const osb::events::Event& event) {
  using namespace osb::events;
  if (std::holds_alternative<Comment>(event)) {
    return "comment";
  }
  if (std::holds_alternative<Object>(event)) {
    const auto& object = std::get<Object>(event);
    const char* kind = std::holds_alternative<Animation>(object.object_type) ? "animation" : "sprite";
    return std::string(kind) + " " + object.filepath().text + " commands=" + std::to_string(object.commands.size()) +
           " total=" + std::to_string(CountCommands(object.commands));
  }
  const auto& normal = std::get<NormalEvent>(event);
  const std::string time = " @" + std::to_string(normal.start_time);
  if (std::holds_alternative<Background>(normal.params)) {
    return "background " + std::get<Background>(normal.params).file_name.text + time;
  }
  if (std::holds_alternative<Video>(normal.params)) {
    return "video " + std::get<Video>(normal.params).file_name.text + time;
  }
  if (std::holds_alternative<Break>(normal.params)) {
    return "break" + time + ".." + std::to_string(std::get<Break>(normal.params).end_time);
  }
  if (std::holds_alternative<ColourTransformation>(normal.params)) {
    return "colour" + time;
  }
  return "sample " + std::get<Sample>(normal.params).file_name.text + time;
}

}  // namespace

int main(int argc, char** argv) {
  if (argc < 2) {
    PrintUsage();
    return 2;
  }

  const std::string command = argv[1];
  if (command != "check" && command != "dump" && command != "roundtrip") {
    std::cerr << "Unsupported command: " << command << "\n";
    PrintUsage();
    return 2;
  }

  std::filesystem::path input;
  CliOptions options;
  std::string cli_error;
  if (!ParseArgs(argc, argv, &input, &options, &cli_error)) {
    std::cerr << "Argument error: " << cli_error << "\n";
    PrintUsage();
    return 2;
  }

  const std::string source = ReadFile(input);
  if (source.empty()) {
    std::cerr << "Failed to read file: " << input << "\n";
    return 3;
  }

  std::optional<osb::core::Version> version = options.version;
  if (!version.has_value()) {
    version = DetectVersion(source);
  }
  if (!version.has_value()) {
    std::cerr << "No `osu file format` header; pass --format-version\n";
    return 2;
  }

  const EventsSection section = ExtractEventsSection(source);
  if (!section.found) {
    std::cerr << "warning: " << input.string() << " has no [Events] section\n";
  }

  const osb::events::EventsParseResult parse = osb::events::ParseEvents(section.body, *version);
  if (!parse.ok) {
    const size_t line = section.first_line + parse.error.line_index + 1;
    std::cerr << input.string() << ":" << line << ": parse error: " << parse.error.error.Message() << "\n";
    return 4;
  }

  if (command == "check") {
    std::cout << "ok: " << parse.events.events.size() << " events\n";
    return 0;
  }

  if (command == "dump") {
    for (const auto& event : parse.events.events) {
      std::cout << DescribeEvent(event) << "\n";
    }
    return 0;
  }

  if (!options.lossy) {
    const auto rendered = osb::events::RenderEvents(parse.events, *version);
    if (!rendered.has_value()) {
      std::cerr << "Events cannot be written at format version " << *version << " (use --lossy)\n";
      return 5;
    }
    std::cout << *rendered << "\n";
    return 0;
  }

  size_t index = 0;
  for (const auto& event : parse.events.events) {
    const auto rendered = osb::events::RenderEvent(event, *version);
    if (rendered.has_value()) {
      std::cout << *rendered << "\n";
    } else {
      std::cerr << "warning: omitting event " << index << " (" << DescribeEvent(event) << ")\n";
    }
    ++index;
  }
  return 0;
}
