#include <catch2/catch.hpp>

#include <string>

#include "osb/events/command_tree.hpp"
#include "osb/events/events.hpp"

using namespace osb::events;
using osb::core::ErrorCode;

namespace {

const std::string kStoryboard =
    "//Background and Video events\n"
    "0,0,\"bg.jpg\",0,0\n"
    "//Storyboard Layer 0 (Background)\n"
    "Sprite,Background,Centre,\"sb/bg.png\",320,240\n"
    " F,0,0,1000,0,1\n"
    " L,1000,4\n"
    "  M,0,0,500,320,240,320,200\n"
    "  T,HitSoundSoftWhistle,0,500\n"
    "   S,0,0,100,1,1.2\n"
    " R,0,0,1000,0,3.14\n"
    "Animation,Foreground,TopLeft,\"sb/spark.png\",0,0,4,50,LoopOnce\n"
    " C,0,0,,255,255,255,0,0,0\n"
    " P,0,0,,A\n"
    "//Break Periods\n"
    "2,100,163";

}  // namespace

TEST_CASE("Background, comment and break events", "[events]") {
  const std::string text =
      "0,0,\"bg2.jpg\",0,0\n"
      "0,0,bg2.jpg,0,1\n"
      "//Break Periods\n"
      "2,100,163";
  const EventsParseResult result = ParseEvents(text, 14);
  REQUIRE(result.ok);

  Events expected;
  expected.events.push_back(NormalEvent{0, Background{FilePath{"\"bg2.jpg\""}, Position{0, 0}}});
  expected.events.push_back(NormalEvent{0, Background{FilePath{"bg2.jpg"}, Position{0, 1}}});
  expected.events.push_back(Comment{"Break Periods"});
  expected.events.push_back(NormalEvent{100, Break{163, true}});
  REQUIRE(result.events == expected);

  REQUIRE(RenderEvents(result.events, 14) == text);
}

TEST_CASE("Storyboard section round-trips", "[events]") {
  const EventsParseResult result = ParseEvents(kStoryboard, 14);
  INFO(result.error.Message());
  REQUIRE(result.ok);
  REQUIRE(result.events.events.size() == 7);

  const auto& sprite = std::get<Object>(result.events.events[3]);
  REQUIRE(sprite.commands.size() == 3);
  REQUIRE(CountCommands(sprite.commands) == 6);
  const auto& loop = std::get<Loop>(sprite.commands[1].properties);
  REQUIRE(loop.loop_count == 4);
  REQUIRE(loop.commands.size() == 2);

  const auto& animation = std::get<Object>(result.events.events[4]);
  REQUIRE(animation.commands.size() == 2);

  REQUIRE(RenderEvents(result.events, 14) == kStoryboard);
}

TEST_CASE("Parsing is idempotent through render", "[events]") {
  const EventsParseResult first = ParseEvents(kStoryboard, 14);
  REQUIRE(first.ok);
  const auto rendered = RenderEvents(first.events, 14);
  REQUIRE(rendered.has_value());
  const EventsParseResult second = ParseEvents(*rendered, 14);
  REQUIRE(second.ok);
  REQUIRE(second.events == first.events);
}

TEST_CASE("Input tolerances", "[events]") {
  SECTION("underscore indentation and CRLF") {
    const EventsParseResult result = ParseEvents("Sprite,Pass,Centre,a.png,0,0\r\n_F,0,0,1,1\r\n__M,0,0,1,0,0", 14);
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error.line_index == 2);
    REQUIRE(result.error.error.code == ErrorCode::kInvalidIndentation);

    const EventsParseResult ok = ParseEvents("Sprite,Pass,Centre,a.png,0,0\r\n_L,0,2\r\n__F,0,0,1,1\r\n", 14);
    REQUIRE(ok.ok);
    REQUIRE(RenderEvents(ok.events, 14) == "Sprite,Pass,Centre,a.png,0,0\n L,0,2\n  F,0,0,1,1");
  }

  SECTION("blank lines are skipped but counted") {
    const EventsParseResult result = ParseEvents("\n0,0,bg.jpg\n\n   \nfoo,1", 14);
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error.line_index == 4);
    REQUIRE(result.error.error.code == ErrorCode::kUnknownEventType);
  }

  SECTION("empty section") {
    const EventsParseResult result = ParseEvents("", 14);
    REQUIRE(result.ok);
    REQUIRE(result.events.events.empty());
    REQUIRE(RenderEvents(result.events, 14) == "");
  }
}

TEST_CASE("Section errors are line indexed", "[events][error]") {
  SECTION("command without an object") {
    const EventsParseResult result = ParseEvents("0,0,bg.jpg\n F,0,0,1,1", 14);
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error.line_index == 1);
    REQUIRE(result.error.error.code == ErrorCode::kCommandWithNoObject);
    REQUIRE(result.error.Message() == "line 1: Storyboard command found without a preceding sprite or animation");
  }

  SECTION("comment ends the command block") {
    const EventsParseResult result = ParseEvents("Sprite,Pass,Centre,a.png,0,0\n//note\n F,0,0,1,1", 14);
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error.line_index == 2);
    REQUIRE(result.error.error.code == ErrorCode::kCommandWithNoObject);
  }

  SECTION("object errors win over the normal event fallback") {
    const EventsParseResult result = ParseEvents("Sprite,Pass,Centre", 14);
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error.error.Message() == "Missing `filepath` field");
  }

  SECTION("normal event error after the fallback") {
    const EventsParseResult result = ParseEvents("0,0,bg.jpg\n3,100,300,0,0", 13);
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error.line_index == 1);
    REQUIRE(result.error.Message() == "line 1: Invalid `red` value");
  }

  SECTION("bad command inside an object") {
    const EventsParseResult result = ParseEvents("Sprite,Pass,Centre,a.png,0,0\n F,0,0,1,1\n X,0,0,1,1", 14);
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error.line_index == 2);
    REQUIRE(result.error.error.code == ErrorCode::kUnknownCommandType);
  }

  SECTION("time pushed out of range by the legacy offset") {
    const EventsParseResult result = ParseEvents("0,0,bg.jpg\n2,2147483647,2147483647", 3);
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error.line_index == 1);
    REQUIRE(result.error.Message() == "line 1: Invalid `start_time` value");
  }

  SECTION("unsupported version") {
    const EventsParseResult result = ParseEvents("0,0,bg.jpg", 15);
    REQUIRE_FALSE(result.ok);
    REQUIRE(result.error.error.code == ErrorCode::kUnsupportedVersion);
    REQUIRE(result.error.error.Message() == "Unsupported format version 15");
  }
}

TEST_CASE("Version dependent rendering", "[events][version]") {
  SECTION("colour transformation has no form at version 14") {
    const EventsParseResult result = ParseEvents("3,100,163,162,255", 13);
    REQUIRE(result.ok);
    REQUIRE(RenderEvents(result.events, 13) == "3,100,163,162,255");
    REQUIRE_FALSE(RenderEvents(result.events, 14).has_value());
    REQUIRE_FALSE(RenderEvent(result.events.events[0], 14).has_value());
  }

  SECTION("legacy files use numeric enums and the time offset") {
    const std::string text =
        "0,0,bg.jpg\n"
        "Sprite,0,1,a.png,320,240\n"
        " F,0,0,100,1";
    const EventsParseResult result = ParseEvents(text, 4);
    REQUIRE(result.ok);
    REQUIRE(std::get<NormalEvent>(result.events.events[0]).start_time == 24);
    REQUIRE(RenderEvents(result.events, 4) == text);
    REQUIRE(RenderEvents(result.events, 5) == "0,24,bg.jpg\nSprite,Background,Centre,a.png,320,240\n F,0,0,100,1");
  }
}

TEST_CASE("Programmatic construction renders like parsed input", "[events]") {
  Object object;
  object.layer = Layer::kForeground;
  object.origin = Origin::kCentre;
  object.object_type = Sprite{FilePath{"a.png"}};
  Fade fade;
  fade.timing.start_time = 0;
  fade.timing.end_time = 100;
  fade.start_opacity = 1;
  object.PushCommand(Command{fade});

  Events events;
  events.events.push_back(object);
  REQUIRE(RenderEvents(events, 14) == "Sprite,Foreground,Centre,a.png,0,0\n F,0,0,100,1");
}
