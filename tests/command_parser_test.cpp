#include <catch2/catch.hpp>

#include <string>

#include "osb/events/command_parser.hpp"

using namespace osb::events;
using osb::core::Error;
using osb::core::ErrorCode;

namespace {

std::string ParseErrorMessage(const std::string& line) {
  Command command;
  Error error;
  if (ParseCommand(line, &command, &error)) {
    return "parsed";
  }
  return error.Message();
}

Command MustParse(const std::string& line) {
  Command command;
  Error error;
  INFO(line);
  REQUIRE(ParseCommand(line, &command, &error));
  return command;
}

}  // namespace

TEST_CASE("Command field errors", "[command][error]") {
  REQUIRE(ParseErrorMessage("foo,0,0,0,0,0,0") == "Unknown command type");
  REQUIRE(ParseErrorMessage("F") == "Missing `easing` field");
  REQUIRE(ParseErrorMessage("F,this is wrong!,123") == "Invalid `easing` value");
  REQUIRE(ParseErrorMessage("F,0") == "Missing `start_time` field");
  REQUIRE(ParseErrorMessage("F,0,foo") == "Invalid `start_time` value");
  REQUIRE(ParseErrorMessage("F,0,0") == "Missing `end_time` field");
  REQUIRE(ParseErrorMessage("F,0,0,foo") == "Invalid `end_time` value");
  REQUIRE(ParseErrorMessage("F,0,0,0") == "Missing `start_opacity` field");
  REQUIRE(ParseErrorMessage("L,0") == "Missing `loop_count` field");
  REQUIRE(ParseErrorMessage("L,0,5,1") == "Invalid `loop_count` value");
  REQUIRE(ParseErrorMessage("F,35,0,0,1") == "Unknown easing type 35");
  REQUIRE(ParseErrorMessage("P,0,0,,X") == "Invalid `parameter_type` value");
}

TEST_CASE("Continuing value errors", "[command][error]") {
  REQUIRE(ParseErrorMessage("C,0,0,0,255,255,255,foo") == "Invalid continuing colour value");
  REQUIRE(ParseErrorMessage("C,0,0,1,foo") == "Invalid `red` value");
  REQUIRE(ParseErrorMessage("C,0,0,1,255") == "Missing `green` field");
  REQUIRE(ParseErrorMessage("C,0,0,1,256,0,0") == "Invalid `red` value");
  REQUIRE(ParseErrorMessage("V,0,0,0,0.5") == "Missing `scale_y` field");
  REQUIRE(ParseErrorMessage("M,0,0,0,100,-100,foo") == "Invalid continuing move value");
  REQUIRE(ParseErrorMessage("F,0,0,0,1,x") == "Invalid continuing opacity value");
  REQUIRE(ParseErrorMessage("P,0,0,,H,Z") == "Invalid continuing parameter value");
}

TEST_CASE("Keyframed commands parse into typed values", "[command]") {
  SECTION("fade with continuing opacities") {
    const Command command = MustParse("F,1,1000,2000,0,1,0.5");
    const auto& fade = std::get<Fade>(command.properties);
    REQUIRE(fade.timing.easing == Easing::kEasingOut);
    REQUIRE(fade.timing.start_time == 1000);
    REQUIRE(fade.timing.end_time == 2000);
    REQUIRE(fade.start_opacity == 0);
    REQUIRE(fade.continuing_opacities.size() == 2);
    REQUIRE(fade.continuing_opacities[1] == *Decimal::Parse("0.5"));
    REQUIRE_FALSE(command.IsContainer());
  }

  SECTION("empty end time") {
    const Command command = MustParse("M,0,500,,320,240");
    const auto& move = std::get<Move>(command.properties);
    REQUIRE_FALSE(move.timing.end_time.has_value());
    REQUIRE(move.timing.ResolvedEndTime() == 500);
    REQUIRE(move.start_position.x == 320);
    REQUIRE(move.continuing_positions.empty());
  }

  SECTION("last vector group may omit y") {
    const Command command = MustParse("V,0,0,1000,1,1,2,3,4");
    const auto& scale = std::get<VectorScale>(command.properties);
    REQUIRE(scale.continuing_scales.size() == 2);
    REQUIRE(scale.continuing_scales[0].y == Decimal(3));
    REQUIRE_FALSE(scale.continuing_scales[1].y.has_value());
    REQUIRE(scale.continuing_scales[1].ResolvedY() == 4);
  }

  SECTION("last colour group may omit green and blue") {
    const Command command = MustParse("C,0,0,,255,255,255,10,20");
    const auto& colour = std::get<Colour>(command.properties);
    REQUIRE(colour.start_colour == Rgb{255, 255, 255});
    REQUIRE(colour.continuing_colours.size() == 1);
    REQUIRE(colour.continuing_colours[0].green == uint8_t{20});
    REQUIRE(colour.continuing_colours[0].ResolvedBlue() == 10);
  }

  SECTION("parameter") {
    const Command command = MustParse("P,0,0,100,A,H");
    const auto& parameter = std::get<Parameter>(command.properties);
    REQUIRE(parameter.parameter == ParameterType::kAdditiveBlending);
    REQUIRE(parameter.continuing_parameters == std::vector<ParameterType>{ParameterType::kHorizontalFlip});
  }
}

TEST_CASE("Containers parse with an empty child list", "[command]") {
  const Command loop = MustParse("L,1000,4");
  REQUIRE(loop.IsContainer());
  REQUIRE(loop.children()->empty());
  REQUIRE(std::get<Loop>(loop.properties).loop_count == 4);

  const Command trigger = MustParse("T,Passing,0,5000");
  const auto& properties = std::get<Trigger>(trigger.properties);
  REQUIRE(properties.trigger_type == TriggerType::Passing());
  REQUIRE(properties.end_time == 5000);
  REQUIRE_FALSE(properties.group_number.has_value());

  const Command grouped = MustParse("T,HitSoundClap,0,5000,2");
  REQUIRE(std::get<Trigger>(grouped.properties).group_number == 2);
  REQUIRE(ParseErrorMessage("T,HitSoundClap,0,5000,2,1") == "Invalid `group_number` value");
}

TEST_CASE("HitSound trigger names", "[command][trigger]") {
  TriggerType type;
  Error error;

  SECTION("sample set and addition") {
    REQUIRE(ParseTriggerType("HitSoundSoftWhistle", &type, &error));
    REQUIRE(type.sample_set == SampleSet::kSoft);
    REQUIRE_FALSE(type.additions_sample_set.has_value());
    REQUIRE(type.addition == Addition::kWhistle);
    REQUIRE(FormatTriggerType(type) == "HitSoundSoftWhistle");
  }

  SECTION("all four parts") {
    REQUIRE(ParseTriggerType("HitSoundDrumNormalClap3", &type, &error));
    REQUIRE(type.sample_set == SampleSet::kDrum);
    REQUIRE(type.additions_sample_set == SampleSet::kNormal);
    REQUIRE(type.addition == Addition::kClap);
    REQUIRE(type.custom_sample_set == 3U);
    REQUIRE(FormatTriggerType(type) == "HitSoundDrumNormalClap3");
  }

  SECTION("bare HitSound") {
    REQUIRE(ParseTriggerType("HitSound", &type, &error));
    REQUIRE(type == TriggerType{});
    REQUIRE(FormatTriggerType(type) == "HitSound");
  }

  SECTION("too many parts") {
    REQUIRE_FALSE(ParseTriggerType("HitSoundAllNormalWhistle3Foo", &type, &error));
    REQUIRE(error.code == ErrorCode::kTooManyHitSoundFields);
    REQUIRE(error.Message() == "There are too many `HitSound` fields: 5");
  }

  SECTION("unknown part") {
    REQUIRE_FALSE(ParseTriggerType("HitSoundSlide", &type, &error));
    REQUIRE(error.Message() == "Unknown `HitSound` type Slide");
  }

  SECTION("custom set must come last") {
    REQUIRE_FALSE(ParseTriggerType("HitSound3Soft", &type, &error));
    REQUIRE(error.code == ErrorCode::kUnknownHitSoundType);
  }

  SECTION("unknown trigger") {
    REQUIRE_FALSE(ParseTriggerType("Hover", &type, &error));
    REQUIRE(error.Message() == "Unknown trigger type Hover");
  }
}

TEST_CASE("Commands render back to their line", "[command][render]") {
  const std::vector<std::string> lines = {
      "F,0,1000,2000,0,1,0.50",  "M,1,0,,320,240,100,200,50", "MX,0,0,100,-10.5", "MY,2,0,100,5,6,7",
      "S,0,0,0,1.25",            "V,0,0,1000,1,1,2,3,4",      "R,0,0,100,-3.14", "C,0,0,,255,255,255,0,0,0,10",
      "P,0,0,100,H,V,A",         "L,1000,4",                  "T,HitSoundDrumWhistle,0,1000,2",
      "T,Failing,100,200",
  };
  for (const std::string& line : lines) {
    INFO(line);
    const auto rendered = RenderCommand(MustParse(line));
    REQUIRE(rendered.has_value());
    REQUIRE(*rendered == line);
  }
}

TEST_CASE("Omitted continuing component must be last", "[command][render]") {
  Error error;

  SECTION("vector") {
    Move move;
    move.continuing_positions.push_back(ContinuingVector2{Decimal(1), std::nullopt});
    move.continuing_positions.push_back(ContinuingVector2{Decimal(2), Decimal(3)});
    const Command command{move};
    REQUIRE_FALSE(ValidateCommand(command, &error));
    REQUIRE(error.code == ErrorCode::kOmittedFieldNotLast);
    REQUIRE(error.field == "y");
    REQUIRE_FALSE(RenderCommand(command).has_value());
  }

  SECTION("colour blue without green") {
    Colour colour;
    colour.continuing_colours.push_back(ContinuingRgb{1, std::nullopt, uint8_t{3}});
    const Command command{colour};
    REQUIRE_FALSE(ValidateCommand(command, &error));
    REQUIRE(error.field == "green");
    REQUIRE(error.Message() ==
            "continuing fields green field is none without it being the last item in the continuing fields");
  }

  SECTION("colour missing blue before the last group") {
    Colour colour;
    colour.continuing_colours.push_back(ContinuingRgb{1, uint8_t{2}, std::nullopt});
    colour.continuing_colours.push_back(ContinuingRgb{4, uint8_t{5}, uint8_t{6}});
    REQUIRE_FALSE(ValidateCommand(Command{colour}, &error));
    REQUIRE(error.field == "blue");
  }
}
