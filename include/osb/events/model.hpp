#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

#include "osb/core/decimal.hpp"
#include "osb/core/types.hpp"

namespace osb::events {

using core::Decimal;
using core::DecimalPosition;
using core::FilePath;
using core::Integer;
using core::Position;

// ---------------------------------------------------------------------------
// Storyboard enumerations

enum class Layer { kBackground, kFail, kPass, kForeground, kOverlay };

enum class Origin {
  kTopLeft,
  kCentre,
  kCentreLeft,
  kTopRight,
  kBottomCentre,
  kTopCentre,
  kCustom,
  kCentreRight,
  kBottomLeft,
  kBottomRight
};

enum class LoopType { kLoopForever, kLoopOnce };

// Numbered 0..34 in file order.
enum class Easing {
  kLinear,
  kEasingOut,
  kEasingIn,
  kQuadIn,
  kQuadOut,
  kQuadInOut,
  kCubicIn,
  kCubicOut,
  kCubicInOut,
  kQuartIn,
  kQuartOut,
  kQuartInOut,
  kQuintIn,
  kQuintOut,
  kQuintInOut,
  kSineIn,
  kSineOut,
  kSineInOut,
  kExpoIn,
  kExpoOut,
  kExpoInOut,
  kCircIn,
  kCircOut,
  kCircInOut,
  kElasticIn,
  kElasticOut,
  kElasticHalfOut,
  kElasticQuarterOut,
  kElasticInOut,
  kBackIn,
  kBackOut,
  kBackInOut,
  kBounceIn,
  kBounceOut,
  kBounceInOut
};

inline constexpr int kEasingCount = 35;

enum class ParameterType { kHorizontalFlip, kVerticalFlip, kAdditiveBlending };

enum class SampleSet { kAll, kNormal, kSoft, kDrum };

enum class Addition { kWhistle, kFinish, kClap };

struct TriggerType {
  enum class Kind { kHitSound, kPassing, kFailing };

  Kind kind = Kind::kHitSound;
  std::optional<SampleSet> sample_set;
  std::optional<SampleSet> additions_sample_set;
  std::optional<Addition> addition;
  std::optional<uint32_t> custom_sample_set;

  static TriggerType Passing() {
    TriggerType out;
    out.kind = Kind::kPassing;
    return out;
  }

  static TriggerType Failing() {
    TriggerType out;
    out.kind = Kind::kFailing;
    return out;
  }

  friend bool operator==(const TriggerType& a, const TriggerType& b) = default;
};

// ---------------------------------------------------------------------------
// Keyframe values

struct Vector2 {
  Decimal x;
  Decimal y;

  friend bool operator==(const Vector2& a, const Vector2& b) = default;
};

struct Rgb {
  uint8_t red = 0;
  uint8_t green = 0;
  uint8_t blue = 0;

  friend bool operator==(const Rgb& a, const Rgb& b) = default;
};

// A continuing group; only the last group of a line may omit `y`.
struct ContinuingVector2 {
  Decimal x;
  std::optional<Decimal> y;

  [[nodiscard]] Decimal ResolvedY() const { return y.value_or(x); }

  friend bool operator==(const ContinuingVector2& a, const ContinuingVector2& b) = default;
};

// A continuing colour; only the last group of a line may omit `green`/`blue`.
struct ContinuingRgb {
  uint8_t red = 0;
  std::optional<uint8_t> green;
  std::optional<uint8_t> blue;

  [[nodiscard]] uint8_t ResolvedGreen() const { return green.value_or(red); }
  [[nodiscard]] uint8_t ResolvedBlue() const { return blue.value_or(red); }

  friend bool operator==(const ContinuingRgb& a, const ContinuingRgb& b) = default;
};

// ---------------------------------------------------------------------------
// Commands

struct CommandTiming {
  Easing easing = Easing::kLinear;
  Integer start_time = 0;
  // nullopt when the end time is written empty.
  std::optional<Integer> end_time;

  [[nodiscard]] Integer ResolvedEndTime() const { return end_time.value_or(start_time); }

  friend bool operator==(const CommandTiming& a, const CommandTiming& b) = default;
};

struct Fade {
  CommandTiming timing;
  Decimal start_opacity;
  std::vector<Decimal> continuing_opacities;

  friend bool operator==(const Fade& a, const Fade& b) = default;
};

struct Move {
  CommandTiming timing;
  Vector2 start_position;
  std::vector<ContinuingVector2> continuing_positions;

  friend bool operator==(const Move& a, const Move& b) = default;
};

struct MoveX {
  CommandTiming timing;
  Decimal start_x;
  std::vector<Decimal> continuing_x;

  friend bool operator==(const MoveX& a, const MoveX& b) = default;
};

struct MoveY {
  CommandTiming timing;
  Decimal start_y;
  std::vector<Decimal> continuing_y;

  friend bool operator==(const MoveY& a, const MoveY& b) = default;
};

struct Scale {
  CommandTiming timing;
  Decimal start_scale;
  std::vector<Decimal> continuing_scales;

  friend bool operator==(const Scale& a, const Scale& b) = default;
};

struct VectorScale {
  CommandTiming timing;
  Vector2 start_scale;
  std::vector<ContinuingVector2> continuing_scales;

  friend bool operator==(const VectorScale& a, const VectorScale& b) = default;
};

struct Rotate {
  CommandTiming timing;
  Decimal start_rotation;
  std::vector<Decimal> continuing_rotations;

  friend bool operator==(const Rotate& a, const Rotate& b) = default;
};

struct Colour {
  CommandTiming timing;
  Rgb start_colour;
  std::vector<ContinuingRgb> continuing_colours;

  friend bool operator==(const Colour& a, const Colour& b) = default;
};

struct Parameter {
  CommandTiming timing;
  ParameterType parameter = ParameterType::kHorizontalFlip;
  std::vector<ParameterType> continuing_parameters;

  friend bool operator==(const Parameter& a, const Parameter& b) = default;
};

struct Command;

struct Loop {
  Integer start_time = 0;
  Integer loop_count = 0;
  std::vector<Command> commands;

  friend bool operator==(const Loop& a, const Loop& b);
};

struct Trigger {
  TriggerType trigger_type;
  Integer start_time = 0;
  Integer end_time = 0;
  std::optional<Integer> group_number;
  std::vector<Command> commands;

  friend bool operator==(const Trigger& a, const Trigger& b);
};

using CommandProperties =
    std::variant<Fade, Move, MoveX, MoveY, Scale, VectorScale, Rotate, Colour, Parameter, Loop, Trigger>;

// Copy, comparison and destruction walk nested Loop/Trigger bodies with an
// explicit stack, so arbitrarily deep trees never recurse.
struct Command {
  Command() = default;
  explicit Command(CommandProperties value) : properties(std::move(value)) {}
  Command(const Command& other);
  Command(Command&&) = default;
  Command& operator=(const Command& other);
  Command& operator=(Command&&) = default;
  ~Command();

  CommandProperties properties;

  // Child list of a Loop/Trigger, nullptr for every other kind.
  [[nodiscard]] std::vector<Command>* children();
  [[nodiscard]] const std::vector<Command>* children() const;
  [[nodiscard]] bool IsContainer() const { return children() != nullptr; }

  friend bool operator==(const Command& a, const Command& b);
};

// Destroys a command forest without recursing into Loop/Trigger bodies.
void ReleaseCommands(std::vector<Command>* commands);

// ---------------------------------------------------------------------------
// Storyboard objects

struct Sprite {
  FilePath filepath;

  friend bool operator==(const Sprite& a, const Sprite& b) = default;
};

struct Animation {
  FilePath filepath;
  uint32_t frame_count = 0;
  Decimal frame_delay;
  // nullopt when the field is omitted, which means LoopForever.
  std::optional<LoopType> loop_type;

  [[nodiscard]] LoopType ResolvedLoopType() const { return loop_type.value_or(LoopType::kLoopForever); }

  friend bool operator==(const Animation& a, const Animation& b) = default;
};

using ObjectType = std::variant<Sprite, Animation>;

struct Object {
  Layer layer = Layer::kBackground;
  Origin origin = Origin::kTopLeft;
  DecimalPosition position;
  ObjectType object_type;
  std::vector<Command> commands;

  // Appends a top-level command, for building storyboards without parsing.
  void PushCommand(Command command) { commands.push_back(std::move(command)); }

  [[nodiscard]] const FilePath& filepath() const;

  friend bool operator==(const Object& a, const Object& b) = default;
};

// ---------------------------------------------------------------------------
// Timeline events

struct Background {
  FilePath file_name;
  std::optional<Position> position;

  friend bool operator==(const Background& a, const Background& b) = default;
};

struct Video {
  FilePath file_name;
  std::optional<Position> position;
  // `1` rather than `Video`.
  bool short_hand = true;

  friend bool operator==(const Video& a, const Video& b) = default;
};

struct Break {
  Integer end_time = 0;
  // `2` rather than `Break`.
  bool short_hand = true;

  friend bool operator==(const Break& a, const Break& b) = default;
};

struct ColourTransformation {
  uint8_t red = 0;
  uint8_t green = 0;
  uint8_t blue = 0;

  friend bool operator==(const ColourTransformation& a, const ColourTransformation& b) = default;
};

// Storyboard sound sample.
struct Sample {
  Integer layer = 0;
  FilePath file_name;
  std::optional<Integer> volume;
  // `5` rather than `Sample`.
  bool short_hand = true;

  friend bool operator==(const Sample& a, const Sample& b) = default;
};

using EventParams = std::variant<Background, Video, Break, ColourTransformation, Sample>;

struct Comment {
  std::string text;

  friend bool operator==(const Comment& a, const Comment& b) = default;
};

struct NormalEvent {
  Integer start_time = 0;
  EventParams params;

  friend bool operator==(const NormalEvent& a, const NormalEvent& b) = default;
};

using Event = std::variant<Comment, NormalEvent, Object>;

struct Events {
  std::vector<Event> events;

  friend bool operator==(const Events& a, const Events& b) = default;
};

}  // namespace osb::events
