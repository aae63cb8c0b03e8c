#pragma once

#include <cstdint>
#include <limits>
#include <optional>

namespace osb::core {

using Version = int;

inline constexpr Version kMinVersion = 3;
inline constexpr Version kMaxVersion = 14;

// Added to event times on parse and removed on render for versions 3 and 4.
inline constexpr int32_t kOldVersionTimeOffset = 24;

struct VersionPolicy {
  bool legacy_time_offset = false;
  bool named_enums = true;
  bool position_materialized = false;
  bool colour_transformation = true;
};

inline bool IsSupportedVersion(Version version) { return version >= kMinVersion && version <= kMaxVersion; }

inline VersionPolicy PolicyFor(Version version) {
  VersionPolicy policy;
  policy.legacy_time_offset = version >= 3 && version <= 4;
  policy.named_enums = version >= 5;
  policy.position_materialized = version >= 14;
  policy.colour_transformation = version < 14;
  return policy;
}

// nullopt when the shifted time no longer fits in 32 bits.
inline std::optional<int32_t> ShiftTime(int32_t time, int64_t delta) {
  const int64_t shifted = static_cast<int64_t>(time) + delta;
  if (shifted < std::numeric_limits<int32_t>::min() || shifted > std::numeric_limits<int32_t>::max()) {
    return std::nullopt;
  }
  return static_cast<int32_t>(shifted);
}

inline std::optional<int32_t> ApplyTimeOffset(int32_t time, Version version) {
  return ShiftTime(time, PolicyFor(version).legacy_time_offset ? kOldVersionTimeOffset : 0);
}

inline std::optional<int32_t> RemoveTimeOffset(int32_t time, Version version) {
  return ShiftTime(time, PolicyFor(version).legacy_time_offset ? -kOldVersionTimeOffset : 0);
}

}  // namespace osb::core
