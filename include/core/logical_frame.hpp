#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "core/pose_observation.hpp"

namespace psp {

// A synthesized frame sits 'weight' of the way from the left source to the right source
struct InterpolationRecipe {
  std::size_t left_source_index{0};
  std::size_t right_source_index{0};
  double weight{0.0};
};

enum class EntryKind {
  Direct,
  Interpolated,
  Unavailable
};

const char* ToString(EntryKind k);

struct LogicalFrameEntry {
  EntryKind kind{EntryKind::Unavailable};
  std::size_t source_index{0};               // Direct only
  std::optional<InterpolationRecipe> recipe; // Interpolated only

  static LogicalFrameEntry Direct(std::size_t source) {
    LogicalFrameEntry e;
    e.kind = EntryKind::Direct;
    e.source_index = source;
    return e;
  }

  static LogicalFrameEntry Interpolated(const InterpolationRecipe& r) {
    LogicalFrameEntry e;
    e.kind = EntryKind::Interpolated;
    e.recipe = r;
    return e;
  }

  static LogicalFrameEntry Unavailable() { return LogicalFrameEntry{}; }
};

using LogicalFrameMap = std::vector<LogicalFrameEntry>;

// What a consumer reads for one logical index
struct MaterializedFrame {
  std::size_t logical_index{0};
  EntryKind kind{EntryKind::Unavailable};
  std::optional<InterpolationRecipe> recipe;
  std::optional<PoseObservation> pose; // empty exactly when kind == Unavailable

  bool available() const { return kind != EntryKind::Unavailable; }
  bool interpolated() const { return kind == EntryKind::Interpolated; }
};

} // namespace psp
