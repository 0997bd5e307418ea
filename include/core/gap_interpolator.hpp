#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "core/logical_frame.hpp"
#include "core/pose_observation.hpp"
#include "core/quality_classifier.hpp"

/*
    Gap planning over a verdict sequence.

    A gap is a maximal run of non-Accepted indices. It is filled only when an Accepted frame bounds it on both
    sides and it holds no more than max_gap frames; everything else stays Unavailable. Planning is index
    bookkeeping only, the pose math happens later in frame_blend when a frame is actually read.
*/

namespace psp {

struct GapRun {
  std::size_t first{0};               // first non-accepted index
  std::size_t last{0};                // last non-accepted index (inclusive)
  std::optional<std::size_t> left;    // accepted bound before the run
  std::optional<std::size_t> right;   // accepted bound after the run
  bool resolved{false};               // interior gets Interpolated entries

  std::size_t size() const { return last - first + 1; }
};

struct GapReport {
  std::size_t total_frames{0};
  std::size_t direct{0};
  std::size_t interpolated{0};
  std::size_t unavailable{0};
  bool has_start_gap{false};
  bool has_end_gap{false};
  std::vector<GapRun> runs;

  double interpolation_percentage() const {
    return total_frames == 0 ? 0.0 : 100.0 * static_cast<double>(interpolated) / static_cast<double>(total_frames);
  }
};

// Finds maximal runs of non-Accepted verdicts
std::vector<GapRun> FindGapRuns(const VerdictSequence& verdicts, int max_gap);

class GapInterpolator {
public:
  explicit GapInterpolator(int max_gap);

  // Throws std::invalid_argument when verdicts do not line up with 'raw'
  LogicalFrameMap interpolate(const RawSequence& raw, const VerdictSequence& verdicts) const;

  // Same as interpolate, also reporting the runs it found
  LogicalFrameMap interpolate(const RawSequence& raw, const VerdictSequence& verdicts, GapReport& report) const;

  int max_gap() const { return max_gap_; }

private:
  int max_gap_;
};

// Free-function form of GapInterpolator::interpolate
LogicalFrameMap Interpolate(const RawSequence& raw, const VerdictSequence& verdicts, int max_gap);

} // namespace psp
