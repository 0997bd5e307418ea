#pragma once

#include <cstddef>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

#include "core/config.hpp"
#include "core/pose_observation.hpp"

/*
    QualityClassifier decides, per raw slot, whether an observation can be shown as-is.

    Rules run in order and stop at the first hit:
      1. RejectedLowConfidence  observation.confidence < min_confidence
      2. RejectedOffScreen      share of keypoints that are outside the frame (boundary_margin counts as outside)
                                and below off_screen_confidence exceeds off_screen_share
      3. RejectedOutlier        the keypoint centroid strays from the motion trend of its neighbours
      4. Accepted

    Outlier trend: the centroid of each observation is taken in normalized image coordinates ([0, 1] on both
    axes). Up to trend_window_size / 2 of the nearest frames on each side that pass rules 1 and 2 are used as
    neighbours, and a least-squares line (centroid against frame offset) is fit through them. The line's value
    at offset 0 is the expected centroid. The deviation ratio is |centroid - expected| / (1 + |slope|), so it
    reads as a fraction of the frame plus the per-frame motion of the trend. Frames without at least one
    neighbour on each side are never outliers.
*/

namespace psp {

enum class QualityVerdict {
  Accepted,
  RejectedLowConfidence,
  RejectedOffScreen,
  RejectedOutlier,
  Absent
};

const char* ToString(QualityVerdict v);

using VerdictSequence = std::vector<QualityVerdict>;

struct QualitySummary {
  std::size_t accepted{0};
  std::size_t low_confidence{0};
  std::size_t off_screen{0};
  std::size_t outlier{0};
  std::size_t absent{0};
};

QualitySummary Summarize(const VerdictSequence& verdicts);

class QualityClassifier {
public:
  // 'frame_size' is used for observations that do not carry their own image size
  explicit QualityClassifier(QualityConfig cfg, cv::Size frame_size = cv::Size());

  VerdictSequence classify(const RawSequence& raw) const;

  // Exposed for diagnostics and tests
  float off_screen_share(const PoseObservation& obs) const;
  double outlier_ratio(const RawSequence& raw, const std::vector<bool>& candidates, std::size_t index) const;

  const QualityConfig& config() const { return cfg_; }

private:
  cv::Size bounds_for(const PoseObservation& obs) const;
  bool outside_frame(const Keypoint& kp, const cv::Size& bounds) const;
  bool centroid(const PoseObservation& obs, cv::Point2d& out) const;

  QualityConfig cfg_;
  cv::Size frame_size_;
};

} // namespace psp
