#include "core/quality_classifier.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace psp {

const char* ToString(QualityVerdict v) {
  switch (v) {
    case QualityVerdict::Accepted: return "accepted";
    case QualityVerdict::RejectedLowConfidence: return "low_confidence";
    case QualityVerdict::RejectedOffScreen: return "off_screen";
    case QualityVerdict::RejectedOutlier: return "outlier";
    case QualityVerdict::Absent: return "absent";
  }
  return "unknown";
}

QualitySummary Summarize(const VerdictSequence& verdicts) {
  QualitySummary s;
  for (const auto v : verdicts) {
    switch (v) {
      case QualityVerdict::Accepted: ++s.accepted; break;
      case QualityVerdict::RejectedLowConfidence: ++s.low_confidence; break;
      case QualityVerdict::RejectedOffScreen: ++s.off_screen; break;
      case QualityVerdict::RejectedOutlier: ++s.outlier; break;
      case QualityVerdict::Absent: ++s.absent; break;
    }
  }
  return s;
}

QualityClassifier::QualityClassifier(QualityConfig cfg, cv::Size frame_size)
    : cfg_(std::move(cfg)), frame_size_(frame_size) {}

cv::Size QualityClassifier::bounds_for(const PoseObservation& obs) const {
  if (obs.image_size.width > 0 && obs.image_size.height > 0) return obs.image_size;
  return frame_size_;
}

bool QualityClassifier::outside_frame(const Keypoint& kp, const cv::Size& bounds) const {
  const float mx = static_cast<float>(bounds.width) * cfg_.boundary_margin;
  const float my = static_cast<float>(bounds.height) * cfg_.boundary_margin;

  return kp.x < mx || kp.x > static_cast<float>(bounds.width) - mx ||
         kp.y < my || kp.y > static_cast<float>(bounds.height) - my;
}

float QualityClassifier::off_screen_share(const PoseObservation& obs) const {
  // Nothing detected at all counts as fully off-screen
  if (obs.keypoints.empty()) return 1.f;

  const cv::Size bounds = bounds_for(obs);
  if (bounds.width <= 0 || bounds.height <= 0) return 0.f; // no frame to compare against

  std::size_t off = 0;
  for (const auto& kp : obs.keypoints) {
    if (kp.confidence < cfg_.off_screen_confidence && outside_frame(kp, bounds)) ++off;
  }
  return static_cast<float>(off) / static_cast<float>(obs.keypoints.size());
}

bool QualityClassifier::centroid(const PoseObservation& obs, cv::Point2d& out) const {
  if (obs.keypoints.empty()) return false;

  cv::Point2d sum(0.0, 0.0);
  for (const auto& kp : obs.keypoints) {
    sum.x += kp.x;
    sum.y += kp.y;
  }
  out = sum * (1.0 / static_cast<double>(obs.keypoints.size()));

  const cv::Size bounds = bounds_for(obs);
  if (bounds.width > 0 && bounds.height > 0) {
    out.x /= bounds.width;
    out.y /= bounds.height;
  }
  return true;
}

double QualityClassifier::outlier_ratio(const RawSequence& raw, const std::vector<bool>& candidates, std::size_t index) const {
  cv::Point2d current;
  if (!raw[index] || !centroid(*raw[index], current)) return 0.0;

  const std::size_t per_side = std::max(1, cfg_.trend_window_size / 2);

  struct Sample { double t; cv::Point2d c; };
  std::vector<Sample> samples;
  std::size_t before = 0;
  std::size_t after = 0;

  for (std::size_t j = index; j-- > 0 && before < per_side;) {
    cv::Point2d c;
    if (candidates[j] && centroid(*raw[j], c)) {
      samples.push_back({static_cast<double>(j) - static_cast<double>(index), c});
      ++before;
    }
  }
  for (std::size_t j = index + 1; j < raw.size() && after < per_side; ++j) {
    cv::Point2d c;
    if (candidates[j] && centroid(*raw[j], c)) {
      samples.push_back({static_cast<double>(j) - static_cast<double>(index), c});
      ++after;
    }
  }

  // Trend needs support on both sides, otherwise this is extrapolation off an edge
  if (before == 0 || after == 0) return 0.0;

  // Least squares line through (offset, centroid) for x and y
  const double n = static_cast<double>(samples.size());
  double st = 0.0, stt = 0.0;
  cv::Point2d sc(0.0, 0.0), stc(0.0, 0.0);
  for (const auto& s : samples) {
    st += s.t;
    stt += s.t * s.t;
    sc += s.c;
    stc += s.c * s.t;
  }

  const double denom = n * stt - st * st;
  if (std::abs(denom) < 1e-12) return 0.0;

  const cv::Point2d slope = (stc * n - sc * st) * (1.0 / denom);
  const cv::Point2d expected = (sc - slope * st) * (1.0 / n);

  const double deviation = cv::norm(current - expected);
  return deviation / (1.0 + cv::norm(slope));
}

VerdictSequence QualityClassifier::classify(const RawSequence& raw) const {
  VerdictSequence verdicts(raw.size(), QualityVerdict::Absent);
  std::vector<bool> candidates(raw.size(), false);

  // Rules 1 and 2 only look at the frame itself
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (!raw[i]) continue;
    const PoseObservation& obs = *raw[i];

    if (obs.confidence < cfg_.min_confidence) {
      verdicts[i] = QualityVerdict::RejectedLowConfidence;
    } else if (off_screen_share(obs) > cfg_.off_screen_share) {
      verdicts[i] = QualityVerdict::RejectedOffScreen;
    } else {
      candidates[i] = true;
    }
  }

  // Rule 3 needs the neighbours that survived rules 1 and 2
  for (std::size_t i = 0; i < raw.size(); ++i) {
    if (!candidates[i]) continue;
    const double ratio = outlier_ratio(raw, candidates, i);
    verdicts[i] = (ratio > cfg_.outlier_deviation) ? QualityVerdict::RejectedOutlier : QualityVerdict::Accepted;
  }

  return verdicts;
}

} // namespace psp
