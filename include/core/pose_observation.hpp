#pragma once

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include <opencv2/core.hpp>

namespace psp {

struct Keypoint {
  std::string name;
  float x{0.f};
  float y{0.f};
  float z{0.f};
  bool has_z{false};
  float confidence{0.f};
};

// The external estimator's answer for one frame. Never mutated once produced.
struct PoseObservation {
  std::uint64_t frame_number{0};
  std::vector<Keypoint> keypoints;
  bool has_3d{false};

  std::optional<std::vector<cv::Point3f>> mesh_vertices;
  std::optional<std::vector<cv::Vec3i>> mesh_faces;
  std::optional<cv::Vec3f> camera_translation;
  std::optional<cv::Vec3d> global_orient; // axis-angle

  float confidence{0.f};
  double processing_time_ms{0.0};
  std::optional<std::string> error;

  // Size of the image the keypoints refer to, filled by the dispatcher from the request
  cv::Size image_size{};
};

// Slot i holds frame i's observation, or nothing when dispatch failed
using RawSequence = std::vector<std::optional<PoseObservation>>;
using RawSequencePtr = std::shared_ptr<const RawSequence>;

bool operator==(const Keypoint& a, const Keypoint& b);
bool operator==(const PoseObservation& a, const PoseObservation& b);
inline bool operator!=(const PoseObservation& a, const PoseObservation& b) { return !(a == b); }

} // namespace psp
