#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include <opencv2/core.hpp>

#include "core/logical_frame.hpp"
#include "core/pose_observation.hpp"

namespace psp {

// Keypoints lerp by position, take the lower confidence, and pad the shorter side from the longer one
std::vector<Keypoint> BlendKeypoints(const std::vector<Keypoint>& a, const std::vector<Keypoint>& b, double t);

// Vertex lists of different lengths are padded with their last vertex
std::vector<cv::Point3f> BlendVertices(const std::vector<cv::Point3f>& a, const std::vector<cv::Point3f>& b, double t);

std::optional<cv::Vec3f> BlendTranslation(const std::optional<cv::Vec3f>& a, const std::optional<cv::Vec3f>& b, double t);

// Axis-angle rotations, blended along the shorter arc
std::optional<cv::Vec3d> BlendOrientation(const std::optional<cv::Vec3d>& a, const std::optional<cv::Vec3d>& b, double t);

PoseObservation BlendObservations(const PoseObservation& left, const PoseObservation& right, double t);

// Produces what get_frame returns for 'entry'. Throws std::invalid_argument when the entry points at an empty slot.
MaterializedFrame Materialize(const RawSequence& raw, const LogicalFrameEntry& entry, std::size_t logical_index);

} // namespace psp
