#include "core/frame_blend.hpp"

#include <opencv2/core/quaternion.hpp>

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <string>

namespace psp {

static inline float Lerp(float a, float b, double t) {
  return static_cast<float>(a + (b - a) * t);
}

static Keypoint BlendKeypoint(const Keypoint& a, const Keypoint& b, double t) {
  Keypoint out;
  out.name = a.name.empty() ? b.name : a.name;
  out.x = Lerp(a.x, b.x, t);
  out.y = Lerp(a.y, b.y, t);

  if (a.has_z && b.has_z) {
    out.z = Lerp(a.z, b.z, t);
    out.has_z = true;
  } else if (a.has_z || b.has_z) {
    out.z = a.has_z ? a.z : b.z;
    out.has_z = true;
  }

  out.confidence = std::min(a.confidence, b.confidence);
  return out;
}

std::vector<Keypoint> BlendKeypoints(const std::vector<Keypoint>& a, const std::vector<Keypoint>& b, double t) {
  const std::size_t n = std::max(a.size(), b.size());
  std::vector<Keypoint> out;
  out.reserve(n);

  for (std::size_t i = 0; i < n; ++i) {
    const Keypoint& ka = (i < a.size()) ? a[i] : b[i];
    const Keypoint& kb = (i < b.size()) ? b[i] : a[i];
    out.push_back(BlendKeypoint(ka, kb, t));
  }
  return out;
}

std::vector<cv::Point3f> BlendVertices(const std::vector<cv::Point3f>& a, const std::vector<cv::Point3f>& b, double t) {
  const std::size_t n = std::max(a.size(), b.size());
  const cv::Point3f a_last = a.empty() ? cv::Point3f() : a.back();
  const cv::Point3f b_last = b.empty() ? cv::Point3f() : b.back();

  std::vector<cv::Point3f> out;
  out.reserve(n);
  for (std::size_t i = 0; i < n; ++i) {
    const cv::Point3f& va = (i < a.size()) ? a[i] : a_last;
    const cv::Point3f& vb = (i < b.size()) ? b[i] : b_last;
    out.emplace_back(Lerp(va.x, vb.x, t), Lerp(va.y, vb.y, t), Lerp(va.z, vb.z, t));
  }
  return out;
}

std::optional<cv::Vec3f> BlendTranslation(const std::optional<cv::Vec3f>& a, const std::optional<cv::Vec3f>& b, double t) {
  if (!a && !b) return std::nullopt;
  if (!a) return b;
  if (!b) return a;

  const cv::Vec3f& va = *a;
  const cv::Vec3f& vb = *b;
  return cv::Vec3f(Lerp(va[0], vb[0], t), Lerp(va[1], vb[1], t), Lerp(va[2], vb[2], t));
}

std::optional<cv::Vec3d> BlendOrientation(const std::optional<cv::Vec3d>& a, const std::optional<cv::Vec3d>& b, double t) {
  if (!a && !b) return std::nullopt;
  if (!a) return b;
  if (!b) return a;

  const cv::Quatd qa = cv::Quatd::createFromRvec(*a);
  const cv::Quatd qb = cv::Quatd::createFromRvec(*b);

  // directChange flips qb when the dot product is negative, which keeps the path on the short arc
  cv::Quatd q = cv::Quatd::slerp(qa, qb, t, cv::QUAT_ASSUME_UNIT, true);

  // Quat::toRotVec divides by sin(angle / 2), so the identity is handled here
  if (q.w < 0.0) q = -q;
  const double s = std::sqrt(q.x * q.x + q.y * q.y + q.z * q.z);
  if (s < 1e-12) return cv::Vec3d(0.0, 0.0, 0.0);
  const double angle = 2.0 * std::atan2(s, q.w);
  return cv::Vec3d(q.x, q.y, q.z) * (angle / s);
}

PoseObservation BlendObservations(const PoseObservation& left, const PoseObservation& right, double t) {
  t = std::max(0.0, std::min(1.0, t));

  PoseObservation out;
  const double span = static_cast<double>(right.frame_number) - static_cast<double>(left.frame_number);
  out.frame_number = left.frame_number + static_cast<std::uint64_t>(std::llround(span * t));

  out.keypoints = BlendKeypoints(left.keypoints, right.keypoints, t);
  out.has_3d = left.has_3d || right.has_3d;

  if (left.mesh_vertices && right.mesh_vertices) {
    out.mesh_vertices = BlendVertices(*left.mesh_vertices, *right.mesh_vertices, t);
  } else if (left.mesh_vertices || right.mesh_vertices) {
    out.mesh_vertices = left.mesh_vertices ? left.mesh_vertices : right.mesh_vertices;
  }

  // Connectivity is not interpolated, take the richer topology
  if (left.mesh_faces && right.mesh_faces) {
    out.mesh_faces = (left.mesh_faces->size() >= right.mesh_faces->size()) ? left.mesh_faces : right.mesh_faces;
  } else if (left.mesh_faces || right.mesh_faces) {
    out.mesh_faces = left.mesh_faces ? left.mesh_faces : right.mesh_faces;
  }

  out.camera_translation = BlendTranslation(left.camera_translation, right.camera_translation, t);
  out.global_orient = BlendOrientation(left.global_orient, right.global_orient, t);

  out.confidence = std::min(left.confidence, right.confidence);
  out.processing_time_ms = 0.0;
  out.image_size = left.image_size;
  return out;
}

static const PoseObservation& SourceAt(const RawSequence& raw, std::size_t index) {
  if (index >= raw.size() || !raw[index]) {
    throw std::invalid_argument("logical entry refers to empty raw slot " + std::to_string(index));
  }
  return *raw[index];
}

MaterializedFrame Materialize(const RawSequence& raw, const LogicalFrameEntry& entry, std::size_t logical_index) {
  MaterializedFrame out;
  out.logical_index = logical_index;
  out.kind = entry.kind;

  switch (entry.kind) {
    case EntryKind::Direct:
      out.pose = SourceAt(raw, entry.source_index);
      break;
    case EntryKind::Interpolated: {
      if (!entry.recipe) throw std::invalid_argument("interpolated entry has no recipe");
      const InterpolationRecipe& r = *entry.recipe;
      out.recipe = r;
      out.pose = BlendObservations(SourceAt(raw, r.left_source_index), SourceAt(raw, r.right_source_index), r.weight);
      break;
    }
    case EntryKind::Unavailable:
      break;
  }

  return out;
}

} // namespace psp
