#include "core/pose_observation.hpp"

namespace psp {

bool operator==(const Keypoint& a, const Keypoint& b) {
  return a.name == b.name && a.x == b.x && a.y == b.y && a.z == b.z &&
         a.has_z == b.has_z && a.confidence == b.confidence;
}

bool operator==(const PoseObservation& a, const PoseObservation& b) {
  return a.frame_number == b.frame_number &&
         a.keypoints == b.keypoints &&
         a.has_3d == b.has_3d &&
         a.mesh_vertices == b.mesh_vertices &&
         a.mesh_faces == b.mesh_faces &&
         a.camera_translation == b.camera_translation &&
         a.global_orient == b.global_orient &&
         a.confidence == b.confidence &&
         a.processing_time_ms == b.processing_time_ms &&
         a.error == b.error &&
         a.image_size == b.image_size;
}

} // namespace psp
