#include <cmath>
#include <iostream>
#include <stdexcept>

#include "core/frame_blend.hpp"

#include "check.hpp"
#include "pose_fixtures.hpp"

int main() {
  const double kPi = std::acos(-1.0);

  // Keypoints: lerp positions, keep the lower confidence, pad from the longer side
  {
    std::vector<psp::Keypoint> a{{"a", 0.f, 0.f, 0.f, false, 0.9f}, {"b", 10.f, 10.f, 0.f, false, 0.8f}};
    std::vector<psp::Keypoint> b{{"a", 4.f, 8.f, 0.f, false, 0.7f}};
    const auto out = psp::BlendKeypoints(a, b, 0.25);
    CHECK(out.size() == 2);
    CHECK(psp_test::Near(out[0].x, 1.0, 1e-6));
    CHECK(psp_test::Near(out[0].y, 2.0, 1e-6));
    CHECK(psp_test::Near(out[0].confidence, 0.7, 1e-6));
    // Only one side has it, so it stays where it is
    CHECK(psp_test::Near(out[1].x, 10.0, 1e-6));
    CHECK(psp_test::Near(out[1].confidence, 0.8, 1e-6));
  }

  // Depth only blended when both sides have it
  {
    std::vector<psp::Keypoint> a{{"k", 0.f, 0.f, 1.f, true, 1.f}};
    std::vector<psp::Keypoint> b{{"k", 0.f, 0.f, 3.f, true, 1.f}};
    std::vector<psp::Keypoint> flat{{"k", 0.f, 0.f, 0.f, false, 1.f}};
    CHECK(psp_test::Near(psp::BlendKeypoints(a, b, 0.5)[0].z, 2.0, 1e-6));
    const auto mixed = psp::BlendKeypoints(a, flat, 0.5);
    CHECK(mixed[0].has_z);
    CHECK(psp_test::Near(mixed[0].z, 1.0, 1e-6));
  }

  // Vertices: the shorter list is padded with its last vertex
  {
    std::vector<cv::Point3f> a{{0.f, 0.f, 0.f}, {2.f, 0.f, 0.f}};
    std::vector<cv::Point3f> b{{2.f, 2.f, 2.f}, {4.f, 0.f, 0.f}, {6.f, 0.f, 0.f}};
    const auto out = psp::BlendVertices(a, b, 0.5);
    CHECK(out.size() == 3);
    CHECK(psp_test::Near(out[0].x, 1.0, 1e-6));
    CHECK(psp_test::Near(out[1].x, 3.0, 1e-6));
    CHECK(psp_test::Near(out[2].x, 4.0, 1e-6)); // (2 + 6) / 2
  }

  // Translation: linear, copied when one side is missing
  {
    const auto t = psp::BlendTranslation(cv::Vec3f(0.f, 0.f, 4.f), cv::Vec3f(2.f, 0.f, 8.f), 0.5);
    CHECK(t && std::abs((*t)[0] - 1.f) < 1e-6f && std::abs((*t)[2] - 6.f) < 1e-6f);
    const auto one = psp::BlendTranslation(std::nullopt, cv::Vec3f(1.f, 2.f, 3.f), 0.3);
    CHECK(one && (*one)[1] == 2.f);
    CHECK(!psp::BlendTranslation(std::nullopt, std::nullopt, 0.5));
  }

  // Orientation: slerp along the short arc
  {
    const auto half = psp::BlendOrientation(cv::Vec3d(0, 0, 0), cv::Vec3d(0, 0, kPi / 2), 0.5);
    CHECK(half.has_value());
    CHECK(psp_test::Near((*half)[2], kPi / 4, 1e-9));

    // +170 and -170 degrees about z meet at 180, not at 0
    const double deg170 = 170.0 * kPi / 180.0;
    const auto wrap = psp::BlendOrientation(cv::Vec3d(0, 0, deg170), cv::Vec3d(0, 0, -deg170), 0.5);
    CHECK(wrap.has_value());
    CHECK(psp_test::Near(std::abs((*wrap)[2]), kPi, 1e-6));

    const auto still = psp::BlendOrientation(cv::Vec3d(0, 0, 0), cv::Vec3d(0, 0, 0), 0.4);
    CHECK(still && cv::norm(*still) == 0.0);

    const auto t0 = psp::BlendOrientation(cv::Vec3d(0.3, 0, 0), cv::Vec3d(0, 0.5, 0), 0.0);
    CHECK(t0 && cv::norm(*t0 - cv::Vec3d(0.3, 0, 0)) < 1e-9);
  }

  // Whole observations
  {
    psp::PoseObservation left = psp_test::MakePose(2, 20.f, 50.f, 0.9f);
    psp::PoseObservation right = psp_test::MakePose(5, 50.f, 50.f, 0.7f);
    left.processing_time_ms = 300.0;
    right.has_3d = true;
    left.mesh_faces = std::vector<cv::Vec3i>{{0, 1, 2}};
    right.mesh_faces = std::vector<cv::Vec3i>{{0, 1, 2}, {1, 2, 3}};
    right.camera_translation = cv::Vec3f(0.f, 0.f, 5.f);

    const psp::PoseObservation mid = psp::BlendObservations(left, right, 1.0 / 3.0);
    CHECK(mid.frame_number == 3);
    CHECK(psp_test::Near(mid.keypoints[0].x, 29.0, 1e-4)); // 19 + 30 / 3
    CHECK(psp_test::Near(mid.confidence, 0.7, 1e-6));
    CHECK(mid.has_3d);
    CHECK(mid.mesh_faces && mid.mesh_faces->size() == 2);
    CHECK(mid.camera_translation && (*mid.camera_translation)[2] == 5.f);
    CHECK(mid.processing_time_ms == 0.0);
    CHECK(!mid.error);
  }

  // Materialize
  {
    psp::RawSequence raw(4);
    raw[0] = psp_test::MakePose(0, 10.f, 10.f);
    raw[3] = psp_test::MakePose(3, 40.f, 10.f);

    const auto direct = psp::Materialize(raw, psp::LogicalFrameEntry::Direct(3), 3);
    CHECK(direct.kind == psp::EntryKind::Direct && direct.pose && *direct.pose == *raw[3]);
    CHECK(!direct.interpolated());

    const auto synth = psp::Materialize(raw, psp::LogicalFrameEntry::Interpolated({0, 3, 2.0 / 3.0}), 2);
    CHECK(synth.interpolated() && synth.pose && synth.pose->frame_number == 2);
    CHECK(synth.logical_index == 2);
    CHECK(psp_test::Near(synth.pose->keypoints[0].x, 29.0, 1e-4));

    const auto none = psp::Materialize(raw, psp::LogicalFrameEntry::Unavailable(), 1);
    CHECK(!none.available() && !none.pose);

    CHECK(psp_test::Throws<std::invalid_argument>([&] {
      (void)(psp::Materialize(raw, psp::LogicalFrameEntry::Direct(1), 1));
    }));
    CHECK(psp_test::Throws<std::invalid_argument>([&] {
      (void)(psp::Materialize(raw, psp::LogicalFrameEntry::Interpolated({0, 2, 0.5}), 1));
    }));
  }

  return psp_test::Finish("frame_blend_test");
}
