#include <cmath>
#include <cstdio>
#include <fstream>
#include <iostream>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

#include <yaml-cpp/yaml.h>

#include "cache/frame_store.hpp"
#include "core/frame_table.hpp"
#include "core/gap_interpolator.hpp"
#include "core/quality_classifier.hpp"

#include "check.hpp"
#include "pose_fixtures.hpp"

// Eight frames: 2 absent (bridged), 6 and 7 absent at the end (unavailable)
static psp::RawSequencePtr Raw() {
  auto raw = std::make_shared<psp::RawSequence>();
  for (std::size_t i = 0; i < 8; ++i) {
    if (i == 2 || i >= 6) {
      raw->emplace_back();
    } else {
      raw->push_back(psp_test::MakePose(i, 20.f + 2.f * static_cast<float>(i), 50.f));
    }
  }
  return raw;
}

static bool SameEntry(const psp::LogicalFrameEntry& a, const psp::LogicalFrameEntry& b) {
  if (a.kind != b.kind) return false;
  if (a.kind == psp::EntryKind::Direct) return a.source_index == b.source_index;
  if (a.kind == psp::EntryKind::Interpolated) {
    return a.recipe && b.recipe && a.recipe->left_source_index == b.recipe->left_source_index &&
           a.recipe->right_source_index == b.recipe->right_source_index &&
           psp_test::Near(a.recipe->weight, b.recipe->weight, 1e-9);
  }
  return true;
}

int main() {
  const psp::RawSequencePtr raw = Raw();
  const psp::VerdictSequence verdicts = psp::QualityClassifier(psp::QualityConfig{}).classify(*raw);
  const psp::LogicalFrameMap plan = psp::Interpolate(*raw, verdicts, 5);

  psp::FrameStore store(psp::CacheConfig{});
  store.initialize(raw, plan);
  const auto frames = store.get_frame_range(0, store.size() - 1);

  YAML::Emitter out;
  psp::WriteFrameTable(out, frames, verdicts, 12.5);
  CHECK(out.good());

  // The written table lists every frame and loads back into the same plan
  {
    const YAML::Node root = YAML::Load(out.c_str());
    CHECK(root["total_frames"].as<std::size_t>() == 8);
    CHECK(root["frames"].size() == 8);
    CHECK(root["frames"][2]["kind"].as<std::string>() == "interpolated");
    CHECK(root["frames"][2]["verdict"].as<std::string>() == psp::ToString(verdicts[2]));
    CHECK(root["frames"][2]["pose"]["frameNumber"].as<std::uint64_t>() == 2);
    CHECK(!root["frames"][7]["pose"]);

    const psp::LogicalFrameMap loaded = psp::ParseFrameTable(root);
    CHECK(loaded.size() == plan.size());
    for (std::size_t i = 0; i < loaded.size() && i < plan.size(); ++i) CHECK(SameEntry(loaded[i], plan[i]));

    // A second store over the same raw sequence serves the same frames without planning again
    psp::FrameStore again(psp::CacheConfig{});
    again.initialize(raw, loaded);
    CHECK(again.get_frame(2)->interpolated());
    CHECK(again.get_frame(2)->pose && psp_test::Near(again.get_frame(2)->pose->keypoints[0].x,
                                                      frames[2]->pose->keypoints[0].x, 1e-4));
    CHECK(!again.get_frame(6)->available());
  }

  // From a file
  {
    const std::string path = "/tmp/psp_frame_table_" + std::to_string(::getpid()) + ".yaml";
    {
      std::ofstream file(path);
      file << out.c_str() << "\n";
    }
    CHECK(psp::LoadFrameTable(path).size() == 8);
    std::remove(path.c_str());
    CHECK(psp_test::Throws<psp::FrameTableError>([&] { (void)(psp::LoadFrameTable(path)); }));
  }

  // Malformed tables
  CHECK(psp_test::Throws<psp::FrameTableError>([&] { (void)(psp::ParseFrameTable(YAML::Load("[1, 2]"))); }));
  CHECK(psp_test::Throws<psp::FrameTableError>([&] {
    (void)(psp::ParseFrameTable(YAML::Load("frames: [{index: 1, kind: direct}]")));
  }));
  CHECK(psp_test::Throws<psp::FrameTableError>([&] {
    (void)(psp::ParseFrameTable(YAML::Load("frames: [{index: 0, kind: blurry}]")));
  }));
  CHECK(psp_test::Throws<psp::FrameTableError>([&] {
    (void)(psp::ParseFrameTable(YAML::Load("frames: [{index: 0, kind: interpolated}]")));
  }));
  CHECK(psp_test::Throws<psp::FrameTableError>([&] {
    (void)(psp::ParseFrameTable(
        YAML::Load("frames: [{index: 0, kind: direct}, {index: 1, kind: interpolated, "
                   "recipe: {left: 0, right: 2, weight: 1.5}}]")));
  }));

  return psp_test::Finish("frame_table_test");
}
