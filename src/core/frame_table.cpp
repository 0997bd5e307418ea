#include "core/frame_table.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>

#include "core/observation_codec.hpp"

namespace psp {

static FrameTableError TableError(std::size_t index, const std::string& msg) {
  std::ostringstream oss;
  oss << "Frame table error at frames[" << index << "]: " << msg;
  return FrameTableError(oss.str());
}

template <typename T>
static T Read(const YAML::Node& n, const char* key, std::size_t index) {
  const YAML::Node v = n[key];
  if (!v) throw TableError(index, std::string("missing '") + key + "'");
  try {
    return v.as<T>();
  } catch (const YAML::Exception& e) {
    throw TableError(index, std::string(key) + ": " + e.what());
  }
}

void WriteFrameTable(YAML::Emitter& out, const std::vector<std::shared_ptr<const MaterializedFrame>>& frames,
                     const std::vector<QualityVerdict>& verdicts, double interpolation_percentage) {
  out << YAML::BeginMap;
  out << YAML::Key << "total_frames" << YAML::Value << frames.size();
  out << YAML::Key << "interpolation_percentage" << YAML::Value << interpolation_percentage;

  out << YAML::Key << "frames" << YAML::Value << YAML::BeginSeq;
  for (const auto& frame : frames) {
    out << YAML::BeginMap;
    out << YAML::Key << "index" << YAML::Value << frame->logical_index;
    out << YAML::Key << "kind" << YAML::Value << ToString(frame->kind);
    if (frame->logical_index < verdicts.size()) {
      out << YAML::Key << "verdict" << YAML::Value << ToString(verdicts[frame->logical_index]);
    }
    // Direct frames are served from the raw slot of the same index
    if (frame->kind == EntryKind::Direct) out << YAML::Key << "source" << YAML::Value << frame->logical_index;
    if (frame->recipe) {
      out << YAML::Key << "recipe" << YAML::Value << YAML::Flow << YAML::BeginMap
          << YAML::Key << "left" << YAML::Value << frame->recipe->left_source_index
          << YAML::Key << "right" << YAML::Value << frame->recipe->right_source_index
          << YAML::Key << "weight" << YAML::Value << frame->recipe->weight
          << YAML::EndMap;
    }
    if (frame->pose) {
      out << YAML::Key << "pose" << YAML::Value;
      WriteObservation(out, *frame->pose);
    }
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;
  out << YAML::EndMap;
}

LogicalFrameMap ParseFrameTable(const YAML::Node& root) {
  const YAML::Node frames = root.IsMap() ? root["frames"] : YAML::Node();
  if (!frames || !frames.IsSequence()) throw FrameTableError("Frame table error: 'frames' must be a list");

  LogicalFrameMap map;
  map.reserve(frames.size());

  for (std::size_t i = 0; i < frames.size(); ++i) {
    const YAML::Node f = frames[i];
    if (!f.IsMap()) throw TableError(i, "entry must be a map");
    if (Read<std::size_t>(f, "index", i) != i) throw TableError(i, "entries must be in logical order");

    const std::string kind = Read<std::string>(f, "kind", i);
    if (kind == ToString(EntryKind::Direct)) {
      map.push_back(LogicalFrameEntry::Direct(f["source"] ? Read<std::size_t>(f, "source", i) : i));
    } else if (kind == ToString(EntryKind::Interpolated)) {
      const YAML::Node r = f["recipe"];
      if (!r || !r.IsMap()) throw TableError(i, "interpolated frame without a recipe");

      InterpolationRecipe recipe;
      recipe.left_source_index = Read<std::size_t>(r, "left", i);
      recipe.right_source_index = Read<std::size_t>(r, "right", i);
      recipe.weight = Read<double>(r, "weight", i);
      if (!(recipe.left_source_index < i && i < recipe.right_source_index)) {
        throw TableError(i, "recipe sources must bracket the frame");
      }
      if (!(recipe.weight > 0.0 && recipe.weight < 1.0)) throw TableError(i, "recipe weight must be in (0, 1)");
      map.push_back(LogicalFrameEntry::Interpolated(recipe));
    } else if (kind == ToString(EntryKind::Unavailable)) {
      map.push_back(LogicalFrameEntry::Unavailable());
    } else {
      throw TableError(i, "unknown kind '" + kind + "'");
    }
  }
  return map;
}

LogicalFrameMap LoadFrameTable(const std::string& path) {
  YAML::Node root;
  try {
    root = YAML::LoadFile(path);
  } catch (const YAML::Exception& e) {
    throw FrameTableError("Cannot read frame table " + path + ": " + e.what());
  }
  return ParseFrameTable(root);
}

} // namespace psp
