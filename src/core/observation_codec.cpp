#include "core/observation_codec.hpp"

#include <yaml-cpp/yaml.h>

#include <sstream>

namespace psp {

static ObservationParseError ParseError(const std::string& msg) {
  return ObservationParseError("Worker output error: " + msg);
}

// Present and not an explicit null
static bool Has(const YAML::Node& map, const char* key) {
  const YAML::Node n = map[key];
  return n && !n.IsNull();
}

template <typename T>
static T As(const YAML::Node& n, const std::string& what) {
  try {
    return n.as<T>();
  } catch (const YAML::Exception& e) {
    throw ParseError(what + ": " + e.what());
  }
}

// A result document is an object or a non-empty list of objects
static bool IsResultDocument(const YAML::Node& n) {
  if (n.IsMap()) return true;
  if (!n.IsSequence() || n.size() == 0) return false;
  for (const auto& item : n) {
    if (!item.IsMap()) return false;
  }
  return true;
}

// Log lines may open with '[' too ("[INFO] ..."), so every line that opens with '{' or '[' is tried in turn
static YAML::Node LoadDocument(const std::string& text) {
  std::string last_error;
  std::size_t line_start = 0;
  while (line_start < text.size()) {
    const std::size_t first = text.find_first_not_of(" \t\r", line_start);
    if (first == std::string::npos) break;

    if (text[first] == '{' || text[first] == '[') {
      try {
        YAML::Node root = YAML::Load(text.substr(first));
        if (IsResultDocument(root)) return root;
        last_error = "result must be an object";
      } catch (const YAML::Exception& e) {
        last_error = std::string("malformed JSON: ") + e.what();
      }
    }

    const std::size_t nl = text.find('\n', first);
    if (nl == std::string::npos) break;
    line_start = nl + 1;
  }

  if (last_error.empty()) throw ParseError("no JSON document on stdout");
  throw ParseError(last_error);
}

static cv::Vec3f ReadVec3f(const YAML::Node& n, const std::string& what) {
  if (!n.IsSequence() || n.size() < 3) throw ParseError(what + " must be a list of 3 numbers");
  return cv::Vec3f(As<float>(n[0], what), As<float>(n[1], what), As<float>(n[2], what));
}

static Keypoint ReadKeypoint(const YAML::Node& n, std::size_t index) {
  const std::string what = "keypoints[" + std::to_string(index) + "]";
  Keypoint kp;

  // Compact form: [x, y, confidence]
  if (n.IsSequence()) {
    if (n.size() < 3) throw ParseError(what + " must be [x, y, confidence]");
    kp.x = As<float>(n[0], what);
    kp.y = As<float>(n[1], what);
    kp.confidence = As<float>(n[2], what);
    return kp;
  }

  if (!n.IsMap()) throw ParseError(what + " must be a map");
  if (!Has(n, "x") || !Has(n, "y")) throw ParseError(what + " is missing x/y");

  kp.x = As<float>(n["x"], what + ".x");
  kp.y = As<float>(n["y"], what + ".y");
  if (Has(n, "z")) {
    kp.z = As<float>(n["z"], what + ".z");
    kp.has_z = true;
  }
  if (Has(n, "confidence")) kp.confidence = As<float>(n["confidence"], what + ".confidence");
  if (Has(n, "name")) kp.name = As<std::string>(n["name"], what + ".name");
  return kp;
}

static YAML::Node SelectResult(const YAML::Node& root, std::uint64_t expected_frame) {
  if (root.IsMap()) return root;
  if (!root.IsSequence() || root.size() == 0) throw ParseError("expected a result object");
  if (root.size() == 1) return root[0];

  for (const auto& item : root) {
    if (item.IsMap() && Has(item, "frameNumber") &&
        As<std::uint64_t>(item["frameNumber"], "frameNumber") == expected_frame) {
      return item;
    }
  }
  throw ParseError("no result for frame " + std::to_string(expected_frame));
}

PoseObservation ParseWorkerOutput(const std::string& text, std::uint64_t expected_frame) {
  const YAML::Node root = LoadDocument(text);

  const YAML::Node r = SelectResult(root, expected_frame);
  if (!r.IsMap()) throw ParseError("result must be an object");

  PoseObservation obs;
  obs.frame_number = expected_frame;

  if (Has(r, "frameNumber")) {
    const auto fn = As<std::uint64_t>(r["frameNumber"], "frameNumber");
    if (fn != expected_frame) {
      std::ostringstream oss;
      oss << "frameNumber " << fn << " does not match request " << expected_frame;
      throw ParseError(oss.str());
    }
  }

  if (Has(r, "error")) obs.error = As<std::string>(r["error"], "error");

  if (Has(r, "keypoints")) {
    const YAML::Node kps = r["keypoints"];
    if (!kps.IsSequence()) throw ParseError("keypoints must be a list");
    obs.keypoints.reserve(kps.size());
    for (std::size_t i = 0; i < kps.size(); ++i) obs.keypoints.push_back(ReadKeypoint(kps[i], i));
  }

  if (Has(r, "has3d")) obs.has_3d = As<bool>(r["has3d"], "has3d");

  if (Has(r, "mesh_vertices_data")) {
    const YAML::Node vs = r["mesh_vertices_data"];
    if (!vs.IsSequence()) throw ParseError("mesh_vertices_data must be a list");
    std::vector<cv::Point3f> verts;
    verts.reserve(vs.size());
    for (const auto& v : vs) {
      const cv::Vec3f p = ReadVec3f(v, "mesh_vertices_data");
      verts.emplace_back(p[0], p[1], p[2]);
    }
    obs.mesh_vertices = std::move(verts);
  }

  if (Has(r, "mesh_faces_data")) {
    const YAML::Node fs = r["mesh_faces_data"];
    if (!fs.IsSequence()) throw ParseError("mesh_faces_data must be a list");
    std::vector<cv::Vec3i> faces;
    faces.reserve(fs.size());
    for (const auto& f : fs) {
      if (!f.IsSequence() || f.size() < 3) throw ParseError("mesh_faces_data entries must be triangles");
      faces.emplace_back(As<int>(f[0], "mesh_faces_data"), As<int>(f[1], "mesh_faces_data"), As<int>(f[2], "mesh_faces_data"));
    }
    obs.mesh_faces = std::move(faces);
  }

  if (Has(r, "cameraTranslation")) obs.camera_translation = ReadVec3f(r["cameraTranslation"], "cameraTranslation");

  if (Has(r, "globalOrient")) {
    const cv::Vec3f g = ReadVec3f(r["globalOrient"], "globalOrient");
    obs.global_orient = cv::Vec3d(g[0], g[1], g[2]);
  }

  if (Has(r, "confidence")) {
    obs.confidence = As<float>(r["confidence"], "confidence");
  } else if (!obs.keypoints.empty()) {
    float sum = 0.f;
    for (const auto& kp : obs.keypoints) sum += kp.confidence;
    obs.confidence = sum / static_cast<float>(obs.keypoints.size());
  }

  if (Has(r, "processingTimeMs")) obs.processing_time_ms = As<double>(r["processingTimeMs"], "processingTimeMs");

  return obs;
}

static void WriteVec3(YAML::Emitter& out, float a, float b, float c) {
  out << YAML::Flow << YAML::BeginSeq << a << b << c << YAML::EndSeq;
}

void WriteObservation(YAML::Emitter& out, const PoseObservation& obs) {
  out << YAML::BeginMap;
  out << YAML::Key << "frameNumber" << YAML::Value << obs.frame_number;
  out << YAML::Key << "has3d" << YAML::Value << obs.has_3d;
  out << YAML::Key << "confidence" << YAML::Value << obs.confidence;
  out << YAML::Key << "processingTimeMs" << YAML::Value << obs.processing_time_ms;

  out << YAML::Key << "keypoints" << YAML::Value << YAML::BeginSeq;
  for (const auto& kp : obs.keypoints) {
    out << YAML::Flow << YAML::BeginMap;
    if (!kp.name.empty()) out << YAML::Key << "name" << YAML::Value << kp.name;
    out << YAML::Key << "x" << YAML::Value << kp.x;
    out << YAML::Key << "y" << YAML::Value << kp.y;
    if (kp.has_z) out << YAML::Key << "z" << YAML::Value << kp.z;
    out << YAML::Key << "confidence" << YAML::Value << kp.confidence;
    out << YAML::EndMap;
  }
  out << YAML::EndSeq;

  if (obs.mesh_vertices) {
    out << YAML::Key << "mesh_vertices_data" << YAML::Value << YAML::BeginSeq;
    for (const auto& v : *obs.mesh_vertices) WriteVec3(out, v.x, v.y, v.z);
    out << YAML::EndSeq;
  }
  if (obs.mesh_faces) {
    out << YAML::Key << "mesh_faces_data" << YAML::Value << YAML::BeginSeq;
    for (const auto& f : *obs.mesh_faces) {
      out << YAML::Flow << YAML::BeginSeq << f[0] << f[1] << f[2] << YAML::EndSeq;
    }
    out << YAML::EndSeq;
  }
  if (obs.camera_translation) {
    const auto& t = *obs.camera_translation;
    out << YAML::Key << "cameraTranslation" << YAML::Value;
    WriteVec3(out, t[0], t[1], t[2]);
  }
  if (obs.global_orient) {
    const auto& g = *obs.global_orient;
    out << YAML::Key << "globalOrient" << YAML::Value << YAML::Flow << YAML::BeginSeq << g[0] << g[1] << g[2] << YAML::EndSeq;
  }
  if (obs.error) out << YAML::Key << "error" << YAML::Value << *obs.error;

  out << YAML::EndMap;
}

} // namespace psp
