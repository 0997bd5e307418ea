#pragma once

#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

#include "core/logical_frame.hpp"
#include "core/quality_classifier.hpp"

namespace YAML {
class Emitter;
class Node;
}

/*
    The frame table is the YAML record of one analysed video: one entry per logical frame, in order.

    Each entry holds the frame's kind, its source slot or interpolation recipe, and the pose that was served.
    LoadFrameTable reads the logical map back, so a FrameStore can be rebuilt over the same raw sequence
    without planning the gaps again.
*/

namespace psp {

class FrameTableError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// 'frames' in logical order from index 0; 'verdicts' is indexed like the raw sequence
void WriteFrameTable(YAML::Emitter& out, const std::vector<std::shared_ptr<const MaterializedFrame>>& frames,
                     const std::vector<QualityVerdict>& verdicts, double interpolation_percentage);

// Throws FrameTableError on a malformed table
LogicalFrameMap ParseFrameTable(const YAML::Node& root);
LogicalFrameMap LoadFrameTable(const std::string& path);

} // namespace psp
