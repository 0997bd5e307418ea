#pragma once

#include <cstdint>
#include <stdexcept>
#include <string>

#include "core/pose_observation.hpp"

namespace YAML {
class Emitter;
}

/*
    Reads and writes the worker's JSON result document.

    The worker prints one JSON object (or a one-element array) on stdout. JSON is a subset of YAML flow
    syntax, so yaml-cpp parses it directly. Anything the worker logs before the document is skipped: the
    document is the first line opening with '{' or '[' from which the rest parses as an object or a list of
    objects.
*/

namespace psp {

class ObservationParseError : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Throws ObservationParseError on malformed output or when the frame number disagrees with 'expected_frame'
PoseObservation ParseWorkerOutput(const std::string& text, std::uint64_t expected_frame);

// Emits the observation as a map using the same keys the worker produces
void WriteObservation(YAML::Emitter& out, const PoseObservation& obs);

} // namespace psp
