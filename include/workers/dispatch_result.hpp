#pragma once

#include <cstdint>
#include <optional>
#include <string>

#include "core/frame.hpp"
#include "core/pose_observation.hpp"
#include "workers/worker.hpp"

namespace psp {

enum class DispatchErrorKind {
  QueueFull,    // admission refused, nothing was started
  Transmission, // payload handoff to the worker failed
  Timeout,      // worker exceeded its deadline and was killed
  Worker,       // worker exited non-zero, reported an error, or produced unreadable output
  Shutdown      // scheduler stopped before the request could run
};

const char* ToString(DispatchErrorKind k);

struct DispatchError {
  DispatchErrorKind kind{DispatchErrorKind::Worker};
  std::string message;

  // Whether a calling layer may resubmit the same request
  bool retryable() const {
    return kind == DispatchErrorKind::QueueFull ||
           kind == DispatchErrorKind::Transmission ||
           kind == DispatchErrorKind::Timeout;
  }
};

struct DispatchResult {
  std::uint64_t frame_number{0};
  std::optional<PoseObservation> observation;
  std::optional<DispatchError> error;

  bool ok() const { return observation.has_value() && !error.has_value(); }

  static DispatchResult Success(std::uint64_t frame, PoseObservation obs);
  static DispatchResult Failure(std::uint64_t frame, DispatchErrorKind kind, std::string message);
};

// Maps a finished worker invocation onto the request's result.
// A failed transmission wins over everything else, including a clean exit.
DispatchResult ResolveOutcome(const FrameRequest& request, const WorkerOutcome& outcome);

} // namespace psp
