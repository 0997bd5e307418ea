#include "workers/dispatch_result.hpp"

#include "core/observation_codec.hpp"

#include <utility>

namespace psp {

const char* ToString(WorkerState s) {
  switch (s) {
    case WorkerState::Idle: return "idle";
    case WorkerState::Spawning: return "spawning";
    case WorkerState::Sending: return "sending";
    case WorkerState::AwaitingResult: return "awaiting_result";
    case WorkerState::Completed: return "completed";
    case WorkerState::Failed: return "failed";
    case WorkerState::TimedOut: return "timed_out";
  }
  return "unknown";
}

const char* ToString(DispatchErrorKind k) {
  switch (k) {
    case DispatchErrorKind::QueueFull: return "queue_full";
    case DispatchErrorKind::Transmission: return "transmission";
    case DispatchErrorKind::Timeout: return "timeout";
    case DispatchErrorKind::Worker: return "worker";
    case DispatchErrorKind::Shutdown: return "shutdown";
  }
  return "unknown";
}

DispatchResult DispatchResult::Success(std::uint64_t frame, PoseObservation obs) {
  DispatchResult r;
  r.frame_number = frame;
  r.observation = std::move(obs);
  return r;
}

DispatchResult DispatchResult::Failure(std::uint64_t frame, DispatchErrorKind kind, std::string message) {
  DispatchResult r;
  r.frame_number = frame;
  r.error = DispatchError{kind, std::move(message)};
  return r;
}

static std::string WithDiagnostics(std::string msg, const std::string& diagnostics) {
  if (diagnostics.empty()) return msg;

  // Keep the tail, that is where the traceback ends up
  constexpr std::size_t kMaxDiag = 2000;
  msg += ": ";
  if (diagnostics.size() > kMaxDiag) {
    msg += "...";
    msg += diagnostics.substr(diagnostics.size() - kMaxDiag);
  } else {
    msg += diagnostics;
  }
  return msg;
}

DispatchResult ResolveOutcome(const FrameRequest& request, const WorkerOutcome& outcome) {
  const std::uint64_t frame = request.frame_number;

  if (outcome.transmission_failed) {
    std::string msg = "failed to send frame " + std::to_string(frame) + " to worker";
    if (!outcome.transmission_error.empty()) msg += ": " + outcome.transmission_error;
    return DispatchResult::Failure(frame, DispatchErrorKind::Transmission, std::move(msg));
  }

  switch (outcome.state) {
    case WorkerState::TimedOut: {
      const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(outcome.elapsed).count();
      return DispatchResult::Failure(frame, DispatchErrorKind::Timeout,
                                     "worker for frame " + std::to_string(frame) + " timed out after " +
                                         std::to_string(ms) + " ms");
    }

    case WorkerState::Completed:
      break;

    default:
      return DispatchResult::Failure(
          frame, DispatchErrorKind::Worker,
          WithDiagnostics("worker for frame " + std::to_string(frame) + " exited with code " +
                              std::to_string(outcome.exit_code),
                          outcome.diagnostics));
  }

  PoseObservation obs;
  try {
    obs = ParseWorkerOutput(outcome.output, frame);
  } catch (const ObservationParseError& e) {
    return DispatchResult::Failure(frame, DispatchErrorKind::Worker, WithDiagnostics(e.what(), outcome.diagnostics));
  }

  if (obs.error) {
    return DispatchResult::Failure(frame, DispatchErrorKind::Worker,
                                   "worker reported an error for frame " + std::to_string(frame) + ": " + *obs.error);
  }

  obs.image_size = request.payload.image_size;
  return DispatchResult::Success(frame, std::move(obs));
}

} // namespace psp
