#pragma once

#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <sys/types.h>

#include "core/config.hpp"
#include "workers/worker.hpp"

/*
    SubprocessWorker runs the estimator as a fresh child process per frame (POSIX fork/exec).

    launch() forks, execs and waits for the exec to succeed or fail; the child's deadline starts there.

    The encoded image is written to the child's stdin, then stdin is closed. stdout is collected as the result
    document and stderr as diagnostics. A write error on stdin (e.g. EPIPE because the child closed its end)
    sets WorkerOutcome::transmission_failed; the child is still awaited so its exit status is known, but the
    flag decides the result. On deadline the child receives SIGKILL.
*/

namespace psp {

class SubprocessWorker : public Worker {
public:
  explicit SubprocessWorker(WorkerConfig cfg);
  ~SubprocessWorker() override;

  SubprocessWorker(const SubprocessWorker&) = delete;
  SubprocessWorker& operator=(const SubprocessWorker&) = delete;

  void launch(const FrameRequest& request) override;
  WorkerOutcome run(const FrameRequest& request, std::chrono::milliseconds timeout) override;
  void terminate() override;

  // argv for one frame, with every "{frame}" replaced by the frame number
  static std::vector<std::string> BuildArgv(const std::vector<std::string>& command, std::uint64_t frame_number);

private:
  struct ChildPipes; // parent ends of the child's stdin, stdout and stderr

  // Non-blocking reap; returns true once the child has been collected into 'status'
  bool try_reap(int& status);
  void kill_child();

  WorkerConfig cfg_;

  bool launched_{false};
  std::chrono::steady_clock::time_point started_;
  std::unique_ptr<ChildPipes> pipes_;
  std::optional<WorkerOutcome> launch_failure_;

  std::mutex mu_;
  pid_t pid_{-1};
  bool terminated_{false};
};

WorkerFactory MakeSubprocessWorkerFactory(const WorkerConfig& cfg);

} // namespace psp
