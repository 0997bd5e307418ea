#include "workers/subprocess_worker.hpp"

#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstring>
#include <thread>
#include <utility>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

namespace psp {

namespace {

// Owns one file descriptor
class Fd {
public:
  Fd() = default;
  explicit Fd(int fd) : fd_(fd) {}
  ~Fd() { reset(); }

  Fd(const Fd&) = delete;
  Fd& operator=(const Fd&) = delete;

  Fd(Fd&& o) noexcept : fd_(std::exchange(o.fd_, -1)) {}
  Fd& operator=(Fd&& o) noexcept {
    if (this != &o) {
      reset();
      fd_ = std::exchange(o.fd_, -1);
    }
    return *this;
  }

  int get() const { return fd_; }
  bool valid() const { return fd_ >= 0; }

  void reset() {
    if (fd_ >= 0) ::close(fd_);
    fd_ = -1;
  }

private:
  int fd_{-1};
};

struct Pipe {
  Fd read;
  Fd write;
};

bool MakePipe(Pipe& p) {
  int fds[2];
  if (::pipe2(fds, O_CLOEXEC) != 0) return false;
  p.read = Fd(fds[0]);
  p.write = Fd(fds[1]);
  return true;
}

// A write to a pipe whose reader is gone must come back as EPIPE, not kill the process
void IgnoreSigpipeOnce() {
  static std::once_flag once;
  std::call_once(once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

// Appends whatever is readable; closes 'fd' on EOF or a hard error
void DrainInto(Fd& fd, std::string& out) {
  char buf[16384];
  const ssize_t n = ::read(fd.get(), buf, sizeof(buf));
  if (n > 0) {
    out.append(buf, static_cast<std::size_t>(n));
  } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
    fd.reset();
  }
}

std::string Errno(const char* what, int err) {
  return std::string(what) + ": " + std::strerror(err);
}

} // namespace

struct SubprocessWorker::ChildPipes {
  Fd in;
  Fd out;
  Fd err;
};

SubprocessWorker::SubprocessWorker(WorkerConfig cfg) : cfg_(std::move(cfg)) {}

SubprocessWorker::~SubprocessWorker() {
  // run() always reaps its child before returning; this only matters if run() never got that far
  kill_child();
  int status = 0;
  while (!try_reap(status)) std::this_thread::sleep_for(std::chrono::milliseconds(1));
}

std::vector<std::string> SubprocessWorker::BuildArgv(const std::vector<std::string>& command,
                                                     std::uint64_t frame_number) {
  static const std::string kToken = "{frame}";
  const std::string frame = std::to_string(frame_number);

  std::vector<std::string> argv;
  argv.reserve(command.size());
  for (std::string arg : command) {
    for (std::size_t pos = arg.find(kToken); pos != std::string::npos; pos = arg.find(kToken, pos + frame.size())) {
      arg.replace(pos, kToken.size(), frame);
    }
    argv.push_back(std::move(arg));
  }
  return argv;
}

bool SubprocessWorker::try_reap(int& status) {
  std::lock_guard<std::mutex> lock(mu_);
  if (pid_ <= 0) return true;

  const pid_t r = ::waitpid(pid_, &status, WNOHANG);
  if (r == pid_ || (r < 0 && errno == ECHILD)) {
    // Cleared under the lock so terminate() can never signal a recycled pid
    pid_ = -1;
    return true;
  }
  return false;
}

void SubprocessWorker::kill_child() {
  std::lock_guard<std::mutex> lock(mu_);
  if (pid_ > 0) ::kill(pid_, SIGKILL);
}

void SubprocessWorker::terminate() {
  {
    std::lock_guard<std::mutex> lock(mu_);
    terminated_ = true;
  }
  kill_child();
}

void SubprocessWorker::launch(const FrameRequest& request) {
  if (launched_) return;
  launched_ = true;
  started_ = std::chrono::steady_clock::now();
  const std::uint64_t frame = request.frame_number;

  auto fail = [&](WorkerState s, std::string diagnostics, int exit_code) {
    WorkerOutcome o;
    o.state = s;
    o.exit_code = exit_code;
    o.diagnostics = std::move(diagnostics);
    launch_failure_ = std::move(o);
  };

  IgnoreSigpipeOnce();
  enter(WorkerState::Spawning, frame);

  if (cfg_.command.empty()) {
    fail(WorkerState::Failed, "worker command is empty", -1);
    return;
  }

  // Everything the child needs is prepared before fork, so the child only makes async-signal-safe calls
  const std::vector<std::string> args = BuildArgv(cfg_.command, frame);
  std::vector<char*> argv;
  argv.reserve(args.size() + 1);
  for (const auto& a : args) argv.push_back(const_cast<char*>(a.c_str()));
  argv.push_back(nullptr);
  const char* workdir = cfg_.working_directory.empty() ? nullptr : cfg_.working_directory.c_str();

  Pipe in, stdout_pipe, stderr_pipe, exec_status;
  if (!MakePipe(in) || !MakePipe(stdout_pipe) || !MakePipe(stderr_pipe) || !MakePipe(exec_status)) {
    fail(WorkerState::Failed, Errno("pipe2", errno), -1);
    return;
  }

  {
    std::lock_guard<std::mutex> lock(mu_);
    if (terminated_) {
      fail(WorkerState::TimedOut, "terminated before start", -1);
      return;
    }

    const pid_t pid = ::fork();
    if (pid < 0) {
      fail(WorkerState::Failed, Errno("fork", errno), -1);
      return;
    }

    if (pid == 0) {
      // Child
      std::signal(SIGPIPE, SIG_DFL);
      ::dup2(in.read.get(), STDIN_FILENO);
      ::dup2(stdout_pipe.write.get(), STDOUT_FILENO);
      ::dup2(stderr_pipe.write.get(), STDERR_FILENO);

      int err = 0;
      if (workdir && ::chdir(workdir) != 0) {
        err = errno;
      } else {
        ::execvp(argv[0], argv.data());
        err = errno;
      }
      // exec_status is O_CLOEXEC: the parent reads EOF on success, our errno otherwise
      const ssize_t ignored = ::write(exec_status.write.get(), &err, sizeof(err));
      (void)ignored;
      ::_exit(127);
    }

    pid_ = pid;
  }

  in.read.reset();
  stdout_pipe.write.reset();
  stderr_pipe.write.reset();
  exec_status.write.reset();

  // Blocks until exec succeeded (EOF) or failed (errno arrives)
  int exec_errno = 0;
  ssize_t n;
  do {
    n = ::read(exec_status.read.get(), &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    while (!try_reap(status)) std::this_thread::sleep_for(std::chrono::milliseconds(1));
    fail(WorkerState::Failed, Errno("failed to start worker", exec_errno) + " (" + args[0] + ")", 127);
    return;
  }

  pipes_ = std::make_unique<ChildPipes>();
  pipes_->in = std::move(in.write);
  pipes_->out = std::move(stdout_pipe.read);
  pipes_->err = std::move(stderr_pipe.read);
}

WorkerOutcome SubprocessWorker::run(const FrameRequest& request, std::chrono::milliseconds timeout) {
  using Clock = std::chrono::steady_clock;

  launch(request);

  const auto deadline = started_ + timeout;
  const std::uint64_t frame = request.frame_number;

  WorkerOutcome out;
  auto finish = [&](WorkerState s) {
    out.state = s;
    out.elapsed = std::chrono::duration_cast<std::chrono::nanoseconds>(Clock::now() - started_);
    enter(s, frame);
    return out;
  };

  if (launch_failure_) {
    out = *launch_failure_;
    return finish(out.state);
  }

  Fd& in = pipes_->in;
  Fd& child_out = pipes_->out;
  Fd& child_err = pipes_->err;

  enter(WorkerState::Sending, frame);

  const std::vector<std::uint8_t>& payload = request.payload.bytes;
  std::size_t written = 0;

  ::fcntl(in.get(), F_SETFL, ::fcntl(in.get(), F_GETFL) | O_NONBLOCK);

  auto close_stdin = [&] {
    in.reset();
    enter(WorkerState::AwaitingResult, frame);
  };

  if (payload.empty()) close_stdin();

  bool timed_out = false;

  while (child_out.valid() || child_err.valid() || in.valid()) {
    const auto now = Clock::now();
    if (now >= deadline) {
      timed_out = true;
      break;
    }
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (terminated_) break;
    }

    pollfd fds[3];
    nfds_t count = 0;
    int in_slot = -1, out_slot = -1, err_slot = -1;

    if (in.valid()) {
      in_slot = static_cast<int>(count);
      fds[count++] = pollfd{in.get(), POLLOUT, 0};
    }
    if (child_out.valid()) {
      out_slot = static_cast<int>(count);
      fds[count++] = pollfd{child_out.get(), POLLIN, 0};
    }
    if (child_err.valid()) {
      err_slot = static_cast<int>(count);
      fds[count++] = pollfd{child_err.get(), POLLIN, 0};
    }

    // Short slices so terminate() and the deadline are noticed promptly
    const auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(deadline - now).count();
    const int wait_ms = static_cast<int>(std::max<long long>(1, std::min<long long>(remaining, 50)));

    const int ready = ::poll(fds, count, wait_ms);
    if (ready < 0) {
      if (errno == EINTR) continue;
      out.diagnostics = Errno("poll", errno);
      break;
    }
    if (ready == 0) continue;

    if (in_slot >= 0 && fds[in_slot].revents != 0) {
      const ssize_t w = ::write(in.get(), payload.data() + written, payload.size() - written);
      if (w > 0) {
        written += static_cast<std::size_t>(w);
        if (written == payload.size()) close_stdin();
      } else if (w < 0 && errno != EAGAIN && errno != EINTR) {
        out.transmission_failed = true;
        out.transmission_error = Errno("write to worker stdin", errno) + " after " + std::to_string(written) +
                                 " of " + std::to_string(payload.size()) + " bytes";
        close_stdin();
      }
    }
    if (out_slot >= 0 && fds[out_slot].revents != 0) DrainInto(child_out, out.output);
    if (err_slot >= 0 && fds[err_slot].revents != 0) DrainInto(child_err, out.diagnostics);
  }

  // Pipes are closed, but the child may still be running
  int status = 0;
  bool reaped = false;
  while (!timed_out && !(reaped = try_reap(status))) {
    {
      std::lock_guard<std::mutex> lock(mu_);
      if (terminated_) break;
    }
    if (Clock::now() >= deadline) {
      timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
  }

  bool killed = false;
  if (!reaped) {
    kill_child();
    killed = true;
    while (!try_reap(status)) std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }

  bool forced;
  {
    std::lock_guard<std::mutex> lock(mu_);
    forced = terminated_;
  }

  if (WIFEXITED(status)) {
    out.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    out.exit_code = 128 + WTERMSIG(status);
    if (!killed && !forced) {
      if (!out.diagnostics.empty() && out.diagnostics.back() != '\n') out.diagnostics += '\n';
      out.diagnostics += "worker killed by signal " + std::to_string(WTERMSIG(status));
    }
  }

  if (timed_out || forced) return finish(WorkerState::TimedOut);
  if (out.exit_code == 0) return finish(WorkerState::Completed);
  return finish(WorkerState::Failed);
}

WorkerFactory MakeSubprocessWorkerFactory(const WorkerConfig& cfg) {
  return [cfg]() -> std::unique_ptr<Worker> { return std::make_unique<SubprocessWorker>(cfg); };
}

} // namespace psp
