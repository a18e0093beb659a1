// Repository: Dossier-render
// Component: Subprocess
// Purpose: fork/exec wrapper for the encoder and the external sonifier with
//          a captured stderr tail and bounded waits.
// Copyright (c) 2025 Dossier

#include "dossier/encode/Subprocess.hpp"

#include <cerrno>
#include <csignal>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <sys/wait.h>
#include <unistd.h>

#include "dossier/util/Logger.hpp"

namespace dossier::encode {

namespace {

std::once_flag g_sigpipe_once;

// Reader wake-up interval while waiting for output or a stop request.
constexpr int kReaderPollMs = 50;
// How long output may stay open after the child has been reaped.
constexpr std::chrono::milliseconds kReaderDrainGrace(250);

void IgnoreSigpipe() {
  std::call_once(g_sigpipe_once, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void CloseFd(int* fd) {
  if (*fd >= 0) {
    ::close(*fd);
    *fd = -1;
  }
}

std::string TrimTrailing(std::string s) {
  while (!s.empty() && (s.back() == '\n' || s.back() == '\r' || s.back() == ' ')) s.pop_back();
  return s;
}

}  // namespace

std::string SubprocessResult::Describe() const {
  std::string what;
  if (timed_out) {
    what = "timed out";
  } else if (interrupted) {
    what = "interrupted";
  } else if (signaled) {
    what = "killed by signal " + std::to_string(signal);
  } else {
    what = "exit code " + std::to_string(exit_code);
  }
  const std::string tail = TrimTrailing(stderr_tail);
  if (!tail.empty()) what += ": " + tail;
  return what;
}

// =============================================================================
// Spawn
// =============================================================================

std::unique_ptr<Subprocess> Subprocess::Spawn(const std::vector<std::string>& argv,
                                              const SubprocessOptions& options,
                                              std::string* error) {
  if (argv.empty() || argv[0].empty()) {
    *error = "empty command line";
    return nullptr;
  }
  IgnoreSigpipe();

  int in_pipe[2] = {-1, -1};
  int out_pipe[2] = {-1, -1};
  int exec_pipe[2] = {-1, -1};  // child reports exec errno here; CLOEXEC closes it on success
  auto close_all = [&] {
    for (int* fd : {&in_pipe[0], &in_pipe[1], &out_pipe[0], &out_pipe[1], &exec_pipe[0],
                    &exec_pipe[1]}) {
      CloseFd(fd);
    }
  };
  if ((options.pipe_stdin && pipe2(in_pipe, O_CLOEXEC) != 0) ||
      pipe2(out_pipe, O_CLOEXEC) != 0 || pipe2(exec_pipe, O_CLOEXEC) != 0) {
    *error = std::string("pipe2 failed: ") + std::strerror(errno);
    close_all();
    return nullptr;
  }

  // Built before fork: the child only makes async-signal-safe calls.
  std::vector<char*> cargv;
  cargv.reserve(argv.size() + 1);
  for (const auto& a : argv) cargv.push_back(const_cast<char*>(a.c_str()));
  cargv.push_back(nullptr);

  const pid_t pid = fork();
  if (pid < 0) {
    *error = std::string("fork failed: ") + std::strerror(errno);
    close_all();
    return nullptr;
  }

  if (pid == 0) {
    setpgid(0, 0);
    if (options.pipe_stdin) {
      dup2(in_pipe[0], STDIN_FILENO);
    } else {
      const int devnull = open("/dev/null", O_RDONLY);
      if (devnull >= 0) dup2(devnull, STDIN_FILENO);
    }
    dup2(out_pipe[1], STDOUT_FILENO);
    dup2(out_pipe[1], STDERR_FILENO);
    execvp(cargv[0], cargv.data());
    const int err = errno;
    if (write(exec_pipe[1], &err, sizeof(err)) < 0) _exit(127);
    _exit(127);
  }

  CloseFd(&in_pipe[0]);
  CloseFd(&out_pipe[1]);
  CloseFd(&exec_pipe[1]);

  int exec_errno = 0;
  ssize_t n;
  do {
    n = read(exec_pipe[0], &exec_errno, sizeof(exec_errno));
  } while (n < 0 && errno == EINTR);
  CloseFd(&exec_pipe[0]);

  if (n == static_cast<ssize_t>(sizeof(exec_errno))) {
    int status = 0;
    while (waitpid(pid, &status, 0) < 0 && errno == EINTR) {
    }
    *error = "cannot execute '" + argv[0] + "': " + std::strerror(exec_errno);
    close_all();
    return nullptr;
  }

  std::unique_ptr<Subprocess> proc(new Subprocess());
  proc->pid_ = pid;
  proc->stdin_fd_ = in_pipe[1];
  proc->output_fd_ = out_pipe[0];
  proc->tail_limit_ = options.stderr_tail_bytes;
  proc->log_tag_ = options.log_tag;
  proc->reader_ = std::thread(&Subprocess::ReaderLoop, proc.get());

  util::Logger::Debug("[" + proc->log_tag_ + "] spawned pid " + std::to_string(pid) + ": " +
                      argv[0]);
  return proc;
}

Subprocess::~Subprocess() {
  CloseFd(&stdin_fd_);
  if (!reaped_) {
    Kill();
    Wait(std::chrono::milliseconds(0));
  }
  FinishReader();
  CloseFd(&output_fd_);
}

int Subprocess::ReleaseStdin() {
  const int fd = stdin_fd_;
  stdin_fd_ = -1;
  return fd;
}

// =============================================================================
// Output capture
// =============================================================================

void Subprocess::ReaderLoop() {
  char buf[4096];
  std::string partial;
  const bool debug = util::Logger::DebugEnabled();
  while (!stop_reader_.load(std::memory_order_acquire)) {
    pollfd pfd{output_fd_, POLLIN, 0};
    const int ready = poll(&pfd, 1, kReaderPollMs);
    if (ready < 0) {
      if (errno == EINTR) continue;
      break;
    }
    if (ready == 0) continue;
    const ssize_t n = read(output_fd_, buf, sizeof(buf));
    if (n < 0) {
      if (errno == EINTR || errno == EAGAIN) continue;
      break;
    }
    if (n == 0) break;
    {
      std::lock_guard<std::mutex> lock(tail_mutex_);
      tail_.append(buf, static_cast<size_t>(n));
      if (tail_.size() > tail_limit_) tail_.erase(0, tail_.size() - tail_limit_);
    }
    if (!debug) continue;
    partial.append(buf, static_cast<size_t>(n));
    size_t nl;
    while ((nl = partial.find('\n')) != std::string::npos) {
      util::Logger::Debug("[" + log_tag_ + "] " + TrimTrailing(partial.substr(0, nl)));
      partial.erase(0, nl + 1);
    }
  }
  if (debug && !partial.empty()) util::Logger::Debug("[" + log_tag_ + "] " + partial);

  std::lock_guard<std::mutex> lock(tail_mutex_);
  reader_done_ = true;
  reader_cv_.notify_all();
}

void Subprocess::FinishReader() {
  if (!reader_.joinable()) return;
  bool drained;
  {
    std::unique_lock<std::mutex> lock(tail_mutex_);
    drained = reader_cv_.wait_for(lock, kReaderDrainGrace, [this] { return reader_done_; });
  }
  if (!drained) {
    // A descendant still holds the output pipe.
    util::Logger::Warn("[" + log_tag_ + "] output of pid " + std::to_string(pid_) +
                       " still open after exit; killing its process group");
    if (pid_ > 0) ::kill(-pid_, SIGKILL);
    stop_reader_.store(true, std::memory_order_release);
  }
  reader_.join();
}

std::string Subprocess::TailSnapshot() {
  std::lock_guard<std::mutex> lock(tail_mutex_);
  return tail_;
}

// =============================================================================
// Wait / Kill
// =============================================================================

void Subprocess::Reap(int status) {
  reaped_ = true;
  if (WIFEXITED(status)) {
    result_.exit_code = WEXITSTATUS(status);
  } else if (WIFSIGNALED(status)) {
    result_.signaled = true;
    result_.signal = WTERMSIG(status);
  }
}

void Subprocess::KillAndReap() {
  Kill();
  int status = 0;
  while (waitpid(pid_, &status, 0) < 0 && errno == EINTR) {
  }
  Reap(status);
}

SubprocessResult Subprocess::Wait(std::chrono::milliseconds timeout,
                                  const std::atomic<bool>* interrupt) {
  using Clock = std::chrono::steady_clock;
  const auto deadline = Clock::now() + timeout;

  while (!reaped_) {
    int status = 0;
    const pid_t r = waitpid(pid_, &status, WNOHANG);
    if (r == pid_) {
      Reap(status);
      break;
    }
    if (r < 0) {
      if (errno == EINTR) continue;
      util::Logger::Error("[" + log_tag_ + "] waitpid failed: " + std::strerror(errno));
      reaped_ = true;
      break;
    }
    if (interrupt && interrupt->load(std::memory_order_acquire)) {
      util::Logger::Warn("[" + log_tag_ + "] pid " + std::to_string(pid_) +
                         " interrupted; killing");
      KillAndReap();
      result_.interrupted = true;
      break;
    }
    if (timeout.count() > 0 && Clock::now() >= deadline) {
      util::Logger::Warn("[" + log_tag_ + "] pid " + std::to_string(pid_) + " timed out after " +
                         std::to_string(timeout.count()) + " ms; killing");
      KillAndReap();
      result_.timed_out = true;
      break;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }

  FinishReader();
  result_.stderr_tail = TailSnapshot();
  return result_;
}

void Subprocess::Kill() {
  if (reaped_ || pid_ <= 0) return;
  // Falls back to the pid alone when the group no longer exists.
  if (::kill(-pid_, SIGKILL) != 0) ::kill(pid_, SIGKILL);
}

SubprocessResult RunSubprocess(const std::vector<std::string>& argv,
                               std::chrono::milliseconds timeout, std::string* spawn_error,
                               const std::string& log_tag,
                               const std::atomic<bool>* interrupt) {
  SubprocessOptions options;
  options.log_tag = log_tag;
  auto proc = Subprocess::Spawn(argv, options, spawn_error);
  if (!proc) return SubprocessResult{};
  return proc->Wait(timeout, interrupt);
}

}  // namespace dossier::encode
