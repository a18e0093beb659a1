// Repository: Dossier-render
// Component: Subprocess
// Purpose: fork/exec wrapper for the encoder and the external sonifier with
//          a captured stderr tail and bounded waits.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_ENCODE_SUBPROCESS_HPP_
#define DOSSIER_ENCODE_SUBPROCESS_HPP_

#include <sys/types.h>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace dossier::encode {

struct SubprocessResult {
  int exit_code = -1;      // valid when !signaled && !timed_out
  bool signaled = false;
  int signal = 0;
  bool timed_out = false;    // killed after the wait deadline
  bool interrupted = false;  // killed because the interrupt flag was raised
  std::string stderr_tail;

  bool ok() const { return !signaled && !timed_out && !interrupted && exit_code == 0; }

  // "exit code 1", "killed by signal 9", "timed out", "interrupted" plus the
  // stderr tail.
  std::string Describe() const;
};

struct SubprocessOptions {
  // Give the child a pipe on stdin (otherwise /dev/null).
  bool pipe_stdin = false;
  // Bytes of combined stdout/stderr kept for diagnostics.
  size_t stderr_tail_bytes = 4096;
  // Prefix for the child's output lines in debug logs.
  std::string log_tag = "Subprocess";
};

// Child stdout and stderr both go to one pipe drained by a reader thread.
// SIGPIPE is ignored process-wide on first spawn so a dead child surfaces as
// EPIPE on the stdin pipe instead of killing the renderer.
//
// The child leads its own process group. Kill() signals the whole group, so
// helpers started by a wrapper script die with it, and Wait() never blocks on
// a descendant that keeps the output pipe open.
class Subprocess {
 public:
  // argv[0] is resolved through PATH. Returns nullptr with *error set when
  // the pipes cannot be created, fork fails, or exec fails in the child.
  static std::unique_ptr<Subprocess> Spawn(const std::vector<std::string>& argv,
                                           const SubprocessOptions& options, std::string* error);

  // Kills and reaps a still-running child.
  ~Subprocess();

  Subprocess(const Subprocess&) = delete;
  Subprocess& operator=(const Subprocess&) = delete;

  pid_t pid() const { return pid_; }

  // Write end of the child's stdin; ownership moves to the caller. -1 when
  // not piped or already released.
  int ReleaseStdin();

  // Waits for exit. A non-positive timeout waits forever. On timeout, or
  // when `interrupt` (may be null) is raised, the process group is SIGKILLed
  // and reaped, and the result is marked timed_out or interrupted.
  SubprocessResult Wait(std::chrono::milliseconds timeout,
                        const std::atomic<bool>* interrupt = nullptr);

  // SIGKILL to the process group; the next Wait() reaps.
  void Kill();

  bool exited() const { return reaped_; }

 private:
  Subprocess() = default;

  void ReaderLoop();
  // Joins the reader once the pipe drains, or after a short grace period
  // in which the leftover process group is killed and the reader stopped.
  void FinishReader();
  std::string TailSnapshot();
  void Reap(int status);
  void KillAndReap();

  pid_t pid_ = -1;
  int stdin_fd_ = -1;
  int output_fd_ = -1;
  size_t tail_limit_ = 4096;
  std::string log_tag_;

  std::thread reader_;
  std::atomic<bool> stop_reader_{false};
  std::mutex tail_mutex_;
  std::condition_variable reader_cv_;
  bool reader_done_ = false;  // guarded by tail_mutex_
  std::string tail_;

  bool reaped_ = false;
  SubprocessResult result_;
};

// Spawn + Wait. Spawn failures come back through *spawn_error with a default
// (failed) result.
SubprocessResult RunSubprocess(const std::vector<std::string>& argv,
                               std::chrono::milliseconds timeout, std::string* spawn_error,
                               const std::string& log_tag = "Subprocess",
                               const std::atomic<bool>* interrupt = nullptr);

}  // namespace dossier::encode

#endif  // DOSSIER_ENCODE_SUBPROCESS_HPP_
