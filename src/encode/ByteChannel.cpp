// Repository: Dossier-render
// Component: Byte Channel
// Purpose: Non-blocking byte sink abstraction over the encoder's stdin pipe.
// Copyright (c) 2025 Dossier

#include "dossier/encode/ByteChannel.hpp"

#include <cerrno>
#include <cstring>

#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

#include "dossier/util/Logger.hpp"

namespace dossier::encode {

PipeChannel::PipeChannel(int fd, std::string name) : fd_(fd), name_(std::move(name)) {
  if (fd_ < 0) {
    last_error_ = "invalid fd";
    return;
  }
  const int flags = fcntl(fd_, F_GETFL, 0);
  if (flags < 0 || fcntl(fd_, F_SETFL, flags | O_NONBLOCK) < 0) {
    // Still usable, but writes may block the frame loop.
    util::Logger::Warn("[" + name_ + "] cannot set O_NONBLOCK: " + std::strerror(errno));
  }
}

PipeChannel::~PipeChannel() { Close(); }

int64_t PipeChannel::TryWrite(const uint8_t* data, size_t len) {
  if (fd_ < 0) {
    if (last_error_.empty()) last_error_ = "channel closed";
    return -1;
  }
  if (data == nullptr || len == 0) return 0;

  for (;;) {
    const ssize_t n = ::write(fd_, data, len);
    if (n >= 0) {
      bytes_delivered_ += static_cast<uint64_t>(n);
      return static_cast<int64_t>(n);
    }
    if (errno == EINTR) continue;
    if (errno == EAGAIN || errno == EWOULDBLOCK) return 0;
    // EPIPE when the reader exited; SIGPIPE is ignored process-wide.
    last_error_ = std::string("write failed: ") + std::strerror(errno);
    return -1;
  }
}

bool PipeChannel::WaitWritable(std::chrono::milliseconds timeout) {
  if (fd_ < 0) return true;
  struct pollfd pfd;
  pfd.fd = fd_;
  pfd.events = POLLOUT;
  pfd.revents = 0;
  for (;;) {
    const int ret = poll(&pfd, 1, static_cast<int>(timeout.count()));
    if (ret < 0) {
      if (errno == EINTR) continue;
      last_error_ = std::string("poll failed: ") + std::strerror(errno);
      return true;
    }
    if (ret == 0) return false;
    // POLLERR / POLLHUP: reader gone; the next write reports it.
    return true;
  }
}

void PipeChannel::Close() {
  if (fd_ < 0) return;
  ::close(fd_);
  fd_ = -1;
  util::Logger::Debug("[" + name_ + "] closed after " + std::to_string(bytes_delivered_) +
                      " bytes");
}

}  // namespace dossier::encode
