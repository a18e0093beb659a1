// Repository: Dossier-render
// Component: Byte Channel
// Purpose: Non-blocking byte sink abstraction over the encoder's stdin pipe.
// Copyright (c) 2025 Dossier

#ifndef DOSSIER_ENCODE_BYTE_CHANNEL_HPP_
#define DOSSIER_ENCODE_BYTE_CHANNEL_HPP_

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>

namespace dossier::encode {

// A channel that may accept fewer bytes than offered. The frame writer loops
// TryWrite / WaitWritable until every byte is accepted, so implementations
// never need to buffer.
class IByteChannel {
 public:
  virtual ~IByteChannel() = default;

  // Never blocks. Returns the number of bytes accepted (0 when the channel is
  // momentarily full) or -1 when the channel is closed or broken; the reason
  // is then available from last_error().
  virtual int64_t TryWrite(const uint8_t* data, size_t len) = 0;

  // Blocks up to `timeout` until the channel can take more bytes. Returns
  // false on timeout. A broken channel reports writable so the next
  // TryWrite can surface the error.
  virtual bool WaitWritable(std::chrono::milliseconds timeout) = 0;

  // Idempotent. Further writes fail.
  virtual void Close() = 0;

  virtual std::string last_error() const = 0;
};

// Pipe write end. Takes ownership of the fd and sets O_NONBLOCK on it.
class PipeChannel : public IByteChannel {
 public:
  explicit PipeChannel(int fd, std::string name = "PipeChannel");
  ~PipeChannel() override;

  PipeChannel(const PipeChannel&) = delete;
  PipeChannel& operator=(const PipeChannel&) = delete;

  int64_t TryWrite(const uint8_t* data, size_t len) override;
  bool WaitWritable(std::chrono::milliseconds timeout) override;
  void Close() override;
  std::string last_error() const override { return last_error_; }

  bool IsClosed() const { return fd_ < 0; }
  uint64_t bytes_delivered() const { return bytes_delivered_; }

 private:
  int fd_;
  std::string name_;
  std::string last_error_;
  uint64_t bytes_delivered_ = 0;
};

}  // namespace dossier::encode

#endif  // DOSSIER_ENCODE_BYTE_CHANNEL_HPP_
