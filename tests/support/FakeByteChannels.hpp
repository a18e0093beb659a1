// In-memory byte channels for exercising FrameStreamWriter backpressure.

#pragma once

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <string>
#include <thread>
#include <vector>

#include "dossier/encode/ByteChannel.hpp"

namespace dossier::test {

// Accepts nothing on every other TryWrite call and at most `chunk` bytes
// otherwise, so every frame needs many partial writes and full events.
class EveryOtherCallChannel : public encode::IByteChannel {
 public:
  explicit EveryOtherCallChannel(size_t chunk = 1000) : chunk_(chunk) {}

  int64_t TryWrite(const uint8_t* data, size_t len) override {
    if (closed_) {
      last_error_ = "closed";
      return -1;
    }
    ++calls_;
    if (calls_ % 2 == 1) return 0;
    const size_t n = std::min(len, chunk_);
    received_.insert(received_.end(), data, data + n);
    return static_cast<int64_t>(n);
  }

  bool WaitWritable(std::chrono::milliseconds) override {
    ++waits_;
    return true;
  }

  void Close() override { closed_ = true; }
  std::string last_error() const override { return last_error_; }

  const std::vector<uint8_t>& received() const { return received_; }
  uint64_t calls() const { return calls_; }
  uint64_t waits() const { return waits_; }

 private:
  size_t chunk_;
  bool closed_ = false;
  uint64_t calls_ = 0;
  uint64_t waits_ = 0;
  std::string last_error_;
  std::vector<uint8_t> received_;
};

// Never drains. WaitWritable sleeps out its timeout in small steps.
class StalledChannel : public encode::IByteChannel {
 public:
  int64_t TryWrite(const uint8_t*, size_t) override { return 0; }

  bool WaitWritable(std::chrono::milliseconds timeout) override {
    std::this_thread::sleep_for(std::min(timeout, std::chrono::milliseconds(5)));
    return false;
  }

  void Close() override {}
  std::string last_error() const override { return ""; }
};

// Accepts `budget` bytes, then reports a broken pipe.
class BreakingChannel : public encode::IByteChannel {
 public:
  explicit BreakingChannel(size_t budget) : budget_(budget) {}

  int64_t TryWrite(const uint8_t*, size_t len) override {
    if (budget_ == 0) {
      last_error_ = "Broken pipe";
      return -1;
    }
    const size_t n = std::min(len, budget_);
    budget_ -= n;
    return static_cast<int64_t>(n);
  }

  bool WaitWritable(std::chrono::milliseconds) override { return true; }
  void Close() override {}
  std::string last_error() const override { return last_error_; }

 private:
  size_t budget_;
  std::string last_error_;
};

}  // namespace dossier::test
