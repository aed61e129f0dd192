#pragma once

#include "simulation/adapters/communication_adapter.hpp"
#include "simulation/control_channel.hpp"
#include "simulation/device.hpp"
#include "simulation/timing.hpp"
#include "transport/framed_stdio.hpp"

#include <gmock/gmock.h>
#include <gtest/gtest.h>

#include <google/protobuf/message.h>

#include <stdexcept>
#include <string>
#include <vector>

#include <unistd.h>

namespace test_support {

//-------------------------------------------------------------------------

class MockDevice : public sim_engine::Device {
public:
  MOCK_METHOD(void, process, (double dt), (override));
};

class MockAdapter : public sim_adapters::CommunicationAdapter {
public:
  MOCK_METHOD(void, handle, (double timeout_s), (override));
};

class MockControlChannel : public sim_engine::ControlChannel {
public:
  MOCK_METHOD(void, process, (), (override));
};

class MockIdleWaiter : public sim_engine::IdleWaiter {
public:
  MOCK_METHOD(void, wait, (double seconds), (override));
};

class MockClock : public sim_engine::Clock {
public:
  MOCK_METHOD(double, now, (), (override));
};

// Clock that only moves when told to.
class ManualClock : public sim_engine::Clock {
public:
  double now() override { return now_; }
  void advance(double seconds) { now_ += seconds; }

private:
  double now_ = 100.0;
};

//-------------------------------------------------------------------------

// Anonymous pipe closed on destruction.
class Pipe {
public:
  Pipe() {
    int fds[2];
    if (::pipe(fds) != 0) {
      throw std::runtime_error("pipe() failed");
    }
    read_fd_ = fds[0];
    write_fd_ = fds[1];
  }
  ~Pipe() {
    close_read();
    close_write();
  }

  Pipe(const Pipe &) = delete;
  Pipe &operator=(const Pipe &) = delete;

  int read_fd() const { return read_fd_; }
  int write_fd() const { return write_fd_; }

  void close_read() {
    if (read_fd_ >= 0) {
      ::close(read_fd_);
      read_fd_ = -1;
    }
  }
  void close_write() {
    if (write_fd_ >= 0) {
      ::close(write_fd_);
      write_fd_ = -1;
    }
  }

  void write_raw(const std::vector<uint8_t> &bytes) {
    const ssize_t n = ::write(write_fd_, bytes.data(), bytes.size());
    if (n != static_cast<ssize_t>(bytes.size())) {
      throw std::runtime_error("short write to pipe");
    }
  }

private:
  int read_fd_ = -1;
  int write_fd_ = -1;
};

inline void write_message(int fd, const google::protobuf::Message &msg) {
  std::string bytes;
  ASSERT_TRUE(msg.SerializeToString(&bytes));
  std::string err;
  ASSERT_TRUE(transport::write_frame(
      fd, reinterpret_cast<const uint8_t *>(bytes.data()), bytes.size(), err))
      << err;
}

// Reads every frame currently queued on fd and parses them as T.
template <typename T> std::vector<T> read_messages(int fd) {
  transport::FrameReader reader(fd);
  std::string err;
  std::vector<T> out;
  EXPECT_TRUE(reader.wait(0.0, err)) << err;

  std::vector<uint8_t> frame;
  while (reader.next_frame(frame, err)) {
    T msg;
    EXPECT_TRUE(
        msg.ParseFromArray(frame.data(), static_cast<int>(frame.size())));
    out.push_back(msg);
  }
  EXPECT_TRUE(err.empty()) << err;
  return out;
}

} // namespace test_support
