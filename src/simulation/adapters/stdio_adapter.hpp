#pragma once

#include "devices/common/sim_device.hpp"
#include "simulation/adapters/communication_adapter.hpp"
#include "simulation/timing.hpp"
#include "transport/framed_stdio.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

#include <unistd.h>

namespace sim_adapters {

// Serves the device protocol (framed protobuf Request/Response) on a pair of
// file descriptors, stdin/stdout by default.
class StdioAdapter : public CommunicationAdapter {
public:
  // NOTE: device and idle_waiter are NOT owned; fds are never closed here.
  explicit StdioAdapter(
      sim_devices::SimDevice &device, int input_fd = STDIN_FILENO,
      int output_fd = STDOUT_FILENO,
      sim_engine::IdleWaiter &idle_waiter = sim_engine::default_idle_waiter());

  // Waits up to timeout_s for requests and answers every complete one. Once
  // the input is closed this only idles for timeout_s.
  void handle(double timeout_s) override;

  // Called once when the peer closes the input or the stream breaks.
  void set_on_eof(std::function<void()> callback) {
    on_eof_ = std::move(callback);
  }

  bool closed() const { return closed_; }
  uint64_t requests_served() const { return requests_served_; }

private:
  void service_frame(const std::vector<uint8_t> &frame);
  void close_input(const std::string &reason);

  sim_devices::SimDevice &device_;
  transport::FrameReader reader_;
  int output_fd_;
  sim_engine::IdleWaiter &idle_waiter_;

  bool closed_ = false;
  uint64_t requests_served_ = 0;
  std::function<void()> on_eof_;
};

} // namespace sim_adapters
