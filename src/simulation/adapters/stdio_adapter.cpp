#include "simulation/adapters/stdio_adapter.hpp"

#include "core/handlers.hpp"
#include "protocol.pb.h"

#include <iostream>

namespace sim_adapters {

StdioAdapter::StdioAdapter(sim_devices::SimDevice &device, int input_fd,
                           int output_fd, sim_engine::IdleWaiter &idle_waiter)
    : device_(device), reader_(input_fd), output_fd_(output_fd),
      idle_waiter_(idle_waiter) {}

void StdioAdapter::handle(double timeout_s) {
  if (closed_) {
    idle_waiter_.wait(timeout_s);
    return;
  }

  std::string err;
  if (!reader_.wait(timeout_s, err)) {
    close_input("read error: " + err);
    return;
  }

  std::vector<uint8_t> frame;
  while (reader_.next_frame(frame, err)) {
    service_frame(frame);
    if (closed_) {
      return;
    }
  }

  if (!err.empty()) {
    close_input("framing error: " + err);
    return;
  }

  if (reader_.eof()) {
    close_input("");
  }
}

void StdioAdapter::service_frame(const std::vector<uint8_t> &frame) {
  devsim::v1::Response resp;

  devsim::v1::Request req;
  if (!req.ParseFromArray(frame.data(), static_cast<int>(frame.size()))) {
    std::cerr << "[StdioAdapter] failed to parse Request protobuf"
              << std::endl;
    resp.mutable_status()->set_code(
        devsim::v1::Status::CODE_INVALID_ARGUMENT);
    resp.mutable_status()->set_message("failed to parse Request");
  } else {
    handlers::dispatch(device_, req, resp);
  }

  std::string resp_bytes;
  if (!resp.SerializeToString(&resp_bytes)) {
    close_input("failed to serialize Response protobuf");
    return;
  }

  std::string io_err;
  if (!transport::write_frame(
          output_fd_, reinterpret_cast<const uint8_t *>(resp_bytes.data()),
          resp_bytes.size(), io_err)) {
    close_input("write_frame error: " + io_err);
    return;
  }

  ++requests_served_;
}

void StdioAdapter::close_input(const std::string &reason) {
  closed_ = true;
  if (reason.empty()) {
    std::cerr << "[StdioAdapter] EOF on input after " << requests_served_
              << " requests" << std::endl;
  } else {
    std::cerr << "[StdioAdapter] " << reason << "; closing" << std::endl;
  }

  if (on_eof_) {
    on_eof_();
  }
}

} // namespace sim_adapters
