#include "control/control_server.hpp"

#include <iostream>
#include <stdexcept>

namespace sim_control {

using devsim::v1::ControlRequest;
using devsim::v1::ControlResponse;
using devsim::v1::Status;

static devsim::v1::SimulationStatus::State
to_proto(sim_engine::SimulationState state) {
  switch (state) {
  case sim_engine::SimulationState::Idle:
    return devsim::v1::SimulationStatus::STATE_IDLE;
  case sim_engine::SimulationState::Running:
    return devsim::v1::SimulationStatus::STATE_RUNNING;
  case sim_engine::SimulationState::Paused:
    return devsim::v1::SimulationStatus::STATE_PAUSED;
  case sim_engine::SimulationState::Stopped:
    return devsim::v1::SimulationStatus::STATE_STOPPED;
  }
  return devsim::v1::SimulationStatus::STATE_UNSPECIFIED;
}

devsim::v1::SimulationStatus to_proto(const sim_engine::SimulationStatus &s) {
  devsim::v1::SimulationStatus out;
  out.set_state(to_proto(s.state));
  out.set_speed(s.speed);
  out.set_cycle_delay(s.cycle_delay);
  out.set_cycles(s.cycles);
  out.set_runtime_s(s.runtime);
  out.set_uptime_s(s.uptime);
  out.set_device_connected(s.device_connected);
  out.set_control_attached(s.control_attached);
  return out;
}

static inline void set_status(ControlResponse &resp, Status::Code code,
                              const std::string &msg) {
  resp.mutable_status()->set_code(code);
  resp.mutable_status()->set_message(msg);
}

ControlServer::ControlServer(sim_engine::Simulation &simulation, int input_fd,
                             int output_fd)
    : simulation_(simulation), reader_(input_fd), output_fd_(output_fd) {}

// -----------------------------
// Request execution
// -----------------------------

ControlResponse ControlServer::execute(const ControlRequest &req) {
  ControlResponse resp;
  resp.set_request_id(req.request_id());
  set_status(resp, Status::CODE_OK, "ok");

  try {
    switch (req.request_case()) {
    case ControlRequest::kGetStatus:
      break;
    case ControlRequest::kPause:
      simulation_.pause();
      break;
    case ControlRequest::kResume:
      simulation_.resume();
      break;
    case ControlRequest::kStop:
      simulation_.stop();
      break;
    case ControlRequest::kSetSpeed:
      simulation_.set_speed(req.set_speed().speed());
      break;
    case ControlRequest::kSetCycleDelay:
      simulation_.set_cycle_delay(req.set_cycle_delay().cycle_delay());
      break;
    case ControlRequest::kConnectDevice:
      simulation_.connect_device();
      break;
    case ControlRequest::kDisconnectDevice:
      simulation_.disconnect_device();
      break;
    case ControlRequest::REQUEST_NOT_SET:
      set_status(resp, Status::CODE_UNIMPLEMENTED, "request not supported");
      break;
    }
  } catch (const sim_engine::InvalidOperation &e) {
    set_status(resp, Status::CODE_FAILED_PRECONDITION, e.what());
  } catch (const std::invalid_argument &e) {
    set_status(resp, Status::CODE_INVALID_ARGUMENT, e.what());
  }

  *resp.mutable_simulation() = to_proto(simulation_.status());
  return resp;
}

// -----------------------------
// Transport
// -----------------------------

void ControlServer::process() {
  if (closed_) {
    return;
  }

  std::string err;
  if (!reader_.wait(0.0, err)) {
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

void ControlServer::service_frame(const std::vector<uint8_t> &frame) {
  ControlResponse resp;

  ControlRequest req;
  if (!req.ParseFromArray(frame.data(), static_cast<int>(frame.size()))) {
    std::cerr << "[ControlServer] failed to parse ControlRequest protobuf"
              << std::endl;
    set_status(resp, Status::CODE_INVALID_ARGUMENT,
               "failed to parse ControlRequest");
    *resp.mutable_simulation() = to_proto(simulation_.status());
  } else {
    resp = execute(req);
  }

  std::string resp_bytes;
  if (!resp.SerializeToString(&resp_bytes)) {
    close_input("failed to serialize ControlResponse protobuf");
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

void ControlServer::close_input(const std::string &reason) {
  closed_ = true;
  if (reason.empty()) {
    std::cerr << "[ControlServer] control client disconnected after "
              << requests_served_ << " requests" << std::endl;
  } else {
    std::cerr << "[ControlServer] " << reason << "; closing" << std::endl;
  }
}

} // namespace sim_control
