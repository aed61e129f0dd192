#pragma once

#include "protocol.pb.h"
#include "simulation/control_channel.hpp"
#include "simulation/simulation.hpp"
#include "transport/framed_stdio.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace sim_control {

devsim::v1::SimulationStatus to_proto(const sim_engine::SimulationStatus &s);

// Control channel serving framed ControlRequest/ControlResponse messages on
// a pair of file descriptors. process() never blocks: it answers whatever
// requests are already readable and returns.
class ControlServer : public sim_engine::ControlChannel {
public:
  // NOTE: simulation is NOT owned; fds are never closed here.
  ControlServer(sim_engine::Simulation &simulation, int input_fd,
                int output_fd);

  void process() override;

  // Apply one request to the simulation and build its response.
  devsim::v1::ControlResponse execute(const devsim::v1::ControlRequest &req);

  bool closed() const { return closed_; }
  uint64_t requests_served() const { return requests_served_; }

private:
  void service_frame(const std::vector<uint8_t> &frame);
  void close_input(const std::string &reason);

  sim_engine::Simulation &simulation_;
  transport::FrameReader reader_;
  int output_fd_;

  bool closed_ = false;
  uint64_t requests_served_ = 0;
};

} // namespace sim_control
