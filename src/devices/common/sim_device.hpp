#pragma once

#include <cstdint>
#include <map>
#include <utility>
#include <string>
#include <vector>

#include "devices/common/device_common.hpp"
#include "protocol.pb.h"
#include "simulation/device.hpp"

namespace sim_devices {

// Simulated device reachable over the device protocol. process() (from
// sim_engine::Device) is driven by the Simulation; everything else is called
// by the protocol handlers on the same thread.
class SimDevice : public sim_engine::Device {
public:
  const std::string &id() const { return id_; }

  virtual devsim::v1::Device device_info() const = 0;
  virtual devsim::v1::CapabilitySet capabilities() const = 0;

  // Empty signal_ids reads the default set. Unknown ids are omitted.
  virtual std::vector<SignalValue>
  read_signals(const std::vector<std::string> &signal_ids) const = 0;

  virtual CallResult call_function(uint32_t function_id,
                                   const std::map<std::string, Value> &args) = 0;

  virtual devsim::v1::DeviceHealth health() const {
    devsim::v1::DeviceHealth h;
    h.set_device_id(id_);
    h.set_state(devsim::v1::DeviceHealth::STATE_OK);
    h.set_message("ok");
    return h;
  }

  bool has_signal(const std::string &signal_id) const {
    for (const auto &s : capabilities().signals()) {
      if (s.signal_id() == signal_id) {
        return true;
      }
    }
    return false;
  }

protected:
  explicit SimDevice(std::string id) : id_(std::move(id)) {}

private:
  std::string id_;
};

} // namespace sim_devices
