#pragma once

#include <memory>
#include <string>
#include <vector>

#include "config.hpp"
#include "devices/common/sim_device.hpp"

namespace device_sim {

// Device Factory - builds the simulated device described by the config
class DeviceFactory {
public:
  // Create a device from specification
  // Throws std::runtime_error if the type is unknown or its parameters are
  // invalid
  static std::unique_ptr<sim_devices::SimDevice>
  create_device(const DeviceSpec &spec);

  static bool is_supported_type(const std::string &type);
  static std::vector<std::string> supported_types();
};

} // namespace device_sim
