#include "devices/common/device_factory.hpp"

#include "devices/motorctl/motorctl_device.hpp"
#include "devices/tempctl/tempctl_device.hpp"

#include <iostream>
#include <optional>
#include <stdexcept>

namespace device_sim {

// Helper: Parse double from config map
static std::optional<double>
parse_double(const std::map<std::string, YAML::Node> &config,
             const std::string &key) {
  auto it = config.find(key);
  if (it == config.end())
    return std::nullopt;

  try {
    return it->second.as<double>();
  } catch (const YAML::Exception &) {
    throw std::runtime_error("[DeviceFactory] Failed to parse '" + key +
                             "' as double");
  }
}

// Helper: Parse [min, max] range from config map
static std::optional<std::pair<double, double>>
parse_range(const std::map<std::string, YAML::Node> &config,
            const std::string &key) {
  auto it = config.find(key);
  if (it == config.end())
    return std::nullopt;

  // Expected format: sequence with 2 elements
  if (!it->second.IsSequence() || it->second.size() != 2) {
    throw std::runtime_error("[DeviceFactory] Invalid range format for '" +
                             key + "' (expected 2-element sequence)");
  }

  double min_val = 0.0;
  double max_val = 0.0;
  try {
    min_val = it->second[0].as<double>();
    max_val = it->second[1].as<double>();
  } catch (const YAML::Exception &) {
    throw std::runtime_error(
        "[DeviceFactory] Failed to parse range values for '" + key + "'");
  }

  if (min_val >= max_val) {
    throw std::runtime_error(
        "[DeviceFactory] Invalid range (min >= max) for '" + key + "'");
  }

  return std::make_pair(min_val, max_val);
}

std::unique_ptr<sim_devices::SimDevice>
DeviceFactory::create_device(const DeviceSpec &spec) {
  std::unique_ptr<sim_devices::SimDevice> device;

  if (spec.type == "tempctl") {
    sim_devices::tempctl::Config config;
    config.initial_temp = parse_double(spec.config, "initial_temp");
    config.temp_range = parse_range(spec.config, "temp_range");
    device = std::make_unique<sim_devices::tempctl::TempCtlDevice>(spec.id,
                                                                   config);
  } else if (spec.type == "motorctl") {
    sim_devices::motorctl::Config config;
    config.max_speed = parse_double(spec.config, "max_speed");
    device = std::make_unique<sim_devices::motorctl::MotorCtlDevice>(spec.id,
                                                                     config);
  } else {
    throw std::runtime_error("[DeviceFactory] Unknown device type '" +
                             spec.type + "' for device '" + spec.id + "'");
  }

  std::cerr << "[DeviceFactory] Initialized device '" << spec.id
            << "' (type: " << spec.type << ")" << std::endl;
  return device;
}

bool DeviceFactory::is_supported_type(const std::string &type) {
  for (const auto &t : supported_types()) {
    if (t == type) {
      return true;
    }
  }
  return false;
}

std::vector<std::string> DeviceFactory::supported_types() {
  return {"tempctl", "motorctl"};
}

} // namespace device_sim
