#pragma once

#include <map>
#include <string>
#include <yaml-cpp/yaml.h>

namespace device_sim {

// Engine parameters (simulation: section)
struct SimulationSettings {
  double speed = 1.0;       // simulated seconds per wall second
  double cycle_delay = 0.1; // pacing bound per cycle (s)
  bool count_paused_uptime = true;
  bool start_disconnected = false;
};

// Specification for the simulated device (device: section)
struct DeviceSpec {
  std::string id;   // Device identifier
  std::string type; // Device type (tempctl, motorctl)
  std::map<std::string, YAML::Node> config; // Type-specific parameters
};

// Control channel endpoint (control: section). The fds are inherited from
// the parent process.
struct ControlSettings {
  bool enabled = false;
  int input_fd = 3;
  int output_fd = 4;
};

// Complete simulator configuration
struct SimulatorConfig {
  std::string config_file_path; // Path to config file (empty if parsed inline)
  SimulationSettings simulation;
  DeviceSpec device;
  ControlSettings control;
};

// Load simulator configuration from YAML file
// Throws std::runtime_error if file cannot be read, parsed, or validated
SimulatorConfig load_config(const std::string &path);

// Validate and convert an already parsed document. source names it in errors.
// Throws std::runtime_error on invalid content
SimulatorConfig parse_config(const YAML::Node &yaml,
                             const std::string &source = "<inline>");

} // namespace device_sim
