#include "config.hpp"
#include <cmath>
#include <filesystem>
#include <stdexcept>

namespace device_sim {

namespace fs = std::filesystem;

// Read an optional scalar, keeping the default when absent
template <typename T>
static void read_optional(const YAML::Node &section, const char *section_name,
                          const char *key, T &out) {
  if (!section[key]) {
    return;
  }
  try {
    out = section[key].as<T>();
  } catch (const YAML::Exception &e) {
    throw std::runtime_error(std::string("[CONFIG] Invalid ") + section_name +
                             "." + key + ": " + e.what());
  }
}

static SimulationSettings parse_simulation(const YAML::Node &node) {
  SimulationSettings settings;
  if (!node) {
    return settings;
  }
  if (!node.IsMap()) {
    throw std::runtime_error("[CONFIG] 'simulation' section must be a map");
  }

  read_optional(node, "simulation", "speed", settings.speed);
  read_optional(node, "simulation", "cycle_delay", settings.cycle_delay);
  read_optional(node, "simulation", "count_paused_uptime",
                settings.count_paused_uptime);
  read_optional(node, "simulation", "start_disconnected",
                settings.start_disconnected);

  if (!(settings.speed >= 0.0) || !std::isfinite(settings.speed)) {
    throw std::runtime_error(
        "[CONFIG] simulation.speed must be finite and >= 0");
  }
  if (!(settings.cycle_delay >= 0.0) || !std::isfinite(settings.cycle_delay)) {
    throw std::runtime_error(
        "[CONFIG] simulation.cycle_delay must be finite and >= 0");
  }

  return settings;
}

static DeviceSpec parse_device(const YAML::Node &node) {
  if (!node) {
    throw std::runtime_error("[CONFIG] Missing required 'device' section");
  }
  if (!node.IsMap()) {
    throw std::runtime_error("[CONFIG] 'device' section must be a map");
  }
  if (!node["type"]) {
    throw std::runtime_error("[CONFIG] Missing required field 'device.type'");
  }

  DeviceSpec spec;
  try {
    spec.type = node["type"].as<std::string>();
    spec.id = node["id"] ? node["id"].as<std::string>() : spec.type + "0";
  } catch (const YAML::Exception &e) {
    throw std::runtime_error(std::string("[CONFIG] Invalid device: ") +
                             e.what());
  }

  if (spec.id.empty()) {
    throw std::runtime_error("[CONFIG] device.id must not be empty");
  }

  // Store all other fields as configuration parameters
  for (const auto &kv : node) {
    std::string key = kv.first.as<std::string>();
    if (key != "id" && key != "type") {
      spec.config[key] = kv.second;
    }
  }

  return spec;
}

static ControlSettings parse_control(const YAML::Node &node) {
  ControlSettings settings;
  if (!node) {
    return settings;
  }
  if (!node.IsMap()) {
    throw std::runtime_error("[CONFIG] 'control' section must be a map");
  }

  read_optional(node, "control", "enabled", settings.enabled);
  read_optional(node, "control", "input_fd", settings.input_fd);
  read_optional(node, "control", "output_fd", settings.output_fd);

  if (settings.enabled) {
    // 0-2 belong to the device protocol and logging
    if (settings.input_fd <= 2 || settings.output_fd <= 2) {
      throw std::runtime_error(
          "[CONFIG] control.input_fd and control.output_fd must be > 2");
    }
  }

  return settings;
}

SimulatorConfig parse_config(const YAML::Node &yaml,
                             const std::string &source) {
  if (!yaml.IsMap()) {
    throw std::runtime_error("[CONFIG] '" + source +
                             "': top level must be a map");
  }

  SimulatorConfig config;
  config.simulation = parse_simulation(yaml["simulation"]);
  config.device = parse_device(yaml["device"]);
  config.control = parse_control(yaml["control"]);
  return config;
}

SimulatorConfig load_config(const std::string &path) {
  YAML::Node yaml;

  try {
    yaml = YAML::LoadFile(path);
  } catch (const YAML::Exception &e) {
    throw std::runtime_error("Failed to load config file '" + path +
                             "': " + e.what());
  }

  SimulatorConfig config = parse_config(yaml, path);
  config.config_file_path = fs::absolute(path).string();
  return config;
}

} // namespace device_sim
