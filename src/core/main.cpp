#include <cstdlib>
#include <exception>
#include <iostream>
#include <memory>
#include <optional>
#include <string>

#include <google/protobuf/stubs/common.h>

#include "config.hpp"
#include "control/control_server.hpp"
#include "devices/common/device_factory.hpp"
#include "simulation/adapters/stdio_adapter.hpp"
#include "simulation/simulation.hpp"

static void log_err(const std::string &msg) {
  std::cerr << "device-sim: " << msg << "\n";
}

static void print_usage() {
  log_err("Usage: device-sim --config <path/to/config.yaml> "
          "[--speed <factor>] [--cycle-delay <seconds>]");
}

static bool parse_double_arg(const char *flag, const char *text, double &out) {
  try {
    size_t used = 0;
    out = std::stod(text, &used);
    if (used == std::string(text).size()) {
      return true;
    }
  } catch (const std::exception &) {
    // reported below
  }
  log_err(std::string("invalid ") + flag + " value: " + text);
  return false;
}

int main(int argc, char **argv) {
  GOOGLE_PROTOBUF_VERIFY_VERSION;

  std::optional<std::string> config_path;
  std::optional<double> speed;
  std::optional<double> cycle_delay;

  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];

    if (arg == "--config" && i + 1 < argc) {
      config_path = argv[++i];
    } else if (arg == "--speed" && i + 1 < argc) {
      double value = 0.0;
      if (!parse_double_arg("--speed", argv[++i], value)) {
        return 1;
      }
      speed = value;
    } else if (arg == "--cycle-delay" && i + 1 < argc) {
      double value = 0.0;
      if (!parse_double_arg("--cycle-delay", argv[++i], value)) {
        return 1;
      }
      cycle_delay = value;
    } else if (arg == "--help" || arg == "-h") {
      print_usage();
      return 0;
    } else {
      log_err("unknown argument: " + arg);
      print_usage();
      return 1;
    }
  }

  if (!config_path) {
    log_err("FATAL: --config argument is required");
    print_usage();
    return 1;
  }

  device_sim::SimulatorConfig config;
  std::unique_ptr<sim_devices::SimDevice> device;
  try {
    log_err("loading configuration from: " + *config_path);
    config = device_sim::load_config(*config_path);
    device = device_sim::DeviceFactory::create_device(config.device);
  } catch (const std::exception &e) {
    log_err("FATAL: Failed to initialize simulation: " + std::string(e.what()));
    return 1;
  }

  sim_adapters::StdioAdapter adapter(*device);
  sim_engine::Simulation simulation(*device, adapter);
  std::unique_ptr<sim_control::ControlServer> control;

  try {
    simulation.set_speed(speed.value_or(config.simulation.speed));
    simulation.set_cycle_delay(
        cycle_delay.value_or(config.simulation.cycle_delay));
    simulation.set_count_paused_uptime(config.simulation.count_paused_uptime);
    if (config.simulation.start_disconnected) {
      simulation.disconnect_device();
    }

    if (config.control.enabled) {
      control = std::make_unique<sim_control::ControlServer>(
          simulation, config.control.input_fd, config.control.output_fd);
      simulation.set_control_channel(control.get());
      log_err("control channel on fds " +
              std::to_string(config.control.input_fd) + "/" +
              std::to_string(config.control.output_fd));
    }
  } catch (const std::exception &e) {
    log_err("FATAL: Invalid simulation settings: " + std::string(e.what()));
    return 1;
  }

  adapter.set_on_eof([&simulation]() {
    log_err("device client closed stdin; stopping");
    simulation.stop();
  });

  log_err("starting device '" + device->id() +
          "' (transport=stdio+uint32_le)");

  try {
    simulation.start();
  } catch (const std::exception &e) {
    log_err("FATAL: simulation aborted: " + std::string(e.what()));
    google::protobuf::ShutdownProtobufLibrary();
    return 2;
  }

  google::protobuf::ShutdownProtobufLibrary();
  return 0;
}
