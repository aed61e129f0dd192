#pragma once

#include <optional>
#include <string>
#include <utility>

#include "devices/common/sim_device.hpp"

namespace sim_devices {
namespace tempctl {

// Default device ID
constexpr const char *kDeviceId = "tempctl0";

// Configuration parameters
struct Config {
  std::optional<double> initial_temp; // Initial temperature (C)
  std::optional<std::pair<double, double>> temp_range; // Min/max temp range (C)
};

// Temperature control card: two thermocouples, two heater relays.
//
// Open mode: relays are set by the client; target temperature is ambient plus
// 45C (one relay) or 75C (both).
// Closed mode: a bang-bang controller with a +/-2C dead band drives the
// relays towards the setpoint on every process() call.
class TempCtlDevice : public SimDevice {
public:
  // Throws std::runtime_error if initial_temp lies outside temp_range.
  explicit TempCtlDevice(const std::string &device_id,
                         const Config &config = Config{});

  void process(double dt) override;

  devsim::v1::Device device_info() const override;
  devsim::v1::CapabilitySet capabilities() const override;
  std::vector<SignalValue>
  read_signals(const std::vector<std::string> &signal_ids) const override;
  CallResult call_function(uint32_t function_id,
                           const std::map<std::string, Value> &args) override;

  double tc1_temp() const { return tc1_c_; }
  double tc2_temp() const { return tc2_c_; }
  bool relay(int index) const { return index == 1 ? relay1_ : relay2_; }
  const std::string &mode() const { return mode_; }
  double setpoint() const { return setpoint_c_; }

private:
  void update_control();

  // Two thermocouples
  double tc1_c_ = 25.0;
  double tc2_c_ = 25.0;

  // Two relays
  bool relay1_ = false;
  bool relay2_ = false;

  // Modes: "open" | "closed"
  std::string mode_ = "open";

  // Closed-loop setpoint
  double setpoint_c_ = 60.0;
};

} // namespace tempctl
} // namespace sim_devices
