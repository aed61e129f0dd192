#pragma once

#include <optional>
#include <string>

#include "devices/common/sim_device.hpp"

namespace sim_devices {
namespace motorctl {

// Default device ID
constexpr const char *kDeviceId = "motorctl0";

// Configuration parameters
struct Config {
  std::optional<double> max_speed; // Maximum motor speed (RPM)
};

// Dual DC motor controller. Speed follows duty * max_speed with a 0.8s lag.
class MotorCtlDevice : public SimDevice {
public:
  // Throws std::runtime_error if max_speed is outside (0, 10000].
  explicit MotorCtlDevice(const std::string &device_id,
                          const Config &config = Config{});

  void process(double dt) override;

  devsim::v1::Device device_info() const override;
  devsim::v1::CapabilitySet capabilities() const override;
  std::vector<SignalValue>
  read_signals(const std::vector<std::string> &signal_ids) const override;
  CallResult call_function(uint32_t function_id,
                           const std::map<std::string, Value> &args) override;

  double speed(int index) const { return index == 1 ? speed1_ : speed2_; }
  double duty(int index) const { return index == 1 ? duty1_ : duty2_; }
  double max_rpm() const { return max_rpm_; }

private:
  double duty1_ = 0.0; // 0..1
  double duty2_ = 0.0;

  double speed1_ = 0.0; // RPM
  double speed2_ = 0.0;

  double max_rpm_ = 3200.0;
};

} // namespace motorctl
} // namespace sim_devices
