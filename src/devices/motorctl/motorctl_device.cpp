#include "devices/motorctl/motorctl_device.hpp"

#include <cmath>
#include <set>
#include <stdexcept>

namespace sim_devices {
namespace motorctl {

using devsim::v1::CapabilitySet;
using devsim::v1::FunctionSpec;

// -----------------------------
// Constants
// -----------------------------

// Function IDs
static constexpr uint32_t kFnSetDuty = 10;

// Signal IDs
static constexpr const char *kSigMotor1Speed = "motor1_speed";
static constexpr const char *kSigMotor2Speed = "motor2_speed";
static constexpr const char *kSigMotor1Duty = "motor1_duty";
static constexpr const char *kSigMotor2Duty = "motor2_duty";

static constexpr double kMotorTauS = 0.8;

// -----------------------------
// Initialization
// -----------------------------

MotorCtlDevice::MotorCtlDevice(const std::string &device_id,
                               const Config &config)
    : SimDevice(device_id) {
  if (config.max_speed.has_value()) {
    double max_speed = config.max_speed.value();

    // Validate reasonable range (0 to 10000 RPM)
    if (max_speed <= 0 || max_speed > 10000.0) {
      throw std::runtime_error("[MotorCtl] max_speed " +
                               std::to_string(max_speed) +
                               " out of valid range (0, 10000] RPM");
    }

    max_rpm_ = max_speed;
  }
}

// -----------------------------
// Physics
// -----------------------------

void MotorCtlDevice::process(double dt) {
  // Speed approaches duty * max_rpm with lag
  const double motor_alpha = 1.0 - std::exp(-dt / kMotorTauS);

  const double tgt1 = clamp(duty1_, 0.0, 1.0) * max_rpm_;
  const double tgt2 = clamp(duty2_, 0.0, 1.0) * max_rpm_;

  speed1_ += motor_alpha * (tgt1 - speed1_);
  speed2_ += motor_alpha * (tgt2 - speed2_);
}

// -----------------------------
// Device Info
// -----------------------------

devsim::v1::Device MotorCtlDevice::device_info() const {
  devsim::v1::Device d;
  d.set_device_id(id());
  d.set_type_id("sim.dual_dc_motor");
  d.set_type_version("1.0");
  d.set_label("Sim Dual DC Motor Controller");
  d.set_address("sim://" + id());
  (*d.mutable_tags())["family"] = "sim";
  (*d.mutable_tags())["kind"] = "motor_control";
  (*d.mutable_tags())["provider"] = kProviderName;
  return d;
}

// -----------------------------
// Capabilities
// -----------------------------

CapabilitySet MotorCtlDevice::capabilities() const {
  CapabilitySet caps;

  *caps.add_signals() =
      make_signal(kSigMotor1Speed, "Motor 1 Speed",
                  ValueType::VALUE_TYPE_DOUBLE, "rpm", "Estimated speed");
  *caps.add_signals() =
      make_signal(kSigMotor2Speed, "Motor 2 Speed",
                  ValueType::VALUE_TYPE_DOUBLE, "rpm", "Estimated speed");
  *caps.add_signals() =
      make_signal(kSigMotor1Duty, "Motor 1 Duty", ValueType::VALUE_TYPE_DOUBLE,
                  "", "PWM duty 0..1");
  *caps.add_signals() =
      make_signal(kSigMotor2Duty, "Motor 2 Duty", ValueType::VALUE_TYPE_DOUBLE,
                  "", "PWM duty 0..1");

  FunctionSpec f;
  f.set_function_id(kFnSetDuty);
  f.set_name("set_motor_duty");
  f.set_description("Set PWM duty for a motor channel");
  *f.add_args() =
      make_arg("motor_index", ValueType::VALUE_TYPE_INT64, true, "1 or 2");
  *f.add_args() =
      make_arg("duty", ValueType::VALUE_TYPE_DOUBLE, true, "Duty 0..1");
  *caps.add_functions() = f;

  return caps;
}

// -----------------------------
// Signal Reading
// -----------------------------

static const std::set<std::string> &get_known_signals() {
  static const std::set<std::string> kKnownSignals{
      kSigMotor1Speed, kSigMotor2Speed, kSigMotor1Duty, kSigMotor2Duty};
  return kKnownSignals;
}

static std::vector<std::string> default_signals() {
  return {kSigMotor1Speed, kSigMotor2Speed};
}

std::vector<SignalValue>
MotorCtlDevice::read_signals(const std::vector<std::string> &signal_ids) const {
  std::vector<std::string> ids = signal_ids;
  if (ids.empty()) {
    ids = default_signals();
  }

  std::vector<SignalValue> out;

  for (const auto &id : ids) {
    if (get_known_signals().count(id) == 0) {
      continue;
    }

    if (id == kSigMotor1Speed)
      out.push_back(make_signal_value(id, make_double(speed1_)));
    else if (id == kSigMotor2Speed)
      out.push_back(make_signal_value(id, make_double(speed2_)));
    else if (id == kSigMotor1Duty)
      out.push_back(make_signal_value(id, make_double(duty1_)));
    else if (id == kSigMotor2Duty)
      out.push_back(make_signal_value(id, make_double(duty2_)));
  }

  return out;
}

// -----------------------------
// Function Calls
// -----------------------------

CallResult
MotorCtlDevice::call_function(uint32_t function_id,
                              const std::map<std::string, Value> &args) {
  if (function_id == kFnSetDuty) {
    int64_t idx = 0;
    double duty = 0.0;
    if (!get_arg_int64(args, "motor_index", idx)) {
      return bad("missing/invalid arg: motor_index (int64)");
    }
    if (idx != 1 && idx != 2) {
      return bad("motor_index must be 1 or 2");
    }
    if (!get_arg_double(args, "duty", duty)) {
      return bad("missing/invalid arg: duty (double)");
    }
    if (duty < 0.0 || duty > 1.0) {
      return bad("duty out of range (0..1)");
    }

    if (idx == 1)
      duty1_ = duty;
    else
      duty2_ = duty;

    return ok();
  }

  return nf("unknown function_id for " + id());
}

} // namespace motorctl
} // namespace sim_devices
