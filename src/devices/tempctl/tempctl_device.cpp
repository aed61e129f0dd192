#include "devices/tempctl/tempctl_device.hpp"

#include <cmath>
#include <set>
#include <stdexcept>

namespace sim_devices {
namespace tempctl {

using devsim::v1::CapabilitySet;
using devsim::v1::FunctionSpec;

// -----------------------------
// Constants
// -----------------------------

// Function IDs
static constexpr uint32_t kFnSetMode = 1;
static constexpr uint32_t kFnSetSetpoint = 2;
static constexpr uint32_t kFnSetRelay = 3;

// Signal IDs
static constexpr const char *kSigTc1Temp = "tc1_temp";
static constexpr const char *kSigTc2Temp = "tc2_temp";
static constexpr const char *kSigRelay1State = "relay1_state";
static constexpr const char *kSigRelay2State = "relay2_state";
static constexpr const char *kSigControlMode = "control_mode";
static constexpr const char *kSigSetpoint = "setpoint";

static constexpr double kAmbientC = 23.0;
static constexpr double kTauS = 6.0; // first-order time constant
static constexpr double kMinSetpointC = -50.0;
static constexpr double kMaxSetpointC = 400.0;

// -----------------------------
// Initialization
// -----------------------------

TempCtlDevice::TempCtlDevice(const std::string &device_id,
                             const Config &config)
    : SimDevice(device_id) {
  if (config.initial_temp.has_value()) {
    double temp = config.initial_temp.value();

    // Validate against temp_range if provided
    if (config.temp_range.has_value()) {
      double min_temp = config.temp_range.value().first;
      double max_temp = config.temp_range.value().second;
      if (temp < min_temp || temp > max_temp) {
        throw std::runtime_error(
            "[TempCtl] initial_temp " + std::to_string(temp) +
            " out of valid range [" + std::to_string(min_temp) + ", " +
            std::to_string(max_temp) + "]");
      }
    }

    tc1_c_ = temp;
    tc2_c_ = temp;
  }
}

// -----------------------------
// Physics
// -----------------------------

void TempCtlDevice::process(double dt) {
  if (mode_ == "closed") {
    update_control();
  }

  const int relays_on = (relay1_ ? 1 : 0) + (relay2_ ? 1 : 0);

  double target = kAmbientC;
  if (mode_ == "closed") {
    target = setpoint_c_;
  } else {
    // 0 relays: ambient, 1 relay: ambient + 45C, 2 relays: ambient + 75C
    target =
        kAmbientC + (relays_on == 0 ? 0.0 : (relays_on == 1 ? 45.0 : 75.0));
  }

  const double alpha = 1.0 - std::exp(-dt / kTauS);

  // Slight sensor offset keeps the channels distinct
  tc1_c_ += alpha * (target - tc1_c_);
  tc2_c_ += alpha * ((target - 1.5) - tc2_c_);
}

void TempCtlDevice::update_control() {
  const double error = setpoint_c_ - tc1_c_;

  if (error > 10.0) {
    // Far below setpoint: both relays on
    relay1_ = true;
    relay2_ = true;
  } else if (error > 2.0) {
    relay1_ = true;
    relay2_ = false;
  } else if (error < -2.0) {
    relay1_ = false;
    relay2_ = false;
  }
  // Else: in dead band, keep current state
}

// -----------------------------
// Device Info
// -----------------------------

devsim::v1::Device TempCtlDevice::device_info() const {
  devsim::v1::Device d;
  d.set_device_id(id());
  d.set_type_id("sim.temp_control_card");
  d.set_type_version("1.0");
  d.set_label("Sim Temp Control Card (2TC + 2Relay)");
  d.set_address("sim://" + id());
  (*d.mutable_tags())["family"] = "sim";
  (*d.mutable_tags())["kind"] = "temp_control";
  (*d.mutable_tags())["provider"] = kProviderName;
  return d;
}

// -----------------------------
// Capabilities
// -----------------------------

CapabilitySet TempCtlDevice::capabilities() const {
  CapabilitySet caps;

  *caps.add_signals() =
      make_signal(kSigTc1Temp, "TC1 Temperature", ValueType::VALUE_TYPE_DOUBLE,
                  "C", "Thermocouple channel 1");
  *caps.add_signals() =
      make_signal(kSigTc2Temp, "TC2 Temperature", ValueType::VALUE_TYPE_DOUBLE,
                  "C", "Thermocouple channel 2");
  *caps.add_signals() =
      make_signal(kSigRelay1State, "Relay 1 State", ValueType::VALUE_TYPE_BOOL,
                  "", "Relay output channel 1");
  *caps.add_signals() =
      make_signal(kSigRelay2State, "Relay 2 State", ValueType::VALUE_TYPE_BOOL,
                  "", "Relay output channel 2");
  *caps.add_signals() =
      make_signal(kSigControlMode, "Control Mode",
                  ValueType::VALUE_TYPE_STRING, "", "open or closed");
  *caps.add_signals() =
      make_signal(kSigSetpoint, "Setpoint", ValueType::VALUE_TYPE_DOUBLE, "C",
                  "Closed-loop temperature setpoint");

  {
    FunctionSpec f;
    f.set_function_id(kFnSetMode);
    f.set_name("set_mode");
    f.set_description("Set control mode: open or closed");
    *f.add_args() =
        make_arg("mode", ValueType::VALUE_TYPE_STRING, true, "open or closed");
    *caps.add_functions() = f;
  }
  {
    FunctionSpec f;
    f.set_function_id(kFnSetSetpoint);
    f.set_name("set_setpoint");
    f.set_description("Set closed-loop setpoint (C)");
    *f.add_args() = make_arg("value", ValueType::VALUE_TYPE_DOUBLE, true,
                             "Temperature setpoint", "C");
    *caps.add_functions() = f;
  }
  {
    FunctionSpec f;
    f.set_function_id(kFnSetRelay);
    f.set_name("set_relay");
    f.set_description("Set relay state in open-loop mode");
    *f.add_args() =
        make_arg("relay_index", ValueType::VALUE_TYPE_INT64, true, "1 or 2");
    *f.add_args() = make_arg("state", ValueType::VALUE_TYPE_BOOL, true,
                             "true=on false=off");
    *caps.add_functions() = f;
  }

  return caps;
}

// -----------------------------
// Signal Reading
// -----------------------------

static const std::set<std::string> &get_known_signals() {
  static const std::set<std::string> kKnownSignals{
      kSigTc1Temp,     kSigTc2Temp,     kSigRelay1State,
      kSigRelay2State, kSigControlMode, kSigSetpoint};
  return kKnownSignals;
}

static std::vector<std::string> default_signals() {
  return {kSigTc1Temp, kSigTc2Temp, kSigRelay1State, kSigRelay2State};
}

std::vector<SignalValue>
TempCtlDevice::read_signals(const std::vector<std::string> &signal_ids) const {
  std::vector<std::string> ids = signal_ids;
  if (ids.empty()) {
    ids = default_signals();
  }

  std::vector<SignalValue> out;

  for (const auto &id : ids) {
    if (get_known_signals().count(id) == 0) {
      // Omit unknown signals
      continue;
    }

    if (id == kSigTc1Temp)
      out.push_back(make_signal_value(id, make_double(tc1_c_)));
    else if (id == kSigTc2Temp)
      out.push_back(make_signal_value(id, make_double(tc2_c_)));
    else if (id == kSigRelay1State)
      out.push_back(make_signal_value(id, make_bool(relay1_)));
    else if (id == kSigRelay2State)
      out.push_back(make_signal_value(id, make_bool(relay2_)));
    else if (id == kSigControlMode)
      out.push_back(make_signal_value(id, make_string(mode_)));
    else if (id == kSigSetpoint)
      out.push_back(make_signal_value(id, make_double(setpoint_c_)));
  }

  return out;
}

// -----------------------------
// Function Calls
// -----------------------------

CallResult
TempCtlDevice::call_function(uint32_t function_id,
                             const std::map<std::string, Value> &args) {
  if (function_id == kFnSetMode) {
    std::string mode;
    if (!get_arg_string(args, "mode", mode)) {
      return bad("missing/invalid arg: mode (string)");
    }
    if (mode != "open" && mode != "closed") {
      return bad("mode must be 'open' or 'closed'");
    }
    mode_ = mode;
    return ok();
  }

  if (function_id == kFnSetSetpoint) {
    double sp = 0.0;
    if (!get_arg_double(args, "value", sp)) {
      return bad("missing/invalid arg: value (double)");
    }
    if (sp < kMinSetpointC || sp > kMaxSetpointC) {
      return bad("setpoint out of range");
    }
    setpoint_c_ = sp;
    return ok();
  }

  if (function_id == kFnSetRelay) {
    // Relays belong to the controller in closed mode
    if (mode_ != "open") {
      return precond("set_relay only allowed in open mode");
    }

    int64_t idx = 0;
    bool st = false;
    if (!get_arg_int64(args, "relay_index", idx)) {
      return bad("missing/invalid arg: relay_index (int64)");
    }
    if (idx != 1 && idx != 2) {
      return bad("relay_index must be 1 or 2");
    }
    if (!get_arg_bool(args, "state", st)) {
      return bad("missing/invalid arg: state (bool)");
    }

    if (idx == 1)
      relay1_ = st;
    else
      relay2_ = st;

    return ok();
  }

  return nf("unknown function_id for " + id());
}

} // namespace tempctl
} // namespace sim_devices
