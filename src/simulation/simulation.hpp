#pragma once

#include "simulation/adapters/communication_adapter.hpp"
#include "simulation/control_channel.hpp"
#include "simulation/device.hpp"
#include "simulation/pacer.hpp"
#include "simulation/timing.hpp"

#include <cstdint>
#include <stdexcept>

namespace sim_engine {

// Raised when a lifecycle or connectivity call is not valid in the current
// state. The engine is left untouched.
class InvalidOperation : public std::runtime_error {
public:
  using std::runtime_error::runtime_error;
};

// Stopped differs from Idle only by history: a stopped engine cannot be
// started again.
enum class SimulationState { Idle, Running, Paused, Stopped };

const char *to_string(SimulationState state);

struct SimulationStatus {
  SimulationState state = SimulationState::Idle;
  double speed = 1.0;
  double cycle_delay = 0.1;
  uint64_t cycles = 0;
  double runtime = 0.0; // simulated seconds
  double uptime = 0.0;  // wall seconds
  bool device_connected = true;
  bool control_attached = false;
};

// Cycle scheduler for one simulated device.
//
// start() blocks the calling thread and repeatedly runs process_cycle():
// measure elapsed wall time, advance the device by elapsed * speed (unless
// paused), pace through the adapter (or idle waiter while the device is
// disconnected), then give the control channel one round.
//
// Single-threaded: every mutator must be called on the thread running
// start(), typically from inside a collaborator callback. Callers on other
// threads need their own locking.
class Simulation {
public:
  // NOTE: no collaborator is owned; all must outlive the Simulation.
  Simulation(Device &device, sim_adapters::CommunicationAdapter &adapter,
             ControlChannel *control_channel = nullptr,
             Clock &clock = system_clock(),
             IdleWaiter &idle_waiter = default_idle_waiter());

  Simulation(const Simulation &) = delete;
  Simulation &operator=(const Simulation &) = delete;

  // Run the cycle loop until stop(). Throws InvalidOperation unless Idle.
  void start();

  // Request loop exit at the next iteration boundary. No-op unless Running
  // or Paused.
  void stop();

  // Running -> Paused. Throws InvalidOperation otherwise.
  void pause();

  // Paused -> Running. Throws InvalidOperation otherwise.
  void resume();

  // One cycle of the loop. Returns the elapsed wall time since
  // previous_timestamp (clamped at 0).
  double process_cycle(double previous_timestamp);

  SimulationState state() const { return state_; }
  bool is_started() const { return state_ != SimulationState::Idle; }
  bool is_running() const { return state_ == SimulationState::Running; }
  bool is_paused() const { return state_ == SimulationState::Paused; }

  double speed() const { return speed_; }
  // Throws std::invalid_argument for negative or non-finite values.
  void set_speed(double speed);

  double cycle_delay() const { return cycle_delay_; }
  // Throws std::invalid_argument for negative or non-finite values.
  void set_cycle_delay(double cycle_delay);

  // Whether wall time spent paused counts towards uptime (default true).
  bool count_paused_uptime() const { return count_paused_uptime_; }
  void set_count_paused_uptime(bool enabled) { count_paused_uptime_ = enabled; }

  uint64_t cycles() const { return cycles_; }
  double runtime() const { return runtime_; }
  double uptime() const { return uptime_; }

  bool device_connected() const { return device_connected_; }
  void connect_device();
  void disconnect_device();

  ControlChannel *control_channel() const { return control_channel_; }
  // While running, a live channel can be detached but not replaced.
  void set_control_channel(ControlChannel *control_channel);

  SimulationStatus status() const;

private:
  bool is_active() const {
    return state_ == SimulationState::Running ||
           state_ == SimulationState::Paused;
  }

  Device &device_;
  ControlChannel *control_channel_;
  Clock &clock_;

  AdapterPacer adapter_pacer_;
  IdlePacer idle_pacer_;
  Pacer *pacer_;

  SimulationState state_ = SimulationState::Idle;
  double speed_ = 1.0;
  double cycle_delay_ = 0.1;
  bool count_paused_uptime_ = true;
  bool device_connected_ = true;

  uint64_t cycles_ = 0;
  double runtime_ = 0.0;
  double uptime_ = 0.0;
};

} // namespace sim_engine
