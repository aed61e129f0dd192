#include "simulation/simulation.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

namespace sim_engine {

const char *to_string(SimulationState state) {
  switch (state) {
  case SimulationState::Idle:
    return "idle";
  case SimulationState::Running:
    return "running";
  case SimulationState::Paused:
    return "paused";
  case SimulationState::Stopped:
    return "stopped";
  }
  return "unknown";
}

Simulation::Simulation(Device &device,
                       sim_adapters::CommunicationAdapter &adapter,
                       ControlChannel *control_channel, Clock &clock,
                       IdleWaiter &idle_waiter)
    : device_(device), control_channel_(control_channel), clock_(clock),
      adapter_pacer_(adapter), idle_pacer_(idle_waiter),
      pacer_(&adapter_pacer_) {}

// -----------------------------
// Lifecycle
// -----------------------------

void Simulation::start() {
  if (state_ != SimulationState::Idle) {
    throw InvalidOperation(std::string("[Simulation] cannot start: ") +
                           to_string(state_));
  }

  state_ = SimulationState::Running;
  std::cerr << "[Simulation] Starting (speed=" << speed_
            << ", cycle_delay=" << cycle_delay_ << "s)" << std::endl;

  double last = clock_.now();
  try {
    while (is_active()) {
      last += process_cycle(last);
    }
  } catch (...) {
    state_ = SimulationState::Stopped;
    std::cerr << "[Simulation] Cycle failed after " << cycles_ << " cycles"
              << std::endl;
    throw;
  }

  std::cerr << "[Simulation] Stopped after " << cycles_
            << " cycles (runtime=" << runtime_ << "s, uptime=" << uptime_
            << "s)" << std::endl;
}

void Simulation::stop() {
  if (!is_active()) {
    return;
  }
  state_ = SimulationState::Stopped;
}

void Simulation::pause() {
  if (state_ != SimulationState::Running) {
    throw InvalidOperation(std::string("[Simulation] cannot pause: ") +
                           to_string(state_));
  }
  state_ = SimulationState::Paused;
  std::cerr << "[Simulation] Paused" << std::endl;
}

void Simulation::resume() {
  if (state_ != SimulationState::Paused) {
    throw InvalidOperation(std::string("[Simulation] cannot resume: ") +
                           to_string(state_));
  }
  state_ = SimulationState::Running;
  std::cerr << "[Simulation] Resumed" << std::endl;
}

// -----------------------------
// Cycle
// -----------------------------

double Simulation::process_cycle(double previous_timestamp) {
  const double elapsed = std::max(0.0, clock_.now() - previous_timestamp);

  if (state_ == SimulationState::Running) {
    const double dt = elapsed * speed_;
    device_.process(dt);
    runtime_ += dt;
    ++cycles_;
    uptime_ += elapsed;
  } else if (state_ == SimulationState::Paused && count_paused_uptime_) {
    uptime_ += elapsed;
  }

  pacer_->pace(cycle_delay_);

  if (control_channel_ != nullptr) {
    control_channel_->process();
  }

  return elapsed;
}

// -----------------------------
// Configuration
// -----------------------------

void Simulation::set_speed(double speed) {
  if (!(speed >= 0.0) || !std::isfinite(speed)) {
    throw std::invalid_argument(
        "[Simulation] speed must be finite and >= 0, got " +
        std::to_string(speed));
  }
  speed_ = speed;
}

void Simulation::set_cycle_delay(double cycle_delay) {
  if (!(cycle_delay >= 0.0) || !std::isfinite(cycle_delay)) {
    throw std::invalid_argument(
        "[Simulation] cycle_delay must be finite and >= 0, got " +
        std::to_string(cycle_delay));
  }
  cycle_delay_ = cycle_delay;
}

// -----------------------------
// Connectivity
// -----------------------------

void Simulation::connect_device() {
  if (device_connected_) {
    throw InvalidOperation("[Simulation] device is already connected");
  }
  device_connected_ = true;
  pacer_ = &adapter_pacer_;
  std::cerr << "[Simulation] Device connected" << std::endl;
}

void Simulation::disconnect_device() {
  if (!device_connected_) {
    throw InvalidOperation("[Simulation] device is already disconnected");
  }
  device_connected_ = false;
  pacer_ = &idle_pacer_;
  std::cerr << "[Simulation] Device disconnected" << std::endl;
}

void Simulation::set_control_channel(ControlChannel *control_channel) {
  if (state_ == SimulationState::Running && control_channel_ != nullptr &&
      control_channel != nullptr) {
    throw InvalidOperation(
        "[Simulation] cannot replace control channel while running");
  }
  control_channel_ = control_channel;
}

SimulationStatus Simulation::status() const {
  SimulationStatus s;
  s.state = state_;
  s.speed = speed_;
  s.cycle_delay = cycle_delay_;
  s.cycles = cycles_;
  s.runtime = runtime_;
  s.uptime = uptime_;
  s.device_connected = device_connected_;
  s.control_attached = control_channel_ != nullptr;
  return s;
}

} // namespace sim_engine
