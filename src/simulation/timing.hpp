#pragma once

namespace sim_engine {

// Monotonic time source in seconds. The origin is arbitrary.
class Clock {
public:
  virtual ~Clock() = default;

  virtual double now() = 0;
};

// Blocking wait used for pacing while the device is disconnected.
class IdleWaiter {
public:
  virtual ~IdleWaiter() = default;

  virtual void wait(double seconds) = 0;
};

// steady_clock backed Clock
class SteadyClock : public Clock {
public:
  double now() override;
};

// this_thread::sleep_for backed IdleWaiter
class SleepWaiter : public IdleWaiter {
public:
  void wait(double seconds) override;
};

// Process-wide defaults (never destroyed before the engines using them).
Clock &system_clock();
IdleWaiter &default_idle_waiter();

} // namespace sim_engine
