#include "simulation/timing.hpp"

#include <chrono>
#include <thread>

namespace sim_engine {

double SteadyClock::now() {
  const auto since_epoch = std::chrono::steady_clock::now().time_since_epoch();
  return std::chrono::duration<double>(since_epoch).count();
}

void SleepWaiter::wait(double seconds) {
  if (seconds <= 0.0) {
    return;
  }
  std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

Clock &system_clock() {
  static SteadyClock clock;
  return clock;
}

IdleWaiter &default_idle_waiter() {
  static SleepWaiter waiter;
  return waiter;
}

} // namespace sim_engine
