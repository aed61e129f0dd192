#pragma once

#include "simulation/adapters/communication_adapter.hpp"
#include "simulation/timing.hpp"

namespace sim_engine {

// Bounded per-cycle wait. The engine keeps one pacer per connectivity state
// and swaps the active one on connect/disconnect.
class Pacer {
public:
  virtual ~Pacer() = default;

  virtual void pace(double timeout_s) = 0;
};

// Connected device: the adapter services its transport during the wait.
class AdapterPacer : public Pacer {
public:
  explicit AdapterPacer(sim_adapters::CommunicationAdapter &adapter)
      : adapter_(adapter) {}

  void pace(double timeout_s) override { adapter_.handle(timeout_s); }

private:
  sim_adapters::CommunicationAdapter &adapter_;
};

// Disconnected device: nobody is serviced, the loop just idles.
class IdlePacer : public Pacer {
public:
  explicit IdlePacer(IdleWaiter &waiter) : waiter_(waiter) {}

  void pace(double timeout_s) override { waiter_.wait(timeout_s); }

private:
  IdleWaiter &waiter_;
};

} // namespace sim_engine
