#pragma once

namespace sim_adapters {

// Channel through which external clients reach the simulated device.
class CommunicationAdapter {
public:
  virtual ~CommunicationAdapter() = default;

  // Service pending transport activity, blocking for at most timeout_s
  // seconds. May return earlier.
  virtual void handle(double timeout_s) = 0;
};

} // namespace sim_adapters
