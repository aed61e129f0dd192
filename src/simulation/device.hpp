#pragma once

namespace sim_engine {

// Simulated device as seen by the engine: an opaque processor of elapsed
// simulated time. Must accept any non-negative dt.
class Device {
public:
  virtual ~Device() = default;

  virtual void process(double dt) = 0;
};

} // namespace sim_engine
