#pragma once

namespace sim_engine {

// Out-of-band inspection/control collaborator, serviced once per cycle on the
// engine thread.
class ControlChannel {
public:
  virtual ~ControlChannel() = default;

  virtual void process() = 0;
};

} // namespace sim_engine
