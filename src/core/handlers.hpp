#pragma once

#include "devices/common/sim_device.hpp"
#include "protocol.pb.h"

namespace handlers {

void handle_hello(const devsim::v1::HelloRequest &req,
                  devsim::v1::Response &resp);

void handle_describe_device(sim_devices::SimDevice &device,
                            const devsim::v1::DescribeDeviceRequest &req,
                            devsim::v1::Response &resp);

void handle_read_signals(sim_devices::SimDevice &device,
                         const devsim::v1::ReadSignalsRequest &req,
                         devsim::v1::Response &resp);

void handle_call(sim_devices::SimDevice &device,
                 const devsim::v1::CallRequest &req,
                 devsim::v1::Response &resp);

void handle_get_health(sim_devices::SimDevice &device,
                       const devsim::v1::GetHealthRequest &req,
                       devsim::v1::Response &resp);

void handle_unimplemented(devsim::v1::Response &resp);

// Routes req to the matching handler. resp always ends up with request_id and
// a status set.
void dispatch(sim_devices::SimDevice &device, const devsim::v1::Request &req,
              devsim::v1::Response &resp);

} // namespace handlers
