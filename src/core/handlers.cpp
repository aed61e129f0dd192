#include "core/handlers.hpp"

#include <map>
#include <string>
#include <vector>

#include "transport/framed_stdio.hpp"

namespace handlers {

using devsim::v1::CallRequest;
using devsim::v1::DescribeDeviceRequest;
using devsim::v1::GetHealthRequest;
using devsim::v1::HelloRequest;
using devsim::v1::ReadSignalsRequest;
using devsim::v1::Response;
using devsim::v1::Status;

static constexpr const char *kProtocolVersion = "v1";
static constexpr const char *kProviderVersion = "0.1.0";

static inline void set_status_ok(Response &resp) {
  resp.mutable_status()->set_code(Status::CODE_OK);
  resp.mutable_status()->set_message("ok");
}

static inline void set_status(Response &resp, Status::Code code,
                              const std::string &msg) {
  resp.mutable_status()->set_code(code);
  resp.mutable_status()->set_message(msg);
}

void handle_hello(const HelloRequest &req, Response &resp) {
  if (req.protocol_version() != kProtocolVersion) {
    set_status(resp, Status::CODE_FAILED_PRECONDITION,
               "unsupported protocol_version; expected v1");
    return;
  }

  auto *hello = resp.mutable_hello();
  hello->set_protocol_version(kProtocolVersion);
  hello->set_provider_name(sim_devices::kProviderName);
  hello->set_provider_version(kProviderVersion);

  (*hello->mutable_metadata())["transport"] = "stdio+uint32_le";
  (*hello->mutable_metadata())["max_frame_bytes"] =
      std::to_string(transport::kMaxFrameBytes);

  set_status_ok(resp);
}

void handle_describe_device(sim_devices::SimDevice &device,
                            const DescribeDeviceRequest & /*req*/,
                            Response &resp) {
  auto *out = resp.mutable_describe_device();
  *out->mutable_device() = device.device_info();
  *out->mutable_capabilities() = device.capabilities();
  set_status_ok(resp);
}

void handle_read_signals(sim_devices::SimDevice &device,
                         const ReadSignalsRequest &req, Response &resp) {
  std::vector<std::string> ids;
  ids.reserve(static_cast<size_t>(req.signal_ids_size()));
  for (const auto &s : req.signal_ids()) {
    if (!device.has_signal(s)) {
      set_status(resp, Status::CODE_NOT_FOUND, "unknown signal_id: " + s);
      return;
    }
    ids.push_back(s);
  }

  const auto values = device.read_signals(ids);

  auto *out = resp.mutable_read_signals();
  out->set_device_id(device.id());
  for (const auto &v : values) {
    *out->add_values() = v;
  }

  set_status_ok(resp);
}

void handle_call(sim_devices::SimDevice &device, const CallRequest &req,
                 Response &resp) {
  std::map<std::string, devsim::v1::Value> args(req.args().begin(),
                                                req.args().end());

  const sim_devices::CallResult result =
      device.call_function(req.function_id(), args);

  if (result.code != Status::CODE_OK) {
    set_status(resp, result.code, result.message);
    return;
  }

  resp.mutable_call()->set_device_id(device.id());
  set_status_ok(resp);
}

void handle_get_health(sim_devices::SimDevice &device,
                       const GetHealthRequest & /*req*/, Response &resp) {
  auto health = device.health();
  (*health.mutable_metrics())["impl"] = "sim";
  *resp.mutable_get_health()->mutable_device() = health;
  set_status_ok(resp);
}

void handle_unimplemented(Response &resp) {
  set_status(resp, Status::CODE_UNIMPLEMENTED, "request not supported");
}

void dispatch(sim_devices::SimDevice &device, const devsim::v1::Request &req,
              Response &resp) {
  resp.set_request_id(req.request_id());
  set_status(resp, Status::CODE_INTERNAL, "uninitialized");

  if (req.has_hello()) {
    handle_hello(req.hello(), resp);
  } else if (req.has_describe_device()) {
    handle_describe_device(device, req.describe_device(), resp);
  } else if (req.has_read_signals()) {
    handle_read_signals(device, req.read_signals(), resp);
  } else if (req.has_call()) {
    handle_call(device, req.call(), resp);
  } else if (req.has_get_health()) {
    handle_get_health(device, req.get_health(), resp);
  } else {
    handle_unimplemented(resp);
  }
}

} // namespace handlers
