#include "devices/common/device_factory.hpp"
#include "devices/motorctl/motorctl_device.hpp"
#include "devices/tempctl/tempctl_device.hpp"

#include <gtest/gtest.h>

#include <map>
#include <stdexcept>
#include <string>

//-------------------------------------------------------------------------

using namespace sim_devices;
using namespace testing;

using devsim::v1::Status;

//-------------------------------------------------------------------------
// tempctl
//-------------------------------------------------------------------------

TEST(TempCtlDeviceTest, DescribesItself) {
  tempctl::TempCtlDevice dev("oven");

  const devsim::v1::Device info = dev.device_info();
  EXPECT_EQ(info.device_id(), "oven");
  EXPECT_EQ(info.type_id(), "sim.temp_control_card");
  EXPECT_EQ(info.address(), "sim://oven");
  EXPECT_EQ(info.tags().at("provider"), "device-sim");

  const devsim::v1::CapabilitySet caps = dev.capabilities();
  EXPECT_EQ(caps.signals_size(), 6);
  ASSERT_EQ(caps.functions_size(), 3);
  EXPECT_EQ(caps.functions(0).name(), "set_mode");
  EXPECT_EQ(caps.functions(2).args_size(), 2);

  EXPECT_TRUE(dev.has_signal("setpoint"));
  EXPECT_FALSE(dev.has_signal("pressure"));
}

TEST(TempCtlDeviceTest, DefaultReadAndUnknownIdsOmitted) {
  tempctl::TempCtlDevice dev(tempctl::kDeviceId);

  const auto defaults = dev.read_signals({});
  ASSERT_EQ(defaults.size(), 4u);
  EXPECT_EQ(defaults[0].signal_id(), "tc1_temp");
  EXPECT_DOUBLE_EQ(defaults[0].value().double_value(), 25.0);
  EXPECT_EQ(defaults[2].value().type(), ValueType::VALUE_TYPE_BOOL);
  EXPECT_EQ(defaults[0].quality(), SignalValue::QUALITY_OK);

  const auto picked = dev.read_signals({"control_mode", "nope"});
  ASSERT_EQ(picked.size(), 1u);
  EXPECT_EQ(picked[0].value().string_value(), "open");
}

TEST(TempCtlDeviceTest, InitialTempValidatedAgainstRange) {
  tempctl::Config config;
  config.initial_temp = 40.0;
  config.temp_range = std::make_pair(0.0, 100.0);

  tempctl::TempCtlDevice dev("t", config);
  EXPECT_DOUBLE_EQ(dev.tc1_temp(), 40.0);
  EXPECT_DOUBLE_EQ(dev.tc2_temp(), 40.0);

  config.initial_temp = 150.0;
  EXPECT_THROW(tempctl::TempCtlDevice("t", config), std::runtime_error);
}

TEST(TempCtlDeviceTest, ZeroStepLeavesTemperatures) {
  tempctl::TempCtlDevice dev("t");
  ASSERT_EQ(dev.call_function(3, {{"relay_index", make_int64(1)},
                                  {"state", make_bool(true)}})
                .code,
            Status::CODE_OK);

  dev.process(0.0);

  EXPECT_DOUBLE_EQ(dev.tc1_temp(), 25.0);
  EXPECT_DOUBLE_EQ(dev.tc2_temp(), 25.0);
}

TEST(TempCtlDeviceTest, OpenLoopRelaysHeatTowardsTarget) {
  tempctl::TempCtlDevice dev("t");

  // ambient
  dev.process(600.0);
  EXPECT_NEAR(dev.tc1_temp(), 23.0, 1e-6);
  EXPECT_NEAR(dev.tc2_temp(), 21.5, 1e-6);

  dev.call_function(3, {{"relay_index", make_int64(1)},
                        {"state", make_bool(true)}});
  dev.process(600.0);
  EXPECT_NEAR(dev.tc1_temp(), 68.0, 1e-6);

  dev.call_function(3, {{"relay_index", make_int64(2)},
                        {"state", make_bool(true)}});
  dev.process(600.0);
  EXPECT_NEAR(dev.tc1_temp(), 98.0, 1e-6);
  EXPECT_NEAR(dev.tc2_temp(), 96.5, 1e-6);
}

TEST(TempCtlDeviceTest, SmallStepMovesPartWay) {
  tempctl::TempCtlDevice dev("t");
  dev.call_function(3, {{"relay_index", make_int64(1)},
                        {"state", make_bool(true)}});

  dev.process(1.0);

  EXPECT_GT(dev.tc1_temp(), 25.0);
  EXPECT_LT(dev.tc1_temp(), 68.0);
}

TEST(TempCtlDeviceTest, ClosedLoopDrivesRelays) {
  tempctl::TempCtlDevice dev("t");
  ASSERT_EQ(dev.call_function(1, {{"mode", make_string("closed")}}).code,
            Status::CODE_OK);
  ASSERT_EQ(dev.call_function(2, {{"value", make_double(80.0)}}).code,
            Status::CODE_OK);

  // far below setpoint
  dev.process(0.0);
  EXPECT_TRUE(dev.relay(1));
  EXPECT_TRUE(dev.relay(2));

  dev.process(600.0);
  EXPECT_NEAR(dev.tc1_temp(), 80.0, 1e-6);

  // dead band keeps the relays
  dev.process(0.0);
  EXPECT_TRUE(dev.relay(1));

  // above setpoint
  dev.call_function(2, {{"value", make_int64(70)}});
  dev.process(0.0);
  EXPECT_FALSE(dev.relay(1));
  EXPECT_FALSE(dev.relay(2));
  EXPECT_DOUBLE_EQ(dev.setpoint(), 70.0);
}

TEST(TempCtlDeviceTest, CallErrors) {
  tempctl::TempCtlDevice dev("t");

  EXPECT_EQ(dev.call_function(1, {}).code, Status::CODE_INVALID_ARGUMENT);
  EXPECT_EQ(dev.call_function(1, {{"mode", make_string("auto")}}).code,
            Status::CODE_INVALID_ARGUMENT);
  EXPECT_EQ(dev.call_function(2, {{"value", make_double(500.0)}}).code,
            Status::CODE_INVALID_ARGUMENT);
  EXPECT_EQ(dev.call_function(3, {{"relay_index", make_int64(3)},
                                  {"state", make_bool(true)}})
                .code,
            Status::CODE_INVALID_ARGUMENT);
  EXPECT_EQ(dev.call_function(3, {{"relay_index", make_int64(1)}}).code,
            Status::CODE_INVALID_ARGUMENT);
  EXPECT_EQ(dev.call_function(99, {}).code, Status::CODE_NOT_FOUND);

  dev.call_function(1, {{"mode", make_string("closed")}});
  const CallResult r = dev.call_function(
      3, {{"relay_index", make_int64(1)}, {"state", make_bool(true)}});
  EXPECT_EQ(r.code, Status::CODE_FAILED_PRECONDITION);
  EXPECT_FALSE(dev.relay(1));
}

//-------------------------------------------------------------------------
// motorctl
//-------------------------------------------------------------------------

TEST(MotorCtlDeviceTest, SpeedFollowsDuty) {
  motorctl::MotorCtlDevice dev(motorctl::kDeviceId);
  ASSERT_EQ(dev.call_function(10, {{"motor_index", make_int64(1)},
                                   {"duty", make_double(0.5)}})
                .code,
            Status::CODE_OK);

  dev.process(0.4);
  EXPECT_GT(dev.speed(1), 0.0);
  EXPECT_LT(dev.speed(1), 1600.0);
  EXPECT_DOUBLE_EQ(dev.speed(2), 0.0);

  dev.process(60.0);
  EXPECT_NEAR(dev.speed(1), 1600.0, 1e-6);

  const auto values = dev.read_signals({"motor1_duty", "motor1_speed"});
  ASSERT_EQ(values.size(), 2u);
  EXPECT_DOUBLE_EQ(values[0].value().double_value(), 0.5);
}

TEST(MotorCtlDeviceTest, MaxSpeedConfigured) {
  motorctl::Config config;
  config.max_speed = 1000.0;
  motorctl::MotorCtlDevice dev("m", config);
  EXPECT_DOUBLE_EQ(dev.max_rpm(), 1000.0);

  dev.call_function(10, {{"motor_index", make_int64(2)},
                         {"duty", make_int64(1)}});
  dev.process(60.0);
  EXPECT_NEAR(dev.speed(2), 1000.0, 1e-6);

  config.max_speed = 0.0;
  EXPECT_THROW(motorctl::MotorCtlDevice("m", config), std::runtime_error);
  config.max_speed = 20000.0;
  EXPECT_THROW(motorctl::MotorCtlDevice("m", config), std::runtime_error);
}

TEST(MotorCtlDeviceTest, CallErrors) {
  motorctl::MotorCtlDevice dev("m");

  EXPECT_EQ(dev.call_function(10, {{"motor_index", make_int64(3)},
                                   {"duty", make_double(0.5)}})
                .code,
            Status::CODE_INVALID_ARGUMENT);
  EXPECT_EQ(dev.call_function(10, {{"motor_index", make_int64(1)},
                                   {"duty", make_double(1.5)}})
                .code,
            Status::CODE_INVALID_ARGUMENT);
  EXPECT_EQ(dev.call_function(10, {{"motor_index", make_int64(1)},
                                   {"duty", make_string("fast")}})
                .code,
            Status::CODE_INVALID_ARGUMENT);
  EXPECT_EQ(dev.call_function(1, {}).code, Status::CODE_NOT_FOUND);
  EXPECT_DOUBLE_EQ(dev.duty(1), 0.0);
}

//-------------------------------------------------------------------------
// factory
//-------------------------------------------------------------------------

TEST(DeviceFactoryTest, CreatesConfiguredTempCtl) {
  device_sim::DeviceSpec spec;
  spec.id = "oven";
  spec.type = "tempctl";
  spec.config["initial_temp"] = YAML::Load("30.5");
  spec.config["temp_range"] = YAML::Load("[0, 200]");

  auto dev = device_sim::DeviceFactory::create_device(spec);

  ASSERT_NE(dev, nullptr);
  EXPECT_EQ(dev->id(), "oven");
  const auto values = dev->read_signals({"tc1_temp"});
  ASSERT_EQ(values.size(), 1u);
  EXPECT_DOUBLE_EQ(values[0].value().double_value(), 30.5);
}

TEST(DeviceFactoryTest, CreatesMotorCtl) {
  device_sim::DeviceSpec spec;
  spec.id = "motors";
  spec.type = "motorctl";
  spec.config["max_speed"] = YAML::Load("1500");

  auto dev = device_sim::DeviceFactory::create_device(spec);

  ASSERT_NE(dev, nullptr);
  EXPECT_EQ(dev->device_info().type_id(), "sim.dual_dc_motor");
}

TEST(DeviceFactoryTest, RejectsBadSpecs) {
  device_sim::DeviceSpec spec;
  spec.id = "x";

  spec.type = "flux_capacitor";
  EXPECT_THROW(device_sim::DeviceFactory::create_device(spec),
               std::runtime_error);

  spec.type = "tempctl";
  spec.config["temp_range"] = YAML::Load("[100, 0]");
  EXPECT_THROW(device_sim::DeviceFactory::create_device(spec),
               std::runtime_error);

  spec.config["temp_range"] = YAML::Load("[0, 10, 20]");
  EXPECT_THROW(device_sim::DeviceFactory::create_device(spec),
               std::runtime_error);

  spec.config.erase("temp_range");
  spec.config["initial_temp"] = YAML::Load("warm");
  EXPECT_THROW(device_sim::DeviceFactory::create_device(spec),
               std::runtime_error);
}

TEST(DeviceFactoryTest, SupportedTypes) {
  EXPECT_TRUE(device_sim::DeviceFactory::is_supported_type("tempctl"));
  EXPECT_TRUE(device_sim::DeviceFactory::is_supported_type("motorctl"));
  EXPECT_FALSE(device_sim::DeviceFactory::is_supported_type("relayio"));
  EXPECT_EQ(device_sim::DeviceFactory::supported_types().size(), 2u);
}
