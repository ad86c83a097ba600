#include <gtest/gtest.h>
#include "EngineError.hpp"
#include "OutputBackend.hpp"
#include "null/NullDriver.hpp"

using namespace deck;

namespace {

ErrorKind resolve_error(hal::AudioHost& host, const std::string& id) {
    try {
        resolve_output_device(host, id);
    } catch (const EngineError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "expected '" << id << "' to fail";
    return ErrorKind::NotFound;
}

} // namespace

TEST(DeviceResolverTest, DefaultResolvesToHostDefault) {
    hal::NullHost host(hal::NullHostOptions{{"Speakers"}, false});
    auto device = resolve_output_device(host, "default");
    EXPECT_EQ(device.id, "default");
    EXPECT_EQ(device.name, host.default_device_name());
}

TEST(DeviceResolverTest, IndexSelectsEnumeratedDevice) {
    hal::NullHost host(hal::NullHostOptions{{"Speakers", "Headphones", "HDMI"}, false});
    auto device = resolve_output_device(host, "2");
    EXPECT_EQ(device.id, "2");
    EXPECT_EQ(device.name, "HDMI");
}

TEST(DeviceResolverTest, LeadingZerosParseAsDecimal) {
    hal::NullHost host(hal::NullHostOptions{{"Speakers", "Headphones"}, false});
    EXPECT_EQ(resolve_output_device(host, "01").name, "Headphones");
}

TEST(DeviceResolverTest, MalformedIdsAreDeviceErrors) {
    hal::NullHost host(hal::NullHostOptions{{"Speakers"}, false});
    EXPECT_EQ(resolve_error(host, ""), ErrorKind::DeviceError);
    EXPECT_EQ(resolve_error(host, "speakers"), ErrorKind::DeviceError);
    EXPECT_EQ(resolve_error(host, "-1"), ErrorKind::DeviceError);
    EXPECT_EQ(resolve_error(host, "0x1"), ErrorKind::DeviceError);
    EXPECT_EQ(resolve_error(host, "1 "), ErrorKind::DeviceError);
    EXPECT_EQ(resolve_error(host, "Default"), ErrorKind::DeviceError);
}

TEST(DeviceResolverTest, OutOfRangeIndexIsDeviceError) {
    hal::NullHost host(hal::NullHostOptions{{"Speakers"}, false});
    EXPECT_EQ(resolve_error(host, "1"), ErrorKind::DeviceError);
    EXPECT_EQ(resolve_error(host, "99999999999999999999999"), ErrorKind::DeviceError);
}

TEST(DeviceResolverTest, HostWithoutDevicesHasNoDefault) {
    hal::NullHost host(hal::NullHostOptions{{}, false});
    EXPECT_EQ(resolve_error(host, "default"), ErrorKind::DeviceError);
    EXPECT_EQ(resolve_error(host, "0"), ErrorKind::DeviceError);
}

TEST(DeviceResolverTest, ListingPrependsDefault) {
    hal::NullHost host(hal::NullHostOptions{{"Speakers", "Headphones"}, false});
    auto devices = list_output_devices(host);
    ASSERT_EQ(devices.size(), 3u);
    EXPECT_EQ(devices[0].id, "default");
    EXPECT_EQ(devices[0].name, host.default_device_name());
    EXPECT_EQ(devices[1].id, "0");
    EXPECT_EQ(devices[1].name, "Speakers");
    EXPECT_EQ(devices[2].id, "1");
}

TEST(DeviceResolverTest, ListingIsNeverEmpty) {
    hal::NullHost host(hal::NullHostOptions{{}, false});
    auto devices = list_output_devices(host);
    ASSERT_EQ(devices.size(), 1u);
    EXPECT_EQ(devices[0].id, "default");
}
