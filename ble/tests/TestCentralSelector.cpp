/**
 * @file TestCentralSelector.cpp
 * @brief getCentral() over fake pre-connected and connectable backends.
 */

#include <catch2/catch_test_macros.hpp>

#include "bpb/ble/CentralSelector.hpp"

#include <memory>
#include <string>
#include <vector>

using namespace bpb;
using namespace bpb::ble;

namespace {

struct FakeCentral {
    std::string name;

    core::ExpectedVoid startScan() { return {}; }
    std::vector<PeripheralRecord> peripherals() { return {}; }
};

// ---- pre-connected backend ----------------------------------------------

struct ReadyAdapter {
    std::string adapterName;

    std::string name() const { return adapterName; }
    core::ExpectedVoid startScan() { return {}; }
    std::vector<PeripheralRecord> peripherals() { return {}; }
};

struct ReadyManager {
    using Adapter = ReadyAdapter;

    std::vector<std::string> names;
    bool listingFails = false;

    core::Expected<std::vector<ReadyAdapter>> adapters() const
    {
        if (listingFails) {
            return core::makeError(core::ErrorCode::kIoError, "radio service unavailable");
        }
        std::vector<ReadyAdapter> out;
        for (const auto &n : names) {
            out.push_back(ReadyAdapter{n});
        }
        return out;
    }
};

// ---- connect-first backend ----------------------------------------------

struct ClosedAdapter {
    using Connected = FakeCentral;

    std::string adapterName;
    bool opens = true;

    std::string name() const { return adapterName; }

    core::Expected<FakeCentral> connect() const
    {
        if (!opens) {
            return core::makeError(core::ErrorCode::kDeviceOpenFailed, "Operation not permitted");
        }
        return FakeCentral{adapterName};
    }
};

struct ConnectManager {
    using Adapter = ClosedAdapter;

    std::vector<ClosedAdapter> list;

    core::Expected<std::vector<ClosedAdapter>> adapters() const { return list; }
};

static_assert(Manager<ReadyManager>);
static_assert(Manager<ConnectManager>);
static_assert(!ConnectableAdapter<ReadyAdapter>);
static_assert(ConnectableAdapter<ClosedAdapter>);
static_assert(std::same_as<CentralOf<ReadyManager>, ReadyAdapter>);
static_assert(std::same_as<CentralOf<ConnectManager>, FakeCentral>);

} // namespace

TEST_CASE("getCentral reports MissingBleAdapter on an empty list", "[ble][selector]")
{
    SECTION("pre-connected backend")
    {
        const auto central = getCentral(ReadyManager{});
        REQUIRE_FALSE(central.has_value());
        REQUIRE(central.error().code() == core::ErrorCode::kMissingBleAdapter);
    }

    SECTION("connect-first backend")
    {
        const auto central = getCentral(ConnectManager{});
        REQUIRE_FALSE(central.has_value());
        REQUIRE(central.error().code() == core::ErrorCode::kMissingBleAdapter);
    }
}

TEST_CASE("getCentral uses the first listed adapter", "[ble][selector]")
{
    SECTION("pre-connected backend")
    {
        const auto central = getCentral(ReadyManager{{"hci0", "hci1"}});
        REQUIRE(central.has_value());
        REQUIRE(central->name() == "hci0");
    }

    SECTION("connect-first backend")
    {
        const auto central = getCentral(ConnectManager{{{"hci0", true}, {"hci1", true}}});
        REQUIRE(central.has_value());
        REQUIRE(central->name == "hci0");
    }
}

TEST_CASE("getCentral wraps a connect failure instead of reporting a missing adapter", "[ble][selector]")
{
    const auto central = getCentral(ConnectManager{{{"hci0", false}, {"hci1", true}}});

    REQUIRE_FALSE(central.has_value());
    REQUIRE(central.error().code() == core::ErrorCode::kBleConnectFailed);
    REQUIRE(central.error().message() == "failed to connect to BLE adapter hci0");
    REQUIRE(central.error().cause() != nullptr);
    REQUIRE(central.error().cause()->code() == core::ErrorCode::kDeviceOpenFailed);
}

TEST_CASE("getCentral wraps a listing failure", "[ble][selector]")
{
    ReadyManager manager;
    manager.listingFails = true;

    const auto central = getCentral(manager);

    REQUIRE_FALSE(central.has_value());
    REQUIRE(central.error().code() == core::ErrorCode::kBleAdapterFailed);
    REQUIRE(central.error().rootCause().code() == core::ErrorCode::kIoError);
}
