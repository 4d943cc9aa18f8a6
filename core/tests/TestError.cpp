/**
 * @file TestError.cpp
 * @brief Unit tests for bpb::core::Error and the BPB_TRY macros.
 */

#include <catch2/catch_test_macros.hpp>

#include "bpb/core/Expected.hpp"

#include <string>

using namespace bpb::core;

namespace {

Expected<int> half(int value)
{
    if (value % 2 != 0) {
        return makeError(ErrorCode::kInvalidArgument, "odd value " + std::to_string(value));
    }
    return value / 2;
}

Expected<int> quarter(int value)
{
    const int h = BPB_TRY(half(value));
    return BPB_TRY(half(h));
}

ExpectedVoid requireEven(int value)
{
    BPB_TRY_VOID(half(value).transform([](int) {}));
    return {};
}

} // namespace

TEST_CASE("Error keeps code, message and origin", "[core][error]")
{
    const Error err{ErrorCode::kDeviceOpenFailed, "/dev/input/js0: Permission denied"};

    REQUIRE(err.code() == ErrorCode::kDeviceOpenFailed);
    REQUIRE(err.message() == "/dev/input/js0: Permission denied");
    REQUIRE(err.cause() == nullptr);
    REQUIRE(&err.rootCause() == &err);
    REQUIRE(std::string(err.location().file_name()).find("TestError.cpp") != std::string::npos);
}

TEST_CASE("Wrapped error exposes the untouched cause", "[core][error]")
{
    Error inner{ErrorCode::kIoError, "HCI socket closed"};
    Error outer{ErrorCode::kBleScanFailed, "failed to scan for new peripherals", inner};

    REQUIRE(outer.code() == ErrorCode::kBleScanFailed);
    REQUIRE(outer.cause() != nullptr);
    REQUIRE(outer.cause()->code() == ErrorCode::kIoError);
    REQUIRE(outer.cause()->message() == "HCI socket closed");
    REQUIRE(outer.rootCause().message() == "HCI socket closed");
}

TEST_CASE("format renders the whole cause chain", "[core][error]")
{
    Error root{ErrorCode::kIoError, "Operation not permitted"};
    Error mid{ErrorCode::kDeviceOpenFailed, "hci0", root};
    Error top{ErrorCode::kBleConnectFailed, "failed to connect to BLE adapter", mid};

    const std::string text = top.format();
    REQUIRE(text.find("[BleConnectFailed] failed to connect to BLE adapter") == 0);
    REQUIRE(text.find(": [DeviceOpenFailed] hci0") != std::string::npos);
    REQUIRE(text.find(": [IoError] Operation not permitted") != std::string::npos);
    REQUIRE(text.find("TestError.cpp") != std::string::npos);
}

TEST_CASE("Bring-up kinds form a closed set", "[core][error]")
{
    REQUIRE(isBringupKind(ErrorCode::kUsbNotSupported));
    REQUIRE(isBringupKind(ErrorCode::kUsbDeviceInitialization));
    REQUIRE(isBringupKind(ErrorCode::kUsbInitialization));
    REQUIRE(isBringupKind(ErrorCode::kMissingGamepad));
    REQUIRE(isBringupKind(ErrorCode::kMissingBleAdapter));

    REQUIRE_FALSE(isBringupKind(ErrorCode::kNone));
    REQUIRE_FALSE(isBringupKind(ErrorCode::kBleScanFailed));
    REQUIRE_FALSE(isBringupKind(ErrorCode::kIoError));
}

TEST_CASE("BPB_TRY propagates the first error", "[core][expected]")
{
    auto ok = quarter(8);
    REQUIRE(ok.has_value());
    REQUIRE(*ok == 2);

    auto bad = quarter(6);
    REQUIRE_FALSE(bad.has_value());
    REQUIRE(bad.error().code() == ErrorCode::kInvalidArgument);
    REQUIRE(bad.error().message() == "odd value 3");

    REQUIRE(requireEven(4).has_value());
    REQUIRE_FALSE(requireEven(5).has_value());
}
