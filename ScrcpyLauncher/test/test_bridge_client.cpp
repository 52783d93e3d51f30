// =============================================================================
// Unit tests for BridgeClient
// Tests: devices -l parsing, wm size / battery parsing, property queries
// against a fake adb, missing tool and timeout handling
// =============================================================================
#include <gtest/gtest.h>

#include <QElapsedTimer>

#include "bridgeclient.h"
#include "faketools.h"

using namespace slc;

class BridgeClientTest : public ShellToolsTest {};

// ---------------------------------------------------------------------------
// parseDeviceList
// ---------------------------------------------------------------------------
TEST(BridgeClientParseTest, KeepsDeviceAndUnauthorizedOnly) {
    const QString output =
        "List of devices attached\n"
        "R58M123ABC             device usb:1-1 product:beyondx model:SM_G977N device:beyondx transport_id:1\n"
        "emulator-5554          offline transport_id:3\n"
        "0123456789ABCDEF       unauthorized usb:1-2 transport_id:2\n"
        "FA7AB1A01234           recovery usb:1-3 transport_id:4\n"
        "HT4CJJT00001           no permissions (user not in plugdev group); see [http://developer.android.com/tools/device.html]\n"
        "\n";

    QVector<Device> devices = BridgeClient::parseDeviceList(output);
    ASSERT_EQ(devices.size(), 2);

    EXPECT_EQ(devices[0].serial, QString("R58M123ABC"));
    EXPECT_EQ(devices[0].state, DeviceState::Device);
    EXPECT_EQ(devices[0].properties.value("model"), QString("SM_G977N"));
    EXPECT_EQ(devices[0].properties.value("transport_id"), QString("1"));

    EXPECT_EQ(devices[1].serial, QString("0123456789ABCDEF"));
    EXPECT_EQ(devices[1].state, DeviceState::Unauthorized);
    EXPECT_TRUE(devices[1].model.isEmpty());
}

TEST(BridgeClientParseTest, HeaderOnlyGivesNoDevices) {
    EXPECT_TRUE(BridgeClient::parseDeviceList("List of devices attached\n\n").isEmpty());
    EXPECT_TRUE(BridgeClient::parseDeviceList("").isEmpty());
}

TEST(BridgeClientParseTest, HandlesCarriageReturns) {
    QVector<Device> devices = BridgeClient::parseDeviceList(
        "List of devices attached\r\nSERIAL1\tdevice\r\n\r\n");
    ASSERT_EQ(devices.size(), 1);
    EXPECT_EQ(devices[0].serial, QString("SERIAL1"));
}

// ---------------------------------------------------------------------------
// parseResolution / parseBatteryLevel
// ---------------------------------------------------------------------------
TEST(BridgeClientParseTest, ResolutionTakesFirstMatch) {
    EXPECT_EQ(BridgeClient::parseResolution("Physical size: 1080x2340\n"), QString("1080x2340"));
    EXPECT_EQ(BridgeClient::parseResolution("Physical size: 1440x3120\nOverride size: 1080x2340\n"),
              QString("1440x3120"));
    EXPECT_TRUE(BridgeClient::parseResolution("error: device offline").isEmpty());
}

TEST(BridgeClientParseTest, BatteryLevel) {
    EXPECT_EQ(BridgeClient::parseBatteryLevel("  AC powered: false\n  level: 87\n  scale: 100\n"), 87);
    EXPECT_EQ(BridgeClient::parseBatteryLevel("level:5"), 5);
    EXPECT_EQ(BridgeClient::parseBatteryLevel("no battery here"), -1);
    EXPECT_EQ(BridgeClient::parseBatteryLevel("level: 150"), -1);
}

TEST(BridgeClientParseTest, MaxListDurationCountsPropertyQueries) {
    EXPECT_EQ(BridgeClient::maxListDurationMs(5000, 3000, 0), 5000);
    EXPECT_EQ(BridgeClient::maxListDurationMs(5000, 3000, 2), 5000 + 2 * 6 * 3000);
    EXPECT_EQ(BridgeClient::maxListDurationMs(5000, 3000, -1), 5000);
}

// ---------------------------------------------------------------------------
// Against a fake adb
// ---------------------------------------------------------------------------
TEST_F(BridgeClientTest, ListDevicesQueriesAuthorizedDevices) {
    FakeTools tools;
    ASSERT_TRUE(tools.isValid());
    ASSERT_TRUE(tools.installAdb("ABC123\tdevice usb:1-1 model:Pixel_7\nDEF456\tunauthorized usb:1-2\n"));

    BridgeClient client(tools.adbPath());
    QVector<Device> devices = client.listDevices();
    ASSERT_EQ(devices.size(), 2);

    const Device& phone = devices[0];
    EXPECT_EQ(phone.serial, QString("ABC123"));
    EXPECT_EQ(phone.model, QString("Pixel 7"));
    EXPECT_EQ(phone.manufacturer, QString("google"));
    EXPECT_EQ(phone.androidVersion, QString("14"));
    EXPECT_EQ(phone.sdk, QString("34"));
    EXPECT_EQ(phone.resolution, QString("1080x2400"));
    EXPECT_EQ(phone.batteryPercent, 87);

    const Device& locked = devices[1];
    EXPECT_EQ(locked.state, DeviceState::Unauthorized);
    EXPECT_TRUE(locked.model.isEmpty());
    EXPECT_EQ(locked.batteryPercent, -1);
}

TEST_F(BridgeClientTest, ModelFallsBackToListingThenSerial) {
    FakeTools tools;
    ASSERT_TRUE(tools.isValid());
    ASSERT_TRUE(tools.installAdb("ABC123\tdevice model:SM_G977N\nDEF456\tdevice\n", false));

    QVector<Device> devices = BridgeClient(tools.adbPath()).listDevices();
    ASSERT_EQ(devices.size(), 2);
    EXPECT_EQ(devices[0].model, QString("SM_G977N"));
    EXPECT_EQ(devices[1].model, QString("DEF456"));
    EXPECT_TRUE(devices[0].resolution.isEmpty());
    EXPECT_EQ(devices[0].batteryPercent, -1);
}

TEST_F(BridgeClientTest, MissingExecutableGivesNoData) {
    BridgeClient client("/nonexistent/dir/adb");
    QString output;
    EXPECT_EQ(client.run(QStringList() << "devices" << "-l", 1000, output), ToolResult::NotFound);
    EXPECT_TRUE(output.isEmpty());
    EXPECT_TRUE(client.listDevices().isEmpty());
    EXPECT_TRUE(client.getProp("X", "ro.product.model").isEmpty());
    EXPECT_EQ(client.queryBatteryLevel("X"), -1);
}

TEST_F(BridgeClientTest, EmptyPathIsNotFound) {
    BridgeClient client{QString()};
    QString output;
    EXPECT_EQ(client.run(QStringList() << "devices", 1000, output), ToolResult::NotFound);
}

TEST_F(BridgeClientTest, TimeoutGivesEmptyResult) {
    FakeTools tools;
    ASSERT_TRUE(tools.isValid());
    ASSERT_TRUE(tools.installSlowAdb(10));

    BridgeClient client(tools.adbPath(), 300, 300);
    QElapsedTimer timer;
    timer.start();

    QString output;
    EXPECT_EQ(client.run(QStringList() << "devices" << "-l", 300, output), ToolResult::Timeout);
    EXPECT_TRUE(client.listDevices().isEmpty());
    EXPECT_LT(timer.elapsed(), 5000);
}
