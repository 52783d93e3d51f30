// =============================================================================
// Unit tests for Device and DeviceSnapshot
// Tests: display names, summary line, equivalence policies, diff, duplicates
// =============================================================================
#include <gtest/gtest.h>

#include "device.h"
#include "devicesnapshot.h"

using namespace slc;

// ---------------------------------------------------------------------------
// Helpers
// ---------------------------------------------------------------------------
static Device makeDevice(const QString& serial, int battery = -1)
{
    Device device;
    device.serial = serial;
    device.model = "Pixel 7";
    device.manufacturer = "google";
    device.androidVersion = "14";
    device.resolution = "1080x2400";
    device.batteryPercent = battery;
    return device;
}

static Device makeUnauthorized(const QString& serial)
{
    Device device;
    device.serial = serial;
    device.state = DeviceState::Unauthorized;
    return device;
}

// ---------------------------------------------------------------------------
// Device
// ---------------------------------------------------------------------------
TEST(DeviceTest, DisplayNameCapitalizesManufacturer) {
    Device device = makeDevice("A1");
    EXPECT_EQ(device.displayName(), QString("Google Pixel 7"));

    device.manufacturer = "OnePlus";
    device.model = "LE2115";
    EXPECT_EQ(device.displayName(), QString("Oneplus LE2115"));
}

TEST(DeviceTest, DisplayNameFallsBackToListingModelThenSerial) {
    Device device;
    device.serial = "emulator-5554";
    EXPECT_EQ(device.displayName(), QString("emulator-5554"));

    device.properties.insert("model", "sdk_gphone64");
    EXPECT_EQ(device.displayName(), QString("sdk_gphone64"));
}

TEST(DeviceTest, SummaryJoinsKnownParts) {
    Device device = makeDevice("A1");
    EXPECT_EQ(device.summary(), QString::fromUtf8("Android 14  ·  1080x2400  ·  A1"));

    Device bare = makeUnauthorized("B2");
    EXPECT_EQ(bare.summary(), QString("B2"));
}

TEST(DeviceTest, ModelOrSerial) {
    EXPECT_EQ(makeDevice("A1").modelOrSerial(), QString("Pixel 7"));
    EXPECT_EQ(makeUnauthorized("B2").modelOrSerial(), QString("B2"));
}

TEST(DeviceTest, AuthorizationAndBattery) {
    EXPECT_TRUE(makeDevice("A1").isAuthorized());
    EXPECT_FALSE(makeUnauthorized("B2").isAuthorized());
    EXPECT_FALSE(makeDevice("A1").hasBattery());
    EXPECT_TRUE(makeDevice("A1", 0).hasBattery());
}

// ---------------------------------------------------------------------------
// DeviceSnapshot construction
// ---------------------------------------------------------------------------
TEST(DeviceSnapshotTest, KeepsBridgeOrder) {
    DeviceSnapshot snapshot({ makeDevice("C"), makeDevice("A"), makeUnauthorized("B") });
    EXPECT_EQ(snapshot.count(), 3);
    EXPECT_EQ(snapshot.orderedSerials(), QStringList({ "C", "A", "B" }));
    EXPECT_TRUE(snapshot.contains("B"));
    EXPECT_FALSE(snapshot.contains("D"));
}

TEST(DeviceSnapshotTest, DuplicateSerialReplacesEarlierEntryInPlace) {
    DeviceSnapshot snapshot({ makeDevice("A", 10), makeDevice("B"), makeDevice("A", 90) });
    EXPECT_EQ(snapshot.count(), 2);
    EXPECT_EQ(snapshot.orderedSerials(), QStringList({ "A", "B" }));
    EXPECT_EQ(snapshot.device("A").batteryPercent, 90);
}

TEST(DeviceSnapshotTest, SkipsEmptySerials) {
    DeviceSnapshot snapshot({ makeDevice(""), makeDevice("A") });
    EXPECT_EQ(snapshot.count(), 1);
}

TEST(DeviceSnapshotTest, UnknownSerialGivesDefaultDevice) {
    DeviceSnapshot snapshot({ makeDevice("A") });
    EXPECT_TRUE(snapshot.device("missing").serial.isEmpty());
}

// ---------------------------------------------------------------------------
// Equivalence
// ---------------------------------------------------------------------------
TEST(DeviceSnapshotTest, EmptySnapshotsAreEquivalent) {
    EXPECT_TRUE(DeviceSnapshot().isEquivalent(DeviceSnapshot()));
}

TEST(DeviceSnapshotTest, SerialSetIgnoresPropertyChanges) {
    DeviceSnapshot before({ makeDevice("A", 80), makeDevice("B", 50) });
    DeviceSnapshot after({ makeDevice("B", 49), makeDevice("A", 80) });
    EXPECT_TRUE(after.isEquivalent(before, ChangePolicy::SerialSet));
}

TEST(DeviceSnapshotTest, FullPropertiesSeesBatteryChange) {
    DeviceSnapshot before({ makeDevice("A", 80) });
    DeviceSnapshot after({ makeDevice("A", 79) });
    EXPECT_FALSE(after.isEquivalent(before, ChangePolicy::FullProperties));
    EXPECT_TRUE(before.isEquivalent(DeviceSnapshot({ makeDevice("A", 80) }), ChangePolicy::FullProperties));
}

TEST(DeviceSnapshotTest, DifferentSerialsAreNotEquivalent) {
    DeviceSnapshot before({ makeDevice("A") });
    DeviceSnapshot after({ makeDevice("B") });
    EXPECT_FALSE(after.isEquivalent(before));
    EXPECT_FALSE(DeviceSnapshot().isEquivalent(before));
}

// ---------------------------------------------------------------------------
// Diff
// ---------------------------------------------------------------------------
TEST(DeviceSnapshotTest, DiffReportsAddedRemovedKept) {
    DeviceSnapshot before({ makeDevice("A"), makeDevice("B") });
    DeviceSnapshot after({ makeDevice("B"), makeDevice("C") });

    SnapshotDiff diff = after.diff(before);
    EXPECT_EQ(diff.added, QStringList({ "C" }));
    EXPECT_EQ(diff.removed, QStringList({ "A" }));
    EXPECT_EQ(diff.kept, QStringList({ "B" }));
    EXPECT_FALSE(diff.isEmpty());
}

TEST(DeviceSnapshotTest, DiffAgainstEmptyAddsEverything) {
    DeviceSnapshot after({ makeDevice("A"), makeUnauthorized("B") });
    SnapshotDiff diff = after.diff(DeviceSnapshot());
    EXPECT_EQ(diff.added, QStringList({ "A", "B" }));
    EXPECT_TRUE(diff.removed.isEmpty());
    EXPECT_TRUE(after.diff(after).isEmpty());
}
