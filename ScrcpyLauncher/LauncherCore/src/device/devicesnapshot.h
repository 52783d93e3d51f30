#ifndef DEVICESNAPSHOT_H
#define DEVICESNAPSHOT_H

#include <QHash>
#include <QMetaType>
#include <QSet>
#include <QStringList>
#include <QVector>

#include "device.h"

namespace slc {

// How two consecutive snapshots are compared by the polling loop
enum class ChangePolicy {
    SerialSet,       // same serials and same count: battery/resolution deltas are ignored
    FullProperties   // every Device field must match
};

struct SnapshotDiff {
    QStringList added;     // in new snapshot order
    QStringList removed;   // in previous snapshot order
    QStringList kept;      // in new snapshot order

    bool isEmpty() const { return added.isEmpty() && removed.isEmpty(); }
};

/**
 * @brief DeviceSnapshot - the devices the bridge reports at one point in time
 *
 * Keeps the bridge's own line order. Serials are unique; a duplicate serial
 * replaces the earlier entry in place.
 */
class DeviceSnapshot
{
public:
    DeviceSnapshot() = default;
    explicit DeviceSnapshot(const QVector<Device>& devices);

    const QVector<Device>& devices() const { return m_devices; }
    int count() const { return m_devices.size(); }
    bool isEmpty() const { return m_devices.isEmpty(); }

    bool contains(const QString& serial) const;
    Device device(const QString& serial) const;
    QSet<QString> serials() const;
    QStringList orderedSerials() const;

    bool isEquivalent(const DeviceSnapshot& other, ChangePolicy policy = ChangePolicy::SerialSet) const;
    SnapshotDiff diff(const DeviceSnapshot& previous) const;

private:
    QVector<Device> m_devices;
    QHash<QString, int> m_index;
};

} // namespace slc

Q_DECLARE_METATYPE(slc::DeviceSnapshot)
Q_DECLARE_METATYPE(slc::SnapshotDiff)

#endif // DEVICESNAPSHOT_H
