#include "devicesnapshot.h"

namespace slc {

DeviceSnapshot::DeviceSnapshot(const QVector<Device>& devices)
{
    m_devices.reserve(devices.size());
    for (const Device& device : devices) {
        if (device.serial.isEmpty()) {
            continue;
        }
        auto it = m_index.constFind(device.serial);
        if (it != m_index.constEnd()) {
            m_devices[it.value()] = device;
            continue;
        }
        m_index.insert(device.serial, m_devices.size());
        m_devices.append(device);
    }
}

bool DeviceSnapshot::contains(const QString& serial) const
{
    return m_index.contains(serial);
}

Device DeviceSnapshot::device(const QString& serial) const
{
    auto it = m_index.constFind(serial);
    if (it == m_index.constEnd()) {
        return Device();
    }
    return m_devices.at(it.value());
}

QSet<QString> DeviceSnapshot::serials() const
{
    QSet<QString> result;
    for (const Device& device : m_devices) {
        result.insert(device.serial);
    }
    return result;
}

QStringList DeviceSnapshot::orderedSerials() const
{
    QStringList result;
    for (const Device& device : m_devices) {
        result.append(device.serial);
    }
    return result;
}

bool DeviceSnapshot::isEquivalent(const DeviceSnapshot& other, ChangePolicy policy) const
{
    if (count() != other.count() || serials() != other.serials()) {
        return false;
    }
    if (policy == ChangePolicy::SerialSet) {
        return true;
    }

    for (const Device& device : m_devices) {
        if (device != other.device(device.serial)) {
            return false;
        }
    }
    return true;
}

SnapshotDiff DeviceSnapshot::diff(const DeviceSnapshot& previous) const
{
    SnapshotDiff result;
    for (const Device& device : m_devices) {
        if (previous.contains(device.serial)) {
            result.kept.append(device.serial);
        } else {
            result.added.append(device.serial);
        }
    }
    for (const Device& device : previous.devices()) {
        if (!contains(device.serial)) {
            result.removed.append(device.serial);
        }
    }
    return result;
}

} // namespace slc
