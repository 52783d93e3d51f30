#include <QStringList>

#include "device.h"

namespace slc {

QString Device::displayName() const
{
    QString name = model;
    if (name.isEmpty()) {
        name = properties.value("model");
    }
    if (name.isEmpty()) {
        name = serial;
    }

    if (manufacturer.isEmpty()) {
        return name;
    }

    // "samsung" -> "Samsung", "OnePlus" -> "Oneplus"
    QString maker = manufacturer.toLower();
    maker[0] = maker[0].toUpper();
    return QString("%1 %2").arg(maker, name).trimmed();
}

QString Device::modelOrSerial() const
{
    return model.isEmpty() ? serial : model;
}

QString Device::summary() const
{
    QStringList parts;
    if (!androidVersion.isEmpty()) {
        parts << QString("Android %1").arg(androidVersion);
    }
    if (!resolution.isEmpty()) {
        parts << resolution;
    }
    parts << serial;
    return parts.join(QString::fromUtf8("  ·  "));
}

bool Device::operator==(const Device& other) const
{
    return serial == other.serial
        && state == other.state
        && model == other.model
        && manufacturer == other.manufacturer
        && androidVersion == other.androidVersion
        && sdk == other.sdk
        && resolution == other.resolution
        && batteryPercent == other.batteryPercent
        && properties == other.properties;
}

QString deviceStateName(DeviceState state)
{
    switch (state) {
    case DeviceState::Device:
        return "device";
    case DeviceState::Unauthorized:
        return "unauthorized";
    }
    return "unknown";
}

} // namespace slc
