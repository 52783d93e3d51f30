#ifndef DEVICE_H
#define DEVICE_H

#include <QMap>
#include <QMetaType>
#include <QString>

namespace slc {

enum class DeviceState {
    Device,        // authorized, properties were queried
    Unauthorized   // USB debugging not yet allowed on the phone
};

/**
 * @brief Device - one bridge-visible Android device
 *
 * Built fresh on every poll cycle and never mutated afterwards.
 * Property fields are only filled for DeviceState::Device.
 */
struct Device {
    QString serial;
    DeviceState state = DeviceState::Device;

    QString model;
    QString manufacturer;
    QString androidVersion;
    QString sdk;
    QString resolution;
    int batteryPercent = -1;   // -1: unknown

    // key:value tokens from the `devices -l` line (product, model, transport_id...)
    QMap<QString, QString> properties;

    bool isAuthorized() const { return state == DeviceState::Device; }
    bool hasBattery() const { return batteryPercent >= 0; }

    QString displayName() const;
    QString modelOrSerial() const;
    QString summary() const;

    bool operator==(const Device& other) const;
    bool operator!=(const Device& other) const { return !(*this == other); }
};

QString deviceStateName(DeviceState state);

} // namespace slc

Q_DECLARE_METATYPE(slc::Device)

#endif // DEVICE_H
