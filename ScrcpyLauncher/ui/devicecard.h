#ifndef DEVICECARD_H
#define DEVICECARD_H

#include <QFrame>

#include "device.h"

class QLabel;

/**
 * @brief DeviceCard - one row in the device list
 *
 * Clicking an authorized card highlights it and emits clicked(). The
 * highlight stays until setMirroring(false), which the window calls when
 * the session ends or is rejected as busy.
 */
class DeviceCard : public QFrame
{
    Q_OBJECT

public:
    explicit DeviceCard(const slc::Device& device, QWidget* parent = nullptr);

    const slc::Device& device() const { return m_device; }
    const QString& serial() const { return m_device.serial; }

    bool isMirroring() const { return m_mirroring; }
    void setMirroring(bool mirroring);

    static QString batteryColor(int percent);

signals:
    void clicked(const slc::Device& device);

protected:
    void mousePressEvent(QMouseEvent* event) override;

private:
    void setupUI();
    void updateStyle();

    slc::Device m_device;
    bool m_mirroring;
};

#endif // DEVICECARD_H
