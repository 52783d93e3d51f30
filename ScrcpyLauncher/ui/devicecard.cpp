#include <QDebug>
#include <QHBoxLayout>
#include <QLabel>
#include <QMouseEvent>
#include <QVBoxLayout>

#include "devicecard.h"
#include "launcherwindowconfig.h"

using namespace LauncherWindowConfig;

DeviceCard::DeviceCard(const slc::Device& device, QWidget* parent)
    : QFrame(parent)
    , m_device(device)
    , m_mirroring(false)
{
    setObjectName("deviceCard");
    setupUI();
    updateStyle();

    if (m_device.isAuthorized()) {
        setCursor(Qt::PointingHandCursor);
    }
}

void DeviceCard::setupUI()
{
    QHBoxLayout* layout = new QHBoxLayout(this);
    layout->setContentsMargins(16, 16, 16, 16);
    layout->setSpacing(12);

    QLabel* icon = new QLabel(QString::fromUtf8("\xF0\x9F\x93\xB1"));
    icon->setFixedSize(CARD_ICON_SIZE, CARD_ICON_SIZE);
    icon->setAlignment(Qt::AlignCenter);
    icon->setStyleSheet(QString("QLabel { background-color: %1; border-radius: 10px; font-size: 22px; }")
                            .arg(ACCENT_DIM));
    layout->addWidget(icon);

    // name + summary
    QVBoxLayout* textLayout = new QVBoxLayout();
    textLayout->setSpacing(2);

    QLabel* nameLabel = new QLabel(m_device.displayName());
    nameLabel->setStyleSheet(QString("QLabel { color: %1; font-size: 15px; font-weight: bold; background: transparent; }")
                                 .arg(TEXT_PRIMARY));
    QLabel* summaryLabel = new QLabel(m_device.summary());
    summaryLabel->setStyleSheet(QString("QLabel { color: %1; font-size: 12px; background: transparent; }")
                                    .arg(TEXT_SECONDARY));

    textLayout->addWidget(nameLabel);
    textLayout->addWidget(summaryLabel);
    layout->addLayout(textLayout, 1);

    QVBoxLayout* rightLayout = new QVBoxLayout();
    rightLayout->setSpacing(2);

    if (!m_device.isAuthorized()) {
        QLabel* status = new QLabel(QString::fromUtf8("\xE2\x9A\xA0 Unauthorized"));
        status->setAlignment(Qt::AlignRight);
        status->setStyleSheet(QString("QLabel { color: %1; font-size: 12px; font-weight: bold; background: transparent; }")
                                  .arg(YELLOW));
        QLabel* hint = new QLabel("Allow USB debugging");
        hint->setAlignment(Qt::AlignRight);
        hint->setStyleSheet(QString("QLabel { color: %1; font-size: 10px; background: transparent; }").arg(TEXT_MUTED));
        rightLayout->addWidget(status);
        rightLayout->addWidget(hint);
    } else {
        if (m_device.hasBattery()) {
            QLabel* battery = new QLabel(QString::fromUtf8("\xF0\x9F\x94\x8B %1%").arg(m_device.batteryPercent));
            battery->setAlignment(Qt::AlignRight);
            battery->setStyleSheet(QString("QLabel { color: %1; font-size: 13px; font-weight: bold; background: transparent; }")
                                       .arg(batteryColor(m_device.batteryPercent)));
            rightLayout->addWidget(battery);
        }
        QLabel* hint = new QLabel(QString::fromUtf8("Click to mirror \xE2\x86\x92"));
        hint->setAlignment(Qt::AlignRight);
        hint->setStyleSheet(QString("QLabel { color: %1; font-size: 11px; background: transparent; }").arg(TEXT_MUTED));
        rightLayout->addWidget(hint);
    }
    layout->addLayout(rightLayout);
}

void DeviceCard::setMirroring(bool mirroring)
{
    if (m_mirroring == mirroring) {
        return;
    }
    m_mirroring = mirroring;
    updateStyle();
}

QString DeviceCard::batteryColor(int percent)
{
    if (percent > BATTERY_HIGH_THRESHOLD) {
        return ACCENT;
    }
    if (percent > BATTERY_LOW_THRESHOLD) {
        return YELLOW;
    }
    return RED;
}

void DeviceCard::mousePressEvent(QMouseEvent* event)
{
    if (event->button() != Qt::LeftButton) {
        QFrame::mousePressEvent(event);
        return;
    }
    event->accept();

    if (!m_device.isAuthorized()) {
        qDebug() << "DeviceCard: Ignoring click on unauthorized device" << m_device.serial;
        return;
    }
    if (m_mirroring) {
        return;
    }
    setMirroring(true);
    emit clicked(m_device);
}

void DeviceCard::updateStyle()
{
    if (m_mirroring) {
        setStyleSheet(QString("QFrame#deviceCard { background-color: %1; border: 1px solid %2; border-radius: %3px; }")
                          .arg(BG_CARD_ACTIVE, ACCENT).arg(CARD_RADIUS));
    } else {
        setStyleSheet(QString("QFrame#deviceCard { background-color: %1; border: 1px solid %2; border-radius: %3px; }"
                              "QFrame#deviceCard:hover { background-color: %4; border-color: %5; }")
                          .arg(BG_CARD, BORDER).arg(CARD_RADIUS).arg(BG_CARD_HOVER, ACCENT_DIM));
    }
}
