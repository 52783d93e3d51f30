#include <QApplication>
#include <QCloseEvent>
#include <QDebug>
#include <QHBoxLayout>
#include <QLabel>
#include <QMessageBox>
#include <QPushButton>
#include <QScrollArea>
#include <QTimer>
#include <QVBoxLayout>

#include "appcontext.h"
#include "devicecard.h"
#include "launcherwindow.h"
#include "launcherwindowconfig.h"
#include "mirrorsessionmanager.h"
#include "pollingloop.h"
#include "usbdriverhelper.h"

using namespace LauncherWindowConfig;

LauncherWindow::LauncherWindow(slc::AppContext* context, QWidget* parent)
    : QWidget(parent)
    , m_context(context)
    , m_pollingLoop(new slc::PollingLoop(context, this))
    , m_sessionManager(new slc::MirrorSessionManager(context, this))
    , m_mainLayout(nullptr)
    , m_refreshBtn(nullptr)
    , m_usbDriverBtn(nullptr)
    , m_adbBadge(nullptr)
    , m_scrcpyBadge(nullptr)
    , m_versionLabel(nullptr)
    , m_deviceCountLabel(nullptr)
    , m_scrollArea(nullptr)
    , m_listWidget(nullptr)
    , m_listLayout(nullptr)
    , m_emptyWidget(nullptr)
    , m_installStatusLabel(nullptr)
    , m_adbFound(context->hasAdb())
    , m_scrcpyFound(context->hasScrcpy())
    , m_isShuttingDown(false)
{
    m_zadigPath = UsbDriverHelper::findZadig(m_context->config().toolsDir);

    setupUI();
    setWindowTitle("Android Mirror & APK Installer");
    setMinimumSize(MIN_WINDOW_WIDTH, MIN_WINDOW_HEIGHT);
    resize(DEFAULT_WINDOW_WIDTH, DEFAULT_WINDOW_HEIGHT);

    connect(m_pollingLoop, &slc::PollingLoop::deviceListChanged, this, &LauncherWindow::onDeviceListChanged);
    connect(m_pollingLoop, &slc::PollingLoop::deviceCountChanged, this, &LauncherWindow::onDeviceCountChanged);
    connect(m_pollingLoop, &slc::PollingLoop::bridgeUnavailable, this, &LauncherWindow::onBridgeUnavailable);
    connect(m_pollingLoop, &slc::PollingLoop::toolStatusChanged, this, &LauncherWindow::onToolStatusChanged);

    connect(m_sessionManager, &slc::MirrorSessionManager::sessionStarted, this, &LauncherWindow::onSessionStarted);
    connect(m_sessionManager, &slc::MirrorSessionManager::sessionStatus, this, &LauncherWindow::onSessionStatus);
    connect(m_sessionManager, &slc::MirrorSessionManager::sessionBusy, this, &LauncherWindow::onSessionBusy);
    connect(m_sessionManager, &slc::MirrorSessionManager::sessionError, this, &LauncherWindow::onSessionError);
    connect(m_sessionManager, &slc::MirrorSessionManager::sessionEnded, this, &LauncherWindow::onSessionEnded);

    connect(qApp, &QApplication::aboutToQuit, this, &LauncherWindow::cleanupAndExit);
}

LauncherWindow::~LauncherWindow()
{
    if (!m_isShuttingDown) {
        cleanupAndExit();
    }
}

void LauncherWindow::start()
{
    qInfo() << "LauncherWindow: Starting device polling";
    showEmptyState();
    m_pollingLoop->start();
}

void LauncherWindow::setupUI()
{
    setStyleSheet(QString("LauncherWindow { background-color: %1; }").arg(BG_DARK));
    setAttribute(Qt::WA_StyledBackground, true);

    m_mainLayout = new QVBoxLayout(this);
    m_mainLayout->setContentsMargins(CONTENT_MARGIN, CONTENT_MARGIN, CONTENT_MARGIN, 16);
    m_mainLayout->setSpacing(12);

    m_mainLayout->addWidget(createHeader());
    m_mainLayout->addWidget(createStatusRow());

    QFrame* separator = new QFrame();
    separator->setFixedHeight(1);
    separator->setStyleSheet(QString("QFrame { background-color: %1; border: none; }").arg(BORDER));
    m_mainLayout->addWidget(separator);

    // device list
    m_scrollArea = new QScrollArea();
    m_scrollArea->setWidgetResizable(true);
    m_scrollArea->setHorizontalScrollBarPolicy(Qt::ScrollBarAlwaysOff);
    m_scrollArea->setFrameShape(QFrame::NoFrame);
    m_scrollArea->setStyleSheet("QScrollArea { background: transparent; }");

    m_listWidget = new QWidget();
    m_listWidget->setStyleSheet("background: transparent;");
    m_listLayout = new QVBoxLayout(m_listWidget);
    m_listLayout->setContentsMargins(0, 0, 0, 0);
    m_listLayout->setSpacing(CARD_SPACING);

    m_emptyWidget = new QWidget();
    m_listLayout->addWidget(m_emptyWidget);
    m_listLayout->addStretch();

    m_scrollArea->setWidget(m_listWidget);
    m_mainLayout->addWidget(m_scrollArea, 1);

    // install status line
    m_installStatusLabel = new QLabel();
    m_installStatusLabel->setAlignment(Qt::AlignCenter);
    m_installStatusLabel->setFixedHeight(36);
    setInstallStatus(QString(), TEXT_MUTED);
    m_mainLayout->addWidget(m_installStatusLabel);
}

QWidget* LauncherWindow::createHeader()
{
    QWidget* header = new QWidget();
    QHBoxLayout* layout = new QHBoxLayout(header);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(8);

    QLabel* title = new QLabel("Android Mirror & APK Installer");
    title->setStyleSheet(QString("QLabel { color: %1; font-size: 22px; font-weight: bold; }").arg(TEXT_PRIMARY));
    layout->addWidget(title);
    layout->addStretch();

    const QString buttonStyle = QString("QPushButton { background: transparent; color: %1; border: 1px solid %2;"
                                        " border-radius: 6px; padding: 6px 12px; font-size: 12px; }"
                                        "QPushButton:hover { background-color: %3; }")
                                    .arg(TEXT_SECONDARY, BORDER, BG_CARD_HOVER);

#ifdef Q_OS_WIN
    if (!m_zadigPath.isEmpty()) {
        m_usbDriverBtn = new QPushButton(QString::fromUtf8("\xF0\x9F\x94\xA7 USB Driver"));
        m_usbDriverBtn->setStyleSheet(buttonStyle);
        connect(m_usbDriverBtn, &QPushButton::clicked, this, &LauncherWindow::onUsbDriverClicked);
        layout->addWidget(m_usbDriverBtn);
    }
#endif

    m_refreshBtn = new QPushButton(QString::fromUtf8("\xE2\x9F\xB3  Refresh"));
    m_refreshBtn->setStyleSheet(buttonStyle);
    connect(m_refreshBtn, &QPushButton::clicked, this, &LauncherWindow::onRefreshClicked);
    layout->addWidget(m_refreshBtn);

    return header;
}

QWidget* LauncherWindow::createStatusRow()
{
    QWidget* row = new QWidget();
    QHBoxLayout* layout = new QHBoxLayout(row);
    layout->setContentsMargins(0, 0, 0, 0);
    layout->setSpacing(16);

    m_adbBadge = new QLabel();
    m_scrcpyBadge = new QLabel();
    updateBadge(m_adbBadge, "ADB", m_adbFound);
    updateBadge(m_scrcpyBadge, "scrcpy", m_scrcpyFound);
    layout->addWidget(m_adbBadge);
    layout->addWidget(m_scrcpyBadge);
    layout->addStretch();

    m_versionLabel = new QLabel(QString("v%1").arg(SLC_VERSION));
    m_versionLabel->setStyleSheet(QString("QLabel { color: %1; font-size: 11px; }").arg(TEXT_MUTED));
    layout->addWidget(m_versionLabel);

    m_deviceCountLabel = new QLabel();
    m_deviceCountLabel->setStyleSheet(QString("QLabel { color: %1; font-size: 12px; }").arg(ACCENT));
    layout->addWidget(m_deviceCountLabel);

    return row;
}

void LauncherWindow::updateBadge(QLabel* badge, const QString& name, bool found)
{
    const QString color = found ? ACCENT : RED;
    const QString mark = found ? QString::fromUtf8("\xE2\x9C\x93") : QString::fromUtf8("\xE2\x9C\x97");
    badge->setText(QString("<span style=\"color:%1\">\xE2\x97\x8F</span>&nbsp;%2 %3").arg(color, name, mark));
    badge->setStyleSheet(QString("QLabel { color: %1; font-size: 12px; }").arg(TEXT_SECONDARY));
}

// ============================================================================
// Polling events
// ============================================================================

void LauncherWindow::onDeviceListChanged(const slc::DeviceSnapshot& snapshot, const slc::SnapshotDiff& diff)
{
    qInfo() << "LauncherWindow: Rebuilding device list," << snapshot.count() << "devices"
            << "(+" << diff.added.size() << "/-" << diff.removed.size() << ")";
    rebuildCards(snapshot);
}

void LauncherWindow::onDeviceCountChanged(int count)
{
    if (count == 0) {
        m_deviceCountLabel->setText(QString());
    } else if (count == 1) {
        m_deviceCountLabel->setText("1 device");
    } else {
        m_deviceCountLabel->setText(QString("%1 devices").arg(count));
    }
}

void LauncherWindow::onBridgeUnavailable()
{
    if (!m_cards.isEmpty() || m_emptyWidget->isHidden()) {
        clearCards();
        showEmptyState();
    }
}

void LauncherWindow::onToolStatusChanged(bool adbFound, bool scrcpyFound)
{
    if (adbFound == m_adbFound && scrcpyFound == m_scrcpyFound) {
        return;
    }
    qInfo() << "LauncherWindow: Tool status changed, adb:" << adbFound << "scrcpy:" << scrcpyFound;
    m_adbFound = adbFound;
    m_scrcpyFound = scrcpyFound;
    updateBadge(m_adbBadge, "ADB", adbFound);
    updateBadge(m_scrcpyBadge, "scrcpy", scrcpyFound);

    if (m_cards.isEmpty()) {
        showEmptyState();
    }
}

void LauncherWindow::rebuildCards(const slc::DeviceSnapshot& snapshot)
{
    clearCards();

    if (snapshot.isEmpty()) {
        showEmptyState();
        return;
    }
    m_emptyWidget->hide();

    int index = 0;
    for (const slc::Device& device : snapshot.devices()) {
        DeviceCard* card = new DeviceCard(device);
        card->setMirroring(m_sessionManager->isActive(device.serial));
        connect(card, &DeviceCard::clicked, this, &LauncherWindow::onCardClicked);
        // index 0 is the empty state widget
        m_listLayout->insertWidget(1 + index, card);
        m_cards.insert(device.serial, card);
        ++index;
    }
}

void LauncherWindow::clearCards()
{
    for (auto it = m_cards.begin(); it != m_cards.end(); ++it) {
        if (!it.value().isNull()) {
            m_listLayout->removeWidget(it.value());
            it.value()->deleteLater();
        }
    }
    m_cards.clear();
}

void LauncherWindow::showEmptyState()
{
    buildEmptyState();
    m_emptyWidget->show();
}

void LauncherWindow::buildEmptyState()
{
    // replace the old contents by re-creating the widget in place
    QWidget* fresh = new QWidget();
    delete m_listLayout->replaceWidget(m_emptyWidget, fresh);
    m_emptyWidget->deleteLater();
    m_emptyWidget = fresh;

    QVBoxLayout* layout = new QVBoxLayout(m_emptyWidget);
    layout->setContentsMargins(0, 60, 0, 0);
    layout->setSpacing(8);
    layout->setAlignment(Qt::AlignHCenter | Qt::AlignTop);

    QString icon;
    QString title;
    QString description;
    bool offerDriver = false;

    if (!m_adbFound) {
        icon = QString::fromUtf8("\xE2\x9A\x99");
        title = "ADB Not Found";
        description = QString("Expected at:\n%1\n\nSee README.md for setup instructions.")
                          .arg(slc::AppContext::expectedAdbLocation());
    } else if (!m_scrcpyFound) {
        icon = QString::fromUtf8("\xF0\x9F\x96\xA5");
        title = "scrcpy Not Found";
        description = QString("Expected at:\n%1\n\nSee README.md for setup instructions.")
                          .arg(slc::AppContext::expectedScrcpyLocation());
    } else {
        icon = QString::fromUtf8("\xF0\x9F\x93\xB2");
        title = "No Devices Connected";
        description = "Connect your Android device via USB and\nenable USB Debugging in Developer Options.";
        offerDriver = !m_zadigPath.isEmpty();
    }

    QLabel* iconLabel = new QLabel(icon);
    iconLabel->setAlignment(Qt::AlignCenter);
    iconLabel->setStyleSheet(QString("QLabel { color: %1; font-size: 48px; }").arg(TEXT_MUTED));
    QLabel* titleLabel = new QLabel(title);
    titleLabel->setAlignment(Qt::AlignCenter);
    titleLabel->setStyleSheet(QString("QLabel { color: %1; font-size: 18px; font-weight: bold; }").arg(TEXT_SECONDARY));
    QLabel* descLabel = new QLabel(description);
    descLabel->setAlignment(Qt::AlignCenter);
    descLabel->setStyleSheet(QString("QLabel { color: %1; font-size: 13px; }").arg(TEXT_MUTED));

    layout->addWidget(iconLabel);
    layout->addWidget(titleLabel);
    layout->addWidget(descLabel);

    if (offerDriver) {
        QLabel* hint = new QLabel("Device not detected? Try fixing the USB driver:");
        hint->setAlignment(Qt::AlignCenter);
        hint->setStyleSheet(QString("QLabel { color: %1; font-size: 11px; margin-top: 20px; }").arg(TEXT_MUTED));
        layout->addWidget(hint);

        QHBoxLayout* buttons = new QHBoxLayout();
        buttons->addStretch();
        QPushButton* installBtn = new QPushButton(QString::fromUtf8("\xE2\x9A\xA1 Install USB Driver"));
        installBtn->setStyleSheet(QString("QPushButton { background-color: %1; color: %2; border: none; border-radius: 6px;"
                                          " padding: 6px 12px; font-size: 12px; font-weight: bold; }")
                                      .arg(BLUE, TEXT_PRIMARY));
        connect(installBtn, &QPushButton::clicked, this, [this]() { showUsbDriverDialog(true); });
        buttons->addWidget(installBtn);

        if (UsbDriverHelper::isWindows11()) {
            QPushButton* restoreBtn = new QPushButton(QString::fromUtf8("\xE2\x86\xA9 Restore Default Driver"));
            restoreBtn->setStyleSheet(QString("QPushButton { background: transparent; color: %1; border: 1px solid %2;"
                                              " border-radius: 6px; padding: 6px 12px; font-size: 12px; }")
                                          .arg(TEXT_SECONDARY, BORDER));
            connect(restoreBtn, &QPushButton::clicked, this, [this]() { showUsbDriverDialog(false); });
            buttons->addWidget(restoreBtn);
        }
        buttons->addStretch();
        layout->addLayout(buttons);
    }
}

// ============================================================================
// Sessions
// ============================================================================

void LauncherWindow::onCardClicked(const slc::Device& device)
{
    if (m_isShuttingDown) {
        return;
    }
    qInfo() << "LauncherWindow: Mirror requested for" << device.serial;
    m_sessionManager->launch(device);
}

void LauncherWindow::onSessionStarted(const QString& serial)
{
    showToast(QString::fromUtf8("Launching mirror for %1\xE2\x80\xA6").arg(nameFor(serial)), ACCENT);
}

void LauncherWindow::onSessionStatus(const QString& serial, slc::SessionStatus status)
{
    Q_UNUSED(serial);
    switch (status) {
    case slc::SessionStatus::Installing:
        setInstallStatus("Installing...", YELLOW);
        break;
    case slc::SessionStatus::InstallSuccess:
        setInstallStatus("Success!", ACCENT);
        showInstallResult(true);
        break;
    case slc::SessionStatus::InstallFailure:
        setInstallStatus("Failed!", RED);
        showInstallResult(false);
        break;
    case slc::SessionStatus::Idle:
        setInstallStatus(QString(), TEXT_MUTED);
        break;
    }
}

void LauncherWindow::onSessionBusy(const QString& serial)
{
    showToast(QString("Already mirroring %1").arg(nameFor(serial)), YELLOW);
    // the live session keeps running; only the highlight from this click is undone
    QPointer<DeviceCard> card = m_cards.value(serial);
    if (card && !m_sessionManager->isActive(serial)) {
        card->setMirroring(false);
    }
}

void LauncherWindow::onSessionError(const QString& serial, slc::ToolError error, const QString& message)
{
    qWarning() << "LauncherWindow: Session error for" << serial << slc::toolErrorName(error) << message;
    if (error == slc::ToolError::ToolNotFound) {
        showToast(message, RED);
    } else {
        showToast(QString("Error: %1").arg(message), RED);
    }
}

void LauncherWindow::onSessionEnded(const QString& serial)
{
    QPointer<DeviceCard> card = m_cards.value(serial);
    if (card) {
        card->setMirroring(false);
    }
}

void LauncherWindow::setInstallStatus(const QString& text, const QString& color)
{
    m_installStatusLabel->setText(text);
    m_installStatusLabel->setStyleSheet(QString("QLabel { background-color: %1; color: %2; border-radius: 8px;"
                                                " font-size: 12px; }")
                                            .arg(BG_CARD, color));
}

void LauncherWindow::showInstallResult(bool success)
{
    QMessageBox* box = new QMessageBox(success ? QMessageBox::Information : QMessageBox::Warning,
                                       "Installation Completed",
                                       success ? QString::fromUtf8("\xE2\x9C\x93 Success!") : QString::fromUtf8("\xE2\x9C\x97 Failed!"),
                                       QMessageBox::Ok, this);
    box->setAttribute(Qt::WA_DeleteOnClose);
    box->open();
}

void LauncherWindow::showToast(const QString& message, const QString& color)
{
    if (m_toast) {
        m_toast->deleteLater();
    }

    QLabel* toast = new QLabel(message, this);
    toast->setStyleSheet(QString("QLabel { background-color: %1; color: %2; border: 1px solid %2;"
                                 " border-radius: 8px; padding: 8px 16px; font-size: 13px; }")
                             .arg(BG_CARD, color));
    toast->adjustSize();
    toast->move((width() - toast->width()) / 2, height() - toast->height() - TOAST_BOTTOM_OFFSET);
    toast->raise();
    toast->show();
    m_toast = toast;

    QTimer::singleShot(TOAST_DURATION_MS, toast, &QLabel::deleteLater);
}

QString LauncherWindow::nameFor(const QString& serial) const
{
    const slc::DeviceSnapshot& snapshot = m_pollingLoop->snapshot();
    if (snapshot.contains(serial)) {
        return snapshot.device(serial).modelOrSerial();
    }
    return serial;
}

// ============================================================================
// Header actions
// ============================================================================

void LauncherWindow::onRefreshClicked()
{
    qDebug() << "LauncherWindow: Manual refresh";
    m_pollingLoop->pollNow();
}

void LauncherWindow::onUsbDriverClicked()
{
    const bool windows11 = UsbDriverHelper::isWindows11();

    QMessageBox box(this);
    box.setWindowTitle("USB Driver Options");
    box.setText(QString("Choose an action%1:").arg(windows11 ? " (Windows 11)" : ""));
    QPushButton* installBtn = box.addButton("Install WinUSB Driver", QMessageBox::AcceptRole);
    QPushButton* restoreBtn = box.addButton("Restore Default Driver", QMessageBox::ActionRole);
    box.addButton(QMessageBox::Cancel);
    box.exec();

    if (box.clickedButton() == installBtn) {
        showUsbDriverDialog(true);
    } else if (box.clickedButton() == restoreBtn) {
        showUsbDriverDialog(false);
    }
}

void LauncherWindow::showUsbDriverDialog(bool install)
{
    if (m_zadigPath.isEmpty()) {
        showToast("Zadig not found in tools/windows/", RED);
        return;
    }

    QMessageBox box(this);
    box.setWindowTitle("USB Driver Setup");
    box.setText(install ? "Install WinUSB Driver" : "Restore Default Driver");
    box.setInformativeText(install ? UsbDriverHelper::installInstructions() : UsbDriverHelper::restoreInstructions());
    QPushButton* openBtn = box.addButton("Open Zadig", QMessageBox::AcceptRole);
    box.addButton(QMessageBox::Cancel);
    box.exec();

    if (box.clickedButton() != openBtn) {
        return;
    }
    if (UsbDriverHelper::launchZadig(m_zadigPath)) {
        showToast("Zadig launched - follow the instructions", BLUE);
    } else {
        showToast("Failed to launch Zadig", RED);
    }
}

// ============================================================================
// Shutdown
// ============================================================================

void LauncherWindow::closeEvent(QCloseEvent* event)
{
    cleanupAndExit();
    event->accept();
}

void LauncherWindow::cleanupAndExit()
{
    if (m_isShuttingDown) {
        qDebug() << "LauncherWindow: Cleanup already in progress, skipping";
        return;
    }
    m_isShuttingDown = true;
    qInfo() << "LauncherWindow: Starting cleanup sequence...";

    m_pollingLoop->stop();
    m_sessionManager->shutdown();

    // an adb query may still be running: the listing plus property queries per device
    const int drainMs = m_pollingLoop->maxCycleDurationMs() + 1000;
    if (!m_pollingLoop->waitForDone(drainMs)) {
        qWarning() << "LauncherWindow: Device query still running after" << drainMs << "ms";
    }

    qInfo() << "LauncherWindow: Cleanup sequence completed";
}
