#ifndef LAUNCHERWINDOW_H
#define LAUNCHERWINDOW_H

#include <QMap>
#include <QPointer>
#include <QWidget>

#include "LauncherCore.h"
#include "devicesnapshot.h"

class QCloseEvent;
class QHBoxLayout;
class QLabel;
class QPushButton;
class QScrollArea;
class QVBoxLayout;
class DeviceCard;

namespace slc {
class AppContext;
class MirrorSessionManager;
class PollingLoop;
}

/**
 * @brief LauncherWindow - device list and mirror launcher
 *
 * Pure consumer of PollingLoop and MirrorSessionManager events: the card list
 * is rebuilt on every deviceListChanged, card highlights follow the session
 * lifecycle and install progress is shown in the status line at the bottom.
 */
class LauncherWindow : public QWidget
{
    Q_OBJECT

public:
    explicit LauncherWindow(slc::AppContext* context, QWidget* parent = nullptr);
    ~LauncherWindow() override;

    void start();

public slots:
    // Stops polling, terminates mirror processes, drains workers. Safe to call repeatedly.
    void cleanupAndExit();

protected:
    void closeEvent(QCloseEvent* event) override;

private slots:
    void onDeviceListChanged(const slc::DeviceSnapshot& snapshot, const slc::SnapshotDiff& diff);
    void onDeviceCountChanged(int count);
    void onBridgeUnavailable();
    void onToolStatusChanged(bool adbFound, bool scrcpyFound);

    void onCardClicked(const slc::Device& device);
    void onSessionStarted(const QString& serial);
    void onSessionStatus(const QString& serial, slc::SessionStatus status);
    void onSessionBusy(const QString& serial);
    void onSessionError(const QString& serial, slc::ToolError error, const QString& message);
    void onSessionEnded(const QString& serial);

    void onRefreshClicked();
    void onUsbDriverClicked();

private:
    void setupUI();
    QWidget* createHeader();
    QWidget* createStatusRow();

    void rebuildCards(const slc::DeviceSnapshot& snapshot);
    void clearCards();
    void showEmptyState();
    void buildEmptyState();
    void updateBadge(QLabel* badge, const QString& name, bool found);
    void setInstallStatus(const QString& text, const QString& color);
    void showInstallResult(bool success);
    void showToast(const QString& message, const QString& color);
    void showUsbDriverDialog(bool install);

    QString nameFor(const QString& serial) const;

    slc::AppContext* m_context;
    slc::PollingLoop* m_pollingLoop;
    slc::MirrorSessionManager* m_sessionManager;

    QVBoxLayout* m_mainLayout;
    QPushButton* m_refreshBtn;
    QPushButton* m_usbDriverBtn;
    QLabel* m_adbBadge;
    QLabel* m_scrcpyBadge;
    QLabel* m_versionLabel;
    QLabel* m_deviceCountLabel;
    QScrollArea* m_scrollArea;
    QWidget* m_listWidget;
    QVBoxLayout* m_listLayout;
    QWidget* m_emptyWidget;
    QLabel* m_installStatusLabel;
    QPointer<QLabel> m_toast;

    QMap<QString, QPointer<DeviceCard>> m_cards;
    QString m_zadigPath;

    bool m_adbFound;
    bool m_scrcpyFound;
    bool m_isShuttingDown;
};

#endif // LAUNCHERWINDOW_H
