#ifndef DEVICEPOLLTASK_H
#define DEVICEPOLLTASK_H

#include <QObject>
#include <QRunnable>

#include "bridgeclient.h"
#include "devicesnapshot.h"

namespace slc {

/**
 * @brief DevicePollTask - QRunnable running one blocking device listing
 *
 * Executed on the PollingLoop's thread pool so adb never blocks the UI
 * thread. The result travels back through pollFinished(), which the loop
 * connects with Qt::QueuedConnection.
 */
class DevicePollTask : public QObject, public QRunnable
{
    Q_OBJECT

public:
    DevicePollTask(const BridgeClient& client, quint64 cycle, QObject* parent = nullptr);
    ~DevicePollTask() override;

    void run() override;

    quint64 cycle() const { return m_cycle; }

signals:
    void pollFinished(quint64 cycle, const slc::DeviceSnapshot& snapshot);

private:
    BridgeClient m_client;
    quint64 m_cycle;
};

} // namespace slc

#endif // DEVICEPOLLTASK_H
