#include <QDebug>
#include <QElapsedTimer>
#include <QThread>

#include "devicepolltask.h"

namespace slc {

DevicePollTask::DevicePollTask(const BridgeClient& client, quint64 cycle, QObject* parent)
    : QObject(parent)
    , m_client(client)
    , m_cycle(cycle)
{
    setAutoDelete(true); // QThreadPool deletes the task after run()
}

DevicePollTask::~DevicePollTask()
{
}

void DevicePollTask::run()
{
    qDebug() << "DevicePollTask: cycle" << m_cycle << "running in thread:" << QThread::currentThreadId();

    QElapsedTimer timer;
    timer.start();
    DeviceSnapshot snapshot(m_client.listDevices());

    qDebug() << "DevicePollTask: cycle" << m_cycle << "found" << snapshot.count()
             << "devices in" << timer.elapsed() << "ms";
    emit pollFinished(m_cycle, snapshot);
}

} // namespace slc
