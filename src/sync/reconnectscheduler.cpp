#include "reconnectscheduler.h"

#include <QDebug>

namespace BridgeSync {

ReconnectScheduler::ReconnectScheduler(const BackoffPolicy &policy, QObject *parent)
    : QObject(parent)
    , m_policy(policy)
{
    m_timer = new QTimer(this);
    m_timer->setSingleShot(true);
    connect(m_timer, &QTimer::timeout, this, &ReconnectScheduler::attemptReconnect);
}

ReconnectScheduler::~ReconnectScheduler()
{
    stop();
}

void ReconnectScheduler::setConnectFunction(ConnectFunction connect)
{
    m_connect = std::move(connect);
}

void ReconnectScheduler::connectionDropped()
{
    if (m_pending.load()) {
        return;  // Already scheduled
    }

    qDebug() << "[ReconnectScheduler] Connection dropped";
    scheduleNext();
}

void ReconnectScheduler::connectionEstablished()
{
    m_timer->stop();
    m_pending = false;
    m_policy.reset();
}

void ReconnectScheduler::stop()
{
    if (!m_pending.load()) {
        return;
    }

    m_pending = false;
    m_timer->stop();
    qDebug() << "[ReconnectScheduler] Stopped";
}

void ReconnectScheduler::scheduleNext()
{
    const qint64 delay = m_policy.nextDelayMs();
    if (delay < 0) {
        qWarning() << "[ReconnectScheduler] Max reconnect attempts reached. Giving up.";
        m_pending = false;
        emit gaveUp();
        return;
    }

    m_pending = true;
    qInfo() << "[ReconnectScheduler] Scheduling reconnect attempt" << m_policy.attempt()
            << "in" << delay << "ms";
    emit reconnecting(m_policy.attempt(), delay);
    m_timer->start(int(delay));
}

void ReconnectScheduler::attemptReconnect()
{
    if (!m_pending.load()) {
        return;
    }

    if (!m_connect) {
        qWarning() << "[ReconnectScheduler] No connect function set";
        m_pending = false;
        return;
    }

    const int attempt = m_policy.attempt();
    if (m_connect()) {
        qInfo() << "[ReconnectScheduler] Reconnected after" << attempt << "attempt(s)";
        connectionEstablished();
        emit reconnected();
        return;
    }

    qWarning() << "[ReconnectScheduler] Reconnect attempt" << attempt << "failed";
    emit attemptFailed(attempt);
    m_pending = false;
    scheduleNext();
}

} // namespace BridgeSync
