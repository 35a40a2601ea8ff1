#ifndef RECONNECTSCHEDULER_H
#define RECONNECTSCHEDULER_H

#include <QObject>
#include <QTimer>
#include <atomic>
#include <functional>

#include "backoffpolicy.h"

namespace BridgeSync {

/**
 * @brief Schedules reconnect attempts for long-lived stream connections
 *
 * Streaming collaborators (live position, event streams) report a
 * dropped connection through connectionDropped(). The scheduler waits
 * for the BackoffPolicy delay, then calls the connect function. A
 * successful attempt resets the policy; running out of attempts emits
 * gaveUp() and stops.
 *
 * Lives on the thread of its owner; the connect function runs there.
 */
class ReconnectScheduler : public QObject
{
    Q_OBJECT

public:
    using ConnectFunction = std::function<bool()>;

    explicit ReconnectScheduler(const BackoffPolicy &policy = BackoffPolicy(),
                                QObject *parent = nullptr);
    ~ReconnectScheduler() override;

    /**
     * @brief Set the function that re-establishes the connection
     *
     * Must return true when the connection is up again.
     */
    void setConnectFunction(ConnectFunction connect);

    /**
     * @brief Check if a reconnect attempt is scheduled
     */
    bool isPending() const { return m_pending.load(); }

    /**
     * @brief Attempts consumed since the last successful connection
     */
    int attempt() const { return m_policy.attempt(); }

    const BackoffPolicy &policy() const { return m_policy; }

public slots:
    /**
     * @brief Report a dropped connection and schedule a reconnect
     */
    void connectionDropped();

    /**
     * @brief Report an established connection (resets the policy)
     */
    void connectionEstablished();

    /**
     * @brief Cancel any scheduled attempt
     */
    void stop();

signals:
    /**
     * @brief Emitted when an attempt is scheduled
     */
    void reconnecting(int attempt, qint64 delayMs);

    void reconnected();

    /**
     * @brief Emitted when an attempt did not bring the connection back
     */
    void attemptFailed(int attempt);

    /**
     * @brief Emitted when the policy ran out of attempts
     */
    void gaveUp();

private slots:
    void attemptReconnect();

private:
    void scheduleNext();

    QTimer *m_timer = nullptr;
    BackoffPolicy m_policy;
    ConnectFunction m_connect;
    std::atomic<bool> m_pending{false};
};

} // namespace BridgeSync

#endif // RECONNECTSCHEDULER_H
