#ifndef BACKOFFPOLICY_H
#define BACKOFFPOLICY_H

#include <QtGlobal>

namespace BridgeSync {

/**
 * @brief Linear retry/reconnect delay policy
 *
 * delay(attempt) = baseDelay * attempt, for attempt in 1..maxAttempts.
 * The attempt counter resets to zero after any successful operation.
 *
 * Shared by the periodic update checker and by reconnecting stream
 * collaborators. Optional jitter only ever adds to the linear delay,
 * so the expected delay stays non-decreasing across attempts.
 */
class BackoffPolicy
{
public:
    static const int DEFAULT_BASE_DELAY_MS = 3000;
    static const int DEFAULT_MAX_ATTEMPTS = 5;

    explicit BackoffPolicy(int baseDelayMs = DEFAULT_BASE_DELAY_MS,
                           int maxAttempts = DEFAULT_MAX_ATTEMPTS);

    int baseDelayMs() const { return m_baseDelayMs; }
    int maxAttempts() const { return m_maxAttempts; }

    /**
     * @brief Number of attempts consumed since the last reset
     */
    int attempt() const { return m_attempt; }

    /**
     * @brief Extra random delay as a fraction of the linear delay (0 disables)
     */
    void setJitterRatio(double ratio);
    double jitterRatio() const { return m_jitterRatio; }

    /**
     * @brief Pure delay function
     * @return baseDelayMs * attempt, or -1 when attempt is outside 1..maxAttempts
     */
    qint64 delayFor(int attempt) const;

    /**
     * @brief Check whether another attempt is allowed
     */
    bool canRetry() const { return m_attempt < m_maxAttempts; }

    /**
     * @brief Consume one attempt and return its delay
     * @return Delay in ms including jitter, or -1 when exhausted
     */
    qint64 nextDelayMs();

    /**
     * @brief Reset the attempt counter (call after any success)
     */
    void reset() { m_attempt = 0; }

private:
    int m_baseDelayMs;
    int m_maxAttempts;
    int m_attempt = 0;
    double m_jitterRatio = 0.0;
};

} // namespace BridgeSync

#endif // BACKOFFPOLICY_H
