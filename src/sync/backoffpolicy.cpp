#include "backoffpolicy.h"

#include <QRandomGenerator>
#include <QDebug>

namespace BridgeSync {

BackoffPolicy::BackoffPolicy(int baseDelayMs, int maxAttempts)
    : m_baseDelayMs(qMax(0, baseDelayMs))
    , m_maxAttempts(qMax(0, maxAttempts))
{
}

void BackoffPolicy::setJitterRatio(double ratio)
{
    m_jitterRatio = qBound(0.0, ratio, 1.0);
}

qint64 BackoffPolicy::delayFor(int attempt) const
{
    if (attempt < 1 || attempt > m_maxAttempts) {
        return -1;
    }
    return qint64(m_baseDelayMs) * attempt;
}

qint64 BackoffPolicy::nextDelayMs()
{
    if (!canRetry()) {
        qDebug() << "[BackoffPolicy] Exhausted after" << m_attempt << "attempts";
        return -1;
    }

    m_attempt++;
    qint64 delay = delayFor(m_attempt);

    if (m_jitterRatio > 0.0 && delay > 0) {
        const qint64 maxJitter = qint64(delay * m_jitterRatio);
        if (maxJitter > 0) {
            delay += QRandomGenerator::global()->bounded(maxJitter + 1);
        }
    }

    return delay;
}

} // namespace BridgeSync
