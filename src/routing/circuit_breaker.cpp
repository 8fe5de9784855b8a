#include "circuit_breaker.h"
#include "core/log_manager.h"
#include <QMutexLocker>
#include <QReadLocker>
#include <QWriteLocker>

QString breakerStateName(BreakerState state)
{
    switch (state) {
    case BreakerState::Closed:   return QStringLiteral("closed");
    case BreakerState::Open:     return QStringLiteral("open");
    case BreakerState::HalfOpen: return QStringLiteral("half_open");
    }
    return QStringLiteral("closed");
}

CircuitBreaker::CircuitBreaker(const BreakerOptions& options)
    : m_options(options)
{
}

BreakerState CircuitBreaker::state(qint64 nowMs) const
{
    QMutexLocker locker(&m_mutex);
    if (m_openedAt == 0)
        return BreakerState::Closed;
    const qint64 window = static_cast<qint64>(m_options.timeoutSeconds) * 1000;
    return nowMs - m_openedAt >= window ? BreakerState::HalfOpen : BreakerState::Open;
}

bool CircuitBreaker::shouldTrip() const
{
    if (m_consecutiveFailures >= qMax(1, m_options.failureThreshold))
        return true;
    if (m_options.errorRateThreshold > 0.0 && m_options.minRequests > 0
        && m_totalSinceClose >= m_options.minRequests) {
        const double rate = static_cast<double>(m_failedSinceClose) / m_totalSinceClose;
        return rate >= m_options.errorRateThreshold;
    }
    return false;
}

BreakerState CircuitBreaker::recordFailure(qint64 nowMs, bool* tripped)
{
    QMutexLocker locker(&m_mutex);
    ++m_consecutiveFailures;
    ++m_totalSinceClose;
    ++m_failedSinceClose;

    const bool wasOpen = m_openedAt != 0;
    if (tripped)
        *tripped = false;
    // A failure while open or half-open restarts the cool-off window.
    if (wasOpen || shouldTrip()) {
        m_openedAt = nowMs;
        if (tripped)
            *tripped = !wasOpen;
        return BreakerState::Open;
    }
    return BreakerState::Closed;
}

void CircuitBreaker::recordSuccess()
{
    QMutexLocker locker(&m_mutex);
    if (m_openedAt != 0) {
        m_openedAt = 0;
        m_totalSinceClose = 0;
        m_failedSinceClose = 0;
    } else {
        ++m_totalSinceClose;
    }
    m_consecutiveFailures = 0;
}

void CircuitBreaker::reset()
{
    QMutexLocker locker(&m_mutex);
    m_openedAt = 0;
    m_consecutiveFailures = 0;
    m_totalSinceClose = 0;
    m_failedSinceClose = 0;
}

void CircuitBreaker::setOptions(const BreakerOptions& options)
{
    QMutexLocker locker(&m_mutex);
    m_options = options;
}

int CircuitBreaker::consecutiveFailures() const
{
    QMutexLocker locker(&m_mutex);
    return m_consecutiveFailures;
}

qint64 CircuitBreaker::openedAt() const
{
    QMutexLocker locker(&m_mutex);
    return m_openedAt;
}

// ========================================================================
// BreakerBoard
// ========================================================================

BreakerBoard::BreakerBoard(const Clock& clock, const BreakerOptions& options)
    : m_clock(clock)
    , m_options(options)
{
}

std::shared_ptr<CircuitBreaker> BreakerBoard::find(const CandidateId& id) const
{
    QReadLocker locker(&m_lock);
    return m_breakers.value(id);
}

std::shared_ptr<CircuitBreaker> BreakerBoard::findOrCreate(const CandidateId& id)
{
    if (auto existing = find(id))
        return existing;

    QWriteLocker locker(&m_lock);
    auto& entry = m_breakers[id];
    if (!entry)
        entry = std::make_shared<CircuitBreaker>(m_options);
    return entry;
}

BreakerState BreakerBoard::state(const CandidateId& id) const
{
    auto breaker = find(id);
    return breaker ? breaker->state(m_clock.nowMs()) : BreakerState::Closed;
}

bool BreakerBoard::isOpen(const CandidateId& id) const
{
    return state(id) == BreakerState::Open;
}

BreakerState BreakerBoard::recordFailure(const CandidateId& id)
{
    auto breaker = findOrCreate(id);
    bool tripped = false;
    const BreakerState next = breaker->recordFailure(m_clock.nowMs(), &tripped);
    if (tripped) {
        LOG_WARNING(QStringLiteral("CircuitBreaker: opened for %1 after %2 consecutive failure(s)")
                        .arg(id.toString())
                        .arg(breaker->consecutiveFailures()));
    }
    return next;
}

void BreakerBoard::recordSuccess(const CandidateId& id)
{
    auto breaker = findOrCreate(id);
    const bool wasOpen = breaker->openedAt() != 0;
    breaker->recordSuccess();
    if (wasOpen)
        LOG_INFO(QStringLiteral("CircuitBreaker: closed for %1").arg(id.toString()));
}

void BreakerBoard::setOptions(const BreakerOptions& options)
{
    QWriteLocker locker(&m_lock);
    m_options = options;
    for (auto& breaker : m_breakers)
        breaker->setOptions(options);
}

void BreakerBoard::clear()
{
    QWriteLocker locker(&m_lock);
    m_breakers.clear();
}

int BreakerBoard::consecutiveFailures(const CandidateId& id) const
{
    auto breaker = find(id);
    return breaker ? breaker->consecutiveFailures() : 0;
}

int BreakerBoard::size() const
{
    QReadLocker locker(&m_lock);
    return m_breakers.size();
}
