#pragma once
#include "config/config_types.h"
#include "core/clock.h"
#include "registry/provider.h"
#include <QHash>
#include <QMutex>
#include <QReadWriteLock>
#include <memory>

enum class BreakerState : quint8 {
    Closed, Open, HalfOpen
};

QString breakerStateName(BreakerState state);

// State machine for one (provider, URL, key) triple.
class CircuitBreaker {
public:
    explicit CircuitBreaker(const BreakerOptions& options);

    BreakerState state(qint64 nowMs) const;
    // Open and still inside the cool-off window.
    bool isOpen(qint64 nowMs) const { return state(nowMs) == BreakerState::Open; }

    // tripped, when given, is set for the failure that moved Closed to Open.
    BreakerState recordFailure(qint64 nowMs, bool* tripped = nullptr);
    void recordSuccess();
    void reset();
    void setOptions(const BreakerOptions& options);

    int consecutiveFailures() const;
    qint64 openedAt() const;

private:
    bool shouldTrip() const;

    mutable QMutex m_mutex;
    BreakerOptions m_options;
    int m_consecutiveFailures = 0;
    int m_totalSinceClose = 0;
    int m_failedSinceClose = 0;
    qint64 m_openedAt = 0;   // 0 = closed
};

// Arena of breakers keyed by candidate. The map lock is only held to find or
// create an entry; transitions take the entry's own mutex.
class BreakerBoard {
public:
    BreakerBoard(const Clock& clock, const BreakerOptions& options);

    BreakerState state(const CandidateId& id) const;
    bool isOpen(const CandidateId& id) const;

    BreakerState recordFailure(const CandidateId& id);
    void recordSuccess(const CandidateId& id);
    int consecutiveFailures(const CandidateId& id) const;

    void setOptions(const BreakerOptions& options);
    void clear();
    int size() const;

private:
    std::shared_ptr<CircuitBreaker> find(const CandidateId& id) const;
    std::shared_ptr<CircuitBreaker> findOrCreate(const CandidateId& id);

    const Clock& m_clock;
    mutable QReadWriteLock m_lock;
    BreakerOptions m_options;
    QHash<CandidateId, std::shared_ptr<CircuitBreaker>> m_breakers;
};
