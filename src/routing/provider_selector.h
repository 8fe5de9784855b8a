#pragma once
#include "circuit_breaker.h"
#include "core/clock.h"
#include "registry/provider_registry.h"
#include <QSet>
#include <QList>
#include <optional>
#include <vector>

// Candidates in ranking order, produced on demand from a heap built over a
// fresh registry snapshot. restart() replays the same order.
class CandidateSequence {
public:
    CandidateSequence() = default;
    CandidateSequence(QList<Candidate> eligible, QString activeGroup);

    std::optional<Candidate> next();
    void restart();
    bool isEmpty() const { return m_pool.isEmpty(); }
    int size() const { return m_pool.size(); }

    // Drains a copy of the sequence.
    QList<Candidate> toList() const;

private:
    QList<Candidate> m_pool;
    QString m_activeGroup;
    std::vector<int> m_heap;
};

class ProviderSelector {
public:
    ProviderSelector(const ProviderRegistry& registry, const BreakerBoard& breakers,
                     const Clock& clock);

    CandidateSequence candidates(AppFamily family,
                                 const QSet<CandidateId>& exclude = {}) const;

    // Strict weak ordering over the nine ranking criteria, with provider id
    // and endpoint position as the last resort for a total order.
    static bool ranksBefore(const Candidate& a, const Candidate& b, const QString& activeGroup);

private:
    const ProviderRegistry& m_registry;
    const BreakerBoard& m_breakers;
    const Clock& m_clock;
};
