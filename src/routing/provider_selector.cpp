#include "provider_selector.h"
#include <algorithm>
#include <limits>
#include <tuple>

namespace {

qint64 latencyRank(const ProviderEndpoint& ep)
{
    return ep.urlLatencyMs < 0 ? std::numeric_limits<qint64>::max() : ep.urlLatencyMs;
}

}

CandidateSequence::CandidateSequence(QList<Candidate> eligible, QString activeGroup)
    : m_pool(std::move(eligible))
    , m_activeGroup(std::move(activeGroup))
{
    restart();
}

void CandidateSequence::restart()
{
    m_heap.clear();
    m_heap.reserve(m_pool.size());
    for (int i = 0; i < m_pool.size(); ++i)
        m_heap.push_back(i);
    std::make_heap(m_heap.begin(), m_heap.end(), [this](int a, int b) {
        return ProviderSelector::ranksBefore(m_pool[b], m_pool[a], m_activeGroup);
    });
}

std::optional<Candidate> CandidateSequence::next()
{
    if (m_heap.empty())
        return std::nullopt;
    std::pop_heap(m_heap.begin(), m_heap.end(), [this](int a, int b) {
        return ProviderSelector::ranksBefore(m_pool[b], m_pool[a], m_activeGroup);
    });
    const int index = m_heap.back();
    m_heap.pop_back();
    return m_pool[index];
}

QList<Candidate> CandidateSequence::toList() const
{
    CandidateSequence copy = *this;
    copy.restart();
    QList<Candidate> ordered;
    while (auto c = copy.next())
        ordered.append(*c);
    return ordered;
}

ProviderSelector::ProviderSelector(const ProviderRegistry& registry, const BreakerBoard& breakers,
                                   const Clock& clock)
    : m_registry(registry)
    , m_breakers(breakers)
    , m_clock(clock)
{
}

bool ProviderSelector::ranksBefore(const Candidate& a, const Candidate& b, const QString& activeGroup)
{
    const Provider& pa = a.provider;
    const Provider& pb = b.provider;
    const ProviderEndpoint& ea = a.endpoint();
    const ProviderEndpoint& eb = b.endpoint();

    const int affinityA = (!activeGroup.isEmpty() && pa.effectiveGroup() == activeGroup) ? 0 : 1;
    const int affinityB = (!activeGroup.isEmpty() && pb.effectiveGroup() == activeGroup) ? 0 : 1;
    if (affinityA != affinityB)
        return affinityA < affinityB;

    const int groupOrder = pa.effectiveGroup().compare(pb.effectiveGroup());
    if (groupOrder != 0)
        return groupOrder < 0;

    return std::forward_as_tuple(pa.rotationTier, ea.urlPriority, latencyRank(ea),
                                 pa.groupPriority, pa.usageCount, pa.lastUsedAt,
                                 pa.sortIndex, pa.id, a.endpointIndex)
         < std::forward_as_tuple(pb.rotationTier, eb.urlPriority, latencyRank(eb),
                                 pb.groupPriority, pb.usageCount, pb.lastUsedAt,
                                 pb.sortIndex, pb.id, b.endpointIndex);
}

CandidateSequence ProviderSelector::candidates(AppFamily family,
                                               const QSet<CandidateId>& exclude) const
{
    const qint64 now = m_clock.nowMs();
    QList<Candidate> eligible;
    for (const Provider& p : m_registry.snapshot(family)) {
        if (!p.enabled || p.isCoolingDown(now))
            continue;
        for (int i = 0; i < p.endpoints.size(); ++i) {
            Candidate c{p, i};
            if (c.endpoint().cooldownUntil > now)
                continue;
            const CandidateId id = c.id();
            if (exclude.contains(id) || m_breakers.isOpen(id))
                continue;
            eligible.append(std::move(c));
        }
    }
    return CandidateSequence(std::move(eligible), m_registry.activeGroup(family));
}
