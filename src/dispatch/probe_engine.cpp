#include "probe_engine.h"
#include "core/log_manager.h"
#include <QElapsedTimer>

ProbeEngine::ProbeEngine(UpstreamSender& sender, const Clock& clock, const ProbeOptions& options)
    : m_sender(sender)
    , m_clock(clock)
    , m_options(options)
{
}

void ProbeEngine::setOptions(const ProbeOptions& options)
{
    QMutexLocker lock(&m_mutex);
    m_options = options;
}

ProbeOptions ProbeEngine::options() const
{
    QMutexLocker lock(&m_mutex);
    return m_options;
}

std::optional<bool> ProbeEngine::cachedVerdict(const CandidateId& id) const
{
    QMutexLocker lock(&m_mutex);
    auto it = m_cache.constFind(id);
    if (it == m_cache.cend())
        return std::nullopt;
    if (m_clock.nowMs() - it->at >= qint64(m_options.cacheTtlSeconds) * 1000)
        return std::nullopt;
    return it->healthy;
}

void ProbeEngine::remember(const CandidateId& id, bool healthy)
{
    QMutexLocker lock(&m_mutex);
    m_cache.insert(id, Verdict{healthy, m_clock.nowMs()});
}

void ProbeEngine::forget(const CandidateId& id)
{
    QMutexLocker lock(&m_mutex);
    m_cache.remove(id);
}

void ProbeEngine::clear()
{
    QMutexLocker lock(&m_mutex);
    m_cache.clear();
}

Result<qint64> ProbeEngine::probe(const RoutedRequest& routed, const Candidate& candidate,
                                  const ExecOptions& baseOptions)
{
    const ProbeOptions opts = options();
    const CandidateId id = candidate.id();

    ExecOptions execOptions = baseOptions;
    execOptions.sink = nullptr;
    execOptions.requestTimeoutMs = qMin(baseOptions.requestTimeoutMs, opts.timeoutMs);
    execOptions.connectionTimeoutMs = qMin(baseOptions.connectionTimeoutMs, opts.timeoutMs);

    QElapsedTimer timer;
    timer.start();
    const SendOutcome outcome = m_sender.send(TransparentRouter::buildProbe(routed, candidate, opts),
                                              execOptions);
    const qint64 elapsed = timer.elapsed();

    if (!outcome.ok()) {
        // A cancelled probe says nothing about the candidate.
        if (outcome.failure->kind != ErrorKind::Cancelled)
            remember(id, false);
        LOG_DEBUG(QStringLiteral("ProbeEngine: %1 failed: %2")
                      .arg(id.toString(), outcome.failure->message));
        return std::unexpected(*outcome.failure);
    }

    remember(id, true);
    const qint64 latency = outcome.response && outcome.response->headerLatencyMs >= 0
        ? outcome.response->headerLatencyMs : elapsed;
    LOG_DEBUG(QStringLiteral("ProbeEngine: %1 healthy in %2 ms").arg(id.toString()).arg(latency));
    return latency;
}
