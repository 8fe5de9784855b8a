#pragma once
#include "upstream_sender.h"
#include "config/config_types.h"
#include "core/clock.h"
#include "proxy/transparent_router.h"
#include "registry/provider.h"
#include <QHash>
#include <QMutex>
#include <optional>

// Cheap health check of one candidate, sent before a full request is risked on
// it. Verdicts are cached per candidate for a short while.
class ProbeEngine {
public:
    ProbeEngine(UpstreamSender& sender, const Clock& clock, const ProbeOptions& options);

    void setOptions(const ProbeOptions& options);
    ProbeOptions options() const;

    // true / false when a verdict younger than the cache TTL exists.
    std::optional<bool> cachedVerdict(const CandidateId& id) const;

    // Sends the probe and caches the verdict. On success yields the observed latency.
    Result<qint64> probe(const RoutedRequest& routed, const Candidate& candidate,
                         const ExecOptions& baseOptions);

    void remember(const CandidateId& id, bool healthy);
    void forget(const CandidateId& id);
    void clear();

private:
    struct Verdict {
        bool healthy = false;
        qint64 at = 0;
    };

    UpstreamSender& m_sender;
    const Clock& m_clock;

    mutable QMutex m_mutex;
    ProbeOptions m_options;
    QHash<CandidateId, Verdict> m_cache;
};
