#pragma once
#include "probe_engine.h"
#include "upstream_sender.h"
#include "core/clock.h"
#include "proxy/transparent_router.h"
#include "registry/provider_registry.h"
#include "routing/circuit_breaker.h"
#include "routing/cooldown_manager.h"
#include "routing/provider_selector.h"
#include <QMap>
#include <QMutex>
#include <optional>

struct DispatchOptions {
    int maxAttempts = 6;
    int maxRetries = 0;       // same candidate, before failing over
    int connectionTimeoutMs = 30000;
    int requestTimeoutMs = 600000;
    int streamIdleTimeoutMs = 60000;
    bool probeEnabled = true;
    QMap<AppFamily, RewriteRules> rules;
};

struct AttemptRecord {
    CandidateId candidate;
    QString stage;            // "full", "probe" or "probe_cached"
    DomainFailure failure;
};

struct DispatchOutcome {
    std::optional<ProviderResponse> response;
    std::optional<DomainFailure> failure;
    std::optional<AppFamily> family;
    QString providerId;
    QList<AttemptRecord> attempts;

    bool ok() const { return response.has_value() && !failure.has_value(); }
    int httpStatus() const;
    // JSON error document; lists the attempts when the candidates ran out.
    QByteArray errorBody() const;
};

// Drives one inbound request through classification, candidate selection,
// sending and failover until it succeeds or the candidates run out.
class RequestDispatcher {
public:
    enum class State : quint8 {
        Classify, SelectCandidate, ProbeNext, Send, RecordFailure, Done
    };

    RequestDispatcher(ProviderRegistry& registry, BreakerBoard& breakers,
                      CooldownManager& cooldowns, const ProviderSelector& selector,
                      ProbeEngine& probes, const UpstreamSender& sender,
                      const TransparentRouter& router, const Clock& clock);

    void setOptions(const DispatchOptions& options);
    DispatchOptions options() const;

    DispatchOutcome dispatch(const InboundRequest& request, const CancelToken& cancel = {},
                             IResponseSink* sink = nullptr) const;

private:
    ExecOptions execOptions(const DispatchOptions& opts, const CancelToken& cancel,
                            IResponseSink* sink) const;
    void onSuccess(AppFamily family, const Candidate& candidate, const ProviderResponse& response) const;
    void onFailure(const Candidate& candidate, const DomainFailure& failure) const;
    // False when the caller went away during the wait.
    bool waitBeforeRetry(int retry, const CancelToken& cancel) const;

    static bool retriesSameCandidate(const DomainFailure& failure);
    static qint64 backoffMs(int retry);

    ProviderRegistry& m_registry;
    BreakerBoard& m_breakers;
    CooldownManager& m_cooldowns;
    const ProviderSelector& m_selector;
    ProbeEngine& m_probes;
    const UpstreamSender& m_sender;
    const TransparentRouter& m_router;
    const Clock& m_clock;

    mutable QMutex m_optionsMutex;
    DispatchOptions m_options;
};
