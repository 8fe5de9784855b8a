#include "request_dispatcher.h"
#include "core/log_manager.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QSet>

namespace {

constexpr qint64 kBaseBackoffMs = 100;
constexpr qint64 kBackoffSliceMs = 50;

}

int DispatchOutcome::httpStatus() const
{
    if (failure)
        return failure->httpStatus();
    return response ? response->statusCode : 500;
}

QByteArray DispatchOutcome::errorBody() const
{
    if (!failure)
        return QByteArray();

    QJsonObject root = failure->toJson();
    if (failure->kind == ErrorKind::Exhausted) {
        QJsonArray list;
        for (const AttemptRecord& attempt : attempts) {
            QJsonObject item;
            item["provider_id"] = attempt.candidate.providerId;
            item["url"] = attempt.candidate.url;
            item["stage"] = attempt.stage;
            item["type"] = errorKindName(attempt.failure.kind);
            item["message"] = attempt.failure.message;
            if (attempt.failure.upstreamStatus > 0)
                item["upstream_status"] = attempt.failure.upstreamStatus;
            list.append(item);
        }
        QJsonObject err = root.value("error").toObject();
        err["attempts"] = list;
        root["error"] = err;
    }
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

RequestDispatcher::RequestDispatcher(ProviderRegistry& registry, BreakerBoard& breakers,
                                     CooldownManager& cooldowns, const ProviderSelector& selector,
                                     ProbeEngine& probes, const UpstreamSender& sender,
                                     const TransparentRouter& router, const Clock& clock)
    : m_registry(registry)
    , m_breakers(breakers)
    , m_cooldowns(cooldowns)
    , m_selector(selector)
    , m_probes(probes)
    , m_sender(sender)
    , m_router(router)
    , m_clock(clock)
{
}

void RequestDispatcher::setOptions(const DispatchOptions& options)
{
    QMutexLocker lock(&m_optionsMutex);
    m_options = options;
    m_options.maxAttempts = qMax(1, m_options.maxAttempts);
    m_options.maxRetries = qBound(0, m_options.maxRetries, kMaxSameCandidateRetries);
}

DispatchOptions RequestDispatcher::options() const
{
    QMutexLocker lock(&m_optionsMutex);
    return m_options;
}

ExecOptions RequestDispatcher::execOptions(const DispatchOptions& opts, const CancelToken& cancel,
                                           IResponseSink* sink) const
{
    ExecOptions exec;
    exec.connectionTimeoutMs = opts.connectionTimeoutMs;
    exec.requestTimeoutMs = opts.requestTimeoutMs;
    exec.streamIdleTimeoutMs = opts.streamIdleTimeoutMs;
    exec.cancel = cancel;
    exec.sink = sink;
    return exec;
}

void RequestDispatcher::onSuccess(AppFamily family, const Candidate& candidate,
                                  const ProviderResponse& response) const
{
    const CandidateId id = candidate.id();
    m_breakers.recordSuccess(id);
    m_registry.recordUsage(id.providerId, m_clock.nowMs());
    if (response.headerLatencyMs >= 0)
        m_registry.recordLatency(id.providerId, id.url, response.headerLatencyMs);
    const int cooled = m_cooldowns.recordSuccess(candidate);
    if (cooled > 0)
        LOG_INFO(QStringLiteral("Dispatcher: %1 URL(s) of group %2 put into cooldown")
                     .arg(cooled).arg(candidate.provider.effectiveGroup()));
    m_probes.remember(id, true);
    m_registry.setActiveProvider(family, id.providerId);
}

void RequestDispatcher::onFailure(const Candidate& candidate, const DomainFailure& failure) const
{
    if (!failure.countsAgainstCandidate())
        return;
    m_breakers.recordFailure(candidate.id());
    m_cooldowns.recordFailure(candidate);
}

bool RequestDispatcher::retriesSameCandidate(const DomainFailure& failure)
{
    // Timeouts, resets, 408 and 5xx map to NetworkFailure; 429 and overload to RateLimited.
    return failure.kind == ErrorKind::NetworkFailure || failure.kind == ErrorKind::RateLimited;
}

qint64 RequestDispatcher::backoffMs(int retry)
{
    return kBaseBackoffMs << qBound(0, retry - 1, kMaxSameCandidateRetries);
}

bool RequestDispatcher::waitBeforeRetry(int retry, const CancelToken& cancel) const
{
    qint64 remaining = backoffMs(retry);
    while (remaining > 0) {
        if (isCancelled(cancel))
            return false;
        const qint64 slice = qMin(remaining, kBackoffSliceMs);
        m_clock.sleepFor(slice);
        remaining -= slice;
    }
    return !isCancelled(cancel);
}

DispatchOutcome RequestDispatcher::dispatch(const InboundRequest& request, const CancelToken& cancel,
                                            IResponseSink* sink) const
{
    const DispatchOptions opts = options();
    DispatchOutcome outcome;

    State state = State::Classify;
    AppFamily family = AppFamily::Claude;
    RoutedRequest routed;
    std::optional<Candidate> current;
    DomainFailure lastFailure;
    QString lastStage;
    QSet<CandidateId> tried;
    bool afterFailure = false;

    // Every candidate passes through at most four states and same-candidate
    // retries stay inside Send; the guard only trips on a logic error.
    const int stepLimit = opts.maxAttempts * 4 + 4;
    int steps = 0;

    while (state != State::Done) {
        if (++steps > stepLimit) {
            LOG_ERROR(QStringLiteral("Dispatcher: %1 %2 exceeded %3 steps")
                          .arg(request.method, request.path).arg(stepLimit));
            outcome.failure = DomainFailure::internal(QStringLiteral("dispatch did not terminate"));
            break;
        }
        if (isCancelled(cancel)) {
            LOG_INFO(QStringLiteral("Dispatcher: caller went away during %1").arg(request.path));
            outcome.failure = DomainFailure::cancelled();
            break;
        }

        switch (state) {
        case State::Classify: {
            const auto classified = m_router.classify(request);
            if (!classified) {
                outcome.failure = classified.error();
                state = State::Done;
                break;
            }
            family = *classified;
            outcome.family = family;
            routed = m_router.rewrite(request, family, opts.rules.value(family));
            state = State::SelectCandidate;
            break;
        }

        case State::SelectCandidate: {
            current.reset();
            if (tried.size() < opts.maxAttempts) {
                CandidateSequence sequence = m_selector.candidates(family, tried);
                current = sequence.next();
            }
            if (!current) {
                const QString msg = tried.isEmpty()
                    ? QStringLiteral("no eligible %1 provider").arg(app_family::name(family))
                    : QStringLiteral("%1 candidate(s) tried for %2, none succeeded")
                          .arg(tried.size()).arg(app_family::name(family));
                LOG_WARNING(QStringLiteral("Dispatcher: exhausted, %1").arg(msg));
                outcome.failure = DomainFailure::exhausted(msg);
                state = State::Done;
                break;
            }
            tried.insert(current->id());
            state = (afterFailure && opts.probeEnabled) ? State::ProbeNext : State::Send;
            break;
        }

        case State::ProbeNext: {
            const CandidateId id = current->id();
            if (const auto cached = m_probes.cachedVerdict(id)) {
                if (*cached) {
                    state = State::Send;
                } else {
                    LOG_DEBUG(QStringLiteral("Dispatcher: skipping %1, probe failed recently").arg(id.toString()));
                    outcome.attempts.append({id, QStringLiteral("probe_cached"),
                                             DomainFailure::networkFailure(QStringLiteral("recent probe failed"))});
                    state = State::SelectCandidate;
                }
                break;
            }

            const auto probed = m_probes.probe(routed, *current, execOptions(opts, cancel, nullptr));
            if (probed) {
                m_registry.recordLatency(id.providerId, id.url, *probed);
                state = State::Send;
            } else if (probed.error().kind == ErrorKind::Cancelled) {
                outcome.failure = probed.error();
                state = State::Done;
            } else {
                lastFailure = probed.error();
                lastStage = QStringLiteral("probe");
                state = State::RecordFailure;
            }
            break;
        }

        case State::Send: {
            const ProviderRequest outgoing = TransparentRouter::bindCandidate(routed, *current);
            LOG_DEBUG(QStringLiteral("Dispatcher: %1 %2 -> %3")
                          .arg(outgoing.method, outgoing.url, current->id().toString()));
            SendOutcome sent = m_sender.send(outgoing, execOptions(opts, cancel, sink));
            for (int retry = 1; retry <= opts.maxRetries && sent.failure && retriesSameCandidate(*sent.failure);
                 ++retry) {
                LOG_INFO(QStringLiteral("Dispatcher: %1 on %2, retry %3/%4 in %5 ms")
                             .arg(errorKindName(sent.failure->kind), current->id().toString())
                             .arg(retry).arg(opts.maxRetries).arg(backoffMs(retry)));
                if (!waitBeforeRetry(retry, cancel))
                    break;
                sent = m_sender.send(outgoing, execOptions(opts, cancel, sink));
            }
            if (sent.ok() && sent.response) {
                onSuccess(family, *current, *sent.response);
                outcome.response = std::move(*sent.response);
                outcome.providerId = current->provider.id;
                state = State::Done;
            } else if (sent.failure && sent.failure->kind == ErrorKind::Cancelled) {
                outcome.failure = *sent.failure;
                state = State::Done;
            } else {
                lastFailure = sent.failure.value_or(
                    DomainFailure::internal(QStringLiteral("upstream returned no response")));
                lastStage = QStringLiteral("full");
                state = State::RecordFailure;
            }
            break;
        }

        case State::RecordFailure: {
            LOG_WARNING(QStringLiteral("Dispatcher: %1 attempt on %2 failed (%3): %4")
                            .arg(lastStage, current->id().toString(),
                                 errorKindName(lastFailure.kind), lastFailure.message));
            outcome.attempts.append({current->id(), lastStage, lastFailure});
            onFailure(*current, lastFailure);
            afterFailure = true;
            state = State::SelectCandidate;
            break;
        }

        case State::Done:
            break;
        }
    }

    return outcome;
}
