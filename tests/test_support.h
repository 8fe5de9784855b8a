#pragma once
#include "core/clock.h"
#include "registry/provider.h"
#include "registry/provider_repository.h"
#include "semantic/ports.h"
#include <QList>
#include <QMutex>
#include <QMutexLocker>
#include <QQueue>
#include <functional>

class ManualClock : public Clock {
public:
    explicit ManualClock(qint64 startMs = 1700000000000) : m_now(startMs) {}

    qint64 nowMs() const override
    {
        QMutexLocker locker(&m_mutex);
        return m_now;
    }
    void advance(qint64 ms)
    {
        QMutexLocker locker(&m_mutex);
        m_now += ms;
    }
    void set(qint64 ms)
    {
        QMutexLocker locker(&m_mutex);
        m_now = ms;
    }
    // Sleeping moves time forward instead of blocking.
    void sleepFor(qint64 ms) const override
    {
        QMutexLocker locker(&m_mutex);
        m_now += ms;
        m_slept += ms;
    }
    qint64 slept() const
    {
        QMutexLocker locker(&m_mutex);
        return m_slept;
    }

private:
    mutable QMutex m_mutex;
    mutable qint64 m_now;
    mutable qint64 m_slept = 0;
};

// Scripted upstream. A responder, when set, answers every request; otherwise
// queued results are handed out in order and an empty queue yields 200 {}.
class FakeExecutor : public IExecutor {
public:
    using Responder = std::function<Result<ProviderResponse>(const ProviderRequest&)>;

    void setResponder(Responder responder) { m_responder = std::move(responder); }
    void enqueue(const Result<ProviderResponse>& result) { m_queue.enqueue(result); }

    Result<ProviderResponse> execute(const ProviderRequest& request, const ExecOptions& options) override
    {
        {
            QMutexLocker locker(&m_mutex);
            m_requests.append(request);
            m_lastOptions = options;
        }
        if (isCancelled(options.cancel))
            return std::unexpected(DomainFailure::cancelled());
        if (m_responder)
            return m_responder(request);
        if (!m_queue.isEmpty())
            return m_queue.dequeue();
        return response(200, "{}");
    }

    QList<ProviderRequest> requests() const
    {
        QMutexLocker locker(&m_mutex);
        return m_requests;
    }
    int count() const
    {
        QMutexLocker locker(&m_mutex);
        return m_requests.size();
    }
    ExecOptions lastOptions() const
    {
        QMutexLocker locker(&m_mutex);
        return m_lastOptions;
    }

    static ProviderResponse response(int status, const QByteArray& body)
    {
        ProviderResponse r;
        r.statusCode = status;
        r.body = body;
        r.headers[QStringLiteral("content-type")] = QStringLiteral("application/json");
        r.headerLatencyMs = 20;
        return r;
    }

private:
    Responder m_responder;
    QQueue<Result<ProviderResponse>> m_queue;
    mutable QMutex m_mutex;
    QList<ProviderRequest> m_requests;
    ExecOptions m_lastOptions;
};

// Provider list kept in memory instead of a configuration file.
class MemoryRepository : public IProviderRepository {
public:
    QList<Provider> providers;
    QList<ProviderRuntimeState> lastStored;
    int storeCount = 0;

    Result<QList<Provider>> loadProviders() override { return providers; }
    VoidResult storeRuntimeState(const QList<ProviderRuntimeState>& states) override
    {
        lastStored = states;
        ++storeCount;
        return {};
    }
    VoidResult addProviders(const QList<Provider>& added) override
    {
        providers += added;
        return {};
    }
    VoidResult setProviderCooldown(const QString& providerId, qint64 untilMs) override
    {
        for (Provider& p : providers) {
            if (p.id == providerId) {
                p.cooldownUntil = untilMs;
                return {};
            }
        }
        return std::unexpected(DomainFailure::notFound(providerId));
    }
};

inline ProviderEndpoint makeEndpoint(const QString& url, const QString& apiKey, int urlPriority = 0)
{
    ProviderEndpoint ep;
    ep.url = url;
    ep.apiKey = apiKey;
    ep.urlPriority = urlPriority;
    return ep;
}

inline Provider makeProvider(const QString& id, AppFamily family, const QString& group,
                             const QList<ProviderEndpoint>& endpoints, int sortIndex = 0)
{
    Provider p;
    p.id = id;
    p.name = id;
    p.family = family;
    p.group = group;
    p.endpoints = endpoints;
    p.sortIndex = sortIndex;
    return p;
}

inline Provider makeProvider(const QString& id, AppFamily family, const QString& group,
                             const QString& url, const QString& apiKey, int sortIndex = 0)
{
    return makeProvider(id, family, group, {makeEndpoint(url, apiKey)}, sortIndex);
}
