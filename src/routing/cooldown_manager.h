#pragma once
#include "circuit_breaker.h"
#include "config/config_types.h"
#include "core/clock.h"
#include "registry/provider_registry.h"
#include "semantic/ports.h"
#include <QHash>
#include <QMutex>
#include <QStringList>
#include <memory>

struct CooldownEntry {
    QString providerId;
    QString name;
    QString group;
    AppFamily family = AppFamily::Claude;
    qint64 remainingSeconds = 0;
    QStringList urls;        // empty when the whole provider is cooling down
};

// Long-term URL suppression. Failure markers are kept per group (the scope in
// which (key, URL) combinations are interchangeable) and only turn into a
// cooldown once the same key has been seen working on another URL.
class CooldownManager {
public:
    CooldownManager(ProviderRegistry& registry, const BreakerBoard& breakers,
                    const Clock& clock, const CooldownOptions& options);

    void setOptions(const CooldownOptions& options);

    // Phase 1: marker for (key, URL) when the candidate's breaker is open.
    void recordFailure(const Candidate& candidate);
    // Phase 2: returns the number of URLs put into cooldown.
    int recordSuccess(const Candidate& candidate);

    QList<CooldownEntry> listCooldowns() const;
    VoidResult setCooldown(const QString& providerId, double hours);
    VoidResult clearCooldown(const QString& providerId);

    bool hasFailureMarker(const Provider& provider, const QString& apiKey, const QString& url) const;

private:
    struct MarkerKey {
        QString apiKey;
        QString url;
        bool operator==(const MarkerKey& o) const { return apiKey == o.apiKey && url == o.url; }
        friend size_t qHash(const MarkerKey& key, size_t seed = 0) noexcept
        {
            return qHashMulti(seed, key.apiKey, key.url);
        }
    };

    struct Scope {
        QMutex mutex;
        QHash<MarkerKey, qint64> markers;
        bool outageWarned = false;
    };

    static QString scopeKey(const Provider& provider);
    std::shared_ptr<Scope> scope(const QString& key, bool create) const;
    QList<MarkerKey> combinationsOf(const Provider& provider) const;
    void pruneExpired(Scope& scope, qint64 nowMs) const;
    static bool allFailed(const QList<MarkerKey>& combinations, const QHash<MarkerKey, qint64>& markers);

    ProviderRegistry& m_registry;
    const BreakerBoard& m_breakers;
    const Clock& m_clock;

    mutable QMutex m_mutex;   // guards m_options and m_scopes
    CooldownOptions m_options;
    mutable QHash<QString, std::shared_ptr<Scope>> m_scopes;
};
