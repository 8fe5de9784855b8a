#pragma once
#include "config/config_types.h"
#include "semantic/types.h"
#include <QString>
#include <QList>
#include <QMap>
#include <QHash>

struct ProviderEndpoint {
    QString url;
    QString apiKey;
    int urlPriority = 0;
    qint64 urlLatencyMs = -1;    // -1 = never measured
    qint64 cooldownUntil = 0;    // epoch ms, 0 = not cooling down

    bool isUsable() const;
};

// Per-provider model rewrite. Claude tiers are picked by name, the
// reasoning model when the request enables thinking, and the default model
// for everything else. Empty fields do not map.
struct ModelMapping {
    QString haiku;
    QString sonnet;
    QString opus;
    QString defaultModel;
    QString reasoning;

    bool isEmpty() const {
        return haiku.isEmpty() && sonnet.isEmpty() && opus.isEmpty()
            && defaultModel.isEmpty() && reasoning.isEmpty();
    }
};

struct Provider {
    QString id;
    QString name;
    QString group;
    AppFamily family = AppFamily::Claude;
    bool enabled = true;
    QList<ProviderEndpoint> endpoints;
    int rotationTier = 0;
    int groupPriority = 0;
    int sortIndex = 0;
    qint64 usageCount = 0;
    qint64 lastUsedAt = 0;       // epoch ms
    qint64 cooldownUntil = 0;    // epoch ms, provider-wide
    qint64 cooldownDurationSecs = kDefaultCooldownSeconds;
    QMap<QString, QString> customHeaders;
    ModelMapping modelMapping;

    // Providers without a group form a group of their own.
    QString effectiveGroup() const { return group.isEmpty() ? id : group; }
    qint64 latestCooldownUntil() const;
    bool isCoolingDown(qint64 nowMs) const { return cooldownUntil > nowMs; }
    int endpointIndex(const QString& url, const QString& apiKey) const;
};

// Breaker key: one credential against one URL of one provider.
struct CandidateId {
    QString providerId;
    QString url;
    QString apiKey;

    bool operator==(const CandidateId& other) const {
        return providerId == other.providerId && url == other.url && apiKey == other.apiKey;
    }
    QString toString() const;
};

size_t qHash(const CandidateId& id, size_t seed = 0) noexcept;

struct Candidate {
    Provider provider;
    int endpointIndex = 0;

    const ProviderEndpoint& endpoint() const { return provider.endpoints.at(endpointIndex); }
    CandidateId id() const { return {provider.id, endpoint().url, endpoint().apiKey}; }
    bool isCoolingDown(qint64 nowMs) const {
        return provider.isCoolingDown(nowMs) || endpoint().cooldownUntil > nowMs;
    }
};

// Runtime fields the registry writes back to the repository.
struct EndpointRuntimeState {
    QString url;
    QString apiKey;
    qint64 urlLatencyMs = -1;
    qint64 cooldownUntil = 0;
};

struct ProviderRuntimeState {
    QString id;
    qint64 usageCount = 0;
    qint64 lastUsedAt = 0;
    qint64 cooldownUntil = 0;
    QList<EndpointRuntimeState> endpoints;
};

QString maskApiKey(const QString& key);
