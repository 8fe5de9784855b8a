#pragma once
#include "semantic/types.h"
#include <QString>
#include <QStringList>
#include <QMap>
#include <QList>

constexpr qint64 kDefaultCooldownSeconds = 259200;   // 72 hours
constexpr double kMaxCooldownHours = 87600.0;  // ten years
constexpr qint64 kMaxCooldownSeconds = 87600 * 3600;
constexpr int kMaxSameCandidateRetries = 5;

struct RuntimeOptions {
    bool debugMode = false;
    QString listenAddress = QStringLiteral("127.0.0.1");
    int proxyPort = 15721;
    int requestTimeout = 600000;
    int connectionTimeout = 30000;
    int streamIdleTimeout = 60000;
    int maxAttempts = 6;
    int maxRetries = 0;     // same-candidate retries on transient failures
    int workerThreads = 16;
    int registryRefreshInterval = 5000;

    bool operator==(const RuntimeOptions&) const = default;
};

struct BreakerOptions {
    int failureThreshold = 5;
    int timeoutSeconds = 60;
    double errorRateThreshold = 0.6;
    int minRequests = 10;

    bool operator==(const BreakerOptions&) const = default;
};

struct CooldownOptions {
    qint64 defaultDurationSeconds = kDefaultCooldownSeconds;
    qint64 failureMarkerTtlSeconds = 3600;

    bool operator==(const CooldownOptions&) const = default;
};

struct ProbeOptions {
    bool enabled = true;
    int cacheTtlSeconds = 60;
    int timeoutMs = 15000;
    QString prompt = QStringLiteral("hi");
    int maxTokens = 1;

    bool operator==(const ProbeOptions&) const = default;
};

enum class SystemPromptMode : quint8 {
    Replace, Prepend, InsertIfMissing
};

struct SystemPromptOverride {
    QString text;
    SystemPromptMode mode = SystemPromptMode::Replace;
    QString keyword;   // InsertIfMissing: skip when an existing instruction contains it

    bool isActive() const { return !text.isEmpty(); }
    bool operator==(const SystemPromptOverride&) const = default;
};

struct FamilyOptions {
    QString activeProvider;
    QMap<QString, QString> customHeaders;
    SystemPromptOverride systemPrompt;

    bool operator==(const FamilyOptions&) const = default;
};

struct ProxyConfig {
    RuntimeOptions runtime;
    BreakerOptions breaker;
    CooldownOptions cooldown;
    ProbeOptions probe;
    QMap<AppFamily, FamilyOptions> families;

    FamilyOptions family(AppFamily f) const { return families.value(f); }
    bool operator==(const ProxyConfig&) const = default;
};
