#pragma once
#include "registry/provider_registry.h"
#include "routing/circuit_breaker.h"
#include "routing/cooldown_manager.h"
#include <QByteArray>
#include <QString>
#include <optional>

struct AdminReply {
    int status = 200;
    QByteArray body;
};

// Loopback management endpoints: health, cooldown list/set/clear, a
// provider overview with breaker states and usage counter resets.
class AdminApi {
public:
    AdminApi(CooldownManager& cooldowns, ProviderRegistry& registry, const BreakerBoard& breakers);

    static bool handles(const QString& path);

    // nullopt when the path is not an admin path.
    std::optional<AdminReply> handle(const QString& method, const QString& path,
                                     const QByteArray& body) const;

private:
    AdminReply listCooldowns() const;
    AdminReply setCooldown(const QString& providerId, const QByteArray& body) const;
    AdminReply clearCooldown(const QString& providerId) const;
    AdminReply listProviders() const;
    AdminReply resetUsage(const QString& providerId) const;
    void persist() const;

    static AdminReply ok(const QJsonObject& body);
    static AdminReply failure(const DomainFailure& failure);

    CooldownManager& m_cooldowns;
    ProviderRegistry& m_registry;
    const BreakerBoard& m_breakers;
};
