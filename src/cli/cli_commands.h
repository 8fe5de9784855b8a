#pragma once
#include "config/config_store.h"
#include "core/clock.h"
#include "proxy/admin_api.h"
#include "registry/provider_batch.h"
#include "registry/provider_registry.h"
#include "routing/circuit_breaker.h"
#include "routing/cooldown_manager.h"
#include <QTextStream>
#include <memory>
#include <optional>

// switchboard-cli operations. Cooldown commands go through the admin API of a
// running proxy and fall back to the configuration file when none answers.
class CliCommands {
public:
    CliCommands(ConfigStore& config, QTextStream& out, QTextStream& err);
    ~CliCommands();

    void setAdminBaseUrl(const QString& url) { m_adminBaseUrl = url; }
    void setAdminTimeout(int ms) { m_adminTimeoutMs = ms; }

    int cooldownList();
    int cooldownSet(const QString& providerId, double hours);
    int cooldownClear(const QString& providerId);

    int providersList(const QString& familyFilter);
    int providersBatchAdd(const ProviderBatch& batch);
    int providersRemove(const QString& providerId);
    int providersResetUsage(const QString& providerId);

    static QString formatDuration(qint64 seconds);
    // Positive and finite, at most kMaxCooldownHours.
    static std::optional<double> parseHours(const QString& text);

private:
    struct Offline {
        SystemClock clock;
        ProviderRegistry registry;
        std::unique_ptr<BreakerBoard> breakers;
        std::unique_ptr<CooldownManager> cooldowns;
    };

    std::optional<AdminReply> callAdmin(const QString& method, const QString& path,
                                        const QByteArray& body = {}) const;
    Offline* offline();
    int reportAdminReply(const AdminReply& reply, const QString& success);
    int fail(const DomainFailure& failure);
    void printCooldowns(const QList<CooldownEntry>& entries);

    ConfigStore& m_config;
    QTextStream& m_out;
    QTextStream& m_err;
    QString m_adminBaseUrl;
    int m_adminTimeoutMs = 2000;
    std::unique_ptr<Offline> m_offline;
};
