#include "admin_api.h"
#include "core/log_manager.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QUrl>

namespace {

const QString kAdminPrefix = QStringLiteral("/_switchboard/");
const QString kCooldownsPath = QStringLiteral("/_switchboard/cooldowns");
const QString kProvidersPath = QStringLiteral("/_switchboard/providers");

}

AdminApi::AdminApi(CooldownManager& cooldowns, ProviderRegistry& registry, const BreakerBoard& breakers)
    : m_cooldowns(cooldowns)
    , m_registry(registry)
    , m_breakers(breakers)
{
}

bool AdminApi::handles(const QString& path)
{
    const QString bare = path.section(QLatin1Char('?'), 0, 0);
    return bare == QStringLiteral("/health") || bare.startsWith(kAdminPrefix);
}

AdminReply AdminApi::ok(const QJsonObject& body)
{
    return {200, QJsonDocument(body).toJson(QJsonDocument::Compact)};
}

AdminReply AdminApi::failure(const DomainFailure& failure)
{
    return {failure.httpStatus(), QJsonDocument(failure.toJson()).toJson(QJsonDocument::Compact)};
}

std::optional<AdminReply> AdminApi::handle(const QString& method, const QString& path,
                                           const QByteArray& body) const
{
    if (!handles(path))
        return std::nullopt;

    const QString bare = path.section(QLatin1Char('?'), 0, 0);
    const QString verb = method.toUpper();
    const auto methodNotAllowed = [&]() {
        AdminReply reply = failure(DomainFailure::invalidInput(
            QStringLiteral("method_not_allowed"), QStringLiteral("%1 is not supported on %2").arg(verb, bare)));
        reply.status = 405;
        return reply;
    };

    if (bare == QStringLiteral("/health")) {
        if (verb != QStringLiteral("GET"))
            return methodNotAllowed();
        QJsonObject health;
        health["status"] = QStringLiteral("ok");
        health["providers"] = m_registry.size();
        return ok(health);
    }

    if (bare == kCooldownsPath || bare == kCooldownsPath + QLatin1Char('/')) {
        if (verb != QStringLiteral("GET"))
            return methodNotAllowed();
        return listCooldowns();
    }

    if (bare.startsWith(kCooldownsPath + QLatin1Char('/'))) {
        const QString providerId = QUrl::fromPercentEncoding(
            bare.mid(kCooldownsPath.size() + 1).toUtf8());
        if (verb == QStringLiteral("POST") || verb == QStringLiteral("PUT"))
            return setCooldown(providerId, body);
        if (verb == QStringLiteral("DELETE"))
            return clearCooldown(providerId);
        return methodNotAllowed();
    }

    if (bare == kProvidersPath) {
        if (verb != QStringLiteral("GET"))
            return methodNotAllowed();
        return listProviders();
    }

    const QString usageSuffix = QStringLiteral("/usage");
    const QString tail = bare.mid(kProvidersPath.size() + 1);
    if (bare.startsWith(kProvidersPath + QLatin1Char('/')) && tail.endsWith(usageSuffix)) {
        const QString encoded = tail.left(tail.size() - usageSuffix.size());
        if (encoded.isEmpty() || encoded.contains(QLatin1Char('/')))
            return failure(DomainFailure::notFound(QStringLiteral("no admin endpoint at %1").arg(bare)));
        if (verb != QStringLiteral("DELETE"))
            return methodNotAllowed();
        return resetUsage(QUrl::fromPercentEncoding(encoded.toUtf8()));
    }

    return failure(DomainFailure::notFound(QStringLiteral("no admin endpoint at %1").arg(bare)));
}

AdminReply AdminApi::listCooldowns() const
{
    QJsonArray list;
    for (const CooldownEntry& entry : m_cooldowns.listCooldowns()) {
        QJsonObject item;
        item["provider_id"] = entry.providerId;
        item["name"] = entry.name;
        item["group"] = entry.group;
        item["family"] = app_family::name(entry.family);
        item["remaining_seconds"] = entry.remainingSeconds;
        item["urls"] = QJsonArray::fromStringList(entry.urls);
        list.append(item);
    }
    QJsonObject root;
    root["cooldowns"] = list;
    return ok(root);
}

AdminReply AdminApi::setCooldown(const QString& providerId, const QByteArray& body) const
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    const QJsonValue hours = doc.object().value(QStringLiteral("hours"));
    if (parseError.error != QJsonParseError::NoError || !hours.isDouble()) {
        return failure(DomainFailure::invalidInput(
            QStringLiteral("invalid_body"), QStringLiteral("expected {\"hours\": <number>}")));
    }

    const auto result = m_cooldowns.setCooldown(providerId, hours.toDouble());
    if (!result)
        return failure(result.error());

    persist();
    QJsonObject root;
    root["status"] = QStringLiteral("ok");
    root["provider_id"] = providerId;
    root["hours"] = hours.toDouble();
    return ok(root);
}

AdminReply AdminApi::clearCooldown(const QString& providerId) const
{
    const auto result = m_cooldowns.clearCooldown(providerId);
    if (!result)
        return failure(result.error());

    persist();
    QJsonObject root;
    root["status"] = QStringLiteral("ok");
    root["provider_id"] = providerId;
    return ok(root);
}

AdminReply AdminApi::resetUsage(const QString& providerId) const
{
    if (!m_registry.resetUsage(providerId))
        return failure(DomainFailure::notFound(QStringLiteral("unknown provider '%1'").arg(providerId)));

    LOG_INFO(QStringLiteral("AdminApi: usage of %1 reset").arg(providerId));
    persist();
    QJsonObject root;
    root["status"] = QStringLiteral("ok");
    root["provider_id"] = providerId;
    root["usage_count"] = 0;
    return ok(root);
}

AdminReply AdminApi::listProviders() const
{
    QJsonArray list;
    for (const Provider& p : m_registry.snapshotAll()) {
        QJsonArray endpoints;
        for (int i = 0; i < p.endpoints.size(); ++i) {
            const ProviderEndpoint& ep = p.endpoints.at(i);
            QJsonObject e;
            e["url"] = ep.url;
            e["api_key"] = maskApiKey(ep.apiKey);
            e["url_priority"] = ep.urlPriority;
            e["url_latency_ms"] = ep.urlLatencyMs;
            e["cooldown_until"] = ep.cooldownUntil;
            const CandidateId id = Candidate{p, i}.id();
            e["breaker"] = breakerStateName(m_breakers.state(id));
            e["consecutive_failures"] = m_breakers.consecutiveFailures(id);
            endpoints.append(e);
        }

        QJsonObject item;
        item["id"] = p.id;
        item["name"] = p.name;
        item["group"] = p.effectiveGroup();
        item["family"] = app_family::name(p.family);
        item["enabled"] = p.enabled;
        item["active"] = m_registry.activeProvider(p.family) == p.id;
        item["rotation_tier"] = p.rotationTier;
        item["group_priority"] = p.groupPriority;
        item["sort_index"] = p.sortIndex;
        item["usage_count"] = p.usageCount;
        item["last_used_at"] = p.lastUsedAt;
        item["cooldown_until"] = p.cooldownUntil;
        item["endpoints"] = endpoints;
        list.append(item);
    }
    QJsonObject root;
    root["providers"] = list;
    return ok(root);
}

void AdminApi::persist() const
{
    const auto flushed = m_registry.flush();
    if (!flushed)
        LOG_WARNING(QStringLiteral("AdminApi: change not persisted: %1").arg(flushed.error().message));
}
