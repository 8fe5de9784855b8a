#include "cli_commands.h"
#include <QEventLoop>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QNetworkRequest>
#include <QTimer>
#include <QUrl>
#include <cmath>

namespace {

QString pad(const QString& text, int width)
{
    return text.leftJustified(width, QLatin1Char(' '), false);
}

}

CliCommands::CliCommands(ConfigStore& config, QTextStream& out, QTextStream& err)
    : m_config(config)
    , m_out(out)
    , m_err(err)
{
}

CliCommands::~CliCommands() = default;

QString CliCommands::formatDuration(qint64 seconds)
{
    if (seconds <= 0)
        return QStringLiteral("0s");
    const qint64 days = seconds / 86400;
    const qint64 hours = (seconds % 86400) / 3600;
    const qint64 minutes = (seconds % 3600) / 60;
    const qint64 secs = seconds % 60;
    if (days > 0)
        return QStringLiteral("%1d %2h").arg(days).arg(hours);
    if (hours > 0)
        return QStringLiteral("%1h %2m").arg(hours).arg(minutes);
    if (minutes > 0)
        return QStringLiteral("%1m %2s").arg(minutes).arg(secs);
    return QStringLiteral("%1s").arg(secs);
}

std::optional<double> CliCommands::parseHours(const QString& text)
{
    bool ok = false;
    const double hours = text.trimmed().toDouble(&ok);
    if (!ok || !std::isfinite(hours) || hours <= 0.0 || hours > kMaxCooldownHours)
        return std::nullopt;
    return hours;
}

std::optional<AdminReply> CliCommands::callAdmin(const QString& method, const QString& path,
                                                 const QByteArray& body) const
{
    if (m_adminBaseUrl.isEmpty())
        return std::nullopt;

    QNetworkAccessManager nam;
    QNetworkRequest req{QUrl{m_adminBaseUrl + path}};
    req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");
    QNetworkReply* reply = nam.sendCustomRequest(req, method.toUtf8(), body);

    QEventLoop loop;
    QTimer timeout;
    timeout.setSingleShot(true);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
    timeout.start(m_adminTimeoutMs);
    loop.exec();

    const QVariant status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (reply->isRunning() || !status.isValid()) {
        reply->abort();
        delete reply;
        return std::nullopt;
    }

    AdminReply result;
    result.status = status.toInt();
    result.body = reply->readAll();
    delete reply;
    return result;
}

CliCommands::Offline* CliCommands::offline()
{
    if (m_offline)
        return m_offline.get();

    auto state = std::make_unique<Offline>();
    const ProxyConfig cfg = m_config.proxyConfig();
    state->registry.setRepository(&m_config);
    const auto loaded = state->registry.refresh();
    if (!loaded) {
        fail(loaded.error());
        return nullptr;
    }
    state->breakers = std::make_unique<BreakerBoard>(state->clock, cfg.breaker);
    state->cooldowns = std::make_unique<CooldownManager>(state->registry, *state->breakers,
                                                         state->clock, cfg.cooldown);
    m_offline = std::move(state);
    return m_offline.get();
}

int CliCommands::fail(const DomainFailure& failure)
{
    m_err << "error: " << failure.message << Qt::endl;
    return 1;
}

int CliCommands::reportAdminReply(const AdminReply& reply, const QString& success)
{
    if (reply.status >= 200 && reply.status < 300) {
        m_out << success << Qt::endl;
        return 0;
    }
    const QJsonObject err = QJsonDocument::fromJson(reply.body).object().value(QStringLiteral("error")).toObject();
    m_err << "error: " << err.value(QStringLiteral("message")).toString(QString::fromUtf8(reply.body))
          << " (HTTP " << reply.status << ")" << Qt::endl;
    return 1;
}

void CliCommands::printCooldowns(const QList<CooldownEntry>& entries)
{
    if (entries.isEmpty()) {
        m_out << "no provider is cooling down" << Qt::endl;
        return;
    }
    m_out << pad(QStringLiteral("ID"), 24) << pad(QStringLiteral("NAME"), 24) << pad(QStringLiteral("GROUP"), 18)
          << pad(QStringLiteral("FAMILY"), 8) << pad(QStringLiteral("REMAINING"), 12) << "URLS" << Qt::endl;
    for (const CooldownEntry& e : entries) {
        m_out << pad(e.providerId, 24) << pad(e.name, 24) << pad(e.group, 18)
              << pad(app_family::name(e.family), 8) << pad(formatDuration(e.remainingSeconds), 12)
              << (e.urls.isEmpty() ? QStringLiteral("(all)") : e.urls.join(QStringLiteral(", "))) << Qt::endl;
    }
}

int CliCommands::cooldownList()
{
    if (const auto reply = callAdmin(QStringLiteral("GET"), QStringLiteral("/_switchboard/cooldowns"))) {
        if (reply->status != 200)
            return reportAdminReply(*reply, QString());
        QList<CooldownEntry> entries;
        const QJsonArray list = QJsonDocument::fromJson(reply->body).object()
                                    .value(QStringLiteral("cooldowns")).toArray();
        for (const QJsonValue& value : list) {
            const QJsonObject obj = value.toObject();
            CooldownEntry e;
            e.providerId = obj.value(QStringLiteral("provider_id")).toString();
            e.name = obj.value(QStringLiteral("name")).toString();
            e.group = obj.value(QStringLiteral("group")).toString();
            e.family = app_family::fromName(obj.value(QStringLiteral("family")).toString()).value_or(AppFamily::Claude);
            e.remainingSeconds = static_cast<qint64>(obj.value(QStringLiteral("remaining_seconds")).toDouble());
            for (const QJsonValue& url : obj.value(QStringLiteral("urls")).toArray())
                e.urls.append(url.toString());
            entries.append(e);
        }
        printCooldowns(entries);
        return 0;
    }

    Offline* state = offline();
    if (!state)
        return 1;
    printCooldowns(state->cooldowns->listCooldowns());
    return 0;
}

int CliCommands::cooldownSet(const QString& providerId, double hours)
{
    QJsonObject body;
    body["hours"] = hours;
    const QString path = QStringLiteral("/_switchboard/cooldowns/%1")
                             .arg(QString::fromUtf8(QUrl::toPercentEncoding(providerId)));
    const QString done = QStringLiteral("cooldown of %1 set to %2 hour(s)").arg(providerId).arg(hours);
    if (const auto reply = callAdmin(QStringLiteral("POST"), path,
                                     QJsonDocument(body).toJson(QJsonDocument::Compact)))
        return reportAdminReply(*reply, done);

    Offline* state = offline();
    if (!state)
        return 1;
    if (const auto set = state->cooldowns->setCooldown(providerId, hours); !set)
        return fail(set.error());
    if (const auto flushed = state->registry.flush(); !flushed)
        return fail(flushed.error());
    m_out << done << " (proxy not running, configuration updated)" << Qt::endl;
    return 0;
}

int CliCommands::cooldownClear(const QString& providerId)
{
    const QString path = QStringLiteral("/_switchboard/cooldowns/%1")
                             .arg(QString::fromUtf8(QUrl::toPercentEncoding(providerId)));
    const QString done = QStringLiteral("cooldown of %1 cleared").arg(providerId);
    if (const auto reply = callAdmin(QStringLiteral("DELETE"), path))
        return reportAdminReply(*reply, done);

    Offline* state = offline();
    if (!state)
        return 1;
    if (const auto cleared = state->cooldowns->clearCooldown(providerId); !cleared)
        return fail(cleared.error());
    if (const auto flushed = state->registry.flush(); !flushed)
        return fail(flushed.error());
    m_out << done << " (proxy not running, configuration updated)" << Qt::endl;
    return 0;
}

int CliCommands::providersList(const QString& familyFilter)
{
    std::optional<AppFamily> family;
    if (!familyFilter.isEmpty()) {
        family = app_family::fromName(familyFilter);
        if (!family)
            return fail(DomainFailure::invalidInput(QStringLiteral("unknown_family"),
                                                    QStringLiteral("unknown family '%1'").arg(familyFilter)));
    }

    const ProxyConfig cfg = m_config.proxyConfig();
    const qint64 now = SystemClock().nowMs();
    int shown = 0;
    m_out << pad(QStringLiteral("ID"), 24) << pad(QStringLiteral("FAMILY"), 8) << pad(QStringLiteral("GROUP"), 18)
          << pad(QStringLiteral("TIER"), 6) << pad(QStringLiteral("USES"), 8) << pad(QStringLiteral("STATE"), 16)
          << "ENDPOINTS" << Qt::endl;
    for (const Provider& p : m_config.providers()) {
        if (family && p.family != *family)
            continue;
        QString state = p.enabled ? QStringLiteral("enabled") : QStringLiteral("disabled");
        if (p.latestCooldownUntil() > now)
            state = QStringLiteral("cooling %1").arg(formatDuration((p.latestCooldownUntil() - now + 999) / 1000));
        if (cfg.family(p.family).activeProvider == p.id)
            state += QStringLiteral(" *");
        QStringList endpoints;
        for (const ProviderEndpoint& ep : p.endpoints)
            endpoints.append(QStringLiteral("%1 [%2]").arg(ep.url, maskApiKey(ep.apiKey)));
        m_out << pad(p.id, 24) << pad(app_family::name(p.family), 8) << pad(p.effectiveGroup(), 18)
              << pad(QString::number(p.rotationTier), 6) << pad(QString::number(p.usageCount), 8)
              << pad(state, 16) << endpoints.join(QStringLiteral(", ")) << Qt::endl;
        ++shown;
    }
    m_out << shown << " provider(s), * = active" << Qt::endl;
    return 0;
}

int CliCommands::providersBatchAdd(const ProviderBatch& batch)
{
    const auto added = m_config.addProviderBatch(batch);
    if (!added)
        return fail(added.error());
    for (const Provider& p : *added)
        m_out << "added " << p.id << "  " << p.endpoints.first().url
              << " [" << maskApiKey(p.endpoints.first().apiKey) << "]" << Qt::endl;
    m_out << added->size() << " provider(s) added to group " << batch.group << Qt::endl;
    return 0;
}

int CliCommands::providersRemove(const QString& providerId)
{
    if (const auto removed = m_config.removeProvider(providerId); !removed)
        return fail(removed.error());
    m_out << "removed " << providerId << Qt::endl;
    return 0;
}

int CliCommands::providersResetUsage(const QString& providerId)
{
    const QString path = QStringLiteral("/_switchboard/providers/%1/usage")
                             .arg(QString::fromUtf8(QUrl::toPercentEncoding(providerId)));
    const QString done = QStringLiteral("usage of %1 reset").arg(providerId);
    if (const auto reply = callAdmin(QStringLiteral("DELETE"), path))
        return reportAdminReply(*reply, done);

    Offline* state = offline();
    if (!state)
        return 1;
    if (!state->registry.resetUsage(providerId))
        return fail(DomainFailure::notFound(QStringLiteral("unknown provider '%1'").arg(providerId)));
    if (const auto flushed = state->registry.flush(); !flushed)
        return fail(flushed.error());
    m_out << done << " (proxy not running, configuration updated)" << Qt::endl;
    return 0;
}
