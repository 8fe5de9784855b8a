#include "config_store.h"
#include "core/log_manager.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QHostAddress>
#include <QJsonArray>
#include <QJsonDocument>
#include <QSaveFile>
#include <QStandardPaths>
#include <cmath>

namespace {

// Largest integer a JSON double holds exactly.
constexpr double kJsonMaxInteger = 9007199254740992.0;

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    return jsonValueEither(obj, snakeKey, camelKey).toString();
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

qint64 jsonInt64Either(const QJsonObject& obj, const char* snakeKey, const char* camelKey, qint64 fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    if (!value.isDouble() || !std::isfinite(value.toDouble()))
        return fallback;
    return static_cast<qint64>(qBound(-kJsonMaxInteger, value.toDouble(), kJsonMaxInteger));
}

double jsonDoubleEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, double fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isDouble() ? value.toDouble() : fallback;
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

int clampInt(int value, int minValue, int maxValue)
{
    return qBound(minValue, value, maxValue);
}

qint64 cooldownSeconds(qint64 value, qint64 fallback)
{
    return value <= 0 ? fallback : qMin(value, kMaxCooldownSeconds);
}

ModelMapping modelMappingFromJson(const QJsonValue& value)
{
    const QJsonObject obj = value.toObject();
    ModelMapping mapping;
    mapping.haiku = obj.value(QStringLiteral("haiku")).toString().trimmed();
    mapping.sonnet = obj.value(QStringLiteral("sonnet")).toString().trimmed();
    mapping.opus = obj.value(QStringLiteral("opus")).toString().trimmed();
    mapping.defaultModel = obj.value(QStringLiteral("default")).toString().trimmed();
    mapping.reasoning = obj.value(QStringLiteral("reasoning")).toString().trimmed();
    return mapping;
}

QJsonObject modelMappingToJson(const ModelMapping& mapping)
{
    QJsonObject obj;
    if (!mapping.haiku.isEmpty())
        obj["haiku"] = mapping.haiku;
    if (!mapping.sonnet.isEmpty())
        obj["sonnet"] = mapping.sonnet;
    if (!mapping.opus.isEmpty())
        obj["opus"] = mapping.opus;
    if (!mapping.defaultModel.isEmpty())
        obj["default"] = mapping.defaultModel;
    if (!mapping.reasoning.isEmpty())
        obj["reasoning"] = mapping.reasoning;
    return obj;
}

QMap<QString, QString> headersFromJson(const QJsonValue& value)
{
    QMap<QString, QString> headers;
    const QJsonObject obj = value.toObject();
    for (auto it = obj.constBegin(); it != obj.constEnd(); ++it)
        headers[it.key()] = it.value().toString();
    return headers;
}

QJsonObject headersToJson(const QMap<QString, QString>& headers)
{
    QJsonObject obj;
    for (auto it = headers.cbegin(); it != headers.cend(); ++it)
        obj[it.key()] = it.value();
    return obj;
}

QString systemPromptModeName(SystemPromptMode mode)
{
    switch (mode) {
    case SystemPromptMode::Replace:         return QStringLiteral("replace");
    case SystemPromptMode::Prepend:         return QStringLiteral("prepend");
    case SystemPromptMode::InsertIfMissing: return QStringLiteral("insert_if_missing");
    }
    return QStringLiteral("replace");
}

SystemPromptMode systemPromptModeFromName(const QString& name)
{
    const QString n = name.trimmed().toLower();
    if (n == QStringLiteral("prepend"))
        return SystemPromptMode::Prepend;
    if (n == QStringLiteral("insert_if_missing") || n == QStringLiteral("insertifmissing"))
        return SystemPromptMode::InsertIfMissing;
    return SystemPromptMode::Replace;
}

// Endpoints, accepting the single "url"/"api_key" shorthand.
QJsonArray endpointArray(const QJsonObject& obj)
{
    QJsonArray endpoints = obj.value(QStringLiteral("endpoints")).toArray();
    if (endpoints.isEmpty() && obj.contains(QStringLiteral("url"))) {
        QJsonObject single;
        single["url"] = obj.value(QStringLiteral("url"));
        single["api_key"] = jsonValueEither(obj, "api_key", "apiKey");
        endpoints.append(single);
    }
    return endpoints;
}

}

ConfigStore::ConfigStore(QObject* parent)
    : QObject(parent)
{
}

QString ConfigStore::defaultPath()
{
    const QString appData = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
    return appData + QStringLiteral("/config.json");
}

bool ConfigStore::load(const QString& path)
{
    m_filePath = path.isEmpty() ? defaultPath() : path;
    if (!QFileInfo::exists(m_filePath)) {
        LOG_INFO(QStringLiteral("ConfigStore: %1 not found, using defaults").arg(m_filePath));
        m_root = QJsonObject();
        if (parseOptions(m_root))
            emit configChanged();
        return true;
    }
    return reload();
}

bool ConfigStore::reload()
{
    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        LOG_ERROR(QStringLiteral("ConfigStore: cannot open %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        LOG_ERROR(QStringLiteral("ConfigStore: %1 is not a JSON object: %2")
                      .arg(m_filePath, parseError.errorString()));
        return false;
    }

    m_root = doc.object();
    if (parseOptions(m_root))
        emit configChanged();
    return true;
}

bool ConfigStore::parseOptions(const QJsonObject& root)
{
    ProxyConfig cfg;

    const QJsonObject rt = root.value(QStringLiteral("runtime")).toObject();
    cfg.runtime.debugMode = jsonBoolEither(rt, "debug_mode", "debugMode", false);
    cfg.runtime.listenAddress = jsonStringEither(rt, "listen_address", "listenAddress");
    const QHostAddress address(cfg.runtime.listenAddress);
    if (cfg.runtime.listenAddress.isEmpty() || address.isNull() || !address.isLoopback()) {
        if (!cfg.runtime.listenAddress.isEmpty())
            LOG_WARNING(QStringLiteral("ConfigStore: listen_address '%1' is not a loopback address, using 127.0.0.1")
                            .arg(cfg.runtime.listenAddress));
        cfg.runtime.listenAddress = QStringLiteral("127.0.0.1");
    }
    cfg.runtime.proxyPort = clampInt(jsonIntEither(rt, "proxy_port", "proxyPort", 15721), 0, 65535);
    cfg.runtime.requestTimeout = clampInt(jsonIntEither(rt, "request_timeout", "requestTimeout", 600000), 1000, 3600000);
    cfg.runtime.connectionTimeout = clampInt(jsonIntEither(rt, "connection_timeout", "connectionTimeout", 30000), 500, 300000);
    cfg.runtime.streamIdleTimeout = clampInt(jsonIntEither(rt, "stream_idle_timeout", "streamIdleTimeout", 60000), 1000, 3600000);
    cfg.runtime.maxAttempts = clampInt(jsonIntEither(rt, "max_attempts", "maxAttempts", 6), 1, 32);
    cfg.runtime.maxRetries = clampInt(jsonIntEither(rt, "max_retries", "maxRetries", 0), 0, kMaxSameCandidateRetries);
    cfg.runtime.workerThreads = clampInt(jsonIntEither(rt, "worker_threads", "workerThreads", 16), 1, 256);
    cfg.runtime.registryRefreshInterval = clampInt(
        jsonIntEither(rt, "registry_refresh_interval", "registryRefreshInterval", 5000), 500, 3600000);

    const QJsonObject cb = root.value(QStringLiteral("circuit_breaker")).toObject();
    cfg.breaker.failureThreshold = clampInt(jsonIntEither(cb, "failure_threshold", "failureThreshold", 5), 1, 1000);
    cfg.breaker.timeoutSeconds = clampInt(jsonIntEither(cb, "timeout_seconds", "timeoutSeconds", 60), 1, 86400);
    cfg.breaker.errorRateThreshold = qBound(0.0, jsonDoubleEither(cb, "error_rate_threshold", "errorRateThreshold", 0.6), 1.0);
    cfg.breaker.minRequests = clampInt(jsonIntEither(cb, "min_requests", "minRequests", 10), 1, 100000);

    const QJsonObject cd = root.value(QStringLiteral("cooldown")).toObject();
    cfg.cooldown.defaultDurationSeconds = cooldownSeconds(
        jsonInt64Either(cd, "default_duration_seconds", "defaultDurationSeconds", kDefaultCooldownSeconds),
        kDefaultCooldownSeconds);
    cfg.cooldown.failureMarkerTtlSeconds = cooldownSeconds(
        jsonInt64Either(cd, "failure_marker_ttl_seconds", "failureMarkerTtlSeconds", 3600), 3600);

    const QJsonObject pr = root.value(QStringLiteral("probe")).toObject();
    cfg.probe.enabled = jsonBoolEither(pr, "enabled", "enabled", true);
    cfg.probe.cacheTtlSeconds = clampInt(jsonIntEither(pr, "cache_ttl_seconds", "cacheTtlSeconds", 60), 0, 3600);
    cfg.probe.timeoutMs = clampInt(jsonIntEither(pr, "timeout_ms", "timeoutMs", 15000), 500, 120000);
    cfg.probe.prompt = jsonStringEither(pr, "prompt", "prompt");
    if (cfg.probe.prompt.isEmpty())
        cfg.probe.prompt = QStringLiteral("hi");
    cfg.probe.maxTokens = clampInt(jsonIntEither(pr, "max_tokens", "maxTokens", 1), 1, 64);

    const QJsonObject fam = root.value(QStringLiteral("families")).toObject();
    for (auto it = fam.constBegin(); it != fam.constEnd(); ++it) {
        const auto family = app_family::fromName(it.key());
        if (!family) {
            LOG_WARNING(QStringLiteral("ConfigStore: config_invalid: unknown family '%1' in families").arg(it.key()));
            continue;
        }
        const QJsonObject f = it.value().toObject();
        FamilyOptions options;
        options.activeProvider = jsonStringEither(f, "active_provider", "activeProvider");
        options.customHeaders = headersFromJson(jsonValueEither(f, "custom_headers", "customHeaders"));
        const QJsonObject sp = jsonValueEither(f, "system_prompt", "systemPrompt").toObject();
        options.systemPrompt.text = sp.value(QStringLiteral("text")).toString();
        options.systemPrompt.mode = systemPromptModeFromName(sp.value(QStringLiteral("mode")).toString());
        options.systemPrompt.keyword = sp.value(QStringLiteral("keyword")).toString();
        cfg.families.insert(*family, options);
    }

    if (cfg == m_config)
        return false;
    m_config = cfg;
    return true;
}

QJsonObject ConfigStore::optionsToJson(QJsonObject root) const
{
    root["version"] = 1;

    QJsonObject rt;
    rt["debug_mode"] = m_config.runtime.debugMode;
    rt["listen_address"] = m_config.runtime.listenAddress;
    rt["proxy_port"] = m_config.runtime.proxyPort;
    rt["request_timeout"] = m_config.runtime.requestTimeout;
    rt["connection_timeout"] = m_config.runtime.connectionTimeout;
    rt["stream_idle_timeout"] = m_config.runtime.streamIdleTimeout;
    rt["max_attempts"] = m_config.runtime.maxAttempts;
    rt["max_retries"] = m_config.runtime.maxRetries;
    rt["worker_threads"] = m_config.runtime.workerThreads;
    rt["registry_refresh_interval"] = m_config.runtime.registryRefreshInterval;
    root["runtime"] = rt;

    QJsonObject cb;
    cb["failure_threshold"] = m_config.breaker.failureThreshold;
    cb["timeout_seconds"] = m_config.breaker.timeoutSeconds;
    cb["error_rate_threshold"] = m_config.breaker.errorRateThreshold;
    cb["min_requests"] = m_config.breaker.minRequests;
    root["circuit_breaker"] = cb;

    QJsonObject cd;
    cd["default_duration_seconds"] = m_config.cooldown.defaultDurationSeconds;
    cd["failure_marker_ttl_seconds"] = m_config.cooldown.failureMarkerTtlSeconds;
    root["cooldown"] = cd;

    QJsonObject pr;
    pr["enabled"] = m_config.probe.enabled;
    pr["cache_ttl_seconds"] = m_config.probe.cacheTtlSeconds;
    pr["timeout_ms"] = m_config.probe.timeoutMs;
    pr["prompt"] = m_config.probe.prompt;
    pr["max_tokens"] = m_config.probe.maxTokens;
    root["probe"] = pr;

    QJsonObject fam;
    for (auto it = m_config.families.cbegin(); it != m_config.families.cend(); ++it) {
        QJsonObject f;
        if (!it->activeProvider.isEmpty())
            f["active_provider"] = it->activeProvider;
        if (!it->customHeaders.isEmpty())
            f["custom_headers"] = headersToJson(it->customHeaders);
        if (it->systemPrompt.isActive()) {
            QJsonObject sp;
            sp["text"] = it->systemPrompt.text;
            sp["mode"] = systemPromptModeName(it->systemPrompt.mode);
            if (!it->systemPrompt.keyword.isEmpty())
                sp["keyword"] = it->systemPrompt.keyword;
            f["system_prompt"] = sp;
        }
        fam[app_family::name(it.key())] = f;
    }
    root["families"] = fam;

    if (!root.contains(QStringLiteral("providers")))
        root["providers"] = QJsonArray();
    return root;
}

bool ConfigStore::save()
{
    if (m_filePath.isEmpty())
        return false;

    QDir().mkpath(QFileInfo(m_filePath).absolutePath());
    m_root = optionsToJson(m_root);

    QSaveFile file(m_filePath);
    if (!file.open(QIODevice::WriteOnly)) {
        LOG_ERROR(QStringLiteral("ConfigStore: cannot write %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }
    file.write(QJsonDocument(m_root).toJson(QJsonDocument::Indented));
    if (!file.commit()) {
        LOG_ERROR(QStringLiteral("ConfigStore: cannot commit %1: %2").arg(m_filePath, file.errorString()));
        return false;
    }
    return true;
}

void ConfigStore::setRuntimeOptions(const RuntimeOptions& options)
{
    if (m_config.runtime == options)
        return;
    m_config.runtime = options;
    if (!save())
        LOG_WARNING(QStringLiteral("ConfigStore: runtime options kept in memory only"));
    emit configChanged();
}

QString ConfigStore::encodeApiKey(const QString& plain)
{
    if (plain.isEmpty())
        return QString();
    return QStringLiteral("ENC:") + QString::fromUtf8(plain.toUtf8().toBase64());
}

QString ConfigStore::decodeApiKey(const QString& encoded)
{
    if (encoded.startsWith(QStringLiteral("ENC:")))
        return QString::fromUtf8(QByteArray::fromBase64(encoded.mid(4).toUtf8()));
    return encoded;
}

std::optional<Provider> ConfigStore::providerFromJson(const QJsonObject& obj, int position)
{
    const auto family = app_family::fromName(obj.value(QStringLiteral("family")).toString());
    if (!family)
        return std::nullopt;

    Provider p;
    p.id = obj.value(QStringLiteral("id")).toString().trimmed();
    p.name = obj.value(QStringLiteral("name")).toString();
    if (p.name.isEmpty())
        p.name = p.id;
    p.group = obj.value(QStringLiteral("group")).toString().trimmed();
    p.family = *family;
    p.enabled = obj.value(QStringLiteral("enabled")).toBool(true);
    p.rotationTier = jsonIntEither(obj, "rotation_tier", "rotationTier", 0);
    p.groupPriority = jsonIntEither(obj, "group_priority", "groupPriority", 0);
    p.sortIndex = jsonIntEither(obj, "sort_index", "sortIndex", position);
    p.usageCount = jsonInt64Either(obj, "usage_count", "usageCount", 0);
    p.lastUsedAt = jsonInt64Either(obj, "last_used_at", "lastUsedAt", 0);
    p.cooldownUntil = jsonInt64Either(obj, "cooldown_until", "cooldownUntil", 0);
    p.cooldownDurationSecs = cooldownSeconds(
        jsonInt64Either(obj, "cooldown_duration", "cooldownDuration", kDefaultCooldownSeconds),
        kDefaultCooldownSeconds);
    p.customHeaders = headersFromJson(jsonValueEither(obj, "custom_headers", "customHeaders"));
    p.modelMapping = modelMappingFromJson(jsonValueEither(obj, "model_mapping", "modelMapping"));

    for (const QJsonValue& value : endpointArray(obj)) {
        const QJsonObject e = value.toObject();
        ProviderEndpoint ep;
        ep.url = e.value(QStringLiteral("url")).toString().trimmed();
        ep.apiKey = decodeApiKey(jsonStringEither(e, "api_key", "apiKey").trimmed());
        ep.urlPriority = jsonIntEither(e, "url_priority", "urlPriority", 0);
        ep.urlLatencyMs = jsonInt64Either(e, "url_latency_ms", "urlLatencyMs", -1);
        ep.cooldownUntil = jsonInt64Either(e, "cooldown_until", "cooldownUntil", 0);
        p.endpoints.append(ep);
    }
    return p;
}

QJsonObject ConfigStore::providerToJson(const Provider& p)
{
    QJsonObject obj;
    obj["id"] = p.id;
    obj["name"] = p.name;
    obj["family"] = app_family::name(p.family);
    obj["group"] = p.group;
    obj["enabled"] = p.enabled;
    obj["rotation_tier"] = p.rotationTier;
    obj["group_priority"] = p.groupPriority;
    obj["sort_index"] = p.sortIndex;
    obj["cooldown_duration"] = p.cooldownDurationSecs;
    obj["usage_count"] = p.usageCount;
    obj["last_used_at"] = p.lastUsedAt;
    obj["cooldown_until"] = p.cooldownUntil;
    if (!p.customHeaders.isEmpty())
        obj["custom_headers"] = headersToJson(p.customHeaders);
    if (!p.modelMapping.isEmpty())
        obj["model_mapping"] = modelMappingToJson(p.modelMapping);

    QJsonArray endpoints;
    for (const ProviderEndpoint& ep : p.endpoints) {
        QJsonObject e;
        e["url"] = ep.url;
        e["api_key"] = encodeApiKey(ep.apiKey);
        e["url_priority"] = ep.urlPriority;
        e["url_latency_ms"] = ep.urlLatencyMs;
        e["cooldown_until"] = ep.cooldownUntil;
        endpoints.append(e);
    }
    obj["endpoints"] = endpoints;
    return obj;
}

QList<Provider> ConfigStore::providers()
{
    QList<Provider> list;
    const QJsonArray array = m_root.value(QStringLiteral("providers")).toArray();
    for (int i = 0; i < array.size(); ++i) {
        const QJsonObject obj = array.at(i).toObject();
        const auto provider = providerFromJson(obj, i);
        if (!provider) {
            const QString id = obj.value(QStringLiteral("id")).toString();
            if (!m_reportedInvalid.contains(id)) {
                m_reportedInvalid.insert(id);
                LOG_WARNING(QStringLiteral("ConfigStore: config_invalid: provider '%1' has unknown family '%2', skipped")
                                .arg(id, obj.value(QStringLiteral("family")).toString()));
            }
            continue;
        }
        list.append(*provider);
    }
    return list;
}

void ConfigStore::setActiveProviders(const QMap<AppFamily, QString>& active)
{
    bool changed = false;
    for (auto it = active.cbegin(); it != active.cend(); ++it) {
        if (it.value().isEmpty() || m_config.families.value(it.key()).activeProvider == it.value())
            continue;
        m_config.families[it.key()].activeProvider = it.value();
        changed = true;
    }
    if (changed)
        save();
}

VoidResult ConfigStore::requireFreshDocument()
{
    if (m_filePath.isEmpty())
        return std::unexpected(DomainFailure::configInvalid(
            QStringLiteral("no_config_file"), QStringLiteral("configuration was never loaded")));
    if (QFileInfo::exists(m_filePath) && !reload())
        return std::unexpected(DomainFailure::configInvalid(
            QStringLiteral("config_unreadable"), QStringLiteral("cannot read %1").arg(m_filePath)));
    return {};
}

bool ConfigStore::writeProviders(const QJsonArray& providers)
{
    m_root["providers"] = providers;
    return save();
}

Result<QList<Provider>> ConfigStore::loadProviders()
{
    if (auto fresh = requireFreshDocument(); !fresh)
        return std::unexpected(fresh.error());
    return providers();
}

VoidResult ConfigStore::storeRuntimeState(const QList<ProviderRuntimeState>& states)
{
    // Providers added by the CLI since the last read must survive this write.
    if (auto fresh = requireFreshDocument(); !fresh)
        return fresh;

    QHash<QString, ProviderRuntimeState> byId;
    for (const ProviderRuntimeState& state : states)
        byId.insert(state.id, state);

    const QJsonArray original = m_root.value(QStringLiteral("providers")).toArray();
    QJsonArray updated;
    for (const QJsonValue& value : original) {
        QJsonObject obj = value.toObject();
        const auto state = byId.constFind(obj.value(QStringLiteral("id")).toString());
        if (state == byId.cend()) {
            updated.append(obj);
            continue;
        }

        obj["usage_count"] = state->usageCount;
        obj["last_used_at"] = state->lastUsedAt;
        obj["cooldown_until"] = state->cooldownUntil;

        QJsonArray endpoints = endpointArray(obj);
        obj.remove(QStringLiteral("url"));
        obj.remove(QStringLiteral("api_key"));
        obj.remove(QStringLiteral("apiKey"));
        for (int i = 0; i < endpoints.size(); ++i) {
            QJsonObject e = endpoints.at(i).toObject();
            const QString url = e.value(QStringLiteral("url")).toString().trimmed();
            const QString key = decodeApiKey(jsonStringEither(e, "api_key", "apiKey").trimmed());
            for (const EndpointRuntimeState& es : state->endpoints) {
                if (es.url == url && es.apiKey == key) {
                    e["url_latency_ms"] = es.urlLatencyMs;
                    e["cooldown_until"] = es.cooldownUntil;
                    break;
                }
            }
            endpoints[i] = e;
        }
        obj["endpoints"] = endpoints;
        updated.append(obj);
    }

    if (updated == original)
        return {};
    if (!writeProviders(updated))
        return std::unexpected(DomainFailure::configInvalid(
            QStringLiteral("config_unwritable"), QStringLiteral("cannot write %1").arg(m_filePath)));
    return {};
}

VoidResult ConfigStore::addProviders(const QList<Provider>& providers)
{
    if (auto fresh = requireFreshDocument(); !fresh)
        return fresh;

    QJsonArray array = m_root.value(QStringLiteral("providers")).toArray();
    QSet<QString> ids;
    for (const QJsonValue& value : std::as_const(array))
        ids.insert(value.toObject().value(QStringLiteral("id")).toString());

    for (const Provider& p : providers) {
        if (ids.contains(p.id))
            return std::unexpected(DomainFailure::configInvalid(
                QStringLiteral("duplicate_id"), QStringLiteral("provider id '%1' already exists").arg(p.id)));
        ids.insert(p.id);
    }
    for (const Provider& p : providers)
        array.append(providerToJson(p));

    if (!writeProviders(array))
        return std::unexpected(DomainFailure::configInvalid(
            QStringLiteral("config_unwritable"), QStringLiteral("cannot write %1").arg(m_filePath)));
    LOG_INFO(QStringLiteral("ConfigStore: %1 provider(s) added").arg(providers.size()));
    return {};
}

Result<QList<Provider>> ConfigStore::addProviderBatch(const ProviderBatch& batch)
{
    if (auto fresh = requireFreshDocument(); !fresh)
        return std::unexpected(fresh.error());

    auto expanded = provider_batch::expand(batch, providers());
    if (!expanded)
        return expanded;
    if (auto added = addProviders(*expanded); !added)
        return std::unexpected(added.error());
    return expanded;
}

VoidResult ConfigStore::setProviderCooldown(const QString& providerId, qint64 untilMs)
{
    if (auto fresh = requireFreshDocument(); !fresh)
        return fresh;

    QJsonArray array = m_root.value(QStringLiteral("providers")).toArray();
    for (int i = 0; i < array.size(); ++i) {
        QJsonObject obj = array.at(i).toObject();
        if (obj.value(QStringLiteral("id")).toString() != providerId)
            continue;
        obj["cooldown_until"] = untilMs;
        array[i] = obj;
        if (!writeProviders(array))
            return std::unexpected(DomainFailure::configInvalid(
                QStringLiteral("config_unwritable"), QStringLiteral("cannot write %1").arg(m_filePath)));
        return {};
    }
    return std::unexpected(DomainFailure::notFound(QStringLiteral("unknown provider '%1'").arg(providerId)));
}

VoidResult ConfigStore::clearProviderCooldown(const QString& providerId)
{
    if (auto fresh = requireFreshDocument(); !fresh)
        return fresh;

    QJsonArray array = m_root.value(QStringLiteral("providers")).toArray();
    for (int i = 0; i < array.size(); ++i) {
        QJsonObject obj = array.at(i).toObject();
        if (obj.value(QStringLiteral("id")).toString() != providerId)
            continue;
        obj["cooldown_until"] = 0;
        QJsonArray endpoints = obj.value(QStringLiteral("endpoints")).toArray();
        for (int j = 0; j < endpoints.size(); ++j) {
            QJsonObject e = endpoints.at(j).toObject();
            e["cooldown_until"] = 0;
            endpoints[j] = e;
        }
        if (!endpoints.isEmpty())
            obj["endpoints"] = endpoints;
        array[i] = obj;
        if (!writeProviders(array))
            return std::unexpected(DomainFailure::configInvalid(
                QStringLiteral("config_unwritable"), QStringLiteral("cannot write %1").arg(m_filePath)));
        return {};
    }
    return std::unexpected(DomainFailure::notFound(QStringLiteral("unknown provider '%1'").arg(providerId)));
}

VoidResult ConfigStore::removeProvider(const QString& providerId)
{
    if (auto fresh = requireFreshDocument(); !fresh)
        return fresh;

    QJsonArray array = m_root.value(QStringLiteral("providers")).toArray();
    for (int i = 0; i < array.size(); ++i) {
        if (array.at(i).toObject().value(QStringLiteral("id")).toString() != providerId)
            continue;
        array.removeAt(i);
        for (auto it = m_config.families.begin(); it != m_config.families.end(); ++it) {
            if (it->activeProvider == providerId)
                it->activeProvider.clear();
        }
        if (!writeProviders(array))
            return std::unexpected(DomainFailure::configInvalid(
                QStringLiteral("config_unwritable"), QStringLiteral("cannot write %1").arg(m_filePath)));
        LOG_INFO(QStringLiteral("ConfigStore: provider '%1' removed").arg(providerId));
        return {};
    }
    return std::unexpected(DomainFailure::notFound(QStringLiteral("unknown provider '%1'").arg(providerId)));
}
