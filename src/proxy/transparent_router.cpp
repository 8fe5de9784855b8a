#include "transparent_router.h"
#include "model_mapper.h"
#include <QJsonArray>
#include <QJsonDocument>
#include <QRegularExpression>
#include <QUrl>
#include <QUrlQuery>

namespace {

const char* const kAnthropicVersion = "2023-06-01";

struct SystemBlock {
    QString text;
    QJsonObject raw;   // original content part, keeps cache_control and friends
};

QList<SystemBlock> blocksFromValue(const QJsonValue& value)
{
    QList<SystemBlock> blocks;
    if (value.isString()) {
        if (!value.toString().isEmpty())
            blocks.append({value.toString(), QJsonObject()});
    } else if (value.isArray()) {
        for (const QJsonValue& item : value.toArray()) {
            if (item.isString()) {
                blocks.append({item.toString(), QJsonObject()});
            } else if (item.isObject()) {
                const QJsonObject part = item.toObject();
                if (part.contains(QStringLiteral("text")))
                    blocks.append({part.value(QStringLiteral("text")).toString(), part});
            }
        }
    } else if (value.isObject()) {
        // Gemini Content object
        const QJsonObject content = value.toObject();
        if (content.contains(QStringLiteral("parts"))) {
            for (const QJsonValue& part : content.value(QStringLiteral("parts")).toArray()) {
                const QString text = part.toObject().value(QStringLiteral("text")).toString();
                if (!text.isEmpty())
                    blocks.append({text, QJsonObject()});
            }
        } else if (content.contains(QStringLiteral("text"))) {
            blocks.append({content.value(QStringLiteral("text")).toString(), QJsonObject()});
        }
    }
    return blocks;
}

QList<SystemBlock> takeField(QJsonObject& root, const QString& key)
{
    if (!root.contains(key))
        return {};
    const QList<SystemBlock> blocks = blocksFromValue(root.value(key));
    root.remove(key);
    return blocks;
}

QList<SystemBlock> peekSystemMessages(const QJsonObject& root)
{
    QList<SystemBlock> blocks;
    for (const QJsonValue& m : root.value(QStringLiteral("messages")).toArray()) {
        const QJsonObject msg = m.toObject();
        if (msg.value(QStringLiteral("role")).toString() == QStringLiteral("system"))
            blocks += blocksFromValue(msg.value(QStringLiteral("content")));
    }
    return blocks;
}

QList<SystemBlock> takeSystemMessages(QJsonObject& root)
{
    const QJsonValue messages = root.value(QStringLiteral("messages"));
    if (!messages.isArray())
        return {};

    QList<SystemBlock> blocks;
    QJsonArray kept;
    const QJsonArray original = messages.toArray();
    for (const QJsonValue& m : original) {
        const QJsonObject msg = m.toObject();
        if (msg.value(QStringLiteral("role")).toString() == QStringLiteral("system"))
            blocks += blocksFromValue(msg.value(QStringLiteral("content")));
        else
            kept.append(m);
    }
    if (kept.size() != original.size())
        root[QStringLiteral("messages")] = kept;
    return blocks;
}

QString joinTexts(const QList<SystemBlock>& blocks)
{
    QStringList texts;
    for (const SystemBlock& b : blocks)
        texts.append(b.text);
    return texts.join(QStringLiteral("\n\n"));
}

bool applyOverride(QList<SystemBlock>& blocks, const SystemPromptOverride& override)
{
    if (!override.isActive())
        return false;

    switch (override.mode) {
    case SystemPromptMode::Replace:
        if (blocks.isEmpty()) {
            blocks.append({override.text, QJsonObject()});
            return true;
        }
        if (blocks.first().text == override.text)
            return false;
        blocks.first().text = override.text;
        return true;
    case SystemPromptMode::Prepend:
        blocks.prepend({override.text, QJsonObject()});
        return true;
    case SystemPromptMode::InsertIfMissing: {
        const QString keyword = override.keyword.isEmpty() ? override.text : override.keyword;
        for (const SystemBlock& b : blocks) {
            if (b.text.contains(keyword))
                return false;
        }
        blocks.prepend({override.text, QJsonObject()});
        return true;
    }
    }
    return false;
}

QJsonArray claudeBlocks(const QList<SystemBlock>& blocks)
{
    QJsonArray array;
    for (const SystemBlock& b : blocks) {
        QJsonObject part = b.raw.value(QStringLiteral("type")).toString() == QStringLiteral("text")
            ? b.raw : QJsonObject();
        part[QStringLiteral("type")] = QStringLiteral("text");
        part[QStringLiteral("text")] = b.text;
        array.append(part);
    }
    return array;
}

QString modelFromPath(const QString& path)
{
    static const QRegularExpression pattern(QStringLiteral("/models/([^/:?]+)"));
    const auto m = pattern.match(path);
    return m.hasMatch() ? m.captured(1) : QString();
}

bool isCodexResponsesApi(const QJsonObject& root)
{
    return !root.contains(QStringLiteral("messages")) && root.contains(QStringLiteral("input"));
}

QString defaultProbeModel(AppFamily family)
{
    switch (family) {
    case AppFamily::Claude: return QStringLiteral("claude-3-5-haiku-latest");
    case AppFamily::Codex:  return QStringLiteral("gpt-4o-mini");
    case AppFamily::Gemini: return QStringLiteral("gemini-2.0-flash");
    }
    return QString();
}

void applyCredential(QMap<QString, QString>& headers, AppFamily family, const QString& apiKey)
{
    headers.remove(QStringLiteral("authorization"));
    headers.remove(QStringLiteral("x-api-key"));
    headers.remove(QStringLiteral("x-goog-api-key"));

    switch (family) {
    case AppFamily::Claude:
        // Relay services handing out "Bearer ..." tokens expect Authorization.
        if (apiKey.startsWith(QStringLiteral("Bearer "), Qt::CaseInsensitive))
            headers[QStringLiteral("authorization")] = apiKey;
        else
            headers[QStringLiteral("x-api-key")] = apiKey;
        if (!headers.contains(QStringLiteral("anthropic-version")))
            headers[QStringLiteral("anthropic-version")] = QString::fromLatin1(kAnthropicVersion);
        break;
    case AppFamily::Codex:
        headers[QStringLiteral("authorization")] =
            apiKey.startsWith(QStringLiteral("Bearer "), Qt::CaseInsensitive)
                ? apiKey : QStringLiteral("Bearer ") + apiKey;
        break;
    case AppFamily::Gemini:
        headers[QStringLiteral("x-goog-api-key")] = apiKey;
        break;
    }
}

void applyProviderHeaders(QMap<QString, QString>& headers, const Provider& provider)
{
    for (auto it = provider.customHeaders.cbegin(); it != provider.customHeaders.cend(); ++it)
        headers[it.key().toLower()] = it.value();
}

}

TransparentRouter::TransparentRouter()
{
    m_router.registerDefaults();
}

bool TransparentRouter::isForwardedHeader(const QString& lowerName)
{
    static const QStringList allowed = {
        QStringLiteral("accept"),
        QStringLiteral("user-agent"),
        QStringLiteral("x-request-id"),
        QStringLiteral("anthropic-version"),
        QStringLiteral("anthropic-beta"),
        QStringLiteral("content-type"),
    };
    return allowed.contains(lowerName) || lowerName.startsWith(QStringLiteral("x-stainless-"));
}

std::optional<AppFamily> TransparentRouter::detectFromShape(const InboundRequest& request)
{
    if (request.headers.contains(QStringLiteral("anthropic-version"))
        || request.headers.contains(QStringLiteral("x-api-key")))
        return AppFamily::Claude;
    if (request.headers.contains(QStringLiteral("x-goog-api-key"))
        || request.path.contains(QStringLiteral(":generateContent"))
        || request.path.contains(QStringLiteral(":streamGenerateContent")))
        return AppFamily::Gemini;

    const QString path = request.path.section(QLatin1Char('?'), 0, 0);
    if (path.endsWith(QStringLiteral("/responses")))
        return AppFamily::Codex;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(request.body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
        return std::nullopt;
    const QJsonObject root = doc.object();

    if (root.contains(QStringLiteral("contents"))
        || root.contains(QStringLiteral("systemInstruction"))
        || root.contains(QStringLiteral("generationConfig")))
        return AppFamily::Gemini;
    if (root.contains(QStringLiteral("anthropic_version")))
        return AppFamily::Claude;
    if (isCodexResponsesApi(root))
        return AppFamily::Codex;
    if (root.value(QStringLiteral("messages")).isArray()) {
        if (!peekSystemMessages(root).isEmpty())
            return AppFamily::Codex;
        if (root.contains(QStringLiteral("system")))
            return AppFamily::Claude;
        return AppFamily::Codex;
    }
    return std::nullopt;
}

Result<AppFamily> TransparentRouter::classify(const InboundRequest& request) const
{
    if (const auto route = m_router.match(request.path))
        return route->route.family;
    if (const auto family = detectFromShape(request))
        return *family;
    return std::unexpected(DomainFailure::invalidInput(
        QStringLiteral("unknown_family"),
        QStringLiteral("cannot determine the API family of %1 %2").arg(request.method, request.path)));
}

QByteArray TransparentRouter::relocateSystemInstructions(const QByteArray& body, AppFamily target,
                                                         const SystemPromptOverride& override)
{
    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
        return body;

    QJsonObject root = doc.object();
    QList<SystemBlock> native;
    QList<SystemBlock> foreign;
    bool nativeWasArray = false;
    const bool responsesApi = isCodexResponsesApi(root);
    QString geminiKey = QStringLiteral("systemInstruction");

    switch (target) {
    case AppFamily::Claude:
        nativeWasArray = root.value(QStringLiteral("system")).isArray();
        native = blocksFromValue(root.value(QStringLiteral("system")));
        foreign += takeSystemMessages(root);
        foreign += takeField(root, QStringLiteral("systemInstruction"));
        foreign += takeField(root, QStringLiteral("system_instruction"));
        foreign += takeField(root, QStringLiteral("instructions"));
        break;
    case AppFamily::Codex:
        if (responsesApi) {
            native = blocksFromValue(root.value(QStringLiteral("instructions")));
        } else {
            native = peekSystemMessages(root);
            foreign += takeField(root, QStringLiteral("instructions"));
        }
        foreign += takeField(root, QStringLiteral("system"));
        foreign += takeField(root, QStringLiteral("systemInstruction"));
        foreign += takeField(root, QStringLiteral("system_instruction"));
        break;
    case AppFamily::Gemini:
        if (root.contains(QStringLiteral("system_instruction"))
            && !root.contains(QStringLiteral("systemInstruction")))
            geminiKey = QStringLiteral("system_instruction");
        native = blocksFromValue(root.value(geminiKey));
        foreign += takeField(root, QStringLiteral("system"));
        foreign += takeSystemMessages(root);
        foreign += takeField(root, QStringLiteral("instructions"));
        break;
    }

    QList<SystemBlock> merged = native + foreign;
    const bool overridden = applyOverride(merged, override);
    if (foreign.isEmpty() && !overridden)
        return body;

    switch (target) {
    case AppFamily::Claude:
        if (merged.isEmpty())
            root.remove(QStringLiteral("system"));
        else if (!nativeWasArray && merged.size() == 1 && merged.first().raw.isEmpty())
            root[QStringLiteral("system")] = merged.first().text;
        else
            root[QStringLiteral("system")] = claudeBlocks(merged);
        break;
    case AppFamily::Codex:
        if (responsesApi) {
            root[QStringLiteral("instructions")] = joinTexts(merged);
        } else {
            takeSystemMessages(root);
            QJsonArray messages = root.value(QStringLiteral("messages")).toArray();
            if (!merged.isEmpty()) {
                QJsonObject system;
                system[QStringLiteral("role")] = QStringLiteral("system");
                system[QStringLiteral("content")] = joinTexts(merged);
                messages.prepend(system);
            }
            root[QStringLiteral("messages")] = messages;
        }
        break;
    case AppFamily::Gemini: {
        QJsonArray parts;
        for (const SystemBlock& b : merged) {
            QJsonObject part;
            part[QStringLiteral("text")] = b.text;
            parts.append(part);
        }
        QJsonObject content;
        content[QStringLiteral("parts")] = parts;
        root[geminiKey] = content;
        break;
    }
    }

    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

RoutedRequest TransparentRouter::rewrite(const InboundRequest& request, AppFamily target,
                                         const RewriteRules& rules) const
{
    RoutedRequest routed;
    routed.family = target;
    routed.method = request.method.isEmpty() ? QStringLiteral("POST") : request.method.toUpper();

    const auto route = m_router.match(request.path);
    routed.upstreamPath = (route && route->route.family == target) ? route->upstreamPath : request.path;
    if (!routed.upstreamPath.startsWith(QLatin1Char('/')))
        routed.upstreamPath.prepend(QLatin1Char('/'));

    for (auto it = request.headers.cbegin(); it != request.headers.cend(); ++it) {
        const QString name = it.key().toLower();
        if (isForwardedHeader(name))
            routed.headers[name] = it.value();
    }
    for (auto it = rules.customHeaders.cbegin(); it != rules.customHeaders.cend(); ++it)
        routed.headers[it.key().toLower()] = it.value();

    routed.body = relocateSystemInstructions(request.body, target, rules.systemPrompt);

    const QJsonObject root = QJsonDocument::fromJson(routed.body).object();
    routed.model = root.value(QStringLiteral("model")).toString();
    if (routed.model.isEmpty())
        routed.model = modelFromPath(routed.upstreamPath);
    routed.stream = root.value(QStringLiteral("stream")).toBool(false)
        || routed.upstreamPath.contains(QStringLiteral(":streamGenerateContent"));
    return routed;
}

QString TransparentRouter::joinUrl(const QString& base, const QString& pathWithQuery)
{
    QString trimmedBase = base.trimmed();
    while (trimmedBase.endsWith(QLatin1Char('/')))
        trimmedBase.chop(1);

    QString path = pathWithQuery;
    if (!path.startsWith(QLatin1Char('/')))
        path.prepend(QLatin1Char('/'));
    const int queryStart = path.indexOf(QLatin1Char('?'));
    const QString query = queryStart >= 0 ? path.mid(queryStart) : QString();
    if (queryStart >= 0)
        path = path.left(queryStart);

    // https://host/v1 + /v1/messages -> https://host/v1/messages
    const QString lastSegment = QUrl(trimmedBase).path().section(QLatin1Char('/'), -1);
    const QString firstSegment = path.section(QLatin1Char('/'), 1, 1);
    if (!lastSegment.isEmpty() && lastSegment == firstSegment)
        path = path.mid(1 + firstSegment.size());

    return trimmedBase + path + query;
}

ProviderRequest TransparentRouter::bindCandidate(const RoutedRequest& routed, const Candidate& candidate)
{
    const ProviderEndpoint& ep = candidate.endpoint();

    QString path = routed.upstreamPath;
    if (routed.family == AppFamily::Gemini && path.contains(QLatin1Char('?'))) {
        // The caller's ?key= must not leak upstream.
        QUrlQuery query(path.section(QLatin1Char('?'), 1));
        query.removeAllQueryItems(QStringLiteral("key"));
        path = path.section(QLatin1Char('?'), 0, 0);
        const QString rest = query.toString(QUrl::FullyEncoded);
        if (!rest.isEmpty())
            path += QLatin1Char('?') + rest;
    }
    const ModelMapping& mapping = candidate.provider.modelMapping;
    if (routed.family == AppFamily::Gemini)
        path = model_mapper::applyToPath(path, mapping);

    ProviderRequest req;
    req.method = routed.method;
    req.url = joinUrl(ep.url, path);
    req.headers = routed.headers;
    applyCredential(req.headers, routed.family, ep.apiKey);
    applyProviderHeaders(req.headers, candidate.provider);
    if (!routed.body.isEmpty() && !req.headers.contains(QStringLiteral("content-type")))
        req.headers[QStringLiteral("content-type")] = QStringLiteral("application/json");
    req.body = routed.family == AppFamily::Gemini
        ? routed.body
        : model_mapper::applyToBody(routed.body, mapping, routed.family);
    req.stream = routed.stream;
    return req;
}

ProviderRequest TransparentRouter::buildProbe(const RoutedRequest& routed, const Candidate& candidate,
                                              const ProbeOptions& options)
{
    QString model = model_mapper::mapModel(candidate.provider.modelMapping,
        routed.model.isEmpty() ? defaultProbeModel(routed.family) : routed.model, false);
    if (routed.family == AppFamily::Codex)
        model = model_mapper::stripGptDate(model);
    const int maxTokens = qMax(1, options.maxTokens);

    QJsonObject body;
    QString path;
    switch (routed.family) {
    case AppFamily::Claude: {
        path = QStringLiteral("/v1/messages");
        QJsonObject message;
        message[QStringLiteral("role")] = QStringLiteral("user");
        message[QStringLiteral("content")] = options.prompt;
        body[QStringLiteral("model")] = model;
        body[QStringLiteral("max_tokens")] = maxTokens;
        body[QStringLiteral("messages")] = QJsonArray{message};
        break;
    }
    case AppFamily::Codex:
        body[QStringLiteral("model")] = model;
        if (routed.upstreamPath.section(QLatin1Char('?'), 0, 0).endsWith(QStringLiteral("/responses"))) {
            path = QStringLiteral("/v1/responses");
            body[QStringLiteral("input")] = options.prompt;
            // The Responses API rejects max_output_tokens below 16.
            body[QStringLiteral("max_output_tokens")] = qMax(16, maxTokens);
        } else {
            path = QStringLiteral("/v1/chat/completions");
            QJsonObject message;
            message[QStringLiteral("role")] = QStringLiteral("user");
            message[QStringLiteral("content")] = options.prompt;
            body[QStringLiteral("max_tokens")] = maxTokens;
            body[QStringLiteral("messages")] = QJsonArray{message};
        }
        break;
    case AppFamily::Gemini: {
        path = QStringLiteral("/v1beta/models/%1:generateContent").arg(model);
        QJsonObject part;
        part[QStringLiteral("text")] = options.prompt;
        QJsonObject content;
        content[QStringLiteral("role")] = QStringLiteral("user");
        content[QStringLiteral("parts")] = QJsonArray{part};
        QJsonObject generation;
        generation[QStringLiteral("maxOutputTokens")] = maxTokens;
        body[QStringLiteral("contents")] = QJsonArray{content};
        body[QStringLiteral("generationConfig")] = generation;
        break;
    }
    }

    ProviderRequest req;
    req.method = QStringLiteral("POST");
    req.url = joinUrl(candidate.endpoint().url, path);
    req.headers[QStringLiteral("content-type")] = QStringLiteral("application/json");
    if (routed.headers.contains(QStringLiteral("user-agent")))
        req.headers[QStringLiteral("user-agent")] = routed.headers.value(QStringLiteral("user-agent"));
    if (routed.family == AppFamily::Claude && routed.headers.contains(QStringLiteral("anthropic-version")))
        req.headers[QStringLiteral("anthropic-version")] = routed.headers.value(QStringLiteral("anthropic-version"));
    applyCredential(req.headers, routed.family, candidate.endpoint().apiKey);
    applyProviderHeaders(req.headers, candidate.provider);
    req.body = QJsonDocument(body).toJson(QJsonDocument::Compact);
    return req;
}
