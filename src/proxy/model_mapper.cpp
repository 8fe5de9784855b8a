#include "model_mapper.h"
#include <QJsonDocument>
#include <QRegularExpression>
#include <QStringList>

namespace {

QString claudeTier(const QString& lower)
{
    for (const char* tier : {"haiku", "sonnet", "opus"}) {
        if (lower.contains(QLatin1String(tier)))
            return QString::fromLatin1(tier);
    }
    return QString();
}

bool isAllDigits(const QString& s)
{
    if (s.isEmpty())
        return false;
    for (const QChar c : s) {
        if (c < QLatin1Char('0') || c > QLatin1Char('9'))
            return false;
    }
    return true;
}

bool isYear(const QString& s)
{
    if (s.size() != 4 || !isAllDigits(s))
        return false;
    const int year = s.toInt();
    return year >= 2000 && year <= 2099;
}

bool isCompactDate(const QString& s)
{
    return s.size() == 8 && isAllDigits(s) && s.startsWith(QStringLiteral("20"));
}

// Legacy OpenAI snapshot suffix such as 0613 or 1106.
bool isMonthDayCode(const QString& s)
{
    if (s.size() != 4 || !isAllDigits(s))
        return false;
    const int month = s.left(2).toInt();
    const int day = s.mid(2).toInt();
    return month >= 1 && month <= 12 && day >= 1 && day <= 31;
}

}

namespace model_mapper {

ModelVendor detectVendor(const QString& modelId)
{
    QString s = modelId.trimmed().toLower();
    if (s.isEmpty())
        return ModelVendor::Other;
    // anthropic/claude-*, openai/gpt-*, google/gemini-*
    s = s.section(QLatin1Char('/'), -1);

    if (s.contains(QStringLiteral("claude")))
        return ModelVendor::Claude;
    if (s.startsWith(QStringLiteral("gpt-")) || s == QStringLiteral("chatgpt")
        || s.startsWith(QStringLiteral("o1")) || s.startsWith(QStringLiteral("o3"))
        || s.startsWith(QStringLiteral("o4")) || s.startsWith(QStringLiteral("o5")))
        return ModelVendor::OpenAi;
    if (s.contains(QStringLiteral("gemini")))
        return ModelVendor::Gemini;
    if (s.contains(QStringLiteral("llama")))
        return ModelVendor::Llama;
    if (s.contains(QStringLiteral("qwen")))
        return ModelVendor::Qwen;
    if (s.contains(QStringLiteral("mistral")) || s.contains(QStringLiteral("mixtral")))
        return ModelVendor::Mistral;
    if (s.contains(QStringLiteral("deepseek")))
        return ModelVendor::DeepSeek;
    if (s.contains(QStringLiteral("grok")))
        return ModelVendor::Grok;
    if (s.contains(QStringLiteral("phi-")) || s.startsWith(QStringLiteral("phi")))
        return ModelVendor::Phi;
    if (s.contains(QStringLiteral("gemma")))
        return ModelVendor::Gemma;
    if (s.contains(QStringLiteral("glm")))
        return ModelVendor::Glm;
    if (s.contains(QStringLiteral("kimi")) || s.contains(QStringLiteral("moonshot")))
        return ModelVendor::Kimi;
    if (s.contains(QStringLiteral("yi-")) || s.contains(QStringLiteral("01-ai")))
        return ModelVendor::Yi;
    if (s.contains(QStringLiteral("command")))
        return ModelVendor::Command;
    if (s.contains(QStringLiteral("jamba")))
        return ModelVendor::Jamba;
    return ModelVendor::Other;
}

bool sameVendor(const QString& requested, const QString& candidate)
{
    const ModelVendor vendor = detectVendor(requested);
    return vendor == ModelVendor::Other || vendor == detectVendor(candidate);
}

bool thinkingEnabled(const QJsonObject& body)
{
    return body.value(QStringLiteral("thinking")).toObject()
               .value(QStringLiteral("type")).toString() == QStringLiteral("enabled");
}

QString mapModel(const ModelMapping& mapping, const QString& requested, bool thinking)
{
    const QString lower = requested.toLower();
    const QString tier = claudeTier(lower);
    const bool claude = detectVendor(requested) == ModelVendor::Claude;

    const auto acceptable = [&](const QString& mapped) {
        if (mapped.isEmpty() || !sameVendor(requested, mapped))
            return false;
        if (claude && !tier.isEmpty()) {
            const QString mappedLower = mapped.toLower();
            return claudeTier(mappedLower).isEmpty() || mappedLower.contains(tier);
        }
        return true;
    };

    if (thinking && acceptable(mapping.reasoning))
        return mapping.reasoning;
    if (lower.contains(QStringLiteral("haiku")) && acceptable(mapping.haiku))
        return mapping.haiku;
    if (lower.contains(QStringLiteral("opus")) && acceptable(mapping.opus))
        return mapping.opus;
    if (lower.contains(QStringLiteral("sonnet")) && acceptable(mapping.sonnet))
        return mapping.sonnet;
    if (acceptable(mapping.defaultModel))
        return mapping.defaultModel;
    return requested;
}

QString stripGptDate(const QString& model)
{
    const QString trimmed = model.trimmed();
    const QString lower = trimmed.toLower();
    if (!lower.startsWith(QStringLiteral("gpt-")))
        return trimmed;

    const QStringList parts = trimmed.split(QLatin1Char('-'));
    for (int i = 1; i < parts.size(); ++i) {
        const QString& part = parts.at(i);
        if (isCompactDate(part) || isYear(part) || isMonthDayCode(part))
            return parts.mid(0, i).join(QLatin1Char('-'));
    }

    const int datePos = lower.indexOf(QStringLiteral("-202"));
    return datePos >= 0 ? trimmed.left(datePos) : trimmed;
}

QByteArray applyToBody(const QByteArray& body, const ModelMapping& mapping, AppFamily family)
{
    const bool sanitize = family == AppFamily::Codex;
    if (mapping.isEmpty() && !sanitize)
        return body;

    QJsonParseError parseError;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject())
        return body;

    QJsonObject root = doc.object();
    const QJsonValue model = root.value(QStringLiteral("model"));
    if (!model.isString())
        return body;

    const QString requested = model.toString();
    QString mapped = mapModel(mapping, requested, thinkingEnabled(root));
    if (sanitize)
        mapped = stripGptDate(mapped);
    if (mapped == requested)
        return body;

    root[QStringLiteral("model")] = mapped;
    return QJsonDocument(root).toJson(QJsonDocument::Compact);
}

QString applyToPath(const QString& path, const ModelMapping& mapping)
{
    if (mapping.isEmpty())
        return path;

    static const QRegularExpression pattern(QStringLiteral("/models/([^/:?]+)"));
    const QRegularExpressionMatch match = pattern.match(path);
    if (!match.hasMatch())
        return path;

    const QString mapped = mapModel(mapping, match.captured(1), false);
    if (mapped == match.captured(1))
        return path;
    QString result = path;
    result.replace(match.capturedStart(1), match.capturedLength(1), mapped);
    return result;
}

}
