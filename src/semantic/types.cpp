#include "types.h"

namespace app_family {

QString name(AppFamily family)
{
    switch (family) {
    case AppFamily::Claude: return QStringLiteral("claude");
    case AppFamily::Codex:  return QStringLiteral("codex");
    case AppFamily::Gemini: return QStringLiteral("gemini");
    }
    return QString();
}

std::optional<AppFamily> fromName(const QString& name)
{
    const QString key = name.trimmed().toLower();
    for (AppFamily family : all()) {
        if (app_family::name(family) == key)
            return family;
    }
    // Aliases accepted from hand-written configuration files.
    if (key == QStringLiteral("anthropic"))
        return AppFamily::Claude;
    if (key == QStringLiteral("openai"))
        return AppFamily::Codex;
    return std::nullopt;
}

const QList<AppFamily>& all()
{
    static const QList<AppFamily> families = {
        AppFamily::Claude, AppFamily::Codex, AppFamily::Gemini
    };
    return families;
}

}

QString errorKindName(ErrorKind kind)
{
    switch (kind) {
    case ErrorKind::NetworkFailure:   return QStringLiteral("network_failure");
    case ErrorKind::AuthFailure:      return QStringLiteral("auth_failure");
    case ErrorKind::WafChallenge:     return QStringLiteral("waf_challenge");
    case ErrorKind::RateLimited:      return QStringLiteral("rate_limited");
    case ErrorKind::UpstreamRejected: return QStringLiteral("upstream_rejected");
    case ErrorKind::Exhausted:        return QStringLiteral("exhausted");
    case ErrorKind::ConfigInvalid:    return QStringLiteral("config_invalid");
    case ErrorKind::InvalidInput:     return QStringLiteral("invalid_input");
    case ErrorKind::Cancelled:        return QStringLiteral("cancelled");
    case ErrorKind::Internal:         return QStringLiteral("internal");
    }
    return QStringLiteral("internal");
}
