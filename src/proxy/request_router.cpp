#include "request_router.h"
#include "core/log_manager.h"

void RequestRouter::registerDefaults()
{
    m_routes.clear();

    // Family-scoped prefixes, stripped before forwarding
    addRoute({QStringLiteral("/claude/*"), AppFamily::Claude, QStringLiteral("/claude")});
    addRoute({QStringLiteral("/codex/*"), AppFamily::Codex, QStringLiteral("/codex")});
    addRoute({QStringLiteral("/gemini/*"), AppFamily::Gemini, QStringLiteral("/gemini")});

    // Native API surfaces
    addRoute({QStringLiteral("/v1/messages"), AppFamily::Claude, QString()});
    addRoute({QStringLiteral("/v1/chat/completions"), AppFamily::Codex, QString()});
    addRoute({QStringLiteral("/v1beta/*"), AppFamily::Gemini, QString()});

    LOG_DEBUG(QStringLiteral("RequestRouter: registered %1 default routes")
                  .arg(m_routes.size()));
}

void RequestRouter::addRoute(const Route& route)
{
    InternalRoute entry;
    entry.route = route;

    // Handle wildcard paths: "/some/prefix/*"
    if (route.pathPattern.endsWith(QLatin1Char('*'))) {
        entry.wildcard = true;
        entry.pathPrefix = route.pathPattern.left(route.pathPattern.size() - 1);
    } else {
        entry.wildcard = false;
        entry.pathPrefix = route.pathPattern;
    }

    m_routes.append(entry);
}

std::optional<RouteMatch> RequestRouter::match(const QString& pathWithQuery) const
{
    const int queryStart = pathWithQuery.indexOf(QLatin1Char('?'));
    const QString path = queryStart >= 0 ? pathWithQuery.left(queryStart) : pathWithQuery;

    for (const InternalRoute& entry : m_routes) {
        bool hit = false;
        if (entry.wildcard) {
            // "/claude/*" also accepts the bare "/claude"
            hit = path.startsWith(entry.pathPrefix)
                || path == entry.pathPrefix.chopped(1);
        } else {
            hit = path == entry.pathPrefix
                || path.startsWith(entry.pathPrefix + QLatin1Char('/'));
        }
        if (!hit)
            continue;

        RouteMatch result;
        result.route = entry.route;
        result.upstreamPath = pathWithQuery;
        if (!entry.route.stripPrefix.isEmpty())
            result.upstreamPath = pathWithQuery.mid(entry.route.stripPrefix.size());
        if (result.upstreamPath.isEmpty() || result.upstreamPath.startsWith(QLatin1Char('?')))
            result.upstreamPath.prepend(QLatin1Char('/'));
        return result;
    }

    return std::nullopt;
}
