#pragma once
#include "semantic/types.h"
#include <QString>
#include <QList>
#include <optional>

struct Route {
    QString pathPattern;
    AppFamily family = AppFamily::Claude;
    QString stripPrefix;   // removed before the path is appended to the upstream URL
};

struct RouteMatch {
    Route route;
    QString upstreamPath;  // path (with query) to send upstream
};

// Path-to-family table. Exact patterns also match their sub-paths
// (/v1/messages/count_tokens); patterns ending in "*" match any suffix.
class RequestRouter {
public:
    void registerDefaults();
    void addRoute(const Route& route);
    std::optional<RouteMatch> match(const QString& pathWithQuery) const;
    int size() const { return m_routes.size(); }

private:
    struct InternalRoute {
        QString pathPrefix;
        bool wildcard = false;
        Route route;
    };
    QList<InternalRoute> m_routes;
};
