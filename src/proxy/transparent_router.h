#pragma once
#include "request_router.h"
#include "config/config_types.h"
#include "registry/provider.h"
#include "semantic/ports.h"
#include <QJsonObject>
#include <QMap>

struct RewriteRules {
    QMap<QString, QString> customHeaders;
    SystemPromptOverride systemPrompt;
};

// Family-shaped request, not yet bound to a provider.
struct RoutedRequest {
    AppFamily family = AppFamily::Claude;
    QString method;
    QString upstreamPath;
    QMap<QString, QString> headers;
    QByteArray body;
    QString model;
    bool stream = false;
};

class TransparentRouter {
public:
    TransparentRouter();

    // Path table first, request shape second.
    Result<AppFamily> classify(const InboundRequest& request) const;

    // Side-effect free: same input, same output.
    RoutedRequest rewrite(const InboundRequest& request, AppFamily target,
                          const RewriteRules& rules) const;

    static ProviderRequest bindCandidate(const RoutedRequest& routed, const Candidate& candidate);
    static ProviderRequest buildProbe(const RoutedRequest& routed, const Candidate& candidate,
                                      const ProbeOptions& options);

    static std::optional<AppFamily> detectFromShape(const InboundRequest& request);
    static QByteArray relocateSystemInstructions(const QByteArray& body, AppFamily target,
                                                 const SystemPromptOverride& override);
    static QString joinUrl(const QString& base, const QString& pathWithQuery);
    static bool isForwardedHeader(const QString& lowerName);

private:
    RequestRouter m_router;
};
