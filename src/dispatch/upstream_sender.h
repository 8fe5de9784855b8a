#pragma once
#include "semantic/ports.h"
#include "waf/waf_registry.h"
#include <optional>

struct SendOutcome {
    std::optional<ProviderResponse> response;
    std::optional<DomainFailure> failure;
    bool wafRetried = false;

    bool ok() const { return !failure.has_value(); }
};

// Sends one request to one candidate, answering a recognised WAF challenge
// with exactly one retry.
class UpstreamSender {
public:
    UpstreamSender(IExecutor& executor, WafRegistry& waf);

    SendOutcome send(const ProviderRequest& request, const ExecOptions& options) const;

private:
    ProviderRequest withCookie(const ProviderRequest& request, const QString& pair) const;

    IExecutor& m_executor;
    WafRegistry& m_waf;
};
