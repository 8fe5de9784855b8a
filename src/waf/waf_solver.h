#pragma once
#include "semantic/ports.h"
#include <QString>

struct WafSolution {
    QString vendor;
    QString cookieName;
    QString cookieValue;

    QString cookiePair() const { return cookieName + QLatin1Char('=') + cookieValue; }
};

// One WAF vendor: recognises its challenge page and computes the answer.
class IWafSolver {
public:
    virtual ~IWafSolver() = default;
    virtual QString vendor() const = 0;
    virtual bool matches(const ProviderResponse& response) const = 0;
    virtual Result<WafSolution> solve(const ProviderResponse& response) const = 0;
};
