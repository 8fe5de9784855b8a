#pragma once
#include "waf_solver.h"

// Alibaba Cloud "acw_sc__v2" JavaScript challenge.
class AcwScV2Solver : public IWafSolver {
public:
    static constexpr const char* kDefaultMask = "3000176000856006061501533003690027800375";

    QString vendor() const override { return QStringLiteral("aliyun_acw_sc_v2"); }
    bool matches(const ProviderResponse& response) const override;
    Result<WafSolution> solve(const ProviderResponse& response) const override;

    static QString extractArg1(const QByteArray& body);
    static QString extractMask(const QByteArray& body, const QString& arg1);
    static Result<QString> computeCookie(const QString& arg1, const QString& mask);
};
