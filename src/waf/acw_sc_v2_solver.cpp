#include "acw_sc_v2_solver.h"
#include <QRegularExpression>

namespace {

constexpr int kTokenLength = 40;

const int kPositions[kTokenLength] = {
    15, 35, 29, 24, 33, 16,  1, 38, 10,  9,
    19, 31, 40, 27, 22, 23, 25, 13,  6, 11,
    39, 18, 20,  8, 14, 21, 32, 26,  2, 30,
     7,  4, 17,  5,  3, 28, 34, 37, 12, 36
};

bool isHexToken(const QString& s)
{
    static const QRegularExpression hex(QStringLiteral("^[0-9a-fA-F]{40}$"));
    return hex.match(s).hasMatch();
}

}

bool AcwScV2Solver::matches(const ProviderResponse& response) const
{
    const int status = response.statusCode;
    if (status != 200 && status != 403 && status != 405)
        return false;
    if (!response.body.contains("acw_sc__v2"))
        return false;
    return !extractArg1(response.body).isEmpty();
}

QString AcwScV2Solver::extractArg1(const QByteArray& body)
{
    static const QRegularExpression arg1Pattern(
        QStringLiteral("arg1\\s*=\\s*['\"]([0-9a-fA-F]{40})['\"]"));
    const auto m = arg1Pattern.match(QString::fromLatin1(body));
    return m.hasMatch() ? m.captured(1) : QString();
}

QString AcwScV2Solver::extractMask(const QByteArray& body, const QString& arg1)
{
    static const QRegularExpression literal(QStringLiteral("['\"]([0-9a-fA-F]{40})['\"]"));
    auto it = literal.globalMatch(QString::fromLatin1(body));
    while (it.hasNext()) {
        const QString candidate = it.next().captured(1);
        if (candidate.compare(arg1, Qt::CaseInsensitive) != 0)
            return candidate;
    }
    return QString::fromLatin1(kDefaultMask);
}

Result<QString> AcwScV2Solver::computeCookie(const QString& arg1, const QString& mask)
{
    if (!isHexToken(arg1) || !isHexToken(mask))
        return std::unexpected(DomainFailure::wafChallenge(
            QStringLiteral("aliyun_acw_sc_v2"), QStringLiteral("malformed acw_sc__v2 challenge token")));

    QString reordered(kTokenLength, QLatin1Char('0'));
    for (int j = 0; j < kTokenLength; ++j)
        reordered[j] = arg1.at(kPositions[j] - 1);

    QString result;
    result.reserve(kTokenLength);
    for (int i = 0; i < kTokenLength; i += 2) {
        const int a = reordered.mid(i, 2).toInt(nullptr, 16);
        const int b = mask.mid(i, 2).toInt(nullptr, 16);
        result += QStringLiteral("%1").arg(a ^ b, 2, 16, QLatin1Char('0'));
    }
    return result;
}

Result<WafSolution> AcwScV2Solver::solve(const ProviderResponse& response) const
{
    const QString arg1 = extractArg1(response.body);
    if (arg1.isEmpty())
        return std::unexpected(DomainFailure::wafChallenge(
            vendor(), QStringLiteral("acw_sc__v2 challenge without arg1")));

    auto cookie = computeCookie(arg1, extractMask(response.body, arg1));
    if (!cookie)
        return std::unexpected(cookie.error());

    return WafSolution{vendor(), QStringLiteral("acw_sc__v2"), *cookie};
}
