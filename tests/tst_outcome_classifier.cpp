#include <QTest>
#include "dispatch/outcome_classifier.h"
#include "test_support.h"

class TestOutcomeClassifier : public QObject {
    Q_OBJECT

private slots:
    void successIsNotAFailure() {
        QVERIFY(!outcome_classifier::classify(FakeExecutor::response(200, "{}")).has_value());
        QVERIFY(!outcome_classifier::classify(FakeExecutor::response(204, "")).has_value());
    }

    void statusMapping_data() {
        QTest::addColumn<int>("status");
        QTest::addColumn<QByteArray>("body");
        QTest::addColumn<int>("kind");
        QTest::addColumn<int>("httpStatus");

        QTest::newRow("401") << 401 << QByteArray("{}") << int(ErrorKind::AuthFailure) << 401;
        QTest::newRow("403") << 403 << QByteArray("{}") << int(ErrorKind::AuthFailure) << 401;
        QTest::newRow("429") << 429 << QByteArray("{}") << int(ErrorKind::RateLimited) << 429;
        QTest::newRow("400 overloaded") << 400 << QByteArray(R"({"error":{"message":"Rate limit reached"}})")
                                        << int(ErrorKind::RateLimited) << 429;
        QTest::newRow("408") << 408 << QByteArray() << int(ErrorKind::NetworkFailure) << 502;
        QTest::newRow("500") << 500 << QByteArray("oops") << int(ErrorKind::NetworkFailure) << 502;
        QTest::newRow("529") << 529 << QByteArray() << int(ErrorKind::NetworkFailure) << 502;
        QTest::newRow("400") << 400 << QByteArray(R"({"error":{"message":"bad model"}})")
                             << int(ErrorKind::UpstreamRejected) << 502;
        QTest::newRow("404") << 404 << QByteArray() << int(ErrorKind::UpstreamRejected) << 502;
    }

    void statusMapping() {
        QFETCH(int, status);
        QFETCH(QByteArray, body);
        QFETCH(int, kind);
        QFETCH(int, httpStatus);

        const auto failure = outcome_classifier::classify(FakeExecutor::response(status, body));
        QVERIFY(failure.has_value());
        QCOMPARE(int(failure->kind), kind);
        QCOMPARE(failure->httpStatus(), httpStatus);
        QCOMPARE(failure->upstreamStatus, status);
        QVERIFY(failure->countsAgainstCandidate());
    }

    void extractsMessage() {
        QCOMPARE(outcome_classifier::extractErrorMessage(R"({"error":{"message":"invalid x-api-key"}})"),
                 QStringLiteral("invalid x-api-key"));
        QCOMPARE(outcome_classifier::extractErrorMessage(R"({"error":"quota"})"), QStringLiteral("quota"));
        QCOMPARE(outcome_classifier::extractErrorMessage(R"({"message":"nope"})"), QStringLiteral("nope"));
        QCOMPARE(outcome_classifier::extractErrorMessage("  Bad\n  Gateway "), QStringLiteral("Bad Gateway"));
    }

    void failureJson() {
        DomainFailure failure = DomainFailure::upstreamRejected(400, QStringLiteral("HTTP 400: bad"));
        const QJsonObject err = failure.toJson().value(QStringLiteral("error")).toObject();
        QCOMPARE(err.value(QStringLiteral("code")).toString(), QStringLiteral("upstream_rejected"));
        QCOMPARE(err.value(QStringLiteral("upstream_status")).toInt(), 400);
        QCOMPARE(err.value(QStringLiteral("type")).toString(), errorKindName(ErrorKind::UpstreamRejected));

        QVERIFY(!DomainFailure::cancelled().countsAgainstCandidate());
        QVERIFY(!DomainFailure::exhausted(QString()).countsAgainstCandidate());
        QCOMPARE(DomainFailure::exhausted(QString()).httpStatus(), 503);
        QCOMPARE(DomainFailure::notFound(QString()).httpStatus(), 404);
    }
};

QTEST_MAIN(TestOutcomeClassifier)
#include "tst_outcome_classifier.moc"
