#include <QTest>
#include <QAtomicInt>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QThreadPool>
#include <memory>
#include "dispatch/request_dispatcher.h"
#include "test_support.h"

namespace {

const QString kPrimary = QStringLiteral("https://primary.example");
const QString kBackup = QStringLiteral("https://backup.example");
const QString kThird = QStringLiteral("https://third.example");

bool isProbe(const ProviderRequest& req)
{
    return req.body.contains("\"hi\"");
}

bool isHost(const ProviderRequest& req, const QString& base)
{
    return req.url.startsWith(base);
}

InboundRequest messagesRequest()
{
    InboundRequest req;
    req.method = QStringLiteral("POST");
    req.path = QStringLiteral("/v1/messages");
    req.headers[QStringLiteral("anthropic-version")] = QStringLiteral("2023-06-01");
    req.body = R"({"model":"claude-sonnet-4","max_tokens":1024,"messages":[{"role":"user","content":"hello"}]})";
    return req;
}

}

class TestRequestDispatcher : public QObject {
    Q_OBJECT

private:
    struct Fixture {
        ManualClock clock;
        ProviderRegistry registry;
        BreakerBoard breakers;
        CooldownManager cooldowns{registry, breakers, clock, CooldownOptions()};
        ProviderSelector selector{registry, breakers, clock};
        WafRegistry waf{clock};
        FakeExecutor executor;
        UpstreamSender sender{executor, waf};
        ProbeEngine probes{sender, clock, ProbeOptions()};
        TransparentRouter router;
        RequestDispatcher dispatcher{registry, breakers, cooldowns, selector, probes, sender, router, clock};

        explicit Fixture(int breakerThreshold = 5, bool sharedKey = false)
            : breakers(clock, breakerOptions(breakerThreshold))
        {
            const QString key = QStringLiteral("sk-ant-shared-0001");
            registry.replaceAll({
                makeProvider(QStringLiteral("primary"), AppFamily::Claude, QStringLiteral("pool"),
                             kPrimary, sharedKey ? key : QStringLiteral("sk-ant-primary-01"), 0),
                makeProvider(QStringLiteral("backup"), AppFamily::Claude, QStringLiteral("pool"),
                             kBackup, sharedKey ? key : QStringLiteral("sk-ant-backup-001"), 1),
                makeProvider(QStringLiteral("third"), AppFamily::Claude, QStringLiteral("pool"),
                             kThird, sharedKey ? key : QStringLiteral("sk-ant-third-0001"), 2),
            });
        }

        CandidateId idOf(const QString& providerId) const
        {
            return Candidate{*registry.provider(providerId), 0}.id();
        }

        // Upstreams listed in `failing` answer 500; probes fail only for `probeFailing`.
        void respond(const QStringList& failing, const QStringList& probeFailing = {})
        {
            executor.setResponder([failing, probeFailing](const ProviderRequest& req) -> Result<ProviderResponse> {
                for (const QString& base : probeFailing) {
                    if (isHost(req, base) && isProbe(req))
                        return FakeExecutor::response(500, R"({"error":{"message":"probe failed"}})");
                }
                for (const QString& base : failing) {
                    if (isHost(req, base))
                        return FakeExecutor::response(500, R"({"error":{"message":"overloaded upstream"}})");
                }
                return FakeExecutor::response(200, R"({"id":"msg_1","type":"message"})");
            });
        }
    };

    static BreakerOptions breakerOptions(int threshold)
    {
        BreakerOptions o;
        o.failureThreshold = threshold;
        return o;
    }

private slots:
    void firstCandidateServes() {
        Fixture f;
        f.respond({});
        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest());
        QVERIFY(outcome.ok());
        QCOMPARE(outcome.providerId, QStringLiteral("primary"));
        QCOMPARE(outcome.family.value(), AppFamily::Claude);
        QCOMPARE(outcome.httpStatus(), 200);
        QCOMPARE(f.executor.count(), 1);
        QVERIFY(!isProbe(f.executor.requests().first()));
        QCOMPARE(f.executor.requests().first().url, kPrimary + QStringLiteral("/v1/messages"));
        QCOMPARE(f.registry.provider(QStringLiteral("primary"))->usageCount, qint64(1));
        QCOMPARE(f.registry.activeProvider(AppFamily::Claude), QStringLiteral("primary"));
    }

    void failsOverWithProbe() {
        Fixture f;
        f.respond({kPrimary});
        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest());
        QVERIFY(outcome.ok());
        QCOMPARE(outcome.providerId, QStringLiteral("backup"));

        const QList<ProviderRequest> sent = f.executor.requests();
        QCOMPARE(sent.size(), 3);
        QVERIFY(isHost(sent.at(0), kPrimary) && !isProbe(sent.at(0)));
        QVERIFY(isHost(sent.at(1), kBackup) && isProbe(sent.at(1)));
        QVERIFY(isHost(sent.at(2), kBackup) && !isProbe(sent.at(2)));

        QCOMPARE(outcome.attempts.size(), 1);
        QCOMPARE(outcome.attempts.first().stage, QStringLiteral("full"));
        QCOMPARE(outcome.attempts.first().candidate.providerId, QStringLiteral("primary"));
        QCOMPARE(f.registry.activeProvider(AppFamily::Claude), QStringLiteral("backup"));
    }

    void failedProbeSkipsFullRequest() {
        Fixture f;
        f.respond({kPrimary}, {kBackup});
        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest());
        QVERIFY(outcome.ok());
        QCOMPARE(outcome.providerId, QStringLiteral("third"));

        for (const ProviderRequest& req : f.executor.requests())
            QVERIFY(!(isHost(req, kBackup) && !isProbe(req)));

        QCOMPARE(outcome.attempts.size(), 2);
        QCOMPARE(outcome.attempts.at(1).stage, QStringLiteral("probe"));
        QCOMPARE(f.probes.cachedVerdict(f.idOf(QStringLiteral("backup"))), std::optional<bool>(false));
    }

    void cachedProbeFailureIsReused() {
        Fixture f;
        f.respond({kPrimary});
        f.probes.remember(f.idOf(QStringLiteral("backup")), false);
        f.clock.advance(30 * 1000);

        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest());
        QVERIFY(outcome.ok());
        QCOMPARE(outcome.providerId, QStringLiteral("third"));
        for (const ProviderRequest& req : f.executor.requests())
            QVERIFY(!isHost(req, kBackup));
        QCOMPARE(outcome.attempts.at(1).stage, QStringLiteral("probe_cached"));
    }

    void openBreakersExhaust() {
        Fixture f(1);
        f.respond({});
        for (const QString& id : {QStringLiteral("primary"), QStringLiteral("backup"), QStringLiteral("third")})
            f.breakers.recordFailure(f.idOf(id));

        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest());
        QVERIFY(!outcome.ok());
        QCOMPARE(outcome.failure->kind, ErrorKind::Exhausted);
        QCOMPARE(outcome.httpStatus(), 503);
        QCOMPARE(f.executor.count(), 0);

        const QJsonObject err = QJsonDocument::fromJson(outcome.errorBody()).object()
                                    .value(QStringLiteral("error")).toObject();
        QCOMPARE(err.value(QStringLiteral("type")).toString(), QStringLiteral("exhausted"));
        QVERIFY(err.value(QStringLiteral("message")).toString().contains(QStringLiteral("claude")));
        QVERIFY(err.value(QStringLiteral("attempts")).toArray().isEmpty());
    }

    void everyCandidateFails() {
        Fixture f;
        f.respond({kPrimary, kBackup, kThird});
        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest());
        QCOMPARE(outcome.failure->kind, ErrorKind::Exhausted);
        QCOMPARE(outcome.httpStatus(), 503);
        QCOMPARE(outcome.attempts.size(), 3);
        QCOMPARE(f.executor.count(), 3);

        const QJsonArray attempts = QJsonDocument::fromJson(outcome.errorBody()).object()
                                        .value(QStringLiteral("error")).toObject()
                                        .value(QStringLiteral("attempts")).toArray();
        QCOMPARE(attempts.size(), 3);
        const QJsonObject first = attempts.first().toObject();
        QCOMPARE(first.value(QStringLiteral("provider_id")).toString(), QStringLiteral("primary"));
        QCOMPARE(first.value(QStringLiteral("stage")).toString(), QStringLiteral("full"));
        QCOMPARE(first.value(QStringLiteral("upstream_status")).toInt(), 500);
        QCOMPARE(attempts.at(2).toObject().value(QStringLiteral("stage")).toString(), QStringLiteral("probe"));
    }

    void maxAttemptsBoundsTheLoop() {
        Fixture f;
        DispatchOptions options;
        options.maxAttempts = 2;
        f.dispatcher.setOptions(options);
        f.respond({kPrimary, kBackup, kThird});

        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest());
        QCOMPARE(outcome.failure->kind, ErrorKind::Exhausted);
        QCOMPARE(outcome.attempts.size(), 2);
        QCOMPARE(f.executor.count(), 2);

        options.maxAttempts = 0;
        f.dispatcher.setOptions(options);
        QCOMPARE(f.dispatcher.options().maxAttempts, 1);
    }

    void disabledProbesSendDirectly() {
        Fixture f;
        DispatchOptions options;
        options.probeEnabled = false;
        f.dispatcher.setOptions(options);
        f.respond({kPrimary});

        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest());
        QVERIFY(outcome.ok());
        QCOMPARE(f.executor.count(), 2);
        for (const ProviderRequest& req : f.executor.requests())
            QVERIFY(!isProbe(req));
    }

    void transientFailureRetriedOnSameCandidate() {
        Fixture f;
        DispatchOptions options;
        options.maxRetries = 2;
        f.dispatcher.setOptions(options);
        auto calls = std::make_shared<int>(0);
        f.executor.setResponder([calls](const ProviderRequest&) -> Result<ProviderResponse> {
            if (++*calls == 1)
                return std::unexpected(DomainFailure::timeout(QStringLiteral("read timed out")));
            if (*calls == 2)
                return FakeExecutor::response(429, R"({"error":{"message":"slow down"}})");
            return FakeExecutor::response(200, R"({"id":"msg_1"})");
        });

        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest());
        QVERIFY(outcome.ok());
        QCOMPARE(outcome.providerId, QStringLiteral("primary"));
        QVERIFY(outcome.attempts.isEmpty());
        QCOMPARE(f.executor.count(), 3);
        for (const ProviderRequest& req : f.executor.requests())
            QVERIFY(isHost(req, kPrimary) && !isProbe(req));
        QCOMPARE(f.clock.slept(), qint64(100 + 200));
        QCOMPARE(f.breakers.consecutiveFailures(f.idOf(QStringLiteral("primary"))), 0);
    }

    void exhaustedRetriesRecordOneFailure() {
        Fixture f;
        DispatchOptions options;
        options.maxRetries = 3;
        f.dispatcher.setOptions(options);
        f.respond({kPrimary});

        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest());
        QVERIFY(outcome.ok());
        QCOMPARE(outcome.providerId, QStringLiteral("backup"));

        int primaryCalls = 0;
        for (const ProviderRequest& req : f.executor.requests()) {
            if (isHost(req, kPrimary))
                ++primaryCalls;
        }
        QCOMPARE(primaryCalls, 4);
        QCOMPARE(f.clock.slept(), qint64(100 + 200 + 400));
        QCOMPARE(outcome.attempts.size(), 1);
        QCOMPARE(outcome.attempts.first().stage, QStringLiteral("full"));
        QCOMPARE(f.breakers.consecutiveFailures(f.idOf(QStringLiteral("primary"))), 1);
    }

    void rejectionIsNotRetried() {
        Fixture f;
        DispatchOptions options;
        options.maxRetries = 3;
        f.dispatcher.setOptions(options);
        f.executor.setResponder([](const ProviderRequest& req) -> Result<ProviderResponse> {
            if (isHost(req, kPrimary))
                return FakeExecutor::response(401, R"({"error":{"message":"invalid x-api-key"}})");
            return FakeExecutor::response(200, "{}");
        });

        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest());
        QVERIFY(outcome.ok());
        QCOMPARE(outcome.providerId, QStringLiteral("backup"));
        QVERIFY(isHost(f.executor.requests().at(0), kPrimary));
        QVERIFY(!isHost(f.executor.requests().at(1), kPrimary));
        QCOMPARE(f.clock.slept(), qint64(0));
        QCOMPARE(outcome.attempts.first().failure.kind, ErrorKind::AuthFailure);

        options.maxRetries = 99;
        f.dispatcher.setOptions(options);
        QCOMPARE(f.dispatcher.options().maxRetries, kMaxSameCandidateRetries);
    }

    void cancellationStopsRetries() {
        Fixture f;
        DispatchOptions options;
        options.maxRetries = 3;
        f.dispatcher.setOptions(options);
        CancelToken cancel = makeCancelToken();
        f.executor.setResponder([cancel](const ProviderRequest&) -> Result<ProviderResponse> {
            cancel->store(true);
            return FakeExecutor::response(503, R"({"error":{"message":"unavailable"}})");
        });

        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest(), cancel);
        QCOMPARE(outcome.failure->kind, ErrorKind::Cancelled);
        QCOMPARE(f.executor.count(), 1);
        QCOMPARE(f.clock.slept(), qint64(0));
    }

    void promotedFullRequestFailureIsRecorded() {
        Fixture f;
        f.executor.setResponder([](const ProviderRequest& req) -> Result<ProviderResponse> {
            if (isHost(req, kPrimary))
                return FakeExecutor::response(500, R"({"error":{"message":"upstream error"}})");
            if (isHost(req, kBackup) && !isProbe(req))
                return FakeExecutor::response(500, R"({"error":{"message":"context too long for relay"}})");
            return FakeExecutor::response(200, R"({"id":"msg_1"})");
        });

        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest());
        QVERIFY(outcome.ok());
        QCOMPARE(outcome.providerId, QStringLiteral("third"));

        QCOMPARE(outcome.attempts.size(), 2);
        QCOMPARE(outcome.attempts.at(1).candidate.providerId, QStringLiteral("backup"));
        QCOMPARE(outcome.attempts.at(1).stage, QStringLiteral("full"));
        QCOMPARE(f.breakers.consecutiveFailures(f.idOf(QStringLiteral("backup"))), 1);
        // The successful health check stays cached; the full failure is a separate event.
        QCOMPARE(f.probes.cachedVerdict(f.idOf(QStringLiteral("backup"))), std::optional<bool>(true));
    }

    void concurrentDispatches() {
        constexpr int kRequests = 32;
        Fixture f;
        f.registry.replaceAll({*f.registry.provider(QStringLiteral("primary"))});
        f.respond({});
        QAtomicInt served;
        QThreadPool pool;
        pool.setMaxThreadCount(8);
        for (int i = 0; i < kRequests; ++i) {
            pool.start([&f, &served]() {
                if (f.dispatcher.dispatch(messagesRequest()).ok())
                    served.fetchAndAddRelaxed(1);
            });
        }
        QVERIFY(pool.waitForDone(30000));

        QCOMPARE(served.loadRelaxed(), kRequests);
        QCOMPARE(f.executor.count(), kRequests);
        QCOMPARE(f.registry.provider(QStringLiteral("primary"))->usageCount, qint64(kRequests));
        QCOMPARE(f.breakers.consecutiveFailures(f.idOf(QStringLiteral("primary"))), 0);
    }

    void concurrentFailuresAllCounted() {
        constexpr int kRequests = 16;
        Fixture f;
        BreakerOptions lenient = breakerOptions(100);
        lenient.errorRateThreshold = 0.0;
        f.breakers.setOptions(lenient);
        f.registry.replaceAll({*f.registry.provider(QStringLiteral("primary"))});
        f.respond({kPrimary});
        QAtomicInt exhausted;
        QThreadPool pool;
        pool.setMaxThreadCount(8);
        for (int i = 0; i < kRequests; ++i) {
            pool.start([&f, &exhausted]() {
                const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest());
                if (outcome.failure && outcome.failure->kind == ErrorKind::Exhausted)
                    exhausted.fetchAndAddRelaxed(1);
            });
        }
        QVERIFY(pool.waitForDone(30000));

        QCOMPARE(exhausted.loadRelaxed(), kRequests);
        QCOMPARE(f.executor.count(), kRequests);
        QCOMPARE(f.breakers.consecutiveFailures(f.idOf(QStringLiteral("primary"))), kRequests);
        QVERIFY(!f.breakers.isOpen(f.idOf(QStringLiteral("primary"))));
    }

    void cancelledBeforeStart() {
        Fixture f;
        f.respond({});
        CancelToken cancel = makeCancelToken();
        cancel->store(true);
        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest(), cancel);
        QCOMPARE(outcome.failure->kind, ErrorKind::Cancelled);
        QCOMPARE(f.executor.count(), 0);
    }

    void cancelledMidFlightStopsFailover() {
        Fixture f;
        CancelToken cancel = makeCancelToken();
        f.executor.setResponder([cancel](const ProviderRequest&) -> Result<ProviderResponse> {
            cancel->store(true);
            return FakeExecutor::response(500, "{}");
        });
        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest(), cancel);
        QCOMPARE(outcome.failure->kind, ErrorKind::Cancelled);
        QCOMPARE(f.executor.count(), 1);
        QVERIFY(outcome.errorBody().contains("cancelled"));
    }

    void unknownFamilyIsRejected() {
        Fixture f;
        InboundRequest req;
        req.method = QStringLiteral("POST");
        req.path = QStringLiteral("/unknown");
        req.body = "plain text";
        const DispatchOutcome outcome = f.dispatcher.dispatch(req);
        QCOMPARE(outcome.failure->kind, ErrorKind::InvalidInput);
        QCOMPARE(outcome.httpStatus(), 400);
        QVERIFY(!outcome.family.has_value());
        QCOMPARE(f.executor.count(), 0);
    }

    void rejectedRequestFailsOver() {
        Fixture f;
        f.executor.setResponder([](const ProviderRequest& req) -> Result<ProviderResponse> {
            if (isHost(req, kPrimary))
                return FakeExecutor::response(400, R"({"error":{"message":"model not supported"}})");
            return FakeExecutor::response(200, "{}");
        });
        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest());
        QVERIFY(outcome.ok());
        QCOMPARE(outcome.providerId, QStringLiteral("backup"));
        QCOMPARE(outcome.attempts.first().failure.kind, ErrorKind::UpstreamRejected);
    }

    void successElsewhereCoolsFailedUrl() {
        Fixture f(1, true);
        f.respond({kPrimary});
        const DispatchOutcome outcome = f.dispatcher.dispatch(messagesRequest());
        QVERIFY(outcome.ok());
        QCOMPARE(outcome.providerId, QStringLiteral("backup"));

        const QList<CooldownEntry> cooling = f.cooldowns.listCooldowns();
        QCOMPARE(cooling.size(), 1);
        QCOMPARE(cooling.first().providerId, QStringLiteral("primary"));
        QCOMPARE(cooling.first().urls, QStringList{kPrimary});

        // The cooled URL is no longer offered
        f.respond({});
        QCOMPARE(f.dispatcher.dispatch(messagesRequest()).providerId, QStringLiteral("backup"));
    }
};

QTEST_MAIN(TestRequestDispatcher)
#include "tst_request_dispatcher.moc"
