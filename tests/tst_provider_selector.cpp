#include <QTest>
#include "routing/provider_selector.h"
#include "test_support.h"

class TestProviderSelector : public QObject {
    Q_OBJECT

private:
    static QStringList ids(const QList<Candidate>& list)
    {
        QStringList out;
        for (const Candidate& c : list)
            out << c.provider.id + QLatin1Char('@') + c.endpoint().url;
        return out;
    }

    static Candidate single(const QString& id, const QString& group = QStringLiteral("g"))
    {
        return Candidate{makeProvider(id, AppFamily::Claude, group, QStringLiteral("https://x.example"),
                                      QStringLiteral("sk-x")), 0};
    }

private slots:
    void criteriaOrder();
    void activeGroupComesFirst();
    void orderIsDeterministic();
    void skipsIneligibleCandidates();
    void excludedCandidatesAreSkipped();
};

void TestProviderSelector::criteriaOrder()
{
    const QString noGroup;

    // Group name, then tier, then url priority
    QVERIFY(ProviderSelector::ranksBefore(single(QStringLiteral("z"), QStringLiteral("alpha")),
                                          single(QStringLiteral("a"), QStringLiteral("beta")), noGroup));

    Candidate a = single(QStringLiteral("a"));
    Candidate b = single(QStringLiteral("b"));
    a.provider.rotationTier = 1;
    b.provider.usageCount = 100;
    QVERIFY(ProviderSelector::ranksBefore(b, a, noGroup));

    a = single(QStringLiteral("a"));
    b = single(QStringLiteral("b"));
    a.provider.endpoints[0].urlPriority = 2;
    b.provider.endpoints[0].urlPriority = 1;
    b.provider.endpoints[0].urlLatencyMs = 5000;
    QVERIFY(ProviderSelector::ranksBefore(b, a, noGroup));

    // Measured latency beats unmeasured
    a = single(QStringLiteral("a"));
    b = single(QStringLiteral("b"));
    b.provider.endpoints[0].urlLatencyMs = 900;
    QVERIFY(ProviderSelector::ranksBefore(b, a, noGroup));
    a.provider.endpoints[0].urlLatencyMs = 300;
    QVERIFY(ProviderSelector::ranksBefore(a, b, noGroup));

    // Group priority, then usage, then last use, then sort index
    a = single(QStringLiteral("a"));
    b = single(QStringLiteral("b"));
    a.provider.groupPriority = 1;
    b.provider.usageCount = 50;
    QVERIFY(ProviderSelector::ranksBefore(b, a, noGroup));

    a = single(QStringLiteral("a"));
    b = single(QStringLiteral("b"));
    a.provider.usageCount = 3;
    b.provider.usageCount = 2;
    b.provider.lastUsedAt = 99999;
    QVERIFY(ProviderSelector::ranksBefore(b, a, noGroup));

    a = single(QStringLiteral("a"));
    b = single(QStringLiteral("b"));
    a.provider.lastUsedAt = 200;
    b.provider.lastUsedAt = 100;
    b.provider.sortIndex = 9;
    QVERIFY(ProviderSelector::ranksBefore(b, a, noGroup));

    a = single(QStringLiteral("a"));
    b = single(QStringLiteral("b"));
    a.provider.sortIndex = 2;
    b.provider.sortIndex = 1;
    QVERIFY(ProviderSelector::ranksBefore(b, a, noGroup));

    // Identical ranking falls back to the id
    QVERIFY(ProviderSelector::ranksBefore(single(QStringLiteral("a")), single(QStringLiteral("b")), noGroup));
    QVERIFY(!ProviderSelector::ranksBefore(single(QStringLiteral("a")), single(QStringLiteral("a")), noGroup));
}

void TestProviderSelector::activeGroupComesFirst()
{
    ManualClock clock;
    ProviderRegistry registry;
    BreakerBoard breakers(clock, BreakerOptions());
    registry.replaceAll({
        makeProvider(QStringLiteral("alpha-1"), AppFamily::Claude, QStringLiteral("alpha"),
                     QStringLiteral("https://a.example"), QStringLiteral("sk-a")),
        makeProvider(QStringLiteral("zeta-1"), AppFamily::Claude, QStringLiteral("zeta"),
                     QStringLiteral("https://z.example"), QStringLiteral("sk-z")),
    });
    ProviderSelector selector(registry, breakers, clock);

    QCOMPARE(selector.candidates(AppFamily::Claude).next()->provider.id, QStringLiteral("alpha-1"));

    registry.setActiveProvider(AppFamily::Claude, QStringLiteral("zeta-1"));
    const QList<Candidate> order = selector.candidates(AppFamily::Claude).toList();
    QCOMPARE(order.size(), 2);
    QCOMPARE(order.at(0).provider.id, QStringLiteral("zeta-1"));
    QCOMPARE(order.at(1).provider.id, QStringLiteral("alpha-1"));
}

void TestProviderSelector::orderIsDeterministic()
{
    ManualClock clock;
    ProviderRegistry registry;
    BreakerBoard breakers(clock, BreakerOptions());

    Provider multi = makeProvider(QStringLiteral("multi"), AppFamily::Codex, QStringLiteral("g"),
                                  {makeEndpoint(QStringLiteral("https://slow.example"), QStringLiteral("sk-1")),
                                   makeEndpoint(QStringLiteral("https://fast.example"), QStringLiteral("sk-1")),
                                   makeEndpoint(QStringLiteral("https://pinned.example"), QStringLiteral("sk-1"), -1)},
                                  0);
    multi.endpoints[0].urlLatencyMs = 800;
    multi.endpoints[1].urlLatencyMs = 120;
    Provider used = makeProvider(QStringLiteral("used"), AppFamily::Codex, QStringLiteral("g"),
                                 QStringLiteral("https://fast.example"), QStringLiteral("sk-2"), 1);
    used.endpoints[0].urlLatencyMs = 120;
    used.usageCount = 7;
    registry.replaceAll({multi, used});
    ProviderSelector selector(registry, breakers, clock);

    const QStringList expected = {
        QStringLiteral("multi@https://pinned.example"),
        QStringLiteral("multi@https://fast.example"),
        QStringLiteral("used@https://fast.example"),
        QStringLiteral("multi@https://slow.example"),
    };
    for (int run = 0; run < 5; ++run)
        QCOMPARE(ids(selector.candidates(AppFamily::Codex).toList()), expected);

    CandidateSequence sequence = selector.candidates(AppFamily::Codex);
    QCOMPARE(sequence.size(), 4);
    sequence.next();
    sequence.next();
    sequence.restart();
    QCOMPARE(sequence.next()->endpoint().url, QStringLiteral("https://pinned.example"));
}

void TestProviderSelector::skipsIneligibleCandidates()
{
    ManualClock clock;
    ProviderRegistry registry;
    BreakerOptions breakerOptions;
    breakerOptions.failureThreshold = 1;
    BreakerBoard breakers(clock, breakerOptions);

    Provider disabled = makeProvider(QStringLiteral("disabled"), AppFamily::Gemini, QStringLiteral("g"),
                                     QStringLiteral("https://d.example"), QStringLiteral("sk-d"), 0);
    disabled.enabled = false;
    Provider cooling = makeProvider(QStringLiteral("cooling"), AppFamily::Gemini, QStringLiteral("g"),
                                    QStringLiteral("https://c.example"), QStringLiteral("sk-c"), 1);
    cooling.cooldownUntil = clock.nowMs() + 60000;
    Provider halfCooling = makeProvider(QStringLiteral("half"), AppFamily::Gemini, QStringLiteral("g"),
                                        {makeEndpoint(QStringLiteral("https://h1.example"), QStringLiteral("sk-h")),
                                         makeEndpoint(QStringLiteral("https://h2.example"), QStringLiteral("sk-h"))},
                                        2);
    halfCooling.endpoints[0].cooldownUntil = clock.nowMs() + 60000;
    Provider broken = makeProvider(QStringLiteral("broken"), AppFamily::Gemini, QStringLiteral("g"),
                                   QStringLiteral("https://b.example"), QStringLiteral("sk-b"), 3);
    Provider claude = makeProvider(QStringLiteral("claude"), AppFamily::Claude, QStringLiteral("g"),
                                   QStringLiteral("https://x.example"), QStringLiteral("sk-x"), 4);
    registry.replaceAll({disabled, cooling, halfCooling, broken, claude});
    breakers.recordFailure(Candidate{broken, 0}.id());

    ProviderSelector selector(registry, breakers, clock);
    QCOMPARE(ids(selector.candidates(AppFamily::Gemini).toList()),
             QStringList{QStringLiteral("half@https://h2.example")});

    // Cooldowns and open breakers lapse with time
    clock.advance(61000);
    QCOMPARE(selector.candidates(AppFamily::Gemini).size(), 4);
}

void TestProviderSelector::excludedCandidatesAreSkipped()
{
    ManualClock clock;
    ProviderRegistry registry;
    BreakerBoard breakers(clock, BreakerOptions());
    const Provider a = makeProvider(QStringLiteral("a"), AppFamily::Claude, QStringLiteral("g"),
                                    QStringLiteral("https://a.example"), QStringLiteral("sk-a"), 0);
    const Provider b = makeProvider(QStringLiteral("b"), AppFamily::Claude, QStringLiteral("g"),
                                    QStringLiteral("https://b.example"), QStringLiteral("sk-b"), 1);
    registry.replaceAll({a, b});
    ProviderSelector selector(registry, breakers, clock);

    QSet<CandidateId> exclude{Candidate{a, 0}.id()};
    CandidateSequence sequence = selector.candidates(AppFamily::Claude, exclude);
    QCOMPARE(sequence.next()->provider.id, QStringLiteral("b"));
    QVERIFY(!sequence.next().has_value());

    exclude.insert(Candidate{b, 0}.id());
    QVERIFY(selector.candidates(AppFamily::Claude, exclude).isEmpty());
}

QTEST_MAIN(TestProviderSelector)
#include "tst_provider_selector.moc"
