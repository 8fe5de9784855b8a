#include <QTest>
#include "registry/provider_batch.h"
#include "test_support.h"

class TestProviderBatch : public QObject {
    Q_OBJECT

private slots:
    void expandsUrlsTimesKeys();
    void numbersAfterExistingProviders();
    void dropsBlankAndDuplicateEntries();
    void rejectsEmptyBatch();
    void slugify();
};

void TestProviderBatch::expandsUrlsTimesKeys()
{
    ProviderBatch batch;
    batch.family = AppFamily::Claude;
    batch.group = QStringLiteral("Relay Pool");
    batch.urls = {QStringLiteral("https://a.example"), QStringLiteral("https://b.example"),
                  QStringLiteral("https://c.example")};
    batch.keys = {QStringLiteral("sk-key-one"), QStringLiteral("sk-key-two")};
    batch.rotationTier = 2;
    batch.cooldownDurationSecs = 3600;

    const auto created = provider_batch::expand(batch, {});
    QVERIFY(created.has_value());
    QCOMPARE(created->size(), 6);

    // url-major order
    QCOMPARE(created->at(0).endpoints.first().url, QStringLiteral("https://a.example"));
    QCOMPARE(created->at(0).endpoints.first().apiKey, QStringLiteral("sk-key-one"));
    QCOMPARE(created->at(1).endpoints.first().url, QStringLiteral("https://a.example"));
    QCOMPARE(created->at(1).endpoints.first().apiKey, QStringLiteral("sk-key-two"));
    QCOMPARE(created->at(5).endpoints.first().url, QStringLiteral("https://c.example"));
    QCOMPARE(created->at(5).endpoints.first().apiKey, QStringLiteral("sk-key-two"));

    for (int i = 0; i < created->size(); ++i) {
        const Provider& p = created->at(i);
        QCOMPARE(p.id, QStringLiteral("relay-pool-%1").arg(i + 1));
        QCOMPARE(p.group, QStringLiteral("Relay Pool"));
        QCOMPARE(p.sortIndex, i);
        QCOMPARE(p.rotationTier, 2);
        QCOMPARE(p.cooldownDurationSecs, qint64(3600));
        QCOMPARE(p.endpoints.size(), 1);
    }
}

void TestProviderBatch::numbersAfterExistingProviders()
{
    QList<Provider> existing;
    existing << makeProvider(QStringLiteral("pool-1"), AppFamily::Codex, QStringLiteral("pool"),
                             QStringLiteral("https://a.example"), QStringLiteral("sk-old"), 4);
    existing << makeProvider(QStringLiteral("pool-3"), AppFamily::Codex, QStringLiteral("pool"),
                             QStringLiteral("https://b.example"), QStringLiteral("sk-old"), 7);

    ProviderBatch batch;
    batch.family = AppFamily::Codex;
    batch.group = QStringLiteral("pool");
    batch.urls = {QStringLiteral("https://c.example")};
    batch.keys = {QStringLiteral("sk-new")};

    const auto created = provider_batch::expand(batch, existing);
    QVERIFY(created.has_value());
    QCOMPARE(created->size(), 1);
    QCOMPARE(created->first().id, QStringLiteral("pool-4"));
    QCOMPARE(created->first().sortIndex, 8);
}

void TestProviderBatch::dropsBlankAndDuplicateEntries()
{
    ProviderBatch batch;
    batch.group = QStringLiteral("g");
    batch.urls = {QStringLiteral(" https://a.example "), QStringLiteral("https://a.example"), QString()};
    batch.keys = {QStringLiteral("sk-1"), QStringLiteral("  "), QStringLiteral("sk-1")};

    const auto created = provider_batch::expand(batch, {});
    QVERIFY(created.has_value());
    QCOMPARE(created->size(), 1);
    QCOMPARE(created->first().endpoints.first().url, QStringLiteral("https://a.example"));
}

void TestProviderBatch::rejectsEmptyBatch()
{
    ProviderBatch noGroup;
    noGroup.urls = {QStringLiteral("https://a.example")};
    noGroup.keys = {QStringLiteral("sk-1")};
    auto result = provider_batch::expand(noGroup, {});
    QVERIFY(!result.has_value());
    QCOMPARE(result.error().kind, ErrorKind::ConfigInvalid);

    ProviderBatch noKeys;
    noKeys.group = QStringLiteral("g");
    noKeys.urls = {QStringLiteral("https://a.example")};
    result = provider_batch::expand(noKeys, {});
    QVERIFY(!result.has_value());
    QCOMPARE(result.error().code, QStringLiteral("batch_empty"));
}

void TestProviderBatch::slugify()
{
    QCOMPARE(provider_batch::slugify(QStringLiteral("My Relay #2")), QStringLiteral("my-relay-2"));
    QCOMPARE(provider_batch::slugify(QStringLiteral("--x--")), QStringLiteral("x"));
    QCOMPARE(provider_batch::slugify(QStringLiteral("中文")), QStringLiteral("provider"));
}

QTEST_MAIN(TestProviderBatch)
#include "tst_provider_batch.moc"
