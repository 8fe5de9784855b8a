#include <QTest>
#include <QJsonDocument>
#include <QJsonObject>

#include "proxy/model_mapper.h"
#include "proxy/transparent_router.h"
#include "test_support.h"

namespace {

ModelMapping claudeMapping()
{
    ModelMapping mapping;
    mapping.haiku = QStringLiteral("claude-haiku-4-5");
    mapping.sonnet = QStringLiteral("cursor2-claude-4.5-sonnet");
    mapping.opus = QStringLiteral("claude-opus-4-5");
    mapping.reasoning = QStringLiteral("claude-sonnet-4-5-thinking");
    return mapping;
}

RoutedRequest routedBody(AppFamily family, const QString& path, const QByteArray& body)
{
    RoutedRequest routed;
    routed.family = family;
    routed.method = QStringLiteral("POST");
    routed.upstreamPath = path;
    routed.body = body;
    return routed;
}

QString modelOf(const QByteArray& body)
{
    return QJsonDocument::fromJson(body).object().value(QStringLiteral("model")).toString();
}

}

class TestModelMapper : public QObject {
    Q_OBJECT

private slots:
    void sonnetRequestUsesSonnetMapping()
    {
        QCOMPARE(model_mapper::mapModel(claudeMapping(), QStringLiteral("claude-sonnet-4-5-20250929"), false),
                 QStringLiteral("cursor2-claude-4.5-sonnet"));
        QCOMPARE(model_mapper::mapModel(claudeMapping(), QStringLiteral("claude-3-5-haiku-latest"), false),
                 QStringLiteral("claude-haiku-4-5"));
    }

    void thinkingPrefersReasoningModel()
    {
        QCOMPARE(model_mapper::mapModel(claudeMapping(), QStringLiteral("claude-sonnet-4-5"), true),
                 QStringLiteral("claude-sonnet-4-5-thinking"));

        const QJsonObject enabled = QJsonDocument::fromJson(
            R"({"model":"m","thinking":{"type":"enabled","budget_tokens":1024}})").object();
        const QJsonObject disabled = QJsonDocument::fromJson(
            R"({"model":"m","thinking":{"type":"disabled"}})").object();
        QVERIFY(model_mapper::thinkingEnabled(enabled));
        QVERIFY(!model_mapper::thinkingEnabled(disabled));
        QVERIFY(!model_mapper::thinkingEnabled(QJsonObject()));
    }

    void emptyMappingKeepsModel()
    {
        QCOMPARE(model_mapper::mapModel(ModelMapping(), QStringLiteral("claude-sonnet-4-5"), false),
                 QStringLiteral("claude-sonnet-4-5"));
        QCOMPARE(model_mapper::mapModel(ModelMapping(), QStringLiteral("claude-sonnet-4-5"), true),
                 QStringLiteral("claude-sonnet-4-5"));
    }

    void defaultModelCoversOtherNames()
    {
        ModelMapping mapping;
        mapping.defaultModel = QStringLiteral("claude-sonnet-4-5");
        QCOMPARE(model_mapper::mapModel(mapping, QStringLiteral("claude-2.1"), false),
                 QStringLiteral("claude-sonnet-4-5"));
        QCOMPARE(model_mapper::mapModel(mapping, QStringLiteral("house-model"), false),
                 QStringLiteral("claude-sonnet-4-5"));
    }

    void crossVendorTargetsRejected()
    {
        ModelMapping mapping;
        mapping.haiku = QStringLiteral("zai-org/GLM-4.5");
        QCOMPARE(model_mapper::mapModel(mapping, QStringLiteral("claude-haiku-4-5"), false),
                 QStringLiteral("claude-haiku-4-5"));

        mapping = ModelMapping();
        mapping.defaultModel = QStringLiteral("deepseek-r1");
        QCOMPARE(model_mapper::mapModel(mapping, QStringLiteral("gpt-5.2"), false), QStringLiteral("gpt-5.2"));
        QCOMPARE(model_mapper::mapModel(mapping, QStringLiteral("unknown-model"), false),
                 QStringLiteral("deepseek-r1"));
    }

    void claudeTierIsKept()
    {
        ModelMapping mapping;
        mapping.defaultModel = QStringLiteral("claude-opus-4-5");
        // A sonnet request never lands on an opus model.
        QCOMPARE(model_mapper::mapModel(mapping, QStringLiteral("claude-sonnet-4-5"), false),
                 QStringLiteral("claude-sonnet-4-5"));
        mapping.defaultModel = QStringLiteral("claude-latest");
        QCOMPARE(model_mapper::mapModel(mapping, QStringLiteral("claude-sonnet-4-5"), false),
                 QStringLiteral("claude-latest"));
    }

    void vendorDetection()
    {
        QCOMPARE(model_mapper::detectVendor(QStringLiteral("anthropic/claude-haiku-4.5")), ModelVendor::Claude);
        QCOMPARE(model_mapper::detectVendor(QStringLiteral("openai/gpt-4o")), ModelVendor::OpenAi);
        QCOMPARE(model_mapper::detectVendor(QStringLiteral("o3-mini")), ModelVendor::OpenAi);
        QCOMPARE(model_mapper::detectVendor(QStringLiteral("gemini-2.5-pro")), ModelVendor::Gemini);
        QCOMPARE(model_mapper::detectVendor(QStringLiteral("meta-llama/llama-3.1-70b")), ModelVendor::Llama);
        QCOMPARE(model_mapper::detectVendor(QStringLiteral("glm-4.5")), ModelVendor::Glm);
        QCOMPARE(model_mapper::detectVendor(QStringLiteral("kimi-k2")), ModelVendor::Kimi);
        QCOMPARE(model_mapper::detectVendor(QStringLiteral("yi-34b")), ModelVendor::Yi);
        QCOMPARE(model_mapper::detectVendor(QStringLiteral("house-model")), ModelVendor::Other);
        QCOMPARE(model_mapper::detectVendor(QString()), ModelVendor::Other);
    }

    void datedGptNamesStripped()
    {
        QCOMPARE(model_mapper::stripGptDate(QStringLiteral("gpt-5.2-2025-12-11")), QStringLiteral("gpt-5.2"));
        QCOMPARE(model_mapper::stripGptDate(QStringLiteral("gpt-5.2-20251211")), QStringLiteral("gpt-5.2"));
        QCOMPARE(model_mapper::stripGptDate(QStringLiteral("gpt-4-0613")), QStringLiteral("gpt-4"));
        QCOMPARE(model_mapper::stripGptDate(QStringLiteral("gpt-4-1106-preview")), QStringLiteral("gpt-4"));
        QCOMPARE(model_mapper::stripGptDate(QStringLiteral("gpt-4-32k-0613")), QStringLiteral("gpt-4-32k"));
        QCOMPARE(model_mapper::stripGptDate(QStringLiteral("gpt-4o-mini-2024-08-06")), QStringLiteral("gpt-4o-mini"));
        QCOMPARE(model_mapper::stripGptDate(QStringLiteral("gpt-5")), QStringLiteral("gpt-5"));
        QCOMPARE(model_mapper::stripGptDate(QStringLiteral("o3-mini-2025-01-31")), QStringLiteral("o3-mini-2025-01-31"));
        QCOMPARE(model_mapper::stripGptDate(QStringLiteral("claude-sonnet-4-5-20250929")),
                 QStringLiteral("claude-sonnet-4-5-20250929"));
    }

    void bindCandidateMapsPerProvider()
    {
        const RoutedRequest routed = routedBody(AppFamily::Claude, QStringLiteral("/v1/messages"),
            R"({"model":"claude-sonnet-4-5-20250929","max_tokens":8,"messages":[]})");

        Provider mapped = makeProvider(QStringLiteral("mapped"), AppFamily::Claude, QString(),
                                       QStringLiteral("https://m.example"), QStringLiteral("sk-ant-mapped"));
        mapped.modelMapping = claudeMapping();
        const Provider plain = makeProvider(QStringLiteral("plain"), AppFamily::Claude, QString(),
                                            QStringLiteral("https://p.example"), QStringLiteral("sk-ant-plain"));

        const ProviderRequest first = TransparentRouter::bindCandidate(routed, Candidate{mapped, 0});
        QCOMPARE(modelOf(first.body), QStringLiteral("cursor2-claude-4.5-sonnet"));
        QCOMPARE(QJsonDocument::fromJson(first.body).object().value(QStringLiteral("max_tokens")).toInt(), 8);

        // Unmapped providers receive the bytes the router produced.
        const ProviderRequest second = TransparentRouter::bindCandidate(routed, Candidate{plain, 0});
        QCOMPARE(second.body, routed.body);
    }

    void bindCandidateThinkingAndCodexDates()
    {
        Provider mapped = makeProvider(QStringLiteral("mapped"), AppFamily::Claude, QString(),
                                       QStringLiteral("https://m.example"), QStringLiteral("sk-ant-mapped"));
        mapped.modelMapping = claudeMapping();
        const RoutedRequest thinking = routedBody(AppFamily::Claude, QStringLiteral("/v1/messages"),
            R"({"model":"claude-sonnet-4-5","thinking":{"type":"enabled","budget_tokens":2048}})");
        QCOMPARE(modelOf(TransparentRouter::bindCandidate(thinking, Candidate{mapped, 0}).body),
                 QStringLiteral("claude-sonnet-4-5-thinking"));

        const Provider openai = makeProvider(QStringLiteral("o"), AppFamily::Codex, QString(),
                                             QStringLiteral("https://o.example"), QStringLiteral("sk-proj-1"));
        const RoutedRequest dated = routedBody(AppFamily::Codex, QStringLiteral("/v1/chat/completions"),
            R"({"model":"gpt-4o-mini-2024-08-06","messages":[]})");
        QCOMPARE(modelOf(TransparentRouter::bindCandidate(dated, Candidate{openai, 0}).body),
                 QStringLiteral("gpt-4o-mini"));

        const RoutedRequest plain = routedBody(AppFamily::Codex, QStringLiteral("/v1/chat/completions"),
            R"({"model":"gpt-5","messages":[]})");
        QCOMPARE(TransparentRouter::bindCandidate(plain, Candidate{openai, 0}).body, plain.body);
    }

    void bindCandidateGeminiPath()
    {
        Provider google = makeProvider(QStringLiteral("g"), AppFamily::Gemini, QString(),
                                       QStringLiteral("https://g.example"), QStringLiteral("AIza-1"));
        google.modelMapping.defaultModel = QStringLiteral("gemini-2.5-flash");
        const RoutedRequest routed = routedBody(AppFamily::Gemini,
            QStringLiteral("/v1beta/models/gemini-2.0-flash:streamGenerateContent?alt=sse"), R"({"contents":[]})");

        const ProviderRequest req = TransparentRouter::bindCandidate(routed, Candidate{google, 0});
        QCOMPARE(req.url, QStringLiteral("https://g.example/v1beta/models/gemini-2.5-flash:streamGenerateContent?alt=sse"));
        QCOMPARE(req.body, routed.body);
    }

    void healthRequestUsesMappedModel()
    {
        Provider mapped = makeProvider(QStringLiteral("mapped"), AppFamily::Claude, QString(),
                                       QStringLiteral("https://m.example"), QStringLiteral("sk-ant-mapped"));
        mapped.modelMapping = claudeMapping();
        RoutedRequest routed;
        routed.family = AppFamily::Claude;
        routed.model = QStringLiteral("claude-opus-4-1");

        const ProviderRequest req = TransparentRouter::buildProbe(routed, Candidate{mapped, 0}, ProbeOptions());
        QCOMPARE(modelOf(req.body), QStringLiteral("claude-opus-4-5"));

        const Provider openai = makeProvider(QStringLiteral("o"), AppFamily::Codex, QString(),
                                             QStringLiteral("https://o.example"), QStringLiteral("sk-proj-1"));
        RoutedRequest codex;
        codex.family = AppFamily::Codex;
        codex.upstreamPath = QStringLiteral("/v1/chat/completions");
        codex.model = QStringLiteral("gpt-4-0613");
        QCOMPARE(modelOf(TransparentRouter::buildProbe(codex, Candidate{openai, 0}, ProbeOptions()).body),
                 QStringLiteral("gpt-4"));
    }
};

QTEST_MAIN(TestModelMapper)
#include "tst_model_mapper.moc"
