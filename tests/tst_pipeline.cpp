#include <QTest>
#include <QJsonDocument>
#include <QJsonObject>
#include "pipeline/pipeline.h"
#include "pipeline/middleware.h"
#include "pipeline/middlewares/auth_injector.h"
#include "pipeline/middlewares/debug_middleware.h"
#include "pipeline/middlewares/header_filter_middleware.h"
#include "pipeline/middlewares/model_rewrite_middleware.h"

// Records the order in which it runs and can short-circuit the chain
class RecordingMiddleware : public IPipelineMiddleware {
public:
    RecordingMiddleware(QString tag, QStringList* log, bool fail = false)
        : m_tag(std::move(tag)), m_log(log), m_fail(fail) {}

    QString name() const override { return m_tag; }
    Result<OutboundCall> onOutbound(OutboundCall call) override {
        m_log->append(m_tag);
        if (m_fail)
            return std::unexpected(DomainFailure::internal(QStringLiteral("stop at %1").arg(m_tag)));
        return call;
    }

private:
    QString m_tag;
    QStringList* m_log;
    bool m_fail;
};

namespace {

OutboundCall sampleCall()
{
    OutboundCall call;
    call.method = QStringLiteral("POST");
    call.url = QUrl(QStringLiteral("https://dashscope.example.com/v1/chat/completions"));
    call.provider.name = QStringLiteral("aliyun");
    call.provider.apiType = ApiType::OpenAI;
    call.provider.secret = QStringLiteral("sk-test");
    call.taggedModel = QStringLiteral("aliyun-qwen3-max");
    call.nativeModel = QStringLiteral("qwen3-max");
    call.dialect = Dialect::OpenAI;

    QJsonObject payload;
    payload[QStringLiteral("model")] = call.taggedModel;
    payload[QStringLiteral("stream")] = true;
    payload[QStringLiteral("temperature")] = 0.5;
    call.payload = payload;

    call.headers = {
        {"host", "127.0.0.1:11434"},
        {"content-type", "application/json; charset=utf-8"},
        {"content-length", "57"},
        {"connection", "keep-alive"},
        {"accept-encoding", "gzip"},
        {"authorization", "Bearer caller"},
        {"x-request-id", "abc123"},
        {"user-agent", "ollama-client/1.0"},
    };
    return call;
}

}

class TestPipeline : public QObject {
    Q_OBJECT

private slots:
    void testMiddlewaresRunInOrder() {
        QStringList log;
        Pipeline pipeline;
        pipeline.addMiddleware(std::make_unique<RecordingMiddleware>(QStringLiteral("first"), &log));
        pipeline.addMiddleware(std::make_unique<RecordingMiddleware>(QStringLiteral("second"), &log));

        auto result = pipeline.process(sampleCall());
        QVERIFY(result.has_value());
        QCOMPARE(log, (QStringList{QStringLiteral("first"), QStringLiteral("second")}));
        QCOMPARE(pipeline.middlewareNames(), log);
    }

    void testFailureStopsChain() {
        QStringList log;
        Pipeline pipeline;
        pipeline.addMiddleware(std::make_unique<RecordingMiddleware>(QStringLiteral("first"), &log, true));
        pipeline.addMiddleware(std::make_unique<RecordingMiddleware>(QStringLiteral("second"), &log));

        auto result = pipeline.process(sampleCall());
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Internal);
        QCOMPARE(log, QStringList{QStringLiteral("first")});
    }

    void testHeaderFilterDropsLocalLegHeaders() {
        HeaderFilterMiddleware filter;
        auto result = filter.onOutbound(sampleCall());
        QVERIFY(result.has_value());

        QVERIFY(!result->hasHeader("host"));
        QVERIFY(!result->hasHeader("content-length"));
        QVERIFY(!result->hasHeader("connection"));
        QVERIFY(!result->hasHeader("accept-encoding"));
        QVERIFY(!result->hasHeader("authorization"));
        QCOMPARE(result->header("x-request-id"), QByteArray("abc123"));
        QCOMPARE(result->header("user-agent"), QByteArray("ollama-client/1.0"));
    }

    void testModelRewriteKeepsOtherFields() {
        ModelRewriteMiddleware rewrite;
        auto result = rewrite.onOutbound(sampleCall());
        QVERIFY(result.has_value());

        const QJsonObject body = QJsonDocument::fromJson(result->body).object();
        QCOMPARE(body.value(QStringLiteral("model")).toString(), QStringLiteral("qwen3-max"));
        QCOMPARE(body.value(QStringLiteral("stream")).toBool(), true);
        QCOMPARE(body.value(QStringLiteral("temperature")).toDouble(), 0.5);
        QCOMPARE(body.size(), 3);
        QCOMPARE(result->header("content-type"), QByteArray("application/json"));
        QVERIFY(!result->body.contains('\n'));
    }

    void testModelRewriteRequiresResolvedModel() {
        OutboundCall call = sampleCall();
        call.nativeModel.clear();

        ModelRewriteMiddleware rewrite;
        auto result = rewrite.onOutbound(std::move(call));
        QVERIFY(!result.has_value());
        QCOMPARE(result.error().kind, ErrorKind::Internal);
    }

    void testDebugMiddlewareLeavesCallUntouched() {
        DebugMiddleware debug(true);
        OutboundCall call = sampleCall();
        const HeaderList before = call.headers;

        auto result = debug.onOutbound(std::move(call));
        QVERIFY(result.has_value());
        QVERIFY(result->headers == before);
    }

    void testFullChain() {
        Pipeline pipeline;
        pipeline.addMiddleware(std::make_unique<HeaderFilterMiddleware>());
        pipeline.addMiddleware(std::make_unique<ModelRewriteMiddleware>());
        pipeline.addMiddleware(std::make_unique<AuthInjector>());
        pipeline.addMiddleware(std::make_unique<DebugMiddleware>(false));

        auto result = pipeline.process(sampleCall());
        QVERIFY(result.has_value());
        QCOMPARE(result->header("authorization"), QByteArray("Bearer sk-test"));
        QCOMPARE(QJsonDocument::fromJson(result->body).object().value(QStringLiteral("model")).toString(),
                 QStringLiteral("qwen3-max"));
        QCOMPARE(pipeline.middlewareNames(),
                 (QStringList{QStringLiteral("header_filter"), QStringLiteral("model_rewrite"),
                              QStringLiteral("auth"), QStringLiteral("debug")}));
    }
};

QTEST_MAIN(TestPipeline)
#include "tst_pipeline.moc"
