#include <QTest>
#include <QFile>
#include <QTemporaryDir>
#include <QJsonDocument>
#include <QJsonObject>
#include <QJsonArray>
#include "config/config_store.h"
#include "config/config_types.h"

namespace {

QJsonObject providerJson(const QString& name, const QString& url, const QJsonValue& secret,
                         const QStringList& models, const QString& apiType)
{
    QJsonObject obj;
    obj[QStringLiteral("name")] = name;
    obj[QStringLiteral("url")] = url;
    obj[QStringLiteral("secret")] = secret;
    obj[QStringLiteral("models")] = QJsonArray::fromStringList(models);
    obj[QStringLiteral("api_type")] = apiType;
    return obj;
}

QByteArray configWith(const QJsonArray& items, const QJsonObject& runtime = {})
{
    QJsonObject root;
    root[QStringLiteral("port")] = 11434;
    root[QStringLiteral("items")] = items;
    if (!runtime.isEmpty())
        root[QStringLiteral("runtime")] = runtime;
    return QJsonDocument(root).toJson();
}

bool anyContains(const QStringList& list, const QString& needle)
{
    for (const QString& s : list) {
        if (s.contains(needle))
            return true;
    }
    return false;
}

}

class TestConfigStore : public QObject {
    Q_OBJECT

private slots:
    void testMissingFileIsAnError() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.path() + QStringLiteral("/config.json");

        ConfigStore store;
        QVERIFY(!store.load(path));
        QCOMPARE(store.errors().size(), 1);
        QCOMPARE(store.filePath(), path);
    }

    void testExampleConfigIsValid() {
        ConfigStore store;
        QVERIFY2(store.loadFromJson(ConfigStore::exampleConfig()),
                 qPrintable(store.errors().join(QStringLiteral("; "))));

        const ProxyConfig config = store.proxyConfig();
        QCOMPARE(config.port, 11434);
        QCOMPARE(config.listenAddress, QStringLiteral("127.0.0.1"));
        QCOMPARE(config.providers.size(), 3);
        QCOMPARE(config.providers[0].name, QStringLiteral("ollama"));
        QVERIFY(!config.providers[0].secret.has_value());
        QCOMPARE(config.providers[1].apiType, ApiType::OpenAI);
        QVERIFY(config.providers[1].hasSecret());
        QCOMPARE(config.runtime.unknownModelPolicy, UnknownModelPolicy::Reject);
    }

    void testLoadFromFile() {
        QTemporaryDir dir;
        QVERIFY(dir.isValid());
        QString path = dir.path() + QStringLiteral("/config.json");
        {
            QFile file(path);
            QVERIFY(file.open(QIODevice::WriteOnly));
            file.write(configWith({providerJson(QStringLiteral("local"), QStringLiteral("http://127.0.0.1:11435"),
                                                QJsonValue::Null, {QStringLiteral("llama3")},
                                                QStringLiteral("Ollama"))}));
        }

        ConfigStore store;
        QVERIFY(store.load(path));
        QCOMPARE(store.proxyConfig().providers.size(), 1);
        QCOMPARE(store.proxyConfig().providers[0].models, QStringList{QStringLiteral("llama3")});
    }

    void testApiTypeIsCaseInsensitive() {
        ConfigStore store;
        QVERIFY(store.loadFromJson(configWith({
            providerJson(QStringLiteral("a"), QStringLiteral("https://a.example.com"), QStringLiteral("k"),
                         {}, QStringLiteral("Openai")),
            providerJson(QStringLiteral("b"), QStringLiteral("http://localhost:1"), QJsonValue::Null,
                         {}, QStringLiteral("OLLAMA")),
        })));
        QCOMPARE(store.proxyConfig().providers[0].apiType, ApiType::OpenAI);
        QCOMPARE(store.proxyConfig().providers[1].apiType, ApiType::Ollama);
    }

    void testUnknownApiTypeRejected() {
        ConfigStore store;
        QVERIFY(!store.loadFromJson(configWith({
            providerJson(QStringLiteral("a"), QStringLiteral("https://a.example.com"), QJsonValue::Null,
                         {}, QStringLiteral("anthropic")),
        })));
        QVERIFY(anyContains(store.errors(), QStringLiteral("api_type")));
    }

    void testCamelCaseRuntimeKeys() {
        QJsonObject runtime;
        runtime[QStringLiteral("connectionTimeout")] = 1500;
        runtime[QStringLiteral("debugMode")] = true;
        runtime[QStringLiteral("unknownModelPolicy")] = QStringLiteral("pass_through");

        ConfigStore store;
        QVERIFY(store.loadFromJson(configWith({
            providerJson(QStringLiteral("a"), QStringLiteral("http://localhost:1"), QJsonValue::Null,
                         {}, QStringLiteral("Ollama")),
        }, runtime)));
        QCOMPARE(store.runtimeConfig().connectionTimeout, 1500);
        QVERIFY(store.runtimeConfig().debugMode);
        QCOMPARE(store.runtimeConfig().unknownModelPolicy, UnknownModelPolicy::PassThrough);
    }

    void testUnknownPolicyRejected() {
        QJsonObject runtime;
        runtime[QStringLiteral("unknown_model_policy")] = QStringLiteral("guess");

        ConfigStore store;
        QVERIFY(!store.loadFromJson(configWith({
            providerJson(QStringLiteral("a"), QStringLiteral("http://localhost:1"), QJsonValue::Null,
                         {}, QStringLiteral("Ollama")),
        }, runtime)));
        QVERIFY(anyContains(store.errors(), QStringLiteral("unknown_model_policy")));
    }

    void testSchemelessUrlGetsHttp() {
        ConfigStore store;
        QVERIFY(store.loadFromJson(configWith({
            providerJson(QStringLiteral("a"), QStringLiteral("localhost:11435"), QJsonValue::Null,
                         {}, QStringLiteral("Ollama")),
        })));
        QCOMPARE(store.proxyConfig().providers[0].url, QStringLiteral("http://localhost:11435"));
        QCOMPARE(store.warnings().size(), 1);
    }

    void testSecretRequiresHttpsUnlessLoopback() {
        ConfigStore remote;
        QVERIFY(!remote.loadFromJson(configWith({
            providerJson(QStringLiteral("a"), QStringLiteral("http://api.example.com"), QStringLiteral("sk"),
                         {}, QStringLiteral("OpenAI")),
        })));
        QVERIFY(anyContains(remote.errors(), QStringLiteral("https")));

        ConfigStore loopback;
        QVERIFY(loopback.loadFromJson(configWith({
            providerJson(QStringLiteral("a"), QStringLiteral("http://127.0.0.1:8080"), QStringLiteral("sk"),
                         {}, QStringLiteral("OpenAI")),
        })));
    }

    void testAllViolationsReported() {
        QJsonObject root;
        root[QStringLiteral("port")] = 70000;
        root[QStringLiteral("items")] = QJsonArray{
            providerJson(QStringLiteral("dup"), QStringLiteral("http://localhost:1"), QJsonValue::Null,
                         {QStringLiteral("m"), QStringLiteral("m")}, QStringLiteral("Ollama")),
            providerJson(QStringLiteral("dup"), QStringLiteral("ftp://host"), QJsonValue::Null,
                         {}, QStringLiteral("Ollama")),
            providerJson(QStringLiteral("has space"), QStringLiteral("http://localhost:2"), QJsonValue::Null,
                         {}, QStringLiteral("Ollama")),
        };

        ConfigStore store;
        QVERIFY(!store.loadFromJson(QJsonDocument(root).toJson()));
        const QStringList errors = store.errors();
        QVERIFY(anyContains(errors, QStringLiteral("port")));
        QVERIFY(anyContains(errors, QStringLiteral("duplicate name")));
        QVERIFY(anyContains(errors, QStringLiteral("duplicate model")));
        QVERIFY(anyContains(errors, QStringLiteral("invalid url")));
        QVERIFY(anyContains(errors, QStringLiteral("whitespace")));
        QVERIFY(errors.size() >= 5);
    }

    void testEmptyProviderListRejected() {
        ConfigStore store;
        QVERIFY(!store.loadFromJson(configWith({})));
        QVERIFY(anyContains(store.errors(), QStringLiteral("no providers")));
    }

    void testNotJsonRejected() {
        ConfigStore store;
        QVERIFY(!store.loadFromJson(QByteArrayLiteral("items: []")));
        QCOMPARE(store.errors().size(), 1);
    }

    void testValidateCommandLineOverrides() {
        ConfigStore store;
        QVERIFY(store.loadFromJson(ConfigStore::exampleConfig()));

        ProxyConfig config = store.proxyConfig();
        config.listenAddress = QStringLiteral("not an address");
        config.port = 0;
        const QStringList errors = ConfigStore::validate(config);
        QCOMPARE(errors.size(), 2);

        config.listenAddress = QStringLiteral("localhost");
        config.port = 8080;
        QVERIFY(ConfigStore::validate(config).isEmpty());
    }
};

QTEST_MAIN(TestConfigStore)
#include "tst_config_store.moc"
