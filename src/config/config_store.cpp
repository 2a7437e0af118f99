#include "config_store.h"
#include <QDir>
#include <QFile>
#include <QHostAddress>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonObject>
#include <QSet>
#include <QStandardPaths>
#include <QUrl>

namespace {

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

QString jsonStringEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey,
                         const QString& fallback = {})
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isString() ? value.toString() : fallback;
}

int jsonIntEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toInt(fallback);
}

qint64 jsonInt64Either(const QJsonObject& obj, const char* snakeKey, const char* camelKey, qint64 fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isDouble() ? static_cast<qint64>(value.toDouble()) : fallback;
}

bool jsonBoolEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool fallback)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    return value.isUndefined() ? fallback : value.toBool(fallback);
}

bool isLoopbackHost(const QString& host)
{
    if (host.compare(QStringLiteral("localhost"), Qt::CaseInsensitive) == 0)
        return true;
    QHostAddress addr;
    return addr.setAddress(host) && addr.isLoopback();
}

}

bool ConfigStore::load(const QString& path)
{
    m_filePath = path.isEmpty() ? defaultConfigPath() : path;
    m_errors.clear();
    m_warnings.clear();

    QFile file(m_filePath);
    if (!file.open(QIODevice::ReadOnly)) {
        m_errors.append(QStringLiteral("cannot open config file %1: %2")
                            .arg(m_filePath, file.errorString()));
        return false;
    }
    return loadFromJson(file.readAll());
}

bool ConfigStore::loadFromJson(const QByteArray& json)
{
    m_errors.clear();
    m_warnings.clear();
    m_config = ProxyConfig{};

    QJsonParseError parseError;
    QJsonDocument doc = QJsonDocument::fromJson(json, &parseError);
    if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
        m_errors.append(QStringLiteral("config is not a JSON object: %1")
                            .arg(parseError.errorString()));
        return false;
    }

    QJsonObject root = doc.object();
    m_config.port = jsonIntEither(root, "port", "port", 11434);
    m_config.listenAddress = jsonStringEither(root, "listen_address", "listenAddress",
                                              m_config.listenAddress);

    // providers, under "items" ("providers" is accepted too)
    QJsonArray items = root.contains("items") ? root["items"].toArray()
                                              : root["providers"].toArray();
    for (int i = 0; i < items.size(); ++i) {
        const QJsonObject obj = items[i].toObject();
        Provider p;
        p.name = obj["name"].toString().trimmed();
        p.url = obj["url"].toString().trimmed();

        const QJsonValue secret = obj["secret"];
        if (secret.isString() && !secret.toString().isEmpty())
            p.secret = secret.toString();

        const QString apiText = jsonStringEither(obj, "api_type", "apiType", QStringLiteral("Ollama"));
        auto apiType = parseApiType(apiText);
        if (!apiType) {
            m_errors.append(QStringLiteral("provider #%1 (%2): unknown api_type '%3'")
                                .arg(i).arg(p.name, apiText));
        } else {
            p.apiType = *apiType;
        }

        for (const auto& m : obj["models"].toArray())
            p.models.append(m.toString());

        if (!p.url.isEmpty() && !p.url.contains(QStringLiteral("://"))) {
            m_warnings.append(QStringLiteral("provider '%1': url '%2' has no scheme, assuming http")
                                  .arg(p.name, p.url));
            p.url.prepend(QStringLiteral("http://"));
        }
        m_config.providers.append(p);
    }

    // runtime
    QJsonObject rt = root["runtime"].toObject();
    RuntimeOptions& r = m_config.runtime;
    r.debugMode = jsonBoolEither(rt, "debug_mode", "debugMode", r.debugMode);
    r.verifyTls = jsonBoolEither(rt, "verify_tls", "verifyTls", r.verifyTls);
    r.enableHttp2 = jsonBoolEither(rt, "enable_http2", "enableHttp2", r.enableHttp2);
    r.enableConnectionPool = jsonBoolEither(rt, "enable_connection_pool", "enableConnectionPool", r.enableConnectionPool);
    r.connectionPoolSize = jsonIntEither(rt, "connection_pool_size", "connectionPoolSize", r.connectionPoolSize);
    r.requestTimeout = jsonIntEither(rt, "request_timeout", "requestTimeout", r.requestTimeout);
    r.connectionTimeout = jsonIntEither(rt, "connection_timeout", "connectionTimeout", r.connectionTimeout);
    r.idleTimeout = jsonIntEither(rt, "idle_timeout", "idleTimeout", r.idleTimeout);
    r.drainTimeout = jsonIntEither(rt, "drain_timeout", "drainTimeout", r.drainTimeout);
    r.maxRequestBody = jsonInt64Either(rt, "max_request_body", "maxRequestBody", r.maxRequestBody);
    r.logLevel = jsonStringEither(rt, "log_level", "logLevel", r.logLevel);
    r.logDir = jsonStringEither(rt, "log_dir", "logDir", r.logDir);

    const QString policy = jsonStringEither(rt, "unknown_model_policy", "unknownModelPolicy",
                                            QStringLiteral("reject")).trimmed().toLower();
    if (policy == QStringLiteral("reject")) {
        r.unknownModelPolicy = UnknownModelPolicy::Reject;
    } else if (policy == QStringLiteral("pass_through") || policy == QStringLiteral("passthrough")) {
        r.unknownModelPolicy = UnknownModelPolicy::PassThrough;
    } else {
        m_errors.append(QStringLiteral("unknown_model_policy must be 'reject' or 'pass_through', got '%1'")
                            .arg(policy));
    }

    m_errors.append(validate(m_config));
    return m_errors.isEmpty();
}

QStringList ConfigStore::validate(const ProxyConfig& config)
{
    QStringList errors;

    if (config.port < 1 || config.port > 65535)
        errors.append(QStringLiteral("port %1 is out of range").arg(config.port));

    QHostAddress listen;
    if (!listen.setAddress(config.listenAddress)
        && config.listenAddress.compare(QStringLiteral("localhost"), Qt::CaseInsensitive) != 0) {
        errors.append(QStringLiteral("listen_address '%1' is not an IP address")
                          .arg(config.listenAddress));
    }

    if (config.providers.isEmpty())
        errors.append(QStringLiteral("no providers configured"));

    QSet<QString> names;
    for (int i = 0; i < config.providers.size(); ++i) {
        const Provider& p = config.providers[i];
        const QString label = p.name.isEmpty() ? QStringLiteral("#%1").arg(i) : p.name;

        if (p.name.isEmpty()) {
            errors.append(QStringLiteral("provider %1: name is empty").arg(label));
        } else {
            for (const QChar c : p.name) {
                if (c.isSpace()) {
                    errors.append(QStringLiteral("provider '%1': name contains whitespace").arg(label));
                    break;
                }
            }
            if (names.contains(p.name))
                errors.append(QStringLiteral("provider '%1': duplicate name").arg(label));
            names.insert(p.name);
        }

        const QUrl url(p.url, QUrl::StrictMode);
        const QString scheme = url.scheme().toLower();
        if (!url.isValid() || url.host().isEmpty()
            || (scheme != QStringLiteral("http") && scheme != QStringLiteral("https"))) {
            errors.append(QStringLiteral("provider '%1': invalid url '%2'").arg(label, p.url));
        } else if (p.hasSecret() && scheme != QStringLiteral("https") && !isLoopbackHost(url.host())) {
            errors.append(QStringLiteral("provider '%1': a secret requires an https url").arg(label));
        }

        QSet<QString> models;
        for (const QString& m : p.models) {
            if (m.isEmpty()) {
                errors.append(QStringLiteral("provider '%1': empty model name").arg(label));
                continue;
            }
            if (models.contains(m))
                errors.append(QStringLiteral("provider '%1': duplicate model '%2'").arg(label, m));
            models.insert(m);
        }
    }

    if (config.runtime.connectionTimeout <= 0 || config.runtime.idleTimeout <= 0
        || config.runtime.requestTimeout <= 0) {
        errors.append(QStringLiteral("timeouts must be positive"));
    }
    if (config.runtime.maxRequestBody <= 0)
        errors.append(QStringLiteral("max_request_body must be positive"));

    return errors;
}

QString ConfigStore::defaultConfigPath()
{
    const QByteArray fromEnv = qgetenv("OLLAMA_PROXY_CONFIG");
    if (!fromEnv.isEmpty())
        return QString::fromLocal8Bit(fromEnv);
    QString dir = QStandardPaths::writableLocation(QStandardPaths::AppConfigLocation);
    return QDir(dir).filePath(QStringLiteral("config.json"));
}

QByteArray ConfigStore::exampleConfig()
{
    auto provider = [](const QString& name, const QString& url, const QJsonValue& secret,
                       const QStringList& models, const QString& apiType) {
        QJsonObject obj;
        obj["name"] = name;
        obj["url"] = url;
        obj["secret"] = secret;
        obj["models"] = QJsonArray::fromStringList(models);
        obj["api_type"] = apiType;
        return obj;
    };

    QJsonArray items;
    items.append(provider(QStringLiteral("ollama"), QStringLiteral("http://localhost:11435"),
                          QJsonValue::Null, {QStringLiteral("qwen3-coder-plus")},
                          QStringLiteral("Ollama")));
    items.append(provider(QStringLiteral("aliyun"),
                          QStringLiteral("https://dashscope.aliyuncs.com/compatible-mode"),
                          QStringLiteral("secret-key"),
                          {QStringLiteral("qwen3-coder-plus"), QStringLiteral("Moonshot-Kimi-K2-Instruct"),
                           QStringLiteral("qwen3-max"), QStringLiteral("glm-4.5")},
                          QStringLiteral("OpenAI")));
    items.append(provider(QStringLiteral("tsinghua"), QStringLiteral("https://llmapi.paratera.com"),
                          QStringLiteral("secret-key"),
                          {QStringLiteral("Qwen3-Coder-Plus"), QStringLiteral("GLM-4.5")},
                          QStringLiteral("OpenAI")));

    RuntimeOptions defaults;
    QJsonObject rt;
    rt["request_timeout"] = defaults.requestTimeout;
    rt["connection_timeout"] = defaults.connectionTimeout;
    rt["idle_timeout"] = defaults.idleTimeout;
    rt["drain_timeout"] = defaults.drainTimeout;
    rt["max_request_body"] = static_cast<double>(defaults.maxRequestBody);
    rt["enable_connection_pool"] = defaults.enableConnectionPool;
    rt["connection_pool_size"] = defaults.connectionPoolSize;
    rt["verify_tls"] = defaults.verifyTls;
    rt["enable_http2"] = defaults.enableHttp2;
    rt["unknown_model_policy"] = QStringLiteral("reject");
    rt["debug_mode"] = defaults.debugMode;
    rt["log_level"] = defaults.logLevel;
    rt["log_dir"] = defaults.logDir;

    QJsonObject root;
    root["port"] = 11434;
    root["listen_address"] = QStringLiteral("127.0.0.1");
    root["items"] = items;
    root["runtime"] = rt;
    return QJsonDocument(root).toJson(QJsonDocument::Indented);
}
