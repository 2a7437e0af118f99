#pragma once
#include "core/types.h"
#include <QString>
#include <QStringList>
#include <QList>
#include <optional>

struct Provider {
    QString name;
    QString url;
    std::optional<QString> secret;   // absent = unauthenticated upstream
    ApiType apiType = ApiType::Ollama;
    QStringList models;              // empty = serves any native model

    bool hasSecret() const { return secret.has_value() && !secret->isEmpty(); }
};

struct RuntimeOptions {
    bool debugMode = false;
    bool verifyTls = true;
    bool enableHttp2 = true;
    bool enableConnectionPool = true;
    UnknownModelPolicy unknownModelPolicy = UnknownModelPolicy::Reject;
    int connectionPoolSize = 10;
    int requestTimeout = 600000;
    int connectionTimeout = 30000;
    int idleTimeout = 120000;
    int drainTimeout = 10000;
    qint64 maxRequestBody = 32 * 1024 * 1024;
    QString logLevel = "info";
    QString logDir;
};

struct ProxyConfig {
    QString listenAddress = "127.0.0.1";
    int port = 11434;
    QList<Provider> providers;
    RuntimeOptions runtime;
};

QString apiTypeName(ApiType type);
std::optional<ApiType> parseApiType(const QString& text);
