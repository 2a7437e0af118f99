#pragma once
#include "config/config_types.h"
#include "proxy/http_codec.h"
#include <QJsonObject>
#include <QUrl>

// One upstream call derived from an inbound request and its resolved provider.
// Owned by the relay that performs it; never shared between requests.
struct OutboundCall {
    QString method;
    QUrl url;
    HeaderList headers;      // lower-case names
    QJsonObject payload;     // parsed inbound body
    QByteArray body;         // bytes sent upstream
    Provider provider;
    QString taggedModel;
    QString nativeModel;
    Dialect dialect = Dialect::Ollama;

    QByteArray header(const QByteArray& name) const;
    bool hasHeader(const QByteArray& name) const;
    void setHeader(const QByteArray& name, const QByteArray& value);
    void removeHeader(const QByteArray& name);
};
