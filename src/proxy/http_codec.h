#pragma once
#include "core/result.h"
#include <QByteArray>
#include <QList>
#include <QMap>
#include <QPair>
#include <QString>
#include <optional>

using HeaderList = QList<QPair<QByteArray, QByteArray>>;

struct InboundRequest {
    QString method;
    QString target;       // path + "?" + query, as received
    QString path;
    QString query;
    QString httpVersion;
    QMap<QString, QString> headers;   // lower-case names
    HeaderList rawHeaders;            // arrival order, lower-case names
    QByteArray body;

    bool isHttp10() const { return httpVersion == QStringLiteral("HTTP/1.0"); }
    bool keepAlive() const;
};

namespace http_codec {

constexpr int kMaxHeadBytes = 64 * 1024;

// Consumes one complete request from the front of buffer.
// nullopt = need more bytes; unexpected = the connection must be answered and closed.
Result<std::optional<InboundRequest>> takeRequest(QByteArray& buffer, qint64 maxBodyBytes);

QByteArray statusText(int status);
QByteArray responseHead(int status, const HeaderList& headers);
QByteArray wrapChunked(const QByteArray& data);
QByteArray chunkTerminator();

bool isHopByHop(const QByteArray& lowerName);

} // namespace http_codec
