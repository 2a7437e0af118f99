#include "stream_relay.h"
#include "response_writer.h"
#include "core/log_manager.h"
#include <QJsonDocument>
#include <QSslConfiguration>

namespace {

constexpr qint64 kReadChunk = 64 * 1024;

QString modeName(BodyMode mode)
{
    switch (mode) {
    case BodyMode::Buffered:     return QStringLiteral("buffered");
    case BodyMode::StreamEvents: return QStringLiteral("event-stream");
    case BodyMode::StreamLines:  return QStringLiteral("ndjson");
    case BodyMode::StreamRaw:    return QStringLiteral("raw");
    }
    return QStringLiteral("unknown");
}

}

RelaySession::RelaySession(QTcpSocket* downstream, ConnectionPool& pool, OutboundCall call,
                           const RelayOptions& options, QObject* parent)
    : QObject(parent)
    , m_socket(downstream)
    , m_pool(pool)
    , m_call(std::move(call))
    , m_options(options)
{
    m_headTimer.setSingleShot(true);
    m_requestTimer.setSingleShot(true);
    connect(&m_headTimer, &QTimer::timeout, this, &RelaySession::onHeadTimeout);
    connect(&m_requestTimer, &QTimer::timeout, this, &RelaySession::onRequestTimeout);
}

RelaySession::~RelaySession()
{
    releaseUpstream(true);
}

QNetworkRequest RelaySession::buildRequest() const
{
    QNetworkRequest req(m_call.url);
    for (const auto& header : m_call.headers)
        req.setRawHeader(header.first, header.second);

    req.setTransferTimeout(m_options.idleTimeout);
    req.setAttribute(QNetworkRequest::Http2AllowedAttribute, m_options.http2);

    if (!m_options.verifyTls && m_call.url.scheme() == QStringLiteral("https")) {
        QSslConfiguration sslConfig = QSslConfiguration::defaultConfiguration();
        sslConfig.setPeerVerifyMode(QSslSocket::VerifyNone);
        req.setSslConfiguration(sslConfig);
    }
    return req;
}

void RelaySession::start()
{
    LOG_INFO(QStringLiteral("Relay: %1 %2 -> provider '%3' model '%4' (%5)")
                 .arg(m_call.method, m_call.url.path(), m_call.provider.name,
                      m_call.nativeModel,
                      m_call.url.toString(QUrl::RemoveUserInfo | QUrl::RemoveQuery)));

    m_nam = m_pool.acquire();
    m_reply = m_nam->sendCustomRequest(buildRequest(), m_call.method.toUtf8(), m_call.body);
    m_reply->setReadBufferSize(m_options.highWaterMark);

    connect(m_reply, &QNetworkReply::metaDataChanged, this, &RelaySession::onMetaDataChanged);
    connect(m_reply, &QNetworkReply::readyRead, this, &RelaySession::onReadyRead);
    connect(m_reply, &QNetworkReply::finished, this, &RelaySession::onReplyFinished);

    if (m_socket) {
        connect(m_socket, &QTcpSocket::bytesWritten,
                this, &RelaySession::onDownstreamBytesWritten);
    }

    m_headTimer.start(m_options.connectionTimeout);
    m_requestTimer.start(m_options.requestTimeout);
}

void RelaySession::abort()
{
    if (m_finished)
        return;

    m_stats.cancelled = true;
    LOG_INFO(QStringLiteral("Relay: caller disconnected from '%1' after %2 unit(s), cancelling upstream")
                 .arg(m_call.taggedModel)
                 .arg(m_stats.unitsForwarded));
    finish(false);
}

HeaderList RelaySession::forwardableResponseHeaders(const QList<QNetworkReply::RawHeaderPair>& pairs)
{
    HeaderList headers;
    for (const auto& pair : pairs) {
        const QByteArray name = pair.first.toLower();
        if (http_codec::isHopByHop(name)
            || name == "content-length"
            || name == "content-encoding"
            || name == "access-control-allow-origin") {
            continue;
        }
        headers.append({name, pair.second});
    }
    return headers;
}

void RelaySession::onMetaDataChanged()
{
    if (m_headSeen || !m_reply)
        return;

    const QVariant statusAttr = m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute);
    if (!statusAttr.isValid())
        return;

    m_headSeen = true;
    m_headTimer.stop();
    m_stats.status = statusAttr.toInt();

    BodyMode mode = StreamFramer::detectMode(m_reply->rawHeader("Content-Type"),
                                             m_reply->hasRawHeader("Content-Length"));
    // No body may follow these
    if (m_stats.status == 204 || m_stats.status == 304)
        mode = BodyMode::Buffered;

    m_stats.mode = mode;
    m_framer = StreamFramer(mode);

    LOG_INFO(QStringLiteral("Relay: upstream '%1' answered %2, body mode %3")
                 .arg(m_call.provider.name)
                 .arg(m_stats.status)
                 .arg(modeName(mode)));

    if (mode == BodyMode::Buffered)
        return;

    m_requestTimer.stop();
    if (!ResponseWriter::writeStreamHead(m_socket, m_stats.status,
                                         forwardableResponseHeaders(m_reply->rawHeaderPairs()),
                                         m_options.chunked)) {
        abort();
        return;
    }
    m_headWritten = true;
}

void RelaySession::onReadyRead()
{
    if (!m_headSeen)
        onMetaDataChanged();
    pump();
}

bool RelaySession::downstreamBacklogged() const
{
    return m_socket && m_socket->bytesToWrite() > m_options.highWaterMark;
}

bool RelaySession::forward(const QList<QByteArray>& units)
{
    for (const QByteArray& unit : units) {
        if (!ResponseWriter::sendChunk(m_socket, unit, m_options.chunked))
            return false;
        ++m_stats.unitsForwarded;
        m_stats.bytesForwarded += unit.size();
    }
    return true;
}

void RelaySession::pump()
{
    if (m_finished || !m_reply)
        return;

    if (m_stats.mode == BodyMode::Buffered || !m_headWritten) {
        m_body.append(m_reply->readAll());
    } else {
        while (m_reply->bytesAvailable() > 0) {
            if (downstreamBacklogged()) {
                if (!m_paused) {
                    m_paused = true;
                    LOG_DEBUG(QStringLiteral("Relay: downstream backlogged (%1 bytes), pausing upstream reads")
                                  .arg(m_socket->bytesToWrite()));
                }
                return;
            }
            if (!forward(m_framer.feed(m_reply->read(kReadChunk)))) {
                abort();
                return;
            }
        }
    }

    if (m_upstreamDone)
        complete();
}

void RelaySession::onDownstreamBytesWritten(qint64)
{
    if (!m_paused || m_finished || !m_socket)
        return;
    if (m_socket->bytesToWrite() > m_options.highWaterMark / 2)
        return;

    m_paused = false;
    LOG_DEBUG(QStringLiteral("Relay: downstream drained, resuming upstream reads"));
    pump();
}

void RelaySession::onHeadTimeout()
{
    if (m_finished || m_headSeen || !m_reply)
        return;
    m_timeoutLimit = m_options.connectionTimeout;
    m_reply->abort();
}

void RelaySession::onRequestTimeout()
{
    if (m_finished || !m_reply)
        return;
    m_timeoutLimit = m_options.requestTimeout;
    m_reply->abort();
}

bool RelaySession::providerAnswered(QNetworkReply::NetworkError error) const
{
    if (m_timeoutLimit > 0)
        return false;
    if (error == QNetworkReply::NoError)
        return true;
    // Network layer errors and malformed framing mean the transfer broke. Any
    // other error with a status is the provider's answer, whatever group Qt
    // maps that status to (400 and 418 land on ProtocolInvalidOperationError).
    const int code = static_cast<int>(error);
    if (code < 100 || error == QNetworkReply::ProtocolFailure)
        return false;
    return m_reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).isValid();
}

void RelaySession::onReplyFinished()
{
    if (m_finished || !m_reply)
        return;

    m_upstreamDone = true;
    m_headTimer.stop();
    m_requestTimer.stop();

    const QNetworkReply::NetworkError error = m_reply->error();
    if (providerAnswered(error)) {
        if (!m_headSeen)
            onMetaDataChanged();
        pump();
        return;
    }

    const QString providerName = m_call.provider.name;
    // Our own timers abort the reply; so does the transfer timeout of the request
    if (m_timeoutLimit > 0 || error == QNetworkReply::TimeoutError
        || error == QNetworkReply::OperationCanceledError) {
        const int limit = m_timeoutLimit > 0 ? m_timeoutLimit : m_options.idleTimeout;
        fail(DomainFailure::upstreamTimeout(
            QStringLiteral("provider '%1' did not respond within %2 ms").arg(providerName).arg(limit)));
        return;
    }

    fail(DomainFailure::upstreamUnreachable(
        QStringLiteral("provider '%1' unreachable: %2").arg(providerName, m_reply->errorString())));
}

void RelaySession::complete()
{
    if (m_finished)
        return;

    if (m_stats.mode == BodyMode::Buffered) {
        HeaderList headers = forwardableResponseHeaders(m_reply->rawHeaderPairs());
        const bool sent = ResponseWriter::sendResponse(m_socket, m_stats.status, m_body,
                                                       QByteArray(), m_options.keepAlive, headers);
        if (sent) {
            m_stats.unitsForwarded = 1;
            m_stats.bytesForwarded = m_body.size();
        }
        finish(sent && m_options.keepAlive);
        return;
    }

    const QByteArray tail = m_framer.flush();
    if (!tail.isEmpty() && !forward({tail})) {
        abort();
        return;
    }
    const bool terminated = ResponseWriter::sendTerminator(m_socket, m_options.chunked);
    finish(terminated && m_options.keepAlive && m_options.chunked);
}

void RelaySession::fail(const DomainFailure& failure)
{
    m_stats.failed = true;
    if (m_stats.status == 0)
        m_stats.status = failure.httpStatus();

    if (!m_headWritten) {
        LOG_WARNING(QStringLiteral("Relay: %1 (%2)").arg(failure.message, errorKindName(failure.kind)));
        const QByteArray body = QJsonDocument(failure.toJson(m_call.dialect)).toJson(QJsonDocument::Compact);
        const bool sent = ResponseWriter::sendResponse(m_socket, failure.httpStatus(), body,
                                                       "application/json", m_options.keepAlive);
        finish(sent && m_options.keepAlive);
        return;
    }

    // The status line is already out; truncate so the caller sees an incomplete transfer
    LOG_WARNING(QStringLiteral("Relay: stream from '%1' broke after %2 unit(s): %3")
                    .arg(m_call.provider.name)
                    .arg(m_stats.unitsForwarded)
                    .arg(failure.message));
    finish(false);
}

void RelaySession::releaseUpstream(bool cancel)
{
    if (m_reply) {
        QNetworkReply* reply = m_reply;
        m_reply = nullptr;
        disconnect(reply, nullptr, this, nullptr);
        if (cancel && reply->isRunning())
            reply->abort();
        reply->deleteLater();
    }
    if (m_nam) {
        m_pool.release(m_nam);
        m_nam = nullptr;
    }
}

void RelaySession::finish(bool keepConnection)
{
    if (m_finished)
        return;
    m_finished = true;
    m_headTimer.stop();
    m_requestTimer.stop();
    if (m_socket)
        disconnect(m_socket, nullptr, this, nullptr);

    releaseUpstream(m_stats.cancelled || m_stats.failed || !m_upstreamDone);

    LOG_INFO(QStringLiteral("Relay: done '%1' status=%2 mode=%3 units=%4 bytes=%5%6")
                 .arg(m_call.taggedModel)
                 .arg(m_stats.status)
                 .arg(modeName(m_stats.mode))
                 .arg(m_stats.unitsForwarded)
                 .arg(m_stats.bytesForwarded)
                 .arg(m_stats.cancelled ? QStringLiteral(" cancelled")
                                        : m_stats.failed ? QStringLiteral(" failed") : QString()));

    emit finished(keepConnection);
}
