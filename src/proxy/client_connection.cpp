#include "client_connection.h"
#include "response_writer.h"
#include "core/log_manager.h"
#include <QHostAddress>
#include <QJsonDocument>

ClientConnection::ClientConnection(QTcpSocket* socket, const ServerContext& context, QObject* parent)
    : QObject(parent)
    , m_socket(socket)
    , m_context(context)
{
    m_socket->setParent(this);
    // Largest request we accept; the socket stops reading beyond it
    m_socket->setReadBufferSize(http_codec::kMaxHeadBytes + m_context.maxRequestBody);
    m_peer = QStringLiteral("%1:%2").arg(m_socket->peerAddress().toString()).arg(m_socket->peerPort());

    connect(m_socket, &QTcpSocket::readyRead, this, &ClientConnection::onReadyRead);
    connect(m_socket, &QTcpSocket::disconnected, this, &ClientConnection::onDisconnected);
    // Progress on the write side counts as activity
    connect(m_socket, &QTcpSocket::bytesWritten, this, [this](qint64) {
        m_idleTimer.start(m_context.idleTimeout);
    });

    m_idleTimer.setSingleShot(true);
    connect(&m_idleTimer, &QTimer::timeout, this, &ClientConnection::onIdleTimeout);
    m_idleTimer.start(m_context.idleTimeout);

    LOG_DEBUG(QStringLiteral("Connection: accepted %1").arg(m_peer));
}

ClientConnection::~ClientConnection()
{
    if (m_relay) {
        m_relay->disconnect(this);
        m_relay->abort();
        delete m_relay;
        m_relay = nullptr;
    }
}

void ClientConnection::onReadyRead()
{
    m_idleTimer.start(m_context.idleTimeout);
    // Pipelined bytes stay in the bounded socket buffer until the relay is done
    if (m_relay)
        return;
    m_buffer.append(m_socket->readAll());
    processBuffer();
}

void ClientConnection::processBuffer()
{
    while (!m_relay && !m_closing && !m_gone
           && m_socket->state() == QAbstractSocket::ConnectedState) {
        auto taken = http_codec::takeRequest(m_buffer, m_context.maxRequestBody);
        if (!taken) {
            LOG_WARNING(QStringLiteral("Connection: rejecting request from %1: %2")
                            .arg(m_peer, taken.error().message));
            m_buffer.clear();
            respondFailure(taken.error(), Dialect::Ollama, false);
            return;
        }
        if (!taken->has_value())
            return;
        handleRequest(**taken);
    }
}

void ClientConnection::handleRequest(const InboundRequest& request)
{
    LOG_INFO(QStringLiteral("%1 %2 %3 from %4")
                 .arg(request.method, request.target, request.httpVersion, m_peer));

    const bool keepAlive = request.keepAlive() && !m_closing;

    if (request.method == QStringLiteral("OPTIONS")) {
        HeaderList cors;
        cors.append({"access-control-allow-methods", "GET, HEAD, POST, OPTIONS"});
        cors.append({"access-control-allow-headers", "*"});
        cors.append({"access-control-max-age", "86400"});
        respond(204, QByteArray(), QByteArray(), keepAlive, cors);
        return;
    }

    const std::optional<Route> route = m_context.router->match(request.method, request.path);
    if (!route) {
        respondFailure(DomainFailure::routeNotFound(request.method, request.path),
                       RequestRouter::dialectForPath(request.path), keepAlive);
        return;
    }

    const LocalEndpoints& endpoints = *m_context.endpoints;
    switch (route->kind) {
    case RouteKind::Health:
        respond(200, request.method == QStringLiteral("HEAD") ? QByteArray() : endpoints.healthBody(),
                "text/plain; charset=utf-8", keepAlive);
        return;
    case RouteKind::Version:
        respond(200, endpoints.versionJson(), "application/json", keepAlive);
        return;
    case RouteKind::Tags:
        respond(200, endpoints.tagsJson(), "application/json", keepAlive);
        return;
    case RouteKind::Models:
        respond(200, endpoints.modelsJson(), "application/json", keepAlive);
        return;
    case RouteKind::Relay:
        break;
    }

    Result<OutboundCall> call = m_context.router->route(request, *route);
    if (!call) {
        LOG_INFO(QStringLiteral("%1 %2: %3").arg(request.method, request.path, call.error().message));
        respondFailure(call.error(), route->dialect, keepAlive);
        return;
    }
    startRelay(request, std::move(*call), keepAlive);
}

void ClientConnection::startRelay(const InboundRequest& request, OutboundCall call, bool keepAlive)
{
    RelayOptions options = m_context.relayOptions;
    options.keepAlive = keepAlive;
    options.chunked = !request.isHttp10();

    m_relay = new RelaySession(m_socket, *m_context.pool, std::move(call), options, this);
    connect(m_relay, &RelaySession::finished, this, &ClientConnection::onRelayFinished);
    m_relay->start();
}

void ClientConnection::onRelayFinished(bool keepConnection)
{
    RelaySession* relay = m_relay;
    m_relay = nullptr;
    if (relay)
        relay->deleteLater();

    emit relayFinished();

    if (m_gone)
        return;

    if (!keepConnection || m_closing) {
        closeGracefully();
        return;
    }

    m_idleTimer.start(m_context.idleTimeout);
    m_buffer.append(m_socket->readAll());
    processBuffer();
}

void ClientConnection::respond(int status, const QByteArray& body, const QByteArray& contentType,
                               bool keepAlive, const HeaderList& extraHeaders)
{
    const bool sent = ResponseWriter::sendResponse(m_socket, status, body, contentType,
                                                   keepAlive, extraHeaders);
    if (!sent || !keepAlive)
        closeGracefully();
}

void ClientConnection::respondFailure(const DomainFailure& failure, Dialect dialect, bool keepAlive)
{
    const QByteArray body = QJsonDocument(failure.toJson(dialect)).toJson(QJsonDocument::Compact);
    respond(failure.httpStatus(), body, "application/json", keepAlive);
}

void ClientConnection::closeWhenIdle()
{
    m_closing = true;
    if (!m_relay)
        closeGracefully();
}

void ClientConnection::forceClose()
{
    m_closing = true;
    if (m_relay)
        m_relay->abort();
    if (!m_gone)
        m_socket->abort();
    markGone();
}

void ClientConnection::closeGracefully()
{
    m_closing = true;
    if (m_gone)
        return;
    if (m_socket->state() == QAbstractSocket::UnconnectedState) {
        markGone();
        return;
    }
    m_socket->disconnectFromHost();
}

void ClientConnection::onIdleTimeout()
{
    if (m_gone)
        return;

    if (m_relay) {
        if (m_socket->bytesToWrite() > 0) {
            LOG_WARNING(QStringLiteral("Connection: %1 stopped reading for %2 ms, dropping")
                            .arg(m_peer)
                            .arg(m_context.idleTimeout));
            forceClose();
            return;
        }
        // Waiting on the upstream; the relay enforces its own timeouts
        m_idleTimer.start(m_context.idleTimeout);
        return;
    }

    LOG_DEBUG(QStringLiteral("Connection: closing idle %1").arg(m_peer));
    closeGracefully();
}

void ClientConnection::onDisconnected()
{
    if (m_relay)
        m_relay->abort();
    markGone();
}

void ClientConnection::markGone()
{
    if (m_gone)
        return;
    m_gone = true;
    m_idleTimer.stop();
    LOG_DEBUG(QStringLiteral("Connection: closed %1").arg(m_peer));
    emit closed(this);
}
