#include "proxy_server.h"
#include "core/log_manager.h"

ProxyServer::ProxyServer(QObject* parent)
    : QObject(parent)
{
    m_drainTimer.setSingleShot(true);
    connect(&m_drainTimer, &QTimer::timeout, this, &ProxyServer::onDrainTimeout);
}

ProxyServer::~ProxyServer()
{
    stop();
}

std::optional<QHostAddress> ProxyServer::listenAddressFor(const QString& text)
{
    const QString trimmed = text.trimmed();
    if (trimmed.isEmpty() || trimmed.compare(QStringLiteral("localhost"), Qt::CaseInsensitive) == 0)
        return QHostAddress(QHostAddress::LocalHost);

    QHostAddress address;
    if (!address.setAddress(trimmed))
        return std::nullopt;
    return address;
}

bool ProxyServer::start(const ProxyConfig& config, std::shared_ptr<const ProviderTable> table,
                        const QString& version)
{
    if (m_server) {
        stop();
    }

    m_config = config;
    const RuntimeOptions& runtime = config.runtime;

    m_connectionPool.clear();
    m_connectionPool.setEnabled(runtime.enableConnectionPool);
    m_connectionPool.resize(runtime.enableConnectionPool ? qMax(1, runtime.connectionPoolSize) : 1);

    m_router = std::make_unique<RequestRouter>(table, runtime.unknownModelPolicy, runtime.debugMode);
    m_endpoints = std::make_unique<LocalEndpoints>(table, version);

    m_context.router = m_router.get();
    m_context.endpoints = m_endpoints.get();
    m_context.pool = &m_connectionPool;
    m_context.maxRequestBody = runtime.maxRequestBody;
    m_context.idleTimeout = runtime.idleTimeout;
    m_context.relayOptions.connectionTimeout = runtime.connectionTimeout;
    m_context.relayOptions.idleTimeout = runtime.idleTimeout;
    m_context.relayOptions.requestTimeout = runtime.requestTimeout;
    m_context.relayOptions.verifyTls = runtime.verifyTls;
    m_context.relayOptions.http2 = runtime.enableHttp2;

    const std::optional<QHostAddress> address = listenAddressFor(config.listenAddress);
    if (!address) {
        LOG_ERROR(QStringLiteral("ProxyServer: invalid listen address '%1'").arg(config.listenAddress));
        return false;
    }

    const quint16 port = static_cast<quint16>(config.port);
    m_server = new QTcpServer(this);
    connect(m_server, &QTcpServer::pendingConnectionAvailable,
            this, &ProxyServer::onNewConnection);

    if (!m_server->listen(*address, port)) {
        LOG_ERROR(QStringLiteral("ProxyServer: failed to listen on %1:%2 - %3")
                      .arg(address->toString())
                      .arg(port)
                      .arg(m_server->errorString()));
        delete m_server;
        m_server = nullptr;
        return false;
    }

    LOG_INFO(QStringLiteral("ProxyServer: listening on %1:%2 with %3 provider(s)")
                 .arg(address->toString())
                 .arg(m_server->serverPort())
                 .arg(table->size()));
    emit statusChanged(true);
    return true;
}

void ProxyServer::closeListener()
{
    if (!m_server)
        return;
    m_server->close();
    delete m_server;
    m_server = nullptr;
}

void ProxyServer::beginShutdown()
{
    if (m_draining)
        return;
    m_draining = true;
    closeListener();

    int inFlight = 0;
    const QSet<ClientConnection*> connections = m_connections;
    for (ClientConnection* connection : connections) {
        if (connection->hasActiveRelay())
            ++inFlight;
        connection->closeWhenIdle();
    }

    LOG_INFO(QStringLiteral("ProxyServer: shutting down, waiting up to %1 ms for %2 in-flight relay(s)")
                 .arg(m_config.runtime.drainTimeout)
                 .arg(inFlight));
    m_drainTimer.start(m_config.runtime.drainTimeout);
    checkDrained();
}

void ProxyServer::onDrainTimeout()
{
    if (m_connections.isEmpty())
        return;

    LOG_WARNING(QStringLiteral("ProxyServer: drain timeout, aborting %1 connection(s)")
                    .arg(m_connections.size()));
    const QSet<ClientConnection*> connections = m_connections;
    for (ClientConnection* connection : connections)
        connection->forceClose();
    checkDrained();
}

void ProxyServer::checkDrained()
{
    if (!m_draining || !m_connections.isEmpty())
        return;

    m_draining = false;
    m_drainTimer.stop();
    m_connectionPool.clear();
    LOG_INFO(QStringLiteral("ProxyServer: proxy server stopped"));
    emit statusChanged(false);
    emit drained();
}

void ProxyServer::stop()
{
    m_drainTimer.stop();
    const bool wasRunning = m_server != nullptr || !m_connections.isEmpty();
    const bool wasDraining = m_draining;

    const QSet<ClientConnection*> connections = m_connections;
    for (ClientConnection* connection : connections) {
        connection->disconnect(this);
        connection->forceClose();
        delete connection;
    }
    m_connections.clear();

    closeListener();
    m_connectionPool.clear();
    m_draining = false;

    if (wasRunning) {
        LOG_INFO(QStringLiteral("ProxyServer: proxy server stopped"));
        emit statusChanged(false);
    }
    if (wasDraining)
        emit drained();
}

bool ProxyServer::isRunning() const
{
    return m_server && m_server->isListening();
}

quint16 ProxyServer::serverPort() const
{
    return m_server ? m_server->serverPort() : 0;
}

void ProxyServer::onNewConnection()
{
    while (m_server && m_server->hasPendingConnections()) {
        QTcpSocket* socket = m_server->nextPendingConnection();
        if (!socket) {
            continue;
        }

        auto* connection = new ClientConnection(socket, m_context, this);
        connect(connection, &ClientConnection::closed,
                this, &ProxyServer::onConnectionClosed);
        m_connections.insert(connection);
    }
}

void ProxyServer::onConnectionClosed(ClientConnection* connection)
{
    if (!m_connections.remove(connection))
        return;
    connection->deleteLater();
    checkDrained();
}
