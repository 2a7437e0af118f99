#pragma once
#include "client_connection.h"
#include "connection_pool.h"
#include "config/config_types.h"
#include <QObject>
#include <QTcpServer>
#include <QHostAddress>
#include <QSet>
#include <QTimer>
#include <memory>

class ProxyServer : public QObject {
    Q_OBJECT
public:
    explicit ProxyServer(QObject* parent = nullptr);
    ~ProxyServer() override;

    bool start(const ProxyConfig& config, std::shared_ptr<const ProviderTable> table,
               const QString& version);
    // Close the listener, let in-flight relays finish within drain_timeout,
    // then abort the rest. Emits drained() when no connection is left.
    void beginShutdown();
    void stop();
    bool isRunning() const;
    quint16 serverPort() const;
    int connectionCount() const { return m_connections.size(); }
    ConnectionPool& connectionPool() { return m_connectionPool; }

    static std::optional<QHostAddress> listenAddressFor(const QString& text);

signals:
    void statusChanged(bool running);
    void drained();

private slots:
    void onNewConnection();
    void onConnectionClosed(ClientConnection* connection);
    void onDrainTimeout();

private:
    QTcpServer* m_server = nullptr;
    ConnectionPool m_connectionPool;
    ProxyConfig m_config;
    std::unique_ptr<RequestRouter> m_router;
    std::unique_ptr<LocalEndpoints> m_endpoints;
    ServerContext m_context;
    QSet<ClientConnection*> m_connections;
    QTimer m_drainTimer;
    bool m_draining = false;

    void closeListener();
    void checkDrained();
};
