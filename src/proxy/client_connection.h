#pragma once
#include "local_endpoints.h"
#include "request_router.h"
#include "stream_relay.h"
#include <QObject>
#include <QTcpSocket>
#include <QTimer>

// Shared, read-only services handed to every connection by the server.
struct ServerContext {
    const RequestRouter* router = nullptr;
    const LocalEndpoints* endpoints = nullptr;
    ConnectionPool* pool = nullptr;
    RelayOptions relayOptions;
    qint64 maxRequestBody = 32 * 1024 * 1024;
    int idleTimeout = 120000;
};

// One accepted caller connection. Requests are answered in arrival order;
// pipelined requests wait in the buffer while a relay is active.
class ClientConnection : public QObject {
    Q_OBJECT
public:
    ClientConnection(QTcpSocket* socket, const ServerContext& context, QObject* parent = nullptr);
    ~ClientConnection() override;

    bool isIdle() const { return !m_relay; }
    bool hasActiveRelay() const { return m_relay != nullptr; }
    QString peer() const { return m_peer; }

    // Stop accepting requests; close now if idle, otherwise after the active relay.
    void closeWhenIdle();
    // Cancel the active relay and drop the connection.
    void forceClose();

signals:
    void closed(ClientConnection* connection);
    void relayFinished();

private slots:
    void onReadyRead();
    void onDisconnected();
    void onIdleTimeout();
    void onRelayFinished(bool keepConnection);

private:
    QTcpSocket* m_socket;
    const ServerContext& m_context;
    QString m_peer;
    QByteArray m_buffer;
    QTimer m_idleTimer;
    RelaySession* m_relay = nullptr;
    bool m_closing = false;
    bool m_gone = false;

    void processBuffer();
    void handleRequest(const InboundRequest& request);
    void startRelay(const InboundRequest& request, OutboundCall call, bool keepAlive);
    void respond(int status, const QByteArray& body, const QByteArray& contentType,
                 bool keepAlive, const HeaderList& extraHeaders = {});
    void respondFailure(const DomainFailure& failure, Dialect dialect, bool keepAlive);
    void closeGracefully();
    void markGone();
};
