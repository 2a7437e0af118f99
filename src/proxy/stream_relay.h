#pragma once
#include "connection_pool.h"
#include "stream_framer.h"
#include "pipeline/outbound_call.h"
#include <QObject>
#include <QPointer>
#include <QNetworkReply>
#include <QTcpSocket>
#include <QTimer>

struct RelayOptions {
    int connectionTimeout = 30000;   // until the upstream response head
    int idleTimeout = 120000;        // upstream inactivity
    int requestTimeout = 600000;     // whole buffered exchange
    qint64 highWaterMark = 256 * 1024;
    bool keepAlive = true;           // caller asked to keep the connection
    bool chunked = true;             // HTTP/1.1 caller; 1.0 gets close-delimited streams
    bool verifyTls = true;
    bool http2 = true;
};

struct RelayStats {
    int status = 0;
    BodyMode mode = BodyMode::Buffered;
    int unitsForwarded = 0;
    qint64 bytesForwarded = 0;
    bool cancelled = false;
    bool failed = false;
};

// Performs one upstream call and pipes its response to the downstream socket.
// Streamed bodies are forwarded unit by unit as they arrive; the relay stops
// reading upstream while the downstream socket is backlogged.
class RelaySession : public QObject {
    Q_OBJECT
public:
    RelaySession(QTcpSocket* downstream, ConnectionPool& pool, OutboundCall call,
                 const RelayOptions& options, QObject* parent = nullptr);
    ~RelaySession() override;

    void start();
    // Downstream went away: cancel the upstream call without writing anything.
    void abort();

    bool isFinished() const { return m_finished; }
    bool headWritten() const { return m_headWritten; }
    const RelayStats& stats() const { return m_stats; }
    const OutboundCall& call() const { return m_call; }

    static HeaderList forwardableResponseHeaders(const QList<QNetworkReply::RawHeaderPair>& pairs);

signals:
    // keepConnection is false when the downstream connection must be closed.
    void finished(bool keepConnection);

private slots:
    void onMetaDataChanged();
    void onReadyRead();
    void onReplyFinished();
    void onDownstreamBytesWritten(qint64 bytes);
    void onHeadTimeout();
    void onRequestTimeout();

private:
    QPointer<QTcpSocket> m_socket;
    ConnectionPool& m_pool;
    OutboundCall m_call;
    RelayOptions m_options;

    QNetworkAccessManager* m_nam = nullptr;
    QNetworkReply* m_reply = nullptr;
    QTimer m_headTimer;
    QTimer m_requestTimer;
    StreamFramer m_framer{BodyMode::Buffered};
    QByteArray m_body;
    RelayStats m_stats;

    bool m_headSeen = false;
    bool m_headWritten = false;
    bool m_paused = false;
    bool m_upstreamDone = false;
    int m_timeoutLimit = 0;   // set when one of our timers aborted the reply
    bool m_finished = false;

    QNetworkRequest buildRequest() const;
    void pump();
    bool downstreamBacklogged() const;
    bool forward(const QList<QByteArray>& units);
    void complete();
    void fail(const DomainFailure& failure);
    void finish(bool keepConnection);
    void releaseUpstream(bool cancel);
    bool providerAnswered(QNetworkReply::NetworkError error) const;
};
