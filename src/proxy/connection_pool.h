#pragma once
#include <QList>
#include <QNetworkAccessManager>
#include <QSet>

// Keeps QNetworkAccessManager instances warm across relays so keep-alive
// sockets to the providers are reused. Lives on the event loop thread with
// the relays that use it; it is not shared between threads.
class ConnectionPool {
public:
    explicit ConnectionPool(int capacity = 10);
    ~ConnectionPool();

    ConnectionPool(const ConnectionPool&) = delete;
    ConnectionPool& operator=(const ConnectionPool&) = delete;

    // Always returns a manager; past capacity an extra one is created and
    // dropped again on release.
    QNetworkAccessManager* acquire();
    void release(QNetworkAccessManager* nam);

    // Drops the warm managers.
    void clear();
    void resize(int capacity);
    void setEnabled(bool enabled);

    bool isEnabled() const { return m_enabled; }
    int capacity() const { return m_capacity; }
    int activeCount() const { return m_inUse.size(); }
    int idleCount() const { return m_warm.size(); }

private:
    int m_capacity;
    bool m_enabled = true;
    QList<QNetworkAccessManager*> m_warm;
    QSet<QNetworkAccessManager*> m_inUse;

    static QNetworkAccessManager* createManager();
    static void retire(QNetworkAccessManager* nam);
    void trimWarm();
};
