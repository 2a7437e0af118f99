#pragma once
#include "result.h"
#include "config/config_types.h"
#include <QObject>
#include <QStringList>
#include <memory>

class ProviderTable;
class ProxyServer;

// Brings the service up in order (provider table, then listener) and takes it
// down gracefully.
class Bootstrap : public QObject {
    Q_OBJECT

public:
    explicit Bootstrap(QObject* parent = nullptr);

    void setProxy(ProxyServer* proxy) { m_proxy = proxy; }
    void setVersion(const QString& version) { m_version = version; }

    // ConfigurationInvalid if the provider table cannot be built,
    // Internal if the listener cannot bind.
    VoidResult startAll(const ProxyConfig& config);
    // First call drains in-flight relays; a second call aborts them.
    void stopAll();

    bool isProxyRunning() const;
    std::shared_ptr<const ProviderTable> table() const { return m_table; }

    static QStringList taggedModels(const ProviderTable& table);

signals:
    void stepProgress(const QString& step, bool success, const QString& message);
    void proxyStatusChanged(bool running);
    void stopped();

private:
    ProxyServer* m_proxy = nullptr;
    std::shared_ptr<const ProviderTable> m_table;
    QString m_version;
    bool m_stopping = false;
};
