#include "bootstrap.h"
#include "log_manager.h"
#include "config/provider_table.h"
#include "proxy/proxy_server.h"

Bootstrap::Bootstrap(QObject* parent)
    : QObject(parent) {
}

bool Bootstrap::isProxyRunning() const {
    return m_proxy && m_proxy->isRunning();
}

QStringList Bootstrap::taggedModels(const ProviderTable& table) {
    QStringList names;
    for (const Provider& provider : table.providers()) {
        if (provider.models.isEmpty()) {
            names << ProviderTable::taggedName(provider.name, QStringLiteral("*"));
            continue;
        }
        for (const QString& model : provider.models)
            names << ProviderTable::taggedName(provider.name, model);
    }
    return names;
}

VoidResult Bootstrap::startAll(const ProxyConfig& config) {
    LOG_INFO(QStringLiteral("========== starting ollama-proxy %1 ==========").arg(m_version));

    if (!m_proxy) {
        emit stepProgress("init", false, "proxy server not set");
        return std::unexpected(DomainFailure::internal(QStringLiteral("proxy server not set")));
    }

    auto table = ProviderTable::build(config.providers);
    if (!table) {
        emit stepProgress("provider_table", false, table.error().message);
        return std::unexpected(table.error());
    }
    m_table = *table;

    for (const Provider& provider : m_table->providers()) {
        LOG_INFO(QStringLiteral("Provider '%1' (%2) %3, %4 model(s)%5")
                     .arg(provider.name, apiTypeName(provider.apiType), provider.url)
                     .arg(provider.models.size())
                     .arg(provider.hasSecret() ? QStringLiteral(", authenticated") : QString()));
    }
    emit stepProgress("provider_table", true,
                      QStringLiteral("%1 provider(s) loaded").arg(m_table->size()));

    connect(m_proxy, &ProxyServer::statusChanged,
            this, &Bootstrap::proxyStatusChanged, Qt::UniqueConnection);

    if (!m_proxy->start(config, m_table, m_version)) {
        emit stepProgress("proxy_start", false, "listener failed to bind");
        return std::unexpected(DomainFailure::internal(
            QStringLiteral("cannot listen on %1:%2").arg(config.listenAddress).arg(config.port)));
    }

    emit stepProgress("proxy_start", true, "proxy started");
    return {};
}

void Bootstrap::stopAll() {
    if (!m_proxy) {
        emit stopped();
        return;
    }

    if (m_stopping) {
        LOG_WARNING(QStringLiteral("Second stop request, aborting in-flight relays"));
        m_proxy->stop();
        return;
    }
    m_stopping = true;

    connect(m_proxy, &ProxyServer::drained, this, [this]() {
        LOG_INFO(QStringLiteral("========== ollama-proxy stopped =========="));
        emit stopped();
    }, Qt::SingleShotConnection);

    m_proxy->beginShutdown();
}
