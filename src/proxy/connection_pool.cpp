#include "connection_pool.h"
#include "core/log_manager.h"

ConnectionPool::ConnectionPool(int capacity)
    : m_capacity(qMax(1, capacity))
{
}

ConnectionPool::~ConnectionPool()
{
    qDeleteAll(m_warm);
    qDeleteAll(m_inUse);
}

QNetworkAccessManager* ConnectionPool::createManager()
{
    auto* nam = new QNetworkAccessManager;
    // 3xx answers go back to the caller as they are
    nam->setRedirectPolicy(QNetworkRequest::ManualRedirectPolicy);
    return nam;
}

// release() runs from inside a reply's finished() handler, so the manager
// must outlive the current signal emission.
void ConnectionPool::retire(QNetworkAccessManager* nam)
{
    nam->deleteLater();
}

QNetworkAccessManager* ConnectionPool::acquire()
{
    QNetworkAccessManager* nam = nullptr;
    if (m_enabled && !m_warm.isEmpty()) {
        nam = m_warm.takeLast();
    } else {
        if (m_enabled && m_inUse.size() >= m_capacity) {
            LOG_DEBUG(QStringLiteral("ConnectionPool: %1 upstream manager(s) busy, adding a temporary one")
                          .arg(m_inUse.size()));
        }
        nam = createManager();
    }
    m_inUse.insert(nam);
    return nam;
}

void ConnectionPool::release(QNetworkAccessManager* nam)
{
    if (!nam)
        return;

    if (!m_inUse.remove(nam)) {
        LOG_WARNING(QStringLiteral("ConnectionPool: released a manager the pool does not own"));
        retire(nam);
        return;
    }

    if (!m_enabled || m_warm.size() + m_inUse.size() >= m_capacity) {
        retire(nam);
        return;
    }
    m_warm.append(nam);
}

// Managers still held by a relay stay tracked until that relay releases them.
void ConnectionPool::clear()
{
    for (QNetworkAccessManager* nam : std::as_const(m_warm))
        retire(nam);
    m_warm.clear();
}

void ConnectionPool::resize(int capacity)
{
    m_capacity = qMax(1, capacity);
    trimWarm();
}

void ConnectionPool::setEnabled(bool enabled)
{
    m_enabled = enabled;
    trimWarm();
}

void ConnectionPool::trimWarm()
{
    while (!m_warm.isEmpty()
           && (!m_enabled || m_warm.size() + m_inUse.size() > m_capacity)) {
        retire(m_warm.takeFirst());
    }
}
