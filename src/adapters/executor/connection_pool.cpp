#include "connection_pool.h"
#include "core/log_manager.h"
#include <QMutexLocker>

ConnectionPool::ConnectionPool(int maxSize)
    : m_maxSize(qMax(1, maxSize))
{
}

ConnectionPool::~ConnectionPool()
{
    clear();
}

QNetworkAccessManager* ConnectionPool::acquire()
{
    QMutexLocker locker(&m_mutex);

    if (!m_idle.isEmpty()) {
        QNetworkAccessManager* nam = m_idle.dequeue();
        m_active.insert(nam);
        return nam;
    }

    if (m_active.size() >= m_maxSize) {
        LOG_DEBUG(QStringLiteral("ConnectionPool: %1 managers busy, creating overflow manager")
                      .arg(m_active.size()));
    }

    auto* nam = new QNetworkAccessManager;
    m_active.insert(nam);
    return nam;
}

void ConnectionPool::release(QNetworkAccessManager* nam)
{
    if (!nam)
        return;

    QMutexLocker locker(&m_mutex);
    if (!m_active.remove(nam)) {
        LOG_WARNING(QStringLiteral("ConnectionPool: release of untracked manager"));
        nam->deleteLater();
        return;
    }

    // Overflow managers are discarded instead of kept idle
    if (m_idle.size() + m_active.size() >= m_maxSize)
        nam->deleteLater();
    else
        m_idle.enqueue(nam);
}

void ConnectionPool::clear()
{
    QMutexLocker locker(&m_mutex);
    qDeleteAll(m_idle);
    m_idle.clear();
    qDeleteAll(m_active);
    m_active.clear();
}

int ConnectionPool::maxSize() const
{
    QMutexLocker locker(&m_mutex);
    return m_maxSize;
}

int ConnectionPool::activeCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_active.size();
}

int ConnectionPool::idleCount() const
{
    QMutexLocker locker(&m_mutex);
    return m_idle.size();
}
