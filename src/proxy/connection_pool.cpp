#include "connection_pool.h"
#include "core/log_manager.h"
#include <QMutexLocker>

ConnectionPool::ConnectionPool(int maxIdlePerThread)
    : m_maxIdlePerThread(maxIdlePerThread)
{
}

ConnectionPool::~ConnectionPool()
{
    clear();
}

QNetworkAccessManager* ConnectionPool::acquire()
{
    QThread* thread = QThread::currentThread();
    QMutexLocker locker(&m_mutex);

    auto it = m_idle.find(thread);
    if (it != m_idle.end() && !it->isEmpty()) {
        QNetworkAccessManager* nam = it->dequeue();
        m_active.insert(nam, thread);
        return nam;
    }

    auto* nam = new QNetworkAccessManager;
    m_active.insert(nam, thread);
    LOG_DEBUG(QStringLiteral("ConnectionPool: created new connection (active=%1)")
                  .arg(m_active.size()));
    return nam;
}

void ConnectionPool::release(QNetworkAccessManager* nam)
{
    if (!nam)
        return;

    QMutexLocker locker(&m_mutex);
    auto it = m_active.find(nam);
    if (it == m_active.end()) {
        LOG_WARNING(QStringLiteral("ConnectionPool: release called on untracked NAM, deleting"));
        delete nam;
        return;
    }
    QThread* owner = it.value();
    m_active.erase(it);

    // Only the owning thread may park it for reuse.
    if (owner != QThread::currentThread()) {
        nam->deleteLater();
        return;
    }

    QQueue<QNetworkAccessManager*>& idle = m_idle[owner];
    if (idle.size() >= m_maxIdlePerThread) {
        delete nam;
        return;
    }
    idle.enqueue(nam);
}

void ConnectionPool::clear()
{
    QMutexLocker locker(&m_mutex);
    for (auto it = m_idle.begin(); it != m_idle.end(); ++it) {
        for (QNetworkAccessManager* nam : std::as_const(*it))
            delete nam;
    }
    m_idle.clear();

    for (auto it = m_active.cbegin(); it != m_active.cend(); ++it)
        delete it.key();
    m_active.clear();

    LOG_DEBUG(QStringLiteral("ConnectionPool: all connections cleared"));
}
