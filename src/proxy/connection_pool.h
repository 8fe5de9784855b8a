#pragma once
#include <QHash>
#include <QMutex>
#include <QNetworkAccessManager>
#include <QQueue>
#include <QThread>

// QNetworkAccessManager instances are bound to the thread that created them,
// so idle managers are kept per worker thread and only handed back to it.
class ConnectionPool {
public:
    explicit ConnectionPool(int maxIdlePerThread = 4);
    ~ConnectionPool();

    QNetworkAccessManager* acquire();
    void release(QNetworkAccessManager* nam);
    void clear();

private:
    int m_maxIdlePerThread;
    QHash<QThread*, QQueue<QNetworkAccessManager*>> m_idle;
    QHash<QNetworkAccessManager*, QThread*> m_active;
    mutable QMutex m_mutex;
};
