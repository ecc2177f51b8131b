#pragma once
#include <QNetworkAccessManager>
#include <QQueue>
#include <QSet>
#include <QMutex>

// Reuses QNetworkAccessManagers across backend calls so their TCP/TLS
// sessions survive between requests.
class ConnectionPool {
public:
    explicit ConnectionPool(int maxSize = 10);
    ~ConnectionPool();

    QNetworkAccessManager* acquire();
    void release(QNetworkAccessManager* nam);
    void clear();
    int maxSize() const;
    int activeCount() const;
    int idleCount() const;

private:
    int m_maxSize;
    QQueue<QNetworkAccessManager*> m_idle;
    QSet<QNetworkAccessManager*> m_active;
    mutable QMutex m_mutex;
};
