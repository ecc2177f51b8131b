#pragma once
#include "semantic/ports.h"
#include "adapters/executor/connection_pool.h"
#include <QNetworkRequest>

class QNetworkReply;

// IBackendClient over QNetworkAccessManager. Both calls block on a local
// QEventLoop until the backend answers or the token is cancelled.
class QtBackendClient : public IBackendClient {
public:
    explicit QtBackendClient(ConnectionPool& pool);

    Result<BackendHttpResponse> execute(const BackendHttpRequest& request,
                                        CancellationToken* cancel) override;
    Result<BackendStream*> openStream(const BackendHttpRequest& request,
                                      CancellationToken* cancel) override;

private:
    ConnectionPool& m_pool;

    static QNetworkRequest buildQtRequest(const BackendHttpRequest& request);
    static QNetworkReply* send(QNetworkAccessManager* nam, const BackendHttpRequest& request);
};
