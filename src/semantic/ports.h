#pragma once
#include "failure.h"
#include <expected>
#include <QByteArray>
#include <QMap>
#include <QString>

template<typename T>
using Result = std::expected<T, ErrorEnvelope>;

using VoidResult = std::expected<void, ErrorEnvelope>;

struct BackendHttpRequest {
    QString method;
    QString url;
    QMap<QString, QString> headers;
    QByteArray body;
    bool stream = false;
};

struct BackendHttpResponse {
    int statusCode = 0;
    QMap<QString, QString> headers;
    QByteArray body;
};

class BackendStream;
class CancellationToken;

// The pipeline's single suspension point. Implementations never retry.
class IBackendClient {
public:
    virtual ~IBackendClient() = default;
    virtual Result<BackendHttpResponse> execute(
        const BackendHttpRequest& request,
        CancellationToken* cancel) = 0;
    virtual Result<BackendStream*> openStream(
        const BackendHttpRequest& request,
        CancellationToken* cancel) = 0;
};
