#include "qt_backend_client.h"
#include "conversion/error_translator.h"
#include "semantic/cancellation.h"
#include "semantic/stream_session.h"
#include "core/log_manager.h"
#include <QEventLoop>
#include <QNetworkReply>
#include <QUrl>

QtBackendClient::QtBackendClient(ConnectionPool& pool)
    : m_pool(pool)
{
}

QNetworkRequest QtBackendClient::buildQtRequest(const BackendHttpRequest& request) {
    QNetworkRequest req{QUrl{request.url}};

    for (auto it = request.headers.constBegin(); it != request.headers.constEnd(); ++it)
        req.setRawHeader(it.key().toUtf8(), it.value().toUtf8());

    if (!req.hasRawHeader("Content-Type"))
        req.setHeader(QNetworkRequest::ContentTypeHeader, "application/json");

    return req;
}

QNetworkReply* QtBackendClient::send(QNetworkAccessManager* nam, const BackendHttpRequest& request) {
    const QNetworkRequest req = buildQtRequest(request);
    const QString method = request.method.trimmed().toUpper();
    if (method == "GET")
        return nam->get(req);
    if (method == "POST" || method.isEmpty())
        return nam->post(req, request.body);
    return nam->sendCustomRequest(req, method.toUtf8(), request.body);
}

Result<BackendHttpResponse> QtBackendClient::execute(const BackendHttpRequest& request,
                                                     CancellationToken* cancel) {
    if (cancel && cancel->isCancelled())
        return std::unexpected(ErrorTranslator::fromCancellation(cancel->reason()));

    auto* nam = m_pool.acquire();
    QNetworkReply* reply = send(nam, request);

    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (cancel) {
        QObject::connect(cancel, &CancellationToken::cancelled, &loop, [reply]() {
            reply->abort();
        });
    }
    if (!reply->isFinished())
        loop.exec();

    const CancelReason reason = cancel ? cancel->reason() : CancelReason::None;
    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    Result<BackendHttpResponse> result;

    if (reason != CancelReason::None || status >= 400
        || (reply->error() != QNetworkReply::NoError && status == 0)) {
        result = std::unexpected(ErrorTranslator::fromReply(reply, reason));
    } else {
        BackendHttpResponse resp;
        resp.statusCode = status;
        resp.body = reply->readAll();
        for (const auto& header : reply->rawHeaderList())
            resp.headers[QString::fromUtf8(header)] = QString::fromUtf8(reply->rawHeader(header));
        result = resp;
    }

    reply->deleteLater();
    m_pool.release(nam);
    return result;
}

Result<BackendStream*> QtBackendClient::openStream(const BackendHttpRequest& request,
                                                   CancellationToken* cancel) {
    if (cancel && cancel->isCancelled())
        return std::unexpected(ErrorTranslator::fromCancellation(cancel->reason()));

    auto* nam = m_pool.acquire();
    QNetworkReply* reply = send(nam, request);

    // Wait for the response head (or the first bytes) before handing out a stream
    QEventLoop loop;
    QObject::connect(reply, &QNetworkReply::metaDataChanged, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::readyRead, &loop, &QEventLoop::quit);
    QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
    if (cancel) {
        QObject::connect(cancel, &CancellationToken::cancelled, &loop, [reply, &loop]() {
            reply->abort();
            loop.quit();
        });
    }
    loop.exec();

    const CancelReason reason = cancel ? cancel->reason() : CancelReason::None;
    int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();

    // Error bodies are small; collect the whole thing so the message can pass through
    if (reason == CancelReason::None && status >= 400 && !reply->isFinished()) {
        QEventLoop bodyLoop;
        QObject::connect(reply, &QNetworkReply::finished, &bodyLoop, &QEventLoop::quit);
        if (cancel) {
            QObject::connect(cancel, &CancellationToken::cancelled, &bodyLoop, [reply]() {
                reply->abort();
            });
        }
        bodyLoop.exec();
    }

    const CancelReason finalReason = cancel ? cancel->reason() : CancelReason::None;
    status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (finalReason != CancelReason::None || status >= 400
        || (reply->error() != QNetworkReply::NoError && status == 0)) {
        const ErrorEnvelope failure = ErrorTranslator::fromReply(reply, finalReason);
        reply->abort();
        reply->deleteLater();
        m_pool.release(nam);
        return std::unexpected(failure);
    }

    auto* session = new StreamSession(reply);
    ConnectionPool* pool = &m_pool;
    QObject::connect(session, &QObject::destroyed, [pool, nam]() {
        pool->release(nam);
    });
    LOG_DEBUG(QStringLiteral("QtBackendClient: stream opened, HTTP %1").arg(status));
    return session;
}
