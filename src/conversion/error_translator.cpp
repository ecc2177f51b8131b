#include "error_translator.h"
#include <QJsonDocument>
#include <QJsonObject>

namespace ErrorTranslator {

ErrorEnvelope fromHttpStatus(int httpStatus, const QByteArray& body)
{
    QString message = backendMessage(body);
    if (message.isEmpty())
        message = QStringLiteral("Backend returned HTTP %1").arg(httpStatus);

    const QString hint = operatorHint(message);
    if (httpStatus >= 400 && httpStatus < 500)
        return ErrorEnvelope::clientError(httpStatus, message, hint);
    return ErrorEnvelope::upstream(message, httpStatus, hint);
}

ErrorEnvelope fromNetworkError(QNetworkReply::NetworkError code, const QString& detail)
{
    switch (code) {
    case QNetworkReply::TimeoutError:
        return ErrorEnvelope::timeout(QStringLiteral("Backend connection timed out"));

    case QNetworkReply::OperationCanceledError:
        return ErrorEnvelope::cancelled(QStringLiteral("Backend request was aborted"));

    case QNetworkReply::ConnectionRefusedError:
    case QNetworkReply::RemoteHostClosedError:
    case QNetworkReply::HostNotFoundError:
    case QNetworkReply::TemporaryNetworkFailureError:
    case QNetworkReply::NetworkSessionFailedError:
    case QNetworkReply::SslHandshakeFailedError:
    case QNetworkReply::ProxyConnectionRefusedError:
    case QNetworkReply::UnknownNetworkError:
        return ErrorEnvelope::upstream(
            QStringLiteral("Backend unreachable: %1").arg(detail));

    default:
        return ErrorEnvelope::upstream(
            QStringLiteral("Backend network error (%1): %2")
                .arg(static_cast<int>(code))
                .arg(detail));
    }
}

ErrorEnvelope fromCancellation(CancelReason reason)
{
    switch (reason) {
    case CancelReason::Timeout:
        return ErrorEnvelope::timeout(QStringLiteral("Backend request timed out"));
    case CancelReason::ClientDisconnected:
        return ErrorEnvelope::cancelled(QStringLiteral("Client disconnected"));
    case CancelReason::Requested:
    case CancelReason::None:
        break;
    }
    return ErrorEnvelope::cancelled(QStringLiteral("Request cancelled by client"));
}

ErrorEnvelope fromReply(QNetworkReply* reply, CancelReason reason)
{
    if (reason != CancelReason::None)
        return fromCancellation(reason);
    if (!reply)
        return ErrorEnvelope::upstream(QStringLiteral("Backend request produced no reply"));

    const int status = reply->attribute(QNetworkRequest::HttpStatusCodeAttribute).toInt();
    if (status >= 400)
        return fromHttpStatus(status, reply->readAll());
    return fromNetworkError(reply->error(), reply->errorString());
}

QString backendMessage(const QByteArray& body)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject())
        return QString::fromUtf8(body.trimmed());

    const QJsonObject root = doc.object();
    const QJsonValue errorVal = root.value(QStringLiteral("error"));
    if (errorVal.isObject()) {
        const QString msg = errorVal.toObject().value(QStringLiteral("message")).toString();
        if (!msg.isEmpty())
            return msg;
    } else if (errorVal.isString()) {
        return errorVal.toString();
    }

    for (const char* key : {"message", "detail"}) {
        const QJsonValue v = root.value(QLatin1String(key));
        if (v.isString() && !v.toString().isEmpty())
            return v.toString();
    }
    return QString::fromUtf8(body.trimmed());
}

QString operatorHint(const QString& message)
{
    const QString lower = message.toLower();

    if (lower.contains(QStringLiteral("unsupported_country_region_territory"))
        || lower.contains(QStringLiteral("country, region, or territory not supported")))
        return QStringLiteral("The backend is not available in this region; consider Azure OpenAI or another endpoint.");

    if (lower.contains(QStringLiteral("invalid_api_key")) || lower.contains(QStringLiteral("unauthorized")))
        return QStringLiteral("Invalid API key; check OPENAI_API_KEY.");

    if (lower.contains(QStringLiteral("rate_limit")) || lower.contains(QStringLiteral("quota")))
        return QStringLiteral("Rate limit or quota exceeded; wait and retry or raise the plan limits.");

    if (lower.contains(QStringLiteral("model"))
        && (lower.contains(QStringLiteral("not found")) || lower.contains(QStringLiteral("does not exist"))))
        return QStringLiteral("Unknown backend model; check BIG_MODEL, MIDDLE_MODEL and SMALL_MODEL.");

    if (lower.contains(QStringLiteral("billing")) || lower.contains(QStringLiteral("payment")))
        return QStringLiteral("Billing problem on the backend account.");

    return {};
}

}
