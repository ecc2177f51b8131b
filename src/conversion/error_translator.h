#pragma once
#include "semantic/failure.h"
#include <QByteArray>
#include <QNetworkReply>

// Converts backend and transport failures into ErrorEnvelopes at the point
// where they are first observed.
namespace ErrorTranslator {
    ErrorEnvelope fromHttpStatus(int httpStatus, const QByteArray& body);
    ErrorEnvelope fromNetworkError(QNetworkReply::NetworkError code, const QString& detail);
    ErrorEnvelope fromCancellation(CancelReason reason);
    ErrorEnvelope fromReply(QNetworkReply* reply, CancelReason reason);

    QString backendMessage(const QByteArray& body);
    QString operatorHint(const QString& message);
}
