#include "failure.h"

int ErrorEnvelope::httpStatus() const {
    switch (kind) {
    case ErrorKind::Validation:
        return 400;
    case ErrorKind::Client:
        return backendStatus.value_or(400);
    case ErrorKind::Upstream:
        if (timedOut) return 504;
        return backendStatus.value_or(502);
    case ErrorKind::Decode:
        return 502;
    case ErrorKind::Cancelled:
        return 499;
    }
    return 500;
}

QString ErrorEnvelope::kindName() const {
    switch (kind) {
    case ErrorKind::Validation: return QStringLiteral("validation-error");
    case ErrorKind::Client:     return QStringLiteral("client-error");
    case ErrorKind::Upstream:   return QStringLiteral("upstream-error");
    case ErrorKind::Decode:     return QStringLiteral("decode-error");
    case ErrorKind::Cancelled:  return QStringLiteral("cancelled");
    }
    return QStringLiteral("upstream-error");
}

QString ErrorEnvelope::claudeErrorType() const {
    switch (kind) {
    case ErrorKind::Validation:
        return QStringLiteral("invalid_request_error");
    case ErrorKind::Client:
        switch (backendStatus.value_or(400)) {
        case 401: return QStringLiteral("authentication_error");
        case 403: return QStringLiteral("permission_error");
        case 404: return QStringLiteral("not_found_error");
        case 413: return QStringLiteral("request_too_large");
        case 429: return QStringLiteral("rate_limit_error");
        default:  return QStringLiteral("invalid_request_error");
        }
    case ErrorKind::Upstream:
        if (backendStatus == 503 || backendStatus == 529)
            return QStringLiteral("overloaded_error");
        return QStringLiteral("api_error");
    case ErrorKind::Decode:
    case ErrorKind::Cancelled:
        return QStringLiteral("api_error");
    }
    return QStringLiteral("api_error");
}

QJsonObject ErrorEnvelope::toJson() const {
    QJsonObject err;
    err["type"] = claudeErrorType();
    err["message"] = message;
    QJsonObject root;
    root["type"] = QStringLiteral("error");
    root["error"] = err;
    return root;
}

ErrorEnvelope ErrorEnvelope::validation(const QString& msg) {
    return {ErrorKind::Validation, msg, std::nullopt, {}, false};
}

ErrorEnvelope ErrorEnvelope::clientError(int status, const QString& msg, const QString& hint) {
    return {ErrorKind::Client, msg, status, hint, false};
}

ErrorEnvelope ErrorEnvelope::upstream(const QString& msg, std::optional<int> status,
                                      const QString& hint) {
    return {ErrorKind::Upstream, msg, status, hint, false};
}

ErrorEnvelope ErrorEnvelope::timeout(const QString& msg) {
    return {ErrorKind::Upstream, msg, std::nullopt, {}, true};
}

ErrorEnvelope ErrorEnvelope::decode(const QString& msg) {
    return {ErrorKind::Decode, msg, std::nullopt, {}, false};
}

ErrorEnvelope ErrorEnvelope::cancelled(const QString& msg) {
    return {ErrorKind::Cancelled, msg, std::nullopt, {}, false};
}
