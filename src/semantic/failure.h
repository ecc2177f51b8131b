#pragma once
#include "types.h"
#include <QString>
#include <QJsonObject>
#include <optional>

struct ErrorEnvelope {
    ErrorKind           kind = ErrorKind::Upstream;
    QString             message;
    std::optional<int>  backendStatus;
    QString             hint;
    bool                timedOut = false;

    int httpStatus() const;
    QString kindName() const;
    QString claudeErrorType() const;
    QJsonObject toJson() const;

    static ErrorEnvelope validation(const QString& msg);
    static ErrorEnvelope clientError(int status, const QString& msg, const QString& hint = {});
    static ErrorEnvelope upstream(const QString& msg, std::optional<int> status = std::nullopt,
                                  const QString& hint = {});
    static ErrorEnvelope timeout(const QString& msg);
    static ErrorEnvelope decode(const QString& msg);
    static ErrorEnvelope cancelled(const QString& msg);
};
