#pragma once
#include "types.h"
#include <QObject>

class CancellationToken : public QObject {
    Q_OBJECT
public:
    explicit CancellationToken(QObject* parent = nullptr);

    void cancel(CancelReason reason = CancelReason::Requested);
    bool isCancelled() const { return m_reason != CancelReason::None; }
    CancelReason reason() const { return m_reason; }

signals:
    void cancelled(CancelReason reason);

private:
    CancelReason m_reason = CancelReason::None;
};
