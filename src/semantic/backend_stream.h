#pragma once
#include "backend.h"
#include "failure.h"
#include "types.h"
#include <QObject>

// Forward-only, non-restartable sequence of backend fragments. Exactly one of
// finished() or failed() is emitted, after which nothing else is.
class BackendStream : public QObject {
    Q_OBJECT
public:
    using QObject::QObject;
    ~BackendStream() override = default;

    virtual void abort(CancelReason reason) = 0;

signals:
    void fragmentReady(const BackendStreamFragment& fragment);
    void finished();
    void failed(const ErrorEnvelope& failure);
};
