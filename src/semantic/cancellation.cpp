#include "cancellation.h"

CancellationToken::CancellationToken(QObject* parent)
    : QObject(parent)
{
}

void CancellationToken::cancel(CancelReason reason)
{
    // First reason wins; later cancels are no-ops.
    if (isCancelled() || reason == CancelReason::None)
        return;
    m_reason = reason;
    emit cancelled(reason);
}
