#include "stream_session.h"
#include "adapters/outbound/openai.h"
#include "conversion/error_translator.h"
#include "core/log_manager.h"

StreamSession::StreamSession(QNetworkReply* reply, QObject* parent)
    : BackendStream(parent)
    , m_reply(reply)
{
    Q_ASSERT(m_reply);

    // Take ownership of the reply so it is cleaned up with this session
    m_reply->setParent(this);

    connect(m_reply, &QNetworkReply::readyRead,
            this, &StreamSession::onReadyRead);
    connect(m_reply, &QNetworkReply::finished,
            this, &StreamSession::onReplyFinished);
    connect(m_reply, &QNetworkReply::errorOccurred,
            this, &StreamSession::onReplyError);

    // Bytes (or the whole body) may already be buffered before anyone listens
    QMetaObject::invokeMethod(this, &StreamSession::drainPending, Qt::QueuedConnection);
}

StreamSession::~StreamSession()
{
    if (m_reply) {
        m_reply->disconnect(this);
        m_reply->abort();
    }
}

void StreamSession::abort(CancelReason reason)
{
    if (m_finished)
        return;
    m_reply->disconnect(this);
    m_reply->abort();
    fail(ErrorTranslator::fromCancellation(reason));
}

void StreamSession::drainPending()
{
    if (m_finished)
        return;
    if (m_reply->bytesAvailable() > 0)
        onReadyRead();
    if (!m_finished && m_reply->isFinished())
        onReplyFinished();
}

void StreamSession::onReadyRead()
{
    if (m_finished)
        return;
    processEvents(m_parser.feed(m_reply->readAll()));
}

void StreamSession::onReplyFinished()
{
    if (m_finished)
        return;

    if (m_reply->error() != QNetworkReply::NoError) {
        onReplyError(m_reply->error());
        return;
    }

    if (m_reply->bytesAvailable() > 0)
        processEvents(m_parser.feed(m_reply->readAll()));
    if (!m_finished)
        processEvents(m_parser.flush());
    if (!m_finished) {
        LOG_DEBUG(QStringLiteral("StreamSession: backend closed the stream without [DONE]"));
        complete();
    }
}

void StreamSession::onReplyError(QNetworkReply::NetworkError code)
{
    if (m_finished || code == QNetworkReply::NoError)
        return;

    const ErrorEnvelope failure = ErrorTranslator::fromReply(m_reply, CancelReason::None);
    LOG_ERROR(QStringLiteral("StreamSession error [%1]: %2")
                  .arg(failure.kindName(), failure.message));
    fail(failure);
}

void StreamSession::processEvents(const QList<SseEvent>& events)
{
    for (const SseEvent& event : events) {
        if (m_finished)
            return;

        if (OpenAICodec::isDoneMarker(event.data)) {
            complete();
            return;
        }
        if (event.data.trimmed().isEmpty())
            continue;

        Result<BackendStreamFragment> fragment = OpenAICodec::parseChunk(event.data);
        if (!fragment) {
            LOG_ERROR(QStringLiteral("StreamSession: %1: %2")
                          .arg(fragment.error().kindName(), fragment.error().message));
            m_reply->disconnect(this);
            m_reply->abort();
            fail(fragment.error());
            return;
        }
        emit fragmentReady(*fragment);
    }
}

void StreamSession::complete()
{
    m_finished = true;
    m_reply->disconnect(this);
    emit finished();
}

void StreamSession::fail(const ErrorEnvelope& failure)
{
    m_finished = true;
    emit failed(failure);
}
