#pragma once
#include "backend_stream.h"
#include "sse_parser.h"
#include <QNetworkReply>

// BackendStream reading Chat Completions SSE chunks from a QNetworkReply.
class StreamSession : public BackendStream {
    Q_OBJECT
public:
    explicit StreamSession(QNetworkReply* reply, QObject* parent = nullptr);
    ~StreamSession() override;

    void abort(CancelReason reason) override;

private slots:
    void onReadyRead();
    void onReplyFinished();
    void onReplyError(QNetworkReply::NetworkError code);
    void drainPending();

private:
    QNetworkReply* m_reply;
    SseParser m_parser;
    bool m_finished = false;

    void processEvents(const QList<SseEvent>& events);
    void complete();
    void fail(const ErrorEnvelope& failure);
};
