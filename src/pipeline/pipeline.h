#pragma once
#include "config/config_types.h"
#include "conversion/model_mapper.h"
#include "conversion/request_converter.h"
#include "conversion/stream_converter.h"
#include "semantic/ports.h"
#include "semantic/request.h"
#include "semantic/response.h"
#include "semantic/stream_event.h"
#include <QElapsedTimer>
#include <QObject>

class BackendStream;
class CancellationToken;
class UsageRecorder;

// Logging and usage accounting for one backend call.
struct BackendCallTrace {
    QString requestId;
    QString backendModel;
    QString baseUrl;
    QString apiType;
    bool stream = false;
    QElapsedTimer timer;
    UsageRecorder* recorder = nullptr;

    void succeeded(const Usage& usage) const;
    void failed(const ErrorEnvelope& failure, const Usage& usage = {}) const;
};

// Drives a StreamConverter from a BackendStream. Backend failures become
// terminal Claude events; finished() is emitted exactly once.
class PipelineStreamSession : public QObject {
    Q_OBJECT
public:
    PipelineStreamSession(BackendStream* upstream,
                          const StreamConverter& converter,
                          const BackendCallTrace& trace,
                          CancellationToken* cancel,
                          QObject* parent = nullptr);

    void abort(CancelReason reason);
    bool isFinished() const { return m_done; }
    const StreamConverter& converter() const { return m_converter; }

signals:
    void eventReady(const StreamEvent& event);
    void finished();

private slots:
    void onUpstreamFragment(const BackendStreamFragment& fragment);
    void onUpstreamFinished();
    void onUpstreamFailed(const ErrorEnvelope& failure);

private:
    BackendStream* m_upstream;
    StreamConverter m_converter;
    BackendCallTrace m_trace;
    bool m_done = false;

    void emitAll(const QList<StreamEvent>& events);
};

// One instance per client request; holds no state shared with other requests.
class Pipeline {
public:
    Pipeline(const BridgeConfig& config, IBackendClient* client, UsageRecorder* usage = nullptr);

    Result<CanonicalResponse> process(const CanonicalRequest& request,
                                      CancellationToken* cancel = nullptr);

    Result<PipelineStreamSession*> processStream(const CanonicalRequest& request,
                                                 CancellationToken* cancel = nullptr,
                                                 QObject* parent = nullptr);

private:
    BridgeConfig m_config;
    ModelMapper m_mapper;
    RequestConverter m_requestConverter;
    IBackendClient* m_client;
    UsageRecorder* m_usage;

    Result<BackendRequest> prepare(const CanonicalRequest& request, bool stream) const;
    BackendCallTrace startTrace(const CanonicalRequest& request, const QString& backendModel,
                                bool stream) const;
};
