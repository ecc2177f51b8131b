#include "pipeline.h"
#include "adapters/outbound/openai.h"
#include "conversion/response_converter.h"
#include "core/log_manager.h"
#include "core/usage_recorder.h"
#include "semantic/backend_stream.h"
#include "semantic/cancellation.h"

// ========== BackendCallTrace ==========

void BackendCallTrace::succeeded(const Usage& usage) const {
    const qint64 latency = timer.isValid() ? timer.elapsed() : 0;
    LOG_INFO(QStringLiteral("Pipeline[%1]: %2 ok in %3 ms (input=%4 output=%5 cached=%6)")
                 .arg(requestId, backendModel)
                 .arg(latency)
                 .arg(usage.inputTokens)
                 .arg(usage.outputTokens)
                 .arg(usage.cacheReadInputTokens));
    if (!recorder)
        return;

    UsageRecord row;
    row.requestId = requestId;
    row.isStream = stream;
    row.model = backendModel;
    row.baseUrl = baseUrl;
    row.apiType = apiType;
    row.inputTokens = usage.inputTokens;
    row.outputTokens = usage.outputTokens;
    row.cacheReadInputTokens = usage.cacheReadInputTokens;
    row.latencyMs = latency;
    row.status = QStringLiteral("success");
    recorder->record(row);
}

void BackendCallTrace::failed(const ErrorEnvelope& failure, const Usage& usage) const {
    const qint64 latency = timer.isValid() ? timer.elapsed() : 0;
    const bool cancelled = failure.kind == ErrorKind::Cancelled;
    if (cancelled) {
        LOG_INFO(QStringLiteral("Pipeline[%1]: %2 cancelled after %3 ms: %4")
                     .arg(requestId, backendModel).arg(latency).arg(failure.message));
    } else {
        LOG_ERROR(QStringLiteral("Pipeline[%1]: %2 failed after %3 ms [%4 %5]: %6")
                      .arg(requestId, backendModel)
                      .arg(latency)
                      .arg(failure.kindName())
                      .arg(failure.httpStatus())
                      .arg(failure.message));
        if (failure.kind == ErrorKind::Decode)
            LOG_WARNING(QStringLiteral("Pipeline[%1]: backend payload did not match the Chat Completions shape")
                            .arg(requestId));
    }
    if (!failure.hint.isEmpty())
        LOG_WARNING(QStringLiteral("Pipeline[%1]: hint: %2").arg(requestId, failure.hint));
    if (!recorder)
        return;

    UsageRecord row;
    row.requestId = requestId;
    row.isStream = stream;
    row.model = backendModel;
    row.baseUrl = baseUrl;
    row.apiType = apiType;
    row.inputTokens = usage.inputTokens;
    row.outputTokens = usage.outputTokens;
    row.cacheReadInputTokens = usage.cacheReadInputTokens;
    row.latencyMs = latency;
    row.status = cancelled ? QStringLiteral("cancelled") : QStringLiteral("error");
    row.error = failure.message;
    recorder->record(row);
}

// ========== PipelineStreamSession ==========

PipelineStreamSession::PipelineStreamSession(
        BackendStream* upstream,
        const StreamConverter& converter,
        const BackendCallTrace& trace,
        CancellationToken* cancel,
        QObject* parent)
    : QObject(parent)
    , m_upstream(upstream)
    , m_converter(converter)
    , m_trace(trace)
{
    m_upstream->setParent(this);
    connect(m_upstream, &BackendStream::fragmentReady,
            this, &PipelineStreamSession::onUpstreamFragment);
    connect(m_upstream, &BackendStream::finished,
            this, &PipelineStreamSession::onUpstreamFinished);
    connect(m_upstream, &BackendStream::failed,
            this, &PipelineStreamSession::onUpstreamFailed);
    if (cancel) {
        connect(cancel, &CancellationToken::cancelled,
                this, &PipelineStreamSession::abort);
    }
}

void PipelineStreamSession::abort(CancelReason reason) {
    if (m_done)
        return;
    m_upstream->abort(reason);
}

void PipelineStreamSession::onUpstreamFragment(const BackendStreamFragment& fragment) {
    if (m_done)
        return;
    emitAll(m_converter.consume(fragment));
}

void PipelineStreamSession::onUpstreamFinished() {
    if (m_done)
        return;
    emitAll(m_converter.finish());
    m_done = true;
    m_trace.succeeded(m_converter.usage());
    emit finished();
}

void PipelineStreamSession::onUpstreamFailed(const ErrorEnvelope& failure) {
    if (m_done)
        return;
    emitAll(m_converter.fail(failure));
    m_done = true;
    m_trace.failed(failure, m_converter.usage());
    emit finished();
}

void PipelineStreamSession::emitAll(const QList<StreamEvent>& events) {
    for (const StreamEvent& ev : events)
        emit eventReady(ev);
}

// ========== Pipeline ==========

Pipeline::Pipeline(const BridgeConfig& config, IBackendClient* client, UsageRecorder* usage)
    : m_config(config)
    , m_mapper(config.models)
    , m_requestConverter(config.conversion)
    , m_client(client)
    , m_usage(usage)
{
}

Result<BackendRequest> Pipeline::prepare(const CanonicalRequest& request, bool stream) const {
    const QString backendModel = m_mapper.map(request.model);
    LOG_INFO(QStringLiteral("Pipeline[%1]: %2 -> %3 (messages=%4 tools=%5 stream=%6)")
                 .arg(request.requestId, request.model, backendModel)
                 .arg(request.messages.size())
                 .arg(request.tools.size())
                 .arg(stream ? QStringLiteral("true") : QStringLiteral("false")));

    CanonicalRequest effective = request;
    effective.stream = stream;
    auto converted = m_requestConverter.convert(effective, backendModel);
    if (!converted) {
        LOG_WARNING(QStringLiteral("Pipeline[%1]: rejected: %2")
                        .arg(request.requestId, converted.error().message));
    }
    return converted;
}

BackendCallTrace Pipeline::startTrace(const CanonicalRequest& request, const QString& backendModel,
                                      bool stream) const {
    BackendCallTrace trace;
    trace.requestId = request.requestId;
    trace.backendModel = backendModel;
    trace.baseUrl = m_config.backend.baseUrl;
    trace.apiType = OpenAICodec::apiType(m_config.backend);
    trace.stream = stream;
    trace.recorder = m_usage;
    trace.timer.start();
    return trace;
}

Result<CanonicalResponse> Pipeline::process(const CanonicalRequest& request,
                                            CancellationToken* cancel) {
    auto converted = prepare(request, false);
    if (!converted)
        return std::unexpected(converted.error());

    const BackendHttpRequest http = OpenAICodec::buildHttpRequest(*converted, m_config.backend);
    const BackendCallTrace trace = startTrace(request, converted->model, false);

    auto resp = m_client->execute(http, cancel);
    if (!resp) {
        trace.failed(resp.error());
        return std::unexpected(resp.error());
    }

    auto parsed = OpenAICodec::parseResponse(resp->body);
    if (!parsed) {
        trace.failed(parsed.error());
        return std::unexpected(parsed.error());
    }

    CanonicalResponse out = ResponseConverter::convert(*parsed, request.model);
    trace.succeeded(out.usage);
    return out;
}

Result<PipelineStreamSession*> Pipeline::processStream(const CanonicalRequest& request,
                                                       CancellationToken* cancel,
                                                       QObject* parent) {
    auto converted = prepare(request, true);
    if (!converted)
        return std::unexpected(converted.error());

    const BackendHttpRequest http = OpenAICodec::buildHttpRequest(*converted, m_config.backend);
    const BackendCallTrace trace = startTrace(request, converted->model, true);

    auto stream = m_client->openStream(http, cancel);
    if (!stream) {
        trace.failed(stream.error());
        return std::unexpected(stream.error());
    }

    StreamConverter::Options options;
    options.awaitTrailingUsage = converted->includeUsage;
    return new PipelineStreamSession(*stream, StreamConverter(request.model, options),
                                     trace, cancel, parent);
}
