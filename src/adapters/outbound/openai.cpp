#include "openai.h"
#include "core/log_manager.h"
#include <QJsonDocument>

QString OpenAICodec::roleName(BackendRole role)
{
    switch (role) {
    case BackendRole::System:    return QStringLiteral("system");
    case BackendRole::User:      return QStringLiteral("user");
    case BackendRole::Assistant: return QStringLiteral("assistant");
    case BackendRole::Tool:      return QStringLiteral("tool");
    }
    return QStringLiteral("user");
}

QString OpenAICodec::apiType(const BackendConfig& config)
{
    return config.isAzure() ? QStringLiteral("azure") : QStringLiteral("openai");
}

QString OpenAICodec::endpointUrl(const QString& model, const BackendConfig& config)
{
    QString base = config.baseUrl;
    while (base.endsWith(QLatin1Char('/')))
        base.chop(1);

    if (config.isAzure()) {
        return base + QStringLiteral("/openai/deployments/") + model
               + QStringLiteral("/chat/completions?api-version=") + config.azureApiVersion;
    }
    return base + QStringLiteral("/chat/completions");
}

BackendHttpRequest OpenAICodec::buildHttpRequest(const BackendRequest& request,
                                                 const BackendConfig& config)
{
    BackendHttpRequest hr;
    hr.method = QStringLiteral("POST");
    hr.url = endpointUrl(request.model, config);
    hr.stream = request.stream;

    if (config.isAzure())
        hr.headers[QStringLiteral("api-key")] = config.apiKey;
    else
        hr.headers[QStringLiteral("Authorization")] = QStringLiteral("Bearer ") + config.apiKey;
    hr.headers[QStringLiteral("Content-Type")] = QStringLiteral("application/json");
    if (request.stream)
        hr.headers[QStringLiteral("Accept")] = QStringLiteral("text/event-stream");

    for (auto it = config.customHeaders.constBegin(); it != config.customHeaders.constEnd(); ++it) {
        if (!it.key().isEmpty())
            hr.headers[it.key()] = it.value();
    }

    hr.body = QJsonDocument(encodeRequest(request)).toJson(QJsonDocument::Compact);
    return hr;
}

QJsonObject OpenAICodec::encodeRequest(const BackendRequest& request)
{
    QJsonObject body;
    body[QStringLiteral("model")] = request.model;
    body[QStringLiteral("messages")] = buildMessages(request.messages);
    body[QStringLiteral("max_tokens")] = request.maxTokens;

    if (!request.tools.isEmpty())
        body[QStringLiteral("tools")] = buildToolDefs(request.tools);
    if (request.toolChoice)
        body[QStringLiteral("tool_choice")] = *request.toolChoice;

    if (request.temperature)
        body[QStringLiteral("temperature")] = *request.temperature;
    if (request.topP)
        body[QStringLiteral("top_p")] = *request.topP;
    if (!request.stop.isEmpty())
        body[QStringLiteral("stop")] = QJsonArray::fromStringList(request.stop);

    if (request.stream) {
        body[QStringLiteral("stream")] = true;
        if (request.includeUsage) {
            QJsonObject opts;
            opts[QStringLiteral("include_usage")] = true;
            body[QStringLiteral("stream_options")] = opts;
        }
    }
    return body;
}

QJsonArray OpenAICodec::buildMessages(const QList<BackendMessage>& messages)
{
    QJsonArray out;
    for (const BackendMessage& m : messages) {
        QJsonObject msg;
        msg[QStringLiteral("role")] = roleName(m.role);

        if (m.role == BackendRole::Tool)
            msg[QStringLiteral("tool_call_id")] = m.toolCallId;

        if (!m.parts.isEmpty()) {
            QJsonArray parts;
            for (const BackendContentPart& p : m.parts) {
                QJsonObject part;
                if (p.kind == BackendContentPart::Kind::Text) {
                    part[QStringLiteral("type")] = QStringLiteral("text");
                    part[QStringLiteral("text")] = p.text;
                } else {
                    part[QStringLiteral("type")] = QStringLiteral("image_url");
                    QJsonObject imageUrl;
                    imageUrl[QStringLiteral("url")] = p.url;
                    part[QStringLiteral("image_url")] = imageUrl;
                }
                parts.append(part);
            }
            msg[QStringLiteral("content")] = parts;
        } else if (m.text) {
            msg[QStringLiteral("content")] = *m.text;
        } else {
            msg[QStringLiteral("content")] = QJsonValue::Null;
        }

        if (!m.toolCalls.isEmpty()) {
            QJsonArray calls;
            for (const BackendToolCall& tc : m.toolCalls) {
                QJsonObject fn;
                fn[QStringLiteral("name")] = tc.name;
                fn[QStringLiteral("arguments")] = tc.arguments;
                QJsonObject call;
                call[QStringLiteral("id")] = tc.id;
                call[QStringLiteral("type")] = QStringLiteral("function");
                call[QStringLiteral("function")] = fn;
                calls.append(call);
            }
            msg[QStringLiteral("tool_calls")] = calls;
        }
        out.append(msg);
    }
    return out;
}

QJsonArray OpenAICodec::buildToolDefs(const QList<BackendToolDefinition>& tools)
{
    QJsonArray arr;
    for (const BackendToolDefinition& tool : tools) {
        QJsonObject fn;
        fn[QStringLiteral("name")] = tool.name;
        if (!tool.description.isEmpty())
            fn[QStringLiteral("description")] = tool.description;
        fn[QStringLiteral("parameters")] = tool.parameters;
        QJsonObject toolObj;
        toolObj[QStringLiteral("type")] = QStringLiteral("function");
        toolObj[QStringLiteral("function")] = fn;
        arr.append(toolObj);
    }
    return arr;
}

Result<BackendResponse> OpenAICodec::parseResponse(const QByteArray& body)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(body, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(ErrorEnvelope::decode(
            QStringLiteral("Backend response is not a JSON object: ") + err.errorString()));
    }

    const QJsonObject root = doc.object();
    const QJsonArray choices = root.value(QStringLiteral("choices")).toArray();
    if (choices.isEmpty()) {
        return std::unexpected(ErrorEnvelope::decode(
            QStringLiteral("Backend response has no choices")));
    }

    BackendResponse resp;
    resp.id = root.value(QStringLiteral("id")).toString();
    resp.model = root.value(QStringLiteral("model")).toString();
    resp.usage = parseUsage(root.value(QStringLiteral("usage")));

    const QJsonObject choice = choices.first().toObject();
    const QJsonObject msg = choice.value(QStringLiteral("message")).toObject();
    const QJsonValue contentVal = msg.value(QStringLiteral("content"));
    if (contentVal.isString() || contentVal.isArray())
        resp.content = contentText(contentVal);

    for (const QJsonValue& tcv : msg.value(QStringLiteral("tool_calls")).toArray())
        resp.toolCalls.append(parseToolCall(tcv.toObject()));

    resp.finishReason = choice.value(QStringLiteral("finish_reason")).toString();
    const QJsonValue matched = choice.value(QStringLiteral("stop_reason"));
    if (matched.isString())
        resp.matchedStop = matched.toString();
    return resp;
}

Result<BackendStreamFragment> OpenAICodec::parseChunk(const QByteArray& data)
{
    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(data, &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        return std::unexpected(ErrorEnvelope::decode(
            QStringLiteral("Malformed backend stream chunk: ") + err.errorString()));
    }

    const QJsonObject root = doc.object();
    if (root.value(QStringLiteral("error")).isObject()) {
        const QJsonObject error = root.value(QStringLiteral("error")).toObject();
        return std::unexpected(ErrorEnvelope::upstream(
            error.value(QStringLiteral("message")).toString(QStringLiteral("Backend stream reported an error"))));
    }

    BackendStreamFragment frag;
    frag.id = root.value(QStringLiteral("id")).toString();
    frag.model = root.value(QStringLiteral("model")).toString();
    frag.usage = parseUsage(root.value(QStringLiteral("usage")));

    const QJsonArray choices = root.value(QStringLiteral("choices")).toArray();
    if (choices.isEmpty())
        return frag;

    const QJsonObject choice = choices.first().toObject();
    const QJsonObject delta = choice.value(QStringLiteral("delta")).toObject();
    const QJsonValue contentVal = delta.value(QStringLiteral("content"));
    if (contentVal.isString() || contentVal.isArray())
        frag.contentDelta = contentText(contentVal);

    const QJsonArray toolCalls = delta.value(QStringLiteral("tool_calls")).toArray();
    for (int i = 0; i < toolCalls.size(); ++i) {
        const QJsonObject tc = toolCalls.at(i).toObject();
        const QJsonObject fn = tc.value(QStringLiteral("function")).toObject();
        BackendToolCallDelta d;
        const QJsonValue indexVal = tc.value(QStringLiteral("index"));
        d.hasIndex = indexVal.isDouble();
        d.index = d.hasIndex ? indexVal.toInt() : i;
        d.id = tc.value(QStringLiteral("id")).toString();
        if (!d.hasIndex) {
            LOG_WARNING(QStringLiteral("OpenAICodec: stream tool call without index (id \"%1\"), position %2 assumed")
                            .arg(d.id).arg(i));
        }
        d.name = fn.value(QStringLiteral("name")).toString();
        d.argumentsDelta = fn.value(QStringLiteral("arguments")).toString();
        frag.toolCalls.append(d);
    }

    frag.finishReason = choice.value(QStringLiteral("finish_reason")).toString();
    const QJsonValue matched = choice.value(QStringLiteral("stop_reason"));
    if (matched.isString())
        frag.matchedStop = matched.toString();
    return frag;
}

BackendToolCall OpenAICodec::parseToolCall(const QJsonObject& tc)
{
    BackendToolCall call;
    call.id = tc.value(QStringLiteral("id")).toString();
    const QJsonObject fn = tc.value(QStringLiteral("function")).toObject();
    call.name = fn.value(QStringLiteral("name")).toString();
    const QJsonValue args = fn.value(QStringLiteral("arguments"));
    if (args.isObject())
        call.arguments = QString::fromUtf8(QJsonDocument(args.toObject()).toJson(QJsonDocument::Compact));
    else
        call.arguments = args.toString();
    return call;
}

std::optional<BackendUsage> OpenAICodec::parseUsage(const QJsonValue& value)
{
    if (!value.isObject())
        return std::nullopt;
    const QJsonObject usage = value.toObject();
    BackendUsage u;
    u.promptTokens = usage.value(QStringLiteral("prompt_tokens")).toInt();
    u.completionTokens = usage.value(QStringLiteral("completion_tokens")).toInt();
    u.cachedTokens = usage.value(QStringLiteral("prompt_tokens_details")).toObject()
                         .value(QStringLiteral("cached_tokens")).toInt();
    return u;
}

QString OpenAICodec::contentText(const QJsonValue& content)
{
    if (content.isString())
        return content.toString();

    QString text;
    for (const QJsonValue& part : content.toArray()) {
        const QJsonObject partObj = part.toObject();
        if (partObj.value(QStringLiteral("type")).toString() == QStringLiteral("text"))
            text += partObj.value(QStringLiteral("text")).toString();
    }
    return text;
}
