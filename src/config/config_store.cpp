#include "config_store.h"
#include "core/log_manager.h"
#include <QFile>
#include <QJsonDocument>

namespace {

QJsonValue jsonValueEither(const QJsonObject& obj, const char* snakeKey, const char* camelKey)
{
    const QString snake = QString::fromUtf8(snakeKey);
    if (obj.contains(snake))
        return obj.value(snake);
    return obj.value(QString::fromUtf8(camelKey));
}

void readString(const QJsonObject& obj, const char* snakeKey, const char* camelKey, QString& out)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    if (value.isString())
        out = value.toString();
}

void readInt(const QJsonObject& obj, const char* snakeKey, const char* camelKey, int& out)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    if (value.isDouble())
        out = value.toInt(out);
}

void readBool(const QJsonObject& obj, const char* snakeKey, const char* camelKey, bool& out)
{
    const QJsonValue value = jsonValueEither(obj, snakeKey, camelKey);
    if (value.isBool())
        out = value.toBool(out);
}

void readEnvString(const QProcessEnvironment& env, const char* name, QString& out)
{
    const QString key = QString::fromLatin1(name);
    if (env.contains(key))
        out = env.value(key);
}

void readEnvInt(const QProcessEnvironment& env, const char* name, int& out, int scale = 1)
{
    const QString key = QString::fromLatin1(name);
    if (!env.contains(key))
        return;
    bool ok = false;
    const int value = env.value(key).trimmed().toInt(&ok);
    if (ok)
        out = value * scale;
    else
        LOG_WARNING(QStringLiteral("ConfigStore: ignoring non-numeric %1=%2").arg(key, env.value(key)));
}

int clampInt(int value, int minValue, int maxValue)
{
    return qBound(minValue, value, maxValue);
}

}

bool ConfigStore::load(const QString& path)
{
    m_filePath = path;
    QFile file(path);
    if (!file.open(QIODevice::ReadOnly)) {
        m_lastError = QStringLiteral("cannot open %1: %2").arg(path, file.errorString());
        LOG_WARNING(QStringLiteral("ConfigStore: ") + m_lastError);
        return false;
    }

    QJsonParseError err;
    const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &err);
    if (err.error != QJsonParseError::NoError || !doc.isObject()) {
        m_lastError = QStringLiteral("%1 is not a JSON object: %2").arg(path, err.errorString());
        LOG_WARNING(QStringLiteral("ConfigStore: ") + m_lastError);
        return false;
    }
    return loadJson(doc.object());
}

bool ConfigStore::loadJson(const QJsonObject& root)
{
    BackendConfig& backend = m_config.backend;
    const QJsonObject b = root.value(QStringLiteral("backend")).toObject();
    readString(b, "base_url", "baseUrl", backend.baseUrl);
    readString(b, "api_key", "apiKey", backend.apiKey);
    readString(b, "azure_api_version", "azureApiVersion", backend.azureApiVersion);
    readInt(b, "connection_pool_size", "connectionPoolSize", backend.connectionPoolSize);
    const QJsonObject headers = jsonValueEither(b, "custom_headers", "customHeaders").toObject();
    for (auto it = headers.constBegin(); it != headers.constEnd(); ++it)
        backend.customHeaders.insert(it.key(), it.value().toString());

    ModelMappingConfig& models = m_config.models;
    const QJsonObject m = root.value(QStringLiteral("models")).toObject();
    readString(m, "small_model", "smallModel", models.smallModel);
    readString(m, "big_model", "bigModel", models.bigModel);
    readString(m, "fallback_model", "fallbackModel", models.fallbackModel);
    if (jsonValueEither(m, "middle_model", "middleModel").isString()) {
        readString(m, "middle_model", "middleModel", models.middleModel);
        m_middleModelSet = true;
    }

    ConversionOptions& conv = m_config.conversion;
    const QJsonObject c = root.value(QStringLiteral("conversion")).toObject();
    readInt(c, "default_max_tokens", "defaultMaxTokens", conv.defaultMaxTokens);
    readInt(c, "min_tokens_limit", "minTokensLimit", conv.minTokensLimit);
    readInt(c, "max_tokens_limit", "maxTokensLimit", conv.maxTokensLimit);
    readBool(c, "request_stream_usage", "requestStreamUsage", conv.requestStreamUsage);

    ServerOptions& server = m_config.server;
    const QJsonObject s = root.value(QStringLiteral("server")).toObject();
    readString(s, "host", "host", server.host);
    readInt(s, "port", "port", server.port);
    int timeoutSeconds = server.requestTimeout / 1000;
    readInt(s, "request_timeout", "requestTimeout", timeoutSeconds);
    server.requestTimeout = timeoutSeconds * 1000;
    readInt(s, "max_request_bytes", "maxRequestBytes", server.maxRequestBytes);

    LoggingOptions& logging = m_config.logging;
    const QJsonObject l = root.value(QStringLiteral("logging")).toObject();
    readString(l, "log_dir", "logDir", logging.logDir);
    readString(l, "level", "level", logging.level);
    readString(l, "usage_stats_path", "usageStatsPath", logging.usageStatsPath);
    readBool(l, "record_usage", "recordUsage", logging.recordUsage);

    if (!m_middleModelSet)
        models.middleModel = models.bigModel;
    clampValues();
    return true;
}

void ConfigStore::applyEnvironment(const QProcessEnvironment& env)
{
    BackendConfig& backend = m_config.backend;
    readEnvString(env, "OPENAI_API_KEY", backend.apiKey);
    readEnvString(env, "OPENAI_BASE_URL", backend.baseUrl);
    readEnvString(env, "AZURE_API_VERSION", backend.azureApiVersion);

    const QString prefix = QStringLiteral("CUSTOM_HEADER_");
    for (const QString& key : env.keys()) {
        if (!key.startsWith(prefix) || key.size() == prefix.size())
            continue;
        QString header = key.mid(prefix.size());
        header.replace(QLatin1Char('_'), QLatin1Char('-'));
        backend.customHeaders.insert(header, env.value(key));
    }

    ModelMappingConfig& models = m_config.models;
    readEnvString(env, "BIG_MODEL", models.bigModel);
    readEnvString(env, "SMALL_MODEL", models.smallModel);
    readEnvString(env, "FALLBACK_MODEL", models.fallbackModel);
    if (env.contains(QStringLiteral("MIDDLE_MODEL"))) {
        models.middleModel = env.value(QStringLiteral("MIDDLE_MODEL"));
        m_middleModelSet = true;
    } else if (!m_middleModelSet) {
        models.middleModel = models.bigModel;
    }

    ConversionOptions& conv = m_config.conversion;
    readEnvInt(env, "MAX_TOKENS_LIMIT", conv.maxTokensLimit);
    readEnvInt(env, "MIN_TOKENS_LIMIT", conv.minTokensLimit);
    readEnvInt(env, "DEFAULT_MAX_TOKENS", conv.defaultMaxTokens);

    ServerOptions& server = m_config.server;
    readEnvString(env, "HOST", server.host);
    readEnvInt(env, "PORT", server.port);
    readEnvInt(env, "REQUEST_TIMEOUT", server.requestTimeout, 1000);
    readEnvInt(env, "MAX_REQUEST_BYTES", server.maxRequestBytes);

    LoggingOptions& logging = m_config.logging;
    readEnvString(env, "LOG_LEVEL", logging.level);
    readEnvString(env, "LOG_DIR", logging.logDir);
    readEnvString(env, "USAGE_STATS_PATH", logging.usageStatsPath);

    clampValues();
}

void ConfigStore::clampValues()
{
    m_config.backend.connectionPoolSize = clampInt(m_config.backend.connectionPoolSize, 1, 100);

    ConversionOptions& conv = m_config.conversion;
    conv.minTokensLimit = clampInt(conv.minTokensLimit, 1, 1000000);
    conv.maxTokensLimit = clampInt(conv.maxTokensLimit, conv.minTokensLimit, 1000000);
    conv.defaultMaxTokens = clampInt(conv.defaultMaxTokens, 1, 1000000);

    m_config.server.port = clampInt(m_config.server.port, 1, 65535);
    m_config.server.requestTimeout = clampInt(m_config.server.requestTimeout, 1000, 3600000);
    m_config.server.maxRequestBytes = clampInt(m_config.server.maxRequestBytes, 1024, 1024 * 1024 * 1024);
}

QJsonObject ConfigStore::toJson(const BridgeConfig& config)
{
    QJsonObject headers;
    for (auto it = config.backend.customHeaders.constBegin();
         it != config.backend.customHeaders.constEnd(); ++it)
        headers[it.key()] = it.value();

    QJsonObject backend;
    backend["base_url"] = config.backend.baseUrl;
    backend["api_key"] = config.backend.apiKey;
    backend["azure_api_version"] = config.backend.azureApiVersion;
    backend["custom_headers"] = headers;
    backend["connection_pool_size"] = config.backend.connectionPoolSize;

    QJsonObject models;
    models["small_model"] = config.models.smallModel;
    models["middle_model"] = config.models.middleModel;
    models["big_model"] = config.models.bigModel;
    models["fallback_model"] = config.models.fallbackModel;

    QJsonObject conversion;
    conversion["default_max_tokens"] = config.conversion.defaultMaxTokens;
    conversion["min_tokens_limit"] = config.conversion.minTokensLimit;
    conversion["max_tokens_limit"] = config.conversion.maxTokensLimit;
    conversion["request_stream_usage"] = config.conversion.requestStreamUsage;

    QJsonObject server;
    server["host"] = config.server.host;
    server["port"] = config.server.port;
    server["request_timeout"] = config.server.requestTimeout / 1000;
    server["max_request_bytes"] = config.server.maxRequestBytes;

    QJsonObject logging;
    logging["log_dir"] = config.logging.logDir;
    logging["level"] = config.logging.level;
    logging["usage_stats_path"] = config.logging.usageStatsPath;
    logging["record_usage"] = config.logging.recordUsage;

    QJsonObject root;
    root["backend"] = backend;
    root["models"] = models;
    root["conversion"] = conversion;
    root["server"] = server;
    root["logging"] = logging;
    return root;
}
