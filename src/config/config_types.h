#pragma once
#include <QString>
#include <QMap>

struct BackendConfig {
    QString baseUrl = QStringLiteral("https://api.openai.com/v1");
    QString apiKey;
    QString azureApiVersion;            // non-empty selects the Azure endpoint layout
    QMap<QString, QString> customHeaders;
    int connectionPoolSize = 10;

    bool isAzure() const { return !azureApiVersion.isEmpty(); }
};

struct ModelMappingConfig {
    QString smallModel = QStringLiteral("gpt-4o-mini");
    QString middleModel = QStringLiteral("gpt-4o");
    QString bigModel = QStringLiteral("gpt-4o");
    QString fallbackModel;              // empty = unmatched ids pass through
};

struct ConversionOptions {
    int defaultMaxTokens = 4096;
    int minTokensLimit = 100;
    int maxTokensLimit = 4096;
    bool requestStreamUsage = true;
};

struct ServerOptions {
    QString host = QStringLiteral("0.0.0.0");
    int port = 8082;
    int requestTimeout = 90000;         // ms, enforced by the HTTP front
    int maxRequestBytes = 32 * 1024 * 1024;
};

struct LoggingOptions {
    QString logDir = QStringLiteral("./logs");
    QString level = QStringLiteral("INFO");
    QString usageStatsPath = QStringLiteral("./openai_usage.tsv");
    bool recordUsage = true;
};

struct BridgeConfig {
    BackendConfig backend;
    ModelMappingConfig models;
    ConversionOptions conversion;
    ServerOptions server;
    LoggingOptions logging;

    bool isValid() const {
        return !backend.baseUrl.isEmpty() && !backend.apiKey.isEmpty();
    }
};
