#include <QCoreApplication>
#include <QProcessEnvironment>

#include "adapters/executor/connection_pool.h"
#include "adapters/executor/qt_backend_client.h"
#include "adapters/outbound/openai.h"
#include "config/config_store.h"
#include "core/log_manager.h"
#include "core/usage_recorder.h"
#include "proxy/proxy_server.h"

int main(int argc, char* argv[])
{
    QCoreApplication app(argc, argv);
    app.setApplicationName(QStringLiteral("claudebridge"));
    app.setApplicationVersion(QStringLiteral("1.0.0"));

    // --- 1. Config ---
    ConfigStore configStore;
    const QStringList args = app.arguments();
    if (args.size() > 1 && !configStore.load(args.at(1))) {
        qCritical("claudebridge: %s", qPrintable(configStore.lastError()));
        return 1;
    }
    configStore.applyEnvironment(QProcessEnvironment::systemEnvironment());
    const BridgeConfig config = configStore.config();

    // --- 2. Log ---
    bool levelOk = false;
    const LogManager::Level level = LogManager::parseLevel(config.logging.level, &levelOk);
    LogManager::instance().setMinimumLevel(level);
    LogManager::instance().initialize(config.logging.logDir);
    if (!levelOk)
        LOG_WARNING(QStringLiteral("Unknown LOG_LEVEL \"%1\", using INFO").arg(config.logging.level));
    LOG_INFO(QStringLiteral("claudebridge v1.0.0 starting"));

    if (!config.isValid()) {
        LOG_ERROR(QStringLiteral("Configuration invalid: OPENAI_API_KEY and OPENAI_BASE_URL are required"));
        return 1;
    }

    LOG_INFO(QStringLiteral("Backend: %1 (%2)").arg(config.backend.baseUrl,
                                                    OpenAICodec::apiType(config.backend)));
    LOG_INFO(QStringLiteral("Models: small=%1 middle=%2 big=%3 fallback=%4")
                 .arg(config.models.smallModel, config.models.middleModel,
                      config.models.bigModel, config.models.fallbackModel));
    LOG_INFO(QStringLiteral("Max tokens: default=%1 range=[%2, %3], request timeout %4 s")
                 .arg(config.conversion.defaultMaxTokens)
                 .arg(config.conversion.minTokensLimit)
                 .arg(config.conversion.maxTokensLimit)
                 .arg(config.server.requestTimeout / 1000));

    // --- 3. Transport + usage ---
    ConnectionPool pool(config.backend.connectionPoolSize);
    QtBackendClient client(pool);
    UsageRecorder usage(config.logging.usageStatsPath, config.logging.recordUsage);

    // --- 4. HTTP front ---
    ProxyServer server(config, &client, &usage);
    if (!server.start())
        return 1;

    QObject::connect(&app, &QCoreApplication::aboutToQuit, &server, &ProxyServer::stop);
    return app.exec();
}
