#include "usage_recorder.h"
#include "log_manager.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QMutexLocker>

UsageRecorder::UsageRecorder(const QString& path, bool enabled)
    : m_path(path)
    , m_enabled(enabled && !path.isEmpty())
{
}

QStringList UsageRecorder::columns()
{
    return {
        QStringLiteral("timestamp"), QStringLiteral("request_id"), QStringLiteral("is_stream"),
        QStringLiteral("model"), QStringLiteral("base_url"), QStringLiteral("api_type"),
        QStringLiteral("input_tokens"), QStringLiteral("output_tokens"),
        QStringLiteral("cache_read_input_tokens"), QStringLiteral("total_tokens"),
        QStringLiteral("latency_ms"), QStringLiteral("status"), QStringLiteral("error"),
    };
}

QString UsageRecorder::sanitize(const QString& value)
{
    QString out = value;
    out.replace(QLatin1Char('\t'), QLatin1Char(' '));
    out.replace(QLatin1Char('\r'), QLatin1Char(' '));
    out.replace(QLatin1Char('\n'), QLatin1Char(' '));
    return out;
}

void UsageRecorder::record(const UsageRecord& row)
{
    if (!m_enabled)
        return;

    const QDateTime ts = row.timestamp.isValid() ? row.timestamp : QDateTime::currentDateTime();
    const QStringList fields = {
        ts.toString(Qt::ISODateWithMs),
        sanitize(row.requestId),
        row.isStream ? QStringLiteral("true") : QStringLiteral("false"),
        sanitize(row.model),
        sanitize(row.baseUrl),
        sanitize(row.apiType),
        QString::number(row.inputTokens),
        QString::number(row.outputTokens),
        QString::number(row.cacheReadInputTokens),
        QString::number(row.totalTokens()),
        QString::number(row.latencyMs),
        sanitize(row.status),
        sanitize(row.error),
    };

    QMutexLocker lock(&m_mutex);
    const QFileInfo info(m_path);
    const bool writeHeader = !info.exists() || info.size() == 0;
    if (!info.absoluteDir().exists())
        QDir().mkpath(info.absolutePath());

    QFile file(m_path);
    if (!file.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        LOG_WARNING(QStringLiteral("UsageRecorder: cannot open %1: %2").arg(m_path, file.errorString()));
        return;
    }

    QByteArray out;
    if (writeHeader)
        out += columns().join(QLatin1Char('\t')).toUtf8() + '\n';
    out += fields.join(QLatin1Char('\t')).toUtf8() + '\n';
    if (file.write(out) != out.size())
        LOG_WARNING(QStringLiteral("UsageRecorder: write to %1 failed: %2").arg(m_path, file.errorString()));
}
