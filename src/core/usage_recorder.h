#pragma once
#include <QDateTime>
#include <QMutex>
#include <QString>
#include <QStringList>

struct UsageRecord {
    QDateTime timestamp;
    QString requestId;
    bool isStream = false;
    QString model;
    QString baseUrl;
    QString apiType;
    int inputTokens = 0;
    int outputTokens = 0;
    int cacheReadInputTokens = 0;
    qint64 latencyMs = 0;
    QString status;             // success, error or cancelled
    QString error;

    int totalTokens() const { return inputTokens + outputTokens; }
};

// Appends one TSV row per backend call. Write failures are logged, never raised.
class UsageRecorder {
public:
    explicit UsageRecorder(const QString& path, bool enabled = true);

    void record(const UsageRecord& row);

    QString path() const { return m_path; }
    bool isEnabled() const { return m_enabled; }

    static QStringList columns();
    static QString sanitize(const QString& value);

private:
    QString m_path;
    bool m_enabled;
    QMutex m_mutex;
};
