#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QMetaEnum>
#include <QMutexLocker>
#include <QTextStream>
#include <QDebug>
#include <cstdio>

namespace {
const char* levelName(LogManager::Level level)
{
    static const char* names[] = {"DEBUG", "INFO", "WARN", "ERROR"};
    return names[level];
}

QString timestampNow()
{
    return QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
}
}

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void LogManager::initialize(const QString& logDir) {
    QMutexLocker lock(&m_mutex);
    if (m_logFile.isOpen())
        m_logFile.close();
    QDir().mkpath(logDir);
    QString logPath = logDir + "/claudebridge.log";
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "LogManager: failed to open log file:" << logPath;
        m_logFile.close();
    }
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }
    if (level < m_minLevel)
        return;

    QString timestamp = timestampNow();
    QString formatted = QString("[%1] [%2] [%3] %4")
        .arg(timestamp, levelName(level), category, message);

    {
        QMutexLocker lock(&m_mutex);
        if (m_logFile.isOpen()) {
            QTextStream stream(&m_logFile);
            stream << formatted << "\n";
            stream.flush();
        }
        if (m_console) {
            const QByteArray line = formatted.toUtf8() + '\n';
            std::fputs(line.constData(), stderr);
        }
    }

    emit logEntry(static_cast<int>(level), timestamp, category, message);
}

LogManager::Level LogManager::parseLevel(const QString& name, bool* ok) {
    QString key = name.trimmed().toLower();
    if (key == "warn")
        key = "warning";
    else if (key == "critical")
        key = "error";
    if (!key.isEmpty())
        key[0] = key[0].toUpper();

    bool found = false;
    const QMetaEnum meta = QMetaEnum::fromType<Level>();
    const int value = meta.keyToValue(key.toLatin1().constData(), &found);
    if (ok)
        *ok = found;
    return found ? static_cast<Level>(value) : Info;
}

QString LogManager::formatMessage(Level level, const QString& category, const QString& message) {
    return QString("[%1] [%2] [%3] %4")
        .arg(timestampNow(), levelName(level), category, message);
}
