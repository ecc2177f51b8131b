#pragma once
#include <QObject>
#include <QFile>
#include <QMutex>

class LogManager : public QObject {
    Q_OBJECT

public:
    static LogManager& instance();

    enum Level { Debug, Info, Warning, Error };
    Q_ENUM(Level)

    // Opens <logDir>/claudebridge.log for append. Console output works without it.
    void initialize(const QString& logDir);
    void setMinimumLevel(Level level) { m_minLevel = level; }
    Level minimumLevel() const { return m_minLevel; }
    void setConsoleEnabled(bool enabled) { m_console = enabled; }

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& msg)   { log(Debug, "app", msg); }
    void info(const QString& msg)    { log(Info, "app", msg); }
    void warning(const QString& msg) { log(Warning, "app", msg); }
    void error(const QString& msg)   { log(Error, "app", msg); }

    // Accepts DEBUG/INFO/WARNING/WARN/ERROR/CRITICAL in any case; unknown names give Info.
    static Level parseLevel(const QString& name, bool* ok = nullptr);
    static QString formatMessage(Level level, const QString& category, const QString& message);

signals:
    void logEntry(int level, const QString& timestamp,
                  const QString& category, const QString& message);

private:
    ~LogManager() override;
    LogManager() = default;
    QFile m_logFile;
    QMutex m_mutex;
    Level m_minLevel = Info;
    bool m_console = true;
};

#define LOG_DEBUG(msg) LogManager::instance().debug(msg)
#define LOG_INFO(msg) LogManager::instance().info(msg)
#define LOG_WARNING(msg) LogManager::instance().warning(msg)
#define LOG_ERROR(msg) LogManager::instance().error(msg)
