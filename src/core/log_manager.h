#pragma once
#include <QFile>
#include <QMutex>
#include <QString>

class LogManager {
public:
    enum Level { Debug, Info, Warning, Error };

    static LogManager& instance();

    void initialize(const QString& logDir, Level minLevel = Info, bool console = true);
    void setMinLevel(Level level) { m_minLevel = level; }
    Level minLevel() const { return m_minLevel; }

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& msg)   { log(Debug, "app", msg); }
    void info(const QString& msg)    { log(Info, "app", msg); }
    void warning(const QString& msg) { log(Warning, "app", msg); }
    void error(const QString& msg)   { log(Error, "app", msg); }

    static QString formatMessage(Level level, const QString& category, const QString& message);
    static Level levelFromString(const QString& name, Level fallback = Info);

private:
    LogManager() = default;
    ~LogManager();
    LogManager(const LogManager&) = delete;
    LogManager& operator=(const LogManager&) = delete;

    QFile m_logFile;
    QMutex m_mutex;
    Level m_minLevel = Info;
    bool m_console = true;
};

#define LOG_DEBUG(msg) LogManager::instance().debug(msg)
#define LOG_INFO(msg) LogManager::instance().info(msg)
#define LOG_WARNING(msg) LogManager::instance().warning(msg)
#define LOG_ERROR(msg) LogManager::instance().error(msg)
