#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QMutexLocker>
#include <QTextStream>
#include <QDebug>

namespace {

const char* const kLevelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};

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

void LogManager::initialize(const QString& logDir, Level minLevel, bool console) {
    QMutexLocker locker(&m_mutex);
    m_minLevel = minLevel;
    m_console = console;

    if (m_logFile.isOpen())
        m_logFile.close();

    QDir().mkpath(logDir);
    QString logPath = logDir + "/scenecast.log";
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

    const QString formatted = formatMessage(level, category, message);

    QMutexLocker locker(&m_mutex);
    if (m_logFile.isOpen()) {
        QTextStream stream(&m_logFile);
        stream << formatted << "\n";
        stream.flush();
    }

    if (m_console) {
        QTextStream err(stderr);
        err << formatted << "\n";
        err.flush();
    }
}

QString LogManager::formatMessage(Level level, const QString& category, const QString& message) {
    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
    return QString("[%1] [%2] [%3] %4")
        .arg(timestamp, kLevelNames[level], category, message);
}

LogManager::Level LogManager::levelFromString(const QString& name, Level fallback) {
    const QString n = name.trimmed().toLower();
    if (n == "debug")
        return Debug;
    if (n == "info")
        return Info;
    if (n == "warn" || n == "warning")
        return Warning;
    if (n == "error")
        return Error;
    return fallback;
}
