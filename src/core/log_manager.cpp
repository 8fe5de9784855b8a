#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QMutexLocker>
#include <QTextStream>
#include <QDebug>
#include <cstdio>

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager()
{
    QMutexLocker locker(&m_mutex);
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void LogManager::initialize(const QString& logDir) {
    QMutexLocker locker(&m_mutex);
    if (m_logFile.isOpen())
        m_logFile.close();

    QDir().mkpath(logDir);
    QString logPath = logDir + "/switchboard.log";
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        qWarning() << "LogManager: failed to open log file:" << logPath;
        m_logFile.close();
    }
}

void LogManager::setMinimumLevel(Level level) {
    QMutexLocker locker(&m_mutex);
    m_minLevel = level;
}

void LogManager::setConsoleEcho(bool enabled) {
    QMutexLocker locker(&m_mutex);
    m_consoleEcho = enabled;
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }

    const QString formatted = formatMessage(level, category, message);

    QMutexLocker locker(&m_mutex);
    if (level < m_minLevel)
        return;

    // file output
    if (m_logFile.isOpen()) {
        QTextStream stream(&m_logFile);
        stream << formatted << "\n";
        stream.flush();
    }

    if (m_consoleEcho) {
        const QByteArray line = formatted.toUtf8();
        std::fprintf(stderr, "%s\n", line.constData());
    }
}

QString LogManager::formatMessage(Level level, const QString& category, const QString& message) {
    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
    static const char* levelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};
    return QString("[%1] [%2] [%3] %4")
        .arg(timestamp, levelNames[level], category, message);
}
