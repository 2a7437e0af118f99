#include "log_manager.h"
#include <QDateTime>
#include <QDir>
#include <QMutexLocker>
#include <QTextStream>
#include <cstdio>

LogManager& LogManager::instance() {
    static LogManager s_instance;
    return s_instance;
}

LogManager::~LogManager() {
    if (m_logFile.isOpen()) {
        m_logFile.flush();
        m_logFile.close();
    }
}

void LogManager::initialize(const QString& logDir) {
    QMutexLocker locker(&m_mutex);
    if (m_logFile.isOpen())
        m_logFile.close();
    if (logDir.isEmpty())
        return;

    QDir().mkpath(logDir);
    QString logPath = logDir + "/ollama-proxy.log";
    m_logFile.setFileName(logPath);
    if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
        std::fprintf(stderr, "LogManager: failed to open log file: %s\n",
                     qPrintable(logPath));
        m_logFile.close();
    }
}

void LogManager::log(Level level, const QString& category, const QString& message) {
    if (level < Debug || level > Error) {
        level = Error;
    }
    if (level < m_minLevel) {
        return;
    }

    const QString formatted = formatMessage(level, category, message);

    QMutexLocker locker(&m_mutex);
    if (m_console) {
        std::fprintf(stderr, "%s\n", formatted.toUtf8().constData());
        std::fflush(stderr);
    }

    if (m_logFile.isOpen()) {
        QTextStream stream(&m_logFile);
        stream << formatted << "\n";
        stream.flush();
    }
}

QString LogManager::formatMessage(Level level, const QString& category, const QString& message) {
    QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
    static const char* levelNames[] = {"DEBUG", "INFO", "WARN", "ERROR"};
    return QString("[%1] [%2] [%3] %4")
        .arg(timestamp, levelNames[level], category, message);
}

std::optional<LogManager::Level> LogManager::parseLevel(const QString& text) {
    const QString t = text.trimmed().toLower();
    if (t == "debug")
        return Debug;
    if (t == "info")
        return Info;
    if (t == "warn" || t == "warning")
        return Warning;
    if (t == "error")
        return Error;
    return std::nullopt;
}
