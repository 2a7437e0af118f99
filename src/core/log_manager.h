#pragma once
#include <QFile>
#include <QMutex>
#include <QString>
#include <optional>

class LogManager {
public:
    static LogManager& instance();

    enum Level { Debug, Info, Warning, Error };

    // Appends to <logDir>/ollama-proxy.log; an empty dir keeps stderr only.
    void initialize(const QString& logDir);
    void setMinimumLevel(Level level) { m_minLevel = level; }
    Level minimumLevel() const { return m_minLevel; }
    void setConsoleEnabled(bool enabled) { m_console = enabled; }

    void log(Level level, const QString& category, const QString& message);
    void debug(const QString& msg)   { log(Debug, "proxy", msg); }
    void info(const QString& msg)    { log(Info, "proxy", msg); }
    void warning(const QString& msg) { log(Warning, "proxy", msg); }
    void error(const QString& msg)   { log(Error, "proxy", msg); }

    static QString formatMessage(Level level, const QString& category, const QString& message);
    static std::optional<Level> parseLevel(const QString& text);

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
