#pragma once

#include <QObject>
#include <QString>
#include <QFile>
#include <QMutex>
#include <functional>

namespace edlkit {

enum class LogLevel {
    Debug = 0,
    Info,
    Warning,
    Error,
    Fatal
};

class Logger : public QObject {
    Q_OBJECT

public:
    using Listener = std::function<void(const QString& formatted, LogLevel level)>;

    static Logger& instance();

    // Opens a per-run log file under logDir. Console logging works without it.
    bool initialize(const QString& logDir);
    void setMinLevel(LogLevel level);
    LogLevel minLevel() const { return m_minLevel; }
    void setConsoleEnabled(bool enabled) { m_consoleEnabled = enabled; }
    void setListener(Listener listener);

    void debug(const QString& msg, const QString& category = QString());
    void info(const QString& msg, const QString& category = QString());
    void warning(const QString& msg, const QString& category = QString());
    void error(const QString& msg, const QString& category = QString());
    void fatal(const QString& msg, const QString& category = QString());

    void log(LogLevel level, const QString& msg, const QString& category = QString());

    QString logFilePath() const { return m_logFilePath; }

    static QString levelToString(LogLevel level);
    static LogLevel levelFromString(const QString& name, LogLevel fallback = LogLevel::Info);

signals:
    void messageLogged(const QString& message, int level);

private:
    Logger() = default;
    ~Logger() override;
    Logger(const Logger&) = delete;
    Logger& operator=(const Logger&) = delete;

    void writeToFile(const QString& formatted);

    QFile m_logFile;
    QString m_logFilePath;
    LogLevel m_minLevel = LogLevel::Info;
    bool m_consoleEnabled = true;
    QMutex m_mutex;
    Listener m_listener;
};

#define LOG_DEBUG(msg)   edlkit::Logger::instance().debug(msg)
#define LOG_INFO(msg)    edlkit::Logger::instance().info(msg)
#define LOG_WARNING(msg) edlkit::Logger::instance().warning(msg)
#define LOG_ERROR(msg)   edlkit::Logger::instance().error(msg)
#define LOG_FATAL(msg)   edlkit::Logger::instance().fatal(msg)

#define LOG_DEBUG_CAT(cat, msg)   edlkit::Logger::instance().debug(msg, cat)
#define LOG_INFO_CAT(cat, msg)    edlkit::Logger::instance().info(msg, cat)
#define LOG_WARNING_CAT(cat, msg) edlkit::Logger::instance().warning(msg, cat)
#define LOG_ERROR_CAT(cat, msg)   edlkit::Logger::instance().error(msg, cat)

} // namespace edlkit
