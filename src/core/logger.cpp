#include "logger.h"
#include <QDateTime>
#include <QDir>
#include <QTextStream>
#include <iostream>

namespace edlkit {

Logger::~Logger()
{
    if (m_logFile.isOpen())
        m_logFile.close();
}

Logger& Logger::instance()
{
    static Logger inst;
    return inst;
}

bool Logger::initialize(const QString& logDir)
{
    {
        QMutexLocker lock(&m_mutex);

        if (m_logFile.isOpen())
            m_logFile.close();

        if (!QDir().mkpath(logDir)) {
            std::cerr << "Cannot create log directory " << logDir.toStdString() << std::endl;
            return false;
        }

        QString filename = QDateTime::currentDateTime().toString("yyyy-MM-dd_HH-mm-ss") + ".log";
        m_logFilePath = QDir(logDir).filePath(filename);
        m_logFile.setFileName(m_logFilePath);
        if (!m_logFile.open(QIODevice::WriteOnly | QIODevice::Append | QIODevice::Text)) {
            std::cerr << "Cannot open log file " << m_logFilePath.toStdString() << std::endl;
            m_logFilePath.clear();
            return false;
        }
    }

    info("Logger initialized: " + m_logFilePath);
    return true;
}

void Logger::setMinLevel(LogLevel level)
{
    m_minLevel = level;
}

void Logger::setListener(Listener listener)
{
    QMutexLocker lock(&m_mutex);
    m_listener = std::move(listener);
}

void Logger::debug(const QString& msg, const QString& category)
{
    log(LogLevel::Debug, msg, category);
}

void Logger::info(const QString& msg, const QString& category)
{
    log(LogLevel::Info, msg, category);
}

void Logger::warning(const QString& msg, const QString& category)
{
    log(LogLevel::Warning, msg, category);
}

void Logger::error(const QString& msg, const QString& category)
{
    log(LogLevel::Error, msg, category);
}

void Logger::fatal(const QString& msg, const QString& category)
{
    log(LogLevel::Fatal, msg, category);
}

void Logger::log(LogLevel level, const QString& msg, const QString& category)
{
    if (level < m_minLevel)
        return;

    QString timestamp = QDateTime::currentDateTime().toString("HH:mm:ss.zzz");
    QString catStr = category.isEmpty() ? QString() : ("[" + category + "] ");
    QString formatted = QString("[%1] [%2] %3%4").arg(timestamp, levelToString(level), catStr, msg);

    Listener listener;
    {
        QMutexLocker lock(&m_mutex);
        writeToFile(formatted);
        listener = m_listener;
    }

    if (m_consoleEnabled)
        std::cerr << formatted.toStdString() << std::endl;

    if (listener)
        listener(formatted, level);

    emit messageLogged(formatted, static_cast<int>(level));
}

void Logger::writeToFile(const QString& formatted)
{
    if (m_logFile.isOpen()) {
        QTextStream stream(&m_logFile);
        stream << formatted << "\n";
        stream.flush();
    }
}

QString Logger::levelToString(LogLevel level)
{
    switch (level) {
    case LogLevel::Debug:   return "DEBUG";
    case LogLevel::Info:    return "INFO";
    case LogLevel::Warning: return "WARN";
    case LogLevel::Error:   return "ERROR";
    case LogLevel::Fatal:   return "FATAL";
    }
    return "UNKNOWN";
}

LogLevel Logger::levelFromString(const QString& name, LogLevel fallback)
{
    const QString n = name.trimmed().toLower();
    if (n == "debug")                     return LogLevel::Debug;
    if (n == "info")                      return LogLevel::Info;
    if (n == "warn" || n == "warning")    return LogLevel::Warning;
    if (n == "error")                     return LogLevel::Error;
    if (n == "fatal")                     return LogLevel::Fatal;
    return fallback;
}

} // namespace edlkit
