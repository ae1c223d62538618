#include "Logger.h"
#include <QDateTime>
#include <QDebug>
#include <QDir>
#include <QFileInfo>
#include <QTextStream>
#include "utils/AppPaths.h"

namespace {
QString levelName(Logger::Level level) {
  switch (level) {
    case Logger::Level::Debug:
      return "DEBUG";
    case Logger::Level::Info:
      return "INFO";
    case Logger::Level::Warn:
      return "WARN";
    case Logger::Level::Error:
      return "ERROR";
  }
  return "INFO";
}
}  // namespace

Logger& Logger::instance() {
  static Logger instance;
  return instance;
}

Logger::Logger() : m_initialized(false), m_level(Level::Info) {}

Logger::~Logger() {
  close();
}

void Logger::init(const QString& logDir) {
  if (m_initialized) {
    return;
  }
  QString logPath = getLogFilePath(logDir.trimmed().isEmpty() ? defaultLogDir() : logDir);
  // Ensure log directory exists.
  QDir dir(QFileInfo(logPath).absolutePath());
  if (!dir.exists()) {
    dir.mkpath(".");
  }
  m_logFile.setFileName(logPath);
  if (m_logFile.open(QIODevice::Append | QIODevice::Text)) {
    m_initialized = true;
    info(QString("Logger initialized: %1").arg(logPath));
  } else {
    warn(QString("Failed to open log file: %1").arg(logPath));
  }
}

void Logger::close() {
  QMutexLocker locker(&m_mutex);
  if (m_logFile.isOpen()) {
    m_logFile.close();
  }
  m_initialized = false;
}

void Logger::setLevel(Level level) {
  m_level = level;
}

Logger::Level Logger::level() const {
  return m_level;
}

Logger::Level Logger::parseLevel(const QString& name, Level fallback) {
  const QString normalized = name.trimmed().toLower();
  if (normalized == "debug") return Level::Debug;
  if (normalized == "info") return Level::Info;
  if (normalized == "warn" || normalized == "warning") return Level::Warn;
  if (normalized == "error") return Level::Error;
  return fallback;
}

QString Logger::getLogFilePath(const QString& logDir) const {
  QString date = QDate::currentDate().toString("yyyy-MM-dd");
  return QDir(logDir).filePath(date + ".log");
}

void Logger::log(Level level, const QString& message) {
  if (static_cast<int>(level) < static_cast<int>(m_level)) {
    return;
  }
  QString timestamp = QDateTime::currentDateTime().toString("yyyy-MM-dd hh:mm:ss.zzz");
  QString logLine   = QString("[%1] [%2] %3").arg(timestamp, levelName(level), message);
  // Output to console.
  qDebug().noquote() << logLine;
  // Output to file.
  QMutexLocker locker(&m_mutex);
  if (m_initialized) {
    QTextStream stream(&m_logFile);
    stream << logLine << "\n";
    stream.flush();
  }
}

void Logger::debug(const QString& message) {
  instance().log(Level::Debug, message);
}

void Logger::info(const QString& message) {
  instance().log(Level::Info, message);
}

void Logger::warn(const QString& message) {
  instance().log(Level::Warn, message);
}

void Logger::error(const QString& message) {
  instance().log(Level::Error, message);
}
