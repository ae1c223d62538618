#ifndef LOGGER_H
#define LOGGER_H
#include <QFile>
#include <QMutex>
#include <QString>
class Logger {
 public:
  enum class Level { Debug = 0, Info, Warn, Error };

  static Logger& instance();
  // Opens <logDir>/<date>.log for appending; console output works without it.
  void           init(const QString& logDir = QString());
  void           close();
  void           setLevel(Level level);
  Level          level() const;
  static Level   parseLevel(const QString& name, Level fallback = Level::Info);
  static void    debug(const QString& message);
  static void    info(const QString& message);
  static void    warn(const QString& message);
  static void    error(const QString& message);

 private:
  Logger();
  ~Logger();
  void    log(Level level, const QString& message);
  QString getLogFilePath(const QString& logDir) const;
  QFile   m_logFile;
  QMutex  m_mutex;
  bool    m_initialized;
  Level   m_level;
};
#endif  // LOGGER_H
