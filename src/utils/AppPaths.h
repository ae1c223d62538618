#ifndef APPPATHS_H
#define APPPATHS_H
#include <QDir>
#include <QStandardPaths>
#include <QString>

inline QString appDataDir() {
  const QString path = QStandardPaths::writableLocation(QStandardPaths::AppDataLocation);
  if (path.isEmpty()) {
    return QDir(QDir::homePath()).filePath(".sing-box-relay");
  }
  return QDir(path).absolutePath();
}

inline QString defaultLogDir() {
  return QDir(appDataDir()).filePath("logs");
}
#endif  // APPPATHS_H
