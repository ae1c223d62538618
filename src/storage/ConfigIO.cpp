#include "storage/ConfigIO.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QSaveFile>
#include "utils/Logger.h"
namespace ConfigIO {
QJsonObject parseConfig(const QByteArray& content, QString* error) {
  QJsonParseError parseError;
  QJsonDocument   doc = QJsonDocument::fromJson(content, &parseError);
  if (parseError.error != QJsonParseError::NoError) {
    if (error) *error = QString("JSON parse error at offset %1: %2").arg(parseError.offset).arg(parseError.errorString());
    return QJsonObject();
  }
  if (!doc.isObject()) {
    if (error) *error = "Config root is not a JSON object";
    return QJsonObject();
  }
  const QJsonObject config = doc.object();
  if (config.contains("outbounds") && !config.value("outbounds").isArray()) {
    if (error) *error = "Config \"outbounds\" is not an array";
    return QJsonObject();
  }
  return config;
}
QJsonObject loadConfig(const QString& path, QString* error) {
  QFile file(path);
  if (!file.open(QIODevice::ReadOnly)) {
    Logger::warn(QString("Failed to open config file: %1").arg(path));
    if (error) *error = QString("Failed to open config file: %1").arg(path);
    return QJsonObject();
  }
  const QByteArray content = file.readAll();
  file.close();
  return parseConfig(content, error);
}
bool saveJson(const QString& path, const QJsonObject& obj, QString* error) {
  const QDir dir = QFileInfo(path).absoluteDir();
  if (!dir.exists()) {
    dir.mkpath(".");
  }
  QSaveFile file(path);
  if (!file.open(QIODevice::WriteOnly)) {
    Logger::error(QString("Failed to write file: %1").arg(path));
    if (error) *error = QString("Failed to write file: %1").arg(path);
    return false;
  }
  file.write(QJsonDocument(obj).toJson(QJsonDocument::Indented));
  if (!file.commit()) {
    Logger::error(QString("Failed to commit file: %1").arg(path));
    if (error) *error = QString("Failed to commit file: %1").arg(path);
    return false;
  }
  return true;
}
bool saveConfig(const QString& path, const QJsonObject& config, QString* error) {
  if (!saveJson(path, config, error)) {
    return false;
  }
  Logger::info(QString("Config saved: %1").arg(path));
  return true;
}
}  // namespace ConfigIO
