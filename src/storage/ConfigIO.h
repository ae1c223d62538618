#ifndef CONFIGIO_H
#define CONFIGIO_H
#include <QJsonObject>
#include <QString>
namespace ConfigIO {
// Empty object on failure; error receives the reason.
QJsonObject loadConfig(const QString& path, QString* error = nullptr);
QJsonObject parseConfig(const QByteArray& content, QString* error = nullptr);
bool        saveConfig(const QString& path, const QJsonObject& config, QString* error = nullptr);
bool        saveJson(const QString& path, const QJsonObject& obj, QString* error = nullptr);
}  // namespace ConfigIO
#endif  // CONFIGIO_H
