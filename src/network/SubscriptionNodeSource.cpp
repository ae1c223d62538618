#include "network/SubscriptionNodeSource.h"
#include <QDir>
#include <QFile>
#include <QFileInfo>
#include <QJsonObject>
#include <QUrl>
#include "network/HttpClient.h"
#include "services/subscription/SubscriptionParser.h"
#include "utils/Logger.h"
#include "utils/tag/TagSanitizer.h"

namespace {
const QStringList kSubscriptionSuffixes = {"json", "yaml", "yml", "txt", "conf"};
}  // namespace

SubscriptionNodeSource::SubscriptionNodeSource(const QString& subscriptionDir, int timeoutMs)
    : m_subscriptionDir(subscriptionDir), m_httpClient(std::make_unique<HttpClient>()) {
  m_httpClient->setTimeout(timeoutMs);
}

SubscriptionNodeSource::~SubscriptionNodeSource() = default;

bool SubscriptionNodeSource::readUrl(const QString& url, QByteArray* content, QString* error) {
  const QUrl    parsed(url);
  const QString scheme = parsed.scheme().toLower();
  if (scheme == "http" || scheme == "https") {
    Logger::info(QString("  Fetch subscription from URL: %1").arg(url));
    return m_httpClient->getBlocking(url, content, error);
  }
  if (scheme == "file") {
    return readLocalFile(parsed.toLocalFile(), content, error);
  }
  return readLocalFile(url, content, error);
}

bool SubscriptionNodeSource::readLocalFile(const QString& path, QByteArray* content, QString* error) const {
  QFile file(path);
  if (!file.open(QIODevice::ReadOnly)) {
    if (error) *error = QString("Failed to open subscription file: %1").arg(path);
    return false;
  }
  *content = file.readAll();
  file.close();
  return true;
}

bool SubscriptionNodeSource::readNamedSubscription(const HopSource&   hop,
                                                   QList<QByteArray>* contents,
                                                   QString*           error) const {
  if (m_subscriptionDir.isEmpty()) {
    if (error) *error = QString("No subscription directory configured for %1").arg(hop.name);
    return false;
  }
  const QDir baseDir(m_subscriptionDir);
  if (hop.isCollection()) {
    const QDir collectionDir(baseDir.filePath(hop.name));
    if (!collectionDir.exists()) {
      if (error) *error = QString("Collection not found: %1").arg(collectionDir.path());
      return false;
    }
    Logger::info(QString("  Read collection: %1").arg(hop.name));
    const QFileInfoList files = collectionDir.entryInfoList(QDir::Files, QDir::Name);
    for (const auto& info : files) {
      QByteArray content;
      if (!readLocalFile(info.absoluteFilePath(), &content, error)) {
        return false;
      }
      contents->append(content);
    }
    return true;
  }
  Logger::info(QString("  Read subscription: %1").arg(hop.name));
  for (const auto& suffix : kSubscriptionSuffixes) {
    const QString path = baseDir.filePath(hop.name + "." + suffix);
    if (QFileInfo::exists(path)) {
      QByteArray content;
      if (!readLocalFile(path, &content, error)) {
        return false;
      }
      contents->append(content);
      return true;
    }
  }
  if (error) *error = QString("Subscription not found: %1").arg(baseDir.filePath(hop.name));
  return false;
}

QJsonArray SubscriptionNodeSource::fetch(const HopSource& hop, QString* error) {
  QList<QByteArray> contents;
  if (!hop.url.isEmpty()) {
    QByteArray content;
    if (!readUrl(hop.url, &content, error)) {
      return QJsonArray();
    }
    contents.append(content);
  } else if (!readNamedSubscription(hop, &contents, error)) {
    return QJsonArray();
  }
  QJsonArray nodes;
  for (const auto& content : contents) {
    const QJsonArray parsed = SubscriptionParser::filterSupportedNodes(
        SubscriptionParser::extractNodesWithFallback(content), hop.includeUnsupportedProxy);
    for (const auto& val : parsed) {
      QJsonObject node = val.toObject();
      node["tag"]      = TagSanitizer::sanitize(node.value("tag").toString());
      nodes.append(node);
    }
  }
  return nodes;
}
