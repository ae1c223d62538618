#ifndef SUBSCRIPTIONNODESOURCE_H
#define SUBSCRIPTIONNODESOURCE_H

#include <QByteArray>
#include <QString>
#include <memory>
#include "app/interfaces/NodeSource.h"

class HttpClient;

/**
 * @brief Default hop fetcher.
 *
 * http(s) URLs are downloaded, file:// URLs and plain paths are read from
 * disk, and a hop without URL is looked up by name in the subscription
 * directory (a collection is a directory whose files are merged in name
 * order). Node tags are sanitized before they are handed out.
 */
class SubscriptionNodeSource : public NodeSource {
 public:
  SubscriptionNodeSource(const QString& subscriptionDir, int timeoutMs);
  ~SubscriptionNodeSource() override;

  QJsonArray fetch(const HopSource& hop, QString* error = nullptr) override;

 private:
  bool readUrl(const QString& url, QByteArray* content, QString* error);
  bool readLocalFile(const QString& path, QByteArray* content, QString* error) const;
  bool readNamedSubscription(const HopSource& hop, QList<QByteArray>* contents, QString* error) const;

  QString                     m_subscriptionDir;
  std::unique_ptr<HttpClient> m_httpClient;
};
#endif  // SUBSCRIPTIONNODESOURCE_H
