#ifndef HTTPCLIENT_H
#define HTTPCLIENT_H

#include <QNetworkAccessManager>
#include <QNetworkReply>
#include <QObject>
class HttpClient : public QObject {
  Q_OBJECT

 public:
  explicit HttpClient(QObject* parent = nullptr);
  ~HttpClient();

  void setTimeout(int msecs);

  // Runs a local event loop until the reply finishes or the timeout hits.
  bool getBlocking(const QString& url, QByteArray* data, QString* error = nullptr);

 private:
  QNetworkRequest createRequest(const QString& url);

  QNetworkAccessManager* m_manager;
  QString                m_userAgent;
  int                    m_timeout;
};
#endif  // HTTPCLIENT_H
