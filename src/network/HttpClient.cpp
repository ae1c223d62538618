#include "HttpClient.h"
#include <QEventLoop>
#include <QTimer>
#include "utils/Logger.h"

HttpClient::HttpClient(QObject* parent)
    : QObject(parent),
      m_manager(new QNetworkAccessManager(this)),
      m_userAgent("sing-box-relay"),
      m_timeout(30000) {}

HttpClient::~HttpClient() {}

void HttpClient::setTimeout(int msecs) {
  m_timeout = msecs;
}

QNetworkRequest HttpClient::createRequest(const QString& url) {
  QNetworkRequest request{QUrl(url)};
  request.setTransferTimeout(m_timeout);
  request.setRawHeader("User-Agent", m_userAgent.toUtf8());
  request.setAttribute(QNetworkRequest::RedirectPolicyAttribute, QNetworkRequest::NoLessSafeRedirectPolicy);
  return request;
}

bool HttpClient::getBlocking(const QString& url, QByteArray* data, QString* error) {
  QNetworkRequest request = createRequest(url);
  QNetworkReply*  reply   = m_manager->get(request);
  QEventLoop      loop;
  QTimer          timeout;
  timeout.setSingleShot(true);
  QObject::connect(&timeout, &QTimer::timeout, &loop, &QEventLoop::quit);
  QObject::connect(reply, &QNetworkReply::finished, &loop, &QEventLoop::quit);
  timeout.start(m_timeout + 2000);
  loop.exec();
  if (!reply->isFinished()) {
    reply->abort();
    reply->deleteLater();
    if (error) *error = QString("Request timed out: %1").arg(url);
    return false;
  }
  if (reply->error() != QNetworkReply::NoError) {
    Logger::warn(QString("HTTP request failed: %1").arg(reply->errorString()));
    if (error) *error = QString("HTTP request failed: %1").arg(reply->errorString());
    reply->deleteLater();
    return false;
  }
  if (data) {
    *data = reply->readAll();
  }
  reply->deleteLater();
  return true;
}
