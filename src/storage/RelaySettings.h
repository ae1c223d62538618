#ifndef RELAYSETTINGS_H
#define RELAYSETTINGS_H

#include <QJsonObject>
#include <QList>
#include <QString>
#include "services/relay/ChainCycleBreaker.h"

/**
 * @brief One subscription batch inserted under its own rule set.
 */
struct HopSource {
  QString label;
  QString name;
  QString type;
  QString url;
  QString outbound;
  bool    includeUnsupportedProxy = false;

  // A hop needs something to fetch and a rule spec to insert with.
  bool isConfigured() const;
  bool isCollection() const;

  static QString normalizeType(const QString& type);
};

/**
 * @brief Settings of a relay merge run.
 *
 * Loaded from a JSON file. Keys missing from the file keep their defaults.
 * Hops come from a "hops" array or from the flat name1/outbound1/... keys.
 * "chains" is either an array of {from, to} objects or a {from: to} map;
 * without it the built-in entry -> relay -> landing chain is used.
 */
class RelaySettings {
 public:
  RelaySettings();

  QString          subscriptionDir() const { return m_subscriptionDir; }
  QList<HopSource> hops() const { return m_hops; }
  QList<ChainEdge> chains() const { return m_chains; }
  QString          fallbackTag() const { return m_fallbackTag; }
  bool             resetDetours() const { return m_resetDetours; }
  int              requestTimeoutMs() const { return m_requestTimeoutMs; }
  QString          logLevel() const { return m_logLevel; }
  QString          logDir() const { return m_logDir; }

  void setSubscriptionDir(const QString& dir);
  void setHops(const QList<HopSource>& hops);
  void setChains(const QList<ChainEdge>& chains);
  void setFallbackTag(const QString& tag);
  void setResetDetours(bool enabled);
  void setRequestTimeoutMs(int msecs);
  void setLogLevel(const QString& level);
  void setLogDir(const QString& dir);

  static QList<ChainEdge> defaultChains();

  bool        load(const QString& path, QString* error = nullptr);
  void        loadFromJson(const QJsonObject& obj);
  QJsonObject toJson() const;

 private:
  QString          m_subscriptionDir;
  QList<HopSource> m_hops;
  QList<ChainEdge> m_chains;
  QString          m_fallbackTag;
  bool             m_resetDetours;
  int              m_requestTimeoutMs;
  QString          m_logLevel;
  QString          m_logDir;
};
#endif  // RELAYSETTINGS_H
