#include "storage/RelaySettings.h"
#include <QFile>
#include <QJsonArray>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>
#include "storage/RelayConstants.h"
#include "utils/Logger.h"

namespace {
HopSource hopFromJson(const QJsonObject& obj, int index) {
  HopSource hop;
  hop.label                   = obj.value("label").toString(RelayConstants::defaultHopLabel(index));
  hop.name                    = obj.value("name").toString().trimmed();
  hop.type                    = HopSource::normalizeType(obj.value("type").toString());
  hop.url                     = obj.value("url").toString().trimmed();
  hop.outbound                = obj.value("outbound").toString();
  hop.includeUnsupportedProxy = obj.value("includeUnsupportedProxy").toBool(false);
  return hop;
}

QList<HopSource> hopsFromFlatKeys(const QJsonObject& obj) {
  QList<HopSource> hops;
  for (int i = 0; i < RelayConstants::MAX_HOPS; ++i) {
    const QString suffix = QString::number(i + 1);
    QJsonObject   hopObj;
    hopObj["name"]                    = obj.value("name" + suffix);
    hopObj["type"]                    = obj.value("type" + suffix);
    hopObj["url"]                     = obj.value("url" + suffix);
    hopObj["outbound"]                = obj.value("outbound" + suffix);
    hopObj["includeUnsupportedProxy"] = obj.value("includeUnsupportedProxy" + suffix);
    hops.append(hopFromJson(hopObj, i));
  }
  return hops;
}

QList<ChainEdge> chainsFromJson(const QJsonValue& value) {
  QList<ChainEdge> chains;
  if (value.isArray()) {
    for (const auto& item : value.toArray()) {
      if (!item.isObject()) continue;
      const QJsonObject edge = item.toObject();
      chains.append(ChainEdge{edge.value("from").toString(), edge.value("to").toString()});
    }
  } else if (value.isObject()) {
    const QJsonObject map = value.toObject();
    for (auto it = map.begin(); it != map.end(); ++it) {
      chains.append(ChainEdge{it.key(), it.value().toString()});
    }
  }
  return chains;
}
}  // namespace

bool HopSource::isConfigured() const {
  return (!name.isEmpty() || !url.isEmpty()) && !outbound.trimmed().isEmpty();
}

bool HopSource::isCollection() const {
  return type == RelayConstants::HOP_TYPE_COLLECTION;
}

QString HopSource::normalizeType(const QString& type) {
  static const QRegularExpression collectionRe(QString::fromUtf8("^1$|col|组合"),
                                               QRegularExpression::CaseInsensitiveOption);
  return collectionRe.match(type.trimmed()).hasMatch() ? RelayConstants::HOP_TYPE_COLLECTION
                                                       : RelayConstants::HOP_TYPE_SUBSCRIPTION;
}

RelaySettings::RelaySettings()
    : m_chains(defaultChains()),
      m_fallbackTag(RelayConstants::DEFAULT_FALLBACK_TAG),
      m_resetDetours(true),
      m_requestTimeoutMs(RelayConstants::DEFAULT_REQUEST_TIMEOUT_MS),
      m_logLevel(RelayConstants::DEFAULT_LOG_LEVEL) {}

QList<ChainEdge> RelaySettings::defaultChains() {
  return {ChainEdge{RelayConstants::GROUP_ENTRY, RelayConstants::GROUP_RELAY},
          ChainEdge{RelayConstants::GROUP_RELAY, RelayConstants::GROUP_LANDING}};
}

void RelaySettings::setSubscriptionDir(const QString& dir) {
  m_subscriptionDir = dir;
}

void RelaySettings::setHops(const QList<HopSource>& hops) {
  m_hops = hops;
  if (m_hops.size() > RelayConstants::MAX_HOPS) {
    Logger::warn(QString("Only %1 hops are supported, %2 ignored")
                     .arg(RelayConstants::MAX_HOPS)
                     .arg(m_hops.size() - RelayConstants::MAX_HOPS));
    m_hops = m_hops.mid(0, RelayConstants::MAX_HOPS);
  }
}

void RelaySettings::setChains(const QList<ChainEdge>& chains) {
  m_chains = chains;
}

void RelaySettings::setFallbackTag(const QString& tag) {
  m_fallbackTag = tag.trimmed().isEmpty() ? RelayConstants::DEFAULT_FALLBACK_TAG : tag.trimmed();
}

void RelaySettings::setResetDetours(bool enabled) {
  m_resetDetours = enabled;
}

void RelaySettings::setRequestTimeoutMs(int msecs) {
  m_requestTimeoutMs = msecs > 0 ? msecs : RelayConstants::DEFAULT_REQUEST_TIMEOUT_MS;
}

void RelaySettings::setLogLevel(const QString& level) {
  m_logLevel = level.trimmed().toLower();
}

void RelaySettings::setLogDir(const QString& dir) {
  m_logDir = dir;
}

bool RelaySettings::load(const QString& path, QString* error) {
  QFile file(path);
  if (!file.open(QIODevice::ReadOnly)) {
    if (error) *error = QString("Failed to open settings file: %1").arg(path);
    return false;
  }
  QJsonParseError parseError;
  const QJsonDocument doc = QJsonDocument::fromJson(file.readAll(), &parseError);
  file.close();
  if (parseError.error != QJsonParseError::NoError || !doc.isObject()) {
    if (error) {
      *error = QString("Invalid settings file %1: %2").arg(path, parseError.errorString());
    }
    return false;
  }
  loadFromJson(doc.object());
  Logger::info(QString("Relay settings loaded: %1").arg(path));
  return true;
}

void RelaySettings::loadFromJson(const QJsonObject& obj) {
  setSubscriptionDir(obj.value("subscriptionDir").toString(m_subscriptionDir));
  if (obj.value("hops").isArray()) {
    QList<HopSource> hops;
    const QJsonArray arr = obj.value("hops").toArray();
    for (int i = 0; i < arr.size(); ++i) {
      if (!arr[i].isObject()) continue;
      hops.append(hopFromJson(arr[i].toObject(), i));
    }
    setHops(hops);
  } else if (obj.contains("name1") || obj.contains("outbound1")) {
    setHops(hopsFromFlatKeys(obj));
  }
  if (obj.contains("chains")) {
    setChains(chainsFromJson(obj.value("chains")));
  }
  setFallbackTag(obj.value("fallbackTag").toString(m_fallbackTag));
  setResetDetours(obj.value("resetDetours").toBool(m_resetDetours));
  setRequestTimeoutMs(obj.value("requestTimeoutMs").toInt(m_requestTimeoutMs));
  setLogLevel(obj.value("logLevel").toString(m_logLevel));
  setLogDir(obj.value("logDir").toString(m_logDir));
}

QJsonObject RelaySettings::toJson() const {
  QJsonObject obj;
  obj["subscriptionDir"] = m_subscriptionDir;
  QJsonArray hops;
  for (const auto& hop : m_hops) {
    QJsonObject hopObj;
    hopObj["label"]                   = hop.label;
    hopObj["name"]                    = hop.name;
    hopObj["type"]                    = hop.type;
    hopObj["url"]                     = hop.url;
    hopObj["outbound"]                = hop.outbound;
    hopObj["includeUnsupportedProxy"] = hop.includeUnsupportedProxy;
    hops.append(hopObj);
  }
  obj["hops"] = hops;
  QJsonArray chains;
  for (const auto& edge : m_chains) {
    QJsonObject edgeObj;
    edgeObj["from"] = edge.source;
    edgeObj["to"]   = edge.target;
    chains.append(edgeObj);
  }
  obj["chains"]           = chains;
  obj["fallbackTag"]      = m_fallbackTag;
  obj["resetDetours"]     = m_resetDetours;
  obj["requestTimeoutMs"] = m_requestTimeoutMs;
  obj["logLevel"]         = m_logLevel;
  obj["logDir"]           = m_logDir;
  return obj;
}
