#ifndef RELAYCONSTANTS_H
#define RELAYCONSTANTS_H

#include <QSet>
#include <QString>
#include <QStringList>
namespace RelayConstants {

// ==================== Outbound types ====================
const QString TYPE_SELECTOR     = "selector";
const QString TYPE_URLTEST      = "urltest";
const QString TYPE_LOAD_BALANCE = "load-balance";
const QString TYPE_DIRECT       = "direct";
const QString TYPE_BLOCK        = "block";
const QString TYPE_DNS          = "dns";

inline const QSet<QString>& groupTypes() {
  static const QSet<QString> types = {TYPE_SELECTOR, TYPE_URLTEST, TYPE_LOAD_BALANCE};
  return types;
}
// Outbounds that can never be chained through another outbound.
inline const QSet<QString>& terminalTypes() {
  static const QSet<QString> types = {TYPE_DIRECT, TYPE_BLOCK, TYPE_DNS};
  return types;
}
// Protocols kept by the subscription decoder unless includeUnsupportedProxy is set.
inline const QSet<QString>& supportedProxyTypes() {
  static const QSet<QString> types = {"socks",     "http",      "shadowsocks", "vmess",     "vless", "trojan",
                                      "anytls",    "hysteria",  "hysteria2",   "tuic",      "wireguard",
                                      "ssh",       "shadowtls"};
  return types;
}

// ==================== Insertion rule grammar ====================
const QString RULE_SEPARATOR        = QString::fromUtf8("🕳");
const QString RULE_NAME_SEPARATOR   = QString::fromUtf8("🏷");
const QString RULE_CASE_INSENSITIVE = QString::fromUtf8("ℹ️");
const QString RULE_MATCH_ALL        = ".*";

// ==================== Hops ====================
const int     MAX_HOPS              = 3;
const QString HOP_TYPE_SUBSCRIPTION = "subscription";
const QString HOP_TYPE_COLLECTION   = "collection";
inline QString defaultHopLabel(int index) {
  switch (index) {
    case 0:
      return "hop1 (entry)";
    case 1:
      return "hop2 (relay)";
    case 2:
      return "hop3 (landing)";
    default:
      return QString("hop%1").arg(index + 1);
  }
}

// ==================== Relay chain defaults ====================
const QString GROUP_ENTRY   = QString::fromUtf8("♻️ 自动入口 🧠");
const QString GROUP_RELAY   = QString::fromUtf8("🚶 中续路径 🔐");
const QString GROUP_LANDING = QString::fromUtf8("🕳️ 落地节点 🔐 +");

// ==================== Misc defaults ====================
const QString DEFAULT_FALLBACK_TAG       = "COMPATIBLE";
const QString DUPLICATE_SUFFIX           = " #%1";
const int     DEFAULT_REQUEST_TIMEOUT_MS = 30000;
const QString DEFAULT_LOG_LEVEL          = "info";
const int     REPORT_PREVIEW_LIMIT       = 5;

}  // namespace RelayConstants
#endif  // RELAYCONSTANTS_H
