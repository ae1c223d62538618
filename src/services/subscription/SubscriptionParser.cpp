#include "services/subscription/SubscriptionParser.h"
#include "storage/RelayConstants.h"
#include "utils/Logger.h"
#include <QHash>
#include <QJsonDocument>
#include <QJsonParseError>
#include <QRegularExpression>
#include <QStringList>
#include <QUrl>
#include <QUrlQuery>
#include <yaml-cpp/yaml.h>

namespace {
bool isLeafOutbound(const QJsonObject &ob)
{
    const QString type = ob.value("type").toString().trimmed().toLower();
    if (type.isEmpty() || ob.value("tag").toString().trimmed().isEmpty()) {
        return false;
    }
    if (RelayConstants::groupTypes().contains(type) || RelayConstants::terminalTypes().contains(type)) {
        return false;
    }
    return true;
}

QJsonArray parseJsonContentToNodes(const QByteArray &content)
{
    QJsonArray result;
    QJsonParseError err;
    QJsonDocument doc = QJsonDocument::fromJson(content, &err);
    if (err.error != QJsonParseError::NoError) {
        return result;
    }

    if (doc.isObject()) {
        const QJsonObject obj = doc.object();
        if (obj.contains("outbounds") || obj.contains("endpoints")) {
            return SubscriptionParser::parseSingBoxConfig(content);
        }
        if (isLeafOutbound(obj)) {
            result.append(obj);
        }
        return result;
    }

    if (doc.isArray()) {
        for (const auto &item : doc.array()) {
            if (!item.isObject()) continue;
            const QJsonObject ob = item.toObject();
            if (isLeafOutbound(ob)) {
                result.append(ob);
            }
        }
    }
    return result;
}

QString yamlText(const YAML::Node &node)
{
    if (!node || !node.IsScalar()) {
        return QString();
    }
    return QString::fromStdString(node.Scalar()).trimmed();
}

int yamlPort(const YAML::Node &node)
{
    bool ok = false;
    const int port = yamlText(node).toInt(&ok);
    return ok && port > 0 && port <= 65535 ? port : 0;
}

bool yamlFlag(const YAML::Node &node)
{
    const QString text = yamlText(node).toLower();
    return text == "true" || text == "1" || text == "yes";
}

// Clash spells a few protocols differently from sing-box.
QString singBoxType(const QString &clashType)
{
    static const QHash<QString, QString> aliases = {
        {"ss", "shadowsocks"},
        {"socks5", "socks"},
        {"hy2", "hysteria2"},
    };
    return aliases.value(clashType, clashType);
}

void putIfSet(QJsonObject &obj, const QString &key, const QString &value)
{
    if (!value.isEmpty()) {
        obj[key] = value;
    }
}

void applyCredentials(QJsonObject &node, const QString &type, const YAML::Node &proxy)
{
    if (type == "vmess") {
        node["uuid"] = yamlText(proxy["uuid"]);
        node["alter_id"] = yamlText(proxy["alterId"]).toInt();
        const QString security = yamlText(proxy["cipher"]);
        node["security"] = security.isEmpty() ? QString("auto") : security;
    } else if (type == "vless") {
        node["uuid"] = yamlText(proxy["uuid"]);
        putIfSet(node, "flow", yamlText(proxy["flow"]));
    } else if (type == "shadowsocks") {
        node["method"] = yamlText(proxy["cipher"]);
        node["password"] = yamlText(proxy["password"]);
    } else if (type == "trojan" || type == "hysteria2" || type == "anytls") {
        node["password"] = yamlText(proxy["password"]);
    } else if (type == "socks" || type == "http") {
        const QString username = yamlText(proxy["username"]);
        if (!username.isEmpty()) {
            node["username"] = username;
            node["password"] = yamlText(proxy["password"]);
        }
    }
}

void applyTls(QJsonObject &node, const QString &type, const YAML::Node &proxy)
{
    static const QStringList tlsOnlyTypes = {"trojan", "hysteria2", "anytls", "tuic"};
    if (!yamlFlag(proxy["tls"]) && !tlsOnlyTypes.contains(type)) {
        return;
    }
    QJsonObject tls;
    tls["enabled"] = true;
    const QString serverName = yamlText(proxy["servername"]);
    putIfSet(tls, "server_name", serverName.isEmpty() ? yamlText(proxy["sni"]) : serverName);
    if (yamlFlag(proxy["skip-cert-verify"])) {
        tls["insecure"] = true;
    }
    node["tls"] = tls;
}

void applyTransport(QJsonObject &node, const YAML::Node &proxy)
{
    const QString network = yamlText(proxy["network"]).toLower();
    QJsonObject transport;
    if (network == "ws") {
        const YAML::Node opts = proxy["ws-opts"];
        if (opts && opts.IsMap()) {
            putIfSet(transport, "path", yamlText(opts["path"]));
            const YAML::Node headers = opts["headers"];
            if (headers && headers.IsMap()) {
                QJsonObject headerObj;
                for (auto it = headers.begin(); it != headers.end(); ++it) {
                    const QString key = yamlText(it->first);
                    if (!key.isEmpty()) {
                        putIfSet(headerObj, key, yamlText(it->second));
                    }
                }
                if (!headerObj.isEmpty()) {
                    transport["headers"] = headerObj;
                }
            }
        }
    } else if (network == "grpc") {
        const YAML::Node opts = proxy["grpc-opts"];
        if (opts && opts.IsMap()) {
            putIfSet(transport, "service_name", yamlText(opts["grpc-service-name"]));
        }
    } else {
        return;
    }
    transport["type"] = network;
    node["transport"] = transport;
}

// Empty object when the proxy has no usable name or type.
QJsonObject clashProxyToOutbound(const YAML::Node &proxy)
{
    if (!proxy.IsMap()) {
        return QJsonObject();
    }
    const QString type = singBoxType(yamlText(proxy["type"]).toLower());
    const QString name = yamlText(proxy["name"]);
    if (type.isEmpty() || name.isEmpty()) {
        return QJsonObject();
    }
    QJsonObject node;
    node["type"] = type;
    node["tag"] = name;
    node["server"] = yamlText(proxy["server"]);
    node["server_port"] = yamlPort(proxy["port"]);
    applyCredentials(node, type, proxy);
    applyTls(node, type, proxy);
    applyTransport(node, proxy);
    return node;
}

int uriPort(const QUrl &url)
{
    const int port = url.port(443);
    return port > 0 ? port : 443;
}

// Fragment is the node name; unnamed nodes fall back to scheme-host:port.
QString uriTag(const QUrl &url, const QString &scheme)
{
    const QString tag = QUrl::fromPercentEncoding(url.fragment(QUrl::FullyEncoded).toUtf8()).trimmed();
    if (!tag.isEmpty()) {
        return tag;
    }
    return QString("%1-%2:%3").arg(scheme, url.host()).arg(uriPort(url));
}

QJsonArray commaList(const QString &text)
{
    QJsonArray items;
    for (const QString &item : text.split(',', Qt::SkipEmptyParts)) {
        if (!item.trimmed().isEmpty()) {
            items.append(item.trimmed());
        }
    }
    return items;
}

struct UriTlsOptions {
    bool forced = false;
    QString security;
    QString serverName;
    bool insecure = false;
    QString alpn;
    QString fingerprint;
    QString realityPublicKey;
    QString realityShortId;
};

void applyUriTls(QJsonObject &node, const UriTlsOptions &opts)
{
    const bool reality = opts.security == "reality";
    if (!opts.forced && opts.security != "tls" && !reality) {
        return;
    }
    QJsonObject tls;
    tls["enabled"] = true;
    putIfSet(tls, "server_name", opts.serverName);
    if (opts.insecure) {
        tls["insecure"] = true;
    }
    const QJsonArray alpn = commaList(opts.alpn);
    if (!alpn.isEmpty()) {
        tls["alpn"] = alpn;
    }
    if (!opts.fingerprint.isEmpty()) {
        tls["utls"] = QJsonObject{{"enabled", true}, {"fingerprint", opts.fingerprint}};
    }
    if (reality) {
        QJsonObject realityObj;
        realityObj["enabled"] = true;
        realityObj["public_key"] = opts.realityPublicKey;
        putIfSet(realityObj, "short_id", opts.realityShortId);
        tls["reality"] = realityObj;
    }
    node["tls"] = tls;
}

void applyUriTransport(QJsonObject &node, const QString &network, const QString &path,
                       const QString &host, const QString &serviceName)
{
    QJsonObject transport;
    if (network == "ws") {
        transport["type"] = "ws";
        putIfSet(transport, "path", path);
        if (!host.isEmpty()) {
            transport["headers"] = QJsonObject{{"Host", host}};
        }
    } else if (network == "grpc") {
        transport["type"] = "grpc";
        putIfSet(transport, "service_name", serviceName.isEmpty() ? path : serviceName);
    } else if (network == "h2" || network == "http") {
        transport["type"] = "http";
        putIfSet(transport, "path", path);
        const QJsonArray hosts = commaList(host);
        if (!hosts.isEmpty()) {
            transport["host"] = hosts;
        }
    } else {
        return;
    }
    node["transport"] = transport;
}

UriTlsOptions tlsFromQuery(const QUrlQuery &query)
{
    UriTlsOptions opts;
    opts.security = query.queryItemValue("security").toLower();
    opts.serverName = query.queryItemValue("sni");
    opts.insecure = query.queryItemValue("allowInsecure") == "1" || query.queryItemValue("insecure") == "1";
    opts.alpn = query.queryItemValue("alpn", QUrl::FullyDecoded);
    opts.fingerprint = query.queryItemValue("fp");
    opts.realityPublicKey = query.queryItemValue("pbk");
    opts.realityShortId = query.queryItemValue("sid");
    return opts;
}

void applyTransportFromQuery(QJsonObject &node, const QUrlQuery &query)
{
    applyUriTransport(node,
                      query.queryItemValue("type").toLower(),
                      query.queryItemValue("path", QUrl::FullyDecoded),
                      query.queryItemValue("host", QUrl::FullyDecoded),
                      query.queryItemValue("serviceName", QUrl::FullyDecoded));
}
} // namespace

QJsonArray SubscriptionParser::parseSubscriptionContent(const QByteArray &content)
{
    QJsonArray jsonNodes = parseJsonContentToNodes(content);
    if (!jsonNodes.isEmpty()) {
        return jsonNodes;
    }

    const QString str = QString::fromUtf8(content);
    if (str.contains("proxies")) {
        const QJsonArray clashNodes = parseClashConfig(content);
        if (!clashNodes.isEmpty()) {
            return clashNodes;
        }
    }
    if (str.contains("://")) {
        return parseURIList(content);
    }
    return QJsonArray();
}

QJsonArray SubscriptionParser::parseSingBoxConfig(const QByteArray &content)
{
    QJsonArray nodes;
    QJsonDocument doc = QJsonDocument::fromJson(content);
    if (!doc.isObject()) {
        return nodes;
    }

    const QJsonObject root = doc.object();
    for (const QString key : {QStringLiteral("outbounds"), QStringLiteral("endpoints")}) {
        const QJsonArray entries = root.value(key).toArray();
        for (const auto &entry : entries) {
            if (!entry.isObject()) continue;
            const QJsonObject outbound = entry.toObject();
            if (!isLeafOutbound(outbound)) continue;
            nodes.append(outbound);
        }
    }
    return nodes;
}

QJsonArray SubscriptionParser::parseClashConfig(const QByteArray &content)
{
    QJsonArray nodes;
    try {
        const YAML::Node root = YAML::Load(content.toStdString());
        const YAML::Node proxies = root.IsMap() ? root["proxies"] : YAML::Node();
        if (!proxies || !proxies.IsSequence()) {
            return nodes;
        }
        int skipped = 0;
        for (const auto &proxy : proxies) {
            const QJsonObject node = clashProxyToOutbound(proxy);
            if (node.isEmpty()) {
                ++skipped;
                continue;
            }
            nodes.append(node);
        }
        if (skipped > 0) {
            Logger::debug(QString("Clash proxies without name or type skipped: %1").arg(skipped));
        }
    } catch (const std::exception &e) {
        Logger::error(QString("YAML parse error: %1").arg(e.what()));
    }
    return nodes;
}

QJsonArray SubscriptionParser::parseURIList(const QByteArray &content)
{
    QJsonArray nodes;
    int skipped = 0;
    const QStringList lines = QString::fromUtf8(content).split('\n', Qt::SkipEmptyParts);
    for (const QString &line : lines) {
        const QString uri = line.trimmed();
        const QString scheme = uri.section("://", 0, 0).toLower();
        QJsonObject node;
        if (scheme == "vmess") {
            node = parseVmessURI(uri);
        } else if (scheme == "vless") {
            node = parseVlessURI(uri);
        } else if (scheme == "trojan") {
            node = parseTrojanURI(uri);
        } else if (scheme == "ss") {
            node = parseShadowsocksURI(uri);
        } else if (scheme == "hysteria2" || scheme == "hy2") {
            node = parseHysteria2URI(uri);
        }
        if (node.isEmpty()) {
            if (!uri.isEmpty()) {
                ++skipped;
            }
            continue;
        }
        nodes.append(node);
    }
    if (skipped > 0) {
        Logger::debug(QString("Subscription lines not understood: %1").arg(skipped));
    }
    return nodes;
}

QJsonObject SubscriptionParser::parseVmessURI(const QString &uri)
{
    const QString decoded = tryDecodeBase64ToText(uri.mid(uri.indexOf("://") + 3));
    const QJsonDocument doc = QJsonDocument::fromJson(decoded.toUtf8());
    if (!doc.isObject()) {
        return QJsonObject();
    }
    const QJsonObject share = doc.object();
    const QString server = share.value("add").toString().trimmed();
    const QString uuid = share.value("id").toString().trimmed();
    if (server.isEmpty() || uuid.isEmpty()) {
        return QJsonObject();
    }
    int port = share.value("port").toVariant().toInt();
    if (port <= 0) {
        port = 443;
    }

    QJsonObject node;
    node["type"] = "vmess";
    const QString name = share.value("ps").toString().trimmed();
    node["tag"] = name.isEmpty() ? QString("vmess-%1:%2").arg(server).arg(port) : name;
    node["server"] = server;
    node["server_port"] = port;
    node["uuid"] = uuid;
    node["alter_id"] = share.value("aid").toVariant().toInt();
    const QString security = share.value("scy").toString().trimmed();
    node["security"] = security.isEmpty() ? QString("auto") : security;

    const QString host = share.value("host").toString().trimmed();
    UriTlsOptions tls;
    tls.security = share.value("tls").toString().trimmed().toLower();
    tls.serverName = share.value("sni").toString().trimmed();
    if (tls.serverName.isEmpty()) {
        tls.serverName = host;
    }
    tls.alpn = share.value("alpn").toString();
    tls.fingerprint = share.value("fp").toString().trimmed();
    applyUriTls(node, tls);
    applyUriTransport(node,
                      share.value("net").toString().trimmed().toLower(),
                      share.value("path").toString().trimmed(),
                      host,
                      share.value("serviceName").toString().trimmed());
    return node;
}

QJsonObject SubscriptionParser::parseVlessURI(const QString &uri)
{
    const QUrl url(uri);
    if (!url.isValid() || url.host().isEmpty() || url.userName().isEmpty()) {
        return QJsonObject();
    }
    const QUrlQuery query(url);
    QJsonObject node;
    node["type"] = "vless";
    node["tag"] = uriTag(url, "vless");
    node["server"] = url.host();
    node["server_port"] = uriPort(url);
    node["uuid"] = url.userName();
    putIfSet(node, "flow", query.queryItemValue("flow"));
    putIfSet(node, "packet_encoding", query.queryItemValue("packetEncoding"));
    applyUriTls(node, tlsFromQuery(query));
    applyTransportFromQuery(node, query);
    return node;
}

QJsonObject SubscriptionParser::parseTrojanURI(const QString &uri)
{
    const QUrl url(uri);
    if (!url.isValid() || url.host().isEmpty() || url.userName().isEmpty()) {
        return QJsonObject();
    }
    const QUrlQuery query(url);
    QJsonObject node;
    node["type"] = "trojan";
    node["tag"] = uriTag(url, "trojan");
    node["server"] = url.host();
    node["server_port"] = uriPort(url);
    node["password"] = url.userName();
    UriTlsOptions tls = tlsFromQuery(query);
    tls.forced = true;
    applyUriTls(node, tls);
    applyTransportFromQuery(node, query);
    return node;
}

QJsonObject SubscriptionParser::parseShadowsocksURI(const QString &uri)
{
    QString body = uri.mid(uri.indexOf("://") + 3);
    QString name;
    const int hash = body.indexOf('#');
    if (hash >= 0) {
        name = QUrl::fromPercentEncoding(body.mid(hash + 1).toUtf8()).trimmed();
        body = body.left(hash);
    }
    body = body.section('?', 0, 0);
    if (body.endsWith('/')) {
        body.chop(1);
    }

    // SIP002 puts base64 userinfo before '@'; the legacy form encodes everything.
    QString userInfo;
    QString hostPart;
    const int at = body.lastIndexOf('@');
    if (at >= 0) {
        const QString rawUser = body.left(at);
        const QString decodedUser = tryDecodeBase64ToText(rawUser);
        userInfo = decodedUser.contains(':') ? decodedUser : QUrl::fromPercentEncoding(rawUser.toUtf8());
        hostPart = body.mid(at + 1);
    } else {
        const QString decoded = tryDecodeBase64ToText(body);
        const int legacyAt = decoded.lastIndexOf('@');
        if (legacyAt < 0) {
            return QJsonObject();
        }
        userInfo = decoded.left(legacyAt);
        hostPart = decoded.mid(legacyAt + 1);
    }

    const int colon = userInfo.indexOf(':');
    const int portSep = hostPart.lastIndexOf(':');
    if (colon <= 0 || portSep <= 0) {
        return QJsonObject();
    }
    QString server = hostPart.left(portSep);
    if (server.startsWith('[') && server.endsWith(']')) {
        server = server.mid(1, server.size() - 2);
    }
    const int port = hostPart.mid(portSep + 1).toInt();
    if (server.isEmpty() || port <= 0) {
        return QJsonObject();
    }

    QJsonObject node;
    node["type"] = "shadowsocks";
    node["tag"] = name.isEmpty() ? QString("ss-%1:%2").arg(server).arg(port) : name;
    node["server"] = server;
    node["server_port"] = port;
    node["method"] = userInfo.left(colon);
    node["password"] = userInfo.mid(colon + 1);
    return node;
}

QJsonObject SubscriptionParser::parseHysteria2URI(const QString &uri)
{
    QString normalized = uri;
    if (normalized.startsWith("hy2://", Qt::CaseInsensitive)) {
        normalized = "hysteria2://" + normalized.mid(6);
    }
    const QUrl url(normalized);
    if (!url.isValid() || url.host().isEmpty()) {
        return QJsonObject();
    }
    const QUrlQuery query(url);
    QJsonObject node;
    node["type"] = "hysteria2";
    node["tag"] = uriTag(url, "hy2");
    node["server"] = url.host();
    node["server_port"] = uriPort(url);
    const QString password = url.userName();
    node["password"] = password.isEmpty() ? query.queryItemValue("auth") : password;

    UriTlsOptions tls = tlsFromQuery(query);
    tls.forced = true;
    applyUriTls(node, tls);
    const QString obfs = query.queryItemValue("obfs");
    if (!obfs.isEmpty()) {
        node["obfs"] = QJsonObject{{"type", obfs}, {"password", query.queryItemValue("obfs-password")}};
    }
    return node;
}

QString SubscriptionParser::tryDecodeBase64ToText(const QString &raw)
{
    QString compact = raw;
    compact.remove(QRegularExpression("\\s+"));
    if (compact.isEmpty()) {
        return QString();
    }

    int rem = compact.length() % 4;
    if (rem != 0) {
        compact.append(QString("=").repeated(4 - rem));
    }

    const QByteArray input = compact.toUtf8();
    auto decoded = QByteArray::fromBase64Encoding(input, QByteArray::Base64Encoding | QByteArray::AbortOnBase64DecodingErrors);
    if (decoded && !decoded.decoded.isEmpty()) {
        return QString::fromUtf8(decoded.decoded);
    }

    decoded = QByteArray::fromBase64Encoding(input, QByteArray::Base64UrlEncoding | QByteArray::AbortOnBase64DecodingErrors);
    if (decoded && !decoded.decoded.isEmpty()) {
        return QString::fromUtf8(decoded.decoded);
    }

    return QString();
}

QJsonArray SubscriptionParser::extractNodesWithFallback(const QByteArray &content)
{
    QJsonArray nodes = parseSubscriptionContent(content.trimmed());
    if (!nodes.isEmpty()) {
        return nodes;
    }

    const QString decoded = tryDecodeBase64ToText(QString::fromUtf8(content));
    if (!decoded.isEmpty()) {
        nodes = parseSubscriptionContent(decoded.toUtf8());
    }
    return nodes;
}

QJsonArray SubscriptionParser::filterSupportedNodes(const QJsonArray &nodes, bool includeUnsupported)
{
    if (includeUnsupported) {
        return nodes;
    }
    QJsonArray supported;
    for (const auto &val : nodes) {
        const QJsonObject node = val.toObject();
        const QString type = node.value("type").toString().trimmed().toLower();
        if (RelayConstants::supportedProxyTypes().contains(type)) {
            supported.append(node);
        } else {
            Logger::debug(QString("Skip unsupported node type %1: %2").arg(type, node.value("tag").toString()));
        }
    }
    return supported;
}
