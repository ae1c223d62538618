#ifndef SUBSCRIPTIONPARSER_H
#define SUBSCRIPTIONPARSER_H

#include <QByteArray>
#include <QJsonArray>
#include <QJsonObject>
#include <QString>

class SubscriptionParser
{
public:
    static QJsonArray parseSubscriptionContent(const QByteArray &content);
    static QJsonArray parseSingBoxConfig(const QByteArray &content);
    static QJsonArray parseClashConfig(const QByteArray &content);

    // One share link per line; unknown schemes are skipped.
    static QJsonArray parseURIList(const QByteArray &content);
    static QJsonObject parseVmessURI(const QString &uri);
    static QJsonObject parseVlessURI(const QString &uri);
    static QJsonObject parseTrojanURI(const QString &uri);
    static QJsonObject parseShadowsocksURI(const QString &uri);
    static QJsonObject parseHysteria2URI(const QString &uri);

    // Tries the raw content first, then its base64-decoded text.
    static QJsonArray extractNodesWithFallback(const QByteArray &content);
    static QString tryDecodeBase64ToText(const QString &raw);

    // Drops node types the relay chain cannot carry unless includeUnsupported is set.
    static QJsonArray filterSupportedNodes(const QJsonArray &nodes, bool includeUnsupported);
};

#endif // SUBSCRIPTIONPARSER_H
