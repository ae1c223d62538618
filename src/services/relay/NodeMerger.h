#ifndef NODEMERGER_H
#define NODEMERGER_H

#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>
#include "services/relay/InsertionRuleParser.h"
#include "services/relay/OutboundGraph.h"
#include "services/relay/RelayReport.h"

struct NodeRecord {
  QJsonObject node;
  QString     hop;

  QString tag() const { return node.value("tag").toString(); }
};

class NodeMerger {
 public:
  // Drops entries that are not objects or lack tag/type, logging each skip.
  static QList<NodeRecord> toRecords(const QJsonArray& nodes, const QString& hopLabel);

  // Appends the tags of matching nodes to every matching group's member
  // list. Never removes members. Returns the number of tags appended.
  static int insertIntoGroups(OutboundGraph&              graph,
                              const QList<NodeRecord>&    nodes,
                              const QList<InsertionRule>& rules,
                              HopReport*                  report = nullptr);

  // Makes the fetched nodes permanent entries of the outbound list.
  static void appendNodes(OutboundGraph& graph, const QList<NodeRecord>& nodes);
};
#endif  // NODEMERGER_H
