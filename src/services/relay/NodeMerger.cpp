#include "services/relay/NodeMerger.h"
#include <QHash>
#include "utils/Logger.h"

namespace {
QStringList matchingTags(const QList<NodeRecord>& nodes, const QRegularExpression& nameRegex) {
  QStringList tags;
  for (const auto& record : nodes) {
    const QString tag = record.tag();
    if (nameRegex.match(tag).hasMatch()) {
      tags.append(tag);
    }
  }
  return tags;
}
}  // namespace

QList<NodeRecord> NodeMerger::toRecords(const QJsonArray& nodes, const QString& hopLabel) {
  QList<NodeRecord> records;
  records.reserve(nodes.size());
  for (int i = 0; i < nodes.size(); ++i) {
    if (!nodes[i].isObject()) {
      Logger::warn(QString("%1: skip node, not an object, index=%2").arg(hopLabel).arg(i));
      continue;
    }
    const QJsonObject node = nodes[i].toObject();
    if (node.value("tag").toString().trimmed().isEmpty()) {
      Logger::warn(QString("%1: skip node, missing tag, index=%2").arg(hopLabel).arg(i));
      continue;
    }
    if (node.value("type").toString().trimmed().isEmpty()) {
      Logger::warn(QString("%1: skip node, missing type, tag=%2").arg(hopLabel, node.value("tag").toString()));
      continue;
    }
    NodeRecord record;
    record.node = node;
    record.hop  = hopLabel;
    records.append(record);
  }
  return records;
}

int NodeMerger::insertIntoGroups(OutboundGraph&              graph,
                                 const QList<NodeRecord>&    nodes,
                                 const QList<InsertionRule>& rules,
                                 HopReport*                  report) {
  if (nodes.isEmpty() || rules.isEmpty()) {
    return 0;
  }
  // Node matches depend only on the rule, not on the group.
  QList<QStringList> matchesPerRule;
  matchesPerRule.reserve(rules.size());
  for (const auto& rule : rules) {
    matchesPerRule.append(matchingTags(nodes, rule.nameRegex));
  }
  QHash<QString, int> statIndex;
  int                 insertedCount = 0;
  for (auto& outbound : graph.items()) {
    if (!outbound.isGroup()) {
      continue;
    }
    for (int r = 0; r < rules.size(); ++r) {
      if (!rules[r].groupRegex.match(outbound.tag).hasMatch()) {
        continue;
      }
      if (!outbound.hasMemberList) {
        outbound.hasMemberList = true;
        outbound.outbounds.clear();
      }
      const QStringList& matched = matchesPerRule[r];
      if (report) {
        if (!statIndex.contains(outbound.tag)) {
          GroupInsertionStat stat;
          stat.group  = outbound.tag;
          stat.before = outbound.outbounds.size();
          report->groups.append(stat);
          statIndex.insert(outbound.tag, report->groups.size() - 1);
        }
        GroupInsertionStat& stat = report->groups[statIndex.value(outbound.tag)];
        stat.inserted += matched.size();
        stat.nodes.append(matched);
      }
      outbound.outbounds.append(matched);
      insertedCount += matched.size();
    }
  }
  if (report) {
    report->inserted += insertedCount;
  }
  return insertedCount;
}

void NodeMerger::appendNodes(OutboundGraph& graph, const QList<NodeRecord>& nodes) {
  for (const auto& record : nodes) {
    graph.append(Outbound::fromJson(record.node));
  }
}
