#include "services/relay/RelayReport.h"
#include <QJsonArray>
#include "storage/RelayConstants.h"
#include "utils/Logger.h"

namespace {
void logPreview(const QStringList& items, const QString& indent) {
  const int shown = qMin(RelayConstants::REPORT_PREVIEW_LIMIT, items.size());
  for (int i = 0; i < shown; ++i) {
    Logger::info(indent + items[i]);
  }
  if (items.size() > shown) {
    Logger::info(indent + QString("... and %1 more").arg(items.size() - shown));
  }
}
}  // namespace

int RelayReport::totalInserted() const {
  int total = 0;
  for (const auto& hop : hops) {
    total += hop.inserted;
  }
  return total;
}

int RelayReport::totalAssigned() const {
  int total = 0;
  for (const auto& stat : assignments) {
    total += stat.assigned;
  }
  return total;
}

QJsonObject RelayReport::toJson() const {
  QJsonObject obj;
  QJsonArray  hopArr;
  for (const auto& hop : hops) {
    QJsonObject hopObj;
    hopObj["label"]        = hop.label;
    hopObj["configured"]   = hop.configured;
    hopObj["fetched"]      = hop.fetched;
    hopObj["fetchedNodes"] = hop.fetchedNodes;
    hopObj["ruleCount"]    = hop.ruleCount;
    hopObj["inserted"]     = hop.inserted;
    if (!hop.error.isEmpty()) {
      hopObj["error"] = hop.error;
    }
    if (!hop.invalidRules.isEmpty()) {
      hopObj["invalidRules"] = QJsonArray::fromStringList(hop.invalidRules);
    }
    QJsonArray groups;
    for (const auto& stat : hop.groups) {
      QJsonObject groupObj;
      groupObj["group"]    = stat.group;
      groupObj["before"]   = stat.before;
      groupObj["inserted"] = stat.inserted;
      groupObj["after"]    = stat.before + stat.inserted;
      groups.append(groupObj);
    }
    hopObj["groups"] = groups;
    hopArr.append(hopObj);
  }
  obj["hops"] = hopArr;

  QJsonArray dupArr;
  for (const auto& dup : duplicates) {
    dupArr.append(QJsonObject{{"tag", dup.tag}, {"count", dup.count}});
  }
  obj["duplicates"]        = dupArr;
  obj["originalOutbounds"] = originalOutbounds;
  obj["addedNodes"]        = addedNodes;
  obj["renamedTags"]       = renamedTags;
  obj["droppedReferences"] = droppedReferences;
  obj["droppedDefaults"]   = droppedDefaults;

  QJsonArray rejectedArr;
  for (const auto& edge : rejectedEdges) {
    rejectedArr.append(QJsonObject{{"from", edge.source}, {"to", edge.target}, {"reason", edge.reason}});
  }
  obj["rejectedEdges"] = rejectedArr;

  QJsonArray cutArr;
  for (const auto& cut : cutEdges) {
    cutArr.append(QJsonObject{
        {"from", cut.source}, {"to", cut.target}, {"cycle", QJsonArray::fromStringList(cut.cyclePath)}});
  }
  obj["cutEdges"] = cutArr;

  QJsonArray assignArr;
  for (const auto& stat : assignments) {
    QJsonObject statObj;
    statObj["from"]            = stat.source;
    statObj["to"]              = stat.target;
    statObj["sourceLeaves"]    = stat.sourceLeaves;
    statObj["assigned"]        = stat.assigned;
    statObj["skippedTerminal"] = stat.skippedTerminal;
    statObj["skippedSelfLoop"] = stat.skippedSelfLoop;
    statObj["skippedMissing"]  = stat.skippedMissing;
    statObj["emptySource"]     = stat.emptySource;
    statObj["nodes"]           = QJsonArray::fromStringList(stat.nodes);
    assignArr.append(statObj);
  }
  obj["assignments"]      = assignArr;
  obj["totalAssigned"]    = totalAssigned();
  obj["backfilledGroups"] = QJsonArray::fromStringList(backfilledGroups);
  if (!fallbackTag.isEmpty()) {
    obj["fallbackTag"] = fallbackTag;
  }
  obj["finalOutbounds"] = finalOutbounds;
  return obj;
}

void RelayReport::logSummary() const {
  Logger::info("==================== Relay merge report ====================");
  Logger::info(QString("Original outbounds: %1").arg(originalOutbounds));
  Logger::info(QString("Added nodes: %1").arg(addedNodes));
  for (const auto& hop : hops) {
    if (!hop.configured) {
      Logger::info(QString("  %1: not configured").arg(hop.label));
      continue;
    }
    if (!hop.error.isEmpty()) {
      Logger::warn(QString("  %1: failed (%2)").arg(hop.label, hop.error));
      continue;
    }
    Logger::info(QString("  %1: %2 node(s) fetched, %3 inserted").arg(hop.label).arg(hop.fetchedNodes).arg(hop.inserted));
    for (const auto& stat : hop.groups) {
      if (stat.inserted > 0) {
        Logger::info(QString("    %1: %2 -> %3").arg(stat.group).arg(stat.before).arg(stat.before + stat.inserted));
      }
    }
  }
  if (!duplicates.isEmpty()) {
    QStringList dupLines;
    for (const auto& dup : duplicates) {
      dupLines.append(QString("%1 (%2 times)").arg(dup.tag).arg(dup.count));
    }
    Logger::warn(QString("Duplicated tags: %1").arg(duplicates.size()));
    logPreview(dupLines, "  ");
  }
  Logger::info(QString("Renamed tags: %1, dropped references: %2, dropped defaults: %3")
                   .arg(renamedTags)
                   .arg(droppedReferences)
                   .arg(droppedDefaults));
  for (const auto& edge : rejectedEdges) {
    Logger::info(QString("Relay edge ignored: %1 -> %2 (%3)").arg(edge.source, edge.target, edge.reason));
  }
  for (const auto& cut : cutEdges) {
    Logger::warn(QString("Relay edge cut: %1 -> %2, cycle %3")
                     .arg(cut.source, cut.target, cut.cyclePath.join(" -> ")));
  }
  const int assigned = totalAssigned();
  if (assigned > 0) {
    Logger::info(QString("Chained %1 node(s):").arg(assigned));
  } else {
    Logger::warn("No node was chained, check the relay configuration");
  }
  for (const auto& stat : assignments) {
    if (stat.emptySource) {
      Logger::warn(QString("  %1 -> %2: source group is empty").arg(stat.source, stat.target));
      continue;
    }
    Logger::info(QString("  %1 -> %2: %3 chained, %4 terminal, %5 already in target")
                     .arg(stat.source, stat.target)
                     .arg(stat.assigned)
                     .arg(stat.skippedTerminal)
                     .arg(stat.skippedSelfLoop));
    logPreview(stat.nodes, "    ");
  }
  if (!backfilledGroups.isEmpty()) {
    Logger::warn(QString("Empty groups filled with %1:").arg(fallbackTag));
    logPreview(backfilledGroups, "  ");
  }
  Logger::info(QString("Final outbounds: %1").arg(finalOutbounds));
  Logger::info("============================================================");
}
