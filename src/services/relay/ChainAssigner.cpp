#include "services/relay/ChainAssigner.h"
#include <QSet>
#include "utils/Logger.h"

QList<ChainAssignmentStat> ChainAssigner::assign(OutboundGraph&          graph,
                                                 GroupResolver&          resolver,
                                                 const QList<ChainEdge>& chains) {
  QList<ChainAssignmentStat> stats;
  for (const auto& edge : chains) {
    ChainAssignmentStat stat;
    stat.source                     = edge.source;
    stat.target                     = edge.target;
    const QStringList   sourceNodes = resolver.resolve(edge.source);
    const QSet<QString> targetNodes = resolver.resolveSet(edge.target);
    stat.sourceLeaves               = sourceNodes.size();
    if (sourceNodes.isEmpty()) {
      Logger::warn(QString("Relay edge %1 -> %2: source group resolves to no node").arg(edge.source, edge.target));
      stat.emptySource = true;
      stats.append(stat);
      continue;
    }
    for (const auto& nodeTag : sourceNodes) {
      Outbound* node = graph.find(nodeTag);
      if (!node) {
        ++stat.skippedMissing;
        continue;
      }
      if (node->isTerminal()) {
        ++stat.skippedTerminal;
        continue;
      }
      if (targetNodes.contains(nodeTag)) {
        // Chaining a node through a group that contains it would loop.
        ++stat.skippedSelfLoop;
        continue;
      }
      node->detour = edge.target;
      ++stat.assigned;
      stat.nodes.append(nodeTag);
    }
    Logger::info(QString("Relay edge %1 -> %2: %3 node(s) chained").arg(edge.source, edge.target).arg(stat.assigned));
    stats.append(stat);
  }
  return stats;
}
