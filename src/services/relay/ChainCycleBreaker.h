#ifndef CHAINCYCLEBREAKER_H
#define CHAINCYCLEBREAKER_H

#include <QList>
#include <QString>
#include "services/relay/OutboundGraph.h"
#include "services/relay/RelayReport.h"

struct ChainEdge {
  QString source;
  QString target;
};

/**
 * @brief Validates the declared relay chain and removes cycles from it.
 *
 * The chain is functional: one outgoing edge per source group. A DFS with
 * unvisited/visiting/visited marks cuts every edge that closes a cycle.
 */
class ChainCycleBreaker {
 public:
  // Sanitizes endpoints and keeps edges whose endpoints are existing groups.
  // A second edge from an already used source is rejected, not overwritten.
  static QList<ChainEdge> filterEdges(const QList<ChainEdge>&   declared,
                                      const OutboundGraph&      graph,
                                      QList<RejectedChainEdge>* rejected = nullptr);

  // Returns the acyclic residual chain in declared order.
  static QList<ChainEdge> breakCycles(const QList<ChainEdge>& edges, QList<CutChainEdge>* cuts = nullptr);
};
#endif  // CHAINCYCLEBREAKER_H
