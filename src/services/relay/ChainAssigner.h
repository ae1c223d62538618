#ifndef CHAINASSIGNER_H
#define CHAINASSIGNER_H

#include <QList>
#include "services/relay/ChainCycleBreaker.h"
#include "services/relay/GroupResolver.h"
#include "services/relay/OutboundGraph.h"
#include "services/relay/RelayReport.h"

class ChainAssigner {
 public:
  /**
   * For each edge source -> target, points the detour of every leaf in the
   * source closure at the target group. Terminal leaves (direct/block/dns)
   * and leaves already inside the target closure are left alone.
   */
  static QList<ChainAssignmentStat> assign(OutboundGraph&          graph,
                                           GroupResolver&          resolver,
                                           const QList<ChainEdge>& chains);
};
#endif  // CHAINASSIGNER_H
