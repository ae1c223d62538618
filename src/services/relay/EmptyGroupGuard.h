#ifndef EMPTYGROUPGUARD_H
#define EMPTYGROUPGUARD_H

#include <QString>
#include <QStringList>
#include "services/relay/OutboundGraph.h"

class EmptyGroupGuard {
 public:
  // Gives every group with an empty direct member list one member: a shared
  // direct-type fallback outbound, created the first time it is needed.
  // Returns the tags of the groups that were filled.
  static QStringList backfill(OutboundGraph& graph, const QString& fallbackTag, QString* usedFallbackTag = nullptr);

 private:
  static QString ensureFallback(OutboundGraph& graph, const QString& fallbackTag);
};
#endif  // EMPTYGROUPGUARD_H
