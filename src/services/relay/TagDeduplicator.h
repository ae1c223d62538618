#ifndef TAGDEDUPLICATOR_H
#define TAGDEDUPLICATOR_H

#include <QHash>
#include <QList>
#include <QString>
#include <QStringList>
#include "services/relay/OutboundGraph.h"
#include "services/relay/RelayReport.h"

// sanitized tag -> claimed tags, in outbound order.
using SanitizedTagMap = QHash<QString, QStringList>;

class TagDeduplicator {
 public:
  // Tags occurring more than once, verbatim, in first-seen order.
  static QList<DuplicateTag> findDuplicates(const OutboundGraph& graph);

  /**
   * Single pass over the outbounds: each tag is sanitized and claimed
   * verbatim when free, otherwise as "<sanitized> #N" with N taken from a
   * per-sanitized-value counter. Tags are rewritten in place and the graph
   * index rebuilt.
   */
  static SanitizedTagMap deduplicate(OutboundGraph& graph, int* renamedCount = nullptr);
};
#endif  // TAGDEDUPLICATOR_H
