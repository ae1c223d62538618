#ifndef REFERENCEREWRITER_H
#define REFERENCEREWRITER_H

#include <QString>
#include <QStringList>
#include "services/relay/OutboundGraph.h"
#include "services/relay/TagDeduplicator.h"

struct RewriteStats {
  int droppedReferences = 0;
  int droppedDefaults   = 0;
  int changedGroups     = 0;
};

/**
 * @brief Points group member lists and default fields at renamed tags.
 *
 * Each old reference resolves in three tiers: every live variant registered
 * for its sanitized form, else the sanitized form when it is a live tag,
 * else the raw tag when it is still live. Anything else is dropped.
 * Running it twice changes nothing the second time.
 */
class ReferenceRewriter {
 public:
  static RewriteStats rewrite(OutboundGraph& graph, const SanitizedTagMap& sanitizedToFinals);

  static QStringList resolveReference(const QString&         oldTag,
                                      const OutboundGraph&   graph,
                                      const SanitizedTagMap& sanitizedToFinals);
};
#endif  // REFERENCEREWRITER_H
