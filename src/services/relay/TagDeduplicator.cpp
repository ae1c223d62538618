#include "services/relay/TagDeduplicator.h"
#include <QSet>
#include "storage/RelayConstants.h"
#include "utils/Logger.h"
#include "utils/tag/TagSanitizer.h"

QList<DuplicateTag> TagDeduplicator::findDuplicates(const OutboundGraph& graph) {
  QHash<QString, int> counts;
  QStringList         order;
  for (const auto& ob : graph.items()) {
    auto it = counts.find(ob.tag);
    if (it == counts.end()) {
      counts.insert(ob.tag, 1);
      order.append(ob.tag);
    } else {
      ++it.value();
    }
  }
  QList<DuplicateTag> duplicates;
  for (const auto& tag : order) {
    const int count = counts.value(tag);
    if (count > 1) {
      duplicates.append(DuplicateTag{tag, count});
    }
  }
  return duplicates;
}

SanitizedTagMap TagDeduplicator::deduplicate(OutboundGraph& graph, int* renamedCount) {
  SanitizedTagMap     sanitizedToFinals;
  QSet<QString>       claimed;
  QHash<QString, int> counters;
  int                 renamed = 0;
  claimed.reserve(graph.size());
  sanitizedToFinals.reserve(graph.size());
  for (auto& outbound : graph.items()) {
    const QString sanitized = TagSanitizer::sanitize(outbound.tag);
    QString       finalTag  = sanitized;
    int           counter   = counters.value(sanitized, 1);
    while (claimed.contains(finalTag)) {
      finalTag = sanitized + RelayConstants::DUPLICATE_SUFFIX.arg(counter);
      ++counter;
    }
    counters.insert(sanitized, counter);
    claimed.insert(finalTag);
    if (finalTag != outbound.tag) {
      Logger::debug(QString("Rename outbound [%1] -> [%2]").arg(outbound.tag, finalTag));
      ++renamed;
    }
    outbound.tag = finalTag;
    sanitizedToFinals[sanitized].append(finalTag);
  }
  graph.reindex();
  if (renamedCount) {
    *renamedCount = renamed;
  }
  Logger::info(QString("Tag deduplication done: %1 outbounds, %2 renamed").arg(graph.size()).arg(renamed));
  return sanitizedToFinals;
}
