#include "services/relay/ReferenceRewriter.h"
#include <QSet>
#include "utils/Logger.h"
#include "utils/tag/TagSanitizer.h"

QStringList ReferenceRewriter::resolveReference(const QString&         oldTag,
                                                const OutboundGraph&   graph,
                                                const SanitizedTagMap& sanitizedToFinals) {
  const QString sanitized = TagSanitizer::sanitize(oldTag);
  auto          it        = sanitizedToFinals.constFind(sanitized);
  if (it != sanitizedToFinals.constEnd()) {
    QStringList live;
    for (const auto& variant : it.value()) {
      if (graph.contains(variant)) {
        live.append(variant);
      }
    }
    return live;
  }
  if (graph.contains(sanitized)) {
    return {sanitized};
  }
  if (graph.contains(oldTag)) {
    return {oldTag};
  }
  return {};
}

RewriteStats ReferenceRewriter::rewrite(OutboundGraph& graph, const SanitizedTagMap& sanitizedToFinals) {
  RewriteStats stats;
  for (auto& outbound : graph.items()) {
    if (!outbound.isGroup()) {
      continue;
    }
    if (outbound.hasMemberList) {
      QStringList   resolved;
      QSet<QString> seen;
      for (const auto& oldTag : outbound.outbounds) {
        QStringList targets = resolveReference(oldTag, graph, sanitizedToFinals);
        // A renamed variant can share the group's own logical name.
        targets.removeAll(outbound.tag);
        if (targets.isEmpty()) {
          Logger::debug(QString("[%1] drop stale reference [%2]").arg(outbound.tag, oldTag));
          ++stats.droppedReferences;
          continue;
        }
        for (const auto& tag : targets) {
          if (!seen.contains(tag)) {
            seen.insert(tag);
            resolved.append(tag);
          }
        }
      }
      if (resolved != outbound.outbounds) {
        outbound.outbounds = resolved;
        ++stats.changedGroups;
      }
    }
    if (!outbound.defaultTag.isEmpty()) {
      QStringList targets = resolveReference(outbound.defaultTag, graph, sanitizedToFinals);
      targets.removeAll(outbound.tag);
      if (targets.isEmpty()) {
        Logger::debug(QString("[%1] drop stale default [%2]").arg(outbound.tag, outbound.defaultTag));
        outbound.defaultTag.clear();
        ++stats.droppedDefaults;
      } else {
        outbound.defaultTag = targets.first();
      }
    }
  }
  Logger::info(QString("Reference rewrite done: %1 groups changed, %2 stale references dropped")
                   .arg(stats.changedGroups)
                   .arg(stats.droppedReferences + stats.droppedDefaults));
  return stats;
}
