#include "services/relay/EmptyGroupGuard.h"
#include <QList>
#include "storage/RelayConstants.h"
#include "utils/Logger.h"

QString EmptyGroupGuard::ensureFallback(OutboundGraph& graph, const QString& fallbackTag) {
  const QString base    = fallbackTag.trimmed().isEmpty() ? RelayConstants::DEFAULT_FALLBACK_TAG : fallbackTag.trimmed();
  QString       tag     = base;
  int           counter = 1;
  while (const Outbound* existing = graph.find(tag)) {
    if (existing->type == RelayConstants::TYPE_DIRECT) {
      return tag;
    }
    tag = base + RelayConstants::DUPLICATE_SUFFIX.arg(counter);
    ++counter;
  }
  QJsonObject obj;
  obj["tag"]  = tag;
  obj["type"] = RelayConstants::TYPE_DIRECT;
  graph.append(Outbound::fromJson(obj));
  Logger::info(QString("Fallback outbound added: %1 (direct)").arg(tag));
  return tag;
}

QStringList EmptyGroupGuard::backfill(OutboundGraph& graph, const QString& fallbackTag, QString* usedFallbackTag) {
  QList<int> emptyGroups;
  for (int i = 0; i < graph.size(); ++i) {
    const Outbound& ob = graph.at(i);
    if (ob.isGroup() && ob.outbounds.isEmpty()) {
      emptyGroups.append(i);
    }
  }
  QStringList filled;
  if (emptyGroups.isEmpty()) {
    return filled;
  }
  const QString tag = ensureFallback(graph, fallbackTag);
  for (int idx : emptyGroups) {
    Outbound& group     = graph.at(idx);
    group.hasMemberList = true;
    group.outbounds.append(tag);
    filled.append(group.tag);
    Logger::warn(QString("Group [%1] is empty, filled with %2").arg(group.tag, tag));
  }
  if (usedFallbackTag) {
    *usedFallbackTag = tag;
  }
  return filled;
}
