#include "services/relay/GroupResolver.h"
#include "utils/Logger.h"

GroupResolver::GroupResolver(const OutboundGraph& graph) : m_graph(graph) {}

QStringList GroupResolver::resolve(const QString& groupTag) {
  if (!m_graph.isGroupTag(groupTag)) {
    return {};
  }
  return resolveOnPath(groupTag, QSet<QString>());
}

QSet<QString> GroupResolver::resolveSet(const QString& groupTag) {
  const QStringList leaves = resolve(groupTag);
  return QSet<QString>(leaves.cbegin(), leaves.cend());
}

void GroupResolver::resolveAll() {
  const QStringList groups = m_graph.groupTags();
  for (const auto& tag : groups) {
    resolve(tag);
  }
  Logger::info(QString("Resolved leaf closures for %1 groups").arg(groups.size()));
}

QStringList GroupResolver::resolveOnPath(const QString& groupTag, QSet<QString> path) {
  auto memo = m_memo.constFind(groupTag);
  if (memo != m_memo.constEnd()) {
    return memo.value();
  }
  if (path.contains(groupTag)) {
    Logger::debug(QString("Group cycle reached [%1], branch ignored").arg(groupTag));
    return {};
  }
  path.insert(groupTag);
  QStringList     leaves;
  QSet<QString>   seen;
  const Outbound* group = m_graph.find(groupTag);
  if (group) {
    for (const auto& member : group->outbounds) {
      if (m_graph.isGroupTag(member)) {
        const QStringList nested = resolveOnPath(member, path);
        for (const auto& leaf : nested) {
          if (!seen.contains(leaf)) {
            seen.insert(leaf);
            leaves.append(leaf);
          }
        }
      } else if (!seen.contains(member)) {
        seen.insert(member);
        leaves.append(member);
      }
    }
  }
  m_memo.insert(groupTag, leaves);
  return leaves;
}
