#ifndef GROUPRESOLVER_H
#define GROUPRESOLVER_H

#include <QHash>
#include <QSet>
#include <QString>
#include <QStringList>
#include "services/relay/OutboundGraph.h"

/**
 * @brief Resolves groups to the concrete leaf tags they reach.
 *
 * Nested groups are inlined. A group met again on the active resolution
 * path contributes nothing for that branch. Results are memoized per group
 * tag, so shared sub-groups are walked once.
 */
class GroupResolver {
 public:
  explicit GroupResolver(const OutboundGraph& graph);

  // Leaf tags in first-seen order; empty for unknown or non-group tags.
  QStringList   resolve(const QString& groupTag);
  QSet<QString> resolveSet(const QString& groupTag);
  void          resolveAll();

  bool isResolved(const QString& groupTag) const { return m_memo.contains(groupTag); }

 private:
  QStringList resolveOnPath(const QString& groupTag, QSet<QString> path);

  const OutboundGraph&        m_graph;
  QHash<QString, QStringList> m_memo;
};
#endif  // GROUPRESOLVER_H
