#ifndef RELAYPIPELINE_H
#define RELAYPIPELINE_H

#include <QJsonObject>
#include <QList>
#include <QString>
#include "services/relay/ChainCycleBreaker.h"
#include "services/relay/OutboundGraph.h"
#include "services/relay/RelayReport.h"
#include "storage/RelaySettings.h"

class NodeSource;

/**
 * @brief Merges fetched hop nodes into a sing-box config and wires the
 * relay chain through detour fields.
 *
 * Order: hops (fetch, rule parse, group insertion, node append) in declared
 * order, tag deduplication, reference rewrite, field normalisation, group
 * closure, chain cycle removal, detour assignment, empty-group back-fill.
 * Nothing in the run throws; every recoverable problem is logged and
 * recorded in the returned report.
 */
class RelayPipeline {
 public:
  RelayPipeline(const RelaySettings& settings, NodeSource* nodeSource);

  RelayReport run(QJsonObject& config);
  RelayReport run(OutboundGraph& graph);

 private:
  void mergeHop(OutboundGraph& graph, const HopSource& hop, HopReport& hopReport);
  void normalizeFields(OutboundGraph& graph) const;

  RelaySettings m_settings;
  NodeSource*   m_nodeSource;
};
#endif  // RELAYPIPELINE_H
