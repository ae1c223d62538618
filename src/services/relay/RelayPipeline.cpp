#include "services/relay/RelayPipeline.h"
#include <QJsonArray>
#include "app/interfaces/NodeSource.h"
#include "services/relay/ChainAssigner.h"
#include "services/relay/EmptyGroupGuard.h"
#include "services/relay/GroupResolver.h"
#include "services/relay/InsertionRuleParser.h"
#include "services/relay/NodeMerger.h"
#include "services/relay/ReferenceRewriter.h"
#include "services/relay/TagDeduplicator.h"
#include "utils/Logger.h"

RelayPipeline::RelayPipeline(const RelaySettings& settings, NodeSource* nodeSource)
    : m_settings(settings), m_nodeSource(nodeSource) {}

RelayReport RelayPipeline::run(QJsonObject& config) {
  OutboundGraph graph  = OutboundGraph::fromJson(config.value("outbounds").toArray());
  RelayReport   report = run(graph);
  config["outbounds"]  = graph.toJson();
  return report;
}

RelayReport RelayPipeline::run(OutboundGraph& graph) {
  RelayReport report;
  report.originalOutbounds = graph.size();

  const QList<HopSource> hops = m_settings.hops();
  for (const auto& hop : hops) {
    HopReport hopReport;
    hopReport.label      = hop.label;
    hopReport.configured = hop.isConfigured();
    if (hopReport.configured) {
      mergeHop(graph, hop, hopReport);
    } else {
      Logger::info(QString("%1: not configured, skipped").arg(hop.label));
    }
    report.hops.append(hopReport);
  }
  report.addedNodes = graph.size() - report.originalOutbounds;
  Logger::info(QString("Hops inserted %1 node reference(s) in total").arg(report.totalInserted()));

  report.duplicates = TagDeduplicator::findDuplicates(graph);
  if (!report.duplicates.isEmpty()) {
    Logger::warn(QString("Found %1 duplicated tag(s), they will be renamed").arg(report.duplicates.size()));
  }
  const SanitizedTagMap sanitizedToFinals = TagDeduplicator::deduplicate(graph, &report.renamedTags);
  const RewriteStats    rewrite           = ReferenceRewriter::rewrite(graph, sanitizedToFinals);
  report.droppedReferences                = rewrite.droppedReferences;
  report.droppedDefaults                  = rewrite.droppedDefaults;

  normalizeFields(graph);

  GroupResolver resolver(graph);
  resolver.resolveAll();

  const QList<ChainEdge> declared = m_settings.chains();
  const QList<ChainEdge> valid    = ChainCycleBreaker::filterEdges(declared, graph, &report.rejectedEdges);
  const QList<ChainEdge> safe     = ChainCycleBreaker::breakCycles(valid, &report.cutEdges);
  report.assignments              = ChainAssigner::assign(graph, resolver, safe);

  report.backfilledGroups = EmptyGroupGuard::backfill(graph, m_settings.fallbackTag(), &report.fallbackTag);
  report.finalOutbounds   = graph.size();
  return report;
}

void RelayPipeline::mergeHop(OutboundGraph& graph, const HopSource& hop, HopReport& hopReport) {
  Logger::info(QString("%1: fetching nodes (%2)").arg(hop.label, hop.name.isEmpty() ? hop.url : hop.name));
  if (!m_nodeSource) {
    hopReport.error = "No node source available";
    Logger::warn(QString("%1: %2").arg(hop.label, hopReport.error));
    return;
  }
  QString          error;
  const QJsonArray fetched = m_nodeSource->fetch(hop, &error);
  if (!error.isEmpty()) {
    hopReport.error = error;
    Logger::warn(QString("%1: fetch failed, hop skipped: %2").arg(hop.label, error));
    return;
  }
  hopReport.fetched                = true;
  const QList<NodeRecord> records  = NodeMerger::toRecords(fetched, hop.label);
  hopReport.fetchedNodes           = records.size();
  const QList<InsertionRule> rules = InsertionRuleParser::parse(hop.outbound, &hopReport.invalidRules);
  hopReport.ruleCount              = rules.size();
  Logger::info(QString("%1: %2 node(s), %3 rule(s)").arg(hop.label).arg(records.size()).arg(rules.size()));
  if (records.isEmpty()) {
    Logger::warn(QString("%1: no nodes fetched, nothing inserted").arg(hop.label));
    return;
  }
  const int inserted = NodeMerger::insertIntoGroups(graph, records, rules, &hopReport);
  NodeMerger::appendNodes(graph, records);
  Logger::info(QString("%1: inserted %2 node reference(s)").arg(hop.label).arg(inserted));
}

void RelayPipeline::normalizeFields(OutboundGraph& graph) const {
  int strippedLists  = 0;
  int clearedDetours = 0;
  for (auto& outbound : graph.items()) {
    if (!outbound.isGroup() && outbound.hasMemberList) {
      outbound.hasMemberList = false;
      outbound.outbounds.clear();
      ++strippedLists;
    }
    if (m_settings.resetDetours() && !outbound.detour.isEmpty()) {
      outbound.detour.clear();
      ++clearedDetours;
    }
  }
  Logger::info(QString("Normalized outbounds: %1 member list(s) stripped, %2 detour(s) cleared")
                   .arg(strippedLists)
                   .arg(clearedDetours));
}
