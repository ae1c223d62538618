#include "services/relay/ChainCycleBreaker.h"
#include <QHash>
#include <QSet>
#include <QStringList>
#include "utils/Logger.h"
#include "utils/tag/TagSanitizer.h"

namespace {
enum class VisitState { Unvisited, Visiting, Visited };

struct CycleSearch {
  const QHash<QString, QString>& chains;
  QHash<QString, VisitState>     states;
  QSet<QString>                  cutSources;
  QList<CutChainEdge>            cuts;

  explicit CycleSearch(const QHash<QString, QString>& chainMap) : chains(chainMap) {}

  void visit(const QString& group, QStringList path) {
    states[group] = VisitState::Visiting;
    path.append(group);
    auto it = chains.constFind(group);
    if (it != chains.constEnd()) {
      const QString    target      = it.value();
      const VisitState targetState = states.value(target, VisitState::Unvisited);
      if (targetState == VisitState::Visiting) {
        CutChainEdge cut;
        cut.source    = group;
        cut.target    = target;
        cut.cyclePath = path.mid(path.indexOf(target));
        cut.cyclePath.append(target);
        Logger::warn(QString("Relay cycle detected: %1").arg(cut.cyclePath.join(" -> ")));
        Logger::warn(QString("Relay edge cut: %1 -> %2").arg(group, target));
        cutSources.insert(group);
        cuts.append(cut);
      } else if (targetState == VisitState::Unvisited) {
        visit(target, path);
      }
    }
    states[group] = VisitState::Visited;
  }
};

void reject(QList<RejectedChainEdge>* rejected, const ChainEdge& edge, const QString& reason) {
  Logger::debug(QString("Relay edge %1 -> %2 ignored: %3").arg(edge.source, edge.target, reason));
  if (rejected) {
    rejected->append(RejectedChainEdge{edge.source, edge.target, reason});
  }
}
}  // namespace

QList<ChainEdge> ChainCycleBreaker::filterEdges(const QList<ChainEdge>&   declared,
                                                const OutboundGraph&      graph,
                                                QList<RejectedChainEdge>* rejected) {
  QList<ChainEdge> edges;
  QSet<QString>    sources;
  for (const auto& decl : declared) {
    ChainEdge edge{TagSanitizer::sanitize(decl.source), TagSanitizer::sanitize(decl.target)};
    if (!graph.contains(edge.source)) {
      reject(rejected, edge, "source missing");
      continue;
    }
    if (!graph.contains(edge.target)) {
      reject(rejected, edge, "target missing");
      continue;
    }
    if (!graph.isGroupTag(edge.source)) {
      reject(rejected, edge, "source is not a group");
      continue;
    }
    if (!graph.isGroupTag(edge.target)) {
      reject(rejected, edge, "target is not a group");
      continue;
    }
    if (sources.contains(edge.source)) {
      Logger::warn(QString("Relay edge %1 -> %2 rejected: source already chained").arg(edge.source, edge.target));
      if (rejected) {
        rejected->append(RejectedChainEdge{edge.source, edge.target, "duplicate source"});
      }
      continue;
    }
    sources.insert(edge.source);
    edges.append(edge);
  }
  return edges;
}

QList<ChainEdge> ChainCycleBreaker::breakCycles(const QList<ChainEdge>& edges, QList<CutChainEdge>* cuts) {
  QHash<QString, QString> chains;
  for (const auto& edge : edges) {
    if (!chains.contains(edge.source)) {
      chains.insert(edge.source, edge.target);
    }
  }
  CycleSearch search(chains);
  for (const auto& edge : edges) {
    if (search.states.value(edge.source, VisitState::Unvisited) == VisitState::Unvisited) {
      search.visit(edge.source, QStringList());
    }
  }
  QList<ChainEdge> residual;
  QSet<QString>    emitted;
  for (const auto& edge : edges) {
    if (search.cutSources.contains(edge.source) || emitted.contains(edge.source)) {
      continue;
    }
    emitted.insert(edge.source);
    residual.append(edge);
  }
  if (search.cuts.isEmpty()) {
    Logger::info("No relay cycle detected");
  } else {
    Logger::warn(QString("Relay cycles broken: %1 edge(s) cut").arg(search.cuts.size()));
  }
  if (cuts) {
    cuts->append(search.cuts);
  }
  return residual;
}
