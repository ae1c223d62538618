#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QObject>
#include <QSet>
#include <QtTest/QtTest>
#include "app/interfaces/NodeSource.h"
#include "services/relay/ChainAssigner.h"
#include "services/relay/ChainCycleBreaker.h"
#include "services/relay/EmptyGroupGuard.h"
#include "services/relay/GroupResolver.h"
#include "services/relay/InsertionRuleParser.h"
#include "services/relay/NodeMerger.h"
#include "services/relay/OutboundGraph.h"
#include "services/relay/ReferenceRewriter.h"
#include "services/relay/RelayPipeline.h"
#include "services/relay/TagDeduplicator.h"
#include "storage/RelaySettings.h"
#include "utils/tag/TagSanitizer.h"

namespace {
QJsonObject leaf(const QString& tag, const QString& type = "vless") {
  return QJsonObject{{"tag", tag}, {"type", type}, {"server", "203.0.113.1"}, {"server_port", 443}};
}

QJsonObject group(const QString& tag, const QStringList& members, const QString& type = "selector") {
  return QJsonObject{{"tag", tag}, {"type", type}, {"outbounds", QJsonArray::fromStringList(members)}};
}

QJsonObject findObjectByTag(const QJsonArray& arr, const QString& tag) {
  for (const auto& v : arr) {
    if (!v.isObject()) {
      continue;
    }
    const QJsonObject obj = v.toObject();
    if (obj.value("tag").toString() == tag) {
      return obj;
    }
  }
  return QJsonObject();
}

QStringList memberTags(const QJsonObject& obj) {
  QStringList tags;
  for (const auto& v : obj.value("outbounds").toArray()) {
    tags.append(v.toString());
  }
  return tags;
}

QList<NodeRecord> records(const QJsonArray& nodes, const QString& hop = "hop1") {
  return NodeMerger::toRecords(nodes, hop);
}

QSet<QString> toSet(const QStringList& list) {
  return QSet<QString>(list.cbegin(), list.cend());
}

class FakeNodeSource : public NodeSource {
 public:
  QHash<QString, QJsonArray> nodesByName;
  QHash<QString, QString>    errorsByName;
  QStringList                requested;

  QJsonArray fetch(const HopSource& hop, QString* error) override {
    requested.append(hop.name);
    if (errorsByName.contains(hop.name)) {
      if (error) *error = errorsByName.value(hop.name);
      return QJsonArray();
    }
    return nodesByName.value(hop.name);
  }
};
}  // namespace

class UnitRelayTest : public QObject {
  Q_OBJECT

 private slots:
  void tagSanitizer_shouldStripDecorationAndWhitespace();
  void insertionRuleParser_shouldParseGrammar();
  void insertionRuleParser_shouldSkipInvalidPatterns();
  void nodeMerger_shouldFilterInvalidRecords();
  void nodeMerger_shouldAppendMatchingNodesToGroups();
  void nodeMerger_shouldIgnoreEmptyHop();
  void outboundGraph_shouldKeepUnknownFields();
  void tagDeduplicator_shouldRenameCollisions();
  void tagDeduplicator_shouldSkipClaimedSuffixes();
  void referenceRewriter_shouldExpandRenamedReferences();
  void referenceRewriter_shouldResolveThroughTiers();
  void referenceRewriter_shouldBeIdempotent();
  void referenceRewriter_shouldNotSelfReference();
  void groupResolver_shouldInlineNestedGroups();
  void groupResolver_shouldSurviveCycles();
  void chainCycleBreaker_shouldCutExactlyOneEdge();
  void chainCycleBreaker_shouldRejectInvalidEdges();
  void chainAssigner_shouldSetDetours();
  void chainAssigner_shouldSkipSelfLoopAndTerminalNodes();
  void chainAssigner_shouldReportEmptySource();
  void emptyGroupGuard_shouldFillEmptyGroups();
  void emptyGroupGuard_shouldAvoidTakenFallbackTag();
  void relayPipeline_shouldMergeHopsAndWireChain();
  void relayPipeline_shouldSkipUnconfiguredHops();
  void relayPipeline_shouldNotNestGroupIntoItself();
};

void UnitRelayTest::tagSanitizer_shouldStripDecorationAndWhitespace() {
  QCOMPARE(TagSanitizer::sanitize(QString::fromUtf8("【HK 01】")), QString("HK 01"));
  QCOMPARE(TagSanitizer::sanitize("[US]  \"Node\"\t 2  "), QString("US Node 2"));
  QCOMPARE(TagSanitizer::sanitize("it's\nfine"), QString("its fine"));
  QCOMPARE(TagSanitizer::sanitize("  lead"), QString(" lead"));
  QCOMPARE(TagSanitizer::sanitize("plain"), QString("plain"));
  QCOMPARE(TagSanitizer::sanitize(QString()), QString());
  const QString once = TagSanitizer::sanitize(QString::fromUtf8("【JP】   Tokyo  "));
  QCOMPARE(TagSanitizer::sanitize(once), once);
}

void UnitRelayTest::insertionRuleParser_shouldParseGrammar() {
  const QString spec = QString::fromUtf8("Auto🏷HK|SG🕳🕳ℹ️^manual");
  QStringList   invalid;
  const QList<InsertionRule> rules = InsertionRuleParser::parse(spec, &invalid);
  QCOMPARE(rules.size(), 2);
  QVERIFY(invalid.isEmpty());
  QCOMPARE(rules[0].groupPattern, QString("Auto"));
  QCOMPARE(rules[0].namePattern, QString("HK|SG"));
  QVERIFY(rules[0].groupRegex.match("My Auto Group").hasMatch());
  QVERIFY(!rules[0].groupRegex.match("auto").hasMatch());
  QVERIFY(rules[0].nameRegex.match("SG 01").hasMatch());
  QVERIFY(!rules[0].nameRegex.match("US 01").hasMatch());
  QCOMPARE(rules[1].namePattern, QString(".*"));
  QVERIFY(rules[1].groupRegex.match("Manual Select").hasMatch());
  QVERIFY(rules[1].nameRegex.match("anything").hasMatch());

  const QList<InsertionRule> caseless =
      InsertionRuleParser::parse(QString::fromUtf8("Relay🏷ℹ️ jp "));
  QCOMPARE(caseless.size(), 1);
  QVERIFY(caseless[0].nameRegex.match("JP 01").hasMatch());

  QVERIFY(InsertionRuleParser::parse(QString()).isEmpty());
  QVERIFY(InsertionRuleParser::parse("   ").isEmpty());
}

void UnitRelayTest::insertionRuleParser_shouldSkipInvalidPatterns() {
  QStringList                invalid;
  const QList<InsertionRule> rules =
      InsertionRuleParser::parse(QString::fromUtf8("(broken🕳Auto🏷[x"), &invalid);
  QCOMPARE(rules.size(), 0);
  QCOMPARE(invalid.size(), 2);
  QCOMPARE(invalid[0], QString("(broken"));
}

void UnitRelayTest::nodeMerger_shouldFilterInvalidRecords() {
  const QJsonArray nodes{leaf("ok"), QJsonValue("not an object"), QJsonObject{{"type", "vless"}},
                         QJsonObject{{"tag", "no type"}}};
  const QList<NodeRecord> recs = records(nodes, "entry");
  QCOMPARE(recs.size(), 1);
  QCOMPARE(recs[0].tag(), QString("ok"));
  QCOMPARE(recs[0].hop, QString("entry"));
}

void UnitRelayTest::nodeMerger_shouldAppendMatchingNodesToGroups() {
  QJsonObject selectWithoutMembers{{"tag", "Select"}, {"type", "selector"}};
  OutboundGraph graph = OutboundGraph::fromJson(QJsonArray{
      group("Auto", {"direct"}, "urltest"), selectWithoutMembers, leaf("Auto leaf"), leaf("direct", "direct")});
  const QList<NodeRecord> nodes =
      records(QJsonArray{leaf("HK 01"), leaf("SG 01", "vmess"), leaf("US 01", "trojan")});
  const QList<InsertionRule> rules = InsertionRuleParser::parse(QString::fromUtf8("Auto🏷HK|SG🕳Select"));

  HopReport report;
  const int inserted = NodeMerger::insertIntoGroups(graph, nodes, rules, &report);
  QCOMPARE(inserted, 5);
  QCOMPARE(report.inserted, 5);
  QCOMPARE(graph.find("Auto")->outbounds, QStringList({"direct", "HK 01", "SG 01"}));
  QVERIFY(graph.find("Select")->hasMemberList);
  QCOMPARE(graph.find("Select")->outbounds, QStringList({"HK 01", "SG 01", "US 01"}));
  QVERIFY(!graph.find("Auto leaf")->hasMemberList);
  QCOMPARE(report.groups.size(), 2);
  QCOMPARE(report.groups[0].group, QString("Auto"));
  QCOMPARE(report.groups[0].before, 1);
  QCOMPARE(report.groups[0].inserted, 2);

  QCOMPARE(graph.size(), 4);
  NodeMerger::appendNodes(graph, nodes);
  QCOMPARE(graph.size(), 7);
  QVERIFY(graph.contains("US 01"));
  QCOMPARE(graph.find("SG 01")->type, QString("vmess"));
}

void UnitRelayTest::nodeMerger_shouldIgnoreEmptyHop() {
  OutboundGraph graph = OutboundGraph::fromJson(QJsonArray{group("Auto", {"a"})});
  const QList<InsertionRule> rules = InsertionRuleParser::parse("Auto");
  QCOMPARE(NodeMerger::insertIntoGroups(graph, QList<NodeRecord>(), rules), 0);
  QCOMPARE(NodeMerger::insertIntoGroups(graph, records(QJsonArray{leaf("x")}), QList<InsertionRule>()), 0);
  QCOMPARE(graph.find("Auto")->outbounds, QStringList({"a"}));
}

void UnitRelayTest::outboundGraph_shouldKeepUnknownFields() {
  QJsonObject urltest = group("Auto", {"a"}, "urltest");
  urltest["interval"] = "10m";
  QJsonObject node    = leaf("a");
  node["outbounds"]   = QJsonArray{"bogus"};
  OutboundGraph graph = OutboundGraph::fromJson(QJsonArray{urltest, QJsonValue(42), node});
  QCOMPARE(graph.size(), 2);
  QCOMPARE(graph.groupTags(), QStringList({"Auto"}));
  graph.find("a")->detour = "Auto";
  const QJsonArray out    = graph.toJson();
  QCOMPARE(findObjectByTag(out, "Auto").value("interval").toString(), QString("10m"));
  QCOMPARE(findObjectByTag(out, "a").value("server_port").toInt(), 443);
  QCOMPARE(findObjectByTag(out, "a").value("detour").toString(), QString("Auto"));
  QVERIFY(!findObjectByTag(out, "Auto").contains("default"));
}

void UnitRelayTest::tagDeduplicator_shouldRenameCollisions() {
  OutboundGraph graph = OutboundGraph::fromJson(QJsonArray{
      group("Auto", {"HK 01", QString::fromUtf8("【HK 01】")}, "urltest"), leaf("HK 01"),
      leaf(QString::fromUtf8("【HK 01】"), "vmess")});
  QCOMPARE(TagDeduplicator::findDuplicates(graph).size(), 0);

  int                   renamed = 0;
  const SanitizedTagMap map     = TagDeduplicator::deduplicate(graph, &renamed);
  QCOMPARE(renamed, 1);
  QCOMPARE(graph.at(1).tag, QString("HK 01"));
  QCOMPARE(graph.at(2).tag, QString("HK 01 #1"));
  QCOMPARE(graph.at(2).type, QString("vmess"));
  QCOMPARE(map.value("HK 01"), QStringList({"HK 01", "HK 01 #1"}));
  QVERIFY(graph.contains("HK 01 #1"));

  ReferenceRewriter::rewrite(graph, map);
  QCOMPARE(graph.find("Auto")->outbounds, QStringList({"HK 01", "HK 01 #1"}));
}

void UnitRelayTest::tagDeduplicator_shouldSkipClaimedSuffixes() {
  OutboundGraph graph = OutboundGraph::fromJson(QJsonArray{leaf("A #1"), leaf("A"), leaf("A"), leaf("[A]")});
  const QList<DuplicateTag> duplicates = TagDeduplicator::findDuplicates(graph);
  QCOMPARE(duplicates.size(), 1);
  QCOMPARE(duplicates[0].tag, QString("A"));
  QCOMPARE(duplicates[0].count, 2);

  const SanitizedTagMap map = TagDeduplicator::deduplicate(graph);
  QStringList           tags;
  for (const auto& ob : graph.items()) {
    tags.append(ob.tag);
  }
  QCOMPARE(tags, QStringList({"A #1", "A", "A #2", "A #3"}));
  QCOMPARE(toSet(tags).size(), tags.size());
  QCOMPARE(map.value("A"), QStringList({"A", "A #2", "A #3"}));
  QCOMPARE(map.value("A #1"), QStringList({"A #1"}));
}

void UnitRelayTest::referenceRewriter_shouldExpandRenamedReferences() {
  QJsonObject selector = group("G", {"[SG] 02", "gone", "HK 01", "SG 02"});
  selector["default"]  = "[SG] 02";
  QJsonObject stale    = group("Stale", {"gone"});
  stale["default"]     = "missing";
  OutboundGraph graph  = OutboundGraph::fromJson(
      QJsonArray{selector, stale, leaf("[SG] 02"), leaf("HK 01"), leaf("HK 01", "vmess")});
  const SanitizedTagMap map   = TagDeduplicator::deduplicate(graph);
  const RewriteStats    stats = ReferenceRewriter::rewrite(graph, map);

  QCOMPARE(graph.find("G")->outbounds, QStringList({"SG 02", "HK 01", "HK 01 #1"}));
  QCOMPARE(graph.find("G")->defaultTag, QString("SG 02"));
  QVERIFY(graph.find("Stale")->outbounds.isEmpty());
  QVERIFY(graph.find("Stale")->defaultTag.isEmpty());
  QCOMPARE(stats.droppedReferences, 2);
  QCOMPARE(stats.droppedDefaults, 1);

  for (const auto& ob : graph.items()) {
    for (const auto& member : ob.outbounds) {
      QVERIFY2(graph.contains(member), qPrintable(member));
    }
    if (!ob.defaultTag.isEmpty()) {
      QVERIFY(graph.contains(ob.defaultTag));
    }
  }
}

void UnitRelayTest::referenceRewriter_shouldResolveThroughTiers() {
  const OutboundGraph graph = OutboundGraph::fromJson(QJsonArray{leaf("X"), leaf("Y\t"), leaf("Z")});
  SanitizedTagMap     map;
  map.insert("Z", QStringList({"Z", "Z #1"}));
  QCOMPARE(ReferenceRewriter::resolveReference("[X]", graph, map), QStringList({"X"}));
  QCOMPARE(ReferenceRewriter::resolveReference("Y\t", graph, map), QStringList({"Y\t"}));
  QCOMPARE(ReferenceRewriter::resolveReference(QString::fromUtf8("【Z】"), graph, map), QStringList({"Z"}));
  QVERIFY(ReferenceRewriter::resolveReference("W", graph, map).isEmpty());
}

void UnitRelayTest::referenceRewriter_shouldBeIdempotent() {
  QJsonObject selector = group("G", {"HK 01", "[JP]", "Inner"});
  selector["default"]  = "HK 01";
  OutboundGraph graph  = OutboundGraph::fromJson(QJsonArray{
      selector, group("Inner", {"JP", "HK 01"}, "urltest"), leaf("HK 01"), leaf("HK 01", "trojan"), leaf("JP")});
  const SanitizedTagMap map = TagDeduplicator::deduplicate(graph);
  ReferenceRewriter::rewrite(graph, map);
  const QJsonArray first = graph.toJson();

  const RewriteStats second = ReferenceRewriter::rewrite(graph, map);
  QCOMPARE(second.changedGroups, 0);
  QCOMPARE(second.droppedReferences, 0);
  QVERIFY(graph.toJson() == first);
  QCOMPARE(graph.find("G")->outbounds, QStringList({"HK 01", "HK 01 #1", "JP", "Inner"}));
  QCOMPARE(graph.find("G")->defaultTag, QString("HK 01"));
}

void UnitRelayTest::referenceRewriter_shouldNotSelfReference() {
  QJsonObject selector = group("X", {"X", "[X]"});
  selector["default"]  = "X";
  OutboundGraph graph  = OutboundGraph::fromJson(QJsonArray{selector, group("Lonely", {"Lonely"}), leaf("X")});
  const SanitizedTagMap map = TagDeduplicator::deduplicate(graph);
  QCOMPARE(map.value("X"), QStringList({"X", "X #1"}));

  const RewriteStats stats = ReferenceRewriter::rewrite(graph, map);
  QCOMPARE(graph.find("X")->outbounds, QStringList({"X #1"}));
  QCOMPARE(graph.find("X")->defaultTag, QString("X #1"));
  QVERIFY(graph.find("Lonely")->outbounds.isEmpty());
  QCOMPARE(stats.droppedReferences, 1);
  for (const auto& ob : graph.items()) {
    QVERIFY2(!ob.outbounds.contains(ob.tag), qPrintable(ob.tag));
  }
}

void UnitRelayTest::groupResolver_shouldInlineNestedGroups() {
  const OutboundGraph graph = OutboundGraph::fromJson(QJsonArray{
      group("G", {"A", "B"}), group("B", {"x", "y"}, "urltest"), group("H", {"B", "x", "G"}), leaf("A"), leaf("x"),
      leaf("y")});
  GroupResolver resolver(graph);
  QCOMPARE(resolver.resolve("B"), QStringList({"x", "y"}));
  QCOMPARE(resolver.resolve("G"), QStringList({"A", "x", "y"}));
  QCOMPARE(resolver.resolveSet("H"), QSet<QString>({"A", "x", "y"}));
  QVERIFY(resolver.resolve("A").isEmpty());
  QVERIFY(resolver.resolve("unknown").isEmpty());
  QVERIFY(resolver.isResolved("B"));
}

void UnitRelayTest::groupResolver_shouldSurviveCycles() {
  const OutboundGraph graph = OutboundGraph::fromJson(QJsonArray{
      group("C1", {"C2", "n1"}), group("C2", {"C1", "n2"}), group("S", {"S", "n3"}), leaf("n1"), leaf("n2"),
      leaf("n3")});
  GroupResolver resolver(graph);
  resolver.resolveAll();
  QCOMPARE(resolver.resolveSet("C1"), QSet<QString>({"n1", "n2"}));
  QVERIFY(resolver.resolveSet("C2").contains("n2"));
  QCOMPARE(resolver.resolve("S"), QStringList({"n3"}));
}

void UnitRelayTest::chainCycleBreaker_shouldCutExactlyOneEdge() {
  const OutboundGraph graph = OutboundGraph::fromJson(
      QJsonArray{group("Entry", {"a"}), group("Relay", {"b"}), group("Landing", {"c"}), leaf("a"), leaf("b"),
                 leaf("c")});
  const QList<ChainEdge> declared{{"Entry", "Relay"}, {"Relay", "Landing"}, {"Landing", "Entry"}};
  QList<RejectedChainEdge> rejected;
  const QList<ChainEdge>   valid = ChainCycleBreaker::filterEdges(declared, graph, &rejected);
  QCOMPARE(valid.size(), 3);
  QVERIFY(rejected.isEmpty());

  QList<CutChainEdge>    cuts;
  const QList<ChainEdge> safe = ChainCycleBreaker::breakCycles(valid, &cuts);
  QCOMPARE(safe.size(), 2);
  QCOMPARE(safe[0].source, QString("Entry"));
  QCOMPARE(safe[0].target, QString("Relay"));
  QCOMPARE(safe[1].source, QString("Relay"));
  QCOMPARE(safe[1].target, QString("Landing"));
  QCOMPARE(cuts.size(), 1);
  QCOMPARE(cuts[0].source, QString("Landing"));
  QCOMPARE(cuts[0].target, QString("Entry"));
  QCOMPARE(cuts[0].cyclePath, QStringList({"Entry", "Relay", "Landing", "Entry"}));

  QList<CutChainEdge> selfCuts;
  QVERIFY(ChainCycleBreaker::breakCycles({{"Entry", "Entry"}}, &selfCuts).isEmpty());
  QCOMPARE(selfCuts.size(), 1);
}

void UnitRelayTest::chainCycleBreaker_shouldRejectInvalidEdges() {
  const OutboundGraph graph = OutboundGraph::fromJson(
      QJsonArray{group("Entry", {"a"}), group("Relay", {"a"}), group("Other", {"a"}), leaf("a")});
  const QList<ChainEdge> declared{{"[Entry]", "Relay"}, {"Nowhere", "Relay"}, {"Relay", "a"},
                                  {"Entry", "Other"},   {"Other", "Missing"}};
  QList<RejectedChainEdge> rejected;
  const QList<ChainEdge>   valid = ChainCycleBreaker::filterEdges(declared, graph, &rejected);
  QCOMPARE(valid.size(), 1);
  QCOMPARE(valid[0].source, QString("Entry"));
  QCOMPARE(valid[0].target, QString("Relay"));
  QCOMPARE(rejected.size(), 4);
  QCOMPARE(rejected[0].reason, QString("source missing"));
  QCOMPARE(rejected[1].reason, QString("target is not a group"));
  QCOMPARE(rejected[2].reason, QString("duplicate source"));
  QCOMPARE(rejected[3].reason, QString("target missing"));
}

void UnitRelayTest::chainAssigner_shouldSetDetours() {
  OutboundGraph graph = OutboundGraph::fromJson(QJsonArray{
      group("Entry", {"Pool"}), group("Pool", {"e1", "e2"}, "urltest"), group("Relay", {"r1"}), leaf("e1"),
      leaf("e2"), leaf("r1")});
  GroupResolver                    resolver(graph);
  const QList<ChainAssignmentStat> stats = ChainAssigner::assign(graph, resolver, {{"Entry", "Relay"}});
  QCOMPARE(stats.size(), 1);
  QCOMPARE(stats[0].assigned, 2);
  QCOMPARE(stats[0].sourceLeaves, 2);
  QCOMPARE(graph.find("e1")->detour, QString("Relay"));
  QCOMPARE(graph.find("e2")->detour, QString("Relay"));
  QVERIFY(graph.find("r1")->detour.isEmpty());
  QVERIFY(graph.find("Pool")->detour.isEmpty());
}

void UnitRelayTest::chainAssigner_shouldSkipSelfLoopAndTerminalNodes() {
  OutboundGraph graph = OutboundGraph::fromJson(QJsonArray{
      group("Entry", {"n1", "direct", "blocked"}), group("Relay", {"n1", "n2"}), leaf("n1"), leaf("n2"),
      leaf("direct", "direct"), leaf("blocked", "block")});
  GroupResolver                    resolver(graph);
  const QList<ChainAssignmentStat> stats = ChainAssigner::assign(graph, resolver, {{"Entry", "Relay"}});
  QCOMPARE(stats.size(), 1);
  QCOMPARE(stats[0].assigned, 0);
  QCOMPARE(stats[0].skippedSelfLoop, 1);
  QCOMPARE(stats[0].skippedTerminal, 2);
  QVERIFY(graph.find("n1")->detour != QString("Relay"));
  QVERIFY(graph.find("direct")->detour.isEmpty());
}

void UnitRelayTest::chainAssigner_shouldReportEmptySource() {
  OutboundGraph graph =
      OutboundGraph::fromJson(QJsonArray{group("Entry", {}), group("Relay", {"r1"}), leaf("r1")});
  GroupResolver                    resolver(graph);
  const QList<ChainAssignmentStat> stats = ChainAssigner::assign(graph, resolver, {{"Entry", "Relay"}});
  QCOMPARE(stats.size(), 1);
  QVERIFY(stats[0].emptySource);
  QCOMPARE(stats[0].assigned, 0);
  QVERIFY(graph.find("r1")->detour.isEmpty());
}

void UnitRelayTest::emptyGroupGuard_shouldFillEmptyGroups() {
  QJsonObject   bare{{"tag", "Sel"}, {"type", "selector"}};
  OutboundGraph graph = OutboundGraph::fromJson(
      QJsonArray{bare, group("Auto", {}, "urltest"), group("Full", {"n1"}), leaf("n1")});
  QString           fallback;
  const QStringList filled = EmptyGroupGuard::backfill(graph, "COMPATIBLE", &fallback);
  QCOMPARE(filled, QStringList({"Sel", "Auto"}));
  QCOMPARE(fallback, QString("COMPATIBLE"));
  QCOMPARE(graph.size(), 5);
  QCOMPARE(graph.find("COMPATIBLE")->type, QString("direct"));
  QCOMPARE(graph.find("Sel")->outbounds, QStringList({"COMPATIBLE"}));
  QCOMPARE(graph.find("Auto")->outbounds, QStringList({"COMPATIBLE"}));
  QCOMPARE(graph.find("Full")->outbounds, QStringList({"n1"}));

  QVERIFY(EmptyGroupGuard::backfill(graph, "COMPATIBLE").isEmpty());
  QCOMPARE(graph.size(), 5);
}

void UnitRelayTest::emptyGroupGuard_shouldAvoidTakenFallbackTag() {
  OutboundGraph graph = OutboundGraph::fromJson(QJsonArray{group("Sel", {}), leaf("COMPATIBLE")});
  QString       fallback;
  QCOMPARE(EmptyGroupGuard::backfill(graph, "COMPATIBLE", &fallback), QStringList({"Sel"}));
  QCOMPARE(fallback, QString("COMPATIBLE #1"));
  QCOMPARE(graph.find("COMPATIBLE #1")->type, QString("direct"));

  OutboundGraph reuse = OutboundGraph::fromJson(QJsonArray{group("Sel", {}), leaf("COMPATIBLE", "direct")});
  EmptyGroupGuard::backfill(reuse, "COMPATIBLE");
  QCOMPARE(reuse.size(), 2);
  QCOMPARE(reuse.find("Sel")->outbounds, QStringList({"COMPATIBLE"}));
}

void UnitRelayTest::relayPipeline_shouldMergeHopsAndWireChain() {
  QJsonObject finalGroup                   = group("Final", {"Entry", "Relay", "Landing"});
  finalGroup["interrupt_exist_connections"] = true;
  QJsonObject staleDetour                  = leaf("static");
  staleDetour["detour"]                    = "Relay";
  QJsonObject config;
  config["outbounds"] = QJsonArray{group("Entry", {}), group("Relay", {}), group("Landing", {}), finalGroup,
                                   leaf("direct", "direct"), staleDetour};
  config["route"]     = QJsonObject{{"final", "Final"}};

  FakeNodeSource source;
  source.nodesByName.insert("entry-sub", QJsonArray{leaf("HK 01"), leaf("HK 02", "vmess")});
  source.nodesByName.insert("relay-sub", QJsonArray{leaf("HK 01", "trojan"), leaf("JP 01", "trojan")});
  source.errorsByName.insert("landing-sub", "boom");

  HopSource entry;
  entry.label    = "entry";
  entry.name     = "entry-sub";
  entry.outbound = "^Entry$";
  HopSource relay;
  relay.label    = "relay";
  relay.name     = "relay-sub";
  relay.outbound = QString::fromUtf8("^Relay$🏷JP");
  HopSource landing;
  landing.label    = "landing";
  landing.name     = "landing-sub";
  landing.outbound = "^Landing$";

  RelaySettings settings;
  settings.setHops({entry, relay, landing});
  settings.setChains({{"Entry", "Relay"}, {"Relay", "Landing"}});

  RelayPipeline     pipeline(settings, &source);
  const RelayReport report = pipeline.run(config);

  QCOMPARE(source.requested, QStringList({"entry-sub", "relay-sub", "landing-sub"}));
  QCOMPARE(report.hops.size(), 3);
  QCOMPARE(report.hops[0].inserted, 2);
  QCOMPARE(report.hops[1].inserted, 1);
  QCOMPARE(report.hops[2].error, QString("boom"));
  QVERIFY(!report.hops[2].fetched);
  QCOMPARE(report.totalInserted(), 3);
  QCOMPARE(report.originalOutbounds, 6);
  QCOMPARE(report.addedNodes, 4);
  QCOMPARE(report.duplicates.size(), 1);
  QCOMPARE(report.renamedTags, 1);
  QVERIFY(report.cutEdges.isEmpty());
  QCOMPARE(report.backfilledGroups, QStringList({"Landing"}));
  QCOMPARE(report.fallbackTag, QString("COMPATIBLE"));
  QCOMPARE(report.finalOutbounds, 11);

  const QJsonArray outbounds = config.value("outbounds").toArray();
  QCOMPARE(outbounds.size(), 11);
  QCOMPARE(memberTags(findObjectByTag(outbounds, "Entry")), QStringList({"HK 01", "HK 01 #1", "HK 02"}));
  QCOMPARE(memberTags(findObjectByTag(outbounds, "Relay")), QStringList({"JP 01"}));
  QCOMPARE(memberTags(findObjectByTag(outbounds, "Landing")), QStringList({"COMPATIBLE"}));
  QCOMPARE(findObjectByTag(outbounds, "HK 01 #1").value("type").toString(), QString("trojan"));
  QCOMPARE(findObjectByTag(outbounds, "HK 01").value("detour").toString(), QString("Relay"));
  QCOMPARE(findObjectByTag(outbounds, "HK 02").value("detour").toString(), QString("Relay"));
  QCOMPARE(findObjectByTag(outbounds, "JP 01").value("detour").toString(), QString("Landing"));
  QVERIFY(!findObjectByTag(outbounds, "static").contains("detour"));
  QVERIFY(findObjectByTag(outbounds, "Final").value("interrupt_exist_connections").toBool());
  QCOMPARE(config.value("route").toObject().value("final").toString(), QString("Final"));
  QCOMPARE(report.totalAssigned(), 4);

  QSet<QString> tags;
  for (const auto& v : outbounds) {
    tags.insert(v.toObject().value("tag").toString());
  }
  QCOMPARE(tags.size(), outbounds.size());
}

void UnitRelayTest::relayPipeline_shouldSkipUnconfiguredHops() {
  QJsonObject config;
  config["outbounds"] = QJsonArray{group("Entry", {"a"}), group("Relay", {"b"}), group("Landing", {"c"}),
                                   leaf("a"), leaf("b"), leaf("c")};
  FakeNodeSource source;
  HopSource      noRules;
  noRules.name = "sub";
  HopSource noName;
  noName.outbound = "Entry";

  RelaySettings settings;
  settings.setHops({noRules, noName});
  settings.setChains({{"Entry", "Relay"}, {"Relay", "Landing"}, {"Landing", "Entry"}});
  RelayPipeline     pipeline(settings, &source);
  const RelayReport report = pipeline.run(config);

  QVERIFY(source.requested.isEmpty());
  QCOMPARE(report.hops.size(), 2);
  QVERIFY(!report.hops[0].configured);
  QVERIFY(!report.hops[1].configured);
  QCOMPARE(report.cutEdges.size(), 1);
  QCOMPARE(report.assignments.size(), 2);

  const QJsonArray outbounds = config.value("outbounds").toArray();
  QCOMPARE(findObjectByTag(outbounds, "a").value("detour").toString(), QString("Relay"));
  QCOMPARE(findObjectByTag(outbounds, "b").value("detour").toString(), QString("Landing"));
  QVERIFY(!findObjectByTag(outbounds, "c").contains("detour"));

  const QJsonObject json = report.toJson();
  QCOMPARE(json.value("totalAssigned").toInt(), 2);
  QCOMPARE(json.value("hops").toArray().size(), 2);
  QVERIFY(!json.value("hops").toArray()[0].toObject().value("configured").toBool());
  const QJsonObject cut = json.value("cutEdges").toArray()[0].toObject();
  QCOMPARE(cut.value("from").toString(), QString("Landing"));
  QCOMPARE(cut.value("to").toString(), QString("Entry"));
  QCOMPARE(cut.value("cycle").toArray().size(), 4);
  QVERIFY(json.value("backfilledGroups").toArray().isEmpty());
  QVERIFY(!json.contains("fallbackTag"));
  QCOMPARE(json.value("finalOutbounds").toInt(), 6);
}

void UnitRelayTest::relayPipeline_shouldNotNestGroupIntoItself() {
  QJsonObject config;
  config["outbounds"] = QJsonArray{group("X", {}), group("Relay", {"r1"}), leaf("r1")};
  FakeNodeSource source;
  source.nodesByName.insert("sub", QJsonArray{leaf("X")});
  HopSource hop;
  hop.label    = "entry";
  hop.name     = "sub";
  hop.outbound = "^X$";

  RelaySettings settings;
  settings.setHops({hop});
  settings.setChains({{"X", "Relay"}});
  RelayPipeline     pipeline(settings, &source);
  const RelayReport report = pipeline.run(config);

  QCOMPARE(report.totalInserted(), 1);
  const QJsonArray outbounds = config.value("outbounds").toArray();
  QCOMPARE(memberTags(findObjectByTag(outbounds, "X")), QStringList({"X #1"}));
  QCOMPARE(findObjectByTag(outbounds, "X #1").value("detour").toString(), QString("Relay"));
  QVERIFY(!findObjectByTag(outbounds, "X").contains("detour"));
}

QTEST_GUILESS_MAIN(UnitRelayTest)

#include "unit_relay_test.moc"
