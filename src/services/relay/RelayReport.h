#ifndef RELAYREPORT_H
#define RELAYREPORT_H

#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

struct GroupInsertionStat {
  QString     group;
  int         before   = 0;
  int         inserted = 0;
  QStringList nodes;
};

struct HopReport {
  QString                   label;
  bool                      configured   = false;
  bool                      fetched      = false;
  int                       fetchedNodes = 0;
  int                       ruleCount    = 0;
  int                       inserted     = 0;
  QString                   error;
  QStringList               invalidRules;
  QList<GroupInsertionStat> groups;
};

struct DuplicateTag {
  QString tag;
  int     count = 0;
};

struct RejectedChainEdge {
  QString source;
  QString target;
  QString reason;
};

struct CutChainEdge {
  QString     source;
  QString     target;
  QStringList cyclePath;
};

struct ChainAssignmentStat {
  QString     source;
  QString     target;
  int         sourceLeaves    = 0;
  int         assigned        = 0;
  int         skippedTerminal = 0;
  int         skippedSelfLoop = 0;
  int         skippedMissing  = 0;
  bool        emptySource     = false;
  QStringList nodes;
};

/**
 * @brief Operator summary of one relay merge run.
 *
 * Every recoverable condition met by the pipeline ends up here instead of
 * being raised.
 */
class RelayReport {
 public:
  QList<HopReport>           hops;
  QList<DuplicateTag>        duplicates;
  int                        originalOutbounds  = 0;
  int                        addedNodes         = 0;
  int                        renamedTags        = 0;
  int                        droppedReferences  = 0;
  int                        droppedDefaults    = 0;
  QList<RejectedChainEdge>   rejectedEdges;
  QList<CutChainEdge>        cutEdges;
  QList<ChainAssignmentStat> assignments;
  QStringList                backfilledGroups;
  QString                    fallbackTag;
  int                        finalOutbounds = 0;

  int totalInserted() const;
  int totalAssigned() const;

  QJsonObject toJson() const;
  void        logSummary() const;
};
#endif  // RELAYREPORT_H
