#ifndef INSERTIONRULEPARSER_H
#define INSERTIONRULEPARSER_H

#include <QList>
#include <QRegularExpression>
#include <QString>
#include <QStringList>

struct InsertionRule {
  QString            groupPattern;
  QString            namePattern;
  QRegularExpression groupRegex;
  QRegularExpression nameRegex;
};

/**
 * @brief Parses a hop's insertion rule spec.
 *
 * Grammar: segments separated by 🕳, each "groupPattern🏷namePattern".
 * A missing namePattern matches every node. A pattern containing ℹ️ is
 * matched case-insensitively once the marker is removed. Patterns are
 * regular expressions with search (unanchored) semantics.
 */
class InsertionRuleParser {
 public:
  // Invalid segments are skipped; their text is appended to invalidRules.
  static QList<InsertionRule> parse(const QString& spec, QStringList* invalidRules = nullptr);
  static QRegularExpression   compilePattern(const QString& pattern);
};
#endif  // INSERTIONRULEPARSER_H
