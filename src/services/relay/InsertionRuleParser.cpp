#include "services/relay/InsertionRuleParser.h"
#include "storage/RelayConstants.h"
#include "utils/Logger.h"

QRegularExpression InsertionRuleParser::compilePattern(const QString& pattern) {
  QString cleaned = pattern;
  cleaned.remove(RelayConstants::RULE_CASE_INSENSITIVE);
  // A bare ℹ without the variation selector is accepted as well.
  const bool caseInsensitive = pattern.contains(RelayConstants::RULE_CASE_INSENSITIVE.at(0));
  cleaned.remove(RelayConstants::RULE_CASE_INSENSITIVE.at(0));
  QRegularExpression::PatternOptions options = QRegularExpression::UseUnicodePropertiesOption;
  if (caseInsensitive) {
    options |= QRegularExpression::CaseInsensitiveOption;
  }
  return QRegularExpression(cleaned.trimmed(), options);
}

QList<InsertionRule> InsertionRuleParser::parse(const QString& spec, QStringList* invalidRules) {
  QList<InsertionRule> rules;
  if (spec.trimmed().isEmpty()) {
    return rules;
  }
  const QStringList segments = spec.split(RelayConstants::RULE_SEPARATOR, Qt::SkipEmptyParts);
  for (const auto& segment : segments) {
    if (segment.trimmed().isEmpty()) {
      continue;
    }
    const int     sep          = segment.indexOf(RelayConstants::RULE_NAME_SEPARATOR);
    const QString groupPattern = sep < 0 ? segment : segment.left(sep);
    QString       namePattern  = RelayConstants::RULE_MATCH_ALL;
    if (sep >= 0) {
      // Anything after a second 🏷 is ignored.
      namePattern = segment.mid(sep + RelayConstants::RULE_NAME_SEPARATOR.size())
                        .section(RelayConstants::RULE_NAME_SEPARATOR, 0, 0);
      if (namePattern.isEmpty()) {
        namePattern = RelayConstants::RULE_MATCH_ALL;
      }
    }
    InsertionRule rule;
    rule.groupPattern = groupPattern;
    rule.namePattern  = namePattern;
    rule.groupRegex   = compilePattern(groupPattern);
    rule.nameRegex    = compilePattern(namePattern);
    if (!rule.groupRegex.isValid() || !rule.nameRegex.isValid()) {
      const QString reason = !rule.groupRegex.isValid() ? rule.groupRegex.errorString() : rule.nameRegex.errorString();
      Logger::warn(QString("Skip insertion rule [%1]: %2").arg(segment, reason));
      if (invalidRules) {
        invalidRules->append(segment);
      }
      continue;
    }
    Logger::debug(QString("Rule: nodes matching [%1] -> groups matching [%2]").arg(namePattern, groupPattern));
    rules.append(rule);
  }
  return rules;
}
