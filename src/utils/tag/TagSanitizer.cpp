#include "utils/tag/TagSanitizer.h"
#include <QRegularExpression>

namespace TagSanitizer {
QString sanitize(const QString& tag) {
  if (tag.isEmpty()) {
    return tag;
  }
  static const QRegularExpression decorationRe(QString::fromUtf8("[\\[\\]【】\"']+"));
  static const QRegularExpression whitespaceRe("\\s+");
  QString cleaned = tag;
  cleaned.remove(decorationRe);
  cleaned.replace(whitespaceRe, " ");
  int end = cleaned.size();
  while (end > 0 && cleaned.at(end - 1).isSpace()) {
    --end;
  }
  cleaned.truncate(end);
  return cleaned;
}
}  // namespace TagSanitizer
