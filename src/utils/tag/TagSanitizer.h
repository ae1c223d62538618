#ifndef TAGSANITIZER_H
#define TAGSANITIZER_H
#include <QString>
namespace TagSanitizer {
// Strips [ ] 【 】 " ' decoration, folds whitespace runs into one space
// and trims the end.
// The result is the identity key used to decide "same logical node".
QString sanitize(const QString& tag);
}  // namespace TagSanitizer
#endif  // TAGSANITIZER_H
