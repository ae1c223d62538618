#ifndef NODESOURCE_H
#define NODESOURCE_H
#include <QJsonArray>
#include <QString>
#include "storage/RelaySettings.h"

class NodeSource {
 public:
  virtual ~NodeSource() = default;
  // Leaf outbounds of one hop. An empty array with error set means the
  // fetch failed; an empty array without error means the hop has no nodes.
  virtual QJsonArray fetch(const HopSource& hop, QString* error = nullptr) = 0;
};
#endif  // NODESOURCE_H
