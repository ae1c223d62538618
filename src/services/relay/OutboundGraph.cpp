#include "services/relay/OutboundGraph.h"
#include "storage/RelayConstants.h"
#include "utils/Logger.h"

bool Outbound::isGroup() const {
  return RelayConstants::groupTypes().contains(type);
}

bool Outbound::isTerminal() const {
  return RelayConstants::terminalTypes().contains(type);
}

Outbound Outbound::fromJson(const QJsonObject& obj) {
  Outbound ob;
  ob.raw  = obj;
  ob.tag  = obj.value("tag").toString();
  ob.type = obj.value("type").toString().trimmed();
  if (obj.value("outbounds").isArray()) {
    ob.hasMemberList = true;
    for (const auto& member : obj.value("outbounds").toArray()) {
      if (member.isString()) {
        ob.outbounds.append(member.toString());
      }
    }
  }
  ob.defaultTag = obj.value("default").toString();
  ob.detour     = obj.value("detour").toString();
  return ob;
}

QJsonObject Outbound::toJson() const {
  QJsonObject obj = raw;
  obj["tag"]      = tag;
  if (!type.isEmpty()) {
    obj["type"] = type;
  }
  if (hasMemberList) {
    obj["outbounds"] = QJsonArray::fromStringList(outbounds);
  } else {
    obj.remove("outbounds");
  }
  if (defaultTag.isEmpty()) {
    obj.remove("default");
  } else {
    obj["default"] = defaultTag;
  }
  if (detour.isEmpty()) {
    obj.remove("detour");
  } else {
    obj["detour"] = detour;
  }
  return obj;
}

OutboundGraph OutboundGraph::fromJson(const QJsonArray& outbounds) {
  OutboundGraph graph;
  for (int i = 0; i < outbounds.size(); ++i) {
    if (!outbounds[i].isObject()) {
      Logger::warn(QString("Skip outbound: not an object, index=%1").arg(i));
      continue;
    }
    graph.append(Outbound::fromJson(outbounds[i].toObject()));
  }
  return graph;
}

QJsonArray OutboundGraph::toJson() const {
  QJsonArray arr;
  for (const auto& ob : m_items) {
    arr.append(ob.toJson());
  }
  return arr;
}

void OutboundGraph::append(const Outbound& outbound) {
  m_items.append(outbound);
  if (!m_index.contains(outbound.tag)) {
    m_index.insert(outbound.tag, m_items.size() - 1);
  }
}

void OutboundGraph::reindex() {
  m_index.clear();
  m_index.reserve(m_items.size());
  for (int i = 0; i < m_items.size(); ++i) {
    if (!m_index.contains(m_items[i].tag)) {
      m_index.insert(m_items[i].tag, i);
    }
  }
}

bool OutboundGraph::contains(const QString& tag) const {
  return m_index.contains(tag);
}

int OutboundGraph::indexOf(const QString& tag) const {
  return m_index.value(tag, -1);
}

Outbound* OutboundGraph::find(const QString& tag) {
  const int idx = indexOf(tag);
  return idx < 0 ? nullptr : &m_items[idx];
}

const Outbound* OutboundGraph::find(const QString& tag) const {
  const int idx = indexOf(tag);
  return idx < 0 ? nullptr : &m_items.at(idx);
}

bool OutboundGraph::isGroupTag(const QString& tag) const {
  const Outbound* ob = find(tag);
  return ob && ob->isGroup();
}

QStringList OutboundGraph::groupTags() const {
  QStringList tags;
  for (const auto& ob : m_items) {
    if (ob.isGroup()) {
      tags.append(ob.tag);
    }
  }
  return tags;
}
