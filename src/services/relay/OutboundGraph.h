#ifndef OUTBOUNDGRAPH_H
#define OUTBOUNDGRAPH_H

#include <QHash>
#include <QJsonArray>
#include <QJsonObject>
#include <QList>
#include <QString>
#include <QStringList>

/**
 * @brief One entry of the sing-box "outbounds" array.
 *
 * The routing fields are parsed out for the relay passes; every other key
 * stays in raw and is written back untouched by toJson().
 */
struct Outbound {
  QString     tag;
  QString     type;
  QStringList outbounds;
  bool        hasMemberList = false;
  QString     defaultTag;
  QString     detour;
  QJsonObject raw;

  bool isGroup() const;
  bool isTerminal() const;

  static Outbound fromJson(const QJsonObject& obj);
  QJsonObject     toJson() const;
};

/**
 * @brief Ordered outbound list with a tag -> position index.
 *
 * The index points at the first outbound carrying a tag. It is maintained
 * by append() and must be rebuilt with reindex() after tags are rewritten
 * in place.
 */
class OutboundGraph {
 public:
  OutboundGraph() = default;

  static OutboundGraph fromJson(const QJsonArray& outbounds);
  QJsonArray           toJson() const;

  int  size() const { return m_items.size(); }
  bool isEmpty() const { return m_items.isEmpty(); }

  Outbound&       at(int index) { return m_items[index]; }
  const Outbound& at(int index) const { return m_items.at(index); }

  QList<Outbound>&       items() { return m_items; }
  const QList<Outbound>& items() const { return m_items; }

  void append(const Outbound& outbound);
  void reindex();

  bool            contains(const QString& tag) const;
  int             indexOf(const QString& tag) const;
  Outbound*       find(const QString& tag);
  const Outbound* find(const QString& tag) const;
  bool            isGroupTag(const QString& tag) const;

  QStringList groupTags() const;

 private:
  QList<Outbound>     m_items;
  QHash<QString, int> m_index;
};
#endif  // OUTBOUNDGRAPH_H
