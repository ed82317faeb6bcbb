#pragma once
#include <QByteArray>
#include <QString>
#include <pugixml.hpp>

namespace QtGridSheet { namespace xml {

/** One parsed XML part of a package. */
class XmlPart {
public:
    bool load(const QByteArray &data);
    /** XPath node set relative to the document root. */
    pugi::xpath_node_set selectAll(const char *xpath) const;
    pugi::xml_document & doc() { return m_doc; }
    const pugi::xml_document & doc() const { return m_doc; }
    QByteArray save() const;
    QString errorString() const { return m_error; }

private:
    pugi::xml_document m_doc;
    QString m_error;
};

/** Element name without namespace prefix ("x:row" -> "row"). */
const char * localName(const pugi::xml_node &node);
/** First child element with the given local name. */
pugi::xml_node childByLocalName(const pugi::xml_node &parent, const char *name);
/** Attribute value matched by local name ("r:id" matches "id"). */
QString attributeByLocalName(const pugi::xml_node &node, const char *name);

}} // namespace QtGridSheet::xml
