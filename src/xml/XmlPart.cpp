#include "xml/XmlPart.hpp"
#include <QDebug>
#include <cstring>
#include <sstream>

namespace QtGridSheet { namespace xml {

bool XmlPart::load(const QByteArray &data) {
    m_error.clear();
    const auto res = m_doc.load_buffer(data.constData(), static_cast<size_t>(data.size()),
                                       pugi::parse_default, pugi::encoding_utf8);
    if(!res) {
        m_error = QStringLiteral("%1 at offset %2").arg(QString::fromUtf8(res.description())).arg(res.offset);
        return false;
    }
    return true;
}

pugi::xpath_node_set XmlPart::selectAll(const char *xpath) const {
    try {
        return m_doc.select_nodes(xpath);
    } catch(const pugi::xpath_exception &e) {
        qWarning("XmlPart: bad XPath %s: %s", xpath, e.what());
        return {};
    }
}

QByteArray XmlPart::save() const {
    std::ostringstream ss;
    m_doc.save(ss, "", pugi::format_raw, pugi::encoding_utf8);
    const std::string s = ss.str();
    return QByteArray(s.data(), static_cast<qsizetype>(s.size()));
}

const char * localName(const pugi::xml_node &node) {
    const char *n = node.name();
    const char *colon = std::strrchr(n, ':');
    return colon ? colon + 1 : n;
}

pugi::xml_node childByLocalName(const pugi::xml_node &parent, const char *name) {
    for(auto c = parent.first_child(); c; c = c.next_sibling()) {
        if(c.type() == pugi::node_element && std::strcmp(localName(c), name) == 0) return c;
    }
    return {};
}

QString attributeByLocalName(const pugi::xml_node &node, const char *name) {
    for(auto a = node.first_attribute(); a; a = a.next_attribute()) {
        const char *n = a.name();
        const char *colon = std::strrchr(n, ':');
        if(std::strcmp(colon ? colon + 1 : n, name) == 0) return QString::fromUtf8(a.value());
    }
    return {};
}

}} // namespace QtGridSheet::xml
