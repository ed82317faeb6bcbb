#pragma once
#include <QByteArray>
#include <QMap>
#include <QString>
#include <QStringList>
#include <optional>

namespace QtGridSheet { namespace opc {

/** In-memory OPC (zip) container. open() loads every part; saveAs() writes them all back. */
class Package {
public:
    /** Load a zip package from disk. Returns false when the file cannot be read as a zip archive. */
    bool open(const QString &path);
    /** Part bytes by name ("xl/workbook.xml"); a leading '/' is ignored. */
    std::optional<QByteArray> readPart(const QString &name) const;
    /** Add or replace a part. */
    void writePart(const QString &name, const QByteArray &data);
    bool hasPart(const QString &name) const { return m_parts.contains(normalize(name)); }
    QStringList partNames() const { return m_parts.keys(); }
    /** Write all parts to a new zip file. */
    bool saveAs(const QString &path) const;

    /** Resolve a relationship target relative to the directory of sourcePart ("xl/workbook.xml"). */
    static QString resolveTarget(const QString &sourcePart, const QString &target);

private:
    static QString normalize(const QString &name);
    QMap<QString, QByteArray> m_parts;
};

}} // namespace QtGridSheet::opc
