#include "opc/Package.hpp"
#include <QDir>
#include <QFileInfo>
#include <QDebug>
#include <private/qzipreader_p.h>
#include <private/qzipwriter_p.h>

namespace QtGridSheet { namespace opc {

QString Package::normalize(const QString &name) {
    QString n = name;
    n.replace(QLatin1Char('\\'), QLatin1Char('/'));
    while(n.startsWith(QLatin1Char('/'))) n.remove(0, 1);
    return n;
}

bool Package::open(const QString &path) {
    m_parts.clear();
    if(!QFileInfo(path).isFile()) return false;
    QZipReader zip(path);
    if(!zip.isReadable() || zip.status() != QZipReader::NoError) return false;
    const auto entries = zip.fileInfoList();
    if(entries.isEmpty()) return false;
    for(const auto &e : entries) {
        if(!e.isFile) continue;
        m_parts.insert(normalize(e.filePath), zip.fileData(e.filePath));
    }
    zip.close();
    return !m_parts.isEmpty();
}

std::optional<QByteArray> Package::readPart(const QString &name) const {
    auto it = m_parts.constFind(normalize(name));
    if(it == m_parts.constEnd()) return std::nullopt;
    return it.value();
}

void Package::writePart(const QString &name, const QByteArray &data) {
    m_parts.insert(normalize(name), data);
}

bool Package::saveAs(const QString &path) const {
    QZipWriter zip(path);
    if(zip.status() != QZipWriter::NoError || !zip.isWritable()) {
        qWarning("opc::Package: cannot write %s", qUtf8Printable(path));
        return false;
    }
    zip.setCompressionPolicy(QZipWriter::AutoCompress);
    // [Content_Types].xml goes first, as producers of OPC packages do
    const QString contentTypes = QStringLiteral("[Content_Types].xml");
    if(m_parts.contains(contentTypes)) zip.addFile(contentTypes, m_parts.value(contentTypes));
    for(auto it = m_parts.constBegin(); it != m_parts.constEnd(); ++it) {
        if(it.key() == contentTypes) continue;
        zip.addFile(it.key(), it.value());
    }
    zip.close();
    return zip.status() == QZipWriter::NoError;
}

QString Package::resolveTarget(const QString &sourcePart, const QString &target) {
    if(target.startsWith(QLatin1Char('/'))) return normalize(target);
    const QString dir = QFileInfo(normalize(sourcePart)).path();
    const QString joined = (dir.isEmpty() || dir == QLatin1String(".")) ? target : dir + QLatin1Char('/') + target;
    return normalize(QDir::cleanPath(joined));
}

}} // namespace QtGridSheet::opc
