#include "QtGridSheet/Workbook.hpp"
#include "opc/Package.hpp"
#include "xml/XmlPart.hpp"
#include <QDebug>
#include <algorithm>
#include <cmath>
#include <cstring>
#include <map>

using QtGridSheet::opc::Package;
using namespace QtGridSheet::xml;

namespace QtGridSheet {

namespace {

const char *kMainNs = "http://schemas.openxmlformats.org/spreadsheetml/2006/main";
const char *kRelNs = "http://schemas.openxmlformats.org/officeDocument/2006/relationships";
const char *kPkgRelNs = "http://schemas.openxmlformats.org/package/2006/relationships";
const char *kWorksheetRel = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet";

// Concatenated text of all <t> below node, skipping phonetic runs.
QString collectText(const pugi::xml_node &node) {
    QString out;
    for(auto c = node.first_child(); c; c = c.next_sibling()) {
        if(c.type() != pugi::node_element) continue;
        const char *n = localName(c);
        if(std::strcmp(n, "rPh") == 0) continue;
        if(std::strcmp(n, "t") == 0) out += QString::fromUtf8(c.text().get());
        else out += collectText(c);
    }
    return out;
}

QString locateFirstSheet(const Package &pkg, WorkbookError *error) {
    auto fail = [error](WorkbookError e) { if(error) *error = e; return QString(); };
    const auto wbData = pkg.readPart(QStringLiteral("xl/workbook.xml"));
    if(!wbData) return fail(WorkbookError::WorkbookPartMissing);
    XmlPart wb;
    if(!wb.load(*wbData)) return fail(WorkbookError::XmlParseFailed);
    const auto sheets = wb.selectAll("//*[local-name()='sheets']/*[local-name()='sheet']");
    if(sheets.empty()) return fail(WorkbookError::SheetMissing);
    const QString relId = attributeByLocalName(sheets.first().node(), "id");

    const auto relData = pkg.readPart(QStringLiteral("xl/_rels/workbook.xml.rels"));
    if(relData) {
        XmlPart rels;
        if(!rels.load(*relData)) return fail(WorkbookError::XmlParseFailed);
        for(const auto &xn : rels.selectAll("//*[local-name()='Relationship']")) {
            const auto rel = xn.node();
            if(QString::fromUtf8(rel.attribute("Id").value()) != relId) continue;
            const QString target = Package::resolveTarget(QStringLiteral("xl/workbook.xml"),
                                                          QString::fromUtf8(rel.attribute("Target").value()));
            if(pkg.hasPart(target)) return target;
        }
    }
    // Producers that omit the relationship part still use the conventional name.
    if(pkg.hasPart(QStringLiteral("xl/worksheets/sheet1.xml"))) return QStringLiteral("xl/worksheets/sheet1.xml");
    return fail(WorkbookError::SheetMissing);
}

bool loadSharedStrings(const Package &pkg, QStringList &strings) {
    const auto data = pkg.readPart(QStringLiteral("xl/sharedStrings.xml"));
    if(!data) return true;
    XmlPart part;
    if(!part.load(*data)) return false;
    for(const auto &xn : part.selectAll("//*[local-name()='sst']/*[local-name()='si']"))
        strings << collectText(xn.node());
    return true;
}

QVariant cellValue(const pugi::xml_node &c, const QStringList &shared) {
    const QString type = QString::fromUtf8(c.attribute("t").value());
    const auto v = childByLocalName(c, "v");
    const QString raw = QString::fromUtf8(v.text().get());
    if(type == QLatin1String("inlineStr")) {
        const QString s = collectText(childByLocalName(c, "is"));
        return s.isEmpty() ? QVariant() : QVariant(s);
    }
    if(!v) return {};
    if(type == QLatin1String("s")) {
        bool ok = false;
        const int idx = raw.toInt(&ok);
        if(!ok || idx < 0 || idx >= shared.size()) {
            qWarning("readWorkbook: shared string index %s out of range", qUtf8Printable(raw));
            return {};
        }
        return shared.at(idx).isEmpty() ? QVariant() : QVariant(shared.at(idx));
    }
    if(type == QLatin1String("str") || type == QLatin1String("d"))
        return raw.isEmpty() ? QVariant() : QVariant(raw);
    if(type == QLatin1String("b")) return QVariant(raw.trimmed() == QLatin1String("1"));
    if(type == QLatin1String("e")) return {};
    bool ok = false;
    const double d = raw.toDouble(&ok);
    if(!ok) {
        qWarning("readWorkbook: cell %s has non-numeric value %s", c.attribute("r").value(), qUtf8Printable(raw));
        return raw.isEmpty() ? QVariant() : QVariant(raw);
    }
    return QVariant(d);
}

bool isBlank(const QVariant &v) {
    return !v.isValid() || (v.typeId() == QMetaType::QString && v.toString().trimmed().isEmpty());
}

pugi::xml_node appendCell(pugi::xml_node row, int col, int rowNumber, const QVariant &value) {
    auto c = row.append_child("c");
    c.append_attribute("r") = (columnName(col) + QString::number(rowNumber)).toUtf8().constData();
    switch(value.typeId()) {
    case QMetaType::Double:
    case QMetaType::Float:
    case QMetaType::Int:
    case QMetaType::LongLong:
        c.append_child("v").text() = QString::number(value.toDouble(), 'g', 15).toUtf8().constData();
        break;
    case QMetaType::Bool:
        c.append_attribute("t") = "b";
        c.append_child("v").text() = value.toBool() ? "1" : "0";
        break;
    default: {
        c.append_attribute("t") = "inlineStr";
        auto t = c.append_child("is").append_child("t");
        t.append_attribute("xml:space") = "preserve";
        t.text() = value.toString().toUtf8().constData();
    }
    }
    return c;
}

QByteArray serialize(const pugi::xml_document &doc) {
    XmlPart part;
    part.doc().reset(doc);
    return part.save();
}

} // namespace

QString columnName(int index) {
    QString name;
    for(int n = index + 1; n > 0; n = (n - 1) / 26) name.prepend(QChar('A' + (n - 1) % 26));
    return name;
}

int columnIndex(const QString &cellRef) {
    int col = 0;
    int letters = 0;
    for(const QChar ch : cellRef) {
        const char16_t u = ch.toUpper().unicode();
        if(u < 'A' || u > 'Z') break;
        col = col * 26 + (u - 'A' + 1);
        ++letters;
    }
    return letters ? col - 1 : -1;
}

std::optional<Table> readWorkbook(const QString &path, WorkbookError *error) {
    auto fail = [error](WorkbookError e) { if(error) *error = e; return std::optional<Table>(); };
    Package pkg;
    if(!pkg.open(path)) {
        qWarning("readWorkbook: cannot open %s", qUtf8Printable(path));
        return fail(WorkbookError::OpenFailed);
    }
    WorkbookError locateError = WorkbookError::SheetMissing;
    const QString sheetPart = locateFirstSheet(pkg, &locateError);
    if(sheetPart.isEmpty()) return fail(locateError);

    QStringList shared;
    if(!loadSharedStrings(pkg, shared)) return fail(WorkbookError::XmlParseFailed);

    XmlPart sheet;
    const auto sheetData = pkg.readPart(sheetPart);
    if(!sheetData) return fail(WorkbookError::SheetMissing);
    if(!sheet.load(*sheetData)) {
        qWarning("readWorkbook: %s: %s", qUtf8Printable(sheetPart), qUtf8Printable(sheet.errorString()));
        return fail(WorkbookError::XmlParseFailed);
    }

    std::map<int, std::map<int, QVariant>> grid;
    int maxCol = -1;
    int nextRow = 1;
    for(const auto &rn : sheet.selectAll("//*[local-name()='sheetData']/*[local-name()='row']")) {
        const auto row = rn.node();
        bool ok = false;
        int rowNumber = QString::fromUtf8(row.attribute("r").value()).toInt(&ok);
        if(!ok || rowNumber < 1) rowNumber = nextRow;
        nextRow = rowNumber + 1;
        int nextCol = 0;
        auto &cells = grid[rowNumber];
        for(auto c = row.first_child(); c; c = c.next_sibling()) {
            if(c.type() != pugi::node_element || std::strcmp(localName(c), "c") != 0) continue;
            int col = columnIndex(QString::fromUtf8(c.attribute("r").value()));
            if(col < 0) col = nextCol;
            nextCol = col + 1;
            const QVariant v = cellValue(c, shared);
            if(isBlank(v)) continue;
            cells[col] = v;
            maxCol = std::max(maxCol, col);
        }
    }

    auto headerIt = grid.begin();
    while(headerIt != grid.end() && headerIt->second.empty()) ++headerIt;
    if(headerIt == grid.end()) return fail(WorkbookError::EmptySheet);

    QStringList columns;
    for(int c = 0; c <= maxCol; ++c) {
        auto it = headerIt->second.find(c);
        columns << (it == headerIt->second.end() ? QStringLiteral("Unnamed: %1").arg(c) : formatCellValue(it->second));
    }
    Table table(columns);
    for(auto it = std::next(headerIt); it != grid.end(); ++it) {
        if(it->second.empty()) continue;
        QVariantList values;
        for(int c = 0; c <= maxCol; ++c) {
            auto cell = it->second.find(c);
            values << (cell == it->second.end() ? QVariant() : cell->second);
        }
        table.addRow(values);
    }
    qInfo("readWorkbook: %s: %lld columns, %d rows", qUtf8Printable(path),
          static_cast<long long>(columns.size()), table.rowCount());
    return table;
}

bool writeWorkbook(const QString &path, const Table &table) {
    Package pkg;
    pkg.writePart(QStringLiteral("[Content_Types].xml"), QByteArray(
        "<?xml version=\"1.0\" encoding=\"UTF-8\" standalone=\"yes\"?>"
        "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
        "<Default Extension=\"rels\" ContentType=\"application/vnd.openxmlformats-package.relationships+xml\"/>"
        "<Default Extension=\"xml\" ContentType=\"application/xml\"/>"
        "<Override PartName=\"/xl/workbook.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.sheet.main+xml\"/>"
        "<Override PartName=\"/xl/worksheets/sheet1.xml\" ContentType=\"application/vnd.openxmlformats-officedocument.spreadsheetml.worksheet+xml\"/>"
        "</Types>"));

    pugi::xml_document rootRels;
    auto rr = rootRels.append_child("Relationships");
    rr.append_attribute("xmlns") = kPkgRelNs;
    auto r1 = rr.append_child("Relationship");
    r1.append_attribute("Id") = "rId1";
    r1.append_attribute("Type") = "http://schemas.openxmlformats.org/officeDocument/2006/relationships/officeDocument";
    r1.append_attribute("Target") = "xl/workbook.xml";
    pkg.writePart(QStringLiteral("_rels/.rels"), serialize(rootRels));

    pugi::xml_document wb;
    auto wbRoot = wb.append_child("workbook");
    wbRoot.append_attribute("xmlns") = kMainNs;
    wbRoot.append_attribute("xmlns:r") = kRelNs;
    auto sheetEl = wbRoot.append_child("sheets").append_child("sheet");
    sheetEl.append_attribute("name") = "Sheet1";
    sheetEl.append_attribute("sheetId") = "1";
    sheetEl.append_attribute("r:id") = "rId1";
    pkg.writePart(QStringLiteral("xl/workbook.xml"), serialize(wb));

    pugi::xml_document wbRels;
    auto wr = wbRels.append_child("Relationships");
    wr.append_attribute("xmlns") = kPkgRelNs;
    auto w1 = wr.append_child("Relationship");
    w1.append_attribute("Id") = "rId1";
    w1.append_attribute("Type") = kWorksheetRel;
    w1.append_attribute("Target") = "worksheets/sheet1.xml";
    pkg.writePart(QStringLiteral("xl/_rels/workbook.xml.rels"), serialize(wbRels));

    pugi::xml_document ws;
    auto wsRoot = ws.append_child("worksheet");
    wsRoot.append_attribute("xmlns") = kMainNs;
    auto data = wsRoot.append_child("sheetData");
    auto header = data.append_child("row");
    header.append_attribute("r") = 1;
    for(int c = 0; c < table.columns().size(); ++c) appendCell(header, c, 1, table.columns().at(c));
    int rowNumber = 2;
    for(const auto &rec : table.records()) {
        auto row = data.append_child("row");
        row.append_attribute("r") = rowNumber;
        for(int c = 0; c < rec.size(); ++c) {
            const QVariant v = rec.value(c);
            if(v.isValid()) appendCell(row, c, rowNumber, v);
        }
        ++rowNumber;
    }
    pkg.writePart(QStringLiteral("xl/worksheets/sheet1.xml"), serialize(ws));
    return pkg.saveAs(path);
}

bool writeTemplateWorkbook(const QString &path) {
    Table t({QStringLiteral("姓名"), QStringLiteral("学号"), QStringLiteral("班级"),
             QStringLiteral("听力"), QStringLiteral("阅读"), QStringLiteral("写作")});
    t.addRow({QStringLiteral("张三"), QStringLiteral("2024001"), QStringLiteral("一班"), 18.0, 32.5, 20.0});
    t.addRow({QStringLiteral("李四"), QStringLiteral("2024002"), QStringLiteral("一班"), 20.0, 30.0, 18.5});
    t.addRow({QStringLiteral("王五"), QStringLiteral("2024003"), QStringLiteral("二班"), 15.0, 35.0, 21.0});
    return writeWorkbook(path, t);
}

const char * toString(WorkbookError error) {
    switch(error) {
    case WorkbookError::OpenFailed: return "OpenFailed";
    case WorkbookError::WorkbookPartMissing: return "WorkbookPartMissing";
    case WorkbookError::SheetMissing: return "SheetMissing";
    case WorkbookError::XmlParseFailed: return "XmlParseFailed";
    case WorkbookError::EmptySheet: return "EmptySheet";
    }
    return "?";
}

} // namespace QtGridSheet
