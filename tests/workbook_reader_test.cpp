// Workbook reading: shared strings, cell types, header detection, failures
#include "QtGridSheet/Workbook.hpp"
#include "opc/Package.hpp"
#include <QTemporaryDir>
#include <QFile>
#include <cassert>
#include <iostream>
#include <string>

using namespace QtGridSheet; using QtGridSheet::opc::Package;

static const QByteArray kContentTypes(
    "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
    "<Types xmlns=\"http://schemas.openxmlformats.org/package/2006/content-types\">"
    "<Default Extension=\"xml\" ContentType=\"application/xml\"/></Types>");

static Package basePackage(const QString &sheetTarget){
    Package pkg; pkg.writePart("[Content_Types].xml", kContentTypes);
    pkg.writePart("xl/workbook.xml", QByteArray(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<x:workbook xmlns:x=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" "
        "xmlns:r=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships\">"
        "<x:sheets><x:sheet name=\"Scores\" sheetId=\"1\" r:id=\"rId7\"/><x:sheet name=\"Other\" sheetId=\"2\" r:id=\"rId8\"/></x:sheets></x:workbook>"));
    pkg.writePart("xl/_rels/workbook.xml.rels", (QString(
        "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
        "<Relationships xmlns=\"http://schemas.openxmlformats.org/package/2006/relationships\">"
        "<Relationship Id=\"rId8\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet\" Target=\"worksheets/other.xml\"/>"
        "<Relationship Id=\"rId7\" Type=\"http://schemas.openxmlformats.org/officeDocument/2006/relationships/worksheet\" Target=\"%1\"/>"
        "</Relationships>").arg(sheetTarget)).toUtf8());
    return pkg;
}

static QString save(Package &pkg, QTemporaryDir &dir, const QString &name){
    const QString p = dir.path() + "/" + name; assert(pkg.saveAs(p)); return p;
}

int main(){
    QTemporaryDir dir; assert(dir.isValid());
    // Shared strings, rich text, phonetic runs, inline strings, booleans, errors, gaps
    {
        Package pkg = basePackage("/xl/worksheets/scores.xml");
        pkg.writePart("xl/sharedStrings.xml", QString(
            "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
            "<sst xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\" count=\"5\" uniqueCount=\"5\">"
            "<si><t>姓名</t></si><si><t>学号</t></si><si><t>班级</t></si>"
            "<si><r><t>听</t></r><r><t>力</t></r><rPh sb=\"0\" eb=\"1\"><t>ting</t></rPh></si>"
            "<si><t>张三</t></si></sst>").toUtf8());
        pkg.writePart("xl/worksheets/scores.xml", QString(
            "<?xml version=\"1.0\" encoding=\"UTF-8\"?>"
            "<worksheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\"><sheetData>"
            "<row r=\"2\"><c r=\"A2\" t=\"s\"><v>0</v></c><c r=\"B2\" t=\"s\"><v>1</v></c><c r=\"C2\" t=\"s\"><v>2</v></c>"
            "<c r=\"D2\" t=\"s\"><v>3</v></c><c r=\"F2\" t=\"inlineStr\"><is><t>Done</t></is></c></row>"
            "<row r=\"3\"><c r=\"A3\" t=\"s\"><v>4</v></c><c r=\"B3\"><v>2024001</v></c><c r=\"C3\" t=\"str\"><v>一班</v></c>"
            "<c r=\"D3\"><v>18.5</v></c><c r=\"E3\" t=\"e\"><v>#DIV/0!</v></c><c r=\"F3\" t=\"b\"><v>1</v></c></row>"
            "<row r=\"4\"><c r=\"A4\" t=\"inlineStr\"><is><t>  </t></is></c></row>"
            "<row r=\"6\"><c r=\"A6\" t=\"inlineStr\"><is><t>李四</t></is></c><c r=\"D6\"><v>4</v></c></row>"
            "</sheetData></worksheet>").toUtf8());
        WorkbookError err = WorkbookError::OpenFailed;
        auto table = readWorkbook(save(pkg, dir, "rich.xlsx"), &err);
        assert(table);
        assert(table->columns() == (QStringList{QStringLiteral("姓名"), QStringLiteral("学号"), QStringLiteral("班级"),
                                                 QStringLiteral("听力"), "Unnamed: 4", "Done"}));
        assert(table->rowCount() == 2);
        const Record &r = table->records()[0];
        assert(r.value(0).toString() == QStringLiteral("张三"));
        assert(r.value(1).toDouble() == 2024001.0);
        assert(r.value(2).toString() == QStringLiteral("一班"));
        assert(r.value(3).toDouble() == 18.5);
        assert(!r.value(4).isValid());
        assert(r.value(5).typeId() == QMetaType::Bool && r.value(5).toBool());
        const Record &r2 = table->records()[1];
        assert(r2.value(0).toString() == QStringLiteral("李四") && formatCellValue(r2.value(3)) == "4" && !r2.value(5).isValid());
    }
    // Cells without references fall into consecutive columns
    {
        Package pkg = basePackage("worksheets/sheet1.xml");
        pkg.writePart("xl/worksheets/sheet1.xml", QByteArray(
            "<worksheet xmlns=\"http://schemas.openxmlformats.org/spreadsheetml/2006/main\"><sheetData>"
            "<row><c t=\"inlineStr\"><is><t>name</t></is></c><c t=\"inlineStr\"><is><t>code</t></is></c></row>"
            "<row><c t=\"inlineStr\"><is><t>Bob</t></is></c><c><v>7</v></c></row>"
            "</sheetData></worksheet>"));
        auto table = readWorkbook(save(pkg, dir, "norefs.xlsx"));
        assert(table && table->columns() == (QStringList{"name", "code"}) && table->rowCount() == 1);
        assert(table->records()[0].value("code").toDouble() == 7.0);
    }
    // Round trip through the writer and the template
    {
        Table t({"Name", "Code", "Class", "Score"});
        t.addRow({"Ann", 1.0, "A", 9.25});
        t.addRow({"Ben", 2.0, QVariant(), false});
        const QString p = dir.path() + "/written.xlsx";
        assert(writeWorkbook(p, t));
        auto back = readWorkbook(p); assert(back);
        assert(back->columns() == t.columns() && back->rowCount() == 2);
        assert(back->records()[0].value("Score").toDouble() == 9.25);
        assert(!back->records()[1].value("Class").isValid());
        assert(back->records()[1].value("Score").toBool() == false && back->records()[1].value("Score").isValid());

        const QString tp = dir.path() + "/template.xlsx";
        assert(writeTemplateWorkbook(tp));
        auto tpl = readWorkbook(tp); assert(tpl);
        assert(tpl->columns().mid(0, 3) == (QStringList{QStringLiteral("姓名"), QStringLiteral("学号"), QStringLiteral("班级")}));
        assert(tpl->columns().size() == 6 && tpl->rowCount() == 3);
        Package pkg; assert(pkg.open(tp)); assert(pkg.partNames().contains("[Content_Types].xml"));
    }
    // Column references
    {
        assert(columnName(0) == "A" && columnName(25) == "Z" && columnName(26) == "AA" && columnName(701) == "ZZ");
        assert(columnIndex("C7") == 2 && columnIndex("aa10") == 26 && columnIndex("12") == -1);
        assert(Package::resolveTarget("xl/workbook.xml", "worksheets/sheet1.xml") == "xl/worksheets/sheet1.xml");
        assert(Package::resolveTarget("xl/workbook.xml", "/xl/worksheets/s.xml") == "xl/worksheets/s.xml");
        assert(Package::resolveTarget("xl/workbook.xml", "../docProps/app.xml") == "docProps/app.xml");
    }
    // Failures
    {
        WorkbookError err = WorkbookError::EmptySheet;
        assert(!readWorkbook("/nonexistent/in.xlsx", &err) && err == WorkbookError::OpenFailed);
        QFile junk(dir.path() + "/junk.xlsx"); assert(junk.open(QIODevice::WriteOnly)); junk.write("not a zip"); junk.close();
        assert(!readWorkbook(junk.fileName(), &err) && err == WorkbookError::OpenFailed);

        Package noWb; noWb.writePart("[Content_Types].xml", kContentTypes);
        assert(!readWorkbook(save(noWb, dir, "nowb.xlsx"), &err) && err == WorkbookError::WorkbookPartMissing);

        Package noSheet = basePackage("worksheets/missing.xml");
        assert(!readWorkbook(save(noSheet, dir, "nosheet.xlsx"), &err) && err == WorkbookError::SheetMissing);

        Package bad = basePackage("worksheets/sheet1.xml");
        bad.writePart("xl/worksheets/sheet1.xml", QByteArray("<worksheet><sheetData><row>"));
        assert(!readWorkbook(save(bad, dir, "bad.xlsx"), &err) && err == WorkbookError::XmlParseFailed);

        Package empty = basePackage("worksheets/sheet1.xml");
        empty.writePart("xl/worksheets/sheet1.xml", QByteArray("<worksheet><sheetData><row r=\"1\"/></sheetData></worksheet>"));
        assert(!readWorkbook(save(empty, dir, "empty.xlsx"), &err) && err == WorkbookError::EmptySheet);
        assert(std::string(toString(WorkbookError::EmptySheet)) == "EmptySheet");
    }
    std::cout << "workbook_reader_test passed" << std::endl;
    return 0;
}
