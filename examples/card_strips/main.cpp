#include <QtGridSheet/CardSheet.hpp>
#include <QtGridSheet/Workbook.hpp>
#include <QCommandLineParser>
#include <QGuiApplication>
#include <iostream>

// Card strips from a score workbook: one rounded card per student, several per A4 page.

using namespace QtGridSheet;

static bool parseNumber(const QCommandLineParser &p, const QString &name, qreal &out){
    if(!p.isSet(name)) return true;
    bool ok = false; const qreal v = p.value(name).toDouble(&ok);
    if(!ok) { std::cerr << "--" << qPrintable(name) << " expects a number" << std::endl; return false; }
    out = v; return true;
}

static bool parseInt(const QCommandLineParser &p, const QString &name, int &out){
    if(!p.isSet(name)) return true;
    bool ok = false; const int v = p.value(name).toInt(&ok);
    if(!ok) { std::cerr << "--" << qPrintable(name) << " expects an integer" << std::endl; return false; }
    out = v; return true;
}

int main(int argc, char **argv){
    QGuiApplication app(argc, argv);
    QCoreApplication::setApplicationName("gridsheet-cards");
    QCommandLineParser parser;
    parser.setApplicationDescription("Render student score cards from an .xlsx workbook into a PDF.");
    parser.addHelpOption();
    parser.addOptions({
        {"excel", "Input workbook.", "path"},
        {"pdf", "Output PDF.", "path"},
        {"font", "CJK-capable TTF/TTC font file.", "path"},
        {"title", "Page header title.", "text"},
        {"card-title", "Label at the right of each card title.", "text"},
        {"cols", "Cards per row.", "n"},
        {"rows", "Card rows per page (reduced when they do not fit).", "n"},
        {"portrait", "Portrait pages (default)."},
        {"landscape", "Landscape pages."},
        {"card-h", "Card height in points.", "pt"},
        {"margin", "Page margin in points.", "pt"},
        {"gutter", "Space between cards in points.", "pt"},
        {"fields", "Comma separated columns shown on each card (default: all score columns).", "a,b"},
        {"preview", "Also write a PNG preview of page 1.", "png"},
        {"dpi", "Preview resolution.", "n", "144"},
        {"write-template", "Write a blank input workbook and exit.", "path"},
    });
    parser.process(app);

    if(parser.isSet("write-template")) {
        const QString path = parser.value("write-template");
        if(!writeTemplateWorkbook(path)) { std::cerr << "cannot write " << qPrintable(path) << std::endl; return 1; }
        std::cout << "template written to " << qPrintable(path) << std::endl;
        return 0;
    }
    if(!parser.isSet("excel") || !parser.isSet("pdf")) {
        std::cerr << "--excel and --pdf are required" << std::endl;
        parser.showHelp(2);
    }

    WorkbookError err = WorkbookError::OpenFailed;
    auto table = readWorkbook(parser.value("excel"), &err);
    if(!table) {
        std::cerr << "cannot read " << qPrintable(parser.value("excel")) << ": " << toString(err) << std::endl;
        return 1;
    }

    CardSheetOptions o;
    if(parser.isSet("title")) o.title = parser.value("title");
    if(parser.isSet("card-title")) o.cardTitle = parser.value("card-title");
    o.fontPath = parser.value("font");
    o.landscape = parser.isSet("landscape") && !parser.isSet("portrait");
    if(!parseInt(parser, "cols", o.cols) || !parseInt(parser, "rows", o.rows) ||
       !parseNumber(parser, "card-h", o.cardHeight) || !parseNumber(parser, "margin", o.margin) ||
       !parseNumber(parser, "gutter", o.gutter)) return 2;
    if(parser.isSet("fields")) {
        for(const auto &f : parser.value("fields").split(',', Qt::SkipEmptyParts)) o.fields << f.trimmed();
    }

    CardSheet sheet(*table);
    sheet.setOptions(o);
    if(!sheet.save(parser.value("pdf"))) {
        std::cerr << "failed: " << toString(*sheet.lastError()) << std::endl;
        return 1;
    }
    for(const auto &w : sheet.warnings()) std::cerr << "warning: " << qPrintable(w) << std::endl;
    if(auto s = sheet.layoutSummary())
        std::cout << table->rowCount() << " cards, " << s->cols << "x" << s->rows << " per page, " << s->pages
                  << " pages -> " << qPrintable(parser.value("pdf")) << std::endl;

    if(parser.isSet("preview")) {
        int dpi = 144;
        if(!parseInt(parser, "dpi", dpi)) return 2;
        const QImage img = sheet.renderPreview(dpi);
        if(img.isNull() || !img.save(parser.value("preview"))) {
            std::cerr << "cannot write preview " << qPrintable(parser.value("preview")) << std::endl;
            return 1;
        }
    }
    return 0;
}
