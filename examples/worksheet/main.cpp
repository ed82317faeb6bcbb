#include <QtGridSheet/Worksheet.hpp>
#include <QCommandLineParser>
#include <QFile>
#include <QGuiApplication>
#include <iostream>

// Dictation worksheet: the same header and numbered item list repeated over one A4 page.

using namespace QtGridSheet;

int main(int argc, char **argv){
    QGuiApplication app(argc, argv);
    QCoreApplication::setApplicationName("gridsheet-worksheet");
    QCommandLineParser parser;
    parser.setApplicationDescription("Render a dictation worksheet PDF from a list of items.");
    parser.addHelpOption();
    parser.addOptions({
        {"date", "Date shown in the header.", "text", "1111"},
        {"scope", "Unit or scope shown in the header.", "text", "eager-effort"},
        {"items", "Text file with one item per line.", "path"},
        {"pdf", "Output PDF.", "path"},
        {"cols", "Blocks per row (1-4).", "n", "2"},
        {"rows", "Block rows (1-5).", "n", "3"},
        {"font-size", "Font size in points (8-16).", "pt", "11"},
        {"padding", "Inner block padding in millimetres (1-10).", "mm", "3"},
        {"font", "CJK font file (SimSun or similar).", "path"},
        {"landscape", "Landscape page."},
        {"preview", "Also write a PNG preview.", "png"},
    });
    parser.process(app);
    if(!parser.isSet("items") || !parser.isSet("pdf")) {
        std::cerr << "--items and --pdf are required" << std::endl;
        parser.showHelp(2);
    }

    QFile in(parser.value("items"));
    if(!in.open(QIODevice::ReadOnly | QIODevice::Text)) {
        std::cerr << "cannot read " << qPrintable(in.fileName()) << ": " << qPrintable(in.errorString()) << std::endl;
        return 1;
    }
    const QStringList items = QString::fromUtf8(in.readAll()).split('\n');

    WorksheetOptions o;
    o.date = parser.value("date");
    o.scope = parser.value("scope");
    o.fontPath = parser.value("font");
    o.landscape = parser.isSet("landscape");
    bool ok = true, all = true;
    o.cols = parser.value("cols").toInt(&ok); all &= ok;
    o.rows = parser.value("rows").toInt(&ok); all &= ok;
    o.fontSize = parser.value("font-size").toDouble(&ok); all &= ok;
    o.paddingMm = parser.value("padding").toDouble(&ok); all &= ok;
    if(!all) { std::cerr << "numeric option expected" << std::endl; return 2; }

    Worksheet sheet(items);
    sheet.setOptions(o);
    if(!sheet.save(parser.value("pdf"))) {
        std::cerr << "failed: " << toString(*sheet.lastError()) << std::endl;
        return 1;
    }
    for(const auto &w : sheet.warnings()) std::cerr << "warning: " << qPrintable(w) << std::endl;
    std::cout << sheet.items().size() << " items -> " << qPrintable(parser.value("pdf")) << std::endl;

    if(parser.isSet("preview")) {
        const QImage img = sheet.renderPreview();
        if(img.isNull() || !img.save(parser.value("preview"))) {
            std::cerr << "cannot write preview " << qPrintable(parser.value("preview")) << std::endl;
            return 1;
        }
    }
    return 0;
}
