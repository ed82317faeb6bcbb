// Diagnostics test: configuration errors, ambiguous schema, write failure, fallback font, warnings
#include "QtGridSheet/CardSheet.hpp"
#include "QtGridSheet/Worksheet.hpp"
#include "support/FixedTypeface.hpp"
#include <QFile>
#include <QGuiApplication>
#include <QTemporaryDir>
#include <cassert>
#include <iostream>
#include <string>

using namespace QtGridSheet;

static Table scores(int rows){
    Table t({QStringLiteral("姓名"), QStringLiteral("学号"), QStringLiteral("班级"), QStringLiteral("听力"), QStringLiteral("阅读")});
    for(int i = 0; i < rows; ++i) t.addRow({QStringLiteral("学生%1").arg(i), 2024000.0 + i, QStringLiteral("一班"), 18.0, 30.5});
    return t;
}

int main(int argc, char **argv){
    qputenv("QT_QPA_PLATFORM", "offscreen");
    QGuiApplication app(argc, argv);
    QTemporaryDir dir; assert(dir.isValid());

    // Empty record set: rejected, no file
    {
        CardSheet s(scores(0)); s.setFont(test::fixedFont());
        const QString out = dir.path() + "/empty.pdf";
        assert(!s.save(out));
        assert(s.lastError().has_value() && s.lastError().value() == CardSheet::ErrorCode::EmptyRecordSet);
        assert(!QFile::exists(out));
        s.clearError(); assert(!s.lastError());
    }
    // Unknown selected fields only: warning plus NoFieldsSelected
    {
        CardSheet s(scores(3)); s.setFont(test::fixedFont());
        CardSheetOptions o; o.fields = QStringList{"Physics"}; s.setOptions(o); s.setFont(test::fixedFont());
        assert(!s.layout());
        assert(s.lastError().value() == CardSheet::ErrorCode::NoFieldsSelected);
        assert(s.warnings().size() == 1 && s.warnings().front().contains("Physics"));
    }
    // Only identity columns: nothing left to show
    {
        Table t({"Name", "Code", "Class"}); t.addRow({"a", 1.0, "b"});
        CardSheet s(t); s.setFont(test::fixedFont());
        assert(!s.layout() && s.lastError().value() == CardSheet::ErrorCode::NoFieldsSelected);
    }
    // Non-positive grid
    {
        CardSheet s(scores(3));
        CardSheetOptions o; o.cols = 0; s.setOptions(o); s.setFont(test::fixedFont());
        assert(!s.save(dir.path() + "/grid.pdf") && s.lastError().value() == CardSheet::ErrorCode::InvalidGrid);
        assert(!s.layoutSummary());
        o.cols = 2; o.rows = 0; s.setOptions(o);
        assert(!s.layout() && s.lastError().value() == CardSheet::ErrorCode::InvalidGrid);
        o.rows = 6; o.cardHeight = -1; s.setOptions(o);
        assert(!s.layout() && s.lastError().value() == CardSheet::ErrorCode::InvalidGrid);
    }
    // Ambiguous schema
    {
        Table t({"x", "y"}); t.addRow({"1", "2"});
        CardSheet s(t); s.setFont(test::fixedFont());
        assert(!s.layout() && s.lastError().value() == CardSheet::ErrorCode::AmbiguousSchema);
        assert(std::string(toString(CardSheet::ErrorCode::AmbiguousSchema)) == "AmbiguousSchema");
    }
    // No class column and identity columns out of position: cards still render, class shares the name column
    {
        Table t({QStringLiteral("听力"), QStringLiteral("阅读"), QStringLiteral("姓名"), QStringLiteral("学号"), QStringLiteral("写作")});
        t.addRow({18.0, 30.0, QStringLiteral("张三"), 2024001.0, 20.5});
        CardSheet s(t); s.setFont(test::fixedFont());
        const QString out = dir.path() + "/noclass.pdf";
        assert(s.save(out) && QFile::exists(out));
        assert(!s.lastError());
        assert(s.selectedFields() == (QStringList{QStringLiteral("听力"), QStringLiteral("阅读"), QStringLiteral("写作")}));
        assert(s.warnings().size() == 1 && s.warnings().front().contains("class"));
        auto pages = s.layout(); assert(pages);
        assert(pages->pages()[0].texts().contains(QStringLiteral("张三 2024001")));
    }
    // Default font path: worded as a missing setting, not a missing file
    {
        CardSheet s(scores(1));
        auto pages = s.layout(); assert(pages);
        assert(s.warnings().size() == 1 && s.warnings().front().startsWith("no font file given"));
        assert(!s.warnings().front().contains("''"));
        Worksheet w({"a"});
        assert(w.layout());
        assert(w.warnings().filter("no font file given").size() == 1);
    }
    // Rows clamped: layout proceeds, warning recorded
    {
        CardSheet s(scores(30));
        CardSheetOptions o; o.rows = 20; s.setOptions(o); s.setFont(test::fixedFont());
        auto pages = s.layout(); assert(pages);
        auto sum = s.layoutSummary(); assert(sum && sum->rowsClamped && sum->rows == 6 && sum->requestedRows == 20);
        assert(pages->pageCount() == 3);
        assert(s.warnings().size() == 1 && s.warnings().front().contains("rows"));
    }
    // Write failure propagates
    {
        CardSheet s(scores(3)); s.setFont(test::fixedFont());
        assert(!s.save("/nonexistent/dir/out.pdf"));
        assert(s.lastError().value() == CardSheet::ErrorCode::WriteFailed);
        Worksheet w({"one"}); w.setFonts(test::fixedFont(), test::fixedFont(true));
        assert(!w.save("/nonexistent/dir/out.pdf") && w.lastError().value() == Worksheet::ErrorCode::WriteFailed);
    }
    // Missing font degrades to the fallback face with a warning
    {
        FontRegistry fonts;
        auto face = fonts.resolve(dir.path() + "/missing.ttf");
        assert(face && face->isFallback());
        assert(fonts.resolve(QString())->isFallback());
        QFile garbage(dir.path() + "/garbage.ttf"); assert(garbage.open(QIODevice::WriteOnly)); garbage.write("not a font"); garbage.close();
        assert(fonts.resolve(garbage.fileName())->isFallback());
        assert(!fonts.serif()->isFallback());
        assert(fonts.fallback(QFont::Bold)->advance('M', 10) > 0);

        CardSheet s(scores(2));
        CardSheetOptions o; o.fontPath = dir.path() + "/missing.ttf"; s.setOptions(o);
        const QString out = dir.path() + "/fallback.pdf";
        assert(s.save(out) && QFile::exists(out));
        assert(!s.lastError());
        assert(s.warnings().size() == 1 && s.warnings().front().contains("missing.ttf"));
    }
    // Worksheet: no items, header overflow, dropped items
    {
        Worksheet none({"  ", ""});
        assert(none.items().isEmpty());
        assert(!none.layout() && none.lastError().value() == Worksheet::ErrorCode::NoItems);

        Worksheet w({"alpha"});
        WorksheetOptions o; o.scope = QString(400, QChar('x')); w.setOptions(o);
        w.setFonts(test::fixedFont(), test::fixedFont(true));
        assert(w.layout());
        assert(w.fittedHeader()->overflow);
        assert(w.warnings().size() == 1 && w.warnings().front().contains("header"));

        QStringList many; for(int i = 0; i < 200; ++i) many << QStringLiteral("item %1").arg(i);
        Worksheet full(many); full.setFonts(test::fixedFont(), test::fixedFont(true));
        assert(full.layout() && full.droppedItems() > 0);
        assert(full.warnings().size() == 1 && full.warnings().front().contains("do not fit"));

        Worksheet bad({"a"});
        WorksheetOptions b; b.cols = 0; bad.setOptions(b); bad.setFonts(test::fixedFont(), test::fixedFont(true));
        assert(!bad.layout() && bad.lastError().value() == Worksheet::ErrorCode::InvalidGrid);
        assert(!bad.fittedHeader());
    }
    std::cout << "diagnostics_test passed" << std::endl;
    return 0;
}
