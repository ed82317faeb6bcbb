// PDF and preview output through the Qt backends
#include "QtGridSheet/CardSheet.hpp"
#include "QtGridSheet/RenderBackend.hpp"
#include "QtGridSheet/Workbook.hpp"
#include "support/FixedTypeface.hpp"
#include <QDir>
#include <QFile>
#include <QGuiApplication>
#include <QTemporaryDir>
#include <QtMath>
#include <cassert>
#include <iostream>

using namespace QtGridSheet;

static Table scores(int rows){
    Table t({QStringLiteral("姓名"), QStringLiteral("学号"), QStringLiteral("班级"), QStringLiteral("听力"), QStringLiteral("阅读"), QStringLiteral("写作")});
    for(int i = 0; i < rows; ++i) t.addRow({QStringLiteral("Student %1").arg(i), 1000.0 + i, "A", 18.0 + i / 2.0, 30.0, QVariant()});
    return t;
}

static bool hasInk(const QImage &img){
    for(int y = 0; y < img.height(); y += 2)
        for(int x = 0; x < img.width(); x += 2)
            if(img.pixel(x, y) != qRgb(255, 255, 255)) return true;
    return false;
}

int main(int argc, char **argv){
    qputenv("QT_QPA_PLATFORM", "offscreen");
    QGuiApplication app(argc, argv);
    QTemporaryDir dir; assert(dir.isValid());

    // 15 records on a 2x3 grid: 3 pages, the last with 3 cards
    {
        CardSheet s(scores(15));
        CardSheetOptions o; o.rows = 3; o.title = "Scores"; s.setOptions(o);
        auto pages = s.layout(); assert(pages);
        assert(pages->pageCount() == 3);
        assert(pages->pages()[0].rectCommands().size() == 6);
        assert(pages->pages()[2].rectCommands().size() == 3);
        for(const auto &p : pages->pages()){
            const QStringList texts = p.texts();
            assert(texts.front() == QStringLiteral("Scores  —  Page %1").arg(p.index()));
        }
        assert(pages->pages()[2].texts().contains("Student 14 1014"));
        assert(s.selectedFields() == (QStringList{QStringLiteral("听力"), QStringLiteral("阅读"), QStringLiteral("写作")}));
        assert(pages->pages()[0].texts().contains(QStringLiteral("写作: -")));
        assert(pages->pages()[0].texts().contains(QStringLiteral("听力: 18.5")));

        const QString out = dir.path() + "/cards.pdf";
        assert(s.save(out));
        QFile f(out); assert(f.open(QIODevice::ReadOnly));
        const QByteArray pdf = f.readAll();
        assert(pdf.startsWith("%PDF"));
        assert(pdf.size() > 1000);
    }
    // Field selection keeps the caller's order
    {
        CardSheet s(scores(2));
        CardSheetOptions o; o.fields = QStringList{QStringLiteral("写作"), QStringLiteral("听力"), QStringLiteral("写作")}; s.setOptions(o);
        assert(s.selectedFields() == (QStringList{QStringLiteral("写作"), QStringLiteral("听力")}));
        auto sum = s.layoutSummary(); assert(sum);
        assert(sum->cols == 2 && sum->rows == 6 && sum->cardsPerPage == 12 && sum->pages == 1 && sum->cardHeight == 110);
    }
    // Preview renders only page 1 worth of cards
    {
        CardSheet s(scores(40));
        auto preview = s.layout(Paginator::Mode::Preview); assert(preview);
        assert(preview->pageCount() == 1 && preview->pages()[0].rectCommands().size() == 12);
        QImage img = s.renderPreview(72);
        assert(!img.isNull());
        assert(img.width() == qCeil(pageSizePoints(false).width()));
        assert(hasInk(img));
        QImage hi = s.renderPreview(144);
        assert(hi.width() >= 2 * img.width() - 1);
    }
    // Landscape pages
    {
        CardSheet s(scores(5));
        CardSheetOptions o; o.landscape = true; s.setOptions(o);
        auto pages = s.layout(); assert(pages);
        assert(pages->pageSize().width() > pages->pageSize().height());
        QImage img = s.renderPreview(36);
        assert(img.width() > img.height());
    }
    // Backends on a hand-built page set
    {
        PageSet set(QSizeF(200, 100));
        set.title = "manual";
        Page &p1 = set.newPage();
        p1.drawRect({CellBox{10, 10, 50, 30}, 4, 1, Qt::red, QColor(Qt::yellow)});
        p1.drawLine({QPointF(0, 0), QPointF(200, 100), 2, Qt::blue});
        p1.drawText(20, 50, QStringLiteral("Hi 你好"), test::fixedFont(), 12);
        set.newPage().drawText(5, 5, "second", test::fixedFont(), 8);
        assert(set.pageCount() == 2 && set.pages()[1].index() == 2);

        PdfBackend pdf(dir.path() + "/manual.pdf");
        assert(pdf.render(set) && pdf.errorString().isEmpty());
        ImageBackend second(72, 2);
        assert(second.render(set) && second.image().size() == QSize(200, 100));
        ImageBackend first(72);
        assert(first.render(set));
        // fill color at the rectangle center (y flipped: page y 25 -> image row 75)
        assert(first.image().pixel(35, 75) == QColor(Qt::yellow).rgb());
        ImageBackend missing(72, 3);
        assert(!missing.render(set) && missing.image().isNull() && !missing.errorString().isEmpty());
        PdfBackend nowhere("/nonexistent/dir/manual.pdf");
        assert(!nowhere.render(set) && !nowhere.errorString().isEmpty());
        assert(!QFile::exists("/nonexistent/dir/manual.pdf"));
    }
    // A failed render leaves an existing output file as it was; a successful one replaces it
    {
        const QString target = dir.path() + "/existing.pdf";
        QFile f(target); assert(f.open(QIODevice::WriteOnly)); f.write("keep"); f.close();
        PdfBackend backend(target);
        assert(!backend.render(PageSet(QSizeF(200, 100))) && !backend.errorString().isEmpty());
        assert(f.open(QIODevice::ReadOnly)); assert(f.readAll() == "keep"); f.close();

        PageSet one(QSizeF(200, 100));
        one.newPage().drawText(5, 5, "fresh", test::fixedFont(), 8);
        assert(backend.render(one));
        assert(f.open(QIODevice::ReadOnly)); assert(f.readAll().startsWith("%PDF")); f.close();
        assert(QDir(dir.path()).entryList(QDir::Files).filter("existing").size() == 1);
    }
    std::cout << "render_output_test passed" << std::endl;
    return 0;
}
