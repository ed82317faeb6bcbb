#include "QtGridSheet/Worksheet.hpp"
#include "QtGridSheet/Builder.hpp"
#include "QtGridSheet/Paginator.hpp"
#include "QtGridSheet/RenderBackend.hpp"
#include "util/Units.hpp"
#include <QDebug>
#include <algorithm>

using namespace QtGridSheet::util;

namespace QtGridSheet {

Worksheet::Worksheet(QStringList items) {
    for(auto &item : items) {
        const QString t = item.trimmed();
        if(!t.isEmpty()) m_items << t;
    }
}

void Worksheet::addWarning(const QString &w) {
    if(m_warnings.contains(w)) return;
    m_warnings << w;
    qWarning("Worksheet: %s", qUtf8Printable(w));
}

void Worksheet::ensureFonts() {
    if(!m_body) m_body = makeMixedFont(m_fonts, m_options.fontPath, QFont::Normal);
    if(!m_emphasized) m_emphasized = makeMixedFont(m_fonts, m_options.fontPath, QFont::Bold);
    if(m_body->wide && m_body->wide->isFallback()) {
        if(m_options.fontPath.isEmpty())
            addWarning(QStringLiteral("no font file given, using %1; Chinese text may not render")
                           .arg(m_body->wide->name()));
        else
            addWarning(QStringLiteral("font '%1' unavailable, using %2; Chinese text may not render")
                           .arg(m_options.fontPath, m_body->wide->name()));
    }
}

std::optional<GridLayout> Worksheet::makeGrid() const {
    const QSizeF page = pageSizePoints(m_options.landscape);
    GridSpec spec;
    spec.pageWidth = page.width();
    spec.pageHeight = page.height();
    spec.margin = mmToPoints(std::max<qreal>(0.0, m_options.marginMm));
    spec.gutter = 0.0;
    // non-positive counts stay invalid; large ones are bounded
    spec.cols = std::min(m_options.cols, 4);
    spec.rows = std::min(m_options.rows, 5);
    spec.mode = GridMode::Tiled;
    return GridLayout::create(spec);
}

WorksheetStyle Worksheet::style() const {
    WorksheetStyle s;
    s.body = *m_body;
    s.emphasized = *m_emphasized;
    s.fontSize = std::clamp<qreal>(m_options.fontSize, 8.0, 16.0);
    s.leading = s.fontSize * m_options.leadingFactor;
    s.padding = mmToPoints(std::clamp<qreal>(m_options.paddingMm, 1.0, 10.0));
    return s;
}

std::optional<FitResult> Worksheet::fittedHeader() {
    const auto grid = makeGrid();
    if(!grid) return std::nullopt;
    ensureFonts();
    const WorksheetStyle s = style();
    const qreal innerWidth = grid->cellWidth() - 2 * s.padding;
    return fitHeaderDetailed(makeWorksheetHeader(m_options.date, m_options.scope), innerWidth, s.emphasized,
                             s.fontSize, m_options.fit);
}

std::optional<PageSet> Worksheet::layout() {
    clearError();
    m_warnings.clear();
    m_dropped = 0;
    if(m_items.isEmpty()) { setError(ErrorCode::NoItems); return std::nullopt; }
    const auto grid = makeGrid();
    if(!grid) { setError(ErrorCode::InvalidGrid); return std::nullopt; }

    const auto header = fittedHeader();
    if(header->overflow)
        addWarning(QStringLiteral("header \"%1\" is wider than the block even at minimum length").arg(header->text));
    const WorksheetStyle s = style();
    const WorksheetBlock block{header->text, m_items};

    PageSet pages(pageSizePoints(m_options.landscape));
    pages.title = QStringLiteral("%1-%2").arg(m_options.date, m_options.scope);
    Paginator paginator(*grid);
    paginator.setPageCallback([&](int) { pages.newPage(); });
    paginator.setCellCallback([&](int, const CellBox &box, int) {
        const auto r = renderWorksheetBlock(pages.current(), box, block, s);
        m_dropped = r.itemsDropped;
    });
    paginator.run(grid->cellsPerPage());
    if(m_dropped > 0)
        addWarning(QStringLiteral("%1 of %2 items do not fit in a block").arg(m_dropped).arg(m_items.size()));
    return pages;
}

bool Worksheet::save(const QString &pdfPath) {
    auto pages = layout();
    if(!pages) return false;
    PdfBackend backend(pdfPath);
    if(!backend.render(*pages)) {
        setError(ErrorCode::WriteFailed);
        return false;
    }
    qInfo("Worksheet: %lld items x %d blocks written to %s", static_cast<long long>(m_items.size()),
          std::min(m_options.cols, 4) * std::min(m_options.rows, 5), qUtf8Printable(pdfPath));
    return true;
}

QImage Worksheet::renderPreview(int dpi) {
    auto pages = layout();
    if(!pages) return {};
    ImageBackend backend(dpi);
    if(!backend.render(*pages)) {
        setError(ErrorCode::RenderFailed);
        return {};
    }
    return backend.image();
}

const char * toString(Worksheet::ErrorCode ec) {
    switch(ec) {
    case Worksheet::ErrorCode::NoItems: return "NoItems";
    case Worksheet::ErrorCode::InvalidGrid: return "InvalidGrid";
    case Worksheet::ErrorCode::WriteFailed: return "WriteFailed";
    case Worksheet::ErrorCode::RenderFailed: return "RenderFailed";
    }
    return "?";
}

} // namespace QtGridSheet
