#include "QtGridSheet/CardSheet.hpp"
#include "QtGridSheet/Builder.hpp"
#include "QtGridSheet/RenderBackend.hpp"
#include <QDebug>
#include <algorithm>

namespace QtGridSheet {

CardSheet::CardSheet(Table table)
    : m_table(std::move(table)) {}

void CardSheet::addWarning(const QString &w) {
    if(m_warnings.contains(w)) return;
    m_warnings << w;
    qWarning("CardSheet: %s", qUtf8Printable(w));
}

const MixedFont & CardSheet::ensureFont() {
    if(!m_font) {
        auto face = m_fonts.resolve(m_options.fontPath);
        m_font = makeUniformFont(face);
    }
    if(m_font->wide && m_font->wide->isFallback()) {
        if(m_options.fontPath.isEmpty())
            addWarning(QStringLiteral("no font file given, using %1; Chinese text may not render")
                           .arg(m_font->wide->name()));
        else
            addWarning(QStringLiteral("font '%1' unavailable, using %2; Chinese text may not render")
                           .arg(m_options.fontPath, m_font->wide->name()));
    }
    return *m_font;
}

std::optional<GridLayout> CardSheet::makeGrid() const {
    const QSizeF page = pageSizePoints(m_options.landscape);
    GridSpec spec;
    spec.pageWidth = page.width();
    spec.pageHeight = page.height();
    spec.margin = std::max<qreal>(0.0, m_options.margin);
    spec.gutter = std::max<qreal>(0.0, m_options.gutter);
    spec.cols = m_options.cols;
    spec.rows = m_options.rows;
    spec.cellHeight = m_options.cardHeight;
    spec.mode = GridMode::FixedCell;
    return GridLayout::create(spec);
}

CardStyle CardSheet::cardStyle(const MixedFont &font) const {
    CardStyle style;
    style.font = font;
    style.titleSize = std::max<qreal>(1.0, m_options.titleFontSize);
    style.asideSize = std::max<qreal>(1.0, m_options.cardTitleFontSize);
    style.bodySize = std::max<qreal>(1.0, m_options.bodyFontSize);
    style.padding = std::max<qreal>(0.0, m_options.padding);
    style.cornerRadius = std::max<qreal>(0.0, m_options.cornerRadius);
    return style;
}

QStringList CardSheet::selectedFields() const {
    const auto roles = m_resolver.resolve(m_table.columns());
    if(!roles.ok()) return {};
    const QStringList detail = RoleResolver::detailColumns(m_table.columns(), *roles.assignment);
    if(m_options.fields.isEmpty()) return detail;
    QStringList out;
    for(const auto &f : m_options.fields) if(detail.contains(f) && !out.contains(f)) out << f;
    return out;
}

std::optional<LayoutSummary> CardSheet::layoutSummary() const {
    const auto grid = makeGrid();
    if(!grid) return std::nullopt;
    LayoutSummary s;
    s.cols = grid->cols();
    s.requestedRows = m_options.rows;
    s.rows = grid->effectiveRows();
    s.rowsClamped = grid->rowsClamped();
    s.cardsPerPage = grid->cellsPerPage();
    s.cardWidth = grid->cellWidth();
    s.cardHeight = grid->cellHeight();
    s.pages = (m_table.rowCount() + s.cardsPerPage - 1) / s.cardsPerPage;
    return s;
}

std::optional<PageSet> CardSheet::layout(Paginator::Mode mode) {
    clearError();
    m_warnings.clear();
    if(m_table.isEmpty()) { setError(ErrorCode::EmptyRecordSet); return std::nullopt; }

    const auto roles = m_resolver.resolve(m_table.columns());
    if(!roles.ok()) {
        qWarning("CardSheet: cannot resolve %s column (too few columns)", toString(roles.failedRole));
        setError(ErrorCode::AmbiguousSchema);
        return std::nullopt;
    }
    for(const auto role : {IdentityRole::Name, IdentityRole::Code, IdentityRole::Class}) {
        const RoleBinding &b = (*roles.assignment)[role];
        if(!b.shared) continue;
        addWarning(QStringLiteral("no %1 column found; column '%2' is used for it as well")
                       .arg(QString::fromLatin1(toString(role)), m_table.columns().at(b.column)));
    }
    for(const auto &f : m_options.fields) {
        if(!m_table.columns().contains(f)) addWarning(QStringLiteral("unknown field '%1' ignored").arg(f));
    }
    const QStringList fields = selectedFields();
    if(fields.isEmpty()) { setError(ErrorCode::NoFieldsSelected); return std::nullopt; }

    const auto grid = makeGrid();
    if(!grid) { setError(ErrorCode::InvalidGrid); return std::nullopt; }
    if(grid->rowsClamped()) {
        qInfo("CardSheet: %d rows requested, %d fit on the page", m_options.rows, grid->effectiveRows());
        addWarning(QStringLiteral("only %1 of %2 rows fit on a page").arg(grid->effectiveRows()).arg(m_options.rows));
    }

    const MixedFont &font = ensureFont();
    const CardStyle style = cardStyle(font);
    const qreal headerSize = std::max<qreal>(1.0, m_options.headerFontSize);
    const QSizeF pageSize = pageSizePoints(m_options.landscape);

    PageSet pages(pageSize);
    pages.title = m_options.title;
    Paginator paginator(*grid);
    paginator.setMode(mode);
    paginator.setSeedHeader(true);
    paginator.setPageCallback([&](int pageIndex) {
        Page &page = pages.newPage();
        const QString header = QStringLiteral("%1  —  Page %2").arg(m_options.title).arg(pageIndex);
        page.drawText(grid->spec().margin, pageSize.height() - grid->spec().margin + 10, header, font, headerSize,
                      QColor(38, 38, 38));
    });
    paginator.setCellCallback([&](int index, const CellBox &box, int) {
        const Record &record = m_table.records().at(static_cast<size_t>(index));
        renderCard(pages.current(), box,
                   makeCardContent(record, *roles.assignment, fields, m_options.cardTitle, m_options.titleRoles),
                   style);
    });
    const auto result = paginator.run(m_table.rowCount());
    qDebug() << "CardSheet: laid out" << result.emitted << "cards on" << result.pages << "pages";
    return pages;
}

bool CardSheet::save(const QString &pdfPath) {
    auto pages = layout(Paginator::Mode::Full);
    if(!pages) return false;
    PdfBackend backend(pdfPath);
    if(!backend.render(*pages)) {
        setError(ErrorCode::WriteFailed);
        return false;
    }
    qInfo("CardSheet: %d cards on %d pages written to %s", m_table.rowCount(), pages->pageCount(),
          qUtf8Printable(pdfPath));
    return true;
}

QImage CardSheet::renderPreview(int dpi) {
    auto pages = layout(Paginator::Mode::Preview);
    if(!pages) return {};
    ImageBackend backend(dpi);
    if(!backend.render(*pages)) {
        setError(ErrorCode::RenderFailed);
        return {};
    }
    return backend.image();
}

const char * toString(CardSheet::ErrorCode ec) {
    switch(ec) {
    case CardSheet::ErrorCode::EmptyRecordSet: return "EmptyRecordSet";
    case CardSheet::ErrorCode::NoFieldsSelected: return "NoFieldsSelected";
    case CardSheet::ErrorCode::InvalidGrid: return "InvalidGrid";
    case CardSheet::ErrorCode::AmbiguousSchema: return "AmbiguousSchema";
    case CardSheet::ErrorCode::WriteFailed: return "WriteFailed";
    case CardSheet::ErrorCode::RenderFailed: return "RenderFailed";
    }
    return "?";
}

} // namespace QtGridSheet
