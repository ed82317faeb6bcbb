#include "QtGridSheet/Grid.hpp"
#include <QPageSize>
#include <algorithm>
#include <cmath>

namespace QtGridSheet {

RowClamp clampRows(int requested, qreal usableHeight, qreal cellHeight, qreal gutter) {
    RowClamp r;
    const qreal pitch = cellHeight + gutter;
    int fit = 1;
    if(pitch > 0) {
        // bound in floating point first; the quotient can exceed int for tiny pitches
        const qreal q = std::floor((usableHeight + gutter) / pitch);
        if(q >= requested) fit = requested;
        else if(q > 1) fit = static_cast<int>(q);
    }
    r.value = std::max(1, std::min(requested, fit));
    r.clamped = r.value < requested;
    return r;
}

std::optional<GridLayout> GridLayout::create(const GridSpec &spec, GridError *error) {
    auto fail = [error](GridError e) { if(error) *error = e; return std::optional<GridLayout>(); };
    if(spec.cols < 1) return fail(GridError::NonPositiveColumns);
    if(spec.rows < 1) return fail(GridError::NonPositiveRows);
    GridLayout g;
    g.m_spec = spec;
    g.m_spec.gutter = std::max<qreal>(0.0, spec.gutter);
    const qreal gutter = g.m_spec.gutter;
    g.m_cellWidth = (spec.usableWidth() - (spec.cols - 1) * gutter) / spec.cols;
    if(g.m_cellWidth <= 0) return fail(GridError::NonPositiveCellWidth);
    if(spec.mode == GridMode::Tiled) {
        g.m_rows = {spec.rows, false};
        g.m_cellHeight = (spec.usableHeight() - (spec.rows - 1) * gutter) / spec.rows;
    } else {
        g.m_cellHeight = spec.cellHeight;
        if(g.m_cellHeight > 0) g.m_rows = clampRows(spec.rows, spec.usableHeight(), g.m_cellHeight, gutter);
    }
    if(g.m_cellHeight <= 0) return fail(GridError::NonPositiveCellHeight);
    return g;
}

CellBox GridLayout::cellBox(int row, int col) const {
    row = std::clamp(row, 0, m_rows.value - 1);
    col = std::clamp(col, 0, m_spec.cols - 1);
    const qreal gutter = m_spec.gutter;
    CellBox b;
    b.width = m_cellWidth;
    b.height = m_cellHeight;
    b.x = m_spec.margin + col * (m_cellWidth + gutter);
    b.y = m_spec.pageHeight - m_spec.margin - m_cellHeight - row * (m_cellHeight + gutter);
    return b;
}

CellBox GridLayout::cellBoxAt(int position) const {
    const int pos = position % cellsPerPage();
    return cellBox(pos / m_spec.cols, pos % m_spec.cols);
}

CellBox GridLayout::usableArea() const {
    return {m_spec.margin, m_spec.margin, m_spec.usableWidth(), m_spec.usableHeight()};
}

QSizeF pageSizePoints(bool landscape) {
    QSizeF a4 = QPageSize::size(QPageSize::A4, QPageSize::Point);
    if(landscape) a4.transpose();
    return a4;
}

} // namespace QtGridSheet
