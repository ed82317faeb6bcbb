/** \file Grid.hpp
 *  Page grid partitioning. Coordinates are points with a bottom-left origin (PDF convention).
 */
#pragma once
#include "QtGridSheet/Export.hpp"
#include <QSizeF>
#include <optional>

namespace QtGridSheet {

/** Cell rectangle, bottom-left origin. */
struct CellBox {
    qreal x{0.0};
    qreal y{0.0};
    qreal width{0.0};
    qreal height{0.0};

    qreal right() const { return x + width; }
    qreal top() const { return y + height; }
    bool contains(const CellBox &o, qreal eps = 1e-6) const {
        return o.x >= x - eps && o.y >= y - eps && o.right() <= right() + eps && o.top() <= top() + eps;
    }
    bool overlaps(const CellBox &o, qreal eps = 1e-6) const {
        return o.x < right() - eps && x < o.right() - eps && o.y < top() - eps && y < o.top() - eps;
    }
};

enum class GridMode {
    Tiled,    ///< cell height = usable height split evenly over rows; cells tile the usable area
    FixedCell ///< caller supplies cell height; rows clamped to what fits, leftover space unused
};

struct QTGRIDSHEET_EXPORT GridSpec {
    qreal pageWidth{0.0};
    qreal pageHeight{0.0};
    qreal margin{0.0};
    qreal gutter{0.0};
    int cols{1};
    int rows{1};
    qreal cellHeight{0.0}; ///< used in FixedCell mode only
    GridMode mode{GridMode::FixedCell};

    qreal usableWidth() const { return pageWidth - 2 * margin; }
    qreal usableHeight() const { return pageHeight - 2 * margin; }
};

/** Effective row count plus whether the request was reduced. */
struct RowClamp {
    int value{1};
    bool clamped{false};
};

/** Rows that fit vertically: min(requested, max(1, floor((usable + gutter) / (cell + gutter)))). */
QTGRIDSHEET_EXPORT RowClamp clampRows(int requested, qreal usableHeight, qreal cellHeight, qreal gutter);

enum class GridError {
    NonPositiveColumns,
    NonPositiveRows,
    NonPositiveCellWidth,
    NonPositiveCellHeight
};

/** Validated grid with derived cell size. Build with create(). */
class QTGRIDSHEET_EXPORT GridLayout {
public:
    /** Validate the grid and derive geometry. std::nullopt (and *error set) on an unusable configuration. */
    static std::optional<GridLayout> create(const GridSpec &spec, GridError *error = nullptr);

    const GridSpec & spec() const { return m_spec; }
    int cols() const { return m_spec.cols; }
    int effectiveRows() const { return m_rows.value; }
    bool rowsClamped() const { return m_rows.clamped; }
    int cellsPerPage() const { return m_spec.cols * m_rows.value; }
    qreal cellWidth() const { return m_cellWidth; }
    qreal cellHeight() const { return m_cellHeight; }

    /** Box of cell (row, col); row 0 is the topmost row. Indices are clamped into range. */
    CellBox cellBox(int row, int col) const;
    /** Box for a position within the page (row = pos / cols, col = pos % cols). */
    CellBox cellBoxAt(int position) const;
    /** Usable area inside the margins. */
    CellBox usableArea() const;

private:
    GridLayout() = default;
    GridSpec m_spec;
    RowClamp m_rows;
    qreal m_cellWidth{0.0};
    qreal m_cellHeight{0.0};
};

/** A4 page size in points, portrait or landscape. */
QTGRIDSHEET_EXPORT QSizeF pageSizePoints(bool landscape);

} // namespace QtGridSheet
