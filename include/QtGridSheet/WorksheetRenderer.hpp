/** \file WorksheetRenderer.hpp
 *  Worksheet block: a thin frame, an emphasized one-line header, then numbered items
 *  wrapped to the block width. Items that no longer fit vertically are dropped.
 */
#pragma once
#include "QtGridSheet/Export.hpp"
#include "QtGridSheet/Page.hpp"
#include <QStringList>

namespace QtGridSheet {

struct QTGRIDSHEET_EXPORT WorksheetStyle {
    MixedFont body;
    MixedFont emphasized;
    qreal fontSize{11.0};
    qreal leading{13.5};
    qreal padding{3 * 72.0 / 25.4};
    qreal headerSpaceAfter{2.0};
    qreal itemSpaceAfter{1.0};
    qreal frameWidth{1.0};
};

struct QTGRIDSHEET_EXPORT WorksheetBlock {
    QString header; ///< already fitted to the inner width
    QStringList items;
};

struct WorksheetBlockResult {
    int itemsDrawn{0};
    int itemsDropped{0};
    int lines{0};
};

/** Greedy wrap: break after the last space that fits, else before the first character that does not fit.
 *  Every returned line is non-empty; a single character wider than maxWidth gets a line of its own.
 */
QTGRIDSHEET_EXPORT QStringList wrapMixed(const QString &text, const MixedFont &font, qreal size, qreal maxWidth);

/** "1. first", "2. second", ... */
QTGRIDSHEET_EXPORT QStringList numberItems(const QStringList &items);

QTGRIDSHEET_EXPORT WorksheetBlockResult renderWorksheetBlock(Page &page, const CellBox &box,
                                                             const WorksheetBlock &block,
                                                             const WorksheetStyle &style);

} // namespace QtGridSheet
