/** \file CardRenderer.hpp
 *  Draws one record as a card inside a cell box: rounded frame, title line, optional
 *  right-aligned aside label, divider, and up to three columns of "key: value" lines.
 */
#pragma once
#include "QtGridSheet/Export.hpp"
#include "QtGridSheet/Page.hpp"
#include <QColor>
#include <QPair>
#include <QString>
#include <array>
#include <vector>

namespace QtGridSheet {

using KeyValue = QPair<QString, QString>;

/** Geometry, sizes and colors of a card. Defaults match the strip layout. */
struct QTGRIDSHEET_EXPORT CardStyle {
    MixedFont font;
    qreal titleSize{10.0};
    qreal asideSize{8.0};
    qreal bodySize{8.0};
    qreal padding{10.0};
    qreal cornerRadius{10.0};
    qreal columnGap{8.0};
    qreal dividerOffset{4.0};
    qreal bodyOffset{20.0};  ///< first body baseline below the title baseline
    qreal lineSpacing{4.0};  ///< added to bodySize to get the line height
    QColor frame{64, 89, 140};
    std::optional<QColor> background{QColor(247, 250, 255)};
    QColor titleColor{31, 46, 89};
    QColor divider{191, 204, 242};
    QColor bodyColor{26, 26, 26};

    qreal lineHeight() const { return bodySize + lineSpacing; }
};

struct QTGRIDSHEET_EXPORT CardContent {
    QString title;
    QString aside;
    std::vector<KeyValue> items;
};

/** Items per body column: body baselines that fit between the first one
 *  (top - padding - titleSize - bodyOffset) and the inner bottom edge (bottom + padding). At least 1.
 */
QTGRIDSHEET_EXPORT int cardColumnCapacity(qreal cellHeight, const CardStyle &style);

/** Fill column 1 up to capacity, then column 2, then column 3; the rest is dropped. */
QTGRIDSHEET_EXPORT std::array<std::vector<KeyValue>, 3> splitIntoColumns(const std::vector<KeyValue> &items,
                                                                        int capacity);

/** Record the card's commands on the page. Everything is clipped to the box. */
QTGRIDSHEET_EXPORT void renderCard(Page &page, const CellBox &box, const CardContent &content,
                                   const CardStyle &style);

} // namespace QtGridSheet
