#include "QtGridSheet/CardRenderer.hpp"
#include <algorithm>
#include <cmath>

namespace QtGridSheet {

int cardColumnCapacity(qreal cellHeight, const CardStyle &style) {
    const qreal line = style.lineHeight();
    if(line <= 0) return 1;
    const qreal below = cellHeight - 2 * style.padding - style.titleSize - style.bodyOffset;
    if(below < 0) return 1;
    return std::max(1, static_cast<int>(std::floor(below / line)) + 1);
}

std::array<std::vector<KeyValue>, 3> splitIntoColumns(const std::vector<KeyValue> &items, int capacity) {
    std::array<std::vector<KeyValue>, 3> cols;
    capacity = std::max(1, capacity);
    const size_t limit = std::min(items.size(), static_cast<size_t>(capacity) * cols.size());
    for(size_t i = 0; i < limit; ++i) cols[i / capacity].push_back(items[i]);
    return cols;
}

void renderCard(Page &page, const CellBox &box, const CardContent &content, const CardStyle &style) {
    page.setClip(box);

    RectCommand frame;
    frame.box = box;
    frame.radius = style.cornerRadius;
    frame.lineWidth = 1.0;
    frame.stroke = style.frame;
    frame.fill = style.background;
    page.drawRect(frame);

    const qreal pad = style.padding;
    const qreal left = box.x + pad;
    const qreal right = box.right() - pad;
    const qreal titleY = box.top() - pad - style.titleSize;

    page.drawText(left, titleY, content.title, style.font, style.titleSize, style.titleColor);
    if(!content.aside.isEmpty()) {
        const qreal w = measureMixed(content.aside, style.font, style.asideSize);
        page.drawText(right - w, titleY, content.aside, style.font, style.asideSize, style.titleColor);
    }

    const qreal dividerY = titleY - style.dividerOffset;
    page.drawLine({QPointF(left, dividerY), QPointF(right, dividerY), 1.0, style.divider});

    const auto columns = splitIntoColumns(content.items, cardColumnCapacity(box.height, style));
    const qreal colWidth = (box.width - 2 * pad - 2 * style.columnGap) / 3;
    const qreal bodyTop = titleY - style.bodyOffset;
    for(size_t c = 0; c < columns.size(); ++c) {
        const qreal x = left + c * (colWidth + style.columnGap);
        qreal y = bodyTop;
        for(const auto &kv : columns[c]) {
            page.drawText(x, y, kv.first + QStringLiteral(": ") + kv.second, style.font, style.bodySize,
                          style.bodyColor);
            y -= style.lineHeight();
        }
    }
    page.setClip(std::nullopt);
}

} // namespace QtGridSheet
