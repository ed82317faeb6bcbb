#include "QtGridSheet/WorksheetRenderer.hpp"

namespace QtGridSheet {

QStringList wrapMixed(const QString &text, const MixedFont &font, qreal size, qreal maxWidth) {
    QStringList lines;
    const int n = text.size();
    int start = 0;
    while(start < n && text.at(start) == QLatin1Char(' ')) ++start;
    int i = start;
    int lastBreak = -1;
    qreal width = 0.0;
    while(i < n) {
        const int step = (text.at(i).isHighSurrogate() && i + 1 < n) ? 2 : 1;
        const QString unit = text.mid(i, step);
        const qreal w = measureMixed(unit, font, size);
        if(width + w > maxWidth && i > start) {
            const int cut = lastBreak > start ? lastBreak : i;
            lines << text.mid(start, cut - start);
            start = cut;
            while(start < n && text.at(start) == QLatin1Char(' ')) ++start;
            i = start;
            width = 0.0;
            lastBreak = -1;
            continue;
        }
        if(unit == QLatin1String(" ")) lastBreak = i + 1;
        width += w;
        i += step;
    }
    if(start < n) lines << text.mid(start);
    for(auto &l : lines) {
        while(l.endsWith(QLatin1Char(' '))) l.chop(1);
    }
    lines.removeAll(QString());
    return lines;
}

QStringList numberItems(const QStringList &items) {
    QStringList out;
    out.reserve(items.size());
    for(int i = 0; i < items.size(); ++i) out << QStringLiteral("%1. %2").arg(i + 1).arg(items.at(i));
    return out;
}

WorksheetBlockResult renderWorksheetBlock(Page &page, const CellBox &box, const WorksheetBlock &block,
                                          const WorksheetStyle &style) {
    WorksheetBlockResult result;
    page.setClip(box);
    RectCommand frame;
    frame.box = box;
    frame.lineWidth = style.frameWidth;
    page.drawRect(frame);

    const qreal left = box.x + style.padding;
    const qreal innerWidth = box.width - 2 * style.padding;
    qreal used = 0.0;
    const qreal top = box.top() - style.padding;
    const qreal available = box.height - 2 * style.padding;

    if(!block.header.isEmpty() && style.leading <= available) {
        page.drawText(left, top - style.fontSize, block.header, style.emphasized, style.fontSize);
        used = style.leading + style.headerSpaceAfter;
        ++result.lines;
    }

    const QStringList numbered = numberItems(block.items);
    for(int i = 0; i < numbered.size(); ++i) {
        const QStringList lines = wrapMixed(numbered.at(i), style.body, style.fontSize, innerWidth);
        const qreal height = lines.size() * style.leading;
        if(used + height > available + 1e-6) {
            result.itemsDropped = numbered.size() - i;
            break;
        }
        qreal baseline = top - used - style.fontSize;
        for(const auto &line : lines) {
            page.drawText(left, baseline, line, style.body, style.fontSize);
            baseline -= style.leading;
            ++result.lines;
        }
        used += height + style.itemSpaceAfter;
        ++result.itemsDrawn;
    }
    page.setClip(std::nullopt);
    return result;
}

} // namespace QtGridSheet
