#include "QtGridSheet/Page.hpp"

namespace QtGridSheet {

QString TextCommand::text() const {
    QString out;
    for(const auto &r : runs) out += r.text;
    return out;
}

void Page::drawRect(const RectCommand &rect) {
    m_items.push_back({rect, m_clip});
}

void Page::drawLine(const LineCommand &line) {
    m_items.push_back({line, m_clip});
}

qreal Page::drawText(qreal x, qreal y, const QString &text, const MixedFont &font, qreal size, const QColor &color) {
    if(text.isEmpty() || !font.isValid()) return 0.0;
    TextCommand cmd;
    cmd.origin = QPointF(x, y);
    cmd.size = size;
    cmd.color = color;
    qreal pen = 0.0;
    for(auto &run : splitRuns(text)) {
        const auto &face = font.faceFor(run.wide);
        const qreal w = measureRun(run.text, *face, size);
        cmd.runs.push_back({std::move(run.text), face, pen, w, run.wide});
        pen += w;
    }
    m_items.push_back({std::move(cmd), m_clip});
    return pen;
}

QStringList Page::texts() const {
    QStringList out;
    for(const auto *t : textCommands()) out << t->text();
    return out;
}

std::vector<const TextCommand *> Page::textCommands() const {
    std::vector<const TextCommand *> out;
    for(const auto &item : m_items)
        if(const auto *t = std::get_if<TextCommand>(&item.command)) out.push_back(t);
    return out;
}

std::vector<const RectCommand *> Page::rectCommands() const {
    std::vector<const RectCommand *> out;
    for(const auto &item : m_items)
        if(const auto *r = std::get_if<RectCommand>(&item.command)) out.push_back(r);
    return out;
}

Page & PageSet::newPage() {
    m_pages.emplace_back(static_cast<int>(m_pages.size()) + 1, m_pageSize);
    return m_pages.back();
}

} // namespace QtGridSheet
