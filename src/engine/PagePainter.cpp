#include "engine/PagePainter.hpp"
#include <QGlyphRun>
#include <QPainter>
#include <QPainterPath>

namespace QtGridSheet { namespace engine {

namespace {

QRectF toDevice(const CellBox &b, qreal pageHeight) {
    return QRectF(b.x, pageHeight - b.y - b.height, b.width, b.height);
}

QPointF toDevice(const QPointF &p, qreal pageHeight) {
    return QPointF(p.x(), pageHeight - p.y());
}

void paintRect(QPainter &p, const RectCommand &cmd, qreal h) {
    p.setPen(QPen(cmd.stroke, cmd.lineWidth));
    p.setBrush(cmd.fill ? QBrush(*cmd.fill) : QBrush(Qt::NoBrush));
    const QRectF r = toDevice(cmd.box, h);
    if(cmd.radius > 0) p.drawRoundedRect(r, cmd.radius, cmd.radius);
    else p.drawRect(r);
}

void paintLine(QPainter &p, const LineCommand &cmd, qreal h) {
    p.setPen(QPen(cmd.color, cmd.lineWidth));
    p.drawLine(toDevice(cmd.from, h), toDevice(cmd.to, h));
}

void paintText(QPainter &p, const TextCommand &cmd, qreal h) {
    p.setPen(cmd.color);
    const QPointF baseline = toDevice(cmd.origin, h);
    for(const auto &run : cmd.runs) {
        const QPointF at(baseline.x() + run.x, baseline.y());
        const QRawFont raw = run.face ? run.face->rawFont(cmd.size) : QRawFont();
        if(!raw.isValid()) {
            QFont f(run.face ? run.face->name() : QString());
            f.setPixelSize(qMax(1, qRound(cmd.size)));
            p.setFont(f);
            p.drawText(at, run.text);
            continue;
        }
        const auto glyphs = raw.glyphIndexesForString(run.text);
        const auto advances = raw.advancesForGlyphIndexes(glyphs, QRawFont::UseDesignMetrics);
        QList<QPointF> positions;
        positions.reserve(glyphs.size());
        qreal x = 0.0;
        for(const auto &a : advances) { positions.append(QPointF(x, 0.0)); x += a.x(); }
        QGlyphRun glyphRun;
        glyphRun.setRawFont(raw);
        glyphRun.setGlyphIndexes(glyphs);
        glyphRun.setPositions(positions);
        p.drawGlyphRun(at, glyphRun);
    }
}

} // namespace

void PagePainter::paint(QPainter &painter, const Page &page) {
    const qreal h = page.size().height();
    for(const auto &item : page.items()) {
        painter.save();
        if(item.clip) painter.setClipRect(toDevice(*item.clip, h));
        if(const auto *r = std::get_if<RectCommand>(&item.command)) paintRect(painter, *r, h);
        else if(const auto *l = std::get_if<LineCommand>(&item.command)) paintLine(painter, *l, h);
        else if(const auto *t = std::get_if<TextCommand>(&item.command)) paintText(painter, *t, h);
        painter.restore();
    }
}

}} // namespace QtGridSheet::engine
