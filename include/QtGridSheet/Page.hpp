/** \file Page.hpp
 *  Display list: pages of vector drawing commands (rectangles, lines, positioned text runs).
 *  Coordinates are points with a bottom-left origin; backends flip them for QPainter.
 */
#pragma once
#include "QtGridSheet/Export.hpp"
#include "QtGridSheet/Grid.hpp"
#include "QtGridSheet/Typeface.hpp"
#include <QColor>
#include <QPointF>
#include <QSizeF>
#include <QStringList>
#include <optional>
#include <variant>
#include <vector>

namespace QtGridSheet {

struct RectCommand {
    CellBox box;
    qreal radius{0.0};
    qreal lineWidth{1.0};
    QColor stroke{Qt::black};
    std::optional<QColor> fill;
};

struct LineCommand {
    QPointF from;
    QPointF to;
    qreal lineWidth{1.0};
    QColor color{Qt::black};
};

/** One run of a text command; x is relative to the command origin. */
struct PlacedRun {
    QString text;
    TypefacePtr face;
    qreal x{0.0};
    qreal width{0.0};
    bool wide{false};
};

struct TextCommand {
    QPointF origin; ///< left end of the baseline
    qreal size{10.0};
    QColor color{Qt::black};
    std::vector<PlacedRun> runs;

    QString text() const;
    qreal width() const { return runs.empty() ? 0.0 : runs.back().x + runs.back().width; }
};

using DrawCommand = std::variant<RectCommand, LineCommand, TextCommand>;

struct DrawItem {
    DrawCommand command;
    std::optional<CellBox> clip;
};

/** One page being recorded. Commands are replayed in insertion order. */
class QTGRIDSHEET_EXPORT Page {
public:
    Page(int index, QSizeF size) : m_index(index), m_size(size) {}

    int index() const { return m_index; }
    QSizeF size() const { return m_size; }
    const std::vector<DrawItem> & items() const { return m_items; }

    /** Clip rectangle attached to subsequent commands (std::nullopt = page). */
    void setClip(std::optional<CellBox> clip) { m_clip = clip; }

    void drawRect(const RectCommand &rect);
    void drawLine(const LineCommand &line);
    /** Split text into runs, measure each with its face and record it at baseline (x, y). Returns the width. */
    qreal drawText(qreal x, qreal y, const QString &text, const MixedFont &font, qreal size,
                   const QColor &color = Qt::black);

    /** Texts of all text commands in order (diagnostics and tests). */
    QStringList texts() const;
    std::vector<const TextCommand *> textCommands() const;
    std::vector<const RectCommand *> rectCommands() const;

private:
    int m_index;
    QSizeF m_size;
    std::optional<CellBox> m_clip;
    std::vector<DrawItem> m_items;
};

/** Ordered pages of one document; exclusively owned by the generation run that fills it. */
class QTGRIDSHEET_EXPORT PageSet {
public:
    explicit PageSet(QSizeF pageSize) : m_pageSize(pageSize) {}

    /** Start a new page and return it; references stay valid until the next newPage(). */
    Page & newPage();
    Page & current() { return m_pages.back(); }
    const std::vector<Page> & pages() const { return m_pages; }
    int pageCount() const { return static_cast<int>(m_pages.size()); }
    QSizeF pageSize() const { return m_pageSize; }

    QString title;

private:
    QSizeF m_pageSize;
    std::vector<Page> m_pages;
};

} // namespace QtGridSheet
