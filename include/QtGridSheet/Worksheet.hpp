/** \file Worksheet.hpp
 *  Public façade for dictation worksheets: one page tiled with identical blocks, each holding
 *  the fitted one-line header and the numbered item list.
 */
#pragma once
#include "QtGridSheet/Export.hpp"
#include "QtGridSheet/FontRegistry.hpp"
#include "QtGridSheet/HeaderTemplate.hpp"
#include "QtGridSheet/Page.hpp"
#include "QtGridSheet/WorksheetRenderer.hpp"
#include <QImage>
#include <optional>

namespace QtGridSheet {

struct QTGRIDSHEET_EXPORT WorksheetOptions {
    QString date{QStringLiteral("1111")};
    QString scope{QStringLiteral("eager-effort")};
    int cols{2};                ///< at most 4
    int rows{3};                ///< at most 5
    qreal fontSize{11.0};       ///< clamped to 8..16
    qreal paddingMm{3.0};       ///< clamped to 1..10
    qreal marginMm{8.0};
    qreal leadingFactor{13.5 / 11.0};
    bool landscape{false};
    QString fontPath;           ///< CJK font, e.g. SimSun
    FitOptions fit;
};

/** Not thread-safe; one instance per document. */
class QTGRIDSHEET_EXPORT Worksheet {
public:
    enum class ErrorCode { NoItems, InvalidGrid, WriteFailed, RenderFailed };

    explicit Worksheet(QStringList items);

    void setOptions(const WorksheetOptions &options) { m_options = options; m_body.reset(); m_emphasized.reset(); }
    const WorksheetOptions & options() const { return m_options; }
    /** Use these faces instead of resolving options().fontPath. */
    void setFonts(const MixedFont &body, const MixedFont &emphasized) { m_body = body; m_emphasized = emphasized; }

    /** Blank items are removed; surrounding whitespace trimmed. */
    const QStringList & items() const { return m_items; }
    /** Header fitted to the block width, measured with the emphasized faces. */
    std::optional<FitResult> fittedHeader();

    std::optional<PageSet> layout();
    bool save(const QString &pdfPath);
    QImage renderPreview(int dpi = 120);

    /** Items that did not fit in a block during the last layout. */
    int droppedItems() const { return m_dropped; }
    QStringList warnings() const { return m_warnings; }
    std::optional<ErrorCode> lastError() const { return m_lastError; }
    void clearError() { m_lastError.reset(); }

private:
    void setError(ErrorCode ec) { m_lastError = ec; }
    void addWarning(const QString &w);
    void ensureFonts();
    std::optional<GridLayout> makeGrid() const;
    WorksheetStyle style() const;

    QStringList m_items;
    WorksheetOptions m_options;
    FontRegistry m_fonts;
    std::optional<MixedFont> m_body;
    std::optional<MixedFont> m_emphasized;
    int m_dropped{0};
    QStringList m_warnings;
    std::optional<ErrorCode> m_lastError;
};

QTGRIDSHEET_EXPORT const char * toString(Worksheet::ErrorCode ec);

} // namespace QtGridSheet
