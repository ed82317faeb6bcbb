/** \file CardSheet.hpp
 *  Public façade for card strips: one card per record, laid out in a fixed-height grid
 *  across as many pages as needed, with a page header on every page.
 */
#pragma once
#include "QtGridSheet/Export.hpp"
#include "QtGridSheet/CardRenderer.hpp"
#include "QtGridSheet/FontRegistry.hpp"
#include "QtGridSheet/Page.hpp"
#include "QtGridSheet/Paginator.hpp"
#include "QtGridSheet/Record.hpp"
#include "QtGridSheet/RoleResolver.hpp"
#include <QImage>
#include <QList>
#include <QStringList>
#include <optional>

namespace QtGridSheet {

/** Layout parameters. Sizes are points. */
struct QTGRIDSHEET_EXPORT CardSheetOptions {
    QString title{QStringLiteral("学生成绩小分条")};
    QString cardTitle{QStringLiteral("期中英语")}; ///< aside label, right-aligned on each card
    int cols{2};
    int rows{6};
    bool landscape{false};
    qreal cardHeight{110.0};
    qreal margin{36.0};
    qreal gutter{16.0};
    qreal titleFontSize{10.0};
    qreal cardTitleFontSize{8.0};
    qreal bodyFontSize{8.0};
    qreal headerFontSize{12.0};
    qreal padding{10.0};
    qreal cornerRadius{10.0};
    QString fontPath; ///< CJK-capable TTF/TTC; empty or unusable -> built-in fallback
    QStringList fields; ///< body columns in order; empty = every non-identity column
    QList<IdentityRole> titleRoles{IdentityRole::Name, IdentityRole::Code};
};

/** Geometry actually used for a configuration. */
struct LayoutSummary {
    int cols{0};
    int requestedRows{0};
    int rows{0};
    bool rowsClamped{false};
    int cardsPerPage{0};
    qreal cardWidth{0.0};
    qreal cardHeight{0.0};
    int pages{0};
};

/** Not thread-safe; one instance per document. */
class QTGRIDSHEET_EXPORT CardSheet {
public:
    enum class ErrorCode {
        EmptyRecordSet,
        NoFieldsSelected,
        InvalidGrid,
        AmbiguousSchema,
        WriteFailed,
        RenderFailed
    };

    explicit CardSheet(Table table);

    void setOptions(const CardSheetOptions &options) { m_options = options; m_font.reset(); }
    const CardSheetOptions & options() const { return m_options; }
    /** Use these faces instead of resolving options().fontPath. */
    void setFont(const MixedFont &font) { m_font = font; }
    void setRoleResolver(const RoleResolver &resolver) { m_resolver = resolver; }

    /** Record all pages (or the preview page). std::nullopt on a configuration error. */
    std::optional<PageSet> layout(Paginator::Mode mode = Paginator::Mode::Full);
    /** Layout and write the PDF. No file is created when the configuration is rejected. */
    bool save(const QString &pdfPath);
    /** Page 1 in preview mode rasterized at dpi; null image on failure. */
    QImage renderPreview(int dpi = 144);
    /** Grid derived from the current options and record count; std::nullopt when the grid is invalid. */
    std::optional<LayoutSummary> layoutSummary() const;

    /** Body columns that will be rendered (after role resolution and selection). */
    QStringList selectedFields() const;
    /** Degradations noticed by the last operation (fallback font, clamped rows, unknown fields). */
    QStringList warnings() const { return m_warnings; }
    std::optional<ErrorCode> lastError() const { return m_lastError; }
    void clearError() { m_lastError.reset(); }

private:
    void setError(ErrorCode ec) { m_lastError = ec; }
    void addWarning(const QString &w);
    const MixedFont & ensureFont();
    std::optional<GridLayout> makeGrid() const;
    CardStyle cardStyle(const MixedFont &font) const;

    Table m_table;
    CardSheetOptions m_options;
    RoleResolver m_resolver;
    FontRegistry m_fonts;
    std::optional<MixedFont> m_font;
    QStringList m_warnings;
    std::optional<ErrorCode> m_lastError;
};

QTGRIDSHEET_EXPORT const char * toString(CardSheet::ErrorCode ec);

} // namespace QtGridSheet
