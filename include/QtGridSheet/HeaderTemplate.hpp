/** \file HeaderTemplate.hpp
 *  One-line header with two shrinkable filler runs, and the greedy fit that makes it fit a width budget.
 *
 *  Assembled form: prefix + " " + labelA + fillerA + sep + labelB + fillerB,
 *  where sep is a single space, or nothing once the tight fallback has been taken.
 */
#pragma once
#include "QtGridSheet/Export.hpp"
#include "QtGridSheet/Typeface.hpp"
#include <QString>

namespace QtGridSheet {

struct QTGRIDSHEET_EXPORT HeaderTemplate {
    QString prefix;
    QString fillerA{QStringLiteral("________")};
    QString labelA{QStringLiteral("Name")};
    QString fillerB{QStringLiteral("___")};
    QString labelB{QStringLiteral("Class")};
    int minLenA{2};
    int minLenB{1};

    /** Assemble with fillers cut to the given lengths (clamped to the template's filler lengths). */
    QString assemble(int lenA, int lenB, bool tight = false) const;
    /** Unshrunk assembly. */
    QString assemble() const { return assemble(fillerA.size(), fillerB.size()); }
};

struct QTGRIDSHEET_EXPORT FitOptions {
    /** Subtracted from the width budget to absorb emboldening differences (default 1 mm). */
    qreal safetyMargin{72.0 / 25.4};
};

struct QTGRIDSHEET_EXPORT FitResult {
    QString text;
    qreal width{0.0};
    int lenA{0};
    int lenB{0};
    int iterations{0};
    bool tight{false};    ///< separator before labelB removed
    bool overflow{false}; ///< still wider than the budget after the tight fallback
};

/** Shrink fillerA, then fillerB, one unit at a time until the header measures <= maxWidth - safetyMargin.
 *  When both fillers are at their minimum the separator before labelB is removed once and the loop stops,
 *  whether or not the result fits. Measure with the font pair the header will be drawn in.
 */
QTGRIDSHEET_EXPORT FitResult fitHeaderDetailed(const HeaderTemplate &tpl, qreal maxWidth,
                                               const MixedFont &font, qreal size,
                                               const FitOptions &options = {});

/** Convenience returning only the fitted text. */
inline QString fitHeader(const HeaderTemplate &tpl, qreal maxWidth, const MixedFont &font, qreal size,
                         const FitOptions &options = {}) {
    return fitHeaderDetailed(tpl, maxWidth, font, size, options).text;
}

} // namespace QtGridSheet
