/** \file Typeface.hpp
 *  Font abstraction used for measurement and drawing, and the mixed-run measurer.
 *  Widths are the sum of per-character advances (no shaping, no kerning).
 */
#pragma once
#include "QtGridSheet/Export.hpp"
#include "QtGridSheet/TextRun.hpp"
#include <QRawFont>
#include <QString>
#include <memory>

namespace QtGridSheet {

/** A single font face at arbitrary size. Implementations must be deterministic. */
class QTGRIDSHEET_EXPORT Typeface {
public:
    virtual ~Typeface() = default;
    /** Horizontal advance of one code point at the given size (points). */
    virtual qreal advance(char32_t codePoint, qreal size) const = 0;
    /** Raw font for glyph drawing at the given pixel size; invalid QRawFont when the face cannot draw. */
    virtual QRawFont rawFont(qreal size) const { Q_UNUSED(size); return QRawFont(); }
    /** True when this is the built-in substitute for a font that could not be loaded. */
    virtual bool isFallback() const { return false; }
    /** Human readable name for diagnostics. */
    virtual QString name() const = 0;
};

using TypefacePtr = std::shared_ptr<const Typeface>;

/** Narrow (Latin) and wide (CJK) faces used together for one text style. */
struct MixedFont {
    TypefacePtr narrow;
    TypefacePtr wide;

    const TypefacePtr & faceFor(bool wideRun) const { return wideRun ? wide : narrow; }
    bool isValid() const { return narrow && wide; }
};

/** Width of a single run measured with one face. */
QTGRIDSHEET_EXPORT qreal measureRun(const QString &run, const Typeface &face, qreal size);

/** Width of mixed text: runs measured with the face matching their class, summed in order. */
QTGRIDSHEET_EXPORT qreal measureMixed(const QString &text, const MixedFont &font, qreal size);

} // namespace QtGridSheet
