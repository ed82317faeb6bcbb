/** \file FontRegistry.hpp
 *  Font file registration with a guaranteed fallback, and the Qt-backed Typeface.
 *  Requires a QGuiApplication instance (QFontDatabase / QRawFont need the platform font database).
 */
#pragma once
#include "QtGridSheet/Export.hpp"
#include "QtGridSheet/Typeface.hpp"
#include <QFont>
#include <QHash>
#include <QRawFont>

namespace QtGridSheet {

/** Typeface over QRawFont. Advances come from design metrics so they are independent of the paint device. */
class QTGRIDSHEET_EXPORT QtTypeface : public Typeface {
public:
    QtTypeface(const QFont &font, bool fallback);

    qreal advance(char32_t codePoint, qreal size) const override;
    QRawFont rawFont(qreal size) const override;
    bool isFallback() const override { return m_fallback; }
    QString name() const override { return m_name; }
    /** False when the platform could not produce a raw font (advances are then size/2). */
    bool isValid() const { return m_raw.isValid(); }

private:
    QRawFont m_raw;
    QString m_name;
    bool m_fallback{false};
    mutable QHash<char32_t, qreal> m_unitAdvances; // advance at pixel size 1
};

/** Registers font files once and hands out typefaces. Never throws; unusable files give the fallback face. */
class QTGRIDSHEET_EXPORT FontRegistry {
public:
    /** Typeface from a TTF/TTC/OTF file. Empty, missing or unparsable paths return fallback(weight). */
    TypefacePtr resolve(const QString &fontPath, QFont::Weight weight = QFont::Normal);
    /** Built-in substitute (sans serif, Latin only on most systems). */
    TypefacePtr fallback(QFont::Weight weight = QFont::Normal) const;
    /** Built-in serif face used for Latin runs (Times). */
    TypefacePtr serif(QFont::Weight weight = QFont::Normal) const;

private:
    QHash<QString, QString> m_families; // font path -> registered family
};

} // namespace QtGridSheet
