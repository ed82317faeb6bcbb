#include "QtGridSheet/FontRegistry.hpp"
#include <QFileInfo>
#include <QFontDatabase>
#include <QDebug>

namespace QtGridSheet {

namespace { constexpr qreal kReferencePixelSize = 1000.0; }

QtTypeface::QtTypeface(const QFont &font, bool fallback)
    : m_raw(QRawFont::fromFont(font)), m_name(font.family()), m_fallback(fallback) {
    if(m_raw.isValid()) m_raw.setPixelSize(kReferencePixelSize);
}

qreal QtTypeface::advance(char32_t codePoint, qreal size) const {
    auto it = m_unitAdvances.constFind(codePoint);
    if(it == m_unitAdvances.constEnd()) {
        qreal unit = 0.5;
        if(m_raw.isValid()) {
            const auto glyphs = m_raw.glyphIndexesForString(QString::fromUcs4(&codePoint, 1));
            const auto advances = m_raw.advancesForGlyphIndexes(glyphs, QRawFont::UseDesignMetrics);
            qreal sum = 0.0;
            for(const auto &a : advances) sum += a.x();
            unit = sum / kReferencePixelSize;
        }
        it = m_unitAdvances.insert(codePoint, unit);
    }
    return it.value() * size;
}

QRawFont QtTypeface::rawFont(qreal size) const {
    QRawFont raw = m_raw;
    if(raw.isValid()) raw.setPixelSize(size);
    return raw;
}

TypefacePtr FontRegistry::resolve(const QString &fontPath, QFont::Weight weight) {
    if(fontPath.isEmpty()) {
        qInfo("FontRegistry: no font file given, using built-in fallback");
        return fallback(weight);
    }
    QString family = m_families.value(fontPath);
    if(family.isEmpty()) {
        if(!QFileInfo(fontPath).isFile()) {
            qWarning("FontRegistry: font file not found: %s", qUtf8Printable(fontPath));
            return fallback(weight);
        }
        const int id = QFontDatabase::addApplicationFont(fontPath);
        const QStringList families = id >= 0 ? QFontDatabase::applicationFontFamilies(id) : QStringList();
        if(families.isEmpty()) {
            qWarning("FontRegistry: failed to register font file: %s", qUtf8Printable(fontPath));
            return fallback(weight);
        }
        family = families.front();
        m_families.insert(fontPath, family);
    }
    QFont font(family);
    font.setWeight(weight);
    auto face = std::make_shared<QtTypeface>(font, false);
    if(!face->isValid()) {
        qWarning("FontRegistry: font family %s has no usable outlines", qUtf8Printable(family));
        return fallback(weight);
    }
    return face;
}

TypefacePtr FontRegistry::fallback(QFont::Weight weight) const {
    QFont font(QStringLiteral("Helvetica"));
    font.setStyleHint(QFont::SansSerif);
    font.setWeight(weight);
    return std::make_shared<QtTypeface>(font, true);
}

TypefacePtr FontRegistry::serif(QFont::Weight weight) const {
    QFont font(QStringLiteral("Times"));
    font.setStyleHint(QFont::Serif);
    font.setWeight(weight);
    return std::make_shared<QtTypeface>(font, false);
}

} // namespace QtGridSheet
