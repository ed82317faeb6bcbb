#include "QtGridSheet/Typeface.hpp"

namespace QtGridSheet {

qreal measureRun(const QString &run, const Typeface &face, qreal size) {
    qreal width = 0.0;
    for(const char32_t cp : run.toUcs4()) width += face.advance(cp, size);
    return width;
}

qreal measureMixed(const QString &text, const MixedFont &font, qreal size) {
    if(!font.isValid()) return 0.0;
    qreal width = 0.0;
    for(const auto &r : splitRuns(text)) width += measureRun(r.text, *font.faceFor(r.wide), size);
    return width;
}

} // namespace QtGridSheet
