/** \file TextRun.hpp
 *  Narrow/wide run splitting for mixed Latin + CJK strings.
 *  A character is narrow when its code point is printable ASCII (0x20-0x7E) and wide otherwise.
 *  This is a proxy for "has a compact Latin glyph"; accented Latin is classified as wide.
 */
#pragma once
#include "QtGridSheet/Export.hpp"
#include <QString>
#include <vector>

namespace QtGridSheet {

/** Maximal substring of a single class. Never empty when produced by splitRuns. */
struct TextRun {
    QString text;
    bool wide{false};

    bool operator==(const TextRun &o) const { return wide == o.wide && text == o.text; }
};

/** True for code points that use the narrow (Latin) typeface. */
inline bool isNarrowCodePoint(char32_t cp) { return cp >= 0x20 && cp <= 0x7E; }

/** Split text into maximal runs, preserving order and characters. Empty input -> empty vector. */
QTGRIDSHEET_EXPORT std::vector<TextRun> splitRuns(const QString &text);

/** Concatenate run texts (inverse of splitRuns). */
QTGRIDSHEET_EXPORT QString joinRuns(const std::vector<TextRun> &runs);

} // namespace QtGridSheet
