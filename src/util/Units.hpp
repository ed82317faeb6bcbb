#pragma once
#include <QtGlobal>

namespace QtGridSheet { namespace util {

constexpr qreal kPointsPerInch = 72.0;
constexpr qreal kMmPerInch = 25.4;

inline constexpr qreal mmToPoints(qreal mm) { return mm * kPointsPerInch / kMmPerInch; }
inline constexpr qreal pointsToMm(qreal pt) { return pt * kMmPerInch / kPointsPerInch; }

}} // namespace QtGridSheet::util
