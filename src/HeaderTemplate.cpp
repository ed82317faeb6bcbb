#include "QtGridSheet/HeaderTemplate.hpp"
#include <algorithm>

namespace QtGridSheet {

QString HeaderTemplate::assemble(int lenA, int lenB, bool tight) const {
    lenA = std::clamp<int>(lenA, 0, fillerA.size());
    lenB = std::clamp<int>(lenB, 0, fillerB.size());
    QString out = prefix;
    out += QLatin1Char(' ');
    out += labelA;
    out += fillerA.left(lenA);
    if(!tight) out += QLatin1Char(' ');
    out += labelB;
    out += fillerB.left(lenB);
    return out;
}

FitResult fitHeaderDetailed(const HeaderTemplate &tpl, qreal maxWidth, const MixedFont &font, qreal size,
                            const FitOptions &options) {
    const qreal budget = maxWidth - options.safetyMargin;
    const int minA = std::clamp<int>(tpl.minLenA, 0, tpl.fillerA.size());
    const int minB = std::clamp<int>(tpl.minLenB, 0, tpl.fillerB.size());

    FitResult r;
    r.lenA = tpl.fillerA.size();
    r.lenB = tpl.fillerB.size();
    r.text = tpl.assemble(r.lenA, r.lenB);
    r.width = measureMixed(r.text, font, size);
    while(r.width > budget) {
        ++r.iterations;
        if(r.lenA > minA) {
            --r.lenA;
        } else if(r.lenB > minB) {
            --r.lenB;
        } else {
            r.tight = true;
            r.text = tpl.assemble(r.lenA, r.lenB, true);
            r.width = measureMixed(r.text, font, size);
            break;
        }
        r.text = tpl.assemble(r.lenA, r.lenB);
        r.width = measureMixed(r.text, font, size);
    }
    r.overflow = r.width > budget;
    return r;
}

} // namespace QtGridSheet
