#include "QtGridSheet/TextRun.hpp"

namespace QtGridSheet {

std::vector<TextRun> splitRuns(const QString &text) {
    std::vector<TextRun> runs;
    // Surrogate halves are never narrow, so classifying UTF-16 units keeps pairs together.
    for(const QChar ch : text) {
        const bool wide = !isNarrowCodePoint(ch.unicode());
        if(runs.empty() || runs.back().wide != wide) runs.push_back({QString(), wide});
        runs.back().text.append(ch);
    }
    return runs;
}

QString joinRuns(const std::vector<TextRun> &runs) {
    QString out;
    for(const auto &r : runs) out += r.text;
    return out;
}

} // namespace QtGridSheet
