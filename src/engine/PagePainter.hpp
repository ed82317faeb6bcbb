#pragma once
#include "QtGridSheet/Page.hpp"

class QPainter;

namespace QtGridSheet { namespace engine {

/** Replays one page's commands onto a painter whose logical unit is one point (top-left origin). */
class PagePainter {
public:
    static void paint(QPainter &painter, const Page &page);
};

}} // namespace QtGridSheet::engine
