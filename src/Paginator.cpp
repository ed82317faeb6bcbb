#include "QtGridSheet/Paginator.hpp"
#include <QDebug>
#include <algorithm>

namespace QtGridSheet {

void Paginator::enter(State s) {
    m_state = s;
    if(m_observer) m_observer(s);
}

int Paginator::placedCount(int recordCount) const {
    recordCount = std::max(0, recordCount);
    return m_mode == Mode::Preview ? std::min(recordCount, m_grid.cellsPerPage()) : recordCount;
}

PaginationResult Paginator::run(int recordCount) {
    const int perPage = m_grid.cellsPerPage();
    const int total = placedCount(recordCount);
    PaginationResult result;
    int pageIndex = 0;
    auto openPage = [&](int index) {
        pageIndex = index;
        ++result.pages;
        qDebug() << "Paginator: page" << index;
        if(m_page) m_page(index);
    };

    enter(State::AwaitingRecord);
    if(m_seedHeader) openPage(1);
    for(int i = 0; i < total; ++i) {
        if(pageIndex == 0) openPage(1);
        enter(State::EmittingCell);
        const int position = result.emitted % perPage;
        const CellBox box = m_grid.cellBox(position / m_grid.cols(), position % m_grid.cols());
        if(m_cell) m_cell(i, box, pageIndex);
        ++result.emitted;
        if(m_mode == Mode::Full && result.emitted % perPage == 0 && i != total - 1) {
            enter(State::PageBoundary);
            ++result.boundaries;
            openPage(pageIndex + 1);
        }
        enter(State::AwaitingRecord);
    }
    enter(State::Done);
    return result;
}

} // namespace QtGridSheet
