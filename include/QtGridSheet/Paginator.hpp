/** \file Paginator.hpp
 *  Streams an ordered record sequence into grid cells across pages.
 *
 *  The page index is an explicit counter owned by one run() call and handed to the callbacks;
 *  there is no shared "current page" state. A page break happens right after a page's last cell
 *  is filled, unless that cell held the final record (no trailing empty page).
 */
#pragma once
#include "QtGridSheet/Export.hpp"
#include "QtGridSheet/Grid.hpp"
#include <functional>

namespace QtGridSheet {

struct PaginationResult {
    int pages{0};      ///< pages opened (page callback invocations)
    int boundaries{0}; ///< page breaks taken after the first page
    int emitted{0};    ///< cells rendered
};

class QTGRIDSHEET_EXPORT Paginator {
public:
    enum class State { AwaitingRecord, EmittingCell, PageBoundary, Done };
    enum class Mode {
        Full,   ///< every record, as many pages as needed
        Preview ///< at most one page worth of records, no page breaks
    };

    /** (record index, cell box on the page, 1-based page index) */
    using CellCallback = std::function<void(int, const CellBox &, int)>;
    /** Called when a page is opened, with its 1-based index, before any of its cells. */
    using PageCallback = std::function<void(int)>;
    using StateObserver = std::function<void(State)>;

    explicit Paginator(GridLayout grid) : m_grid(std::move(grid)) {}

    void setCellCallback(CellCallback cb) { m_cell = std::move(cb); }
    void setPageCallback(PageCallback cb) { m_page = std::move(cb); }
    void setStateObserver(StateObserver cb) { m_observer = std::move(cb); }
    void setMode(Mode mode) { m_mode = mode; }
    /** Open page 1 (and draw its header) before the first record, even when there are no records. */
    void setSeedHeader(bool seed) { m_seedHeader = seed; }

    /** Records that will be placed for a given input count in the current mode. */
    int placedCount(int recordCount) const;
    /** Drive the callbacks for recordCount records. */
    PaginationResult run(int recordCount);

    State state() const { return m_state; }
    const GridLayout & grid() const { return m_grid; }

private:
    void enter(State s);

    GridLayout m_grid;
    CellCallback m_cell;
    PageCallback m_page;
    StateObserver m_observer;
    Mode m_mode{Mode::Full};
    bool m_seedHeader{false};
    State m_state{State::AwaitingRecord};
};

} // namespace QtGridSheet
