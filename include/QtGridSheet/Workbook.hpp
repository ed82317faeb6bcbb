/** \file Workbook.hpp
 *  Minimal .xlsx input/output: read the first worksheet into a Table, write the blank template workbook.
 */
#pragma once
#include "QtGridSheet/Export.hpp"
#include "QtGridSheet/Record.hpp"
#include <QString>
#include <optional>

namespace QtGridSheet {

enum class WorkbookError {
    OpenFailed,          ///< file missing or not a zip package
    WorkbookPartMissing, ///< xl/workbook.xml (or its relationships) absent
    SheetMissing,        ///< no worksheet part could be located
    XmlParseFailed,      ///< a required part is not well-formed
    EmptySheet           ///< no header row found
};

/** Read the first worksheet. The first non-empty row is the header; empty header cells become
 *  "Unnamed: <index>"; rows with no values are skipped. Numbers become double, booleans bool,
 *  error cells empty. Returns std::nullopt and sets *error on failure.
 */
QTGRIDSHEET_EXPORT std::optional<Table> readWorkbook(const QString &path, WorkbookError *error = nullptr);

/** Write the blank input template (identity columns, three subjects, three sample rows). */
QTGRIDSHEET_EXPORT bool writeTemplateWorkbook(const QString &path);

/** Write a table as a single-sheet workbook (strings inline, numbers as values). */
QTGRIDSHEET_EXPORT bool writeWorkbook(const QString &path, const Table &table);

/** "A" for 0, "Z" for 25, "AA" for 26. */
QTGRIDSHEET_EXPORT QString columnName(int index);
/** Zero-based column of a cell reference ("C7" -> 2); -1 when the reference has no letters. */
QTGRIDSHEET_EXPORT int columnIndex(const QString &cellRef);

QTGRIDSHEET_EXPORT const char * toString(WorkbookError error);

} // namespace QtGridSheet
