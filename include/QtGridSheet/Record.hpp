/** \file Record.hpp
 *  Tabular input model: ordered column names plus rows of scalar values.
 *  Values are QVariant holding QString, double or bool; an invalid QVariant is an empty cell.
 */
#pragma once
#include "QtGridSheet/Export.hpp"
#include <QString>
#include <QStringList>
#include <QVariant>
#include <memory>
#include <vector>

namespace QtGridSheet {

/** One row of a Table. Immutable after construction; column names are shared with the owning table. */
class QTGRIDSHEET_EXPORT Record {
public:
    Record() = default;
    Record(std::shared_ptr<const QStringList> columns, QVariantList values);

    /** Column names in source order. */
    const QStringList & columns() const;
    /** Number of columns (values beyond the header are not kept). */
    int size() const { return m_columns ? m_columns->size() : 0; }
    /** Value at column index; invalid QVariant when out of range or empty. */
    QVariant value(int column) const;
    /** Value by exact column name; invalid QVariant when unknown. */
    QVariant value(const QString &column) const;

private:
    std::shared_ptr<const QStringList> m_columns;
    QVariantList m_values;
};

/** Ordered column names and the records read from one sheet. */
class QTGRIDSHEET_EXPORT Table {
public:
    Table() : m_columns(std::make_shared<QStringList>()) {}
    explicit Table(QStringList columns);

    /** Append a row; values are padded with empty cells or truncated to the column count. */
    void addRow(QVariantList values);
    const QStringList & columns() const { return *m_columns; }
    const std::vector<Record> & records() const { return m_records; }
    int rowCount() const { return static_cast<int>(m_records.size()); }
    bool isEmpty() const { return m_records.empty(); }

private:
    std::shared_ptr<const QStringList> m_columns;
    std::vector<Record> m_records;
};

/** Render a cell value for display.
 *  Empty or NaN -> "-", integral doubles without a decimal point, other doubles with two
 *  decimals and trailing zeros trimmed, bools as TRUE/FALSE, everything else via toString().
 */
QTGRIDSHEET_EXPORT QString formatCellValue(const QVariant &value);

} // namespace QtGridSheet
