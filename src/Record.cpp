#include "QtGridSheet/Record.hpp"
#include <cmath>

namespace QtGridSheet {

Record::Record(std::shared_ptr<const QStringList> columns, QVariantList values)
    : m_columns(std::move(columns)), m_values(std::move(values)) {}

const QStringList & Record::columns() const {
    static const QStringList empty;
    return m_columns ? *m_columns : empty;
}

QVariant Record::value(int column) const {
    if(column < 0 || column >= m_values.size()) return {};
    return m_values.at(column);
}

QVariant Record::value(const QString &column) const {
    if(!m_columns) return {};
    return value(static_cast<int>(m_columns->indexOf(column)));
}

Table::Table(QStringList columns)
    : m_columns(std::make_shared<QStringList>(std::move(columns))) {}

void Table::addRow(QVariantList values) {
    const auto width = m_columns->size();
    while(values.size() < width) values.append(QVariant());
    if(values.size() > width) values = values.mid(0, width);
    m_records.emplace_back(m_columns, std::move(values));
}

QString formatCellValue(const QVariant &value) {
    if(!value.isValid() || value.isNull()) return QStringLiteral("-");
    switch(value.typeId()) {
    case QMetaType::Double:
    case QMetaType::Float: {
        const double v = value.toDouble();
        if(std::isnan(v)) return QStringLiteral("-");
        if(std::isinf(v)) return v > 0 ? QStringLiteral("inf") : QStringLiteral("-inf");
        if(std::abs(v - std::trunc(v)) < 1e-9) return QString::number(std::trunc(v), 'f', 0);
        QString s = QString::number(v, 'f', 2);
        while(s.endsWith('0')) s.chop(1);
        if(s.endsWith('.')) s.chop(1);
        return s;
    }
    case QMetaType::Bool:
        return value.toBool() ? QStringLiteral("TRUE") : QStringLiteral("FALSE");
    case QMetaType::QString: {
        const QString s = value.toString();
        return s.isEmpty() ? QStringLiteral("-") : s;
    }
    default:
        return value.toString();
    }
}

} // namespace QtGridSheet
