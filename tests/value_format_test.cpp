// Record model and cell value formatting
#include "QtGridSheet/Record.hpp"
#include <cassert>
#include <cmath>
#include <iostream>
#include <limits>

using namespace QtGridSheet;

int main(){
    // Substitution policy
    {
        assert(formatCellValue(4.0) == "4");
        assert(formatCellValue(4.5) == "4.5");
        assert(formatCellValue(QVariant()) == "-");
        assert(formatCellValue(std::numeric_limits<double>::quiet_NaN()) == "-");
        assert(formatCellValue(QString()) == "-");
        assert(formatCellValue(3.14159) == "3.14");
        assert(formatCellValue(2.10) == "2.1");
        assert(formatCellValue(-7.0) == "-7");
        assert(formatCellValue(2024001.0) == "2024001");
        assert(formatCellValue(0.004) == "0");
        assert(formatCellValue(true) == "TRUE" && formatCellValue(false) == "FALSE");
        assert(formatCellValue(QStringLiteral("一班")) == QStringLiteral("一班"));
        assert(formatCellValue(42) == "42");
    }
    // Table padding and truncation
    {
        Table t({"a", "b", "c"});
        assert(t.isEmpty());
        t.addRow({1.0});
        t.addRow({1.0, 2.0, 3.0, 4.0});
        assert(t.rowCount() == 2);
        const Record &r0 = t.records()[0];
        assert(r0.size() == 3 && r0.value(0).toDouble() == 1.0 && !r0.value(2).isValid());
        assert(!t.records()[1].value(3).isValid());
        assert(t.records()[1].value("c").toDouble() == 3.0);
        assert(!t.records()[1].value("missing").isValid());
        assert(r0.columns() == (QStringList{"a", "b", "c"}));
        Record empty;
        assert(empty.size() == 0 && empty.columns().isEmpty() && !empty.value("a").isValid());
    }
    std::cout << "value_format_test passed" << std::endl;
    return 0;
}
