#include "QtGridSheet/Builder.hpp"

namespace QtGridSheet {

HeaderTemplate makeWorksheetHeader(const QString &date, const QString &scope) {
    HeaderTemplate tpl;
    tpl.prefix = date + QStringLiteral("重默 ") + scope;
    tpl.fillerA = QStringLiteral("________");
    tpl.labelA = QStringLiteral("Name");
    tpl.fillerB = QStringLiteral("___");
    tpl.labelB = QStringLiteral("Class");
    tpl.minLenA = 2;
    tpl.minLenB = 1;
    return tpl;
}

CardContent makeCardContent(const Record &record, const RoleAssignment &roles, const QStringList &fields,
                            const QString &aside, const QList<IdentityRole> &titleRoles) {
    CardContent content;
    QStringList title;
    for(const auto role : titleRoles) title << formatCellValue(record.value(roles.column(role)));
    content.title = title.join(QLatin1Char(' '));
    content.aside = aside;
    content.items.reserve(fields.size());
    for(const auto &f : fields) content.items.emplace_back(f, formatCellValue(record.value(f)));
    return content;
}

MixedFont makeMixedFont(FontRegistry &registry, const QString &wideFontPath, QFont::Weight weight) {
    return MixedFont{registry.serif(weight), registry.resolve(wideFontPath, weight)};
}

} // namespace QtGridSheet
