/** \file Builder.hpp
 *  Free helper functions assembling templates, card contents and font pairs.
 */
#pragma once
#include "QtGridSheet/Export.hpp"
#include "QtGridSheet/CardRenderer.hpp"
#include "QtGridSheet/FontRegistry.hpp"
#include "QtGridSheet/HeaderTemplate.hpp"
#include "QtGridSheet/Record.hpp"
#include "QtGridSheet/RoleResolver.hpp"
#include <QList>

namespace QtGridSheet {

/** Worksheet header "<date>重默 <scope> Name________ Class___" with minimum fillers 2 and 1. */
QTGRIDSHEET_EXPORT HeaderTemplate makeWorksheetHeader(const QString &date, const QString &scope);

/** Title from the identity roles (joined by one space), aside label, and "field: value" items. */
QTGRIDSHEET_EXPORT CardContent makeCardContent(const Record &record, const RoleAssignment &roles,
                                               const QStringList &fields, const QString &aside,
                                               const QList<IdentityRole> &titleRoles = {IdentityRole::Name,
                                                                                        IdentityRole::Code});

/** Same face for both run classes (a single CJK-capable font). */
inline MixedFont makeUniformFont(const TypefacePtr &face) { return MixedFont{face, face}; }

/** Built-in serif for Latin runs and the given file for wide runs. */
QTGRIDSHEET_EXPORT MixedFont makeMixedFont(FontRegistry &registry, const QString &wideFontPath,
                                           QFont::Weight weight = QFont::Normal);

} // namespace QtGridSheet
