/** \file RoleResolver.hpp
 *  Resolves the three identity columns (name, code, class) of a table.
 *  Each role is matched against its alias list first (exact, case-sensitive, surrounding
 *  whitespace ignored); a role without a match falls back to a fixed column position.
 *  A fallback position already taken by another role is shared with it and flagged, not rejected.
 */
#pragma once
#include "QtGridSheet/Export.hpp"
#include <QStringList>
#include <array>
#include <optional>

namespace QtGridSheet {

enum class IdentityRole { Name = 0, Code = 1, Class = 2 };

enum class RoleSource { Alias, Position };

struct RoleBinding {
    int column{-1};
    RoleSource source{RoleSource::Alias};
    bool shared{false}; ///< column also bound to another role
};

struct QTGRIDSHEET_EXPORT RoleAssignment {
    std::array<RoleBinding, 3> bindings;

    const RoleBinding & operator[](IdentityRole r) const { return bindings[static_cast<int>(r)]; }
    int column(IdentityRole r) const { return (*this)[r].column; }
    bool isIdentity(int column) const;
    /** True when some role had to share its column with another one. */
    bool hasSharedColumn() const;
};

enum class SchemaError {
    TooFewColumns ///< positional fallback points past the last column
};

/** Either an assignment or the reason the schema is ambiguous. */
struct QTGRIDSHEET_EXPORT RoleResult {
    std::optional<RoleAssignment> assignment;
    SchemaError error{SchemaError::TooFewColumns};
    IdentityRole failedRole{IdentityRole::Name};

    bool ok() const { return assignment.has_value(); }
};

class QTGRIDSHEET_EXPORT RoleResolver {
public:
    /** Resolver with the default alias lists and positions 0/1/2. */
    RoleResolver();

    void setAliases(IdentityRole role, const QStringList &aliases) { m_aliases[static_cast<int>(role)] = aliases; }
    void setFallbackPosition(IdentityRole role, int column) { m_positions[static_cast<int>(role)] = column; }
    const QStringList & aliases(IdentityRole role) const { return m_aliases[static_cast<int>(role)]; }

    RoleResult resolve(const QStringList &columns) const;

    /** Columns that are not identity columns, in source order. */
    static QStringList detailColumns(const QStringList &columns, const RoleAssignment &roles);

private:
    std::array<QStringList, 3> m_aliases;
    std::array<int, 3> m_positions{{0, 1, 2}};
};

QTGRIDSHEET_EXPORT const char * toString(IdentityRole role);

} // namespace QtGridSheet
