#include "QtGridSheet/RoleResolver.hpp"

namespace QtGridSheet {

bool RoleAssignment::isIdentity(int column) const {
    for(const auto &b : bindings) if(b.column == column) return true;
    return false;
}

bool RoleAssignment::hasSharedColumn() const {
    for(const auto &b : bindings) if(b.shared) return true;
    return false;
}

RoleResolver::RoleResolver() {
    m_aliases[static_cast<int>(IdentityRole::Name)] = {QStringLiteral("姓名"), QStringLiteral("姓名/Name"),
                                                      QStringLiteral("name"), QStringLiteral("Name")};
    m_aliases[static_cast<int>(IdentityRole::Code)] = {QStringLiteral("学号"), QStringLiteral("学号/Code"),
                                                      QStringLiteral("code"), QStringLiteral("Code")};
    m_aliases[static_cast<int>(IdentityRole::Class)] = {QStringLiteral("班级"), QStringLiteral("班级/Class"),
                                                       QStringLiteral("class"), QStringLiteral("Class")};
}

RoleResult RoleResolver::resolve(const QStringList &columns) const {
    RoleResult result;
    RoleAssignment roles;
    for(int r = 0; r < 3; ++r) {
        auto &binding = roles.bindings[r];
        for(int c = 0; c < columns.size() && binding.column < 0; ++c) {
            if(m_aliases[r].contains(columns.at(c).trimmed())) binding = {c, RoleSource::Alias};
        }
        if(binding.column >= 0) continue;
        if(m_positions[r] < 0 || m_positions[r] >= columns.size()) {
            result.error = SchemaError::TooFewColumns;
            result.failedRole = static_cast<IdentityRole>(r);
            return result;
        }
        binding = {m_positions[r], RoleSource::Position};
    }
    for(int a = 0; a < 3; ++a) {
        for(int b = a + 1; b < 3; ++b) {
            if(roles.bindings[a].column != roles.bindings[b].column) continue;
            // flag the role that got there by position
            const int flagged = roles.bindings[b].source == RoleSource::Position ? b : a;
            roles.bindings[flagged].shared = true;
        }
    }
    result.assignment = roles;
    return result;
}

QStringList RoleResolver::detailColumns(const QStringList &columns, const RoleAssignment &roles) {
    QStringList out;
    for(int c = 0; c < columns.size(); ++c) if(!roles.isIdentity(c)) out << columns.at(c);
    return out;
}

const char * toString(IdentityRole role) {
    switch(role) {
    case IdentityRole::Name: return "name";
    case IdentityRole::Code: return "code";
    case IdentityRole::Class: return "class";
    }
    return "?";
}

} // namespace QtGridSheet
