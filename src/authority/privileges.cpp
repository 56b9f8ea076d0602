// ---------------------------------------------------------------------------
// privileges.cpp
// ---------------------------------------------------------------------------

#include "authority/privileges.hpp"

#include <algorithm>
#include <utility>

namespace {

constexpr std::string_view kAnyDatabase = "*";

bool contains_database(const std::set<std::string, std::less<>>& databases,
                       std::string_view                          database) {
    return databases.contains(kAnyDatabase) || databases.contains(database);
}

}  // namespace

// ---------------------------------------------------------------------------
// AllPermittedPrivileges
// ---------------------------------------------------------------------------
bool AllPermittedPrivileges::has_privileges(std::string_view /*database*/) const {
    return true;
}

bool AllPermittedPrivileges::has_privileges(const PrivilegeTypeSet& /*privileges*/) const {
    return true;
}

// ---------------------------------------------------------------------------
// DatabasePermittedPrivileges
//   가시성만 제한한다. 권한 종류 검사는 항상 통과 (DB 단위 권한 모델).
// ---------------------------------------------------------------------------
DatabasePermittedPrivileges::DatabasePermittedPrivileges(
    std::set<std::string, std::less<>> databases)
    : databases_(std::move(databases))
{}

bool DatabasePermittedPrivileges::has_privileges(std::string_view database) const {
    return contains_database(databases_, database);
}

bool DatabasePermittedPrivileges::has_privileges(const PrivilegeTypeSet& /*privileges*/) const {
    return true;
}

// ---------------------------------------------------------------------------
// GrantedPrivileges
// ---------------------------------------------------------------------------
GrantedPrivileges::GrantedPrivileges(std::set<std::string, std::less<>> databases,
                                     PrivilegeTypeSet                   granted)
    : databases_(std::move(databases))
    , granted_(std::move(granted))
{}

bool GrantedPrivileges::has_privileges(std::string_view database) const {
    return contains_database(databases_, database);
}

bool GrantedPrivileges::has_privileges(const PrivilegeTypeSet& privileges) const {
    return std::any_of(privileges.begin(), privileges.end(),
                       [this](PrivilegeType each) { return granted_.contains(each); });
}
