// ---------------------------------------------------------------------------
// authority_rule.cpp
// ---------------------------------------------------------------------------

#include "authority/authority_rule.hpp"

#include <algorithm>

AuthorityRule::AuthorityRule(std::vector<AuthorityUser> users,
                             std::vector<PrivilegesEntry> privileges)
    : users_(std::move(users))
    , privileges_(std::move(privileges))
{}

std::optional<AuthorityUser> AuthorityRule::find_user(const Grantee& grantee) const {
    const auto it = std::find_if(users_.begin(), users_.end(), [&](const AuthorityUser& each) {
        return each.grantee.matches(grantee);
    });
    if (it == users_.end()) {
        return std::nullopt;
    }
    return *it;
}

std::shared_ptr<const Privileges> AuthorityRule::find_privileges(const Grantee& grantee) const {
    // find_user 가 고른 레코드의 권한만 본다. 그 레코드에 권한이 없으면
    // 뒤의 "%" 항목으로 넘어가지 않고 nullptr (권한 없음).
    const auto user = std::find_if(users_.begin(), users_.end(), [&](const AuthorityUser& each) {
        return each.grantee.matches(grantee);
    });
    if (user == users_.end()) {
        return nullptr;
    }
    const auto it = std::find_if(privileges_.begin(), privileges_.end(),
                                 [&](const PrivilegesEntry& each) {
                                     return each.first == user->grantee;
                                 });
    if (it == privileges_.end()) {
        return nullptr;
    }
    return it->second;
}
