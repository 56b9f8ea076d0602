// ---------------------------------------------------------------------------
// authority_checker.cpp
// ---------------------------------------------------------------------------

#include "authority/authority_checker.hpp"

#include <string>
#include <utility>

#include <spdlog/spdlog.h>

#include "authority/privilege_classifier.hpp"

AuthorityChecker::AuthorityChecker(const AuthorityRule& rule, std::optional<Grantee> grantee)
    : rule_(rule)
    , grantee_(std::move(grantee))
{}

bool AuthorityChecker::is_authenticated(const CredentialValidator& validator,
                                        std::string_view           cipher) const {
    if (!grantee_.has_value()) {
        return false;
    }
    const auto user = rule_.find_user(*grantee_);
    if (!user.has_value()) {
        spdlog::debug("authority_checker: no user record for '{}'", grantee_->to_string());
        return false;
    }
    return validator(*user, cipher);
}

bool AuthorityChecker::is_authorized(std::string_view database) const {
    if (!grantee_.has_value()) {
        return true;
    }
    const auto privileges = rule_.find_privileges(*grantee_);
    return privileges != nullptr && privileges->has_privileges(database);
}

std::expected<void, AuthorityError>
AuthorityChecker::check_privileges(std::optional<std::string_view> database,
                                   const SqlStatement&             statement) const {
    // 1. principal 없음 → 신뢰된 내부 호출
    if (!grantee_.has_value()) {
        return {};
    }

    const auto privileges = rule_.find_privileges(*grantee_);

    // 2. DB 가시성
    if (database.has_value() &&
        (privileges == nullptr || !privileges->has_privileges(*database))) {
        spdlog::debug("authority_checker: '{}' cannot see database '{}'",
                      grantee_->to_string(), *database);
        return std::unexpected(AuthorityError{
            AuthorityErrorCode::kUnknownDatabase,
            std::string(*database)
        });
    }

    // 3. 구문 권한
    const auto required = PrivilegeClassifier::resolve(statement);
    if (privileges == nullptr || !required.has_value() ||
        !privileges->has_privileges(PrivilegeTypeSet{*required})) {
        const std::string name = required.has_value() ? std::string(to_string(*required)) : "";
        spdlog::debug("authority_checker: '{}' lacks privilege '{}' for {}:{}",
                      grantee_->to_string(), name,
                      category_name(statement), kind_name(statement));
        return std::unexpected(AuthorityError{
            AuthorityErrorCode::kUnauthorizedOperation,
            name
        });
    }

    return {};
}
