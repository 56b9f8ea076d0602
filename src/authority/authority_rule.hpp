#pragma once

// ---------------------------------------------------------------------------
// authority_rule.hpp
//
// 사용자(자격 증명 레코드) 목록과 사용자별 권한 집합을 담는 불변 규칙 객체.
//
// [수명]
// 프로세스 전역. AuthorityRuleStore 가 shared_ptr<const AuthorityRule> 로
// 보유하며, 갱신은 새 객체로의 원자적 교체로만 이루어진다.
// 생성 이후 어떤 멤버도 변경되지 않으므로 동시 조회에 잠금이 필요 없다.
//
// [매칭 순서]
// find_user 는 설정 순서대로 Grantee::matches 를 적용하여 첫 번째로 일치하는
// 사용자를 반환한다. 구체적인 host 를 "%" 보다 앞에 둘 것.
// find_privileges 는 그 사용자와 grantee 가 정확히 같은 항목만 반환한다.
// ---------------------------------------------------------------------------

#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

#include "authority/grantee.hpp"
#include "authority/privileges.hpp"

// ---------------------------------------------------------------------------
// AuthorityUser
//   저장된 자격 증명 레코드. password 는 평문 그대로 보관되며
//   비교 방식은 호출자가 주입하는 validator 가 결정한다.
// ---------------------------------------------------------------------------
struct AuthorityUser {
    Grantee     grantee{};
    std::string password{};
    std::string auth_plugin{"mysql_native_password"};
};

class AuthorityRule {
public:
    using PrivilegesEntry = std::pair<Grantee, std::shared_ptr<const Privileges>>;

    AuthorityRule(std::vector<AuthorityUser> users, std::vector<PrivilegesEntry> privileges);

    // 요청 grantee 와 일치하는 사용자. 없으면 std::nullopt.
    [[nodiscard]] std::optional<AuthorityUser> find_user(const Grantee& grantee) const;

    // find_user 가 고른 사용자의 권한 집합. 사용자나 권한이 없으면 nullptr.
    [[nodiscard]] std::shared_ptr<const Privileges> find_privileges(const Grantee& grantee) const;

    [[nodiscard]] const std::vector<AuthorityUser>& users() const noexcept { return users_; }

private:
    std::vector<AuthorityUser>   users_;
    std::vector<PrivilegesEntry> privileges_;
};
