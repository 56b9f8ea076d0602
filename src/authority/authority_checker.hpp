#pragma once

// ---------------------------------------------------------------------------
// authority_checker.hpp
//
// principal 하나에 대해 인증/가시성/구문 권한을 판정한다.
//
// [fail-close 원칙: 절대 위반 금지]
// 1. check_privileges 의 거부는 항상 std::unexpected(AuthorityError) 로 반환된다.
//    [[nodiscard]] 이므로 결과를 무시할 수 없다.
// 2. 권한 매핑이 없는 구문은 항상 kUnauthorizedOperation("") 으로 거부된다.
// 3. 권한 집합이 없는 principal 은 어떤 구문도 통과하지 못한다.
//
// [principal 없음 = 신뢰된 내부 호출]
// grantee 가 std::nullopt 이면 모든 검사를 건너뛴다. 이는 principal 을
// 갖지 않는 관리/시스템 경로를 위한 의도된 우회이다.
// 빈 username 의 Grantee 는 이 우회에 해당하지 않는다.
//
// [스레드 안전성]
// rule 과 grantee 를 읽기만 하므로 동시 호출에 안전하다. rule 의 수명은
// 호출자가 보장한다 (AuthorityRuleStore::snapshot 으로 얻은 shared_ptr 유지).
// ---------------------------------------------------------------------------

#include <expected>
#include <functional>
#include <optional>
#include <string_view>

#include "authority/authority_rule.hpp"
#include "authority/grantee.hpp"
#include "common/types.hpp"          // AuthorityError
#include "parser/sql_statement.hpp"

// ---------------------------------------------------------------------------
// CredentialValidator
//   저장된 사용자 레코드와 클라이언트가 보낸 cipher 를 비교한다.
//   비교 알고리즘(평문, mysql_native_password 등)은 전적으로 validator 소관이다.
// ---------------------------------------------------------------------------
using CredentialValidator = std::function<bool(const AuthorityUser&, std::string_view)>;

class AuthorityChecker {
public:
    AuthorityChecker(const AuthorityRule& rule, std::optional<Grantee> grantee);

    // is_authenticated
    //   저장된 사용자 레코드가 없으면 false, 있으면 validator(user, cipher) 결과를
    //   그대로 반환한다. 예외를 던지지 않는 validator 를 전달할 것.
    [[nodiscard]] bool is_authenticated(const CredentialValidator& validator,
                                        std::string_view           cipher) const;

    // is_authorized
    //   카탈로그 노출 여부 등에 쓰는 비예외 가시성 조회.
    //   principal 없음 → true, 권한 집합 없음 → false.
    [[nodiscard]] bool is_authorized(std::string_view database) const;

    // check_privileges
    //   구문 실행 전 호출하는 강제 검사. 순서대로 short-circuit:
    //     1. principal 없음 → 성공
    //     2. database 지정 시 가시성 없음(또는 권한 집합 없음)
    //        → kUnknownDatabase(database)
    //     3. 필요한 권한 미보유(또는 매핑 없음, 권한 집합 없음)
    //        → kUnauthorizedOperation(권한 이름 또는 "")
    //   database 가 std::nullopt 이면 2단계를 건너뛴다.
    [[nodiscard]] std::expected<void, AuthorityError>
    check_privileges(std::optional<std::string_view> database,
                     const SqlStatement&             statement) const;

    [[nodiscard]] const std::optional<Grantee>& grantee() const noexcept { return grantee_; }

private:
    const AuthorityRule&   rule_;
    std::optional<Grantee> grantee_;
};
