#pragma once

// ---------------------------------------------------------------------------
// privileges.hpp
//
// principal 한 명이 보유한 권한 집합 (DB 가시성 + 권한 종류).
//
// 권한 검사 코어는 이 인터페이스를 읽기만 한다. 생성/갱신은
// AuthorityRule 빌더(authority_loader) 소관이다.
//
// [구현체]
// - AllPermittedPrivileges      : 모든 DB, 모든 권한 허용
// - DatabasePermittedPrivileges : 매핑된 DB 만 보이며, 보이는 DB 에서는 모든 권한
// - GrantedPrivileges           : 명시적 DB 목록 + 명시적 권한 종류
//
// 데이터베이스 목록의 "*" 는 모든 DB 를 의미한다. DB 이름 비교는 대소문자를
// 구분한다.
// ---------------------------------------------------------------------------

#include <functional>
#include <set>
#include <string>
#include <string_view>

#include "authority/privilege_type.hpp"

class Privileges {
public:
    virtual ~Privileges() = default;

    // database 에 대한 가시성
    [[nodiscard]] virtual bool has_privileges(std::string_view database) const = 0;

    // privileges 중 하나 이상을 보유하는지
    [[nodiscard]] virtual bool has_privileges(const PrivilegeTypeSet& privileges) const = 0;
};

class AllPermittedPrivileges final : public Privileges {
public:
    [[nodiscard]] bool has_privileges(std::string_view database) const override;
    [[nodiscard]] bool has_privileges(const PrivilegeTypeSet& privileges) const override;
};

class DatabasePermittedPrivileges final : public Privileges {
public:
    explicit DatabasePermittedPrivileges(std::set<std::string, std::less<>> databases);

    [[nodiscard]] bool has_privileges(std::string_view database) const override;
    [[nodiscard]] bool has_privileges(const PrivilegeTypeSet& privileges) const override;

private:
    std::set<std::string, std::less<>> databases_;
};

class GrantedPrivileges final : public Privileges {
public:
    GrantedPrivileges(std::set<std::string, std::less<>> databases, PrivilegeTypeSet granted);

    [[nodiscard]] bool has_privileges(std::string_view database) const override;
    [[nodiscard]] bool has_privileges(const PrivilegeTypeSet& privileges) const override;

    [[nodiscard]] const PrivilegeTypeSet& granted() const noexcept { return granted_; }

private:
    std::set<std::string, std::less<>> databases_;
    PrivilegeTypeSet                   granted_;
};
