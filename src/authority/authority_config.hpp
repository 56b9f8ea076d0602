#pragma once

// ---------------------------------------------------------------------------
// authority_config.hpp
//
// 권한 설정 구조체 정의 (헤더만, 구현 없음).
// yaml-cpp 를 통해 config/authority.yaml 에서 로드된다.
//
// [설계 원칙]
// - 이 구조체는 판정 로직을 포함하지 않는다. AuthorityRule 로 변환된 뒤
//   AuthorityChecker 가 사용한다.
// - 모든 컨테이너 멤버는 기본값을 명시하여 미초기화 동작을 방지한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <map>
#include <string>
#include <vector>

#include "authority/authority_rule.hpp"  // AuthorityUser
#include "authority/privilege_type.hpp"

// ---------------------------------------------------------------------------
// PrivilegeProviderType
//   사용자별 권한 집합을 만드는 방식.
//
//   kAllPermitted      : 모든 사용자에게 모든 DB/권한 허용
//   kDatabasePermitted : props["user-database-mappings"] 에 매핑된 DB 만 허용
//                        (예: "root@%=*, alice@%=sales, alice@%=hr")
//   kGranted           : grants 목록의 DB/권한만 허용
// ---------------------------------------------------------------------------
enum class PrivilegeProviderType : std::uint8_t {
    kAllPermitted      = 0,
    kDatabasePermitted = 1,
    kGranted           = 2,
};

// ---------------------------------------------------------------------------
// GrantConfig
//   kGranted 공급자의 사용자별 권한 항목.
// ---------------------------------------------------------------------------
struct GrantConfig {
    Grantee                  grantee{};
    std::vector<std::string> databases{};   // "*" = 모든 DB
    PrivilegeTypeSet         privileges{};
};

// ---------------------------------------------------------------------------
// DatabaseMapping
//   user-database-mappings 의 "user@host=db" 항목 하나.
// ---------------------------------------------------------------------------
struct DatabaseMapping {
    Grantee     grantee{};
    std::string database{};
};

struct PrivilegeProviderConfig {
    PrivilegeProviderType              type{PrivilegeProviderType::kAllPermitted};
    std::map<std::string, std::string> props{};              // 원문 props
    std::vector<DatabaseMapping>       database_mappings{};  // kDatabasePermitted
    std::vector<GrantConfig>           grants{};             // kGranted
};

// ---------------------------------------------------------------------------
// GlobalConfig
//   log_level: "debug"|"info"|"warn"|"error"
// ---------------------------------------------------------------------------
struct GlobalConfig {
    std::string   log_level{"info"};
    std::string   log_path{"/tmp/dbauthz.log"};
    std::uint32_t reload_interval_ms{1000};
};

// ---------------------------------------------------------------------------
// AuthorityConfig
//   AuthorityLoader::load 가 반환하는 최종 결과물.
// ---------------------------------------------------------------------------
struct AuthorityConfig {
    GlobalConfig               global{};
    std::vector<AuthorityUser> users{};
    PrivilegeProviderConfig    privilege{};
};
