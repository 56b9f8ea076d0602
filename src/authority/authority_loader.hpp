#pragma once

// ---------------------------------------------------------------------------
// authority_loader.hpp
//
// YAML 권한 설정 파일을 로드하여 AuthorityConfig 로 파싱하고,
// 이를 불변 AuthorityRule 로 변환한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환. 호출자는
//   실패 시 기존 규칙을 유지하거나 서비스를 차단해야 한다.
// - 부분적으로 파싱된 설정을 반환하지 않는다 (all-or-nothing).
// - 파싱 실패 원인은 로깅하되, password 를 로그에 출력하지 않는다.
//
// [YAML 스키마]
//   global:
//     log_level: info
//     log_path: /tmp/dbauthz.log
//     reload_interval_ms: 1000
//   authority:
//     users:
//       - root@%:root                 # user@host:password
//       - user: alice@%
//         password: secret
//         auth_plugin: mysql_native_password
//     privilege:
//       type: DATABASE_PERMITTED      # ALL_PERMITTED | DATABASE_PERMITTED | GRANTED
//       props:
//         user-database-mappings: root@%=*, alice@%=sales
//     grants:                         # GRANTED 전용
//       - user: alice@%
//         databases: [sales]
//         privileges: [SELECT]
// ---------------------------------------------------------------------------

#include <expected>
#include <filesystem>
#include <memory>
#include <string>

#include "authority/authority_config.hpp"
#include "authority/authority_rule.hpp"

class AuthorityLoader {
public:
    // load
    //   파일 없음, YAML 오류, authority 섹션 누락, 사용자 없음,
    //   알 수 없는 공급자 타입/권한 이름, 선언되지 않은 사용자를 가리키는
    //   매핑/grant 는 모두 실패로 처리한다.
    [[nodiscard]] static std::expected<AuthorityConfig, std::string>
    load(const std::filesystem::path& config_path);

    // load_from_string
    //   load() 와 동일한 검증을 문자열 입력에 적용한다. source 는 오류 메시지용.
    [[nodiscard]] static std::expected<AuthorityConfig, std::string>
    load_from_string(const std::string& yaml, const std::string& source = "<string>");
};

// ---------------------------------------------------------------------------
// build_authority_rule
//   공급자 설정에 따라 선언된 사용자마다 Privileges 를 만든다.
//   kDatabasePermitted / kGranted 에서 매핑되지 않은 사용자는 권한 집합이 없다.
//   (load() 를 통과한 설정을 전제로 하며 실패하지 않는다)
// ---------------------------------------------------------------------------
[[nodiscard]] std::shared_ptr<const AuthorityRule> build_authority_rule(const AuthorityConfig& config);
