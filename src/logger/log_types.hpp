#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [순환 의존성 방지 설계]
// - AuthorityChecker / PrivilegeType 을 include 하지 않는다.
//   호출자가 이름 문자열로 변환하여 채운다.
//
// [민감정보 취급 주의]
// - raw_sql 은 원문 SQL 전체를 포함한다. 운영 환경에서 로그 레벨/마스킹
//   정책을 별도로 적용할 것.
// - password / cipher 는 어떤 로그 구조체에도 넣지 않는다.
// ---------------------------------------------------------------------------

#include <chrono>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// "debug"|"info"|"warn"|"error" → LogLevel. 알 수 없으면 kInfo.
[[nodiscard]] LogLevel log_level_from_string(const std::string& level);

// ---------------------------------------------------------------------------
// DecisionLog
//   check_privileges 판정 로그. 허용은 info, 거부는 warn 레벨.
//
//   grantee            : "user@host", principal 없으면 빈 문자열
//   database           : 대상 DB, 지정되지 않았으면 빈 문자열
//   statement          : "DML:SELECT" 형식
//   required_privilege : 매핑된 권한 이름, 매핑 없으면 빈 문자열
//   error_code         : "UNKNOWN_DATABASE" | "UNAUTHORIZED_OPERATION" (허용 시 빈 문자열)
// ---------------------------------------------------------------------------
struct DecisionLog {
    std::string                           grantee{};
    std::string                           database{};
    std::string                           statement{};
    std::string                           required_privilege{};
    std::string                           raw_sql{};      // 원문 SQL (마스킹 주의)
    bool                                  allowed{false};
    std::string                           error_code{};
    std::string                           reason{};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// AuthenticationLog
//   is_authenticated 결과 로그.
// ---------------------------------------------------------------------------
struct AuthenticationLog {
    std::string                           grantee{};
    std::string                           auth_plugin{};
    bool                                  success{false};
    std::chrono::system_clock::time_point timestamp{};
};
