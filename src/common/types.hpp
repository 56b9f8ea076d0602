#pragma once

#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// ParseErrorCode
//   SQL 파싱 단계에서 발생 가능한 오류 분류.
// ---------------------------------------------------------------------------
enum class ParseErrorCode : std::uint8_t {
    kInvalidSql     = 0,  // SQL 문법 오류 (빈 입력 등)
    kMultiStatement = 1,  // 세미콜론으로 구분된 복수 구문
    kInternalError  = 2,  // 파서 내부 오류
};

// ---------------------------------------------------------------------------
// ParseError
//   파싱 실패 시 반환되는 오류 정보.
//   std::expected<T, ParseError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct ParseError {
    ParseErrorCode code{ParseErrorCode::kInternalError};
    std::string    message{};  // 사람이 읽을 수 있는 오류 설명
    std::string    context{};  // 오류가 발생한 입력 단편 (로깅용)
};

// ---------------------------------------------------------------------------
// AuthorityErrorCode
//   권한 검사 거부 사유.
//
//   kUnknownDatabase       : 대상 DB 가 principal 에게 보이지 않음
//                            ("permission denied" 대신 "database not found" 로
//                            보고하여 DB 존재 여부를 노출하지 않는다)
//   kUnauthorizedOperation : 가시성은 통과했으나 필요한 권한이 없거나
//                            구문이 어떤 권한에도 매핑되지 않음
// ---------------------------------------------------------------------------
enum class AuthorityErrorCode : std::uint8_t {
    kUnknownDatabase       = 0,
    kUnauthorizedOperation = 1,
};

// ---------------------------------------------------------------------------
// AuthorityError
//   AuthorityChecker::check_privileges 가 반환하는 거부 정보.
//
//   subject:
//     kUnknownDatabase       → 데이터베이스 이름
//     kUnauthorizedOperation → 권한 이름 (매핑 없는 구문이면 빈 문자열)
// ---------------------------------------------------------------------------
struct AuthorityError {
    AuthorityErrorCode code{AuthorityErrorCode::kUnauthorizedOperation};
    std::string        subject{};

    // 클라이언트 응답용 메시지
    [[nodiscard]] std::string message() const {
        if (code == AuthorityErrorCode::kUnknownDatabase) {
            return "Unknown database '" + subject + "'";
        }
        return "Access denied for operation " + subject;
    }

    bool operator==(const AuthorityError&) const = default;
};
