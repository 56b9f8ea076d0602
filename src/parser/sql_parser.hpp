#pragma once

// ---------------------------------------------------------------------------
// sql_parser.hpp
//
// SQL 문자열을 타입화된 SqlStatement 로 변환하는 "선두 키워드 기반 분류"
// 수준의 경량 파서. 권한 검사 코어(AuthorityChecker)의 입력을 만든다.
//
// [설계 한계 / 알려진 우회 가능성]
// 1. 주석 내 SQL: /*!50000 DROP TABLE */ 같은 MySQL 조건부 주석은 제거되어
//    내용이 분류에 반영되지 않는다.
// 2. WITH (CTE): CTE 목록을 건너뛰고 본문 동사로 분류한다.
//    WITH ... UPDATE 는 UPDATE, WITH ... DELETE 는 DELETE 가 된다.
//    본문을 찾지 못하면 DalKind::kOther 로 분류된다.
// 3. 알 수 없는 선두 키워드는 DalKind::kOther 로 분류되며, 분류기에서
//    권한 매핑이 없으므로 검사 단계에서 항상 거부된다 (fail-close).
// 4. tables 는 로깅 목적이다. 서브쿼리 내부 테이블명도 구분 없이 추출된다.
// ---------------------------------------------------------------------------

#include <expected>
#include <string_view>

#include "common/types.hpp"        // ParseError, ParseErrorCode
#include "parser/sql_statement.hpp"

// ---------------------------------------------------------------------------
// SqlParser
//   SQL 문자열을 받아 SqlStatement 로 변환한다.
//   실패 시 std::unexpected(ParseError) 를 반환한다.
//
//   [파서 보안 원칙]
//   - 파싱 실패는 절대 허용으로 이어지지 않는다. 호출자는 error path 에서
//     구문을 실행하지 않아야 한다.
//   - 복수 구문(문자열/주석 밖 세미콜론)은 ParseErrorCode::kMultiStatement.
//     끝에 붙은 세미콜론 하나는 허용한다.
// ---------------------------------------------------------------------------
class SqlParser {
public:
    SqlParser()  = default;
    ~SqlParser() = default;

    // 복사/이동 허용 (stateless)
    SqlParser(const SqlParser&)            = default;
    SqlParser& operator=(const SqlParser&) = default;
    SqlParser(SqlParser&&)                 = default;
    SqlParser& operator=(SqlParser&&)      = default;

    [[nodiscard]] std::expected<SqlStatement, ParseError>
    parse(std::string_view sql) const;
};
