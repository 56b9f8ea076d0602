#pragma once

// ---------------------------------------------------------------------------
// sql_statement.hpp
//
// 파싱이 끝난 SQL 구문의 타입 표현.
//
// [구조]
// - 구문 카테고리(DML/DDL/DAL/DCL/TCL)마다 별도 구조체를 두고,
//   SqlStatement 는 이들의 std::variant 를 보유한다.
// - 카테고리 구조체는 정확한 구문 종류(kind)를 enum 으로 갖는다.
// - 새 카테고리를 추가하면 std::visit 기반 분기(PrivilegeClassifier 등)가
//   컴파일 오류를 내므로 누락을 조기에 발견할 수 있다.
// - 새 kind 는 기존 카테고리 안에 추가되는 경우가 대부분이며,
//   분류기에서는 wildcard 로 "매핑 없음" 처리된다.
//
// 이 헤더는 다른 프로젝트 헤더에 의존하지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

enum class DmlKind : std::uint8_t {
    kSelect  = 0,
    kInsert  = 1,
    kUpdate  = 2,
    kDelete  = 3,
    kReplace = 4,
    kCall    = 5,
    kDo      = 6,
    kLoad    = 7,  // LOAD DATA / LOAD XML
};

enum class DdlKind : std::uint8_t {
    kAlterDatabase   = 0,
    kAlterTable      = 1,
    kCreateDatabase  = 2,
    kCreateTable     = 3,
    kCreateFunction  = 4,
    kCreateIndex     = 5,
    kCreateView      = 6,
    kCreateProcedure = 7,
    kDropTable       = 8,
    kDropDatabase    = 9,
    kDropIndex       = 10,
    kDropView        = 11,
    kTruncate        = 12,
    kRenameTable     = 13,
    kOther           = 14,  // 기타 CREATE/ALTER/DROP 대상 (TRIGGER, EVENT 등)
};

// 데이터베이스 관리 구문 (SHOW/USE/SET/EXPLAIN 등)
enum class DalKind : std::uint8_t {
    kShowDatabases = 0,
    kShowTables    = 1,
    kShowOther     = 2,
    kUse           = 3,
    kSet           = 4,
    kExplain       = 5,
    kOther         = 6,  // 분류 불가 키워드
};

enum class DclKind : std::uint8_t {
    kGrant      = 0,
    kRevoke     = 1,
    kCreateUser = 2,
    kDropUser   = 3,
    kAlterUser  = 4,
};

enum class TclKind : std::uint8_t {
    kBegin     = 0,
    kCommit    = 1,
    kRollback  = 2,
    kSavepoint = 3,
};

struct DmlStatement {
    DmlKind kind{DmlKind::kSelect};
};

struct DdlStatement {
    DdlKind kind{DdlKind::kOther};
};

struct DalStatement {
    DalKind kind{DalKind::kOther};
};

struct DclStatement {
    DclKind kind{DclKind::kGrant};
};

struct TclStatement {
    TclKind kind{TclKind::kBegin};
};

using StatementBody =
    std::variant<DmlStatement, DdlStatement, DalStatement, DclStatement, TclStatement>;

// ---------------------------------------------------------------------------
// SqlStatement
//   읽기 전용 입력. 권한 검사 코어는 이 값을 변경하거나 보관하지 않는다.
//   raw_sql / tables 는 로깅 목적이며 권한 판정에 사용되지 않는다.
// ---------------------------------------------------------------------------
struct SqlStatement {
    StatementBody            body{DalStatement{}};
    std::string              raw_sql{};
    std::vector<std::string> tables{};
};

// 카테고리/종류 이름 (로깅용). 예: ("DML", "SELECT"), ("DDL", "CREATE_TABLE")
[[nodiscard]] std::string_view category_name(const SqlStatement& statement);
[[nodiscard]] std::string_view kind_name(const SqlStatement& statement);
