// ---------------------------------------------------------------------------
// test_sql_parser.cpp
//
// SqlParser 단위 테스트.
//
// [테스트 범위]
// - 선두 키워드 기반 카테고리/종류 분류 (DML/DDL/DAL/DCL/TCL)
// - CREATE/ALTER/DROP 수식어 건너뛰기 (OR REPLACE, UNIQUE, DEFINER=..., IF EXISTS)
// - 테이블명 추출 (FROM/INTO/UPDATE/JOIN/TABLE/ON)
// - 주석 전처리 (/* */, --, #)
// - 에러 처리 (빈 입력, 공백 전용, 주석 전용, 멀티 스테이트먼트)
// - raw_sql 원문 보존
//
// [알려진 한계]
// - 서브쿼리 내부 테이블명도 추출된다 (outer/inner 구분 없음).
// - 인식하지 못한 선두 키워드는 DalKind::kOther 로 분류된다.
// ---------------------------------------------------------------------------

#include "parser/sql_parser.hpp"

#include <gtest/gtest.h>

#include <algorithm>
#include <string>
#include <vector>

namespace {

bool contains_table(const std::vector<std::string>& tables, const std::string& name) {
    return std::find(tables.begin(), tables.end(), name) != tables.end();
}

// 분류 결과가 기대한 대체 타입/종류인지 검사한다.
template <class Statement, class Kind>
void expect_kind(std::string_view sql, Kind expected) {
    const SqlParser parser{};
    const auto result = parser.parse(sql);
    ASSERT_TRUE(result.has_value()) << "parse failed: " << sql;

    const auto* body = std::get_if<Statement>(&result->body);
    ASSERT_NE(body, nullptr)
        << "unexpected category " << category_name(*result) << " for: " << sql;
    EXPECT_EQ(body->kind, expected)
        << "unexpected kind " << kind_name(*result) << " for: " << sql;
}

}  // namespace

// ---------------------------------------------------------------------------
// DML 분류
// ---------------------------------------------------------------------------

TEST(SqlParser, SelectStatement) {
    expect_kind<DmlStatement>("SELECT id FROM users", DmlKind::kSelect);
}

TEST(SqlParser, WithClauseIsSelect) {
    expect_kind<DmlStatement>(
        "WITH recent AS (SELECT * FROM orders) SELECT * FROM recent", DmlKind::kSelect);
}

TEST(SqlParser, WithClauseClassifiedByMainVerb) {
    expect_kind<DmlStatement>(
        "WITH x AS (SELECT id FROM t WHERE a > 1) DELETE FROM t WHERE id IN (SELECT id FROM x)",
        DmlKind::kDelete);
    expect_kind<DmlStatement>("WITH x AS (SELECT 1) UPDATE t SET a = 1", DmlKind::kUpdate);
    expect_kind<DmlStatement>(
        "with recursive seq (n) as (select 1 union all select n + 1 from seq where n < 5) "
        "select * from seq",
        DmlKind::kSelect);
}

TEST(SqlParser, WithClauseMultipleCtesAndQuotedParens) {
    expect_kind<DmlStatement>(
        "WITH a AS (SELECT ')' AS p), b (c) AS (SELECT `x(`.c FROM `x(`) "
        "UPDATE t JOIN b ON t.id = b.c SET t.v = 1",
        DmlKind::kUpdate);
}

TEST(SqlParser, WithClauseWithoutMainStatementIsOther) {
    expect_kind<DalStatement>("WITH x AS (SELECT 1)", DalKind::kOther);
}

TEST(SqlParser, InsertStatement) {
    expect_kind<DmlStatement>("INSERT INTO users(name) VALUES('alice')", DmlKind::kInsert);
}

TEST(SqlParser, UpdateStatement) {
    expect_kind<DmlStatement>("UPDATE users SET name='bob' WHERE id=1", DmlKind::kUpdate);
}

TEST(SqlParser, DeleteStatement) {
    expect_kind<DmlStatement>("DELETE FROM users WHERE id=1", DmlKind::kDelete);
}

TEST(SqlParser, ReplaceCallLoad) {
    expect_kind<DmlStatement>("REPLACE INTO users VALUES (1)", DmlKind::kReplace);
    expect_kind<DmlStatement>("CALL refresh_stats()", DmlKind::kCall);
    expect_kind<DmlStatement>("LOAD DATA INFILE '/tmp/x' INTO TABLE t", DmlKind::kLoad);
}

// ---------------------------------------------------------------------------
// DDL 분류
// ---------------------------------------------------------------------------

TEST(SqlParser, CreateTable) {
    expect_kind<DdlStatement>("CREATE TABLE t (id INT)", DdlKind::kCreateTable);
    expect_kind<DdlStatement>("CREATE TEMPORARY TABLE IF NOT EXISTS t (id INT)",
                              DdlKind::kCreateTable);
}

TEST(SqlParser, CreateDatabaseAndSchema) {
    expect_kind<DdlStatement>("CREATE DATABASE sales", DdlKind::kCreateDatabase);
    expect_kind<DdlStatement>("CREATE SCHEMA IF NOT EXISTS sales", DdlKind::kCreateDatabase);
}

TEST(SqlParser, CreateFunctionWithDefiner) {
    expect_kind<DdlStatement>(
        "CREATE DEFINER=`root`@`%` FUNCTION f() RETURNS INT RETURN 1",
        DdlKind::kCreateFunction);
}

TEST(SqlParser, CreateUniqueIndex) {
    expect_kind<DdlStatement>("CREATE UNIQUE INDEX idx_name ON users(name)",
                              DdlKind::kCreateIndex);
}

TEST(SqlParser, CreateOrReplaceView) {
    expect_kind<DdlStatement>("CREATE OR REPLACE VIEW v AS SELECT * FROM users",
                              DdlKind::kCreateView);
}

TEST(SqlParser, CreateProcedure) {
    // 본문에 세미콜론이 있는 복합 구문은 멀티 스테이트먼트로 거부되므로 단일 본문만 사용
    expect_kind<DdlStatement>("CREATE PROCEDURE p() SELECT 1", DdlKind::kCreateProcedure);
}

TEST(SqlParser, AlterTableAndDatabase) {
    expect_kind<DdlStatement>("ALTER TABLE users ADD COLUMN age INT", DdlKind::kAlterTable);
    expect_kind<DdlStatement>("ALTER DATABASE sales CHARACTER SET utf8mb4",
                              DdlKind::kAlterDatabase);
    expect_kind<DdlStatement>("ALTER SCHEMA sales READ ONLY = 1", DdlKind::kAlterDatabase);
}

TEST(SqlParser, DropVariants) {
    expect_kind<DdlStatement>("DROP TABLE IF EXISTS users", DdlKind::kDropTable);
    expect_kind<DdlStatement>("DROP DATABASE sales", DdlKind::kDropDatabase);
    expect_kind<DdlStatement>("DROP SCHEMA sales", DdlKind::kDropDatabase);
    expect_kind<DdlStatement>("DROP INDEX idx_name ON users", DdlKind::kDropIndex);
    expect_kind<DdlStatement>("DROP VIEW v", DdlKind::kDropView);
}

TEST(SqlParser, TruncateWithAndWithoutTableKeyword) {
    expect_kind<DdlStatement>("TRUNCATE TABLE logs", DdlKind::kTruncate);
    expect_kind<DdlStatement>("TRUNCATE logs", DdlKind::kTruncate);
}

TEST(SqlParser, CreateTriggerIsOtherDdl) {
    expect_kind<DdlStatement>(
        "CREATE TRIGGER trg BEFORE INSERT ON users FOR EACH ROW SET NEW.x = 1",
        DdlKind::kOther);
}

// ---------------------------------------------------------------------------
// DAL / DCL / TCL 분류
// ---------------------------------------------------------------------------

TEST(SqlParser, ShowDatabasesAndSchemas) {
    expect_kind<DalStatement>("SHOW DATABASES", DalKind::kShowDatabases);
    expect_kind<DalStatement>("show schemas", DalKind::kShowDatabases);
}

TEST(SqlParser, ShowTablesAndOtherShow) {
    expect_kind<DalStatement>("SHOW FULL TABLES", DalKind::kShowTables);
    expect_kind<DalStatement>("SHOW VARIABLES LIKE 'x'", DalKind::kShowOther);
}

TEST(SqlParser, UseSetExplain) {
    expect_kind<DalStatement>("USE sales", DalKind::kUse);
    expect_kind<DalStatement>("SET autocommit = 0", DalKind::kSet);
    expect_kind<DalStatement>("EXPLAIN SELECT * FROM users", DalKind::kExplain);
    expect_kind<DalStatement>("DESCRIBE users", DalKind::kExplain);
}

TEST(SqlParser, UnknownLeadingKeywordIsOtherDal) {
    expect_kind<DalStatement>("FLUSH PRIVILEGES", DalKind::kOther);
}

TEST(SqlParser, DclStatements) {
    expect_kind<DclStatement>("GRANT SELECT ON sales.* TO 'alice'@'%'", DclKind::kGrant);
    expect_kind<DclStatement>("REVOKE SELECT ON sales.* FROM 'alice'@'%'", DclKind::kRevoke);
    expect_kind<DclStatement>("CREATE USER 'bob'@'%' IDENTIFIED BY 'x'", DclKind::kCreateUser);
    expect_kind<DclStatement>("DROP USER 'bob'@'%'", DclKind::kDropUser);
    expect_kind<DclStatement>("ALTER USER 'bob'@'%' ACCOUNT LOCK", DclKind::kAlterUser);
}

TEST(SqlParser, TclStatements) {
    expect_kind<TclStatement>("BEGIN", TclKind::kBegin);
    expect_kind<TclStatement>("START TRANSACTION", TclKind::kBegin);
    expect_kind<TclStatement>("COMMIT", TclKind::kCommit);
    expect_kind<TclStatement>("ROLLBACK", TclKind::kRollback);
    expect_kind<TclStatement>("SAVEPOINT sp1", TclKind::kSavepoint);
}

// ---------------------------------------------------------------------------
// 카테고리/종류 이름
// ---------------------------------------------------------------------------

TEST(SqlParser, CategoryAndKindNames) {
    const SqlParser parser{};

    const auto drop = parser.parse("DROP TABLE users");
    ASSERT_TRUE(drop.has_value());
    EXPECT_EQ(category_name(*drop), "DDL");
    EXPECT_EQ(kind_name(*drop), "DROP_TABLE");

    const auto show = parser.parse("SHOW DATABASES");
    ASSERT_TRUE(show.has_value());
    EXPECT_EQ(category_name(*show), "DAL");
    EXPECT_EQ(kind_name(*show), "SHOW_DATABASES");
}

// ---------------------------------------------------------------------------
// 테이블명 추출 (대문자 정규화)
// ---------------------------------------------------------------------------

TEST(SqlParser, TableFromSelect) {
    const SqlParser parser{};
    const auto result = parser.parse("SELECT * FROM users WHERE id = 1");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(contains_table(result->tables, "USERS"));
}

TEST(SqlParser, TablesFromJoinAndComma) {
    const SqlParser parser{};
    const auto joined = parser.parse(
        "SELECT * FROM users u JOIN orders o ON u.id = o.user_id");
    ASSERT_TRUE(joined.has_value());
    EXPECT_TRUE(contains_table(joined->tables, "USERS"));
    EXPECT_TRUE(contains_table(joined->tables, "ORDERS"));

    const auto comma = parser.parse("SELECT * FROM t1, t2");
    ASSERT_TRUE(comma.has_value());
    EXPECT_TRUE(contains_table(comma->tables, "T1"));
    EXPECT_TRUE(contains_table(comma->tables, "T2"));
}

TEST(SqlParser, TableFromInsertAndUpdate) {
    const SqlParser parser{};
    const auto insert = parser.parse("INSERT INTO `orders` VALUES (1)");
    ASSERT_TRUE(insert.has_value());
    EXPECT_TRUE(contains_table(insert->tables, "ORDERS"));

    const auto update = parser.parse("UPDATE accounts SET balance = 0");
    ASSERT_TRUE(update.has_value());
    EXPECT_TRUE(contains_table(update->tables, "ACCOUNTS"));
}

TEST(SqlParser, TableFromDropIfExists) {
    const SqlParser parser{};
    const auto result = parser.parse("DROP TABLE IF EXISTS audit_log");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(contains_table(result->tables, "AUDIT_LOG"));
    EXPECT_FALSE(contains_table(result->tables, "IF"));
}

TEST(SqlParser, TableFromTruncateWithoutTableKeyword) {
    const SqlParser parser{};
    const auto result = parser.parse("TRUNCATE logs");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(contains_table(result->tables, "LOGS"));
}

TEST(SqlParser, TableFromCreateIndex) {
    const SqlParser parser{};
    const auto result = parser.parse("CREATE INDEX idx ON users(name)");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(contains_table(result->tables, "USERS"));
}

TEST(SqlParser, SchemaQualifiedTable) {
    const SqlParser parser{};
    const auto result = parser.parse("SELECT * FROM sales.orders");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(contains_table(result->tables, "SALES.ORDERS"));
}

// [알려진 동작] 서브쿼리 내부 테이블명도 추출된다.
TEST(SqlParser, SubqueryTableExtracted_DocumentedBehavior) {
    const SqlParser parser{};
    const auto result = parser.parse("SELECT * FROM (SELECT id FROM inner_table) AS sub");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(contains_table(result->tables, "INNER_TABLE"));
}

// ---------------------------------------------------------------------------
// 대소문자 / 주석 처리
// ---------------------------------------------------------------------------

TEST(SqlParser, CaseInsensitive) {
    expect_kind<DmlStatement>("select * from users", DmlKind::kSelect);
    expect_kind<DdlStatement>("Drop Table users", DdlKind::kDropTable);
}

TEST(SqlParser, InlineComment) {
    expect_kind<DmlStatement>("/* hint */ SELECT * FROM users", DmlKind::kSelect);
}

TEST(SqlParser, CommentSplitKeywords) {
    // 주석 자리에 공백이 들어가므로 DROP 과 TABLE 이 분리되어 인식된다
    expect_kind<DdlStatement>("DROP/**/TABLE users", DdlKind::kDropTable);
}

TEST(SqlParser, LineAndHashComments) {
    expect_kind<DmlStatement>("-- leading\nSELECT 1", DmlKind::kSelect);
    expect_kind<DmlStatement>("# leading\nDELETE FROM t", DmlKind::kDelete);
}

TEST(SqlParser, CommentMarkerInsideStringPreserved) {
    const SqlParser parser{};
    const auto result = parser.parse("SELECT '--not a comment' FROM users");
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(contains_table(result->tables, "USERS"));
}

// ---------------------------------------------------------------------------
// 에러 처리
// ---------------------------------------------------------------------------

TEST(SqlParser, EmptyString) {
    const SqlParser parser{};
    const auto result = parser.parse("");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::kInvalidSql);
}

TEST(SqlParser, WhitespaceOnly) {
    const SqlParser parser{};
    const auto result = parser.parse("   \t\n  ");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::kInvalidSql);
}

TEST(SqlParser, CommentsOnly) {
    const SqlParser parser{};
    const auto result = parser.parse("/* nothing */ -- here");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::kInvalidSql);
}

TEST(SqlParser, MultiStatementRejected) {
    const SqlParser parser{};
    const auto result = parser.parse("SELECT 1; DROP TABLE users");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::kMultiStatement);
}

TEST(SqlParser, DoubleSemicolonRejected) {
    const SqlParser parser{};
    const auto result = parser.parse("SELECT 1; ;");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ParseErrorCode::kMultiStatement);
}

TEST(SqlParser, SemicolonInsideStringAllowed) {
    expect_kind<DmlStatement>("SELECT ';' FROM t", DmlKind::kSelect);
}

TEST(SqlParser, SemicolonInsideCommentsAllowed) {
    expect_kind<DmlStatement>("SELECT 1 /* ; DROP TABLE users */ FROM t", DmlKind::kSelect);
    expect_kind<DmlStatement>("SELECT 1 -- ; DROP TABLE users\nFROM t", DmlKind::kSelect);
}

TEST(SqlParser, TrailingSemicolonAllowed) {
    expect_kind<DmlStatement>("SELECT 1;", DmlKind::kSelect);
    expect_kind<DmlStatement>("SELECT 1;  \t\n  ", DmlKind::kSelect);
    expect_kind<DmlStatement>("SELECT 1; -- trailing comment", DmlKind::kSelect);
}

TEST(SqlParser, RawSqlPreserved) {
    const SqlParser parser{};
    const std::string sql = "Select Id From Users";
    const auto result = parser.parse(sql);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->raw_sql, sql);
}
