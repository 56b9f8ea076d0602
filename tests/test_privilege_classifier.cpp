// ---------------------------------------------------------------------------
// test_privilege_classifier.cpp
//
// PrivilegeClassifier / PrivilegeType 단위 테스트.
//
// [테스트 범위]
// - 매핑되는 모든 구문 종류 → 권한 종류
// - 매핑되지 않는 구문 (REPLACE, CALL, CREATE INDEX, SHOW TABLES, DCL, TCL ...)
// - 파서 출력과 분류기의 연결 (SQL 문자열 기준)
// - PrivilegeType 이름 변환
// ---------------------------------------------------------------------------

#include "authority/privilege_classifier.hpp"
#include "parser/sql_parser.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <string>

namespace {

SqlStatement make(StatementBody body) {
    SqlStatement statement;
    statement.body = body;
    return statement;
}

std::optional<PrivilegeType> resolve_sql(const std::string& sql) {
    const SqlParser parser{};
    const auto statement = parser.parse(sql);
    EXPECT_TRUE(statement.has_value()) << "parse failed: " << sql;
    if (!statement.has_value()) {
        return std::nullopt;
    }
    return PrivilegeClassifier::resolve(*statement);
}

}  // namespace

// ---------------------------------------------------------------------------
// 매핑되는 구문
// ---------------------------------------------------------------------------

TEST(PrivilegeClassifier, ShowDatabasesRequiresShowDb) {
    EXPECT_EQ(PrivilegeClassifier::resolve(make(DalStatement{DalKind::kShowDatabases})),
              PrivilegeType::kShowDb);
}

TEST(PrivilegeClassifier, DmlMapsToSameNamedPrivilege) {
    EXPECT_EQ(PrivilegeClassifier::resolve(make(DmlStatement{DmlKind::kSelect})),
              PrivilegeType::kSelect);
    EXPECT_EQ(PrivilegeClassifier::resolve(make(DmlStatement{DmlKind::kInsert})),
              PrivilegeType::kInsert);
    EXPECT_EQ(PrivilegeClassifier::resolve(make(DmlStatement{DmlKind::kUpdate})),
              PrivilegeType::kUpdate);
    EXPECT_EQ(PrivilegeClassifier::resolve(make(DmlStatement{DmlKind::kDelete})),
              PrivilegeType::kDelete);
}

TEST(PrivilegeClassifier, DdlMapping) {
    EXPECT_EQ(PrivilegeClassifier::resolve(make(DdlStatement{DdlKind::kAlterDatabase})),
              PrivilegeType::kAlterAnyDatabase);
    EXPECT_EQ(PrivilegeClassifier::resolve(make(DdlStatement{DdlKind::kAlterTable})),
              PrivilegeType::kAlter);
    EXPECT_EQ(PrivilegeClassifier::resolve(make(DdlStatement{DdlKind::kCreateDatabase})),
              PrivilegeType::kCreateDatabase);
    EXPECT_EQ(PrivilegeClassifier::resolve(make(DdlStatement{DdlKind::kCreateTable})),
              PrivilegeType::kCreateTable);
    EXPECT_EQ(PrivilegeClassifier::resolve(make(DdlStatement{DdlKind::kCreateFunction})),
              PrivilegeType::kCreateFunction);
    EXPECT_EQ(PrivilegeClassifier::resolve(make(DdlStatement{DdlKind::kTruncate})),
              PrivilegeType::kTruncate);
}

TEST(PrivilegeClassifier, DropTableAndDropDatabaseShareDrop) {
    EXPECT_EQ(PrivilegeClassifier::resolve(make(DdlStatement{DdlKind::kDropTable})),
              PrivilegeType::kDrop);
    EXPECT_EQ(PrivilegeClassifier::resolve(make(DdlStatement{DdlKind::kDropDatabase})),
              PrivilegeType::kDrop);
}

// ---------------------------------------------------------------------------
// 매핑되지 않는 구문 → std::nullopt
// ---------------------------------------------------------------------------

TEST(PrivilegeClassifier, UnmappedDml) {
    EXPECT_FALSE(PrivilegeClassifier::resolve(make(DmlStatement{DmlKind::kReplace})));
    EXPECT_FALSE(PrivilegeClassifier::resolve(make(DmlStatement{DmlKind::kCall})));
    EXPECT_FALSE(PrivilegeClassifier::resolve(make(DmlStatement{DmlKind::kLoad})));
}

TEST(PrivilegeClassifier, UnmappedDdl) {
    EXPECT_FALSE(PrivilegeClassifier::resolve(make(DdlStatement{DdlKind::kCreateIndex})));
    EXPECT_FALSE(PrivilegeClassifier::resolve(make(DdlStatement{DdlKind::kCreateView})));
    EXPECT_FALSE(PrivilegeClassifier::resolve(make(DdlStatement{DdlKind::kDropIndex})));
    EXPECT_FALSE(PrivilegeClassifier::resolve(make(DdlStatement{DdlKind::kRenameTable})));
    EXPECT_FALSE(PrivilegeClassifier::resolve(make(DdlStatement{DdlKind::kOther})));
}

TEST(PrivilegeClassifier, UnmappedDalOtherThanShowDatabases) {
    EXPECT_FALSE(PrivilegeClassifier::resolve(make(DalStatement{DalKind::kShowTables})));
    EXPECT_FALSE(PrivilegeClassifier::resolve(make(DalStatement{DalKind::kUse})));
    EXPECT_FALSE(PrivilegeClassifier::resolve(make(DalStatement{DalKind::kOther})));
}

TEST(PrivilegeClassifier, DclAndTclAreUnmapped) {
    EXPECT_FALSE(PrivilegeClassifier::resolve(make(DclStatement{DclKind::kGrant})));
    EXPECT_FALSE(PrivilegeClassifier::resolve(make(DclStatement{DclKind::kCreateUser})));
    EXPECT_FALSE(PrivilegeClassifier::resolve(make(TclStatement{TclKind::kCommit})));
}

// ---------------------------------------------------------------------------
// SQL 문자열 → 권한 (파서 연동)
// ---------------------------------------------------------------------------

TEST(PrivilegeClassifier, FromSql) {
    EXPECT_EQ(resolve_sql("SELECT * FROM orders"), PrivilegeType::kSelect);
    EXPECT_EQ(resolve_sql("WITH x AS (SELECT 1) SELECT * FROM x"), PrivilegeType::kSelect);
    EXPECT_EQ(resolve_sql("WITH x AS (SELECT id FROM t) DELETE FROM t WHERE id IN (SELECT id FROM x)"),
              PrivilegeType::kDelete);
    EXPECT_EQ(resolve_sql("WITH x AS (SELECT 1) UPDATE t SET a = 1"), PrivilegeType::kUpdate);
    EXPECT_EQ(resolve_sql("DROP SCHEMA sales"), PrivilegeType::kDrop);
    EXPECT_EQ(resolve_sql("TRUNCATE TABLE logs"), PrivilegeType::kTruncate);
    EXPECT_EQ(resolve_sql("ALTER SCHEMA sales READ ONLY = 1"), PrivilegeType::kAlterAnyDatabase);
    EXPECT_EQ(resolve_sql("SHOW SCHEMAS"), PrivilegeType::kShowDb);
    EXPECT_EQ(resolve_sql("CREATE DEFINER=`root`@`%` FUNCTION f() RETURNS INT RETURN 1"),
              PrivilegeType::kCreateFunction);

    EXPECT_FALSE(resolve_sql("CREATE UNIQUE INDEX idx ON users(name)").has_value());
    EXPECT_FALSE(resolve_sql("GRANT SELECT ON sales.* TO 'alice'@'%'").has_value());
    EXPECT_FALSE(resolve_sql("BEGIN").has_value());
}

// ---------------------------------------------------------------------------
// PrivilegeType 이름 변환
// ---------------------------------------------------------------------------

TEST(PrivilegeType, CanonicalNames) {
    EXPECT_EQ(to_string(PrivilegeType::kSelect), "SELECT");
    EXPECT_EQ(to_string(PrivilegeType::kShowDb), "SHOW_DB");
    EXPECT_EQ(to_string(PrivilegeType::kCreateTable), "CREATE_TABLE");
    EXPECT_EQ(to_string(PrivilegeType::kAlterAnyDatabase), "ALTER_ANY_DATABASE");
}

TEST(PrivilegeType, ParsesNamesCaseInsensitivelyWithSpaces) {
    EXPECT_EQ(privilege_type_from_string("select"), PrivilegeType::kSelect);
    EXPECT_EQ(privilege_type_from_string("create table"), PrivilegeType::kCreateTable);
    EXPECT_EQ(privilege_type_from_string("Show_Db"), PrivilegeType::kShowDb);
    EXPECT_FALSE(privilege_type_from_string("FLY").has_value());
    EXPECT_FALSE(privilege_type_from_string("").has_value());
}

TEST(PrivilegeType, EveryNameRoundTrips) {
    for (const PrivilegeType type : all_privilege_types()) {
        EXPECT_EQ(privilege_type_from_string(to_string(type)), type) << to_string(type);
    }
    EXPECT_EQ(all_privilege_types().size(), 30U);
}
