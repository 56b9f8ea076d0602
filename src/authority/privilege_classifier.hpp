#pragma once

// ---------------------------------------------------------------------------
// privilege_classifier.hpp
//
// SqlStatement → 필요한 PrivilegeType 매핑.
//
// [분기 순서: 상호 배타적]
// 1. SHOW DATABASES                          → SHOW_DB
// 2. DML: SELECT/INSERT/UPDATE/DELETE        → 동명 권한, 그 외 DML → 매핑 없음
// 3. DDL: ALTER DATABASE  → ALTER_ANY_DATABASE
//         ALTER TABLE     → ALTER
//         CREATE DATABASE → CREATE_DATABASE
//         CREATE TABLE    → CREATE_TABLE
//         CREATE FUNCTION → CREATE_FUNCTION
//         DROP TABLE / DROP DATABASE → DROP
//         TRUNCATE        → TRUNCATE
//         그 외 DDL → 매핑 없음
// 4. 그 외 카테고리 → 매핑 없음
//
// [매핑 없음]
// std::nullopt 는 오류가 아닌 유효한 결과이다. 매핑 없는 구문을 어떻게
// 처리할지는 AuthorityChecker 가 결정한다 (항상 거부).
//
// 순수 함수: 구문의 정적 형태만 보며 부작용이 없다.
// ---------------------------------------------------------------------------

#include <optional>

#include "authority/privilege_type.hpp"
#include "parser/sql_statement.hpp"

class PrivilegeClassifier {
public:
    [[nodiscard]] static std::optional<PrivilegeType> resolve(const SqlStatement& statement);
};
