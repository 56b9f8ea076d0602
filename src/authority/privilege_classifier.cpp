// ---------------------------------------------------------------------------
// privilege_classifier.cpp
//
// 카테고리 분기는 std::visit 로 수행하므로 StatementBody 에 카테고리가
// 추가되면 컴파일 오류가 발생한다. 카테고리 내부 kind 분기는 default 로
// "매핑 없음" 을 반환한다 (권한이 없는 새 구문 종류가 계속 추가되므로).
// ---------------------------------------------------------------------------

#include "authority/privilege_classifier.hpp"

#include <variant>

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

std::optional<PrivilegeType> resolve_dml(const DmlStatement& statement) {
    switch (statement.kind) {
        case DmlKind::kSelect: return PrivilegeType::kSelect;
        case DmlKind::kInsert: return PrivilegeType::kInsert;
        case DmlKind::kUpdate: return PrivilegeType::kUpdate;
        case DmlKind::kDelete: return PrivilegeType::kDelete;
        default:               return std::nullopt;
    }
}

std::optional<PrivilegeType> resolve_ddl(const DdlStatement& statement) {
    switch (statement.kind) {
        case DdlKind::kAlterDatabase:  return PrivilegeType::kAlterAnyDatabase;
        case DdlKind::kAlterTable:     return PrivilegeType::kAlter;
        case DdlKind::kCreateDatabase: return PrivilegeType::kCreateDatabase;
        case DdlKind::kCreateTable:    return PrivilegeType::kCreateTable;
        case DdlKind::kCreateFunction: return PrivilegeType::kCreateFunction;
        case DdlKind::kDropTable:
        case DdlKind::kDropDatabase:   return PrivilegeType::kDrop;
        case DdlKind::kTruncate:       return PrivilegeType::kTruncate;
        default:                       return std::nullopt;
    }
}

// DAL 중에서는 SHOW DATABASES 만 매핑된다.
std::optional<PrivilegeType> resolve_dal(const DalStatement& statement) {
    if (statement.kind == DalKind::kShowDatabases) {
        return PrivilegeType::kShowDb;
    }
    return std::nullopt;
}

}  // namespace

std::optional<PrivilegeType> PrivilegeClassifier::resolve(const SqlStatement& statement) {
    return std::visit(Overloaded{
        [](const DalStatement& dal) { return resolve_dal(dal); },
        [](const DmlStatement& dml) { return resolve_dml(dml); },
        [](const DdlStatement& ddl) { return resolve_ddl(ddl); },
        [](const DclStatement&) -> std::optional<PrivilegeType> { return std::nullopt; },
        [](const TclStatement&) -> std::optional<PrivilegeType> { return std::nullopt; },
    }, statement.body);
}
