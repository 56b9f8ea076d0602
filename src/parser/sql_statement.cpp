// ---------------------------------------------------------------------------
// sql_statement.cpp
//
// SqlStatement 카테고리/종류 이름 변환.
// ---------------------------------------------------------------------------

#include "parser/sql_statement.hpp"

namespace {

template <class... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

std::string_view to_string(DmlKind kind) {
    switch (kind) {
        case DmlKind::kSelect:  return "SELECT";
        case DmlKind::kInsert:  return "INSERT";
        case DmlKind::kUpdate:  return "UPDATE";
        case DmlKind::kDelete:  return "DELETE";
        case DmlKind::kReplace: return "REPLACE";
        case DmlKind::kCall:    return "CALL";
        case DmlKind::kDo:      return "DO";
        case DmlKind::kLoad:    return "LOAD";
    }
    return "UNKNOWN";
}

std::string_view to_string(DdlKind kind) {
    switch (kind) {
        case DdlKind::kAlterDatabase:   return "ALTER_DATABASE";
        case DdlKind::kAlterTable:      return "ALTER_TABLE";
        case DdlKind::kCreateDatabase:  return "CREATE_DATABASE";
        case DdlKind::kCreateTable:     return "CREATE_TABLE";
        case DdlKind::kCreateFunction:  return "CREATE_FUNCTION";
        case DdlKind::kCreateIndex:     return "CREATE_INDEX";
        case DdlKind::kCreateView:      return "CREATE_VIEW";
        case DdlKind::kCreateProcedure: return "CREATE_PROCEDURE";
        case DdlKind::kDropTable:       return "DROP_TABLE";
        case DdlKind::kDropDatabase:    return "DROP_DATABASE";
        case DdlKind::kDropIndex:       return "DROP_INDEX";
        case DdlKind::kDropView:        return "DROP_VIEW";
        case DdlKind::kTruncate:        return "TRUNCATE";
        case DdlKind::kRenameTable:     return "RENAME_TABLE";
        case DdlKind::kOther:           return "OTHER";
    }
    return "UNKNOWN";
}

std::string_view to_string(DalKind kind) {
    switch (kind) {
        case DalKind::kShowDatabases: return "SHOW_DATABASES";
        case DalKind::kShowTables:    return "SHOW_TABLES";
        case DalKind::kShowOther:     return "SHOW";
        case DalKind::kUse:           return "USE";
        case DalKind::kSet:           return "SET";
        case DalKind::kExplain:       return "EXPLAIN";
        case DalKind::kOther:         return "OTHER";
    }
    return "UNKNOWN";
}

std::string_view to_string(DclKind kind) {
    switch (kind) {
        case DclKind::kGrant:      return "GRANT";
        case DclKind::kRevoke:     return "REVOKE";
        case DclKind::kCreateUser: return "CREATE_USER";
        case DclKind::kDropUser:   return "DROP_USER";
        case DclKind::kAlterUser:  return "ALTER_USER";
    }
    return "UNKNOWN";
}

std::string_view to_string(TclKind kind) {
    switch (kind) {
        case TclKind::kBegin:     return "BEGIN";
        case TclKind::kCommit:    return "COMMIT";
        case TclKind::kRollback:  return "ROLLBACK";
        case TclKind::kSavepoint: return "SAVEPOINT";
    }
    return "UNKNOWN";
}

}  // namespace

std::string_view category_name(const SqlStatement& statement) {
    return std::visit(Overloaded{
        [](const DmlStatement&) -> std::string_view { return "DML"; },
        [](const DdlStatement&) -> std::string_view { return "DDL"; },
        [](const DalStatement&) -> std::string_view { return "DAL"; },
        [](const DclStatement&) -> std::string_view { return "DCL"; },
        [](const TclStatement&) -> std::string_view { return "TCL"; },
    }, statement.body);
}

std::string_view kind_name(const SqlStatement& statement) {
    return std::visit([](const auto& body) { return to_string(body.kind); }, statement.body);
}
