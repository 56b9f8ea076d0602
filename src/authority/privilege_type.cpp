// ---------------------------------------------------------------------------
// privilege_type.cpp
// ---------------------------------------------------------------------------

#include "authority/privilege_type.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <string>
#include <utility>

namespace {

constexpr std::array<std::pair<PrivilegeType, std::string_view>, 30> kPrivilegeNames = {{
    {PrivilegeType::kSelect,           "SELECT"},
    {PrivilegeType::kInsert,           "INSERT"},
    {PrivilegeType::kUpdate,           "UPDATE"},
    {PrivilegeType::kDelete,           "DELETE"},
    {PrivilegeType::kUsage,            "USAGE"},
    {PrivilegeType::kCreate,           "CREATE"},
    {PrivilegeType::kDrop,             "DROP"},
    {PrivilegeType::kReload,           "RELOAD"},
    {PrivilegeType::kProcess,          "PROCESS"},
    {PrivilegeType::kGrant,            "GRANT"},
    {PrivilegeType::kReferences,       "REFERENCES"},
    {PrivilegeType::kIndex,            "INDEX"},
    {PrivilegeType::kAlter,            "ALTER"},
    {PrivilegeType::kShowDb,           "SHOW_DB"},
    {PrivilegeType::kSuper,            "SUPER"},
    {PrivilegeType::kCreateTmp,        "CREATE_TMP"},
    {PrivilegeType::kLockTables,       "LOCK_TABLES"},
    {PrivilegeType::kExecute,          "EXECUTE"},
    {PrivilegeType::kCreateView,       "CREATE_VIEW"},
    {PrivilegeType::kShowView,         "SHOW_VIEW"},
    {PrivilegeType::kCreateProc,       "CREATE_PROC"},
    {PrivilegeType::kAlterProc,        "ALTER_PROC"},
    {PrivilegeType::kCreateUser,       "CREATE_USER"},
    {PrivilegeType::kEvent,            "EVENT"},
    {PrivilegeType::kTrigger,          "TRIGGER"},
    {PrivilegeType::kTruncate,         "TRUNCATE"},
    {PrivilegeType::kCreateDatabase,   "CREATE_DATABASE"},
    {PrivilegeType::kCreateTable,      "CREATE_TABLE"},
    {PrivilegeType::kCreateFunction,   "CREATE_FUNCTION"},
    {PrivilegeType::kAlterAnyDatabase, "ALTER_ANY_DATABASE"},
}};

}  // namespace

std::string_view to_string(PrivilegeType type) noexcept {
    for (const auto& [each, name] : kPrivilegeNames) {
        if (each == type) {
            return name;
        }
    }
    return "UNKNOWN";
}

std::optional<PrivilegeType> privilege_type_from_string(std::string_view name) {
    std::string normalized;
    normalized.reserve(name.size());
    for (const unsigned char c : name) {
        normalized.push_back(c == ' ' ? '_' : static_cast<char>(std::toupper(c)));
    }

    const auto it = std::find_if(kPrivilegeNames.begin(), kPrivilegeNames.end(),
                                 [&](const auto& entry) { return entry.second == normalized; });
    if (it == kPrivilegeNames.end()) {
        return std::nullopt;
    }
    return it->first;
}

const PrivilegeTypeSet& all_privilege_types() {
    static const PrivilegeTypeSet kAll = [] {
        PrivilegeTypeSet result;
        for (const auto& entry : kPrivilegeNames) {
            result.insert(entry.first);
        }
        return result;
    }();
    return kAll;
}
