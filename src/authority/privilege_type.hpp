#pragma once

// ---------------------------------------------------------------------------
// privilege_type.hpp
//
// 권한 종류의 닫힌 열거형.
//
// [동기화 규칙]
// 새 구문 종류에 권한을 매핑하려면 이 열거형과 PrivilegeClassifier 를
// 함께 확장해야 한다. to_string / privilege_type_from_string 도 같이 갱신한다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <optional>
#include <set>
#include <string_view>

enum class PrivilegeType : std::uint8_t {
    kSelect           = 0,
    kInsert           = 1,
    kUpdate           = 2,
    kDelete           = 3,
    kUsage            = 4,
    kCreate           = 5,
    kDrop             = 6,
    kReload           = 7,
    kProcess          = 8,
    kGrant            = 9,
    kReferences       = 10,
    kIndex            = 11,
    kAlter            = 12,
    kShowDb           = 13,
    kSuper            = 14,
    kCreateTmp        = 15,
    kLockTables       = 16,
    kExecute          = 17,
    kCreateView       = 18,
    kShowView         = 19,
    kCreateProc       = 20,
    kAlterProc        = 21,
    kCreateUser       = 22,
    kEvent            = 23,
    kTrigger          = 24,
    kTruncate         = 25,
    kCreateDatabase   = 26,
    kCreateTable      = 27,
    kCreateFunction   = 28,
    kAlterAnyDatabase = 29,
};

using PrivilegeTypeSet = std::set<PrivilegeType>;

// 정식 이름 (예: "SELECT", "CREATE_TABLE", "SHOW_DB")
[[nodiscard]] std::string_view to_string(PrivilegeType type) noexcept;

// 이름 → PrivilegeType. 대소문자 무관, 공백은 '_' 와 동일하게 취급한다.
// ("create table" == "CREATE_TABLE"). 알 수 없는 이름이면 std::nullopt.
[[nodiscard]] std::optional<PrivilegeType> privilege_type_from_string(std::string_view name);

// 정의된 모든 권한 종류 (열거형 순서)
[[nodiscard]] const PrivilegeTypeSet& all_privilege_types();
