// ---------------------------------------------------------------------------
// authority_loader.cpp
//
// YAML 권한 설정 파일을 AuthorityConfig 로 파싱하고 AuthorityRule 을 만든다.
//
// [설계 원칙]
// - All-or-nothing: 검증 실패 시 부분 설정을 반환하지 않는다.
// - 섹션 단위로 YAML::Exception 을 잡아 섹션 이름을 포함한 오류로 변환한다.
// - password 값은 어떤 로그에도 출력하지 않는다.
//
// [알려진 한계]
// - users 의 스칼라 형식 "user@host:password" 는 '@' 뒤 첫 ':' 를 구분자로 쓴다.
//   username 에 '@' 가 들어가는 사용자는 map 형식으로 선언해야 한다.
// - user-database-mappings 와 grants 는 선언된 사용자와 user@host 가 정확히
//   같아야 한다 (와일드카드 매칭 아님).
// ---------------------------------------------------------------------------

#include "authority/authority_loader.hpp"

#include <algorithm>
#include <cctype>
#include <set>
#include <sstream>
#include <string>
#include <string_view>
#include <utility>

#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

constexpr std::string_view kUserDatabaseMappingsKey = "user-database-mappings";

std::string_view trim(std::string_view s) {
    const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    if (begin == s.end()) {
        return {};
    }
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return s.substr(static_cast<std::size_t>(begin - s.begin()),
                    static_cast<std::size_t>(end - begin));
}

std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

// ---------------------------------------------------------------------------
// 내부 헬퍼: YAML 스칼라 읽기. 노드가 없거나 스칼라가 아니면 fallback.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string read_string(const YAML::Node& node, const std::string& fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::string>();
    } catch (const YAML::Exception&) {
        return fallback;
    }
}

[[nodiscard]] std::uint32_t read_uint32(const YAML::Node& node, std::uint32_t fallback) {
    if (!node || !node.IsScalar()) {
        return fallback;
    }
    try {
        return node.as<std::uint32_t>();
    } catch (const YAML::Exception&) {
        spdlog::warn("authority_loader: '{}' is not an unsigned integer, using default {}",
                     node.Scalar(), fallback);
        return fallback;
    }
}

[[nodiscard]] std::vector<std::string> read_string_sequence(const YAML::Node& node) {
    std::vector<std::string> result;
    if (!node || !node.IsSequence()) {
        return result;
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (item.IsScalar()) {
            result.push_back(item.as<std::string>());
        }
    }
    return result;
}

// ---------------------------------------------------------------------------
// GlobalConfig 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] GlobalConfig parse_global(const YAML::Node& global_node) {
    GlobalConfig cfg{};
    if (!global_node || !global_node.IsMap()) {
        return cfg;
    }

    cfg.log_level          = read_string(global_node["log_level"], cfg.log_level);
    cfg.log_path           = read_string(global_node["log_path"], cfg.log_path);
    cfg.reload_interval_ms = read_uint32(global_node["reload_interval_ms"], cfg.reload_interval_ms);
    return cfg;
}

// ---------------------------------------------------------------------------
// 사용자 파싱
//   스칼라: "root@%:root"  (password 생략 가능: "root@%")
//   맵    : {user: root@%, password: root, auth_plugin: ...}
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<AuthorityUser, std::string> parse_user(const YAML::Node& user_node) {
    AuthorityUser user{};

    if (user_node.IsScalar()) {
        const std::string raw = user_node.as<std::string>();
        const auto at_pos = raw.find('@');
        const auto colon_pos = raw.find(':', at_pos == std::string::npos ? 0 : at_pos);
        const std::string_view identity = (colon_pos == std::string::npos)
            ? std::string_view(raw)
            : std::string_view(raw).substr(0, colon_pos);
        user.grantee = Grantee::parse(trim(identity));
        if (colon_pos != std::string::npos) {
            user.password = raw.substr(colon_pos + 1);
        }
    } else if (user_node.IsMap()) {
        const std::string identity = read_string(user_node["user"], "");
        user.grantee     = Grantee::parse(trim(identity));
        user.password    = read_string(user_node["password"], "");
        user.auth_plugin = read_string(user_node["auth_plugin"], user.auth_plugin);
    } else {
        return std::unexpected(std::string("user entry must be a scalar or a map"));
    }

    if (user.grantee.username.empty()) {
        return std::unexpected(std::string("user entry has an empty username"));
    }
    return user;
}

[[nodiscard]] std::string_view provider_type_name(PrivilegeProviderType type) {
    switch (type) {
        case PrivilegeProviderType::kAllPermitted:      return "ALL_PERMITTED";
        case PrivilegeProviderType::kDatabasePermitted: return "DATABASE_PERMITTED";
        case PrivilegeProviderType::kGranted:           return "GRANTED";
    }
    return "UNKNOWN";
}

[[nodiscard]] bool is_declared(const std::vector<AuthorityUser>& users, const Grantee& grantee) {
    return std::any_of(users.begin(), users.end(),
                       [&](const AuthorityUser& each) { return each.grantee == grantee; });
}

// ---------------------------------------------------------------------------
// user-database-mappings 파싱: "root@%=*, alice@%=sales"
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::vector<DatabaseMapping>, std::string>
parse_database_mappings(const std::string& raw, const std::vector<AuthorityUser>& users) {
    std::vector<DatabaseMapping> mappings;

    std::stringstream stream(raw);
    std::string item;
    while (std::getline(stream, item, ',')) {
        const auto entry = trim(item);
        if (entry.empty()) {
            continue;
        }
        const auto eq_pos = entry.rfind('=');
        if (eq_pos == std::string_view::npos) {
            return std::unexpected(fmt::format("mapping '{}' is not in 'user@host=database' form", entry));
        }

        DatabaseMapping mapping{};
        mapping.grantee  = Grantee::parse(trim(entry.substr(0, eq_pos)));
        mapping.database = std::string(trim(entry.substr(eq_pos + 1)));
        if (mapping.grantee.username.empty() || mapping.database.empty()) {
            return std::unexpected(fmt::format("mapping '{}' has an empty user or database", entry));
        }
        if (!is_declared(users, mapping.grantee)) {
            return std::unexpected(fmt::format("mapping '{}' refers to undeclared user '{}'",
                                               entry, mapping.grantee.to_string()));
        }
        mappings.push_back(std::move(mapping));
    }
    return mappings;
}

// ---------------------------------------------------------------------------
// grants 파싱 (GRANTED 공급자)
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::vector<GrantConfig>, std::string>
parse_grants(const YAML::Node& grants_node, const std::vector<AuthorityUser>& users) {
    std::vector<GrantConfig> grants;
    if (!grants_node) {
        return grants;
    }
    if (!grants_node.IsSequence()) {
        return std::unexpected(std::string("'grants' must be a sequence"));
    }

    for (const auto& grant_node : grants_node) {
        if (!grant_node.IsMap()) {
            return std::unexpected(std::string("grant entry must be a map"));
        }

        GrantConfig grant{};
        grant.grantee = Grantee::parse(trim(read_string(grant_node["user"], "")));
        if (grant.grantee.username.empty()) {
            return std::unexpected(std::string("grant entry has an empty user"));
        }
        if (!is_declared(users, grant.grantee)) {
            return std::unexpected(fmt::format("grant refers to undeclared user '{}'",
                                               grant.grantee.to_string()));
        }

        grant.databases = read_string_sequence(grant_node["databases"]);
        for (const auto& name : read_string_sequence(grant_node["privileges"])) {
            if (to_upper(trim(name)) == "ALL") {
                const auto& all = all_privilege_types();
                grant.privileges.insert(all.begin(), all.end());
                continue;
            }
            const auto type = privilege_type_from_string(trim(name));
            if (!type.has_value()) {
                return std::unexpected(fmt::format("grant for '{}' has unknown privilege '{}'",
                                                   grant.grantee.to_string(), name));
            }
            grant.privileges.insert(*type);
        }
        grants.push_back(std::move(grant));
    }
    return grants;
}

// ---------------------------------------------------------------------------
// privilege 섹션 파싱
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<PrivilegeProviderConfig, std::string>
parse_privilege_provider(const YAML::Node& authority_node, const std::vector<AuthorityUser>& users) {
    PrivilegeProviderConfig provider{};

    const YAML::Node privilege_node = authority_node["privilege"];
    if (privilege_node && privilege_node.IsMap()) {
        const std::string type = to_upper(read_string(privilege_node["type"], "ALL_PERMITTED"));
        if (type == "ALL_PERMITTED") {
            provider.type = PrivilegeProviderType::kAllPermitted;
        } else if (type == "DATABASE_PERMITTED") {
            provider.type = PrivilegeProviderType::kDatabasePermitted;
        } else if (type == "GRANTED") {
            provider.type = PrivilegeProviderType::kGranted;
        } else {
            return std::unexpected(fmt::format("unknown privilege provider type '{}'", type));
        }

        const YAML::Node props_node = privilege_node["props"];
        if (props_node && props_node.IsMap()) {
            for (const auto& prop : props_node) {
                provider.props[prop.first.as<std::string>()] = read_string(prop.second, "");
            }
        }
    } else if (privilege_node && !privilege_node.IsNull()) {
        return std::unexpected(std::string("'authority.privilege' must be a map"));
    }

    if (provider.type == PrivilegeProviderType::kDatabasePermitted) {
        const auto it = provider.props.find(std::string(kUserDatabaseMappingsKey));
        if (it == provider.props.end()) {
            return std::unexpected(fmt::format(
                "DATABASE_PERMITTED requires props.{}", kUserDatabaseMappingsKey));
        }
        auto mappings = parse_database_mappings(it->second, users);
        if (!mappings.has_value()) {
            return std::unexpected(mappings.error());
        }
        provider.database_mappings = std::move(*mappings);
    }

    if (provider.type == PrivilegeProviderType::kGranted) {
        auto grants = parse_grants(authority_node["grants"], users);
        if (!grants.has_value()) {
            return std::unexpected(grants.error());
        }
        provider.grants = std::move(*grants);
    }

    return provider;
}

// ---------------------------------------------------------------------------
// 루트 노드 → AuthorityConfig
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<AuthorityConfig, std::string>
parse_root(const YAML::Node& root, const std::string& source) {
    const auto fail = [&source](const std::string& reason) {
        const std::string err = fmt::format("authority_loader: '{}': {}", source, reason);
        spdlog::error("{}", err);
        return std::unexpected(err);
    };

    if (!root || !root.IsMap()) {
        return fail("not a valid YAML map (top-level)");
    }

    AuthorityConfig cfg{};

    try {
        cfg.global = parse_global(root["global"]);
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("error parsing 'global' section: {}", e.what()));
    }

    const YAML::Node authority_node = root["authority"];
    if (!authority_node || !authority_node.IsMap()) {
        return fail("missing 'authority' section");
    }

    try {
        const YAML::Node users_node = authority_node["users"];
        if (!users_node || !users_node.IsSequence() || users_node.size() == 0) {
            return fail("'authority.users' must be a non-empty sequence");
        }
        for (const auto& user_node : users_node) {
            auto user = parse_user(user_node);
            if (!user.has_value()) {
                return fail(user.error());
            }
            if (is_declared(cfg.users, user->grantee)) {
                return fail(fmt::format("duplicate user '{}'", user->grantee.to_string()));
            }
            cfg.users.push_back(std::move(*user));
        }
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("error parsing 'authority.users' section: {}", e.what()));
    }

    try {
        auto provider = parse_privilege_provider(authority_node, cfg.users);
        if (!provider.has_value()) {
            return fail(provider.error());
        }
        cfg.privilege = std::move(*provider);
    } catch (const YAML::Exception& e) {
        return fail(fmt::format("error parsing 'authority.privilege' section: {}", e.what()));
    }

    spdlog::info("authority_loader: authority loaded from '{}', users={}, provider={}",
                 source, cfg.users.size(), provider_type_name(cfg.privilege.type));
    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// AuthorityLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<AuthorityConfig, std::string>
AuthorityLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format(
            "authority_loader: cannot resolve config path '{}': {}",
            config_path.string(), ec.message()
        );
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("authority_loader: loading authority from '{}'", canonical_path.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format(
            "authority_loader: cannot open file '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "authority_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(), e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "authority_loader: YAML error in '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return parse_root(root, canonical_path.string());
}

std::expected<AuthorityConfig, std::string>
AuthorityLoader::load_from_string(const std::string& yaml, const std::string& source) {
    YAML::Node root;
    try {
        root = YAML::Load(yaml);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format(
            "authority_loader: YAML error in '{}': {}", source, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    return parse_root(root, source);
}

// ---------------------------------------------------------------------------
// build_authority_rule 구현
//   권한 항목은 users 선언 순서를 따른다 (find_user 와 같은 매칭 순서).
// ---------------------------------------------------------------------------
std::shared_ptr<const AuthorityRule> build_authority_rule(const AuthorityConfig& config) {
    std::vector<AuthorityRule::PrivilegesEntry> entries;
    entries.reserve(config.users.size());

    switch (config.privilege.type) {
        case PrivilegeProviderType::kAllPermitted: {
            const auto all = std::make_shared<const AllPermittedPrivileges>();
            for (const auto& user : config.users) {
                entries.emplace_back(user.grantee, all);
            }
            break;
        }

        case PrivilegeProviderType::kDatabasePermitted: {
            for (const auto& user : config.users) {
                std::set<std::string, std::less<>> databases;
                for (const auto& mapping : config.privilege.database_mappings) {
                    if (mapping.grantee == user.grantee) {
                        databases.insert(mapping.database);
                    }
                }
                if (!databases.empty()) {
                    entries.emplace_back(
                        user.grantee,
                        std::make_shared<const DatabasePermittedPrivileges>(std::move(databases)));
                }
            }
            break;
        }

        case PrivilegeProviderType::kGranted: {
            for (const auto& user : config.users) {
                std::set<std::string, std::less<>> databases;
                PrivilegeTypeSet                   granted;
                bool                               has_grant = false;
                for (const auto& grant : config.privilege.grants) {
                    if (grant.grantee == user.grantee) {
                        has_grant = true;
                        databases.insert(grant.databases.begin(), grant.databases.end());
                        granted.insert(grant.privileges.begin(), grant.privileges.end());
                    }
                }
                if (has_grant) {
                    entries.emplace_back(
                        user.grantee,
                        std::make_shared<const GrantedPrivileges>(std::move(databases),
                                                                  std::move(granted)));
                }
            }
            break;
        }
    }

    return std::make_shared<const AuthorityRule>(config.users, std::move(entries));
}
