// ---------------------------------------------------------------------------
// sql_parser.cpp
//
// SQL 문자열 → SqlStatement 분류 구현.
// "선두 키워드 기반 분류 + 정규식 테이블명 추출" 수준의 경량 파서.
//
// [처리 순서]
// 1. 빈 입력 검사
// 2. 문자열/주석 밖 세미콜론 탐지 (끝 세미콜론 하나만 허용)
// 3. 주석 제거, 대문자 정규화
// 4. 토큰화 후 선두 키워드(+ 대상 키워드)로 카테고리/종류 결정
// 5. 로깅용 테이블명 추출
//
// [파서 설계 한계]
// - CREATE/ALTER/DROP 은 동사 뒤 최대 kObjectScanLimit 개 토큰 안에서
//   대상 키워드(TABLE, DATABASE, FUNCTION ...)를 찾는다. 그 범위 밖에 있으면
//   DdlKind::kOther 로 분류된다.
// - hex 리터럴, 멀티바이트 경계 조작 등 인코딩 우회는 다루지 않는다.
// ---------------------------------------------------------------------------

#include "parser/sql_parser.hpp"

#include <algorithm>
#include <cctype>
#include <optional>
#include <regex>
#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

#include <spdlog/spdlog.h>

namespace {

// CREATE/ALTER/DROP 뒤에서 대상 키워드를 찾는 최대 토큰 수
constexpr std::size_t kObjectScanLimit = 8;

// SQL에서 주석을 제거한다.
//   /* ... */ 블록 주석 (자리에 공백 하나 삽입), -- 및 # 줄 주석.
//   문자열 리터럴 내부의 주석 기호는 보존한다.
std::string remove_comments(std::string_view sql) {
    std::string result;
    result.reserve(sql.size());

    std::size_t i = 0;
    const std::size_t len = sql.size();
    char quote = '\0';

    while (i < len) {
        const char c = sql[i];

        if (quote != '\0') {
            result.push_back(c);
            if (c == '\\' && i + 1 < len) {
                result.push_back(sql[i + 1]);
                i += 2;
                continue;
            }
            if (c == quote) {
                quote = '\0';
            }
            ++i;
            continue;
        }

        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
            result.push_back(c);
            ++i;
            continue;
        }

        if (i + 1 < len && c == '/' && sql[i + 1] == '*') {
            i += 2;
            while (i + 1 < len && !(sql[i] == '*' && sql[i + 1] == '/')) {
                ++i;
            }
            i = (i + 1 < len) ? i + 2 : len;
            result.push_back(' ');
            continue;
        }

        if ((i + 1 < len && c == '-' && sql[i + 1] == '-') || c == '#') {
            while (i < len && sql[i] != '\n') {
                ++i;
            }
            continue;
        }

        result.push_back(c);
        ++i;
    }

    return result;
}

// 문자열을 대문자로 변환한다 (ASCII only).
std::string to_upper(std::string_view s) {
    std::string result(s);
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return result;
}

// 문자열의 앞뒤 공백(스페이스, 탭, 개행 포함)을 제거한다.
std::string_view trim(std::string_view s) {
    const auto not_space = [](unsigned char c) { return std::isspace(c) == 0; };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    if (begin == s.end()) {
        return {};
    }
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return s.substr(
        static_cast<std::size_t>(begin - s.begin()),
        static_cast<std::size_t>(end - begin)
    );
}

// ---------------------------------------------------------------------------
// find_semicolon_outside_string_or_comment
//   원문 SQL에서 문자열 리터럴과 주석 밖에 있는 첫 세미콜론 위치를 반환한다.
//   없으면 std::nullopt.
//
//   주석 제거 전 원문을 상태 머신으로 스캔한다.
//   '' / "" 연속 따옴표와 백슬래시 이스케이프를 처리한다.
// ---------------------------------------------------------------------------
std::optional<std::size_t> find_semicolon_outside_string_or_comment(std::string_view sql) {
    enum class State : std::uint8_t {
        kNormal,
        kSingleQuote,
        kDoubleQuote,
        kBacktick,
        kBlockComment,
        kLineComment,
    };

    State state = State::kNormal;
    const std::size_t len = sql.size();

    for (std::size_t i = 0; i < len; ++i) {
        const char c = sql[i];
        const char next = (i + 1 < len) ? sql[i + 1] : '\0';

        switch (state) {
            case State::kNormal:
                if (c == '\'') {
                    state = State::kSingleQuote;
                } else if (c == '"') {
                    state = State::kDoubleQuote;
                } else if (c == '`') {
                    state = State::kBacktick;
                } else if (c == '/' && next == '*') {
                    state = State::kBlockComment;
                    ++i;
                } else if ((c == '-' && next == '-') || c == '#') {
                    state = State::kLineComment;
                } else if (c == ';') {
                    return i;
                }
                break;

            case State::kSingleQuote:
            case State::kDoubleQuote: {
                const char quote = (state == State::kSingleQuote) ? '\'' : '"';
                if (c == '\\') {
                    ++i;
                } else if (c == quote) {
                    if (next == quote) {
                        ++i;
                    } else {
                        state = State::kNormal;
                    }
                }
                break;
            }

            case State::kBacktick:
                if (c == '`') {
                    state = State::kNormal;
                }
                break;

            case State::kBlockComment:
                if (c == '*' && next == '/') {
                    state = State::kNormal;
                    ++i;
                }
                break;

            case State::kLineComment:
                if (c == '\n') {
                    state = State::kNormal;
                }
                break;
        }
    }

    return std::nullopt;
}

// 정규화된 SQL을 공백과 괄호 기준으로 토큰화한다.
std::vector<std::string> tokenize(std::string_view normalized_sql) {
    std::vector<std::string> tokens;
    std::string current;
    for (const char c : normalized_sql) {
        if (std::isspace(static_cast<unsigned char>(c)) != 0 || c == '(' || c == ')' || c == ',') {
            if (!current.empty()) {
                tokens.push_back(std::move(current));
                current.clear();
            }
            continue;
        }
        current.push_back(c);
    }
    if (!current.empty()) {
        tokens.push_back(std::move(current));
    }
    return tokens;
}

// ---------------------------------------------------------------------------
// 대상 키워드 탐색
//   CREATE/ALTER/DROP 동사 다음 토큰들에서 첫 번째 대상 키워드를 찾는다.
//   OR REPLACE, TEMPORARY, UNIQUE, DEFINER=... 같은 수식어는 자연히 건너뛴다.
// ---------------------------------------------------------------------------
enum class ObjectKeyword : std::uint8_t {
    kTable,
    kDatabase,
    kFunction,
    kProcedure,
    kIndex,
    kView,
    kUser,
    kOther,
    kNone,
};

ObjectKeyword find_object_keyword(const std::vector<std::string>& tokens) {
    static const std::unordered_map<std::string, ObjectKeyword> kObjectMap = {
        {"TABLE",      ObjectKeyword::kTable},
        {"DATABASE",   ObjectKeyword::kDatabase},
        {"SCHEMA",     ObjectKeyword::kDatabase},
        {"FUNCTION",   ObjectKeyword::kFunction},
        {"PROCEDURE",  ObjectKeyword::kProcedure},
        {"INDEX",      ObjectKeyword::kIndex},
        {"VIEW",       ObjectKeyword::kView},
        {"USER",       ObjectKeyword::kUser},
        {"TRIGGER",    ObjectKeyword::kOther},
        {"EVENT",      ObjectKeyword::kOther},
        {"TABLESPACE", ObjectKeyword::kOther},
        {"SERVER",     ObjectKeyword::kOther},
        {"ROLE",       ObjectKeyword::kOther},
        {"LOGFILE",    ObjectKeyword::kOther},
        {"INSTANCE",   ObjectKeyword::kOther},
    };

    const std::size_t limit = std::min(tokens.size(), kObjectScanLimit + 1);
    for (std::size_t i = 1; i < limit; ++i) {
        const auto it = kObjectMap.find(tokens[i]);
        if (it != kObjectMap.end()) {
            return it->second;
        }
    }
    return ObjectKeyword::kNone;
}

StatementBody classify_create(const std::vector<std::string>& tokens) {
    switch (find_object_keyword(tokens)) {
        case ObjectKeyword::kTable:     return DdlStatement{DdlKind::kCreateTable};
        case ObjectKeyword::kDatabase:  return DdlStatement{DdlKind::kCreateDatabase};
        case ObjectKeyword::kFunction:  return DdlStatement{DdlKind::kCreateFunction};
        case ObjectKeyword::kProcedure: return DdlStatement{DdlKind::kCreateProcedure};
        case ObjectKeyword::kIndex:     return DdlStatement{DdlKind::kCreateIndex};
        case ObjectKeyword::kView:      return DdlStatement{DdlKind::kCreateView};
        case ObjectKeyword::kUser:      return DclStatement{DclKind::kCreateUser};
        case ObjectKeyword::kOther:
        case ObjectKeyword::kNone:
            break;
    }
    return DdlStatement{DdlKind::kOther};
}

StatementBody classify_alter(const std::vector<std::string>& tokens) {
    switch (find_object_keyword(tokens)) {
        case ObjectKeyword::kTable:    return DdlStatement{DdlKind::kAlterTable};
        case ObjectKeyword::kDatabase: return DdlStatement{DdlKind::kAlterDatabase};
        case ObjectKeyword::kUser:     return DclStatement{DclKind::kAlterUser};
        default:
            break;
    }
    return DdlStatement{DdlKind::kOther};
}

StatementBody classify_drop(const std::vector<std::string>& tokens) {
    switch (find_object_keyword(tokens)) {
        case ObjectKeyword::kTable:    return DdlStatement{DdlKind::kDropTable};
        case ObjectKeyword::kDatabase: return DdlStatement{DdlKind::kDropDatabase};
        case ObjectKeyword::kIndex:    return DdlStatement{DdlKind::kDropIndex};
        case ObjectKeyword::kView:     return DdlStatement{DdlKind::kDropView};
        case ObjectKeyword::kUser:     return DclStatement{DclKind::kDropUser};
        default:
            break;
    }
    return DdlStatement{DdlKind::kOther};
}

StatementBody classify_show(const std::vector<std::string>& tokens) {
    // SHOW [FULL] TABLES / SHOW DATABASES / SHOW SCHEMAS
    for (std::size_t i = 1; i < tokens.size() && i < 3; ++i) {
        if (tokens[i] == "DATABASES" || tokens[i] == "SCHEMAS") {
            return DalStatement{DalKind::kShowDatabases};
        }
        if (tokens[i] == "TABLES") {
            return DalStatement{DalKind::kShowTables};
        }
    }
    return DalStatement{DalKind::kShowOther};
}

StatementBody classify(const std::vector<std::string>& tokens) {
    if (tokens.empty()) {
        return DalStatement{DalKind::kOther};
    }

    const std::string& verb = tokens.front();

    if (verb == "SELECT" || verb == "TABLE" || verb == "VALUES") {
        return DmlStatement{DmlKind::kSelect};
    }
    if (verb == "INSERT")  { return DmlStatement{DmlKind::kInsert}; }
    if (verb == "UPDATE")  { return DmlStatement{DmlKind::kUpdate}; }
    if (verb == "DELETE")  { return DmlStatement{DmlKind::kDelete}; }
    if (verb == "REPLACE") { return DmlStatement{DmlKind::kReplace}; }
    if (verb == "CALL")    { return DmlStatement{DmlKind::kCall}; }
    if (verb == "DO")      { return DmlStatement{DmlKind::kDo}; }
    if (verb == "LOAD")    { return DmlStatement{DmlKind::kLoad}; }

    if (verb == "CREATE")   { return classify_create(tokens); }
    if (verb == "ALTER")    { return classify_alter(tokens); }
    if (verb == "DROP")     { return classify_drop(tokens); }
    if (verb == "TRUNCATE") { return DdlStatement{DdlKind::kTruncate}; }
    if (verb == "RENAME")   { return DdlStatement{DdlKind::kRenameTable}; }

    if (verb == "SHOW") { return classify_show(tokens); }
    if (verb == "USE")  { return DalStatement{DalKind::kUse}; }
    if (verb == "SET")  { return DalStatement{DalKind::kSet}; }
    if (verb == "EXPLAIN" || verb == "DESCRIBE" || verb == "DESC") {
        return DalStatement{DalKind::kExplain};
    }

    if (verb == "GRANT")  { return DclStatement{DclKind::kGrant}; }
    if (verb == "REVOKE") { return DclStatement{DclKind::kRevoke}; }

    if (verb == "BEGIN" || verb == "START") { return TclStatement{TclKind::kBegin}; }
    if (verb == "COMMIT")                   { return TclStatement{TclKind::kCommit}; }
    if (verb == "ROLLBACK")                 { return TclStatement{TclKind::kRollback}; }
    if (verb == "SAVEPOINT" || verb == "RELEASE") {
        return TclStatement{TclKind::kSavepoint};
    }

    return DalStatement{DalKind::kOther};
}

// ---------------------------------------------------------------------------
// skip_cte_list
//   "WITH [RECURSIVE] name [(cols)] AS (...) [, ...] <본문>" 에서 <본문> 의
//   시작 위치부터의 문자열을 반환한다. 본문을 찾지 못하면 빈 문자열.
//
//   괄호 깊이 0 에서 CTE 정의가 닫힌 뒤(")" 다음) 처음 나오는 단어가 본문
//   동사다. 쉼표는 다음 CTE 정의, AS 는 컬럼 목록 뒤의 정의 시작이다.
//   문자열/식별자 따옴표 안의 괄호는 세지 않는다.
// ---------------------------------------------------------------------------
std::string_view skip_cte_list(std::string_view normalized_sql) {
    int  depth          = 0;
    bool after_cte_body = false;
    char quote          = '\0';

    for (std::size_t i = 0; i < normalized_sql.size(); ++i) {
        const char c = normalized_sql[i];

        if (quote != '\0') {
            if (c == '\\' && quote != '`') {
                ++i;
            } else if (c == quote) {
                quote = '\0';
            }
            continue;
        }

        if (c == '\'' || c == '"' || c == '`') {
            quote = c;
            continue;
        }
        if (c == '(') {
            ++depth;
            continue;
        }
        if (c == ')') {
            if (depth > 0 && --depth == 0) {
                after_cte_body = true;
            }
            continue;
        }
        if (depth != 0) {
            continue;
        }
        if (c == ',') {
            after_cte_body = false;
            continue;
        }
        if (std::isalpha(static_cast<unsigned char>(c)) == 0) {
            continue;
        }

        // 깊이 0 의 단어
        std::size_t end = i;
        while (end < normalized_sql.size() &&
               (std::isalnum(static_cast<unsigned char>(normalized_sql[end])) != 0 ||
                normalized_sql[end] == '_' || normalized_sql[end] == '$')) {
            ++end;
        }
        const std::string_view word = normalized_sql.substr(i, end - i);

        if (word == "AS") {
            after_cte_body = false;
        } else if (after_cte_body) {
            return normalized_sql.substr(i);
        }
        i = end - 1;
    }
    return {};
}

// ---------------------------------------------------------------------------
// extract_tables_for_keyword
//   normalized_sql 에서 keyword 뒤의 테이블명(들)을 추출하여 out_tables 에
//   추가한다. 쉼표 구분 복수 테이블(FROM t1, t2)과 IF [NOT] EXISTS 를 처리한다.
//   백틱은 제거하고, 대소문자 무관 중복은 한 번만 추가한다.
//
//   결과는 대문자 정규화된 이름이다. 원문 대소문자는 raw_sql 로 확인한다.
// ---------------------------------------------------------------------------
void extract_tables_for_keyword(const std::string&        normalized_sql,
                                const std::string&        keyword,
                                std::vector<std::string>& out_tables) {
    const std::string pattern =
        "\\b" + keyword +
        "\\s+(?:IF\\s+(?:NOT\\s+)?EXISTS\\s+)?(`?[\\w.$]+`?(?:\\s*,\\s*`?[\\w.$]+`?)*)";

    try {
        const std::regex re(pattern, std::regex_constants::ECMAScript);

        auto it = std::sregex_iterator(normalized_sql.begin(), normalized_sql.end(), re);
        const auto end_it = std::sregex_iterator();

        for (; it != end_it; ++it) {
            const std::smatch& m = *it;
            if (m.size() < 2) {
                continue;
            }

            const std::string table_list = m[1].str();
            std::size_t pos = 0;
            while (pos <= table_list.size()) {
                const auto comma = table_list.find(',', pos);
                const auto piece = (comma == std::string::npos)
                    ? std::string_view(table_list).substr(pos)
                    : std::string_view(table_list).substr(pos, comma - pos);
                pos = (comma == std::string::npos) ? table_list.size() + 1 : comma + 1;

                std::string name(trim(piece));
                name.erase(std::remove(name.begin(), name.end(), '`'), name.end());
                if (name.empty()) {
                    continue;
                }
                if (std::find(out_tables.begin(), out_tables.end(), name) == out_tables.end()) {
                    out_tables.push_back(std::move(name));
                }
            }
        }
    } catch (const std::regex_error& e) {
        spdlog::warn("sql_parser: regex error for keyword '{}': {}", keyword, e.what());
    }
}

std::vector<std::string> extract_tables(const StatementBody& body, const std::string& normalized) {
    std::vector<std::string> tables;

    if (const auto* dml = std::get_if<DmlStatement>(&body)) {
        switch (dml->kind) {
            case DmlKind::kSelect:
            case DmlKind::kDelete:
                extract_tables_for_keyword(normalized, "FROM", tables);
                extract_tables_for_keyword(normalized, "JOIN", tables);
                break;
            case DmlKind::kInsert:
            case DmlKind::kReplace:
            case DmlKind::kLoad:
                extract_tables_for_keyword(normalized, "INTO", tables);
                break;
            case DmlKind::kUpdate:
                extract_tables_for_keyword(normalized, "UPDATE", tables);
                extract_tables_for_keyword(normalized, "JOIN", tables);
                break;
            default:
                break;
        }
        return tables;
    }

    if (const auto* ddl = std::get_if<DdlStatement>(&body)) {
        switch (ddl->kind) {
            case DdlKind::kCreateTable:
            case DdlKind::kAlterTable:
            case DdlKind::kDropTable:
            case DdlKind::kRenameTable:
                extract_tables_for_keyword(normalized, "TABLE", tables);
                break;
            case DdlKind::kTruncate:
                extract_tables_for_keyword(normalized, "TABLE", tables);
                if (tables.empty()) {
                    extract_tables_for_keyword(normalized, "TRUNCATE", tables);
                }
                break;
            case DdlKind::kCreateIndex:
            case DdlKind::kDropIndex:
                extract_tables_for_keyword(normalized, "ON", tables);
                break;
            default:
                break;
        }
    }
    return tables;
}

}  // namespace

// ---------------------------------------------------------------------------
// SqlParser::parse 구현
// ---------------------------------------------------------------------------
std::expected<SqlStatement, ParseError>
SqlParser::parse(std::string_view sql) const {
    // 1. 빈 입력 검사
    if (trim(sql).empty()) {
        return std::unexpected(ParseError{
            ParseErrorCode::kInvalidSql,
            "Empty SQL input",
            std::string(sql)
        });
    }

    // 2. 멀티 스테이트먼트 감지 (주석 제거 전 원문에서 수행)
    //    끝 세미콜론 뒤에 주석/공백만 남으면 단일 구문으로 취급한다.
    std::string_view statement_sql = sql;
    if (const auto semicolon = find_semicolon_outside_string_or_comment(sql)) {
        const auto rest = sql.substr(*semicolon + 1);
        if (!trim(remove_comments(rest)).empty()) {
            spdlog::warn("sql_parser: multi-statement detected, fail-close applied. "
                         "sql_prefix='{}'",
                         std::string(sql.substr(0, 80)));
            return std::unexpected(ParseError{
                ParseErrorCode::kMultiStatement,
                "Multi-statement SQL detected: semicolon outside string or comment",
                std::string(sql)
            });
        }
        statement_sql = sql.substr(0, *semicolon);
    }

    // 3. 주석 제거 + 대문자 정규화
    const std::string normalized = to_upper(trim(remove_comments(statement_sql)));
    if (normalized.empty()) {
        return std::unexpected(ParseError{
            ParseErrorCode::kInvalidSql,
            "SQL is empty after comment removal",
            std::string(sql)
        });
    }

    // 4. 카테고리/종류 분류
    //    WITH 는 CTE 목록을 건너뛴 본문 동사로 분류한다 (WITH ... UPDATE/DELETE).
    //    본문을 찾지 못하면 토큰이 비어 분류 불가(DAL:OTHER)로 거부된다.
    auto tokens = tokenize(normalized);
    if (!tokens.empty() && tokens.front() == "WITH") {
        tokens = tokenize(skip_cte_list(normalized));
    }

    SqlStatement result;
    result.body    = classify(tokens);
    result.raw_sql = std::string(sql);

    // 5. 테이블명 추출 (로깅용)
    result.tables = extract_tables(result.body, normalized);

    spdlog::debug("sql_parser: classified as {}:{} tables={}",
                  category_name(result), kind_name(result), result.tables.size());

    return result;
}
