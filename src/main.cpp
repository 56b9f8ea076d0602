// ---------------------------------------------------------------------------
// main.cpp
//
// dbauthz 명령행 도구.
//
//   dbauthz <user@host> <database|-> <sql|->
//
// 권한 규칙 YAML 을 로드하고, 주어진 principal 이 SQL 한 구문을 실행할 수
// 있는지 판정한다. database 자리에 "-" 를 주면 가시성 검사를 건너뛴다.
//
// sql 자리에 "-" 를 주면 표준입력에서 한 줄에 한 구문씩 읽어 판정한다.
// 이 모드에서는 AuthorityRuleStore 가 규칙 파일을 global.reload_interval_ms
// 간격으로 감시하여 바뀐 규칙을 다음 줄부터 적용하고, SIGHUP 을 받으면
// 즉시 다시 로드한다.
//
// [환경변수]
//   AUTHORITY_PATH     : 규칙 파일 경로 (기본 config/authority.yaml)
//   LOG_LEVEL          : debug|info|warn|error (기본: 규칙 파일 global.log_level)
//   LOG_PATH           : 로그 파일 경로 (기본: 규칙 파일 global.log_path)
//   AUTHORITY_PASSWORD : 지정 시 판정 전에 평문 비밀번호로 인증을 먼저 수행
//
// [종료 코드]
//   0 허용, 1 거부 (인증 실패 포함), 2 사용법/설정/파싱 오류
//   표준입력 모드는 모든 줄 중 가장 큰 값을 반환한다.
// ---------------------------------------------------------------------------

#include "authority/authority_checker.hpp"
#include "authority/authority_loader.hpp"
#include "authority/authority_rule_store.hpp"
#include "authority/password_validator.hpp"
#include "authority/privilege_classifier.hpp"
#include "logger/structured_logger.hpp"
#include "parser/sql_parser.hpp"

#include <spdlog/spdlog.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <algorithm>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <thread>

namespace {

constexpr int kExitAllowed = 0;
constexpr int kExitDenied  = 1;
constexpr int kExitError   = 2;

std::string env_str(const char* name, std::string default_val) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return val;
    }
    return default_val;
}

std::optional<std::string> env_opt(const char* name) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val == nullptr) {
        return std::nullopt;
    }
    return std::string(val);
}

void print_usage(const char* prog) {
    std::fprintf(stderr,
                 "usage: %s <user@host> <database|-> <sql|->\n"
                 "  env: AUTHORITY_PATH, LOG_LEVEL, LOG_PATH, AUTHORITY_PASSWORD\n",
                 prog);
}

std::string statement_label(const SqlStatement& statement) {
    return std::string(category_name(statement)) + ":" + std::string(kind_name(statement));
}

std::string_view error_code_name(AuthorityErrorCode code) {
    switch (code) {
        case AuthorityErrorCode::kUnknownDatabase:       return "UNKNOWN_DATABASE";
        case AuthorityErrorCode::kUnauthorizedOperation: return "UNAUTHORIZED_OPERATION";
    }
    return "UNKNOWN";
}

// 한 구문을 판정하고 결정 로그를 남긴다. 반환: 종료 코드
int check_statement(const AuthorityRule&            rule,
                    const Grantee&                  grantee,
                    std::optional<std::string_view> database,
                    const std::string&              raw_sql,
                    StructuredLogger&               logger) {
    const SqlParser parser{};
    const auto statement = parser.parse(raw_sql);
    if (!statement.has_value()) {
        spdlog::error("dbauthz: SQL parse failed: {}", statement.error().message);
        return kExitError;
    }

    const AuthorityChecker checker{rule, grantee};
    const auto required = PrivilegeClassifier::resolve(*statement);
    const auto decision = checker.check_privileges(database, *statement);

    DecisionLog entry{
        .grantee            = grantee.to_string(),
        .database           = database.has_value() ? std::string(*database) : std::string{},
        .statement          = statement_label(*statement),
        .required_privilege = required.has_value() ? std::string(to_string(*required)) : std::string{},
        .raw_sql            = raw_sql,
        .allowed            = decision.has_value(),
        .timestamp          = std::chrono::system_clock::now(),
    };
    if (!decision.has_value()) {
        entry.error_code = std::string(error_code_name(decision.error().code));
        entry.reason     = decision.error().message();
    }
    logger.log_decision(entry);

    if (!decision.has_value()) {
        std::printf("DENIED: %s\n", decision.error().message().c_str());
        return kExitDenied;
    }

    std::printf("ALLOWED: %s (requires %s)\n",
                entry.statement.c_str(),
                entry.required_privilege.empty() ? "-" : entry.required_privilege.c_str());
    return kExitAllowed;
}

}  // namespace

// ---------------------------------------------------------------------------
// main
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {
    if (argc != 4) {
        print_usage(argc > 0 ? argv[0] : "dbauthz");
        return kExitError;
    }

    const Grantee     grantee  = Grantee::parse(argv[1]);
    const std::string db_arg   = argv[2];
    const std::string raw_sql  = argv[3];

    if (grantee.username.empty()) {
        spdlog::error("dbauthz: empty username in '{}'", argv[1]);
        return kExitError;
    }

    // ── 규칙 로드 ───────────────────────────────────────────────────────
    const std::string authority_path = env_str("AUTHORITY_PATH", "config/authority.yaml");
    const auto config = AuthorityLoader::load(authority_path);
    if (!config.has_value()) {
        spdlog::error("dbauthz: {}", config.error());
        return kExitError;
    }

    const std::string log_level = env_str("LOG_LEVEL", config->global.log_level);
    const std::string log_path  = env_str("LOG_PATH",  config->global.log_path);

    spdlog::set_level(log_level_from_string(log_level) == LogLevel::kDebug
                          ? spdlog::level::debug
                          : spdlog::level::info);

    std::optional<StructuredLogger> logger;
    try {
        logger.emplace(log_level_from_string(log_level), log_path);
    } catch (const std::runtime_error& ex) {
        spdlog::error("dbauthz: {}", ex.what());
        return kExitError;
    }

    const auto rule = build_authority_rule(*config);
    const AuthorityChecker checker{*rule, grantee};

    // ── 인증 (선택) ─────────────────────────────────────────────────────
    if (const auto password = env_opt("AUTHORITY_PASSWORD"); password.has_value()) {
        const bool authenticated = checker.is_authenticated(make_plaintext_validator(), *password);
        const auto user          = rule->find_user(grantee);

        logger->log_authentication(AuthenticationLog{
            .grantee     = grantee.to_string(),
            .auth_plugin = user.has_value() ? user->auth_plugin : std::string{},
            .success     = authenticated,
            .timestamp   = std::chrono::system_clock::now(),
        });

        if (!authenticated) {
            std::printf("DENIED: Access denied for user '%s'\n", grantee.to_string().c_str());
            return kExitDenied;
        }
    }

    const std::optional<std::string_view> database =
        db_arg == "-" ? std::nullopt : std::optional<std::string_view>{db_arg};

    if (raw_sql != "-") {
        return check_statement(*rule, grantee, database, raw_sql, *logger);
    }

    // ── 표준입력 모드: 규칙 파일 감시 ───────────────────────────────────
    boost::asio::io_context ioc;
    AuthorityRuleStore      store{rule};

    store.watch(authority_path, ioc,
                std::chrono::milliseconds{config->global.reload_interval_ms});

    // SIGHUP → 즉시 재로딩. 수신 후 재등록하여 반복 감지
    auto signals_hup = std::make_shared<boost::asio::signal_set>(ioc, SIGHUP);
    std::function<void()> setup_hup;
    setup_hup = [&store, &authority_path, signals_hup, &setup_hup]() {
        signals_hup->async_wait(
            [&store, &authority_path, &setup_hup](const boost::system::error_code& ec, int /*signum*/) {
                if (!ec) {
                    (void)store.reload_from_file(authority_path);
                    setup_hup();
                }
            });
    };
    setup_hup();

    std::thread io_thread{[&ioc]() { ioc.run(); }};

    // 규칙이 비어 있으면(nullptr) 빈 규칙으로 검사하여 거부한다
    const AuthorityRule empty_rule{{}, {}};

    int         exit_code = kExitAllowed;
    std::string line;
    while (std::getline(std::cin, line)) {
        if (line.find_first_not_of(" \t\r") == std::string::npos) {
            continue;
        }
        const auto current = store.snapshot();
        exit_code = std::max(exit_code,
                             check_statement(current ? *current : empty_rule,
                                             grantee, database, line, *logger));
        std::fflush(stdout);
    }

    // io_context 를 멈춘 뒤에 감시를 정리한다 (steady_timer 는 스레드 안전하지 않다)
    ioc.stop();
    io_thread.join();
    store.stop();

    spdlog::info("dbauthz: input closed, {} rule reload(s)", store.reload_count());
    return exit_code;
}
