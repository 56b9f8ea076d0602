// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdio>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

constexpr const char* kLoggerName = "dbauthz";

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto duration = tp.time_since_epoch();
    const auto seconds  = std::chrono::duration_cast<std::chrono::seconds>(duration);
    const auto millis   = std::chrono::duration_cast<std::chrono::milliseconds>(duration) - seconds;

    const std::time_t time_t_val = std::chrono::system_clock::to_time_t(tp);
    std::tm           tm_val{};
    gmtime_r(&time_t_val, &tm_val);

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0')
        << std::setw(3) << millis.count() << 'Z';
    return oss.str();
}

std::string escape_json_string(const std::string& str) {
    std::string result;
    result.reserve(str.size() + 16);

    for (const unsigned char ch : str) {
        switch (ch) {
            case '"':  result += "\\\""; break;
            case '\\': result += "\\\\"; break;
            case '\b': result += "\\b";  break;
            case '\f': result += "\\f";  break;
            case '\n': result += "\\n";  break;
            case '\r': result += "\\r";  break;
            case '\t': result += "\\t";  break;
            default:
                if (ch < 0x20) {
                    char buf[8]{};
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
                    result += buf;
                } else {
                    result += static_cast<char>(ch);
                }
                break;
        }
    }
    return result;
}

spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

}  // namespace

LogLevel log_level_from_string(const std::string& level) {
    std::string lower(level);
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "debug") {
        return LogLevel::kDebug;
    }
    if (lower == "warn" || lower == "warning") {
        return LogLevel::kWarn;
    }
    if (lower == "error") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        // Rotating file sink (10MB, 3개 파일 유지)
        constexpr std::size_t kMaxFileSize = 10 * 1024 * 1024;
        constexpr std::size_t kMaxFiles    = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), kMaxFileSize, kMaxFiles));

        logger_ = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level));

        // 구조화 로그는 각 메서드에서 JSON 으로 생성하므로 패턴은 타임스탬프만
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::debug);

        spdlog::register_logger(logger_);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (!logger_) {
        return;
    }
    try {
        logger_->flush();
        spdlog::drop(kLoggerName);
    } catch (const std::exception& ex) {
        std::fprintf(stderr, "structured_logger: shutdown failed: %s\n", ex.what());
    }
}

bool StructuredLogger::enabled(LogLevel level) const noexcept {
    return logger_ && static_cast<int>(level) >= static_cast<int>(min_level_);
}

// ---------------------------------------------------------------------------
// log_decision: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_decision(const DecisionLog& entry) {
    const LogLevel level = entry.allowed ? LogLevel::kInfo : LogLevel::kWarn;
    if (!enabled(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":")"
         << (entry.allowed ? "authorization_allowed" : "authorization_denied")
         << R"(","grantee":")" << escape_json_string(entry.grantee)
         << R"(","database":")" << escape_json_string(entry.database)
         << R"(","statement":")" << escape_json_string(entry.statement)
         << R"(","required_privilege":")" << escape_json_string(entry.required_privilege)
         << R"(","raw_sql":")" << escape_json_string(entry.raw_sql)
         << R"(","allowed":)" << (entry.allowed ? "true" : "false");

    if (!entry.allowed) {
        json << R"(,"error_code":")" << escape_json_string(entry.error_code)
             << R"(","reason":")" << escape_json_string(entry.reason) << '"';
    }
    json << R"(,"timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    if (entry.allowed) {
        logger_->info(json.str());
    } else {
        logger_->warn(json.str());
    }
}

// ---------------------------------------------------------------------------
// log_authentication: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_authentication(const AuthenticationLog& entry) {
    const LogLevel level = entry.success ? LogLevel::kInfo : LogLevel::kWarn;
    if (!enabled(level)) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":")"
         << (entry.success ? "authentication_succeeded" : "authentication_failed")
         << R"(","grantee":")" << escape_json_string(entry.grantee)
         << R"(","auth_plugin":")" << escape_json_string(entry.auth_plugin)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    if (entry.success) {
        logger_->info(json.str());
    } else {
        logger_->warn(json.str());
    }
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}
