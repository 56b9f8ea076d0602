// ---------------------------------------------------------------------------
// authority_rule_store.cpp
// ---------------------------------------------------------------------------

#include "authority/authority_rule_store.hpp"

#include <optional>
#include <system_error>
#include <utility>

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/use_awaitable.hpp>

#include <spdlog/spdlog.h>

#include "authority/authority_loader.hpp"

namespace {

// 파일 mtime. 조회 실패 시 std::nullopt (파일 삭제/교체 중일 수 있음).
std::optional<std::filesystem::file_time_type> config_mtime(const std::filesystem::path& path) {
    std::error_code ec;
    const auto mtime = std::filesystem::last_write_time(path, ec);
    if (ec) {
        return std::nullopt;
    }
    return mtime;
}

}  // namespace

AuthorityRuleStore::AuthorityRuleStore(std::shared_ptr<const AuthorityRule> rule)
    : rule_state_(std::make_shared<RuleState>(std::move(rule)))
{}

AuthorityRuleStore::~AuthorityRuleStore() {
    stop();
}

std::shared_ptr<const AuthorityRule> AuthorityRuleStore::snapshot() const {
    return rule_state_->rule.load();
}

void AuthorityRuleStore::reload(std::shared_ptr<const AuthorityRule> new_rule) {
    swap_rule(*rule_state_, std::move(new_rule));
}

bool AuthorityRuleStore::reload_from_file(const std::filesystem::path& config_path) {
    return load_and_swap(*rule_state_, config_path);
}

void AuthorityRuleStore::swap_rule(RuleState& state, std::shared_ptr<const AuthorityRule> new_rule) {
    if (!new_rule) {
        spdlog::warn("authority_rule_store: reloaded with null rule, "
                     "every request carrying a principal will be denied");
    }
    state.rule.store(std::move(new_rule));
    state.reload_count.fetch_add(1, std::memory_order_relaxed);
}

bool AuthorityRuleStore::load_and_swap(RuleState& state, const std::filesystem::path& config_path) {
    const auto config = AuthorityLoader::load(config_path);
    if (!config.has_value()) {
        spdlog::error("authority_rule_store: reload failed, keeping previous rule: {}",
                      config.error());
        return false;
    }
    swap_rule(state, build_authority_rule(*config));
    spdlog::info("authority_rule_store: rule reloaded from '{}' (users={})",
                 config_path.string(), config->users.size());
    return true;
}

void AuthorityRuleStore::watch(const std::filesystem::path& config_path,
                               boost::asio::io_context&     io_ctx,
                               std::chrono::milliseconds    interval) {
    stop();

    watch_state_ = std::make_shared<WatchState>(io_ctx);
    boost::asio::co_spawn(io_ctx,
                          watch_loop(rule_state_, watch_state_, config_path, interval),
                          boost::asio::detached);

    spdlog::info("authority_rule_store: watching '{}' every {}ms",
                 config_path.string(), interval.count());
}

void AuthorityRuleStore::stop() {
    if (!watch_state_) {
        return;
    }
    watch_state_->stopped = true;
    watch_state_->timer.cancel();
    watch_state_.reset();
}

boost::asio::awaitable<void>
AuthorityRuleStore::watch_loop(std::shared_ptr<RuleState>  rule_state,
                               std::shared_ptr<WatchState> watch_state,
                               std::filesystem::path       config_path,
                               std::chrono::milliseconds   interval) {
    auto known_mtime = config_mtime(config_path);

    while (!watch_state->stopped) {
        watch_state->timer.expires_after(interval);

        boost::system::error_code ec;
        co_await watch_state->timer.async_wait(
            boost::asio::redirect_error(boost::asio::use_awaitable, ec));

        if (ec == boost::asio::error::operation_aborted || watch_state->stopped) {
            break;
        }
        if (ec) {
            spdlog::warn("authority_rule_store: timer error: {}", ec.message());
            break;
        }

        const auto current_mtime = config_mtime(config_path);
        if (!current_mtime.has_value()) {
            spdlog::debug("authority_rule_store: '{}' not accessible, keeping previous rule",
                          config_path.string());
            continue;
        }
        if (known_mtime.has_value() && *known_mtime == *current_mtime) {
            continue;
        }

        // 로드 실패여도 mtime 을 갱신하여 같은 잘못된 파일을 반복 로드하지 않는다.
        known_mtime = current_mtime;
        (void)load_and_swap(*rule_state, config_path);
    }

    spdlog::debug("authority_rule_store: watch on '{}' stopped", config_path.string());
}
