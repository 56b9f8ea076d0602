#pragma once

// ---------------------------------------------------------------------------
// authority_rule_store.hpp
//
// 프로세스 전역 AuthorityRule 보관소 + 설정 파일 Hot Reload 감시.
//
// [원자적 교체]
// std::atomic<std::shared_ptr<const AuthorityRule>> 로 규칙을 보유한다.
// - snapshot(): 현재 규칙의 shared_ptr 을 얻는다. 진행 중인 검사는 이
//   snapshot 으로 끝까지 수행되며, 도중에 reload 가 일어나도 영향이 없다.
// - reload(): 새 규칙으로 교체한다. nullptr 로 교체하면 이후 snapshot 이
//   nullptr 을 반환하며, 호출자는 principal 이 있는 요청을 거부해야 한다.
//
// [watch]
// Boost.Asio steady_timer 코루틴으로 파일 mtime 을 주기적으로 비교한다.
// 변경 감지 시 AuthorityLoader 로 다시 로드하고, 성공했을 때만 교체한다.
// 로드 실패 시 기존 규칙을 유지하고 오류 로그만 남긴다 (fail-close).
//
// [한계]
// - mtime 해상도보다 짧은 간격의 연속 수정은 한 번의 변경으로 보일 수 있다.
// - 결정 캐시는 두지 않는다. 매 검사가 snapshot 시점의 규칙을 읽는다.
//
// [수명]
// 규칙과 감시 상태는 shared_ptr 로 감시 코루틴과 공유한다. 코루틴은 this 를
// 잡지 않으므로 store 가 먼저 파괴되어도 재개 시 해제된 메모리에 닿지 않는다.
// 소멸자는 stop() 을 호출한다. io_context 는 store 보다 오래 살아야 한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <utility>

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/steady_timer.hpp>

#include "authority/authority_rule.hpp"

class AuthorityRuleStore {
public:
    explicit AuthorityRuleStore(std::shared_ptr<const AuthorityRule> rule);

    ~AuthorityRuleStore();

    // 복사/이동 금지 (감시 상태 소유권이 하나뿐이다)
    AuthorityRuleStore(const AuthorityRuleStore&)            = delete;
    AuthorityRuleStore& operator=(const AuthorityRuleStore&) = delete;
    AuthorityRuleStore(AuthorityRuleStore&&)                 = delete;
    AuthorityRuleStore& operator=(AuthorityRuleStore&&)      = delete;

    [[nodiscard]] std::shared_ptr<const AuthorityRule> snapshot() const;

    void reload(std::shared_ptr<const AuthorityRule> new_rule);

    // reload_from_file
    //   config_path 를 로드하여 성공 시 교체한다. 실패 시 기존 규칙 유지.
    //   반환: 교체 여부
    bool reload_from_file(const std::filesystem::path& config_path);

    // watch
    //   io_context 에서 감시 코루틴을 co_spawn 한다. stop() 또는 io_context 종료 시
    //   감시가 끝난다. 한 번에 하나의 감시만 유지하며, 다시 호출하면 이전 감시를
    //   취소한다.
    void watch(const std::filesystem::path& config_path,
               boost::asio::io_context&     io_ctx,
               std::chrono::milliseconds    interval);

    // stop
    //   감시를 취소한다. io_context 를 실행하는 스레드에서 호출하거나
    //   io_context 가 멈춘 뒤 호출할 것 (steady_timer 는 스레드 안전하지 않다).
    void stop();

    // 성공한 교체 횟수 (초기 규칙 제외)
    [[nodiscard]] std::uint64_t reload_count() const noexcept {
        return rule_state_->reload_count.load(std::memory_order_relaxed);
    }

private:
    // 현재 규칙과 교체 횟수. store 와 감시 코루틴이 함께 소유한다.
    struct RuleState {
        explicit RuleState(std::shared_ptr<const AuthorityRule> initial) : rule(std::move(initial)) {}

        std::atomic<std::shared_ptr<const AuthorityRule>> rule;
        std::atomic<std::uint64_t>                        reload_count{0};
    };

    // 감시 코루틴 하나의 상태. stop() 이후 재개되어도 댕글링 참조가 생기지 않는다.
    struct WatchState {
        explicit WatchState(boost::asio::io_context& io_ctx) : timer(io_ctx) {}

        boost::asio::steady_timer timer;
        bool                      stopped{false};
    };

    static void swap_rule(RuleState& state, std::shared_ptr<const AuthorityRule> new_rule);
    static bool load_and_swap(RuleState& state, const std::filesystem::path& config_path);

    // static: 코루틴 프레임에 this 가 남지 않는다
    static boost::asio::awaitable<void> watch_loop(std::shared_ptr<RuleState>  rule_state,
                                                   std::shared_ptr<WatchState> watch_state,
                                                   std::filesystem::path       config_path,
                                                   std::chrono::milliseconds   interval);

    std::shared_ptr<RuleState>  rule_state_;
    std::shared_ptr<WatchState> watch_state_;
};
