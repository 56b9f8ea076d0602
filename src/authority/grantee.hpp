#pragma once

// ---------------------------------------------------------------------------
// grantee.hpp
//
// 권한 주체(principal) 식별자: user@host.
//
// [호스트 매칭]
// 저장된 grantee 의 hostname 이 "%" 또는 빈 문자열이면 모든 호스트와 매칭된다.
// 그 외에는 hostname 을 대소문자 무관으로 비교한다. username 은 대소문자를
// 구분한다.
//
// [주의]
// "principal 없음(신뢰된 내부 호출)" 은 std::optional<Grantee> 의 nullopt 로만
// 표현한다. username 이 빈 Grantee 는 익명 사용자가 아니라 실제 grantee 이다.
// ---------------------------------------------------------------------------

#include <string>
#include <string_view>

struct Grantee {
    std::string username{};
    std::string hostname{"%"};

    // 호스트 제한이 없는지 ("%" 또는 빈 문자열)
    [[nodiscard]] bool is_unlimited_host() const noexcept;

    // 이 (저장된) grantee 가 요청 grantee 를 포함하는지
    [[nodiscard]] bool matches(const Grantee& requested) const;

    // "user@host"
    [[nodiscard]] std::string to_string() const;

    // "user@host" 파싱. 마지막 '@' 가 구분자이며, '@' 가 없으면 host 는 "%".
    [[nodiscard]] static Grantee parse(std::string_view text);

    bool operator==(const Grantee&) const = default;
};
