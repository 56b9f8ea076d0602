// ---------------------------------------------------------------------------
// grantee.cpp
// ---------------------------------------------------------------------------

#include "authority/grantee.hpp"

#include <algorithm>
#include <cctype>

namespace {

bool iequals(std::string_view a, std::string_view b) {
    if (a.size() != b.size()) {
        return false;
    }
    return std::equal(a.begin(), a.end(), b.begin(), [](unsigned char ac, unsigned char bc) {
        return std::tolower(ac) == std::tolower(bc);
    });
}

}  // namespace

bool Grantee::is_unlimited_host() const noexcept {
    return hostname.empty() || hostname == "%";
}

bool Grantee::matches(const Grantee& requested) const {
    if (username != requested.username) {
        return false;
    }
    return is_unlimited_host() || iequals(hostname, requested.hostname);
}

std::string Grantee::to_string() const {
    return username + "@" + hostname;
}

Grantee Grantee::parse(std::string_view text) {
    const auto at_pos = text.rfind('@');
    if (at_pos == std::string_view::npos) {
        return Grantee{std::string(text), "%"};
    }
    return Grantee{std::string(text.substr(0, at_pos)), std::string(text.substr(at_pos + 1))};
}
