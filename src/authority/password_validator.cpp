// ---------------------------------------------------------------------------
// password_validator.cpp
//
// SHA-1 은 OpenSSL EVP 인터페이스로 계산한다.
// 비교는 CRYPTO_memcmp 로 상수 시간에 수행한다.
// ---------------------------------------------------------------------------

#include "authority/password_validator.hpp"

#include <array>
#include <initializer_list>
#include <memory>
#include <utility>

#include <openssl/crypto.h>
#include <openssl/evp.h>
#include <spdlog/spdlog.h>

namespace {

using Sha1Digest = std::array<unsigned char, kNativePasswordScrambleLength>;

struct EvpMdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const noexcept { EVP_MD_CTX_free(ctx); }
};

// parts 를 순서대로 이어 붙인 입력의 SHA-1. 실패 시 false.
bool sha1(std::initializer_list<std::string_view> parts, Sha1Digest& out) {
    std::unique_ptr<EVP_MD_CTX, EvpMdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        spdlog::error("password_validator: EVP_MD_CTX_new failed");
        return false;
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha1(), nullptr) != 1) {
        spdlog::error("password_validator: EVP_DigestInit_ex(sha1) failed");
        return false;
    }
    for (const auto part : parts) {
        if (EVP_DigestUpdate(ctx.get(), part.data(), part.size()) != 1) {
            spdlog::error("password_validator: EVP_DigestUpdate failed");
            return false;
        }
    }
    unsigned int len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1 || len != out.size()) {
        spdlog::error("password_validator: EVP_DigestFinal_ex failed");
        return false;
    }
    return true;
}

std::string_view as_view(const Sha1Digest& digest) {
    return {reinterpret_cast<const char*>(digest.data()), digest.size()};
}

}  // namespace

std::string scramble_native_password(std::string_view password, std::string_view scramble) {
    if (password.empty()) {
        return {};
    }

    Sha1Digest stage1{};
    Sha1Digest stage2{};
    Sha1Digest mixed{};
    if (!sha1({password}, stage1) ||
        !sha1({as_view(stage1)}, stage2) ||
        !sha1({scramble, as_view(stage2)}, mixed)) {
        return {};
    }

    std::string result(kNativePasswordScrambleLength, '\0');
    for (std::size_t i = 0; i < kNativePasswordScrambleLength; ++i) {
        result[i] = static_cast<char>(stage1[i] ^ mixed[i]);
    }
    return result;
}

CredentialValidator make_plaintext_validator() {
    return [](const AuthorityUser& user, std::string_view cipher) {
        return user.password == cipher;
    };
}

CredentialValidator make_native_password_validator(std::string scramble) {
    return [scramble = std::move(scramble)](const AuthorityUser& user, std::string_view cipher) {
        if (user.password.empty() || cipher.empty()) {
            return user.password.empty() && cipher.empty();
        }
        if (scramble.size() != kNativePasswordScrambleLength ||
            cipher.size() != kNativePasswordScrambleLength) {
            spdlog::debug("password_validator: unexpected length scramble={} cipher={}",
                          scramble.size(), cipher.size());
            return false;
        }

        const std::string expected = scramble_native_password(user.password, scramble);
        if (expected.size() != cipher.size()) {
            return false;
        }
        return CRYPTO_memcmp(expected.data(), cipher.data(), cipher.size()) == 0;
    };
}
