#pragma once

// ---------------------------------------------------------------------------
// password_validator.hpp
//
// AuthorityChecker::is_authenticated 에 주입하는 CredentialValidator 팩토리.
//
// [mysql_native_password]
//   stage1 = SHA1(password)
//   stage2 = SHA1(stage1)
//   client = stage1 XOR SHA1(scramble || stage2)
//   서버는 저장된 평문 password 로 client 값을 재계산하여 비교한다.
//   - 저장 password 가 비어 있으면 cipher 도 비어 있어야 통과한다.
//   - scramble 이 20 바이트가 아니거나 cipher 가 20 바이트가 아니면 실패.
//
// [보안 주의]
// SHA-1 기반 challenge-response 는 전송 구간 보호를 TLS 에 의존한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <string>
#include <string_view>

#include "authority/authority_checker.hpp"  // CredentialValidator

inline constexpr std::size_t kNativePasswordScrambleLength = 20;

// 저장된 password 와 cipher 의 바이트 단위 일치
[[nodiscard]] CredentialValidator make_plaintext_validator();

// scramble: 서버가 handshake 에서 보낸 20 바이트 auth-plugin-data
[[nodiscard]] CredentialValidator make_native_password_validator(std::string scramble);

// 클라이언트 측 응답 계산 (테스트 및 내부 재계산용).
// SHA-1 계산 실패 시 빈 문자열.
[[nodiscard]] std::string scramble_native_password(std::string_view password,
                                                   std::string_view scramble);
