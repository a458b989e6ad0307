#pragma once

// ---------------------------------------------------------------------------
// handshake_detail.hpp  —  테스트 전용 내부 인터페이스
//
// handshake.cpp 내부 detail namespace 의 순수 함수를 노출한다.
// 소켓/Transport 와 무관하며 단위 테스트에서 직접 검증한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "net/ssl_mode.hpp"

#include <cstdint>
#include <expected>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace detail {

// utf8mb4_general_ci
inline constexpr std::uint8_t  kDefaultCharset     = 45;
inline constexpr std::uint32_t kClientMaxPacketSize = 0x01000000U;

// 한 핸드셰이크에서 허용하는 AuthSwitchRequest 수 / auth 패킷 교환 수
inline constexpr int kMaxAuthSwitches   = 1;
inline constexpr int kMaxAuthRoundTrips = 8;

// ---------------------------------------------------------------------------
// AuthResponseType
//   인증 단계 서버 패킷의 첫 바이트 + payload 길이로 패킷 종류를 분류한다.
// ---------------------------------------------------------------------------
enum class AuthResponseType : std::uint8_t {
    kOk,           // 0x00 — 인증 완료
    kError,        // 0xFF — 인증 실패
    kEof,          // 0xFE + payload < 9 — 구형 auth switch (지원 안 함)
    kAuthSwitch,   // 0xFE + payload >= 9 — AuthSwitchRequest
    kAuthMoreData, // 0x01 — plugin 추가 데이터
    kUnknown,      // 그 외
};

// ---------------------------------------------------------------------------
// HandshakeState
//   클라이언트 핸드셰이크 상태.
//
//   kAwaitInitialHandshake → kCapabilitiesSent → (kTlsUpgrading)
//     → kAuthChallengeSent → (kAuthSwitching) → (kPublicKeyRequested)
//     → kAuthenticated | kAuthFailed
// ---------------------------------------------------------------------------
enum class HandshakeState : std::uint8_t {
    kAwaitInitialHandshake,
    kCapabilitiesSent,
    kTlsUpgrading,
    kAuthChallengeSent,
    kAuthSwitching,
    kPublicKeyRequested,
    kAuthenticated,
    kAuthFailed,
};

[[nodiscard]] auto handshake_state_name(HandshakeState state) noexcept -> std::string_view;

// ---------------------------------------------------------------------------
// HandshakeAction
//   인증 단계 서버 패킷을 받은 뒤 엔진이 해야 할 일.
// ---------------------------------------------------------------------------
enum class HandshakeAction : std::uint8_t {
    kComplete,      // OK — ServerInfo 반환
    kFail,          // ERR — kAuthentication 으로 종료
    kSwitchPlugin,  // AuthSwitchRequest — plugin / scramble 교체 후 응답
    kContinueAuth,  // AuthMoreData — 현재 plugin 의 continue_auth 호출
};

struct HandshakeTransition {
    HandshakeState  next_state{HandshakeState::kAuthFailed};
    HandshakeAction action{HandshakeAction::kFail};
};

// ---------------------------------------------------------------------------
// InitialHandshake (Protocol::HandshakeV10)
//   scramble 은 part1(8) + part2 를 이어 붙이고 끝의 NUL 을 제거한 값.
// ---------------------------------------------------------------------------
struct InitialHandshake {
    std::uint8_t  protocol_version{0};
    std::string   server_version{};
    std::uint32_t connection_id{0};
    Bytes         scramble{};
    std::uint32_t capabilities{0};
    std::uint8_t  charset{0};
    std::uint16_t status_flags{0};
    std::string   auth_plugin_name{};
};

// ---------------------------------------------------------------------------
// Negotiation
//   capabilities : 클라이언트 요청 ∩ 서버 광고
//   use_tls      : SSLRequest + TLS 업그레이드 수행 여부
//   tls_fallback : SSL 이 요청됐지만 서버가 광고하지 않아 평문으로 계속함
// ---------------------------------------------------------------------------
struct Negotiation {
    std::uint32_t capabilities{0};
    bool          use_tls{false};
    bool          tls_fallback{false};
};

struct AuthSwitchRequest {
    std::string plugin_name{};
    Bytes       scramble{};
};

// ---------------------------------------------------------------------------
// classify_auth_response
//   payload: 인증 단계 서버 패킷의 payload (헤더 4바이트 제외)
// ---------------------------------------------------------------------------
auto classify_auth_response(std::span<const std::uint8_t> payload) noexcept
    -> AuthResponseType;

// ---------------------------------------------------------------------------
// process_auth_packet
//   현재 상태 + 수신 패킷 → 다음 상태 + 액션.
//
//   auth_switches : 지금까지 처리한 AuthSwitchRequest 수
//   round_trips   : 지금까지 처리한 인증 단계 서버 패킷 수
//
//   실패 시:
//     인증 단계가 아닌 상태             → kFraming
//     두 번째 AuthSwitchRequest         → kAuthentication
//     round_trips >= kMaxAuthRoundTrips → kAuthentication
//     구형 auth switch (0xFE, < 9)       → kAuthentication
//     알 수 없는 패킷                   → kFraming
//
//   kPublicKeyRequested 상태에서는 0x01 헤더 없이 도착한 PEM 도 kContinueAuth.
// ---------------------------------------------------------------------------
auto process_auth_packet(HandshakeState                current_state,
                         std::span<const std::uint8_t> payload,
                         int                           auth_switches,
                         int                           round_trips)
    -> std::expected<HandshakeTransition, Error>;

// plugin 이 공개키를 요청했으면 kPublicKeyRequested, 아니면 current 를 유지한다.
// kPublicKeyRequested 에서 키로 응답한 뒤에는 kAuthChallengeSent 로 돌아간다.
[[nodiscard]] auto state_after_reply(HandshakeState current, bool public_key_requested) noexcept
    -> HandshakeState;

// ---------------------------------------------------------------------------
// parse_initial_handshake
//   실패 시: protocol version != 10, 잘린 payload → kFraming
// ---------------------------------------------------------------------------
auto parse_initial_handshake(std::span<const std::uint8_t> payload)
    -> std::expected<InitialHandshake, Error>;

// ---------------------------------------------------------------------------
// negotiate_capabilities
//   실패 시:
//     서버가 PROTOCOL_41 미지원                          → kCapabilityMismatch
//     SSL 요청 + 서버 미광고 + fallback 불가               → kCapabilityMismatch
// ---------------------------------------------------------------------------
auto negotiate_capabilities(std::uint32_t server_capabilities,
                            const SslMode& ssl,
                            bool           has_database)
    -> std::expected<Negotiation, Error>;

// SSLRequest: [4B caps][4B max packet][1B charset][23B zero] = 32바이트
[[nodiscard]] auto build_ssl_request(std::uint32_t capabilities, std::uint8_t charset) -> Bytes;

// ---------------------------------------------------------------------------
// build_handshake_response
//   Protocol::HandshakeResponse41
//   [SSLRequest 32B][user NUL][lenenc auth response][database NUL]?[plugin NUL]
// ---------------------------------------------------------------------------
[[nodiscard]] auto build_handshake_response(std::uint32_t                     capabilities,
                                            std::uint8_t                      charset,
                                            std::string_view                  user,
                                            std::span<const std::uint8_t>     auth_response,
                                            const std::optional<std::string>& database,
                                            std::string_view                  plugin_name) -> Bytes;

// ---------------------------------------------------------------------------
// build_change_user
//   [0x11][user NUL][1B auth 길이][auth response][database NUL][2B charset]
//   [plugin NUL]?  (CLIENT_PLUGIN_AUTH)
//   database 가 없으면 빈 문자열을 보낸다.
// ---------------------------------------------------------------------------
[[nodiscard]] auto build_change_user(std::uint32_t                     capabilities,
                                     std::uint8_t                      charset,
                                     std::string_view                  user,
                                     std::span<const std::uint8_t>     auth_response,
                                     const std::optional<std::string>& database,
                                     std::string_view                  plugin_name) -> Bytes;

// [0xFE][plugin name NUL][plugin data (끝 NUL 제거)]
auto parse_auth_switch_request(std::span<const std::uint8_t> payload)
    -> std::expected<AuthSwitchRequest, Error>;

}  // namespace detail
