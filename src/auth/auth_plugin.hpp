#pragma once

#include "common/types.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <span>
#include <string_view>

// ---------------------------------------------------------------------------
// AuthContext
//   plugin 이 응답을 만들 때 참조하는 연결 상태.
//
//   secure_channel             : TLS 업그레이드 완료 여부
//   allow_public_key_retrieval : 평문 채널에서 서버 RSA 공개키 요청 허용 여부
// ---------------------------------------------------------------------------
struct AuthContext {
    bool secure_channel{false};
    bool allow_public_key_retrieval{false};
};

// ---------------------------------------------------------------------------
// AuthReply
//   plugin 이 다음에 해야 할 일.
//
//   kSend        : payload 를 서버로 보낸다.
//   kAwaitServer : 보낼 것 없이 서버의 다음 패킷을 기다린다 (fast auth 등).
//
//   public_key_requested 가 true 이면 payload 는 공개키 요청 바이트이다.
// ---------------------------------------------------------------------------
enum class AuthStep : std::uint8_t {
    kSend,
    kAwaitServer,
};

struct AuthReply {
    AuthStep step{AuthStep::kSend};
    Bytes    payload{};
    bool     public_key_requested{false};
};

// ---------------------------------------------------------------------------
// AuthPlugin
//   서버가 지정한 인증 알고리즘 하나를 구현한다.
//   plugin 선택은 서버 handshake / auth switch 의 plugin 이름으로 결정된다.
//
//   initial_response : HandshakeResponse41 또는 AuthSwitchResponse 에 실을 데이터
//   continue_auth    : AuthMoreData(0x01) payload(헤더 제외)를 받았을 때의 다음 단계
// ---------------------------------------------------------------------------
class AuthPlugin {
public:
    virtual ~AuthPlugin() = default;

    [[nodiscard]] virtual auto name() const noexcept -> std::string_view = 0;

    [[nodiscard]] virtual auto initial_response(std::string_view              password,
                                                std::span<const std::uint8_t> scramble,
                                                const AuthContext&            ctx) const
        -> std::expected<AuthReply, Error> = 0;

    [[nodiscard]] virtual auto continue_auth(std::span<const std::uint8_t> more_data,
                                             std::string_view              password,
                                             std::span<const std::uint8_t> scramble,
                                             const AuthContext&            ctx) const
        -> std::expected<AuthReply, Error>;
};

inline constexpr std::string_view kNativePasswordPlugin      = "mysql_native_password";
inline constexpr std::string_view kCachingSha2PasswordPlugin = "caching_sha2_password";
inline constexpr std::string_view kSha256PasswordPlugin      = "sha256_password";

// ---------------------------------------------------------------------------
// make_auth_plugin
//   plugin 이름으로 구현을 찾는다.
//   실패 시: kAuthentication "Unknown authentication plugin: <name>"
// ---------------------------------------------------------------------------
[[nodiscard]] auto make_auth_plugin(std::string_view name)
    -> std::expected<std::unique_ptr<AuthPlugin>, Error>;

// ---------------------------------------------------------------------------
// 해시/암호화 primitive (테스트에서 직접 검증)
// ---------------------------------------------------------------------------

// SHA1(pw) XOR SHA1(scramble + SHA1(SHA1(pw))). 빈 비밀번호는 빈 응답.
[[nodiscard]] auto scramble_native_password(std::string_view              password,
                                            std::span<const std::uint8_t> scramble)
    -> std::expected<Bytes, Error>;

// SHA256(pw) XOR SHA256(SHA256(SHA256(pw)) + scramble). 빈 비밀번호는 빈 응답.
[[nodiscard]] auto scramble_caching_sha2(std::string_view              password,
                                         std::span<const std::uint8_t> scramble)
    -> std::expected<Bytes, Error>;

// (pw + NUL) XOR scramble 을 PEM 공개키로 RSA-OAEP 암호화한다.
[[nodiscard]] auto rsa_encrypt_password(std::string_view              password,
                                        std::span<const std::uint8_t> scramble,
                                        std::span<const std::uint8_t> pem_public_key)
    -> std::expected<Bytes, Error>;
