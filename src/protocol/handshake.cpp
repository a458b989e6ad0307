#include "protocol/handshake.hpp"
#include "protocol/handshake_detail.hpp"

#include "auth/auth_plugin.hpp"
#include "protocol/capabilities.hpp"
#include "protocol/codec.hpp"
#include "protocol/command.hpp"
#include "protocol/response.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <memory>

// ---------------------------------------------------------------------------
// HandshakeEngine — 구현
//
// 상태 머신:
//   AwaitInitialHandshake → CapabilitiesSent
//     └─ SSL 협상됨 → TlsUpgrading → (TLS 위에서) HandshakeResponse41
//   AuthChallengeSent
//     └─ OK          → Authenticated
//     └─ ERR         → AuthFailed
//     └─ AuthSwitch  → AuthSwitching (새 plugin / scramble 로 재응답, 최대 1회)
//     └─ AuthMoreData→ plugin.continue_auth
//          └─ 공개키 요청 → PublicKeyRequested → PEM 수신 → RSA 응답
// ---------------------------------------------------------------------------

namespace {

constexpr std::uint8_t kProtocolVersion10 = 10;
constexpr std::uint8_t kAuthMoreDataHeader = 0x01;

// HandshakeV10 의 auth-plugin-data-part-1 길이 / part-2 최소 길이
constexpr std::size_t kScramblePart1Size    = 8;
constexpr std::size_t kScramblePart2MinSize = 13;

auto framing_error(std::string message, std::string context = {}) -> Error {
    return Error{ErrorCode::kFraming, std::move(message), std::move(context)};
}

void drop_trailing_nul(Bytes& data) {
    if (!data.empty() && data.back() == 0x00) {
        data.pop_back();
    }
}

void log_state(detail::HandshakeState state) {
    spdlog::debug("[handshake] state={}", detail::handshake_state_name(state));
}

// 인증 응답 루프에서 바뀌는 값들. 루프가 끝나면 plugin_name 이 최종 plugin 이다.
struct AuthSession {
    std::unique_ptr<AuthPlugin> plugin;
    std::string                 plugin_name;
    Bytes                       scramble;
    std::string_view            password;
    AuthContext                 context;
    detail::HandshakeState      state{detail::HandshakeState::kAuthChallengeSent};
};

auto run_auth_loop(PacketChannel& channel, AuthSession& session)
    -> boost::asio::awaitable<std::expected<OkPacket, Error>>;

}  // namespace

// ---------------------------------------------------------------------------
// detail namespace 구현 — 순수 함수 (소켓 무관)
// ---------------------------------------------------------------------------

namespace detail {

auto handshake_state_name(HandshakeState state) noexcept -> std::string_view {
    switch (state) {
        case HandshakeState::kAwaitInitialHandshake: return "await_initial_handshake";
        case HandshakeState::kCapabilitiesSent:      return "capabilities_sent";
        case HandshakeState::kTlsUpgrading:          return "tls_upgrading";
        case HandshakeState::kAuthChallengeSent:     return "auth_challenge_sent";
        case HandshakeState::kAuthSwitching:         return "auth_switching";
        case HandshakeState::kPublicKeyRequested:    return "public_key_requested";
        case HandshakeState::kAuthenticated:         return "authenticated";
        case HandshakeState::kAuthFailed:            return "auth_failed";
    }
    return "unknown";
}

// ---------------------------------------------------------------------------
// classify_auth_response
// ---------------------------------------------------------------------------
auto classify_auth_response(std::span<const std::uint8_t> payload) noexcept
    -> AuthResponseType
{
    if (payload.empty()) {
        return AuthResponseType::kUnknown;
    }

    switch (payload[0]) {
        case kOkHeader:
            return AuthResponseType::kOk;
        case kErrHeader:
            return AuthResponseType::kError;
        case kEofHeader:
            // payload < 9 → 구형 EOF, payload >= 9 → AuthSwitchRequest
            if (payload.size() < 9) {
                return AuthResponseType::kEof;
            }
            return AuthResponseType::kAuthSwitch;
        case kAuthMoreDataHeader:
            return AuthResponseType::kAuthMoreData;
        default:
            return AuthResponseType::kUnknown;
    }
}

// ---------------------------------------------------------------------------
// process_auth_packet
// ---------------------------------------------------------------------------
auto process_auth_packet(HandshakeState                current_state,
                         std::span<const std::uint8_t> payload,
                         int                           auth_switches,
                         int                           round_trips)
    -> std::expected<HandshakeTransition, Error>
{
    if (current_state != HandshakeState::kAuthChallengeSent &&
        current_state != HandshakeState::kAuthSwitching &&
        current_state != HandshakeState::kPublicKeyRequested)
    {
        return std::unexpected(framing_error(
            "authentication packet received outside the authentication phase",
            fmt::format("state={}", handshake_state_name(current_state))));
    }

    if (round_trips >= kMaxAuthRoundTrips) {
        return std::unexpected(Error{
            ErrorCode::kAuthentication,
            "authentication exceeded max round trips",
            fmt::format("round_trips={}", round_trips)
        });
    }

    switch (classify_auth_response(payload)) {
        case AuthResponseType::kOk:
            return HandshakeTransition{HandshakeState::kAuthenticated, HandshakeAction::kComplete};

        case AuthResponseType::kError:
            return HandshakeTransition{HandshakeState::kAuthFailed, HandshakeAction::kFail};

        case AuthResponseType::kEof:
            return std::unexpected(Error{
                ErrorCode::kAuthentication,
                "old authentication method switch is not supported",
                fmt::format("state={}", handshake_state_name(current_state))
            });

        case AuthResponseType::kAuthSwitch:
            if (auth_switches >= kMaxAuthSwitches) {
                return std::unexpected(Error{
                    ErrorCode::kAuthentication,
                    "unexpected AuthSwitchRequest after auth switch",
                    fmt::format("auth_switches={}", auth_switches)
                });
            }
            return HandshakeTransition{HandshakeState::kAuthSwitching, HandshakeAction::kSwitchPlugin};

        case AuthResponseType::kAuthMoreData:
            return HandshakeTransition{current_state, HandshakeAction::kContinueAuth};

        case AuthResponseType::kUnknown:
            // 일부 서버는 요청받은 공개키를 0x01 헤더 없이 보낸다
            if (current_state == HandshakeState::kPublicKeyRequested &&
                !payload.empty() && payload[0] == static_cast<std::uint8_t>('-'))
            {
                return HandshakeTransition{current_state, HandshakeAction::kContinueAuth};
            }
            break;
    }

    return std::unexpected(framing_error(
        "unknown authentication response packet",
        fmt::format("state={}, payload[0]=0x{:02X}", handshake_state_name(current_state),
                    payload.empty() ? 0U : static_cast<unsigned>(payload[0]))));
}

auto state_after_reply(HandshakeState current, bool public_key_requested) noexcept -> HandshakeState {
    if (public_key_requested) {
        return HandshakeState::kPublicKeyRequested;
    }
    if (current == HandshakeState::kPublicKeyRequested) {
        return HandshakeState::kAuthChallengeSent;
    }
    return current;
}

// ---------------------------------------------------------------------------
// parse_initial_handshake
//
//   HandshakeV10:
//     [1B  protocol_version = 10]
//     [NUL server_version]
//     [4B  connection_id]
//     [8B  auth_plugin_data_part_1]
//     [1B  filler]
//     [2B  capability_flags_1]
//     [1B  charset] [2B status_flags] [2B capability_flags_2]
//     [1B  auth_plugin_data_len] [10B reserved]
//     [max(13, len - 8) auth_plugin_data_part_2]   (CLIENT_SECURE_CONNECTION)
//     [NUL auth_plugin_name]                      (CLIENT_PLUGIN_AUTH)
// ---------------------------------------------------------------------------
auto parse_initial_handshake(std::span<const std::uint8_t> payload)
    -> std::expected<InitialHandshake, Error>
{
    PacketReader     r(payload);
    InitialHandshake hs;

    auto version = r.read_u8();
    if (!version) {
        return std::unexpected(std::move(version.error()));
    }
    if (*version != kProtocolVersion10) {
        return std::unexpected(framing_error(
            "unsupported handshake protocol version",
            fmt::format("protocol_version={}", *version)));
    }
    hs.protocol_version = *version;

    auto server_version = r.read_null_terminated();
    if (!server_version) {
        return std::unexpected(std::move(server_version.error()));
    }
    auto connection_id = r.read_u32();
    if (!connection_id) {
        return std::unexpected(std::move(connection_id.error()));
    }
    hs.server_version = std::move(*server_version);
    hs.connection_id  = *connection_id;

    auto part1 = r.read_bytes(kScramblePart1Size);
    if (!part1) {
        return std::unexpected(std::move(part1.error()));
    }
    hs.scramble.assign(part1->begin(), part1->end());

    if (auto filler = r.skip(1); !filler) {
        return std::unexpected(std::move(filler.error()));
    }
    auto caps_low = r.read_u16();
    if (!caps_low) {
        return std::unexpected(std::move(caps_low.error()));
    }
    hs.capabilities = *caps_low;

    if (r.empty()) {
        return hs;
    }

    // charset(1) + status(2) + capability_flags_2(2) + auth_plugin_data_len(1)
    if (r.remaining() < 6) {
        return std::unexpected(framing_error(
            "initial handshake truncated", fmt::format("remaining={}", r.remaining())));
    }
    auto charset   = r.read_u8();
    auto status    = r.read_u16();
    auto caps_high = r.read_u16();
    auto auth_len  = r.read_u8();
    hs.charset       = *charset;
    hs.status_flags  = *status;
    hs.capabilities |= static_cast<std::uint32_t>(*caps_high) << 16U;

    if (auto reserved = r.skip(10); !reserved) {
        return std::unexpected(std::move(reserved.error()));
    }

    if (capability::has(hs.capabilities, capability::kSecureConnection)) {
        std::size_t part2_len = kScramblePart2MinSize;
        if (*auth_len > kScramblePart1Size) {
            part2_len = std::max<std::size_t>(kScramblePart2MinSize, *auth_len - kScramblePart1Size);
        }
        part2_len = std::min(part2_len, r.remaining());
        auto part2 = r.read_bytes(part2_len);
        if (!part2) {
            return std::unexpected(std::move(part2.error()));
        }
        hs.scramble.insert(hs.scramble.end(), part2->begin(), part2->end());
        drop_trailing_nul(hs.scramble);
    }

    if (capability::has(hs.capabilities, capability::kPluginAuth) && !r.empty()) {
        // 일부 서버는 plugin 이름 끝 NUL 을 생략한다
        auto plugin = r.read_null_terminated();
        hs.auth_plugin_name = plugin ? std::move(*plugin) : r.read_rest_string();
    }

    return hs;
}

// ---------------------------------------------------------------------------
// negotiate_capabilities
// ---------------------------------------------------------------------------
auto negotiate_capabilities(std::uint32_t server_capabilities,
                            const SslMode& ssl,
                            bool           has_database)
    -> std::expected<Negotiation, Error>
{
    if (!capability::has(server_capabilities, capability::kProtocol41)) {
        return std::unexpected(Error{
            ErrorCode::kCapabilityMismatch,
            "server does not support protocol 4.1",
            fmt::format("server_capabilities=0x{:08X}", server_capabilities)
        });
    }

    std::uint32_t desired = capability::kClientBase;
    if (has_database) {
        desired |= capability::kConnectWithDb;
    }

    Negotiation result;
    if (ssl.enabled()) {
        if (capability::has(server_capabilities, capability::kSsl)) {
            desired |= capability::kSsl;
            result.use_tls = true;
        } else if (ssl.fallback_ok()) {
            result.tls_fallback = true;
        } else {
            return std::unexpected(Error{
                ErrorCode::kCapabilityMismatch,
                "SSL connection required but the server does not support SSL",
                fmt::format("ssl_mode={}", ssl_mode_name(ssl.kind()))
            });
        }
    }

    result.capabilities = desired & server_capabilities;
    return result;
}

auto build_ssl_request(std::uint32_t capabilities, std::uint8_t charset) -> Bytes {
    PacketWriter w(32);
    w.write_u32(capabilities);
    w.write_u32(kClientMaxPacketSize);
    w.write_u8(charset);
    w.write_zeros(23);
    return w.release();
}

auto build_handshake_response(std::uint32_t                     capabilities,
                              std::uint8_t                      charset,
                              std::string_view                  user,
                              std::span<const std::uint8_t>     auth_response,
                              const std::optional<std::string>& database,
                              std::string_view                  plugin_name) -> Bytes
{
    PacketWriter w(64 + user.size() + auth_response.size());
    w.write_u32(capabilities);
    w.write_u32(kClientMaxPacketSize);
    w.write_u8(charset);
    w.write_zeros(23);
    w.write_null_terminated(user);

    if (capability::has(capabilities, capability::kPluginAuthLenencClientData)) {
        w.write_lenenc_bytes(auth_response);
    } else if (capability::has(capabilities, capability::kSecureConnection)) {
        w.write_u8(static_cast<std::uint8_t>(std::min<std::size_t>(auth_response.size(), 0xFF)));
        w.write_bytes(auth_response.first(std::min<std::size_t>(auth_response.size(), 0xFF)));
    } else {
        w.write_bytes(auth_response);
        w.write_u8(0x00);
    }

    if (capability::has(capabilities, capability::kConnectWithDb) && database) {
        w.write_null_terminated(*database);
    }
    if (capability::has(capabilities, capability::kPluginAuth)) {
        w.write_null_terminated(plugin_name);
    }
    return w.release();
}

auto build_change_user(std::uint32_t                     capabilities,
                       std::uint8_t                      charset,
                       std::string_view                  user,
                       std::span<const std::uint8_t>     auth_response,
                       const std::optional<std::string>& database,
                       std::string_view                  plugin_name) -> Bytes
{
    PacketWriter w(16 + user.size() + auth_response.size());
    w.write_u8(static_cast<std::uint8_t>(CommandType::kComChangeUser));
    w.write_null_terminated(user);

    if (capability::has(capabilities, capability::kSecureConnection)) {
        const auto len = std::min<std::size_t>(auth_response.size(), 0xFF);
        w.write_u8(static_cast<std::uint8_t>(len));
        w.write_bytes(auth_response.first(len));
    } else {
        w.write_bytes(auth_response);
        w.write_u8(0x00);
    }

    w.write_null_terminated(database ? std::string_view(*database) : std::string_view{});
    w.write_u16(charset);
    if (capability::has(capabilities, capability::kPluginAuth)) {
        w.write_null_terminated(plugin_name);
    }
    return w.release();
}

auto parse_auth_switch_request(std::span<const std::uint8_t> payload)
    -> std::expected<AuthSwitchRequest, Error>
{
    PacketReader r(payload);
    auto header = r.read_u8();
    if (!header) {
        return std::unexpected(std::move(header.error()));
    }
    if (*header != kEofHeader) {
        return std::unexpected(framing_error(
            "not an AuthSwitchRequest", fmt::format("header=0x{:02X}", *header)));
    }

    auto plugin = r.read_null_terminated();
    if (!plugin) {
        return std::unexpected(std::move(plugin.error()));
    }

    AuthSwitchRequest req;
    req.plugin_name = std::move(*plugin);
    const auto data = r.read_rest();
    req.scramble.assign(data.begin(), data.end());
    drop_trailing_nul(req.scramble);
    return req;
}

}  // namespace detail

// ===========================================================================
// HandshakeEngine::perform — I/O 껍질
//
// 상태 판단은 detail 순수 함수에 위임하고, 이 함수는 channel read/write 와
// plugin 호출만 담당한다.
// ===========================================================================

// static
auto HandshakeEngine::perform(PacketChannel& channel, const HandshakeOptions& options)
    -> boost::asio::awaitable<std::expected<ServerInfo, Error>>
{
    using detail::HandshakeState;

    HandshakeState state = HandshakeState::kAwaitInitialHandshake;
    channel.reset_sequence();

    // -----------------------------------------------------------------------
    // 1. Initial Handshake
    // -----------------------------------------------------------------------
    auto greeting_payload = co_await channel.read_payload();
    if (!greeting_payload) {
        co_return std::unexpected(std::move(greeting_payload.error()));
    }
    if (!greeting_payload->empty() && (*greeting_payload)[0] == kErrHeader) {
        // max_connections 초과 등: 핸드셰이크 전에 서버가 거부
        co_return std::unexpected(error_from_payload(*greeting_payload, ErrorCode::kAuthentication));
    }

    auto greeting = detail::parse_initial_handshake(*greeting_payload);
    if (!greeting) {
        co_return std::unexpected(std::move(greeting.error()));
    }

    // -----------------------------------------------------------------------
    // 2. capability 협상 + (선택) TLS 업그레이드
    // -----------------------------------------------------------------------
    auto negotiation = detail::negotiate_capabilities(
        greeting->capabilities, options.ssl, options.database.has_value());
    if (!negotiation) {
        co_return std::unexpected(std::move(negotiation.error()));
    }
    if (negotiation->tls_fallback) {
        spdlog::warn("[handshake] server {} does not support SSL, continuing without TLS",
                     options.host);
    }

    const std::uint32_t caps = negotiation->capabilities;
    state = HandshakeState::kCapabilitiesSent;

    if (negotiation->use_tls) {
        const auto ssl_request = detail::build_ssl_request(caps, detail::kDefaultCharset);
        if (auto written = co_await channel.write_payload(ssl_request); !written) {
            co_return std::unexpected(std::move(written.error()));
        }
        log_state(state);

        state = HandshakeState::kTlsUpgrading;
        log_state(state);
        auto upgraded = co_await channel.transport().upgrade_to_tls(options.ssl, options.host);
        if (!upgraded) {
            co_return std::unexpected(std::move(upgraded.error()));
        }
    }

    // -----------------------------------------------------------------------
    // 3. HandshakeResponse41
    // -----------------------------------------------------------------------
    const std::string greeting_plugin = greeting->auth_plugin_name.empty()
                                            ? std::string(kNativePasswordPlugin)
                                            : greeting->auth_plugin_name;

    AuthSession session;
    session.plugin_name = greeting_plugin;
    session.scramble    = greeting->scramble;
    session.password    = options.password ? std::string_view(*options.password) : std::string_view{};
    session.context     = AuthContext{channel.transport().is_secure(), options.allow_public_key_retrieval};

    auto plugin = make_auth_plugin(session.plugin_name);
    if (!plugin) {
        co_return std::unexpected(std::move(plugin.error()));
    }
    session.plugin = std::move(*plugin);

    auto initial = session.plugin->initial_response(session.password, session.scramble, session.context);
    if (!initial) {
        co_return std::unexpected(std::move(initial.error()));
    }

    const auto response = detail::build_handshake_response(
        caps, detail::kDefaultCharset, options.user, initial->payload, options.database,
        session.plugin_name);
    if (auto written = co_await channel.write_payload(response); !written) {
        co_return std::unexpected(std::move(written.error()));
    }
    session.state = detail::state_after_reply(HandshakeState::kAuthChallengeSent,
                                              initial->public_key_requested);
    log_state(session.state);

    // -----------------------------------------------------------------------
    // 4. 인증 응답 루프
    // -----------------------------------------------------------------------
    auto ok = co_await run_auth_loop(channel, session);
    if (!ok) {
        co_return std::unexpected(std::move(ok.error()));
    }

    ServerInfo info;
    info.protocol_version = greeting->protocol_version;
    info.server_version   = std::move(greeting->server_version);
    info.connection_id    = greeting->connection_id;
    info.capabilities     = caps;
    info.status_flags     = ok->status_flags;
    info.charset          = greeting->charset;
    info.auth_plugin      = std::move(session.plugin_name);
    info.tls              = channel.transport().is_secure();
    info.greeting_plugin  = greeting_plugin;
    info.scramble         = std::move(greeting->scramble);

    spdlog::debug("[handshake] authenticated: server={} connection_id={} plugin={} tls={}",
                  info.server_version, info.connection_id, info.auth_plugin, info.tls);
    co_return info;
}

// ---------------------------------------------------------------------------
// change_user
//   COM_CHANGE_USER 의 auth 데이터는 greeting 의 plugin / scramble 로 만든다.
//   이후 응답은 핸드셰이크와 같은 인증 루프로 처리한다.
// ---------------------------------------------------------------------------
// static
auto HandshakeEngine::change_user(PacketChannel&          channel,
                                  const ServerInfo&       server,
                                  const HandshakeOptions& options)
    -> boost::asio::awaitable<std::expected<ServerInfo, Error>>
{
    AuthSession session;
    session.plugin_name = server.greeting_plugin.empty() ? std::string(kNativePasswordPlugin)
                                                         : server.greeting_plugin;
    session.scramble    = server.scramble;
    session.password    = options.password ? std::string_view(*options.password) : std::string_view{};
    session.context     = AuthContext{channel.transport().is_secure(), options.allow_public_key_retrieval};

    auto plugin = make_auth_plugin(session.plugin_name);
    if (!plugin) {
        co_return std::unexpected(std::move(plugin.error()));
    }
    session.plugin = std::move(*plugin);

    auto initial = session.plugin->initial_response(session.password, session.scramble, session.context);
    if (!initial) {
        co_return std::unexpected(std::move(initial.error()));
    }

    const auto request = detail::build_change_user(server.capabilities, detail::kDefaultCharset,
                                                   options.user, initial->payload, options.database,
                                                   session.plugin_name);
    channel.reset_sequence();
    if (auto written = co_await channel.write_payload(request); !written) {
        co_return std::unexpected(std::move(written.error()));
    }
    session.state = detail::state_after_reply(detail::HandshakeState::kAuthChallengeSent,
                                              initial->public_key_requested);
    log_state(session.state);

    auto ok = co_await run_auth_loop(channel, session);
    if (!ok) {
        co_return std::unexpected(std::move(ok.error()));
    }

    ServerInfo info    = server;
    info.status_flags  = ok->status_flags;
    info.auth_plugin   = std::move(session.plugin_name);
    spdlog::debug("[handshake] changed user to {} (plugin={})", options.user, info.auth_plugin);
    co_return info;
}

namespace {

// ---------------------------------------------------------------------------
// run_auth_loop
//   OK 를 받을 때까지 서버 인증 패킷을 처리한다.
//   ERR → kAuthentication, 나머지 실패는 process_auth_packet 의 분류를 따른다.
// ---------------------------------------------------------------------------
auto run_auth_loop(PacketChannel& channel, AuthSession& session)
    -> boost::asio::awaitable<std::expected<OkPacket, Error>>
{
    using detail::HandshakeAction;

    int auth_switches = 0;
    int round_trips   = 0;

    while (true) {
        auto payload = co_await channel.read_payload();
        if (!payload) {
            co_return std::unexpected(std::move(payload.error()));
        }

        auto transition = detail::process_auth_packet(session.state, *payload, auth_switches, round_trips);
        if (!transition) {
            co_return std::unexpected(std::move(transition.error()));
        }
        ++round_trips;

        switch (transition->action) {
            case HandshakeAction::kComplete: {
                auto ok = parse_ok_packet(*payload);
                if (!ok) {
                    co_return std::unexpected(std::move(ok.error()));
                }
                session.state = transition->next_state;
                log_state(session.state);
                co_return std::move(*ok);
            }

            case HandshakeAction::kFail:
                session.state = transition->next_state;
                log_state(session.state);
                co_return std::unexpected(error_from_payload(*payload, ErrorCode::kAuthentication));

            case HandshakeAction::kSwitchPlugin: {
                auto request = detail::parse_auth_switch_request(*payload);
                if (!request) {
                    co_return std::unexpected(std::move(request.error()));
                }
                auto next_plugin = make_auth_plugin(request->plugin_name);
                if (!next_plugin) {
                    co_return std::unexpected(std::move(next_plugin.error()));
                }

                // 이전 plugin 상태는 버리고 새 plugin / scramble 로 재시작한다
                session.plugin      = std::move(*next_plugin);
                session.plugin_name = std::move(request->plugin_name);
                session.scramble    = std::move(request->scramble);
                ++auth_switches;
                spdlog::debug("[handshake] auth switch to {}", session.plugin_name);

                auto reply = session.plugin->initial_response(session.password, session.scramble,
                                                              session.context);
                if (!reply) {
                    co_return std::unexpected(std::move(reply.error()));
                }
                if (auto written = co_await channel.write_payload(reply->payload); !written) {
                    co_return std::unexpected(std::move(written.error()));
                }
                session.state = detail::state_after_reply(transition->next_state,
                                                          reply->public_key_requested);
                log_state(session.state);
                break;
            }

            case HandshakeAction::kContinueAuth: {
                std::span<const std::uint8_t> more_data{*payload};
                if (!more_data.empty() && more_data[0] == kAuthMoreDataHeader) {
                    more_data = more_data.subspan(1);
                }

                auto reply = session.plugin->continue_auth(more_data, session.password,
                                                           session.scramble, session.context);
                if (!reply) {
                    co_return std::unexpected(std::move(reply.error()));
                }
                if (reply->step == AuthStep::kSend) {
                    if (auto written = co_await channel.write_payload(reply->payload); !written) {
                        co_return std::unexpected(std::move(written.error()));
                    }
                }
                session.state = detail::state_after_reply(transition->next_state,
                                                          reply->public_key_requested);
                log_state(session.state);
                break;
            }
        }
    }
}

}  // namespace
