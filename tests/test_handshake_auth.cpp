// ---------------------------------------------------------------------------
// test_handshake_auth.cpp
//
// 핸드셰이크 순수 함수 단위 테스트
//
// 검증 대상:
//   classify_auth_response    — auth 응답 분류
//   process_auth_packet       — 상태 머신 전이
//   state_after_reply         — 공개키 요청 전이
//   parse_initial_handshake   — HandshakeV10 파싱
//   negotiate_capabilities    — capability / SSL 협상
//   build_ssl_request / build_handshake_response / parse_auth_switch_request
// ---------------------------------------------------------------------------

#include "protocol/handshake_detail.hpp"

#include "protocol/capabilities.hpp"
#include "scripted_transport.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <vector>

using detail::AuthResponseType;
using detail::HandshakeAction;
using detail::HandshakeState;

// ===========================================================================
// classify_auth_response
// ===========================================================================

// ---------------------------------------------------------------------------
// CA-1. 0x00 → kOk (핸드셰이크 완료)
// ---------------------------------------------------------------------------
TEST(ClassifyAuthResponse, X00_IsOk) {
    const std::vector<std::uint8_t> payload = {0x00, 0x00, 0x00};
    const auto result = detail::classify_auth_response(
        std::span<const std::uint8_t>{payload}
    );
    EXPECT_EQ(result, AuthResponseType::kOk);
}

// ---------------------------------------------------------------------------
// CA-2. 0xFF → kError (인증 실패)
// ---------------------------------------------------------------------------
TEST(ClassifyAuthResponse, XFF_IsError) {
    const std::vector<std::uint8_t> payload = {0xFF, 0x15, 0x04};
    const auto result = detail::classify_auth_response(
        std::span<const std::uint8_t>{payload}
    );
    EXPECT_EQ(result, AuthResponseType::kError);
}

// ---------------------------------------------------------------------------
// CA-3. 0xFE + payload 8바이트 → kEof (payload < 9)
// ---------------------------------------------------------------------------
TEST(ClassifyAuthResponse, XFE_8bytes_IsEof) {
    std::vector<std::uint8_t> payload = {
        0xFE, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07
    };
    ASSERT_EQ(payload.size(), 8U);
    const auto result = detail::classify_auth_response(
        std::span<const std::uint8_t>{payload}
    );
    EXPECT_EQ(result, AuthResponseType::kEof);
}

// ---------------------------------------------------------------------------
// CA-4. 0xFE + payload 9바이트 → kAuthSwitch (payload >= 9)
// ---------------------------------------------------------------------------
TEST(ClassifyAuthResponse, XFE_9bytes_IsAuthSwitch) {
    std::vector<std::uint8_t> payload = {
        0xFE, 0x01, 0x02, 0x03, 0x04, 0x05, 0x06, 0x07, 0x08
    };
    ASSERT_EQ(payload.size(), 9U);
    const auto result = detail::classify_auth_response(
        std::span<const std::uint8_t>{payload}
    );
    EXPECT_EQ(result, AuthResponseType::kAuthSwitch);
}

// ---------------------------------------------------------------------------
// CA-5. 0x01 → kAuthMoreData (caching_sha2_password 등)
// ---------------------------------------------------------------------------
TEST(ClassifyAuthResponse, X01_IsAuthMoreData) {
    const std::vector<std::uint8_t> payload = {0x01, 0x03};
    const auto result = detail::classify_auth_response(
        std::span<const std::uint8_t>{payload}
    );
    EXPECT_EQ(result, AuthResponseType::kAuthMoreData);
}

// ---------------------------------------------------------------------------
// CA-6. 빈 payload / 알 수 없는 헤더 → kUnknown
// ---------------------------------------------------------------------------
TEST(ClassifyAuthResponse, EmptyOrUnknown_IsUnknown) {
    const std::vector<std::uint8_t> empty;
    EXPECT_EQ(detail::classify_auth_response(std::span<const std::uint8_t>{empty}),
              AuthResponseType::kUnknown);

    const std::vector<std::uint8_t> payload = {0x42, 0x00};
    EXPECT_EQ(detail::classify_auth_response(std::span<const std::uint8_t>{payload}),
              AuthResponseType::kUnknown);
}

// ===========================================================================
// process_auth_packet
// ===========================================================================

// ---------------------------------------------------------------------------
// PA-1. OK → kAuthenticated / kComplete
// ---------------------------------------------------------------------------
TEST(ProcessAuthPacket, Ok_Completes) {
    const auto payload = scripted::ok();
    auto t = detail::process_auth_packet(HandshakeState::kAuthChallengeSent, payload, 0, 0);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->next_state, HandshakeState::kAuthenticated);
    EXPECT_EQ(t->action, HandshakeAction::kComplete);
}

// ---------------------------------------------------------------------------
// PA-2. ERR → kAuthFailed / kFail
// ---------------------------------------------------------------------------
TEST(ProcessAuthPacket, Err_Fails) {
    const auto payload = scripted::err(1045, "28000", "Access denied");
    auto t = detail::process_auth_packet(HandshakeState::kAuthChallengeSent, payload, 0, 0);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->next_state, HandshakeState::kAuthFailed);
    EXPECT_EQ(t->action, HandshakeAction::kFail);
}

// ---------------------------------------------------------------------------
// PA-3. 첫 AuthSwitchRequest → kAuthSwitching / kSwitchPlugin
// ---------------------------------------------------------------------------
TEST(ProcessAuthPacket, FirstAuthSwitch_Switches) {
    const std::vector<std::uint8_t> payload(20, 0xFE);
    auto t = detail::process_auth_packet(HandshakeState::kAuthChallengeSent, payload, 0, 1);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->next_state, HandshakeState::kAuthSwitching);
    EXPECT_EQ(t->action, HandshakeAction::kSwitchPlugin);
}

// ---------------------------------------------------------------------------
// PA-4. 두 번째 AuthSwitchRequest → kAuthentication
// ---------------------------------------------------------------------------
TEST(ProcessAuthPacket, SecondAuthSwitch_IsError) {
    const std::vector<std::uint8_t> payload(20, 0xFE);
    auto t = detail::process_auth_packet(HandshakeState::kAuthSwitching, payload,
                                         detail::kMaxAuthSwitches, 1);
    ASSERT_FALSE(t.has_value());
    EXPECT_EQ(t.error().code, ErrorCode::kAuthentication);
    EXPECT_EQ(t.error().message, "unexpected AuthSwitchRequest after auth switch");
}

// ---------------------------------------------------------------------------
// PA-5. AuthMoreData → 상태 유지 / kContinueAuth
// ---------------------------------------------------------------------------
TEST(ProcessAuthPacket, MoreData_Continues) {
    const std::vector<std::uint8_t> payload = {0x01, 0x04};
    auto t = detail::process_auth_packet(HandshakeState::kAuthSwitching, payload, 1, 2);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->next_state, HandshakeState::kAuthSwitching);
    EXPECT_EQ(t->action, HandshakeAction::kContinueAuth);
}

// ---------------------------------------------------------------------------
// PA-6. 공개키 요청 후 0x01 없이 도착한 PEM → kContinueAuth
// ---------------------------------------------------------------------------
TEST(ProcessAuthPacket, BarePemAfterKeyRequest_Continues) {
    const std::string pem = "-----BEGIN PUBLIC KEY-----";
    const std::vector<std::uint8_t> payload(pem.begin(), pem.end());

    auto t = detail::process_auth_packet(HandshakeState::kPublicKeyRequested, payload, 0, 2);
    ASSERT_TRUE(t.has_value());
    EXPECT_EQ(t->action, HandshakeAction::kContinueAuth);

    // 공개키를 요청하지 않은 상태에서는 알 수 없는 패킷
    auto u = detail::process_auth_packet(HandshakeState::kAuthChallengeSent, payload, 0, 2);
    ASSERT_FALSE(u.has_value());
    EXPECT_EQ(u.error().code, ErrorCode::kFraming);
}

// ---------------------------------------------------------------------------
// PA-7. 구형 EOF auth switch → kAuthentication
// ---------------------------------------------------------------------------
TEST(ProcessAuthPacket, OldEofSwitch_IsAuthenticationError) {
    const std::vector<std::uint8_t> payload = {0xFE};
    auto t = detail::process_auth_packet(HandshakeState::kAuthChallengeSent, payload, 0, 0);
    ASSERT_FALSE(t.has_value());
    EXPECT_EQ(t.error().code, ErrorCode::kAuthentication);
}

// ---------------------------------------------------------------------------
// PA-8. 라운드트립 상한 초과 → kAuthentication
// ---------------------------------------------------------------------------
TEST(ProcessAuthPacket, RoundTripLimit) {
    const std::vector<std::uint8_t> payload = {0x01, 0x03};
    auto t = detail::process_auth_packet(HandshakeState::kAuthChallengeSent, payload, 0,
                                         detail::kMaxAuthRoundTrips);
    ASSERT_FALSE(t.has_value());
    EXPECT_EQ(t.error().code, ErrorCode::kAuthentication);
}

// ---------------------------------------------------------------------------
// PA-9. 인증 단계가 아닌 상태 → kFraming
// ---------------------------------------------------------------------------
TEST(ProcessAuthPacket, OutsideAuthPhase_IsFraming) {
    const auto payload = scripted::ok();
    for (auto state : {HandshakeState::kAwaitInitialHandshake, HandshakeState::kCapabilitiesSent,
                       HandshakeState::kAuthenticated, HandshakeState::kAuthFailed}) {
        auto t = detail::process_auth_packet(state, payload, 0, 0);
        ASSERT_FALSE(t.has_value()) << detail::handshake_state_name(state);
        EXPECT_EQ(t.error().code, ErrorCode::kFraming);
    }
}

// ---------------------------------------------------------------------------
// PA-10. state_after_reply
// ---------------------------------------------------------------------------
TEST(ProcessAuthPacket, StateAfterReply) {
    EXPECT_EQ(detail::state_after_reply(HandshakeState::kAuthChallengeSent, true),
              HandshakeState::kPublicKeyRequested);
    EXPECT_EQ(detail::state_after_reply(HandshakeState::kPublicKeyRequested, false),
              HandshakeState::kAuthChallengeSent);
    EXPECT_EQ(detail::state_after_reply(HandshakeState::kAuthSwitching, false),
              HandshakeState::kAuthSwitching);
}

// ===========================================================================
// parse_initial_handshake
// ===========================================================================

// ---------------------------------------------------------------------------
// IH-1. 정상 HandshakeV10
// ---------------------------------------------------------------------------
TEST(ParseInitialHandshake, AllFields) {
    const auto payload = scripted::greeting(scripted::kServerCaps, "caching_sha2_password",
                                            scripted::test_scramble(), 1234);
    auto hs = detail::parse_initial_handshake(payload);
    ASSERT_TRUE(hs.has_value()) << hs.error().message;
    EXPECT_EQ(hs->protocol_version, 10);
    EXPECT_EQ(hs->server_version, "8.0.34-test");
    EXPECT_EQ(hs->connection_id, 1234U);
    EXPECT_EQ(hs->scramble, scripted::test_scramble());
    EXPECT_EQ(hs->capabilities, scripted::kServerCaps);
    EXPECT_EQ(hs->charset, 45);
    EXPECT_EQ(hs->status_flags, scripted::kStatusAutocommit);
    EXPECT_EQ(hs->auth_plugin_name, "caching_sha2_password");
}

// ---------------------------------------------------------------------------
// IH-2. protocol version != 10 → kFraming
// ---------------------------------------------------------------------------
TEST(ParseInitialHandshake, WrongProtocolVersion) {
    auto payload = scripted::greeting();
    payload[0] = 9;
    auto hs = detail::parse_initial_handshake(payload);
    ASSERT_FALSE(hs.has_value());
    EXPECT_EQ(hs.error().code, ErrorCode::kFraming);
}

// ---------------------------------------------------------------------------
// IH-3. 잘린 payload → kFraming
// ---------------------------------------------------------------------------
TEST(ParseInitialHandshake, Truncated) {
    auto payload = scripted::greeting();
    payload.resize(20);
    auto hs = detail::parse_initial_handshake(payload);
    ASSERT_FALSE(hs.has_value());
    EXPECT_EQ(hs.error().code, ErrorCode::kFraming);
}

// ===========================================================================
// negotiate_capabilities
// ===========================================================================

// ---------------------------------------------------------------------------
// NC-1. 결과는 클라이언트 요청 ∩ 서버 광고
// ---------------------------------------------------------------------------
TEST(NegotiateCapabilities, IntersectsWithServer) {
    const std::uint32_t server = capability::kProtocol41 | capability::kSecureConnection
                               | capability::kPluginAuth | capability::kCompress;
    auto n = detail::negotiate_capabilities(server, SslMode::disabled(), false);
    ASSERT_TRUE(n.has_value());
    EXPECT_EQ(n->capabilities,
              capability::kProtocol41 | capability::kSecureConnection | capability::kPluginAuth);
    EXPECT_FALSE(n->use_tls);
    EXPECT_FALSE(n->tls_fallback);
}

// ---------------------------------------------------------------------------
// NC-2. database 가 있을 때만 CONNECT_WITH_DB
// ---------------------------------------------------------------------------
TEST(NegotiateCapabilities, ConnectWithDbOnlyWithDatabase) {
    auto without_db = detail::negotiate_capabilities(scripted::kServerCaps, SslMode::disabled(), false);
    auto with_db    = detail::negotiate_capabilities(scripted::kServerCaps, SslMode::disabled(), true);
    ASSERT_TRUE(without_db.has_value());
    ASSERT_TRUE(with_db.has_value());
    EXPECT_FALSE(capability::has(without_db->capabilities, capability::kConnectWithDb));
    EXPECT_TRUE(capability::has(with_db->capabilities, capability::kConnectWithDb));
}

// ---------------------------------------------------------------------------
// NC-3. 서버가 PROTOCOL_41 미지원 → kCapabilityMismatch
// ---------------------------------------------------------------------------
TEST(NegotiateCapabilities, Protocol41Required) {
    auto n = detail::negotiate_capabilities(capability::kSecureConnection, SslMode::disabled(), false);
    ASSERT_FALSE(n.has_value());
    EXPECT_EQ(n.error().code, ErrorCode::kCapabilityMismatch);
    EXPECT_EQ(n.error().message, "server does not support protocol 4.1");
}

// ---------------------------------------------------------------------------
// NC-4. SSL 요청 + 서버 광고 → use_tls, SSL 비트 포함
// ---------------------------------------------------------------------------
TEST(NegotiateCapabilities, SslAdvertised) {
    auto n = detail::negotiate_capabilities(scripted::kServerCaps | capability::kSsl,
                                            SslMode::trusted(), false);
    ASSERT_TRUE(n.has_value());
    EXPECT_TRUE(n->use_tls);
    EXPECT_TRUE(capability::has(n->capabilities, capability::kSsl));
}

// ---------------------------------------------------------------------------
// NC-5. SSL 요청 + 서버 미광고: fallback 여부에 따라 분기
// ---------------------------------------------------------------------------
TEST(NegotiateCapabilities, SslNotAdvertised) {
    auto strict = detail::negotiate_capabilities(scripted::kServerCaps, SslMode::trusted(), false);
    ASSERT_FALSE(strict.has_value());
    EXPECT_EQ(strict.error().code, ErrorCode::kCapabilityMismatch);
    EXPECT_EQ(strict.error().message, "SSL connection required but the server does not support SSL");

    auto fallback = detail::negotiate_capabilities(scripted::kServerCaps,
                                                   SslMode::trusted().with_fallback(true), false);
    ASSERT_TRUE(fallback.has_value());
    EXPECT_FALSE(fallback->use_tls);
    EXPECT_TRUE(fallback->tls_fallback);
    EXPECT_FALSE(capability::has(fallback->capabilities, capability::kSsl));
}

// ===========================================================================
// 클라이언트 패킷 빌더
// ===========================================================================

// ---------------------------------------------------------------------------
// HR-1. SSLRequest 는 32바이트
// ---------------------------------------------------------------------------
TEST(BuildHandshakePackets, SslRequestLayout) {
    const auto req = detail::build_ssl_request(0x01020304U, detail::kDefaultCharset);
    ASSERT_EQ(req.size(), 32U);
    EXPECT_EQ(req[0], 0x04);
    EXPECT_EQ(req[3], 0x01);
    EXPECT_EQ(req[7], 0x01);  // max packet 0x01000000
    EXPECT_EQ(req[8], detail::kDefaultCharset);
    for (std::size_t i = 9; i < req.size(); ++i) {
        EXPECT_EQ(req[i], 0x00) << "index=" << i;
    }
}

// ---------------------------------------------------------------------------
// HR-2. HandshakeResponse41: user / lenenc auth / database / plugin
// ---------------------------------------------------------------------------
TEST(BuildHandshakePackets, HandshakeResponseFields) {
    const std::uint32_t caps  = capability::kClientBase | capability::kConnectWithDb;
    const Bytes         auth  = {0xAA, 0xBB, 0xCC};
    const auto          bytes = detail::build_handshake_response(
        caps, detail::kDefaultCharset, "root", auth, std::optional<std::string>{"shop"},
        "mysql_native_password");

    PacketReader r(bytes);
    EXPECT_EQ(*r.read_u32(), caps);
    EXPECT_EQ(*r.read_u32(), detail::kClientMaxPacketSize);
    EXPECT_EQ(*r.read_u8(), detail::kDefaultCharset);
    ASSERT_TRUE(r.skip(23).has_value());
    EXPECT_EQ(*r.read_null_terminated(), "root");
    auto auth_field = r.read_lenenc_bytes();
    ASSERT_TRUE(auth_field.has_value());
    EXPECT_EQ(Bytes(auth_field->begin(), auth_field->end()), auth);
    EXPECT_EQ(*r.read_null_terminated(), "shop");
    EXPECT_EQ(*r.read_null_terminated(), "mysql_native_password");
    EXPECT_TRUE(r.empty());
}

// ---------------------------------------------------------------------------
// HR-3. CONNECT_WITH_DB 가 없으면 database 를 싣지 않는다
// ---------------------------------------------------------------------------
TEST(BuildHandshakePackets, DatabaseOmittedWithoutCapability) {
    const auto bytes = detail::build_handshake_response(
        capability::kClientBase, detail::kDefaultCharset, "u", Bytes{},
        std::optional<std::string>{"shop"}, "caching_sha2_password");

    PacketReader r(bytes);
    ASSERT_TRUE(r.skip(32).has_value());
    EXPECT_EQ(*r.read_null_terminated(), "u");
    EXPECT_TRUE(r.read_lenenc_bytes()->empty());
    EXPECT_EQ(*r.read_null_terminated(), "caching_sha2_password");
    EXPECT_TRUE(r.empty());
}

// ---------------------------------------------------------------------------
// AS-1. AuthSwitchRequest 파싱 (끝 NUL 제거)
// ---------------------------------------------------------------------------
TEST(ParseAuthSwitchRequest, PluginAndScramble) {
    PacketWriter w;
    w.write_u8(0xFE);
    w.write_null_terminated("mysql_native_password");
    w.write_bytes(scripted::test_scramble('A'));
    w.write_u8(0x00);

    auto req = detail::parse_auth_switch_request(w.release());
    ASSERT_TRUE(req.has_value());
    EXPECT_EQ(req->plugin_name, "mysql_native_password");
    EXPECT_EQ(req->scramble, scripted::test_scramble('A'));
}

// ---------------------------------------------------------------------------
// AS-2. 0xFE 가 아닌 헤더 / plugin 이름 NUL 누락 → kFraming
// ---------------------------------------------------------------------------
TEST(ParseAuthSwitchRequest, Malformed) {
    const std::vector<std::uint8_t> wrong_header = {0x01, 'a', 0x00};
    auto a = detail::parse_auth_switch_request(wrong_header);
    ASSERT_FALSE(a.has_value());
    EXPECT_EQ(a.error().code, ErrorCode::kFraming);

    const std::vector<std::uint8_t> no_nul = {0xFE, 'a', 'b'};
    auto b = detail::parse_auth_switch_request(no_nul);
    ASSERT_FALSE(b.has_value());
    EXPECT_EQ(b.error().code, ErrorCode::kFraming);
}

// ---------------------------------------------------------------------------
// HR-4. COM_CHANGE_USER: user / 1B auth 길이 / database / charset / plugin
// ---------------------------------------------------------------------------
TEST(BuildHandshakePackets, ChangeUserFields) {
    const Bytes auth  = {0x11, 0x22};
    const auto  bytes = detail::build_change_user(
        capability::kClientBase, detail::kDefaultCharset, "bob", auth, std::nullopt,
        "mysql_native_password");

    PacketReader r(bytes);
    EXPECT_EQ(*r.read_u8(), 0x11);
    EXPECT_EQ(*r.read_null_terminated(), "bob");
    EXPECT_EQ(*r.read_u8(), 2);
    auto auth_field = r.read_bytes(2);
    ASSERT_TRUE(auth_field.has_value());
    EXPECT_EQ(Bytes(auth_field->begin(), auth_field->end()), auth);
    EXPECT_EQ(*r.read_null_terminated(), "");
    EXPECT_EQ(*r.read_u16(), detail::kDefaultCharset);
    EXPECT_EQ(*r.read_null_terminated(), "mysql_native_password");
    EXPECT_TRUE(r.empty());
}
