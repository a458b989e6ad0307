// ---------------------------------------------------------------------------
// test_handshake_engine.cpp
//
// HandshakeEngine 통합 테스트 (ScriptedTransport 사용)
//
// 검증 대상:
//   - 서버 패킷 순서 / sequence id 와 클라이언트가 쓴 패킷
//   - auth switch, caching_sha2 fast / full auth, 공개키 정책
//   - SSL 협상 (업그레이드, fallback, 실패)
//   - 서버 거부 (ERR greeting, ERR auth)
// ---------------------------------------------------------------------------

#include "auth/auth_plugin.hpp"
#include "client/connection.hpp"
#include "protocol/handshake_detail.hpp"

#include "scripted_transport.hpp"

#include <gtest/gtest.h>

#include <memory>
#include <optional>
#include <string>
#include <utility>

using scripted::ScriptState;

namespace {

auto make_state() -> std::shared_ptr<ScriptState> {
    return std::make_shared<ScriptState>();
}

auto auth_more_data(std::uint8_t status) -> Bytes {
    return Bytes{0x01, status};
}

auto auth_switch(std::string_view plugin, const Bytes& scramble) -> Bytes {
    PacketWriter w;
    w.write_u8(0xFE);
    w.write_null_terminated(plugin);
    w.write_bytes(scramble);
    w.write_u8(0x00);
    return w.release();
}

// HandshakeResponse41 에서 user 다음의 lenenc auth response 를 꺼낸다
auto auth_response_of(const Bytes& handshake_response) -> Bytes {
    PacketReader r(handshake_response);
    if (!r.skip(32) || !r.read_null_terminated()) {
        return {};
    }
    auto auth = r.read_lenenc_bytes();
    return auth ? Bytes(auth->begin(), auth->end()) : Bytes{};
}

}  // namespace

// ===========================================================================
// 정상 경로
// ===========================================================================

// ---------------------------------------------------------------------------
// HE-1. mysql_native_password: greeting(0) → response(1) → OK(2)
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, NativePasswordSucceeds) {
    auto state = make_state();
    scripted::push_handshake(*state);

    auto conn = scripted::open_connection(state, scripted::default_config());
    ASSERT_TRUE(conn.has_value()) << conn.error().message;

    const auto& info = (*conn)->server_info();
    EXPECT_EQ(info.protocol_version, 10);
    EXPECT_EQ(info.server_version, "8.0.34-test");
    EXPECT_EQ(info.connection_id, 42U);
    EXPECT_EQ(info.auth_plugin, "mysql_native_password");
    EXPECT_EQ(info.capabilities, capability::kClientBase);
    EXPECT_FALSE(info.tls);
    EXPECT_TRUE((*conn)->auto_commit());
    EXPECT_TRUE((*conn)->is_open());

    ASSERT_EQ(state->writes.size(), 1U);
    const auto response = scripted::written_payload(*state, 0, 1);
    ASSERT_FALSE(response.empty());

    PacketReader r(response);
    ASSERT_TRUE(r.skip(32).has_value());
    EXPECT_EQ(*r.read_null_terminated(), "root");
    EXPECT_EQ(auth_response_of(response),
              *scramble_native_password("secret", scripted::test_scramble()));
}

// ---------------------------------------------------------------------------
// HE-2. database 설정 시 CONNECT_WITH_DB + catalog()
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, DatabaseIsSentAndExposedAsCatalog) {
    auto state = make_state();
    scripted::push_handshake(*state);

    auto conn = scripted::open_connection(state, scripted::default_config().set_database("shop"));
    ASSERT_TRUE(conn.has_value()) << conn.error().message;

    EXPECT_TRUE(capability::has((*conn)->server_info().capabilities, capability::kConnectWithDb));
    EXPECT_EQ((*conn)->catalog(), std::optional<std::string>{"shop"});
    EXPECT_FALSE((*conn)->schema().has_value());

    const auto response = scripted::written_payload(*state, 0, 1);
    const std::string text(response.begin(), response.end());
    EXPECT_NE(text.find(std::string("shop") + '\0' + "mysql_native_password"), std::string::npos);
}

// ---------------------------------------------------------------------------
// HE-3. AuthSwitchRequest: 새 plugin / 새 scramble 로 응답(seq 3), OK(seq 4)
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, AuthSwitchUsesNewScramble) {
    auto state = make_state();
    scripted::push(*state, scripted::greeting(scripted::kServerCaps, "caching_sha2_password"), 0);
    scripted::push(*state, auth_switch("mysql_native_password", scripted::test_scramble('A')), 2);
    scripted::push(*state, scripted::ok(), 4);

    auto conn = scripted::open_connection(state, scripted::default_config());
    ASSERT_TRUE(conn.has_value()) << conn.error().message;
    EXPECT_EQ((*conn)->server_info().auth_plugin, "mysql_native_password");

    ASSERT_EQ(state->writes.size(), 2U);
    EXPECT_EQ(auth_response_of(scripted::written_payload(*state, 0, 1)),
              *scramble_caching_sha2("secret", scripted::test_scramble()));
    EXPECT_EQ(scripted::written_payload(*state, 1, 3),
              *scramble_native_password("secret", scripted::test_scramble('A')));
}

// ---------------------------------------------------------------------------
// HE-4. caching_sha2 fast auth: {0x01 0x03}(seq 2) 후 아무것도 보내지 않고 OK(seq 3)
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, CachingSha2FastAuth) {
    auto state = make_state();
    scripted::push(*state, scripted::greeting(scripted::kServerCaps, "caching_sha2_password"), 0);
    scripted::push(*state, auth_more_data(0x03), 2);
    scripted::push(*state, scripted::ok(), 3);

    auto conn = scripted::open_connection(state, scripted::default_config());
    ASSERT_TRUE(conn.has_value()) << conn.error().message;
    EXPECT_EQ((*conn)->server_info().auth_plugin, "caching_sha2_password");
    EXPECT_EQ(state->writes.size(), 1U);
}

// ---------------------------------------------------------------------------
// HE-5. caching_sha2 full auth + TLS: SSLRequest(1), response(2), 평문 비밀번호(4)
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, TlsUpgradeAndCleartextFullAuth) {
    auto state = make_state();
    scripted::push(*state,
                   scripted::greeting(scripted::kServerCaps | capability::kSsl, "caching_sha2_password"),
                   0);
    scripted::push(*state, auth_more_data(0x04), 3);
    scripted::push(*state, scripted::ok(), 5);

    auto conn = scripted::open_connection(state, scripted::default_config().set_ssl(SslMode::trusted()));
    ASSERT_TRUE(conn.has_value()) << conn.error().message;

    EXPECT_EQ(state->tls_upgrades, 1);
    EXPECT_TRUE((*conn)->server_info().tls);
    EXPECT_TRUE(capability::has((*conn)->server_info().capabilities, capability::kSsl));

    ASSERT_EQ(state->writes.size(), 3U);
    EXPECT_EQ(scripted::written_payload(*state, 0, 1).size(), 32U);
    EXPECT_FALSE(scripted::written_payload(*state, 1, 2).empty());
    EXPECT_EQ(scripted::written_payload(*state, 2, 4),
              (Bytes{'s', 'e', 'c', 'r', 'e', 't', 0x00}));
}

// ---------------------------------------------------------------------------
// HE-6. SSL 요청 + 서버 미광고 + fallback → 평문으로 계속
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, SslFallbackContinuesInPlaintext) {
    auto state = make_state();
    scripted::push_handshake(*state);

    auto conn = scripted::open_connection(
        state, scripted::default_config().set_ssl(SslMode::trusted().with_fallback(true)));
    ASSERT_TRUE(conn.has_value()) << conn.error().message;
    EXPECT_EQ(state->tls_upgrades, 0);
    EXPECT_FALSE((*conn)->server_info().tls);
}

// ===========================================================================
// 실패 경로
// ===========================================================================

// ---------------------------------------------------------------------------
// HE-7. SSL 요청 + 서버 미광고 → kCapabilityMismatch, 아무것도 보내지 않는다
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, SslRequiredButUnsupported) {
    auto state = make_state();
    scripted::push_handshake(*state);

    auto conn = scripted::open_connection(state, scripted::default_config().set_ssl(SslMode::trusted()));
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, ErrorCode::kCapabilityMismatch);
    EXPECT_TRUE(state->writes.empty());
    EXPECT_FALSE(state->open);
}

// ---------------------------------------------------------------------------
// HE-8. TLS 업그레이드 실패 → kTls
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, TlsUpgradeFailure) {
    auto state = make_state();
    state->fail_tls = true;
    scripted::push(*state, scripted::greeting(scripted::kServerCaps | capability::kSsl), 0);

    auto conn = scripted::open_connection(state, scripted::default_config().set_ssl(SslMode::trusted()));
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, ErrorCode::kTls);
    EXPECT_EQ(state->tls_upgrades, 1);
}

// ---------------------------------------------------------------------------
// HE-9. full auth + 평문 + 공개키 요청 비허용 → kPolicyViolation
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, PublicKeyRetrievalNotAllowed) {
    auto state = make_state();
    scripted::push(*state, scripted::greeting(scripted::kServerCaps, "caching_sha2_password"), 0);
    scripted::push(*state, auth_more_data(0x04), 2);

    auto conn = scripted::open_connection(state, scripted::default_config());
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, ErrorCode::kPolicyViolation);
    EXPECT_EQ(conn.error().message, "Public Key Retrieval is not allowed");
    EXPECT_FALSE(state->open);
}

// ---------------------------------------------------------------------------
// HE-10. 공개키 요청 허용 → {0x02}(seq 3) 전송 후 서버 키를 기다린다
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, PublicKeyRequestedWhenAllowed) {
    auto state = make_state();
    scripted::push(*state, scripted::greeting(scripted::kServerCaps, "caching_sha2_password"), 0);
    scripted::push(*state, auth_more_data(0x04), 2);
    scripted::push(*state, scripted::err(1045, "28000", "Access denied for user 'root'"), 4);

    auto conn = scripted::open_connection(
        state, scripted::default_config().set_allow_public_key_retrieval(true));
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, ErrorCode::kAuthentication);

    ASSERT_EQ(state->writes.size(), 2U);
    EXPECT_EQ(scripted::written_payload(*state, 1, 3), (Bytes{0x02}));
}

// ---------------------------------------------------------------------------
// HE-11. greeting 대신 ERR (Too many connections) → kAuthentication
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, ErrGreeting) {
    auto state = make_state();
    scripted::push(*state, scripted::err(1040, "08004", "Too many connections"), 0);

    auto conn = scripted::open_connection(state, scripted::default_config());
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, ErrorCode::kAuthentication);
    EXPECT_EQ(conn.error().server_code, 1040);
    EXPECT_EQ(conn.error().message, "Too many connections");
}

// ---------------------------------------------------------------------------
// HE-12. 인증 거부 ERR → kAuthentication + 서버 코드
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, AccessDenied) {
    auto state = make_state();
    scripted::push(*state, scripted::greeting(), 0);
    scripted::push(*state, scripted::err(1045, "28000", "Access denied for user 'root'"), 2);

    auto conn = scripted::open_connection(state, scripted::default_config());
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, ErrorCode::kAuthentication);
    EXPECT_EQ(conn.error().server_code, 1045);
    EXPECT_EQ(conn.error().sql_state, "28000");
}

// ---------------------------------------------------------------------------
// HE-13. 두 번째 AuthSwitchRequest → kAuthentication
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, SecondAuthSwitchRejected) {
    auto state = make_state();
    scripted::push(*state, scripted::greeting(), 0);
    scripted::push(*state, auth_switch("caching_sha2_password", scripted::test_scramble('A')), 2);
    scripted::push(*state, auth_switch("mysql_native_password", scripted::test_scramble('B')), 4);

    auto conn = scripted::open_connection(state, scripted::default_config());
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, ErrorCode::kAuthentication);
    EXPECT_EQ(conn.error().message, "unexpected AuthSwitchRequest after auth switch");
}

// ---------------------------------------------------------------------------
// HE-14. 알 수 없는 plugin → kAuthentication
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, UnknownPlugin) {
    auto state = make_state();
    scripted::push(*state, scripted::greeting(scripted::kServerCaps, "mysql_clear_password"), 0);

    auto conn = scripted::open_connection(state, scripted::default_config());
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, ErrorCode::kAuthentication);
    EXPECT_EQ(conn.error().message, "Unknown authentication plugin: mysql_clear_password");
}

// ---------------------------------------------------------------------------
// HE-15. 서버 OK 의 sequence id 가 틀림 → kFraming
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, SequenceMismatch) {
    auto state = make_state();
    scripted::push(*state, scripted::greeting(), 0);
    scripted::push(*state, scripted::ok(), 5);

    auto conn = scripted::open_connection(state, scripted::default_config());
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, ErrorCode::kFraming);
}

// ---------------------------------------------------------------------------
// HE-16. 서버가 중간에 끊음 → kIo
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, ServerHangsUp) {
    auto state = make_state();
    scripted::push(*state, scripted::greeting(), 0);

    auto conn = scripted::open_connection(state, scripted::default_config());
    ASSERT_FALSE(conn.has_value());
    EXPECT_EQ(conn.error().code, ErrorCode::kIo);
}

// ===========================================================================
// COM_CHANGE_USER
// ===========================================================================

namespace {

auto change_user(Connection& conn, std::string user, std::optional<std::string> password)
    -> std::expected<void, Error>
{
    std::expected<void, Error> result{std::unexpected(Error{})};
    scripted::run_coro([&]() -> boost::asio::awaitable<void> {
        result = co_await conn.change_user(std::move(user), std::move(password));
    });
    return result;
}

// COM_CHANGE_USER 에서 1B 길이 앞의 auth response 를 꺼낸다
auto change_user_auth_of(const Bytes& payload) -> Bytes {
    PacketReader r(payload);
    if (!r.skip(1) || !r.read_null_terminated()) {
        return {};
    }
    auto len = r.read_u8();
    if (!len) {
        return {};
    }
    auto auth = r.read_bytes(*len);
    return auth ? Bytes(auth->begin(), auth->end()) : Bytes{};
}

}  // namespace

// ---------------------------------------------------------------------------
// HE-17. change_user: greeting scramble 로 만든 auth, OK(seq 1) 후 user 갱신
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, ChangeUserWithGreetingScramble) {
    auto state = make_state();
    scripted::push_handshake(*state);
    auto conn = scripted::open_connection(state, scripted::default_config());
    ASSERT_TRUE(conn.has_value()) << conn.error().message;
    state->writes.clear();

    scripted::push_response(*state, {scripted::ok()});
    auto changed = change_user(**conn, "bob", std::optional<std::string>{"hunter2"});

    ASSERT_TRUE(changed.has_value()) << changed.error().message;
    EXPECT_EQ((*conn)->config().user(), "bob");
    EXPECT_EQ((*conn)->config().password(), std::optional<std::string>{"hunter2"});
    EXPECT_TRUE((*conn)->is_open());

    ASSERT_EQ(state->writes.size(), 1U);
    const auto payload = scripted::written_payload(*state, 0);
    ASSERT_FALSE(payload.empty());
    EXPECT_EQ(payload[0], 0x11);
    EXPECT_EQ(change_user_auth_of(payload),
              *scramble_native_password("hunter2", scripted::test_scramble()));
}

// ---------------------------------------------------------------------------
// HE-18. change_user 중 AuthSwitchRequest: 새 scramble 로 응답(seq 2), OK(seq 3)
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, ChangeUserFollowsAuthSwitch) {
    auto state = make_state();
    scripted::push_handshake(*state);
    auto conn = scripted::open_connection(state, scripted::default_config());
    ASSERT_TRUE(conn.has_value()) << conn.error().message;
    state->writes.clear();

    scripted::push(*state, auth_switch("mysql_native_password", scripted::test_scramble('K')), 1);
    scripted::push(*state, scripted::ok(), 3);
    auto changed = change_user(**conn, "bob", std::optional<std::string>{"hunter2"});

    ASSERT_TRUE(changed.has_value()) << changed.error().message;
    ASSERT_EQ(state->writes.size(), 2U);
    EXPECT_EQ(scripted::written_payload(*state, 1, 2),
              *scramble_native_password("hunter2", scripted::test_scramble('K')));
}

// ---------------------------------------------------------------------------
// HE-19. change_user 거부 → kAuthentication, 연결은 무효화되고 user 는 그대로
// ---------------------------------------------------------------------------
TEST(HandshakeEngine, ChangeUserRejected) {
    auto state = make_state();
    scripted::push_handshake(*state);
    auto conn = scripted::open_connection(state, scripted::default_config());
    ASSERT_TRUE(conn.has_value()) << conn.error().message;

    scripted::push_response(*state, {scripted::err(1045, "28000", "Access denied for user 'bob'")});
    auto changed = change_user(**conn, "bob", std::nullopt);

    ASSERT_FALSE(changed.has_value());
    EXPECT_EQ(changed.error().code, ErrorCode::kAuthentication);
    EXPECT_EQ(changed.error().server_code, 1045);
    EXPECT_EQ((*conn)->config().user(), "root");
    EXPECT_FALSE((*conn)->is_open());
}
