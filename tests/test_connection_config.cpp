// ---------------------------------------------------------------------------
// test_connection_config.cpp
//
// ConnectionConfig 불변 값 단위 테스트
//   기본값, setter 별 구조적 비교, 원본 불변, socket option 순서
// ---------------------------------------------------------------------------

#include "client/connection_config.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <memory>

using namespace std::chrono_literals;

namespace {

class NullTracer final : public Tracer {
public:
    auto start_span(std::string_view) -> std::unique_ptr<Span> override { return nullptr; }
};

auto base() -> ConnectionConfig {
    return ConnectionConfig("127.0.0.1", ConnectionConfig::kDefaultPort, "ldbc");
}

}  // namespace

// ---------------------------------------------------------------------------
// 1. 기본값
// ---------------------------------------------------------------------------
TEST(ConnectionConfig, Defaults) {
    const auto cfg = base();
    EXPECT_EQ(cfg.host(), "127.0.0.1");
    EXPECT_EQ(cfg.port(), 3306);
    EXPECT_EQ(cfg.user(), "ldbc");
    EXPECT_FALSE(cfg.password().has_value());
    EXPECT_FALSE(cfg.database().has_value());
    EXPECT_FALSE(cfg.debug());
    EXPECT_EQ(cfg.ssl(), SslMode::disabled());
    ASSERT_EQ(cfg.socket_options().size(), 1U);
    EXPECT_EQ(cfg.socket_options()[0], SocketOption::no_delay(true));
    EXPECT_FALSE(cfg.read_timeout().has_value());
    EXPECT_FALSE(cfg.allow_public_key_retrieval());
    EXPECT_EQ(cfg.database_term(), DatabaseTerm::kCatalog);
    EXPECT_EQ(cfg.tracer(), nullptr);
    EXPECT_EQ(cfg.logger(), nullptr);

    const ConnectionConfig empty;
    EXPECT_EQ(empty.host(), "127.0.0.1");
    EXPECT_EQ(empty.port(), ConnectionConfig::kDefaultPort);
}

// ---------------------------------------------------------------------------
// 2. 같은 값으로 만든 설정은 같다
// ---------------------------------------------------------------------------
TEST(ConnectionConfig, StructuralEquality) {
    const auto a = base().set_password("pw").set_database("world").set_read_timeout(30s);
    const auto b = base().set_password("pw").set_database("world").set_read_timeout(30'000ms);
    EXPECT_EQ(a, b);
}

// ---------------------------------------------------------------------------
// 3. setter 하나만 달라도 다르다
// ---------------------------------------------------------------------------
TEST(ConnectionConfig, EachSetterBreaksEquality) {
    const auto cfg = base();

    EXPECT_NE(cfg, cfg.set_host("db.example.com"));
    EXPECT_NE(cfg, cfg.set_port(13306));
    EXPECT_NE(cfg, cfg.set_user("root"));
    EXPECT_NE(cfg, cfg.set_password("password"));
    EXPECT_NE(cfg, cfg.set_database("world"));
    EXPECT_NE(cfg, cfg.set_debug(true));
    EXPECT_NE(cfg, cfg.set_ssl(SslMode::trusted()));
    EXPECT_NE(cfg, cfg.add_socket_option(SocketOption::keep_alive(true)));
    EXPECT_NE(cfg, cfg.set_socket_options({}));
    EXPECT_NE(cfg, cfg.set_read_timeout(5s));
    EXPECT_NE(cfg, cfg.set_allow_public_key_retrieval(true));
    EXPECT_NE(cfg, cfg.set_database_term(DatabaseTerm::kSchema));
    EXPECT_NE(cfg, cfg.set_tracer(std::make_shared<NullTracer>()));
    EXPECT_NE(cfg, cfg.set_logger(std::make_shared<StructuredLogger>(LogLevel::kError)));
}

// ---------------------------------------------------------------------------
// 4. setter 는 원본을 바꾸지 않는다
// ---------------------------------------------------------------------------
TEST(ConnectionConfig, SettersDoNotMutate) {
    const auto cfg     = base();
    const auto changed = cfg.set_host("other").set_port(1).set_debug(true);

    EXPECT_EQ(cfg.host(), "127.0.0.1");
    EXPECT_EQ(cfg.port(), 3306);
    EXPECT_FALSE(cfg.debug());
    EXPECT_EQ(changed.host(), "other");
    EXPECT_EQ(changed.port(), 1);
    EXPECT_TRUE(changed.debug());
}

// ---------------------------------------------------------------------------
// 5. add_socket_option 은 앞에 추가한다
// ---------------------------------------------------------------------------
TEST(ConnectionConfig, AddSocketOptionPrepends) {
    const auto cfg = base()
                         .add_socket_option(SocketOption::keep_alive(true))
                         .add_socket_option(SocketOption::receive_buffer_size(65536));

    ASSERT_EQ(cfg.socket_options().size(), 3U);
    EXPECT_EQ(cfg.socket_options()[0], SocketOption::receive_buffer_size(65536));
    EXPECT_EQ(cfg.socket_options()[1], SocketOption::keep_alive(true));
    EXPECT_EQ(cfg.socket_options()[2], SocketOption::no_delay(true));

    const auto replaced = cfg.set_socket_options({SocketOption::send_buffer_size(1024)});
    ASSERT_EQ(replaced.socket_options().size(), 1U);
    EXPECT_EQ(replaced.socket_options()[0].kind, SocketOption::Kind::kSendBufferSize);
}

// ---------------------------------------------------------------------------
// 6. tracer / logger 는 포인터 동일성으로 비교한다
// ---------------------------------------------------------------------------
TEST(ConnectionConfig, HooksCompareByIdentity) {
    auto tracer = std::make_shared<NullTracer>();
    EXPECT_EQ(base().set_tracer(tracer), base().set_tracer(tracer));
    EXPECT_NE(base().set_tracer(tracer), base().set_tracer(std::make_shared<NullTracer>()));

    auto logger = std::make_shared<StructuredLogger>(LogLevel::kError);
    EXPECT_EQ(base().set_logger(logger), base().set_logger(logger));
}

// ---------------------------------------------------------------------------
// 7. read_timeout 해제
// ---------------------------------------------------------------------------
TEST(ConnectionConfig, ClearingReadTimeout) {
    const auto timed = base().set_read_timeout(250ms);
    ASSERT_TRUE(timed.read_timeout().has_value());
    EXPECT_EQ(*timed.read_timeout(), 250ms);

    const auto infinite = timed.set_read_timeout(std::nullopt);
    EXPECT_FALSE(infinite.read_timeout().has_value());
    EXPECT_EQ(infinite, base());
}

TEST(SocketOption, Names) {
    EXPECT_EQ(socket_option_name(SocketOption::Kind::kNoDelay), "no_delay");
    EXPECT_EQ(socket_option_name(SocketOption::Kind::kKeepAlive), "keep_alive");
    EXPECT_EQ(socket_option_name(SocketOption::Kind::kReceiveBufferSize), "receive_buffer_size");
    EXPECT_EQ(socket_option_name(SocketOption::Kind::kSendBufferSize), "send_buffer_size");
}
