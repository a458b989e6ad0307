// ---------------------------------------------------------------------------
// test_tcp_transport.cpp
//
// TcpTransport 단위 테스트 (127.0.0.1 loopback 소켓 쌍)
//   read timeout, 늦게 실행되는 타이머 완료, peer 종료
// ---------------------------------------------------------------------------

#include "net/tcp_transport.hpp"

#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/detached.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/write.hpp>

#include <gtest/gtest.h>

#include <array>
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <thread>

namespace asio = boost::asio;
using asio::ip::tcp;
using namespace std::chrono_literals;

namespace {

// 연결된 loopback 소켓 쌍. client 쪽을 TcpTransport 로 감싼다.
struct LoopbackPair {
    asio::io_context ctx;
    tcp::acceptor    acceptor{ctx, tcp::endpoint(asio::ip::address_v4::loopback(), 0)};
    tcp::socket      server{ctx};
    std::unique_ptr<TcpTransport> transport;

    explicit LoopbackPair(std::optional<std::chrono::milliseconds> timeout) {
        tcp::socket client(ctx);
        client.connect(acceptor.local_endpoint());
        acceptor.accept(server);
        transport = std::make_unique<TcpTransport>(std::move(client), timeout);
    }

    void send(std::string_view text) {
        asio::write(server, asio::buffer(text.data(), text.size()));
    }
};

auto as_text(const std::array<std::uint8_t, 16>& buf, std::size_t n) -> std::string {
    return std::string(reinterpret_cast<const char*>(buf.data()), n);
}

}  // namespace

// ---------------------------------------------------------------------------
// 1. 데이터가 없으면 timeout 후 kTimeout, transport 는 닫힌다
// ---------------------------------------------------------------------------
TEST(TcpTransport, ReadTimesOutWithoutData) {
    LoopbackPair pair(50ms);

    std::array<std::uint8_t, 16>        buf{};
    std::expected<std::size_t, Error>   first{std::unexpected(Error{})};
    std::expected<std::size_t, Error>   after{std::unexpected(Error{})};
    asio::co_spawn(pair.ctx, [&]() -> asio::awaitable<void> {
        first = co_await pair.transport->read_some(buf);
        after = co_await pair.transport->read_some(buf);
    }, asio::detached);
    pair.ctx.run();

    ASSERT_FALSE(first.has_value());
    EXPECT_EQ(first.error().code, ErrorCode::kTimeout);
    EXPECT_EQ(first.error().message, "read timed out");
    EXPECT_FALSE(pair.transport->is_open());

    ASSERT_FALSE(after.has_value());
    EXPECT_EQ(after.error().code, ErrorCode::kIo);
}

// ---------------------------------------------------------------------------
// 2. timeout 안에 도착한 데이터는 그대로 읽힌다
// ---------------------------------------------------------------------------
TEST(TcpTransport, ReadsDataWithinTimeout) {
    LoopbackPair pair(200ms);
    pair.send("hello");

    std::array<std::uint8_t, 16>      buf{};
    std::expected<std::size_t, Error> n{std::unexpected(Error{})};
    asio::co_spawn(pair.ctx, [&]() -> asio::awaitable<void> {
        n = co_await pair.transport->read_some(buf);
    }, asio::detached);
    pair.ctx.run();

    ASSERT_TRUE(n.has_value()) << n.error().message;
    EXPECT_EQ(as_text(buf, *n), "hello");
    EXPECT_TRUE(pair.transport->is_open());
}

// ---------------------------------------------------------------------------
// 3. 첫 read 의 타이머가 만료된 뒤 늦게 실행돼도 다음 read 를 끊지 않는다
//    io 스레드를 timeout 보다 오래 막아 read 완료와 타이머 완료가
//    같은 차례에 대기하도록 만든다.
// ---------------------------------------------------------------------------
TEST(TcpTransport, ExpiredTimerOfPreviousReadDoesNotCancelNextRead) {
    LoopbackPair pair(200ms);
    pair.send("A");

    std::array<std::uint8_t, 16>      buf{};
    std::string                       first_text;
    std::expected<std::size_t, Error> first{std::unexpected(Error{})};
    std::expected<std::size_t, Error> second{std::unexpected(Error{})};
    asio::co_spawn(pair.ctx, [&]() -> asio::awaitable<void> {
        first = co_await pair.transport->read_some(buf);
        if (first) {
            first_text = as_text(buf, *first);
        }
        pair.send("B");
        second = co_await pair.transport->read_some(buf);
    }, asio::detached);
    asio::post(pair.ctx, [] { std::this_thread::sleep_for(300ms); });
    pair.ctx.run();

    ASSERT_TRUE(first.has_value()) << first.error().message;
    EXPECT_EQ(first_text, "A");
    ASSERT_TRUE(second.has_value()) << second.error().message << " " << second.error().context;
    EXPECT_EQ(as_text(buf, *second), "B");
    EXPECT_TRUE(pair.transport->is_open());
}

// ---------------------------------------------------------------------------
// 4. peer 가 닫으면 kIo, transport 도 닫힌다
// ---------------------------------------------------------------------------
TEST(TcpTransport, PeerCloseIsIoError) {
    LoopbackPair pair(std::nullopt);
    pair.server.close();

    std::array<std::uint8_t, 16>      buf{};
    std::expected<std::size_t, Error> n{std::unexpected(Error{})};
    asio::co_spawn(pair.ctx, [&]() -> asio::awaitable<void> {
        n = co_await pair.transport->read_some(buf);
    }, asio::detached);
    pair.ctx.run();

    ASSERT_FALSE(n.has_value());
    EXPECT_EQ(n.error().code, ErrorCode::kIo);
    EXPECT_FALSE(pair.transport->is_open());
}
