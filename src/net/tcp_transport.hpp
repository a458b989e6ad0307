#pragma once

#include "net/socket_option.hpp"
#include "net/transport.hpp"

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/ssl/stream.hpp>
#include <boost/asio/steady_timer.hpp>

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// TcpTransport
//   Boost.Asio TCP 소켓 기반 Transport. upgrade_to_tls() 이후에는
//   같은 소켓을 감싼 ssl::stream 으로 읽고 쓴다.
//
//   read timeout : 설정되면 매 read_some 마다 steady_timer 를 건다.
//                  만료 시 소켓을 cancel 하고 kTimeout 을 반환하며 transport 를 닫는다.
//                  만료와 데이터 도착이 겹치면 데이터를 돌려준다.
// ---------------------------------------------------------------------------
class TcpTransport final : public Transport {
public:
    using tcp        = boost::asio::ip::tcp;
    using TlsStream  = boost::asio::ssl::stream<tcp::socket>;

    TcpTransport(tcp::socket socket, std::optional<std::chrono::milliseconds> read_timeout);
    ~TcpTransport() override;

    TcpTransport(const TcpTransport&)            = delete;
    TcpTransport& operator=(const TcpTransport&) = delete;

    // -----------------------------------------------------------------------
    // connect
    //   host:port 를 resolve 후 연결하고 socket_options 를 순서대로 적용한다.
    //   실패 시: resolve / connect / setsockopt 오류 → kIo
    // -----------------------------------------------------------------------
    static auto connect(boost::asio::any_io_executor                executor,
                        const std::string&                          host,
                        std::uint16_t                               port,
                        const std::vector<SocketOption>&            options,
                        std::optional<std::chrono::milliseconds>    read_timeout)
        -> boost::asio::awaitable<std::expected<std::unique_ptr<TcpTransport>, Error>>;

    auto read_some(std::span<std::uint8_t> buffer)
        -> boost::asio::awaitable<std::expected<std::size_t, Error>> override;

    auto write_all(std::span<const std::uint8_t> data)
        -> boost::asio::awaitable<std::expected<void, Error>> override;

    auto upgrade_to_tls(const SslMode& mode, std::string_view host)
        -> boost::asio::awaitable<std::expected<void, Error>> override;

    void close() noexcept override;

    [[nodiscard]] bool is_open()   const noexcept override;
    [[nodiscard]] bool is_secure() const noexcept override { return tls_ != nullptr; }

private:
    auto lowest_layer() noexcept -> tcp::socket&;
    auto io_error(std::string message, const boost::system::error_code& ec) -> Error;

    // read_some 한 번의 타이머 상태. 타이머 핸들러와 공유한다.
    struct PendingRead {
        bool active{true};
        bool expired{false};
    };

    tcp::socket                                  socket_;
    std::shared_ptr<boost::asio::ssl::context>   ssl_context_{};
    std::unique_ptr<TlsStream>                   tls_{};
    boost::asio::steady_timer                    timer_;
    std::optional<std::chrono::milliseconds>     read_timeout_;
};

// 소켓 옵션 하나를 적용한다. 실패 시 kIo.
[[nodiscard]] auto apply_socket_option(boost::asio::ip::tcp::socket& socket,
                                       const SocketOption&           option)
    -> std::expected<void, Error>;
