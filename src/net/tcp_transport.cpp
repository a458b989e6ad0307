#include "net/tcp_transport.hpp"

#include <utility>
#include <boost/asio/connect.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/ssl/host_name_verification.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <fmt/format.h>
#include <openssl/ssl.h>
#include <spdlog/spdlog.h>

namespace asio = boost::asio;
namespace ssl  = boost::asio::ssl;

TcpTransport::TcpTransport(tcp::socket socket, std::optional<std::chrono::milliseconds> read_timeout)
    : socket_(std::move(socket))
    , timer_(socket_.get_executor())
    , read_timeout_(read_timeout)
{}

TcpTransport::~TcpTransport() {
    close();
}

auto TcpTransport::connect(asio::any_io_executor                    executor,
                           const std::string&                       host,
                           std::uint16_t                            port,
                           const std::vector<SocketOption>&         options,
                           std::optional<std::chrono::milliseconds> read_timeout)
    -> asio::awaitable<std::expected<std::unique_ptr<TcpTransport>, Error>>
{
    boost::system::error_code ec;

    tcp::resolver resolver(executor);
    const auto endpoints = co_await resolver.async_resolve(
        host, std::to_string(port),
        asio::redirect_error(asio::use_awaitable, ec)
    );
    if (ec) {
        co_return std::unexpected(Error{
            ErrorCode::kIo,
            fmt::format("failed to resolve {}:{}", host, port),
            ec.message()
        });
    }

    tcp::socket socket(executor);
    co_await asio::async_connect(
        socket, endpoints,
        asio::redirect_error(asio::use_awaitable, ec)
    );
    if (ec) {
        co_return std::unexpected(Error{
            ErrorCode::kIo,
            fmt::format("failed to connect to {}:{}", host, port),
            ec.message()
        });
    }

    for (const auto& option : options) {
        if (auto applied = apply_socket_option(socket, option); !applied) {
            boost::system::error_code ignored;
            socket.close(ignored);
            co_return std::unexpected(std::move(applied.error()));
        }
    }

    spdlog::debug("[transport] connected to {}:{}", host, port);
    co_return std::make_unique<TcpTransport>(std::move(socket), read_timeout);
}

auto TcpTransport::read_some(std::span<std::uint8_t> buffer)
    -> asio::awaitable<std::expected<std::size_t, Error>>
{
    if (!is_open()) {
        co_return std::unexpected(Error{ErrorCode::kIo, "transport is closed", {}});
    }

    // 읽기마다 별도 상태를 둔다. 이전 읽기의 타이머 완료가 늦게 실행돼도
    // 자기 상태만 보므로 다음 읽기를 취소하지 않는다.
    auto pending = std::make_shared<PendingRead>();
    if (read_timeout_) {
        timer_.expires_after(*read_timeout_);
        timer_.async_wait([this, pending](const boost::system::error_code& timer_ec) {
            if (!timer_ec && pending->active) {
                pending->expired = true;
                boost::system::error_code ignored;
                lowest_layer().cancel(ignored);
            }
        });
    }

    boost::system::error_code ec;
    std::size_t               n = 0;
    if (tls_) {
        n = co_await tls_->async_read_some(
            asio::buffer(buffer.data(), buffer.size()),
            asio::redirect_error(asio::use_awaitable, ec)
        );
    } else {
        n = co_await socket_.async_read_some(
            asio::buffer(buffer.data(), buffer.size()),
            asio::redirect_error(asio::use_awaitable, ec)
        );
    }

    pending->active = false;
    if (read_timeout_) {
        timer_.cancel();
    }

    // 타이머와 데이터가 같이 도착했으면 데이터가 우선
    if (!ec) {
        co_return n;
    }
    if (pending->expired) {
        close();
        co_return std::unexpected(Error{
            ErrorCode::kTimeout,
            "read timed out",
            fmt::format("timeout={}ms", read_timeout_->count())
        });
    }
    co_return std::unexpected(io_error("failed to read from server", ec));
}

auto TcpTransport::write_all(std::span<const std::uint8_t> data)
    -> asio::awaitable<std::expected<void, Error>>
{
    if (!is_open()) {
        co_return std::unexpected(Error{ErrorCode::kIo, "transport is closed", {}});
    }

    boost::system::error_code ec;
    if (tls_) {
        co_await asio::async_write(
            *tls_, asio::buffer(data.data(), data.size()),
            asio::redirect_error(asio::use_awaitable, ec)
        );
    } else {
        co_await asio::async_write(
            socket_, asio::buffer(data.data(), data.size()),
            asio::redirect_error(asio::use_awaitable, ec)
        );
    }

    if (ec) {
        co_return std::unexpected(io_error("failed to write to server", ec));
    }
    co_return std::expected<void, Error>{};
}

auto TcpTransport::upgrade_to_tls(const SslMode& mode, std::string_view host)
    -> asio::awaitable<std::expected<void, Error>>
{
    if (tls_) {
        co_return std::unexpected(Error{ErrorCode::kUsage, "transport is already secure", {}});
    }

    auto ctx = mode.make_context();
    if (!ctx) {
        close();
        co_return std::unexpected(std::move(ctx.error()));
    }
    ssl_context_ = std::move(*ctx);
    tls_         = std::make_unique<TlsStream>(std::move(socket_), *ssl_context_);

    // SNI: 설정된 첫 server name, 없으면 접속 host
    std::string server_name(host);
    if (const auto& params = mode.tls_parameters(); params && !params->server_names.empty()) {
        server_name = params->server_names.front();
    }
    if (!server_name.empty()
        && SSL_set_tlsext_host_name(tls_->native_handle(), server_name.c_str()) != 1) {
        close();
        co_return std::unexpected(Error{ErrorCode::kTls, "failed to set SNI host name", server_name});
    }

    const bool verify_host =
        mode.kind() == SslMode::Kind::kSystem
        || (mode.kind() == SslMode::Kind::kCustom && mode.custom_files().verify_peer);
    if (verify_host) {
        boost::system::error_code verify_ec;
        tls_->set_verify_callback(ssl::host_name_verification(server_name), verify_ec);
        if (verify_ec) {
            close();
            co_return std::unexpected(Error{ErrorCode::kTls, "failed to set host name verification",
                                            verify_ec.message()});
        }
    }

    boost::system::error_code ec;
    co_await tls_->async_handshake(
        ssl::stream_base::client,
        asio::redirect_error(asio::use_awaitable, ec)
    );
    if (ec) {
        close();
        co_return std::unexpected(Error{
            ErrorCode::kTls,
            "TLS handshake failed",
            fmt::format("mode={} host={}: {}", ssl_mode_name(mode.kind()), server_name, ec.message())
        });
    }

    spdlog::debug("[transport] TLS established with {} ({})", server_name, ssl_mode_name(mode.kind()));
    co_return std::expected<void, Error>{};
}

void TcpTransport::close() noexcept {
    timer_.cancel();
    auto& sock = lowest_layer();
    if (sock.is_open()) {
        boost::system::error_code ignored;
        sock.shutdown(tcp::socket::shutdown_both, ignored);
        sock.close(ignored);
    }
}

bool TcpTransport::is_open() const noexcept {
    return tls_ ? tls_->lowest_layer().is_open() : socket_.is_open();
}

auto TcpTransport::lowest_layer() noexcept -> tcp::socket& {
    return tls_ ? tls_->next_layer() : socket_;
}

auto TcpTransport::io_error(std::string message, const boost::system::error_code& ec) -> Error {
    close();
    return Error{ErrorCode::kIo, std::move(message), ec.message()};
}

auto apply_socket_option(asio::ip::tcp::socket& socket, const SocketOption& option)
    -> std::expected<void, Error>
{
    boost::system::error_code ec;
    switch (option.kind) {
        case SocketOption::Kind::kNoDelay:
            socket.set_option(asio::ip::tcp::no_delay(option.value != 0), ec);
            break;
        case SocketOption::Kind::kKeepAlive:
            socket.set_option(asio::socket_base::keep_alive(option.value != 0), ec);
            break;
        case SocketOption::Kind::kReceiveBufferSize:
            socket.set_option(asio::socket_base::receive_buffer_size(option.value), ec);
            break;
        case SocketOption::Kind::kSendBufferSize:
            socket.set_option(asio::socket_base::send_buffer_size(option.value), ec);
            break;
    }

    if (ec) {
        return std::unexpected(Error{
            ErrorCode::kIo,
            fmt::format("failed to set socket option {}", socket_option_name(option.kind)),
            ec.message()
        });
    }
    return {};
}
