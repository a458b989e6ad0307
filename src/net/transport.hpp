#pragma once

#include "common/types.hpp"
#include "net/ssl_mode.hpp"

#include <utility>
#include <boost/asio/awaitable.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string_view>

// ---------------------------------------------------------------------------
// Transport
//   순서가 보장되는 양방향 바이트 스트림.
//   핸드셰이크 엔진과 커맨드 엔진은 이 인터페이스만 사용한다.
//
//   read_some      : 1바이트 이상 읽는다. 스트림 종료는 kIo, timeout 은 kTimeout
//   write_all      : data 전체를 쓴다
//   upgrade_to_tls : 같은 스트림 위에서 TLS client handshake 를 수행한다
//
//   read/write 실패 시 구현은 스트림을 닫는다 (is_open() == false).
// ---------------------------------------------------------------------------
class Transport {
public:
    virtual ~Transport() = default;

    virtual auto read_some(std::span<std::uint8_t> buffer)
        -> boost::asio::awaitable<std::expected<std::size_t, Error>> = 0;

    virtual auto write_all(std::span<const std::uint8_t> data)
        -> boost::asio::awaitable<std::expected<void, Error>> = 0;

    virtual auto upgrade_to_tls(const SslMode& mode, std::string_view host)
        -> boost::asio::awaitable<std::expected<void, Error>> = 0;

    virtual void close() noexcept = 0;

    [[nodiscard]] virtual bool is_open()   const noexcept = 0;
    [[nodiscard]] virtual bool is_secure() const noexcept = 0;
};
