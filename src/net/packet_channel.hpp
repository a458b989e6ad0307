#pragma once

#include "common/types.hpp"
#include "net/transport.hpp"

#include <utility>
#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <expected>
#include <span>
#include <string_view>

// ---------------------------------------------------------------------------
// PacketChannel
//   Transport 위에서 논리 payload 단위로 읽고 쓴다.
//
//   - 쓰기: encode_packets() 로 분할 + 헤더 부착, sequence 를 진행한다.
//   - 읽기: 물리 패킷을 모아 하나의 payload 로 재조립하고 sequence 를 검증한다.
//   - 새 커맨드 시작 시 reset_sequence() 로 sequence 를 0 으로 되돌린다.
//
//   읽기/쓰기/프레이밍 오류가 한 번이라도 발생하면 채널은 broken 상태가 되고
//   transport 를 닫는다. 이후 모든 호출은 kIo 를 반환한다.
//
//   debug 가 켜져 있으면 모든 패킷을 spdlog::debug 로 기록한다.
// ---------------------------------------------------------------------------
class PacketChannel {
public:
    PacketChannel(Transport& transport, bool debug) noexcept;

    auto read_payload()
        -> boost::asio::awaitable<std::expected<Bytes, Error>>;

    auto write_payload(std::span<const std::uint8_t> payload)
        -> boost::asio::awaitable<std::expected<void, Error>>;

    void reset_sequence() noexcept { sequence_id_ = 0; }

    // 오류 없이 transport 를 닫는다 (COM_QUIT 이후 등)
    void close() noexcept;

    [[nodiscard]] auto sequence_id() const noexcept -> std::uint8_t { return sequence_id_; }
    [[nodiscard]] bool is_broken()   const noexcept { return broken_; }
    [[nodiscard]] bool is_usable()   const noexcept { return !broken_ && transport_.is_open(); }
    [[nodiscard]] auto transport() noexcept -> Transport& { return transport_; }

private:
    // buffer_ 에 최소 count 바이트가 쌓일 때까지 transport 에서 읽는다.
    auto fill(std::size_t count) -> boost::asio::awaitable<std::expected<void, Error>>;

    auto fail(Error error) -> Error;
    void trace(std::string_view direction, std::uint32_t length, std::uint8_t sequence,
               std::span<const std::uint8_t> payload) const;

    Transport&   transport_;
    bool         debug_{false};
    std::uint8_t sequence_id_{0};
    bool         broken_{false};
    Bytes        buffer_{};
};
