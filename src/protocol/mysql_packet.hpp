#pragma once

#include "common/types.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <vector>

// MySQL 와이어 프로토콜: payload 길이 필드는 3바이트 = 최대 0xFFFFFF(16MB-1)
inline constexpr std::uint32_t kMaxPacketPayload = 0x00FFFFFFU;
inline constexpr std::size_t   kPacketHeaderSize = 4;

// ---------------------------------------------------------------------------
// PacketHeader
//   [3바이트 payload length LE][1바이트 sequence id]
// ---------------------------------------------------------------------------
struct PacketHeader {
    std::uint32_t payload_length{0};
    std::uint8_t  sequence_id{0};
};

[[nodiscard]] auto parse_packet_header(std::span<const std::uint8_t, kPacketHeaderSize> raw) noexcept
    -> PacketHeader;

[[nodiscard]] auto make_packet_header(std::uint32_t payload_length, std::uint8_t sequence_id) noexcept
    -> std::array<std::uint8_t, kPacketHeaderSize>;

// ---------------------------------------------------------------------------
// MysqlPacket
//   MySQL 와이어 프로토콜의 단일 물리 패킷을 나타낸다.
//
//   Wire 포맷:
//     [3바이트 payload length][1바이트 sequence id][payload...]
//
//   parse()    : 원시 바이트에서 MysqlPacket 으로 변환
//   serialize(): MysqlPacket 을 원시 바이트로 변환
// ---------------------------------------------------------------------------
class MysqlPacket {
public:
    MysqlPacket() = default;
    MysqlPacket(std::uint8_t sequence_id, Bytes payload);

    // -----------------------------------------------------------------------
    // parse
    //   data 는 헤더(4바이트)와 선언된 길이만큼의 payload 를 모두 담고 있어야 한다.
    //
    //   실패 시: std::unexpected(Error{kFraming})
    // -----------------------------------------------------------------------
    static auto parse(std::span<const std::uint8_t> data)
        -> std::expected<MysqlPacket, Error>;

    [[nodiscard]] auto sequence_id()    const noexcept -> std::uint8_t;
    [[nodiscard]] auto payload_length() const noexcept -> std::uint32_t;
    [[nodiscard]] auto payload()        const noexcept -> std::span<const std::uint8_t>;

    // -----------------------------------------------------------------------
    // serialize
    //   헤더(4바이트) + 페이로드. payload 가 0xFFFFFF 를 넘으면 kFraming.
    // -----------------------------------------------------------------------
    [[nodiscard]] auto serialize() const -> std::expected<Bytes, Error>;

private:
    std::uint8_t sequence_id_{0};
    Bytes        payload_{};
};

// ---------------------------------------------------------------------------
// encode_packets
//   하나의 논리 payload 를 물리 패킷 열로 프레이밍한다.
//
//   - 0xFFFFFF 바이트 단위로 분할하고 나머지를 마지막 패킷에 담는다.
//   - 마지막 조각이 정확히 0xFFFFFF 이면 길이 0 종결 패킷을 덧붙인다.
//   - sequence_id 는 첫 패킷 번호로 사용되고, 반환 시 다음 번호로 갱신된다.
// ---------------------------------------------------------------------------
[[nodiscard]] auto encode_packets(std::span<const std::uint8_t> payload,
                                  std::uint8_t&                 sequence_id) -> Bytes;

// ---------------------------------------------------------------------------
// DecodedPayload
//   decode_packets() 결과. consumed 는 stream 에서 소비한 바이트 수.
// ---------------------------------------------------------------------------
struct DecodedPayload {
    Bytes        payload{};
    std::uint8_t next_sequence_id{0};
    std::size_t  consumed{0};
};

// ---------------------------------------------------------------------------
// decode_packets
//   stream 앞부분에서 분할된 패킷을 하나의 논리 payload 로 재조립한다.
//   각 패킷의 sequence id 는 expected_sequence_id 부터 1씩(mod 256) 증가해야 한다.
//
//   실패 시: sequence 불일치, 또는 선언된 길이보다 stream 이 먼저 끝남 → kFraming
// ---------------------------------------------------------------------------
[[nodiscard]] auto decode_packets(std::span<const std::uint8_t> stream,
                                  std::uint8_t                  expected_sequence_id)
    -> std::expected<DecodedPayload, Error>;
