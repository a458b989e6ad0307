#include "protocol/mysql_packet.hpp"

#include <fmt/format.h>

#include <algorithm>

// ---------------------------------------------------------------------------
// MysqlPacket — 구현
//
// MySQL 와이어 포맷:
//   [3바이트 payload length LE][1바이트 seq_id][N바이트 payload]
// ---------------------------------------------------------------------------

auto parse_packet_header(std::span<const std::uint8_t, kPacketHeaderSize> raw) noexcept
    -> PacketHeader
{
    return PacketHeader{
        static_cast<std::uint32_t>(raw[0])
            | (static_cast<std::uint32_t>(raw[1]) << 8U)
            | (static_cast<std::uint32_t>(raw[2]) << 16U),
        raw[3]
    };
}

auto make_packet_header(std::uint32_t payload_length, std::uint8_t sequence_id) noexcept
    -> std::array<std::uint8_t, kPacketHeaderSize>
{
    return {
        static_cast<std::uint8_t>(payload_length & 0xFFU),
        static_cast<std::uint8_t>((payload_length >> 8U) & 0xFFU),
        static_cast<std::uint8_t>((payload_length >> 16U) & 0xFFU),
        sequence_id
    };
}

MysqlPacket::MysqlPacket(std::uint8_t sequence_id, Bytes payload)
    : sequence_id_(sequence_id)
    , payload_(std::move(payload))
{}

// static
auto MysqlPacket::parse(std::span<const std::uint8_t> data)
    -> std::expected<MysqlPacket, Error>
{
    if (data.size() < kPacketHeaderSize) {
        return std::unexpected(Error{
            ErrorCode::kFraming,
            "packet too short",
            fmt::format("received {} bytes, need at least 4", data.size())
        });
    }

    const auto header = parse_packet_header(data.first<kPacketHeaderSize>());

    if (data.size() < kPacketHeaderSize + header.payload_length) {
        return std::unexpected(Error{
            ErrorCode::kFraming,
            "incomplete payload",
            fmt::format("declared length={}, available={}",
                        header.payload_length, data.size() - kPacketHeaderSize)
        });
    }

    const auto* payload_begin = data.data() + kPacketHeaderSize;
    return MysqlPacket{header.sequence_id,
                       Bytes(payload_begin, payload_begin + header.payload_length)};
}

auto MysqlPacket::sequence_id() const noexcept -> std::uint8_t {
    return sequence_id_;
}

auto MysqlPacket::payload_length() const noexcept -> std::uint32_t {
    return static_cast<std::uint32_t>(payload_.size());
}

auto MysqlPacket::payload() const noexcept -> std::span<const std::uint8_t> {
    return std::span<const std::uint8_t>{payload_};
}

auto MysqlPacket::serialize() const -> std::expected<Bytes, Error> {
    if (payload_.size() > kMaxPacketPayload) {
        return std::unexpected(Error{
            ErrorCode::kFraming,
            "payload exceeds single packet limit",
            fmt::format("payload length={}", payload_.size())
        });
    }

    const auto header = make_packet_header(payload_length(), sequence_id_);

    Bytes result;
    result.reserve(kPacketHeaderSize + payload_.size());
    result.insert(result.end(), header.begin(), header.end());
    result.insert(result.end(), payload_.begin(), payload_.end());
    return result;
}

auto encode_packets(std::span<const std::uint8_t> payload, std::uint8_t& sequence_id) -> Bytes {
    const std::size_t chunks = payload.size() / kMaxPacketPayload + 1;

    Bytes out;
    out.reserve(payload.size() + chunks * kPacketHeaderSize);

    std::size_t offset = 0;
    while (true) {
        const std::size_t remaining = payload.size() - offset;
        const auto        chunk_len = static_cast<std::uint32_t>(
            std::min<std::size_t>(remaining, kMaxPacketPayload));

        const auto header = make_packet_header(chunk_len, sequence_id);
        out.insert(out.end(), header.begin(), header.end());
        out.insert(out.end(), payload.begin() + static_cast<std::ptrdiff_t>(offset),
                   payload.begin() + static_cast<std::ptrdiff_t>(offset + chunk_len));

        ++sequence_id;  // uint8_t: mod 256 wrap
        offset += chunk_len;

        // 0xFFFFFF 미만 조각이 나오면 논리 payload 종료.
        // 정확히 0xFFFFFF 로 끝났으면 다음 루프에서 길이 0 패킷을 쓴다.
        if (chunk_len < kMaxPacketPayload) {
            break;
        }
    }
    return out;
}

auto decode_packets(std::span<const std::uint8_t> stream, std::uint8_t expected_sequence_id)
    -> std::expected<DecodedPayload, Error>
{
    DecodedPayload result;
    result.next_sequence_id = expected_sequence_id;

    std::size_t pos = 0;
    while (true) {
        if (stream.size() - pos < kPacketHeaderSize) {
            return std::unexpected(Error{
                ErrorCode::kFraming,
                "stream ended inside packet header",
                fmt::format("offset={}, available={}", pos, stream.size() - pos)
            });
        }

        const auto header =
            parse_packet_header(stream.subspan(pos).first<kPacketHeaderSize>());

        if (header.sequence_id != result.next_sequence_id) {
            return std::unexpected(Error{
                ErrorCode::kFraming,
                "packet sequence mismatch",
                fmt::format("expected={}, received={}",
                            result.next_sequence_id, header.sequence_id)
            });
        }
        pos += kPacketHeaderSize;

        if (stream.size() - pos < header.payload_length) {
            return std::unexpected(Error{
                ErrorCode::kFraming,
                "stream ended before declared payload length",
                fmt::format("declared length={}, available={}",
                            header.payload_length, stream.size() - pos)
            });
        }

        const auto chunk = stream.subspan(pos, header.payload_length);
        result.payload.insert(result.payload.end(), chunk.begin(), chunk.end());
        pos += header.payload_length;
        ++result.next_sequence_id;

        if (header.payload_length < kMaxPacketPayload) {
            break;
        }
    }

    result.consumed = pos;
    return result;
}
