#include "net/packet_channel.hpp"

#include "protocol/mysql_packet.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <array>
#include <string>

namespace {

// 한 번에 transport 에서 읽어 오는 최대 바이트 수
constexpr std::size_t kReadChunkSize = 16 * 1024;

// debug 로그에 남길 payload 앞부분 길이
constexpr std::size_t kTraceHeadBytes = 16;

auto hex_head(std::span<const std::uint8_t> payload) -> std::string {
    std::string out;
    const auto  n = std::min(payload.size(), kTraceHeadBytes);
    out.reserve(n * 3);
    for (std::size_t i = 0; i < n; ++i) {
        if (i != 0) {
            out += ' ';
        }
        out += fmt::format("{:02X}", payload[i]);
    }
    if (payload.size() > n) {
        out += " ...";
    }
    return out;
}

}  // namespace

PacketChannel::PacketChannel(Transport& transport, bool debug) noexcept
    : transport_(transport)
    , debug_(debug)
{}

auto PacketChannel::read_payload() -> boost::asio::awaitable<std::expected<Bytes, Error>> {
    if (broken_) {
        co_return std::unexpected(Error{ErrorCode::kIo, "connection is closed", {}});
    }

    Bytes payload;
    while (true) {
        if (auto filled = co_await fill(kPacketHeaderSize); !filled) {
            co_return std::unexpected(fail(std::move(filled.error())));
        }

        const auto header = parse_packet_header(
            std::span<const std::uint8_t, kPacketHeaderSize>{buffer_.data(), kPacketHeaderSize});

        if (header.sequence_id != sequence_id_) {
            co_return std::unexpected(fail(Error{
                ErrorCode::kFraming,
                "packet sequence mismatch",
                fmt::format("expected={}, actual={}", sequence_id_, header.sequence_id)
            }));
        }

        const std::size_t frame_size = kPacketHeaderSize + header.payload_length;
        if (auto filled = co_await fill(frame_size); !filled) {
            co_return std::unexpected(fail(std::move(filled.error())));
        }

        const auto body = std::span<const std::uint8_t>{buffer_}.subspan(
            kPacketHeaderSize, header.payload_length);
        if (debug_) {
            trace("recv", header.payload_length, header.sequence_id, body);
        }
        payload.insert(payload.end(), body.begin(), body.end());
        buffer_.erase(buffer_.begin(), buffer_.begin() + static_cast<std::ptrdiff_t>(frame_size));

        sequence_id_ = static_cast<std::uint8_t>(sequence_id_ + 1);

        // 0xFFFFFF 길이 패킷 뒤에는 연속 패킷이 온다
        if (header.payload_length < kMaxPacketPayload) {
            break;
        }
    }
    co_return payload;
}

auto PacketChannel::write_payload(std::span<const std::uint8_t> payload)
    -> boost::asio::awaitable<std::expected<void, Error>>
{
    if (broken_) {
        co_return std::unexpected(Error{ErrorCode::kIo, "connection is closed", {}});
    }

    if (debug_) {
        trace("send", static_cast<std::uint32_t>(std::min<std::size_t>(payload.size(), kMaxPacketPayload)),
              sequence_id_, payload);
    }

    const auto frames = encode_packets(payload, sequence_id_);
    if (auto written = co_await transport_.write_all(frames); !written) {
        co_return std::unexpected(fail(std::move(written.error())));
    }
    co_return std::expected<void, Error>{};
}

void PacketChannel::close() noexcept {
    broken_ = true;
    buffer_.clear();
    transport_.close();
}

auto PacketChannel::fill(std::size_t count) -> boost::asio::awaitable<std::expected<void, Error>> {
    std::array<std::uint8_t, kReadChunkSize> chunk{};
    while (buffer_.size() < count) {
        auto n = co_await transport_.read_some(chunk);
        if (!n) {
            co_return std::unexpected(std::move(n.error()));
        }
        if (*n == 0) {
            co_return std::unexpected(Error{ErrorCode::kIo, "connection closed by server", {}});
        }
        buffer_.insert(buffer_.end(), chunk.begin(), chunk.begin() + static_cast<std::ptrdiff_t>(*n));
    }
    co_return std::expected<void, Error>{};
}

auto PacketChannel::fail(Error error) -> Error {
    if (!broken_) {
        spdlog::debug("[channel] closing after {} error: {} ({})",
                      error_code_name(error.code), error.message, error.context);
    }
    close();
    return error;
}

void PacketChannel::trace(std::string_view              direction,
                          std::uint32_t                 length,
                          std::uint8_t                  sequence,
                          std::span<const std::uint8_t> payload) const
{
    spdlog::debug("[packet] {} len={} seq={} data=[{}]", direction, length, sequence, hex_head(payload));
}
