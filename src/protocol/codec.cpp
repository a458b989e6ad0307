#include "protocol/codec.hpp"

#include <fmt/format.h>

#include <algorithm>

// ---------------------------------------------------------------------------
// PacketWriter
// ---------------------------------------------------------------------------

PacketWriter::PacketWriter(std::size_t reserve) {
    buffer_.reserve(reserve);
}

void PacketWriter::write_u8(std::uint8_t value) {
    buffer_.push_back(value);
}

void PacketWriter::write_u16(std::uint16_t value) {
    buffer_.push_back(static_cast<std::uint8_t>(value & 0xFFU));
    buffer_.push_back(static_cast<std::uint8_t>((value >> 8U) & 0xFFU));
}

void PacketWriter::write_u24(std::uint32_t value) {
    buffer_.push_back(static_cast<std::uint8_t>(value & 0xFFU));
    buffer_.push_back(static_cast<std::uint8_t>((value >> 8U) & 0xFFU));
    buffer_.push_back(static_cast<std::uint8_t>((value >> 16U) & 0xFFU));
}

void PacketWriter::write_u32(std::uint32_t value) {
    for (unsigned shift = 0; shift < 32U; shift += 8U) {
        buffer_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFU));
    }
}

void PacketWriter::write_u64(std::uint64_t value) {
    for (unsigned shift = 0; shift < 64U; shift += 8U) {
        buffer_.push_back(static_cast<std::uint8_t>((value >> shift) & 0xFFU));
    }
}

void PacketWriter::write_lenenc_int(std::uint64_t value) {
    if (value < 251U) {
        write_u8(static_cast<std::uint8_t>(value));
    } else if (value < 0x10000U) {
        write_u8(kLenEnc2Bytes);
        write_u16(static_cast<std::uint16_t>(value));
    } else if (value < 0x1000000U) {
        write_u8(kLenEnc3Bytes);
        write_u24(static_cast<std::uint32_t>(value));
    } else {
        write_u8(kLenEnc8Bytes);
        write_u64(value);
    }
}

void PacketWriter::write_bytes(std::span<const std::uint8_t> data) {
    buffer_.insert(buffer_.end(), data.begin(), data.end());
}

void PacketWriter::write_string(std::string_view str) {
    buffer_.insert(buffer_.end(), str.begin(), str.end());
}

void PacketWriter::write_null_terminated(std::string_view str) {
    write_string(str);
    buffer_.push_back(0x00);
}

void PacketWriter::write_lenenc_string(std::string_view str) {
    write_lenenc_int(str.size());
    write_string(str);
}

void PacketWriter::write_lenenc_bytes(std::span<const std::uint8_t> data) {
    write_lenenc_int(data.size());
    write_bytes(data);
}

void PacketWriter::write_zeros(std::size_t count) {
    buffer_.insert(buffer_.end(), count, 0x00);
}

// ---------------------------------------------------------------------------
// PacketReader
// ---------------------------------------------------------------------------

PacketReader::PacketReader(std::span<const std::uint8_t> payload) noexcept
    : data_(payload)
{}

auto PacketReader::require(std::size_t count, std::string_view what) const
    -> std::expected<void, Error>
{
    if (remaining() < count) {
        return std::unexpected(Error{
            ErrorCode::kFraming,
            fmt::format("truncated {}", what),
            fmt::format("offset={}, need={}, available={}", pos_, count, remaining())
        });
    }
    return {};
}

auto PacketReader::read_u8() -> std::expected<std::uint8_t, Error> {
    if (auto ok = require(1, "int<1>"); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    return data_[pos_++];
}

auto PacketReader::read_u16() -> std::expected<std::uint16_t, Error> {
    if (auto ok = require(2, "int<2>"); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    const auto value = static_cast<std::uint16_t>(
        data_[pos_] | (static_cast<std::uint16_t>(data_[pos_ + 1]) << 8U));
    pos_ += 2;
    return value;
}

auto PacketReader::read_u24() -> std::expected<std::uint32_t, Error> {
    if (auto ok = require(3, "int<3>"); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    const std::uint32_t value =
        static_cast<std::uint32_t>(data_[pos_])
        | (static_cast<std::uint32_t>(data_[pos_ + 1]) << 8U)
        | (static_cast<std::uint32_t>(data_[pos_ + 2]) << 16U);
    pos_ += 3;
    return value;
}

auto PacketReader::read_u32() -> std::expected<std::uint32_t, Error> {
    if (auto ok = require(4, "int<4>"); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    std::uint32_t value = 0;
    for (unsigned i = 0; i < 4U; ++i) {
        value |= static_cast<std::uint32_t>(data_[pos_ + i]) << (8U * i);
    }
    pos_ += 4;
    return value;
}

auto PacketReader::read_u64() -> std::expected<std::uint64_t, Error> {
    if (auto ok = require(8, "int<8>"); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    std::uint64_t value = 0;
    for (unsigned i = 0; i < 8U; ++i) {
        value |= static_cast<std::uint64_t>(data_[pos_ + i]) << (8U * i);
    }
    pos_ += 8;
    return value;
}

auto PacketReader::read_lenenc_int() -> std::expected<std::uint64_t, Error> {
    auto first = read_u8();
    if (!first) {
        return std::unexpected(std::move(first.error()));
    }

    switch (*first) {
        case kLenEnc2Bytes: {
            auto v = read_u16();
            if (!v) { return std::unexpected(std::move(v.error())); }
            return static_cast<std::uint64_t>(*v);
        }
        case kLenEnc3Bytes: {
            auto v = read_u24();
            if (!v) { return std::unexpected(std::move(v.error())); }
            return static_cast<std::uint64_t>(*v);
        }
        case kLenEnc8Bytes:
            return read_u64();
        case kLenEncNull:
        case 0xFF:
            // 0xFB 는 NULL 표식, 0xFF 는 ERR 헤더 — 정수 값이 될 수 없다
            --pos_;
            return std::unexpected(Error{
                ErrorCode::kFraming,
                "invalid length-encoded integer prefix",
                fmt::format("offset={}, byte=0x{:02X}", pos_, *first)
            });
        default:
            return static_cast<std::uint64_t>(*first);
    }
}

auto PacketReader::read_bytes(std::size_t count)
    -> std::expected<std::span<const std::uint8_t>, Error>
{
    if (auto ok = require(count, "byte string"); !ok) {
        return std::unexpected(std::move(ok.error()));
    }
    const auto out = data_.subspan(pos_, count);
    pos_ += count;
    return out;
}

auto PacketReader::read_string(std::size_t count) -> std::expected<std::string, Error> {
    auto bytes = read_bytes(count);
    if (!bytes) {
        return std::unexpected(std::move(bytes.error()));
    }
    return std::string(bytes->begin(), bytes->end());
}

auto PacketReader::read_null_terminated() -> std::expected<std::string, Error> {
    const auto rest = data_.subspan(pos_);
    const auto nul  = std::find(rest.begin(), rest.end(), std::uint8_t{0x00});
    if (nul == rest.end()) {
        return std::unexpected(Error{
            ErrorCode::kFraming,
            "missing NUL terminator",
            fmt::format("offset={}", pos_)
        });
    }
    std::string out(rest.begin(), nul);
    pos_ += out.size() + 1;
    return out;
}

auto PacketReader::read_lenenc_string() -> std::expected<std::string, Error> {
    auto bytes = read_lenenc_bytes();
    if (!bytes) {
        return std::unexpected(std::move(bytes.error()));
    }
    return std::string(bytes->begin(), bytes->end());
}

auto PacketReader::read_lenenc_bytes() -> std::expected<std::span<const std::uint8_t>, Error> {
    auto len = read_lenenc_int();
    if (!len) {
        return std::unexpected(std::move(len.error()));
    }
    return read_bytes(static_cast<std::size_t>(*len));
}

auto PacketReader::read_rest() noexcept -> std::span<const std::uint8_t> {
    const auto out = data_.subspan(pos_);
    pos_ = data_.size();
    return out;
}

auto PacketReader::read_rest_string() -> std::string {
    const auto rest = read_rest();
    return std::string(rest.begin(), rest.end());
}

auto PacketReader::skip(std::size_t count) -> std::expected<void, Error> {
    if (auto ok = require(count, "skipped field"); !ok) {
        return ok;
    }
    pos_ += count;
    return {};
}

auto PacketReader::peek() const noexcept -> std::uint8_t {
    return pos_ < data_.size() ? data_[pos_] : std::uint8_t{0};
}

auto PacketReader::remaining() const noexcept -> std::size_t {
    return data_.size() - pos_;
}

// ---------------------------------------------------------------------------
// 편의 함수
// ---------------------------------------------------------------------------

auto encode_lenenc_int(std::uint64_t value) -> Bytes {
    PacketWriter w(lenenc_int_size(value));
    w.write_lenenc_int(value);
    return w.release();
}

auto decode_lenenc_int(std::span<const std::uint8_t> data)
    -> std::expected<std::uint64_t, Error>
{
    PacketReader r(data);
    return r.read_lenenc_int();
}
