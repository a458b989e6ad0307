#pragma once

#include "common/types.hpp"

#include <cstddef>
#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>

// ---------------------------------------------------------------------------
// codec.hpp
//
// 패킷 payload 내부 필드 단위 인코더/디코더.
//
//   고정 길이 정수   : 1/2/3/4/8 바이트 리틀 엔디언
//   length-encoded   : < 251 → 1바이트
//                      0xFC + 2바이트 / 0xFD + 3바이트 / 0xFE + 8바이트
//                      0xFB(NULL 표식), 0xFF(ERR 헤더)는 정수로 해석 불가
//   문자열           : NUL 종결, length-encoded, 고정 길이, 패킷 끝까지
// ---------------------------------------------------------------------------

// length-encoded 정수 표식 바이트
inline constexpr std::uint8_t kLenEncNull   = 0xFB;
inline constexpr std::uint8_t kLenEnc2Bytes = 0xFC;
inline constexpr std::uint8_t kLenEnc3Bytes = 0xFD;
inline constexpr std::uint8_t kLenEnc8Bytes = 0xFE;

// length-encoded 정수 인코딩 시 필요한 바이트 수 (prefix 포함)
[[nodiscard]] constexpr auto lenenc_int_size(std::uint64_t value) noexcept -> std::size_t {
    if (value < 251U)        { return 1; }
    if (value < 0x10000U)    { return 3; }
    if (value < 0x1000000U)  { return 4; }
    return 9;
}

// ---------------------------------------------------------------------------
// PacketWriter
//   payload 버퍼에 필드를 순서대로 추가한다.
// ---------------------------------------------------------------------------
class PacketWriter {
public:
    PacketWriter() = default;
    explicit PacketWriter(std::size_t reserve);

    void write_u8(std::uint8_t value);
    void write_u16(std::uint16_t value);
    void write_u24(std::uint32_t value);
    void write_u32(std::uint32_t value);
    void write_u64(std::uint64_t value);
    void write_lenenc_int(std::uint64_t value);

    void write_bytes(std::span<const std::uint8_t> data);
    void write_string(std::string_view str);            // 길이 정보 없이 그대로
    void write_null_terminated(std::string_view str);
    void write_lenenc_string(std::string_view str);
    void write_lenenc_bytes(std::span<const std::uint8_t> data);
    void write_zeros(std::size_t count);

    [[nodiscard]] auto size() const noexcept -> std::size_t { return buffer_.size(); }
    [[nodiscard]] auto view() const noexcept -> std::span<const std::uint8_t> { return buffer_; }
    [[nodiscard]] auto release() noexcept -> Bytes { return std::move(buffer_); }

private:
    Bytes buffer_{};
};

// ---------------------------------------------------------------------------
// PacketReader
//   payload 를 앞에서부터 소비하며 필드를 읽는다.
//   모든 읽기는 남은 바이트가 부족하면 std::unexpected(Error{kFraming}) 를 반환한다.
//   reader 는 payload 를 소유하지 않는다.
// ---------------------------------------------------------------------------
class PacketReader {
public:
    explicit PacketReader(std::span<const std::uint8_t> payload) noexcept;

    auto read_u8()  -> std::expected<std::uint8_t, Error>;
    auto read_u16() -> std::expected<std::uint16_t, Error>;
    auto read_u24() -> std::expected<std::uint32_t, Error>;
    auto read_u32() -> std::expected<std::uint32_t, Error>;
    auto read_u64() -> std::expected<std::uint64_t, Error>;

    // 0xFB / 0xFF 로 시작하면 kFraming
    auto read_lenenc_int() -> std::expected<std::uint64_t, Error>;

    auto read_bytes(std::size_t count) -> std::expected<std::span<const std::uint8_t>, Error>;
    auto read_string(std::size_t count) -> std::expected<std::string, Error>;
    auto read_null_terminated() -> std::expected<std::string, Error>;
    auto read_lenenc_string() -> std::expected<std::string, Error>;
    auto read_lenenc_bytes() -> std::expected<std::span<const std::uint8_t>, Error>;
    auto read_rest() noexcept -> std::span<const std::uint8_t>;
    auto read_rest_string() -> std::string;

    auto skip(std::size_t count) -> std::expected<void, Error>;

    [[nodiscard]] auto peek() const noexcept -> std::uint8_t;  // 남은 바이트가 없으면 0
    [[nodiscard]] auto remaining() const noexcept -> std::size_t;
    [[nodiscard]] auto empty() const noexcept -> bool { return remaining() == 0; }
    [[nodiscard]] auto position() const noexcept -> std::size_t { return pos_; }

private:
    auto require(std::size_t count, std::string_view what) const -> std::expected<void, Error>;

    std::span<const std::uint8_t> data_;
    std::size_t                   pos_{0};
};

// ---------------------------------------------------------------------------
// 편의 함수: 단일 length-encoded 정수 인코딩/디코딩
// ---------------------------------------------------------------------------
[[nodiscard]] auto encode_lenenc_int(std::uint64_t value) -> Bytes;
[[nodiscard]] auto decode_lenenc_int(std::span<const std::uint8_t> data)
    -> std::expected<std::uint64_t, Error>;
