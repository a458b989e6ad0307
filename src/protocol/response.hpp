#pragma once

#include "common/types.hpp"
#include "protocol/column_type.hpp"

#include <cstdint>
#include <expected>
#include <span>
#include <string>

// ---------------------------------------------------------------------------
// response.hpp
//
// 서버 응답 패킷(OK / ERR / EOF / column definition / COM_STMT_PREPARE OK)
// 디코더. 소켓과 무관한 순수 함수.
//
//   OK  : [0x00 | 0xFE][lenenc affected_rows][lenenc last_insert_id]
//         [2B status][2B warnings][info...]
//   ERR : [0xFF][2B code]['#'][5B sql_state][message...]
//   EOF : [0xFE][2B warnings][2B status]   (payload < 9)
// ---------------------------------------------------------------------------

inline constexpr std::uint8_t kOkHeader  = 0x00;
inline constexpr std::uint8_t kErrHeader = 0xFF;
inline constexpr std::uint8_t kEofHeader = 0xFE;

// ---------------------------------------------------------------------------
// ResponseKind
//   커맨드 응답 첫 패킷의 분류.
// ---------------------------------------------------------------------------
enum class ResponseKind : std::uint8_t {
    kOk,
    kError,
    kEof,
    kLocalInfile,   // 0xFB — LOCAL INFILE 요청 (지원하지 않음)
    kResultSet,     // lenenc column count
};

struct OkPacket {
    std::uint64_t affected_rows{0};
    std::uint64_t last_insert_id{0};
    std::uint16_t status_flags{0};
    std::uint16_t warnings{0};
    std::string   info{};
};

struct ErrPacket {
    std::uint16_t error_code{0};
    std::string   sql_state{};
    std::string   message{};
};

struct EofPacket {
    std::uint16_t warnings{0};
    std::uint16_t status_flags{0};
};

// ---------------------------------------------------------------------------
// ColumnDefinition (Protocol::ColumnDefinition41)
// ---------------------------------------------------------------------------
struct ColumnDefinition {
    std::string   catalog{};
    std::string   schema{};
    std::string   table{};
    std::string   org_table{};
    std::string   name{};
    std::string   org_name{};
    std::uint16_t charset{0};
    std::uint32_t column_length{0};
    ColumnType    type{ColumnType::kNull};
    std::uint16_t flags{0};
    std::uint8_t  decimals{0};

    [[nodiscard]] bool is_unsigned() const noexcept {
        return (flags & column_flag::kUnsigned) != 0;
    }
    [[nodiscard]] bool is_nullable() const noexcept {
        return (flags & column_flag::kNotNull) == 0;
    }
    [[nodiscard]] bool is_binary() const noexcept {
        return charset == kBinaryCharset;
    }
    [[nodiscard]] auto type_name() const noexcept -> std::string_view {
        return column_type_name(type, is_unsigned());
    }
};

// ---------------------------------------------------------------------------
// PrepareOk (COM_STMT_PREPARE_OK)
//   [0x00][4B statement_id][2B num_columns][2B num_params][1B filler][2B warnings]
// ---------------------------------------------------------------------------
struct PrepareOk {
    std::uint32_t statement_id{0};
    std::uint16_t num_columns{0};
    std::uint16_t num_params{0};
    std::uint16_t warnings{0};
};

// 첫 바이트 + payload 길이로 커맨드 응답을 분류한다.
[[nodiscard]] auto classify_response(std::span<const std::uint8_t> payload) noexcept
    -> ResponseKind;

// ---------------------------------------------------------------------------
// is_result_terminator
//   result set row 스트림의 종료 표식인지 판별한다.
//   deprecate_eof=false : 0xFE + payload < 9   (EOF 패킷)
//   deprecate_eof=true  : 0xFE + payload < 0xFFFFFF (OK 패킷)
//   0xFE 로 시작하는 텍스트 row(lenenc 8바이트 길이)와 구분하기 위해 길이를 본다.
// ---------------------------------------------------------------------------
[[nodiscard]] bool is_result_terminator(std::span<const std::uint8_t> payload,
                                        bool                          deprecate_eof) noexcept;

[[nodiscard]] auto parse_ok_packet(std::span<const std::uint8_t> payload)
    -> std::expected<OkPacket, Error>;

[[nodiscard]] auto parse_err_packet(std::span<const std::uint8_t> payload)
    -> std::expected<ErrPacket, Error>;

[[nodiscard]] auto parse_eof_packet(std::span<const std::uint8_t> payload)
    -> std::expected<EofPacket, Error>;

[[nodiscard]] auto parse_column_definition(std::span<const std::uint8_t> payload)
    -> std::expected<ColumnDefinition, Error>;

[[nodiscard]] auto parse_prepare_ok(std::span<const std::uint8_t> payload)
    -> std::expected<PrepareOk, Error>;

// ERR 패킷 → Error. code 는 호출 단계에 따라 kServer / kAuthentication.
[[nodiscard]] auto to_error(const ErrPacket& err, ErrorCode code) -> Error;

// ERR payload 를 바로 Error 로 변환한다. 파싱 실패 시 kFraming.
[[nodiscard]] auto error_from_payload(std::span<const std::uint8_t> payload, ErrorCode code)
    -> Error;
