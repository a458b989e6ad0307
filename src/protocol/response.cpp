#include "protocol/response.hpp"

#include "protocol/codec.hpp"
#include "protocol/mysql_packet.hpp"

#include <fmt/format.h>

#include <initializer_list>

// ---------------------------------------------------------------------------
// 응답 패킷 디코더 — 구현
// ---------------------------------------------------------------------------

namespace {

auto unexpected_header(std::string_view what, std::span<const std::uint8_t> payload) -> Error {
    return Error{
        ErrorCode::kFraming,
        fmt::format("unexpected {} header", what),
        payload.empty() ? std::string{"empty payload"}
                        : fmt::format("first byte=0x{:02X}, length={}", payload[0], payload.size())
    };
}

}  // namespace

auto classify_response(std::span<const std::uint8_t> payload) noexcept -> ResponseKind {
    if (payload.empty()) {
        return ResponseKind::kResultSet;
    }
    switch (payload[0]) {
        case kOkHeader:
            return ResponseKind::kOk;
        case kErrHeader:
            return ResponseKind::kError;
        case kEofHeader:
            // payload < 9 → EOF, 그 외는 lenenc 8바이트 column count
            return payload.size() < 9 ? ResponseKind::kEof : ResponseKind::kResultSet;
        case kLenEncNull:
            return ResponseKind::kLocalInfile;
        default:
            return ResponseKind::kResultSet;
    }
}

bool is_result_terminator(std::span<const std::uint8_t> payload, bool deprecate_eof) noexcept {
    if (payload.empty() || payload[0] != kEofHeader) {
        return false;
    }
    return deprecate_eof ? payload.size() < kMaxPacketPayload : payload.size() < 9;
}

auto parse_ok_packet(std::span<const std::uint8_t> payload) -> std::expected<OkPacket, Error> {
    PacketReader r(payload);

    auto header = r.read_u8();
    if (!header) {
        return std::unexpected(std::move(header.error()));
    }
    if (*header != kOkHeader && *header != kEofHeader) {
        return std::unexpected(unexpected_header("OK", payload));
    }

    OkPacket ok;
    auto affected = r.read_lenenc_int();
    if (!affected) {
        return std::unexpected(std::move(affected.error()));
    }
    ok.affected_rows = *affected;

    auto insert_id = r.read_lenenc_int();
    if (!insert_id) {
        return std::unexpected(std::move(insert_id.error()));
    }
    ok.last_insert_id = *insert_id;

    // status / warnings 는 PROTOCOL_41 에서 항상 존재하지만
    // 일부 서버 구현은 생략하므로 남은 바이트가 있을 때만 읽는다.
    if (r.remaining() >= 4) {
        ok.status_flags = *r.read_u16();
        ok.warnings     = *r.read_u16();
    }
    ok.info = r.read_rest_string();
    return ok;
}

auto parse_err_packet(std::span<const std::uint8_t> payload) -> std::expected<ErrPacket, Error> {
    PacketReader r(payload);

    auto header = r.read_u8();
    if (!header) {
        return std::unexpected(std::move(header.error()));
    }
    if (*header != kErrHeader) {
        return std::unexpected(unexpected_header("ERR", payload));
    }

    auto code = r.read_u16();
    if (!code) {
        return std::unexpected(std::move(code.error()));
    }

    ErrPacket err;
    err.error_code = *code;

    // '#' + 5바이트 sql_state (PROTOCOL_41)
    if (r.peek() == static_cast<std::uint8_t>('#') && r.remaining() >= 6) {
        (void)r.skip(1);
        err.sql_state = *r.read_string(5);
    }
    err.message = r.read_rest_string();
    return err;
}

auto parse_eof_packet(std::span<const std::uint8_t> payload) -> std::expected<EofPacket, Error> {
    if (payload.empty() || payload[0] != kEofHeader || payload.size() >= 9) {
        return std::unexpected(unexpected_header("EOF", payload));
    }

    PacketReader r(payload.subspan(1));
    EofPacket eof;
    if (r.remaining() >= 4) {
        eof.warnings     = *r.read_u16();
        eof.status_flags = *r.read_u16();
    }
    return eof;
}

auto parse_column_definition(std::span<const std::uint8_t> payload)
    -> std::expected<ColumnDefinition, Error>
{
    PacketReader     r(payload);
    ColumnDefinition col;

    for (std::string* field : {&col.catalog, &col.schema, &col.table,
                               &col.org_table, &col.name, &col.org_name}) {
        auto value = r.read_lenenc_string();
        if (!value) {
            return std::unexpected(std::move(value.error()));
        }
        *field = std::move(*value);
    }

    // 고정 길이 필드 블록 길이 (항상 0x0C)
    auto fixed_len = r.read_lenenc_int();
    if (!fixed_len) {
        return std::unexpected(std::move(fixed_len.error()));
    }
    if (*fixed_len < 10 || r.remaining() < 10) {
        return std::unexpected(Error{
            ErrorCode::kFraming,
            "truncated column definition",
            fmt::format("column='{}', fixed_length={}, remaining={}",
                        col.name, *fixed_len, r.remaining())
        });
    }

    col.charset       = *r.read_u16();
    col.column_length = *r.read_u32();
    col.type          = static_cast<ColumnType>(*r.read_u8());
    col.flags         = *r.read_u16();
    col.decimals      = *r.read_u8();
    return col;
}

auto parse_prepare_ok(std::span<const std::uint8_t> payload) -> std::expected<PrepareOk, Error> {
    if (payload.size() < 12 || payload[0] != kOkHeader) {
        return std::unexpected(unexpected_header("COM_STMT_PREPARE_OK", payload));
    }

    PacketReader r(payload.subspan(1));
    PrepareOk ok;
    ok.statement_id = *r.read_u32();
    ok.num_columns  = *r.read_u16();
    ok.num_params   = *r.read_u16();
    (void)r.skip(1);  // filler
    ok.warnings     = *r.read_u16();
    return ok;
}

auto to_error(const ErrPacket& err, ErrorCode code) -> Error {
    return Error{
        code,
        err.message,
        fmt::format("server error {} ({})", err.error_code, err.sql_state),
        err.error_code,
        err.sql_state
    };
}

auto error_from_payload(std::span<const std::uint8_t> payload, ErrorCode code) -> Error {
    auto err = parse_err_packet(payload);
    if (!err) {
        return std::move(err.error());
    }
    return to_error(*err, code);
}
