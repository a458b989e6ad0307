#include "protocol/command.hpp"

#include "protocol/codec.hpp"

#include <bit>
#include <type_traits>
#include <variant>

// ---------------------------------------------------------------------------
// 커맨드 payload 빌더 — 구현
// ---------------------------------------------------------------------------

namespace {

auto build_with_text(CommandType type, std::string_view text) -> Bytes {
    PacketWriter w(1 + text.size());
    w.write_u8(static_cast<std::uint8_t>(type));
    w.write_string(text);
    return w.release();
}

auto build_with_statement_id(CommandType type, std::uint32_t statement_id) -> Bytes {
    PacketWriter w(5);
    w.write_u8(static_cast<std::uint8_t>(type));
    w.write_u32(statement_id);
    return w.release();
}

void write_date_fields(PacketWriter& w, std::uint16_t year, std::uint8_t month, std::uint8_t day) {
    w.write_u16(year);
    w.write_u8(month);
    w.write_u8(day);
}

// binary 프로토콜 값 인코딩. NULL 은 bitmap 으로만 표현되므로 여기 오지 않는다.
void write_binary_value(PacketWriter& w, const FieldValue& value) {
    std::visit([&w](const auto& v) {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::int64_t>) {
            w.write_u64(static_cast<std::uint64_t>(v));
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
            w.write_u64(v);
        } else if constexpr (std::is_same_v<T, float>) {
            w.write_u32(std::bit_cast<std::uint32_t>(v));
        } else if constexpr (std::is_same_v<T, double>) {
            w.write_u64(std::bit_cast<std::uint64_t>(v));
        } else if constexpr (std::is_same_v<T, std::string>) {
            w.write_lenenc_string(v);
        } else if constexpr (std::is_same_v<T, Bytes>) {
            w.write_lenenc_bytes(v);
        } else if constexpr (std::is_same_v<T, Date>) {
            w.write_u8(4);
            write_date_fields(w, v.year, v.month, v.day);
        } else if constexpr (std::is_same_v<T, DateTime>) {
            const bool has_micro = v.microsecond != 0;
            w.write_u8(has_micro ? 11 : 7);
            write_date_fields(w, v.year, v.month, v.day);
            w.write_u8(v.hour);
            w.write_u8(v.minute);
            w.write_u8(v.second);
            if (has_micro) {
                w.write_u32(v.microsecond);
            }
        } else if constexpr (std::is_same_v<T, Time>) {
            const bool has_micro = v.microsecond != 0;
            w.write_u8(has_micro ? 12 : 8);
            w.write_u8(v.negative ? 1 : 0);
            w.write_u32(v.days);
            w.write_u8(v.hour);
            w.write_u8(v.minute);
            w.write_u8(v.second);
            if (has_micro) {
                w.write_u32(v.microsecond);
            }
        }
    }, value);
}

}  // namespace

auto build_simple_command(CommandType type) -> Bytes {
    return Bytes{static_cast<std::uint8_t>(type)};
}

auto build_query(std::string_view sql) -> Bytes {
    return build_with_text(CommandType::kComQuery, sql);
}

auto build_init_db(std::string_view database) -> Bytes {
    return build_with_text(CommandType::kComInitDb, database);
}

auto build_stmt_prepare(std::string_view sql) -> Bytes {
    return build_with_text(CommandType::kComStmtPrepare, sql);
}

auto build_stmt_close(std::uint32_t statement_id) -> Bytes {
    return build_with_statement_id(CommandType::kComStmtClose, statement_id);
}

auto build_stmt_reset(std::uint32_t statement_id) -> Bytes {
    return build_with_statement_id(CommandType::kComStmtReset, statement_id);
}

auto parameter_type(const FieldValue& value) noexcept -> ParameterType {
    return std::visit([](const auto& v) -> ParameterType {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::int64_t>) {
            return {ColumnType::kLongLong, false};
        } else if constexpr (std::is_same_v<T, std::uint64_t>) {
            return {ColumnType::kLongLong, true};
        } else if constexpr (std::is_same_v<T, float>) {
            return {ColumnType::kFloat, false};
        } else if constexpr (std::is_same_v<T, double>) {
            return {ColumnType::kDouble, false};
        } else if constexpr (std::is_same_v<T, std::string>) {
            return {ColumnType::kVarString, false};
        } else if constexpr (std::is_same_v<T, Bytes>) {
            return {ColumnType::kBlob, false};
        } else if constexpr (std::is_same_v<T, Date>) {
            return {ColumnType::kDate, false};
        } else if constexpr (std::is_same_v<T, DateTime>) {
            return {ColumnType::kDateTime, false};
        } else if constexpr (std::is_same_v<T, Time>) {
            return {ColumnType::kTime, false};
        } else {
            return {ColumnType::kNull, false};
        }
    }, value);
}

auto build_stmt_execute(std::uint32_t statement_id, std::span<const FieldValue> params) -> Bytes {
    PacketWriter w(16 + params.size() * 10);
    w.write_u8(static_cast<std::uint8_t>(CommandType::kComStmtExecute));
    w.write_u32(statement_id);
    w.write_u8(0x00);   // CURSOR_TYPE_NO_CURSOR
    w.write_u32(1);     // iteration count

    if (params.empty()) {
        return w.release();
    }

    // NULL bitmap (offset 0)
    Bytes bitmap((params.size() + 7) / 8, 0x00);
    for (std::size_t i = 0; i < params.size(); ++i) {
        if (is_null(params[i])) {
            bitmap[i / 8] |= static_cast<std::uint8_t>(1U << (i % 8));
        }
    }
    w.write_bytes(bitmap);

    w.write_u8(0x01);  // new_params_bound_flag
    for (const auto& param : params) {
        const auto pt = parameter_type(param);
        w.write_u8(static_cast<std::uint8_t>(pt.type));
        w.write_u8(pt.is_unsigned ? 0x80 : 0x00);
    }

    for (const auto& param : params) {
        if (!is_null(param)) {
            write_binary_value(w, param);
        }
    }
    return w.release();
}
