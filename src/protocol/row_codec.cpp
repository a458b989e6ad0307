#include "protocol/row_codec.hpp"

#include "protocol/codec.hpp"

#include <fmt/format.h>

#include <bit>
#include <charconv>
#include <string_view>

namespace {

bool is_integer_type(ColumnType type) noexcept {
    switch (type) {
        case ColumnType::kTiny:
        case ColumnType::kShort:
        case ColumnType::kLong:
        case ColumnType::kInt24:
        case ColumnType::kLongLong:
        case ColumnType::kYear:
            return true;
        default:
            return false;
    }
}

// BLOB/TEXT 계열: binary 문자셋이면 Bytes, 아니면 문자열
bool is_bytes_column(const ColumnDefinition& col) noexcept {
    switch (col.type) {
        case ColumnType::kBit:
        case ColumnType::kGeometry:
            return true;
        case ColumnType::kTinyBlob:
        case ColumnType::kMediumBlob:
        case ColumnType::kLongBlob:
        case ColumnType::kBlob:
        case ColumnType::kVarString:
        case ColumnType::kVarchar:
        case ColumnType::kString:
            return col.is_binary();
        default:
            return false;
    }
}

auto string_or_bytes(const ColumnDefinition& col, std::span<const std::uint8_t> raw) -> FieldValue {
    if (is_bytes_column(col)) {
        return Bytes(raw.begin(), raw.end());
    }
    return std::string(raw.begin(), raw.end());
}

template <typename T>
bool parse_number(std::string_view text, T& out) noexcept {
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
    return ec == std::errc{} && ptr == text.data() + text.size();
}

// 텍스트 셀 하나를 컬럼 타입에 맞춰 변환한다.
auto convert_text_cell(const ColumnDefinition& col, std::span<const std::uint8_t> raw) -> FieldValue {
    const std::string_view text(reinterpret_cast<const char*>(raw.data()), raw.size());

    if (is_integer_type(col.type)) {
        if (col.is_unsigned()) {
            std::uint64_t v = 0;
            if (parse_number(text, v)) {
                return v;
            }
        } else {
            std::int64_t v = 0;
            if (parse_number(text, v)) {
                return v;
            }
        }
        return std::string(text);
    }

    switch (col.type) {
        case ColumnType::kFloat: {
            float v = 0;
            if (parse_number(text, v)) {
                return v;
            }
            return std::string(text);
        }
        case ColumnType::kDouble: {
            double v = 0;
            if (parse_number(text, v)) {
                return v;
            }
            return std::string(text);
        }
        case ColumnType::kDate: {
            Date v;
            if (parse_date(text, v)) {
                return v;
            }
            return std::string(text);
        }
        case ColumnType::kDateTime:
        case ColumnType::kTimestamp: {
            DateTime v;
            if (parse_datetime(text, v)) {
                return v;
            }
            return std::string(text);
        }
        case ColumnType::kTime: {
            Time v;
            if (parse_time(text, v)) {
                return v;
            }
            return std::string(text);
        }
        case ColumnType::kNull:
            return std::monostate{};
        default:
            return string_or_bytes(col, raw);
    }
}

auto read_binary_date(PacketReader& r, ColumnType type) -> std::expected<FieldValue, Error> {
    auto len = r.read_u8();
    if (!len) {
        return std::unexpected(std::move(len.error()));
    }
    if (*len != 0 && *len != 4 && *len != 7 && *len != 11) {
        return std::unexpected(Error{
            ErrorCode::kFraming,
            "invalid binary date length",
            fmt::format("length={}", *len)
        });
    }
    if (r.remaining() < *len) {
        return std::unexpected(Error{ErrorCode::kFraming, "truncated binary date", {}});
    }

    DateTime dt;
    if (*len >= 4) {
        dt.year  = *r.read_u16();
        dt.month = *r.read_u8();
        dt.day   = *r.read_u8();
    }
    if (*len >= 7) {
        dt.hour   = *r.read_u8();
        dt.minute = *r.read_u8();
        dt.second = *r.read_u8();
    }
    if (*len == 11) {
        dt.microsecond = *r.read_u32();
    }

    if (type == ColumnType::kDate) {
        return Date{dt.year, dt.month, dt.day};
    }
    return dt;
}

auto read_binary_time(PacketReader& r) -> std::expected<FieldValue, Error> {
    auto len = r.read_u8();
    if (!len) {
        return std::unexpected(std::move(len.error()));
    }
    if (*len != 0 && *len != 8 && *len != 12) {
        return std::unexpected(Error{
            ErrorCode::kFraming,
            "invalid binary time length",
            fmt::format("length={}", *len)
        });
    }
    if (r.remaining() < *len) {
        return std::unexpected(Error{ErrorCode::kFraming, "truncated binary time", {}});
    }

    Time t;
    if (*len >= 8) {
        t.negative = *r.read_u8() != 0;
        t.days     = *r.read_u32();
        t.hour     = *r.read_u8();
        t.minute   = *r.read_u8();
        t.second   = *r.read_u8();
    }
    if (*len == 12) {
        t.microsecond = *r.read_u32();
    }
    return t;
}

// 고정 폭 정수를 읽어 signed/unsigned FieldValue 로 만든다.
template <typename Unsigned, typename Signed>
auto to_int_value(bool is_unsigned, std::expected<Unsigned, Error> raw)
    -> std::expected<FieldValue, Error>
{
    if (!raw) {
        return std::unexpected(std::move(raw.error()));
    }
    if (is_unsigned) {
        return FieldValue{static_cast<std::uint64_t>(*raw)};
    }
    return FieldValue{static_cast<std::int64_t>(static_cast<Signed>(*raw))};
}

auto read_binary_cell(PacketReader& r, const ColumnDefinition& col)
    -> std::expected<FieldValue, Error>
{
    switch (col.type) {
        case ColumnType::kTiny:
            return to_int_value<std::uint8_t, std::int8_t>(col.is_unsigned(), r.read_u8());
        case ColumnType::kShort:
        case ColumnType::kYear:
            return to_int_value<std::uint16_t, std::int16_t>(col.is_unsigned(), r.read_u16());
        case ColumnType::kLong:
        case ColumnType::kInt24:
            return to_int_value<std::uint32_t, std::int32_t>(col.is_unsigned(), r.read_u32());
        case ColumnType::kLongLong:
            return to_int_value<std::uint64_t, std::int64_t>(col.is_unsigned(), r.read_u64());
        case ColumnType::kFloat: {
            auto raw = r.read_u32();
            if (!raw) {
                return std::unexpected(std::move(raw.error()));
            }
            return FieldValue{std::bit_cast<float>(*raw)};
        }
        case ColumnType::kDouble: {
            auto raw = r.read_u64();
            if (!raw) {
                return std::unexpected(std::move(raw.error()));
            }
            return FieldValue{std::bit_cast<double>(*raw)};
        }
        case ColumnType::kDate:
        case ColumnType::kDateTime:
        case ColumnType::kTimestamp:
            return read_binary_date(r, col.type);
        case ColumnType::kTime:
            return read_binary_time(r);
        case ColumnType::kNull:
            return FieldValue{};
        default: {
            auto raw = r.read_lenenc_bytes();
            if (!raw) {
                return std::unexpected(std::move(raw.error()));
            }
            return string_or_bytes(col, *raw);
        }
    }
}

}  // namespace

auto decode_text_row(std::span<const std::uint8_t>        payload,
                     const std::vector<ColumnDefinition>& columns)
    -> std::expected<Row, Error>
{
    PacketReader r(payload);
    Row          row;
    row.reserve(columns.size());

    for (const auto& col : columns) {
        if (r.empty()) {
            return std::unexpected(Error{
                ErrorCode::kFraming,
                "text row has fewer values than columns",
                fmt::format("columns={}, decoded={}", columns.size(), row.size())
            });
        }
        if (r.peek() == kLenEncNull) {
            (void)r.skip(1);
            row.emplace_back(std::monostate{});
            continue;
        }
        auto raw = r.read_lenenc_bytes();
        if (!raw) {
            return std::unexpected(std::move(raw.error()));
        }
        row.push_back(convert_text_cell(col, *raw));
    }

    if (!r.empty()) {
        return std::unexpected(Error{
            ErrorCode::kFraming,
            "text row has trailing bytes",
            fmt::format("remaining={}", r.remaining())
        });
    }
    return row;
}

auto decode_binary_row(std::span<const std::uint8_t>        payload,
                       const std::vector<ColumnDefinition>& columns)
    -> std::expected<Row, Error>
{
    PacketReader r(payload);

    auto header = r.read_u8();
    if (!header) {
        return std::unexpected(std::move(header.error()));
    }
    if (*header != 0x00) {
        return std::unexpected(Error{
            ErrorCode::kFraming,
            "invalid binary row header",
            fmt::format("byte=0x{:02X}", *header)
        });
    }

    // NULL bitmap: 처음 2비트는 예약 (offset 2)
    const std::size_t bitmap_len = (columns.size() + 7 + 2) / 8;
    auto bitmap = r.read_bytes(bitmap_len);
    if (!bitmap) {
        return std::unexpected(std::move(bitmap.error()));
    }

    Row row;
    row.reserve(columns.size());
    for (std::size_t i = 0; i < columns.size(); ++i) {
        const std::size_t bit = i + 2;
        if (((*bitmap)[bit / 8] >> (bit % 8)) & 0x01U) {
            row.emplace_back(std::monostate{});
            continue;
        }
        auto cell = read_binary_cell(r, columns[i]);
        if (!cell) {
            cell.error().context += fmt::format(" (column '{}')", columns[i].name);
            return std::unexpected(std::move(cell.error()));
        }
        row.push_back(std::move(*cell));
    }
    return row;
}

auto decode_row(RowFormat                            format,
                std::span<const std::uint8_t>        payload,
                const std::vector<ColumnDefinition>& columns)
    -> std::expected<Row, Error>
{
    return format == RowFormat::kText ? decode_text_row(payload, columns)
                                      : decode_binary_row(payload, columns);
}
