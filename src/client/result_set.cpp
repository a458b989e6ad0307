#include "client/result_set.hpp"

#include "client/connection.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <limits>
#include <type_traits>
#include <utility>

namespace {

auto usage_error(std::string message) -> Error {
    return Error{ErrorCode::kUsage, std::move(message)};
}

bool iequals(std::string_view lhs, std::string_view rhs) noexcept {
    return std::ranges::equal(lhs, rhs, [](char a, char b) {
        return std::tolower(static_cast<unsigned char>(a)) == std::tolower(static_cast<unsigned char>(b));
    });
}

template <typename T>
bool parse_full(std::string_view text, T& out) noexcept {
    const char* first = text.data();
    const char* last  = text.data() + text.size();
    auto [ptr, ec] = std::from_chars(first, last, out);
    return ec == std::errc{} && ptr == last;
}

// BIT 값 (big-endian, 최대 8바이트)
bool bit_value(const Bytes& raw, std::uint64_t& out) noexcept {
    if (raw.size() > 8) {
        return false;
    }
    out = 0;
    for (std::uint8_t b : raw) {
        out = (out << 8U) | b;
    }
    return true;
}

template <typename T, typename F>
bool float_to_integer(F value, T& out) noexcept {
    if (!std::isfinite(value)) {
        return false;
    }
    const auto truncated = std::trunc(static_cast<double>(value));
    const auto lo        = static_cast<double>(std::numeric_limits<T>::min());
    const auto hi        = static_cast<double>(std::numeric_limits<T>::max()) + 1.0;
    if (truncated < lo || truncated >= hi) {
        return false;
    }
    out = static_cast<T>(truncated);
    return true;
}

// 정수형 변환. 범위를 벗어나거나 숫자가 아니면 false
template <typename T>
bool to_integer(const FieldValue& value, bool is_bit, T& out) noexcept {
    if (const auto* v = std::get_if<std::int64_t>(&value)) {
        if (!std::in_range<T>(*v)) {
            return false;
        }
        out = static_cast<T>(*v);
        return true;
    }
    if (const auto* v = std::get_if<std::uint64_t>(&value)) {
        if (!std::in_range<T>(*v)) {
            return false;
        }
        out = static_cast<T>(*v);
        return true;
    }
    if (const auto* v = std::get_if<float>(&value)) {
        return float_to_integer(*v, out);
    }
    if (const auto* v = std::get_if<double>(&value)) {
        return float_to_integer(*v, out);
    }
    if (const auto* v = std::get_if<std::string>(&value)) {
        if (parse_full(*v, out)) {
            return true;
        }
        double parsed = 0.0;
        return parse_full(*v, parsed) && float_to_integer(parsed, out);
    }
    if (const auto* v = std::get_if<Bytes>(&value)) {
        std::uint64_t bits = 0;
        if (!is_bit || !bit_value(*v, bits) || !std::in_range<T>(bits)) {
            return false;
        }
        out = static_cast<T>(bits);
        return true;
    }
    return false;
}

bool to_double(const FieldValue& value, bool is_bit, double& out) noexcept {
    if (const auto* v = std::get_if<std::int64_t>(&value)) {
        out = static_cast<double>(*v);
        return true;
    }
    if (const auto* v = std::get_if<std::uint64_t>(&value)) {
        out = static_cast<double>(*v);
        return true;
    }
    if (const auto* v = std::get_if<float>(&value)) {
        out = *v;
        return true;
    }
    if (const auto* v = std::get_if<double>(&value)) {
        out = *v;
        return true;
    }
    if (const auto* v = std::get_if<std::string>(&value)) {
        return parse_full(*v, out);
    }
    if (const auto* v = std::get_if<Bytes>(&value)) {
        std::uint64_t bits = 0;
        if (!is_bit || !bit_value(*v, bits)) {
            return false;
        }
        out = static_cast<double>(bits);
        return true;
    }
    return false;
}

auto to_text(const FieldValue& value) -> std::string {
    if (const auto* v = std::get_if<std::int64_t>(&value)) {
        return std::to_string(*v);
    }
    if (const auto* v = std::get_if<std::uint64_t>(&value)) {
        return std::to_string(*v);
    }
    if (const auto* v = std::get_if<float>(&value)) {
        return fmt::format("{}", *v);
    }
    if (const auto* v = std::get_if<double>(&value)) {
        return fmt::format("{}", *v);
    }
    if (const auto* v = std::get_if<std::string>(&value)) {
        return *v;
    }
    if (const auto* v = std::get_if<Bytes>(&value)) {
        return std::string(v->begin(), v->end());
    }
    if (const auto* v = std::get_if<Date>(&value)) {
        return format_date(*v);
    }
    if (const auto* v = std::get_if<DateTime>(&value)) {
        return format_datetime(*v);
    }
    if (const auto* v = std::get_if<Time>(&value)) {
        return format_time(*v);
    }
    return {};
}

template <typename Getter>
auto with_label(const ResultSet& rs, std::string_view label, Getter getter)
    -> decltype(getter(std::size_t{}))
{
    auto index = rs.find_column(label);
    if (!index) {
        return std::unexpected(std::move(index.error()));
    }
    return getter(*index);
}

}  // namespace

ResultSet::ResultSet(Connection&                   conn,
                     std::uint64_t                 stream_id,
                     std::vector<ColumnDefinition> columns,
                     RowFormat                     format)
    : conn_(&conn)
    , stream_id_(stream_id)
    , format_(format)
    , columns_(std::move(columns))
{}

ResultSet::ResultSet(std::vector<ColumnDefinition> columns, std::vector<Row> rows)
    : columns_(std::move(columns))
    , rows_(std::move(rows))
{}

// ---------------------------------------------------------------------------
// next / close
// ---------------------------------------------------------------------------
auto ResultSet::next() -> boost::asio::awaitable<std::expected<bool, Error>> {
    if (closed_) {
        co_return std::unexpected(usage_error("result set is closed"));
    }
    if (exhausted_) {
        has_row_ = false;
        co_return false;
    }

    if (conn_ == nullptr) {
        if (cursor_ < rows_.size()) {
            current_ = rows_[cursor_++];
            has_row_ = true;
            ++row_number_;
            co_return true;
        }
        exhausted_ = true;
        has_row_   = false;
        co_return false;
    }

    auto row = co_await conn_->fetch_row(stream_id_, columns_, format_);
    if (!row) {
        has_row_ = false;
        co_return std::unexpected(std::move(row.error()));
    }
    if (!row->has_value()) {
        exhausted_ = true;
        has_row_   = false;
        co_return false;
    }

    current_ = std::move(**row);
    has_row_ = true;
    ++row_number_;
    co_return true;
}

auto ResultSet::close() -> boost::asio::awaitable<std::expected<void, Error>> {
    if (closed_) {
        co_return std::expected<void, Error>{};
    }
    closed_  = true;
    has_row_ = false;

    if (conn_ != nullptr && !exhausted_ && conn_->owns_stream(stream_id_)) {
        exhausted_ = true;
        auto drained = co_await conn_->drain_stream();
        if (!drained) {
            co_return std::unexpected(std::move(drained.error()));
        }
    }
    exhausted_ = true;
    co_return std::expected<void, Error>{};
}

// ---------------------------------------------------------------------------
// cursor 검사
// ---------------------------------------------------------------------------
auto ResultSet::current(std::size_t index) -> std::expected<const FieldValue*, Error> {
    if (closed_) {
        return std::unexpected(usage_error("result set is closed"));
    }
    if (!has_row_) {
        return std::unexpected(usage_error(exhausted_ ? "no current row: result set is exhausted"
                                                      : "no current row: call next() first"));
    }
    if (index >= current_.size()) {
        return std::unexpected(usage_error(
            fmt::format("column index {} is out of range for {} columns", index, current_.size())));
    }

    const FieldValue& value = current_[index];
    was_null_ = ::is_null(value);
    return &value;
}

auto ResultSet::conversion_error(std::size_t index, std::string_view requested) const -> Error {
    std::string      name = "?";
    std::string_view type = "UNKNOWN";
    if (index < columns_.size()) {
        name = columns_[index].name;
        type = columns_[index].type_name();
    }
    return Error{
        ErrorCode::kTypeConversion,
        fmt::format("cannot convert column '{}' (index {}, {}) to {}", name, index, type, requested),
        name,
    };
}

auto ResultSet::find_column(std::string_view label) const -> std::expected<std::size_t, Error> {
    for (std::size_t i = 0; i < columns_.size(); ++i) {
        if (iequals(columns_[i].name, label)) {
            return i;
        }
    }
    return std::unexpected(usage_error(fmt::format("column '{}' not found", label)));
}

template <typename T>
auto ResultSet::get_integer(std::size_t index, std::string_view requested) -> std::expected<T, Error> {
    auto value = current(index);
    if (!value) {
        return std::unexpected(std::move(value.error()));
    }
    if (was_null_) {
        return T{0};
    }

    const bool is_bit = index < columns_.size() && columns_[index].type == ColumnType::kBit;
    T out{};
    if (!to_integer(**value, is_bit, out)) {
        return std::unexpected(conversion_error(index, requested));
    }
    return out;
}

// ---------------------------------------------------------------------------
// 접근자 (index)
// ---------------------------------------------------------------------------
auto ResultSet::get_bool(std::size_t index) -> std::expected<bool, Error> {
    auto value = current(index);
    if (!value) {
        return std::unexpected(std::move(value.error()));
    }
    if (was_null_) {
        return false;
    }

    if (const auto* text = std::get_if<std::string>(*value)) {
        if (iequals(*text, "true") || *text == "1") {
            return true;
        }
        if (iequals(*text, "false") || *text == "0") {
            return false;
        }
    }
    if (const auto* raw = std::get_if<Bytes>(*value)) {
        if (raw->size() <= 8) {
            return std::ranges::any_of(*raw, [](std::uint8_t b) { return b != 0; });
        }
        return std::unexpected(conversion_error(index, "bool"));
    }

    double number = 0.0;
    if (!to_double(**value, false, number)) {
        return std::unexpected(conversion_error(index, "bool"));
    }
    return number != 0.0;
}

auto ResultSet::get_int8(std::size_t index) -> std::expected<std::int8_t, Error> {
    return get_integer<std::int8_t>(index, "int8");
}

auto ResultSet::get_int16(std::size_t index) -> std::expected<std::int16_t, Error> {
    return get_integer<std::int16_t>(index, "int16");
}

auto ResultSet::get_int32(std::size_t index) -> std::expected<std::int32_t, Error> {
    return get_integer<std::int32_t>(index, "int32");
}

auto ResultSet::get_int64(std::size_t index) -> std::expected<std::int64_t, Error> {
    return get_integer<std::int64_t>(index, "int64");
}

auto ResultSet::get_uint64(std::size_t index) -> std::expected<std::uint64_t, Error> {
    return get_integer<std::uint64_t>(index, "uint64");
}

auto ResultSet::get_float(std::size_t index) -> std::expected<float, Error> {
    auto value = current(index);
    if (!value) {
        return std::unexpected(std::move(value.error()));
    }
    if (was_null_) {
        return 0.0F;
    }
    if (const auto* f = std::get_if<float>(*value)) {
        return *f;
    }

    const bool is_bit = index < columns_.size() && columns_[index].type == ColumnType::kBit;
    double number = 0.0;
    if (!to_double(**value, is_bit, number)
        || (std::isfinite(number) && std::fabs(number) > std::numeric_limits<float>::max()))
    {
        return std::unexpected(conversion_error(index, "float"));
    }
    return static_cast<float>(number);
}

auto ResultSet::get_double(std::size_t index) -> std::expected<double, Error> {
    auto value = current(index);
    if (!value) {
        return std::unexpected(std::move(value.error()));
    }
    if (was_null_) {
        return 0.0;
    }

    const bool is_bit = index < columns_.size() && columns_[index].type == ColumnType::kBit;
    double number = 0.0;
    if (!to_double(**value, is_bit, number)) {
        return std::unexpected(conversion_error(index, "double"));
    }
    return number;
}

auto ResultSet::get_string(std::size_t index) -> std::expected<std::string, Error> {
    auto value = current(index);
    if (!value) {
        return std::unexpected(std::move(value.error()));
    }
    return to_text(**value);
}

auto ResultSet::get_bytes(std::size_t index) -> std::expected<Bytes, Error> {
    auto value = current(index);
    if (!value) {
        return std::unexpected(std::move(value.error()));
    }
    if (const auto* raw = std::get_if<Bytes>(*value)) {
        return *raw;
    }
    const auto text = to_text(**value);
    return Bytes(text.begin(), text.end());
}

auto ResultSet::get_date(std::size_t index) -> std::expected<Date, Error> {
    auto value = current(index);
    if (!value) {
        return std::unexpected(std::move(value.error()));
    }
    if (was_null_) {
        return Date{};
    }
    if (const auto* d = std::get_if<Date>(*value)) {
        return *d;
    }
    if (const auto* dt = std::get_if<DateTime>(*value)) {
        return Date{dt->year, dt->month, dt->day};
    }
    if (const auto* text = std::get_if<std::string>(*value)) {
        Date     date;
        DateTime datetime;
        if (parse_date(*text, date)) {
            return date;
        }
        if (parse_datetime(*text, datetime)) {
            return Date{datetime.year, datetime.month, datetime.day};
        }
    }
    return std::unexpected(conversion_error(index, "date"));
}

auto ResultSet::get_datetime(std::size_t index) -> std::expected<DateTime, Error> {
    auto value = current(index);
    if (!value) {
        return std::unexpected(std::move(value.error()));
    }
    if (was_null_) {
        return DateTime{};
    }
    if (const auto* dt = std::get_if<DateTime>(*value)) {
        return *dt;
    }
    if (const auto* d = std::get_if<Date>(*value)) {
        DateTime midnight;
        midnight.year  = d->year;
        midnight.month = d->month;
        midnight.day   = d->day;
        return midnight;
    }
    if (const auto* text = std::get_if<std::string>(*value)) {
        DateTime datetime;
        Date     date;
        if (parse_datetime(*text, datetime)) {
            return datetime;
        }
        if (parse_date(*text, date)) {
            DateTime midnight;
            midnight.year  = date.year;
            midnight.month = date.month;
            midnight.day   = date.day;
            return midnight;
        }
    }
    return std::unexpected(conversion_error(index, "datetime"));
}

auto ResultSet::get_time(std::size_t index) -> std::expected<Time, Error> {
    auto value = current(index);
    if (!value) {
        return std::unexpected(std::move(value.error()));
    }
    if (was_null_) {
        return Time{};
    }
    if (const auto* t = std::get_if<Time>(*value)) {
        return *t;
    }
    if (const auto* dt = std::get_if<DateTime>(*value)) {
        Time time;
        time.hour        = dt->hour;
        time.minute      = dt->minute;
        time.second      = dt->second;
        time.microsecond = dt->microsecond;
        return time;
    }
    if (const auto* text = std::get_if<std::string>(*value)) {
        Time time;
        if (parse_time(*text, time)) {
            return time;
        }
    }
    return std::unexpected(conversion_error(index, "time"));
}

auto ResultSet::get_value(std::size_t index) -> std::expected<FieldValue, Error> {
    auto value = current(index);
    if (!value) {
        return std::unexpected(std::move(value.error()));
    }
    return **value;
}

auto ResultSet::is_null(std::size_t index) -> std::expected<bool, Error> {
    auto value = current(index);
    if (!value) {
        return std::unexpected(std::move(value.error()));
    }
    return was_null_;
}

// ---------------------------------------------------------------------------
// 접근자 (label)
// ---------------------------------------------------------------------------
auto ResultSet::get_bool(std::string_view label) -> std::expected<bool, Error> {
    return with_label(*this, label, [this](std::size_t i) { return get_bool(i); });
}

auto ResultSet::get_int8(std::string_view label) -> std::expected<std::int8_t, Error> {
    return with_label(*this, label, [this](std::size_t i) { return get_int8(i); });
}

auto ResultSet::get_int16(std::string_view label) -> std::expected<std::int16_t, Error> {
    return with_label(*this, label, [this](std::size_t i) { return get_int16(i); });
}

auto ResultSet::get_int32(std::string_view label) -> std::expected<std::int32_t, Error> {
    return with_label(*this, label, [this](std::size_t i) { return get_int32(i); });
}

auto ResultSet::get_int64(std::string_view label) -> std::expected<std::int64_t, Error> {
    return with_label(*this, label, [this](std::size_t i) { return get_int64(i); });
}

auto ResultSet::get_uint64(std::string_view label) -> std::expected<std::uint64_t, Error> {
    return with_label(*this, label, [this](std::size_t i) { return get_uint64(i); });
}

auto ResultSet::get_float(std::string_view label) -> std::expected<float, Error> {
    return with_label(*this, label, [this](std::size_t i) { return get_float(i); });
}

auto ResultSet::get_double(std::string_view label) -> std::expected<double, Error> {
    return with_label(*this, label, [this](std::size_t i) { return get_double(i); });
}

auto ResultSet::get_string(std::string_view label) -> std::expected<std::string, Error> {
    return with_label(*this, label, [this](std::size_t i) { return get_string(i); });
}

auto ResultSet::get_bytes(std::string_view label) -> std::expected<Bytes, Error> {
    return with_label(*this, label, [this](std::size_t i) { return get_bytes(i); });
}

auto ResultSet::get_date(std::string_view label) -> std::expected<Date, Error> {
    return with_label(*this, label, [this](std::size_t i) { return get_date(i); });
}

auto ResultSet::get_datetime(std::string_view label) -> std::expected<DateTime, Error> {
    return with_label(*this, label, [this](std::size_t i) { return get_datetime(i); });
}

auto ResultSet::get_time(std::string_view label) -> std::expected<Time, Error> {
    return with_label(*this, label, [this](std::size_t i) { return get_time(i); });
}

auto ResultSet::get_value(std::string_view label) -> std::expected<FieldValue, Error> {
    return with_label(*this, label, [this](std::size_t i) { return get_value(i); });
}

auto ResultSet::is_null(std::string_view label) -> std::expected<bool, Error> {
    return with_label(*this, label, [this](std::size_t i) { return is_null(i); });
}
