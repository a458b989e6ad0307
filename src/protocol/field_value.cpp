#include "protocol/field_value.hpp"

#include <fmt/format.h>

#include <charconv>

namespace {

// text[pos, pos+width) 를 정수로 읽는다. 숫자가 아닌 문자가 섞이면 false.
template <typename T>
bool read_fixed(std::string_view text, std::size_t pos, std::size_t width, T& out) noexcept {
    if (pos + width > text.size()) {
        return false;
    }
    const char* begin = text.data() + pos;
    const char* end   = begin + width;
    unsigned    value = 0;
    auto [ptr, ec]    = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr != end) {
        return false;
    }
    out = static_cast<T>(value);
    return true;
}

// ".ffffff" 소수부 (1~6자리) → 마이크로초
bool read_fraction(std::string_view text, std::size_t pos, std::uint32_t& out) noexcept {
    if (pos == text.size()) {
        out = 0;
        return true;
    }
    if (text[pos] != '.') {
        return false;
    }
    const std::string_view digits = text.substr(pos + 1);
    if (digits.empty() || digits.size() > 6) {
        return false;
    }
    std::uint32_t value = 0;
    auto [ptr, ec] = std::from_chars(digits.data(), digits.data() + digits.size(), value);
    if (ec != std::errc{} || ptr != digits.data() + digits.size()) {
        return false;
    }
    for (std::size_t i = digits.size(); i < 6; ++i) {
        value *= 10U;
    }
    out = value;
    return true;
}

auto format_fraction(std::uint32_t microsecond) -> std::string {
    return microsecond == 0 ? std::string{} : fmt::format(".{:06}", microsecond);
}

}  // namespace

auto format_date(const Date& value) -> std::string {
    return fmt::format("{:04}-{:02}-{:02}", value.year, value.month, value.day);
}

auto format_datetime(const DateTime& value) -> std::string {
    return fmt::format("{:04}-{:02}-{:02} {:02}:{:02}:{:02}{}",
                       value.year, value.month, value.day,
                       value.hour, value.minute, value.second,
                       format_fraction(value.microsecond));
}

auto format_time(const Time& value) -> std::string {
    const std::uint64_t hours = static_cast<std::uint64_t>(value.days) * 24U + value.hour;
    return fmt::format("{}{:02}:{:02}:{:02}{}",
                       value.negative ? "-" : "",
                       hours, value.minute, value.second,
                       format_fraction(value.microsecond));
}

bool parse_date(std::string_view text, Date& out) noexcept {
    if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
        return false;
    }
    return read_fixed(text, 0, 4, out.year)
        && read_fixed(text, 5, 2, out.month)
        && read_fixed(text, 8, 2, out.day);
}

bool parse_datetime(std::string_view text, DateTime& out) noexcept {
    if (text.size() < 19 || text[10] != ' ' || text[13] != ':' || text[16] != ':') {
        return false;
    }
    Date date;
    if (!parse_date(text.substr(0, 10), date)) {
        return false;
    }
    out.year  = date.year;
    out.month = date.month;
    out.day   = date.day;
    return read_fixed(text, 11, 2, out.hour)
        && read_fixed(text, 14, 2, out.minute)
        && read_fixed(text, 17, 2, out.second)
        && read_fraction(text, 19, out.microsecond);
}

bool parse_time(std::string_view text, Time& out) noexcept {
    std::size_t pos = 0;
    out.negative = !text.empty() && text[0] == '-';
    if (out.negative) {
        pos = 1;
    }

    const auto colon = text.find(':', pos);
    if (colon == std::string_view::npos || colon == pos) {
        return false;
    }

    std::uint32_t hours = 0;
    if (!read_fixed(text, pos, colon - pos, hours)) {
        return false;
    }
    if (colon + 6 > text.size() || text[colon + 3] != ':') {
        return false;
    }

    out.days = hours / 24U;
    out.hour = static_cast<std::uint8_t>(hours % 24U);
    return read_fixed(text, colon + 1, 2, out.minute)
        && read_fixed(text, colon + 4, 2, out.second)
        && read_fraction(text, colon + 6, out.microsecond);
}
