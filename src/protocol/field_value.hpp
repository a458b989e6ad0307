#pragma once

#include "common/types.hpp"

#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

// ---------------------------------------------------------------------------
// Date / DateTime / Time
//   MySQL 날짜/시간 값. binary 프로토콜 인코딩 단위를 그대로 보관한다.
// ---------------------------------------------------------------------------
struct Date {
    std::uint16_t year{0};
    std::uint8_t  month{0};
    std::uint8_t  day{0};

    bool operator==(const Date&) const = default;
};

struct DateTime {
    std::uint16_t year{0};
    std::uint8_t  month{0};
    std::uint8_t  day{0};
    std::uint8_t  hour{0};
    std::uint8_t  minute{0};
    std::uint8_t  second{0};
    std::uint32_t microsecond{0};

    bool operator==(const DateTime&) const = default;
};

// TIME 은 음수와 24시간 초과(days)를 허용한다.
struct Time {
    bool          negative{false};
    std::uint32_t days{0};
    std::uint8_t  hour{0};
    std::uint8_t  minute{0};
    std::uint8_t  second{0};
    std::uint32_t microsecond{0};

    bool operator==(const Time&) const = default;
};

// ---------------------------------------------------------------------------
// FieldValue
//   디코딩된 컬럼 값 / 바인딩 파라미터 값.
//
//   monostate : SQL NULL
//   string    : 문자열, DECIMAL, JSON, ENUM, SET
//   Bytes     : BLOB(binary), BIT, GEOMETRY
// ---------------------------------------------------------------------------
using FieldValue = std::variant<std::monostate,
                                std::int64_t,
                                std::uint64_t,
                                float,
                                double,
                                std::string,
                                Bytes,
                                Date,
                                DateTime,
                                Time>;

[[nodiscard]] inline bool is_null(const FieldValue& value) noexcept {
    return std::holds_alternative<std::monostate>(value);
}

// YYYY-MM-DD / YYYY-MM-DD hh:mm:ss[.ffffff] / [-]hhh:mm:ss[.ffffff]
[[nodiscard]] auto format_date(const Date& value) -> std::string;
[[nodiscard]] auto format_datetime(const DateTime& value) -> std::string;
[[nodiscard]] auto format_time(const Time& value) -> std::string;

// 텍스트 프로토콜 값 파싱. 형식이 맞지 않으면 false.
[[nodiscard]] bool parse_date(std::string_view text, Date& out) noexcept;
[[nodiscard]] bool parse_datetime(std::string_view text, DateTime& out) noexcept;
[[nodiscard]] bool parse_time(std::string_view text, Time& out) noexcept;
