#pragma once

#include "common/types.hpp"
#include "protocol/field_value.hpp"
#include "protocol/response.hpp"

#include <expected>
#include <span>
#include <vector>

// ---------------------------------------------------------------------------
// Row
//   디코딩된 한 행. 컬럼 순서대로 FieldValue 를 담는다.
// ---------------------------------------------------------------------------
using Row = std::vector<FieldValue>;

// ---------------------------------------------------------------------------
// RowFormat
//   COM_QUERY 결과는 텍스트 row, COM_STMT_EXECUTE 결과는 binary row.
// ---------------------------------------------------------------------------
enum class RowFormat : std::uint8_t {
    kText,
    kBinary,
};

// ---------------------------------------------------------------------------
// decode_text_row
//   각 컬럼은 lenenc 문자열 또는 0xFB(NULL).
//   컬럼 타입에 따라 정수/실수/날짜로 변환하며, 변환할 수 없는 텍스트는
//   문자열 그대로 보관한다 (변환 오류는 접근 시점에 보고된다).
//
//   실패 시: 컬럼 수 불일치, 잘린 payload → kFraming
// ---------------------------------------------------------------------------
[[nodiscard]] auto decode_text_row(std::span<const std::uint8_t>        payload,
                                   const std::vector<ColumnDefinition>& columns)
    -> std::expected<Row, Error>;

// ---------------------------------------------------------------------------
// decode_binary_row
//   [0x00][NULL bitmap (n + 7 + 2) / 8 바이트, offset 2][값...]
//   값 인코딩은 컬럼 타입과 UNSIGNED 플래그로 결정된다.
// ---------------------------------------------------------------------------
[[nodiscard]] auto decode_binary_row(std::span<const std::uint8_t>        payload,
                                     const std::vector<ColumnDefinition>& columns)
    -> std::expected<Row, Error>;

[[nodiscard]] auto decode_row(RowFormat                            format,
                              std::span<const std::uint8_t>        payload,
                              const std::vector<ColumnDefinition>& columns)
    -> std::expected<Row, Error>;
