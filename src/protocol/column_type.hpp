#pragma once

#include <cstdint>
#include <string_view>

// ---------------------------------------------------------------------------
// ColumnType
//   column definition 패킷과 COM_STMT_EXECUTE 파라미터에 쓰이는
//   MySQL 고정 타입 코드.
// ---------------------------------------------------------------------------
enum class ColumnType : std::uint8_t {
    kDecimal    = 0x00,
    kTiny       = 0x01,
    kShort      = 0x02,
    kLong       = 0x03,
    kFloat      = 0x04,
    kDouble     = 0x05,
    kNull       = 0x06,
    kTimestamp  = 0x07,
    kLongLong   = 0x08,
    kInt24      = 0x09,
    kDate       = 0x0A,
    kTime       = 0x0B,
    kDateTime   = 0x0C,
    kYear       = 0x0D,
    kVarchar    = 0x0F,
    kBit        = 0x10,
    kJson       = 0xF5,
    kNewDecimal = 0xF6,
    kEnum       = 0xF7,
    kSet        = 0xF8,
    kTinyBlob   = 0xF9,
    kMediumBlob = 0xFA,
    kLongBlob   = 0xFB,
    kBlob       = 0xFC,
    kVarString  = 0xFD,
    kString     = 0xFE,
    kGeometry   = 0xFF,
};

// ---------------------------------------------------------------------------
// Column definition flags (일부)
// ---------------------------------------------------------------------------
namespace column_flag {

inline constexpr std::uint16_t kNotNull       = 0x0001;
inline constexpr std::uint16_t kPrimaryKey    = 0x0002;
inline constexpr std::uint16_t kUniqueKey     = 0x0004;
inline constexpr std::uint16_t kMultipleKey   = 0x0008;
inline constexpr std::uint16_t kBlob          = 0x0010;
inline constexpr std::uint16_t kUnsigned      = 0x0020;
inline constexpr std::uint16_t kZerofill      = 0x0040;
inline constexpr std::uint16_t kBinary        = 0x0080;
inline constexpr std::uint16_t kEnum          = 0x0100;
inline constexpr std::uint16_t kAutoIncrement = 0x0200;
inline constexpr std::uint16_t kTimestamp     = 0x0400;
inline constexpr std::uint16_t kSet           = 0x0800;

}  // namespace column_flag

// binary 문자셋 (63) — BLOB 과 TEXT 를 구분할 때 사용
inline constexpr std::uint16_t kBinaryCharset = 63;

// 오류 메시지 / 메타데이터용 SQL 타입 이름
[[nodiscard]] constexpr auto column_type_name(ColumnType type, bool is_unsigned = false) noexcept
    -> std::string_view
{
    switch (type) {
        case ColumnType::kDecimal:
        case ColumnType::kNewDecimal: return "DECIMAL";
        case ColumnType::kTiny:       return is_unsigned ? "TINYINT UNSIGNED" : "TINYINT";
        case ColumnType::kShort:      return is_unsigned ? "SMALLINT UNSIGNED" : "SMALLINT";
        case ColumnType::kLong:       return is_unsigned ? "INT UNSIGNED" : "INT";
        case ColumnType::kFloat:      return "FLOAT";
        case ColumnType::kDouble:     return "DOUBLE";
        case ColumnType::kNull:       return "NULL";
        case ColumnType::kTimestamp:  return "TIMESTAMP";
        case ColumnType::kLongLong:   return is_unsigned ? "BIGINT UNSIGNED" : "BIGINT";
        case ColumnType::kInt24:      return is_unsigned ? "MEDIUMINT UNSIGNED" : "MEDIUMINT";
        case ColumnType::kDate:       return "DATE";
        case ColumnType::kTime:       return "TIME";
        case ColumnType::kDateTime:   return "DATETIME";
        case ColumnType::kYear:       return "YEAR";
        case ColumnType::kVarchar:
        case ColumnType::kVarString:  return "VARCHAR";
        case ColumnType::kBit:        return "BIT";
        case ColumnType::kJson:       return "JSON";
        case ColumnType::kEnum:       return "ENUM";
        case ColumnType::kSet:        return "SET";
        case ColumnType::kTinyBlob:   return "TINYBLOB";
        case ColumnType::kMediumBlob: return "MEDIUMBLOB";
        case ColumnType::kLongBlob:   return "LONGBLOB";
        case ColumnType::kBlob:       return "BLOB";
        case ColumnType::kString:     return "CHAR";
        case ColumnType::kGeometry:   return "GEOMETRY";
    }
    return "UNKNOWN";
}
