#pragma once

#include "common/types.hpp"
#include "protocol/column_type.hpp"
#include "protocol/field_value.hpp"

#include <cstdint>
#include <span>
#include <string_view>

// ---------------------------------------------------------------------------
// CommandType
//   MySQL COM_* 커맨드 바이트 값을 열거한다.
//   핸드셰이크 완료 이후의 커맨드 패킷 첫 바이트에 대응한다.
// ---------------------------------------------------------------------------
enum class CommandType : std::uint8_t {
    kComQuit            = 0x01,  // COM_QUIT
    kComInitDb          = 0x02,  // COM_INIT_DB  (USE database)
    kComQuery           = 0x03,  // COM_QUERY    (SQL 문 실행)
    kComStatistics      = 0x09,  // COM_STATISTICS (서버 상태 문자열)
    kComPing            = 0x0E,  // COM_PING
    kComChangeUser      = 0x11,  // COM_CHANGE_USER
    kComStmtPrepare     = 0x16,  // COM_STMT_PREPARE
    kComStmtExecute     = 0x17,  // COM_STMT_EXECUTE
    kComStmtClose       = 0x19,  // COM_STMT_CLOSE
    kComStmtReset       = 0x1A,  // COM_STMT_RESET
    kComResetConnection = 0x1F,  // COM_RESET_CONNECTION
};

// ---------------------------------------------------------------------------
// 커맨드 payload 빌더
//   반환값은 패킷 헤더를 제외한 payload 이다. 프레이밍은 PacketChannel 이 한다.
// ---------------------------------------------------------------------------

// [cmd] — COM_QUIT / COM_PING / COM_RESET_CONNECTION
[[nodiscard]] auto build_simple_command(CommandType type) -> Bytes;

// [0x03][SQL]
[[nodiscard]] auto build_query(std::string_view sql) -> Bytes;

// [0x02][schema]
[[nodiscard]] auto build_init_db(std::string_view database) -> Bytes;

// [0x16][SQL]
[[nodiscard]] auto build_stmt_prepare(std::string_view sql) -> Bytes;

// [0x19][4B statement_id] — 서버는 응답하지 않는다
[[nodiscard]] auto build_stmt_close(std::uint32_t statement_id) -> Bytes;

// [0x1A][4B statement_id]
[[nodiscard]] auto build_stmt_reset(std::uint32_t statement_id) -> Bytes;

// ---------------------------------------------------------------------------
// build_stmt_execute
//   [0x17][4B statement_id][1B flags=CURSOR_TYPE_NO_CURSOR][4B iteration_count=1]
//   파라미터가 있으면:
//     [NULL bitmap (n + 7) / 8][1B new_params_bound_flag=1]
//     [n × (1B type, 1B unsigned flag 0x80)][값...]
// ---------------------------------------------------------------------------
[[nodiscard]] auto build_stmt_execute(std::uint32_t                 statement_id,
                                      std::span<const FieldValue> params) -> Bytes;

// ---------------------------------------------------------------------------
// ParameterType
//   바인딩 값에 대응하는 wire 타입.
// ---------------------------------------------------------------------------
struct ParameterType {
    ColumnType type{ColumnType::kNull};
    bool       is_unsigned{false};
};

[[nodiscard]] auto parameter_type(const FieldValue& value) noexcept -> ParameterType;
