#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [민감정보 취급 주의]
// - sql 은 원문 SQL 전체를 포함한다. 비밀번호는 어떤 로그에도 넣지 않는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <chrono>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// ConnectionLog
//   서버 연결/해제 이벤트 로그.
//   event: "connect" | "disconnect" | "auth_failed"
// ---------------------------------------------------------------------------
struct ConnectionLog {
    std::uint32_t                         connection_id{0};   // 서버가 부여한 thread id
    std::string                           event{};
    std::string                           host{};
    std::uint16_t                         port{0};
    std::string                           db_user{};
    std::string                           database{};
    std::string                           auth_plugin{};
    bool                                  tls{false};
    std::chrono::system_clock::time_point timestamp{};
};

// ---------------------------------------------------------------------------
// QueryLog
//   SQL 실행 로그.
//   protocol: "text" (COM_QUERY) | "binary" (COM_STMT_EXECUTE)
//   outcome : "ok" | "error"
// ---------------------------------------------------------------------------
struct QueryLog {
    std::uint32_t                         connection_id{0};
    std::string                           db_user{};
    std::string                           sql{};             // 원문 SQL (마스킹 주의)
    std::string                           protocol{};
    std::uint64_t                         affected_rows{0};
    std::string                           outcome{};
    std::chrono::system_clock::time_point timestamp{};
    std::chrono::microseconds             duration{0};
};

// ---------------------------------------------------------------------------
// ErrorLog
//   연결을 무효화하거나 서버 ERR 로 끝난 작업의 오류 로그.
//   operation: "handshake" | "query" | "prepare" | "execute" | ...
// ---------------------------------------------------------------------------
struct ErrorLog {
    std::uint32_t                         connection_id{0};
    std::string                           operation{};
    ErrorCode                             code{ErrorCode::kFraming};
    std::uint16_t                         server_code{0};
    std::string                           sql_state{};
    std::string                           message{};
    std::chrono::system_clock::time_point timestamp{};
};
