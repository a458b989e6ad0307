#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: ConnectionConfig::set_logger() 로 주입한다.
// - 고빈도 로그 경로(log_query)는 const-ref 파라미터를 사용한다.
//
// [JSON 스키마 일관성]
// 모든 구조체 필드를 snake_case JSON 키로 직렬화한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}

// ---------------------------------------------------------------------------
// StructuredLogger
//   ConnectionLog / QueryLog / ErrorLog 를 JSON 포맷으로 기록한다.
//   내부 진단용 debug/info/warn/error 메서드도 제공한다.
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로. 비어 있으면 stdout 에만 기록한다.
    //
    //   spdlog sink 생성 실패 시 std::runtime_error
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path = {});

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    // log_connection
    //   연결/해제/인증 실패 이벤트를 JSON 으로 기록한다.
    void log_connection(const ConnectionLog& entry);

    // log_query
    //   SQL 실행 결과를 JSON 으로 기록한다.
    void log_query(const QueryLog& entry);

    // log_error
    //   오류를 JSON 으로 기록한다 (warn 레벨).
    void log_error(const ErrorLog& entry);

    // 내부 진단용 spdlog 래퍼
    //   SQL, 사용자명 등 클라이언트 데이터를 직접 전달하지 말 것.
    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    [[nodiscard]] auto min_level() const noexcept -> LogLevel { return min_level_; }

private:
    // min_level_ 미만이면 버린다
    void emit(LogLevel level, std::string_view line);

    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
