// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// 이벤트 구조체를 한 줄 JSON 으로 직렬화해 spdlog sink 로 보낸다.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include <chrono>
#include <ctime>
#include <iterator>
#include <stdexcept>
#include <type_traits>
#include <vector>

#include <fmt/chrono.h>
#include <fmt/format.h>

#include <spdlog/common.h>
#include <spdlog/logger.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>

namespace {

constexpr std::size_t kMaxFileSize = 100 * 1024 * 1024;
constexpr std::size_t kMaxFiles    = 3;

// ---------------------------------------------------------------------------
// JsonObject
//   필드를 추가한 순서대로 {"k":v,...} 를 만든다. 중첩 객체는 쓰지 않는다.
// ---------------------------------------------------------------------------
class JsonObject {
public:
    JsonObject() { buf_.push_back('{'); }

    auto add(std::string_view key, std::string_view value) -> JsonObject& {
        begin_field(key);
        buf_.push_back('"');
        append_escaped(value);
        buf_.push_back('"');
        return *this;
    }

    auto add(std::string_view key, const char* value) -> JsonObject& {
        return add(key, std::string_view{value});
    }

    auto add(std::string_view key, bool value) -> JsonObject& {
        begin_field(key);
        fmt::format_to(std::back_inserter(buf_), "{}", value ? "true" : "false");
        return *this;
    }

    template <typename Int>
        requires std::is_integral_v<Int>
    auto add(std::string_view key, Int value) -> JsonObject& {
        begin_field(key);
        fmt::format_to(std::back_inserter(buf_), "{}", value);
        return *this;
    }

    auto finish() -> std::string {
        buf_.push_back('}');
        return fmt::to_string(buf_);
    }

private:
    void begin_field(std::string_view key) {
        if (!first_) {
            buf_.push_back(',');
        }
        first_ = false;
        fmt::format_to(std::back_inserter(buf_), "\"{}\":", key);
    }

    // RFC 8259 이스케이프. 0x20 미만 제어 문자는 \u00XX
    void append_escaped(std::string_view value) {
        for (const char c : value) {
            const auto ch = static_cast<unsigned char>(c);
            switch (ch) {
                case '"':  put("\\\""); break;
                case '\\': put("\\\\"); break;
                case '\b': put("\\b"); break;
                case '\f': put("\\f"); break;
                case '\n': put("\\n"); break;
                case '\r': put("\\r"); break;
                case '\t': put("\\t"); break;
                default:
                    if (ch < 0x20) {
                        fmt::format_to(std::back_inserter(buf_), "\\u{:04x}", static_cast<unsigned>(ch));
                    } else {
                        buf_.push_back(c);
                    }
                    break;
            }
        }
    }

    void put(std::string_view text) { fmt::format_to(std::back_inserter(buf_), "{}", text); }

    fmt::memory_buffer buf_;
    bool               first_{true};
};

// 2024-02-29T12:05:09.123Z
std::string iso8601_utc(std::chrono::system_clock::time_point tp) {
    const auto        millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()) % 1000;
    const std::time_t secs   = std::chrono::system_clock::to_time_t(tp);
    std::tm           utc{};
    gmtime_r(&secs, &utc);
    return fmt::format("{:%Y-%m-%dT%H:%M:%S}.{:03}Z", utc, millis.count());
}

spdlog::level::level_enum to_spdlog(LogLevel level) {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

}  // namespace

// ---------------------------------------------------------------------------
// 생성자: stdout + (선택) rotating file sink
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    std::vector<spdlog::sink_ptr> sinks{std::make_shared<spdlog::sinks::stdout_sink_mt>()};
    try {
        if (!log_path_.empty()) {
            if (log_path_.has_parent_path()) {
                std::filesystem::create_directories(log_path_.parent_path());
            }
            sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
                log_path_.string(), kMaxFileSize, kMaxFiles));
        }
    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(fmt::format("cannot open log file {}: {}", log_path_.string(), ex.what()));
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(fmt::format("cannot open log file {}: {}", log_path_.string(), ex.what()));
    }

    // 전역 registry 에는 등록하지 않는다 (연결마다 다른 로거를 쓸 수 있음)
    logger_ = std::make_shared<spdlog::logger>("mywire", sinks.begin(), sinks.end());
    logger_->set_level(to_spdlog(min_level));
    logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
    logger_->flush_on(spdlog::level::trace);
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

void StructuredLogger::emit(LogLevel level, std::string_view line) {
    if (logger_ && static_cast<int>(level) >= static_cast<int>(min_level_)) {
        logger_->log(to_spdlog(level), line);
    }
}

// ---------------------------------------------------------------------------
// 이벤트 로그
// ---------------------------------------------------------------------------
void StructuredLogger::log_connection(const ConnectionLog& entry) {
    // 인증 실패만 warn, 나머지 연결 이벤트는 info
    const LogLevel level = entry.event == "auth_failed" ? LogLevel::kWarn : LogLevel::kInfo;
    emit(level, JsonObject{}
                    .add("event", entry.event)
                    .add("connection_id", entry.connection_id)
                    .add("host", entry.host)
                    .add("port", entry.port)
                    .add("db_user", entry.db_user)
                    .add("database", entry.database)
                    .add("auth_plugin", entry.auth_plugin)
                    .add("tls", entry.tls)
                    .add("timestamp", iso8601_utc(entry.timestamp))
                    .finish());
}

void StructuredLogger::log_query(const QueryLog& entry) {
    emit(LogLevel::kInfo, JsonObject{}
                              .add("event", "query")
                              .add("connection_id", entry.connection_id)
                              .add("db_user", entry.db_user)
                              .add("sql", entry.sql)
                              .add("protocol", entry.protocol)
                              .add("affected_rows", entry.affected_rows)
                              .add("outcome", entry.outcome)
                              .add("timestamp", iso8601_utc(entry.timestamp))
                              .add("duration_us", entry.duration.count())
                              .finish());
}

void StructuredLogger::log_error(const ErrorLog& entry) {
    emit(LogLevel::kWarn, JsonObject{}
                              .add("event", "error")
                              .add("connection_id", entry.connection_id)
                              .add("operation", entry.operation)
                              .add("error_code", error_code_name(entry.code))
                              .add("server_code", entry.server_code)
                              .add("sql_state", entry.sql_state)
                              .add("message", entry.message)
                              .add("timestamp", iso8601_utc(entry.timestamp))
                              .finish());
}

// ---------------------------------------------------------------------------
// 진단 메시지
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) { emit(LogLevel::kDebug, msg); }
void StructuredLogger::info(std::string_view msg) { emit(LogLevel::kInfo, msg); }
void StructuredLogger::warn(std::string_view msg) { emit(LogLevel::kWarn, msg); }
void StructuredLogger::error(std::string_view msg) { emit(LogLevel::kError, msg); }
