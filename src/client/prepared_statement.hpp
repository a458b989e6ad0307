#pragma once

#include "client/connection.hpp"
#include "client/result_set.hpp"
#include "common/types.hpp"
#include "protocol/field_value.hpp"
#include "protocol/response.hpp"

#include <utility>
#include <boost/asio/awaitable.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// PreparedStatement
//   binary 프로토콜(COM_STMT_PREPARE / EXECUTE) 실행기.
//   Connection::prepare() 로만 만든다.
//
//   - 파라미터 index 는 0 부터. 실행 전 모든 파라미터가 바인딩돼야 한다 (kUsage).
//   - 바인딩 값은 실행 후에도 유지된다. clear_params() 로 지운다.
//   - close() 는 COM_STMT_CLOSE 를 보낸다 (서버 응답 없음).
//     소멸자는 아무것도 보내지 않는다. 서버 측 statement 는 연결 종료 시 해제된다.
// ---------------------------------------------------------------------------
class PreparedStatement {
public:
    PreparedStatement(Connection&                   conn,
                      std::string                   sql,
                      const PrepareOk&              ok,
                      std::vector<ColumnDefinition> params,
                      std::vector<ColumnDefinition> columns,
                      GeneratedKeys                 keys);

    PreparedStatement(PreparedStatement&&) noexcept            = default;
    PreparedStatement& operator=(PreparedStatement&&) noexcept = default;

    // index 범위를 벗어나면 kUsage
    auto set_param(std::size_t index, FieldValue value) -> std::expected<void, Error>;
    void clear_params() noexcept;

    auto execute_query() -> boost::asio::awaitable<std::expected<ResultSet, Error>>;

    // prepare() 또는 여기서 kReturn 을 지정하면 get_generated_keys() 를 쓸 수 있다
    auto execute_update(GeneratedKeys keys = GeneratedKeys::kNone)
        -> boost::asio::awaitable<std::expected<std::uint64_t, Error>>;

    [[nodiscard]] auto last_insert_id() const noexcept -> std::optional<std::uint64_t> {
        return last_insert_id_;
    }
    [[nodiscard]] auto get_generated_keys() const -> std::expected<ResultSet, Error>;

    // COM_STMT_RESET: 서버 측 long data / cursor 상태 초기화
    auto reset() -> boost::asio::awaitable<std::expected<void, Error>>;

    // COM_STMT_CLOSE. 여러 번 호출해도 된다.
    auto close() -> boost::asio::awaitable<std::expected<void, Error>>;

    [[nodiscard]] auto statement_id()    const noexcept -> std::uint32_t { return statement_id_; }
    [[nodiscard]] auto sql()             const noexcept -> const std::string& { return sql_; }
    [[nodiscard]] auto parameter_count() const noexcept -> std::size_t { return params_.size(); }
    [[nodiscard]] auto parameters()      const noexcept -> const std::vector<ColumnDefinition>& {
        return param_defs_;
    }
    [[nodiscard]] auto columns()         const noexcept -> const std::vector<ColumnDefinition>& {
        return columns_;
    }
    [[nodiscard]] bool is_closed()       const noexcept { return closed_; }

private:
    // 바인딩 검사 후 COM_STMT_EXECUTE 전송 + 첫 응답
    auto execute() -> boost::asio::awaitable<std::expected<CommandResponse, Error>>;

    Connection*                             conn_;
    std::string                             sql_;
    std::uint32_t                           statement_id_{0};
    std::vector<ColumnDefinition>           param_defs_;
    std::vector<ColumnDefinition>           columns_;
    std::vector<std::optional<FieldValue>>  params_;
    GeneratedKeys                           keys_{GeneratedKeys::kNone};      // prepare() 지정값
    bool                                    keys_requested_{false};            // 마지막 execute_update
    std::optional<std::uint64_t>            last_insert_id_{};
    bool                                    closed_{false};
};
