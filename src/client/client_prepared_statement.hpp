#pragma once

#include "client/connection.hpp"
#include "client/result_set.hpp"
#include "client/statement.hpp"
#include "common/types.hpp"
#include "protocol/field_value.hpp"

#include <utility>
#include <boost/asio/awaitable.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// sql_literal
//   바인딩 값을 SQL 리터럴로 바꾼다.
//     NULL          → NULL
//     정수 / 실수    → 10진 표기 (NaN, inf 는 kUsage)
//     string        → '...' (no_backslash_escapes 면 ' 만 두 번 쓴다)
//     Bytes         → 0x<hex>, 빈 값은 X''
//     Date/DateTime/Time → '2024-02-29' 형식
// ---------------------------------------------------------------------------
[[nodiscard]] auto sql_literal(const FieldValue& value, bool no_backslash_escapes)
    -> std::expected<std::string, Error>;

// '?' 자리의 offset 목록. 문자열 / 식별자 인용과 주석 안의 '?' 는 제외한다.
[[nodiscard]] auto find_placeholders(std::string_view sql) -> std::vector<std::size_t>;

// ---------------------------------------------------------------------------
// ClientPreparedStatement
//   클라이언트 측 prepared statement. '?' 를 바인딩 값의 리터럴로 바꾼 SQL 을
//   텍스트 프로토콜(COM_QUERY)로 실행한다. 서버에 statement 를 만들지 않는다.
//
//   - 파라미터 index 는 0 부터. 실행 전 모든 파라미터가 바인딩돼야 한다 (kUsage).
//   - 실행(execute_query / execute_update / add_batch) 후 바인딩은 지워진다.
//   - 문자열 이스케이프는 연결의 NO_BACKSLASH_ESCAPES 상태를 따른다.
// ---------------------------------------------------------------------------
class ClientPreparedStatement {
public:
    ClientPreparedStatement(Connection& conn, std::string sql);

    // index 범위를 벗어나면 kUsage
    auto set_param(std::size_t index, FieldValue value) -> std::expected<void, Error>;
    void clear_params() noexcept;

    // 현재 바인딩으로 만든 SQL
    [[nodiscard]] auto to_sql() const -> std::expected<std::string, Error>;

    auto execute_query() -> boost::asio::awaitable<std::expected<ResultSet, Error>>;

    auto execute_update(GeneratedKeys keys = GeneratedKeys::kNone)
        -> boost::asio::awaitable<std::expected<std::uint64_t, Error>>;

    // 현재 바인딩으로 만든 SQL 을 배치에 넣는다
    auto add_batch() -> std::expected<void, Error>;
    auto execute_batch() -> boost::asio::awaitable<std::expected<std::vector<std::uint64_t>, Error>>;

    [[nodiscard]] auto last_insert_id() const noexcept -> std::optional<std::uint64_t> {
        return statement_.last_insert_id();
    }
    [[nodiscard]] auto get_generated_keys() const -> std::expected<ResultSet, Error> {
        return statement_.get_generated_keys();
    }

    [[nodiscard]] auto sql()             const noexcept -> const std::string& { return sql_; }
    [[nodiscard]] auto parameter_count() const noexcept -> std::size_t { return params_.size(); }

private:
    Connection*                            conn_;
    std::string                            sql_;
    std::vector<std::size_t>               placeholders_;
    std::vector<std::optional<FieldValue>> params_;
    Statement                              statement_;
};
