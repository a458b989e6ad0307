#pragma once

#include "common/types.hpp"
#include "protocol/field_value.hpp"
#include "protocol/response.hpp"
#include "protocol/row_codec.hpp"

#include <utility>
#include <boost/asio/awaitable.hpp>

#include <cstddef>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <vector>

class Connection;

// ---------------------------------------------------------------------------
// ResultSet
//   행 단위 cursor. 두 가지 형태가 있다.
//
//   streaming : 커맨드 응답의 row 를 next() 가 호출될 때마다 연결에서 읽는다.
//               같은 연결에서 다음 커맨드가 시작되면 남은 row 는 버려지고
//               이후 next() 는 kUsage 를 반환한다.
//   in-memory : 이미 만들어진 row 목록 (OK 응답의 빈 결과, 생성 키 등).
//
//   next() 만 네트워크를 읽는다. get_* 접근자는 현재 row 만 본다.
//
//   접근자 규칙:
//     - 컬럼 index 는 0 부터 시작한다. label 은 column alias(name) 와 비교한다.
//     - next() 이전 / 소진 이후 / close() 이후 접근 → kUsage
//     - NULL 은 0 / 빈 값을 반환하고 was_null() 을 true 로 만든다
//     - 변환할 수 없는 값 → kTypeConversion (컬럼, 요청 타입, 실제 타입 포함)
// ---------------------------------------------------------------------------
class ResultSet {
public:
    ResultSet() = default;

    // streaming
    ResultSet(Connection&                   conn,
              std::uint64_t                 stream_id,
              std::vector<ColumnDefinition> columns,
              RowFormat                     format);

    // in-memory
    ResultSet(std::vector<ColumnDefinition> columns, std::vector<Row> rows);

    ResultSet(ResultSet&&) noexcept            = default;
    ResultSet& operator=(ResultSet&&) noexcept = default;

    ResultSet(const ResultSet&)            = delete;
    ResultSet& operator=(const ResultSet&) = delete;

    // 다음 row 로 이동한다. row 가 없으면 false.
    auto next() -> boost::asio::awaitable<std::expected<bool, Error>>;

    // 남은 row 를 읽어 버리고 cursor 를 닫는다. 여러 번 호출해도 된다.
    auto close() -> boost::asio::awaitable<std::expected<void, Error>>;

    // -----------------------------------------------------------------------
    // 접근자
    // -----------------------------------------------------------------------
    [[nodiscard]] auto get_bool(std::size_t index) -> std::expected<bool, Error>;
    [[nodiscard]] auto get_int8(std::size_t index) -> std::expected<std::int8_t, Error>;
    [[nodiscard]] auto get_int16(std::size_t index) -> std::expected<std::int16_t, Error>;
    [[nodiscard]] auto get_int32(std::size_t index) -> std::expected<std::int32_t, Error>;
    [[nodiscard]] auto get_int64(std::size_t index) -> std::expected<std::int64_t, Error>;
    [[nodiscard]] auto get_uint64(std::size_t index) -> std::expected<std::uint64_t, Error>;
    [[nodiscard]] auto get_float(std::size_t index) -> std::expected<float, Error>;
    [[nodiscard]] auto get_double(std::size_t index) -> std::expected<double, Error>;
    [[nodiscard]] auto get_string(std::size_t index) -> std::expected<std::string, Error>;
    [[nodiscard]] auto get_bytes(std::size_t index) -> std::expected<Bytes, Error>;
    [[nodiscard]] auto get_date(std::size_t index) -> std::expected<Date, Error>;
    [[nodiscard]] auto get_datetime(std::size_t index) -> std::expected<DateTime, Error>;
    [[nodiscard]] auto get_time(std::size_t index) -> std::expected<Time, Error>;
    [[nodiscard]] auto get_value(std::size_t index) -> std::expected<FieldValue, Error>;
    [[nodiscard]] auto is_null(std::size_t index) -> std::expected<bool, Error>;

    [[nodiscard]] auto get_bool(std::string_view label) -> std::expected<bool, Error>;
    [[nodiscard]] auto get_int8(std::string_view label) -> std::expected<std::int8_t, Error>;
    [[nodiscard]] auto get_int16(std::string_view label) -> std::expected<std::int16_t, Error>;
    [[nodiscard]] auto get_int32(std::string_view label) -> std::expected<std::int32_t, Error>;
    [[nodiscard]] auto get_int64(std::string_view label) -> std::expected<std::int64_t, Error>;
    [[nodiscard]] auto get_uint64(std::string_view label) -> std::expected<std::uint64_t, Error>;
    [[nodiscard]] auto get_float(std::string_view label) -> std::expected<float, Error>;
    [[nodiscard]] auto get_double(std::string_view label) -> std::expected<double, Error>;
    [[nodiscard]] auto get_string(std::string_view label) -> std::expected<std::string, Error>;
    [[nodiscard]] auto get_bytes(std::string_view label) -> std::expected<Bytes, Error>;
    [[nodiscard]] auto get_date(std::string_view label) -> std::expected<Date, Error>;
    [[nodiscard]] auto get_datetime(std::string_view label) -> std::expected<DateTime, Error>;
    [[nodiscard]] auto get_time(std::string_view label) -> std::expected<Time, Error>;
    [[nodiscard]] auto get_value(std::string_view label) -> std::expected<FieldValue, Error>;
    [[nodiscard]] auto is_null(std::string_view label) -> std::expected<bool, Error>;

    // label → 0-based index. 없으면 kUsage
    [[nodiscard]] auto find_column(std::string_view label) const -> std::expected<std::size_t, Error>;

    // 마지막 접근자가 읽은 값이 NULL 이었는지
    [[nodiscard]] bool was_null() const noexcept { return was_null_; }

    [[nodiscard]] auto columns() const noexcept -> const std::vector<ColumnDefinition>& {
        return columns_;
    }
    [[nodiscard]] auto column_count() const noexcept -> std::size_t { return columns_.size(); }

    // 현재 row 번호 (1부터). next() 이전에는 0
    [[nodiscard]] auto row_number() const noexcept -> std::uint64_t { return row_number_; }
    [[nodiscard]] bool is_closed()  const noexcept { return closed_; }

private:
    // 현재 row 의 index 번째 값. cursor 상태 / index 범위를 검사하고 was_null_ 을 갱신한다.
    auto current(std::size_t index) -> std::expected<const FieldValue*, Error>;

    auto conversion_error(std::size_t index, std::string_view requested) const -> Error;

    template <typename T>
    auto get_integer(std::size_t index, std::string_view requested) -> std::expected<T, Error>;

    Connection*                   conn_{nullptr};
    std::uint64_t                 stream_id_{0};
    RowFormat                     format_{RowFormat::kText};
    std::vector<ColumnDefinition> columns_{};
    std::vector<Row>              rows_{};        // in-memory
    std::size_t                   cursor_{0};     // in-memory: 다음에 읽을 row
    Row                           current_{};
    bool                          has_row_{false};
    bool                          exhausted_{false};
    bool                          closed_{false};
    bool                          was_null_{false};
    std::uint64_t                 row_number_{0};
};
