#pragma once

#include "client/connection.hpp"
#include "client/result_set.hpp"
#include "common/types.hpp"

#include <utility>
#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

// 생성 키 result set 의 컬럼 이름
inline constexpr std::string_view kGeneratedKeyColumn = "GENERATED_KEY";

// 생성 키를 요청하지 않고 get_generated_keys() 를 호출했을 때의 메시지
inline constexpr std::string_view kGeneratedKeysNotRequested =
    "Generated keys not requested. You need to specify GeneratedKeys::kReturn to "
    "Statement::execute_update() or Connection::prepare().";

// last_insert_id 하나를 담은 생성 키 result set (BIGINT UNSIGNED 한 컬럼)
[[nodiscard]] auto make_generated_keys(std::optional<std::uint64_t> last_insert_id) -> ResultSet;

// ---------------------------------------------------------------------------
// Statement
//   텍스트 프로토콜(COM_QUERY) 실행기. Connection 을 참조만 한다.
//
//   execute_query  : result set 을 돌려준다 (row 는 next() 때 읽는다).
//                    서버가 OK 로 응답하면 빈 result set.
//   execute_update : 영향받은 row 수. result set 이 오면 비우고 kUsage.
//   execute_batch  : add_batch() 로 쌓은 SQL 을 순서대로 실행한다.
//                    첫 실패에서 멈추고 그 오류를 반환한다. 배치는 항상 비워진다.
// ---------------------------------------------------------------------------
class Statement {
public:
    explicit Statement(Connection& conn) noexcept : conn_(&conn) {}

    auto execute_query(std::string_view sql)
        -> boost::asio::awaitable<std::expected<ResultSet, Error>>;

    auto execute_update(std::string_view sql, GeneratedKeys keys = GeneratedKeys::kNone)
        -> boost::asio::awaitable<std::expected<std::uint64_t, Error>>;

    // 마지막 execute_update 의 last-insert-id. 0 이면 std::nullopt
    [[nodiscard]] auto last_insert_id() const noexcept -> std::optional<std::uint64_t> {
        return last_insert_id_;
    }

    // GeneratedKeys::kReturn 으로 실행하지 않았으면 kUsage
    [[nodiscard]] auto get_generated_keys() const -> std::expected<ResultSet, Error>;

    void add_batch(std::string sql) { batch_.push_back(std::move(sql)); }
    void clear_batch() noexcept { batch_.clear(); }
    [[nodiscard]] auto batch_size() const noexcept -> std::size_t { return batch_.size(); }

    auto execute_batch() -> boost::asio::awaitable<std::expected<std::vector<std::uint64_t>, Error>>;

    // 마지막 실행의 warning 수
    [[nodiscard]] auto warnings() const noexcept -> std::uint16_t { return warnings_; }

private:
    Connection*                  conn_;
    std::vector<std::string>     batch_{};
    std::optional<std::uint64_t> last_insert_id_{};
    GeneratedKeys                keys_{GeneratedKeys::kNone};
    std::uint16_t                warnings_{0};
};
