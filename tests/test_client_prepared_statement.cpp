// ---------------------------------------------------------------------------
// test_client_prepared_statement.cpp
//
// ClientPreparedStatement 테스트
//   '?' 위치 탐색, 값 → SQL 리터럴, COM_QUERY 로 보내는 최종 SQL, 배치
// ---------------------------------------------------------------------------

#include "client/client_prepared_statement.hpp"
#include "client/connection.hpp"
#include "protocol/capabilities.hpp"

#include "scripted_transport.hpp"

#include <gtest/gtest.h>

#include <cstdint>
#include <limits>
#include <memory>
#include <string>
#include <vector>

using scripted::ScriptState;

namespace {

auto query_payload(std::string_view sql) -> Bytes {
    Bytes out{0x03};
    out.insert(out.end(), sql.begin(), sql.end());
    return out;
}

auto literal(const FieldValue& value, bool no_backslash_escapes = false) -> std::string {
    auto out = sql_literal(value, no_backslash_escapes);
    return out ? *out : "<error: " + out.error().message + ">";
}

class ClientPreparedStatementTest : public ::testing::Test {
protected:
    void SetUp() override {
        state_ = std::make_shared<ScriptState>();
        scripted::push_handshake(*state_);
        auto conn = scripted::open_connection(state_, scripted::default_config());
        ASSERT_TRUE(conn.has_value()) << conn.error().message;
        conn_ = std::move(*conn);
        state_->writes.clear();
    }

    std::shared_ptr<ScriptState> state_;
    std::unique_ptr<Connection>  conn_;
};

}  // namespace

// ---------------------------------------------------------------------------
// CP-1. 인용 / 주석 안의 '?' 는 파라미터가 아니다
// ---------------------------------------------------------------------------
TEST(FindPlaceholders, SkipsQuotedTextAndComments) {
    EXPECT_EQ(find_placeholders("SELECT ?, ?"), (std::vector<std::size_t>{7, 10}));
    EXPECT_EQ(find_placeholders("SELECT '?', \"?\", `?`, ?"), (std::vector<std::size_t>{22}));
    EXPECT_EQ(find_placeholders("SELECT 'it\\'s ?' , ?"), (std::vector<std::size_t>{19}));
    EXPECT_EQ(find_placeholders("SELECT ? -- why?\n, ? # what?\n/* ? */"),
              (std::vector<std::size_t>{7, 19}));
    EXPECT_TRUE(find_placeholders("SELECT 1").empty());
}

// ---------------------------------------------------------------------------
// CP-2. 타입별 리터럴
// ---------------------------------------------------------------------------
TEST(SqlLiteral, RendersEachValueKind) {
    EXPECT_EQ(literal(FieldValue{}), "NULL");
    EXPECT_EQ(literal(FieldValue{std::int64_t{-42}}), "-42");
    EXPECT_EQ(literal(FieldValue{std::uint64_t{18446744073709551615ULL}}), "18446744073709551615");
    EXPECT_EQ(literal(FieldValue{1.5}), "1.5");
    EXPECT_EQ(literal(FieldValue{std::string("abc")}), "'abc'");
    EXPECT_EQ(literal(FieldValue{Bytes{0x00, 0xAB, 0x10}}), "0x00AB10");
    EXPECT_EQ(literal(FieldValue{Bytes{}}), "X''");
    EXPECT_EQ(literal(FieldValue{Date{2024, 2, 29}}), "'2024-02-29'");
    EXPECT_EQ(literal(FieldValue{DateTime{2024, 2, 29, 12, 5, 9, 0}}), "'2024-02-29 12:05:09'");
    EXPECT_EQ(literal(FieldValue{Time{true, 1, 2, 3, 4, 0}}), "'-26:03:04'");
}

TEST(SqlLiteral, EscapesStrings) {
    const FieldValue tricky{std::string("O'Neil \\ \"x\"\n")};
    EXPECT_EQ(literal(tricky), "'O\\'Neil \\\\ \\\"x\\\"\\n'");
    EXPECT_EQ(literal(tricky, true), "'O''Neil \\ \"x\"\n'");
}

TEST(SqlLiteral, RejectsNonFiniteNumbers) {
    auto nan = sql_literal(FieldValue{std::numeric_limits<double>::quiet_NaN()}, false);
    ASSERT_FALSE(nan.has_value());
    EXPECT_EQ(nan.error().code, ErrorCode::kUsage);
}

// ---------------------------------------------------------------------------
// CP-3. execute_update: 치환된 SQL 을 COM_QUERY 로 보내고 바인딩을 지운다
// ---------------------------------------------------------------------------
TEST_F(ClientPreparedStatementTest, ExecuteUpdateSendsInterpolatedSql) {
    scripted::push_response(*state_, {scripted::ok(1, 7)});

    auto stmt = conn_->client_prepared_statement("INSERT INTO t(id, name) VALUES (?, ?)");
    ASSERT_EQ(stmt.parameter_count(), 2U);
    ASSERT_TRUE(stmt.set_param(0, FieldValue{std::int64_t{5}}).has_value());
    ASSERT_TRUE(stmt.set_param(1, FieldValue{std::string("it's")}).has_value());

    std::expected<std::uint64_t, Error> count{std::unexpected(Error{})};
    scripted::run_coro([&]() -> boost::asio::awaitable<void> {
        count = co_await stmt.execute_update(GeneratedKeys::kReturn);
    });

    ASSERT_TRUE(count.has_value()) << count.error().message;
    EXPECT_EQ(*count, 1U);
    EXPECT_EQ(stmt.last_insert_id(), std::optional<std::uint64_t>{7});
    EXPECT_TRUE(stmt.get_generated_keys().has_value());
    EXPECT_EQ(scripted::written_payload(*state_, 0),
              query_payload("INSERT INTO t(id, name) VALUES (5, 'it\\'s')"));

    auto rebuilt = stmt.to_sql();
    ASSERT_FALSE(rebuilt.has_value());
    EXPECT_EQ(rebuilt.error().message, "parameter 0 is not bound");
}

// ---------------------------------------------------------------------------
// CP-4. 바인딩 누락 / index 범위 → kUsage, 아무것도 보내지 않는다
// ---------------------------------------------------------------------------
TEST_F(ClientPreparedStatementTest, UnboundParameterIsUsageError) {
    auto stmt = conn_->client_prepared_statement("SELECT * FROM t WHERE a = ? AND b = ?");
    ASSERT_TRUE(stmt.set_param(0, FieldValue{std::int64_t{1}}).has_value());

    auto out_of_range = stmt.set_param(2, FieldValue{});
    ASSERT_FALSE(out_of_range.has_value());
    EXPECT_EQ(out_of_range.error().code, ErrorCode::kUsage);

    std::expected<ResultSet, Error> rs{std::unexpected(Error{})};
    scripted::run_coro([&]() -> boost::asio::awaitable<void> {
        rs = co_await stmt.execute_query();
    });

    ASSERT_FALSE(rs.has_value());
    EXPECT_EQ(rs.error().code, ErrorCode::kUsage);
    EXPECT_EQ(rs.error().message, "parameter 1 is not bound");
    EXPECT_TRUE(state_->writes.empty());
}

// ---------------------------------------------------------------------------
// CP-5. execute_query: 텍스트 result set
// ---------------------------------------------------------------------------
TEST_F(ClientPreparedStatementTest, ExecuteQueryStreamsRows) {
    scripted::push_response(*state_, {
        scripted::column_count(1),
        scripted::column_def("name", ColumnType::kVarString),
        scripted::text_row({"alice"}),
        scripted::end_of_rows(),
    });

    auto stmt = conn_->client_prepared_statement("SELECT name FROM users WHERE id = ?");
    ASSERT_TRUE(stmt.set_param(0, FieldValue{std::uint64_t{1}}).has_value());

    std::vector<std::string> names;
    scripted::run_coro([&]() -> boost::asio::awaitable<void> {
        auto rs = co_await stmt.execute_query();
        if (!rs) {
            co_return;
        }
        while (true) {
            auto more = co_await rs->next();
            if (!more || !*more) {
                break;
            }
            names.push_back(rs->get_string(0).value_or(""));
        }
    });

    EXPECT_EQ(names, (std::vector<std::string>{"alice"}));
    EXPECT_EQ(scripted::written_payload(*state_, 0),
              query_payload("SELECT name FROM users WHERE id = 1"));
}

// ---------------------------------------------------------------------------
// CP-6. NO_BACKSLASH_ESCAPES 인 세션에서는 ' 를 두 번 쓴다
// ---------------------------------------------------------------------------
TEST_F(ClientPreparedStatementTest, FollowsNoBackslashEscapesStatus) {
    const std::uint16_t status = scripted::kStatusAutocommit | server_status::kNoBackslashEscapes;
    scripted::push_response(*state_, {scripted::ok(0, 0, status)});

    std::expected<void, Error> pinged{std::unexpected(Error{})};
    scripted::run_coro([&]() -> boost::asio::awaitable<void> {
        pinged = co_await conn_->ping();
    });
    ASSERT_TRUE(pinged.has_value());

    auto stmt = conn_->client_prepared_statement("SELECT ?");
    ASSERT_TRUE(stmt.set_param(0, FieldValue{std::string("a'b\\c")}).has_value());
    EXPECT_EQ(stmt.to_sql(), std::string("SELECT 'a''b\\c'"));
}

// ---------------------------------------------------------------------------
// CP-7. add_batch / execute_batch
// ---------------------------------------------------------------------------
TEST_F(ClientPreparedStatementTest, BatchRunsEachBinding) {
    scripted::push_response(*state_, {scripted::ok(1)});
    scripted::push_response(*state_, {scripted::ok(1)});

    auto stmt = conn_->client_prepared_statement("DELETE FROM t WHERE id = ?");
    ASSERT_TRUE(stmt.set_param(0, FieldValue{std::int64_t{1}}).has_value());
    ASSERT_TRUE(stmt.add_batch().has_value());
    ASSERT_TRUE(stmt.set_param(0, FieldValue{std::int64_t{2}}).has_value());
    ASSERT_TRUE(stmt.add_batch().has_value());
    EXPECT_FALSE(stmt.add_batch().has_value());

    std::expected<std::vector<std::uint64_t>, Error> counts{std::unexpected(Error{})};
    scripted::run_coro([&]() -> boost::asio::awaitable<void> {
        counts = co_await stmt.execute_batch();
    });

    ASSERT_TRUE(counts.has_value()) << counts.error().message;
    EXPECT_EQ(*counts, (std::vector<std::uint64_t>{1, 1}));
    EXPECT_EQ(scripted::written_payload(*state_, 0), query_payload("DELETE FROM t WHERE id = 1"));
    EXPECT_EQ(scripted::written_payload(*state_, 1), query_payload("DELETE FROM t WHERE id = 2"));
}
