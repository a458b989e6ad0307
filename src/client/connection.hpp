#pragma once

#include "client/connection_config.hpp"
#include "common/types.hpp"
#include "net/packet_channel.hpp"
#include "net/transport.hpp"
#include "protocol/handshake.hpp"
#include "protocol/response.hpp"
#include "protocol/row_codec.hpp"

#include <utility>
#include <boost/asio/any_io_executor.hpp>
#include <boost/asio/awaitable.hpp>

#include <chrono>
#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

class ClientPreparedStatement;
class PreparedStatement;
class ResultSet;
class Statement;

// ---------------------------------------------------------------------------
// GeneratedKeys
//   execute_update / prepare 에서 생성 키 result set 을 요청할지 여부.
// ---------------------------------------------------------------------------
enum class GeneratedKeys : std::uint8_t {
    kNone,
    kReturn,
};

// ---------------------------------------------------------------------------
// TransactionIsolation
//   SET SESSION TRANSACTION ISOLATION LEVEL 의 네 단계.
// ---------------------------------------------------------------------------
enum class TransactionIsolation : std::uint8_t {
    kReadUncommitted,
    kReadCommitted,
    kRepeatableRead,
    kSerializable,
};

// "READ COMMITTED" 등 SET 문에 쓰는 이름
[[nodiscard]] auto isolation_sql_name(TransactionIsolation level) noexcept -> std::string_view;

// @@session.transaction_isolation 값("READ-COMMITTED" 등) → 단계.
// 모르는 값이면 kUsage "Unknown transaction isolation level <value>"
[[nodiscard]] auto parse_isolation_level(std::string_view value)
    -> std::expected<TransactionIsolation, Error>;

// set_savepoint() 가 돌려주는 이름표. rollback / release 에 그대로 넘긴다.
struct Savepoint {
    std::string name;
};

// ---------------------------------------------------------------------------
// ServerStatistics
//   COM_STATISTICS 응답 문자열. 예:
//   "Uptime: 5  Threads: 1  Questions: 9  Slow queries: 0  Opens: 117
//    Flush tables: 3  Open tables: 36  Queries per second avg: 1.800"
//   없는 항목은 0 으로 남는다. raw 에 원문을 보관한다.
// ---------------------------------------------------------------------------
struct ServerStatistics {
    std::uint64_t uptime{0};
    std::uint64_t threads{0};
    std::uint64_t questions{0};
    std::uint64_t slow_queries{0};
    std::uint64_t opens{0};
    std::uint64_t flush_tables{0};
    std::uint64_t open_tables{0};
    double        queries_per_second_avg{0.0};
    std::string   raw{};
};

[[nodiscard]] auto parse_server_statistics(std::string_view text) -> ServerStatistics;

// ---------------------------------------------------------------------------
// CommandResponse
//   커맨드 응답 첫 단계의 결과.
//   has_result_set == false : ok 에 OK 패킷 내용
//   has_result_set == true  : columns / stream_id 로 row 스트리밍 시작
// ---------------------------------------------------------------------------
struct CommandResponse {
    bool                          has_result_set{false};
    OkPacket                      ok{};
    std::vector<ColumnDefinition> columns{};
    std::uint64_t                 stream_id{0};
};

// ---------------------------------------------------------------------------
// Connection
//   하나의 물리 연결. transport 와 packet channel(sequence counter)을 소유한다.
//
//   - 커맨드는 한 번에 하나씩 순서대로 실행된다. 내부 잠금은 없다.
//   - 스트리밍 중인 ResultSet 이 있는 상태에서 새 커맨드를 보내면
//     남은 row 를 먼저 읽어 버린다. 버려진 ResultSet 의 next() 는 kUsage.
//   - 연결을 무효화하는 오류(invalidates_connection) 후에는 transport 가 닫히고
//     이후 모든 커맨드는 kIo 를 반환한다.
//   - 소멸자는 transport 를 닫는다. COM_QUIT 을 보내려면 close() 를 호출한다.
//
//   Statement / PreparedStatement / ResultSet 은 Connection 보다 오래 살 수 없다.
// ---------------------------------------------------------------------------
class Connection {
    // connect() / open() 만 생성자를 부를 수 있도록 하는 접근 키
    struct Passkey {
        explicit Passkey() = default;
    };

public:
    Connection(Passkey, std::unique_ptr<Transport> transport, ConnectionConfig config);

    // TCP 연결 + 소켓 옵션 + 핸드셰이크
    static auto connect(boost::asio::any_io_executor executor, const ConnectionConfig& config)
        -> boost::asio::awaitable<std::expected<std::unique_ptr<Connection>, Error>>;

    // 이미 연결된 transport 위에서 핸드셰이크를 수행한다
    static auto open(std::unique_ptr<Transport> transport, const ConnectionConfig& config)
        -> boost::asio::awaitable<std::expected<std::unique_ptr<Connection>, Error>>;

    ~Connection();

    Connection(const Connection&)            = delete;
    Connection& operator=(const Connection&) = delete;

    [[nodiscard]] auto create_statement() -> Statement;

    // '?' 자리에 SQL 리터럴을 채워 COM_QUERY 로 실행하는 문장. 서버와 통신하지 않는다.
    [[nodiscard]] auto client_prepared_statement(std::string sql) -> ClientPreparedStatement;

    // -----------------------------------------------------------------------
    // prepare
    //   COM_STMT_PREPARE. 서버 ERR → kServer
    // -----------------------------------------------------------------------
    auto prepare(std::string sql, GeneratedKeys keys = GeneratedKeys::kNone)
        -> boost::asio::awaitable<std::expected<PreparedStatement, Error>>;

    auto ping() -> boost::asio::awaitable<std::expected<void, Error>>;

    // COM_INIT_DB. 성공 시 catalog()/schema() 가 새 database 를 반환한다.
    auto set_database(std::string database) -> boost::asio::awaitable<std::expected<void, Error>>;

    // COM_RESET_CONNECTION. 서버 측 prepared statement 와 세션 상태가 초기화된다.
    auto reset() -> boost::asio::awaitable<std::expected<void, Error>>;

    // -----------------------------------------------------------------------
    // reset_server_state
    //   COM_RESET_CONNECTION 후 세션 기본값을 다시 맞춘다:
    //   SET NAMES utf8mb4 / SET character_set_results = NULL / SET autocommit=1
    //   성공하면 auto_commit() == true, read_only() == false.
    // -----------------------------------------------------------------------
    auto reset_server_state() -> boost::asio::awaitable<std::expected<void, Error>>;

    // -----------------------------------------------------------------------
    // change_user
    //   COM_CHANGE_USER. 현재 database 를 유지한 채 다른 계정으로 재인증한다.
    //   성공하면 config().user() / password() 가 바뀐다.
    //   인증 실패(kAuthentication)는 연결을 무효화한다.
    // -----------------------------------------------------------------------
    auto change_user(std::string user, std::optional<std::string> password)
        -> boost::asio::awaitable<std::expected<void, Error>>;

    // COM_STATISTICS. 응답은 OK 가 아닌 문자열 하나다.
    auto statistics() -> boost::asio::awaitable<std::expected<ServerStatistics, Error>>;

    // -----------------------------------------------------------------------
    // 트랜잭션
    //   commit / rollback 은 autocommit 상태에서 호출하면 아무것도 보내지 않고 kUsage.
    // -----------------------------------------------------------------------
    auto set_auto_commit(bool enabled) -> boost::asio::awaitable<std::expected<void, Error>>;
    auto commit()   -> boost::asio::awaitable<std::expected<void, Error>>;
    auto rollback() -> boost::asio::awaitable<std::expected<void, Error>>;

    // SET SESSION TRANSACTION READ ONLY | READ WRITE
    auto set_read_only(bool read_only) -> boost::asio::awaitable<std::expected<void, Error>>;

    auto set_transaction_isolation(TransactionIsolation level)
        -> boost::asio::awaitable<std::expected<void, Error>>;

    // SELECT @@session.transaction_isolation
    auto transaction_isolation() -> boost::asio::awaitable<std::expected<TransactionIsolation, Error>>;

    // SAVEPOINT `name`. 이름을 주지 않으면 UUID 기반 이름을 만든다.
    auto set_savepoint() -> boost::asio::awaitable<std::expected<Savepoint, Error>>;
    auto set_savepoint(std::string name) -> boost::asio::awaitable<std::expected<Savepoint, Error>>;

    // ROLLBACK TO SAVEPOINT `name`
    auto rollback(const Savepoint& savepoint) -> boost::asio::awaitable<std::expected<void, Error>>;

    // RELEASE SAVEPOINT `name`
    auto release_savepoint(const Savepoint& savepoint)
        -> boost::asio::awaitable<std::expected<void, Error>>;

    // -----------------------------------------------------------------------
    // close
    //   autocommit 이 꺼져 있으면 ROLLBACK 을 먼저 보낸다 (실패는 무시).
    //   이어서 COM_QUIT 후 transport 를 닫는다. 여러 번 호출해도 된다.
    // -----------------------------------------------------------------------
    auto close() -> boost::asio::awaitable<void>;

    // database_term 에 해당하는 쪽만 현재 database 를 반환한다
    [[nodiscard]] auto catalog() const -> std::optional<std::string>;
    [[nodiscard]] auto schema()  const -> std::optional<std::string>;

    [[nodiscard]] bool auto_commit()   const noexcept;
    [[nodiscard]] bool in_transaction() const noexcept;
    [[nodiscard]] bool read_only()     const noexcept { return read_only_; }
    [[nodiscard]] bool is_open()       const noexcept { return channel_.is_usable(); }
    [[nodiscard]] auto status_flags()  const noexcept -> std::uint16_t { return status_flags_; }
    [[nodiscard]] auto server_info()   const noexcept -> const ServerInfo& { return server_info_; }
    [[nodiscard]] auto config()        const noexcept -> const ConnectionConfig& { return config_; }

private:
    friend class PreparedStatement;
    friend class ResultSet;
    friend class Statement;

    // Connection::open 의 핸드셰이크 단계. span 은 호출자가 소유한다.
    static auto handshake(std::unique_ptr<Transport> transport,
                          const ConnectionConfig&    config,
                          Span*                      span)
        -> boost::asio::awaitable<std::expected<std::unique_ptr<Connection>, Error>>;

    // SQL 한 문장을 실행하고 결과를 버린다
    auto execute_sql(std::string_view sql) -> boost::asio::awaitable<std::expected<void, Error>>;

    // -----------------------------------------------------------------------
    // 커맨드 엔진 (Statement / PreparedStatement / ResultSet 전용)
    // -----------------------------------------------------------------------

    // 남은 스트림을 비우고 sequence 를 0 으로 되돌린 뒤 payload 를 보낸다
    auto send_command(std::span<const std::uint8_t> payload)
        -> boost::asio::awaitable<std::expected<void, Error>>;

    // OK / ERR / result set 헤더 + column definition 까지 읽는다
    auto read_command_response()
        -> boost::asio::awaitable<std::expected<CommandResponse, Error>>;

    // send_command + read_command_response. result set 이 오면 비우고 OK 를 만든다.
    auto execute_simple(std::span<const std::uint8_t> payload)
        -> boost::asio::awaitable<std::expected<OkPacket, Error>>;

    // 스트림에서 row 하나. 종료 표식이면 std::nullopt
    auto fetch_row(std::uint64_t stream_id, const std::vector<ColumnDefinition>& columns, RowFormat format)
        -> boost::asio::awaitable<std::expected<std::optional<Row>, Error>>;

    // 진행 중인 스트림 + 후속 result(MORE_RESULTS_EXISTS)를 모두 읽어 버린다
    auto drain_pending() -> boost::asio::awaitable<std::expected<void, Error>>;
    auto drain_stream()  -> boost::asio::awaitable<std::expected<void, Error>>;

    // row 스트림 종료 패킷(EOF 또는 OK)을 반영하고 스트림을 끝낸다
    auto finish_stream(std::span<const std::uint8_t> payload) -> std::expected<void, Error>;

    auto read_column_definitions(std::uint64_t count)
        -> boost::asio::awaitable<std::expected<std::vector<ColumnDefinition>, Error>>;

    auto read_packet() -> boost::asio::awaitable<std::expected<Bytes, Error>>;

    [[nodiscard]] bool owns_stream(std::uint64_t stream_id) const noexcept {
        return stream_id != 0 && active_stream_ == stream_id;
    }
    [[nodiscard]] bool deprecate_eof() const noexcept;

    void update_status(std::uint16_t status_flags) noexcept;

    // 연결을 무효화하는 오류면 channel 을 닫는다. 오류를 그대로 반환한다.
    auto fail(Error error, std::string_view operation) -> Error;

    void log_query(std::string_view                     sql,
                   std::string_view                     protocol,
                   std::uint64_t                        affected_rows,
                   const Error*                         error,
                   std::chrono::steady_clock::duration  elapsed) const;
    void log_connection_event(std::string_view event) const;

    std::unique_ptr<Transport>  transport_;
    PacketChannel               channel_;
    ConnectionConfig            config_;
    ServerInfo                  server_info_{};
    std::optional<std::string>  database_{};
    std::uint16_t               status_flags_{0};
    bool                        more_results_{false};
    std::uint64_t               active_stream_{0};
    std::uint64_t               next_stream_id_{0};
    bool                        read_only_{false};
    bool                        closed_{false};
};
