#include "client/connection.hpp"

#include "client/client_prepared_statement.hpp"
#include "client/prepared_statement.hpp"
#include "client/statement.hpp"
#include "net/tcp_transport.hpp"
#include "protocol/capabilities.hpp"
#include "protocol/codec.hpp"
#include "protocol/command.hpp"

#include <boost/uuid/random_generator.hpp>
#include <boost/uuid/uuid_io.hpp>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <charconv>
#include <utility>

// ---------------------------------------------------------------------------
// Connection — 구현
//
// 커맨드 사이클:
//   send_command      : drain_pending → reset_sequence → write_payload
//   read_command_resp : OK | ERR | [column count][column def × n][EOF?]
//   fetch_row         : row | ERR | 종료 표식(EOF 또는 0xFE OK)
//
// active_stream_ 은 아직 종료 표식을 읽지 않은 result set 의 id 이다.
// 새 커맨드가 시작되면 drain_stream() 이 남은 row 를 버리고 0 으로 되돌린다.
// ---------------------------------------------------------------------------

namespace {

constexpr std::uint8_t kLocalInfileHeader = 0xFB;

auto closed_error() -> Error {
    return Error{ErrorCode::kIo, "connection is closed"};
}

void record_error(Span* span, const Error& error) {
    if (span != nullptr) {
        span->record_error(error);
    }
}

void record_error(const std::unique_ptr<Span>& span, const Error& error) {
    record_error(span.get(), error);
}

// 식별자를 `...` 로 감싼다. 안의 ` 는 두 번 쓴다.
auto quote_identifier(std::string_view name) -> std::string {
    std::string out;
    out.reserve(name.size() + 2);
    out.push_back('`');
    for (const char c : name) {
        if (c == '`') {
            out.push_back('`');
        }
        out.push_back(c);
    }
    out.push_back('`');
    return out;
}

// UUID 의 '-' 를 '_' 로 바꾼 이름
auto unique_savepoint_name() -> std::string {
    auto name = boost::uuids::to_string(boost::uuids::random_generator()());
    std::replace(name.begin(), name.end(), '-', '_');
    return name;
}

// "Uptime" 등 이름 → ServerStatistics 필드
auto statistics_field(ServerStatistics& stats, std::string_view key) -> std::uint64_t* {
    if (key == "Uptime")       return &stats.uptime;
    if (key == "Threads")      return &stats.threads;
    if (key == "Questions")    return &stats.questions;
    if (key == "Slow queries") return &stats.slow_queries;
    if (key == "Opens")        return &stats.opens;
    if (key == "Flush tables") return &stats.flush_tables;
    if (key == "Open tables")  return &stats.open_tables;
    return nullptr;
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && text.front() == ' ') {
        text.remove_prefix(1);
    }
    while (!text.empty() && text.back() == ' ') {
        text.remove_suffix(1);
    }
    return text;
}

}  // namespace

// ---------------------------------------------------------------------------
// 세션 값 도우미
// ---------------------------------------------------------------------------
auto isolation_sql_name(TransactionIsolation level) noexcept -> std::string_view {
    switch (level) {
        case TransactionIsolation::kReadUncommitted: return "READ UNCOMMITTED";
        case TransactionIsolation::kReadCommitted:   return "READ COMMITTED";
        case TransactionIsolation::kRepeatableRead:  return "REPEATABLE READ";
        case TransactionIsolation::kSerializable:    return "SERIALIZABLE";
    }
    return "REPEATABLE READ";
}

auto parse_isolation_level(std::string_view value) -> std::expected<TransactionIsolation, Error> {
    if (value == "READ-UNCOMMITTED") return TransactionIsolation::kReadUncommitted;
    if (value == "READ-COMMITTED")   return TransactionIsolation::kReadCommitted;
    if (value == "REPEATABLE-READ")  return TransactionIsolation::kRepeatableRead;
    if (value == "SERIALIZABLE")     return TransactionIsolation::kSerializable;
    return std::unexpected(Error{
        ErrorCode::kUsage,
        fmt::format("Unknown transaction isolation level {}", value),
    });
}

// 항목은 두 칸 공백으로 구분된 "이름: 값"
auto parse_server_statistics(std::string_view text) -> ServerStatistics {
    ServerStatistics stats;
    stats.raw = std::string(text);

    std::string_view rest = text;
    while (!rest.empty()) {
        const auto sep   = rest.find("  ");
        const auto entry = trim(rest.substr(0, sep));
        rest = sep == std::string_view::npos ? std::string_view{} : rest.substr(sep + 2);

        const auto colon = entry.find(':');
        if (colon == std::string_view::npos) {
            continue;
        }
        const auto key   = trim(entry.substr(0, colon));
        const auto value = trim(entry.substr(colon + 1));
        const char* end  = value.data() + value.size();

        if (key == "Queries per second avg") {
            double avg = 0.0;
            if (auto [ptr, ec] = std::from_chars(value.data(), end, avg); ec == std::errc{}) {
                stats.queries_per_second_avg = avg;
            }
            continue;
        }
        if (auto* field = statistics_field(stats, key); field != nullptr) {
            std::uint64_t number = 0;
            if (auto [ptr, ec] = std::from_chars(value.data(), end, number); ec == std::errc{}) {
                *field = number;
            }
        }
    }
    return stats;
}

Connection::Connection(Passkey, std::unique_ptr<Transport> transport, ConnectionConfig config)
    : transport_(std::move(transport))
    , channel_(*transport_, config.debug())
    , config_(std::move(config))
    , database_(config_.database())
{}

Connection::~Connection() {
    if (!closed_) {
        channel_.close();
    }
}

// ---------------------------------------------------------------------------
// connect / open
//   "connect" span 하나가 TCP 연결과 핸드셰이크를 함께 감싼다.
//   성공: ConnectionLog "connect" + info, 실패: ErrorLog + warn.
// ---------------------------------------------------------------------------
auto Connection::connect(boost::asio::any_io_executor executor, const ConnectionConfig& config)
    -> boost::asio::awaitable<std::expected<std::unique_ptr<Connection>, Error>>
{
    auto span = start_span(config.tracer(), "connect");
    if (span) {
        span->set_attribute("server.address", config.host());
        span->set_attribute("db.user", config.user());
    }

    auto transport = co_await TcpTransport::connect(
        executor, config.host(), config.port(), config.socket_options(), config.read_timeout());
    if (!transport) {
        record_error(span, transport.error());
        spdlog::warn("[connection] connect to {}:{} failed: {}", config.host(), config.port(),
                     transport.error().message);
        if (config.logger()) {
            config.logger()->log_error(ErrorLog{
                .connection_id = 0,
                .operation     = "connect",
                .code          = transport.error().code,
                .message       = transport.error().message,
                .timestamp     = std::chrono::system_clock::now(),
            });
        }
        co_return std::unexpected(std::move(transport.error()));
    }

    co_return co_await handshake(std::move(*transport), config, span.get());
}

auto Connection::open(std::unique_ptr<Transport> transport, const ConnectionConfig& config)
    -> boost::asio::awaitable<std::expected<std::unique_ptr<Connection>, Error>>
{
    auto span = start_span(config.tracer(), "connect");
    if (span) {
        span->set_attribute("server.address", config.host());
        span->set_attribute("db.user", config.user());
    }
    co_return co_await handshake(std::move(transport), config, span.get());
}

auto Connection::handshake(std::unique_ptr<Transport> transport,
                           const ConnectionConfig&    config,
                           Span*                      span)
    -> boost::asio::awaitable<std::expected<std::unique_ptr<Connection>, Error>>
{
    auto conn = std::make_unique<Connection>(Passkey{}, std::move(transport), config);

    HandshakeOptions options{
        .host                       = config.host(),
        .user                       = config.user(),
        .password                   = config.password(),
        .database                   = config.database(),
        .ssl                        = config.ssl(),
        .allow_public_key_retrieval = config.allow_public_key_retrieval(),
    };

    auto info = co_await HandshakeEngine::perform(conn->channel_, options);
    if (!info) {
        record_error(span, info.error());
        spdlog::warn("[connection] handshake with {}:{} failed: {}", config.host(), config.port(),
                     info.error().message);
        if (info.error().code == ErrorCode::kAuthentication) {
            conn->log_connection_event("auth_failed");
        }
        auto error = conn->fail(std::move(info.error()), "handshake");
        conn->channel_.close();
        conn->closed_ = true;
        co_return std::unexpected(std::move(error));
    }

    conn->server_info_  = std::move(*info);
    conn->status_flags_ = conn->server_info_.status_flags;
    conn->log_connection_event("connect");

    spdlog::info("[connection] connected to {}:{} id={} version={} plugin={} tls={}",
                 config.host(), config.port(), conn->server_info_.connection_id,
                 conn->server_info_.server_version, conn->server_info_.auth_plugin,
                 conn->server_info_.tls);
    co_return std::move(conn);
}

auto Connection::create_statement() -> Statement {
    return Statement(*this);
}

auto Connection::client_prepared_statement(std::string sql) -> ClientPreparedStatement {
    return ClientPreparedStatement(*this, std::move(sql));
}

// ---------------------------------------------------------------------------
// prepare
//   [PrepareOk][param def × num_params][EOF?][column def × num_columns][EOF?]
// ---------------------------------------------------------------------------
auto Connection::prepare(std::string sql, GeneratedKeys keys)
    -> boost::asio::awaitable<std::expected<PreparedStatement, Error>>
{
    auto span = start_span(config_.tracer(), "prepare");
    if (span) {
        span->set_attribute("db.statement", sql);
    }

    const Bytes payload = build_stmt_prepare(sql);
    auto sent = co_await send_command(payload);
    if (!sent) {
        record_error(span, sent.error());
        co_return std::unexpected(std::move(sent.error()));
    }

    auto response = co_await read_packet();
    if (!response) {
        record_error(span, response.error());
        co_return std::unexpected(std::move(response.error()));
    }
    if (!response->empty() && response->front() == kErrHeader) {
        auto error = fail(error_from_payload(*response, ErrorCode::kServer), "prepare");
        record_error(span, error);
        co_return std::unexpected(std::move(error));
    }

    auto ok = parse_prepare_ok(*response);
    if (!ok) {
        auto error = fail(std::move(ok.error()), "prepare");
        record_error(span, error);
        co_return std::unexpected(std::move(error));
    }

    auto params = co_await read_column_definitions(ok->num_params);
    if (!params) {
        record_error(span, params.error());
        co_return std::unexpected(std::move(params.error()));
    }
    auto columns = co_await read_column_definitions(ok->num_columns);
    if (!columns) {
        record_error(span, columns.error());
        co_return std::unexpected(std::move(columns.error()));
    }

    spdlog::debug("[connection] prepared statement id={} params={} columns={}",
                  ok->statement_id, ok->num_params, ok->num_columns);
    co_return PreparedStatement(*this, std::move(sql), *ok, std::move(*params),
                                std::move(*columns), keys);
}

// ---------------------------------------------------------------------------
// 단순 커맨드
// ---------------------------------------------------------------------------
auto Connection::ping() -> boost::asio::awaitable<std::expected<void, Error>> {
    const Bytes payload = build_simple_command(CommandType::kComPing);
    auto ok = co_await execute_simple(payload);
    if (!ok) {
        co_return std::unexpected(std::move(ok.error()));
    }
    co_return std::expected<void, Error>{};
}

auto Connection::set_database(std::string database)
    -> boost::asio::awaitable<std::expected<void, Error>>
{
    const Bytes payload = build_init_db(database);
    auto ok = co_await execute_simple(payload);
    if (!ok) {
        co_return std::unexpected(std::move(ok.error()));
    }
    database_ = std::move(database);
    co_return std::expected<void, Error>{};
}

auto Connection::reset() -> boost::asio::awaitable<std::expected<void, Error>> {
    const Bytes payload = build_simple_command(CommandType::kComResetConnection);
    auto ok = co_await execute_simple(payload);
    if (!ok) {
        co_return std::unexpected(std::move(ok.error()));
    }
    co_return std::expected<void, Error>{};
}

// ---------------------------------------------------------------------------
// reset_server_state / change_user / statistics
// ---------------------------------------------------------------------------
auto Connection::reset_server_state() -> boost::asio::awaitable<std::expected<void, Error>> {
    auto reset_done = co_await reset();
    if (!reset_done) {
        co_return std::unexpected(std::move(reset_done.error()));
    }
    for (const std::string_view sql : {"SET NAMES utf8mb4", "SET character_set_results = NULL",
                                       "SET autocommit=1"}) {
        auto done = co_await execute_sql(sql);
        if (!done) {
            co_return std::unexpected(std::move(done.error()));
        }
    }
    status_flags_ |= server_status::kAutocommit;
    read_only_ = false;
    co_return std::expected<void, Error>{};
}

auto Connection::change_user(std::string user, std::optional<std::string> password)
    -> boost::asio::awaitable<std::expected<void, Error>>
{
    if (closed_ || !channel_.is_usable()) {
        co_return std::unexpected(closed_error());
    }
    auto drained = co_await drain_pending();
    if (!drained) {
        co_return std::unexpected(std::move(drained.error()));
    }

    HandshakeOptions options{
        .host                       = config_.host(),
        .user                       = user,
        .password                   = password,
        .database                   = database_,
        .ssl                        = config_.ssl(),
        .allow_public_key_retrieval = config_.allow_public_key_retrieval(),
    };

    auto info = co_await HandshakeEngine::change_user(channel_, server_info_, options);
    if (!info) {
        if (info.error().code == ErrorCode::kAuthentication) {
            log_connection_event("auth_failed");
        }
        co_return std::unexpected(fail(std::move(info.error()), "change_user"));
    }

    server_info_ = std::move(*info);
    update_status(server_info_.status_flags);
    config_ = config_.set_user(std::move(user)).set_password(std::move(password));
    read_only_ = false;
    log_connection_event("change_user");
    co_return std::expected<void, Error>{};
}

auto Connection::statistics() -> boost::asio::awaitable<std::expected<ServerStatistics, Error>> {
    const Bytes payload = build_simple_command(CommandType::kComStatistics);
    auto sent = co_await send_command(payload);
    if (!sent) {
        co_return std::unexpected(std::move(sent.error()));
    }

    auto reply = co_await read_packet();
    if (!reply) {
        co_return std::unexpected(std::move(reply.error()));
    }
    if (!reply->empty() && reply->front() == kErrHeader) {
        co_return std::unexpected(fail(error_from_payload(*reply, ErrorCode::kServer), "statistics"));
    }
    const std::string_view text(reinterpret_cast<const char*>(reply->data()), reply->size());
    co_return parse_server_statistics(text);
}

// ---------------------------------------------------------------------------
// 트랜잭션
// ---------------------------------------------------------------------------
auto Connection::set_auto_commit(bool enabled) -> boost::asio::awaitable<std::expected<void, Error>> {
    co_return co_await execute_sql(enabled ? "SET autocommit=1" : "SET autocommit=0");
}

auto Connection::commit() -> boost::asio::awaitable<std::expected<void, Error>> {
    if (auto_commit()) {
        co_return std::unexpected(Error{ErrorCode::kUsage, "Can't call commit when autocommit=true"});
    }
    co_return co_await execute_sql("COMMIT");
}

auto Connection::rollback() -> boost::asio::awaitable<std::expected<void, Error>> {
    if (auto_commit()) {
        co_return std::unexpected(Error{ErrorCode::kUsage, "Can't call rollback when autocommit=true"});
    }
    co_return co_await execute_sql("ROLLBACK");
}

auto Connection::set_read_only(bool read_only) -> boost::asio::awaitable<std::expected<void, Error>> {
    auto done = co_await execute_sql(read_only ? "SET SESSION TRANSACTION READ ONLY"
                                               : "SET SESSION TRANSACTION READ WRITE");
    if (!done) {
        co_return std::unexpected(std::move(done.error()));
    }
    read_only_ = read_only;
    co_return std::expected<void, Error>{};
}

auto Connection::set_transaction_isolation(TransactionIsolation level)
    -> boost::asio::awaitable<std::expected<void, Error>>
{
    co_return co_await execute_sql(
        fmt::format("SET SESSION TRANSACTION ISOLATION LEVEL {}", isolation_sql_name(level)));
}

auto Connection::transaction_isolation()
    -> boost::asio::awaitable<std::expected<TransactionIsolation, Error>>
{
    Statement stmt(*this);
    auto rs = co_await stmt.execute_query("SELECT @@session.transaction_isolation");
    if (!rs) {
        co_return std::unexpected(std::move(rs.error()));
    }
    auto has_row = co_await rs->next();
    if (!has_row) {
        co_return std::unexpected(std::move(has_row.error()));
    }
    if (!*has_row) {
        co_return std::unexpected(
            Error{ErrorCode::kUsage, "transaction isolation query returned no rows"});
    }
    auto value = rs->get_string(0);
    if (!value) {
        co_return std::unexpected(std::move(value.error()));
    }
    auto closed = co_await rs->close();
    if (!closed) {
        co_return std::unexpected(std::move(closed.error()));
    }
    co_return parse_isolation_level(*value);
}

auto Connection::set_savepoint() -> boost::asio::awaitable<std::expected<Savepoint, Error>> {
    co_return co_await set_savepoint(unique_savepoint_name());
}

auto Connection::set_savepoint(std::string name)
    -> boost::asio::awaitable<std::expected<Savepoint, Error>>
{
    auto done = co_await execute_sql(fmt::format("SAVEPOINT {}", quote_identifier(name)));
    if (!done) {
        co_return std::unexpected(std::move(done.error()));
    }
    co_return Savepoint{std::move(name)};
}

auto Connection::rollback(const Savepoint& savepoint)
    -> boost::asio::awaitable<std::expected<void, Error>>
{
    co_return co_await execute_sql(
        fmt::format("ROLLBACK TO SAVEPOINT {}", quote_identifier(savepoint.name)));
}

auto Connection::release_savepoint(const Savepoint& savepoint)
    -> boost::asio::awaitable<std::expected<void, Error>>
{
    co_return co_await execute_sql(
        fmt::format("RELEASE SAVEPOINT {}", quote_identifier(savepoint.name)));
}

auto Connection::execute_sql(std::string_view sql) -> boost::asio::awaitable<std::expected<void, Error>> {
    const Bytes payload = build_query(sql);
    auto ok = co_await execute_simple(payload);
    if (!ok) {
        co_return std::unexpected(std::move(ok.error()));
    }
    co_return std::expected<void, Error>{};
}

// ---------------------------------------------------------------------------
// close
//   열린 트랜잭션은 ROLLBACK 으로 정리한다. 실패해도 종료는 계속한다.
//   COM_QUIT 에는 응답이 없다. 쓰기 실패는 debug 로만 남긴다.
// ---------------------------------------------------------------------------
auto Connection::close() -> boost::asio::awaitable<void> {
    if (closed_) {
        co_return;
    }

    if (channel_.is_usable() && !auto_commit()) {
        auto rolled_back = co_await execute_sql("ROLLBACK");
        if (!rolled_back) {
            spdlog::debug("[connection] ROLLBACK before close failed: {}", rolled_back.error().message);
        }
    }
    closed_ = true;

    if (channel_.is_usable()) {
        channel_.reset_sequence();
        const Bytes quit = build_simple_command(CommandType::kComQuit);
        auto written = co_await channel_.write_payload(quit);
        if (!written) {
            spdlog::debug("[connection] COM_QUIT failed: {}", written.error().message);
        }
    }
    channel_.close();
    active_stream_ = 0;
    more_results_  = false;
    log_connection_event("disconnect");
}

auto Connection::catalog() const -> std::optional<std::string> {
    if (config_.database_term() != DatabaseTerm::kCatalog) {
        return std::nullopt;
    }
    return database_;
}

auto Connection::schema() const -> std::optional<std::string> {
    if (config_.database_term() != DatabaseTerm::kSchema) {
        return std::nullopt;
    }
    return database_;
}

bool Connection::auto_commit() const noexcept {
    return (status_flags_ & server_status::kAutocommit) != 0;
}

bool Connection::in_transaction() const noexcept {
    return (status_flags_ & server_status::kInTransaction) != 0;
}

// ---------------------------------------------------------------------------
// 커맨드 엔진
// ---------------------------------------------------------------------------
auto Connection::send_command(std::span<const std::uint8_t> payload)
    -> boost::asio::awaitable<std::expected<void, Error>>
{
    if (closed_ || !channel_.is_usable()) {
        co_return std::unexpected(closed_error());
    }

    auto drained = co_await drain_pending();
    if (!drained) {
        co_return std::unexpected(std::move(drained.error()));
    }

    channel_.reset_sequence();
    auto written = co_await channel_.write_payload(payload);
    if (!written) {
        co_return std::unexpected(fail(std::move(written.error()), "command"));
    }
    co_return std::expected<void, Error>{};
}

auto Connection::read_command_response()
    -> boost::asio::awaitable<std::expected<CommandResponse, Error>>
{
    auto payload = co_await read_packet();
    if (!payload) {
        co_return std::unexpected(std::move(payload.error()));
    }

    switch (classify_response(*payload)) {
        case ResponseKind::kOk: {
            auto ok = parse_ok_packet(*payload);
            if (!ok) {
                co_return std::unexpected(fail(std::move(ok.error()), "command"));
            }
            update_status(ok->status_flags);
            CommandResponse response;
            response.ok = std::move(*ok);
            co_return response;
        }

        case ResponseKind::kError: {
            more_results_ = false;
            co_return std::unexpected(
                fail(error_from_payload(*payload, ErrorCode::kServer), "command"));
        }

        case ResponseKind::kLocalInfile: {
            // 빈 패킷으로 거절하면 서버가 OK 또는 ERR 로 사이클을 끝낸다
            auto written = co_await channel_.write_payload(std::span<const std::uint8_t>{});
            if (!written) {
                co_return std::unexpected(fail(std::move(written.error()), "command"));
            }
            auto tail = co_await read_packet();
            if (!tail) {
                co_return std::unexpected(std::move(tail.error()));
            }
            if (!tail->empty() && tail->front() == kOkHeader) {
                auto ok = parse_ok_packet(*tail);
                if (ok) {
                    update_status(ok->status_flags);
                }
            } else {
                more_results_ = false;
            }
            co_return std::unexpected(Error{ErrorCode::kUsage, "LOCAL INFILE is not supported"});
        }

        case ResponseKind::kEof:
            co_return std::unexpected(
                fail(Error{ErrorCode::kFraming, "unexpected EOF packet in command response"},
                     "command"));

        case ResponseKind::kResultSet:
            break;
    }

    PacketReader r(*payload);
    auto count = r.read_lenenc_int();
    if (!count) {
        co_return std::unexpected(fail(std::move(count.error()), "command"));
    }
    if (*count == 0 || !r.empty()) {
        co_return std::unexpected(
            fail(Error{ErrorCode::kFraming, "invalid column count packet"}, "command"));
    }

    auto columns = co_await read_column_definitions(*count);
    if (!columns) {
        co_return std::unexpected(std::move(columns.error()));
    }

    CommandResponse response;
    response.has_result_set = true;
    response.columns        = std::move(*columns);
    response.stream_id      = ++next_stream_id_;
    active_stream_          = response.stream_id;
    co_return response;
}

auto Connection::execute_simple(std::span<const std::uint8_t> payload)
    -> boost::asio::awaitable<std::expected<OkPacket, Error>>
{
    auto sent = co_await send_command(payload);
    if (!sent) {
        co_return std::unexpected(std::move(sent.error()));
    }

    auto response = co_await read_command_response();
    if (!response) {
        co_return std::unexpected(std::move(response.error()));
    }

    auto drained = co_await drain_pending();
    if (!drained) {
        co_return std::unexpected(std::move(drained.error()));
    }

    if (response->has_result_set) {
        OkPacket ok;
        ok.status_flags = status_flags_;
        co_return ok;
    }
    co_return std::move(response->ok);
}

auto Connection::fetch_row(std::uint64_t                        stream_id,
                           const std::vector<ColumnDefinition>& columns,
                           RowFormat                            format)
    -> boost::asio::awaitable<std::expected<std::optional<Row>, Error>>
{
    if (!owns_stream(stream_id)) {
        co_return std::unexpected(
            Error{ErrorCode::kUsage, "result set was closed by a later command"});
    }

    auto payload = co_await read_packet();
    if (!payload) {
        active_stream_ = 0;
        co_return std::unexpected(std::move(payload.error()));
    }

    if (payload->front() == kErrHeader) {
        active_stream_ = 0;
        more_results_  = false;
        co_return std::unexpected(
            fail(error_from_payload(*payload, ErrorCode::kServer), "fetch"));
    }

    if (is_result_terminator(*payload, deprecate_eof())) {
        auto finished = finish_stream(*payload);
        if (!finished) {
            co_return std::unexpected(std::move(finished.error()));
        }
        co_return std::optional<Row>{};
    }

    auto row = decode_row(format, *payload, columns);
    if (!row) {
        active_stream_ = 0;
        co_return std::unexpected(fail(std::move(row.error()), "fetch"));
    }
    co_return std::optional<Row>{std::move(*row)};
}

auto Connection::drain_pending() -> boost::asio::awaitable<std::expected<void, Error>> {
    auto drained = co_await drain_stream();
    if (!drained) {
        co_return std::unexpected(std::move(drained.error()));
    }

    // 다중 result: 남은 result 의 ERR 는 그 result 의 실패일 뿐 연결은 유지된다
    while (more_results_) {
        more_results_ = false;
        auto response = co_await read_command_response();
        if (!response) {
            if (invalidates_connection(response.error().code)) {
                co_return std::unexpected(std::move(response.error()));
            }
            spdlog::debug("[connection] discarded trailing result error: {}",
                          response.error().message);
            continue;
        }
        if (response->has_result_set) {
            auto rows = co_await drain_stream();
            if (!rows) {
                co_return std::unexpected(std::move(rows.error()));
            }
        }
    }
    co_return std::expected<void, Error>{};
}

auto Connection::drain_stream() -> boost::asio::awaitable<std::expected<void, Error>> {
    std::size_t discarded = 0;
    while (active_stream_ != 0) {
        auto payload = co_await read_packet();
        if (!payload) {
            active_stream_ = 0;
            co_return std::unexpected(std::move(payload.error()));
        }
        if (payload->front() == kErrHeader) {
            active_stream_ = 0;
            more_results_  = false;
            spdlog::debug("[connection] result stream ended with server error while draining");
            break;
        }
        if (is_result_terminator(*payload, deprecate_eof())) {
            auto finished = finish_stream(*payload);
            if (!finished) {
                co_return std::unexpected(std::move(finished.error()));
            }
            break;
        }
        ++discarded;
    }
    if (discarded > 0) {
        spdlog::debug("[connection] drained {} unread rows", discarded);
    }
    co_return std::expected<void, Error>{};
}

auto Connection::finish_stream(std::span<const std::uint8_t> payload) -> std::expected<void, Error> {
    active_stream_ = 0;
    if (deprecate_eof()) {
        auto ok = parse_ok_packet(payload);
        if (!ok) {
            return std::unexpected(fail(std::move(ok.error()), "fetch"));
        }
        update_status(ok->status_flags);
        return {};
    }

    auto eof = parse_eof_packet(payload);
    if (!eof) {
        return std::unexpected(fail(std::move(eof.error()), "fetch"));
    }
    update_status(eof->status_flags);
    return {};
}

// ---------------------------------------------------------------------------
// read_column_definitions
//   count 개의 column definition + (DEPRECATE_EOF 가 아니면) EOF 하나.
//   count == 0 이면 아무것도 읽지 않는다.
// ---------------------------------------------------------------------------
auto Connection::read_column_definitions(std::uint64_t count)
    -> boost::asio::awaitable<std::expected<std::vector<ColumnDefinition>, Error>>
{
    std::vector<ColumnDefinition> columns;
    if (count == 0) {
        co_return columns;
    }
    columns.reserve(static_cast<std::size_t>(count));

    for (std::uint64_t i = 0; i < count; ++i) {
        auto payload = co_await read_packet();
        if (!payload) {
            co_return std::unexpected(std::move(payload.error()));
        }
        auto column = parse_column_definition(*payload);
        if (!column) {
            co_return std::unexpected(fail(std::move(column.error()), "metadata"));
        }
        columns.push_back(std::move(*column));
    }

    if (!deprecate_eof()) {
        auto payload = co_await read_packet();
        if (!payload) {
            co_return std::unexpected(std::move(payload.error()));
        }
        if (classify_response(*payload) != ResponseKind::kEof) {
            co_return std::unexpected(fail(
                Error{ErrorCode::kFraming, "expected EOF after column definitions"}, "metadata"));
        }
    }
    co_return columns;
}

auto Connection::read_packet() -> boost::asio::awaitable<std::expected<Bytes, Error>> {
    if (closed_) {
        co_return std::unexpected(closed_error());
    }
    auto payload = co_await channel_.read_payload();
    if (!payload) {
        co_return std::unexpected(fail(std::move(payload.error()), "read"));
    }
    if (payload->empty()) {
        co_return std::unexpected(fail(Error{ErrorCode::kFraming, "empty response packet"}, "read"));
    }
    co_return std::move(*payload);
}

bool Connection::deprecate_eof() const noexcept {
    return capability::has(server_info_.capabilities, capability::kDeprecateEof);
}

void Connection::update_status(std::uint16_t status_flags) noexcept {
    status_flags_ = status_flags;
    more_results_ = (status_flags & server_status::kMoreResultsExist) != 0;
}

// ---------------------------------------------------------------------------
// 오류 처리 / 로깅
// ---------------------------------------------------------------------------
auto Connection::fail(Error error, std::string_view operation) -> Error {
    if (invalidates_connection(error.code)) {
        channel_.close();
        active_stream_ = 0;
        more_results_  = false;
        spdlog::debug("[connection] {} failed, connection invalidated: {} ({})", operation,
                      error.message, error_code_name(error.code));
    }

    if (config_.logger() && error.code != ErrorCode::kUsage
        && error.code != ErrorCode::kTypeConversion)
    {
        config_.logger()->log_error(ErrorLog{
            .connection_id = server_info_.connection_id,
            .operation     = std::string(operation),
            .code          = error.code,
            .server_code   = error.server_code,
            .sql_state     = error.sql_state,
            .message       = error.message,
            .timestamp     = std::chrono::system_clock::now(),
        });
    }
    return error;
}

void Connection::log_query(std::string_view                    sql,
                           std::string_view                    protocol,
                           std::uint64_t                       affected_rows,
                           const Error*                        error,
                           std::chrono::steady_clock::duration elapsed) const
{
    if (!config_.logger()) {
        return;
    }
    config_.logger()->log_query(QueryLog{
        .connection_id = server_info_.connection_id,
        .db_user       = config_.user(),
        .sql           = std::string(sql),
        .protocol      = std::string(protocol),
        .affected_rows = affected_rows,
        .outcome       = error == nullptr ? "ok" : "error",
        .timestamp     = std::chrono::system_clock::now(),
        .duration      = std::chrono::duration_cast<std::chrono::microseconds>(elapsed),
    });
}

void Connection::log_connection_event(std::string_view event) const {
    if (!config_.logger()) {
        return;
    }
    config_.logger()->log_connection(ConnectionLog{
        .connection_id = server_info_.connection_id,
        .event         = std::string(event),
        .host          = config_.host(),
        .port          = config_.port(),
        .db_user       = config_.user(),
        .database      = database_.value_or(""),
        .auth_plugin   = server_info_.auth_plugin,
        .tls           = server_info_.tls,
        .timestamp     = std::chrono::system_clock::now(),
    });
}
