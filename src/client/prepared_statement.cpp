#include "client/prepared_statement.hpp"

#include "client/statement.hpp"
#include "protocol/command.hpp"
#include "tracing/tracer.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <chrono>
#include <utility>

PreparedStatement::PreparedStatement(Connection&                   conn,
                                     std::string                   sql,
                                     const PrepareOk&              ok,
                                     std::vector<ColumnDefinition> params,
                                     std::vector<ColumnDefinition> columns,
                                     GeneratedKeys                 keys)
    : conn_(&conn)
    , sql_(std::move(sql))
    , statement_id_(ok.statement_id)
    , param_defs_(std::move(params))
    , columns_(std::move(columns))
    , params_(ok.num_params)
    , keys_(keys)
{}

auto PreparedStatement::set_param(std::size_t index, FieldValue value) -> std::expected<void, Error> {
    if (index >= params_.size()) {
        return std::unexpected(Error{
            ErrorCode::kUsage,
            fmt::format("parameter index {} is out of range for {} parameters", index, params_.size()),
        });
    }
    params_[index] = std::move(value);
    return {};
}

void PreparedStatement::clear_params() noexcept {
    for (auto& param : params_) {
        param.reset();
    }
}

// ---------------------------------------------------------------------------
// execute
//   [0x17][statement_id][flags][iteration=1][null bitmap][bound=1][types][values]
// ---------------------------------------------------------------------------
auto PreparedStatement::execute() -> boost::asio::awaitable<std::expected<CommandResponse, Error>> {
    if (closed_) {
        co_return std::unexpected(Error{ErrorCode::kUsage, "prepared statement is closed"});
    }

    std::vector<FieldValue> values;
    values.reserve(params_.size());
    for (std::size_t i = 0; i < params_.size(); ++i) {
        if (!params_[i]) {
            co_return std::unexpected(
                Error{ErrorCode::kUsage, fmt::format("parameter {} is not bound", i)});
        }
        values.push_back(*params_[i]);
    }

    const Bytes payload = build_stmt_execute(statement_id_, values);
    auto sent = co_await conn_->send_command(payload);
    if (!sent) {
        co_return std::unexpected(std::move(sent.error()));
    }
    co_return co_await conn_->read_command_response();
}

auto PreparedStatement::execute_query() -> boost::asio::awaitable<std::expected<ResultSet, Error>> {
    const auto started = std::chrono::steady_clock::now();
    auto       span    = start_span(conn_->config().tracer(), "execute_prepared");
    if (span) {
        span->set_attribute("db.statement", sql_);
    }

    auto response = co_await execute();
    if (!response) {
        if (span) {
            span->record_error(response.error());
        }
        conn_->log_query(sql_, "binary", 0, &response.error(), std::chrono::steady_clock::now() - started);
        co_return std::unexpected(std::move(response.error()));
    }
    conn_->log_query(sql_, "binary", 0, nullptr, std::chrono::steady_clock::now() - started);

    if (!response->has_result_set) {
        co_return ResultSet(std::vector<ColumnDefinition>{}, std::vector<Row>{});
    }
    co_return ResultSet(*conn_, response->stream_id, std::move(response->columns), RowFormat::kBinary);
}

auto PreparedStatement::execute_update(GeneratedKeys keys)
    -> boost::asio::awaitable<std::expected<std::uint64_t, Error>>
{
    keys_requested_ = keys == GeneratedKeys::kReturn || keys_ == GeneratedKeys::kReturn;
    last_insert_id_.reset();

    const auto started = std::chrono::steady_clock::now();
    auto       span    = start_span(conn_->config().tracer(), "execute_prepared");
    if (span) {
        span->set_attribute("db.statement", sql_);
    }

    auto report = [&](std::uint64_t affected, const Error* error) {
        if (span && error != nullptr) {
            span->record_error(*error);
        }
        conn_->log_query(sql_, "binary", affected, error, std::chrono::steady_clock::now() - started);
    };

    auto response = co_await execute();
    if (!response) {
        report(0, &response.error());
        co_return std::unexpected(std::move(response.error()));
    }

    if (response->has_result_set) {
        auto drained = co_await conn_->drain_pending();
        if (!drained) {
            report(0, &drained.error());
            co_return std::unexpected(std::move(drained.error()));
        }
        Error error{ErrorCode::kUsage, "statement produced a result set; use execute_query()"};
        report(0, &error);
        co_return std::unexpected(std::move(error));
    }

    if (response->ok.last_insert_id != 0) {
        last_insert_id_ = response->ok.last_insert_id;
    }
    report(response->ok.affected_rows, nullptr);
    co_return response->ok.affected_rows;
}

auto PreparedStatement::get_generated_keys() const -> std::expected<ResultSet, Error> {
    if (!keys_requested_) {
        return std::unexpected(Error{ErrorCode::kUsage, std::string(kGeneratedKeysNotRequested)});
    }
    return make_generated_keys(last_insert_id_);
}

auto PreparedStatement::reset() -> boost::asio::awaitable<std::expected<void, Error>> {
    if (closed_) {
        co_return std::unexpected(Error{ErrorCode::kUsage, "prepared statement is closed"});
    }
    const Bytes payload = build_stmt_reset(statement_id_);
    auto ok = co_await conn_->execute_simple(payload);
    if (!ok) {
        co_return std::unexpected(std::move(ok.error()));
    }
    co_return std::expected<void, Error>{};
}

auto PreparedStatement::close() -> boost::asio::awaitable<std::expected<void, Error>> {
    if (closed_) {
        co_return std::expected<void, Error>{};
    }
    closed_ = true;

    const Bytes payload = build_stmt_close(statement_id_);
    auto sent = co_await conn_->send_command(payload);
    if (!sent) {
        co_return std::unexpected(std::move(sent.error()));
    }
    spdlog::debug("[connection] closed prepared statement id={}", statement_id_);
    co_return std::expected<void, Error>{};
}
