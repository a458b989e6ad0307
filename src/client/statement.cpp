#include "client/statement.hpp"

#include "protocol/column_type.hpp"
#include "protocol/command.hpp"
#include "tracing/tracer.hpp"

#include <chrono>
#include <utility>

auto make_generated_keys(std::optional<std::uint64_t> last_insert_id) -> ResultSet {
    ColumnDefinition column;
    column.name          = std::string(kGeneratedKeyColumn);
    column.org_name      = column.name;
    column.charset       = kBinaryCharset;
    column.column_length = 20;
    column.type          = ColumnType::kLongLong;
    column.flags         = column_flag::kUnsigned | column_flag::kNotNull;

    std::vector<Row> rows;
    if (last_insert_id) {
        rows.push_back(Row{FieldValue{*last_insert_id}});
    }
    return ResultSet({std::move(column)}, std::move(rows));
}

// ---------------------------------------------------------------------------
// execute_query
// ---------------------------------------------------------------------------
auto Statement::execute_query(std::string_view sql)
    -> boost::asio::awaitable<std::expected<ResultSet, Error>>
{
    const auto started = std::chrono::steady_clock::now();
    auto       span    = start_span(conn_->config().tracer(), "execute_query");
    if (span) {
        span->set_attribute("db.statement", sql);
    }

    auto report = [&](const Error* error) {
        if (span && error != nullptr) {
            span->record_error(*error);
        }
        conn_->log_query(sql, "text", 0, error, std::chrono::steady_clock::now() - started);
    };

    const Bytes payload = build_query(sql);
    auto sent = co_await conn_->send_command(payload);
    if (!sent) {
        report(&sent.error());
        co_return std::unexpected(std::move(sent.error()));
    }

    auto response = co_await conn_->read_command_response();
    if (!response) {
        report(&response.error());
        co_return std::unexpected(std::move(response.error()));
    }
    report(nullptr);

    if (!response->has_result_set) {
        warnings_ = response->ok.warnings;
        co_return ResultSet(std::vector<ColumnDefinition>{}, std::vector<Row>{});
    }
    co_return ResultSet(*conn_, response->stream_id, std::move(response->columns), RowFormat::kText);
}

// ---------------------------------------------------------------------------
// execute_update
// ---------------------------------------------------------------------------
auto Statement::execute_update(std::string_view sql, GeneratedKeys keys)
    -> boost::asio::awaitable<std::expected<std::uint64_t, Error>>
{
    keys_ = keys;
    last_insert_id_.reset();

    const auto started = std::chrono::steady_clock::now();
    auto       span    = start_span(conn_->config().tracer(), "execute_update");
    if (span) {
        span->set_attribute("db.statement", sql);
    }

    auto report = [&](std::uint64_t affected, const Error* error) {
        if (span && error != nullptr) {
            span->record_error(*error);
        }
        conn_->log_query(sql, "text", affected, error, std::chrono::steady_clock::now() - started);
    };

    const Bytes payload = build_query(sql);
    auto sent = co_await conn_->send_command(payload);
    if (!sent) {
        report(0, &sent.error());
        co_return std::unexpected(std::move(sent.error()));
    }

    auto response = co_await conn_->read_command_response();
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

    const OkPacket& ok = response->ok;
    warnings_ = ok.warnings;
    if (ok.last_insert_id != 0) {
        last_insert_id_ = ok.last_insert_id;
    }
    report(ok.affected_rows, nullptr);
    co_return ok.affected_rows;
}

auto Statement::get_generated_keys() const -> std::expected<ResultSet, Error> {
    if (keys_ != GeneratedKeys::kReturn) {
        return std::unexpected(Error{ErrorCode::kUsage, std::string(kGeneratedKeysNotRequested)});
    }
    return make_generated_keys(last_insert_id_);
}

auto Statement::execute_batch()
    -> boost::asio::awaitable<std::expected<std::vector<std::uint64_t>, Error>>
{
    auto batch = std::move(batch_);
    batch_.clear();

    std::vector<std::uint64_t> counts;
    counts.reserve(batch.size());
    for (const auto& sql : batch) {
        auto count = co_await execute_update(sql);
        if (!count) {
            co_return std::unexpected(std::move(count.error()));
        }
        counts.push_back(*count);
    }
    co_return counts;
}
