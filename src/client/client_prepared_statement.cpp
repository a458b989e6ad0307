#include "client/client_prepared_statement.hpp"

#include "protocol/capabilities.hpp"

#include <fmt/format.h>

#include <cmath>
#include <iterator>
#include <type_traits>
#include <utility>
#include <variant>

namespace {

void append_escaped(std::string& out, std::string_view text, bool no_backslash_escapes) {
    for (const char c : text) {
        if (no_backslash_escapes) {
            if (c == '\'') {
                out.push_back('\'');
            }
            out.push_back(c);
            continue;
        }
        switch (c) {
            case '\0':   out += "\\0"; break;
            case '\n':   out += "\\n"; break;
            case '\r':   out += "\\r"; break;
            case '\\':   out += "\\\\"; break;
            case '\'':   out += "\\'"; break;
            case '"':    out += "\\\""; break;
            case '\x1a': out += "\\Z"; break;
            default:     out.push_back(c); break;
        }
    }
}

auto quoted(std::string_view text, bool no_backslash_escapes) -> std::string {
    std::string out;
    out.reserve(text.size() + 2);
    out.push_back('\'');
    append_escaped(out, text, no_backslash_escapes);
    out.push_back('\'');
    return out;
}

// 인용 구간 끝(닫는 quote 다음) offset. 닫히지 않으면 sql.size()
auto skip_quoted(std::string_view sql, std::size_t pos) -> std::size_t {
    const char quote = sql[pos];
    for (++pos; pos < sql.size(); ++pos) {
        if (sql[pos] == '\\' && quote != '`') {
            ++pos;
            continue;
        }
        if (sql[pos] == quote) {
            return pos + 1;
        }
    }
    return sql.size();
}

}  // namespace

auto sql_literal(const FieldValue& value, bool no_backslash_escapes)
    -> std::expected<std::string, Error>
{
    return std::visit(
        [&](const auto& v) -> std::expected<std::string, Error> {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::monostate>) {
                return std::string("NULL");
            } else if constexpr (std::is_same_v<T, std::int64_t> || std::is_same_v<T, std::uint64_t>) {
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, float> || std::is_same_v<T, double>) {
                if (!std::isfinite(v)) {
                    return std::unexpected(Error{ErrorCode::kUsage,
                                                 fmt::format("{} cannot be written as a SQL literal", v)});
                }
                return fmt::format("{}", v);
            } else if constexpr (std::is_same_v<T, std::string>) {
                return quoted(v, no_backslash_escapes);
            } else if constexpr (std::is_same_v<T, Bytes>) {
                if (v.empty()) {
                    return std::string("X''");
                }
                std::string out = "0x";
                out.reserve(2 + v.size() * 2);
                for (const auto byte : v) {
                    fmt::format_to(std::back_inserter(out), "{:02X}", byte);
                }
                return out;
            } else if constexpr (std::is_same_v<T, Date>) {
                return quoted(format_date(v), no_backslash_escapes);
            } else if constexpr (std::is_same_v<T, DateTime>) {
                return quoted(format_datetime(v), no_backslash_escapes);
            } else {
                return quoted(format_time(v), no_backslash_escapes);
            }
        },
        value);
}

auto find_placeholders(std::string_view sql) -> std::vector<std::size_t> {
    std::vector<std::size_t> out;
    std::size_t              pos = 0;
    while (pos < sql.size()) {
        const char c = sql[pos];
        if (c == '\'' || c == '"' || c == '`') {
            pos = skip_quoted(sql, pos);
        } else if (c == '#' || (c == '-' && sql.substr(pos, 3) == "-- ")) {
            const auto eol = sql.find('\n', pos);
            pos = eol == std::string_view::npos ? sql.size() : eol + 1;
        } else if (c == '/' && sql.substr(pos, 2) == "/*") {
            const auto close = sql.find("*/", pos + 2);
            pos = close == std::string_view::npos ? sql.size() : close + 2;
        } else {
            if (c == '?') {
                out.push_back(pos);
            }
            ++pos;
        }
    }
    return out;
}

ClientPreparedStatement::ClientPreparedStatement(Connection& conn, std::string sql)
    : conn_(&conn)
    , sql_(std::move(sql))
    , placeholders_(find_placeholders(sql_))
    , params_(placeholders_.size())
    , statement_(conn)
{}

auto ClientPreparedStatement::set_param(std::size_t index, FieldValue value) -> std::expected<void, Error> {
    if (index >= params_.size()) {
        return std::unexpected(Error{
            ErrorCode::kUsage,
            fmt::format("parameter index {} is out of range for {} parameters", index, params_.size()),
        });
    }
    params_[index] = std::move(value);
    return {};
}

void ClientPreparedStatement::clear_params() noexcept {
    for (auto& param : params_) {
        param.reset();
    }
}

auto ClientPreparedStatement::to_sql() const -> std::expected<std::string, Error> {
    const bool no_backslash_escapes =
        (conn_->status_flags() & server_status::kNoBackslashEscapes) != 0;

    std::string out;
    out.reserve(sql_.size() + params_.size() * 8);
    std::size_t copied = 0;
    for (std::size_t i = 0; i < placeholders_.size(); ++i) {
        if (!params_[i]) {
            return std::unexpected(Error{ErrorCode::kUsage, fmt::format("parameter {} is not bound", i)});
        }
        auto literal = sql_literal(*params_[i], no_backslash_escapes);
        if (!literal) {
            return std::unexpected(std::move(literal.error()));
        }
        out.append(sql_, copied, placeholders_[i] - copied);
        out += *literal;
        copied = placeholders_[i] + 1;
    }
    out.append(sql_, copied, std::string::npos);
    return out;
}

auto ClientPreparedStatement::execute_query()
    -> boost::asio::awaitable<std::expected<ResultSet, Error>>
{
    auto sql = to_sql();
    if (!sql) {
        co_return std::unexpected(std::move(sql.error()));
    }
    clear_params();
    co_return co_await statement_.execute_query(*sql);
}

auto ClientPreparedStatement::execute_update(GeneratedKeys keys)
    -> boost::asio::awaitable<std::expected<std::uint64_t, Error>>
{
    auto sql = to_sql();
    if (!sql) {
        co_return std::unexpected(std::move(sql.error()));
    }
    clear_params();
    co_return co_await statement_.execute_update(*sql, keys);
}

auto ClientPreparedStatement::add_batch() -> std::expected<void, Error> {
    auto sql = to_sql();
    if (!sql) {
        return std::unexpected(std::move(sql.error()));
    }
    clear_params();
    statement_.add_batch(std::move(*sql));
    return {};
}

auto ClientPreparedStatement::execute_batch()
    -> boost::asio::awaitable<std::expected<std::vector<std::uint64_t>, Error>>
{
    co_return co_await statement_.execute_batch();
}
