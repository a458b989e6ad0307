#include "client/connection_provider.hpp"
#include "client/result_set.hpp"
#include "client/statement.hpp"
#include "config/config_loader.hpp"
#include "logger/structured_logger.hpp"

#include <utility>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/io_context.hpp>

#include <spdlog/spdlog.h>

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <exception>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// Helper: 환경변수 읽기 (없으면 std::nullopt)
// ---------------------------------------------------------------------------
namespace {

std::optional<std::string> env_str(const char* name) {
    const char* val = std::getenv(name);  // NOLINT(concurrency-mt-unsafe)
    if (val != nullptr && val[0] != '\0') {
        return std::string(val);
    }
    return std::nullopt;
}

std::optional<std::uint16_t> env_u16(const char* name) {
    const auto val = env_str(name);
    if (!val) {
        return std::nullopt;
    }
    int parsed{0};
    auto [ptr, ec] = std::from_chars(val->data(), val->data() + val->size(), parsed);
    if (ec != std::errc{} || ptr != val->data() + val->size() || parsed < 1 || parsed > 65535) {
        spdlog::warn("env {}: invalid value '{}', ignored", name, *val);
        return std::nullopt;
    }
    return static_cast<std::uint16_t>(parsed);
}

LogLevel parse_log_level(const std::string& level) {
    if (level == "debug") {
        return LogLevel::kDebug;
    }
    if (level == "warn") {
        return LogLevel::kWarn;
    }
    if (level == "error") {
        return LogLevel::kError;
    }
    return LogLevel::kInfo;
}

// 환경변수가 설정 파일 값을 덮어쓴다
ConnectionConfig apply_env_overrides(ConnectionConfig config) {
    if (auto host = env_str("MYWIRE_HOST")) {
        config = config.set_host(*host);
    }
    if (auto port = env_u16("MYWIRE_PORT")) {
        config = config.set_port(*port);
    }
    if (auto user = env_str("MYWIRE_USER")) {
        config = config.set_user(*user);
    }
    if (auto password = env_str("MYWIRE_PASSWORD")) {
        config = config.set_password(*password);
    }
    if (auto database = env_str("MYWIRE_DATABASE")) {
        config = config.set_database(*database);
    }
    return config;
}

// ---------------------------------------------------------------------------
// run_sql: SQL 하나를 실행하고 row 를 탭 구분으로 출력한다
// ---------------------------------------------------------------------------
auto run_sql(const std::string& sql, Connection& conn)
    -> boost::asio::awaitable<std::expected<int, Error>>
{
    auto stmt   = conn.create_statement();
    auto result = co_await stmt.execute_query(sql);
    if (!result) {
        co_return std::unexpected(std::move(result.error()));
    }

    const auto& columns = result->columns();
    if (columns.empty()) {
        std::printf("OK\n");
        co_return 0;
    }

    for (std::size_t i = 0; i < columns.size(); ++i) {
        std::printf("%s%s", i == 0 ? "" : "\t", columns[i].name.c_str());
    }
    std::printf("\n");

    int rows = 0;
    while (true) {
        auto has_row = co_await result->next();
        if (!has_row) {
            co_return std::unexpected(std::move(has_row.error()));
        }
        if (!*has_row) {
            break;
        }
        for (std::size_t i = 0; i < columns.size(); ++i) {
            auto value = result->get_string(i);
            if (!value) {
                co_return std::unexpected(std::move(value.error()));
            }
            std::printf("%s%s", i == 0 ? "" : "\t", result->was_null() ? "NULL" : value->c_str());
        }
        std::printf("\n");
        ++rows;
    }
    co_return rows;
}

}  // namespace

// ---------------------------------------------------------------------------
// main
//   mywire [SQL]
//   MYWIRE_CONFIG 로 YAML 설정 파일을 지정할 수 있다.
// ---------------------------------------------------------------------------
int main(int argc, char* argv[]) {

    // ── 설정 로드 (설정 파일 → 환경변수 덮어쓰기) ────────────────────────
    ConnectionConfig config;
    if (auto path = env_str("MYWIRE_CONFIG")) {
        auto loaded = ConfigLoader::load(*path);
        if (!loaded) {
            spdlog::error("config load failed: {}", loaded.error());
            return EXIT_FAILURE;
        }
        config = std::move(*loaded);
    }
    config = apply_env_overrides(std::move(config));

    const std::string sql       = argc > 1 ? argv[1] : "SELECT VERSION()";
    const std::string log_level = env_str("LOG_LEVEL").value_or("info");
    const std::string log_path  = env_str("LOG_PATH").value_or("");

    // ── 로깅 초기화 ─────────────────────────────────────────────────────
    if (log_level == "debug") {
        spdlog::set_level(spdlog::level::debug);
    }
    try {
        config = config.set_logger(std::make_shared<StructuredLogger>(parse_log_level(log_level), log_path));
    } catch (const std::runtime_error& e) {
        spdlog::error("logger initialization failed: {}", e.what());
        return EXIT_FAILURE;
    }

    spdlog::info("Target: {}:{} user={} database={}", config.host(), config.port(), config.user(),
                 config.database().value_or("<none>"));
    spdlog::info("SSL: {}", ssl_mode_name(config.ssl().kind()));

    // ── 실행 ───────────────────────────────────────────────────────────
    boost::asio::io_context   ioc;
    const ConnectionProvider<> provider(config);

    std::optional<std::expected<int, Error>> outcome;
    std::exception_ptr                       failure;

    boost::asio::co_spawn(
        ioc,
        provider.use<int>([&sql](Connection& conn) { return run_sql(sql, conn); }),
        [&](std::exception_ptr e, std::expected<int, Error> result) {
            failure = e;
            outcome.emplace(std::move(result));
        });
    ioc.run();

    // ── 종료 처리 ───────────────────────────────────────────────────────
    if (failure) {
        try {
            std::rethrow_exception(failure);
        } catch (const std::exception& e) {
            spdlog::error("query failed with exception: {}", e.what());
        }
        return EXIT_FAILURE;
    }
    if (!outcome || !*outcome) {
        if (outcome) {
            const Error& err = outcome->error();
            spdlog::error("query failed: [{}] {} (server_code={}, sql_state={})",
                          error_code_name(err.code), err.message, err.server_code, err.sql_state);
        }
        return EXIT_FAILURE;
    }

    spdlog::info("{} row(s)", **outcome);
    return EXIT_SUCCESS;
}
