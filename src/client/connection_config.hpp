#pragma once

#include "logger/structured_logger.hpp"
#include "net/socket_option.hpp"
#include "net/ssl_mode.hpp"
#include "tracing/tracer.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// DatabaseTerm
//   설정한 database 를 catalog 로 볼지 schema 로 볼지 결정한다.
//   Connection::catalog() / schema() 중 해당하는 쪽만 값을 돌려준다.
// ---------------------------------------------------------------------------
enum class DatabaseTerm : std::uint8_t {
    kCatalog,
    kSchema,
};

// ---------------------------------------------------------------------------
// ConnectionConfig
//   연결 설정 불변 값.
//
//   모든 set_* / add_* 는 수정된 복사본을 반환하며 원본은 변하지 않는다.
//   operator== 는 구조적 비교이고, tracer / logger 는 포인터 동일성으로 비교한다.
//
//   기본값:
//     host 127.0.0.1, port 3306, socket_options [no_delay(true)],
//     read_timeout 없음(무한), SSL 비활성, public key retrieval 비허용,
//     database_term kCatalog
// ---------------------------------------------------------------------------
class ConnectionConfig {
public:
    static constexpr std::uint16_t kDefaultPort = 3306;

    ConnectionConfig() = default;
    ConnectionConfig(std::string host, std::uint16_t port, std::string user);

    [[nodiscard]] auto set_host(std::string host) const -> ConnectionConfig;
    [[nodiscard]] auto set_port(std::uint16_t port) const -> ConnectionConfig;
    [[nodiscard]] auto set_user(std::string user) const -> ConnectionConfig;
    [[nodiscard]] auto set_password(std::optional<std::string> password) const -> ConnectionConfig;
    [[nodiscard]] auto set_database(std::optional<std::string> database) const -> ConnectionConfig;
    [[nodiscard]] auto set_debug(bool debug) const -> ConnectionConfig;
    [[nodiscard]] auto set_ssl(SslMode ssl) const -> ConnectionConfig;

    // 기존 목록 앞에 추가한다
    [[nodiscard]] auto add_socket_option(SocketOption option) const -> ConnectionConfig;
    [[nodiscard]] auto set_socket_options(std::vector<SocketOption> options) const -> ConnectionConfig;

    // std::nullopt 는 무한 대기
    [[nodiscard]] auto set_read_timeout(std::optional<std::chrono::milliseconds> timeout) const
        -> ConnectionConfig;
    [[nodiscard]] auto set_allow_public_key_retrieval(bool allow) const -> ConnectionConfig;
    [[nodiscard]] auto set_database_term(DatabaseTerm term) const -> ConnectionConfig;
    [[nodiscard]] auto set_tracer(std::shared_ptr<Tracer> tracer) const -> ConnectionConfig;
    [[nodiscard]] auto set_logger(std::shared_ptr<StructuredLogger> logger) const -> ConnectionConfig;

    [[nodiscard]] auto host()     const noexcept -> const std::string& { return host_; }
    [[nodiscard]] auto port()     const noexcept -> std::uint16_t { return port_; }
    [[nodiscard]] auto user()     const noexcept -> const std::string& { return user_; }
    [[nodiscard]] auto password() const noexcept -> const std::optional<std::string>& { return password_; }
    [[nodiscard]] auto database() const noexcept -> const std::optional<std::string>& { return database_; }
    [[nodiscard]] bool debug()    const noexcept { return debug_; }
    [[nodiscard]] auto ssl()      const noexcept -> const SslMode& { return ssl_; }
    [[nodiscard]] auto socket_options() const noexcept -> const std::vector<SocketOption>& {
        return socket_options_;
    }
    [[nodiscard]] auto read_timeout() const noexcept -> const std::optional<std::chrono::milliseconds>& {
        return read_timeout_;
    }
    [[nodiscard]] bool allow_public_key_retrieval() const noexcept { return allow_public_key_retrieval_; }
    [[nodiscard]] auto database_term() const noexcept -> DatabaseTerm { return database_term_; }
    [[nodiscard]] auto tracer()        const noexcept -> const std::shared_ptr<Tracer>& { return tracer_; }
    [[nodiscard]] auto logger()        const noexcept -> const std::shared_ptr<StructuredLogger>& {
        return logger_;
    }

    bool operator==(const ConnectionConfig&) const = default;

private:
    std::string                              host_{"127.0.0.1"};
    std::uint16_t                            port_{kDefaultPort};
    std::string                              user_{};
    std::optional<std::string>               password_{};
    std::optional<std::string>               database_{};
    bool                                     debug_{false};
    SslMode                                  ssl_{SslMode::disabled()};
    std::vector<SocketOption>                socket_options_{SocketOption::no_delay(true)};
    std::optional<std::chrono::milliseconds> read_timeout_{};
    bool                                     allow_public_key_retrieval_{false};
    DatabaseTerm                             database_term_{DatabaseTerm::kCatalog};
    std::shared_ptr<Tracer>                  tracer_{};
    std::shared_ptr<StructuredLogger>        logger_{};
};
