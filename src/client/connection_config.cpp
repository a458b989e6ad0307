#include "client/connection_config.hpp"

#include <utility>

ConnectionConfig::ConnectionConfig(std::string host, std::uint16_t port, std::string user)
    : host_(std::move(host))
    , port_(port)
    , user_(std::move(user))
{}

auto ConnectionConfig::set_host(std::string host) const -> ConnectionConfig {
    ConnectionConfig copy = *this;
    copy.host_ = std::move(host);
    return copy;
}

auto ConnectionConfig::set_port(std::uint16_t port) const -> ConnectionConfig {
    ConnectionConfig copy = *this;
    copy.port_ = port;
    return copy;
}

auto ConnectionConfig::set_user(std::string user) const -> ConnectionConfig {
    ConnectionConfig copy = *this;
    copy.user_ = std::move(user);
    return copy;
}

auto ConnectionConfig::set_password(std::optional<std::string> password) const -> ConnectionConfig {
    ConnectionConfig copy = *this;
    copy.password_ = std::move(password);
    return copy;
}

auto ConnectionConfig::set_database(std::optional<std::string> database) const -> ConnectionConfig {
    ConnectionConfig copy = *this;
    copy.database_ = std::move(database);
    return copy;
}

auto ConnectionConfig::set_debug(bool debug) const -> ConnectionConfig {
    ConnectionConfig copy = *this;
    copy.debug_ = debug;
    return copy;
}

auto ConnectionConfig::set_ssl(SslMode ssl) const -> ConnectionConfig {
    ConnectionConfig copy = *this;
    copy.ssl_ = std::move(ssl);
    return copy;
}

auto ConnectionConfig::add_socket_option(SocketOption option) const -> ConnectionConfig {
    ConnectionConfig copy = *this;
    copy.socket_options_.insert(copy.socket_options_.begin(), option);
    return copy;
}

auto ConnectionConfig::set_socket_options(std::vector<SocketOption> options) const -> ConnectionConfig {
    ConnectionConfig copy = *this;
    copy.socket_options_ = std::move(options);
    return copy;
}

auto ConnectionConfig::set_read_timeout(std::optional<std::chrono::milliseconds> timeout) const
    -> ConnectionConfig
{
    ConnectionConfig copy = *this;
    copy.read_timeout_ = timeout;
    return copy;
}

auto ConnectionConfig::set_allow_public_key_retrieval(bool allow) const -> ConnectionConfig {
    ConnectionConfig copy = *this;
    copy.allow_public_key_retrieval_ = allow;
    return copy;
}

auto ConnectionConfig::set_database_term(DatabaseTerm term) const -> ConnectionConfig {
    ConnectionConfig copy = *this;
    copy.database_term_ = term;
    return copy;
}

auto ConnectionConfig::set_tracer(std::shared_ptr<Tracer> tracer) const -> ConnectionConfig {
    ConnectionConfig copy = *this;
    copy.tracer_ = std::move(tracer);
    return copy;
}

auto ConnectionConfig::set_logger(std::shared_ptr<StructuredLogger> logger) const -> ConnectionConfig {
    ConnectionConfig copy = *this;
    copy.logger_ = std::move(logger);
    return copy;
}
