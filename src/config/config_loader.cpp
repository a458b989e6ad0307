// ---------------------------------------------------------------------------
// config_loader.cpp
//
// YAML 설정 파일을 ConnectionConfig 로 파싱한다.
//
// [설계 원칙]
// - All-or-nothing: 어느 한 키라도 잘못되면 전체를 실패로 처리한다.
// - 필드 누락 시 ConnectionConfig 기본값을 적용한다.
// - YAML 파일 전체나 password 를 로그에 출력하지 않는다.
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <charconv>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/spdlog.h>
#include <yaml-cpp/yaml.h>

namespace {

using LoadResult = std::expected<void, std::string>;

// ---------------------------------------------------------------------------
// 내부 헬퍼: scalar 읽기. 노드가 없으면 std::nullopt, 타입이 틀리면 오류.
// ---------------------------------------------------------------------------
template <typename T>
[[nodiscard]] auto read_scalar(const YAML::Node& node, std::string_view key)
    -> std::expected<std::optional<T>, std::string>
{
    if (!node || node.IsNull()) {
        return std::optional<T>{};
    }
    if (!node.IsScalar()) {
        return std::unexpected(fmt::format("'{}' must be a scalar", key));
    }
    try {
        return std::optional<T>{node.as<T>()};
    } catch (const YAML::Exception& e) {
        return std::unexpected(fmt::format("'{}' has an invalid value: {}", key, e.what()));
    }
}

[[nodiscard]] auto read_string_sequence(const YAML::Node& node, std::string_view key)
    -> std::expected<std::vector<std::string>, std::string>
{
    std::vector<std::string> result;
    if (!node || node.IsNull()) {
        return result;
    }
    if (!node.IsSequence()) {
        return std::unexpected(fmt::format("'{}' must be a sequence", key));
    }
    result.reserve(node.size());
    for (const auto& item : node) {
        if (!item.IsScalar()) {
            return std::unexpected(fmt::format("'{}' entries must be scalars", key));
        }
        result.push_back(item.as<std::string>());
    }
    return result;
}

// ---------------------------------------------------------------------------
// socket_options:
//   no_delay: true
//   keep_alive: true
//   receive_buffer_size: 65536
//   send_buffer_size: 65536
// 키가 하나라도 있으면 목록 전체를 교체한다.
// ---------------------------------------------------------------------------
[[nodiscard]] LoadResult parse_socket_options(const YAML::Node& node, ConnectionConfig& cfg) {
    if (!node || node.IsNull()) {
        return {};
    }
    if (!node.IsMap()) {
        return std::unexpected(std::string("'socket_options' must be a map"));
    }

    std::vector<SocketOption> options;

    auto no_delay = read_scalar<bool>(node["no_delay"], "socket_options.no_delay");
    if (!no_delay) {
        return std::unexpected(no_delay.error());
    }
    if (*no_delay) {
        options.push_back(SocketOption::no_delay(**no_delay));
    }

    auto keep_alive = read_scalar<bool>(node["keep_alive"], "socket_options.keep_alive");
    if (!keep_alive) {
        return std::unexpected(keep_alive.error());
    }
    if (*keep_alive) {
        options.push_back(SocketOption::keep_alive(**keep_alive));
    }

    auto rcvbuf = read_scalar<std::int32_t>(node["receive_buffer_size"],
                                            "socket_options.receive_buffer_size");
    if (!rcvbuf) {
        return std::unexpected(rcvbuf.error());
    }
    if (*rcvbuf) {
        if (**rcvbuf <= 0) {
            return std::unexpected(std::string("'socket_options.receive_buffer_size' must be positive"));
        }
        options.push_back(SocketOption::receive_buffer_size(**rcvbuf));
    }

    auto sndbuf = read_scalar<std::int32_t>(node["send_buffer_size"],
                                            "socket_options.send_buffer_size");
    if (!sndbuf) {
        return std::unexpected(sndbuf.error());
    }
    if (*sndbuf) {
        if (**sndbuf <= 0) {
            return std::unexpected(std::string("'socket_options.send_buffer_size' must be positive"));
        }
        options.push_back(SocketOption::send_buffer_size(**sndbuf));
    }

    cfg = cfg.set_socket_options(std::move(options));
    return {};
}

// ---------------------------------------------------------------------------
// ssl:
//   mode: disabled | trusted | system | custom
// ---------------------------------------------------------------------------
[[nodiscard]] LoadResult parse_ssl(const YAML::Node& node, ConnectionConfig& cfg) {
    if (!node || node.IsNull()) {
        return {};
    }
    if (!node.IsMap()) {
        return std::unexpected(std::string("'ssl' must be a map"));
    }

    auto mode_name = read_scalar<std::string>(node["mode"], "ssl.mode");
    if (!mode_name) {
        return std::unexpected(mode_name.error());
    }
    const std::string mode_word = mode_name->value_or("disabled");

    SslMode mode;
    if (mode_word == "disabled") {
        mode = SslMode::disabled();
    } else if (mode_word == "trusted") {
        mode = SslMode::trusted();
    } else if (mode_word == "system") {
        mode = SslMode::system();
    } else if (mode_word == "custom") {
        CustomSslFiles files;
        auto ca     = read_scalar<std::string>(node["ca_file"], "ssl.ca_file");
        auto cert   = read_scalar<std::string>(node["cert_file"], "ssl.cert_file");
        auto key    = read_scalar<std::string>(node["key_file"], "ssl.key_file");
        auto verify = read_scalar<bool>(node["verify_peer"], "ssl.verify_peer");
        for (const auto* field : {&ca, &cert, &key}) {
            if (!*field) {
                return std::unexpected(field->error());
            }
        }
        if (!verify) {
            return std::unexpected(verify.error());
        }
        files.ca_file     = ca->value_or("");
        files.cert_file   = cert->value_or("");
        files.key_file    = key->value_or("");
        files.verify_peer = verify->value_or(true);
        mode = SslMode::custom(std::move(files));
    } else {
        return std::unexpected(fmt::format(
            "'ssl.mode' must be one of disabled, trusted, system, custom (got '{}')", mode_word));
    }

    auto protocols    = read_string_sequence(node["protocols"], "ssl.protocols");
    auto server_names = read_string_sequence(node["server_names"], "ssl.server_names");
    auto ciphers      = read_scalar<std::string>(node["cipher_suites"], "ssl.cipher_suites");
    if (!protocols) {
        return std::unexpected(protocols.error());
    }
    if (!server_names) {
        return std::unexpected(server_names.error());
    }
    if (!ciphers) {
        return std::unexpected(ciphers.error());
    }
    if (!protocols->empty() || !server_names->empty() || ciphers->has_value()) {
        mode = mode.with_tls_parameters(TlsParameters{
            .protocols     = std::move(*protocols),
            .cipher_suites = ciphers->value_or(""),
            .server_names  = std::move(*server_names),
        });
    }

    auto fallback = read_scalar<bool>(node["fallback"], "ssl.fallback");
    if (!fallback) {
        return std::unexpected(fallback.error());
    }
    if (*fallback) {
        mode = mode.with_fallback(**fallback);
    }

    cfg = cfg.set_ssl(std::move(mode));
    return {};
}

// ---------------------------------------------------------------------------
// connection 섹션
// ---------------------------------------------------------------------------
[[nodiscard]] LoadResult parse_connection(const YAML::Node& node, ConnectionConfig& cfg) {
    if (!node || node.IsNull()) {
        return {};
    }
    if (!node.IsMap()) {
        return std::unexpected(std::string("'connection' must be a map"));
    }

    auto host = read_scalar<std::string>(node["host"], "host");
    if (!host) {
        return std::unexpected(host.error());
    }
    if (*host) {
        cfg = cfg.set_host(**host);
    }

    auto port = read_scalar<std::uint32_t>(node["port"], "port");
    if (!port) {
        return std::unexpected(port.error());
    }
    if (*port) {
        if (**port == 0 || **port > std::numeric_limits<std::uint16_t>::max()) {
            return std::unexpected(fmt::format("'port' out of range: {}", **port));
        }
        cfg = cfg.set_port(static_cast<std::uint16_t>(**port));
    }

    auto user = read_scalar<std::string>(node["user"], "user");
    if (!user) {
        return std::unexpected(user.error());
    }
    if (*user) {
        cfg = cfg.set_user(**user);
    }

    auto password = read_scalar<std::string>(node["password"], "password");
    if (!password) {
        return std::unexpected(std::string("'password' has an invalid value"));
    }
    if (*password) {
        cfg = cfg.set_password(**password);
    }

    auto database = read_scalar<std::string>(node["database"], "database");
    if (!database) {
        return std::unexpected(database.error());
    }
    if (*database) {
        cfg = cfg.set_database(**database);
    }

    auto debug = read_scalar<bool>(node["debug"], "debug");
    if (!debug) {
        return std::unexpected(debug.error());
    }
    if (*debug) {
        cfg = cfg.set_debug(**debug);
    }

    auto timeout = read_scalar<std::string>(node["read_timeout"], "read_timeout");
    if (!timeout) {
        return std::unexpected(timeout.error());
    }
    if (*timeout) {
        auto parsed = parse_duration(**timeout);
        if (!parsed) {
            return std::unexpected(fmt::format("'read_timeout': {}", parsed.error()));
        }
        cfg = cfg.set_read_timeout(*parsed);
    }

    auto retrieval = read_scalar<bool>(node["allow_public_key_retrieval"], "allow_public_key_retrieval");
    if (!retrieval) {
        return std::unexpected(retrieval.error());
    }
    if (*retrieval) {
        cfg = cfg.set_allow_public_key_retrieval(**retrieval);
    }

    auto term = read_scalar<std::string>(node["database_term"], "database_term");
    if (!term) {
        return std::unexpected(term.error());
    }
    if (*term) {
        if (**term == "catalog") {
            cfg = cfg.set_database_term(DatabaseTerm::kCatalog);
        } else if (**term == "schema") {
            cfg = cfg.set_database_term(DatabaseTerm::kSchema);
        } else {
            return std::unexpected(fmt::format(
                "'database_term' must be 'catalog' or 'schema' (got '{}')", **term));
        }
    }

    if (auto sockets = parse_socket_options(node["socket_options"], cfg); !sockets) {
        return sockets;
    }
    if (auto ssl = parse_ssl(node["ssl"], cfg); !ssl) {
        return ssl;
    }
    return {};
}

[[nodiscard]] std::expected<ConnectionConfig, std::string> parse_root(const YAML::Node& root,
                                                                      std::string_view  source) {
    if (!root || !root.IsMap()) {
        const std::string err =
            fmt::format("config_loader: '{}' is not a valid YAML map (top-level)", source);
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    ConnectionConfig cfg;
    try {
        if (auto parsed = parse_connection(root["connection"], cfg); !parsed) {
            const std::string err = fmt::format(
                "config_loader: error parsing 'connection' section: {}", parsed.error());
            spdlog::error("{}", err);
            return std::unexpected(err);
        }
    } catch (const YAML::Exception& e) {
        const std::string err =
            fmt::format("config_loader: error parsing 'connection' section: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    return cfg;
}

}  // namespace

// ---------------------------------------------------------------------------
// parse_duration
// ---------------------------------------------------------------------------
auto parse_duration(std::string_view text) -> std::expected<std::chrono::milliseconds, std::string> {
    const char* begin = text.data();
    const char* end   = text.data() + text.size();

    std::uint64_t value{0};
    auto [ptr, ec] = std::from_chars(begin, end, value);
    if (ec != std::errc{} || ptr == begin) {
        return std::unexpected(fmt::format("invalid duration '{}'", text));
    }

    const std::string_view unit(ptr, static_cast<std::size_t>(end - ptr));
    if (unit == "ms") {
        return std::chrono::milliseconds(value);
    }
    if (unit == "s") {
        return std::chrono::milliseconds(value * 1000);
    }
    if (unit == "m") {
        return std::chrono::milliseconds(value * 60 * 1000);
    }
    return std::unexpected(fmt::format("invalid duration unit in '{}' (expected ms, s or m)", text));
}

// ---------------------------------------------------------------------------
// ConfigLoader::load 구현
// ---------------------------------------------------------------------------
std::expected<ConnectionConfig, std::string>
ConfigLoader::load(const std::filesystem::path& config_path) {
    std::error_code ec;
    const auto canonical_path = std::filesystem::canonical(config_path, ec);
    if (ec) {
        const std::string err = fmt::format("config_loader: cannot resolve config path '{}': {}",
                                            config_path.string(), ec.message());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    spdlog::info("config_loader: loading config from '{}'", canonical_path.string());

    YAML::Node root;
    try {
        root = YAML::LoadFile(canonical_path.string());
    } catch (const YAML::BadFile& e) {
        const std::string err = fmt::format("config_loader: cannot open file '{}': {}",
                                            canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format(
            "config_loader: YAML parse error in '{}' at line {}, col {}: {}",
            canonical_path.string(), e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err =
            fmt::format("config_loader: YAML error in '{}': {}", canonical_path.string(), e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }

    return parse_root(root, canonical_path.string());
}

std::expected<ConnectionConfig, std::string> ConfigLoader::load_from_string(std::string_view yaml) {
    YAML::Node root;
    try {
        root = YAML::Load(std::string(yaml));
    } catch (const YAML::ParserException& e) {
        const std::string err = fmt::format("config_loader: YAML parse error at line {}, col {}: {}",
                                            e.mark.line + 1, e.mark.column + 1, e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    } catch (const YAML::Exception& e) {
        const std::string err = fmt::format("config_loader: YAML error: {}", e.what());
        spdlog::error("{}", err);
        return std::unexpected(err);
    }
    return parse_root(root, "<string>");
}
