#include "net/ssl_mode.hpp"

#include <fmt/format.h>

#include <openssl/ssl.h>

#include <boost/system/system_error.hpp>

#include <string_view>

namespace ssl = boost::asio::ssl;

namespace {

auto tls_error(std::string message, std::string context = {}) -> Error {
    return Error{ErrorCode::kTls, std::move(message), std::move(context)};
}

// 허용 목록에 없는 프로토콜을 끄는 옵션 마스크를 만든다.
auto protocol_options(const std::vector<std::string>& protocols)
    -> std::expected<ssl::context::options, Error>
{
    bool tls10 = false;
    bool tls11 = false;
    bool tls12 = false;
    bool tls13 = false;

    for (const auto& p : protocols) {
        if (p == "TLSv1" || p == "TLSv1.0") {
            tls10 = true;
        } else if (p == "TLSv1.1") {
            tls11 = true;
        } else if (p == "TLSv1.2") {
            tls12 = true;
        } else if (p == "TLSv1.3") {
            tls13 = true;
        } else {
            return std::unexpected(tls_error(fmt::format("unsupported TLS protocol: {}", p)));
        }
    }

    ssl::context::options opts = 0;
    if (!tls10) { opts |= ssl::context::no_tlsv1; }
    if (!tls11) { opts |= ssl::context::no_tlsv1_1; }
    if (!tls12) { opts |= ssl::context::no_tlsv1_2; }
    if (!tls13) { opts |= ssl::context::no_tlsv1_3; }
    return opts;
}

// "A:B:TLS_X" → TLS 1.2 이하 cipher list "A:B", TLS 1.3 suite "TLS_X"
auto apply_cipher_suites(ssl::context& ctx, std::string_view suites) -> std::expected<void, Error> {
    std::string legacy;
    std::string tls13;

    std::size_t start = 0;
    while (start <= suites.size()) {
        const auto end   = suites.find(':', start);
        const auto token = suites.substr(start, end == std::string_view::npos ? end : end - start);
        if (!token.empty()) {
            std::string& target = token.starts_with("TLS_") ? tls13 : legacy;
            if (!target.empty()) {
                target += ':';
            }
            target += token;
        }
        if (end == std::string_view::npos) {
            break;
        }
        start = end + 1;
    }

    if (!legacy.empty() && SSL_CTX_set_cipher_list(ctx.native_handle(), legacy.c_str()) != 1) {
        return std::unexpected(tls_error("invalid cipher suites", legacy));
    }
    if (!tls13.empty() && SSL_CTX_set_ciphersuites(ctx.native_handle(), tls13.c_str()) != 1) {
        return std::unexpected(tls_error("invalid TLS 1.3 cipher suites", tls13));
    }
    return {};
}

}  // namespace

auto SslMode::disabled() -> SslMode {
    return SslMode{Kind::kDisabled};
}

auto SslMode::trusted() -> SslMode {
    return SslMode{Kind::kTrusted};
}

auto SslMode::system() -> SslMode {
    return SslMode{Kind::kSystem};
}

auto SslMode::custom(CustomSslFiles files) -> SslMode {
    SslMode mode{Kind::kCustom};
    mode.custom_files_ = std::move(files);
    return mode;
}

auto SslMode::with_tls_parameters(TlsParameters params) const -> SslMode {
    SslMode copy = *this;
    copy.tls_parameters_ = std::move(params);
    return copy;
}

auto SslMode::with_fallback(bool fallback_ok) const -> SslMode {
    SslMode copy = *this;
    copy.fallback_ok_ = fallback_ok;
    return copy;
}

auto SslMode::make_context() const -> std::expected<std::shared_ptr<ssl::context>, Error> {
    if (kind_ == Kind::kDisabled) {
        return std::unexpected(tls_error(std::string(kDisabledTlsContextMessage)));
    }

    std::shared_ptr<ssl::context> ctx;
    try {
        ctx = std::make_shared<ssl::context>(ssl::context::tls_client);
    } catch (const boost::system::system_error& ex) {
        return std::unexpected(tls_error("TLS context construction failed", ex.what()));
    }

    boost::system::error_code ec;
    ssl::context::options     opts =
        ssl::context::default_workarounds | ssl::context::no_sslv2 | ssl::context::no_sslv3;

    if (tls_parameters_ && !tls_parameters_->protocols.empty()) {
        auto protocol_opts = protocol_options(tls_parameters_->protocols);
        if (!protocol_opts) {
            return std::unexpected(std::move(protocol_opts.error()));
        }
        opts |= *protocol_opts;
    }
    ctx->set_options(opts, ec);
    if (ec) {
        return std::unexpected(tls_error("failed to set TLS options", ec.message()));
    }

    if (tls_parameters_ && !tls_parameters_->cipher_suites.empty()) {
        if (auto applied = apply_cipher_suites(*ctx, tls_parameters_->cipher_suites); !applied) {
            return std::unexpected(std::move(applied.error()));
        }
    }

    switch (kind_) {
        case Kind::kTrusted:
            ctx->set_verify_mode(ssl::verify_none, ec);
            break;

        case Kind::kSystem:
            ctx->set_default_verify_paths(ec);
            if (!ec) {
                ctx->set_verify_mode(ssl::verify_peer, ec);
            }
            break;

        case Kind::kCustom:
            if (!custom_files_.ca_file.empty()) {
                ctx->load_verify_file(custom_files_.ca_file, ec);
                if (ec) {
                    return std::unexpected(tls_error("failed to load CA file",
                        fmt::format("{}: {}", custom_files_.ca_file, ec.message())));
                }
            }
            if (!custom_files_.cert_file.empty()) {
                ctx->use_certificate_chain_file(custom_files_.cert_file, ec);
                if (ec) {
                    return std::unexpected(tls_error("failed to load certificate",
                        fmt::format("{}: {}", custom_files_.cert_file, ec.message())));
                }
            }
            if (!custom_files_.key_file.empty()) {
                ctx->use_private_key_file(custom_files_.key_file, ssl::context::pem, ec);
                if (ec) {
                    return std::unexpected(tls_error("failed to load private key",
                        fmt::format("{}: {}", custom_files_.key_file, ec.message())));
                }
            }
            ctx->set_verify_mode(custom_files_.verify_peer ? ssl::verify_peer : ssl::verify_none, ec);
            break;

        case Kind::kDisabled:
            break;
    }

    if (ec) {
        return std::unexpected(tls_error(
            fmt::format("failed to configure {} TLS context", ssl_mode_name(kind_)), ec.message()));
    }
    return ctx;
}

auto ssl_mode_name(SslMode::Kind kind) noexcept -> std::string_view {
    switch (kind) {
        case SslMode::Kind::kDisabled: return "disabled";
        case SslMode::Kind::kTrusted:  return "trusted";
        case SslMode::Kind::kSystem:   return "system";
        case SslMode::Kind::kCustom:   return "custom";
    }
    return "unknown";
}
