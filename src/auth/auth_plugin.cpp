#include "auth/auth_plugin.hpp"

#include <fmt/format.h>

#include <openssl/bio.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/pem.h>
#include <openssl/rsa.h>

#include <array>
#include <string>

// ---------------------------------------------------------------------------
// 인증 plugin — 구현
//
// caching_sha2_password AuthMoreData 분기:
//   0x03 : fast auth 성공 → 서버의 최종 OK 대기
//   0x04 : full auth 필요
//          TLS   → 비밀번호 + NUL 평문 전송
//          평문  → 0x02 로 공개키 요청 (허용된 경우) → PEM 수신 → RSA-OAEP
//   "-----BEGIN" : 요청한 공개키 도착
// ---------------------------------------------------------------------------

namespace {

constexpr std::uint8_t kFastAuthSuccess        = 0x03;
constexpr std::uint8_t kPerformFullAuth        = 0x04;
constexpr std::uint8_t kCachingSha2RequestKey  = 0x02;
constexpr std::uint8_t kSha256RequestKey       = 0x01;
constexpr std::size_t  kMaxPublicKeySize       = 1024U * 1024U;

struct BioDeleter {
    void operator()(BIO* bio) const noexcept { BIO_free(bio); }
};
struct EvpPkeyDeleter {
    void operator()(EVP_PKEY* pkey) const noexcept { EVP_PKEY_free(pkey); }
};
struct EvpPkeyCtxDeleter {
    void operator()(EVP_PKEY_CTX* ctx) const noexcept { EVP_PKEY_CTX_free(ctx); }
};

auto openssl_error(std::string_view what) -> Error {
    const unsigned long code = ERR_get_error();
    std::array<char, 256> buf{};
    if (code != 0) {
        ERR_error_string_n(code, buf.data(), buf.size());
    }
    return Error{
        ErrorCode::kAuthentication,
        fmt::format("RSA password encryption failed: {}", what),
        code != 0 ? std::string(buf.data()) : std::string{"no OpenSSL error detail"}
    };
}

auto as_bytes(std::string_view str) -> std::span<const std::uint8_t> {
    return {reinterpret_cast<const std::uint8_t*>(str.data()), str.size()};
}

template <std::size_t N>
auto digest(const EVP_MD* md, std::span<const std::uint8_t> a, std::span<const std::uint8_t> b = {})
    -> std::expected<std::array<std::uint8_t, N>, Error>
{
    std::array<std::uint8_t, N> out{};
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> ctx(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    unsigned int len = 0;
    if (!ctx
        || EVP_DigestInit_ex(ctx.get(), md, nullptr) != 1
        || EVP_DigestUpdate(ctx.get(), a.data(), a.size()) != 1
        || (!b.empty() && EVP_DigestUpdate(ctx.get(), b.data(), b.size()) != 1)
        || EVP_DigestFinal_ex(ctx.get(), out.data(), &len) != 1
        || len != N) {
        return std::unexpected(Error{
            ErrorCode::kAuthentication,
            "password digest failed",
            fmt::format("algorithm={}", EVP_MD_get0_name(md))
        });
    }
    return out;
}

// H(pw) XOR H(salt 입력) 공통 계산.
// native       : H(scramble + H(H(pw)))      → scramble_first=true
// caching_sha2 : H(H(H(pw)) + scramble)      → scramble_first=false
template <std::size_t N>
auto xor_scramble(const EVP_MD* md, std::string_view password,
                  std::span<const std::uint8_t> scramble, bool scramble_first)
    -> std::expected<Bytes, Error>
{
    if (password.empty()) {
        return Bytes{};
    }

    auto stage1 = digest<N>(md, as_bytes(password));
    if (!stage1) {
        return std::unexpected(std::move(stage1.error()));
    }
    auto stage2 = digest<N>(md, *stage1);
    if (!stage2) {
        return std::unexpected(std::move(stage2.error()));
    }
    auto salted = scramble_first ? digest<N>(md, scramble, *stage2)
                                 : digest<N>(md, *stage2, scramble);
    if (!salted) {
        return std::unexpected(std::move(salted.error()));
    }

    Bytes out(N);
    for (std::size_t i = 0; i < N; ++i) {
        out[i] = (*stage1)[i] ^ (*salted)[i];
    }
    return out;
}

auto password_with_nul(std::string_view password) -> Bytes {
    Bytes out(password.begin(), password.end());
    out.push_back(0x00);
    return out;
}

bool looks_like_pem(std::span<const std::uint8_t> data) noexcept {
    return !data.empty() && data[0] == static_cast<std::uint8_t>('-');
}

// ---------------------------------------------------------------------------
// mysql_native_password
// ---------------------------------------------------------------------------
class NativePasswordPlugin final : public AuthPlugin {
public:
    [[nodiscard]] auto name() const noexcept -> std::string_view override {
        return kNativePasswordPlugin;
    }

    [[nodiscard]] auto initial_response(std::string_view              password,
                                        std::span<const std::uint8_t> scramble,
                                        const AuthContext&) const
        -> std::expected<AuthReply, Error> override
    {
        auto response = scramble_native_password(password, scramble);
        if (!response) {
            return std::unexpected(std::move(response.error()));
        }
        return AuthReply{AuthStep::kSend, std::move(*response), false};
    }
};

// ---------------------------------------------------------------------------
// caching_sha2_password
// ---------------------------------------------------------------------------
class CachingSha2PasswordPlugin final : public AuthPlugin {
public:
    [[nodiscard]] auto name() const noexcept -> std::string_view override {
        return kCachingSha2PasswordPlugin;
    }

    [[nodiscard]] auto initial_response(std::string_view              password,
                                        std::span<const std::uint8_t> scramble,
                                        const AuthContext&) const
        -> std::expected<AuthReply, Error> override
    {
        auto response = scramble_caching_sha2(password, scramble);
        if (!response) {
            return std::unexpected(std::move(response.error()));
        }
        return AuthReply{AuthStep::kSend, std::move(*response), false};
    }

    [[nodiscard]] auto continue_auth(std::span<const std::uint8_t> more_data,
                                     std::string_view              password,
                                     std::span<const std::uint8_t> scramble,
                                     const AuthContext&            ctx) const
        -> std::expected<AuthReply, Error> override
    {
        if (more_data.size() == 1 && more_data[0] == kFastAuthSuccess) {
            return AuthReply{AuthStep::kAwaitServer, {}, false};
        }

        if (more_data.size() == 1 && more_data[0] == kPerformFullAuth) {
            if (ctx.secure_channel) {
                return AuthReply{AuthStep::kSend, password_with_nul(password), false};
            }
            if (!ctx.allow_public_key_retrieval) {
                return std::unexpected(Error{
                    ErrorCode::kPolicyViolation,
                    "Public Key Retrieval is not allowed",
                    "caching_sha2_password full authentication over an insecure channel"
                });
            }
            return AuthReply{AuthStep::kSend, Bytes{kCachingSha2RequestKey}, true};
        }

        if (looks_like_pem(more_data)) {
            auto encrypted = rsa_encrypt_password(password, scramble, more_data);
            if (!encrypted) {
                return std::unexpected(std::move(encrypted.error()));
            }
            return AuthReply{AuthStep::kSend, std::move(*encrypted), false};
        }

        return AuthReply{AuthStep::kAwaitServer, {}, false};
    }
};

// ---------------------------------------------------------------------------
// sha256_password
//   TLS 에서는 비밀번호 평문, 그 외에는 RSA 공개키 교환이 필요하다.
// ---------------------------------------------------------------------------
class Sha256PasswordPlugin final : public AuthPlugin {
public:
    [[nodiscard]] auto name() const noexcept -> std::string_view override {
        return kSha256PasswordPlugin;
    }

    [[nodiscard]] auto initial_response(std::string_view              password,
                                        std::span<const std::uint8_t>,
                                        const AuthContext&            ctx) const
        -> std::expected<AuthReply, Error> override
    {
        if (password.empty()) {
            return AuthReply{AuthStep::kSend, Bytes{0x00}, false};
        }
        if (ctx.secure_channel) {
            return AuthReply{AuthStep::kSend, password_with_nul(password), false};
        }
        if (!ctx.allow_public_key_retrieval) {
            return std::unexpected(Error{
                ErrorCode::kPolicyViolation,
                "Public Key Retrieval is not allowed",
                "sha256_password over an insecure channel"
            });
        }
        return AuthReply{AuthStep::kSend, Bytes{kSha256RequestKey}, true};
    }

    [[nodiscard]] auto continue_auth(std::span<const std::uint8_t> more_data,
                                     std::string_view              password,
                                     std::span<const std::uint8_t> scramble,
                                     const AuthContext&) const
        -> std::expected<AuthReply, Error> override
    {
        if (!looks_like_pem(more_data)) {
            return std::unexpected(Error{
                ErrorCode::kAuthentication,
                "unexpected sha256_password auth data",
                fmt::format("length={}", more_data.size())
            });
        }
        auto encrypted = rsa_encrypt_password(password, scramble, more_data);
        if (!encrypted) {
            return std::unexpected(std::move(encrypted.error()));
        }
        return AuthReply{AuthStep::kSend, std::move(*encrypted), false};
    }
};

}  // namespace

// 기본 구현: 추가 라운드트립을 지원하지 않는 plugin
auto AuthPlugin::continue_auth(std::span<const std::uint8_t> more_data,
                               std::string_view,
                               std::span<const std::uint8_t>,
                               const AuthContext&) const
    -> std::expected<AuthReply, Error>
{
    return std::unexpected(Error{
        ErrorCode::kAuthentication,
        fmt::format("{} does not accept additional auth data", name()),
        fmt::format("length={}", more_data.size())
    });
}

auto make_auth_plugin(std::string_view name) -> std::expected<std::unique_ptr<AuthPlugin>, Error> {
    if (name == kNativePasswordPlugin) {
        return std::make_unique<NativePasswordPlugin>();
    }
    if (name == kCachingSha2PasswordPlugin) {
        return std::make_unique<CachingSha2PasswordPlugin>();
    }
    if (name == kSha256PasswordPlugin) {
        return std::make_unique<Sha256PasswordPlugin>();
    }
    return std::unexpected(Error{
        ErrorCode::kAuthentication,
        fmt::format("Unknown authentication plugin: {}", name),
        {}
    });
}

auto scramble_native_password(std::string_view password, std::span<const std::uint8_t> scramble)
    -> std::expected<Bytes, Error>
{
    return xor_scramble<20>(EVP_sha1(), password, scramble, true);
}

auto scramble_caching_sha2(std::string_view password, std::span<const std::uint8_t> scramble)
    -> std::expected<Bytes, Error>
{
    return xor_scramble<32>(EVP_sha256(), password, scramble, false);
}

auto rsa_encrypt_password(std::string_view              password,
                          std::span<const std::uint8_t> scramble,
                          std::span<const std::uint8_t> pem_public_key)
    -> std::expected<Bytes, Error>
{
    if (scramble.empty()) {
        return std::unexpected(Error{ErrorCode::kAuthentication, "empty scramble", {}});
    }
    if (pem_public_key.size() > kMaxPublicKeySize) {
        return std::unexpected(Error{
            ErrorCode::kAuthentication,
            "server public key too large",
            fmt::format("length={}", pem_public_key.size())
        });
    }

    std::unique_ptr<BIO, BioDeleter> bio(
        BIO_new_mem_buf(pem_public_key.data(), static_cast<int>(pem_public_key.size())));
    if (!bio) {
        return std::unexpected(openssl_error("BIO_new_mem_buf"));
    }
    std::unique_ptr<EVP_PKEY, EvpPkeyDeleter> key(
        PEM_read_bio_PUBKEY(bio.get(), nullptr, nullptr, nullptr));
    if (!key) {
        return std::unexpected(openssl_error("PEM_read_bio_PUBKEY"));
    }

    // NUL 종결자까지 scramble 로 XOR 한다 (0 ^ s = s)
    Bytes salted(password.size() + 1, 0x00);
    for (std::size_t i = 0; i < salted.size(); ++i) {
        const std::uint8_t ch = i < password.size() ? static_cast<std::uint8_t>(password[i]) : 0x00;
        salted[i] = ch ^ scramble[i % scramble.size()];
    }

    std::unique_ptr<EVP_PKEY_CTX, EvpPkeyCtxDeleter> ctx(EVP_PKEY_CTX_new(key.get(), nullptr));
    if (!ctx) {
        return std::unexpected(openssl_error("EVP_PKEY_CTX_new"));
    }
    if (EVP_PKEY_encrypt_init(ctx.get()) <= 0) {
        return std::unexpected(openssl_error("EVP_PKEY_encrypt_init"));
    }
    if (EVP_PKEY_CTX_set_rsa_padding(ctx.get(), RSA_PKCS1_OAEP_PADDING) <= 0) {
        return std::unexpected(openssl_error("EVP_PKEY_CTX_set_rsa_padding"));
    }

    const int max_size = EVP_PKEY_size(key.get());
    if (max_size <= 0) {
        return std::unexpected(openssl_error("EVP_PKEY_size"));
    }

    Bytes       out(static_cast<std::size_t>(max_size));
    std::size_t out_len = out.size();
    if (EVP_PKEY_encrypt(ctx.get(), out.data(), &out_len, salted.data(), salted.size()) <= 0) {
        return std::unexpected(openssl_error("EVP_PKEY_encrypt"));
    }
    out.resize(out_len);
    return out;
}
