#pragma once

#include "common/types.hpp"

#include <utility>
#include <boost/asio/ssl/context.hpp>

#include <cstdint>
#include <expected>
#include <memory>
#include <optional>
#include <string>
#include <vector>

// ---------------------------------------------------------------------------
// TlsParameters
//   TLS 업그레이드 시 적용할 선택 파라미터.
//
//   protocols     : 허용할 프로토콜 ("TLSv1.2", "TLSv1.3" ...). 비어 있으면 기본값
//   cipher_suites : OpenSSL cipher 문자열. "TLS_" 로 시작하는 항목은 TLS 1.3 suite
//   server_names  : SNI 호스트 이름 목록. 첫 항목을 사용하며, 비어 있으면 접속 host
// ---------------------------------------------------------------------------
struct TlsParameters {
    std::vector<std::string> protocols{};
    std::string              cipher_suites{};
    std::vector<std::string> server_names{};

    bool operator==(const TlsParameters&) const = default;
};

// ---------------------------------------------------------------------------
// CustomSslFiles
//   SslMode::custom() 이 사용하는 인증서 파일 경로. 빈 문자열은 미사용.
// ---------------------------------------------------------------------------
struct CustomSslFiles {
    std::string ca_file{};
    std::string cert_file{};
    std::string key_file{};
    bool        verify_peer{true};

    bool operator==(const CustomSslFiles&) const = default;
};

// ---------------------------------------------------------------------------
// SslMode
//   연결의 TLS 정책. 불변 값 타입이며 with_* 는 새 값을 반환한다.
//
//   kDisabled : TLS 미사용. make_context() 는 항상 실패한다.
//   kTrusted  : 모든 인증서 수락 (verify_none)
//   kSystem   : 시스템 CA 저장소로 검증 + 호스트 이름 검증
//   kCustom   : 지정 CA / 클라이언트 인증서
//
//   fallback_ok: 서버가 SSL 을 광고하지 않을 때 평문으로 계속할지 여부
// ---------------------------------------------------------------------------
class SslMode {
public:
    enum class Kind : std::uint8_t {
        kDisabled,
        kTrusted,
        kSystem,
        kCustom,
    };

    SslMode() = default;

    static auto disabled() -> SslMode;
    static auto trusted() -> SslMode;
    static auto system() -> SslMode;
    static auto custom(CustomSslFiles files) -> SslMode;

    [[nodiscard]] auto with_tls_parameters(TlsParameters params) const -> SslMode;
    [[nodiscard]] auto with_fallback(bool fallback_ok) const -> SslMode;

    [[nodiscard]] auto kind()           const noexcept -> Kind { return kind_; }
    [[nodiscard]] bool enabled()        const noexcept { return kind_ != Kind::kDisabled; }
    [[nodiscard]] bool fallback_ok()    const noexcept { return fallback_ok_; }
    [[nodiscard]] auto tls_parameters() const noexcept -> const std::optional<TlsParameters>& {
        return tls_parameters_;
    }
    [[nodiscard]] auto custom_files()   const noexcept -> const CustomSslFiles& {
        return custom_files_;
    }

    // -----------------------------------------------------------------------
    // make_context
    //   네트워크 접근 없이 TLS client context 를 구성한다.
    //   kDisabled → kTls "SSL.None: cannot create TLSContext."
    //   파일 로드 / cipher / 프로토콜 이름 오류 → kTls
    // -----------------------------------------------------------------------
    [[nodiscard]] auto make_context() const
        -> std::expected<std::shared_ptr<boost::asio::ssl::context>, Error>;

    bool operator==(const SslMode&) const = default;

private:
    explicit SslMode(Kind kind) noexcept : kind_(kind) {}

    Kind                         kind_{Kind::kDisabled};
    std::optional<TlsParameters> tls_parameters_{};
    CustomSslFiles               custom_files_{};
    bool                         fallback_ok_{false};
};

inline constexpr std::string_view kDisabledTlsContextMessage = "SSL.None: cannot create TLSContext.";

[[nodiscard]] auto ssl_mode_name(SslMode::Kind kind) noexcept -> std::string_view;
