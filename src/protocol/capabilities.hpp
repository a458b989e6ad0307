#pragma once

#include <cstdint>

// ---------------------------------------------------------------------------
// Capability flags
//   클라이언트/서버가 HandshakeV10 / HandshakeResponse41 에서 교환하는
//   32비트 기능 집합. 실제 사용 집합 = 클라이언트 요청 ∩ 서버 광고.
// ---------------------------------------------------------------------------
namespace capability {

inline constexpr std::uint32_t kLongPassword                = 1U << 0U;
inline constexpr std::uint32_t kFoundRows                   = 1U << 1U;
inline constexpr std::uint32_t kLongFlag                    = 1U << 2U;
inline constexpr std::uint32_t kConnectWithDb               = 1U << 3U;
inline constexpr std::uint32_t kNoSchema                    = 1U << 4U;
inline constexpr std::uint32_t kCompress                    = 1U << 5U;
inline constexpr std::uint32_t kOdbc                        = 1U << 6U;
inline constexpr std::uint32_t kLocalFiles                  = 1U << 7U;
inline constexpr std::uint32_t kIgnoreSpace                 = 1U << 8U;
inline constexpr std::uint32_t kProtocol41                  = 1U << 9U;
inline constexpr std::uint32_t kInteractive                 = 1U << 10U;
inline constexpr std::uint32_t kSsl                         = 1U << 11U;
inline constexpr std::uint32_t kIgnoreSigpipe               = 1U << 12U;
inline constexpr std::uint32_t kTransactions                = 1U << 13U;
inline constexpr std::uint32_t kReserved                    = 1U << 14U;
inline constexpr std::uint32_t kSecureConnection            = 1U << 15U;
inline constexpr std::uint32_t kMultiStatements             = 1U << 16U;
inline constexpr std::uint32_t kMultiResults                = 1U << 17U;
inline constexpr std::uint32_t kPsMultiResults              = 1U << 18U;
inline constexpr std::uint32_t kPluginAuth                  = 1U << 19U;
inline constexpr std::uint32_t kConnectAttrs                = 1U << 20U;
inline constexpr std::uint32_t kPluginAuthLenencClientData  = 1U << 21U;
inline constexpr std::uint32_t kCanHandleExpiredPasswords   = 1U << 22U;
inline constexpr std::uint32_t kSessionTrack                = 1U << 23U;
inline constexpr std::uint32_t kDeprecateEof                = 1U << 24U;
inline constexpr std::uint32_t kOptionalResultsetMetadata   = 1U << 25U;
inline constexpr std::uint32_t kZstdCompressionAlgorithm    = 1U << 26U;
inline constexpr std::uint32_t kQueryAttributes             = 1U << 27U;
inline constexpr std::uint32_t kMultiFactorAuthentication   = 1U << 28U;
inline constexpr std::uint32_t kCapabilityExtension         = 1U << 29U;
inline constexpr std::uint32_t kSslVerifyServerCert         = 1U << 30U;
inline constexpr std::uint32_t kRememberOptions             = 1U << 31U;

// 이 클라이언트가 항상 요청하는 기본 집합.
// kConnectWithDb / kSsl 은 설정에 따라 추가된다.
inline constexpr std::uint32_t kClientBase =
    kLongPassword | kLongFlag | kProtocol41 | kTransactions | kSecureConnection
    | kMultiStatements | kMultiResults | kPsMultiResults | kPluginAuth
    | kPluginAuthLenencClientData | kDeprecateEof;

[[nodiscard]] constexpr bool has(std::uint32_t flags, std::uint32_t bit) noexcept {
    return (flags & bit) != 0U;
}

}  // namespace capability

// ---------------------------------------------------------------------------
// Server status flags
//   OK / EOF 패킷이 전달하는 16비트 서버 상태.
// ---------------------------------------------------------------------------
namespace server_status {

inline constexpr std::uint16_t kInTransaction         = 0x0001;
inline constexpr std::uint16_t kAutocommit            = 0x0002;
inline constexpr std::uint16_t kMoreResultsExist      = 0x0008;
inline constexpr std::uint16_t kNoGoodIndexUsed       = 0x0010;
inline constexpr std::uint16_t kNoIndexUsed           = 0x0020;
inline constexpr std::uint16_t kCursorExists          = 0x0040;
inline constexpr std::uint16_t kLastRowSent           = 0x0080;
inline constexpr std::uint16_t kDbDropped             = 0x0100;
inline constexpr std::uint16_t kNoBackslashEscapes    = 0x0200;
inline constexpr std::uint16_t kMetadataChanged       = 0x0400;
inline constexpr std::uint16_t kQueryWasSlow          = 0x0800;
inline constexpr std::uint16_t kPsOutParams           = 0x1000;
inline constexpr std::uint16_t kInTransactionReadonly = 0x2000;
inline constexpr std::uint16_t kSessionStateChanged   = 0x4000;

}  // namespace server_status
