#pragma once

#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

// ---------------------------------------------------------------------------
// Bytes
//   패킷 payload / auth 데이터 등 원시 바이트 버퍼.
// ---------------------------------------------------------------------------
using Bytes = std::vector<std::uint8_t>;

// ---------------------------------------------------------------------------
// ErrorCode
//   프로토콜 엔진 전 계층에서 발생 가능한 오류 분류.
//   invalidates_connection() 이 true 인 분류는 연결을 폐기해야 한다.
// ---------------------------------------------------------------------------
enum class ErrorCode : std::uint8_t {
    kFraming            = 0,  // 패킷 구조 오류 / sequence 불일치
    kCapabilityMismatch = 1,  // 서버가 요구 기능을 지원하지 않음
    kTls                = 2,  // TLS context 생성 또는 업그레이드 실패
    kAuthentication     = 3,  // 서버 인증 거부, 알 수 없는 plugin 등
    kPolicyViolation    = 4,  // public key retrieval 비허용 상태에서 요청됨
    kServer             = 5,  // 커맨드 실행 중 ERR 패킷
    kTypeConversion     = 6,  // 컬럼 값 변환 실패
    kUsage              = 7,  // cursor / API 오용
    kIo                 = 8,  // transport 읽기/쓰기 실패
    kTimeout            = 9,  // read timeout 초과
};

// ---------------------------------------------------------------------------
// Error
//   실패 시 반환되는 오류 정보.
//   std::expected<T, Error> 패턴과 함께 사용한다.
//
//   server_code / sql_state 는 서버 ERR 패킷에서 온 경우에만 채워진다.
// ---------------------------------------------------------------------------
struct Error {
    ErrorCode     code{ErrorCode::kFraming};
    std::string   message{};     // 사람이 읽을 수 있는 오류 설명
    std::string   context{};     // 오류가 발생한 위치/입력 단편 (로깅용)
    std::uint16_t server_code{0};
    std::string   sql_state{};
};

// 연결을 더 이상 사용할 수 없게 만드는 오류인지 판별한다.
[[nodiscard]] constexpr bool invalidates_connection(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::kServer:
        case ErrorCode::kTypeConversion:
        case ErrorCode::kUsage:
            return false;
        default:
            return true;
    }
}

// 로그/테스트 출력용 이름
[[nodiscard]] constexpr auto error_code_name(ErrorCode code) noexcept -> std::string_view {
    switch (code) {
        case ErrorCode::kFraming:            return "framing";
        case ErrorCode::kCapabilityMismatch: return "capability_mismatch";
        case ErrorCode::kTls:                return "tls";
        case ErrorCode::kAuthentication:     return "authentication";
        case ErrorCode::kPolicyViolation:    return "policy_violation";
        case ErrorCode::kServer:             return "server";
        case ErrorCode::kTypeConversion:     return "type_conversion";
        case ErrorCode::kUsage:              return "usage";
        case ErrorCode::kIo:                 return "io";
        case ErrorCode::kTimeout:            return "timeout";
    }
    return "unknown";
}
