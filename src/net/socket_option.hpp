#pragma once

#include <cstdint>
#include <string_view>

// ---------------------------------------------------------------------------
// SocketOption
//   TCP 연결 직후 소켓에 적용할 옵션 하나.
//   ConnectionConfig 는 이 값을 순서대로 보관하고 TcpTransport 가 적용한다.
// ---------------------------------------------------------------------------
struct SocketOption {
    enum class Kind : std::uint8_t {
        kNoDelay,
        kKeepAlive,
        kReceiveBufferSize,
        kSendBufferSize,
    };

    Kind         kind{Kind::kNoDelay};
    std::int32_t value{0};   // bool 옵션은 0 / 1

    static auto no_delay(bool on) noexcept -> SocketOption {
        return SocketOption{Kind::kNoDelay, on ? 1 : 0};
    }
    static auto keep_alive(bool on) noexcept -> SocketOption {
        return SocketOption{Kind::kKeepAlive, on ? 1 : 0};
    }
    static auto receive_buffer_size(std::int32_t bytes) noexcept -> SocketOption {
        return SocketOption{Kind::kReceiveBufferSize, bytes};
    }
    static auto send_buffer_size(std::int32_t bytes) noexcept -> SocketOption {
        return SocketOption{Kind::kSendBufferSize, bytes};
    }

    bool operator==(const SocketOption&) const = default;
};

[[nodiscard]] constexpr auto socket_option_name(SocketOption::Kind kind) noexcept -> std::string_view {
    switch (kind) {
        case SocketOption::Kind::kNoDelay:           return "no_delay";
        case SocketOption::Kind::kKeepAlive:         return "keep_alive";
        case SocketOption::Kind::kReceiveBufferSize: return "receive_buffer_size";
        case SocketOption::Kind::kSendBufferSize:    return "send_buffer_size";
    }
    return "unknown";
}
