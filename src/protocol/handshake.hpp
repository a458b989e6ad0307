#pragma once

#include "common/types.hpp"
#include "net/packet_channel.hpp"
#include "net/ssl_mode.hpp"

#include <utility>
#include <boost/asio/awaitable.hpp>

#include <cstdint>
#include <expected>
#include <optional>
#include <string>

// ---------------------------------------------------------------------------
// HandshakeOptions
//   핸드셰이크에 필요한 연결 설정. ConnectionConfig 에서 채운다.
// ---------------------------------------------------------------------------
struct HandshakeOptions {
    std::string                host{};
    std::string                user{};
    std::optional<std::string> password{};
    std::optional<std::string> database{};
    SslMode                    ssl{};
    bool                       allow_public_key_retrieval{false};
};

// ---------------------------------------------------------------------------
// ServerInfo
//   핸드셰이크 성공 결과.
// ---------------------------------------------------------------------------
struct ServerInfo {
    std::uint8_t  protocol_version{0};
    std::string   server_version{};
    std::uint32_t connection_id{0};
    std::uint32_t capabilities{0};   // 실제 사용 집합 (클라이언트 ∩ 서버)
    std::uint16_t status_flags{0};
    std::uint8_t  charset{0};
    std::string   auth_plugin{};     // 최종 인증에 사용한 plugin
    bool          tls{false};
    std::string   greeting_plugin{}; // greeting 이 지정한 plugin
    Bytes         scramble{};        // greeting 의 scramble (COM_CHANGE_USER 에 재사용)
};

// ---------------------------------------------------------------------------
// HandshakeEngine
//   새 연결에서 MySQL 클라이언트 핸드셰이크를 수행한다.
//
//   흐름:
//     1. Initial Handshake 수신 / 파싱
//     2. capability 협상 (SSL 요청 시 SSLRequest + TLS 업그레이드)
//     3. HandshakeResponse41 전송 (서버 지정 plugin 의 auth response)
//     4. OK / ERR / AuthSwitch / AuthMoreData 처리 루프
//
//   상태 판단은 detail::process_auth_packet 에 위임한다.
//   실패 시 channel 은 호출자가 닫는다.
//
//   change_user 는 인증된 연결에서 COM_CHANGE_USER 를 보내고 같은 인증 루프
//   (4단계)를 돈다. options 의 user / password / database /
//   allow_public_key_retrieval 만 사용한다. 성공 시 status_flags 와
//   auth_plugin 이 갱신된 server 사본을 반환한다.
// ---------------------------------------------------------------------------
class HandshakeEngine {
public:
    static auto perform(PacketChannel& channel, const HandshakeOptions& options)
        -> boost::asio::awaitable<std::expected<ServerInfo, Error>>;

    static auto change_user(PacketChannel&          channel,
                            const ServerInfo&       server,
                            const HandshakeOptions& options)
        -> boost::asio::awaitable<std::expected<ServerInfo, Error>>;
};
