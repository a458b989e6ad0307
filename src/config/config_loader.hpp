#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일을 읽어 ConnectionConfig 를 만든다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message) 반환.
//   부분적으로 파싱된 설정을 반환하지 않는다.
// - 키가 없으면 ConnectionConfig 기본값을 유지한다.
// - password 는 로그에 출력하지 않는다.
//
// [YAML 스키마]
//   connection:
//     host / port / user / password / database / debug
//     read_timeout: "500ms" | "30s" | "1m"
//     allow_public_key_retrieval: bool
//     database_term: catalog | schema
//     socket_options: { no_delay, keep_alive, receive_buffer_size, send_buffer_size }
//     ssl:
//       mode: disabled | trusted | system | custom
//       ca_file / cert_file / key_file / verify_peer   (custom)
//       protocols: [TLSv1.2, ...]
//       cipher_suites: "..."
//       server_names: [...]
//       fallback: bool
// ---------------------------------------------------------------------------

#include "client/connection_config.hpp"

#include <chrono>
#include <expected>
#include <filesystem>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// ConfigLoader
// ---------------------------------------------------------------------------
class ConfigLoader {
public:
    // load
    //   실패: 파일 없음, YAML 문법 오류, 알 수 없는 enum 값,
    //         잘못된 duration / 숫자 범위
    [[nodiscard]] static std::expected<ConnectionConfig, std::string>
    load(const std::filesystem::path& config_path);

    // 이미 읽은 YAML 문자열에서 파싱한다 (테스트 / 내장 설정)
    [[nodiscard]] static std::expected<ConnectionConfig, std::string>
    load_from_string(std::string_view yaml);
};

// "500ms" / "30s" / "1m" → milliseconds. 단위가 없거나 숫자가 아니면 실패.
[[nodiscard]] auto parse_duration(std::string_view text)
    -> std::expected<std::chrono::milliseconds, std::string>;
