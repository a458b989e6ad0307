// ---------------------------------------------------------------------------
// test_config_loader.cpp
//
// ConfigLoader (yaml-cpp) 단위 테스트
//   전체 스키마, 기본값 유지, 오류 입력, 파일 로드, duration 파싱
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

namespace fs = std::filesystem;
using namespace std::chrono_literals;

// ===========================================================================
// load_from_string
// ===========================================================================

// ---------------------------------------------------------------------------
// 1. 모든 키
// ---------------------------------------------------------------------------
TEST(ConfigLoader, FullSchema) {
    constexpr std::string_view kYaml = R"(
connection:
  host: db.example.com
  port: 13306
  user: ldbc
  password: password
  database: world
  debug: true
  read_timeout: 30s
  allow_public_key_retrieval: true
  database_term: schema
  socket_options:
    no_delay: false
    keep_alive: true
    receive_buffer_size: 65536
    send_buffer_size: 32768
  ssl:
    mode: trusted
    protocols: [TLSv1.2, TLSv1.3]
    cipher_suites: "TLS_AES_128_GCM_SHA256"
    server_names: [db.example.com]
    fallback: true
)";

    auto cfg = ConfigLoader::load_from_string(kYaml);
    ASSERT_TRUE(cfg.has_value()) << cfg.error();

    EXPECT_EQ(cfg->host(), "db.example.com");
    EXPECT_EQ(cfg->port(), 13306);
    EXPECT_EQ(cfg->user(), "ldbc");
    EXPECT_EQ(cfg->password(), std::optional<std::string>{"password"});
    EXPECT_EQ(cfg->database(), std::optional<std::string>{"world"});
    EXPECT_TRUE(cfg->debug());
    ASSERT_TRUE(cfg->read_timeout().has_value());
    EXPECT_EQ(*cfg->read_timeout(), 30s);
    EXPECT_TRUE(cfg->allow_public_key_retrieval());
    EXPECT_EQ(cfg->database_term(), DatabaseTerm::kSchema);

    const std::vector<SocketOption> expected_options = {
        SocketOption::no_delay(false),
        SocketOption::keep_alive(true),
        SocketOption::receive_buffer_size(65536),
        SocketOption::send_buffer_size(32768),
    };
    EXPECT_EQ(cfg->socket_options(), expected_options);

    const auto expected_ssl = SslMode::trusted()
                                  .with_tls_parameters(TlsParameters{
                                      .protocols     = {"TLSv1.2", "TLSv1.3"},
                                      .cipher_suites = "TLS_AES_128_GCM_SHA256",
                                      .server_names  = {"db.example.com"},
                                  })
                                  .with_fallback(true);
    EXPECT_EQ(cfg->ssl(), expected_ssl);
}

// ---------------------------------------------------------------------------
// 2. 없는 키는 기본값
// ---------------------------------------------------------------------------
TEST(ConfigLoader, MissingKeysKeepDefaults) {
    auto cfg = ConfigLoader::load_from_string("connection:\n  user: app\n");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(*cfg, ConnectionConfig().set_user("app"));

    auto empty = ConfigLoader::load_from_string("other: 1\n");
    ASSERT_TRUE(empty.has_value()) << empty.error();
    EXPECT_EQ(*empty, ConnectionConfig());
}

// ---------------------------------------------------------------------------
// 3. custom SSL 파일
// ---------------------------------------------------------------------------
TEST(ConfigLoader, CustomSslFiles) {
    auto cfg = ConfigLoader::load_from_string(R"(
connection:
  ssl:
    mode: custom
    ca_file: /etc/mysql/ca.pem
    cert_file: /etc/mysql/client-cert.pem
    key_file: /etc/mysql/client-key.pem
    verify_peer: false
)");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->ssl(), SslMode::custom(CustomSslFiles{
                              .ca_file     = "/etc/mysql/ca.pem",
                              .cert_file   = "/etc/mysql/client-cert.pem",
                              .key_file    = "/etc/mysql/client-key.pem",
                              .verify_peer = false,
                          }));
    EXPECT_FALSE(cfg->ssl().tls_parameters().has_value());
}

// ---------------------------------------------------------------------------
// 4. 잘못된 입력은 전체 실패
// ---------------------------------------------------------------------------
TEST(ConfigLoader, RejectsInvalidValues) {
    const std::vector<std::string> invalid = {
        "connection:\n  port: 70000\n",
        "connection:\n  port: 0\n",
        "connection:\n  port: abc\n",
        "connection:\n  read_timeout: 30\n",
        "connection:\n  read_timeout: 5h\n",
        "connection:\n  database_term: namespace\n",
        "connection:\n  ssl:\n    mode: strict\n",
        "connection:\n  socket_options:\n    receive_buffer_size: -1\n",
        "connection:\n  socket_options: [no_delay]\n",
        "connection:\n  debug: maybe\n",
        "connection: [a, b]\n",
        "- just\n- a list\n",
    };

    for (const auto& yaml : invalid) {
        auto cfg = ConfigLoader::load_from_string(yaml);
        EXPECT_FALSE(cfg.has_value()) << "accepted: " << yaml;
    }
}

TEST(ConfigLoader, ErrorMessageNamesTheKey) {
    auto cfg = ConfigLoader::load_from_string("connection:\n  database_term: namespace\n");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("database_term"), std::string::npos);
    EXPECT_NE(cfg.error().find("namespace"), std::string::npos);
}

TEST(ConfigLoader, SyntaxError) {
    auto cfg = ConfigLoader::load_from_string("connection:\n  host: [unterminated\n");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("YAML"), std::string::npos);
}

// ===========================================================================
// load (파일)
// ===========================================================================

class ConfigLoaderFileTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = fs::temp_directory_path() / "mywire_config_test";
        fs::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    auto write(const std::string& name, const std::string& content) -> fs::path {
        const auto path = dir_ / name;
        std::ofstream out(path);
        out << content;
        return path;
    }

    fs::path dir_;
};

TEST_F(ConfigLoaderFileTest, LoadsFile) {
    const auto path = write("mywire.yaml", "connection:\n  host: 10.0.0.5\n  read_timeout: 1500ms\n");

    auto cfg = ConfigLoader::load(path);
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->host(), "10.0.0.5");
    EXPECT_EQ(*cfg->read_timeout(), 1500ms);
}

TEST_F(ConfigLoaderFileTest, MissingFile) {
    auto cfg = ConfigLoader::load(dir_ / "nope.yaml");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("nope.yaml"), std::string::npos);
}

// ===========================================================================
// parse_duration
// ===========================================================================

TEST(ParseDuration, Units) {
    EXPECT_EQ(parse_duration("500ms").value(), 500ms);
    EXPECT_EQ(parse_duration("30s").value(), 30s);
    EXPECT_EQ(parse_duration("2m").value(), 2min);
    EXPECT_EQ(parse_duration("0s").value(), 0ms);
}

TEST(ParseDuration, RejectsMalformed) {
    EXPECT_FALSE(parse_duration("").has_value());
    EXPECT_FALSE(parse_duration("30").has_value());
    EXPECT_FALSE(parse_duration("s").has_value());
    EXPECT_FALSE(parse_duration("-5s").has_value());
    EXPECT_FALSE(parse_duration("1.5s").has_value());
    EXPECT_FALSE(parse_duration("10 s").has_value());
    EXPECT_FALSE(parse_duration("3h").has_value());
}
