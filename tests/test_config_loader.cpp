// ---------------------------------------------------------------------------
// test_config_loader.cpp
//
// ConfigLoader 단위 테스트.
//
// [테스트 범위]
// - 저장소에 포함된 config/shortlink.yaml 로드
// - 부분 설정 → 나머지는 기본값, 빈 파일 → 전부 기본값
// - 파일 없음 / YAML 문법 오류 / 최상위 비-map / 타입 오류 / 포트 범위 → 실패
// - validate: backend 이름, base_url scheme, 0 한도, log level
// - 환경변수 오버라이드 (잘못된 숫자는 기존 값 유지)
// ---------------------------------------------------------------------------

#include "config/config_loader.hpp"

#include <gtest/gtest.h>

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fs = std::filesystem;

// ---------------------------------------------------------------------------
// Fixture: 임시 YAML 파일
// ---------------------------------------------------------------------------
class ConfigLoaderTest : public ::testing::Test {
protected:
    void SetUp() override {
        const auto* info = ::testing::UnitTest::GetInstance()->current_test_info();
        dir_ = fs::temp_directory_path() / "shortlink_test_config" /
               (std::string(info->name()) + "_" + std::to_string(::getpid()));
        fs::create_directories(dir_);
    }

    void TearDown() override {
        for (const char* name : kEnvNames) {
            ::unsetenv(name);
        }
        std::error_code ec;
        fs::remove_all(dir_, ec);
    }

    fs::path write_yaml(const std::string& content) {
        const auto path = dir_ / "config.yaml";
        std::ofstream out(path);
        out << content;
        return path;
    }

    static constexpr const char* kEnvNames[] = {
        "SHORTLINK_LISTEN_ADDR", "SHORTLINK_PORT",          "SHORTLINK_BASE_URL",
        "SHORTLINK_THREADS",     "SHORTLINK_STORE_BACKEND", "SHORTLINK_DB_PATH",
        "SHORTLINK_LOG_PATH",    "SHORTLINK_LOG_LEVEL",
    };

    fs::path dir_;
};

// ---------------------------------------------------------------------------
// 정상 로드
// ---------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, LoadsBundledConfig) {
    auto cfg = ConfigLoader::load(fs::path{SHORTLINK_SOURCE_DIR} / "config" / "shortlink.yaml");
    ASSERT_TRUE(cfg.has_value()) << cfg.error();

    EXPECT_EQ(cfg->listen_address, "0.0.0.0");
    EXPECT_EQ(cfg->listen_port, 5000);
    EXPECT_EQ(cfg->base_url, "http://localhost:5000");
    EXPECT_EQ(cfg->store.backend, "sqlite");
    EXPECT_EQ(cfg->store.path, "url_shortener.db");
    EXPECT_EQ(cfg->max_generation_attempts, 10U);
    EXPECT_EQ(cfg->log_level, "info");
}

TEST_F(ConfigLoaderTest, PartialConfigKeepsDefaults) {
    auto cfg = ConfigLoader::load(write_yaml(
        "server:\n"
        "  listen_port: 8080\n"
        "  base_url: \"https://sho.rt\"\n"
        "store:\n"
        "  backend: memory\n"));
    ASSERT_TRUE(cfg.has_value()) << cfg.error();

    const ServerConfig defaults{};
    EXPECT_EQ(cfg->listen_port, 8080);
    EXPECT_EQ(cfg->base_url, "https://sho.rt");
    EXPECT_EQ(cfg->store.backend, "memory");
    EXPECT_EQ(cfg->listen_address, defaults.listen_address);
    EXPECT_EQ(cfg->store.path, defaults.store.path);
    EXPECT_EQ(cfg->max_request_bytes, defaults.max_request_bytes);
    EXPECT_EQ(cfg->log_path, defaults.log_path);
}

TEST_F(ConfigLoaderTest, EmptyFileUsesDefaults) {
    auto cfg = ConfigLoader::load(write_yaml(""));
    ASSERT_TRUE(cfg.has_value()) << cfg.error();
    EXPECT_EQ(cfg->listen_port, ServerConfig{}.listen_port);
    EXPECT_EQ(cfg->store.backend, "sqlite");
}

// ---------------------------------------------------------------------------
// 로드 실패
// ---------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, MissingFileFails) {
    auto cfg = ConfigLoader::load(dir_ / "does_not_exist.yaml");
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("cannot resolve config path"), std::string::npos);
}

TEST_F(ConfigLoaderTest, SyntaxErrorFails) {
    auto cfg = ConfigLoader::load(write_yaml("server:\n  listen_port: [5000\n"));
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("YAML parse error"), std::string::npos) << cfg.error();
}

TEST_F(ConfigLoaderTest, TopLevelSequenceFails) {
    auto cfg = ConfigLoader::load(write_yaml("- a\n- b\n"));
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("not a valid YAML map"), std::string::npos);
}

TEST_F(ConfigLoaderTest, TypeErrorNamesSection) {
    auto cfg = ConfigLoader::load(write_yaml("limits:\n  max_url_length: lots\n"));
    ASSERT_FALSE(cfg.has_value());
    EXPECT_NE(cfg.error().find("'limits'"), std::string::npos) << cfg.error();
}

TEST_F(ConfigLoaderTest, PortOutOfRangeFails) {
    for (const char* port : {"0", "70000"}) {
        auto cfg = ConfigLoader::load(write_yaml(std::string{"server:\n  listen_port: "} + port + "\n"));
        ASSERT_FALSE(cfg.has_value()) << port;
        EXPECT_NE(cfg.error().find("'server'"), std::string::npos) << cfg.error();
    }
}

TEST_F(ConfigLoaderTest, InvalidValuesFailValidation) {
    EXPECT_FALSE(ConfigLoader::load(write_yaml("store:\n  backend: redis\n")).has_value());
    EXPECT_FALSE(ConfigLoader::load(write_yaml("server:\n  base_url: sho.rt\n")).has_value());
    EXPECT_FALSE(ConfigLoader::load(write_yaml("limits:\n  max_generation_attempts: 0\n")).has_value());
    EXPECT_FALSE(ConfigLoader::load(write_yaml("logging:\n  level: verbose\n")).has_value());
    EXPECT_FALSE(ConfigLoader::load(write_yaml("server:\n  worker_threads: 4294967295\n")).has_value());
    EXPECT_FALSE(ConfigLoader::load(write_yaml("store:\n  busy_timeout_ms: 3000000000\n")).has_value());
}

TEST_F(ConfigLoaderTest, NumericUpperBounds) {
    ServerConfig threads{};
    threads.worker_threads = kMaxWorkerThreads;
    EXPECT_TRUE(ConfigLoader::validate(threads).has_value());
    threads.worker_threads = kMaxWorkerThreads + 1;
    auto too_many = ConfigLoader::validate(threads);
    ASSERT_FALSE(too_many.has_value());
    EXPECT_NE(too_many.error().find("worker_threads"), std::string::npos);

    ServerConfig busy{};
    busy.store.busy_timeout_ms = kMaxBusyTimeoutMs;
    EXPECT_TRUE(ConfigLoader::validate(busy).has_value());
    busy.store.busy_timeout_ms = kMaxBusyTimeoutMs + 1U;
    auto too_long = ConfigLoader::validate(busy);
    ASSERT_FALSE(too_long.has_value());
    EXPECT_NE(too_long.error().find("busy_timeout_ms"), std::string::npos);
}

TEST_F(ConfigLoaderTest, HugeThreadCountFromEnvFailsValidation) {
    ::setenv("SHORTLINK_THREADS", "4294967295", 1);
    ServerConfig cfg{};
    ConfigLoader::apply_env_overrides(cfg);
    ::unsetenv("SHORTLINK_THREADS");

    EXPECT_EQ(cfg.worker_threads, 4294967295U);
    EXPECT_FALSE(ConfigLoader::validate(cfg).has_value());
}

// ---------------------------------------------------------------------------
// validate
// ---------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, ValidateDefaults) {
    EXPECT_TRUE(ConfigLoader::validate(ServerConfig{}).has_value());
}

TEST_F(ConfigLoaderTest, ValidateRejectsBadCombinations) {
    ServerConfig empty_path{};
    empty_path.store.path.clear();
    EXPECT_FALSE(ConfigLoader::validate(empty_path).has_value());

    // memory 백엔드는 경로가 필요 없다
    ServerConfig memory{};
    memory.store.backend = "memory";
    memory.store.path.clear();
    EXPECT_TRUE(ConfigLoader::validate(memory).has_value());

    ServerConfig tiny_request{};
    tiny_request.max_request_bytes = 512;
    EXPECT_FALSE(ConfigLoader::validate(tiny_request).has_value());

    ServerConfig no_timeout{};
    no_timeout.request_timeout_sec = 0;
    EXPECT_FALSE(ConfigLoader::validate(no_timeout).has_value());
}

// ---------------------------------------------------------------------------
// 환경변수 오버라이드
// ---------------------------------------------------------------------------
TEST_F(ConfigLoaderTest, EnvOverridesReplaceValues) {
    ::setenv("SHORTLINK_PORT", "9090", 1);
    ::setenv("SHORTLINK_BASE_URL", "https://env.example.com", 1);
    ::setenv("SHORTLINK_STORE_BACKEND", "memory", 1);
    ::setenv("SHORTLINK_THREADS", "4", 1);
    ::setenv("SHORTLINK_LOG_LEVEL", "debug", 1);

    ServerConfig cfg{};
    ConfigLoader::apply_env_overrides(cfg);

    EXPECT_EQ(cfg.listen_port, 9090);
    EXPECT_EQ(cfg.base_url, "https://env.example.com");
    EXPECT_EQ(cfg.store.backend, "memory");
    EXPECT_EQ(cfg.worker_threads, 4U);
    EXPECT_EQ(cfg.log_level, "debug");
    EXPECT_EQ(cfg.listen_address, ServerConfig{}.listen_address);
}

TEST_F(ConfigLoaderTest, InvalidEnvNumbersKeepExistingValues) {
    ::setenv("SHORTLINK_PORT", "not-a-port", 1);
    ::setenv("SHORTLINK_THREADS", "-3", 1);

    ServerConfig cfg{};
    cfg.listen_port    = 7000;
    cfg.worker_threads = 2;
    ConfigLoader::apply_env_overrides(cfg);

    EXPECT_EQ(cfg.listen_port, 7000);
    EXPECT_EQ(cfg.worker_threads, 2U);

    ::setenv("SHORTLINK_PORT", "70000", 1);
    ConfigLoader::apply_env_overrides(cfg);
    EXPECT_EQ(cfg.listen_port, 7000);
}

TEST_F(ConfigLoaderTest, EmptyEnvValueIsIgnored) {
    ::setenv("SHORTLINK_DB_PATH", "", 1);
    ServerConfig cfg{};
    ConfigLoader::apply_env_overrides(cfg);
    EXPECT_EQ(cfg.store.path, ServerConfig{}.store.path);
}
