#pragma once

// ---------------------------------------------------------------------------
// config_loader.hpp
//
// YAML 설정 파일을 ServerConfig 로 로드하고 환경변수 오버라이드를 적용한다.
//
// [설계 원칙]
// - load() 실패 시 std::unexpected(error_message). 부분적으로 파싱된 설정을
//   반환하지 않는다 (all-or-nothing).
// - 누락된 키는 ServerConfig 기본값을 유지한다.
// - 환경변수 값이 잘못되면 경고 로그 후 기존 값을 유지한다.
//
// [YAML 스키마]
//   server:
//     listen_address: "0.0.0.0"
//     listen_port: 5000
//     base_url: "http://localhost:5000"
//     worker_threads: 0
//   store:
//     backend: sqlite            # sqlite | memory
//     path: url_shortener.db
//     busy_timeout_ms: 5000
//   logging:
//     level: info                # debug | info | warn | error
//     path: /tmp/shortlink.log
//   limits:
//     max_request_bytes: 65536
//     max_url_length: 2048
//     max_generation_attempts: 10
//     request_timeout_sec: 10
// ---------------------------------------------------------------------------

#include "server_config.hpp"

#include <expected>
#include <filesystem>
#include <string>

class ConfigLoader {
public:
    // load
    //   성공: 파일 내용이 반영된 ServerConfig
    //   실패: 파일 없음 / YAML 문법 오류 / 값 범위 오류
    [[nodiscard]] static std::expected<ServerConfig, std::string>
    load(const std::filesystem::path& config_path);

    // apply_env_overrides
    //   SHORTLINK_LISTEN_ADDR, SHORTLINK_PORT, SHORTLINK_BASE_URL,
    //   SHORTLINK_THREADS, SHORTLINK_STORE_BACKEND, SHORTLINK_DB_PATH,
    //   SHORTLINK_LOG_PATH, SHORTLINK_LOG_LEVEL
    static void apply_env_overrides(ServerConfig& config);

    // validate
    //   값 조합 검증 (backend 이름, 0 이 될 수 없는 한도 등).
    //   load() 와 main 에서 환경변수 적용 후 다시 호출한다.
    [[nodiscard]] static std::expected<void, std::string>
    validate(const ServerConfig& config);
};
