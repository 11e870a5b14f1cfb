#pragma once

// ---------------------------------------------------------------------------
// server_config.hpp
//
// 서버 설정 구조체 정의 (헤더만, 구현 없음).
// ConfigLoader 가 YAML 파일 + 환경변수에서 채운다.
//
// [설계 원칙]
// - 모든 멤버는 기본값을 명시한다. 설정 파일이 없으면 기본값으로 기동한다.
// - 이 헤더는 다른 프로젝트 헤더에 의존하지 않는다.
// ---------------------------------------------------------------------------

#include <cstdint>
#include <string>

// validate() 가 허용하는 상한. 이 범위 안의 값만 int / 스레드 수로 좁혀진다.
inline constexpr std::uint32_t kMaxWorkerThreads = 1024;
inline constexpr std::uint32_t kMaxBusyTimeoutMs = 2147483647;  // INT_MAX

// ---------------------------------------------------------------------------
// StoreConfig
//   backend: "sqlite" | "memory"
//   path   : SQLite 파일 경로 (":memory:" 허용). memory 백엔드에서는 무시.
// ---------------------------------------------------------------------------
struct StoreConfig {
    std::string   backend{"sqlite"};
    std::string   path{"url_shortener.db"};
    std::uint32_t busy_timeout_ms{5000};
};

// ---------------------------------------------------------------------------
// ServerConfig
//   listen_address / listen_port : HTTP 리슨 엔드포인트
//   base_url                     : short_url 조립용 공개 prefix (끝 '/' 없음)
//   worker_threads               : io_context::run 스레드 수 (0 = 하드웨어 동시성)
//   max_request_bytes            : 요청 헤더+바디 최대 크기
//   max_url_length               : 단축 대상 URL 최대 길이
//   max_generation_attempts      : short_code 충돌 재시도 한도
//   request_timeout_sec          : 요청 수신 제한 시간 (초과 시 연결 종료)
//   log_path / log_level         : StructuredLogger 설정
//                                  ("debug" | "info" | "warn" | "error")
// ---------------------------------------------------------------------------
struct ServerConfig {
    std::string   listen_address{"0.0.0.0"};
    std::uint16_t listen_port{5000};
    std::string   base_url{"http://localhost:5000"};
    std::uint32_t worker_threads{0};

    std::uint32_t max_request_bytes{64 * 1024};
    std::uint32_t max_url_length{2048};
    std::uint32_t max_generation_attempts{10};
    std::uint32_t request_timeout_sec{10};

    std::string   log_path{"/tmp/shortlink.log"};
    std::string   log_level{"info"};

    StoreConfig   store{};
};
