#pragma once

// ---------------------------------------------------------------------------
// log_types.hpp
//
// 로거 서브시스템에서 사용하는 구조화 로그 타입 정의.
//
// [민감정보 취급 주의]
// - original_url 은 쿼리 문자열(토큰 등)을 포함할 수 있다. 운영 환경에서
//   로그 보관 정책을 별도로 적용할 것.
// ---------------------------------------------------------------------------

#include "common/types.hpp"  // ServiceErrorCode

#include <chrono>
#include <cstdint>
#include <string>

// ---------------------------------------------------------------------------
// LogLevel
//   로거의 최소 출력 레벨. config 에서 주입.
// ---------------------------------------------------------------------------
enum class LogLevel : std::uint8_t {
    kDebug = 0,
    kInfo  = 1,
    kWarn  = 2,
    kError = 3,
};

// ---------------------------------------------------------------------------
// ShortenLog
//   단축 URL 생성 이벤트.
// ---------------------------------------------------------------------------
struct ShortenLog {
    std::string                                short_code{};
    std::string                                original_url{};
    std::string                                client_ip{};
    std::chrono::system_clock::time_point      timestamp{};
};

// ---------------------------------------------------------------------------
// RedirectLog
//   리다이렉트 이벤트. click_count 는 증가 후 값.
// ---------------------------------------------------------------------------
struct RedirectLog {
    std::string                                short_code{};
    std::string                                original_url{};
    std::uint64_t                              click_count{0};
    std::string                                client_ip{};
    std::chrono::system_clock::time_point      timestamp{};
};

// ---------------------------------------------------------------------------
// FailureLog
//   요청 실패 이벤트.
//   operation: "shorten" | "redirect" | "stats"
//   서버 오류(kStore, kGenerationExhausted)는 error 레벨,
//   클라이언트 오류는 debug 레벨로 기록된다.
// ---------------------------------------------------------------------------
struct FailureLog {
    std::string                                operation{};
    ServiceErrorCode                           error_code{ServiceErrorCode::kStore};
    std::string                                message{};
    std::string                                context{};
    std::string                                client_ip{};
    std::chrono::system_clock::time_point      timestamp{};
};
