#pragma once

// ---------------------------------------------------------------------------
// structured_logger.hpp
//
// spdlog 기반 구조화 JSON 로거 인터페이스.
//
// [설계 원칙]
// - 싱글턴 금지: 생성자 주입 방식으로 의존성을 명시적으로 표현한다.
// - 이벤트 로그(log_shorten / log_redirect / log_failure)는 한 줄에 JSON 객체
//   하나를 기록한다. 필드명은 snake_case.
// - 내부 진단 메시지는 debug/info/warn/error 래퍼를 사용한다.
// ---------------------------------------------------------------------------

#include "log_types.hpp"

#include <filesystem>
#include <memory>
#include <string_view>

namespace spdlog {
class logger;
}  // namespace spdlog

// parse_log_level
//   "debug" | "info" | "warn" | "error" → LogLevel. 그 외는 kInfo.
[[nodiscard]] LogLevel parse_log_level(std::string_view level_str) noexcept;

// ---------------------------------------------------------------------------
// StructuredLogger
//   stdout + rotating file 싱크에 동시에 기록한다. 스레드 안전 (spdlog _mt 싱크).
// ---------------------------------------------------------------------------
class StructuredLogger {
public:
    // 생성자
    //   min_level : 이 레벨 미만의 로그는 기록하지 않는다.
    //   log_path  : 로그 파일 경로 (상위 디렉터리는 없으면 생성)
    //   실패 시 std::runtime_error.
    explicit StructuredLogger(LogLevel min_level,
                              const std::filesystem::path& log_path);

    ~StructuredLogger();

    // 복사 금지 (spdlog 인스턴스 소유권 명확화)
    StructuredLogger(const StructuredLogger&)            = delete;
    StructuredLogger& operator=(const StructuredLogger&) = delete;

    void log_shorten(const ShortenLog& entry);
    void log_redirect(const RedirectLog& entry);
    void log_failure(const FailureLog& entry);

    void debug(std::string_view msg);
    void info(std::string_view msg);
    void warn(std::string_view msg);
    void error(std::string_view msg);

    void flush();

private:
    LogLevel                        min_level_;
    std::filesystem::path           log_path_;
    std::shared_ptr<spdlog::logger> logger_;
};
