// ---------------------------------------------------------------------------
// structured_logger.cpp
//
// spdlog 기반 구조화 JSON 로거 구현.
// ---------------------------------------------------------------------------

#include "logger/structured_logger.hpp"

#include "common/json_util.hpp"
#include "common/time_util.hpp"

#include <sstream>
#include <stdexcept>
#include <vector>

#include <spdlog/common.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_sinks.h>
#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::kDebug: return spdlog::level::debug;
        case LogLevel::kInfo:  return spdlog::level::info;
        case LogLevel::kWarn:  return spdlog::level::warn;
        case LogLevel::kError: return spdlog::level::err;
    }
    return spdlog::level::info;
}

}  // namespace

LogLevel parse_log_level(std::string_view level_str) noexcept {
    if (level_str == "debug") { return LogLevel::kDebug; }
    if (level_str == "warn")  { return LogLevel::kWarn;  }
    if (level_str == "error") { return LogLevel::kError; }
    return LogLevel::kInfo;
}

// ---------------------------------------------------------------------------
// StructuredLogger 생성자
// ---------------------------------------------------------------------------
StructuredLogger::StructuredLogger(LogLevel min_level, const std::filesystem::path& log_path)
    : min_level_(min_level)
    , log_path_(log_path)
{
    try {
        if (log_path_.has_parent_path()) {
            std::filesystem::create_directories(log_path_.parent_path());
        }

        std::vector<spdlog::sink_ptr> sinks;
        sinks.push_back(std::make_shared<spdlog::sinks::stdout_sink_mt>());

        // Rotating file sink (100MB, 3개 파일 유지)
        const std::size_t max_file_size = 100 * 1024 * 1024;
        const std::size_t max_files     = 3;
        sinks.push_back(std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            log_path_.string(), max_file_size, max_files));

        logger_ = std::make_shared<spdlog::logger>("shortlink", sinks.begin(), sinks.end());
        logger_->set_level(to_spdlog_level(min_level_));

        // 구조화 로그는 각 메서드에서 JSON 으로 생성하므로 패턴은 타임스탬프만
        logger_->set_pattern("[%Y-%m-%d %H:%M:%S.%e] %v");
        logger_->flush_on(spdlog::level::warn);

    } catch (const spdlog::spdlog_ex& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    } catch (const std::filesystem::filesystem_error& ex) {
        throw std::runtime_error(std::string("Logger initialization failed: ") + ex.what());
    }
}

StructuredLogger::~StructuredLogger() {
    if (logger_) {
        logger_->flush();
    }
}

// ---------------------------------------------------------------------------
// log_shorten: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_shorten(const ShortenLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kInfo) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"shorten","short_code":")" << json_escape(entry.short_code)
         << R"(","original_url":")" << json_escape(entry.original_url)
         << R"(","client_ip":")" << json_escape(entry.client_ip)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_redirect: JSON 직렬화
// ---------------------------------------------------------------------------
void StructuredLogger::log_redirect(const RedirectLog& entry) {
    if (!logger_ || min_level_ > LogLevel::kInfo) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"redirect","short_code":")" << json_escape(entry.short_code)
         << R"(","original_url":")" << json_escape(entry.original_url)
         << R"(","click_count":)" << entry.click_count
         << R"(,"client_ip":")" << json_escape(entry.client_ip)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    logger_->info(json.str());
}

// ---------------------------------------------------------------------------
// log_failure: 서버 오류는 error, 클라이언트 오류는 debug
// ---------------------------------------------------------------------------
void StructuredLogger::log_failure(const FailureLog& entry) {
    const bool server_fault = is_server_fault(entry.error_code);
    const LogLevel level    = server_fault ? LogLevel::kError : LogLevel::kDebug;
    if (!logger_ || min_level_ > level) {
        return;
    }

    std::ostringstream json;
    json << R"({"event":"failure","operation":")" << json_escape(entry.operation)
         << R"(","error_code":")" << to_string(entry.error_code)
         << R"(","message":")" << json_escape(entry.message)
         << R"(","context":")" << json_escape(entry.context)
         << R"(","client_ip":")" << json_escape(entry.client_ip)
         << R"(","timestamp":")" << format_iso8601(entry.timestamp) << R"("})";

    if (server_fault) {
        logger_->error(json.str());
    } else {
        logger_->debug(json.str());
    }
}

// ---------------------------------------------------------------------------
// 내부 진단용 spdlog 래퍼
// ---------------------------------------------------------------------------
void StructuredLogger::debug(std::string_view msg) {
    if (logger_) {
        logger_->debug(msg);
    }
}

void StructuredLogger::info(std::string_view msg) {
    if (logger_) {
        logger_->info(msg);
    }
}

void StructuredLogger::warn(std::string_view msg) {
    if (logger_) {
        logger_->warn(msg);
    }
}

void StructuredLogger::error(std::string_view msg) {
    if (logger_) {
        logger_->error(msg);
    }
}

void StructuredLogger::flush() {
    if (logger_) {
        logger_->flush();
    }
}
