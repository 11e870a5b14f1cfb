// ---------------------------------------------------------------------------
// request_handler.cpp
//
// 라우팅과 ServiceError → HTTP 상태 코드 매핑.
//
//   kValidation          → 400 Invalid URL format (+ reason)
//   kNotFound            → 404 Short code not found
//   kGenerationExhausted → 500 Unable to generate unique short code
//   kStore               → 500 Internal server error (내부 메시지는 노출하지 않음)
// ---------------------------------------------------------------------------

#include "http/request_handler.hpp"

#include "common/json_util.hpp"
#include "common/time_util.hpp"
#include "logger/structured_logger.hpp"
#include "service/redirect_service.hpp"
#include "service/shorten_service.hpp"
#include "service/stats_service.hpp"
#include "stats/stats_collector.hpp"

#include <chrono>
#include <exception>

#include <spdlog/spdlog.h>

namespace {

constexpr std::string_view kStatsPrefix = "/api/stats/";

[[nodiscard]] HttpResponse error_response(int status, std::string_view error) {
    return make_json_response(status, fmt::format(R"({{"error":"{}"}})", json_escape(error)));
}

[[nodiscard]] HttpResponse error_response(int status, std::string_view error,
                                          std::string_view reason) {
    return make_json_response(status, fmt::format(R"({{"error":"{}","reason":"{}"}})",
                                                  json_escape(error), json_escape(reason)));
}

[[nodiscard]] HttpResponse method_not_allowed(std::string_view allowed) {
    auto response = error_response(405, "Method not allowed");
    response.headers.emplace_back("Allow", std::string{allowed});
    return response;
}

// 조회/리다이렉트 공통 매핑 (kNotFound 외에는 서버 오류)
[[nodiscard]] HttpResponse lookup_error_response(const ServiceError& error) {
    if (error.code == ServiceErrorCode::kNotFound) {
        return error_response(404, "Short code not found");
    }
    return error_response(500, "Internal server error");
}

}  // namespace

RequestHandler::RequestHandler(std::shared_ptr<ShortenService>   shorten,
                               std::shared_ptr<RedirectService>  redirect,
                               std::shared_ptr<StatsService>     stats_service,
                               std::shared_ptr<StructuredLogger> logger,
                               std::shared_ptr<StatsCollector>   stats)
    : shorten_{std::move(shorten)}
    , redirect_{std::move(redirect)}
    , stats_service_{std::move(stats_service)}
    , logger_{std::move(logger)}
    , stats_{std::move(stats)}
{}

// ---------------------------------------------------------------------------
// handle: 라우팅 중 발생한 예외는 500 으로 변환한다
// ---------------------------------------------------------------------------
HttpResponse RequestHandler::handle(const HttpRequest& request) const {
    try {
        return route(request);
    } catch (const std::exception& e) {
        logger_->error(fmt::format("[request_handler] unhandled exception on {} {}: {}",
                                   request.method, request.path, e.what()));
        stats_->on_server_error();
        return error_response(500, "Internal server error");
    }
}

void RequestHandler::set_unhealthy(std::string_view reason) {
    {
        std::lock_guard lock(reason_mutex_);
        unhealthy_reason_ = std::string{reason};
    }
    healthy_.store(false, std::memory_order_release);
}

void RequestHandler::set_healthy() {
    {
        std::lock_guard lock(reason_mutex_);
        unhealthy_reason_.clear();
    }
    healthy_.store(true, std::memory_order_release);
}

// ---------------------------------------------------------------------------
// route
// ---------------------------------------------------------------------------
HttpResponse RequestHandler::route(const HttpRequest& request) const {
    const std::string_view path   = request.path;
    const std::string_view method = request.method;

    if (path == "/") {
        if (method != "GET") {
            return method_not_allowed("GET");
        }
        return handle_health(R"({"status":"healthy","service":"URL Shortener API"})");
    }

    if (path == "/api/health") {
        if (method != "GET") {
            return method_not_allowed("GET");
        }
        return handle_health(R"({"status":"ok","message":"URL Shortener API is running"})");
    }

    if (path == "/api/shorten") {
        if (method != "POST") {
            return method_not_allowed("POST");
        }
        return handle_shorten(request);
    }

    if (path == "/api/metrics") {
        if (method != "GET") {
            return method_not_allowed("GET");
        }
        return handle_metrics();
    }

    if (path.starts_with(kStatsPrefix)) {
        const auto code = path.substr(kStatsPrefix.size());
        if (code.find('/') != std::string_view::npos) {
            return error_response(404, "Not found");
        }
        if (method != "GET") {
            return method_not_allowed("GET");
        }
        return handle_stats(request, code);
    }

    // "/api" 하위의 나머지 경로는 단축 코드로 해석하지 않는다
    if (path == "/api" || path.starts_with("/api/")) {
        return error_response(404, "Not found");
    }

    // 단일 세그먼트 "/<code>"
    const auto code = path.substr(1);
    if (code.find('/') != std::string_view::npos) {
        return error_response(404, "Not found");
    }
    if (method != "GET") {
        return method_not_allowed("GET");
    }
    return handle_redirect(request, code);
}

// ---------------------------------------------------------------------------
// handle_health
// ---------------------------------------------------------------------------
HttpResponse RequestHandler::handle_health(std::string_view healthy_body) const {
    if (healthy()) {
        return make_json_response(200, std::string{healthy_body});
    }

    std::string reason;
    {
        std::lock_guard lock(reason_mutex_);
        reason = unhealthy_reason_.empty() ? "service unavailable" : unhealthy_reason_;
    }
    return make_json_response(503, fmt::format(R"({{"status":"unhealthy","reason":"{}"}})",
                                               json_escape(reason)));
}

// ---------------------------------------------------------------------------
// handle_shorten
// ---------------------------------------------------------------------------
HttpResponse RequestHandler::handle_shorten(const HttpRequest& request) const {
    auto field = find_string_field(request.body, "url");
    if (!field) {
        stats_->on_shorten(false);
        logger_->debug(fmt::format("[request_handler] invalid shorten body from {}: {}",
                                   request.client_ip, field.error()));
        return error_response(400, "Invalid JSON body", field.error());
    }
    if (!field->has_value()) {
        stats_->on_shorten(false);
        return error_response(400, "Missing 'url' field in request body");
    }

    auto result = shorten_->shorten(**field);
    if (!result) {
        stats_->on_shorten(false);
        record_failure("shorten", result.error(), request);

        switch (result.error().code) {
            case ServiceErrorCode::kValidation:
                return error_response(400, "Invalid URL format", result.error().message);
            case ServiceErrorCode::kGenerationExhausted:
                return error_response(500, "Unable to generate unique short code");
            default:
                return error_response(500, "Internal server error");
        }
    }

    stats_->on_shorten(true);
    logger_->log_shorten(ShortenLog{
        .short_code   = result->record.short_code,
        .original_url = result->record.original_url,
        .client_ip    = request.client_ip,
        .timestamp    = std::chrono::system_clock::now(),
    });

    return make_json_response(
        201, fmt::format(R"({{"short_code":"{}","original_url":"{}","short_url":"{}"}})",
                         json_escape(result->record.short_code),
                         json_escape(result->record.original_url),
                         json_escape(result->short_url)));
}

// ---------------------------------------------------------------------------
// handle_redirect: 302 + Location
// ---------------------------------------------------------------------------
HttpResponse RequestHandler::handle_redirect(const HttpRequest& request,
                                             std::string_view  code) const {
    auto result = redirect_->resolve(code);
    if (!result) {
        if (result.error().code == ServiceErrorCode::kNotFound) {
            stats_->on_redirect(false);
        }
        record_failure("redirect", result.error(), request);
        return lookup_error_response(result.error());
    }

    stats_->on_redirect(true);
    logger_->log_redirect(RedirectLog{
        .short_code   = result->short_code,
        .original_url = result->original_url,
        .click_count  = result->click_count,
        .client_ip    = request.client_ip,
        .timestamp    = std::chrono::system_clock::now(),
    });

    HttpResponse response;
    response.status = 302;
    response.headers.emplace_back("Location", result->original_url);
    return response;
}

// ---------------------------------------------------------------------------
// handle_stats
// ---------------------------------------------------------------------------
HttpResponse RequestHandler::handle_stats(const HttpRequest& request,
                                          std::string_view  code) const {
    stats_->on_stats_lookup();

    auto result = stats_service_->lookup(code);
    if (!result) {
        record_failure("stats", result.error(), request);
        return lookup_error_response(result.error());
    }

    return make_json_response(
        200, fmt::format(
                 R"({{"short_code":"{}","original_url":"{}","click_count":{},"created_at":"{}"}})",
                 json_escape(result->short_code), json_escape(result->original_url),
                 result->click_count, format_iso8601(result->created_at)));
}

// ---------------------------------------------------------------------------
// handle_metrics
//   저장소 레코드 수 조회 실패 시 total_urls 는 null.
// ---------------------------------------------------------------------------
HttpResponse RequestHandler::handle_metrics() const {
    const auto snap = stats_->snapshot();

    std::string total_urls = "null";
    if (auto count = stats_service_->total_urls(); count) {
        total_urls = fmt::format("{}", *count);
    } else {
        logger_->warn(fmt::format("[request_handler] metrics: record count unavailable: {}",
                                  count.error().message));
    }

    return make_json_response(
        200, fmt::format(
                 R"({{"total_urls":{},"urls_created":{},"shorten_failures":{},)"
                 R"("redirects":{},"redirect_misses":{},"redirect_hit_rate":{:.4f},)"
                 R"("stats_lookups":{},"server_errors":{},)"
                 R"("total_connections":{},"active_connections":{},)"
                 R"("uptime_seconds":{},"captured_at":"{}"}})",
                 total_urls, snap.urls_created, snap.shorten_failures, snap.redirects,
                 snap.redirect_misses, snap.redirect_hit_rate, snap.stats_lookups,
                 snap.server_errors, snap.total_connections, snap.active_connections,
                 snap.uptime.count(), format_iso8601(snap.captured_at)));
}

// ---------------------------------------------------------------------------
// record_failure: 구조화 실패 로그 + 서버 오류 카운트
// ---------------------------------------------------------------------------
void RequestHandler::record_failure(std::string_view    operation,
                                    const ServiceError& error,
                                    const HttpRequest&  request) const {
    if (is_server_fault(error.code)) {
        stats_->on_server_error();
    }
    logger_->log_failure(FailureLog{
        .operation  = std::string{operation},
        .error_code = error.code,
        .message    = error.message,
        .context    = error.context,
        .client_ip  = request.client_ip,
        .timestamp  = std::chrono::system_clock::now(),
    });
}
