#pragma once

// ---------------------------------------------------------------------------
// request_handler.hpp
//
// HTTP 라우팅 + 서비스 호출 + 상태 코드/JSON 응답 매핑.
//
// [라우트]
//   GET  /                  헬스 (서비스 식별)
//   GET  /api/health        헬스
//   POST /api/shorten       단축 URL 생성
//   GET  /api/stats/<code>  조회 (click_count 불변)
//   GET  /api/metrics       StatsCollector 스냅샷
//   GET  /<code>            302 리다이렉트 (click_count 증가)
//
// 알려진 경로에 다른 메서드 → 405, 그 외 경로 → 404.
//
// [로깅/통계]
// - 성공한 단축/리다이렉트는 StructuredLogger 이벤트로 남긴다.
// - 서비스 오류는 log_failure (서버 오류 error, 클라이언트 오류 debug).
// - 서버 오류(kStore, kGenerationExhausted)는 StatsCollector::on_server_error.
//
// handle() 은 여러 I/O 스레드에서 동시에 호출된다. 멤버는 생성 후 불변이며
// 헬스 상태만 atomic + mutex 로 보호한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "http/http_message.hpp"

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

class ShortenService;
class RedirectService;
class StatsService;
class StructuredLogger;
class StatsCollector;

class RequestHandler {
public:
    RequestHandler(std::shared_ptr<ShortenService>   shorten,
                   std::shared_ptr<RedirectService>  redirect,
                   std::shared_ptr<StatsService>     stats_service,
                   std::shared_ptr<StructuredLogger> logger,
                   std::shared_ptr<StatsCollector>   stats);

    ~RequestHandler() = default;

    RequestHandler(const RequestHandler&)            = delete;
    RequestHandler& operator=(const RequestHandler&) = delete;

    // handle
    //   예외를 던지지 않는다. 처리 중 예외는 500 으로 변환된다.
    [[nodiscard]] HttpResponse handle(const HttpRequest& request) const;

    // set_unhealthy / set_healthy
    //   종료 중에는 헬스 라우트가 503 을 반환한다.
    void set_unhealthy(std::string_view reason);
    void set_healthy();

    [[nodiscard]] bool healthy() const noexcept {
        return healthy_.load(std::memory_order_acquire);
    }

private:
    std::shared_ptr<ShortenService>   shorten_;
    std::shared_ptr<RedirectService>  redirect_;
    std::shared_ptr<StatsService>     stats_service_;
    std::shared_ptr<StructuredLogger> logger_;
    std::shared_ptr<StatsCollector>   stats_;

    std::atomic<bool>  healthy_{true};
    mutable std::mutex reason_mutex_;
    std::string        unhealthy_reason_{};

    [[nodiscard]] HttpResponse route(const HttpRequest& request) const;

    [[nodiscard]] HttpResponse handle_health(std::string_view healthy_body) const;
    [[nodiscard]] HttpResponse handle_shorten(const HttpRequest& request) const;
    [[nodiscard]] HttpResponse handle_redirect(const HttpRequest& request,
                                               std::string_view code) const;
    [[nodiscard]] HttpResponse handle_stats(const HttpRequest& request,
                                            std::string_view code) const;
    [[nodiscard]] HttpResponse handle_metrics() const;

    void record_failure(std::string_view    operation,
                        const ServiceError& error,
                        const HttpRequest&  request) const;
};
