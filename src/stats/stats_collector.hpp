#pragma once

// ---------------------------------------------------------------------------
// stats_collector.hpp
//
// 서비스 레벨 실시간 통계 수집기. 헤더 전용 (atomic inline 구현).
//
// [스레드 안전성]
// - on_* 갱신 메서드: 요청 처리 경로에서 concurrent 호출 안전 (atomic).
// - snapshot(): 조회 경로 (/api/metrics). 갱신 경로와 mutex 없이 분리된다.
//
// [격리 원칙]
// - 통계 수집 실패가 요청 처리로 전파되지 않도록 모든 갱신 메서드는 noexcept.
// - 레코드별 click_count 와는 무관하다. click_count 의 정합성은 UrlStore 소관이며
//   여기 카운터는 운영 가시성 용도로만 사용한다.
// ---------------------------------------------------------------------------

#include <atomic>
#include <chrono>
#include <cstdint>

// ---------------------------------------------------------------------------
// StatsSnapshot
//   특정 시점의 통계 스냅샷 (불변 값 객체).
//   redirect_hit_rate: redirects / (redirects + redirect_misses), 분모 0 이면 0.0
// ---------------------------------------------------------------------------
struct StatsSnapshot {
    std::uint64_t                              urls_created{0};
    std::uint64_t                              shorten_failures{0};
    std::uint64_t                              redirects{0};
    std::uint64_t                              redirect_misses{0};
    std::uint64_t                              stats_lookups{0};
    std::uint64_t                              server_errors{0};
    std::uint64_t                              total_connections{0};
    std::uint64_t                              active_connections{0};
    double                                     redirect_hit_rate{0.0};
    std::chrono::seconds                       uptime{0};
    std::chrono::system_clock::time_point      captured_at{};
};

// ---------------------------------------------------------------------------
// StatsCollector
// ---------------------------------------------------------------------------
class StatsCollector {
public:
    StatsCollector() noexcept
        : started_at_(std::chrono::system_clock::now())
    {}

    ~StatsCollector() = default;

    // 복사/이동 금지 (atomic 은 복사 불가)
    StatsCollector(const StatsCollector&)            = delete;
    StatsCollector& operator=(const StatsCollector&) = delete;
    StatsCollector(StatsCollector&&)                 = delete;
    StatsCollector& operator=(StatsCollector&&)      = delete;

    void on_connection_open() noexcept {
        total_connections_.fetch_add(1, std::memory_order_relaxed);
        active_connections_.fetch_add(1, std::memory_order_relaxed);
    }

    // 언더플로우 방지: 0 이면 감소하지 않는다
    void on_connection_close() noexcept {
        std::uint64_t current = active_connections_.load(std::memory_order_relaxed);
        while (current > 0 &&
               !active_connections_.compare_exchange_weak(
                   current, current - 1, std::memory_order_relaxed)) {
        }
    }

    // on_shorten
    //   created: 레코드 생성 성공이면 true
    void on_shorten(bool created) noexcept {
        if (created) {
            urls_created_.fetch_add(1, std::memory_order_relaxed);
        } else {
            shorten_failures_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    // on_redirect
    //   found: 코드가 해석되어 리다이렉트했으면 true
    void on_redirect(bool found) noexcept {
        if (found) {
            redirects_.fetch_add(1, std::memory_order_relaxed);
        } else {
            redirect_misses_.fetch_add(1, std::memory_order_relaxed);
        }
    }

    void on_stats_lookup() noexcept {
        stats_lookups_.fetch_add(1, std::memory_order_relaxed);
    }

    // on_server_error
    //   kStore / kGenerationExhausted 발생 시 호출.
    void on_server_error() noexcept {
        server_errors_.fetch_add(1, std::memory_order_relaxed);
    }

    [[nodiscard]] StatsSnapshot snapshot() const noexcept {
        const auto now        = std::chrono::system_clock::now();
        const auto redirects  = redirects_.load(std::memory_order_relaxed);
        const auto misses     = redirect_misses_.load(std::memory_order_relaxed);

        double hit_rate = 0.0;
        if (redirects + misses > 0) {
            hit_rate = static_cast<double>(redirects) /
                       static_cast<double>(redirects + misses);
        }

        return StatsSnapshot{
            .urls_created       = urls_created_.load(std::memory_order_relaxed),
            .shorten_failures   = shorten_failures_.load(std::memory_order_relaxed),
            .redirects          = redirects,
            .redirect_misses    = misses,
            .stats_lookups      = stats_lookups_.load(std::memory_order_relaxed),
            .server_errors      = server_errors_.load(std::memory_order_relaxed),
            .total_connections  = total_connections_.load(std::memory_order_relaxed),
            .active_connections = active_connections_.load(std::memory_order_relaxed),
            .redirect_hit_rate  = hit_rate,
            .uptime             = std::chrono::duration_cast<std::chrono::seconds>(
                                      now - started_at_),
            .captured_at        = now,
        };
    }

private:
    std::atomic<std::uint64_t>            urls_created_{0};
    std::atomic<std::uint64_t>            shorten_failures_{0};
    std::atomic<std::uint64_t>            redirects_{0};
    std::atomic<std::uint64_t>            redirect_misses_{0};
    std::atomic<std::uint64_t>            stats_lookups_{0};
    std::atomic<std::uint64_t>            server_errors_{0};
    std::atomic<std::uint64_t>            total_connections_{0};
    std::atomic<std::uint64_t>            active_connections_{0};
    const std::chrono::system_clock::time_point started_at_;
};
