#include "server/shortener_server.hpp"

#include "core/code_generator.hpp"
#include "core/url_validator.hpp"
#include "http/http_server.hpp"
#include "http/request_handler.hpp"
#include "logger/structured_logger.hpp"
#include "service/redirect_service.hpp"
#include "service/shorten_service.hpp"
#include "service/stats_service.hpp"
#include "stats/stats_collector.hpp"
#include "store/store_factory.hpp"
#include "store/url_store.hpp"

#include <boost/asio/co_spawn.hpp>
#include <boost/asio/post.hpp>

#include <spdlog/spdlog.h>

#include <chrono>
#include <stdexcept>

// ---------------------------------------------------------------------------
// ShortenerServer — 구현
//
// run() 흐름:
//   1. logger_, stats_ 생성
//   2. make_url_store(config_.store) → 실패 시 runtime_error
//   3. CodeGenerator / UrlValidator / 서비스 3종 / RequestHandler 생성
//   4. HttpServer 생성 (bind) + co_spawn(run)
//   5. SIGTERM/SIGINT 핸들러 → stop()
//
// stop() 흐름:
//   1. stopping_ = true
//   2. 헬스 상태 unhealthy
//   3. HttpServer::stop() (acceptor close)
//   4. signal_set cancel → 남은 작업이 끝나면 io_context::run 반환
// ---------------------------------------------------------------------------

ShortenerServer::ShortenerServer(ServerConfig config)
    : config_{std::move(config)}
{}

ShortenerServer::~ShortenerServer() = default;

// ---------------------------------------------------------------------------
// ShortenerServer::run
// ---------------------------------------------------------------------------
void ShortenerServer::run(boost::asio::io_context& io_ctx)
{
    // -----------------------------------------------------------------------
    // 1. logger, stats
    // -----------------------------------------------------------------------
    logger_ = std::make_shared<StructuredLogger>(parse_log_level(config_.log_level),
                                                 config_.log_path);
    stats_  = std::make_shared<StatsCollector>();

    // -----------------------------------------------------------------------
    // 2. 저장소
    // -----------------------------------------------------------------------
    auto store = make_url_store(config_.store);
    if (!store) {
        throw std::runtime_error(store.error());
    }
    store_ = std::move(*store);

    // -----------------------------------------------------------------------
    // 3. 서비스 + 핸들러
    // -----------------------------------------------------------------------
    auto generator = std::make_shared<CodeGenerator>();
    auto shorten   = std::make_shared<ShortenService>(
        store_,
        generator,
        UrlValidator{config_.max_url_length},
        ShortenOptions{
            .base_url     = config_.base_url,
            .max_attempts = config_.max_generation_attempts,
        });
    auto redirect      = std::make_shared<RedirectService>(store_);
    auto stats_service = std::make_shared<StatsService>(store_);

    handler_ = std::make_shared<RequestHandler>(shorten, redirect, stats_service, logger_, stats_);

    // -----------------------------------------------------------------------
    // 4. HttpServer 생성 + co_spawn
    // -----------------------------------------------------------------------
    const auto listen_addr = boost::asio::ip::make_address(config_.listen_address);
    const auto listen_ep   = boost::asio::ip::tcp::endpoint{listen_addr, config_.listen_port};

    http_server_ = std::make_unique<HttpServer>(
        io_ctx,
        listen_ep,
        handler_,
        stats_,
        HttpServerOptions{
            .max_request_bytes = config_.max_request_bytes,
            .request_timeout   = std::chrono::seconds{config_.request_timeout_sec},
        });

    boost::asio::co_spawn(
        http_server_->executor(),
        http_server_->run(),
        [](std::exception_ptr eptr) {
            if (eptr) {
                try { std::rethrow_exception(eptr); }
                catch (const std::exception& e) {
                    spdlog::error("[server] http_server error: {}", e.what());
                }
            }
        }
    );

    // -----------------------------------------------------------------------
    // 5. 시그널 핸들러
    //    SIGTERM / SIGINT → stop()
    // -----------------------------------------------------------------------
    signals_ = std::make_unique<boost::asio::signal_set>(io_ctx, SIGTERM, SIGINT);
    signals_->async_wait(
        [this](const boost::system::error_code& ec, int signum) {
            if (!ec) {
                spdlog::info("[server] shutdown signal {} received", signum);
                stop();
            }
        }
    );

    if (auto urls = store_->count(); urls) {
        logger_->info(fmt::format("shortlink started (store={}, urls={}, base_url={})",
                                  config_.store.backend, *urls, config_.base_url));
    } else {
        logger_->warn(fmt::format(
            "shortlink started (store={}, base_url={}), record count unavailable: {}",
            config_.store.backend, config_.base_url, urls.error().message));
    }
}

// ---------------------------------------------------------------------------
// ShortenerServer::stop
// ---------------------------------------------------------------------------
void ShortenerServer::stop()
{
    if (stopping_.exchange(true)) {
        return;
    }

    spdlog::info("[server] stopping");

    // 헬스를 unhealthy 로 전환 (로드밸런서 라우팅 제외)
    if (handler_) {
        handler_->set_unhealthy("server shutting down");
    }

    if (http_server_) {
        http_server_->stop();
    }

    if (signals_) {
        boost::asio::post(signals_->get_executor(), [this]() {
            boost::system::error_code ec;
            signals_->cancel(ec);
        });
    }

    if (logger_) {
        logger_->flush();
    }
}

boost::asio::ip::tcp::endpoint ShortenerServer::local_endpoint() const
{
    if (!http_server_) {
        return {};
    }
    return http_server_->local_endpoint();
}
