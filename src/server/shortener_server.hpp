#pragma once

// ---------------------------------------------------------------------------
// shortener_server.hpp
//
// 전체 구성요소 조립 + 시그널 처리 + Graceful Shutdown.
//
//   사용 예:
//     ShortenerServer server(config);
//     server.run(io_ctx);   // io_ctx.run() 은 호출자가 (여러 스레드에서) 실행
//
//   Graceful Shutdown:
//     SIGINT / SIGTERM 또는 stop() → 헬스 503 전환, 새 연결 수락 중단.
//     진행 중인 연결이 끝나면 io_context 의 작업이 소진되어 run() 이 반환된다.
// ---------------------------------------------------------------------------

#include "config/server_config.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <memory>

class UrlStore;
class StructuredLogger;
class StatsCollector;
class RequestHandler;
class HttpServer;

class ShortenerServer {
public:
    explicit ShortenerServer(ServerConfig config);

    ~ShortenerServer();

    ShortenerServer(const ShortenerServer&)            = delete;
    ShortenerServer& operator=(const ShortenerServer&) = delete;
    ShortenerServer(ShortenerServer&&)                 = delete;
    ShortenerServer& operator=(ShortenerServer&&)      = delete;

    // -----------------------------------------------------------------------
    // run
    //   로거, 저장소, 서비스, HTTP 서버를 생성하고 Accept 루프를 co_spawn 한다.
    //   저장소 열기 / 로거 생성 / 포트 bind 실패 시 예외 (std::runtime_error,
    //   boost::system::system_error). 반환 후 호출자가 io_ctx.run() 을 실행한다.
    // -----------------------------------------------------------------------
    void run(boost::asio::io_context& io_ctx);

    // stop
    //   Graceful Shutdown 시작. 중복 호출은 무시한다.
    void stop();

    // local_endpoint
    //   실제 바인딩된 엔드포인트 (listen_port 0 사용 시 확인용). run() 이후 유효.
    [[nodiscard]] boost::asio::ip::tcp::endpoint local_endpoint() const;

private:
    ServerConfig      config_;
    std::atomic<bool> stopping_{false};

    std::shared_ptr<StructuredLogger>        logger_{};
    std::shared_ptr<StatsCollector>          stats_{};
    std::shared_ptr<UrlStore>                store_{};
    std::shared_ptr<RequestHandler>          handler_{};
    std::unique_ptr<HttpServer>              http_server_{};
    std::unique_ptr<boost::asio::signal_set> signals_{};
};
