#pragma once

// ---------------------------------------------------------------------------
// http_server.hpp
//
// Boost.Asio 코루틴 기반 HTTP/1.x 서버.
//
// [연결 처리]
// - 연결 하나 = 코루틴 하나. 요청 하나를 읽고 응답 후 소켓을 닫는다.
// - 요청 헤더는 "\r\n\r\n" 까지, 바디는 Content-Length 만큼 읽는다.
// - 헤더 + 바디 합계가 max_request_bytes 를 넘으면 413.
// - request_timeout 안에 요청을 다 받지 못하면 응답 없이 소켓을 닫는다.
//
// [스레드 모델]
// - io_context 는 여러 스레드에서 run() 될 수 있다.
// - acceptor 는 전용 strand 에서, 각 연결은 연결별 strand 에서 실행된다.
// ---------------------------------------------------------------------------

#include <utility>  // boost/asio/awaitable.hpp uses std::exchange without including it

#include <boost/asio/awaitable.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/strand.hpp>

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>

class RequestHandler;
class StatsCollector;

// ---------------------------------------------------------------------------
// HttpServerOptions
// ---------------------------------------------------------------------------
struct HttpServerOptions {
    std::size_t          max_request_bytes{64 * 1024};
    std::chrono::seconds request_timeout{10};
};

class HttpServer {
public:
    // -----------------------------------------------------------------------
    // 생성자
    //   endpoint 에 즉시 bind + listen 한다 (포트 0 이면 임의 포트).
    //   bind 실패 시 boost::system::system_error.
    // -----------------------------------------------------------------------
    HttpServer(boost::asio::io_context&         io_context,
               const boost::asio::ip::tcp::endpoint& endpoint,
               std::shared_ptr<RequestHandler>  handler,
               std::shared_ptr<StatsCollector>  stats,
               HttpServerOptions                options);

    ~HttpServer() = default;

    HttpServer(const HttpServer&)            = delete;
    HttpServer& operator=(const HttpServer&) = delete;
    HttpServer(HttpServer&&)                 = delete;
    HttpServer& operator=(HttpServer&&)      = delete;

    // -----------------------------------------------------------------------
    // run
    //   Accept 루프. executor() 위에서 co_spawn 해야 한다.
    //   stop() 으로 acceptor 가 닫히면 반환한다.
    // -----------------------------------------------------------------------
    auto run() -> boost::asio::awaitable<void>;

    // stop
    //   새 연결 수락을 중단한다. 진행 중인 연결은 끝까지 처리된다.
    //   어느 스레드에서 호출해도 안전하다.
    void stop();

    [[nodiscard]] boost::asio::ip::tcp::endpoint local_endpoint() const;

    [[nodiscard]] boost::asio::strand<boost::asio::io_context::executor_type>
    executor() const noexcept { return strand_; }

private:
    boost::asio::io_context&                                   io_context_;
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::ip::tcp::acceptor                              acceptor_;
    std::shared_ptr<RequestHandler>                             handler_;
    std::shared_ptr<StatsCollector>                             stats_;
    HttpServerOptions                                           options_;
    std::atomic<bool>                                           stopping_{false};
};
