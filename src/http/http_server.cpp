// ---------------------------------------------------------------------------
// http_server.cpp
//
// handle_connection 흐름:
//   1. client_ip 추출, stats on_connection_open (RAII 로 close 보장)
//   2. 요청 타임아웃 타이머 시작 (만료 시 소켓 close)
//   3. "\r\n\r\n" 까지 읽기 → parse_request_head
//   4. Content-Length 만큼 바디 읽기
//   5. RequestHandler::handle → 응답 쓰기 → shutdown + close
// ---------------------------------------------------------------------------

#include "http/http_server.hpp"

#include "http/http_message.hpp"
#include "http/request_handler.hpp"
#include "stats/stats_collector.hpp"

#include <boost/asio/buffer.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/completion_condition.hpp>
#include <boost/asio/post.hpp>
#include <boost/asio/read.hpp>
#include <boost/asio/read_until.hpp>
#include <boost/asio/redirect_error.hpp>
#include <boost/asio/steady_timer.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/write.hpp>

#include <spdlog/spdlog.h>

#include <memory>
#include <string>
#include <string_view>

namespace {

// -----------------------------------------------------------------------
// write_and_close: 응답 전송 후 소켓 즉시 close
// -----------------------------------------------------------------------
auto write_and_close(boost::asio::ip::tcp::socket& socket, const HttpResponse& response)
    -> boost::asio::awaitable<void>
{
    const std::string wire = serialize_response(response);
    boost::system::error_code ec;

    co_await boost::asio::async_write(
        socket,
        boost::asio::buffer(wire),
        boost::asio::redirect_error(boost::asio::use_awaitable, ec)
    );
    if (ec) {
        spdlog::debug("[http_server] write error: {}", ec.message());
    }

    socket.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket.close(ec);
}

// -----------------------------------------------------------------------
// handle_connection
//   단일 HTTP 연결을 처리하는 코루틴. socket 의 executor(연결별 strand)에서 실행된다.
// -----------------------------------------------------------------------
auto handle_connection(boost::asio::ip::tcp::socket    socket,
                       std::shared_ptr<RequestHandler> handler,
                       std::shared_ptr<StatsCollector> stats,
                       HttpServerOptions               options)
    -> boost::asio::awaitable<void>
{
    stats->on_connection_open();
    struct StatsGuard {
        StatsCollector* stats;
        ~StatsGuard() { stats->on_connection_close(); }
    } stats_guard{stats.get()};

    std::string client_ip;
    boost::system::error_code peer_ec;
    const auto remote_ep = socket.remote_endpoint(peer_ec);
    if (!peer_ec) {
        client_ip = remote_ep.address().to_string();
    }

    // 타임아웃: 만료 시 소켓을 닫아 진행 중인 read 를 중단시킨다.
    // 핸들러가 코루틴보다 늦게 실행될 수 있으므로 소켓은 shared_ptr 로 공유한다.
    auto conn = std::make_shared<boost::asio::ip::tcp::socket>(std::move(socket));

    boost::asio::steady_timer deadline{conn->get_executor()};
    deadline.expires_after(options.request_timeout);
    deadline.async_wait([conn, client_ip](const boost::system::error_code& ec) {
        if (!ec) {
            spdlog::debug("[http_server] request timeout from {}", client_ip);
            boost::system::error_code close_ec;
            conn->close(close_ec);
        }
    });

    // -----------------------------------------------------------------------
    // 1. 요청 헤더
    // -----------------------------------------------------------------------
    std::string buffer;
    boost::system::error_code ec;

    const std::size_t head_len = co_await boost::asio::async_read_until(
        *conn,
        boost::asio::dynamic_buffer(buffer, options.max_request_bytes),
        "\r\n\r\n",
        boost::asio::redirect_error(boost::asio::use_awaitable, ec)
    );

    if (ec == boost::asio::error::not_found) {
        // 구분자 없이 max_request_bytes 도달
        deadline.cancel();
        co_await write_and_close(*conn, make_json_response(
            413, R"({"error":"Request too large"})"));
        co_return;
    }
    if (ec) {
        if (ec != boost::asio::error::eof) {
            spdlog::debug("[http_server] read error from {}: {}", client_ip, ec.message());
        }
        deadline.cancel();
        conn->close(ec);
        co_return;
    }

    auto request = parse_request_head(std::string_view{buffer}.substr(0, head_len));
    if (!request) {
        spdlog::debug("[http_server] bad request from {}: {}", client_ip, request.error().message);
        deadline.cancel();
        co_await write_and_close(*conn, make_json_response(
            request.error().status,
            fmt::format(R"({{"error":"{}"}})", reason_phrase(request.error().status))));
        co_return;
    }
    request->client_ip = client_ip;

    // -----------------------------------------------------------------------
    // 2. 바디 (Content-Length)
    // -----------------------------------------------------------------------
    auto body_len = content_length(*request, options.max_request_bytes - head_len);
    if (!body_len) {
        spdlog::debug("[http_server] rejected body from {}: {}", client_ip, body_len.error().message);
        deadline.cancel();
        co_await write_and_close(*conn, make_json_response(
            body_len.error().status,
            fmt::format(R"({{"error":"{}"}})", reason_phrase(body_len.error().status))));
        co_return;
    }

    const std::size_t have = buffer.size() - head_len;
    if (have < *body_len) {
        co_await boost::asio::async_read(
            *conn,
            boost::asio::dynamic_buffer(buffer, options.max_request_bytes),
            boost::asio::transfer_exactly(*body_len - have),
            boost::asio::redirect_error(boost::asio::use_awaitable, ec)
        );
        if (ec) {
            spdlog::debug("[http_server] body read error from {}: {}", client_ip, ec.message());
            deadline.cancel();
            conn->close(ec);
            co_return;
        }
    }
    request->body = buffer.substr(head_len, *body_len);

    // -----------------------------------------------------------------------
    // 3. 처리 + 응답
    // -----------------------------------------------------------------------
    deadline.cancel();
    const HttpResponse response = handler->handle(*request);

    spdlog::debug("[http_server] {} {} -> {} ({})", request->method, request->target,
                  response.status, client_ip);

    co_await write_and_close(*conn, response);
}

}  // namespace

// ---------------------------------------------------------------------------
// HttpServer 구현
// ---------------------------------------------------------------------------

HttpServer::HttpServer(boost::asio::io_context&              io_context,
                       const boost::asio::ip::tcp::endpoint& endpoint,
                       std::shared_ptr<RequestHandler>       handler,
                       std::shared_ptr<StatsCollector>       stats,
                       HttpServerOptions                     options)
    : io_context_{io_context}
    , strand_{boost::asio::make_strand(io_context)}
    , acceptor_{strand_}
    , handler_{std::move(handler)}
    , stats_{std::move(stats)}
    , options_{options}
{
    acceptor_.open(endpoint.protocol());
    acceptor_.set_option(boost::asio::ip::tcp::acceptor::reuse_address(true));
    acceptor_.bind(endpoint);
    acceptor_.listen(boost::asio::socket_base::max_listen_connections);
}

auto HttpServer::run() -> boost::asio::awaitable<void>
{
    const auto endpoint = local_endpoint();
    spdlog::info("[http_server] listening on {}:{}", endpoint.address().to_string(),
                 endpoint.port());

    while (!stopping_.load(std::memory_order_acquire)) {
        boost::system::error_code ec;

        // 연결별 strand: 타임아웃 핸들러와 코루틴이 소켓을 동시에 만지지 않도록 한다
        const boost::asio::any_io_executor conn_executor = boost::asio::make_strand(io_context_);

        auto socket = co_await acceptor_.async_accept(
            conn_executor,
            boost::asio::redirect_error(boost::asio::use_awaitable, ec)
        );

        if (ec) {
            if (ec == boost::asio::error::operation_aborted ||
                stopping_.load(std::memory_order_acquire)) {
                spdlog::info("[http_server] acceptor closed, stopping");
                break;
            }
            spdlog::warn("[http_server] accept error: {}", ec.message());
            continue;
        }

        boost::asio::co_spawn(
            conn_executor,
            handle_connection(std::move(socket), handler_, stats_, options_),
            [](std::exception_ptr eptr) {
                if (eptr) {
                    try { std::rethrow_exception(eptr); }
                    catch (const std::exception& e) {
                        spdlog::error("[http_server] connection exception: {}", e.what());
                    }
                }
            }
        );
    }
}

void HttpServer::stop()
{
    if (stopping_.exchange(true, std::memory_order_acq_rel)) {
        return;
    }

    // acceptor 는 strand_ 에서만 접근한다
    boost::asio::post(strand_, [this]() {
        boost::system::error_code ec;
        acceptor_.close(ec);
        if (ec) {
            spdlog::warn("[http_server] acceptor close error: {}", ec.message());
        }
    });
}

boost::asio::ip::tcp::endpoint HttpServer::local_endpoint() const
{
    boost::system::error_code ec;
    auto endpoint = acceptor_.local_endpoint(ec);
    if (ec) {
        spdlog::debug("[http_server] local_endpoint unavailable: {}", ec.message());
    }
    return endpoint;
}
