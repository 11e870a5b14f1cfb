#pragma once

// ---------------------------------------------------------------------------
// http_message.hpp
//
// HTTP/1.x 요청/응답 메시지 모델과 요청 헤더 파서.
//
// [범위]
// - 요청 라인 + 헤더 파싱 (바디는 Content-Length 만큼 HttpServer 가 읽는다)
// - chunked 전송 인코딩, keep-alive, 파이프라이닝은 지원하지 않는다.
//   모든 응답은 Connection: close 로 끝난다.
// - 헤더 이름은 소문자로 정규화하여 저장한다.
// ---------------------------------------------------------------------------

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>
#include <unordered_map>
#include <utility>
#include <vector>

// ---------------------------------------------------------------------------
// HttpRequest
//   target : 요청 라인의 원본 대상 ("/api/stats/Ab3Xy9?x=1")
//   path   : target 에서 쿼리 문자열을 제외한 부분 (라우팅 기준)
// ---------------------------------------------------------------------------
struct HttpRequest {
    std::string                                  method{};
    std::string                                  target{};
    std::string                                  path{};
    std::string                                  version{};
    std::unordered_map<std::string, std::string> headers{};
    std::string                                  body{};
    std::string                                  client_ip{};

    // header
    //   name 은 소문자로 전달한다. 없으면 빈 string_view.
    [[nodiscard]] std::string_view header(const std::string& name) const {
        const auto it = headers.find(name);
        if (it == headers.end()) {
            return {};
        }
        return it->second;
    }
};

// ---------------------------------------------------------------------------
// HttpResponse
//   serialize_response 가 Content-Length / Connection 헤더를 추가한다.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int                                              status{200};
    std::vector<std::pair<std::string, std::string>> headers{};
    std::string                                      body{};
};

// ---------------------------------------------------------------------------
// HttpParseError
//   status : 클라이언트에 돌려줄 HTTP 상태 코드 (400 / 413 / 501)
// ---------------------------------------------------------------------------
struct HttpParseError {
    int         status{400};
    std::string message{};
};

// parse_request_head
//   head : 요청 라인부터 빈 줄("\r\n\r\n")까지. 빈 줄 포함 여부는 무관.
//   성공 시 body 를 제외한 HttpRequest.
[[nodiscard]] std::expected<HttpRequest, HttpParseError>
parse_request_head(std::string_view head);

// content_length
//   Content-Length 헤더 값 (없으면 0).
//   숫자가 아니거나 max_body 초과 시 오류 (각각 400 / 413).
//   Transfer-Encoding 헤더가 있으면 501.
[[nodiscard]] std::expected<std::size_t, HttpParseError>
content_length(const HttpRequest& request, std::size_t max_body);

// reason_phrase
//   상태 코드 → 표준 reason phrase. 모르는 코드는 "Unknown".
[[nodiscard]] std::string_view reason_phrase(int status) noexcept;

// make_json_response
//   Content-Type: application/json 응답을 만든다.
[[nodiscard]] HttpResponse make_json_response(int status, std::string body);

// serialize_response
//   "HTTP/1.1 <status> <reason>\r\n" + 헤더 + Content-Length + Connection: close + 바디
[[nodiscard]] std::string serialize_response(const HttpResponse& response);
