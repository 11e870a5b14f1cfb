// ---------------------------------------------------------------------------
// http_message.cpp
//
// HTTP/1.x 요청 헤더 파서와 응답 직렬화.
//
// [파싱 규칙]
// - 요청 라인: METHOD SP target SP HTTP/1.0|HTTP/1.1
// - METHOD 는 대문자 토큰, target 은 '/' 로 시작해야 한다.
// - 헤더 라인에 ':' 가 없거나 이름이 비어 있으면 400.
// - Content-Length 가 서로 다른 값으로 중복되면 400.
// ---------------------------------------------------------------------------

#include "http/http_message.hpp"

#include <algorithm>
#include <cctype>
#include <charconv>

#include <spdlog/spdlog.h>

namespace {

[[nodiscard]] std::string_view trim(std::string_view sv) noexcept {
    while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) {
        sv.remove_prefix(1);
    }
    while (!sv.empty() && (sv.back() == ' ' || sv.back() == '\t')) {
        sv.remove_suffix(1);
    }
    return sv;
}

[[nodiscard]] std::string to_lower(std::string_view sv) {
    std::string out{sv};
    std::transform(out.begin(), out.end(), out.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    return out;
}

[[nodiscard]] bool is_method_token(std::string_view sv) noexcept {
    if (sv.empty() || sv.size() > 16) {
        return false;
    }
    return std::all_of(sv.begin(), sv.end(), [](char c) { return c >= 'A' && c <= 'Z'; });
}

[[nodiscard]] std::unexpected<HttpParseError> bad_request(std::string message) {
    return std::unexpected(HttpParseError{.status = 400, .message = std::move(message)});
}

}  // namespace

// ---------------------------------------------------------------------------
// parse_request_head
// ---------------------------------------------------------------------------
std::expected<HttpRequest, HttpParseError>
parse_request_head(std::string_view head) {
    // 끝의 빈 줄 제거
    while (head.ends_with("\r\n")) {
        head.remove_suffix(2);
    }
    if (head.empty()) {
        return bad_request("empty request");
    }

    // -----------------------------------------------------------------------
    // 1. 요청 라인
    // -----------------------------------------------------------------------
    const auto line_end = head.find("\r\n");
    const std::string_view request_line =
        (line_end == std::string_view::npos) ? head : head.substr(0, line_end);

    const auto sp1 = request_line.find(' ');
    if (sp1 == std::string_view::npos) {
        return bad_request("malformed request line");
    }
    const auto sp2 = request_line.find(' ', sp1 + 1);
    if (sp2 == std::string_view::npos ||
        request_line.find(' ', sp2 + 1) != std::string_view::npos) {
        return bad_request("malformed request line");
    }

    const auto method  = request_line.substr(0, sp1);
    const auto target  = request_line.substr(sp1 + 1, sp2 - sp1 - 1);
    const auto version = request_line.substr(sp2 + 1);

    if (!is_method_token(method)) {
        return bad_request("invalid method");
    }
    if (target.empty() || target.front() != '/') {
        return bad_request("request target must be an absolute path");
    }
    if (version != "HTTP/1.1" && version != "HTTP/1.0") {
        return bad_request(fmt::format("unsupported http version '{}'", version));
    }

    HttpRequest request;
    request.method  = std::string{method};
    request.target  = std::string{target};
    request.path    = std::string{target.substr(0, target.find('?'))};
    request.version = std::string{version};

    // -----------------------------------------------------------------------
    // 2. 헤더
    // -----------------------------------------------------------------------
    std::string_view rest =
        (line_end == std::string_view::npos) ? std::string_view{} : head.substr(line_end + 2);

    while (!rest.empty()) {
        const auto eol = rest.find("\r\n");
        const std::string_view line = (eol == std::string_view::npos) ? rest : rest.substr(0, eol);
        rest = (eol == std::string_view::npos) ? std::string_view{} : rest.substr(eol + 2);

        const auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return bad_request("malformed header line");
        }
        const auto raw_name = line.substr(0, colon);
        if (raw_name.find_first_of(" \t") != std::string_view::npos) {
            return bad_request("whitespace in header name");
        }

        std::string name  = to_lower(raw_name);
        std::string value{trim(line.substr(colon + 1))};

        auto [it, inserted] = request.headers.try_emplace(name, value);
        if (!inserted) {
            if (name == "content-length" && it->second != value) {
                return bad_request("conflicting content-length headers");
            }
            // 그 외 중복 헤더는 쉼표로 결합 (RFC 9110 5.3)
            if (name != "content-length") {
                it->second += ", ";
                it->second += value;
            }
        }
    }

    return request;
}

// ---------------------------------------------------------------------------
// content_length
// ---------------------------------------------------------------------------
std::expected<std::size_t, HttpParseError>
content_length(const HttpRequest& request, std::size_t max_body) {
    if (!request.header("transfer-encoding").empty()) {
        return std::unexpected(HttpParseError{
            .status = 501, .message = "transfer-encoding is not supported"});
    }

    const auto value = request.header("content-length");
    if (value.empty()) {
        return std::size_t{0};
    }

    std::size_t length = 0;
    const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
    if (ec == std::errc::result_out_of_range) {
        return std::unexpected(HttpParseError{.status = 413, .message = "request body too large"});
    }
    if (ec != std::errc{} || ptr != value.data() + value.size()) {
        return bad_request(fmt::format("invalid content-length '{}'", value));
    }
    if (length > max_body) {
        return std::unexpected(HttpParseError{.status = 413, .message = "request body too large"});
    }
    return length;
}

// ---------------------------------------------------------------------------
// reason_phrase
// ---------------------------------------------------------------------------
std::string_view reason_phrase(int status) noexcept {
    switch (status) {
        case 200: return "OK";
        case 201: return "Created";
        case 302: return "Found";
        case 400: return "Bad Request";
        case 404: return "Not Found";
        case 405: return "Method Not Allowed";
        case 408: return "Request Timeout";
        case 413: return "Payload Too Large";
        case 500: return "Internal Server Error";
        case 501: return "Not Implemented";
        case 503: return "Service Unavailable";
        default:  return "Unknown";
    }
}

HttpResponse make_json_response(int status, std::string body) {
    HttpResponse response;
    response.status = status;
    response.headers.emplace_back("Content-Type", "application/json");
    response.body = std::move(body);
    return response;
}

// ---------------------------------------------------------------------------
// serialize_response
// ---------------------------------------------------------------------------
std::string serialize_response(const HttpResponse& response) {
    std::string out = fmt::format("HTTP/1.1 {} {}\r\n", response.status,
                                  reason_phrase(response.status));
    for (const auto& [name, value] : response.headers) {
        out += name;
        out += ": ";
        out += value;
        out += "\r\n";
    }
    out += fmt::format("Content-Length: {}\r\nConnection: close\r\n\r\n", response.body.size());
    out += response.body;
    return out;
}
