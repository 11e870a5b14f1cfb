// ---------------------------------------------------------------------------
// url_validator.cpp
//
// URL 검증/정규화 구현. 정규식 대신 authority 를 직접 분해한다.
//
// [처리 순서]
//   1. 앞뒤 공백 제거 → 빈 값/최대 길이 검사
//   2. 내부 공백/제어문자 거부
//   3. scheme 분리 ("://") → http/https 검사
//   4. authority 분리 (첫 '/', '?', '#' 전까지) → userinfo 거부
//   5. host / port 분리 → 각각 검증
//   6. scheme + host 소문자 변환 후 나머지(tail)는 원문 그대로 이어 붙임
// ---------------------------------------------------------------------------

#include "core/url_validator.hpp"

#include <boost/asio/ip/address_v6.hpp>
#include <spdlog/fmt/fmt.h>

#include <algorithm>
#include <charconv>
#include <cstdint>

namespace {

constexpr std::size_t kMaxHostLength  = 253;
constexpr std::size_t kMaxLabelLength = 63;

[[nodiscard]] bool is_ascii_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

[[nodiscard]] bool is_ascii_alpha(char c) noexcept {
    return (c >= 'A' && c <= 'Z') || (c >= 'a' && c <= 'z');
}

[[nodiscard]] bool is_ascii_digit(char c) noexcept {
    return c >= '0' && c <= '9';
}

[[nodiscard]] bool is_ascii_alnum(char c) noexcept {
    return is_ascii_alpha(c) || is_ascii_digit(c);
}

[[nodiscard]] bool is_hex_digit(char c) noexcept {
    return is_ascii_digit(c) || (c >= 'a' && c <= 'f') || (c >= 'A' && c <= 'F');
}

[[nodiscard]] std::string to_lower_ascii(std::string_view sv) {
    std::string out{sv};
    std::transform(out.begin(), out.end(), out.begin(), [](char c) {
        return (c >= 'A' && c <= 'Z') ? static_cast<char>(c - 'A' + 'a') : c;
    });
    return out;
}

[[nodiscard]] std::string_view trim(std::string_view sv) noexcept {
    while (!sv.empty() && is_ascii_space(sv.front())) { sv.remove_prefix(1); }
    while (!sv.empty() && is_ascii_space(sv.back()))  { sv.remove_suffix(1); }
    return sv;
}

// ---------------------------------------------------------------------------
// is_ipv4
//   "a.b.c.d" 각 옥텟 1~3자리 10진수, 0~255.
// ---------------------------------------------------------------------------
[[nodiscard]] bool is_ipv4(std::string_view host) noexcept {
    int octets = 0;
    while (true) {
        const auto dot   = host.find('.');
        const auto part  = host.substr(0, dot);
        if (part.empty() || part.size() > 3 ||
            !std::all_of(part.begin(), part.end(), is_ascii_digit)) {
            return false;
        }
        unsigned value{0};
        std::from_chars(part.data(), part.data() + part.size(), value);
        if (value > 255) {
            return false;
        }
        ++octets;
        if (dot == std::string_view::npos) {
            break;
        }
        host.remove_prefix(dot + 1);
    }
    return octets == 4;
}

// ---------------------------------------------------------------------------
// is_ipv6_literal
//   "[...]" 형태. 내부 문자 집합(hex, ':', '.')을 먼저 거르고,
//   그룹 수/"::" 개수 같은 구조는 Asio 주소 파서로 확인한다.
// ---------------------------------------------------------------------------
[[nodiscard]] bool is_ipv6_literal(std::string_view host) {
    if (host.size() < 4 || host.front() != '[' || host.back() != ']') {
        return false;
    }
    const auto inner = host.substr(1, host.size() - 2);
    if (inner.find(':') == std::string_view::npos) {
        return false;
    }
    const bool charset_ok = std::all_of(inner.begin(), inner.end(), [](char c) {
        return is_hex_digit(c) || c == ':' || c == '.';
    });
    if (!charset_ok) {
        return false;
    }

    boost::system::error_code ec;
    boost::asio::ip::make_address_v6(std::string{inner}, ec);
    return !ec;
}

// ---------------------------------------------------------------------------
// is_dns_name
//   2개 이상 라벨, 라벨당 1~63자 [A-Za-z0-9-], 하이픈으로 시작/종료 불가.
//   마지막 라벨(TLD)은 알파벳 2자 이상. 끝의 '.' 하나는 허용한다.
// ---------------------------------------------------------------------------
[[nodiscard]] bool is_dns_name(std::string_view host) noexcept {
    if (!host.empty() && host.back() == '.') {
        host.remove_suffix(1);
    }
    if (host.empty() || host.size() > kMaxHostLength) {
        return false;
    }

    int              labels = 0;
    std::string_view last_label;
    while (true) {
        const auto dot   = host.find('.');
        const auto label = host.substr(0, dot);
        if (label.empty() || label.size() > kMaxLabelLength) {
            return false;
        }
        if (label.front() == '-' || label.back() == '-') {
            return false;
        }
        if (!std::all_of(label.begin(), label.end(),
                         [](char c) { return is_ascii_alnum(c) || c == '-'; })) {
            return false;
        }
        ++labels;
        last_label = label;
        if (dot == std::string_view::npos) {
            break;
        }
        host.remove_prefix(dot + 1);
    }

    return labels >= 2 && last_label.size() >= 2 &&
           std::all_of(last_label.begin(), last_label.end(), is_ascii_alpha);
}

[[nodiscard]] bool is_valid_port(std::string_view port) noexcept {
    if (port.empty() || port.size() > 5 ||
        !std::all_of(port.begin(), port.end(), is_ascii_digit)) {
        return false;
    }
    std::uint32_t value{0};
    std::from_chars(port.data(), port.data() + port.size(), value);
    return value >= 1 && value <= 65535;
}

[[nodiscard]] std::unexpected<ServiceError> reject(std::string message, std::string_view input) {
    return std::unexpected(ServiceError{
        .code    = ServiceErrorCode::kValidation,
        .message = std::move(message),
        .context = std::string{input},
    });
}

}  // namespace

// ---------------------------------------------------------------------------
// UrlValidator::validate
// ---------------------------------------------------------------------------
std::expected<std::string, ServiceError>
UrlValidator::validate(std::string_view raw) const {
    const std::string_view url = trim(raw);

    if (url.empty()) {
        return reject("url must not be empty", raw);
    }
    if (url.size() > max_url_length_) {
        return reject(fmt::format("url exceeds {} characters", max_url_length_),
                      url.substr(0, 64));
    }

    const bool has_ctl = std::any_of(url.begin(), url.end(), [](char c) {
        const auto uc = static_cast<unsigned char>(c);
        return uc <= 0x20 || uc == 0x7f;
    });
    if (has_ctl) {
        return reject("url must not contain whitespace or control characters", url);
    }

    // ── scheme ──────────────────────────────────────────────────────────
    const auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos || scheme_end == 0) {
        return reject("url must be absolute (missing scheme)", url);
    }
    const std::string scheme = to_lower_ascii(url.substr(0, scheme_end));
    if (scheme != "http" && scheme != "https") {
        return reject(fmt::format("unsupported scheme '{}'", scheme), url);
    }

    // ── authority / tail ────────────────────────────────────────────────
    const std::string_view rest      = url.substr(scheme_end + 3);
    const auto             auth_end  = rest.find_first_of("/?#");
    const std::string_view authority = rest.substr(0, auth_end);
    const std::string_view tail =
        (auth_end == std::string_view::npos) ? std::string_view{} : rest.substr(auth_end);

    if (authority.find('@') != std::string_view::npos) {
        return reject("userinfo is not allowed in url", url);
    }

    std::string_view host;
    std::string_view port;
    bool             has_port = false;

    if (!authority.empty() && authority.front() == '[') {
        const auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return reject("malformed IPv6 host", url);
        }
        host = authority.substr(0, close + 1);
        const auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return reject("malformed IPv6 host", url);
            }
            has_port = true;
            port     = after.substr(1);
        }
    } else {
        const auto colon = authority.find(':');
        host = authority.substr(0, colon);
        if (colon != std::string_view::npos) {
            has_port = true;
            port     = authority.substr(colon + 1);
        }
    }

    if (host.empty()) {
        return reject("url must have a host", url);
    }
    if (has_port && !is_valid_port(port)) {
        return reject(fmt::format("invalid port '{}'", port), url);
    }

    const std::string host_lower = to_lower_ascii(host);
    const bool host_ok = host_lower == "localhost" || is_ipv4(host_lower) ||
                         is_ipv6_literal(host_lower) || is_dns_name(host_lower);
    if (!host_ok) {
        return reject(fmt::format("invalid host '{}'", host), url);
    }

    // ── 정규화 결과 조립 ───────────────────────────────────────────────
    std::string normalized;
    normalized.reserve(url.size());
    normalized += scheme;
    normalized += "://";
    normalized += host_lower;
    if (has_port) {
        normalized += ':';
        normalized += port;
    }
    normalized += tail;
    return normalized;
}

// ---------------------------------------------------------------------------
// is_valid_short_code
// ---------------------------------------------------------------------------
bool is_valid_short_code(std::string_view code) noexcept {
    return code.size() == kShortCodeLength && std::all_of(code.begin(), code.end(), is_ascii_alnum);
}
