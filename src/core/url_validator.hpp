#pragma once

// ---------------------------------------------------------------------------
// url_validator.hpp
//
// 단축 대상 URL 검증 및 정규화.
//
// [허용 형식]
//   scheme "://" [host] [":" port] [path] ["?" query] ["#" fragment]
//   - scheme: http | https (대소문자 무시)
//   - host  : localhost | IPv4 dotted quad | [IPv6] | 2개 이상 라벨의 도메인
//             (마지막 라벨은 알파벳 2자 이상)
//   - port  : 1~65535
//
// [정규화]
//   앞뒤 공백 제거, scheme/host 소문자 변환.
//   port/path/query/fragment 는 원문 그대로 보존한다.
//
// [알려진 한계]
// - IDN(국제화 도메인)은 punycode 로 변환된 형태만 허용한다.
// - IPv6 리터럴은 문자 집합만 검사하고 주소 구조는 검증하지 않는다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <cstddef>
#include <expected>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// UrlValidator
//   상태 없음 (max_url_length 만 보유). concurrent 호출 안전.
// ---------------------------------------------------------------------------
class UrlValidator {
public:
    static constexpr std::size_t kDefaultMaxUrlLength = 2048;

    explicit UrlValidator(std::size_t max_url_length = kDefaultMaxUrlLength) noexcept
        : max_url_length_{max_url_length}
    {}

    // validate
    //   성공: 정규화된 URL
    //   실패: ServiceError{kValidation, 사유}
    [[nodiscard]] std::expected<std::string, ServiceError>
    validate(std::string_view raw) const;

    [[nodiscard]] std::size_t max_url_length() const noexcept { return max_url_length_; }

private:
    std::size_t max_url_length_;
};

// is_valid_short_code
//   정확히 6자, [A-Za-z0-9] 만 허용.
[[nodiscard]] bool is_valid_short_code(std::string_view code) noexcept;
