#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

// short_code 길이 (base62 6자리 = 약 5.68e10 공간)
inline constexpr std::size_t kShortCodeLength = 6;

// ---------------------------------------------------------------------------
// ShortUrlRecord
//   단축 코드 하나와 원본 URL 의 매핑. 저장소의 유일한 영속 엔티티.
//   short_code / original_url / created_at 은 생성 후 불변이며,
//   click_count 는 UrlStore::increment_click 으로만 증가한다.
// ---------------------------------------------------------------------------
struct ShortUrlRecord {
    std::string   short_code{};                          // 6자리 base62 (PK)
    std::string   original_url{};                        // 정규화된 http/https URL
    std::chrono::system_clock::time_point created_at{};  // 생성 시각 (ms 정밀도로 저장)
    std::uint64_t click_count{0};                        // 리다이렉트 성공 횟수
};

// ---------------------------------------------------------------------------
// ShortenResult
//   ShortenService::shorten 성공 결과.
//   short_url = base_url + "/" + short_code
// ---------------------------------------------------------------------------
struct ShortenResult {
    ShortUrlRecord record{};
    std::string    short_url{};
};

// ---------------------------------------------------------------------------
// ServiceErrorCode
//   코어 연산에서 발생 가능한 오류 분류.
//
//   kValidation / kNotFound         : 클라이언트 오류
//   kGenerationExhausted / kStore   : 서버 오류 (error 레벨 로깅 대상)
//   kDuplicateCode                  : ShortenService 재시도 루프 내부 전용.
//                                     호출자에게 절대 노출되지 않는다.
// ---------------------------------------------------------------------------
enum class ServiceErrorCode : std::uint8_t {
    kValidation          = 0,  // URL 누락/형식 오류
    kNotFound            = 1,  // 존재하지 않는 short_code
    kGenerationExhausted = 2,  // 재시도 한도 내에 유일 코드 확보 실패
    kDuplicateCode       = 3,  // insert 시 PK 충돌
    kStore               = 4,  // 저장소 I/O 실패
};

// ---------------------------------------------------------------------------
// ServiceError
//   std::expected<T, ServiceError> 패턴과 함께 사용한다.
// ---------------------------------------------------------------------------
struct ServiceError {
    ServiceErrorCode code{ServiceErrorCode::kStore};
    std::string      message{};  // 사람이 읽을 수 있는 오류 설명
    std::string      context{};  // 관련 입력 단편 (short_code 등, 로깅용)
};

// is_server_fault
//   kStore / kGenerationExhausted 이면 true.
[[nodiscard]] constexpr bool is_server_fault(ServiceErrorCode code) noexcept {
    return code == ServiceErrorCode::kStore ||
           code == ServiceErrorCode::kGenerationExhausted;
}

// to_string
//   로그/JSON 용 오류 코드 이름.
[[nodiscard]] constexpr std::string_view to_string(ServiceErrorCode code) noexcept {
    switch (code) {
        case ServiceErrorCode::kValidation:          return "validation";
        case ServiceErrorCode::kNotFound:            return "not_found";
        case ServiceErrorCode::kGenerationExhausted: return "generation_exhausted";
        case ServiceErrorCode::kDuplicateCode:       return "duplicate_code";
        case ServiceErrorCode::kStore:               return "store";
    }
    return "unknown";
}
