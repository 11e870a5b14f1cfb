#pragma once

// ---------------------------------------------------------------------------
// shorten_service.hpp
//
// URL 단축: 검증 → 코드 생성 → UrlStore::insert 재시도 루프.
//
// [재시도 규칙]
// - kDuplicateCode 는 루프 내부에서만 처리하고 절대 호출자에게 노출하지 않는다.
// - 최대 max_attempts 회. 소진 시 kGenerationExhausted (레코드 생성 없음).
// - kValidation / kStore 는 그대로 전파한다.
//
// [멱등성 없음]
// 같은 URL 을 두 번 단축하면 서로 다른 코드의 레코드 두 개가 생성된다.
// 의도된 단순화이며, 멱등 단축이 필요하면 별도 확장으로 다룬다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "core/code_generator.hpp"
#include "core/url_validator.hpp"
#include "store/url_store.hpp"

#include <cstdint>
#include <expected>
#include <memory>
#include <string>
#include <string_view>

// ---------------------------------------------------------------------------
// ShortenOptions
//   base_url     : short_url 조립용 prefix. 끝의 '/' 는 생성자에서 제거한다.
//   max_attempts : 충돌 재시도 한도 (0 이면 kDefaultMaxAttempts 사용)
// ---------------------------------------------------------------------------
struct ShortenOptions {
    std::string   base_url{"http://localhost:5000"};
    std::uint32_t max_attempts{CodeGenerator::kDefaultMaxAttempts};
};

class ShortenService {
public:
    ShortenService(std::shared_ptr<UrlStore>      store,
                   std::shared_ptr<CodeGenerator> generator,
                   UrlValidator                   validator,
                   ShortenOptions                 options);

    ~ShortenService() = default;

    ShortenService(const ShortenService&)            = delete;
    ShortenService& operator=(const ShortenService&) = delete;

    // shorten
    //   성공: {record, short_url}
    //   실패: kValidation | kGenerationExhausted | kStore
    [[nodiscard]] std::expected<ShortenResult, ServiceError>
    shorten(std::string_view raw_url) const;

    [[nodiscard]] const std::string& base_url() const noexcept { return options_.base_url; }

private:
    std::shared_ptr<UrlStore>      store_;
    std::shared_ptr<CodeGenerator> generator_;
    UrlValidator                   validator_;
    ShortenOptions                 options_;
};
