#pragma once

// ---------------------------------------------------------------------------
// redirect_service.hpp
//
// short_code → original_url 해석 + 방문 기록.
//
// [순서 보장]
// increment_click 은 resolve() 반환 전에 완료된다 (fire-and-forget 금지).
// 형식이 잘못된 코드는 저장소 조회 없이 kNotFound 로 처리한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"
#include "store/url_store.hpp"

#include <expected>
#include <memory>
#include <string_view>

class RedirectService {
public:
    explicit RedirectService(std::shared_ptr<UrlStore> store);

    // resolve
    //   성공: 증가 반영된 레코드 (original_url 로 리다이렉트)
    //   실패: kNotFound | kStore
    [[nodiscard]] std::expected<ShortUrlRecord, ServiceError>
    resolve(std::string_view short_code) const;

private:
    std::shared_ptr<UrlStore> store_;
};
