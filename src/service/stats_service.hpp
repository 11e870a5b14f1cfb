#pragma once

#include "common/types.hpp"
#include "store/url_store.hpp"

#include <cstddef>
#include <expected>
#include <memory>
#include <string_view>

// ---------------------------------------------------------------------------
// StatsService
//   short_code 의 현재 상태 조회 (읽기 전용, 부수효과 없음).
//   형식이 잘못된 코드는 저장소 조회 없이 kNotFound.
// ---------------------------------------------------------------------------
class StatsService {
public:
    explicit StatsService(std::shared_ptr<UrlStore> store);

    [[nodiscard]] std::expected<ShortUrlRecord, ServiceError>
    lookup(std::string_view short_code) const;

    // total_urls
    //   저장된 레코드 수 (/api/metrics 용)
    [[nodiscard]] std::expected<std::size_t, ServiceError> total_urls() const;

private:
    std::shared_ptr<UrlStore> store_;
};
