#pragma once

// ---------------------------------------------------------------------------
// memory_url_store.hpp
//
// 프로세스 메모리 기반 UrlStore. 재시작 시 데이터가 사라진다.
// 테스트 및 store.backend: memory 설정에서 사용한다.
//
// [잠금 규율]
// - get / count       : shared_lock (읽기끼리 블로킹 없음)
// - insert            : unique_lock + try_emplace (insert-if-absent)
// - increment_click   : unique_lock + ++click_count
// ---------------------------------------------------------------------------

#include "store/url_store.hpp"

#include <shared_mutex>
#include <string>
#include <unordered_map>

class MemoryUrlStore final : public UrlStore {
public:
    MemoryUrlStore()           = default;
    ~MemoryUrlStore() override = default;

    [[nodiscard]] std::expected<ShortUrlRecord, ServiceError>
    insert(const ShortUrlRecord& record) override;

    [[nodiscard]] std::expected<ShortUrlRecord, ServiceError>
    get(std::string_view short_code) const override;

    [[nodiscard]] std::expected<ShortUrlRecord, ServiceError>
    increment_click(std::string_view short_code) override;

    [[nodiscard]] std::expected<std::size_t, ServiceError> count() const override;

private:
    mutable std::shared_mutex                       mutex_;
    std::unordered_map<std::string, ShortUrlRecord> records_;
};
