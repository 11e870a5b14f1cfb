#include "store/memory_url_store.hpp"

#include <mutex>

namespace {

[[nodiscard]] std::unexpected<ServiceError> not_found(std::string_view short_code) {
    return std::unexpected(ServiceError{
        .code    = ServiceErrorCode::kNotFound,
        .message = "short code not found",
        .context = std::string{short_code},
    });
}

}  // namespace

std::expected<ShortUrlRecord, ServiceError>
MemoryUrlStore::insert(const ShortUrlRecord& record) {
    std::unique_lock lock{mutex_};

    // 존재 확인 + 생성을 같은 임계 구역에서 수행
    const auto [it, inserted] = records_.try_emplace(record.short_code, record);
    if (!inserted) {
        return std::unexpected(ServiceError{
            .code    = ServiceErrorCode::kDuplicateCode,
            .message = "short code already exists",
            .context = record.short_code,
        });
    }
    return it->second;
}

std::expected<ShortUrlRecord, ServiceError>
MemoryUrlStore::get(std::string_view short_code) const {
    std::shared_lock lock{mutex_};

    const auto it = records_.find(std::string{short_code});
    if (it == records_.end()) {
        return not_found(short_code);
    }
    return it->second;
}

std::expected<ShortUrlRecord, ServiceError>
MemoryUrlStore::increment_click(std::string_view short_code) {
    std::unique_lock lock{mutex_};

    const auto it = records_.find(std::string{short_code});
    if (it == records_.end()) {
        return not_found(short_code);
    }
    ++it->second.click_count;
    return it->second;
}

std::expected<std::size_t, ServiceError> MemoryUrlStore::count() const {
    std::shared_lock lock{mutex_};
    return records_.size();
}
