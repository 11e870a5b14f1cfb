#include "service/stats_service.hpp"

#include "core/url_validator.hpp"

StatsService::StatsService(std::shared_ptr<UrlStore> store)
    : store_{std::move(store)}
{}

std::expected<ShortUrlRecord, ServiceError>
StatsService::lookup(std::string_view short_code) const {
    if (!is_valid_short_code(short_code)) {
        return std::unexpected(ServiceError{
            .code    = ServiceErrorCode::kNotFound,
            .message = "invalid short code format",
            .context = std::string{short_code},
        });
    }
    return store_->get(short_code);
}

std::expected<std::size_t, ServiceError> StatsService::total_urls() const {
    return store_->count();
}
