#include "service/redirect_service.hpp"

#include "core/url_validator.hpp"

RedirectService::RedirectService(std::shared_ptr<UrlStore> store)
    : store_{std::move(store)}
{}

std::expected<ShortUrlRecord, ServiceError>
RedirectService::resolve(std::string_view short_code) const {
    if (!is_valid_short_code(short_code)) {
        return std::unexpected(ServiceError{
            .code    = ServiceErrorCode::kNotFound,
            .message = "invalid short code format",
            .context = std::string{short_code},
        });
    }

    // increment_click 은 존재 확인과 증가를 한 번에 수행한다 (미존재 시 kNotFound).
    // 증가 후 레코드를 그대로 반환한다.
    return store_->increment_click(short_code);
}
