#include "service/shorten_service.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

ShortenService::ShortenService(std::shared_ptr<UrlStore>      store,
                               std::shared_ptr<CodeGenerator> generator,
                               UrlValidator                   validator,
                               ShortenOptions                 options)
    : store_{std::move(store)}
    , generator_{std::move(generator)}
    , validator_{validator}
    , options_{std::move(options)}
{
    while (!options_.base_url.empty() && options_.base_url.back() == '/') {
        options_.base_url.pop_back();
    }
    if (options_.max_attempts == 0) {
        options_.max_attempts = CodeGenerator::kDefaultMaxAttempts;
    }
}

std::expected<ShortenResult, ServiceError>
ShortenService::shorten(std::string_view raw_url) const {
    auto normalized = validator_.validate(raw_url);
    if (!normalized) {
        return std::unexpected(std::move(normalized.error()));
    }

    // created_at 은 요청 단위로 한 번만 정한다 (재시도 간 동일)
    const auto now = std::chrono::system_clock::now();

    for (std::uint32_t attempt = 1; attempt <= options_.max_attempts; ++attempt) {
        ShortUrlRecord candidate{
            .short_code   = generator_->generate(),
            .original_url = *normalized,
            .created_at   = now,
            .click_count  = 0,
        };

        auto inserted = store_->insert(candidate);
        if (inserted) {
            std::string short_url = options_.base_url + "/" + inserted->short_code;
            return ShortenResult{
                .record    = std::move(*inserted),
                .short_url = std::move(short_url),
            };
        }

        if (inserted.error().code != ServiceErrorCode::kDuplicateCode) {
            return std::unexpected(std::move(inserted.error()));
        }

        spdlog::debug("[shorten] collision on '{}' (attempt {}/{})",
                      candidate.short_code, attempt, options_.max_attempts);
    }

    return std::unexpected(ServiceError{
        .code    = ServiceErrorCode::kGenerationExhausted,
        .message = fmt::format("no unique short code after {} attempts",
                               options_.max_attempts),
        .context = *normalized,
    });
}
