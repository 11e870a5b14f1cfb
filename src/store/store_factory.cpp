#include "store/store_factory.hpp"

#include "store/memory_url_store.hpp"
#include "store/sqlite_url_store.hpp"

#include <spdlog/spdlog.h>

#include <chrono>

std::expected<std::shared_ptr<UrlStore>, std::string>
make_url_store(const StoreConfig& config) {
    if (config.backend == "memory") {
        spdlog::info("[store] using in-memory backend (records are not persisted)");
        return std::make_shared<MemoryUrlStore>();
    }

    if (config.backend == "sqlite") {
        auto opened = SqliteUrlStore::open(
            config.path, std::chrono::milliseconds{config.busy_timeout_ms});
        if (!opened) {
            return std::unexpected(fmt::format("cannot open sqlite store '{}': {}",
                                               config.path, opened.error().message));
        }
        return std::shared_ptr<UrlStore>{std::move(*opened)};
    }

    return std::unexpected(fmt::format("unknown store backend '{}'", config.backend));
}
