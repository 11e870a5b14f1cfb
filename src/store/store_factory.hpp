#pragma once

#include "config/server_config.hpp"
#include "store/url_store.hpp"

#include <expected>
#include <memory>
#include <string>

// ---------------------------------------------------------------------------
// make_url_store
//   StoreConfig.backend 에 따라 UrlStore 구현체를 생성한다.
//   "memory" → MemoryUrlStore
//   "sqlite" → SqliteUrlStore::open(path, busy_timeout_ms)
//   알 수 없는 backend 또는 open 실패 시 std::unexpected(error_message).
//
//   반환된 store 는 ShortenerServer 가 한 번만 생성하고 모든 서비스에 주입한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::expected<std::shared_ptr<UrlStore>, std::string>
make_url_store(const StoreConfig& config);
