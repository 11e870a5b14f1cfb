#pragma once

// ---------------------------------------------------------------------------
// sqlite_url_store.hpp
//
// SQLite 기반 영속 UrlStore.
//
// [스키마]
//   CREATE TABLE urls (
//       short_code   TEXT    PRIMARY KEY,
//       original_url TEXT    NOT NULL,
//       created_at   INTEGER NOT NULL,          -- Unix epoch ms
//       click_count  INTEGER NOT NULL DEFAULT 0
//   )
//
// [원자성]
// - insert          : PRIMARY KEY 제약으로 insert-if-absent 를 엔진에 위임.
//                     SQLITE_CONSTRAINT_PRIMARYKEY → kDuplicateCode.
// - increment_click : "UPDATE ... SET click_count = click_count + 1 ... RETURNING"
//                     단일 문장으로 증가와 결과 조회를 수행 (SQLite >= 3.35).
// - 쓰기 연산은 내부 shared_mutex 의 unique_lock 으로 직렬화하고,
//   읽기 연산은 shared_lock 으로 서로 블로킹하지 않는다.
//
// [연결]
// 단일 연결, SQLITE_OPEN_FULLMUTEX. 오류 메시지는 스레드 간 덮어쓰기를
// 피하기 위해 sqlite3_errstr(rc) 를 사용한다.
// ---------------------------------------------------------------------------

#include "store/url_store.hpp"

#include <chrono>
#include <memory>
#include <shared_mutex>
#include <string>

struct sqlite3;

class SqliteUrlStore final : public UrlStore {
public:
    // open
    //   db_path 를 열고 스키마를 준비한다. ":memory:" 허용.
    //   실패: ServiceError{kStore}
    [[nodiscard]] static std::expected<std::unique_ptr<SqliteUrlStore>, ServiceError>
    open(const std::string& db_path, std::chrono::milliseconds busy_timeout);

    ~SqliteUrlStore() override;

    [[nodiscard]] std::expected<ShortUrlRecord, ServiceError>
    insert(const ShortUrlRecord& record) override;

    [[nodiscard]] std::expected<ShortUrlRecord, ServiceError>
    get(std::string_view short_code) const override;

    [[nodiscard]] std::expected<ShortUrlRecord, ServiceError>
    increment_click(std::string_view short_code) override;

    [[nodiscard]] std::expected<std::size_t, ServiceError> count() const override;

private:
    explicit SqliteUrlStore(sqlite3* db) noexcept;

    mutable std::shared_mutex mutex_;
    sqlite3*                  db_{nullptr};
};
