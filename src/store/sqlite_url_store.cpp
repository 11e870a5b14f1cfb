// ---------------------------------------------------------------------------
// sqlite_url_store.cpp
//
// SqliteUrlStore 구현.
//
// [Statement 수명]
// 호출마다 prepare → bind → step → finalize 한다. finalize 는 unique_ptr
// deleter(StmtPtr)로 보장한다. 공유 캐시 statement 를 두지 않으므로
// 읽기 경로가 shared_lock 만으로 동시에 실행될 수 있다.
// ---------------------------------------------------------------------------

#include "store/sqlite_url_store.hpp"

#include <sqlite3.h>

#include <spdlog/spdlog.h>

#include <mutex>

namespace {

constexpr const char* kCreateTableSql =
    "CREATE TABLE IF NOT EXISTS urls ("
    "  short_code   TEXT    PRIMARY KEY,"
    "  original_url TEXT    NOT NULL,"
    "  created_at   INTEGER NOT NULL,"
    "  click_count  INTEGER NOT NULL DEFAULT 0"
    ")";

constexpr const char* kInsertSql =
    "INSERT INTO urls (short_code, original_url, created_at, click_count) "
    "VALUES (?1, ?2, ?3, ?4)";

constexpr const char* kSelectSql =
    "SELECT short_code, original_url, created_at, click_count "
    "FROM urls WHERE short_code = ?1";

constexpr const char* kIncrementSql =
    "UPDATE urls SET click_count = click_count + 1 WHERE short_code = ?1 "
    "RETURNING short_code, original_url, created_at, click_count";

constexpr const char* kCountSql = "SELECT COUNT(*) FROM urls";

struct StmtDeleter {
    void operator()(sqlite3_stmt* stmt) const noexcept { sqlite3_finalize(stmt); }
};
using StmtPtr = std::unique_ptr<sqlite3_stmt, StmtDeleter>;

[[nodiscard]] ServiceError store_error(std::string_view op, int rc,
                                       std::string_view context = {}) {
    ServiceError err{
        .code    = ServiceErrorCode::kStore,
        .message = fmt::format("sqlite {} failed: {}", op, sqlite3_errstr(rc)),
        .context = std::string{context},
    };
    spdlog::error("[sqlite_store] {} (rc={})", err.message, rc);
    return err;
}

[[nodiscard]] std::expected<StmtPtr, ServiceError>
prepare(sqlite3* db, const char* sql) {
    sqlite3_stmt* raw = nullptr;
    const int rc = sqlite3_prepare_v2(db, sql, -1, &raw, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_finalize(raw);
        return std::unexpected(store_error("prepare", rc));
    }
    return StmtPtr{raw};
}

[[nodiscard]] int bind_text(sqlite3_stmt* stmt, int index, std::string_view value) {
    return sqlite3_bind_text(stmt, index, value.data(), static_cast<int>(value.size()),
                             SQLITE_TRANSIENT);
}

[[nodiscard]] std::int64_t to_epoch_ms(std::chrono::system_clock::time_point tp) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(tp.time_since_epoch()).count();
}

[[nodiscard]] std::string column_string(sqlite3_stmt* stmt, int col) {
    const auto* text  = sqlite3_column_text(stmt, col);
    const int   bytes = sqlite3_column_bytes(stmt, col);
    if (text == nullptr) {
        return {};
    }
    return std::string{reinterpret_cast<const char*>(text), static_cast<std::size_t>(bytes)};
}

// 현재 행 → ShortUrlRecord (컬럼 순서: short_code, original_url, created_at, click_count)
[[nodiscard]] ShortUrlRecord read_record(sqlite3_stmt* stmt) {
    ShortUrlRecord rec;
    rec.short_code   = column_string(stmt, 0);
    rec.original_url = column_string(stmt, 1);
    rec.created_at   = std::chrono::system_clock::time_point{
        std::chrono::milliseconds{sqlite3_column_int64(stmt, 2)}};
    rec.click_count  = static_cast<std::uint64_t>(sqlite3_column_int64(stmt, 3));
    return rec;
}

[[nodiscard]] std::unexpected<ServiceError> not_found(std::string_view short_code) {
    return std::unexpected(ServiceError{
        .code    = ServiceErrorCode::kNotFound,
        .message = "short code not found",
        .context = std::string{short_code},
    });
}

}  // namespace

// ---------------------------------------------------------------------------
// open
// ---------------------------------------------------------------------------
std::expected<std::unique_ptr<SqliteUrlStore>, ServiceError>
SqliteUrlStore::open(const std::string& db_path, std::chrono::milliseconds busy_timeout) {
    sqlite3*  db    = nullptr;
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;

    int rc = sqlite3_open_v2(db_path.c_str(), &db, flags, nullptr);
    if (rc != SQLITE_OK) {
        sqlite3_close(db);  // 실패해도 핸들이 할당될 수 있다
        return std::unexpected(store_error("open", rc, db_path));
    }

    // 이 시점부터 db 소유권은 store 에 있다 (소멸자에서 close)
    std::unique_ptr<SqliteUrlStore> store{new SqliteUrlStore(db)};

    sqlite3_extended_result_codes(db, 1);

    rc = sqlite3_busy_timeout(db, static_cast<int>(busy_timeout.count()));
    if (rc != SQLITE_OK) {
        return std::unexpected(store_error("busy_timeout", rc, db_path));
    }

    char* err_msg = nullptr;
    rc = sqlite3_exec(db, kCreateTableSql, nullptr, nullptr, &err_msg);
    if (rc != SQLITE_OK) {
        spdlog::error("[sqlite_store] schema init error: {}",
                      err_msg != nullptr ? err_msg : "unknown");
        sqlite3_free(err_msg);
        return std::unexpected(store_error("create table", rc, db_path));
    }

    // increment_click 의 UPDATE ... RETURNING 은 SQLite 3.35 이상이 필요하다.
    // 지원하지 않는 엔진이면 첫 리다이렉트가 아니라 기동 시점에 실패시킨다.
    for (const char* sql : {kInsertSql, kSelectSql, kIncrementSql, kCountSql}) {
        auto stmt = prepare(db, sql);
        if (!stmt) {
            spdlog::error("[sqlite_store] statement check failed (sqlite {}): {}",
                          sqlite3_libversion(), stmt.error().message);
            return std::unexpected(stmt.error());
        }
    }

    // WAL 은 파일 DB 에서만 의미가 있다. 실패해도 동작에는 지장이 없으므로 경고만 남긴다.
    if (db_path != ":memory:") {
        rc = sqlite3_exec(db, "PRAGMA journal_mode=WAL", nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            spdlog::warn("[sqlite_store] journal_mode=WAL not applied: {}",
                         err_msg != nullptr ? err_msg : sqlite3_errstr(rc));
            sqlite3_free(err_msg);
        }
    }

    spdlog::info("[sqlite_store] opened '{}'", db_path);
    return store;
}

SqliteUrlStore::SqliteUrlStore(sqlite3* db) noexcept
    : db_{db}
{}

SqliteUrlStore::~SqliteUrlStore() {
    if (db_ != nullptr) {
        const int rc = sqlite3_close(db_);
        if (rc != SQLITE_OK) {
            spdlog::warn("[sqlite_store] close error: {}", sqlite3_errstr(rc));
        }
    }
}

// ---------------------------------------------------------------------------
// insert
// ---------------------------------------------------------------------------
std::expected<ShortUrlRecord, ServiceError>
SqliteUrlStore::insert(const ShortUrlRecord& record) {
    std::unique_lock lock{mutex_};

    auto stmt = prepare(db_, kInsertSql);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }

    sqlite3_stmt* s = stmt->get();
    int rc = bind_text(s, 1, record.short_code);
    if (rc == SQLITE_OK) { rc = bind_text(s, 2, record.original_url); }
    if (rc == SQLITE_OK) { rc = sqlite3_bind_int64(s, 3, to_epoch_ms(record.created_at)); }
    if (rc == SQLITE_OK) {
        rc = sqlite3_bind_int64(s, 4, static_cast<sqlite3_int64>(record.click_count));
    }
    if (rc != SQLITE_OK) {
        return std::unexpected(store_error("bind", rc, record.short_code));
    }

    rc = sqlite3_step(s);
    if (rc == SQLITE_CONSTRAINT_PRIMARYKEY) {
        return std::unexpected(ServiceError{
            .code    = ServiceErrorCode::kDuplicateCode,
            .message = "short code already exists",
            .context = record.short_code,
        });
    }
    if (rc != SQLITE_DONE) {
        return std::unexpected(store_error("insert", rc, record.short_code));
    }

    // 저장 정밀도(ms)에 맞춘 값을 반환해 이후 get() 결과와 일치시킨다
    ShortUrlRecord stored = record;
    stored.created_at = std::chrono::system_clock::time_point{
        std::chrono::milliseconds{to_epoch_ms(record.created_at)}};
    return stored;
}

// ---------------------------------------------------------------------------
// get
// ---------------------------------------------------------------------------
std::expected<ShortUrlRecord, ServiceError>
SqliteUrlStore::get(std::string_view short_code) const {
    std::shared_lock lock{mutex_};

    auto stmt = prepare(db_, kSelectSql);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }

    int rc = bind_text(stmt->get(), 1, short_code);
    if (rc != SQLITE_OK) {
        return std::unexpected(store_error("bind", rc, short_code));
    }

    rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_ROW) {
        return read_record(stmt->get());
    }
    if (rc == SQLITE_DONE) {
        return not_found(short_code);
    }
    return std::unexpected(store_error("select", rc, short_code));
}

// ---------------------------------------------------------------------------
// increment_click
//   UPDATE ... RETURNING 단일 문장. 행이 없으면 kNotFound.
// ---------------------------------------------------------------------------
std::expected<ShortUrlRecord, ServiceError>
SqliteUrlStore::increment_click(std::string_view short_code) {
    std::unique_lock lock{mutex_};

    auto stmt = prepare(db_, kIncrementSql);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }

    int rc = bind_text(stmt->get(), 1, short_code);
    if (rc != SQLITE_OK) {
        return std::unexpected(store_error("bind", rc, short_code));
    }

    rc = sqlite3_step(stmt->get());
    if (rc == SQLITE_DONE) {
        return not_found(short_code);
    }
    if (rc != SQLITE_ROW) {
        return std::unexpected(store_error("update", rc, short_code));
    }

    ShortUrlRecord updated = read_record(stmt->get());

    // 문장을 끝까지 실행해야 auto-commit 이 확정된다
    rc = sqlite3_step(stmt->get());
    if (rc != SQLITE_DONE) {
        return std::unexpected(store_error("update", rc, short_code));
    }
    return updated;
}

// ---------------------------------------------------------------------------
// count
// ---------------------------------------------------------------------------
std::expected<std::size_t, ServiceError> SqliteUrlStore::count() const {
    std::shared_lock lock{mutex_};

    auto stmt = prepare(db_, kCountSql);
    if (!stmt) {
        return std::unexpected(stmt.error());
    }

    const int rc = sqlite3_step(stmt->get());
    if (rc != SQLITE_ROW) {
        return std::unexpected(store_error("count", rc));
    }
    return static_cast<std::size_t>(sqlite3_column_int64(stmt->get(), 0));
}
