// ---------------------------------------------------------------------------
// test_memory_url_store.cpp
//
// MemoryUrlStore 단위 테스트.
//
// [테스트 범위]
// - insert / get / increment_click / count 기본 동작
// - 중복 코드 insert → kDuplicateCode, 기존 레코드 불변
// - 미존재 코드 → kNotFound, 레코드 생성 없음
// - 동시 insert 경쟁: 같은 코드에 대해 정확히 한 스레드만 성공
// - 동시 increment: 100 스레드 × 1 회 → click_count == 100 (lost update 없음)
// ---------------------------------------------------------------------------

#include "store/memory_url_store.hpp"

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace {

ShortUrlRecord make_record(std::string code, std::string url) {
    return ShortUrlRecord{
        .short_code   = std::move(code),
        .original_url = std::move(url),
        .created_at   = std::chrono::system_clock::now(),
        .click_count  = 0,
    };
}

}  // namespace

TEST(MemoryUrlStore, InsertThenGet) {
    MemoryUrlStore store;

    auto inserted = store.insert(make_record("Ab3Xy9", "https://example.com/page"));
    ASSERT_TRUE(inserted.has_value());
    EXPECT_EQ(inserted->short_code, "Ab3Xy9");
    EXPECT_EQ(inserted->click_count, 0U);

    auto found = store.get("Ab3Xy9");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->original_url, "https://example.com/page");
    EXPECT_EQ(found->created_at, inserted->created_at);
}

TEST(MemoryUrlStore, DuplicateInsertKeepsOriginal) {
    MemoryUrlStore store;
    ASSERT_TRUE(store.insert(make_record("Ab3Xy9", "https://first.example.com")).has_value());

    auto dup = store.insert(make_record("Ab3Xy9", "https://second.example.com"));
    ASSERT_FALSE(dup.has_value());
    EXPECT_EQ(dup.error().code, ServiceErrorCode::kDuplicateCode);

    auto found = store.get("Ab3Xy9");
    ASSERT_TRUE(found.has_value());
    EXPECT_EQ(found->original_url, "https://first.example.com");
    EXPECT_EQ(*store.count(), 1U);
}

TEST(MemoryUrlStore, MissingCodeIsNotFound) {
    MemoryUrlStore store;

    auto got = store.get("zzzzzz");
    ASSERT_FALSE(got.has_value());
    EXPECT_EQ(got.error().code, ServiceErrorCode::kNotFound);
    EXPECT_EQ(got.error().context, "zzzzzz");

    auto inc = store.increment_click("zzzzzz");
    ASSERT_FALSE(inc.has_value());
    EXPECT_EQ(inc.error().code, ServiceErrorCode::kNotFound);

    // 증가 시도가 레코드를 만들지 않는다
    EXPECT_EQ(*store.count(), 0U);
}

TEST(MemoryUrlStore, IncrementReturnsUpdatedRecord) {
    MemoryUrlStore store;
    ASSERT_TRUE(store.insert(make_record("Ab3Xy9", "https://example.com")).has_value());

    for (std::uint64_t expected = 1; expected <= 3; ++expected) {
        auto inc = store.increment_click("Ab3Xy9");
        ASSERT_TRUE(inc.has_value());
        EXPECT_EQ(inc->click_count, expected);
    }
    EXPECT_EQ(store.get("Ab3Xy9")->click_count, 3U);
}

TEST(MemoryUrlStore, CountTracksInserts) {
    MemoryUrlStore store;
    EXPECT_EQ(*store.count(), 0U);
    ASSERT_TRUE(store.insert(make_record("AAAAAA", "https://a.example.com")).has_value());
    ASSERT_TRUE(store.insert(make_record("BBBBBB", "https://b.example.com")).has_value());
    EXPECT_EQ(*store.count(), 2U);
}

// ---------------------------------------------------------------------------
// 동시성
// ---------------------------------------------------------------------------
TEST(MemoryUrlStore, ConcurrentInsertSameCodeHasOneWinner) {
    MemoryUrlStore store;

    constexpr int kThreads = 32;
    std::atomic<int> winners{0};
    std::atomic<int> duplicates{0};
    std::atomic<bool> go{false};

    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&, i]() {
            while (!go.load()) {
                std::this_thread::yield();
            }
            auto r = store.insert(make_record("Ab3Xy9", "https://example.com/" + std::to_string(i)));
            if (r) {
                winners.fetch_add(1);
            } else if (r.error().code == ServiceErrorCode::kDuplicateCode) {
                duplicates.fetch_add(1);
            }
        });
    }
    go.store(true);
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(winners.load(), 1);
    EXPECT_EQ(duplicates.load(), kThreads - 1);
    EXPECT_EQ(*store.count(), 1U);
}

TEST(MemoryUrlStore, ConcurrentIncrementsAreNotLost) {
    MemoryUrlStore store;
    ASSERT_TRUE(store.insert(make_record("Ab3Xy9", "https://example.com")).has_value());

    constexpr int kThreads = 100;
    std::vector<std::thread> threads;
    for (int i = 0; i < kThreads; ++i) {
        threads.emplace_back([&store]() {
            EXPECT_TRUE(store.increment_click("Ab3Xy9").has_value());
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    EXPECT_EQ(store.get("Ab3Xy9")->click_count, static_cast<std::uint64_t>(kThreads));
}
