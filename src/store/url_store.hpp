#pragma once

// ---------------------------------------------------------------------------
// url_store.hpp
//
// short_code → ShortUrlRecord 영속 저장소 인터페이스.
//
// [원자성 요구사항 — 모든 구현체 공통]
// 1. insert: "존재 여부 확인"과 "생성"이 하나의 원자적 단계여야 한다.
//    같은 코드로 경쟁하는 두 호출 중 정확히 하나만 성공하고,
//    나머지는 kDuplicateCode 를 받는다. 실패 시 어떤 상태도 남기지 않는다.
// 2. get: 동시 쓰기의 이전 또는 이후 상태만 관찰한다 (부분 적용 상태 불가).
// 3. increment_click: 저장소 내부 fetch-and-add. N 개의 동시 호출 후
//    click_count 는 정확히 N 만큼 증가한다 (lost update 불가).
//
// [직렬화 지점]
// 모든 잠금/트랜잭션 규율은 구현체 내부에만 존재한다.
// 서비스 레이어는 별도 잠금을 두지 않으며, 레코드를 직접 수정하지 않는다.
//
// [삭제 경로 없음]
// 레코드는 생성 후 삭제/변경되지 않는다 (click_count 제외).
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <cstddef>
#include <expected>
#include <string_view>

class UrlStore {
public:
    virtual ~UrlStore() = default;

    // insert
    //   성공: 저장된 레코드 (입력과 동일)
    //   실패: kDuplicateCode | kStore
    [[nodiscard]] virtual std::expected<ShortUrlRecord, ServiceError>
    insert(const ShortUrlRecord& record) = 0;

    // get
    //   실패: kNotFound | kStore
    [[nodiscard]] virtual std::expected<ShortUrlRecord, ServiceError>
    get(std::string_view short_code) const = 0;

    // increment_click
    //   성공: click_count 증가가 반영된 레코드
    //   실패: kNotFound | kStore (카운트 변경 없음)
    [[nodiscard]] virtual std::expected<ShortUrlRecord, ServiceError>
    increment_click(std::string_view short_code) = 0;

    // count
    //   저장된 레코드 수.
    [[nodiscard]] virtual std::expected<std::size_t, ServiceError> count() const = 0;

protected:
    UrlStore() = default;

    UrlStore(const UrlStore&)            = delete;
    UrlStore& operator=(const UrlStore&) = delete;
    UrlStore(UrlStore&&)                 = delete;
    UrlStore& operator=(UrlStore&&)      = delete;
};
