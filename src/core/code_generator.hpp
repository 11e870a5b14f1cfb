#pragma once

// ---------------------------------------------------------------------------
// code_generator.hpp
//
// 6자리 base62 short_code 후보 생성기.
//
// [설계 원칙]
// - 저장소를 조회하지 않는다. 유일성은 UrlStore::insert 가 보장하고,
//   충돌 시 ShortenService 가 새 후보를 요청한다.
// - 암호학적 난수가 필요하지 않다 (예측 불가성보다 분포 균등성이 중요).
// - generate() 는 virtual: 테스트에서 충돌 시나리오를 스크립트로 주입한다.
//
// [스레드 안전성]
// 하나의 인스턴스를 여러 요청이 공유하므로 엔진 접근은 mutex 로 직렬화한다.
// ---------------------------------------------------------------------------

#include "common/types.hpp"

#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <string_view>

class CodeGenerator {
public:
    static constexpr std::string_view kAlphabet =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789";
    static constexpr std::size_t kCodeLength = kShortCodeLength;

    // ShortenService 의 기본 재시도 한도
    static constexpr std::uint32_t kDefaultMaxAttempts = 10;

    // seed 미지정 시 std::random_device 로 시드한다.
    explicit CodeGenerator(std::optional<std::uint64_t> seed = std::nullopt);

    virtual ~CodeGenerator() = default;

    CodeGenerator(const CodeGenerator&)            = delete;
    CodeGenerator& operator=(const CodeGenerator&) = delete;
    CodeGenerator(CodeGenerator&&)                 = delete;
    CodeGenerator& operator=(CodeGenerator&&)      = delete;

    // generate
    //   kAlphabet 에서 균등 추출한 kCodeLength 자리 후보를 반환한다.
    [[nodiscard]] virtual std::string generate();

private:
    std::mutex                                 mutex_;
    std::mt19937_64                            engine_;
    std::uniform_int_distribution<std::size_t> dist_{0, kAlphabet.size() - 1};
};
