#pragma once

// ---------------------------------------------------------------------------
// json_util.hpp
//
// 외부 JSON 라이브러리 없이 사용하는 최소 JSON 헬퍼.
//
// [범위]
// - json_escape        : 문자열 값 직렬화용 이스케이프 (따옴표 제외 내용만)
// - find_string_field  : 최상위 객체에서 문자열 필드 하나를 추출
//
// 응답 JSON 은 fmt::format 으로 직접 조립하고, 요청 JSON 은
// {"url": "..."} 형태의 단일 필드만 필요하므로 전체 DOM 파서를 두지 않는다.
//
// [알려진 한계]
// - 중첩 객체/배열은 구조 검증 후 건너뛸 뿐 값을 해석하지 않는다.
// - 숫자/리터럴 토큰은 문자 집합만 검사한다.
// - 중복 키는 첫 번째 값을 사용한다.
// ---------------------------------------------------------------------------

#include <expected>
#include <optional>
#include <string>
#include <string_view>

// json_escape
//   '"', '\\', 제어문자(< 0x20)를 JSON 이스케이프 시퀀스로 변환한다.
[[nodiscard]] std::string json_escape(std::string_view sv);

// find_string_field
//   json 이 최상위 객체일 때 key 에 해당하는 문자열 값을 반환한다.
//
//   value(std::nullopt) : 키 없음
//   value(string)       : 이스케이프 해제된 값 (\uXXXX → UTF-8)
//   unexpected(message) : JSON 형식 오류, 또는 키의 값이 문자열이 아님
[[nodiscard]] std::expected<std::optional<std::string>, std::string>
find_string_field(std::string_view json, std::string_view key);
