#pragma once

#include <chrono>
#include <string>

// ---------------------------------------------------------------------------
// format_iso8601
//   system_clock 시각 → "YYYY-MM-DDTHH:MM:SS.mmmZ" (UTC, ms 정밀도).
//   로그 타임스탬프와 /api/stats 응답의 created_at 에 공통 사용한다.
// ---------------------------------------------------------------------------
[[nodiscard]] std::string format_iso8601(const std::chrono::system_clock::time_point& tp);
