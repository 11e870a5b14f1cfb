#include "common/time_util.hpp"

#include <ctime>
#include <iomanip>
#include <sstream>

std::string format_iso8601(const std::chrono::system_clock::time_point& tp) {
    const auto since_epoch = tp.time_since_epoch();
    auto       seconds     = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    auto       millis      = std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch) - seconds;

    // epoch 이전 시각: 음수 ms 를 이전 초로 내림
    if (millis.count() < 0) {
        millis  += std::chrono::seconds{1};
        seconds -= std::chrono::seconds{1};
    }

    const std::time_t time_t_val = static_cast<std::time_t>(seconds.count());
    std::tm           tm_val{};
    ::gmtime_r(&time_t_val, &tm_val);  // gmtime 은 스레드 안전하지 않다

    std::ostringstream oss;
    oss << std::put_time(&tm_val, "%Y-%m-%dT%H:%M:%S") << '.' << std::setfill('0') << std::setw(3)
        << millis.count() << 'Z';
    return oss.str();
}
