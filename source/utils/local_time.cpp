#include "utils/local_time.hpp"

#include <ctime>
#include <cstdio>
#include <stdexcept>

namespace local_time {

static std::tm to_local_tm(std::chrono::system_clock::time_point time_point) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(time_point);
    std::tm local_tm{};
    if (localtime_r(&seconds, &local_tm) == nullptr) {
        throw std::runtime_error("localtime_r failed");
    }
    return local_tm;
}

std::string iso8601(std::chrono::system_clock::time_point time_point) {
    std::string text = format(time_point, "%Y-%m-%dT%H:%M:%S");

    auto since_epoch = time_point.time_since_epoch();
    auto whole_seconds = std::chrono::duration_cast<std::chrono::seconds>(since_epoch);
    if (whole_seconds > since_epoch) {
        whole_seconds -= std::chrono::seconds(1); // pre-epoch: floor, not truncate
    }
    long long microseconds = std::chrono::duration_cast<std::chrono::microseconds>(since_epoch - whole_seconds).count();

    if (microseconds != 0) {
        char fraction[16];
        std::snprintf(fraction, sizeof(fraction), ".%06lld", microseconds);
        text += fraction;
    }
    return text;
}

std::string format(std::chrono::system_clock::time_point time_point, const char *pattern) {
    std::tm local_tm = to_local_tm(time_point);
    char buffer[128];
    std::size_t length = std::strftime(buffer, sizeof(buffer), pattern, &local_tm);
    if (length == 0) {
        throw std::runtime_error(std::string("strftime produced no output for pattern ") + pattern);
    }
    return std::string(buffer, length);
}

} // namespace local_time
