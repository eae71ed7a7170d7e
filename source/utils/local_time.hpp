#ifndef TMCPS_LOCAL_TIME_HPP
#define TMCPS_LOCAL_TIME_HPP

// Local wall-clock formatting for the time tools.

#include <chrono>
#include <string>

namespace local_time {

// ISO-8601 local timestamp without zone: YYYY-MM-DDTHH:MM:SS, followed by
// .ffffff only when the microsecond part is non-zero.
std::string iso8601(std::chrono::system_clock::time_point time_point);

// strftime-style rendering of the local time (seconds resolution).
// Throws std::runtime_error if the pattern produces nothing.
std::string format(std::chrono::system_clock::time_point time_point, const char *pattern);

} // namespace local_time

#endif // TMCPS_LOCAL_TIME_HPP
