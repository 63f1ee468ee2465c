// common/utils/ids.cpp
#include "common/utils/ids.h"
#include <ctime>
#include <iomanip>
#include <random>
#include <sstream>

namespace agentkernel {

std::string generate_id(const std::string& prefix, int hex_digits) {
    thread_local std::mt19937_64 gen(std::random_device{}());
    std::uniform_int_distribution<int> dis(0, 15);

    std::ostringstream ss;
    if (!prefix.empty()) {
        ss << prefix << '-';
    }
    ss << std::hex;
    for (int i = 0; i < hex_digits; ++i) {
        ss << dis(gen);
    }
    return ss.str();
}

std::string to_rfc3339(std::chrono::system_clock::time_point tp) {
    auto secs = std::chrono::time_point_cast<std::chrono::seconds>(tp);
    auto millis = std::chrono::duration_cast<std::chrono::milliseconds>(tp - secs).count();
    std::time_t t = std::chrono::system_clock::to_time_t(secs);
    std::tm tm{};
    gmtime_r(&t, &tm);

    std::ostringstream ss;
    ss << std::put_time(&tm, "%Y-%m-%dT%H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << millis
       << 'Z';
    return ss.str();
}

std::string now_rfc3339() {
    return to_rfc3339(std::chrono::system_clock::now());
}

} // namespace agentkernel
