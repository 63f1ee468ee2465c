#ifndef AGENTKERNEL_COMMON_UTILS_IDS_H
#define AGENTKERNEL_COMMON_UTILS_IDS_H

#include <chrono>
#include <string>

namespace agentkernel {

// Random hex id, "<prefix>-" + `hex_digits` digits (e.g. "run-3fa9c01e...")
std::string generate_id(const std::string& prefix, int hex_digits = 16);

// UTC, millisecond precision: 2024-01-01T12:00:00.000Z
std::string to_rfc3339(std::chrono::system_clock::time_point tp);
std::string now_rfc3339();

} // namespace agentkernel

#endif // AGENTKERNEL_COMMON_UTILS_IDS_H
