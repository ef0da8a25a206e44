#pragma once

#include <chrono>
#include <cstdint>
#include <cstdio>
#include <random>
#include <string>

namespace mcpgate::core {

/**
 * Generate a prefixed ID: prefix-timestamp_ms-random6hex.
 * Used for event stream client ids on the bridge.
 */
inline std::string generateId(const std::string& prefix = "gw") {
    auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
                  std::chrono::system_clock::now().time_since_epoch())
                  .count();

    static thread_local std::mt19937_64 rng{std::random_device{}()};
    std::uniform_int_distribution<uint32_t> dist(0, 0xFFFFFF);
    uint32_t r = dist(rng);

    char buf[64];
    std::snprintf(buf, sizeof(buf), "%s-%lld-%06x", prefix.c_str(), static_cast<long long>(ms), r);
    return std::string(buf);
}

} // namespace mcpgate::core
