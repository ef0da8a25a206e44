#pragma once

#include <cstdint>
#include <functional>
#include <mutex>
#include <set>
#include <mcpgate/core/types.h>

namespace mcpgate::proxy {

// Tracks a closed port range. allocate() returns the lowest port that is neither allocated
// here nor held by someone else (checked with a real bind on 127.0.0.1).
class PortAllocator {
public:
    using PortProbe = std::function<bool(std::uint16_t)>;

    PortAllocator(std::uint16_t rangeStart, std::uint16_t rangeEnd, PortProbe probe = {});

    Result<std::uint16_t> allocate();
    // Idempotent
    void release(std::uint16_t port);
    void clear();

    bool isAllocated(std::uint16_t port) const;
    std::size_t allocatedCount() const;
    std::uint16_t rangeStart() const { return start_; }
    std::uint16_t rangeEnd() const { return end_; }

    // Bind-and-release probe
    static bool isPortBindable(std::uint16_t port);

private:
    std::uint16_t start_;
    std::uint16_t end_;
    PortProbe probe_;
    mutable std::mutex mutex_;
    std::set<std::uint16_t> allocated_;
};

} // namespace mcpgate::proxy
