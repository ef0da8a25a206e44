#include <mcpgate/core/format.h>
#include <mcpgate/proxy/port_allocator.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <spdlog/spdlog.h>

namespace mcpgate::proxy {

PortAllocator::PortAllocator(std::uint16_t rangeStart, std::uint16_t rangeEnd, PortProbe probe)
    : start_(rangeStart), end_(rangeEnd), probe_(std::move(probe)) {
    if (!probe_)
        probe_ = &PortAllocator::isPortBindable;
}

bool PortAllocator::isPortBindable(std::uint16_t port) {
    boost::asio::io_context ctx;
    boost::asio::ip::tcp::acceptor acceptor(ctx);
    boost::system::error_code ec;
    const boost::asio::ip::tcp::endpoint ep(boost::asio::ip::make_address_v4("127.0.0.1"), port);
    acceptor.open(ep.protocol(), ec);
    if (ec)
        return false;
    acceptor.set_option(boost::asio::socket_base::reuse_address(true), ec);
    acceptor.bind(ep, ec);
    if (ec)
        return false;
    acceptor.close(ec);
    return true;
}

Result<std::uint16_t> PortAllocator::allocate() {
    std::lock_guard<std::mutex> lk(mutex_);
    for (std::uint32_t p = start_; p <= end_; ++p) {
        const auto port = static_cast<std::uint16_t>(p);
        if (allocated_.count(port))
            continue;
        if (!probe_(port)) {
            spdlog::debug("[PortAllocator] port {} is held outside the allocator", port);
            continue;
        }
        allocated_.insert(port);
        return port;
    }
    return Error{ErrorCode::NoAvailablePorts,
                 format("No available ports in range {}-{}", start_, end_)};
}

void PortAllocator::release(std::uint16_t port) {
    std::lock_guard<std::mutex> lk(mutex_);
    allocated_.erase(port);
}

void PortAllocator::clear() {
    std::lock_guard<std::mutex> lk(mutex_);
    allocated_.clear();
}

bool PortAllocator::isAllocated(std::uint16_t port) const {
    std::lock_guard<std::mutex> lk(mutex_);
    return allocated_.count(port) > 0;
}

std::size_t PortAllocator::allocatedCount() const {
    std::lock_guard<std::mutex> lk(mutex_);
    return allocated_.size();
}

} // namespace mcpgate::proxy
