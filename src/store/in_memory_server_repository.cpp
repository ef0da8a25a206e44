#include <mcpgate/core/format.h>
#include <mcpgate/store/server_repository.h>

#include <algorithm>
#include <mutex>

namespace mcpgate::store {

Error InMemoryServerRepository::notFound(const ServerId& id) {
    return Error{ErrorCode::ServerNotFound, format("Server not found: {}", id)};
}

void InMemoryServerRepository::upsertServer(model::ServerDescriptor server) {
    std::unique_lock lock(mutex_);
    auto it = servers_.find(server.id);
    if (it != servers_.end()) {
        server.runtime = it->second.runtime;
        server.restartCount = it->second.restartCount;
        server.toolsDiscoveredAt = it->second.toolsDiscoveredAt;
        server.toolsCount = it->second.toolsCount;
        it->second = std::move(server);
        return;
    }
    order_.push_back(server.id);
    auto id = server.id;
    servers_.emplace(std::move(id), std::move(server));
}

bool InMemoryServerRepository::removeServer(const ServerId& id) {
    std::unique_lock lock(mutex_);
    tools_.erase(id);
    order_.erase(std::remove(order_.begin(), order_.end(), id), order_.end());
    return servers_.erase(id) > 0;
}

Result<model::ServerDescriptor> InMemoryServerRepository::getServer(const ServerId& id) const {
    std::shared_lock lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end())
        return notFound(id);
    return it->second;
}

std::vector<model::ServerDescriptor> InMemoryServerRepository::listServers() const {
    std::shared_lock lock(mutex_);
    std::vector<model::ServerDescriptor> out;
    out.reserve(order_.size());
    for (const auto& id : order_)
        out.push_back(servers_.at(id));
    return out;
}

std::vector<model::ServerDescriptor> InMemoryServerRepository::listEnabledServers() const {
    std::shared_lock lock(mutex_);
    std::vector<model::ServerDescriptor> out;
    for (const auto& id : order_) {
        const auto& s = servers_.at(id);
        if (s.enabled)
            out.push_back(s);
    }
    return out;
}

Result<void> InMemoryServerRepository::updateRuntimeInfo(const ServerId& id,
                                                         std::optional<int> pid,
                                                         std::optional<std::uint16_t> port,
                                                         model::RuntimeStatus status,
                                                         bool isActive) {
    std::unique_lock lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end())
        return notFound(id);
    it->second.runtime = model::RuntimeInfo{pid, port, status, isActive};
    return {};
}

Result<model::RuntimeInfo> InMemoryServerRepository::getRuntimeInfo(const ServerId& id) const {
    std::shared_lock lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end())
        return notFound(id);
    return it->second.runtime;
}

Result<int> InMemoryServerRepository::incrementRestartCount(const ServerId& id) {
    std::unique_lock lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end())
        return notFound(id);
    return ++it->second.restartCount;
}

Result<void> InMemoryServerRepository::clearToolsCache(const ServerId& id) {
    std::unique_lock lock(mutex_);
    if (!servers_.count(id))
        return notFound(id);
    tools_.erase(id);
    return {};
}

Result<void> InMemoryServerRepository::cacheTools(const ServerId& id,
                                                  const std::vector<model::ToolRecord>& tools) {
    std::unique_lock lock(mutex_);
    if (!servers_.count(id))
        return notFound(id);
    auto& cached = tools_[id];
    cached.insert(cached.end(), tools.begin(), tools.end());
    return {};
}

Result<std::vector<model::ToolRecord>>
InMemoryServerRepository::cachedTools(const ServerId& id) const {
    std::shared_lock lock(mutex_);
    if (!servers_.count(id))
        return notFound(id);
    auto it = tools_.find(id);
    if (it == tools_.end())
        return std::vector<model::ToolRecord>{};
    return it->second;
}

Result<void> InMemoryServerRepository::updateToolsDiscovered(const ServerId& id, int count,
                                                             TimePoint at) {
    std::unique_lock lock(mutex_);
    auto it = servers_.find(id);
    if (it == servers_.end())
        return notFound(id);
    it->second.toolsCount = count;
    it->second.toolsDiscoveredAt = at;
    return {};
}

} // namespace mcpgate::store
