#pragma once

#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>
#include <mcpgate/core/types.h>
#include <mcpgate/model/server.h>
#include <mcpgate/model/tool.h>

namespace mcpgate::store {

// Data-access seam for server descriptors, runtime records and the tool cache.
class IServerRepository {
public:
    virtual ~IServerRepository() = default;

    virtual Result<model::ServerDescriptor> getServer(const ServerId& id) const = 0;
    virtual std::vector<model::ServerDescriptor> listServers() const = 0;
    virtual std::vector<model::ServerDescriptor> listEnabledServers() const = 0;

    virtual Result<void> updateRuntimeInfo(const ServerId& id, std::optional<int> pid,
                                           std::optional<std::uint16_t> port,
                                           model::RuntimeStatus status, bool isActive) = 0;
    virtual Result<model::RuntimeInfo> getRuntimeInfo(const ServerId& id) const = 0;
    virtual Result<int> incrementRestartCount(const ServerId& id) = 0;

    virtual Result<void> clearToolsCache(const ServerId& id) = 0;
    virtual Result<void> cacheTools(const ServerId& id,
                                    const std::vector<model::ToolRecord>& tools) = 0;
    virtual Result<std::vector<model::ToolRecord>> cachedTools(const ServerId& id) const = 0;
    virtual Result<void> updateToolsDiscovered(const ServerId& id, int count, TimePoint at) = 0;
};

class InMemoryServerRepository : public IServerRepository {
public:
    InMemoryServerRepository() = default;

    // Inserts or replaces the descriptor (runtime info and tool cache are kept on replace)
    void upsertServer(model::ServerDescriptor server);
    bool removeServer(const ServerId& id);

    Result<model::ServerDescriptor> getServer(const ServerId& id) const override;
    std::vector<model::ServerDescriptor> listServers() const override;
    std::vector<model::ServerDescriptor> listEnabledServers() const override;

    Result<void> updateRuntimeInfo(const ServerId& id, std::optional<int> pid,
                                   std::optional<std::uint16_t> port, model::RuntimeStatus status,
                                   bool isActive) override;
    Result<model::RuntimeInfo> getRuntimeInfo(const ServerId& id) const override;
    Result<int> incrementRestartCount(const ServerId& id) override;

    Result<void> clearToolsCache(const ServerId& id) override;
    Result<void> cacheTools(const ServerId& id,
                            const std::vector<model::ToolRecord>& tools) override;
    Result<std::vector<model::ToolRecord>> cachedTools(const ServerId& id) const override;
    Result<void> updateToolsDiscovered(const ServerId& id, int count, TimePoint at) override;

private:
    static Error notFound(const ServerId& id);

    mutable std::shared_mutex mutex_;
    std::unordered_map<ServerId, model::ServerDescriptor> servers_;
    std::unordered_map<ServerId, std::vector<model::ToolRecord>> tools_;
    // Insertion order for stable listings
    std::vector<ServerId> order_;
};

} // namespace mcpgate::store
