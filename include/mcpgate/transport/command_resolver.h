#pragma once

#include <filesystem>
#include <string>
#include <vector>

namespace mcpgate::transport {

struct ResolvedCommand {
    std::string program;
    std::vector<std::string> args;
};

/**
 * Maps logical runtime commands onto the bundled runtimes in `runtimeBinDir`:
 *   npx        -> bun x
 *   node, npm  -> bun
 *   pip, pip3  -> uv pip
 *   uvx        -> uv tool run
 *   python[3]  -> uv run python
 * A mapping applies only when the bundled executable exists; anything else passes through.
 * A command with embedded spaces and no separate args ("npx server.js") is split on
 * whitespace first.
 */
class CommandResolver {
public:
    explicit CommandResolver(std::filesystem::path runtimeBinDir)
        : binDir_(std::move(runtimeBinDir)) {}

    ResolvedCommand resolve(const std::string& command, const std::vector<std::string>& args) const;

    static std::vector<std::string> splitCommandLine(const std::string& command);

private:
    // Full path of a bundled runtime, or empty when it is not installed
    std::string bundled(const char* name) const;

    std::filesystem::path binDir_;
};

} // namespace mcpgate::transport
