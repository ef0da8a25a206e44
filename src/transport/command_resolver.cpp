#include <mcpgate/transport/command_resolver.h>

#include <initializer_list>
#include <sstream>

#include <unistd.h>

namespace mcpgate::transport {

std::vector<std::string> CommandResolver::splitCommandLine(const std::string& command) {
    std::vector<std::string> parts;
    std::istringstream in(command);
    std::string token;
    while (in >> token)
        parts.push_back(token);
    return parts;
}

std::string CommandResolver::bundled(const char* name) const {
    if (binDir_.empty())
        return {};
    auto candidate = binDir_ / name;
    if (::access(candidate.c_str(), X_OK) == 0)
        return candidate.string();
    return {};
}

ResolvedCommand CommandResolver::resolve(const std::string& command,
                                         const std::vector<std::string>& args) const {
    std::string program = command;
    std::vector<std::string> rest = args;
    if (args.empty() && command.find_first_of(" \t") != std::string::npos) {
        auto parts = splitCommandLine(command);
        if (!parts.empty()) {
            program = parts.front();
            rest.assign(parts.begin() + 1, parts.end());
        }
    }

    auto withPrefix = [&](std::string runtime, std::initializer_list<const char*> prefix) {
        ResolvedCommand out{std::move(runtime), {}};
        for (const char* p : prefix)
            out.args.emplace_back(p);
        out.args.insert(out.args.end(), rest.begin(), rest.end());
        return out;
    };

    if (program == "npx") {
        if (auto bun = bundled("bun"); !bun.empty())
            return withPrefix(bun, {"x"});
    } else if (program == "node" || program == "npm") {
        if (auto bun = bundled("bun"); !bun.empty())
            return withPrefix(bun, {});
    } else if (program == "pip" || program == "pip3") {
        if (auto uv = bundled("uv"); !uv.empty())
            return withPrefix(uv, {"pip"});
    } else if (program == "uvx") {
        if (auto uv = bundled("uv"); !uv.empty())
            return withPrefix(uv, {"tool", "run"});
    } else if (program == "python" || program == "python3") {
        if (auto uv = bundled("uv"); !uv.empty())
            return withPrefix(uv, {"run", "python"});
    }
    return ResolvedCommand{program, rest};
}

} // namespace mcpgate::transport
