#pragma once

// Formatting entry point shared by the library.
// Uses std::format when the toolchain provides it, falls back to the fmt bundled with spdlog.

#if MCPGATE_HAS_STD_FORMAT
#include <format>
namespace mcpgate {
using std::format;
using std::format_to;
} // namespace mcpgate
#else
#include <spdlog/fmt/fmt.h>

namespace mcpgate {
using fmt::format;
using fmt::format_to;
} // namespace mcpgate
#endif
