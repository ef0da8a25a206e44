/*
 * Version header for mcpgate
 *
 * The build system passes MCPGATE_VERSION_STRING from the project version; the
 * fallbacks keep the header usable when it is compiled outside that build.
 */

#pragma once

#ifndef MCPGATE_VERSION_STRING
#define MCPGATE_VERSION_STRING "0.0.0+dev"
#endif

#ifndef MCPGATE_BUILD_DATE
#define MCPGATE_BUILD_DATE __DATE__ " " __TIME__
#endif

#define MCPGATE_VERSION_LONG_STRING MCPGATE_VERSION_STRING " (built: " MCPGATE_BUILD_DATE ")"

namespace mcpgate::version {
constexpr const char* string_v = MCPGATE_VERSION_STRING;
constexpr const char* long_string_v = MCPGATE_VERSION_LONG_STRING;
} // namespace mcpgate::version
