#pragma once

#include <string>

namespace mcpbridge::core {

/**
 * Install the process-wide default logger: stderr colour sink, plus a rotating file sink
 * (10 MiB x 3) when logFile is non-empty. MCPBRIDGE_LOG_LEVEL overrides `level`.
 *
 * Throws spdlog::spdlog_ex when a sink cannot be created.
 */
void setupLogging(const std::string& name, const std::string& level,
                  const std::string& logFile = {});

// trace|debug|info|warn|error; anything else leaves the level unchanged
void applyLogLevel(const std::string& level);

} // namespace mcpbridge::core
