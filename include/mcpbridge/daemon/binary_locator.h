#pragma once

#include <mcpbridge/config/config.h>
#include <mcpbridge/core/types.h>
#include <mcpbridge/daemon/process_launcher.h>

#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace mcpbridge::daemon {

inline constexpr const char* kDaemonCommand = "mcpd";

// Packaged binary name for the platform this was built for
const char* bundledBinaryName();

// Explicit candidates in search order: bundled resources first, then system install paths
std::vector<std::filesystem::path> daemonBinaryCandidates(const config::SupervisorConfig& cfg);

/**
 * Resolve the daemon binary.
 *
 * An explicit binaryOverride must exist. Otherwise the first executable candidate wins,
 * and the bare command name is looked up on `searchPath` last.
 */
Result<std::filesystem::path> locateDaemonBinary(const config::SupervisorConfig& cfg,
                                                 const IProcessLauncher& launcher,
                                                 const std::string& searchPath);

/**
 * PATH handed to the daemon: the inherited entries followed by common tool install
 * locations (the daemon shells out to npx/uvx), de-duplicated in first-seen order.
 */
std::string buildDaemonSearchPath(const std::string& inheritedPath,
                                  const std::optional<std::string>& home,
                                  const std::optional<std::filesystem::path>& nodeDir);

// NODE_PATH handed to the daemon
std::string daemonNodePath();

} // namespace mcpbridge::daemon
