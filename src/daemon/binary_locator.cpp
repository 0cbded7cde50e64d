#include <mcpbridge/daemon/binary_locator.h>

#include <spdlog/spdlog.h>

#include <algorithm>

namespace mcpbridge::daemon {

namespace {

constexpr const char* kSystemPaths[] = {"/opt/homebrew/bin/mcpd", "/usr/local/bin/mcpd",
                                        "/usr/bin/mcpd"};

std::vector<std::string> splitPath(const std::string& path) {
    std::vector<std::string> out;
    size_t start = 0;
    while (start <= path.size()) {
        auto colon = path.find(':', start);
        if (colon == std::string::npos) {
            colon = path.size();
        }
        if (colon > start) {
            out.push_back(path.substr(start, colon - start));
        }
        start = colon + 1;
    }
    return out;
}

} // namespace

const char* bundledBinaryName() {
#if defined(_WIN32)
    return "mcpd.exe";
#elif defined(__APPLE__) && (defined(__aarch64__) || defined(__arm64__))
    return "mcpd-darwin-arm64";
#elif defined(__APPLE__)
    return "mcpd-darwin-x64";
#else
    return "mcpd-linux";
#endif
}

std::vector<std::filesystem::path> daemonBinaryCandidates(const config::SupervisorConfig& cfg) {
    std::vector<std::filesystem::path> out;
    if (cfg.bundledResourceDir) {
        out.push_back(*cfg.bundledResourceDir / "resources" / bundledBinaryName());
        out.push_back(*cfg.bundledResourceDir / bundledBinaryName());
    }
    for (const char* p : kSystemPaths) {
        out.emplace_back(p);
    }
    return out;
}

Result<std::filesystem::path> locateDaemonBinary(const config::SupervisorConfig& cfg,
                                                 const IProcessLauncher& launcher,
                                                 const std::string& searchPath) {
    if (cfg.binaryOverride) {
        if (launcher.isExecutable(*cfg.binaryOverride)) {
            return *cfg.binaryOverride;
        }
        return Error{ErrorCode::BinaryNotFound,
                     "mcpd binary not found at " + cfg.binaryOverride->string()};
    }

    for (const auto& candidate : daemonBinaryCandidates(cfg)) {
        if (launcher.isExecutable(candidate)) {
            spdlog::debug("Using mcpd binary at {}", candidate.string());
            return candidate;
        }
    }

    if (auto onPath = launcher.findInPath(kDaemonCommand, searchPath)) {
        spdlog::warn("mcpd not found in system paths or bundled, using {} from PATH",
                     onPath->string());
        return *onPath;
    }
    return Error{ErrorCode::BinaryNotFound,
                 "mcpd binary not found. Install it with: go install "
                 "github.com/mozilla-ai/mcpd@latest"};
}

std::string buildDaemonSearchPath(const std::string& inheritedPath,
                                  const std::optional<std::string>& home,
                                  const std::optional<std::filesystem::path>& nodeDir) {
    std::vector<std::string> entries = splitPath(inheritedPath);
    std::vector<std::string> extras = {"/usr/local/bin", "/opt/homebrew/bin", "/usr/bin", "/bin",
                                       "/usr/sbin",      "/sbin"};
    if (home) {
        extras.push_back(*home + "/.npm/bin");
        extras.push_back(*home + "/.local/bin");
    }
    extras.push_back("/usr/local/opt/node/bin");
    extras.push_back("/opt/homebrew/opt/node/bin");
    if (nodeDir && !nodeDir->empty()) {
        extras.push_back(nodeDir->string());
    }

    std::vector<std::string> unique;
    for (auto& e : entries) {
        if (std::find(unique.begin(), unique.end(), e) == unique.end()) {
            unique.push_back(std::move(e));
        }
    }
    for (auto& e : extras) {
        if (std::find(unique.begin(), unique.end(), e) == unique.end()) {
            unique.push_back(std::move(e));
        }
    }

    std::string out;
    for (const auto& e : unique) {
        if (!out.empty()) {
            out.push_back(':');
        }
        out += e;
    }
    return out;
}

std::string daemonNodePath() {
    return "/usr/local/lib/node_modules:/opt/homebrew/lib/node_modules";
}

} // namespace mcpbridge::daemon
