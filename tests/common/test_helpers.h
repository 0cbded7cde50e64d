// Small helpers shared by the unit tests
#pragma once

#include <unistd.h>

#include <chrono>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <optional>
#include <string>

namespace mcpbridge::test {

inline std::filesystem::path make_temp_dir(const std::string& prefix = "mcpbridge_test_") {
    auto base = std::filesystem::temp_directory_path();
    auto stamp = std::chrono::steady_clock::now().time_since_epoch().count();
    for (int i = 0; i < 1000; ++i) {
        auto p = base / (prefix + std::to_string(::getpid()) + "_" + std::to_string(stamp) + "_" +
                         std::to_string(i));
        if (std::filesystem::create_directories(p))
            return p;
    }
    return base;
}

inline std::filesystem::path write_file(const std::filesystem::path& p, const std::string& data) {
    std::filesystem::create_directories(p.parent_path());
    std::ofstream ofs(p, std::ios::binary);
    ofs << data;
    return p;
}

inline std::string read_file(const std::filesystem::path& p) {
    std::ifstream in(p, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

// Removes the directory tree on scope exit
struct TempDir {
    std::filesystem::path path = make_temp_dir();

    TempDir() = default;
    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path, ec);
    }
    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;
};

// Sets (or unsets, with nullopt) an environment variable and restores it on scope exit
struct EnvGuard {
    std::string name;
    std::optional<std::string> savedValue;

    EnvGuard(std::string envName, std::optional<std::string> newValue) : name(std::move(envName)) {
        if (const char* orig = std::getenv(name.c_str())) {
            savedValue = orig;
        }
        if (newValue) {
            ::setenv(name.c_str(), newValue->c_str(), 1);
        } else {
            ::unsetenv(name.c_str());
        }
    }

    ~EnvGuard() {
        if (savedValue) {
            ::setenv(name.c_str(), savedValue->c_str(), 1);
        } else {
            ::unsetenv(name.c_str());
        }
    }

    EnvGuard(const EnvGuard&) = delete;
    EnvGuard& operator=(const EnvGuard&) = delete;
};

} // namespace mcpbridge::test
