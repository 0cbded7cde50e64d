#include <mcpbridge/core/logging.h>

#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

#include <cstdlib>
#include <memory>
#include <vector>

namespace mcpbridge::core {

void applyLogLevel(const std::string& level) {
    if (level == "trace")
        spdlog::set_level(spdlog::level::trace);
    else if (level == "debug")
        spdlog::set_level(spdlog::level::debug);
    else if (level == "info")
        spdlog::set_level(spdlog::level::info);
    else if (level == "warn")
        spdlog::set_level(spdlog::level::warn);
    else if (level == "error")
        spdlog::set_level(spdlog::level::err);
}

void setupLogging(const std::string& name, const std::string& level, const std::string& logFile) {
    std::vector<spdlog::sink_ptr> sinks;
    // stdout is reserved for protocol frames in the stdio bridge
    sinks.push_back(std::make_shared<spdlog::sinks::stderr_color_sink_mt>());
    if (!logFile.empty()) {
        sinks.push_back(
            std::make_shared<spdlog::sinks::rotating_file_sink_mt>(logFile, 10 * 1024 * 1024, 3));
    }

    auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
    spdlog::set_default_logger(logger);

    applyLogLevel(level);
    if (const char* env = std::getenv("MCPBRIDGE_LOG_LEVEL"); env && *env) {
        applyLogLevel(env);
    }
    spdlog::set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%l] [%n] %v");
}

} // namespace mcpbridge::core
