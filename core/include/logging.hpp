#pragma once

#include <spdlog/spdlog.h>
#include <spdlog/logger.h>
#include <nlohmann/json.hpp>
#include <memory>
#include <optional>
#include <string>

namespace core {
namespace logging {

    struct LoggingOptions {
        std::string directory = "logs";
        std::string file_prefix = "endpoint_rules"; // <prefix>_<UTC timestamp>.log
        spdlog::level::level_enum console_level = spdlog::level::info;
        spdlog::level::level_enum file_level = spdlog::level::debug;
        bool write_file = true;

        // Reads "directory", "filePrefix", "consoleLevel", "fileLevel" and "writeFile".
        // Missing keys keep their defaults. Throws std::invalid_argument on wrong types
        // or unknown level names.
        static LoggingOptions fromJson(const nlohmann::json& config);
    };

    // Installs the process-wide "EndpointRules" logger. SPDLOG_LEVEL, when set to a
    // known level, overrides both sink levels. If the file sink cannot be created
    // the logger continues console-only and says so at warn.
    void initialize(const LoggingOptions& options = {});

    // The process-wide logger. Without initialize() a console-only logger at
    // 'warn' (or SPDLOG_LEVEL) is created on first use.
    // Lock-free after the first call; initialize() must not race with loggers
    // in use on other threads.
    std::shared_ptr<spdlog::logger>& getLogger();

    // trace, debug, info, warn/warning, error/err, critical/crit, off (any case)
    std::optional<spdlog::level::level_enum> level_from_string(const std::string& level_str);

} // namespace logging
} // namespace core
