#include "logging.hpp"
#include "utils.hpp"
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <algorithm>
#include <array>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <filesystem>
#include <iomanip>
#include <mutex>
#include <sstream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace core {
namespace logging {

    namespace {

        std::shared_ptr<spdlog::logger> global_logger;
        std::mutex logger_mutex;
        std::once_flag default_logger_flag;

        constexpr const char* kLoggerName = "EndpointRules";
        constexpr const char* kPattern = "[%Y-%m-%d %H:%M:%S.%e%z] [%^%l%$] [%n] %v";
        constexpr std::size_t kMaxFileSize = 10 * 1024 * 1024;
        constexpr std::size_t kMaxFiles = 5;

        const std::array<std::pair<const char*, spdlog::level::level_enum>, 10> kLevelNames{{
            {"trace", spdlog::level::trace},
            {"debug", spdlog::level::debug},
            {"info", spdlog::level::info},
            {"warn", spdlog::level::warn},
            {"warning", spdlog::level::warn},
            {"error", spdlog::level::err},
            {"err", spdlog::level::err},
            {"critical", spdlog::level::critical},
            {"crit", spdlog::level::critical},
            {"off", spdlog::level::off},
        }};

        std::optional<spdlog::level::level_enum> levelFromEnvironment() {
            const char* env_level = std::getenv("SPDLOG_LEVEL");
            return env_level ? level_from_string(env_level) : std::nullopt;
        }

        std::string timestampedFileName(const LoggingOptions& options) {
            std::time_t now = std::chrono::system_clock::to_time_t(std::chrono::system_clock::now());
            std::tm utc_tm{};
            #ifdef _WIN32
                gmtime_s(&utc_tm, &now);
            #else
                gmtime_r(&now, &utc_tm);
            #endif
            std::ostringstream name;
            name << options.file_prefix << "_" << std::put_time(&utc_tm, "%Y%m%d_%H%M%SZ") << ".log";
            return (std::filesystem::path(options.directory) / name.str()).string();
        }

        spdlog::level::level_enum levelField(const nlohmann::json& config, const char* key,
                                             spdlog::level::level_enum fallback) {
            if (!config.contains(key)) return fallback;
            if (!config[key].is_string()) {
                throw std::invalid_argument(std::string("Logging option '") + key + "' must be a string.");
            }
            auto level = level_from_string(config[key].get<std::string>());
            if (!level) {
                throw std::invalid_argument("Unknown log level '" + config[key].get<std::string>() + "'.");
            }
            return *level;
        }

        std::string stringField(const nlohmann::json& config, const char* key, const std::string& fallback) {
            if (!config.contains(key)) return fallback;
            if (!config[key].is_string()) {
                throw std::invalid_argument(std::string("Logging option '") + key + "' must be a string.");
            }
            return config[key].get<std::string>();
        }

    } // namespace

    LoggingOptions LoggingOptions::fromJson(const nlohmann::json& config) {
        if (!config.is_object()) {
            throw std::invalid_argument("Logging options must be a JSON object.");
        }
        LoggingOptions options;
        options.directory = stringField(config, "directory", options.directory);
        options.file_prefix = stringField(config, "filePrefix", options.file_prefix);
        options.console_level = levelField(config, "consoleLevel", options.console_level);
        options.file_level = levelField(config, "fileLevel", options.file_level);
        if (config.contains("writeFile")) {
            if (!config["writeFile"].is_boolean()) {
                throw std::invalid_argument("Logging option 'writeFile' must be a boolean.");
            }
            options.write_file = config["writeFile"].get<bool>();
        }
        return options;
    }

    void initialize(const LoggingOptions& options) {
        std::lock_guard<std::mutex> lock(logger_mutex);

        spdlog::level::level_enum console_level = options.console_level;
        spdlog::level::level_enum file_level = options.file_level;
        if (auto env_level = levelFromEnvironment()) {
            console_level = *env_level;
            file_level = *env_level;
        }

        auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
        console_sink->set_level(console_level);
        console_sink->set_pattern(kPattern);
        std::vector<spdlog::sink_ptr> sinks{console_sink};

        std::string file_path;
        std::string file_problem;
        if (options.write_file) {
            try {
                std::filesystem::create_directories(options.directory);
                file_path = timestampedFileName(options);
                auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(file_path, kMaxFileSize, kMaxFiles, true);
                file_sink->set_level(file_level);
                file_sink->set_pattern(kPattern);
                sinks.push_back(file_sink);
            } catch (const std::filesystem::filesystem_error& e) {
                file_problem = e.what();
            } catch (const spdlog::spdlog_ex& e) {
                file_problem = e.what();
            }
        }

        if (global_logger) {
            spdlog::drop(kLoggerName);
        }
        global_logger = std::make_shared<spdlog::logger>(kLoggerName, sinks.begin(), sinks.end());
        global_logger->set_level(sinks.size() > 1 ? std::min(console_level, file_level) : console_level);
        global_logger->flush_on(spdlog::level::err);
        spdlog::register_logger(global_logger);
        spdlog::set_default_logger(global_logger);

        #ifdef NDEBUG
            const char* build_type = "Release";
        #else
            const char* build_type = "Debug";
        #endif

        if (!file_problem.empty()) {
            global_logger->warn("Log file under '{}' unavailable, logging to console only: {}", options.directory, file_problem);
        }
        global_logger->info("Logging initialized ({} build). Console: {}, File: {}", build_type,
                            spdlog::level::to_string_view(console_level),
                            file_path.empty() ? std::string("disabled") : file_path);
    }

    std::shared_ptr<spdlog::logger>& getLogger() {
        // Only the first call pays for the lock; initialize() runs at start-up
        std::call_once(default_logger_flag, [] {
            std::lock_guard<std::mutex> lock(logger_mutex);
            if (!global_logger) {
                auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
                console_sink->set_pattern(kPattern);
                global_logger = std::make_shared<spdlog::logger>(kLoggerName, console_sink);
                global_logger->set_level(levelFromEnvironment().value_or(spdlog::level::warn));
            }
        });
        return global_logger;
    }

    std::optional<spdlog::level::level_enum> level_from_string(const std::string& level_str) {
        const std::string lower = utils::toLower(level_str);
        auto it = std::find_if(kLevelNames.begin(), kLevelNames.end(),
                               [&lower](const auto& entry) { return lower == entry.first; });
        if (it == kLevelNames.end()) return std::nullopt;
        return it->second;
    }

} // namespace logging
} // namespace core
