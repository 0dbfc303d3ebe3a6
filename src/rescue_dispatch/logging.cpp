#include "rescue_dispatch/logging.hpp"

#include <algorithm>
#include <cctype>
#include <filesystem>
#include <mutex>
#include <stdexcept>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace rescue_dispatch {

namespace {
std::once_flag logger_once_flag;
std::shared_ptr<spdlog::logger> shared_logger;
constexpr std::size_t k_max_file_size_bytes{10 * 1024 * 1024};
constexpr std::size_t k_max_files{5};
constexpr const char* k_logger_name{"rescue_dispatch"};
constexpr const char* k_log_file_name{"rescue_dispatch.log"};

spdlog::sink_ptr make_console_sink() {
    auto console_sink = std::make_shared<spdlog::sinks::stdout_color_sink_mt>();
    console_sink->set_pattern("[%l] %v");
    return console_sink;
}

/**
 * @brief Rotating JSON-line sink holding the dispatch audit trail.
 */
spdlog::sink_ptr make_audit_sink(const std::filesystem::path& path_log_dir) {
    const std::filesystem::path path_log_file = path_log_dir / k_log_file_name;
    auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
        path_log_file.string(),
        k_max_file_size_bytes,
        k_max_files
    );
    file_sink->set_pattern(R"({"ts":"%Y-%m-%dT%H:%M:%S.%eZ","level":"%l","msg":%v})");
    return file_sink;
}

std::string normalize_level_name(const std::string& str_level) {
    std::string str_normalized = str_level;
    std::transform(str_normalized.begin(), str_normalized.end(), str_normalized.begin(), [](unsigned char character) {
        return static_cast<char>(std::tolower(character));
    });
    if (str_normalized == "warning") {
        return "warn";
    }
    if (str_normalized == "error") {
        return "err";
    }
    return str_normalized;
}
}  // namespace

std::shared_ptr<spdlog::logger> initialize_logger(const std::string& log_directory) {
    std::call_once(
        logger_once_flag,
        [&log_directory]() {
            const std::filesystem::path path_log_dir{log_directory};
            std::error_code error_directory;
            std::filesystem::create_directories(path_log_dir, error_directory);
            if (error_directory) {
                throw std::runtime_error("Unable to create log directory at " + path_log_dir.string());
            }

            spdlog::sinks_init_list sinks{make_console_sink(), make_audit_sink(path_log_dir)};
            shared_logger = std::make_shared<spdlog::logger>(k_logger_name, sinks);
            shared_logger->set_level(spdlog::level::info);
            // Expiry and planning-timeout warnings must reach disk even if the process dies.
            shared_logger->flush_on(spdlog::level::warn);
            spdlog::register_logger(shared_logger);
        }
    );
    return shared_logger;
}

std::shared_ptr<spdlog::logger> get_logger() {
    if (!shared_logger) {
        throw std::runtime_error("Logger not initialized");
    }
    return shared_logger;
}

void set_log_level(const std::string& str_level) {
    if (!shared_logger) {
        return;
    }
    const std::string str_normalized = normalize_level_name(str_level);
    const auto level = spdlog::level::from_str(str_normalized);
    // from_str maps unknown names to off.
    if (level == spdlog::level::off && str_normalized != "off") {
        shared_logger->warn("Unknown log level {}; defaulting to info", str_level);
        shared_logger->set_level(spdlog::level::info);
        return;
    }
    shared_logger->set_level(level);
}

}  // namespace rescue_dispatch
