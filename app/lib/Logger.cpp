#include "Logger.hpp"
#include "Utils.hpp"

#include <spdlog/spdlog.h>
#include <spdlog/sinks/rotating_file_sink.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <array>
#include <filesystem>
#include <mutex>
#include <vector>

namespace {

constexpr std::size_t kMaxLogFileSize = 5 * 1024 * 1024;
constexpr std::size_t kMaxLogFiles = 3;
constexpr std::array<const char*, 3> kLoggerNames = {"core_logger", "vcs_logger", "journal_logger"};

std::mutex& setup_mutex()
{
    static std::mutex mutex;
    return mutex;
}

std::string& active_log_directory()
{
    static std::string dir;
    return dir;
}

spdlog::level::level_enum parse_level(const std::string& level)
{
    const auto parsed = spdlog::level::from_str(level);
    // from_str maps unknown names to off
    if (parsed == spdlog::level::off && level != "off") {
        return spdlog::level::info;
    }
    return parsed;
}

} // namespace


std::string Logger::default_log_directory()
{
    return Utils::path_to_utf8(Utils::state_directory() / "logs");
}


void Logger::setup_loggers(const std::string& log_dir, const std::string& level)
{
    std::lock_guard<std::mutex> lock(setup_mutex());

    const std::string dir = log_dir.empty() ? default_log_directory() : log_dir;
    std::filesystem::create_directories(Utils::utf8_to_path(dir));
    active_log_directory() = dir;

    const auto log_level = parse_level(level);
    auto console_sink = std::make_shared<spdlog::sinks::stderr_color_sink_mt>();
    console_sink->set_level(spdlog::level::warn);
    console_sink->set_pattern("%^[%l]%$ %v");

    for (const char* name : kLoggerNames) {
        if (spdlog::get(name)) {
            spdlog::drop(name);
        }
        const auto file_path = Utils::utf8_to_path(dir) / (std::string(name) + ".log");
        auto file_sink = std::make_shared<spdlog::sinks::rotating_file_sink_mt>(
            Utils::path_to_utf8(file_path), kMaxLogFileSize, kMaxLogFiles);
        file_sink->set_pattern("[%Y-%m-%d %H:%M:%S.%e] [%n] [%l] %v");

        std::vector<spdlog::sink_ptr> sinks{file_sink, console_sink};
        auto logger = std::make_shared<spdlog::logger>(name, sinks.begin(), sinks.end());
        logger->set_level(log_level);
        logger->flush_on(spdlog::level::warn);
        spdlog::register_logger(logger);
    }
}


std::shared_ptr<spdlog::logger> Logger::get_logger(const std::string& name)
{
    return spdlog::get(name);
}


void Logger::set_level(const std::string& level)
{
    const auto log_level = parse_level(level);
    for (const char* name : kLoggerNames) {
        if (auto logger = spdlog::get(name)) {
            logger->set_level(log_level);
        }
    }
}


std::string Logger::get_log_directory()
{
    std::lock_guard<std::mutex> lock(setup_mutex());
    return active_log_directory();
}
