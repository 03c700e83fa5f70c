#ifndef LOGGER_HPP
#define LOGGER_HPP

#include <memory>
#include <string>

#include <spdlog/logger.h>

class Logger {
public:
    // Creates core_logger, vcs_logger and journal_logger. Safe to call twice.
    static void setup_loggers(const std::string& log_dir = std::string(),
                              const std::string& level = "info");
    static std::shared_ptr<spdlog::logger> get_logger(const std::string& name);
    static void set_level(const std::string& level);
    static std::string get_log_directory();

private:
    static std::string default_log_directory();
};

#endif
