#include "Settings.hpp"
#include "AppException.hpp"
#include "Logger.hpp"
#include "Utils.hpp"
#include <QStandardPaths>
#include <QString>
#include <spdlog/spdlog.h>
#include <spdlog/fmt/fmt.h>
#include <cstdio>
#include <cstdlib>
#include <filesystem>


namespace {
constexpr int kMinMaxPath = 16;
constexpr int kMaxMaxPath = 32767;

template <typename... Args>
void settings_log(spdlog::level::level_enum level, const char* fmt, Args&&... args) {
    auto message = fmt::format(fmt::runtime(fmt), std::forward<Args>(args)...);
    if (auto logger = Logger::get_logger("core_logger")) {
        logger->log(level, "{}", message);
    } else if (level >= spdlog::level::warn) {
        std::fprintf(stderr, "%s\n", message.c_str());
    }
}

std::string bool_to_string(bool value) {
    return value ? "true" : "false";
}
}


Settings::Settings()
{
    config_path = define_config_path();
    config_dir = Utils::utf8_to_path(config_path).parent_path();
}


std::string Settings::define_config_path()
{
    const std::string app_name = "RepoPathSanitizer";
    if (const char* override_root = std::getenv("REPOPATH_SANITIZER_CONFIG_DIR")) {
        std::filesystem::path base = Utils::utf8_to_path(override_root);
        return Utils::path_to_utf8(base / app_name / "config.ini");
    }
    const QString location = QStandardPaths::writableLocation(QStandardPaths::GenericConfigLocation);
    if (!location.isEmpty()) {
        const std::filesystem::path base = Utils::utf8_to_path(location.toStdString());
        return Utils::path_to_utf8(base / app_name / "config.ini");
    }
    return "config.ini";
}


std::string Settings::get_config_dir()
{
    return Utils::path_to_utf8(config_dir);
}


bool Settings::load()
{
    if (!config.load(config_path)) {
        return false;
    }

    if (auto value = config.getInt("Scan", "MaxPath")) {
        set_max_path(*value);
    }
    if (auto value = config.getBool("Scan", "NormalizeUnicodeNfc")) {
        normalize_unicode_nfc = *value;
    }
    if (auto value = config.getBool("Scan", "CollapseSpaces")) {
        collapse_spaces = *value;
    }
    if (auto value = config.getBool("Scan", "AutoDisambiguate")) {
        auto_disambiguate = *value;
    }
    if (auto value = config.getBool("Scan", "IncludeIgnored")) {
        include_ignored = *value;
    }
    if (auto value = config.getInt("Scan", "Threads")) {
        set_scan_threads(*value);
    }
    log_level = config.getValue("Logging", "Level", log_level);
    journal_directory = config.getValue("Journal", "Directory", journal_directory);

    settings_log(spdlog::level::debug, "Loaded settings from {}", config_path);
    return true;
}


bool Settings::save()
{
    try {
        if (!std::filesystem::exists(config_dir)) {
            std::filesystem::create_directories(config_dir);
        }
    } catch (const std::filesystem::filesystem_error& e) {
        settings_log(spdlog::level::err, "Error creating configuration directory: {}", e.what());
        return false;
    }

    config.setValue("Scan", "MaxPath", std::to_string(max_path));
    config.setValue("Scan", "NormalizeUnicodeNfc", bool_to_string(normalize_unicode_nfc));
    config.setValue("Scan", "CollapseSpaces", bool_to_string(collapse_spaces));
    config.setValue("Scan", "AutoDisambiguate", bool_to_string(auto_disambiguate));
    config.setValue("Scan", "IncludeIgnored", bool_to_string(include_ignored));
    config.setValue("Scan", "Threads", std::to_string(scan_threads));
    config.setValue("Logging", "Level", log_level);
    config.setValue("Journal", "Directory", journal_directory);

    return config.save(config_path);
}


int Settings::get_max_path() const
{
    return max_path;
}


void Settings::set_max_path(int value)
{
    if (value < kMinMaxPath || value > kMaxMaxPath) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            fmt::format("MaxPath must be between {} and {}", kMinMaxPath, kMaxMaxPath),
                            fmt::format("MaxPath={}", value));
    }
    max_path = value;
}


bool Settings::get_normalize_unicode_nfc() const
{
    return normalize_unicode_nfc;
}


void Settings::set_normalize_unicode_nfc(bool value)
{
    normalize_unicode_nfc = value;
}


bool Settings::get_collapse_spaces() const
{
    return collapse_spaces;
}


void Settings::set_collapse_spaces(bool value)
{
    collapse_spaces = value;
}


bool Settings::get_auto_disambiguate() const
{
    return auto_disambiguate;
}


void Settings::set_auto_disambiguate(bool value)
{
    auto_disambiguate = value;
}


bool Settings::get_include_ignored() const
{
    return include_ignored;
}


void Settings::set_include_ignored(bool value)
{
    include_ignored = value;
}


int Settings::get_scan_threads() const
{
    return scan_threads;
}


void Settings::set_scan_threads(int value)
{
    if (value < 0) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::CONFIG_INVALID_VALUE,
                            "Threads must be zero (automatic) or positive",
                            fmt::format("Threads={}", value));
    }
    scan_threads = value;
}


std::string Settings::get_log_level() const
{
    return log_level;
}


void Settings::set_log_level(const std::string& value)
{
    log_level = value;
}


std::string Settings::get_journal_directory() const
{
    if (!journal_directory.empty()) {
        return journal_directory;
    }
    return Utils::path_to_utf8(Utils::state_directory());
}


void Settings::set_journal_directory(const std::string& value)
{
    journal_directory = value;
}


ScanConfig Settings::to_scan_config() const
{
    ScanConfig scan_config;
    scan_config.max_path = max_path;
    scan_config.normalize_unicode_nfc = normalize_unicode_nfc;
    scan_config.collapse_spaces = collapse_spaces;
    scan_config.auto_disambiguate = auto_disambiguate;
    return scan_config;
}
