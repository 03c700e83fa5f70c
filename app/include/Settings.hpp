#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <IniConfig.hpp>
#include <Types.hpp>
#include <string>
#include <filesystem>


class Settings
{
public:
    Settings();

    bool load();
    bool save();

    int get_max_path() const;
    void set_max_path(int value);

    bool get_normalize_unicode_nfc() const;
    void set_normalize_unicode_nfc(bool value);

    bool get_collapse_spaces() const;
    void set_collapse_spaces(bool value);

    bool get_auto_disambiguate() const;
    void set_auto_disambiguate(bool value);

    bool get_include_ignored() const;
    void set_include_ignored(bool value);

    int get_scan_threads() const;
    void set_scan_threads(int value);

    std::string get_log_level() const;
    void set_log_level(const std::string& value);

    std::string get_journal_directory() const;
    void set_journal_directory(const std::string& value);

    ScanConfig to_scan_config() const;

    std::string define_config_path();
    std::string get_config_dir();
    std::string get_config_path() const { return config_path; }

private:
    std::string config_path;
    std::filesystem::path config_dir;
    IniConfig config;

    int max_path{260};
    bool normalize_unicode_nfc{false};
    bool collapse_spaces{false};
    bool auto_disambiguate{true};
    bool include_ignored{false};
    int scan_threads{0};
    std::string log_level{"info"};
    std::string journal_directory;
};

#endif
