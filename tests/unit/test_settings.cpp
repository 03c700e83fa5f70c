#include <catch2/catch_test_macros.hpp>

#include "AppException.hpp"
#include "IniConfig.hpp"
#include "Settings.hpp"
#include "TestHelpers.hpp"
#include "Utils.hpp"

#include <filesystem>

TEST_CASE("Settings use defaults when no config file exists") {
    TempDir temp;
    EnvVarGuard config_guard("REPOPATH_SANITIZER_CONFIG_DIR", temp.path().string());
    EnvVarGuard state_guard("REPOPATH_SANITIZER_STATE_DIR", (temp.path() / "state").string());

    Settings settings;
    REQUIRE_FALSE(settings.load());

    const auto config = settings.to_scan_config();
    CHECK(config.max_path == 260);
    CHECK_FALSE(config.normalize_unicode_nfc);
    CHECK_FALSE(config.collapse_spaces);
    CHECK(config.auto_disambiguate);
    CHECK_FALSE(settings.get_include_ignored());
    CHECK(settings.get_scan_threads() == 0);
    CHECK(settings.get_log_level() == "info");
    CHECK(settings.get_journal_directory() == (temp.path() / "state").string());
}

TEST_CASE("Settings round trip through the config file") {
    TempDir temp;
    EnvVarGuard config_guard("REPOPATH_SANITIZER_CONFIG_DIR", temp.path().string());

    {
        Settings settings;
        settings.set_max_path(200);
        settings.set_normalize_unicode_nfc(true);
        settings.set_collapse_spaces(true);
        settings.set_auto_disambiguate(false);
        settings.set_include_ignored(true);
        settings.set_scan_threads(3);
        settings.set_log_level("debug");
        settings.set_journal_directory("/tmp/journals");
        REQUIRE(settings.save());
        CHECK(std::filesystem::exists(Utils::utf8_to_path(settings.get_config_path())));
    }

    Settings reloaded;
    REQUIRE(reloaded.load());
    CHECK(reloaded.get_max_path() == 200);
    CHECK(reloaded.get_normalize_unicode_nfc());
    CHECK(reloaded.get_collapse_spaces());
    CHECK_FALSE(reloaded.get_auto_disambiguate());
    CHECK(reloaded.get_include_ignored());
    CHECK(reloaded.get_scan_threads() == 3);
    CHECK(reloaded.get_log_level() == "debug");
    CHECK(reloaded.get_journal_directory() == "/tmp/journals");
}

TEST_CASE("Config path lives under the override directory") {
    TempDir temp;
    EnvVarGuard config_guard("REPOPATH_SANITIZER_CONFIG_DIR", temp.path().string());

    Settings settings;
    const auto expected = temp.path() / "RepoPathSanitizer" / "config.ini";
    CHECK(settings.get_config_path() == expected.string());
    CHECK(settings.get_config_dir() == (temp.path() / "RepoPathSanitizer").string());
}

TEST_CASE("Out of range values are rejected") {
    TempDir temp;
    EnvVarGuard config_guard("REPOPATH_SANITIZER_CONFIG_DIR", temp.path().string());

    Settings settings;
    CHECK_THROWS_AS(settings.set_max_path(5), ErrorCodes::AppException);
    CHECK_THROWS_AS(settings.set_max_path(40000), ErrorCodes::AppException);
    CHECK_THROWS_AS(settings.set_scan_threads(-1), ErrorCodes::AppException);
    CHECK(settings.get_max_path() == 260);

    write_text_file(temp.path() / "RepoPathSanitizer" / "config.ini", "[Scan]\nMaxPath = 5\n");
    try {
        settings.load();
        FAIL("expected CONFIG_INVALID_VALUE");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::CONFIG_INVALID_VALUE);
    }
}

TEST_CASE("IniConfig parses sections, comments and typed values") {
    TempDir temp;
    const auto file = temp.path() / "sample.ini";
    write_text_file(file,
                    "; comment\n"
                    "# another\n"
                    "[Scan]\n"
                    "MaxPath = 120\n"
                    "Collapse = yes\n"
                    "Broken = maybe\n"
                    "Threads = 4x\n"
                    "this line is junk\n"
                    "[Logging]\n"
                    "Level=warn\n");

    IniConfig config;
    REQUIRE(config.load(file.string()));
    CHECK(config.getInt("Scan", "MaxPath") == 120);
    CHECK(config.getBool("Scan", "Collapse") == true);
    CHECK_FALSE(config.getBool("Scan", "Broken").has_value());
    CHECK_FALSE(config.getInt("Scan", "Threads").has_value());
    CHECK_FALSE(config.getInt("Scan", "Missing").has_value());
    CHECK(config.getValue("Logging", "Level") == "warn");
    CHECK(config.getValue("Logging", "Missing", "fallback") == "fallback");
    CHECK(config.hasValue("Scan", "MaxPath"));
    REQUIRE(config.malformedLines().size() == 1);
    CHECK(config.malformedLines().front().find("this line is junk") != std::string::npos);
}
