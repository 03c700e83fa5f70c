#include <catch2/catch_test_macros.hpp>

#include "AppException.hpp"
#include "ReportWriter.hpp"
#include "TestHelpers.hpp"

#ifdef _WIN32
#include <json/json.h>
#elif __APPLE__
#include <json/json.h>
#else
#include <jsoncpp/json/json.h>
#endif

#include <atomic>
#include <sstream>
#include <string>
#include <vector>

namespace {

ScanResult scan_of(const std::vector<std::string>& paths)
{
    std::vector<PathEntry> entries;
    for (const auto& path : paths) {
        entries.push_back(PathEntry::from_string(path, EntryKind::File));
    }
    std::atomic<bool> stop{false};
    return ScanService(ScanConfig{}, 1).scan(entries, stop);
}

ReportMetadata metadata()
{
    ReportMetadata meta;
    meta.repo = "/work/repo";
    meta.timestamp = "2026-01-02T03:04:05";
    meta.submodules = {"vendor/lib"};
    return meta;
}

Json::Value parse(const std::string& text)
{
    Json::CharReaderBuilder reader;
    Json::Value root;
    std::string errors;
    std::istringstream stream(text);
    REQUIRE(Json::parseFromStream(reader, stream, &root, &errors));
    return root;
}

bool contains(const std::string& haystack, const std::string& needle)
{
    return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST_CASE("JSON report lists items, planned renames and scan metadata") {
    const auto scan = scan_of({"CON.txt", "ok.txt", "a:b.txt", "a -b.txt"});
    const auto root = parse(ReportWriter::to_json(metadata(), scan));

    CHECK(root["repo"].asString() == "/work/repo");
    CHECK(root["scan"]["max_path"].asInt() == 260);
    CHECK(root["scan"]["total_paths"].asUInt64() == 4);
    CHECK_FALSE(root["scan"]["cancelled"].asBool());
    CHECK(root["scan"]["submodules"][0].asString() == "vendor/lib");
    CHECK(root["scan"]["snapshot_id"].asString().size() == 16);

    const auto& items = root["items"];
    REQUIRE(items.isArray());
    bool saw_reserved = false;
    for (const auto& item : items) {
        CHECK(item["type"].asString() == "File");
        if (item["current_path"].asString() == "CON.txt") {
            saw_reserved = true;
            CHECK(item["status"].asString() == "proposed");
            CHECK(item["proposed_fix"]["path"].asString() == "CON_.txt");
            CHECK(item["issues"][0]["rule"].asString() == "RESERVED_DEVICE");
            CHECK(item["issues"][0]["severity"].asString() == "Blocking");
        }
        CHECK(item["current_path"].asString() != "ok.txt");
    }
    CHECK(saw_reserved);

    REQUIRE(root["planned_renames"].size() == 2);
    CHECK(root["planned_renames"][0]["source"].isString());
    CHECK(root["planned_renames"][0]["role"].asString() == "rename");
    CHECK(root["applied_renames"].size() == 0);
    CHECK(root["warnings"].isArray());
    CHECK(root["unresolved"].isArray());
}

TEST_CASE("JSON report includes the applied batch and failure") {
    const auto scan = scan_of({"CON.txt"});
    ApplyResult applied;
    Batch batch;
    batch.batch_id = "20260102-030405-1";
    batch.operations = scan.plan->plan.operations;
    applied.batch = batch;
    applied.failed_at = 1;
    applied.error = AdapterError{AdapterErrorKind::TargetExists, "busy.txt"};

    const auto root = parse(ReportWriter::to_json(metadata(), scan, applied));
    CHECK(root["batch_id"].asString() == "20260102-030405-1");
    CHECK(root["applied_renames"].size() == 1);
    CHECK(root["apply_failure"]["failed_at"].asUInt64() == 1);
    CHECK(root["apply_failure"]["kind"].asString() == "TargetExists");
}

TEST_CASE("Text summary shows renames and next steps") {
    const auto scan = scan_of({"CON.txt", "ok.txt"});
    const auto text = ReportWriter::to_text_summary(metadata(), scan);

    CHECK(contains(text, "RepoPath Sanitizer report for: /work/repo"));
    CHECK(contains(text, "Scanned 2 path(s), 1 with issues."));
    CHECK(contains(text, "Planned renames (git mv):"));
    CHECK(contains(text, "  - CON.txt  ->  CON_.txt"));
    CHECK(contains(text, "Suggested next steps:"));
    CHECK(contains(text, "Sanitize paths for Windows checkout (RepoPath Sanitizer)"));
    CHECK_FALSE(contains(text, "Unresolved:"));
}

TEST_CASE("Text summary of a clean tree says none") {
    const auto text = ReportWriter::to_text_summary(metadata(), scan_of({"src/main.cpp"}));
    CHECK(contains(text, "Planned renames (git mv):\n  (none)"));
}

TEST_CASE("Text summary of a cancelled scan stops early") {
    ScanResult scan;
    scan.total = 10;
    scan.cancelled = true;
    const auto text = ReportWriter::to_text_summary(metadata(), scan);
    CHECK(contains(text, "Scan cancelled after 0 of 10 path(s)"));
    CHECK_FALSE(contains(text, "Planned renames"));
}

TEST_CASE("Reports are written to disk") {
    TempDir dir;
    const auto file = dir.path() / "report.json";
    ReportWriter::write_file(Utils::path_to_utf8(file), "{}");
    CHECK(read_text_file(file) == "{}\n");

    const auto missing = dir.path() / "no-such-dir" / "report.json";
    try {
        ReportWriter::write_file(Utils::path_to_utf8(missing), "{}");
        FAIL("expected FILE_WRITE_FAILED");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::FILE_WRITE_FAILED);
    }
}
