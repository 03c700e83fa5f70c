#include "AppException.hpp"
#include "GitAdapter.hpp"
#include "Logger.hpp"
#include "ReportWriter.hpp"
#include "SanitizerEngine.hpp"
#include "Settings.hpp"
#include "UndoJournal.hpp"
#include "Utils.hpp"

#include <QCoreApplication>

#include <fmt/format.h>

#include <atomic>
#include <csignal>
#include <cstdio>
#include <cstdlib>
#include <cstring>
#include <iostream>
#include <optional>
#include <string>
#include <vector>


namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitPartial = 1;
constexpr int kExitUsage = 2;

std::atomic<bool> g_stop_requested{false};

void handle_interrupt(int)
{
    g_stop_requested.store(true);
}

enum class Command {Scan, Apply, Undo, Batches};

struct ParsedArguments {
    Command command{Command::Scan};
    std::string repo{"."};
    std::string batch_id{"latest"};
    std::optional<int> max_path;
    bool nfc{false};
    bool collapse_spaces{false};
    bool include_ignored{false};
    bool no_disambiguate{false};
    std::optional<int> threads;
    std::vector<std::string> excluded;
    std::string json_path;
    std::string text_path;
    bool allow_dirty{false};
    std::string log_level;
    bool show_help{false};
};

void print_usage()
{
    std::puts(
        "Usage: repopath-sanitizer [scan|apply|undo [batch-id|latest]|batches] [options]\n"
        "\n"
        "Options:\n"
        "  --repo <path>        Repository path (default: .)\n"
        "  --max-path <n>       Windows path length limit in UTF-16 units (default: 260)\n"
        "  --nfc                Normalize proposed names to Unicode NFC\n"
        "  --collapse-spaces    Collapse runs of spaces in proposed names\n"
        "  --include-ignored    Also scan files ignored by .gitignore\n"
        "  --no-disambiguate    Report collisions instead of adding _N suffixes\n"
        "  --threads <n>        Validation threads (0 = all cores)\n"
        "  --exclude <path>     Keep this path unchanged (repeatable)\n"
        "  --json <file>        Write the JSON report to a file instead of stdout\n"
        "  --text <file>        Write a plain text summary\n"
        "  --allow-dirty        Apply even with uncommitted changes\n"
        "  --log-level <level>  trace, debug, info, warn, error\n"
        "  -h, --help           Show this help");
}

int parse_int(const char* flag, const char* value)
{
    const auto parsed = Utils::parse_int(value);
    if (!parsed) {
        THROW_APP_ERROR(ErrorCodes::Code::CLI_INVALID_ARGUMENT, fmt::format("{} {}", flag, value));
    }
    return *parsed;
}

ParsedArguments parse_command_line(int argc, char** argv)
{
    ParsedArguments parsed;
    bool command_seen = false;

    auto next_value = [&](int& i) -> const char* {
        if (i + 1 >= argc) {
            THROW_APP_ERROR(ErrorCodes::Code::CLI_MISSING_VALUE, argv[i]);
        }
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const char* arg = argv[i];
        if (std::strcmp(arg, "-h") == 0 || std::strcmp(arg, "--help") == 0) {
            parsed.show_help = true;
        } else if (std::strcmp(arg, "--repo") == 0) {
            parsed.repo = next_value(i);
        } else if (std::strcmp(arg, "--max-path") == 0) {
            parsed.max_path = parse_int(arg, next_value(i));
        } else if (std::strcmp(arg, "--nfc") == 0) {
            parsed.nfc = true;
        } else if (std::strcmp(arg, "--collapse-spaces") == 0) {
            parsed.collapse_spaces = true;
        } else if (std::strcmp(arg, "--include-ignored") == 0) {
            parsed.include_ignored = true;
        } else if (std::strcmp(arg, "--no-disambiguate") == 0) {
            parsed.no_disambiguate = true;
        } else if (std::strcmp(arg, "--threads") == 0) {
            parsed.threads = parse_int(arg, next_value(i));
        } else if (std::strcmp(arg, "--exclude") == 0) {
            parsed.excluded.emplace_back(next_value(i));
        } else if (std::strcmp(arg, "--json") == 0) {
            parsed.json_path = next_value(i);
        } else if (std::strcmp(arg, "--text") == 0) {
            parsed.text_path = next_value(i);
        } else if (std::strcmp(arg, "--allow-dirty") == 0) {
            parsed.allow_dirty = true;
        } else if (std::strcmp(arg, "--log-level") == 0) {
            parsed.log_level = next_value(i);
        } else if (arg[0] == '-') {
            THROW_APP_ERROR(ErrorCodes::Code::CLI_INVALID_ARGUMENT, arg);
        } else if (!command_seen) {
            command_seen = true;
            if (std::strcmp(arg, "scan") == 0) {
                parsed.command = Command::Scan;
            } else if (std::strcmp(arg, "apply") == 0) {
                parsed.command = Command::Apply;
            } else if (std::strcmp(arg, "undo") == 0) {
                parsed.command = Command::Undo;
            } else if (std::strcmp(arg, "batches") == 0) {
                parsed.command = Command::Batches;
            } else {
                THROW_APP_ERROR(ErrorCodes::Code::CLI_INVALID_ARGUMENT, arg);
            }
        } else if (parsed.command == Command::Undo) {
            parsed.batch_id = arg;
        } else {
            THROW_APP_ERROR(ErrorCodes::Code::CLI_INVALID_ARGUMENT, arg);
        }
    }
    return parsed;
}

void apply_overrides(Settings& settings, const ParsedArguments& args)
{
    if (args.max_path) {
        settings.set_max_path(*args.max_path);
    }
    if (args.nfc) {
        settings.set_normalize_unicode_nfc(true);
    }
    if (args.collapse_spaces) {
        settings.set_collapse_spaces(true);
    }
    if (args.include_ignored) {
        settings.set_include_ignored(true);
    }
    if (args.no_disambiguate) {
        settings.set_auto_disambiguate(false);
    }
    if (args.threads) {
        settings.set_scan_threads(*args.threads);
    }
    if (!args.log_level.empty()) {
        settings.set_log_level(args.log_level);
    }
}

void emit_reports(const ParsedArguments& args,
                  const ReportMetadata& meta,
                  const ScanResult& scan,
                  const std::optional<ApplyResult>& applied)
{
    const std::string json = ReportWriter::to_json(meta, scan, applied);
    if (!args.json_path.empty()) {
        ReportWriter::write_file(args.json_path, json);
    } else {
        std::cout << json << std::endl;
    }
    if (!args.text_path.empty()) {
        ReportWriter::write_file(args.text_path, ReportWriter::to_text_summary(meta, scan, applied));
    }
}

int run_scan_or_apply(const ParsedArguments& args,
                      const Settings& settings,
                      GitAdapter& adapter,
                      SanitizerEngine& engine)
{
    auto logger = Logger::get_logger("core_logger");

    if (args.command == Command::Apply && !args.allow_dirty && adapter.has_uncommitted_changes()) {
        THROW_APP_ERROR(ErrorCodes::Code::VCS_WORK_TREE_DIRTY, adapter.root());
    }

    PlanOptions options;
    options.excluded.insert(args.excluded.begin(), args.excluded.end());

    const auto entries = engine.snapshot();
    std::signal(SIGINT, handle_interrupt);
    ScanResult scan = engine.scan(entries, g_stop_requested, options);
    std::signal(SIGINT, SIG_DFL);

    ReportMetadata meta;
    meta.repo = adapter.root();
    meta.timestamp = Utils::current_timestamp();
    meta.config = settings.to_scan_config();
    meta.include_ignored = settings.get_include_ignored();
    meta.submodules = adapter.list_submodules();

    if (scan.cancelled) {
        emit_reports(args, meta, scan, std::nullopt);
        std::fprintf(stderr, "Scan cancelled; nothing was planned.\n");
        return kExitPartial;
    }

    std::optional<ApplyResult> applied;
    if (args.command == Command::Apply) {
        applied = engine.apply_plan(scan.plan->plan);
        if (logger) {
            logger->info("Apply finished: {} operation(s) applied", applied->applied_count());
        }
    }

    emit_reports(args, meta, scan, applied);

    if (args.command == Command::Apply) {
        if (applied->failed_at || !scan.plan->unresolved.empty()) {
            return kExitPartial;
        }
    }
    return kExitSuccess;
}

int run_undo(const ParsedArguments& args, SanitizerEngine& engine)
{
    const RevertResult result = engine.revert_batch(args.batch_id);
    std::cout << result.message << std::endl;
    if (result.status == RevertStatus::NotFound) {
        return kExitUsage;
    }
    return result.ok() ? kExitSuccess : kExitPartial;
}

int run_batches(SanitizerEngine& engine, const UndoJournal& journal)
{
    const auto batches = engine.list_batches();
    if (batches.empty()) {
        std::cout << "No journaled batches." << std::endl;
    }
    for (const auto& batch : batches) {
        std::cout << fmt::format("{}  {}  {} operation(s){}{}", batch.batch_id, batch.timestamp,
                                 batch.operation_count,
                                 batch.reverted_count > 0 ? fmt::format(", {} reverted", batch.reverted_count) : "",
                                 batch.completed ? "" : ", incomplete")
                  << std::endl;
    }
    const auto quarantined = journal.quarantined();
    if (!quarantined.empty()) {
        std::cout << fmt::format("{} quarantined record(s) in {}", quarantined.size(),
                                 Utils::path_to_utf8(journal.file()))
                  << std::endl;
    }
    return kExitSuccess;
}

int run_application(const ParsedArguments& args)
{
    Settings settings;
    settings.load();
    apply_overrides(settings, args);
    Logger::set_level(settings.get_log_level());

    if (!GitAdapter::is_git_repo(args.repo)) {
        THROW_APP_ERROR(ErrorCodes::Code::REPO_NOT_A_WORK_TREE, args.repo);
    }
    const std::string root = GitAdapter::repo_root(args.repo);

    GitAdapter adapter(root, settings.get_include_ignored(), Logger::get_logger("vcs_logger"));
    UndoJournal journal(UndoJournal::path_for_repository(Utils::utf8_to_path(settings.get_journal_directory()), root),
                        Logger::get_logger("journal_logger"));
    journal.load();
    for (const auto& warning : journal.load_warnings()) {
        std::fprintf(stderr, "Journal: %s\n", warning.c_str());
    }

    SanitizerEngine engine(adapter, journal, settings.to_scan_config(), settings.get_scan_threads(),
                           Logger::get_logger("core_logger"));

    switch (args.command) {
        case Command::Scan:
        case Command::Apply:
            return run_scan_or_apply(args, settings, adapter, engine);
        case Command::Undo:
            return run_undo(args, engine);
        case Command::Batches:
            return run_batches(engine, journal);
    }
    return kExitUsage;
}

bool initialize_loggers()
{
    try {
        Logger::setup_loggers();
        return true;
    } catch (const std::exception& e) {
        std::fprintf(stderr, "Failed to initialize loggers: %s\n", e.what());
        return false;
    }
}

} // namespace


int main(int argc, char** argv)
{
    QCoreApplication app(argc, argv);
    QCoreApplication::setApplicationName(QStringLiteral("RepoPath Sanitizer"));

    ParsedArguments args;
    try {
        args = parse_command_line(argc, argv);
    } catch (const ErrorCodes::AppException& ex) {
        std::fprintf(stderr, "%s\n", ex.get_user_message().c_str());
        print_usage();
        return kExitUsage;
    }
    if (args.show_help) {
        print_usage();
        return kExitSuccess;
    }

    if (!initialize_loggers()) {
        return kExitUsage;
    }

    try {
        return run_application(args);
    } catch (const ErrorCodes::AppException& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->info("{}", ex.get_full_details());
        }
        std::fprintf(stderr, "%s\n", ex.get_user_message().c_str());
        return kExitUsage;
    } catch (const std::exception& ex) {
        if (auto logger = Logger::get_logger("core_logger")) {
            logger->critical("Error: {}", ex.what());
        } else {
            std::fprintf(stderr, "Error: %s\n", ex.what());
        }
        return kExitUsage;
    }
}
