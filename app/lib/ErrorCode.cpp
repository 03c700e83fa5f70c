#include "ErrorCode.hpp"

#include <fmt/format.h>

#include <unordered_map>

namespace ErrorCodes {

namespace {

struct CatalogEntry {
    const char* message;
    const char* resolution;
};

const std::unordered_map<Code, CatalogEntry>& catalog()
{
    static const std::unordered_map<Code, CatalogEntry> entries = {
        {Code::UNKNOWN_ERROR,
         {"An unexpected error occurred.",
          "Re-run with --log-level debug and check the log file."}},
        {Code::REPO_NOT_FOUND,
         {"The repository path does not exist.",
          "Pass an existing directory with --repo."}},
        {Code::REPO_NOT_A_WORK_TREE,
         {"The path is not inside a git working tree.",
          "Run the command from a git checkout or pass --repo."}},
        {Code::VCS_EXECUTABLE_MISSING,
         {"The git executable could not be found.",
          "Install git and make sure it is on PATH."}},
        {Code::VCS_COMMAND_FAILED,
         {"A git command failed.",
          "Inspect the git output in the log and retry."}},
        {Code::VCS_WORK_TREE_DIRTY,
         {"The working tree has uncommitted changes.",
          "Commit or stash your changes, or pass --allow-dirty."}},
        {Code::PLAN_STALE_SNAPSHOT,
         {"The tracked files changed since the plan was computed.",
          "Scan again and apply the fresh plan."}},
        {Code::PLAN_EMPTY,
         {"There is nothing to rename.",
          "No action is needed."}},
        {Code::FILE_NOT_FOUND,
         {"File not found.",
          "Check that the path exists."}},
        {Code::FILE_OPEN_FAILED,
         {"A file could not be opened.",
          "Check file permissions."}},
        {Code::FILE_WRITE_FAILED,
         {"A file could not be written.",
          "Check free disk space and permissions."}},
        {Code::DIRECTORY_CREATE_FAILED,
         {"A directory could not be created.",
          "Check permissions of the parent directory."}},
        {Code::JOURNAL_LOAD_FAILED,
         {"The undo journal could not be read.",
          "Check permissions of the state directory."}},
        {Code::JOURNAL_CORRUPTED,
         {"The undo journal is corrupted.",
          "The damaged records were quarantined; inspect them before undoing by hand."}},
        {Code::JOURNAL_WRITE_FAILED,
         {"The undo journal could not be written.",
          "Check free disk space and permissions of the state directory."}},
        {Code::JOURNAL_BUSY,
         {"Another apply or undo is already running.",
          "Wait for the running operation to finish."}},
        {Code::JOURNAL_BATCH_NOT_FOUND,
         {"The requested batch is not in the undo journal.",
          "List batches with the 'batches' command."}},
        {Code::CONFIG_PARSE_ERROR,
         {"The configuration file could not be parsed.",
          "Fix or delete config.ini."}},
        {Code::CONFIG_INVALID_VALUE,
         {"A configuration value is invalid.",
          "Correct the value in config.ini or on the command line."}},
        {Code::CONFIG_SAVE_FAILED,
         {"The configuration could not be saved.",
          "Check permissions of the configuration directory."}},
        {Code::CLI_INVALID_ARGUMENT,
         {"Invalid command line argument.",
          "Run with --help to see the supported options."}},
        {Code::CLI_MISSING_VALUE,
         {"A command line option is missing its value.",
          "Run with --help to see the supported options."}},
    };
    return entries;
}

} // namespace

std::string ErrorInfo::get_user_message() const
{
    if (resolution.empty()) {
        return message;
    }
    return fmt::format("{}\n{}", message, resolution);
}

std::string ErrorInfo::get_full_details() const
{
    std::string details = fmt::format("Error {}: {}", static_cast<int>(code), message);
    if (!context.empty()) {
        details += fmt::format("\nDetails: {}", context);
    }
    if (!resolution.empty()) {
        details += fmt::format("\nResolution: {}", resolution);
    }
    return details;
}

ErrorInfo ErrorCatalog::get_error_info(Code code, const std::string& context)
{
    const auto& entries = catalog();
    auto it = entries.find(code);
    if (it == entries.end()) {
        it = entries.find(Code::UNKNOWN_ERROR);
    }
    return ErrorInfo(code, it->second.message, it->second.resolution, context);
}

} // namespace ErrorCodes
