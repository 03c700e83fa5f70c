#include "GitAdapter.hpp"
#include "AppException.hpp"
#include "Utils.hpp"

#include <QProcess>
#include <QProcessEnvironment>
#include <QStandardPaths>
#include <QString>

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

constexpr int kGitTimeoutMs = 120000;
constexpr const char* kSymlinkMode = "120000";

std::vector<std::string> split_nul(const QByteArray& data)
{
    std::vector<std::string> items;
    for (const QByteArray& part : data.split('\0')) {
        if (!part.isEmpty()) {
            items.emplace_back(part.constData(), static_cast<std::size_t>(part.size()));
        }
    }
    return items;
}

std::string trimmed(const std::string& value)
{
    const auto first = value.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) {
        return std::string();
    }
    const auto last = value.find_last_not_of(" \t\r\n");
    return value.substr(first, last - first + 1);
}

bool contains(const std::string& haystack, const char* needle)
{
    return haystack.find(needle) != std::string::npos;
}

AdapterErrorKind classify_mv_error(const std::string& stderr_text)
{
    if (contains(stderr_text, "bad source") || contains(stderr_text, "does not exist")) {
        return AdapterErrorKind::NotFound;
    }
    if (contains(stderr_text, "destination exists") || contains(stderr_text, "already exists")) {
        return AdapterErrorKind::TargetExists;
    }
    if (contains(stderr_text, "not under version control") || contains(stderr_text, "is empty")) {
        return AdapterErrorKind::Unsupported;
    }
    return AdapterErrorKind::Other;
}

} // namespace


GitAdapter::GitAdapter(std::string repo_root,
                       bool include_ignored,
                       std::shared_ptr<spdlog::logger> logger)
    : repo_root_(std::move(repo_root)),
      include_ignored_(include_ignored),
      logger_(std::move(logger))
{
}


GitAdapter::GitResult GitAdapter::run_git(const std::string& working_dir, const QStringList& args)
{
    GitResult result;
    const QString git = QStandardPaths::findExecutable(QStringLiteral("git"));
    if (git.isEmpty()) {
        result.error = "git executable not found in PATH";
        return result;
    }

    QProcessEnvironment environment = QProcessEnvironment::systemEnvironment();
    environment.insert(QStringLiteral("GIT_PAGER"), QStringLiteral("cat"));
    environment.insert(QStringLiteral("LC_ALL"), QStringLiteral("C"));

    QStringList full_args;
    full_args << QStringLiteral("-C") << QString::fromStdString(working_dir) << args;

    QProcess process;
    process.setProcessEnvironment(environment);
    process.start(git, full_args);
    if (!process.waitForStarted()) {
        result.error = process.errorString().toStdString();
        return result;
    }
    result.started = true;
    if (!process.waitForFinished(kGitTimeoutMs)) {
        process.kill();
        process.waitForFinished();
        result.error = "git did not finish in time";
        return result;
    }
    result.exit_code = process.exitStatus() == QProcess::NormalExit ? process.exitCode() : -1;
    result.output = process.readAllStandardOutput();
    const QByteArray err = process.readAllStandardError();
    result.error = trimmed(std::string(err.constData(), static_cast<std::size_t>(err.size())));
    return result;
}


GitAdapter::GitResult GitAdapter::run_checked(const QStringList& args) const
{
    GitResult result = run_git(repo_root_, args);
    const std::string command = fmt::format("git {}", args.join(QLatin1Char(' ')).toStdString());
    if (!result.started) {
        if (logger_) {
            logger_->error("Could not run '{}': {}", command, result.error);
        }
        THROW_APP_ERROR(ErrorCodes::Code::VCS_EXECUTABLE_MISSING, result.error);
    }
    if (result.exit_code != 0) {
        if (logger_) {
            logger_->error("'{}' exited with {}: {}", command, result.exit_code, result.error);
        }
        THROW_APP_ERROR(ErrorCodes::Code::VCS_COMMAND_FAILED, fmt::format("{}: {}", command, result.error));
    }
    return result;
}


bool GitAdapter::is_git_available()
{
    return !QStandardPaths::findExecutable(QStringLiteral("git")).isEmpty();
}


bool GitAdapter::is_git_repo(const std::string& path)
{
    const GitResult result = run_git(path, {QStringLiteral("rev-parse"), QStringLiteral("--is-inside-work-tree")});
    return result.started && result.exit_code == 0 && result.output.trimmed() == "true";
}


std::string GitAdapter::repo_root(const std::string& path)
{
    const GitResult result = run_git(path, {QStringLiteral("rev-parse"), QStringLiteral("--show-toplevel")});
    if (!result.started) {
        THROW_APP_ERROR(ErrorCodes::Code::VCS_EXECUTABLE_MISSING, result.error);
    }
    if (result.exit_code != 0) {
        THROW_APP_ERROR(ErrorCodes::Code::REPO_NOT_A_WORK_TREE, path);
    }
    const QByteArray root = result.output.trimmed();
    return std::string(root.constData(), static_cast<std::size_t>(root.size()));
}


std::vector<PathEntry> GitAdapter::list_tracked()
{
    std::vector<PathEntry> entries;
    std::set<std::string> seen;

    const GitResult tracked = run_checked({QStringLiteral("ls-files"), QStringLiteral("-z"), QStringLiteral("-s")});
    for (const auto& record : split_nul(tracked.output)) {
        // <mode> <object> <stage>\t<path>
        const auto tab = record.find('\t');
        if (tab == std::string::npos) {
            continue;
        }
        const std::string path = record.substr(tab + 1);
        if (!seen.insert(path).second) {
            continue;
        }
        const bool symlink = record.compare(0, 6, kSymlinkMode) == 0;
        entries.push_back(PathEntry::from_string(path, symlink ? EntryKind::Symlink : EntryKind::File));
    }

    ignored_paths_.clear();
    if (include_ignored_) {
        const GitResult ignored = run_checked({QStringLiteral("ls-files"), QStringLiteral("-z"),
                                               QStringLiteral("--others"), QStringLiteral("-i"),
                                               QStringLiteral("--exclude-standard")});
        for (const auto& path : split_nul(ignored.output)) {
            if (!seen.insert(path).second) {
                continue;
            }
            ignored_paths_.insert(path);
            entries.push_back(PathEntry::from_string(path, EntryKind::File));
        }
    }

    if (logger_) {
        logger_->info("Listed {} tracked and {} ignored path(s) in {}",
                      entries.size() - ignored_paths_.size(), ignored_paths_.size(), repo_root_);
    }
    return Utils::with_parent_directories(entries);
}


MoveOutcome GitAdapter::move(const std::string& source, const std::string& target)
{
    const fs::path root = Utils::utf8_to_path(repo_root_);
    const fs::path source_path = root / Utils::utf8_to_path(source);
    const fs::path target_path = root / Utils::utf8_to_path(target);

    std::error_code ec;
    if (!fs::exists(fs::symlink_status(source_path, ec))) {
        return MoveOutcome::failure(AdapterErrorKind::NotFound, fmt::format("'{}' does not exist", source));
    }
    if (fs::exists(fs::symlink_status(target_path, ec))) {
        // A case-only rename sees the source itself on case-insensitive filesystems.
        if (!fs::equivalent(source_path, target_path, ec) || ec) {
            return MoveOutcome::failure(AdapterErrorKind::TargetExists, fmt::format("'{}' already exists", target));
        }
    }

    if (ignored_paths_.contains(source)) {
        return move_untracked(source, target);
    }

    const GitResult result = run_git(repo_root_, {QStringLiteral("mv"), QStringLiteral("--"),
                                                  QString::fromStdString(source),
                                                  QString::fromStdString(target)});
    if (!result.started) {
        if (logger_) {
            logger_->error("git mv could not start: {}", result.error);
        }
        return MoveOutcome::failure(AdapterErrorKind::Unsupported, result.error);
    }
    if (result.exit_code == 0) {
        if (logger_) {
            logger_->debug("git mv '{}' -> '{}'", source, target);
        }
        rebase_ignored(source, target);
        return MoveOutcome::success();
    }

    const AdapterErrorKind kind = classify_mv_error(result.error);
    const std::string prefix = source + "/";
    const bool holds_ignored = std::any_of(ignored_paths_.begin(), ignored_paths_.end(),
        [&prefix](const std::string& path) { return path.compare(0, prefix.size(), prefix) == 0; });
    if (kind == AdapterErrorKind::Unsupported && holds_ignored) {
        return move_untracked(source, target);
    }

    if (logger_) {
        logger_->warn("git mv '{}' -> '{}' failed: {}", source, target, result.error);
    }
    return MoveOutcome::failure(kind, result.error.empty() ? "git mv failed" : result.error);
}


MoveOutcome GitAdapter::move_untracked(const std::string& source, const std::string& target)
{
    const fs::path root = Utils::utf8_to_path(repo_root_);
    std::error_code ec;
    fs::rename(root / Utils::utf8_to_path(source), root / Utils::utf8_to_path(target), ec);
    if (ec) {
        return MoveOutcome::failure(AdapterErrorKind::Other, ec.message());
    }
    if (logger_) {
        logger_->debug("Moved untracked '{}' -> '{}'", source, target);
    }
    rebase_ignored(source, target);
    return MoveOutcome::success();
}


void GitAdapter::rebase_ignored(const std::string& source, const std::string& target)
{
    const std::string prefix = source + "/";
    std::set<std::string> rebased;
    for (const auto& path : ignored_paths_) {
        if (path == source) {
            rebased.insert(target);
        } else if (path.compare(0, prefix.size(), prefix) == 0) {
            rebased.insert(target + path.substr(source.size()));
        } else {
            rebased.insert(path);
        }
    }
    ignored_paths_ = std::move(rebased);
}


bool GitAdapter::has_uncommitted_changes() const
{
    const GitResult result = run_checked({QStringLiteral("status"), QStringLiteral("--porcelain")});
    return !result.output.trimmed().isEmpty();
}


std::vector<std::string> GitAdapter::list_submodules() const
{
    std::vector<std::string> submodules;
    const GitResult result = run_git(repo_root_, {QStringLiteral("submodule"), QStringLiteral("status"),
                                                  QStringLiteral("--recursive")});
    if (!result.started || result.exit_code != 0) {
        if (logger_) {
            logger_->debug("No submodule listing for {}: {}", repo_root_, result.error);
        }
        return submodules;
    }
    // " <sha> <path> (<describe>)", first column is a status flag
    for (const QString& line : QString::fromUtf8(result.output).split(QLatin1Char('\n'))) {
        const QStringList parts = line.trimmed().split(QLatin1Char(' '), Qt::SkipEmptyParts);
        if (parts.size() >= 2) {
            submodules.push_back(parts.at(1).toStdString());
        }
    }
    return submodules;
}
