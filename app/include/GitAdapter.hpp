#ifndef GIT_ADAPTER_HPP
#define GIT_ADAPTER_HPP

#include "IVersionControlAdapter.hpp"
#include "Types.hpp"

#include <QByteArray>
#include <QStringList>

#include <memory>
#include <set>
#include <string>
#include <vector>

#include <spdlog/logger.h>

/**
 * @brief Version control adapter backed by the git executable.
 *
 * Tracked paths come from `git ls-files -z -s`; moves are `git mv`, which
 * records the rename in the index so history follows the new name. Ignored
 * files, when included, are moved on the filesystem since git has no
 * history for them.
 */
class GitAdapter : public IVersionControlAdapter {
public:
    explicit GitAdapter(std::string repo_root,
                        bool include_ignored = false,
                        std::shared_ptr<spdlog::logger> logger = nullptr);

    std::vector<PathEntry> list_tracked() override;
    MoveOutcome move(const std::string& source, const std::string& target) override;

    bool has_uncommitted_changes() const;
    std::vector<std::string> list_submodules() const;
    const std::string& root() const { return repo_root_; }

    static bool is_git_available();
    static bool is_git_repo(const std::string& path);
    // Top level of the work tree containing `path`; throws when there is none.
    static std::string repo_root(const std::string& path);

private:
    struct GitResult {
        bool started{false};
        int exit_code{-1};
        QByteArray output;
        std::string error;
    };

    static GitResult run_git(const std::string& working_dir, const QStringList& args);
    GitResult run_checked(const QStringList& args) const;
    MoveOutcome move_untracked(const std::string& source, const std::string& target);
    // Keeps the ignored set pointing at live paths after a move.
    void rebase_ignored(const std::string& source, const std::string& target);

    std::string repo_root_;
    bool include_ignored_;
    std::shared_ptr<spdlog::logger> logger_;
    std::set<std::string> ignored_paths_;
};

#endif
