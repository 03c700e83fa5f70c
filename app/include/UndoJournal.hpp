#ifndef UNDO_JOURNAL_HPP
#define UNDO_JOURNAL_HPP

#include "IVersionControlAdapter.hpp"
#include "Types.hpp"

#include <atomic>
#include <cstddef>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include <spdlog/logger.h>

enum class RevertStatus {Reverted, NotFound, Conflict, AdapterFailure};

inline std::string to_string(RevertStatus status) {
    switch (status) {
        case RevertStatus::Reverted: return "reverted";
        case RevertStatus::NotFound: return "not-found";
        case RevertStatus::Conflict: return "conflict";
        case RevertStatus::AdapterFailure: return "adapter-failure";
        default: return "unknown";
    }
}

struct RevertResult {
    RevertStatus status{RevertStatus::NotFound};
    std::string batch_id;
    // Position in the batch of the first operation that could not be reverted.
    std::optional<std::size_t> failed_at;
    std::optional<AdapterError> error;
    std::size_t reverted_operations{0};
    std::string message;

    bool ok() const { return status == RevertStatus::Reverted; }
};

/**
 * @brief Durable, per-repository log of applied rename batches.
 *
 * The journal is a single JSON document rewritten atomically after every
 * change. Writes go through a WriteSession; only one session may be open at
 * a time and a second caller gets JOURNAL_BUSY.
 */
class UndoJournal {
public:
    class WriteSession {
    public:
        explicit WriteSession(UndoJournal& journal);
        ~WriteSession();
        WriteSession(const WriteSession&) = delete;
        WriteSession& operator=(const WriteSession&) = delete;

        const std::string& begin_batch(const std::string& snapshot_id);
        void record_applied(const Operation& operation);
        // Closes the open batch; a batch without operations is dropped.
        std::optional<Batch> finalize_batch();

    private:
        UndoJournal& journal_;
        std::optional<Batch> open_batch_;
    };

    explicit UndoJournal(std::filesystem::path file,
                         std::shared_ptr<spdlog::logger> logger = nullptr);

    // <state dir>/journal_<repo key>.json where the key hashes the repository root.
    static std::filesystem::path path_for_repository(const std::filesystem::path& directory,
                                                     const std::string& repo_root);

    void load();

    std::vector<BatchSummary> list_batches() const;
    std::optional<Batch> find_batch(const std::string& batch_id) const;
    std::optional<Batch> latest_batch() const;
    std::vector<std::string> quarantined() const;
    std::vector<std::string> load_warnings() const;
    const std::filesystem::path& file() const { return file_; }

    // Accepts a batch id or "latest".
    RevertResult revert(const std::string& batch_id, IVersionControlAdapter& adapter);

private:
    void persist() const;
    std::string next_batch_id();
    std::optional<std::string> find_later_overlap(std::size_t index) const;

    std::filesystem::path file_;
    std::shared_ptr<spdlog::logger> logger_;
    mutable std::mutex mutex_;
    std::atomic<bool> session_open_{false};

    std::vector<Batch> batches_;
    std::vector<std::string> quarantined_;
    std::vector<std::string> load_warnings_;
    std::size_t id_sequence_{0};
};

#endif
