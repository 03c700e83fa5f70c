#ifndef TYPES_HPP
#define TYPES_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <utility>
#include <vector>

enum class EntryKind {File, Directory, Symlink};

inline std::string to_string(EntryKind kind) {
    switch (kind) {
        case EntryKind::File: return "File";
        case EntryKind::Directory: return "Directory";
        case EntryKind::Symlink: return "Symlink";
        default: return "Unknown";
    }
}

enum class RuleKind {
    ForbiddenCharacter,
    ReservedDeviceName,
    TrailingSpaceOrPeriod,
    PathTooLong,
    CaseInsensitiveCollision,
    UnicodeNormalizationCollision,
    SymlinkEntry
};

inline std::string to_string(RuleKind rule) {
    switch (rule) {
        case RuleKind::ForbiddenCharacter: return "FORBIDDEN_CHARS";
        case RuleKind::ReservedDeviceName: return "RESERVED_DEVICE";
        case RuleKind::TrailingSpaceOrPeriod: return "TRAILING_SPACE_PERIOD";
        case RuleKind::PathTooLong: return "PATH_TOO_LONG";
        case RuleKind::CaseInsensitiveCollision: return "CASE_COLLISION";
        case RuleKind::UnicodeNormalizationCollision: return "UNICODE_NFC_COLLISION";
        case RuleKind::SymlinkEntry: return "SYMLINK";
        default: return "UNKNOWN";
    }
}

enum class Severity {Blocking, Warning};

inline std::string to_string(Severity severity) {
    return severity == Severity::Blocking ? "Blocking" : "Warning";
}

/**
 * @brief A tracked path captured in a snapshot, split into segments.
 */
struct PathEntry {
    std::vector<std::string> segments;
    EntryKind kind{EntryKind::File};

    static PathEntry from_string(const std::string& rel_path, EntryKind kind) {
        PathEntry entry;
        entry.kind = kind;
        std::size_t start = 0;
        while (start <= rel_path.size()) {
            const auto slash = rel_path.find('/', start);
            const auto end = slash == std::string::npos ? rel_path.size() : slash;
            if (end > start) {
                entry.segments.push_back(rel_path.substr(start, end - start));
            }
            if (slash == std::string::npos) {
                break;
            }
            start = slash + 1;
        }
        return entry;
    }

    std::string path() const {
        std::string joined;
        for (std::size_t i = 0; i < segments.size(); ++i) {
            if (i > 0) {
                joined += '/';
            }
            joined += segments[i];
        }
        return joined;
    }
    std::size_t depth() const { return segments.empty() ? 0 : segments.size() - 1; }

    bool operator==(const PathEntry& other) const {
        return segments == other.segments && kind == other.kind;
    }
};

struct Violation {
    std::string path;
    RuleKind rule;
    std::string detail;
    Severity severity{Severity::Blocking};
};

struct Proposal {
    std::string source_path;
    std::string proposed_path;
    std::vector<RuleKind> rationale;
};

/**
 * @brief Alternative fix offered to the presentation layer for one path.
 */
struct FixOption {
    std::string key;
    std::string label;
    std::string preview_path;
    std::vector<std::string> notes;
};

enum class OperationRole {Rename, CycleBreak, CycleCleanup};

inline std::string to_string(OperationRole role) {
    switch (role) {
        case OperationRole::Rename: return "rename";
        case OperationRole::CycleBreak: return "cycle-break";
        case OperationRole::CycleCleanup: return "cycle-cleanup";
        default: return "unknown";
    }
}

struct Operation {
    std::string source_path;
    std::string target_path;
    std::size_t sequence_index{0};
    OperationRole role{OperationRole::Rename};

    bool operator==(const Operation& other) const {
        return source_path == other.source_path
            && target_path == other.target_path
            && sequence_index == other.sequence_index;
    }
};

struct RenamePlan {
    std::vector<Operation> operations;
    std::string snapshot_id;

    bool empty() const { return operations.empty(); }
};

struct Batch {
    std::string batch_id;
    std::string snapshot_id;
    std::vector<Operation> operations;
    std::string timestamp;
    std::size_t reverted_count{0};
    bool completed{false};
};

struct BatchSummary {
    std::string batch_id;
    std::string timestamp;
    std::size_t operation_count{0};
    std::size_t reverted_count{0};
    bool completed{false};
};

enum class AdapterErrorKind {NotFound, TargetExists, Unsupported, Other};

inline std::string to_string(AdapterErrorKind kind) {
    switch (kind) {
        case AdapterErrorKind::NotFound: return "NotFound";
        case AdapterErrorKind::TargetExists: return "TargetExists";
        case AdapterErrorKind::Unsupported: return "Unsupported";
        case AdapterErrorKind::Other: return "Other";
        default: return "Unknown";
    }
}

struct AdapterError {
    AdapterErrorKind kind{AdapterErrorKind::Other};
    std::string detail;
};

/**
 * @brief Result of a single adapter move; `error` is empty on success.
 */
struct MoveOutcome {
    std::optional<AdapterError> error;

    bool ok() const { return !error.has_value(); }

    static MoveOutcome success() { return MoveOutcome{}; }
    static MoveOutcome failure(AdapterErrorKind kind, std::string detail) {
        return MoveOutcome{AdapterError{kind, std::move(detail)}};
    }
};

struct ScanConfig {
    int max_path{260};
    bool normalize_unicode_nfc{false};
    bool collapse_spaces{false};
    bool auto_disambiguate{true};
};

#endif
