#ifndef RENAME_EXECUTOR_HPP
#define RENAME_EXECUTOR_HPP

#include "IVersionControlAdapter.hpp"
#include "Types.hpp"
#include "UndoJournal.hpp"

#include <cstddef>
#include <memory>
#include <optional>

#include <spdlog/logger.h>

struct ApplyResult {
    // Empty when no operation was applied.
    std::optional<Batch> batch;
    // Sequence index of the first operation that did not complete.
    std::optional<std::size_t> failed_at;
    std::optional<AdapterError> error;

    bool ok() const { return !failed_at.has_value(); }
    std::size_t applied_count() const { return batch ? batch->operations.size() : 0; }
};

class RenameExecutor {
public:
    RenameExecutor(IVersionControlAdapter& adapter,
                   UndoJournal& journal,
                   std::shared_ptr<spdlog::logger> logger = nullptr);

    // Applies the operations in order and stops at the first adapter error.
    // Completed operations are not rolled back.
    ApplyResult apply(const RenamePlan& plan);

private:
    IVersionControlAdapter& adapter_;
    UndoJournal& journal_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif
