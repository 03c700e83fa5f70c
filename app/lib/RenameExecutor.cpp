#include "RenameExecutor.hpp"

#include <spdlog/spdlog.h>

#include <utility>

RenameExecutor::RenameExecutor(IVersionControlAdapter& adapter,
                               UndoJournal& journal,
                               std::shared_ptr<spdlog::logger> logger)
    : adapter_(adapter),
      journal_(journal),
      logger_(std::move(logger))
{
}


ApplyResult RenameExecutor::apply(const RenamePlan& plan)
{
    ApplyResult result;
    if (plan.empty()) {
        return result;
    }

    UndoJournal::WriteSession session(journal_);
    const std::string batch_id = session.begin_batch(plan.snapshot_id);
    if (logger_) {
        logger_->info("Applying {} operation(s) as batch {}", plan.operations.size(), batch_id);
    }

    for (const auto& operation : plan.operations) {
        const MoveOutcome outcome = adapter_.move(operation.source_path, operation.target_path);
        if (!outcome.ok()) {
            result.failed_at = operation.sequence_index;
            result.error = outcome.error;
            if (logger_) {
                logger_->error("Operation {} '{}' -> '{}' failed ({}): {}",
                               operation.sequence_index, operation.source_path, operation.target_path,
                               to_string(outcome.error->kind), outcome.error->detail);
            }
            break;
        }
        session.record_applied(operation);
        if (logger_) {
            logger_->debug("Applied {} '{}' -> '{}'", operation.sequence_index,
                           operation.source_path, operation.target_path);
        }
    }

    result.batch = session.finalize_batch();
    if (logger_) {
        logger_->info("Batch {}: {} of {} operation(s) applied", batch_id,
                      result.applied_count(), plan.operations.size());
    }
    return result;
}
