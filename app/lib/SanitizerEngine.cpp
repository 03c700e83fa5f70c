#include "SanitizerEngine.hpp"
#include "AppException.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#include <utility>

SanitizerEngine::SanitizerEngine(IVersionControlAdapter& adapter,
                                 UndoJournal& journal,
                                 ScanConfig config,
                                 int threads,
                                 std::shared_ptr<spdlog::logger> logger)
    : adapter_(adapter),
      journal_(journal),
      config_(config),
      threads_(threads),
      logger_(std::move(logger))
{
}


std::vector<PathEntry> SanitizerEngine::snapshot()
{
    return adapter_.list_tracked();
}


ScanResult SanitizerEngine::scan(const std::vector<PathEntry>& entries,
                                 std::atomic<bool>& stop_flag,
                                 const PlanOptions& options,
                                 const ScanService::ProgressCallback& progress_callback) const
{
    ScanService service(config_, threads_, logger_);
    return service.scan(entries, stop_flag, options, progress_callback);
}


ApplyResult SanitizerEngine::apply_plan(const RenamePlan& plan, bool verify_snapshot)
{
    if (verify_snapshot && !plan.empty()) {
        const std::string current = ConflictResolver::snapshot_id(adapter_.list_tracked());
        if (current != plan.snapshot_id) {
            if (logger_) {
                logger_->warn("Plan snapshot {} does not match current tree {}", plan.snapshot_id, current);
            }
            THROW_APP_ERROR(ErrorCodes::Code::PLAN_STALE_SNAPSHOT,
                            fmt::format("plan {} vs tree {}", plan.snapshot_id, current));
        }
    }
    RenameExecutor executor(adapter_, journal_, logger_);
    return executor.apply(plan);
}


RevertResult SanitizerEngine::revert_batch(const std::string& batch_id)
{
    return journal_.revert(batch_id, adapter_);
}


std::vector<BatchSummary> SanitizerEngine::list_batches() const
{
    return journal_.list_batches();
}
