#ifndef SANITIZER_ENGINE_HPP
#define SANITIZER_ENGINE_HPP

#include "ConflictResolver.hpp"
#include "IVersionControlAdapter.hpp"
#include "RenameExecutor.hpp"
#include "ScanService.hpp"
#include "Types.hpp"
#include "UndoJournal.hpp"

#include <atomic>
#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>

/**
 * @brief Entry point for presentation layers.
 *
 * Ties one adapter and one journal to the scan, plan, apply and revert
 * phases. The engine owns neither; callers keep them alive.
 */
class SanitizerEngine {
public:
    SanitizerEngine(IVersionControlAdapter& adapter,
                    UndoJournal& journal,
                    ScanConfig config,
                    int threads = 0,
                    std::shared_ptr<spdlog::logger> logger = nullptr);

    std::vector<PathEntry> snapshot();

    ScanResult scan(const std::vector<PathEntry>& entries,
                    std::atomic<bool>& stop_flag,
                    const PlanOptions& options = PlanOptions{},
                    const ScanService::ProgressCallback& progress_callback = ScanService::ProgressCallback{}) const;

    // Rejects the plan with PLAN_STALE_SNAPSHOT when the tracked tree changed since it was made.
    ApplyResult apply_plan(const RenamePlan& plan, bool verify_snapshot = true);

    RevertResult revert_batch(const std::string& batch_id);
    std::vector<BatchSummary> list_batches() const;

    const ScanConfig& config() const { return config_; }

private:
    IVersionControlAdapter& adapter_;
    UndoJournal& journal_;
    ScanConfig config_;
    int threads_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif
