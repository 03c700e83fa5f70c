#ifndef SCAN_SERVICE_HPP
#define SCAN_SERVICE_HPP

#include "ConflictResolver.hpp"
#include "PathValidator.hpp"
#include "Types.hpp"

#include <atomic>
#include <cstddef>
#include <functional>
#include <memory>
#include <optional>
#include <vector>

namespace spdlog { class logger; }

struct ScanResult {
    // Validation results in snapshot order; only the scanned prefix when cancelled.
    std::vector<ValidationResult> results;
    std::size_t total{0};
    bool cancelled{false};
    // Empty when cancelled.
    std::optional<PlanResult> plan;
};

/**
 * @brief Validates a snapshot on a pool of worker threads, then plans it.
 *
 * Workers pull paths from a shared cursor and check the stop flag before
 * each one. Planning runs on the calling thread after every worker joined.
 */
class ScanService {
public:
    using ProgressCallback = std::function<void(std::size_t done, std::size_t total)>;

    explicit ScanService(ScanConfig config,
                         int threads = 0,
                         std::shared_ptr<spdlog::logger> logger = nullptr);

    ScanResult scan(const std::vector<PathEntry>& entries,
                    std::atomic<bool>& stop_flag,
                    const PlanOptions& options = PlanOptions{},
                    const ProgressCallback& progress_callback = ProgressCallback{}) const;

    std::size_t worker_count(std::size_t entry_count) const;

private:
    ScanConfig config_;
    int threads_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif
