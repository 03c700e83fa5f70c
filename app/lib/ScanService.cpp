#include "ScanService.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <exception>
#include <mutex>
#include <thread>
#include <utility>

ScanService::ScanService(ScanConfig config,
                         int threads,
                         std::shared_ptr<spdlog::logger> logger)
    : config_(config),
      threads_(threads),
      logger_(std::move(logger))
{
}


std::size_t ScanService::worker_count(std::size_t entry_count) const
{
    std::size_t count = threads_ > 0 ? static_cast<std::size_t>(threads_)
                                     : static_cast<std::size_t>(std::thread::hardware_concurrency());
    if (count == 0) {
        count = 1;
    }
    return std::max<std::size_t>(1, std::min(count, entry_count));
}


ScanResult ScanService::scan(const std::vector<PathEntry>& entries,
                             std::atomic<bool>& stop_flag,
                             const PlanOptions& options,
                             const ProgressCallback& progress_callback) const
{
    ScanResult result;
    result.total = entries.size();

    const PathValidator validator(config_);
    std::vector<std::optional<ValidationResult>> slots(entries.size());
    std::atomic<std::size_t> cursor{0};
    std::size_t done = 0;
    std::mutex progress_mutex;
    std::exception_ptr failure;

    auto worker = [&]() {
        try {
            for (;;) {
                if (stop_flag.load()) {
                    return;
                }
                const std::size_t index = cursor.fetch_add(1);
                if (index >= entries.size()) {
                    return;
                }
                slots[index] = validator.validate(entries[index]);

                std::lock_guard<std::mutex> lock(progress_mutex);
                ++done;
                if (progress_callback) {
                    progress_callback(done, entries.size());
                }
            }
        } catch (...) {
            std::lock_guard<std::mutex> lock(progress_mutex);
            if (!failure) {
                failure = std::current_exception();
            }
            stop_flag.store(true);
        }
    };

    const std::size_t count = worker_count(entries.size());
    if (logger_) {
        logger_->debug("Validating {} path(s) on {} worker(s)", entries.size(), count);
    }
    std::vector<std::thread> workers;
    workers.reserve(count);
    for (std::size_t i = 0; i < count; ++i) {
        workers.emplace_back(worker);
    }
    for (auto& thread : workers) {
        thread.join();
    }
    if (failure) {
        std::rethrow_exception(failure);
    }

    for (auto& slot : slots) {
        if (slot) {
            result.results.push_back(std::move(*slot));
        }
    }
    result.cancelled = result.results.size() < entries.size();

    if (result.cancelled) {
        if (logger_) {
            logger_->info("Scan cancelled after {} of {} path(s)", result.results.size(), entries.size());
        }
        return result;
    }

    ConflictResolver resolver(config_, logger_);
    result.plan = resolver.plan(entries, result.results, options);
    return result;
}
