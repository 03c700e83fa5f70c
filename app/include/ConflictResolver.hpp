#ifndef CONFLICT_RESOLVER_HPP
#define CONFLICT_RESOLVER_HPP

#include "PathValidator.hpp"
#include "Types.hpp"

#include <map>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace spdlog { class logger; }

struct PlanOptions {
    // Original paths the user deselected; they keep their names.
    std::set<std::string> excluded;
    // Original path -> edited proposal. Only the last segment of the edit is used.
    std::map<std::string, std::string> edited;
};

struct CollisionGroups {
    std::map<std::string, std::vector<std::string>> case_insensitive;
    std::map<std::string, std::vector<std::string>> nfc;
};

struct PlanResult {
    RenamePlan plan;
    // Every path with at least one violation, carrying its final proposal.
    std::vector<ValidationResult> findings;
    std::vector<Violation> violations;
    std::vector<Violation> unresolved;
    std::vector<Proposal> proposals;
    std::vector<std::string> warnings;
    CollisionGroups collisions;
};

class ConflictResolver {
public:
    explicit ConflictResolver(ScanConfig config,
                              std::shared_ptr<spdlog::logger> logger = nullptr);

    PlanResult plan(const std::vector<PathEntry>& entries,
                    const PlanOptions& options = PlanOptions{}) const;

    // Uses validation results computed elsewhere (e.g. by the parallel scan).
    PlanResult plan(const std::vector<PathEntry>& entries,
                    const std::vector<ValidationResult>& validations,
                    const PlanOptions& options) const;

    static std::string snapshot_id(const std::vector<PathEntry>& entries);

private:
    ScanConfig config_;
    PathValidator validator_;
    std::shared_ptr<spdlog::logger> logger_;
};

#endif
