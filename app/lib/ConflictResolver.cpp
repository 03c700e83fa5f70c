#include "ConflictResolver.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <fmt/ranges.h>
#include <spdlog/spdlog.h>

#include <algorithm>
#include <limits>
#include <map>
#include <unordered_map>
#include <unordered_set>
#include <utility>

namespace {

constexpr std::size_t kRoot = 0;
constexpr std::size_t kNone = std::numeric_limits<std::size_t>::max();
constexpr std::size_t kSnapshotIdLength = 16;

struct Demand {
    std::string name;
    std::vector<RuleKind> rationale;
};

struct PlanNode {
    std::string name;
    std::string path;
    EntryKind kind{EntryKind::Directory};
    std::size_t parent{kRoot};
    std::size_t depth{0};
    std::vector<std::size_t> children;

    bool pinned{false};
    std::vector<Demand> demands;

    std::string final_name;
    std::vector<RuleKind> rationale;

    std::string current_name;
    std::string current_key;
    std::string live_key;
};

void add_rule(std::vector<RuleKind>& rules, RuleKind rule)
{
    if (std::find(rules.begin(), rules.end(), rule) == rules.end()) {
        rules.push_back(rule);
    }
}

bool has_blocking(const std::vector<Violation>& violations)
{
    return std::any_of(violations.begin(), violations.end(), [](const Violation& v) {
        return v.severity == Severity::Blocking;
    });
}

std::string join_paths(const std::vector<std::string>& paths)
{
    return fmt::format("[{}]", fmt::join(paths, ", "));
}

class PlanBuilder {
public:
    PlanBuilder(const PathValidator& validator,
                const ScanConfig& config,
                const std::shared_ptr<spdlog::logger>& logger)
        : validator(validator), config(config), logger(logger)
    {
        nodes.emplace_back();
    }

    PlanResult build(const std::vector<PathEntry>& entries,
                     const std::unordered_map<std::string, const ValidationResult*>& given,
                     const PlanOptions& options)
    {
        for (const auto& entry : entries) {
            add_entry(entry);
        }
        validate_nodes(given);
        detect_snapshot_collisions();
        apply_options(options);
        collect_demands();

        for (;;) {
            collision_records.clear();
            collision_unresolved.clear();
            collision_warnings.clear();
            resolve_demands();
            resolve_sibling_collisions();
            if (!pin_unresolvable_renames()) {
                break;
            }
        }

        report();
        schedule();
        result.plan.snapshot_id = ConflictResolver::snapshot_id(entries);

        if (logger) {
            logger->info("Planned {} operation(s) over {} path(s); {} unresolved violation(s)",
                         result.plan.operations.size(), nodes.size() - 1, result.unresolved.size());
        }
        return std::move(result);
    }

private:
    std::size_t add_entry(const PathEntry& entry)
    {
        std::size_t parent = kRoot;
        std::string prefix;
        for (std::size_t i = 0; i < entry.segments.size(); ++i) {
            prefix = i == 0 ? entry.segments[i] : prefix + "/" + entry.segments[i];
            const bool leaf = i + 1 == entry.segments.size();
            auto it = index_by_path.find(prefix);
            if (it != index_by_path.end()) {
                if (leaf) {
                    nodes[it->second].kind = entry.kind;
                }
                parent = it->second;
                continue;
            }
            PlanNode node;
            node.name = entry.segments[i];
            node.path = prefix;
            node.kind = leaf ? entry.kind : EntryKind::Directory;
            node.parent = parent;
            node.depth = i;
            const std::size_t index = nodes.size();
            nodes.push_back(std::move(node));
            nodes[parent].children.push_back(index);
            index_by_path.emplace(prefix, index);
            parent = index;
        }
        return parent;
    }

    PathEntry node_entry(std::size_t index) const
    {
        return PathEntry::from_string(nodes[index].path, nodes[index].kind);
    }

    void validate_nodes(const std::unordered_map<std::string, const ValidationResult*>& given)
    {
        validations.resize(nodes.size());
        for (std::size_t i = 1; i < nodes.size(); ++i) {
            auto it = given.find(nodes[i].path);
            if (it != given.end() && it->second) {
                validations[i] = *it->second;
            } else {
                validations[i] = validator.validate(node_entry(i));
            }
            snapshot_keys.insert(Utils::collision_key(nodes[i].path));
        }
    }

    void detect_snapshot_collisions()
    {
        std::map<std::string, std::vector<std::size_t>> by_key;
        std::map<std::string, std::vector<std::size_t>> by_nfc;
        for (std::size_t i = 1; i < nodes.size(); ++i) {
            by_key[Utils::collision_key(nodes[i].path)].push_back(i);
            by_nfc[Utils::normalize_nfc(nodes[i].path)].push_back(i);
        }

        for (const auto& [key, members] : by_nfc) {
            if (members.size() < 2) {
                continue;
            }
            std::vector<std::string> paths;
            for (std::size_t index : members) {
                paths.push_back(nodes[index].path);
            }
            result.collisions.nfc[key] = paths;
            for (std::size_t index : members) {
                add_set_violation(index, Violation{nodes[index].path, RuleKind::UnicodeNormalizationCollision,
                    fmt::format("NFC normalization collision group: {}", join_paths(paths)),
                    Severity::Blocking});
            }
        }

        for (const auto& [key, members] : by_key) {
            if (members.size() < 2) {
                continue;
            }
            std::vector<std::string> paths;
            for (std::size_t index : members) {
                paths.push_back(nodes[index].path);
            }
            result.collisions.case_insensitive[key] = paths;
            for (std::size_t index : members) {
                const std::string nfc = Utils::normalize_nfc(nodes[index].path);
                const bool case_differs = std::any_of(members.begin(), members.end(), [&](std::size_t other) {
                    return Utils::normalize_nfc(nodes[other].path) != nfc;
                });
                if (case_differs) {
                    add_set_violation(index, Violation{nodes[index].path, RuleKind::CaseInsensitiveCollision,
                        fmt::format("Case-insensitive collision group: {}", join_paths(paths)),
                        Severity::Blocking});
                }
            }
        }
    }

    void apply_options(const PlanOptions& options)
    {
        for (std::size_t i = 1; i < nodes.size(); ++i) {
            auto& node = nodes[i];
            if (Utils::is_git_internal(node.path)) {
                node.pinned = true;
                if (validations[i].proposal) {
                    result.warnings.push_back(fmt::format("Refusing to rename .git internals: {}", node.path));
                }
                continue;
            }
            if (options.excluded.contains(node.path)) {
                node.pinned = true;
                result.warnings.push_back(fmt::format("Excluded by request: {}", node.path));
                continue;
            }
            auto edit = options.edited.find(node.path);
            if (edit != options.edited.end()) {
                apply_edit(i, edit->second);
            }
        }
    }

    void apply_edit(std::size_t index, const std::string& edited_path)
    {
        auto& node = nodes[index];
        const PathEntry edited = PathEntry::from_string(edited_path, node.kind);
        if (edited.segments.size() != node.depth + 1) {
            node.pinned = true;
            add_unresolved(Violation{node.path, RuleKind::ForbiddenCharacter,
                fmt::format("Edited proposal '{}' must keep the same number of path segments", edited_path),
                Severity::Blocking});
            return;
        }

        const std::string& leaf = edited.segments.back();
        PathEntry leaf_entry{{leaf}, node.kind};
        std::vector<Violation> leaf_violations;
        for (auto& violation : validator.check(leaf_entry)) {
            if (violation.severity == Severity::Blocking && violation.rule != RuleKind::PathTooLong) {
                leaf_violations.push_back(std::move(violation));
            }
        }
        if (!leaf_violations.empty()) {
            node.pinned = true;
            for (auto& violation : leaf_violations) {
                violation.path = node.path;
                violation.detail = fmt::format("Edited proposal '{}' rejected: {}", edited_path, violation.detail);
                add_unresolved(std::move(violation));
            }
            return;
        }

        std::vector<RuleKind> rationale;
        for (const auto& violation : validations[index].violations) {
            if (violation.rule != RuleKind::SymlinkEntry) {
                add_rule(rationale, violation.rule);
            }
        }
        edited_nodes.insert(index);
        node.demands.push_back(Demand{leaf, rationale});
    }

    std::size_t ancestor_at_depth(std::size_t index, std::size_t depth) const
    {
        while (index != kRoot && nodes[index].depth > depth) {
            index = nodes[index].parent;
        }
        return index;
    }

    void collect_demands()
    {
        for (std::size_t i = 1; i < nodes.size(); ++i) {
            if (nodes[i].pinned || edited_nodes.contains(i)) {
                continue;
            }
            const auto& proposal = validations[i].proposal;
            if (!proposal) {
                continue;
            }
            const PathEntry proposed = PathEntry::from_string(proposal->proposed_path, nodes[i].kind);
            if (proposed.segments.size() != nodes[i].depth + 1) {
                continue;
            }
            for (std::size_t depth = 0; depth < proposed.segments.size(); ++depth) {
                const std::size_t target = ancestor_at_depth(i, depth);
                auto& node = nodes[target];
                if (proposed.segments[depth] == node.name || node.pinned || edited_nodes.contains(target)) {
                    continue;
                }
                std::vector<RuleKind> rationale;
                const std::string sanitized = validator.sanitize_segment(node.name, rationale);
                if (sanitized != proposed.segments[depth]) {
                    add_rule(rationale, RuleKind::PathTooLong);
                }
                node.demands.push_back(Demand{proposed.segments[depth], std::move(rationale)});
            }
        }
    }

    // Shortening requested by different descendants may disagree; the shortest name satisfies all of them.
    void resolve_demands()
    {
        for (std::size_t i = 1; i < nodes.size(); ++i) {
            auto& node = nodes[i];
            node.final_name = node.name;
            node.rationale.clear();
            if (node.pinned || node.demands.empty()) {
                continue;
            }
            const auto best = std::min_element(node.demands.begin(), node.demands.end(),
                [](const Demand& a, const Demand& b) {
                    const auto la = Utils::utf16_length(a.name);
                    const auto lb = Utils::utf16_length(b.name);
                    return la != lb ? la < lb : a.name < b.name;
                });
            node.final_name = best->name;
            node.rationale = best->rationale;
        }
    }

    void resolve_sibling_collisions()
    {
        for (std::size_t parent = 0; parent < nodes.size(); ++parent) {
            if (nodes[parent].children.size() > 1) {
                resolve_children(parent);
            }
        }
    }

    void resolve_children(std::size_t parent)
    {
        const auto& children = nodes[parent].children;
        bool changed = true;
        while (changed) {
            changed = false;
            std::map<std::string, std::vector<std::size_t>> groups;
            std::unordered_set<std::string> used_keys;
            for (std::size_t child : children) {
                const std::string key = Utils::collision_key(nodes[child].final_name);
                groups[key].push_back(child);
                used_keys.insert(key);
            }

            for (auto& [key, members] : groups) {
                if (members.size() < 2) {
                    continue;
                }
                std::sort(members.begin(), members.end(), [this](std::size_t a, std::size_t b) {
                    const auto rank = [this](std::size_t index) {
                        if (nodes[index].pinned) return 0;
                        return nodes[index].final_name == nodes[index].name ? 1 : 2;
                    };
                    const int ra = rank(a);
                    const int rb = rank(b);
                    return ra != rb ? ra < rb : nodes[a].path < nodes[b].path;
                });

                const std::size_t keeper = members.front();
                std::vector<std::string> names;
                for (std::size_t member : members) {
                    names.push_back(nodes[member].path);
                }

                for (std::size_t member : members) {
                    const RuleKind rule = collision_rule(nodes[member].final_name, nodes[keeper].final_name);
                    record_collision(member, Violation{nodes[member].path, rule,
                        fmt::format("Name '{}' collides within '{}': {}", nodes[member].final_name,
                                    parent == kRoot ? std::string(".") : nodes[parent].path, join_paths(names)),
                        Severity::Blocking});
                }

                for (auto it = std::next(members.begin()); it != members.end(); ++it) {
                    changed |= separate(*it, keeper, used_keys);
                }
            }
        }
    }

    RuleKind collision_rule(const std::string& a, const std::string& b) const
    {
        return a != b && Utils::normalize_nfc(a) == Utils::normalize_nfc(b)
            ? RuleKind::UnicodeNormalizationCollision
            : RuleKind::CaseInsensitiveCollision;
    }

    // Returns true when the member's name changed and the group must be recomputed.
    bool separate(std::size_t member, std::size_t keeper, std::unordered_set<std::string>& used_keys)
    {
        auto& node = nodes[member];
        const RuleKind rule = collision_rule(node.final_name, nodes[keeper].final_name);

        if (node.pinned) {
            collision_unresolved.push_back(Violation{node.path, rule,
                fmt::format("Kept name collides with '{}' and cannot be renamed", nodes[keeper].path),
                Severity::Blocking});
            return false;
        }

        if (!config.auto_disambiguate) {
            collision_unresolved.push_back(Violation{node.path, rule,
                fmt::format("Collides with '{}'; choose a distinguishing name manually", nodes[keeper].path),
                Severity::Blocking});
            if (node.final_name != node.name) {
                node.pinned = true;
                node.final_name = node.name;
                node.rationale.clear();
                return true;
            }
            return false;
        }

        const bool shortened = std::find(node.rationale.begin(), node.rationale.end(), RuleKind::PathTooLong)
                               != node.rationale.end();
        for (int counter = 1;; ++counter) {
            bool trimmed = false;
            std::string candidate = suffixed_name(member, counter, trimmed);
            const std::string key = Utils::collision_key(candidate);
            if (used_keys.contains(key)) {
                continue;
            }
            used_keys.insert(key);
            if (shortened) {
                record_collision(member, Violation{node.path, RuleKind::PathTooLong,
                    fmt::format("Shortened name '{}' collided; suffix applied as '{}', confirm before applying",
                                node.final_name, candidate),
                    Severity::Warning});
            } else if (trimmed) {
                record_collision(member, Violation{node.path, RuleKind::PathTooLong,
                    fmt::format("Suffixed name trimmed to '{}' to stay within {} UTF-16 units",
                                candidate, config.max_path),
                    Severity::Warning});
            }
            collision_warnings.push_back(fmt::format("Collision: '{}' adjusted to '{}'", node.final_name, candidate));
            node.final_name = std::move(candidate);
            add_rule(node.rationale, rule);
            if (trimmed) {
                add_rule(node.rationale, RuleKind::PathTooLong);
            }
            return true;
        }
    }

    // The stem loses units until the suffixed name and everything below it fit max_path.
    std::string suffixed_name(std::size_t member, int counter, bool& trimmed) const
    {
        const auto& node = nodes[member];
        std::string candidate = validator.disambiguate_name(node.final_name, node.kind, counter);
        const std::string parent_path = final_path(node.parent);
        const std::size_t fixed = (parent_path.empty() ? 0 : Utils::utf16_length(parent_path) + 1)
                                  + longest_tail(member);
        const std::size_t length = fixed + Utils::utf16_length(candidate);
        const auto limit = static_cast<std::size_t>(config.max_path);
        if (length <= limit) {
            return candidate;
        }

        std::string stem = node.final_name;
        std::string extension;
        if (node.kind != EntryKind::Directory) {
            const auto dot = stem.rfind('.');
            if (dot != std::string::npos && dot > 0) {
                extension = stem.substr(dot);
                stem.resize(dot);
            }
        }
        const std::size_t overflow = length - limit;
        const std::size_t stem_length = Utils::utf16_length(stem);
        if (overflow >= stem_length) {
            return candidate;
        }
        trimmed = true;
        return validator.disambiguate_name(Utils::utf16_prefix(stem, stem_length - overflow) + extension,
                                           node.kind, counter);
    }

    std::size_t longest_tail(std::size_t index) const
    {
        std::size_t longest = 0;
        for (std::size_t child : nodes[index].children) {
            longest = std::max(longest, 1 + Utils::utf16_length(nodes[child].final_name) + longest_tail(child));
        }
        return longest;
    }

    std::string final_path(std::size_t index) const
    {
        if (index == kRoot) {
            return std::string();
        }
        const auto& node = nodes[index];
        if (node.parent == kRoot) {
            return node.final_name;
        }
        return final_path(node.parent) + "/" + node.final_name;
    }

    std::string current_path(std::size_t index) const
    {
        if (index == kRoot) {
            return std::string();
        }
        const auto& node = nodes[index];
        if (node.parent == kRoot) {
            return node.current_name;
        }
        return current_path(node.parent) + "/" + node.current_name;
    }

    // A rename whose new segment still violates a blocking rule is withdrawn.
    bool pin_unresolvable_renames()
    {
        bool pinned_any = false;
        for (std::size_t i = 1; i < nodes.size(); ++i) {
            auto& node = nodes[i];
            if (node.pinned || node.final_name == node.name) {
                continue;
            }
            auto violations = validator.check(PathEntry{{node.final_name}, node.kind});
            violations.erase(std::remove_if(violations.begin(), violations.end(), [](const Violation& v) {
                return v.rule == RuleKind::PathTooLong;
            }), violations.end());
            if (has_blocking(violations)) {
                const std::string target = final_path(i);
                node.pinned = true;
                pinned_any = true;
                result.warnings.push_back(fmt::format("Withdrawn rename of '{}': '{}' is still invalid",
                                                      node.path, target));
            }
        }

        // A path that fit before planning must still fit afterwards.
        const auto limit = static_cast<std::size_t>(config.max_path);
        for (std::size_t i = 1; i < nodes.size(); ++i) {
            const std::string target = final_path(i);
            if (target == nodes[i].path || Utils::utf16_length(target) <= limit
                || Utils::utf16_length(nodes[i].path) > limit) {
                continue;
            }
            const std::size_t culprit = lengthening_rename(i);
            if (culprit == kNone) {
                continue;
            }
            auto& node = nodes[culprit];
            result.warnings.push_back(fmt::format("Withdrawn rename of '{}': '{}' exceeds {} UTF-16 units",
                                                  node.path, final_path(culprit), config.max_path));
            node.pinned = true;
            node.final_name = node.name;
            pinned_any = true;
        }
        return pinned_any;
    }

    // Deepest rename on the chain that made its segment longer, else the deepest rename.
    std::size_t lengthening_rename(std::size_t index) const
    {
        std::size_t fallback = kNone;
        for (std::size_t current = index; current != kRoot; current = nodes[current].parent) {
            const auto& node = nodes[current];
            if (node.pinned || node.final_name == node.name) {
                continue;
            }
            if (Utils::utf16_length(node.final_name) > Utils::utf16_length(node.name)) {
                return current;
            }
            if (fallback == kNone) {
                fallback = current;
            }
        }
        return fallback;
    }

    void report()
    {
        for (auto& warning : collision_warnings) {
            result.warnings.push_back(std::move(warning));
        }
        for (auto& record : collision_records) {
            add_set_violation(record.first, std::move(record.second));
        }
        for (auto& violation : collision_unresolved) {
            add_unresolved(std::move(violation));
        }

        for (std::size_t i = 1; i < nodes.size(); ++i) {
            const std::string target = final_path(i);
            auto& validation = validations[i];

            const bool had_blocking = validation.has_blocking() || !validation.unresolved.empty();
            if (had_blocking || target != nodes[i].path) {
                for (auto& violation : validator.check(PathEntry::from_string(target, nodes[i].kind))) {
                    if (violation.severity != Severity::Blocking) {
                        continue;
                    }
                    if (target != nodes[i].path) {
                        violation.detail = fmt::format("Still invalid as '{}': {}", target, violation.detail);
                    }
                    violation.path = nodes[i].path;
                    add_unresolved(std::move(violation));
                }
            }

            std::optional<Proposal> proposal;
            if (target != nodes[i].path) {
                proposal = Proposal{nodes[i].path, target, chain_rationale(i)};
                result.proposals.push_back(*proposal);
            }

            for (const auto& violation : validation.violations) {
                result.violations.push_back(violation);
            }
            if (!validation.violations.empty() || !validation.unresolved.empty()) {
                validation.proposal = proposal;
                result.findings.push_back(validation);
            }
        }
    }

    std::vector<RuleKind> chain_rationale(std::size_t index) const
    {
        std::vector<std::size_t> chain;
        for (std::size_t current = index; current != kRoot; current = nodes[current].parent) {
            chain.push_back(current);
        }
        std::vector<RuleKind> rationale;
        for (auto it = chain.rbegin(); it != chain.rend(); ++it) {
            const auto& node = nodes[*it];
            if (node.final_name == node.name) {
                continue;
            }
            for (RuleKind rule : node.rationale) {
                add_rule(rationale, rule);
            }
        }
        return rationale;
    }

    void add_set_violation(std::size_t index, Violation violation)
    {
        auto& existing = validations[index].violations;
        const bool duplicate = std::any_of(existing.begin(), existing.end(), [&](const Violation& v) {
            return v.rule == violation.rule && v.severity == violation.severity;
        });
        if (!duplicate) {
            existing.push_back(std::move(violation));
        }
    }

    void record_collision(std::size_t index, Violation violation)
    {
        collision_records.emplace_back(index, std::move(violation));
    }

    void add_unresolved(Violation violation)
    {
        const bool duplicate = std::any_of(result.unresolved.begin(), result.unresolved.end(),
            [&](const Violation& v) { return v.path == violation.path && v.rule == violation.rule; });
        if (!duplicate) {
            result.unresolved.push_back(std::move(violation));
        }
    }

    bool target_free(std::size_t index) const
    {
        return occupant(index) == kNone;
    }

    // Parents that still collide share a key, so the target is checked against full live paths.
    std::size_t occupant(std::size_t index) const
    {
        const std::string parent_path = current_path(nodes[index].parent);
        const std::string& name = nodes[index].final_name;
        auto it = live_keys.find(Utils::collision_key(parent_path.empty() ? name : parent_path + "/" + name));
        if (it == live_keys.end()) {
            return kNone;
        }
        for (std::size_t other : it->second) {
            if (other != index) {
                return other;
            }
        }
        return kNone;
    }

    void track_subtree(std::size_t index)
    {
        auto& node = nodes[index];
        node.live_key = Utils::collision_key(current_path(index));
        live_keys[node.live_key].push_back(index);
        for (std::size_t child : node.children) {
            track_subtree(child);
        }
    }

    void untrack_subtree(std::size_t index)
    {
        auto it = live_keys.find(nodes[index].live_key);
        if (it != live_keys.end()) {
            auto& members = it->second;
            members.erase(std::remove(members.begin(), members.end(), index), members.end());
            if (members.empty()) {
                live_keys.erase(it);
            }
        }
        for (std::size_t child : nodes[index].children) {
            untrack_subtree(child);
        }
    }

    bool before(std::size_t a, std::size_t b) const
    {
        if (b == kNone) {
            return true;
        }
        if (nodes[a].depth != nodes[b].depth) {
            return nodes[a].depth > nodes[b].depth;
        }
        return current_path(a) < current_path(b);
    }

    std::string make_temporary_name(std::size_t index)
    {
        const std::size_t parent = nodes[index].parent;
        const std::string parent_path = current_path(parent);
        for (;;) {
            std::string candidate = fmt::format("rps-tmp-{}", ++temporary_counter);
            const std::string key = Utils::collision_key(candidate);
            const std::string full_key = Utils::collision_key(
                parent_path.empty() ? candidate : parent_path + "/" + candidate);
            const bool sibling_clash = live_keys.contains(full_key) || std::any_of(
                nodes[parent].children.begin(), nodes[parent].children.end(), [&](std::size_t sibling) {
                    return nodes[sibling].current_key == key
                        || Utils::collision_key(nodes[sibling].final_name) == key
                        || Utils::collision_key(nodes[sibling].name) == key;
                });
            if (!sibling_clash && !snapshot_keys.contains(full_key)) {
                return candidate;
            }
        }
    }

    void emit(std::size_t index, const std::string& new_name, OperationRole role)
    {
        auto& node = nodes[index];
        const std::string parent_path = current_path(node.parent);
        Operation op;
        op.source_path = current_path(index);
        op.target_path = parent_path.empty() ? new_name : parent_path + "/" + new_name;
        op.sequence_index = result.plan.operations.size();
        op.role = role;
        if (logger) {
            logger->debug("Plan step {}: {} '{}' -> '{}'", op.sequence_index, to_string(role),
                          op.source_path, op.target_path);
        }
        result.plan.operations.push_back(std::move(op));
        untrack_subtree(index);
        node.current_name = new_name;
        node.current_key = Utils::collision_key(new_name);
        track_subtree(index);
    }

    std::size_t cycle_member(std::size_t start) const
    {
        std::unordered_set<std::size_t> seen;
        std::size_t current = start;
        while (current != kNone && !seen.contains(current)) {
            seen.insert(current);
            current = occupant(current);
            // Only names that are about to move can form a cycle.
            if (current != kNone && !awaiting[current]) {
                return kNone;
            }
        }
        if (current == kNone) {
            return kNone;
        }
        std::size_t best = current;
        for (std::size_t member = occupant(current); member != current; member = occupant(member)) {
            if (before(member, best)) {
                best = member;
            }
        }
        return best;
    }

    void schedule()
    {
        std::vector<std::size_t> pending;
        awaiting.assign(nodes.size(), 0);
        for (std::size_t i = 1; i < nodes.size(); ++i) {
            nodes[i].current_name = nodes[i].name;
            nodes[i].current_key = Utils::collision_key(nodes[i].name);
            if (!nodes[i].pinned && nodes[i].final_name != nodes[i].name) {
                pending.push_back(i);
                awaiting[i] = 1;
            }
        }
        live_keys.clear();
        for (std::size_t child : nodes[kRoot].children) {
            track_subtree(child);
        }

        auto ancestors_done = [&](std::size_t index) {
            for (std::size_t p = nodes[index].parent; p != kRoot; p = nodes[p].parent) {
                if (awaiting[p]) {
                    return false;
                }
            }
            return true;
        };

        while (!pending.empty()) {
            std::size_t best_free = kNone;
            std::size_t best_blocked = kNone;
            for (std::size_t index : pending) {
                if (!ancestors_done(index)) {
                    continue;
                }
                if (target_free(index)) {
                    if (before(index, best_free)) best_free = index;
                } else if (before(index, best_blocked)) {
                    best_blocked = index;
                }
            }

            if (best_free != kNone) {
                auto& node = nodes[best_free];
                const OperationRole role = node.current_name != node.name
                    ? OperationRole::CycleCleanup : OperationRole::Rename;
                emit(best_free, node.final_name, role);
                awaiting[best_free] = 0;
                pending.erase(std::find(pending.begin(), pending.end(), best_free));
                continue;
            }
            const std::size_t member = best_blocked == kNone ? kNone : cycle_member(best_blocked);
            if (member != kNone) {
                emit(member, make_temporary_name(member), OperationRole::CycleBreak);
                continue;
            }

            // Blocked by a name that will not move.
            for (std::size_t index : pending) {
                add_unresolved(Violation{nodes[index].path, RuleKind::CaseInsensitiveCollision,
                    "Rename could not be scheduled", Severity::Blocking});
            }
            if (logger) {
                logger->error("Scheduler stalled with {} pending rename(s)", pending.size());
            }
            break;
        }
    }

    const PathValidator& validator;
    const ScanConfig& config;
    std::shared_ptr<spdlog::logger> logger;

    std::vector<PlanNode> nodes;
    std::vector<ValidationResult> validations;
    std::unordered_map<std::string, std::size_t> index_by_path;
    std::unordered_set<std::string> snapshot_keys;
    std::unordered_set<std::size_t> edited_nodes;
    std::vector<std::pair<std::size_t, Violation>> collision_records;
    std::vector<Violation> collision_unresolved;
    std::vector<std::string> collision_warnings;
    std::unordered_map<std::string, std::vector<std::size_t>> live_keys;
    std::vector<char> awaiting;
    std::size_t temporary_counter{0};
    PlanResult result;
};

} // namespace


ConflictResolver::ConflictResolver(ScanConfig config, std::shared_ptr<spdlog::logger> logger)
    : config_(config),
      validator_(config),
      logger_(std::move(logger))
{
}


PlanResult ConflictResolver::plan(const std::vector<PathEntry>& entries,
                                  const PlanOptions& options) const
{
    return plan(entries, {}, options);
}


PlanResult ConflictResolver::plan(const std::vector<PathEntry>& entries,
                                  const std::vector<ValidationResult>& validations,
                                  const PlanOptions& options) const
{
    std::unordered_map<std::string, const ValidationResult*> given;
    given.reserve(validations.size());
    for (const auto& validation : validations) {
        given.emplace(validation.entry.path(), &validation);
    }
    PlanBuilder builder(validator_, config_, logger_);
    return builder.build(entries, given, options);
}


std::string ConflictResolver::snapshot_id(const std::vector<PathEntry>& entries)
{
    std::vector<std::string> paths;
    paths.reserve(entries.size());
    for (const auto& entry : entries) {
        paths.push_back(entry.path());
    }
    std::sort(paths.begin(), paths.end());
    paths.erase(std::unique(paths.begin(), paths.end()), paths.end());
    return Utils::sha1_hex(fmt::format("{}", fmt::join(paths, "\n"))).substr(0, kSnapshotIdLength);
}
