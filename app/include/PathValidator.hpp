#ifndef PATH_VALIDATOR_HPP
#define PATH_VALIDATOR_HPP

#include "Types.hpp"

#include <optional>
#include <string>
#include <vector>

struct ValidationResult {
    PathEntry entry;
    std::vector<Violation> violations;
    std::optional<Proposal> proposal;
    // Violations left on a rejected proposal.
    std::vector<Violation> unresolved;
    std::vector<FixOption> fix_options;

    bool has_blocking() const;
};

/**
 * @brief Checks one path against the Windows naming rules and proposes a fix.
 *
 * Every rule is a separate check run in a fixed order. The validator keeps no
 * state besides its configuration, so one instance may be shared by several
 * scanning threads.
 */
class PathValidator {
public:
    explicit PathValidator(ScanConfig config = ScanConfig{});

    ValidationResult validate(const PathEntry& entry) const;

    // Violations only, no proposal. Used to re-validate proposed paths.
    std::vector<Violation> check(const PathEntry& entry) const;

    // Sanitizes a single segment; appends the rules it addressed to `addressed`.
    std::string sanitize_segment(const std::string& segment,
                                 std::vector<RuleKind>& addressed) const;

    // Truncates segments until the path fits max_path. Returns nullopt if it cannot.
    std::optional<std::vector<std::string>> shorten(const std::vector<std::string>& segments,
                                                    bool leaf_has_extension) const;

    std::string disambiguate_name(const std::string& name, EntryKind kind, int counter) const;

    const ScanConfig& config() const { return config_; }

    static bool is_reserved_device_name(const std::string& segment);
    static bool contains_forbidden_character(const std::string& segment);
    static bool has_trailing_space_or_period(const std::string& segment);

private:
    void check_forbidden_characters(const std::string& path, const std::string& segment,
                                    std::vector<Violation>& out) const;
    void check_reserved_device_name(const std::string& path, const std::string& segment,
                                    std::vector<Violation>& out) const;
    void check_trailing_space_or_period(const std::string& path, const std::string& segment,
                                        std::vector<Violation>& out) const;
    void check_path_length(const std::string& path, std::vector<Violation>& out) const;
    void check_symlink(const PathEntry& entry, const std::string& path,
                       std::vector<Violation>& out) const;

    std::vector<FixOption> build_fix_options(const PathEntry& entry,
                                             const std::optional<Proposal>& proposal) const;
    std::string shorten_segment(const std::string& segment, std::size_t allowed,
                                bool keep_extension) const;

    ScanConfig config_;
};

#endif
