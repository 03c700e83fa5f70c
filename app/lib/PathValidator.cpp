#include "PathValidator.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <array>
#include <cctype>
#include <numeric>
#include <string_view>
#include <utility>

namespace {

constexpr std::string_view kForbiddenCharacters = "<>:\"/\\|?*";
constexpr std::size_t kHashLength = 6;
// One readable character, the separator and the hash.
constexpr std::size_t kMinShortenedLength = 1 + 1 + kHashLength;
constexpr std::size_t kMaxPreservedExtension = 16;

struct Substitution {
    char from;
    const char* to;
};

// Fixed table so a rerun over already sanitized names changes nothing.
constexpr std::array<Substitution, 9> kSubstitutions = {{
    {':', " -"},
    {'|', "-"},
    {'\\', "-"},
    {'/', "-"},
    {'<', ""},
    {'>', ""},
    {'"', ""},
    {'?', ""},
    {'*', ""},
}};

constexpr std::array<std::string_view, 22> kReservedDeviceNames = {
    "CON", "PRN", "AUX", "NUL",
    "COM1", "COM2", "COM3", "COM4", "COM5", "COM6", "COM7", "COM8", "COM9",
    "LPT1", "LPT2", "LPT3", "LPT4", "LPT5", "LPT6", "LPT7", "LPT8", "LPT9"
};

bool is_control(unsigned char ch)
{
    return ch < 32;
}

bool is_special_segment(const std::string& segment)
{
    return segment.empty() || segment == "." || segment == "..";
}

std::string upper_ascii(std::string_view value)
{
    std::string out(value);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char ch) { return static_cast<char>(std::toupper(ch)); });
    return out;
}

// Device names are matched on the part before the first dot, trailing spaces ignored.
std::string_view device_stem(std::string_view segment)
{
    auto stem = segment.substr(0, segment.find('.'));
    while (!stem.empty() && stem.back() == ' ') {
        stem.remove_suffix(1);
    }
    return stem;
}

std::string collapse_space_runs(const std::string& value)
{
    std::string out;
    out.reserve(value.size());
    for (char ch : value) {
        if (ch == ' ' && !out.empty() && out.back() == ' ') {
            continue;
        }
        out.push_back(ch);
    }
    return out;
}

std::string join_segments(const std::vector<std::string>& segments)
{
    PathEntry entry;
    entry.segments = segments;
    return entry.path();
}

void add_rule(std::vector<RuleKind>& rules, RuleKind rule)
{
    if (std::find(rules.begin(), rules.end(), rule) == rules.end()) {
        rules.push_back(rule);
    }
}

std::string quoted(const std::string& value)
{
    return fmt::format("'{}'", value);
}

} // namespace


bool ValidationResult::has_blocking() const
{
    return std::any_of(violations.begin(), violations.end(), [](const Violation& v) {
        return v.severity == Severity::Blocking;
    });
}


PathValidator::PathValidator(ScanConfig config)
    : config_(std::move(config))
{
}


bool PathValidator::is_reserved_device_name(const std::string& segment)
{
    const std::string stem = upper_ascii(device_stem(segment));
    return std::find(kReservedDeviceNames.begin(), kReservedDeviceNames.end(), stem)
           != kReservedDeviceNames.end();
}


bool PathValidator::contains_forbidden_character(const std::string& segment)
{
    return std::any_of(segment.begin(), segment.end(), [](char ch) {
        return is_control(static_cast<unsigned char>(ch))
               || kForbiddenCharacters.find(ch) != std::string_view::npos;
    });
}


bool PathValidator::has_trailing_space_or_period(const std::string& segment)
{
    return !segment.empty() && (segment.back() == ' ' || segment.back() == '.');
}


void PathValidator::check_forbidden_characters(const std::string& path,
                                               const std::string& segment,
                                               std::vector<Violation>& out) const
{
    if (contains_forbidden_character(segment)) {
        out.push_back(Violation{path, RuleKind::ForbiddenCharacter,
            fmt::format("Segment contains forbidden Windows characters or control chars: {}", quoted(segment)),
            Severity::Blocking});
    }
}


void PathValidator::check_reserved_device_name(const std::string& path,
                                               const std::string& segment,
                                               std::vector<Violation>& out) const
{
    if (is_reserved_device_name(segment)) {
        out.push_back(Violation{path, RuleKind::ReservedDeviceName,
            fmt::format("Segment is a reserved Windows device name: {}", quoted(segment)),
            Severity::Blocking});
    }
}


void PathValidator::check_trailing_space_or_period(const std::string& path,
                                                   const std::string& segment,
                                                   std::vector<Violation>& out) const
{
    if (has_trailing_space_or_period(segment)) {
        out.push_back(Violation{path, RuleKind::TrailingSpaceOrPeriod,
            fmt::format("Segment ends with a trailing space or period: {}", quoted(segment)),
            Severity::Blocking});
    }
}


void PathValidator::check_path_length(const std::string& path,
                                      std::vector<Violation>& out) const
{
    const std::size_t length = Utils::utf16_length(path);
    if (length > static_cast<std::size_t>(config_.max_path)) {
        out.push_back(Violation{path, RuleKind::PathTooLong,
            fmt::format("Path length {} exceeds configured limit {}", length, config_.max_path),
            Severity::Blocking});
    }
}


void PathValidator::check_symlink(const PathEntry& entry,
                                  const std::string& path,
                                  std::vector<Violation>& out) const
{
    if (entry.kind == EntryKind::Symlink) {
        out.push_back(Violation{path, RuleKind::SymlinkEntry,
            "Symlink detected; Windows checkout depends on core.symlinks and user permissions",
            Severity::Warning});
    }
}


std::vector<Violation> PathValidator::check(const PathEntry& entry) const
{
    std::vector<Violation> violations;
    const std::string path = entry.path();

    for (const auto& segment : entry.segments) {
        if (is_special_segment(segment)) {
            continue;
        }
        check_forbidden_characters(path, segment, violations);
        check_trailing_space_or_period(path, segment, violations);
        check_reserved_device_name(path, segment, violations);
    }
    check_path_length(path, violations);
    check_symlink(entry, path, violations);
    return violations;
}


std::string PathValidator::sanitize_segment(const std::string& segment,
                                            std::vector<RuleKind>& addressed) const
{
    if (is_special_segment(segment)) {
        return segment;
    }

    std::string out;
    out.reserve(segment.size());
    bool replaced = false;
    for (char ch : segment) {
        if (is_control(static_cast<unsigned char>(ch))) {
            replaced = true;
            continue;
        }
        const auto it = std::find_if(kSubstitutions.begin(), kSubstitutions.end(),
                                     [ch](const Substitution& s) { return s.from == ch; });
        if (it != kSubstitutions.end()) {
            out += it->to;
            replaced = true;
            continue;
        }
        out.push_back(ch);
    }
    if (replaced) {
        add_rule(addressed, RuleKind::ForbiddenCharacter);
    }

    if (has_trailing_space_or_period(out)) {
        const auto last = out.find_last_not_of(" .");
        out.erase(last == std::string::npos ? 0 : last + 1);
        add_rule(addressed, RuleKind::TrailingSpaceOrPeriod);
    }

    if (out.empty()) {
        out = "_";
    }

    if (is_reserved_device_name(out)) {
        const auto dot = out.find('.');
        out.insert(dot == std::string::npos ? out.size() : dot, "_");
        add_rule(addressed, RuleKind::ReservedDeviceName);
    }

    if (config_.collapse_spaces) {
        out = collapse_space_runs(out);
    }
    if (config_.normalize_unicode_nfc) {
        out = Utils::normalize_nfc(out);
    }
    return out;
}


std::string PathValidator::shorten_segment(const std::string& segment,
                                           std::size_t allowed,
                                           bool keep_extension) const
{
    std::string extension;
    if (keep_extension) {
        const auto dot = segment.rfind('.');
        if (dot != std::string::npos && dot > 0
            && Utils::utf16_length(segment.substr(dot)) <= kMaxPreservedExtension) {
            extension = segment.substr(dot);
        }
    }
    const std::string stem = segment.substr(0, segment.size() - extension.size());
    const std::string hash = Utils::sha1_hex(segment).substr(0, kHashLength);

    const std::size_t fixed = 1 + kHashLength + Utils::utf16_length(extension);
    const std::size_t keep = allowed > fixed ? allowed - fixed : 1;
    std::string prefix = Utils::utf16_prefix(stem, keep);
    if (prefix.empty()) {
        prefix = "_";
    }
    return prefix + "-" + hash + extension;
}


std::optional<std::vector<std::string>> PathValidator::shorten(
    const std::vector<std::string>& segments,
    bool leaf_has_extension) const
{
    const auto limit = static_cast<std::size_t>(config_.max_path);
    const std::size_t length = Utils::utf16_length(join_segments(segments));
    if (length <= limit) {
        return segments;
    }
    if (segments.empty()) {
        return std::nullopt;
    }

    std::size_t excess = length - limit;
    std::vector<std::string> work = segments;

    auto shrink = [&](std::size_t index, bool keep_extension) {
        const std::size_t current = Utils::utf16_length(work[index]);
        if (current <= kMinShortenedLength) {
            return;
        }
        const std::size_t allowed = std::max(kMinShortenedLength,
                                             current > excess ? current - excess : 0);
        std::string candidate = shorten_segment(work[index], allowed, keep_extension);
        const std::size_t shortened = Utils::utf16_length(candidate);
        if (shortened >= current) {
            return;
        }
        work[index] = std::move(candidate);
        const std::size_t gained = current - shortened;
        excess = gained >= excess ? 0 : excess - gained;
    };

    // Intermediate directories first, longest first; the leaf only as a last resort.
    std::vector<std::size_t> order(work.size() - 1);
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(), [&work](std::size_t a, std::size_t b) {
        return Utils::utf16_length(work[a]) > Utils::utf16_length(work[b]);
    });
    for (std::size_t index : order) {
        if (excess == 0) {
            break;
        }
        shrink(index, false);
    }
    if (excess > 0) {
        shrink(work.size() - 1, leaf_has_extension);
    }

    if (excess > 0) {
        return std::nullopt;
    }
    return work;
}


std::string PathValidator::disambiguate_name(const std::string& name,
                                             EntryKind kind,
                                             int counter) const
{
    const std::string suffix = fmt::format("_{}", counter);
    if (kind != EntryKind::Directory) {
        const auto dot = name.rfind('.');
        if (dot != std::string::npos && dot > 0) {
            return name.substr(0, dot) + suffix + name.substr(dot);
        }
    }
    return name + suffix;
}


ValidationResult PathValidator::validate(const PathEntry& entry) const
{
    ValidationResult result;
    result.entry = entry;
    result.violations = check(entry);

    const bool fixable = std::any_of(result.violations.begin(), result.violations.end(),
                                     [](const Violation& v) { return v.rule != RuleKind::SymlinkEntry; });
    if (!fixable) {
        result.fix_options = build_fix_options(entry, std::nullopt);
        return result;
    }

    const std::string path = entry.path();
    std::vector<RuleKind> rationale;
    std::vector<std::string> fixed;
    fixed.reserve(entry.segments.size());
    for (const auto& segment : entry.segments) {
        fixed.push_back(sanitize_segment(segment, rationale));
    }

    if (Utils::utf16_length(join_segments(fixed)) > static_cast<std::size_t>(config_.max_path)) {
        if (auto shortened = shorten(fixed, entry.kind != EntryKind::Directory)) {
            fixed = std::move(*shortened);
            add_rule(rationale, RuleKind::PathTooLong);
        } else {
            result.unresolved.push_back(Violation{path, RuleKind::PathTooLong,
                fmt::format("Path cannot be shortened below {} UTF-16 units", config_.max_path),
                Severity::Blocking});
            result.fix_options = build_fix_options(entry, std::nullopt);
            return result;
        }
    }

    if (fixed != entry.segments) {
        PathEntry proposed_entry{fixed, entry.kind};
        const std::string proposed_path = proposed_entry.path();
        std::vector<Violation> remaining;
        for (auto& violation : check(proposed_entry)) {
            if (violation.severity == Severity::Blocking) {
                violation.detail = fmt::format("Proposal {} rejected: {}", quoted(proposed_path), violation.detail);
                violation.path = path;
                remaining.push_back(std::move(violation));
            }
        }
        if (remaining.empty()) {
            result.proposal = Proposal{path, proposed_path, rationale};
        } else {
            result.unresolved = std::move(remaining);
        }
    }

    result.fix_options = build_fix_options(entry, result.proposal);
    return result;
}


std::vector<FixOption> PathValidator::build_fix_options(const PathEntry& entry,
                                                        const std::optional<Proposal>& proposal) const
{
    std::vector<FixOption> options;
    const std::string path = entry.path();

    if (proposal) {
        FixOption option{"auto", "Auto sanitize (recommended)", proposal->proposed_path, {}};
        for (RuleKind rule : proposal->rationale) {
            option.notes.push_back(fmt::format("Addresses {}", to_string(rule)));
        }
        options.push_back(std::move(option));
    } else {
        options.push_back(FixOption{"none", "No change", path, {}});
    }

    const std::string nfc = Utils::normalize_nfc(path);
    if (nfc != path) {
        options.push_back(FixOption{"nfc", "Normalize Unicode to NFC", nfc, {"Normalize full path to NFC"}});
    }

    const std::string collapsed = collapse_space_runs(path);
    if (collapsed != path) {
        options.push_back(FixOption{"spaces", "Collapse multiple spaces", collapsed, {"Collapse multiple spaces"}});
    }

    if (Utils::utf16_length(path) > static_cast<std::size_t>(config_.max_path)) {
        if (auto shortened = shorten(entry.segments, entry.kind != EntryKind::Directory)) {
            options.push_back(FixOption{"shorten",
                                        fmt::format("Shorten to <= {}", config_.max_path),
                                        join_segments(*shortened),
                                        {"Truncation with hash suffix"}});
        }
    }
    return options;
}
