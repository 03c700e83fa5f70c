#ifndef UTILS_HPP
#define UTILS_HPP

#include "Types.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace Utils {

std::string path_to_utf8(const std::filesystem::path& path);
std::filesystem::path utf8_to_path(const std::string& value);

// Per-user state directory, honours REPOPATH_SANITIZER_STATE_DIR and XDG_STATE_HOME.
std::filesystem::path state_directory();

std::string normalize_nfc(const std::string& value);
std::string fold_case(const std::string& value);
// Key under which two paths collide on a case-insensitive, normalizing filesystem.
std::string collision_key(const std::string& value);
bool is_nfc(const std::string& value);

std::size_t utf16_length(const std::string& value);
// Longest prefix of at most max_units UTF-16 units that does not split a surrogate pair.
std::string utf16_prefix(const std::string& value, std::size_t max_units);

std::string sha1_hex(const std::string& value);
std::string current_timestamp();
// UTC, safe inside file names: yyyyMMdd-HHmmss.
std::string compact_timestamp();

// Adds a Directory entry for every ancestor of the given entries that is not already present.
std::vector<PathEntry> with_parent_directories(const std::vector<PathEntry>& entries);

bool is_git_internal(const std::string& rel_path);

// Whole-string base-10 integer; nullopt on trailing text or a value outside int.
std::optional<int> parse_int(const std::string& value);

} // namespace Utils

#endif
