/**
 * @file TestHelpers.hpp
 * @brief Common utilities for unit tests (temp paths, env guards, in-memory adapter).
 */
#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <map>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "IVersionControlAdapter.hpp"
#include "Types.hpp"
#include "Utils.hpp"

/**
 * @brief Build a unique token string with the given prefix.
 * @param prefix Prefix to include in the token.
 * @return Unique token string that is safe for filenames.
 */
inline std::string make_unique_token(std::string_view prefix) {
    static std::atomic<uint64_t> counter{0};
    const uint64_t value = counter.fetch_add(1, std::memory_order_relaxed);
    const auto now = std::chrono::high_resolution_clock::now().time_since_epoch().count();
    return std::string(prefix) + std::to_string(now) + "-" + std::to_string(value);
}

/**
 * @brief RAII helper that sets and restores environment variables.
 */
class EnvVarGuard {
public:
    EnvVarGuard(std::string key, std::optional<std::string> value)
        : key_(std::move(key)) {
        if (const char* existing = std::getenv(key_.c_str())) {
            original_ = existing;
        }
        apply(value);
    }

    ~EnvVarGuard() {
        apply(original_);
    }

    EnvVarGuard(const EnvVarGuard&) = delete;
    EnvVarGuard& operator=(const EnvVarGuard&) = delete;

private:
    static void set_env(const std::string& key, const std::string& value) {
#ifdef _WIN32
        _putenv_s(key.c_str(), value.c_str());
#else
        setenv(key.c_str(), value.c_str(), 1);
#endif
    }

    static void unset_env(const std::string& key) {
#ifdef _WIN32
        _putenv_s(key.c_str(), "");
#else
        unsetenv(key.c_str());
#endif
    }

    void apply(const std::optional<std::string>& value) {
        if (value.has_value()) {
            set_env(key_, *value);
        } else {
            unset_env(key_);
        }
    }

    std::string key_;
    std::optional<std::string> original_;
};

/**
 * @brief Creates a temporary directory and cleans it up on destruction.
 */
class TempDir {
public:
    TempDir()
        : path_(std::filesystem::temp_directory_path() /
                make_unique_token("rps-test-")) {
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::filesystem::path& path() const { return path_; }

private:
    std::filesystem::path path_;
};

inline void write_text_file(const std::filesystem::path& path, const std::string& contents) {
    std::filesystem::create_directories(path.parent_path());
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

inline std::string read_text_file(const std::filesystem::path& path) {
    std::ifstream in(path, std::ios::binary);
    return std::string(std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>());
}

/**
 * @brief Version control adapter over an in-memory tree of live paths.
 *
 * Moves behave like a case-insensitive, normalizing filesystem: a target
 * that collides with another live path under the collision key is rejected.
 * Every move is recorded, and a failure can be scheduled for the Nth call.
 */
class InMemoryAdapter : public IVersionControlAdapter {
public:
    explicit InMemoryAdapter(const std::vector<std::string>& files,
                             EntryKind kind = EntryKind::File) {
        for (const auto& file : files) {
            add(file, kind);
        }
    }

    void add(const std::string& path, EntryKind kind = EntryKind::File) {
        const auto entry = PathEntry::from_string(path, kind);
        std::string prefix;
        for (std::size_t i = 0; i + 1 < entry.segments.size(); ++i) {
            prefix = i == 0 ? entry.segments[i] : prefix + "/" + entry.segments[i];
            live_.emplace(prefix, EntryKind::Directory);
        }
        live_[entry.path()] = kind;
    }

    std::vector<PathEntry> list_tracked() override {
        std::vector<PathEntry> entries;
        for (const auto& [path, kind] : live_) {
            entries.push_back(PathEntry::from_string(path, kind));
        }
        return entries;
    }

    MoveOutcome move(const std::string& source, const std::string& target) override {
        const std::size_t call = calls_++;
        if (fail_at_call_ && *fail_at_call_ == call) {
            return MoveOutcome::failure(fail_kind_, "scheduled failure");
        }
        if (!live_.contains(source)) {
            return MoveOutcome::failure(AdapterErrorKind::NotFound, source);
        }
        const std::string target_key = Utils::collision_key(target);
        for (const auto& [path, kind] : live_) {
            if (path != source && Utils::collision_key(path) == target_key) {
                return MoveOutcome::failure(AdapterErrorKind::TargetExists, path);
            }
        }
        const auto slash = target.rfind('/');
        if (slash != std::string::npos && !live_.contains(target.substr(0, slash))) {
            return MoveOutcome::failure(AdapterErrorKind::Other, "missing parent for " + target);
        }

        std::map<std::string, EntryKind> next;
        const std::string prefix = source + "/";
        for (const auto& [path, kind] : live_) {
            if (path == source) {
                next[target] = kind;
            } else if (path.compare(0, prefix.size(), prefix) == 0) {
                next[target + path.substr(source.size())] = kind;
            } else {
                next[path] = kind;
            }
        }
        const std::size_t before = colliding_groups();
        live_ = std::move(next);
        moves_.emplace_back(source, target);
        if (colliding_groups() > before) {
            collision_seen_ = true;
        }
        return MoveOutcome::success();
    }

    void fail_on_call(std::size_t call, AdapterErrorKind kind) {
        fail_at_call_ = call;
        fail_kind_ = kind;
    }

    void clear_failure() { fail_at_call_.reset(); }

    bool contains(const std::string& path) const { return live_.contains(path); }
    std::vector<std::string> live_paths() const {
        std::vector<std::string> paths;
        for (const auto& [path, kind] : live_) {
            paths.push_back(path);
        }
        return paths;
    }
    const std::vector<std::pair<std::string, std::string>>& moves() const { return moves_; }
    // True once a move created a collision that did not exist before it.
    bool collision_seen() const { return collision_seen_; }

private:
    std::size_t colliding_groups() const {
        std::map<std::string, int> keys;
        for (const auto& [path, kind] : live_) {
            ++keys[Utils::collision_key(path)];
        }
        std::size_t groups = 0;
        for (const auto& [key, count] : keys) {
            if (count > 1) {
                ++groups;
            }
        }
        return groups;
    }

    std::map<std::string, EntryKind> live_;
    std::vector<std::pair<std::string, std::string>> moves_;
    std::optional<std::size_t> fail_at_call_;
    AdapterErrorKind fail_kind_{AdapterErrorKind::Other};
    std::size_t calls_{0};
    bool collision_seen_{false};
};
