#include "Utils.hpp"

#include <QByteArray>
#include <QCryptographicHash>
#include <QDateTime>
#include <QString>

#include <algorithm>
#include <cerrno>
#include <climits>
#include <cstdlib>
#include <set>

namespace Utils {

namespace {

QString to_qstring(const std::string& value)
{
    return QString::fromUtf8(value.data(), static_cast<qsizetype>(value.size()));
}

std::string to_utf8(const QString& value)
{
    const QByteArray bytes = value.toUtf8();
    return std::string(bytes.constData(), static_cast<std::size_t>(bytes.size()));
}

} // namespace


std::string path_to_utf8(const std::filesystem::path& path)
{
    const auto u8 = path.u8string();
    return std::string(u8.begin(), u8.end());
}


std::filesystem::path utf8_to_path(const std::string& value)
{
    return std::filesystem::path(std::u8string(value.begin(), value.end()));
}


std::filesystem::path state_directory()
{
    if (const char* override_dir = std::getenv("REPOPATH_SANITIZER_STATE_DIR")) {
        if (*override_dir != '\0') {
            return utf8_to_path(override_dir);
        }
    }
    std::filesystem::path base;
    if (const char* xdg = std::getenv("XDG_STATE_HOME"); xdg && *xdg != '\0') {
        base = utf8_to_path(xdg);
    } else if (const char* home = std::getenv("HOME"); home && *home != '\0') {
        base = utf8_to_path(home) / ".local" / "state";
    } else {
        base = std::filesystem::temp_directory_path();
    }
    return base / "repopath-sanitizer";
}


std::string normalize_nfc(const std::string& value)
{
    return to_utf8(to_qstring(value).normalized(QString::NormalizationForm_C));
}


std::string fold_case(const std::string& value)
{
    return to_utf8(to_qstring(value).toCaseFolded());
}


std::string collision_key(const std::string& value)
{
    const QString nfc = to_qstring(value).normalized(QString::NormalizationForm_C);
    return to_utf8(nfc.toCaseFolded().normalized(QString::NormalizationForm_C));
}


bool is_nfc(const std::string& value)
{
    return normalize_nfc(value) == value;
}


std::size_t utf16_length(const std::string& value)
{
    return static_cast<std::size_t>(to_qstring(value).size());
}


std::string utf16_prefix(const std::string& value, std::size_t max_units)
{
    const QString text = to_qstring(value);
    if (static_cast<std::size_t>(text.size()) <= max_units) {
        return value;
    }
    qsizetype cut = static_cast<qsizetype>(max_units);
    if (cut > 0 && text.at(cut - 1).isHighSurrogate()) {
        --cut;
    }
    return to_utf8(text.left(cut));
}


std::string sha1_hex(const std::string& value)
{
    const QByteArray digest = QCryptographicHash::hash(
        QByteArray(value.data(), static_cast<qsizetype>(value.size())),
        QCryptographicHash::Sha1);
    return digest.toHex().toStdString();
}


std::string current_timestamp()
{
    return QDateTime::currentDateTime().toString(Qt::ISODate).toStdString();
}


std::string compact_timestamp()
{
    return QDateTime::currentDateTimeUtc().toString(QStringLiteral("yyyyMMdd-HHmmss")).toStdString();
}


std::vector<PathEntry> with_parent_directories(const std::vector<PathEntry>& entries)
{
    std::set<std::string> known;
    for (const auto& entry : entries) {
        known.insert(entry.path());
    }

    std::vector<PathEntry> result = entries;
    std::set<std::string> added;
    for (const auto& entry : entries) {
        std::string prefix;
        for (std::size_t i = 0; i + 1 < entry.segments.size(); ++i) {
            prefix = i == 0 ? entry.segments[0] : prefix + "/" + entry.segments[i];
            if (known.contains(prefix) || added.contains(prefix)) {
                continue;
            }
            added.insert(prefix);
            result.push_back(PathEntry::from_string(prefix, EntryKind::Directory));
        }
    }

    std::sort(result.begin(), result.end(), [](const PathEntry& a, const PathEntry& b) {
        if (a.segments.size() != b.segments.size()) {
            return a.segments.size() < b.segments.size();
        }
        return a.path() < b.path();
    });
    return result;
}


bool is_git_internal(const std::string& rel_path)
{
    return rel_path == ".git" || rel_path.starts_with(".git/");
}


std::optional<int> parse_int(const std::string& value)
{
    if (value.empty()) {
        return std::nullopt;
    }
    char* end = nullptr;
    errno = 0;
    const long parsed = std::strtol(value.c_str(), &end, 10);
    if (end == value.c_str() || *end != '\0' || errno == ERANGE
        || parsed < INT_MIN || parsed > INT_MAX) {
        return std::nullopt;
    }
    return static_cast<int>(parsed);
}

} // namespace Utils
