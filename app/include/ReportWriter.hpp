#ifndef REPORT_WRITER_HPP
#define REPORT_WRITER_HPP

#include "RenameExecutor.hpp"
#include "ScanService.hpp"
#include "Types.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

struct ReportMetadata {
    std::string repo;
    std::string timestamp;
    ScanConfig config;
    bool include_ignored{false};
    std::vector<std::string> submodules;
};

// Serializes engine output; never changes it.
class ReportWriter {
public:
    static std::string to_json(const ReportMetadata& meta,
                               const ScanResult& scan,
                               const std::optional<ApplyResult>& applied = std::nullopt);

    static std::string to_text_summary(const ReportMetadata& meta,
                                       const ScanResult& scan,
                                       const std::optional<ApplyResult>& applied = std::nullopt);

    // Throws FILE_WRITE_FAILED.
    static void write_file(const std::string& path, const std::string& contents);
};

#endif
