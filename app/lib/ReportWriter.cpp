#include "ReportWriter.hpp"
#include "AppException.hpp"
#include "Utils.hpp"

#include <fmt/format.h>

#ifdef _WIN32
#include <json/json.h>
#elif __APPLE__
#include <json/json.h>
#else
#include <jsoncpp/json/json.h>
#endif

#include <algorithm>
#include <fstream>
#include <map>
#include <sstream>

namespace {

Json::Value string_array(const std::vector<std::string>& values)
{
    Json::Value array(Json::arrayValue);
    for (const auto& value : values) {
        array.append(value);
    }
    return array;
}

Json::Value groups_to_json(const std::map<std::string, std::vector<std::string>>& groups)
{
    Json::Value object(Json::objectValue);
    for (const auto& [key, paths] : groups) {
        object[key] = string_array(paths);
    }
    return object;
}

Json::Value violation_to_json(const Violation& violation)
{
    Json::Value value(Json::objectValue);
    value["path"] = violation.path;
    value["rule"] = to_string(violation.rule);
    value["severity"] = to_string(violation.severity);
    value["detail"] = violation.detail;
    return value;
}

Json::Value operations_to_json(const std::vector<Operation>& operations)
{
    Json::Value array(Json::arrayValue);
    for (const auto& operation : operations) {
        Json::Value value(Json::objectValue);
        value["sequence_index"] = static_cast<Json::UInt64>(operation.sequence_index);
        value["source"] = operation.source_path;
        value["target"] = operation.target_path;
        value["role"] = to_string(operation.role);
        array.append(value);
    }
    return array;
}

std::string item_status(const ValidationResult& item, const std::vector<Violation>& unresolved)
{
    const std::string path = item.entry.path();
    const bool blocked = std::any_of(unresolved.begin(), unresolved.end(),
                                     [&path](const Violation& v) { return v.path == path; });
    if (item.proposal) {
        return blocked ? "partial" : "proposed";
    }
    if (blocked) {
        return "unresolved";
    }
    // Keeps its name while colliding siblings are renamed.
    return item.has_blocking() ? "kept" : "warning";
}

Json::Value item_to_json(const ValidationResult& item, const std::vector<Violation>& unresolved)
{
    Json::Value value(Json::objectValue);
    value["type"] = to_string(item.entry.kind);
    value["current_path"] = item.entry.path();

    Json::Value issues(Json::arrayValue);
    for (const auto& violation : item.violations) {
        issues.append(violation_to_json(violation));
    }
    value["issues"] = issues;

    if (item.proposal) {
        Json::Value proposal(Json::objectValue);
        proposal["path"] = item.proposal->proposed_path;
        Json::Value rationale(Json::arrayValue);
        for (RuleKind rule : item.proposal->rationale) {
            rationale.append(to_string(rule));
        }
        proposal["rationale"] = rationale;
        value["proposed_fix"] = proposal;
    } else {
        value["proposed_fix"] = Json::Value(Json::nullValue);
    }

    Json::Value options(Json::arrayValue);
    for (const auto& option : item.fix_options) {
        Json::Value entry(Json::objectValue);
        entry["key"] = option.key;
        entry["label"] = option.label;
        entry["preview_path"] = option.preview_path;
        entry["notes"] = string_array(option.notes);
        options.append(entry);
    }
    value["fix_options"] = options;
    value["status"] = item_status(item, unresolved);
    return value;
}

void append_operations(std::ostringstream& out, const std::vector<Operation>& operations)
{
    if (operations.empty()) {
        out << "  (none)\n";
        return;
    }
    for (const auto& operation : operations) {
        out << "  - " << operation.source_path << "  ->  " << operation.target_path;
        if (operation.role != OperationRole::Rename) {
            out << "  [" << to_string(operation.role) << "]";
        }
        out << "\n";
    }
}

} // namespace


std::string ReportWriter::to_json(const ReportMetadata& meta,
                                  const ScanResult& scan,
                                  const std::optional<ApplyResult>& applied)
{
    static const std::vector<Violation> no_violations;
    const PlanResult* plan = scan.plan ? &*scan.plan : nullptr;
    const auto& unresolved = plan ? plan->unresolved : no_violations;

    Json::Value root(Json::objectValue);
    root["repo"] = meta.repo;

    Json::Value scan_meta(Json::objectValue);
    scan_meta["timestamp"] = meta.timestamp;
    scan_meta["max_path"] = meta.config.max_path;
    scan_meta["normalize_unicode_nfc"] = meta.config.normalize_unicode_nfc;
    scan_meta["collapse_spaces"] = meta.config.collapse_spaces;
    scan_meta["auto_disambiguate"] = meta.config.auto_disambiguate;
    scan_meta["include_ignored"] = meta.include_ignored;
    scan_meta["total_paths"] = static_cast<Json::UInt64>(scan.total);
    scan_meta["scanned_paths"] = static_cast<Json::UInt64>(scan.results.size());
    scan_meta["cancelled"] = scan.cancelled;
    scan_meta["submodules"] = string_array(meta.submodules);
    if (plan) {
        scan_meta["snapshot_id"] = plan->plan.snapshot_id;
        Json::Value collisions(Json::objectValue);
        collisions["case_insensitive"] = groups_to_json(plan->collisions.case_insensitive);
        collisions["nfc"] = groups_to_json(plan->collisions.nfc);
        scan_meta["collisions"] = collisions;
    }
    root["scan"] = scan_meta;

    Json::Value items(Json::arrayValue);
    if (plan) {
        for (const auto& item : plan->findings) {
            items.append(item_to_json(item, unresolved));
        }
    } else {
        for (const auto& item : scan.results) {
            if (!item.violations.empty()) {
                items.append(item_to_json(item, unresolved));
            }
        }
    }
    root["items"] = items;

    root["planned_renames"] = plan ? operations_to_json(plan->plan.operations) : Json::Value(Json::arrayValue);
    if (applied && applied->batch) {
        root["applied_renames"] = operations_to_json(applied->batch->operations);
        root["batch_id"] = applied->batch->batch_id;
    } else {
        root["applied_renames"] = Json::Value(Json::arrayValue);
    }
    if (applied && applied->failed_at) {
        Json::Value failure(Json::objectValue);
        failure["failed_at"] = static_cast<Json::UInt64>(*applied->failed_at);
        if (applied->error) {
            failure["kind"] = to_string(applied->error->kind);
            failure["detail"] = applied->error->detail;
        }
        root["apply_failure"] = failure;
    }

    Json::Value unresolved_json(Json::arrayValue);
    for (const auto& violation : unresolved) {
        unresolved_json.append(violation_to_json(violation));
    }
    root["unresolved"] = unresolved_json;
    root["warnings"] = string_array(plan ? plan->warnings : std::vector<std::string>{});

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, root);
}


std::string ReportWriter::to_text_summary(const ReportMetadata& meta,
                                          const ScanResult& scan,
                                          const std::optional<ApplyResult>& applied)
{
    std::ostringstream out;
    out << "RepoPath Sanitizer report for: " << meta.repo << "\n\n";

    if (scan.cancelled || !scan.plan) {
        out << fmt::format("Scan cancelled after {} of {} path(s); no plan was made.\n", scan.results.size(), scan.total);
        return out.str();
    }
    const PlanResult& plan = *scan.plan;

    out << fmt::format("Scanned {} path(s), {} with issues.\n\n", scan.total, plan.findings.size());

    out << "Planned renames (git mv):\n";
    append_operations(out, plan.plan.operations);

    if (applied) {
        out << "\nApplied renames";
        if (applied->batch) {
            out << " (batch " << applied->batch->batch_id << ")";
        }
        out << ":\n";
        append_operations(out, applied->batch ? applied->batch->operations : std::vector<Operation>{});
        if (applied->failed_at) {
            out << fmt::format("  Stopped at operation {}: {}\n", *applied->failed_at,
                               applied->error ? fmt::format("{} ({})", applied->error->detail,
                                                            to_string(applied->error->kind))
                                              : std::string("unknown error"));
        }
    }

    if (!plan.unresolved.empty()) {
        out << "\nUnresolved:\n";
        for (const auto& violation : plan.unresolved) {
            out << "  - " << violation.path << " [" << to_string(violation.rule) << "] " << violation.detail << "\n";
        }
    }

    if (!plan.warnings.empty()) {
        out << "\nWarnings:\n";
        for (const auto& warning : plan.warnings) {
            out << "  - " << warning << "\n";
        }
    }

    out << "\nSuggested next steps:\n";
    out << "  1) Run your test suite\n";
    out << "  2) Review `git status` and diff\n";
    out << "  3) Commit (example message):\n";
    out << "     \"Sanitize paths for Windows checkout (RepoPath Sanitizer)\"\n";
    out << "  4) Push\n";
    return out.str();
}


void ReportWriter::write_file(const std::string& path, const std::string& contents)
{
    std::ofstream out(Utils::utf8_to_path(path), std::ios::binary | std::ios::trunc);
    if (!out) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, path);
    }
    out << contents;
    if (!contents.empty() && contents.back() != '\n') {
        out << '\n';
    }
    out.flush();
    if (!out) {
        THROW_APP_ERROR(ErrorCodes::Code::FILE_WRITE_FAILED, path);
    }
}
