#include "UndoJournal.hpp"
#include "AppException.hpp"
#include "Utils.hpp"

#include <fmt/format.h>
#include <spdlog/spdlog.h>

#ifdef _WIN32
#include <json/json.h>
#elif __APPLE__
#include <json/json.h>
#else
#include <jsoncpp/json/json.h>
#endif

#include <algorithm>
#include <fstream>
#include <sstream>
#include <system_error>
#include <utility>

namespace fs = std::filesystem;

namespace {

constexpr int kJournalVersion = 1;
constexpr std::size_t kRepoKeyLength = 16;

std::string compact_json(const Json::Value& value)
{
    Json::StreamWriterBuilder builder;
    builder["indentation"] = "";
    builder["emitUTF8"] = true;
    return Json::writeString(builder, value);
}

std::optional<OperationRole> role_from_string(const std::string& value)
{
    if (value == "rename") return OperationRole::Rename;
    if (value == "cycle-break") return OperationRole::CycleBreak;
    if (value == "cycle-cleanup") return OperationRole::CycleCleanup;
    return std::nullopt;
}

Json::Value operation_to_json(const Operation& operation)
{
    Json::Value value(Json::objectValue);
    value["source"] = operation.source_path;
    value["target"] = operation.target_path;
    value["sequence_index"] = static_cast<Json::UInt64>(operation.sequence_index);
    value["role"] = to_string(operation.role);
    return value;
}

Json::Value batch_to_json(const Batch& batch)
{
    Json::Value value(Json::objectValue);
    value["batch_id"] = batch.batch_id;
    value["snapshot_id"] = batch.snapshot_id;
    value["timestamp"] = batch.timestamp;
    value["reverted_count"] = static_cast<Json::UInt64>(batch.reverted_count);
    value["completed"] = batch.completed;
    Json::Value operations(Json::arrayValue);
    for (const auto& operation : batch.operations) {
        operations.append(operation_to_json(operation));
    }
    value["operations"] = operations;
    return value;
}

std::optional<Operation> operation_from_json(const Json::Value& value)
{
    if (!value.isObject()
        || !value["source"].isString()
        || !value["target"].isString()
        || !value["sequence_index"].isUInt64()
        || !value["role"].isString()) {
        return std::nullopt;
    }
    const auto role = role_from_string(value["role"].asString());
    if (!role) {
        return std::nullopt;
    }
    Operation operation;
    operation.source_path = value["source"].asString();
    operation.target_path = value["target"].asString();
    operation.sequence_index = static_cast<std::size_t>(value["sequence_index"].asUInt64());
    operation.role = *role;
    if (operation.source_path.empty() || operation.target_path.empty()) {
        return std::nullopt;
    }
    return operation;
}

std::optional<Batch> batch_from_json(const Json::Value& value)
{
    if (!value.isObject()
        || !value["batch_id"].isString()
        || !value["operations"].isArray()) {
        return std::nullopt;
    }
    Batch batch;
    batch.batch_id = value["batch_id"].asString();
    if (batch.batch_id.empty()) {
        return std::nullopt;
    }
    batch.snapshot_id = value.get("snapshot_id", "").asString();
    batch.timestamp = value.get("timestamp", "").asString();
    batch.completed = value.get("completed", false).asBool();

    const Json::Value& reverted = value["reverted_count"];
    if (!reverted.isNull() && !reverted.isUInt64()) {
        return std::nullopt;
    }
    batch.reverted_count = reverted.isNull() ? 0 : static_cast<std::size_t>(reverted.asUInt64());

    for (const auto& item : value["operations"]) {
        auto operation = operation_from_json(item);
        if (!operation) {
            return std::nullopt;
        }
        batch.operations.push_back(std::move(*operation));
    }
    if (batch.reverted_count > batch.operations.size()) {
        return std::nullopt;
    }
    return batch;
}

bool is_key_ancestor(const std::string& parent, const std::string& child)
{
    return child.size() > parent.size()
        && child.compare(0, parent.size(), parent) == 0
        && child[parent.size()] == '/';
}

bool paths_overlap(const std::string& a, const std::string& b)
{
    const std::string key_a = Utils::collision_key(a);
    const std::string key_b = Utils::collision_key(b);
    return key_a == key_b || is_key_ancestor(key_a, key_b) || is_key_ancestor(key_b, key_a);
}

BatchSummary summarize(const Batch& batch)
{
    return BatchSummary{batch.batch_id, batch.timestamp, batch.operations.size(),
                        batch.reverted_count, batch.completed};
}

} // namespace


UndoJournal::WriteSession::WriteSession(UndoJournal& journal)
    : journal_(journal)
{
    if (journal_.session_open_.exchange(true)) {
        THROW_APP_ERROR(ErrorCodes::Code::JOURNAL_BUSY, Utils::path_to_utf8(journal_.file_));
    }
}


UndoJournal::WriteSession::~WriteSession()
{
    if (open_batch_) {
        try {
            finalize_batch();
        } catch (const std::exception& ex) {
            if (journal_.logger_) {
                journal_.logger_->error("Failed to finalize batch on session close: {}", ex.what());
            }
        }
    }
    journal_.session_open_.store(false);
}


const std::string& UndoJournal::WriteSession::begin_batch(const std::string& snapshot_id)
{
    if (open_batch_) {
        finalize_batch();
    }
    std::lock_guard<std::mutex> lock(journal_.mutex_);
    Batch batch;
    batch.batch_id = journal_.next_batch_id();
    batch.snapshot_id = snapshot_id;
    batch.timestamp = Utils::current_timestamp();
    open_batch_ = std::move(batch);
    if (journal_.logger_) {
        journal_.logger_->debug("Opened batch {}", open_batch_->batch_id);
    }
    return open_batch_->batch_id;
}


void UndoJournal::WriteSession::record_applied(const Operation& operation)
{
    if (!open_batch_) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::JOURNAL_WRITE_FAILED,
                            "No batch is open for recording", operation.source_path);
    }
    std::lock_guard<std::mutex> lock(journal_.mutex_);
    open_batch_->operations.push_back(operation);

    auto& batches = journal_.batches_;
    if (batches.empty() || batches.back().batch_id != open_batch_->batch_id) {
        batches.push_back(*open_batch_);
    } else {
        batches.back().operations.push_back(operation);
    }
    journal_.persist();
}


std::optional<Batch> UndoJournal::WriteSession::finalize_batch()
{
    if (!open_batch_) {
        return std::nullopt;
    }
    Batch batch = std::move(*open_batch_);
    open_batch_.reset();

    if (batch.operations.empty()) {
        if (journal_.logger_) {
            journal_.logger_->debug("Discarded empty batch {}", batch.batch_id);
        }
        return std::nullopt;
    }

    std::lock_guard<std::mutex> lock(journal_.mutex_);
    batch.completed = true;
    for (auto& stored : journal_.batches_) {
        if (stored.batch_id == batch.batch_id) {
            stored.completed = true;
        }
    }
    journal_.persist();
    if (journal_.logger_) {
        journal_.logger_->info("Journaled batch {} with {} operation(s)",
                               batch.batch_id, batch.operations.size());
    }
    return batch;
}


UndoJournal::UndoJournal(fs::path file, std::shared_ptr<spdlog::logger> logger)
    : file_(std::move(file)),
      logger_(std::move(logger))
{
}


fs::path UndoJournal::path_for_repository(const fs::path& directory, const std::string& repo_root)
{
    const std::string key = Utils::sha1_hex(repo_root).substr(0, kRepoKeyLength);
    return directory / fmt::format("journal_{}.json", key);
}


void UndoJournal::load()
{
    std::lock_guard<std::mutex> lock(mutex_);
    batches_.clear();
    quarantined_.clear();
    load_warnings_.clear();

    std::error_code ec;
    if (!fs::exists(file_, ec)) {
        return;
    }

    std::ifstream in(file_, std::ios::binary);
    if (!in) {
        THROW_APP_ERROR(ErrorCodes::Code::JOURNAL_LOAD_FAILED, Utils::path_to_utf8(file_));
    }

    Json::CharReaderBuilder reader;
    Json::Value root;
    std::string errors;
    const bool parsed = Json::parseFromStream(reader, in, &root, &errors);
    in.close();

    if (!parsed || !root.isObject() || !root["batches"].isArray()) {
        fs::path aside = file_;
        aside += fmt::format(".corrupt-{}", Utils::compact_timestamp());
        fs::rename(file_, aside, ec);
        if (ec) {
            THROW_APP_ERROR_MSG(ErrorCodes::Code::JOURNAL_CORRUPTED,
                                fmt::format("Journal is unreadable and could not be moved aside: {}", ec.message()),
                                Utils::path_to_utf8(file_));
        }
        const std::string warning = fmt::format("Journal {} was unreadable and has been moved to {}",
                                                Utils::path_to_utf8(file_), Utils::path_to_utf8(aside));
        load_warnings_.push_back(warning);
        if (logger_) {
            logger_->warn("{} ({})", warning, parsed ? "unexpected layout" : errors);
        }
        return;
    }

    bool newly_quarantined = false;
    for (const auto& item : root["batches"]) {
        if (auto batch = batch_from_json(item)) {
            batches_.push_back(std::move(*batch));
            continue;
        }
        quarantined_.push_back(compact_json(item));
        newly_quarantined = true;
        load_warnings_.push_back(fmt::format("Quarantined malformed batch record: {}", quarantined_.back()));
        if (logger_) {
            logger_->warn("Quarantined malformed batch record in {}", Utils::path_to_utf8(file_));
        }
    }
    if (root["quarantined"].isArray()) {
        for (const auto& item : root["quarantined"]) {
            quarantined_.push_back(compact_json(item));
        }
    }

    if (logger_) {
        logger_->debug("Loaded {} batch(es) from {}", batches_.size(), Utils::path_to_utf8(file_));
    }
    if (newly_quarantined) {
        persist();
    }
}


std::vector<BatchSummary> UndoJournal::list_batches() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    std::vector<BatchSummary> summaries;
    summaries.reserve(batches_.size());
    for (const auto& batch : batches_) {
        summaries.push_back(summarize(batch));
    }
    return summaries;
}


std::optional<Batch> UndoJournal::find_batch(const std::string& batch_id) const
{
    std::lock_guard<std::mutex> lock(mutex_);
    for (const auto& batch : batches_) {
        if (batch.batch_id == batch_id) {
            return batch;
        }
    }
    return std::nullopt;
}


std::optional<Batch> UndoJournal::latest_batch() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    if (batches_.empty()) {
        return std::nullopt;
    }
    return batches_.back();
}


std::vector<std::string> UndoJournal::quarantined() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return quarantined_;
}


std::vector<std::string> UndoJournal::load_warnings() const
{
    std::lock_guard<std::mutex> lock(mutex_);
    return load_warnings_;
}


std::optional<std::string> UndoJournal::find_later_overlap(std::size_t index) const
{
    const auto& batch = batches_[index];
    for (std::size_t later = index + 1; later < batches_.size(); ++later) {
        for (const auto& mine : batch.operations) {
            for (const auto& theirs : batches_[later].operations) {
                for (const auto* path : {&theirs.source_path, &theirs.target_path}) {
                    if (paths_overlap(mine.source_path, *path) || paths_overlap(mine.target_path, *path)) {
                        return fmt::format("'{}' was touched again by later batch {}",
                                           *path, batches_[later].batch_id);
                    }
                }
            }
        }
    }
    return std::nullopt;
}


RevertResult UndoJournal::revert(const std::string& batch_id, IVersionControlAdapter& adapter)
{
    WriteSession session(*this);
    std::unique_lock<std::mutex> lock(mutex_);

    RevertResult result;
    result.batch_id = batch_id;

    std::size_t index = batches_.size();
    if (batch_id == "latest") {
        if (!batches_.empty()) {
            index = batches_.size() - 1;
        }
    } else {
        for (std::size_t i = 0; i < batches_.size(); ++i) {
            if (batches_[i].batch_id == batch_id) {
                index = i;
                break;
            }
        }
    }
    if (index == batches_.size()) {
        result.status = RevertStatus::NotFound;
        result.message = batch_id == "latest" ? "The journal has no batches"
                                               : fmt::format("Batch {} not found", batch_id);
        return result;
    }

    Batch& batch = batches_[index];
    result.batch_id = batch.batch_id;

    if (auto overlap = find_later_overlap(index)) {
        result.status = RevertStatus::Conflict;
        result.message = fmt::format("Batch {} cannot be reverted: {}", batch.batch_id, *overlap);
        if (logger_) {
            logger_->warn("{}", result.message);
        }
        return result;
    }

    if (logger_) {
        logger_->info("Reverting batch {} ({} of {} operation(s) already reverted)",
                      batch.batch_id, batch.reverted_count, batch.operations.size());
    }

    while (batch.reverted_count < batch.operations.size()) {
        const std::size_t position = batch.operations.size() - batch.reverted_count - 1;
        const Operation operation = batch.operations[position];
        // The open session keeps other writers out while readers may call back in.
        lock.unlock();
        const MoveOutcome outcome = adapter.move(operation.target_path, operation.source_path);
        lock.lock();
        if (!outcome.ok()) {
            result.status = RevertStatus::AdapterFailure;
            result.failed_at = position;
            result.error = outcome.error;
            result.message = fmt::format("Reverting '{}' -> '{}' failed ({}): {}",
                                         operation.target_path, operation.source_path,
                                         to_string(outcome.error->kind), outcome.error->detail);
            if (logger_) {
                logger_->error("{}", result.message);
            }
            return result;
        }
        ++batch.reverted_count;
        ++result.reverted_operations;
        persist();
    }

    const std::string reverted_id = batch.batch_id;
    batches_.erase(batches_.begin() + static_cast<std::ptrdiff_t>(index));
    persist();

    result.status = RevertStatus::Reverted;
    result.message = fmt::format("Batch {} reverted", reverted_id);
    if (logger_) {
        logger_->info("{}", result.message);
    }
    return result;
}


void UndoJournal::persist() const
{
    Json::Value root(Json::objectValue);
    root["version"] = kJournalVersion;
    Json::Value batches(Json::arrayValue);
    for (const auto& batch : batches_) {
        batches.append(batch_to_json(batch));
    }
    root["batches"] = batches;

    Json::Value quarantined(Json::arrayValue);
    Json::CharReaderBuilder reader;
    for (const auto& raw : quarantined_) {
        Json::Value item;
        std::string errors;
        std::istringstream stream(raw);
        if (Json::parseFromStream(reader, stream, &item, &errors)) {
            quarantined.append(item);
        } else {
            quarantined.append(raw);
        }
    }
    root["quarantined"] = quarantined;

    std::error_code ec;
    if (file_.has_parent_path()) {
        fs::create_directories(file_.parent_path(), ec);
        if (ec) {
            THROW_APP_ERROR(ErrorCodes::Code::DIRECTORY_CREATE_FAILED, Utils::path_to_utf8(file_.parent_path()));
        }
    }

    Json::StreamWriterBuilder builder;
    builder["indentation"] = "  ";
    builder["emitUTF8"] = true;

    fs::path temporary = file_;
    temporary += ".tmp";
    {
        std::ofstream out(temporary, std::ios::binary | std::ios::trunc);
        if (!out) {
            THROW_APP_ERROR(ErrorCodes::Code::JOURNAL_WRITE_FAILED, Utils::path_to_utf8(temporary));
        }
        out << Json::writeString(builder, root) << '\n';
        out.flush();
        if (!out) {
            THROW_APP_ERROR(ErrorCodes::Code::JOURNAL_WRITE_FAILED, Utils::path_to_utf8(temporary));
        }
    }

    fs::rename(temporary, file_, ec);
    if (ec) {
        THROW_APP_ERROR_MSG(ErrorCodes::Code::JOURNAL_WRITE_FAILED,
                            fmt::format("Could not replace journal: {}", ec.message()),
                            Utils::path_to_utf8(file_));
    }
}


std::string UndoJournal::next_batch_id()
{
    const std::string stamp = Utils::compact_timestamp();
    for (;;) {
        std::string candidate = fmt::format("{}-{}", stamp, ++id_sequence_);
        const bool taken = std::any_of(batches_.begin(), batches_.end(), [&](const Batch& batch) {
            return batch.batch_id == candidate;
        });
        if (!taken) {
            return candidate;
        }
    }
}
