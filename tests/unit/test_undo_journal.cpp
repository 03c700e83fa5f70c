#include <catch2/catch_test_macros.hpp>

#include "AppException.hpp"
#include "RenameExecutor.hpp"
#include "TestHelpers.hpp"
#include "UndoJournal.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace {

RenamePlan make_plan(const std::vector<std::pair<std::string, std::string>>& moves)
{
    RenamePlan plan;
    plan.snapshot_id = "snap";
    for (std::size_t i = 0; i < moves.size(); ++i) {
        plan.operations.push_back(Operation{moves[i].first, moves[i].second, i, OperationRole::Rename});
    }
    return plan;
}

std::string apply_batch(InMemoryAdapter& adapter, UndoJournal& journal,
                        const std::vector<std::pair<std::string, std::string>>& moves)
{
    RenameExecutor executor(adapter, journal);
    const auto result = executor.apply(make_plan(moves));
    REQUIRE(result.ok());
    REQUIRE(result.batch.has_value());
    return result.batch->batch_id;
}

bool has_corrupt_sibling(const fs::path& file)
{
    const std::string prefix = file.filename().string() + ".corrupt-";
    for (const auto& entry : fs::directory_iterator(file.parent_path())) {
        if (entry.path().filename().string().rfind(prefix, 0) == 0) {
            return true;
        }
    }
    return false;
}

// Reads the journal from inside every move, the way a progress hook would.
class JournalReadingAdapter : public InMemoryAdapter {
public:
    JournalReadingAdapter(const std::vector<std::string>& files, const UndoJournal& journal)
        : InMemoryAdapter(files), journal_(journal) {}

    MoveOutcome move(const std::string& source, const std::string& target) override {
        const auto batches = journal_.list_batches();
        if (!batches.empty()) {
            seen_reverted.push_back(batches.front().reverted_count);
        }
        return InMemoryAdapter::move(source, target);
    }

    std::vector<std::size_t> seen_reverted;

private:
    const UndoJournal& journal_;
};

} // namespace

TEST_CASE("An adapter may read the journal while a revert is running") {
    TempDir dir;
    UndoJournal journal(dir.path() / "journal.json");
    JournalReadingAdapter adapter({"a", "b"}, journal);

    const auto batch_id = apply_batch(adapter, journal, {{"a", "a1"}, {"b", "b1"}});
    adapter.seen_reverted.clear();

    const auto result = journal.revert(batch_id, adapter);

    REQUIRE(result.ok());
    CHECK(result.reverted_operations == 2);
    CHECK(adapter.seen_reverted == std::vector<std::size_t>{0, 1});
    CHECK(adapter.live_paths() == std::vector<std::string>{"a", "b"});
    CHECK(journal.list_batches().empty());
}

TEST_CASE("Reverting a batch undoes its operations in reverse order") {
    TempDir dir;
    UndoJournal journal(dir.path() / "journal.json");
    InMemoryAdapter adapter({"a", "b", "c"});

    const auto first = apply_batch(adapter, journal, {{"a", "a1"}, {"b", "b1"}});
    apply_batch(adapter, journal, {{"c", "c1"}});
    const std::size_t before = adapter.moves().size();

    const auto result = journal.revert(first, adapter);

    REQUIRE(result.ok());
    CHECK(result.reverted_operations == 2);
    const auto& moves = adapter.moves();
    REQUIRE(moves.size() == before + 2);
    CHECK(moves[before] == std::make_pair(std::string("b1"), std::string("b")));
    CHECK(moves[before + 1] == std::make_pair(std::string("a1"), std::string("a")));
    CHECK(adapter.live_paths() == std::vector<std::string>{"a", "b", "c1"});

    const auto remaining = journal.list_batches();
    REQUIRE(remaining.size() == 1);
    CHECK(remaining[0].batch_id != first);
}

TEST_CASE("A batch touched again by a later batch is not reverted") {
    TempDir dir;
    UndoJournal journal(dir.path() / "journal.json");
    InMemoryAdapter adapter({"a", "b"});

    const auto first = apply_batch(adapter, journal, {{"a", "a1"}});
    apply_batch(adapter, journal, {{"a1", "a2"}});
    const std::size_t before = adapter.moves().size();

    const auto result = journal.revert(first, adapter);

    CHECK(result.status == RevertStatus::Conflict);
    CHECK_FALSE(result.message.empty());
    CHECK(adapter.moves().size() == before);
    CHECK(journal.list_batches().size() == 2);
}

TEST_CASE("A later batch below a renamed directory overlaps it") {
    TempDir dir;
    UndoJournal journal(dir.path() / "journal.json");
    InMemoryAdapter adapter({"Dir/x.txt", "other"});

    const auto first = apply_batch(adapter, journal, {{"Dir", "Docs"}});
    apply_batch(adapter, journal, {{"Docs/x.txt", "Docs/y.txt"}});

    CHECK(journal.revert(first, adapter).status == RevertStatus::Conflict);
}

TEST_CASE("Latest reverts the most recent batch") {
    TempDir dir;
    UndoJournal journal(dir.path() / "journal.json");
    InMemoryAdapter adapter({"a", "b"});

    apply_batch(adapter, journal, {{"a", "a1"}});
    const auto second = apply_batch(adapter, journal, {{"b", "b1"}});

    const auto result = journal.revert("latest", adapter);
    REQUIRE(result.ok());
    CHECK(result.batch_id == second);
    CHECK(adapter.contains("b"));
    CHECK(adapter.contains("a1"));
}

TEST_CASE("Unknown batches are reported as not found") {
    TempDir dir;
    UndoJournal journal(dir.path() / "journal.json");
    InMemoryAdapter adapter({"a"});

    CHECK(journal.revert("latest", adapter).status == RevertStatus::NotFound);
    apply_batch(adapter, journal, {{"a", "a1"}});
    CHECK(journal.revert("no-such-batch", adapter).status == RevertStatus::NotFound);
    CHECK(journal.list_batches().size() == 1);
}

TEST_CASE("An interrupted revert resumes where it stopped") {
    TempDir dir;
    const fs::path file = dir.path() / "journal.json";
    UndoJournal journal(file);
    InMemoryAdapter adapter({"x1", "x2", "x3"});

    const auto id = apply_batch(adapter, journal, {{"x1", "y1"}, {"x2", "y2"}, {"x3", "y3"}});
    // Calls 0-2 applied the batch; call 3 reverts y3, call 4 fails on y2.
    adapter.fail_on_call(4, AdapterErrorKind::Other);

    const auto failed = journal.revert(id, adapter);
    CHECK(failed.status == RevertStatus::AdapterFailure);
    REQUIRE(failed.failed_at.has_value());
    CHECK(*failed.failed_at == 1);
    CHECK(failed.reverted_operations == 1);
    CHECK(adapter.contains("x3"));
    CHECK(adapter.contains("y2"));

    UndoJournal reloaded(file);
    reloaded.load();
    const auto stored = reloaded.find_batch(id);
    REQUIRE(stored.has_value());
    CHECK(stored->reverted_count == 1);

    adapter.clear_failure();
    const auto resumed = reloaded.revert(id, adapter);
    REQUIRE(resumed.ok());
    CHECK(resumed.reverted_operations == 2);
    CHECK(adapter.live_paths() == std::vector<std::string>{"x1", "x2", "x3"});
    CHECK(reloaded.list_batches().empty());
}

TEST_CASE("Batches survive a reload") {
    TempDir dir;
    const fs::path file = dir.path() / "journal.json";
    std::string id;
    {
        UndoJournal journal(file);
        InMemoryAdapter adapter({"a"});
        id = apply_batch(adapter, journal, {{"a", "b"}});
    }

    UndoJournal reloaded(file);
    reloaded.load();
    const auto batch = reloaded.find_batch(id);
    REQUIRE(batch.has_value());
    CHECK(batch->completed);
    CHECK(batch->snapshot_id == "snap");
    REQUIRE(batch->operations.size() == 1);
    CHECK(batch->operations[0].source_path == "a");
    CHECK(batch->operations[0].target_path == "b");
    CHECK(batch->operations[0].role == OperationRole::Rename);
    CHECK(reloaded.load_warnings().empty());
}

TEST_CASE("Batch ids are unique within a journal") {
    TempDir dir;
    UndoJournal journal(dir.path() / "journal.json");
    InMemoryAdapter adapter({"a", "b", "c"});

    const auto first = apply_batch(adapter, journal, {{"a", "a1"}});
    const auto second = apply_batch(adapter, journal, {{"b", "b1"}});
    const auto third = apply_batch(adapter, journal, {{"c", "c1"}});
    CHECK(first != second);
    CHECK(second != third);
    CHECK(first != third);
}

TEST_CASE("An unreadable journal is moved aside") {
    TempDir dir;
    const fs::path file = dir.path() / "journal.json";
    write_text_file(file, "{ not json");

    UndoJournal journal(file);
    journal.load();

    CHECK(journal.list_batches().empty());
    CHECK_FALSE(journal.load_warnings().empty());
    CHECK_FALSE(fs::exists(file));
    CHECK(has_corrupt_sibling(file));
}

TEST_CASE("Malformed batch records are quarantined and kept") {
    TempDir dir;
    const fs::path file = dir.path() / "journal.json";
    write_text_file(file, R"({
  "version": 1,
  "batches": [
    {"batch_id": "good", "snapshot_id": "s", "timestamp": "t", "reverted_count": 0, "completed": true,
     "operations": [{"source": "a", "target": "b", "sequence_index": 0, "role": "rename"}]},
    {"batch_id": 5, "operations": "nope"}
  ]
})");

    UndoJournal journal(file);
    journal.load();
    CHECK(journal.list_batches().size() == 1);
    CHECK(journal.quarantined().size() == 1);
    CHECK(journal.load_warnings().size() == 1);

    UndoJournal reloaded(file);
    reloaded.load();
    CHECK(reloaded.list_batches().size() == 1);
    CHECK(reloaded.quarantined().size() == 1);
    CHECK(reloaded.load_warnings().empty());
}

TEST_CASE("A second writer gets JOURNAL_BUSY") {
    TempDir dir;
    UndoJournal journal(dir.path() / "journal.json");
    InMemoryAdapter adapter({"a"});

    UndoJournal::WriteSession holder(journal);
    CHECK_THROWS_AS(UndoJournal::WriteSession(journal), ErrorCodes::AppException);
    try {
        journal.revert("latest", adapter);
        FAIL("expected JOURNAL_BUSY");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::JOURNAL_BUSY);
    }
}

TEST_CASE("Journal files are keyed by repository root") {
    const fs::path base = "/state";
    const auto first = UndoJournal::path_for_repository(base, "/work/repo-a");
    const auto again = UndoJournal::path_for_repository(base, "/work/repo-a");
    const auto other = UndoJournal::path_for_repository(base, "/work/repo-b");

    CHECK(first == again);
    CHECK(first != other);
    CHECK(first.parent_path() == base);
    const std::string name = first.filename().string();
    CHECK(name.rfind("journal_", 0) == 0);
    CHECK(name.size() == std::string("journal_.json").size() + 16);
}
