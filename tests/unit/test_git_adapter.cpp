#include <catch2/catch_test_macros.hpp>

#include "AppException.hpp"
#include "GitAdapter.hpp"
#include "TestHelpers.hpp"
#include "Utils.hpp"

#include <QCoreApplication>
#include <QProcess>
#include <QStandardPaths>
#include <QStringList>

#include <algorithm>
#include <memory>
#include <string>
#include <vector>

namespace {

void ensure_core_application()
{
    static int argc = 1;
    static char name[] = "repopath-sanitizer-tests";
    static char* argv[] = {name, nullptr};
    static std::unique_ptr<QCoreApplication> app;
    if (!QCoreApplication::instance()) {
        app = std::make_unique<QCoreApplication>(argc, argv);
    }
}

bool git(const std::filesystem::path& dir, const QStringList& args)
{
    QProcess process;
    QStringList full_args;
    full_args << QStringLiteral("-C") << QString::fromStdString(Utils::path_to_utf8(dir))
              << QStringLiteral("-c") << QStringLiteral("user.name=Test")
              << QStringLiteral("-c") << QStringLiteral("user.email=test@example.com")
              << QStringLiteral("-c") << QStringLiteral("commit.gpgsign=false")
              << args;
    process.start(QStandardPaths::findExecutable(QStringLiteral("git")), full_args);
    return process.waitForStarted() && process.waitForFinished(60000)
        && process.exitStatus() == QProcess::NormalExit && process.exitCode() == 0;
}

struct GitFixture {
    TempDir dir;

    GitFixture()
    {
        ensure_core_application();
        REQUIRE(git(dir.path(), {QStringLiteral("init"), QStringLiteral("-q")}));
        write_text_file(dir.path() / "src" / "main.cpp", "int main() {}\n");
        write_text_file(dir.path() / "notes" / "todo.md", "- fix\n");
        write_text_file(dir.path() / ".gitignore", "*.log\n");
        write_text_file(dir.path() / "build.log", "log\n");
        REQUIRE(git(dir.path(), {QStringLiteral("add"), QStringLiteral(".")}));
        REQUIRE(git(dir.path(), {QStringLiteral("commit"), QStringLiteral("-q"),
                                 QStringLiteral("-m"), QStringLiteral("initial")}));
    }

    std::string root() const { return Utils::path_to_utf8(dir.path()); }
};

std::vector<std::string> paths_of(const std::vector<PathEntry>& entries)
{
    std::vector<std::string> paths;
    for (const auto& entry : entries) {
        paths.push_back(entry.path());
    }
    std::sort(paths.begin(), paths.end());
    return paths;
}

} // namespace

TEST_CASE("GitAdapter lists tracked files with their directories") {
    if (!GitAdapter::is_git_available()) {
        SKIP("git is not installed");
    }
    GitFixture fixture;
    GitAdapter adapter(fixture.root());

    const auto paths = paths_of(adapter.list_tracked());
    CHECK(paths == std::vector<std::string>{".gitignore", "notes", "notes/todo.md", "src", "src/main.cpp"});
}

TEST_CASE("GitAdapter includes ignored files on request") {
    if (!GitAdapter::is_git_available()) {
        SKIP("git is not installed");
    }
    GitFixture fixture;
    GitAdapter adapter(fixture.root(), true);

    const auto paths = paths_of(adapter.list_tracked());
    CHECK(std::find(paths.begin(), paths.end(), "build.log") != paths.end());

    REQUIRE(adapter.move("build.log", "build-1.log").ok());
    CHECK(std::filesystem::exists(fixture.dir.path() / "build-1.log"));
    CHECK_FALSE(std::filesystem::exists(fixture.dir.path() / "build.log"));
}

TEST_CASE("GitAdapter moves tracked paths with git mv") {
    if (!GitAdapter::is_git_available()) {
        SKIP("git is not installed");
    }
    GitFixture fixture;
    GitAdapter adapter(fixture.root());

    CHECK_FALSE(adapter.has_uncommitted_changes());
    REQUIRE(adapter.move("notes", "docs").ok());
    CHECK(std::filesystem::exists(fixture.dir.path() / "docs" / "todo.md"));
    CHECK(adapter.has_uncommitted_changes());

    const auto paths = paths_of(adapter.list_tracked());
    CHECK(std::find(paths.begin(), paths.end(), "docs/todo.md") != paths.end());
    CHECK(std::find(paths.begin(), paths.end(), "notes/todo.md") == paths.end());
}

TEST_CASE("GitAdapter reports move failures by kind") {
    if (!GitAdapter::is_git_available()) {
        SKIP("git is not installed");
    }
    GitFixture fixture;
    GitAdapter adapter(fixture.root());

    const auto missing = adapter.move("nowhere.txt", "elsewhere.txt");
    REQUIRE_FALSE(missing.ok());
    CHECK(missing.error->kind == AdapterErrorKind::NotFound);

    const auto occupied = adapter.move("notes/todo.md", "src/main.cpp");
    REQUIRE_FALSE(occupied.ok());
    CHECK(occupied.error->kind == AdapterErrorKind::TargetExists);
}

TEST_CASE("GitAdapter detects work trees") {
    if (!GitAdapter::is_git_available()) {
        SKIP("git is not installed");
    }
    GitFixture fixture;
    CHECK(GitAdapter::is_git_repo(fixture.root()));
    CHECK(std::filesystem::equivalent(Utils::utf8_to_path(GitAdapter::repo_root(fixture.root() + "/src")),
                                      fixture.dir.path()));
    CHECK(GitAdapter(fixture.root()).list_submodules().empty());

    TempDir plain;
    CHECK_FALSE(GitAdapter::is_git_repo(Utils::path_to_utf8(plain.path())));
    try {
        GitAdapter::repo_root(Utils::path_to_utf8(plain.path()));
        FAIL("expected REPO_NOT_A_WORK_TREE");
    } catch (const ErrorCodes::AppException& ex) {
        CHECK(ex.get_error_code() == ErrorCodes::Code::REPO_NOT_A_WORK_TREE);
    }
}
