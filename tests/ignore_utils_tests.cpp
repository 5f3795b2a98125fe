#include "test_common.hpp"
#include <stdexcept>
#include "errors.hpp"
#include "ignore_utils.hpp"
#include "system_utils.hpp"

using git_ignore::test_support::read_file;
using git_ignore::test_support::TempDir;
using git_ignore::test_support::write_file;

TEST_CASE("read_ignore_file trims whitespace and skips comments") {
    TempDir dir("ign_test_parse");
    fs::path file = dir.path() / ".gitignore";
    write_file(file, "  foo  \r\n#comment\nbar\n   \n\t#another\n\tbaz  \n");
    auto entries = ignore::read_ignore_file(file);
    std::vector<std::string> expected{"foo", "bar", "baz"};
    REQUIRE(entries == expected);
}

TEST_CASE("read_ignore_file of a missing file is empty") {
    TempDir dir("ign_test_missing");
    REQUIRE(ignore::read_ignore_file(dir.path() / "nope").empty());
}

TEST_CASE("read_ignore_file rejects a directory") {
    TempDir dir("ign_test_dir");
    try {
        ignore::read_ignore_file(dir.path());
        FAIL("expected IgnoreError");
    } catch (const IgnoreError& e) {
        REQUIRE(e.kind() == ErrorKind::Io);
    }
}

TEST_CASE("normalize_pattern strips line breaks and whitespace") {
    REQUIRE(ignore::normalize_pattern("  *.pyc \r\n") == "*.pyc");
    REQUIRE(ignore::normalize_pattern("a\nb") == "ab");
    REQUIRE(ignore::normalize_pattern(" \n ").empty());
}

TEST_CASE("append_patterns creates a missing file") {
    TempDir dir("ign_test_create");
    fs::path file = dir.path() / ".gitignore";
    auto report = ignore::append_patterns(file, {"*.pyc", "__pycache__/"});
    REQUIRE(report.created);
    REQUIRE(report.target_path == file);
    REQUIRE(report.added == std::vector<std::string>{"*.pyc", "__pycache__/"});
    REQUIRE(report.skipped_duplicates.empty());
    REQUIRE(read_file(file) == "*.pyc\n__pycache__/\n");
}

TEST_CASE("append_patterns creates missing parent directories") {
    TempDir dir("ign_test_parents");
    fs::path file = dir.path() / "config" / "git" / "ignore";
    auto report = ignore::append_patterns(file, {".DS_Store"});
    REQUIRE(report.created);
    REQUIRE(read_file(file) == ".DS_Store\n");
}

TEST_CASE("append_patterns is idempotent") {
    TempDir dir("ign_test_idem");
    fs::path file = dir.path() / ".gitignore";
    ignore::append_patterns(file, {"*.pyc"});
    for (int i = 0; i < 3; ++i) {
        auto report = ignore::append_patterns(file, {"*.pyc", "  *.pyc  "});
        REQUIRE(report.added.empty());
        REQUIRE(report.skipped_duplicates.size() == 2);
        REQUIRE_FALSE(report.created);
    }
    REQUIRE(read_file(file) == "*.pyc\n");
}

TEST_CASE("append_patterns preserves existing content verbatim") {
    TempDir dir("ign_test_preserve");
    fs::path file = dir.path() / ".gitignore";
    const std::string original = "# build output\r\nbuild/\r\n\r\n  # indented comment\n*.o";
    write_file(file, original);
    auto report = ignore::append_patterns(file, {"*.o", "# build output", "dist/"});
    REQUIRE(report.skipped_duplicates == std::vector<std::string>{"*.o"});
    REQUIRE(report.added == std::vector<std::string>{"# build output", "dist/"});
    REQUIRE(read_file(file) == original + "\n# build output\ndist/\n");
}

TEST_CASE("append_patterns skips repeats within a batch") {
    TempDir dir("ign_test_batch");
    fs::path file = dir.path() / ".gitignore";
    auto report = ignore::append_patterns(file, {"a", "b", "a"});
    REQUIRE(report.added == std::vector<std::string>{"a", "b"});
    REQUIRE(report.skipped_duplicates == std::vector<std::string>{"a"});
}

TEST_CASE("append_patterns with duplicates allowed adds everything") {
    TempDir dir("ign_test_allow");
    fs::path file = dir.path() / ".gitignore";
    write_file(file, "a\n");
    auto report = ignore::append_patterns(file, {"a", "a"}, true);
    REQUIRE(report.added.size() == 2);
    REQUIRE(report.skipped_duplicates.empty());
    REQUIRE(read_file(file) == "a\na\na\n");
}

TEST_CASE("append_patterns without new patterns leaves the file alone") {
    TempDir dir("ign_test_noop");
    fs::path file = dir.path() / ".gitignore";
    write_file(file, "a");
    auto before = fs::last_write_time(file);
    auto report = ignore::append_patterns(file, {"a"});
    REQUIRE(report.added.empty());
    REQUIRE(read_file(file) == "a");
    REQUIRE(fs::last_write_time(file) == before);
}

TEST_CASE("append_patterns drops candidates that normalize to empty") {
    TempDir dir("ign_test_blank");
    fs::path file = dir.path() / ".gitignore";
    auto report = ignore::append_patterns(file, {"  ", "\n"}, true);
    REQUIRE(report.added.empty());
    REQUIRE(report.dropped_blank == 2);
    REQUIRE_FALSE(report.created);
    REQUIRE_FALSE(fs::exists(file));
}

TEST_CASE("Failure before replace leaves target untouched") {
    TempDir dir("ign_test_atomic");
    fs::path file = dir.path() / ".gitignore";
    write_file(file, "keep\n");
    fs::path staged;
    auto hook = [&](const fs::path& tmp) {
        staged = tmp;
        REQUIRE(read_file(tmp) == "keep\nnew\n");
        throw std::runtime_error("simulated crash");
    };
    REQUIRE_THROWS_AS(ignore::append_patterns(file, {"new"}, false, hook), std::runtime_error);
    REQUIRE(read_file(file) == "keep\n");
    REQUIRE_FALSE(staged.empty());
    REQUIRE(staged.parent_path() == file.parent_path());
    REQUIRE_FALSE(fs::exists(staged));
}

TEST_CASE("Pending interrupt aborts before replace") {
    TempDir dir("ign_test_interrupt");
    fs::path file = dir.path() / ".gitignore";
    write_file(file, "keep\n");
    procutil::request_interrupt();
    try {
        ignore::append_patterns(file, {"new"});
        procutil::clear_interrupt();
        FAIL("expected IgnoreError");
    } catch (const IgnoreError& e) {
        procutil::clear_interrupt();
        REQUIRE(e.kind() == ErrorKind::Interrupted);
    }
    REQUIRE(read_file(file) == "keep\n");
    for (const auto& entry : fs::directory_iterator(dir.path()))
        REQUIRE(entry.path().filename() == ".gitignore");
}

#ifndef _WIN32
TEST_CASE("Unwritable directory reports an I/O error") {
    if (geteuid() == 0)
        SKIP("permissions are not enforced for root");
    TempDir dir("ign_test_perm");
    fs::path sub = dir.path() / "ro";
    fs::create_directories(sub);
    write_file(sub / ".gitignore", "a\n");
    fs::permissions(sub, fs::perms::owner_read | fs::perms::owner_exec);
    try {
        ignore::append_patterns(sub / ".gitignore", {"b"});
        FAIL("expected IgnoreError");
    } catch (const IgnoreError& e) {
        REQUIRE(e.kind() == ErrorKind::Io);
    }
    fs::permissions(sub, fs::perms::owner_all);
    REQUIRE(read_file(sub / ".gitignore") == "a\n");
}
#endif

TEST_CASE("append_patterns writes through a symbolic link") {
    TempDir dir("ign_test_symlink");
    fs::path real = dir.path() / "dotfiles" / "gitignore";
    write_file(real, "*.swp\n");
    fs::path link = dir.path() / "ignore";
    std::error_code ec;
    fs::create_symlink(fs::path("dotfiles") / "gitignore", link, ec);
    if (ec)
        SKIP("symbolic links not available");

    auto report = ignore::append_patterns(link, {".DS_Store", "*.swp"});
    REQUIRE(report.added == std::vector<std::string>{".DS_Store"});
    REQUIRE(report.skipped_duplicates == std::vector<std::string>{"*.swp"});
    REQUIRE_FALSE(report.created);
    REQUIRE(fs::is_symlink(link));
    REQUIRE(read_file(real) == "*.swp\n.DS_Store\n");
    for (const auto& entry : fs::directory_iterator(real.parent_path()))
        REQUIRE(entry.path().filename() == "gitignore");
}

TEST_CASE("append_patterns follows a link chain to a missing file") {
    TempDir dir("ign_test_symlink_chain");
    fs::path real = dir.path() / "store" / "ignore";
    fs::path middle = dir.path() / "middle";
    fs::path link = dir.path() / "link";
    std::error_code ec;
    fs::create_symlink(real, middle, ec);
    if (!ec)
        fs::create_symlink("middle", link, ec);
    if (ec)
        SKIP("symbolic links not available");

    auto report = ignore::append_patterns(link, {"*.log"});
    REQUIRE(report.created);
    REQUIRE(fs::is_symlink(link));
    REQUIRE(fs::is_symlink(middle));
    REQUIRE(read_file(real) == "*.log\n");
}

TEST_CASE("ensure_exclude_file writes the template once") {
    TempDir dir("ign_test_exclude");
    fs::path file = dir.path() / "info" / "exclude";
    REQUIRE(ignore::ensure_exclude_file(file));
    std::string content = read_file(file);
    REQUIRE(content.rfind("# git ls-files --others --exclude-from=.git/info/exclude\n", 0) == 0);
    REQUIRE(ignore::read_ignore_file(file).empty());
    REQUIRE_FALSE(ignore::ensure_exclude_file(file));
    REQUIRE(read_file(file) == content);
}

TEST_CASE("write_file_atomic replaces content") {
    TempDir dir("ign_test_replace");
    fs::path file = dir.path() / "f";
    ignore::write_file_atomic(file, "one\n");
    ignore::write_file_atomic(file, "two\n");
    REQUIRE(read_file(file) == "two\n");
}
