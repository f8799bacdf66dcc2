//
// Created by gregorian-rayne on 2/4/26.
//

#include "fdeps/scanner/source_scanner.hpp"
#include "fdeps/utils/file_utils.hpp"

#include <gtest/gtest.h>
#include <algorithm>
#include <unistd.h>

namespace fdeps::scanner
{
    TEST(GlobToRegexTest, Translation) {
        EXPECT_EQ(glob_to_regex("*.py"), "^.*\\.py$");
        EXPECT_EQ(glob_to_regex("test_?"), "^test_.$");
        EXPECT_EQ(glob_to_regex("[!a]x"), "^[^a]x$");
        EXPECT_EQ(glob_to_regex("a+b"), "^a\\+b$");
        EXPECT_EQ(glob_to_regex("[oops"), "^\\[oops$");
    }

    TEST(IgnoreMatcherTest, MatchesWholePathOrSegment) {
        const IgnoreMatcher matcher({"test_*.py", "docs/*", "migrations"});

        EXPECT_EQ(matcher.size(), 3u);
        EXPECT_TRUE(matcher.matches("pkg/test_core.py"));
        EXPECT_TRUE(matcher.matches("docs/conf.py"));
        EXPECT_TRUE(matcher.matches("app/migrations/0001.py"));
        EXPECT_FALSE(matcher.matches("pkg/core.py"));
    }

    TEST(IgnoreMatcherTest, RecursivePrefixAlsoMatchesTopLevel) {
        const IgnoreMatcher matcher({"**/generated"});

        EXPECT_TRUE(matcher.matches("generated"));
        EXPECT_TRUE(matcher.matches("a/b/generated"));
        EXPECT_FALSE(matcher.matches("a/b/generator.py"));
    }

    TEST(IgnoreMatcherTest, EmptyMatchesNothing) {
        const IgnoreMatcher matcher({});
        EXPECT_TRUE(matcher.empty());
        EXPECT_FALSE(matcher.matches("anything.py"));
    }

    class SourceScannerTest : public ::testing::Test {
    protected:
        void SetUp() override {
            temp_dir = fs::temp_directory_path() / "fdeps_scanner_test";
            fs::create_directories(temp_dir);
        }

        void TearDown() override {
            fs::remove_all(temp_dir);
        }

        void create_test_file(const fs::path& relative, const std::string& content = "") const {
            ASSERT_TRUE(file_utils::write_file(temp_dir / relative, content).is_ok());
        }

        [[nodiscard]] std::vector<std::string> relative(const std::vector<fs::path>& files) const {
            std::vector<std::string> out;
            for (const auto& f : files) {
                out.push_back(f.lexically_relative(temp_dir).generic_string());
            }
            return out;
        }

        fs::path temp_dir;
    };

    TEST_F(SourceScannerTest, FindsSourceFilesSorted) {
        create_test_file("b.py");
        create_test_file("a.py");
        create_test_file("pkg/__init__.py");
        create_test_file("pkg/mod.py");
        create_test_file("README.md");
        create_test_file("pkg/data.json");

        const auto files = discover_source_files(temp_dir);

        EXPECT_EQ(relative(files),
                  (std::vector<std::string>{"a.py", "b.py", "pkg/__init__.py", "pkg/mod.py"}));
        EXPECT_TRUE(std::ranges::is_sorted(files));
    }

    TEST_F(SourceScannerTest, SkipsExcludedAndHiddenDirectories) {
        create_test_file("main.py");
        create_test_file("__pycache__/main.cpython-311.py");
        create_test_file(".venv/lib/site.py");
        create_test_file(".hidden/secret.py");
        create_test_file("node_modules/x.py");

        EXPECT_EQ(relative(discover_source_files(temp_dir)), std::vector<std::string>{"main.py"});
    }

    TEST_F(SourceScannerTest, CustomExcludeDirs) {
        create_test_file("keep/a.py");
        create_test_file("build/b.py");

        ScanOptions options;
        options.exclude_dirs = {"build"};

        EXPECT_EQ(relative(discover_source_files(temp_dir, options)), std::vector<std::string>{"keep/a.py"});
    }

    TEST_F(SourceScannerTest, IgnorePatterns) {
        create_test_file("app/core.py");
        create_test_file("app/test_core.py");
        create_test_file("tests/helpers.py");

        ScanOptions options;
        options.ignore_patterns = {"test_*.py", "tests"};

        EXPECT_EQ(relative(discover_source_files(temp_dir, options)), std::vector<std::string>{"app/core.py"});
    }

    TEST_F(SourceScannerTest, DoesNotFollowSymlinkedDirectories) {
        const auto outside = fs::temp_directory_path() / "fdeps_scanner_outside";
        ASSERT_TRUE(file_utils::write_file(outside / "elsewhere.py", "").is_ok());
        create_test_file("main.py");

        std::error_code ec;
        fs::create_directory_symlink(outside, temp_dir / "linked", ec);
        if (ec) {
            fs::remove_all(outside);
            GTEST_SKIP() << "directory symlinks unavailable: " << ec.message();
        }

        EXPECT_EQ(relative(discover_source_files(temp_dir)), std::vector<std::string>{"main.py"});
        fs::remove_all(outside);
    }

    TEST_F(SourceScannerTest, SkipsUnreadableDirectories) {
        if (::geteuid() == 0) {
            GTEST_SKIP() << "permission checks do not apply to root";
        }
        create_test_file("main.py");
        create_test_file("locked/hidden_mod.py");
        fs::permissions(temp_dir / "locked", fs::perms::none);

        const auto files = discover_source_files(temp_dir);

        fs::permissions(temp_dir / "locked", fs::perms::owner_all);
        EXPECT_EQ(relative(files), std::vector<std::string>{"main.py"});
    }

    TEST_F(SourceScannerTest, MissingRootGivesEmptyList) {
        EXPECT_TRUE(discover_source_files(temp_dir / "nowhere").empty());
    }
}  // namespace fdeps::scanner
