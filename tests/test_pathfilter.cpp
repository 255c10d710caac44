/**
 * @file test_pathfilter.cpp
 * @brief Unit tests for the PathFilter class
 *
 * ## Test Coverage
 *
 * ### Pattern Matching (6 tests)
 * - ExcludesByBasename: Pattern matches a single component
 * - ExcludesWholeSubtree: A matching ancestor excludes its descendants
 * - MatchesJoinedPrefix: Patterns containing '/' match the joined prefix
 * - WildcardPatterns: '*' and '?' globs
 * - DoesNotMatchPartialNames: "node_modules" does not exclude "node_modules2"
 * - EmptyPatternListExcludesNothing
 *
 * ### Hidden Entries (3 tests)
 * - HiddenSkippedWhenDisabled
 * - HiddenKeptWhenEnabled
 * - HiddenCheckIsRootRelative: Dot directories above the root do not count
 *
 * ### Root Handling (3 tests)
 * - RootIsNeverExcludedByPattern
 * - PathsOutsideRootAreNotMatched
 * - RelativePathUsesForwardSlashes
 *
 * @note PathFilter is purely lexical; no files are needed on disk
 *
 * @see PathFilter
 */

#include <gtest/gtest.h>
#include "pathfilter.hpp"

#include <filesystem>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @class PathFilterTest
 * @brief Test fixture providing a fixed root and a filter factory
 */
class PathFilterTest : public ::testing::Test {
protected:
    /** @brief Root used by every filter; it does not have to exist */
    fs::path root = "/work/project";

    PathFilter makeFilter(std::vector<std::string> patterns,
                          bool include_hidden = true) {
        return PathFilter(root, std::move(patterns), include_hidden);
    }
};

/**
 * @test ExcludesByBasename
 * @brief A pattern matching one component excludes that entry
 */
TEST_F(PathFilterTest, ExcludesByBasename) {
    auto filter = makeFilter({".git", "node_modules"});

    EXPECT_TRUE(filter.isExcludedByPattern(root / ".git"));
    EXPECT_TRUE(filter.isExcludedByPattern(root / "node_modules"));
    EXPECT_FALSE(filter.isExcludedByPattern(root / "src"));
    EXPECT_FALSE(filter.isExcludedByPattern(root / "README.md"));
}

/**
 * @test ExcludesWholeSubtree
 * @brief Everything below an excluded directory is excluded too
 *
 * "web/node_modules/react/index.js" matches through its ancestor
 * "node_modules".
 */
TEST_F(PathFilterTest, ExcludesWholeSubtree) {
    auto filter = makeFilter({"node_modules"});

    EXPECT_TRUE(filter.isExcludedByPattern(
        root / "web" / "node_modules" / "react" / "index.js"));
    EXPECT_TRUE(filter.shouldSkip(root / "node_modules" / "a" / "b.js"));
    EXPECT_FALSE(filter.shouldSkip(root / "web" / "src" / "index.js"));
}

/**
 * @test MatchesJoinedPrefix
 * @brief Patterns with a slash are tested against the joined prefix
 */
TEST_F(PathFilterTest, MatchesJoinedPrefix) {
    auto filter = makeFilter({"docs/*.md", "build/out"});

    EXPECT_TRUE(filter.isExcludedByPattern(root / "docs" / "a.md"));
    EXPECT_TRUE(filter.isExcludedByPattern(root / "build" / "out" / "x.o"));
    EXPECT_FALSE(filter.isExcludedByPattern(root / "docs" / "a.txt"));
    EXPECT_FALSE(filter.isExcludedByPattern(root / "docs"));
    EXPECT_FALSE(filter.isExcludedByPattern(root / "build" / "lib"));
}

/**
 * @test WildcardPatterns
 * @brief Shell-style globs apply to single components
 */
TEST_F(PathFilterTest, WildcardPatterns) {
    auto filter = makeFilter({"*.pyc", "tmp?"});

    EXPECT_TRUE(filter.isExcludedByPattern(root / "pkg" / "mod.pyc"));
    EXPECT_TRUE(filter.isExcludedByPattern(root / "tmp1"));
    EXPECT_TRUE(filter.isExcludedByPattern(root / "tmp2" / "keep.txt"));
    EXPECT_FALSE(filter.isExcludedByPattern(root / "pkg" / "mod.py"));
    EXPECT_FALSE(filter.isExcludedByPattern(root / "tmp10"));
}

/**
 * @test DoesNotMatchPartialNames
 * @brief Patterns match whole components only
 */
TEST_F(PathFilterTest, DoesNotMatchPartialNames) {
    auto filter = makeFilter({"node_modules"});

    EXPECT_FALSE(filter.isExcludedByPattern(root / "node_modules2"));
    EXPECT_FALSE(filter.isExcludedByPattern(root / "my_node_modules"));
}

TEST_F(PathFilterTest, EmptyPatternListExcludesNothing) {
    auto filter = makeFilter({});

    EXPECT_FALSE(filter.isExcludedByPattern(root / ".git"));
    EXPECT_FALSE(filter.shouldSkip(root / "node_modules" / "x"));
}

/**
 * @test HiddenSkippedWhenDisabled
 * @brief With hidden entries disabled, any dot component skips the path
 */
TEST_F(PathFilterTest, HiddenSkippedWhenDisabled) {
    auto filter = makeFilter({}, false);

    EXPECT_TRUE(filter.isHidden(root / ".env"));
    EXPECT_TRUE(filter.shouldSkip(root / ".env"));
    EXPECT_TRUE(filter.shouldSkip(root / ".config" / "settings.json"));
    EXPECT_FALSE(filter.shouldSkip(root / "src" / "main.c"));
}

TEST_F(PathFilterTest, HiddenKeptWhenEnabled) {
    auto filter = makeFilter({}, true);

    EXPECT_TRUE(filter.isHidden(root / ".env"));
    EXPECT_FALSE(filter.shouldSkip(root / ".env"));
}

/**
 * @test HiddenCheckIsRootRelative
 * @brief Dot directories above the root do not hide the whole tree
 */
TEST_F(PathFilterTest, HiddenCheckIsRootRelative) {
    fs::path hidden_root = "/home/user/.cache/project";
    PathFilter filter(hidden_root, {}, false);

    EXPECT_FALSE(filter.isHidden(hidden_root / "main.c"));
    EXPECT_FALSE(filter.shouldSkip(hidden_root));
    EXPECT_TRUE(filter.shouldSkip(hidden_root / ".git"));
}

/**
 * @test RootIsNeverExcludedByPattern
 * @brief The root itself is kept even if its own name matches a pattern
 */
TEST_F(PathFilterTest, RootIsNeverExcludedByPattern) {
    auto filter = makeFilter({"project"});

    EXPECT_FALSE(filter.shouldSkip(root));
    EXPECT_FALSE(filter.shouldSkip(fs::path("/work/project/")));
}

TEST_F(PathFilterTest, PathsOutsideRootAreNotMatched) {
    auto filter = makeFilter({"other"});

    EXPECT_FALSE(filter.isExcludedByPattern("/work/other/file.txt"));
    EXPECT_EQ(filter.relativePath("/work/other/file.txt"), "");
}

/**
 * @test RelativePathUsesForwardSlashes
 * @brief relativePath() joins components with '/' and is empty for the root
 */
TEST_F(PathFilterTest, RelativePathUsesForwardSlashes) {
    PathFilter filter(fs::path("/work/project/"), {}, true);

    EXPECT_EQ(filter.relativePath(root / "src" / "a.go"), "src/a.go");
    EXPECT_EQ(filter.relativePath(root), "");
    EXPECT_EQ(filter.root(), root);
}
