#include <catch2/catch_test_macros.hpp>
#include "pattern_matcher.hpp"
#include <filesystem>
#include <fstream>

namespace fs = std::filesystem;

TEST_CASE("PatternMatcher handles basic patterns", "[PatternMatcher]") {
    SECTION("Default constructor has no rules") {
        PatternMatcher matcher;
        REQUIRE(matcher.ignoreRuleCount() == 0);
        REQUIRE_FALSE(matcher.isIgnored("src/main.cpp"));
        REQUIRE(matcher.shouldProcess("src/main.cpp"));
    }

    SECTION("Constructor with patterns") {
        PatternMatcher matcher({".git/", "node_modules/", "*.o"});

        REQUIRE(matcher.isIgnored(".git/config"));
        REQUIRE(matcher.isIgnored("node_modules/package.json"));
        REQUIRE(matcher.isIgnored("build/main.o"));
        REQUIRE_FALSE(matcher.isIgnored("src/main.cpp"));
    }

    SECTION("Wildcard patterns") {
        PatternMatcher matcher;
        matcher.addIgnorePattern("*.txt");

        REQUIRE(matcher.isIgnored("file.txt"));
        REQUIRE(matcher.isIgnored("path/to/file.txt"));
        REQUIRE_FALSE(matcher.isIgnored("file.md"));
    }

    SECTION("Single character wildcard") {
        PatternMatcher matcher;
        matcher.addIgnorePattern("file?.txt");

        REQUIRE(matcher.isIgnored("file1.txt"));
        REQUIRE_FALSE(matcher.isIgnored("file.txt"));
        REQUIRE_FALSE(matcher.isIgnored("file12.txt"));
    }

    SECTION("Trailing double star") {
        PatternMatcher matcher;
        matcher.addIgnorePattern("build/**");

        REQUIRE(matcher.isIgnored("build/main.cpp"));
        REQUIRE(matcher.isIgnored("build/obj/main.o"));
        REQUIRE_FALSE(matcher.isIgnored("src/build.cpp"));
    }

    SECTION("Double star between segments") {
        PatternMatcher matcher;
        matcher.addIgnorePattern("src/**/test");

        REQUIRE(matcher.isIgnored("src/test"));
        REQUIRE(matcher.isIgnored("src/foo/test"));
        REQUIRE(matcher.isIgnored("src/foo/bar/test"));
        REQUIRE_FALSE(matcher.isIgnored("foo/test"));
    }

    SECTION("Patterns with a separator are anchored") {
        PatternMatcher matcher;
        matcher.addIgnorePattern("src/secret.key");

        REQUIRE(matcher.isIgnored("src/secret.key"));
        REQUIRE_FALSE(matcher.isIgnored("secret.key"));
        REQUIRE_FALSE(matcher.isIgnored("src/not_secret.key"));
        REQUIRE_FALSE(matcher.isIgnored("lib/src/secret.key"));
    }

    SECTION("Leading slash anchors to the root") {
        PatternMatcher matcher;
        matcher.addIgnorePattern("/TODO");

        REQUIRE(matcher.isIgnored("TODO"));
        REQUIRE_FALSE(matcher.isIgnored("docs/TODO"));
    }

    SECTION("Character classes") {
        PatternMatcher matcher;
        matcher.addIgnorePattern("*.[oa]");
        matcher.addIgnorePattern("[!a]*.log");

        REQUIRE(matcher.isIgnored("x.o"));
        REQUIRE(matcher.isIgnored("lib/x.a"));
        REQUIRE_FALSE(matcher.isIgnored("x.c"));
        REQUIRE(matcher.isIgnored("b.log"));
        REQUIRE_FALSE(matcher.isIgnored("a.log"));
    }

    SECTION("Comments, blanks and escapes") {
        PatternMatcher matcher;
        matcher.addIgnorePattern("# a comment");
        matcher.addIgnorePattern("   ");
        REQUIRE(matcher.ignoreRuleCount() == 0);

        matcher.addIgnorePattern("\\#notcomment");
        REQUIRE(matcher.isIgnored("#notcomment"));
    }

    SECTION("Whitespace follows gitignore rules") {
        PatternMatcher matcher;
        matcher.addIgnorePattern(" leading.txt");
        matcher.addIgnorePattern("trailing.txt   ");
        matcher.addIgnorePattern("kept\\ ");

        REQUIRE(matcher.isIgnored(" leading.txt"));
        REQUIRE_FALSE(matcher.isIgnored("leading.txt"));
        REQUIRE(matcher.isIgnored("trailing.txt"));
        REQUIRE(matcher.isIgnored("kept "));
        REQUIRE_FALSE(matcher.isIgnored("kept"));
    }
}

TEST_CASE("PatternMatcher applies gitignore precedence", "[PatternMatcher]") {
    SECTION("Later negation re-includes") {
        PatternMatcher matcher({"*.log", "!keep.log"});

        REQUIRE(matcher.isIgnored("debug.log"));
        REQUIRE_FALSE(matcher.isIgnored("keep.log"));
    }

    SECTION("Last matching rule wins") {
        PatternMatcher matcher({"!keep.log", "*.log"});

        REQUIRE(matcher.isIgnored("keep.log"));
    }

    SECTION("Directory-only patterns") {
        PatternMatcher matcher({"logs/"});

        REQUIRE(matcher.isIgnored("logs", true));
        REQUIRE_FALSE(matcher.isIgnored("logs", false));
        REQUIRE(matcher.isIgnored("logs/today.txt"));
        REQUIRE(matcher.isIgnored("app/logs/today.txt"));
    }

    SECTION("Files under an ignored directory stay ignored") {
        PatternMatcher matcher({"build/", "!build/keep.txt"});

        REQUIRE(matcher.isIgnored("build/keep.txt"));
        REQUIRE_FALSE(matcher.isEntryIgnored("build/keep.txt", false));
    }

    SECTION("Rules scoped to a base directory") {
        PatternMatcher matcher;
        matcher.addIgnorePattern("*.tmp", "sub");
        matcher.addIgnorePattern("/only.txt", "sub");

        REQUIRE(matcher.isIgnored("sub/a.tmp"));
        REQUIRE(matcher.isIgnored("sub/deep/b.tmp"));
        REQUIRE_FALSE(matcher.isIgnored("a.tmp"));
        REQUIRE_FALSE(matcher.isIgnored("other/a.tmp"));

        REQUIRE(matcher.isIgnored("sub/only.txt"));
        REQUIRE_FALSE(matcher.isIgnored("sub/x/only.txt"));
        REQUIRE_FALSE(matcher.isIgnored("only.txt"));
    }
}

TEST_CASE("PatternMatcher include patterns", "[PatternMatcher]") {
    PatternMatcher matcher;

    SECTION("Everything is included without include patterns") {
        REQUIRE_FALSE(matcher.hasIncludePatterns());
        REQUIRE(matcher.isIncluded("anything/at/all.bin"));
    }

    SECTION("Files must match one include pattern") {
        matcher.setIncludePatterns("*.cpp, docs/");

        REQUIRE(matcher.hasIncludePatterns());
        REQUIRE(matcher.isIncluded("src/a.cpp"));
        REQUIRE(matcher.isIncluded("docs/readme.md"));
        REQUIRE(matcher.isIncluded("docs/deep/guide.md"));
        REQUIRE_FALSE(matcher.isIncluded("src/a.h"));
    }

    SECTION("shouldProcess combines ignores and includes") {
        matcher.setIncludePatterns("*.cpp");
        matcher.setExcludePatterns("test/");

        REQUIRE(matcher.shouldProcess("src/main.cpp"));
        REQUIRE_FALSE(matcher.shouldProcess("test/main_test.cpp"));
        REQUIRE_FALSE(matcher.shouldProcess("src/main.h"));
    }
}

TEST_CASE("PatternMatcher rejects malformed patterns", "[PatternMatcher]") {
    PatternMatcher matcher;

    REQUIRE_THROWS_AS(matcher.addIgnorePattern("foo[bar"), PatternError);
    REQUIRE_THROWS_AS(matcher.addIgnorePattern("trailing\\"), PatternError);
    REQUIRE_THROWS_AS(matcher.setExcludePatterns("ok,["), PatternError);
    REQUIRE_THROWS_AS(matcher.setIncludePatterns("[abc"), PatternError);
}

TEST_CASE("PatternMatcher splits comma-separated lists", "[PatternMatcher]") {
    const auto patterns = PatternMatcher::splitPatternString(" *.rs , ,*.toml ");

    REQUIRE(patterns.size() == 2);
    REQUIRE(patterns[0] == "*.rs");
    REQUIRE(patterns[1] == "*.toml");
    REQUIRE(PatternMatcher::splitPatternString("").empty());
}

TEST_CASE("PatternMatcher loads ignore files", "[PatternMatcher]") {
    fs::path tempDir = fs::temp_directory_path() / "ctxpack_pattern_matcher_test";
    fs::remove_all(tempDir);
    fs::create_directories(tempDir);

    SECTION("Valid lines become rules") {
        {
            std::ofstream file(tempDir / ".gitignore");
            file << "# comment\n\n*.log\n!important.log\nbuild/\n";
        }

        PatternMatcher matcher;
        REQUIRE(matcher.loadGitignore(tempDir / ".gitignore") == 3);
        REQUIRE(matcher.isIgnored("debug.log"));
        REQUIRE_FALSE(matcher.isIgnored("important.log"));
        REQUIRE(matcher.isIgnored("build/out.txt"));
    }

    SECTION("Windows line endings and leading spaces") {
        {
            std::ofstream file(tempDir / ".gitignore");
            file << "*.tmp\r\n  spaced.txt\r\n";
        }

        PatternMatcher matcher;
        REQUIRE(matcher.loadGitignore(tempDir / ".gitignore") == 2);
        REQUIRE(matcher.isIgnored("x.tmp"));
        REQUIRE(matcher.isIgnored("  spaced.txt"));
        REQUIRE_FALSE(matcher.isIgnored("spaced.txt"));
    }

    SECTION("Malformed lines are skipped") {
        {
            std::ofstream file(tempDir / ".gitignore");
            file << "bad[\n*.tmp\n";
        }

        PatternMatcher matcher;
        REQUIRE(matcher.loadGitignore(tempDir / ".gitignore") == 1);
        REQUIRE(matcher.isIgnored("x.tmp"));
    }

    SECTION("Missing file throws") {
        PatternMatcher matcher;
        REQUIRE_THROWS_AS(matcher.loadGitignore(tempDir / "does_not_exist"), std::runtime_error);
    }

    fs::remove_all(tempDir);
}
