/**
 * @file glob_pattern_tests.cpp
 * @brief Unit tests for glob compilation and matching.
 */
#include "GlobPattern/GlobPattern.hpp"
#include "gtest/gtest.h"

#include <stdexcept>
#include <string>

TEST(GlobSegmentTests, StarMatchesAnyRun)
{
    EXPECT_TRUE(GlobPattern::MatchSegment("*", "a.txt"));
    EXPECT_TRUE(GlobPattern::MatchSegment("*.txt", "notes.txt"));
    EXPECT_TRUE(GlobPattern::MatchSegment("a*b*c", "aXXbYYc"));
    EXPECT_FALSE(GlobPattern::MatchSegment("*.txt", "notes.md"));
    EXPECT_FALSE(GlobPattern::MatchSegment("a*b*c", "aXXbYY"));
}

TEST(GlobSegmentTests, QuestionMarkMatchesOneCharacter)
{
    EXPECT_TRUE(GlobPattern::MatchSegment("file?.log", "file1.log"));
    EXPECT_FALSE(GlobPattern::MatchSegment("file?.log", "file.log"));
    EXPECT_FALSE(GlobPattern::MatchSegment("file?.log", "file12.log"));
}

TEST(GlobSegmentTests, CharacterClassesAndRanges)
{
    EXPECT_TRUE(GlobPattern::MatchSegment("[abc].txt", "b.txt"));
    EXPECT_FALSE(GlobPattern::MatchSegment("[abc].txt", "d.txt"));
    EXPECT_TRUE(GlobPattern::MatchSegment("v[0-9]", "v7"));
    EXPECT_FALSE(GlobPattern::MatchSegment("v[0-9]", "vx"));
    EXPECT_TRUE(GlobPattern::MatchSegment("[]]", "]"));
    EXPECT_TRUE(GlobPattern::MatchSegment("[a-]", "-"));
}

TEST(GlobSegmentTests, NegatedClassExcludesLeadingDot)
{
    EXPECT_TRUE(GlobPattern::MatchSegment("[!.]*", "a.txt"));
    EXPECT_FALSE(GlobPattern::MatchSegment("[!.]*", ".hidden.txt"));
    EXPECT_FALSE(GlobPattern::MatchSegment("[!.]*", ""));
    EXPECT_TRUE(GlobPattern::MatchSegment("[!0-9]x", "ax"));
    EXPECT_FALSE(GlobPattern::MatchSegment("[!0-9]x", "5x"));
}

TEST(GlobSegmentTests, LeadingDotMustBeMatchedLiterally)
{
    EXPECT_FALSE(GlobPattern::MatchSegment("*", ".hidden"));
    EXPECT_FALSE(GlobPattern::MatchSegment("?hidden", ".hidden"));
    EXPECT_FALSE(GlobPattern::MatchSegment("[.]hidden", ".hidden"));
    EXPECT_TRUE(GlobPattern::MatchSegment(".*", ".hidden"));
    EXPECT_TRUE(GlobPattern::MatchSegment(".h*", ".hidden"));
    EXPECT_TRUE(GlobPattern::MatchSegment("*.txt", "a.b.txt"));
}

TEST(GlobSegmentTests, UnterminatedBracketIsLiteral)
{
    EXPECT_TRUE(GlobPattern::MatchSegment("[abc", "[abc"));
    EXPECT_FALSE(GlobPattern::MatchSegment("[abc", "a"));
}

TEST(GlobSegmentTests, MatchingIsCaseSensitive)
{
    EXPECT_FALSE(GlobPattern::MatchSegment("*.TXT", "a.txt"));
}

TEST(GlobPatternTests, Compile_RejectsInvalidPatterns)
{
    EXPECT_THROW(GlobPattern::Compile(""), std::invalid_argument);
    EXPECT_THROW(GlobPattern::Compile("/abs/*"), std::invalid_argument);
    EXPECT_THROW(GlobPattern::Compile("../*"), std::invalid_argument);
    EXPECT_THROW(GlobPattern::Compile("./"), std::invalid_argument);
}

TEST(GlobPatternTests, StarDoesNotCrossSeparators)
{
    // Arrange
    const GlobPattern pattern = GlobPattern::Compile("*");

    // Act & Assert
    EXPECT_TRUE(pattern.Matches("a.txt", false));
    EXPECT_FALSE(pattern.Matches("sub/c.txt", false));
}

TEST(GlobPatternTests, DoubleStarMatchesZeroOrMoreLevels)
{
    // Arrange
    const GlobPattern pattern = GlobPattern::Compile("**/*.txt");

    // Act & Assert
    EXPECT_TRUE(pattern.Matches("a.txt", false));
    EXPECT_TRUE(pattern.Matches("sub/c.txt", false));
    EXPECT_TRUE(pattern.Matches("x/y/z/d.txt", false));
    EXPECT_FALSE(pattern.Matches("x/y/z/d.md", false));
}

TEST(GlobPatternTests, DefaultPatternSkipsHiddenNamesButEntersHiddenDirectories)
{
    // Arrange
    const GlobPattern pattern = GlobPattern::Compile("**/[!.]*");

    // Act & Assert
    EXPECT_TRUE(pattern.Matches("a.txt", false));
    EXPECT_TRUE(pattern.Matches("sub/c.txt", false));
    EXPECT_FALSE(pattern.Matches(".hidden.txt", false));
    EXPECT_TRUE(pattern.Matches(".config/settings.json", false));
    EXPECT_TRUE(pattern.Matches(".git/objects/pack", false));
    EXPECT_FALSE(pattern.Matches(".git/.keep", false));
}

TEST(GlobPatternTests, IncrementalMatcher_DoubleStarDescendsIntoHiddenDirectory)
{
    const GlobPattern pattern = GlobPattern::Compile("**/*.txt");

    const GlobPattern::StateSet hidden = pattern.Advance(pattern.InitialStates(), ".git");

    EXPECT_TRUE(pattern.CanDescend(hidden));
    EXPECT_FALSE(pattern.Accepts(hidden));
}

TEST(GlobPatternTests, HiddenDirectoryReachedByLiteralSegment)
{
    const GlobPattern pattern = GlobPattern::Compile(".config/**/*.json");

    EXPECT_TRUE(pattern.Matches(".config/settings.json", false));
    EXPECT_TRUE(pattern.Matches(".config/app/settings.json", false));
    EXPECT_TRUE(pattern.Matches(".config/.cache/settings.json", false));
    EXPECT_FALSE(pattern.Matches(".config/app/.settings.json", false));
}

TEST(GlobPatternTests, InnerDoubleStar)
{
    // Arrange
    const GlobPattern pattern = GlobPattern::Compile("docs/**/index.md");

    // Act & Assert
    EXPECT_TRUE(pattern.Matches("docs/index.md", false));
    EXPECT_TRUE(pattern.Matches("docs/a/b/index.md", false));
    EXPECT_FALSE(pattern.Matches("src/index.md", false));
}

TEST(GlobPatternTests, TrailingDoubleStarOrSlashMatchesDirectoriesOnly)
{
    const GlobPattern recursive = GlobPattern::Compile("**");
    EXPECT_TRUE(recursive.MatchesDirectoriesOnly());
    EXPECT_TRUE(recursive.Matches("sub", true));
    EXPECT_FALSE(recursive.Matches("a.txt", false));

    const GlobPattern slash = GlobPattern::Compile("*/");
    EXPECT_TRUE(slash.MatchesDirectoriesOnly());
    EXPECT_TRUE(slash.Matches("sub", true));
    EXPECT_FALSE(slash.Matches("a.txt", false));
}

TEST(GlobPatternTests, IncrementalMatcher_TracksDescentAndAcceptance)
{
    // Arrange
    const GlobPattern pattern = GlobPattern::Compile("sub/*.txt");

    // Act
    const GlobPattern::StateSet root = pattern.InitialStates();
    const GlobPattern::StateSet sub = pattern.Advance(root, "sub");
    const GlobPattern::StateSet other = pattern.Advance(root, "other");
    const GlobPattern::StateSet file = pattern.Advance(sub, "c.txt");

    // Assert
    EXPECT_TRUE(pattern.CanDescend(sub));
    EXPECT_FALSE(pattern.Accepts(sub));
    EXPECT_TRUE(other.empty());
    EXPECT_TRUE(pattern.Accepts(file));
    EXPECT_FALSE(pattern.CanDescend(file));
}

TEST(GlobPatternTests, RedundantSegmentsAreIgnored)
{
    const GlobPattern pattern = GlobPattern::Compile("./**/**//*.md");
    EXPECT_EQ("./**/**//*.md", pattern.String());
    EXPECT_TRUE(pattern.Matches("b.md", false));
    EXPECT_TRUE(pattern.Matches("x/b.md", false));
}
