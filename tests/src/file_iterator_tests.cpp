/**
 * @file file_iterator_tests.cpp
 * @brief Tests for the lazy glob walk.
 */
#include "FileIterator/FileIterator.hpp"
#include "FileIterator/TraversalError.hpp"
#include "helpers/TestHelpers.hpp"

#include <gmock/gmock.h>

#include <unistd.h>

#include <string>
#include <vector>

class FileIteratorTest : public TemporaryDirectoryTest
{
  protected:
    std::vector<std::string> walk(const std::string& patternText, TraversalErrorPolicy policy = TraversalErrorPolicy::Fail)
    {
        const GlobPattern pattern = GlobPattern::Compile(patternText);
        FileIterator iterator(root, pattern, policy);
        std::vector<std::string> paths;
        fs::directory_entry entry;
        while (true == iterator.Next(entry))
        {
            paths.push_back(fs::relative(entry.path(), root).string());
        }
        return NormalizePaths(paths);
    }
};

TEST_F(FileIteratorTest, Next_VisitsEntriesInNameOrderDepthFirst)
{
    // Arrange
    createFile("b.txt");
    createFile("a/z.txt");
    createFile("a/y.txt");
    createFile("c/x.txt");

    // Act
    const auto paths = walk("**/*");

    // Assert
    EXPECT_THAT(paths, testing::ElementsAre("a", "a/y.txt", "a/z.txt", "b.txt", "c", "c/x.txt"));
}

TEST_F(FileIteratorTest, Next_ReportsDirectoriesMatchedByThePattern)
{
    createFile("a.txt");
    createDirectory("sub");

    EXPECT_THAT(walk("*"), testing::ElementsAre("a.txt", "sub"));
}

TEST_F(FileIteratorTest, Next_RepeatedWalksAgree)
{
    createFile("m/1");
    createFile("k/2");
    createFile("z");

    EXPECT_EQ(walk("**/*"), walk("**/*"));
}

TEST_F(FileIteratorTest, Next_DoesNotDescendIntoSymlinkedDirectories)
{
    // Arrange
    createFile("real/inner.txt");
    std::error_code ec;
    fs::create_directory_symlink(root / "real", root / "link", ec);
    if (ec)
    {
        GTEST_SKIP() << "Symbolic links unavailable: " << ec.message();
    }

    // Act
    const auto paths = walk("**/*.txt");

    // Assert
    EXPECT_THAT(paths, testing::ElementsAre("real/inner.txt"));
}

TEST_F(FileIteratorTest, Next_MissingRootThrowsPathNotFound)
{
    // Arrange
    const GlobPattern pattern = GlobPattern::Compile("*");
    FileIterator iterator(root / "missing", pattern, TraversalErrorPolicy::Fail);
    fs::directory_entry entry;

    // Act & Assert
    EXPECT_THROW(iterator.Next(entry), PathNotFoundError);
    EXPECT_FALSE(iterator.Next(entry));
}

TEST_F(FileIteratorTest, Next_FileRootThrowsNotADirectory)
{
    // Arrange
    createFile("plain.txt");
    const GlobPattern pattern = GlobPattern::Compile("*");
    FileIterator iterator(root / "plain.txt", pattern, TraversalErrorPolicy::Fail);
    fs::directory_entry entry;

    // Act & Assert
    EXPECT_THROW(iterator.Next(entry), NotADirectoryError);
}

TEST_F(FileIteratorTest, Next_ListsSubdirectoryOnlyWhenReached)
{
    // Arrange
    createFile("a.txt");
    createFile("sub/b.txt");
    const GlobPattern pattern = GlobPattern::Compile("**/*");
    FileIterator iterator(root, pattern, TraversalErrorPolicy::Fail);
    fs::directory_entry entry;

    // Act
    ASSERT_TRUE(iterator.Next(entry));
    EXPECT_EQ("a.txt", entry.path().filename().string());
    ASSERT_TRUE(iterator.Next(entry));
    EXPECT_EQ("sub", entry.path().filename().string());

    // Removing the subdirectory after it was reported but before it was listed is observed.
    fs::remove_all(root / "sub");

    // Assert
    EXPECT_THROW(iterator.Next(entry), TraversalError);
}

TEST_F(FileIteratorTest, Close_EndsTheWalk)
{
    createFile("a.txt");
    createFile("b.txt");
    const GlobPattern pattern = GlobPattern::Compile("*");
    FileIterator iterator(root, pattern, TraversalErrorPolicy::Fail);
    fs::directory_entry entry;

    ASSERT_TRUE(iterator.Next(entry));
    iterator.Close();

    EXPECT_FALSE(iterator.Next(entry));
}

class UnreadableDirectoryTest : public FileIteratorTest
{
  protected:
    void SetUp() override
    {
        FileIteratorTest::SetUp();
        if (0 == geteuid())
        {
            GTEST_SKIP() << "Permission checks do not apply to root.";
        }
        createFile("a.txt");
        createFile("locked/secret.txt");
        createFile("z.txt");
        fs::permissions(root / "locked", fs::perms::none);
    }

    void TearDown() override
    {
        std::error_code ec;
        fs::permissions(root / "locked", fs::perms::owner_all, ec);
        FileIteratorTest::TearDown();
    }
};

TEST_F(UnreadableDirectoryTest, FailPolicy_ThrowsAtTheUnreadableDirectory)
{
    // Arrange
    const GlobPattern pattern = GlobPattern::Compile("**/*.txt");
    FileIterator iterator(root, pattern, TraversalErrorPolicy::Fail);
    fs::directory_entry entry;

    // Act & Assert
    ASSERT_TRUE(iterator.Next(entry));
    EXPECT_EQ("a.txt", entry.path().filename().string());
    EXPECT_THROW(iterator.Next(entry), TraversalError);
    EXPECT_FALSE(iterator.Next(entry));
}

TEST_F(UnreadableDirectoryTest, SkipPolicy_OmitsAndRecordsTheSubtree)
{
    // Arrange
    const GlobPattern pattern = GlobPattern::Compile("**/*.txt");
    FileIterator iterator(root, pattern, TraversalErrorPolicy::Skip);
    std::vector<std::string> names;
    fs::directory_entry entry;

    // Act
    while (true == iterator.Next(entry))
    {
        names.push_back(entry.path().filename().string());
    }

    // Assert
    EXPECT_THAT(names, testing::ElementsAre("a.txt", "z.txt"));
    ASSERT_THAT(iterator.SkippedDirectories(), testing::SizeIs(1));
    EXPECT_EQ(root / "locked", iterator.SkippedDirectories()[0]);
}
