#pragma once

#include "GlobPattern/GlobPattern.hpp"

#include <cstddef>
#include <filesystem>
#include <optional>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief What to do with a subdirectory that cannot be listed mid-walk.
 */
enum class TraversalErrorPolicy
{
    Fail,   /**< Raise TraversalError and end the walk */
    Skip    /**< Omit the subtree and record it */
};

/**
 * @brief Infrastructure component for lazily enumerating glob matches on the filesystem.
 *
 * Entries are produced one per call to Next(). Each directory is listed only
 * when the walk reaches it, and entries of a directory are visited in
 * ascending name order so repeated walks of an unchanged tree agree.
 * Symbolic links to directories are reported but never descended into.
 */
class FileIterator
{
  public:
    /**
     * @brief Prepare a walk. No filesystem access happens until the first Next().
     *
     * @param[in] root Directory to walk
     * @param[in] pattern Compiled glob pattern relative to root
     * @param[in] policy Handling of unreadable subdirectories
     */
    FileIterator(const fs::path& root, const GlobPattern& pattern, TraversalErrorPolicy policy);

    /**
     * @brief Produce the next entry matching the pattern.
     *
     * @param[out] outEntry Matching entry (file, directory or special file)
     * @return true if an entry was produced, false once the walk is over
     * @throws PathNotFoundError if the root does not exist
     * @throws NotADirectoryError if the root is not a directory
     * @throws TraversalError if a directory cannot be listed and the policy is Fail
     */
    bool Next(fs::directory_entry& outEntry);

    /**
     * @brief Release all traversal state; later calls to Next() return false.
     */
    void Close();

    /**
     * @brief Subdirectories omitted under TraversalErrorPolicy::Skip, in walk order.
     */
    const std::vector<fs::path>& SkippedDirectories() const;

  private:
    struct Frame
    {
        std::vector<fs::directory_entry> entries;
        std::size_t position;
        GlobPattern::StateSet states;
    };

    struct PendingDescent
    {
        fs::path directory;
        GlobPattern::StateSet states;
    };

    void Start();
    void Descend(const PendingDescent& descent);

    fs::path _root;
    const GlobPattern& _pattern;
    TraversalErrorPolicy _policy;
    std::vector<Frame> _stack;
    std::optional<PendingDescent> _pendingDescent;
    std::vector<fs::path> _skippedDirectories;
    bool _started;
    bool _finished;
};
