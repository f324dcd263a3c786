#pragma once

#include <cstddef>
#include <filesystem>
#include <string>
#include <string_view>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Compiled glob expression evaluated one path segment at a time.
 *
 * Supported syntax: '*' (any run of characters inside a segment), '?' (one
 * character), '[...]' classes with ranges and '!' negation, and '**' as a whole
 * segment matching zero or more directory levels. A trailing '/' or '**'
 * restricts matches to directories.
 *
 * Names starting with '.' are hidden: only a pattern segment starting with a
 * literal '.' matches them. '**' still descends through hidden directories.
 */
class GlobPattern
{
  public:
    /**
     * @brief Set of segment indices the matcher may be positioned at.
     *
     * Kept sorted and free of duplicates.
     */
    using StateSet = std::vector<std::size_t>;

    /**
     * @brief Compile a glob expression.
     *
     * @param[in] pattern Relative glob expression, '/' separated
     * @return Compiled pattern
     * @throws std::invalid_argument if the pattern is empty, absolute or contains a ".." segment
     */
    static GlobPattern Compile(const std::string& pattern);

    /**
     * @brief Match a single path segment against a segment pattern (fnmatch rules, case sensitive).
     *
     * @param[in] pattern Segment pattern without '/'
     * @param[in] name Directory entry name
     * @return true if the name matches
     */
    static bool MatchSegment(std::string_view pattern, std::string_view name);

    StateSet InitialStates() const;

    /**
     * @brief Advance the matcher by one directory entry name.
     *
     * @param[in] states States reached by the parent directory
     * @param[in] name Entry name inside that directory
     * @return States reached by the entry, empty if nothing further can match
     */
    StateSet Advance(const StateSet& states, const std::string& name) const;

    bool Accepts(const StateSet& states) const;
    bool CanDescend(const StateSet& states) const;

    bool MatchesDirectoriesOnly() const;

    /**
     * @brief Match a whole relative path.
     *
     * @param[in] relativePath Path relative to the traversal root
     * @param[in] isDirectory Whether the path denotes a directory
     * @return true if the path matches the pattern
     */
    bool Matches(const fs::path& relativePath, bool isDirectory) const;

    const std::string& String() const;

  private:
    struct Segment
    {
        std::string text;
        bool recursive;
    };

    GlobPattern() = default;

    void AddWithClosure(StateSet& states, std::size_t index) const;

    std::string _text;
    std::vector<Segment> _segments;
    bool _directoriesOnly = false;
};
