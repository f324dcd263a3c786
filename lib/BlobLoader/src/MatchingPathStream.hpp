#pragma once

#include "BlobLoader/DirectoryBlobEnumerator.hpp"
#include "FileIterator/FileIterator.hpp"
#include "GlobPattern/GlobPattern.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Validated, immutable enumeration settings shared with running sequences.
 */
struct EnumerationSettings
{
    fs::path root;
    GlobPattern pattern;
    std::set<std::string> suffixes;
    bool reportProgress;
    std::shared_ptr<ProgressSink> progressSink;
    BlobFactory blobFactory;
    TraversalErrorPolicy traversalErrorPolicy;
};

/**
 * @brief Application component yielding the regular files of a glob walk that pass the suffix filter.
 */
class MatchingPathStream
{
  public:
    explicit MatchingPathStream(const EnumerationSettings& settings);

    /**
     * @brief Produce the next accepted path.
     *
     * @param[out] outPath Accepted path
     * @return true if a path was produced, false once the walk is over
     */
    bool Next(fs::path& outPath);
    void Close();

    const std::vector<fs::path>& SkippedDirectories() const;

  private:
    bool Accept(const fs::directory_entry& entry) const;

    const EnumerationSettings& _settings;
    FileIterator _fileIterator;
};

/**
 * @brief Suffix of the final path segment: from its last dot, if that dot is neither first nor last.
 *
 * @param[in] path File path
 * @return Suffix including the dot, or an empty string
 */
std::string FinalSuffix(const fs::path& path);

/**
 * @brief Walk the tree once and count accepted paths.
 *
 * @param[in] settings Enumeration settings
 * @return Number of accepted paths
 */
std::size_t CountMatchingPaths(const EnumerationSettings& settings);
