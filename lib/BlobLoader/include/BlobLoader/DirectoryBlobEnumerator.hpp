#pragma once

#include "Blob/Blob.hpp"
#include "FileIterator/FileIterator.hpp"
#include "ProgressSink/ProgressSink.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <iterator>
#include <memory>
#include <set>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Glob selecting every non-hidden entry at any depth.
 */
constexpr const char* DefaultGlobPattern = "**/[!.]*";

/**
 * @brief Factory turning a matched path into a blob.
 */
using BlobFactory = std::function<Blob(const fs::path&)>;

struct EnumerationSettings;

/**
 * @brief Configuration parameters for directory enumeration.
 */
struct DirectoryBlobEnumeratorConfig
{
    std::string pattern;                            /**< Glob pattern relative to the root */
    std::set<std::string> suffixes;                 /**< Accepted final suffixes, compared verbatim, empty accepts all */
    bool reportProgress;                            /**< Count matches first and report progress while producing */
    std::shared_ptr<ProgressSink> progressSink;     /**< Optional sink for progress signals */
    BlobFactory blobFactory;                        /**< Optional factory, MakeBlobFromPath when unset */
    TraversalErrorPolicy traversalErrorPolicy;      /**< Handling of unreadable subdirectories */

    /**
     * @brief Initialize configuration with default values.
     */
    DirectoryBlobEnumeratorConfig()
        : pattern(DefaultGlobPattern)
        , reportProgress(false)
        , progressSink(nullptr)
        , blobFactory(nullptr)
        , traversalErrorPolicy(TraversalErrorPolicy::Fail)
    {
    }
};

/**
 * @brief Lazy, single-pass sequence of blobs produced by one enumeration.
 *
 * Nothing is read from the filesystem until the first call to Next(). The
 * traversal and any progress acquisition are released when the sequence is
 * exhausted, closed, destroyed or fails during traversal.
 */
class BlobSequence
{
  public:
    /**
     * @brief Input iterator over the remaining blobs.
     *
     * Errors raised while advancing propagate out of begin() and operator++
     * and end the range-for loop; use Next() to continue past a failed item.
     */
    class Iterator
    {
      public:
        using iterator_category = std::input_iterator_tag;
        using value_type = Blob;
        using difference_type = std::ptrdiff_t;
        using pointer = const Blob*;
        using reference = const Blob&;

        Iterator() : _sequence(nullptr)
        {
        }

        explicit Iterator(BlobSequence* sequence) : _sequence(sequence)
        {
            Advance();
        }

        reference operator*() const
        {
            return _current;
        }

        pointer operator->() const
        {
            return &_current;
        }

        Iterator& operator++()
        {
            Advance();
            return *this;
        }

        bool operator==(const Iterator& other) const
        {
            return _sequence == other._sequence;
        }

        bool operator!=(const Iterator& other) const
        {
            return _sequence != other._sequence;
        }

      private:
        void Advance()
        {
            if ((nullptr != _sequence) && (false == _sequence->Next(_current)))
            {
                _sequence = nullptr;
            }
        }

        BlobSequence* _sequence;
        Blob _current;
    };

    explicit BlobSequence(std::shared_ptr<const EnumerationSettings> settings);
    ~BlobSequence();

    BlobSequence(const BlobSequence&) = delete;
    BlobSequence& operator=(const BlobSequence&) = delete;

    BlobSequence(BlobSequence&& other) noexcept;
    BlobSequence& operator=(BlobSequence&& other) noexcept;

    /**
     * @brief Produce the next blob.
     *
     * A failure of the blob factory affects only the item being produced: the
     * error propagates and the following call continues with the next path.
     *
     * @param[out] outBlob Next blob
     * @return true if a blob was produced, false once the sequence is exhausted
     * @throws TraversalError (or a subclass) if the walk fails; the sequence is then closed
     * @throws BlobMaterializationError (or whatever the configured factory throws) for a failed item
     */
    bool Next(Blob& outBlob);

    /**
     * @brief Abandon the sequence and release its traversal and progress scope.
     */
    void Close();

    /**
     * @brief Subdirectories omitted under TraversalErrorPolicy::Skip so far.
     */
    const std::vector<fs::path>& SkippedDirectories() const;

    Iterator begin();
    Iterator end();

  private:
    struct State;

    std::shared_ptr<const EnumerationSettings> _settings;
    std::unique_ptr<State> _state;
};

/**
 * @brief Enumerates files under a directory that match a glob pattern and suffix filter.
 *
 * Configuration is fixed at construction. Every call to Enumerate() or
 * CountMatches() walks the tree again from the root.
 */
class DirectoryBlobEnumerator
{
  public:
    /**
     * @brief Validate and store the configuration. The filesystem is not accessed.
     *
     * @param[in] root Directory to enumerate, the working directory when empty
     * @param[in] config Pattern, suffix filter, progress reporting and collaborators
     * @throws std::invalid_argument if the root contains a null character or the pattern is invalid
     */
    explicit DirectoryBlobEnumerator(const fs::path& root,
                                     const DirectoryBlobEnumeratorConfig& config = DirectoryBlobEnumeratorConfig());

    /**
     * @brief Start a lazy enumeration of blobs for every matching regular file.
     *
     * @return Sequence producing one blob per match
     */
    BlobSequence Enumerate() const;

    /**
     * @brief Count matching regular files without creating blobs.
     *
     * @return Number of matches
     * @throws TraversalError (or a subclass) if the walk fails
     */
    std::size_t CountMatches() const;

    const fs::path& Root() const;
    const std::string& Pattern() const;
    const std::set<std::string>& Suffixes() const;
    bool ReportsProgress() const;

  private:
    std::shared_ptr<const EnumerationSettings> _settings;
};
