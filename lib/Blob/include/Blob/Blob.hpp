#pragma once

#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

/**
 * @brief Raised when a blob cannot be created from, or read back from, its file.
 */
class BlobMaterializationError : public std::runtime_error
{
  public:
    BlobMaterializationError(const fs::path& path, const std::string& reason)
        : std::runtime_error("Cannot materialize blob " + path.string() + ": " + reason)
        , _path(path)
    {
    }

    const fs::path& Path() const noexcept
    {
        return _path;
    }

  private:
    fs::path _path;
};

/**
 * @brief Options applied when a blob is created from a path.
 */
struct BlobOptions
{
    std::string encoding;   /**< Text encoding reported for the content */
    std::string mimetype;   /**< Explicit mimetype, takes precedence over guessing */
    bool guessMimetype;     /**< Guess the mimetype from the extension when none is given */

    /**
     * @brief Initialize options with default values.
     */
    BlobOptions()
        : encoding("utf-8")
        , guessMimetype(true)
    {
    }
};

/**
 * @brief File-backed binary record.
 *
 * A blob refers to its file; content is read each time it is requested.
 */
class Blob
{
  public:
    Blob() = default;
    Blob(const fs::path& path, std::uintmax_t size, const std::string& mimetype, const std::string& encoding);

    const fs::path& Path() const;

    /**
     * @brief Location of the blob's data as a string.
     */
    std::string Source() const;

    /**
     * @brief Mimetype of the content, empty when unknown.
     */
    const std::string& Mimetype() const;
    const std::string& Encoding() const;

    /**
     * @brief Size of the file when the blob was created, in bytes.
     */
    std::uintmax_t Size() const;

    /**
     * @brief Read the content as raw bytes.
     *
     * @return File content
     * @throws BlobMaterializationError if the file cannot be read
     */
    std::vector<char> AsBytes() const;

    /**
     * @brief Read the content as a string.
     *
     * @return File content
     * @throws BlobMaterializationError if the file cannot be read
     */
    std::string AsString() const;

    /**
     * @brief Compute an XXH64 digest of the content.
     *
     * @param[out] outputHash Lowercase hex-encoded digest
     * @return true on success, false if the file cannot be read
     */
    bool ComputeHash(std::string& outputHash) const;

  private:
    fs::path _path;
    std::uintmax_t _size = 0;
    std::string _mimetype;
    std::string _encoding;
};

/**
 * @brief Guess a mimetype from the extension of a path.
 *
 * @param[in] path File path
 * @return Mimetype, or an empty string when the extension is unknown
 */
std::string GuessMimetype(const fs::path& path);

/**
 * @brief Create a blob for a file using default options.
 *
 * @param[in] path Path to a regular file
 * @return Blob referring to the file
 * @throws BlobMaterializationError if the file cannot be inspected or opened
 */
Blob MakeBlobFromPath(const fs::path& path);

/**
 * @brief Create a blob for a file.
 *
 * @param[in] path Path to a regular file
 * @param[in] options Encoding and mimetype handling
 * @return Blob referring to the file
 * @throws BlobMaterializationError if the file cannot be inspected or opened
 */
Blob MakeBlobFromPath(const fs::path& path, const BlobOptions& options);
