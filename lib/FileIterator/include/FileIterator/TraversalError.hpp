#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace fs = std::filesystem;

/**
 * @brief Raised when a directory walk cannot proceed.
 */
class TraversalError : public std::runtime_error
{
  public:
    TraversalError(const std::string& message, const fs::path& path, std::error_code errorCode)
        : std::runtime_error(message + ": " + path.string() + " (" + errorCode.message() + ")")
        , _path(path)
        , _errorCode(errorCode)
    {
    }

    const fs::path& Path() const noexcept
    {
        return _path;
    }

    std::error_code Code() const noexcept
    {
        return _errorCode;
    }

  private:
    fs::path _path;
    std::error_code _errorCode;
};

/**
 * @brief The traversal root does not exist.
 */
class PathNotFoundError : public TraversalError
{
  public:
    explicit PathNotFoundError(const fs::path& path)
        : TraversalError("Path not found", path, std::make_error_code(std::errc::no_such_file_or_directory))
    {
    }
};

/**
 * @brief The traversal root exists but is not a directory.
 */
class NotADirectoryError : public TraversalError
{
  public:
    explicit NotADirectoryError(const fs::path& path)
        : TraversalError("Not a directory", path, std::make_error_code(std::errc::not_a_directory))
    {
    }
};
