#include "FileIterator/FileIterator.hpp"
#include "FileIterator/TraversalError.hpp"

#include <algorithm>
#include <filesystem>
#include <system_error>
#include <utility>

namespace
{
/**
 * @brief List a directory and sort its entries by name.
 *
 * The directory handle is released before returning.
 *
 * @param[in] directory Directory to list
 * @param[out] outEntries Sorted entries
 * @param[out] errorCode Set if the directory cannot be opened or read
 */
void ReadDirectory(const fs::path& directory, std::vector<fs::directory_entry>& outEntries, std::error_code& errorCode)
{
    outEntries.clear();
    fs::directory_iterator iterator(directory, errorCode);
    if (0 != errorCode.value())
    {
        return;
    }

    const fs::directory_iterator end;
    while (end != iterator)
    {
        outEntries.push_back(*iterator);
        iterator.increment(errorCode);
        if (0 != errorCode.value())
        {
            outEntries.clear();
            return;
        }
    }

    std::sort(outEntries.begin(), outEntries.end(),
              [](const fs::directory_entry& left, const fs::directory_entry& right)
              { return left.path().filename().native() < right.path().filename().native(); });
}

bool IsRealDirectory(const fs::directory_entry& entry)
{
    std::error_code errorCode;
    const fs::file_status status = entry.symlink_status(errorCode);
    return (0 == errorCode.value()) && (fs::file_type::directory == status.type());
}
}

FileIterator::FileIterator(const fs::path& root, const GlobPattern& pattern, TraversalErrorPolicy policy)
    : _root(root), _pattern(pattern), _policy(policy), _started(false), _finished(false)
{
}

void FileIterator::Start()
{
    _started = true;

    std::error_code errorCode;
    const fs::file_status status = fs::status(_root, errorCode);
    if ((fs::file_type::not_found == status.type()) || (errorCode == std::errc::no_such_file_or_directory))
    {
        _finished = true;
        throw PathNotFoundError(_root);
    }
    if (0 != errorCode.value())
    {
        _finished = true;
        throw TraversalError("Cannot access root", _root, errorCode);
    }
    if (fs::file_type::directory != status.type())
    {
        _finished = true;
        throw NotADirectoryError(_root);
    }

    // The root is always listed; only subdirectories fall under the skip policy.
    Frame rootFrame{{}, 0, _pattern.InitialStates()};
    ReadDirectory(_root, rootFrame.entries, errorCode);
    if (0 != errorCode.value())
    {
        _finished = true;
        throw TraversalError("Cannot list directory", _root, errorCode);
    }
    _stack.push_back(std::move(rootFrame));
}

void FileIterator::Descend(const PendingDescent& descent)
{
    Frame frame{{}, 0, descent.states};
    std::error_code errorCode;
    ReadDirectory(descent.directory, frame.entries, errorCode);
    if (0 != errorCode.value())
    {
        if (TraversalErrorPolicy::Skip == _policy)
        {
            _skippedDirectories.push_back(descent.directory);
            return;
        }
        Close();
        throw TraversalError("Cannot list directory", descent.directory, errorCode);
    }
    _stack.push_back(std::move(frame));
}

bool FileIterator::Next(fs::directory_entry& outEntry)
{
    if (true == _finished)
    {
        return false;
    }
    if (false == _started)
    {
        Start();
    }

    if (true == _pendingDescent.has_value())
    {
        const PendingDescent descent = std::move(*_pendingDescent);
        _pendingDescent.reset();
        Descend(descent);
    }

    while (false == _stack.empty())
    {
        Frame& frame = _stack.back();
        if (frame.position >= frame.entries.size())
        {
            _stack.pop_back();
            continue;
        }

        const fs::directory_entry entry = frame.entries[frame.position++];
        GlobPattern::StateSet states = _pattern.Advance(frame.states, entry.path().filename().string());
        if (true == states.empty())
        {
            continue;
        }

        std::error_code errorCode;
        const bool isDirectory = IsRealDirectory(entry);
        const bool matched = (true == _pattern.Accepts(states))
                             && ((false == _pattern.MatchesDirectoriesOnly()) || (true == entry.is_directory(errorCode)));
        const bool descend = (true == isDirectory) && (true == _pattern.CanDescend(states));

        if (true == matched)
        {
            if (true == descend)
            {
                _pendingDescent = PendingDescent{entry.path(), std::move(states)};
            }
            outEntry = entry;
            return true;
        }

        if (true == descend)
        {
            Descend({entry.path(), std::move(states)});
        }
    }

    _finished = true;
    return false;
}

void FileIterator::Close()
{
    _finished = true;
    _stack.clear();
    _stack.shrink_to_fit();
    _pendingDescent.reset();
}

const std::vector<fs::path>& FileIterator::SkippedDirectories() const
{
    return _skippedDirectories;
}
