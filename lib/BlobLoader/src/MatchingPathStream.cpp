#include "MatchingPathStream.hpp"

#include <system_error>

MatchingPathStream::MatchingPathStream(const EnumerationSettings& settings)
    : _settings(settings), _fileIterator(settings.root, settings.pattern, settings.traversalErrorPolicy)
{
}

bool MatchingPathStream::Accept(const fs::directory_entry& entry) const
{
    // Follows symlinks: a link to a regular file is accepted, a link to a directory is not.
    std::error_code errorCode;
    const bool isRegularFile = entry.is_regular_file(errorCode);
    if ((0 != errorCode.value()) || (false == isRegularFile))
    {
        return false;
    }

    if (true == _settings.suffixes.empty())
    {
        return true;
    }
    return 0 != _settings.suffixes.count(FinalSuffix(entry.path()));
}

bool MatchingPathStream::Next(fs::path& outPath)
{
    fs::directory_entry entry;
    while (true == _fileIterator.Next(entry))
    {
        if (true == Accept(entry))
        {
            outPath = entry.path();
            return true;
        }
    }
    return false;
}

void MatchingPathStream::Close()
{
    _fileIterator.Close();
}

const std::vector<fs::path>& MatchingPathStream::SkippedDirectories() const
{
    return _fileIterator.SkippedDirectories();
}

std::string FinalSuffix(const fs::path& path)
{
    const std::string name = path.filename().string();
    const std::size_t dot = name.rfind('.');
    if ((std::string::npos == dot) || (0 == dot) || ((name.size() - 1) == dot))
    {
        return std::string();
    }
    return name.substr(dot);
}

std::size_t CountMatchingPaths(const EnumerationSettings& settings)
{
    MatchingPathStream paths(settings);
    std::size_t count = 0;
    fs::path path;
    while (true == paths.Next(path))
    {
        ++count;
    }
    return count;
}
