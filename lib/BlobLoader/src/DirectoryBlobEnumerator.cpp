#include "BlobLoader/DirectoryBlobEnumerator.hpp"
#include "FileIterator/TraversalError.hpp"
#include "MatchingPathStream.hpp"

#include <optional>
#include <stdexcept>
#include <utility>

namespace
{
/**
 * @brief Check the root once, at the boundary where it enters the enumerator.
 */
fs::path ValidateRoot(const fs::path& root)
{
    const auto& native = root.native();
    if (native.npos != native.find(fs::path::value_type()))
    {
        throw std::invalid_argument("Root path must not contain a null character.");
    }
    // An empty path names the working directory.
    return (true == native.empty()) ? fs::path(".") : root;
}

std::shared_ptr<const EnumerationSettings> MakeSettings(const fs::path& root, const DirectoryBlobEnumeratorConfig& config)
{
    std::shared_ptr<ProgressSink> progressSink = config.progressSink;
    if (nullptr == progressSink)
    {
        progressSink = std::make_shared<NullProgressSink>();
    }

    BlobFactory blobFactory = config.blobFactory;
    if (nullptr == blobFactory)
    {
        blobFactory = [](const fs::path& path) { return MakeBlobFromPath(path); };
    }

    return std::make_shared<EnumerationSettings>(EnumerationSettings{ValidateRoot(root),
                                                                           GlobPattern::Compile(config.pattern),
                                                                           config.suffixes,
                                                                           config.reportProgress,
                                                                           std::move(progressSink),
                                                                           std::move(blobFactory),
                                                                           config.traversalErrorPolicy});
}
}

struct BlobSequence::State
{
    explicit State(const EnumerationSettings& settings) : paths(settings), started(false), incrementPending(false), closed(false)
    {
    }

    MatchingPathStream paths;
    std::optional<ProgressScope> progressScope;
    bool started;
    bool incrementPending;
    bool closed;
};

BlobSequence::BlobSequence(std::shared_ptr<const EnumerationSettings> settings)
    : _settings(std::move(settings)), _state(std::make_unique<State>(*_settings))
{
}

BlobSequence::~BlobSequence()
{
    Close();
}

BlobSequence::BlobSequence(BlobSequence&& other) noexcept = default;

BlobSequence& BlobSequence::operator=(BlobSequence&& other) noexcept
{
    if (this != &other)
    {
        Close();
        _settings = std::move(other._settings);
        _state = std::move(other._state);
    }
    return *this;
}

bool BlobSequence::Next(Blob& outBlob)
{
    if ((nullptr == _state) || (true == _state->closed))
    {
        return false;
    }

    State& state = *_state;
    fs::path path;
    try
    {
        if (false == state.started)
        {
            state.started = true;
            if (true == _settings->reportProgress)
            {
                // Counting walks the whole tree before the first blob is produced.
                const std::size_t total = CountMatchingPaths(*_settings);
                state.progressScope.emplace(*_settings->progressSink, total);
            }
        }

        if (true == state.incrementPending)
        {
            state.incrementPending = false;
            if (true == state.progressScope.has_value())
            {
                state.progressScope->Increment();
            }
        }

        if (false == state.paths.Next(path))
        {
            Close();
            return false;
        }
    }
    catch (const TraversalError&)
    {
        Close();
        throw;
    }

    // The item counts as handed out even if the factory fails for it.
    state.incrementPending = true;
    outBlob = _settings->blobFactory(path);
    return true;
}

void BlobSequence::Close()
{
    if ((nullptr == _state) || (true == _state->closed))
    {
        return;
    }
    _state->closed = true;
    _state->incrementPending = false;
    _state->paths.Close();
    _state->progressScope.reset();
}

const std::vector<fs::path>& BlobSequence::SkippedDirectories() const
{
    static const std::vector<fs::path> None;
    return (nullptr == _state) ? None : _state->paths.SkippedDirectories();
}

BlobSequence::Iterator BlobSequence::begin()
{
    return Iterator(this);
}

BlobSequence::Iterator BlobSequence::end()
{
    return Iterator();
}

DirectoryBlobEnumerator::DirectoryBlobEnumerator(const fs::path& root, const DirectoryBlobEnumeratorConfig& config)
    : _settings(MakeSettings(root, config))
{
}

BlobSequence DirectoryBlobEnumerator::Enumerate() const
{
    return BlobSequence(_settings);
}

std::size_t DirectoryBlobEnumerator::CountMatches() const
{
    return CountMatchingPaths(*_settings);
}

const fs::path& DirectoryBlobEnumerator::Root() const
{
    return _settings->root;
}

const std::string& DirectoryBlobEnumerator::Pattern() const
{
    return _settings->pattern.String();
}

const std::set<std::string>& DirectoryBlobEnumerator::Suffixes() const
{
    return _settings->suffixes;
}

bool DirectoryBlobEnumerator::ReportsProgress() const
{
    return _settings->reportProgress;
}
