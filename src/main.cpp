// file main.cpp:

#include "BlobLoader/DirectoryBlobEnumerator.hpp"
#include "FileIterator/TraversalError.hpp"
#include "cxxopts.hpp"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;

namespace
{

/**
 * @brief Settings for one run of the command line tool.
 */
struct ScanSettings
{
    fs::path root;
    DirectoryBlobEnumeratorConfig enumeratorConfig;
    bool countOnly = false;
    bool printHash = false;
    bool verbose = false;
};

/**
 * @brief Parses command-line arguments using cxxopts.
 *
 * @param[in] argc Argument count.
 * @param[in] argv Argument values.
 * @return std::optional<cxxopts::ParseResult> if parsing is successful and help is not requested,
 *         otherwise returns an empty optional (e.g., if help is shown or required args are missing).
 */
std::optional<cxxopts::ParseResult> ParseCommandLineOptions(int argc, char* argv[])
{
    cxxopts::Options options("blobscan", "List files under a directory as blobs");

    // clang-format off
    options.add_options()
        ("p,path",          "Directory to scan", cxxopts::value<std::string>())
        ("g,glob",          "Glob pattern relative to the directory", cxxopts::value<std::string>()->default_value(DefaultGlobPattern))
        ("s,suffix",        "Accepted suffix including the dot (repeatable)", cxxopts::value<std::vector<std::string>>())
        ("c,count",         "Only print the number of matching files")
        ("hash",            "Print the XXH64 digest of each file")
        ("progress",        "Count matches first and report progress on stderr")
        ("skip-unreadable", "Skip subdirectories that cannot be listed")
        ("v,verbose",       "Verbose output")
        ("h,help",          "Print help");
    // clang-format on

    auto parseResult = options.parse(argc, argv);

    if ((0 < parseResult.count("help")) || (0 == parseResult.count("path")))
    {
        std::cout << options.help() << '\n';
        return std::nullopt;
    }

    return parseResult;
}

/**
 * @brief Builds the scan settings from parsed command-line options.
 *
 * @param[in] parseResult The parsed command-line options.
 * @return Scan settings.
 */
ScanSettings SetupScanSettings(const cxxopts::ParseResult& parseResult)
{
    ScanSettings settings;

    settings.root = fs::path(parseResult["path"].as<std::string>());
    settings.countOnly = (0 < parseResult.count("count"));
    settings.printHash = (0 < parseResult.count("hash"));
    settings.verbose = (0 < parseResult.count("verbose"));

    DirectoryBlobEnumeratorConfig& config = settings.enumeratorConfig;
    config.pattern = parseResult["glob"].as<std::string>();
    if (0 < parseResult.count("suffix"))
    {
        for (const auto& suffix : parseResult["suffix"].as<std::vector<std::string>>())
        {
            config.suffixes.insert(suffix);
        }
    }
    if (0 < parseResult.count("skip-unreadable"))
    {
        config.traversalErrorPolicy = TraversalErrorPolicy::Skip;
    }
    if (0 < parseResult.count("progress"))
    {
        config.reportProgress = true;
        config.progressSink = std::make_shared<ConsoleProgressSink>(std::cerr);
    }

    return settings;
}

/**
 * @brief Print one line per blob, continuing past items that fail.
 *
 * @param[in] enumerator Configured enumerator
 * @param[in] settings Output settings
 * @return true if every item was produced, false if any item failed
 */
bool ListBlobs(const DirectoryBlobEnumerator& enumerator, const ScanSettings& settings)
{
    bool allSucceeded = true;
    std::size_t produced = 0;

    BlobSequence blobs = enumerator.Enumerate();
    while (true)
    {
        Blob blob;
        try
        {
            if (false == blobs.Next(blob))
            {
                break;
            }
        }
        catch (const BlobMaterializationError& error)
        {
            std::cerr << error.what() << '\n';
            allSucceeded = false;
            continue;
        }

        std::cout << blob.Source() << '\t' << blob.Size() << '\t' << (blob.Mimetype().empty() ? "-" : blob.Mimetype());
        if (true == settings.printHash)
        {
            std::string hash;
            if (false == blob.ComputeHash(hash))
            {
                std::cerr << "Failed to hash " << blob.Source() << '\n';
                allSucceeded = false;
                hash = "-";
            }
            std::cout << '\t' << hash;
        }
        std::cout << '\n';
        ++produced;
    }

    for (const auto& skipped : blobs.SkippedDirectories())
    {
        std::cerr << "Skipped unreadable directory " << skipped.string() << '\n';
    }

    if (true == settings.verbose)
    {
        std::cout << "Listed " << produced << " blobs\n";
    }
    return allSucceeded;
}

/**
 * @brief Parse the command line, then scan and print.
 *
 * @return Process exit code.
 */
int Run(int argc, char* argv[])
{
    std::optional<cxxopts::ParseResult> parseResult = ParseCommandLineOptions(argc, argv);

    if (false == parseResult.has_value())
    {
        return 0; // Help was shown or required arguments are missing.
    }

    const ScanSettings settings = SetupScanSettings(parseResult.value());

    try
    {
        const DirectoryBlobEnumerator enumerator(settings.root, settings.enumeratorConfig);

        if (true == settings.countOnly)
        {
            std::cout << enumerator.CountMatches() << '\n';
            return 0;
        }

        if (true == settings.verbose)
        {
            std::cout << "Scanning " << enumerator.Root().string() << " for " << enumerator.Pattern() << '\n';
        }

        if (false == ListBlobs(enumerator, settings))
        {
            std::cerr << "Some files could not be listed\n";
            return 1;
        }
    }
    catch (const std::invalid_argument& error)
    {
        std::cerr << "Invalid argument: " << error.what() << '\n';
        return 1;
    }
    catch (const TraversalError& error)
    {
        std::cerr << error.what() << '\n';
        return 1;
    }

    return 0;
}

} // namespace

int main(int argc, char* argv[])
{
    try
    {
        return Run(argc, argv);
    }
    catch (const cxxopts::exceptions::exception& error)
    {
        std::cerr << error.what() << '\n';
        return 1;
    }
}
