#include "Blob/Blob.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <unordered_map>

#include <xxhash.h>

namespace
{
constexpr std::size_t FileReadBufferSize = 8192;
constexpr XXH64_hash_t HashSeed = 0;

const std::unordered_map<std::string, std::string>& MimetypesByExtension()
{
    static const std::unordered_map<std::string, std::string> mimetypes = {
        {".txt", "text/plain"},
        {".text", "text/plain"},
        {".log", "text/plain"},
        {".md", "text/markdown"},
        {".markdown", "text/markdown"},
        {".rst", "text/x-rst"},
        {".csv", "text/csv"},
        {".tsv", "text/tab-separated-values"},
        {".html", "text/html"},
        {".htm", "text/html"},
        {".css", "text/css"},
        {".xml", "text/xml"},
        {".py", "text/x-python"},
        {".c", "text/x-c"},
        {".h", "text/x-c"},
        {".cpp", "text/x-c++"},
        {".hpp", "text/x-c++"},
        {".js", "text/javascript"},
        {".json", "application/json"},
        {".yaml", "application/yaml"},
        {".yml", "application/yaml"},
        {".pdf", "application/pdf"},
        {".rtf", "application/rtf"},
        {".doc", "application/msword"},
        {".docx", "application/vnd.openxmlformats-officedocument.wordprocessingml.document"},
        {".xls", "application/vnd.ms-excel"},
        {".xlsx", "application/vnd.openxmlformats-officedocument.spreadsheetml.sheet"},
        {".ppt", "application/vnd.ms-powerpoint"},
        {".pptx", "application/vnd.openxmlformats-officedocument.presentationml.presentation"},
        {".odt", "application/vnd.oasis.opendocument.text"},
        {".epub", "application/epub+zip"},
        {".zip", "application/zip"},
        {".gz", "application/gzip"},
        {".tar", "application/x-tar"},
        {".png", "image/png"},
        {".jpg", "image/jpeg"},
        {".jpeg", "image/jpeg"},
        {".gif", "image/gif"},
        {".bmp", "image/bmp"},
        {".svg", "image/svg+xml"},
        {".webp", "image/webp"},
        {".mp3", "audio/mpeg"},
        {".wav", "audio/x-wav"},
        {".mp4", "video/mp4"},
    };
    return mimetypes;
}

/**
 * @brief Open a file for binary reading or throw.
 */
std::ifstream OpenForReading(const fs::path& path)
{
    std::ifstream inputStream(path, std::ios::binary);
    if (false == inputStream.is_open())
    {
        throw BlobMaterializationError(path, "cannot open file for reading");
    }
    return inputStream;
}
}

Blob::Blob(const fs::path& path, std::uintmax_t size, const std::string& mimetype, const std::string& encoding)
    : _path(path), _size(size), _mimetype(mimetype), _encoding(encoding)
{
}

const fs::path& Blob::Path() const
{
    return _path;
}

std::string Blob::Source() const
{
    return _path.string();
}

const std::string& Blob::Mimetype() const
{
    return _mimetype;
}

const std::string& Blob::Encoding() const
{
    return _encoding;
}

std::uintmax_t Blob::Size() const
{
    return _size;
}

std::vector<char> Blob::AsBytes() const
{
    std::ifstream inputStream = OpenForReading(_path);
    std::vector<char> content((std::istreambuf_iterator<char>(inputStream)), std::istreambuf_iterator<char>());
    if (true == inputStream.bad())
    {
        throw BlobMaterializationError(_path, "read failed");
    }
    return content;
}

std::string Blob::AsString() const
{
    std::ifstream inputStream = OpenForReading(_path);
    std::ostringstream outputStream;
    outputStream << inputStream.rdbuf();
    if (true == inputStream.bad())
    {
        throw BlobMaterializationError(_path, "read failed");
    }
    return outputStream.str();
}

bool Blob::ComputeHash(std::string& outputHash) const
{
    std::ifstream inputStream(_path, std::ios::binary);
    if (false == inputStream.is_open())
    {
        return false;
    }

    XXH64_state_t* hashState = XXH64_createState();
    if (nullptr == hashState)
    {
        return false;
    }

    XXH64_reset(hashState, HashSeed);

    char buffer[FileReadBufferSize];
    const std::streamsize bufferSize = static_cast<std::streamsize>(sizeof(buffer));
    while (true)
    {
        inputStream.read(buffer, bufferSize);
        const std::streamsize bytesRead = inputStream.gcount();
        if (0 == bytesRead)
        {
            break;
        }
        XXH64_update(hashState, buffer, static_cast<size_t>(bytesRead));
        if (bufferSize > bytesRead)
        {
            break;
        }
    }

    const bool readFailed = inputStream.bad();
    const XXH64_hash_t hashValue = XXH64_digest(hashState);
    XXH64_freeState(hashState);
    if (true == readFailed)
    {
        return false;
    }

    std::ostringstream outputStream;
    outputStream << std::hex << hashValue;
    outputHash = outputStream.str();
    return true;
}

std::string GuessMimetype(const fs::path& path)
{
    std::string extension = path.extension().string();
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char character) { return static_cast<char>(std::tolower(character)); });

    const auto& mimetypes = MimetypesByExtension();
    const auto found = mimetypes.find(extension);
    return (mimetypes.end() == found) ? std::string() : found->second;
}

Blob MakeBlobFromPath(const fs::path& path)
{
    return MakeBlobFromPath(path, BlobOptions());
}

Blob MakeBlobFromPath(const fs::path& path, const BlobOptions& options)
{
    std::error_code errorCode;
    const std::uintmax_t size = fs::file_size(path, errorCode);
    if (0 != errorCode.value())
    {
        throw BlobMaterializationError(path, errorCode.message());
    }

    // A blob is only handed out for a file that can be opened.
    OpenForReading(path);

    std::string mimetype = options.mimetype;
    if ((true == mimetype.empty()) && (true == options.guessMimetype))
    {
        mimetype = GuessMimetype(path);
    }

    return Blob(path, size, mimetype, options.encoding);
}
