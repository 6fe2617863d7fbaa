module;

#include <cstddef>
#include <expected>
#include <filesystem>
#include <fstream>
#include <span>
#include <string>
#include <vector>

module Core:IOBackend.Impl;

import :IOBackend;

namespace Core::IO
{
    namespace
    {
        namespace fs = std::filesystem;

        struct ByteRange
        {
            size_t Offset = 0;
            size_t Size = 0;
        };

        std::expected<ByteRange, ErrorCode> ClampRequest(const IORequest& request, size_t fileSize)
        {
            if (request.Offset > fileSize)
                return std::unexpected(ErrorCode::OutOfRange);

            const size_t available = fileSize - request.Offset;
            const size_t size = request.Size == 0 ? available : request.Size;
            if (size > available)
                return std::unexpected(ErrorCode::OutOfRange);

            return ByteRange{request.Offset, size};
        }

        fs::path StagingPathFor(const fs::path& destination)
        {
            fs::path staging = destination;
            staging += ".partial";
            return staging;
        }
    }

    std::expected<IOReadResult, ErrorCode> FileIOBackend::Read(const IORequest& request)
    {
        if (request.Path.empty())
            return std::unexpected(ErrorCode::InvalidPath);

        std::error_code ec;
        const fs::path path(request.Path);
        if (!fs::is_regular_file(path, ec))
            return std::unexpected(ErrorCode::FileNotFound);

        const auto fileSize = fs::file_size(path, ec);
        if (ec)
            return std::unexpected(ErrorCode::FileReadError);

        auto range = ClampRequest(request, static_cast<size_t>(fileSize));
        if (!range)
            return std::unexpected(range.error());

        std::ifstream file(path, std::ios::binary);
        if (!file || !file.seekg(static_cast<std::streamoff>(range->Offset)))
            return std::unexpected(ErrorCode::FileReadError);

        IOReadResult result;
        result.Data.resize(range->Size);
        if (!file.read(reinterpret_cast<char*>(result.Data.data()), static_cast<std::streamsize>(range->Size)))
            return std::unexpected(ErrorCode::FileReadError);

        return result;
    }

    std::expected<void, ErrorCode> FileIOBackend::Write(const IORequest& request, std::span<const std::byte> data)
    {
        if (request.Path.empty())
            return std::unexpected(ErrorCode::InvalidPath);

        const fs::path destination(request.Path);
        const fs::path staging = StagingPathFor(destination);

        std::error_code ec;
        if (destination.has_parent_path())
            fs::create_directories(destination.parent_path(), ec);

        {
            std::ofstream file(staging, std::ios::binary | std::ios::trunc);
            if (!file)
                return std::unexpected(ErrorCode::FileWriteError);

            file.write(reinterpret_cast<const char*>(data.data()), static_cast<std::streamsize>(data.size()));
            if (!file.flush())
            {
                file.close();
                fs::remove(staging, ec);
                return std::unexpected(ErrorCode::FileWriteError);
            }
        }

        // Readers see either the old file or the complete new one.
        fs::rename(staging, destination, ec);
        if (ec)
        {
            fs::remove(staging, ec);
            return std::unexpected(ErrorCode::FileWriteError);
        }
        return {};
    }
}
