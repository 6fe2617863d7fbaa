module;

#include <cstddef>
#include <expected>
#include <span>
#include <string>
#include <vector>

export module Core:IOBackend;

import :Error;

export namespace Core::IO
{
    struct IORequest
    {
        std::string Path;
        size_t Offset = 0; // Read only
        size_t Size = 0;   // Read only; 0 = to end of file
    };

    struct IOReadResult
    {
        std::vector<std::byte> Data;
    };

    // Abstract I/O backend. Implementations must be callable from worker threads.
    class IIOBackend
    {
    public:
        virtual ~IIOBackend() = default;
        IIOBackend(const IIOBackend&) = delete;
        IIOBackend& operator=(const IIOBackend&) = delete;
        IIOBackend(IIOBackend&&) = delete;
        IIOBackend& operator=(IIOBackend&&) = delete;

        [[nodiscard]] virtual std::expected<IOReadResult, ErrorCode> Read(
            const IORequest& request) = 0;

        // Replaces the whole file at IORequest::Path. A concurrent Read() of the
        // same path never observes a partially written file.
        [[nodiscard]] virtual std::expected<void, ErrorCode> Write(
            const IORequest& request,
            std::span<const std::byte> data) = 0;

    protected:
        IIOBackend() = default;
    };

    // Loose files on the local filesystem. Write() stages to "<path>.partial"
    // and renames over the destination.
    class FileIOBackend final : public IIOBackend
    {
    public:
        FileIOBackend() = default;
        [[nodiscard]] std::expected<IOReadResult, ErrorCode> Read(
            const IORequest& request) override;
        [[nodiscard]] std::expected<void, ErrorCode> Write(
            const IORequest& request,
            std::span<const std::byte> data) override;
    };
}
