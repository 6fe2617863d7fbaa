module;

#include <cmath>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <expected>
#include <filesystem>
#include <format>
#include <memory>
#include <span>
#include <string>
#include <string_view>
#include <utility>

module Residency:ResourceSource.Impl;

import :ResourceSource;
import Core;
import Graphics;

namespace Runtime::Residency
{
    namespace
    {
        // Percent-escapes everything that could leave the root directory or
        // confuse the filesystem: separators, drive colons, control bytes and '%'.
        std::string EscapeFileStem(std::string_view entityId)
        {
            std::string out;
            out.reserve(entityId.size());
            for (const char c : entityId)
            {
                const auto byte = static_cast<unsigned char>(c);
                if (byte < 0x20 || byte == 0x7F || c == '/' || c == '\\' || c == ':' || c == '%')
                    out += std::format("%{:02X}", byte);
                else
                    out.push_back(c);
            }
            return out;
        }
    }

    FileResourceSource::FileResourceSource(std::filesystem::path root,
                                           std::unique_ptr<Core::IO::IIOBackend> backend)
        : m_Root(std::move(root)),
          m_Backend(backend ? std::move(backend) : std::make_unique<Core::IO::FileIOBackend>())
    {
    }

    std::filesystem::path FileResourceSource::PathFor(std::string_view entityId, Quality tier) const
    {
        const std::string_view suffix = (tier == Quality::High) ? "high" : "low";
        return m_Root / std::format("{}_{}.rgba", EscapeFileStem(entityId), suffix);
    }

    Core::Expected<Graphics::Image> FileResourceSource::Fetch(std::string_view entityId, Quality tier)
    {
        if (tier == Quality::None)
            return std::unexpected(Core::ErrorCode::InvalidArgument);

        Core::IO::IORequest request;
        request.Path = PathFor(entityId, tier).string();

        auto read = m_Backend->Read(request);
        if (!read)
            return std::unexpected(read.error());

        auto image = DecodeSquareRGBA8(read->Data);
        if (!image)
            Core::Log::Warn("FileResourceSource: '{}' is not a square RGBA8 image ({} bytes).",
                            request.Path, read->Data.size());
        return image;
    }

    Core::Result FileResourceSource::Store(std::string_view entityId, Quality tier, const Graphics::Image& image)
    {
        if (tier == Quality::None || !image.IsValid() || image.Width != image.Height)
            return Core::Err(Core::ErrorCode::InvalidArgument);

        Core::IO::IORequest request;
        request.Path = PathFor(entityId, tier).string();

        auto bytes = std::as_bytes(std::span(image.Pixels));
        auto written = m_Backend->Write(request, bytes);
        if (!written)
            return Core::Err(written.error());
        return Core::Ok();
    }

    Core::Expected<Graphics::Image> DecodeSquareRGBA8(std::span<const std::byte> bytes)
    {
        if (bytes.empty() || bytes.size() % 4 != 0)
            return std::unexpected(Core::ErrorCode::InvalidFormat);

        const size_t texels = bytes.size() / 4;
        const auto side = static_cast<size_t>(std::llround(std::sqrt(static_cast<double>(texels))));
        if (side == 0 || side * side != texels)
            return std::unexpected(Core::ErrorCode::InvalidFormat);

        Graphics::Image image;
        image.Width = static_cast<uint32_t>(side);
        image.Height = static_cast<uint32_t>(side);
        image.Pixels.resize(bytes.size());
        std::memcpy(image.Pixels.data(), bytes.data(), bytes.size());
        return image;
    }
}
