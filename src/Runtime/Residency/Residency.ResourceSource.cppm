module;

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>
#include <string_view>

export module Residency:ResourceSource;

import :Types;
import Core;
import Graphics;

export namespace Runtime::Residency
{
    // Opaque, fallible lookup of precomputed images keyed by (entityId, tier).
    // Fetch() runs on worker threads; implementations must be thread-safe.
    // An absent resource is reported as ResourceNotFound/FileNotFound.
    class IResourceSource
    {
    public:
        virtual ~IResourceSource() = default;

        [[nodiscard]] virtual Core::Expected<Graphics::Image> Fetch(std::string_view entityId, Quality tier) = 0;
    };

    // Precomputed images on disk: <root>/<entityId>_<high|low>.rgba, with path
    // separators and '%' in the id percent-escaped so every file stays under root.
    // File content is raw square RGBA8 (side = sqrt(bytes / 4)).
    class FileResourceSource final : public IResourceSource
    {
    public:
        explicit FileResourceSource(std::filesystem::path root,
                                    std::unique_ptr<Core::IO::IIOBackend> backend = nullptr);

        [[nodiscard]] Core::Expected<Graphics::Image> Fetch(std::string_view entityId, Quality tier) override;

        // Writes an image where Fetch() will look for it. Used to bake a catalog offline.
        [[nodiscard]] Core::Result Store(std::string_view entityId, Quality tier, const Graphics::Image& image);

        [[nodiscard]] std::filesystem::path PathFor(std::string_view entityId, Quality tier) const;

    private:
        std::filesystem::path m_Root;
        std::unique_ptr<Core::IO::IIOBackend> m_Backend;
    };

    // Raw square RGBA8 <-> Image.
    [[nodiscard]] Core::Expected<Graphics::Image> DecodeSquareRGBA8(std::span<const std::byte> bytes);
}
