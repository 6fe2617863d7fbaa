module;

#include <cstddef>
#include <cstdint>
#include <vector>

export module Graphics:Image;

export namespace Runtime::Graphics
{
    // CPU-side RGBA8 image. The payload format of every resident resource,
    // whether synthesized or fetched.
    struct Image
    {
        uint32_t Width = 0;
        uint32_t Height = 0;
        std::vector<uint8_t> Pixels; // Width * Height * 4, row-major, top row first

        [[nodiscard]] bool IsValid() const
        {
            return Width > 0 && Height > 0 &&
                   Pixels.size() == static_cast<size_t>(Width) * Height * 4u;
        }

        [[nodiscard]] size_t SizeBytes() const { return Pixels.size(); }

        bool operator==(const Image&) const = default;
    };
}
