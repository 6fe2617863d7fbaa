module;

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

export module Catalog:Loader;

import Core;
import ECS;

export namespace Runtime::Catalog
{
    // One catalog row. Missing measurements stay empty.
    struct CatalogRecord
    {
        std::string Id;
        std::string Name;
        ECS::Components::PhysicalAttributes::Component Attributes{};
        std::optional<float> StarDistanceLy;
    };

    // CSV catalog -> registry entities.
    //
    // Format: name,mass,radius,temperature,star_distance[,id]
    //   - optional header row (first field "name"), '#' comment lines, blank lines
    //   - empty fields are missing values; the id defaults to the name
    //   - malformed rows are logged and skipped
    //
    // Placement: each entity sits on a sphere of radius star_distance around the
    // origin, in a seeded random direction, retried until it keeps
    // MinSeparationMultiplier * (r_i + r_j) from every entity placed before it.
    class CatalogLoader
    {
    public:
        struct Config
        {
            float LightYearToSceneUnits = 25.0e6f;
            float EarthRadiusToSceneUnits = 5.0e6f;
            float DefaultDistanceLy = 100.0f;
            float DefaultRadius = 1.0f;
            float MinSeparationMultiplier = 2.5f;
            uint32_t MaxPlacementAttempts = 100;
            uint64_t Seed = 0x0a11ce5eedULL;
        };

        struct LoadSummary
        {
            size_t Rows = 0;
            size_t Skipped = 0;
            size_t Created = 0;
            size_t Duplicates = 0;
            size_t PlacementFallbacks = 0;
        };

        explicit CatalogLoader(Config config = {}, std::unique_ptr<Core::IO::IIOBackend> backend = nullptr);

        [[nodiscard]] Core::Expected<std::vector<CatalogRecord>> Parse(std::string_view text);
        [[nodiscard]] Core::Expected<std::vector<CatalogRecord>> LoadFile(const std::filesystem::path& path);
        [[nodiscard]] Core::Result SaveFile(const std::filesystem::path& path, std::span<const CatalogRecord> records);

        // Creates one entity per record; duplicates of an existing id are skipped.
        size_t Populate(ECS::SceneObjectRegistry& registry, std::span<const CatalogRecord> records);

        [[nodiscard]] float BoundingRadiusFor(const CatalogRecord& record) const;
        [[nodiscard]] float DistanceFor(const CatalogRecord& record) const;

        [[nodiscard]] const LoadSummary& GetSummary() const { return m_Summary; }
        [[nodiscard]] const Config& GetConfig() const { return m_Config; }

        // Plausible random catalog for demos and stress tests.
        [[nodiscard]] static std::vector<CatalogRecord> GenerateSynthetic(size_t count, uint64_t seed);

        [[nodiscard]] static std::string Serialize(std::span<const CatalogRecord> records);

    private:
        Config m_Config;
        std::unique_ptr<Core::IO::IIOBackend> m_Backend;
        LoadSummary m_Summary{};
    };
}
