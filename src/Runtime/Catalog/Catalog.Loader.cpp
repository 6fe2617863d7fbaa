module;

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <memory>
#include <numbers>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glm/glm.hpp>
#include <entt/entity/registry.hpp>

module Catalog:Loader.Impl;

import :Loader;
import Core;
import ECS;

namespace Runtime::Catalog
{
    namespace
    {
        class PlacementRandom
        {
        public:
            explicit PlacementRandom(uint64_t seed) : m_Engine(seed) {}

            // [0, 1)
            double Next() { return static_cast<double>(m_Engine() >> 11) * 0x1.0p-53; }

            double Range(double lo, double hi) { return lo + (hi - lo) * Next(); }

        private:
            std::mt19937_64 m_Engine;
        };

        // Uniform direction, scaled to `radius`.
        glm::vec3 RandomPointOnSphere(float radius, PlacementRandom& rng)
        {
            const double theta = 2.0 * std::numbers::pi * rng.Next();
            const double phi = std::acos(2.0 * rng.Next() - 1.0);
            const double s = std::sin(phi);
            return glm::vec3(static_cast<float>(radius * s * std::cos(theta)),
                             static_cast<float>(radius * s * std::sin(theta)),
                             static_cast<float>(radius * std::cos(phi)));
        }

        std::string_view Trim(std::string_view s)
        {
            const auto first = s.find_first_not_of(" \t\r");
            if (first == std::string_view::npos) return {};
            const auto last = s.find_last_not_of(" \t\r");
            return s.substr(first, last - first + 1);
        }

        // Splits on commas; a field wrapped in double quotes may contain commas.
        std::vector<std::string> SplitRow(std::string_view line)
        {
            std::vector<std::string> fields;
            std::string current;
            bool quoted = false;

            for (size_t i = 0; i < line.size(); ++i)
            {
                const char c = line[i];
                if (c == '"')
                {
                    if (quoted && i + 1 < line.size() && line[i + 1] == '"')
                    {
                        current.push_back('"');
                        ++i;
                    }
                    else
                    {
                        quoted = !quoted;
                    }
                }
                else if (c == ',' && !quoted)
                {
                    fields.emplace_back(Trim(current));
                    current.clear();
                }
                else
                {
                    current.push_back(c);
                }
            }
            fields.emplace_back(Trim(current));
            return fields;
        }

        // Empty -> nullopt. Unparsable -> error.
        Core::Expected<std::optional<float>> ParseOptionalFloat(std::string_view field)
        {
            if (field.empty()) return std::optional<float>{};

            float value = 0.0f;
            const auto [ptr, ec] = std::from_chars(field.data(), field.data() + field.size(), value);
            if (ec != std::errc{} || ptr != field.data() + field.size() || !std::isfinite(value))
                return std::unexpected(Core::ErrorCode::InvalidFormat);
            return std::optional<float>{value};
        }

        std::string FormatOptional(const std::optional<float>& value)
        {
            return value ? std::format("{}", *value) : std::string{};
        }

        std::string QuoteIfNeeded(const std::string& field)
        {
            if (field.find_first_of(",\"") == std::string::npos) return field;

            std::string out = "\"";
            for (char c : field)
            {
                if (c == '"') out.push_back('"');
                out.push_back(c);
            }
            out.push_back('"');
            return out;
        }
    }

    CatalogLoader::CatalogLoader(Config config, std::unique_ptr<Core::IO::IIOBackend> backend)
        : m_Config(config),
          m_Backend(backend ? std::move(backend) : std::make_unique<Core::IO::FileIOBackend>())
    {
    }

    Core::Expected<std::vector<CatalogRecord>> CatalogLoader::Parse(std::string_view text)
    {
        std::vector<CatalogRecord> records;
        m_Summary.Rows = 0;
        m_Summary.Skipped = 0;

        size_t lineNumber = 0;
        size_t pos = 0;
        while (pos <= text.size())
        {
            const size_t end = std::min(text.find('\n', pos), text.size());
            const std::string_view line = Trim(text.substr(pos, end - pos));
            pos = end + 1;
            ++lineNumber;

            if (line.empty() || line.front() == '#') continue;

            std::vector<std::string> fields = SplitRow(line);
            if (m_Summary.Rows == 0)
            {
                std::string first = fields.front();
                for (char& c : first) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
                if (first == "name") continue; // Header
            }

            ++m_Summary.Rows;

            if (fields.size() < 5 || fields.size() > 6)
            {
                Core::Log::Warn("CatalogLoader: line {} has {} fields (expected 5 or 6), skipped.",
                                lineNumber, fields.size());
                ++m_Summary.Skipped;
                continue;
            }

            CatalogRecord record;
            record.Name = fields[0];
            record.Id = (fields.size() == 6 && !fields[5].empty()) ? fields[5] : fields[0];
            if (record.Id.empty())
            {
                Core::Log::Warn("CatalogLoader: line {} has neither name nor id, skipped.", lineNumber);
                ++m_Summary.Skipped;
                continue;
            }

            auto mass = ParseOptionalFloat(fields[1]);
            auto radius = ParseOptionalFloat(fields[2]);
            auto temperature = ParseOptionalFloat(fields[3]);
            auto distance = ParseOptionalFloat(fields[4]);
            if (!mass || !radius || !temperature || !distance)
            {
                Core::Log::Warn("CatalogLoader: line {} ('{}') has a non-numeric value, skipped.",
                                lineNumber, record.Id);
                ++m_Summary.Skipped;
                continue;
            }

            record.Attributes.Mass = *mass;
            record.Attributes.Radius = *radius;
            record.Attributes.Temperature = *temperature;
            record.StarDistanceLy = *distance;
            records.push_back(std::move(record));
        }

        if (records.empty() && m_Summary.Rows > 0)
        {
            Core::Log::Error("CatalogLoader: none of {} rows could be parsed.", m_Summary.Rows);
            return std::unexpected(Core::ErrorCode::InvalidFormat);
        }
        return records;
    }

    Core::Expected<std::vector<CatalogRecord>> CatalogLoader::LoadFile(const std::filesystem::path& path)
    {
        Core::IO::IORequest request;
        request.Path = path.string();

        auto read = m_Backend->Read(request);
        if (!read)
        {
            Core::Log::Error("CatalogLoader: cannot read '{}' ({}).", request.Path,
                             Core::ErrorCodeToString(read.error()));
            return std::unexpected(read.error());
        }

        const std::string_view text(reinterpret_cast<const char*>(read->Data.data()), read->Data.size());
        auto records = Parse(text);
        if (records)
            Core::Log::Info("CatalogLoader: '{}' -> {} records ({} skipped).",
                            request.Path, records->size(), m_Summary.Skipped);
        return records;
    }

    Core::Result CatalogLoader::SaveFile(const std::filesystem::path& path, std::span<const CatalogRecord> records)
    {
        const std::string text = Serialize(records);

        Core::IO::IORequest request;
        request.Path = path.string();
        auto written = m_Backend->Write(request, std::as_bytes(std::span(text.data(), text.size())));
        if (!written)
        {
            Core::Log::Error("CatalogLoader: cannot write '{}' ({}).", request.Path,
                             Core::ErrorCodeToString(written.error()));
            return Core::Err(written.error());
        }
        return Core::Ok();
    }

    float CatalogLoader::BoundingRadiusFor(const CatalogRecord& record) const
    {
        const auto& radius = record.Attributes.Radius;
        const float earthRadii = (radius && *radius > 0.0f) ? *radius : m_Config.DefaultRadius;
        return earthRadii * m_Config.EarthRadiusToSceneUnits;
    }

    float CatalogLoader::DistanceFor(const CatalogRecord& record) const
    {
        const auto& ly = record.StarDistanceLy;
        const float lightYears = (ly && *ly > 0.0f) ? *ly : m_Config.DefaultDistanceLy;
        return lightYears * m_Config.LightYearToSceneUnits;
    }

    size_t CatalogLoader::Populate(ECS::SceneObjectRegistry& registry, std::span<const CatalogRecord> records)
    {
        struct Placed
        {
            glm::vec3 Position;
            float Radius;
        };

        PlacementRandom rng(m_Config.Seed);
        std::vector<Placed> placed;
        placed.reserve(registry.Size() + records.size());

        // Entities already in the registry take part in separation checks.
        for (const ECS::EntityView& existing : registry.Gather())
            placed.push_back({existing.Position, existing.BoundingRadius});

        m_Summary.Created = 0;
        m_Summary.Duplicates = 0;
        m_Summary.PlacementFallbacks = 0;

        for (const CatalogRecord& record : records)
        {
            if (registry.Find(record.Id) != entt::null)
            {
                ++m_Summary.Duplicates;
                Core::Log::Warn("CatalogLoader: duplicate id '{}', skipped.", record.Id);
                continue;
            }

            const float radius = BoundingRadiusFor(record);
            const float distance = DistanceFor(record);

            std::optional<glm::vec3> position;
            for (uint32_t attempt = 0; attempt < m_Config.MaxPlacementAttempts && !position; ++attempt)
            {
                const glm::vec3 candidate = RandomPointOnSphere(distance, rng);
                bool collides = false;
                for (const Placed& other : placed)
                {
                    const float minDistance = (radius + other.Radius) * m_Config.MinSeparationMultiplier;
                    if (glm::distance(candidate, other.Position) < minDistance)
                    {
                        collides = true;
                        break;
                    }
                }
                if (!collides) position = candidate;
            }

            if (!position)
            {
                ++m_Summary.PlacementFallbacks;
                Core::Log::Warn("CatalogLoader: no free spot for '{}' after {} attempts; placing anyway.",
                                record.Id, m_Config.MaxPlacementAttempts);
                position = RandomPointOnSphere(distance, rng);
            }

            if (registry.CreateEntity(record.Id, *position, record.Attributes, radius) == entt::null)
                continue;

            placed.push_back({*position, radius});
            ++m_Summary.Created;
        }

        Core::Log::Info("CatalogLoader: created {} entities ({} duplicates, {} placement fallbacks).",
                        m_Summary.Created, m_Summary.Duplicates, m_Summary.PlacementFallbacks);
        return m_Summary.Created;
    }

    std::vector<CatalogRecord> CatalogLoader::GenerateSynthetic(size_t count, uint64_t seed)
    {
        PlacementRandom rng(seed);
        std::vector<CatalogRecord> records;
        records.reserve(count);

        for (size_t i = 0; i < count; ++i)
        {
            CatalogRecord record;
            record.Name = std::format("SYN-{:05}", i);
            record.Id = record.Name;

            // Log-uniform mass (0.1 .. 3000 Earth masses); radius loosely follows mass.
            const double mass = std::pow(10.0, rng.Range(-1.0, 3.5));
            const double radius = std::clamp(std::pow(mass, 0.55) * rng.Range(0.7, 1.3), 0.3, 22.0);

            record.Attributes.Mass = static_cast<float>(mass);
            record.Attributes.Radius = static_cast<float>(radius);
            record.Attributes.Temperature = static_cast<float>(rng.Range(40.0, 2600.0));
            record.StarDistanceLy = static_cast<float>(rng.Range(4.0, 400.0));

            // Some rows miss measurements, as in real catalogs.
            if (rng.Next() < 0.1) record.Attributes.Temperature.reset();
            if (rng.Next() < 0.05) record.StarDistanceLy.reset();

            records.push_back(std::move(record));
        }
        return records;
    }

    std::string CatalogLoader::Serialize(std::span<const CatalogRecord> records)
    {
        std::string out = "name,mass,radius,temperature,star_distance,id\n";
        for (const CatalogRecord& record : records)
        {
            out += std::format("{},{},{},{},{},{}\n",
                               QuoteIfNeeded(record.Name),
                               FormatOptional(record.Attributes.Mass),
                               FormatOptional(record.Attributes.Radius),
                               FormatOptional(record.Attributes.Temperature),
                               FormatOptional(record.StarDistanceLy),
                               QuoteIfNeeded(record.Id));
        }
        return out;
    }
}
