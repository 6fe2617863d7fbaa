#include <charconv>
#include <chrono>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <numbers>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include <glm/glm.hpp>

import Core;
import Graphics;
import ECS;
import Catalog;
import Synthesis;
import Residency;
import Runtime.CatalogStreamer;

using namespace Core;
using namespace Runtime;

namespace
{
    struct Options
    {
        std::filesystem::path CatalogPath;
        std::filesystem::path PrecomputedRoot; // Empty = synthesize everything
        std::filesystem::path BakeRoot;        // Empty = no baking
        std::filesystem::path WriteCatalogPath;
        size_t SyntheticCount = 2000;
        uint32_t Frames = 1200;
        bool Help = false;
    };

    template <typename T>
    bool ParseNumber(std::string_view text, T& out)
    {
        const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), out);
        return ec == std::errc{} && ptr == text.data() + text.size();
    }

    bool ParseOptions(int argc, char** argv, Options& options)
    {
        for (int i = 1; i < argc; ++i)
        {
            const std::string_view arg = argv[i];
            const bool hasValue = i + 1 < argc;

            if (arg == "--help" || arg == "-h") options.Help = true;
            else if (arg == "--frames" && hasValue) { if (!ParseNumber(argv[++i], options.Frames)) return false; }
            else if (arg == "--synthetic" && hasValue) { if (!ParseNumber(argv[++i], options.SyntheticCount)) return false; }
            else if (arg == "--precomputed" && hasValue) options.PrecomputedRoot = argv[++i];
            else if (arg == "--bake" && hasValue) options.BakeRoot = argv[++i];
            else if (arg == "--write-catalog" && hasValue) options.WriteCatalogPath = argv[++i];
            else if (!arg.starts_with("--") && options.CatalogPath.empty()) options.CatalogPath = arg;
            else return false;
        }
        return true;
    }

    void PrintUsage()
    {
        Log::Info("Usage: CatalogViewer [catalog.csv] [--frames N] [--synthetic N]");
        Log::Info("                     [--precomputed DIR] [--bake DIR] [--write-catalog FILE]");
    }
}

// Headless viewer: orbits a camera through the catalog and streams residency.
class CatalogViewerApp
{
public:
    explicit CatalogViewerApp(Options options) : m_Options(std::move(options)) {}

    int Run()
    {
        if (!LoadCatalog())
            return 1;

        if (!m_Options.BakeRoot.empty())
            return Bake() ? 0 : 1;

        std::shared_ptr<Residency::IResourceSource> source;
        if (!m_Options.PrecomputedRoot.empty())
        {
            source = std::make_shared<Residency::FileResourceSource>(m_Options.PrecomputedRoot);
            Log::Info("CatalogViewer: precomputed images from '{}'.", m_Options.PrecomputedRoot.string());
        }

        CatalogStreamer streamer(m_Registry, {}, {}, {}, std::move(source));

        // Orbit well inside the catalog shell so the frustum sweeps across it.
        Graphics::CameraComponent camera;
        camera.Fov = 60.0f;
        camera.AspectRatio = 16.0f / 9.0f;
        camera.Near = 1.0e5f;
        camera.Far = 1.0e10f;

        const float orbitDistance = 1.0e9f;
        const auto frameTime = std::chrono::microseconds(16667);
        auto now = Residency::Clock::now();

        for (uint32_t frame = 0; frame < m_Options.Frames; ++frame)
        {
            const float yaw = static_cast<float>(frame) * (2.0f * std::numbers::pi_v<float> / 1200.0f);
            Graphics::Orbit(camera, glm::vec3(0.0f), yaw, orbitDistance, 0.2f * orbitDistance);

            if (streamer.OnFrame(camera, now))
                Tasks::Scheduler::WaitForAll(); // Headless: let fetches land before the next cycle

            now += frameTime;
        }

        streamer.GetResidency().LogDetailedStats();

        const auto& vis = streamer.GetVisibility().GetStats();
        Log::Info("CatalogViewer: {} frames, {} cycles, last partition {} visible / {} invisible.",
                  streamer.GetFrameNumber(), streamer.GetCycleCount(), vis.LastVisible, vis.LastInvisible);
        return 0;
    }

private:
    bool LoadCatalog()
    {
        std::vector<Catalog::CatalogRecord> records;
        if (!m_Options.CatalogPath.empty())
        {
            auto loaded = m_Loader.LoadFile(m_Options.CatalogPath);
            if (!loaded)
                return false;
            records = std::move(*loaded);
        }
        else
        {
            records = Catalog::CatalogLoader::GenerateSynthetic(m_Options.SyntheticCount, 42);
            Log::Info("CatalogViewer: generated {} synthetic records.", records.size());
        }

        if (!m_Options.WriteCatalogPath.empty())
        {
            if (auto saved = m_Loader.SaveFile(m_Options.WriteCatalogPath, records); !saved)
                return false;
        }

        m_Loader.Populate(m_Registry, records);
        return m_Registry.Size() > 0;
    }

    // Precomputes both tiers for every entity into BakeRoot.
    bool Bake()
    {
        Residency::FileResourceSource sink(m_Options.BakeRoot);
        Synthesis::ProceduralSynthesizer synthesizer;

        size_t written = 0;
        for (const ECS::EntityView& entity : m_Registry.Gather())
        {
            const auto high = synthesizer.Synthesize(entity.Id, entity.Attributes,
                                                     Synthesis::DetailResolutionFor(entity.Attributes));
            const auto low = synthesizer.Synthesize(entity.Id, entity.Attributes, Synthesis::kThumbnailResolution);

            auto storedHigh = sink.Store(entity.Id, Residency::Quality::High, *high);
            auto storedLow = sink.Store(entity.Id, Residency::Quality::Low, *low);
            if (!storedHigh || !storedLow)
            {
                Log::Error("CatalogViewer: failed to bake '{}'.", entity.Id);
                return false;
            }
            ++written;
            synthesizer.ClearCache();
        }

        Log::Info("CatalogViewer: baked {} entities into '{}'.", written, m_Options.BakeRoot.string());
        return true;
    }

    Options m_Options;
    ECS::SceneObjectRegistry m_Registry;
    Catalog::CatalogLoader m_Loader;
};

int main(int argc, char** argv)
{
    Options options;
    if (!ParseOptions(argc, argv, options) || options.Help)
    {
        PrintUsage();
        return options.Help ? 0 : 2;
    }

    Tasks::Scheduler::Initialize();

    int result = 0;
    {
        CatalogViewerApp app(std::move(options));
        result = app.Run();
    }

    Tasks::Scheduler::Shutdown();
    return result;
}
