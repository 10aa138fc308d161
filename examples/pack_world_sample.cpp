#include "common/config_helpers.hpp"
#include "stella/stella.h"

#include <spdlog/spdlog.h>

#include <exception>
#include <string>
#include <utility>

namespace stella::examples {

// A 4m x 3m x 4m room: floor slab plus four walls.
voxel::VoxelField BuildRoom() {
    voxel::VoxelField field(glm::uvec3(40, 30, 40), 0.1f, glm::vec3(-2.0f, 0.0f, -2.0f));
    field.fillBox(glm::uvec3(0, 0, 0), glm::uvec3(40, 1, 40), true);
    field.fillBox(glm::uvec3(0, 0, 0), glm::uvec3(1, 30, 40), true);
    field.fillBox(glm::uvec3(39, 0, 0), glm::uvec3(40, 30, 40), true);
    field.fillBox(glm::uvec3(0, 0, 0), glm::uvec3(40, 30, 1), true);
    field.fillBox(glm::uvec3(0, 0, 39), glm::uvec3(40, 30, 40), true);
    return field;
}

} // namespace stella::examples

int main(int argc, char** argv) {
    if (argc < 2) {
        spdlog::error("usage: {} <output.stella> [config.json]", argv[0]);
        return 2;
    }

    stella::json::Value config = stella::json::Object();
    if (argc > 2) {
        if (auto loaded = stella::config::LoadJsonFile(argv[2], "sample config", spdlog::level::warn)) {
            config = std::move(*loaded);
        }
    }

    try {
        const auto field = stella::examples::BuildRoom();
        const auto stats = stella::voxel::ComputeStats(field);
        spdlog::info("Sample: Room has {} of {} cells solid", stats.solidVoxels, stats.totalVoxels);

        const auto level = stella::schema::MakeLevelDescriptor("Ground Floor");
        const auto manifest = stella::schema::MakeManifest(
            stella::config::ReadStringConfig(config, "world.title", "Sample Room"));

        // Stand-in for a real glTF binary.
        const std::string mesh = "glTF";
        const std::string levelText = level.ToCanonicalText();

        stella::package::PayloadMap payloads;
        payloads[stella::package::LevelEntryPath("0", stella::package::kLevelDescriptorFile)] =
            stella::package::Bytes(levelText.begin(), levelText.end());
        payloads[stella::package::LevelEntryPath("0", stella::package::kRenderMeshFile)] =
            stella::package::Bytes(mesh.begin(), mesh.end());
        payloads[stella::package::LevelEntryPath("0", stella::package::kCollisionFile)] =
            stella::voxel::rlevox::Encode(field);

        const auto output = stella::package::Pack(argv[1], manifest, payloads,
                                                  stella::package::PackOptionsFromConfig(config));

        const auto report = stella::package::Validate(output);
        for (const auto& message : report.messages) {
            spdlog::warn("Sample: {}", message);
        }
        return report.ok ? 0 : 1;
    } catch (const stella::StructuralError& e) {
        spdlog::error("Sample: {} ({}): {}", stella::ErrorKindName(e.kind()),
                      stella::StructuralErrorCodeName(e.code()), e.what());
        return 1;
    } catch (const stella::Error& e) {
        spdlog::error("Sample: {} error: {}", stella::ErrorKindName(e.kind()), e.what());
        return 1;
    } catch (const std::exception& e) {
        spdlog::error("Sample: {}", e.what());
        return 1;
    }
}
