#include "package/package.hpp"

#include "common/error.hpp"
#include "common/json.hpp"

#include <spdlog/spdlog.h>

namespace fs = std::filesystem;

namespace stella::package {

namespace {

// Non-string ids are spelled the way a Python writer would format them, so `{"id": 3}`
// names levels/3/ and `{"id": true}` names levels/True/.
std::string LevelIdOrUnknown(const json::Value& level) {
    if (!level.is_object()) {
        return "unknown";
    }
    const auto it = level.find("id");
    if (it == level.end()) {
        return "unknown";
    }
    if (it->is_string()) {
        return it->get<std::string>();
    }
    if (it->is_boolean()) {
        return it->get<bool>() ? "True" : "False";
    }
    if (it->is_null()) {
        return "None";
    }
    return it->dump();
}

void CheckLevels(const ArchiveReader& archive, const json::Value& manifest, std::vector<std::string>& errors) {
    if (!manifest.is_object() || !manifest.contains("levels")) {
        errors.push_back("manifest.json missing 'levels' field");
        return;
    }
    const json::Value& levels = manifest["levels"];
    if (!levels.is_array()) {
        errors.push_back(std::string("manifest.json 'levels' field must be an array, got ") + levels.type_name());
        return;
    }
    if (levels.empty()) {
        errors.push_back("manifest.json has empty 'levels' array");
        return;
    }

    for (const auto& level : levels) {
        const std::string id = LevelIdOrUnknown(level);
        for (const char* file : {kLevelDescriptorFile, kRenderMeshFile, kCollisionFile}) {
            const std::string required = LevelEntryPath(id, file);
            if (!archive.contains(required)) {
                errors.push_back("Missing required file: " + required);
            }
        }
    }
}

} // namespace

CheckReport Validate(const fs::path& archivePath) {
    CheckReport report;
    auto fail = [&report](std::string message) {
        report.ok = false;
        report.messages.push_back(std::move(message));
        return report;
    };

    std::optional<ArchiveReader> archive;
    try {
        archive.emplace(ArchiveReader::Open(archivePath));
    } catch (const IOError&) {
        return fail("File not found: " + archivePath.string());
    } catch (const StructuralError& e) {
        spdlog::debug("Validate: {}", e.what());
        return fail("Not a valid ZIP file");
    }

    std::vector<std::string> errors;
    if (!archive->contains(kManifestPath)) {
        errors.push_back(std::string("Missing required file: ") + kManifestPath);
    } else {
        try {
            const Bytes raw = archive->read(kManifestPath);
            const json::Value manifest = json::Parse(std::string(raw.begin(), raw.end()));
            CheckLevels(*archive, manifest, errors);
        } catch (const json::Exception& e) {
            errors.push_back(std::string("Invalid JSON in manifest.json: ") + e.what());
        } catch (const IOError& e) {
            errors.push_back(std::string("Failed to read manifest.json: ") + e.what());
        }
    }

    if (archive->contains(kChecksumsPath)) {
        try {
            const CheckReport checksums = VerifyChecksums(*archive);
            if (!checksums.ok) {
                errors.insert(errors.end(), checksums.messages.begin(), checksums.messages.end());
            }
        } catch (const IOError& e) {
            errors.push_back(std::string("Failed to read checksums.sha256: ") + e.what());
        }
    }

    report.ok = errors.empty();
    report.messages = std::move(errors);
    spdlog::debug("Validate: {} ({} problems)", archivePath.string(), report.messages.size());
    return report;
}

} // namespace stella::package
