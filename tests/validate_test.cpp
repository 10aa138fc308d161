#include "package/package.hpp"
#include "test_support.hpp"

#include <gtest/gtest.h>

#include <fstream>

namespace fs = std::filesystem;

namespace stella::package {
namespace {

using test::ScopedTempDir;
using test::ToBytes;

TEST(ValidateTest, CompleteArchiveIsValid) {
    ScopedTempDir dir;
    const fs::path output = Pack(dir / "world.stella", schema::MakeManifest(), test::MakeLevelPayloads());

    const CheckReport report = Validate(output);
    EXPECT_TRUE(report.ok);
    EXPECT_TRUE(report.messages.empty());
}

TEST(ValidateTest, MissingFileFailsImmediately) {
    ScopedTempDir dir;
    const fs::path path = dir / "absent.stella";
    const CheckReport report = Validate(path);
    EXPECT_FALSE(report.ok);
    EXPECT_EQ(report.messages, (std::vector<std::string>{"File not found: " + path.string()}));
}

TEST(ValidateTest, NonZipFailsImmediately) {
    ScopedTempDir dir;
    const fs::path path = dir / "plain.stella";
    {
        std::ofstream out(path, std::ios::binary);
        out << "plain text, definitely not a zip central directory";
    }
    const CheckReport report = Validate(path);
    EXPECT_FALSE(report.ok);
    EXPECT_EQ(report.messages, (std::vector<std::string>{"Not a valid ZIP file"}));
}

TEST(ValidateTest, ReportsEachMissingLevelFile) {
    ScopedTempDir dir;
    PayloadMap payloads;
    payloads["levels/0/level.json"] = ToBytes(schema::LevelDescriptor().ToCanonicalText());
    const fs::path path = Pack(dir / "partial.stella", schema::MakeManifest(), payloads);

    const CheckReport report = Validate(path);
    EXPECT_FALSE(report.ok);
    EXPECT_EQ(report.messages, (std::vector<std::string>{
                                   "Missing required file: levels/0/render.glb",
                                   "Missing required file: levels/0/collision.rlevox",
                               }));
}

TEST(ValidateTest, MissingManifest) {
    ScopedTempDir dir;
    const fs::path path = dir / "no-manifest.stella";
    test::EntryList entries;
    for (auto& [name, data] : test::MakeLevelPayloads()) {
        entries.emplace_back(name, data);
    }
    test::WriteRawArchive(path, entries);

    EXPECT_EQ(Validate(path).messages, (std::vector<std::string>{"Missing required file: manifest.json"}));
}

TEST(ValidateTest, InvalidManifestJson) {
    ScopedTempDir dir;
    const fs::path path = dir / "bad-json.stella";
    test::WriteRawArchive(path, {{"manifest.json", ToBytes("{\"levels\": [")}});

    const CheckReport report = Validate(path);
    EXPECT_FALSE(report.ok);
    ASSERT_EQ(report.messages.size(), 1u);
    EXPECT_EQ(report.messages[0].rfind("Invalid JSON in manifest.json: ", 0), 0u) << report.messages[0];
}

TEST(ValidateTest, MissingOrEmptyLevels) {
    ScopedTempDir dir;

    const fs::path noLevels = dir / "no-levels.stella";
    test::WriteRawArchive(noLevels, {{"manifest.json", ToBytes(R"({"format": "stella.world"})")}});
    EXPECT_EQ(Validate(noLevels).messages, (std::vector<std::string>{"manifest.json missing 'levels' field"}));

    const fs::path emptyLevels = dir / "empty-levels.stella";
    test::WriteRawArchive(emptyLevels, {{"manifest.json", ToBytes(R"({"levels": []})")}});
    EXPECT_EQ(Validate(emptyLevels).messages, (std::vector<std::string>{"manifest.json has empty 'levels' array"}));

    const fs::path objectLevels = dir / "object-levels.stella";
    test::WriteRawArchive(objectLevels, {{"manifest.json", ToBytes(R"({"levels": {"id": "0"}})")}});
    EXPECT_EQ(Validate(objectLevels).messages,
              (std::vector<std::string>{"manifest.json 'levels' field must be an array, got object"}));
}

TEST(ValidateTest, LevelWithoutIdIsCheckedAsUnknown) {
    ScopedTempDir dir;
    const fs::path path = dir / "anonymous.stella";
    PayloadMap payloads = test::MakeLevelPayloads("unknown");
    test::EntryList entries{{"manifest.json", ToBytes(R"({"levels": [{"path": "x"}, "loose"]})")}};
    entries.emplace_back("levels/unknown/level.json", payloads["levels/unknown/level.json"]);
    test::WriteRawArchive(path, entries);

    EXPECT_EQ(Validate(path).messages, (std::vector<std::string>{
                                           "Missing required file: levels/unknown/render.glb",
                                           "Missing required file: levels/unknown/collision.rlevox",
                                           "Missing required file: levels/unknown/render.glb",
                                           "Missing required file: levels/unknown/collision.rlevox",
                                       }));
}

TEST(ValidateTest, NumericLevelIdNamesItsDirectory) {
    ScopedTempDir dir;
    const fs::path complete = dir / "numeric.stella";
    test::EntryList entries{{"manifest.json", ToBytes(R"({"levels": [{"id": 3}]})")}};
    for (auto& [name, data] : test::MakeLevelPayloads("3")) {
        entries.emplace_back(name, data);
    }
    test::WriteRawArchive(complete, entries);

    const CheckReport report = Validate(complete);
    EXPECT_TRUE(report.ok);
    EXPECT_TRUE(report.messages.empty());

    const fs::path flags = dir / "flags.stella";
    test::WriteRawArchive(flags, {{"manifest.json", ToBytes(R"({"levels": [{"id": true}, {"id": 2.5}]})")}});
    EXPECT_EQ(Validate(flags).messages, (std::vector<std::string>{
                                            "Missing required file: levels/True/level.json",
                                            "Missing required file: levels/True/render.glb",
                                            "Missing required file: levels/True/collision.rlevox",
                                            "Missing required file: levels/2.5/level.json",
                                            "Missing required file: levels/2.5/render.glb",
                                            "Missing required file: levels/2.5/collision.rlevox",
                                        }));
}

TEST(ValidateTest, FoldsInChecksumErrors) {
    ScopedTempDir dir;
    const fs::path original = Pack(dir / "world.stella", schema::MakeManifest(), test::MakeLevelPayloads());

    test::EntryList entries = test::ReadRawArchive(original);
    for (auto& [name, data] : entries) {
        if (name == "levels/0/collision.rlevox") {
            data.back() ^= 0x01;
        }
    }
    const fs::path tampered = dir / "tampered.stella";
    test::WriteRawArchive(tampered, entries);

    const CheckReport report = Validate(tampered);
    EXPECT_FALSE(report.ok);
    EXPECT_EQ(report.messages, (std::vector<std::string>{"Checksum mismatch for levels/0/collision.rlevox"}));
}

TEST(ValidateTest, ArchiveWithoutChecksumsCarriesNoNote) {
    ScopedTempDir dir;
    const fs::path output = Pack(dir / "bare.stella", schema::MakeManifest(), test::MakeLevelPayloads(), false);
    const CheckReport report = Validate(output);
    EXPECT_TRUE(report.ok);
    EXPECT_TRUE(report.messages.empty());
}

} // namespace
} // namespace stella::package
