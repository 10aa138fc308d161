#pragma once

#include "voxel/voxel_field.hpp"

#include <glm/glm.hpp>

#include <array>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <vector>

// RLEVOX: little-endian header followed by one run-length encoded x-row per (y, z),
// z outer and y inner. Each run record is (length:u16, value:u8, flags:u8).
namespace stella::voxel::rlevox {

inline constexpr std::array<uint8_t, 4> kMagic{'S', 'T', 'V', 'X'};
inline constexpr std::array<uint8_t, 4> kEncodingRle1{'R', 'L', 'E', '1'};
inline constexpr uint16_t kVersion = 1;
inline constexpr uint16_t kHeaderSize = 64;
// Bytes of defined header fields; header_size may be larger but never smaller.
inline constexpr uint16_t kMinHeaderSize = 44;
inline constexpr std::size_t kRunRecordSize = 4;
inline constexpr uint32_t kMaxRunLength = 65535;

struct Header {
    uint16_t version = kVersion;
    uint16_t headerSize = kHeaderSize;
    glm::uvec3 dims{0u};
    float voxelSize = 0.0f;
    glm::vec3 origin{0.0f};
};

struct RunRecord {
    uint16_t length = 0;
    uint8_t value = 0;
};

// Maximal runs over one row, with runs longer than kMaxRunLength split into consecutive records.
std::vector<RunRecord> EncodeRow(const uint8_t* cells, std::size_t length);

std::vector<uint8_t> Encode(const VoxelField& field);

// Validates magic, version and encoding and returns the header fields. Throws FormatError or
// CorruptPayloadError(UnexpectedEof) for a header shorter than kMinHeaderSize.
Header ReadHeader(const uint8_t* data, std::size_t size);

// Throws FormatError for header problems and CorruptPayloadError for payload problems.
VoxelField Decode(const uint8_t* data, std::size_t size);
VoxelField Decode(const std::vector<uint8_t>& bytes);

void WriteFile(const std::filesystem::path& path, const VoxelField& field);
VoxelField ReadFile(const std::filesystem::path& path);

} // namespace stella::voxel::rlevox
