#include "voxel/rlevox.hpp"

#include "common/error.hpp"
#include "common/file_utils.hpp"

#include <algorithm>
#include <cstring>
#include <limits>
#include <spdlog/spdlog.h>
#include <string>

namespace stella::voxel::rlevox {

namespace {

constexpr std::size_t kVersionOffset = 4;
constexpr std::size_t kHeaderSizeOffset = 6;
constexpr std::size_t kDimsOffset = 8;
constexpr std::size_t kVoxelSizeOffset = 20;
constexpr std::size_t kOriginOffset = 24;
constexpr std::size_t kEncodingOffset = 36;
// Fields up to this many cells are allocated up front and decoded record by record.
constexpr uint64_t kEagerDecodeCells = uint64_t{1} << 24;

void PutU16(std::vector<uint8_t>& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>(value & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
}

void PutU32(std::vector<uint8_t>& out, uint32_t value) {
    for (int shift = 0; shift < 32; shift += 8) {
        out.push_back(static_cast<uint8_t>((value >> shift) & 0xFF));
    }
}

void PutF32(std::vector<uint8_t>& out, float value) {
    static_assert(sizeof(float) == sizeof(uint32_t), "float32 expected");
    uint32_t bits = 0;
    std::memcpy(&bits, &value, sizeof(bits));
    PutU32(out, bits);
}

uint16_t GetU16(const uint8_t* data) {
    return static_cast<uint16_t>(static_cast<uint16_t>(data[0]) | (static_cast<uint16_t>(data[1]) << 8));
}

uint32_t GetU32(const uint8_t* data) {
    return static_cast<uint32_t>(data[0])
        | (static_cast<uint32_t>(data[1]) << 8)
        | (static_cast<uint32_t>(data[2]) << 16)
        | (static_cast<uint32_t>(data[3]) << 24);
}

float GetF32(const uint8_t* data) {
    const uint32_t bits = GetU32(data);
    float value = 0.0f;
    std::memcpy(&value, &bits, sizeof(value));
    return value;
}

std::string TagText(const uint8_t* data) {
    std::string text;
    for (std::size_t i = 0; i < 4; ++i) {
        const char ch = static_cast<char>(data[i]);
        text += (ch >= 0x20 && ch < 0x7F) ? ch : '?';
    }
    return text;
}

std::string RowLocation(uint32_t z, uint32_t y, uint64_t x) {
    return "z=" + std::to_string(z) + ", y=" + std::to_string(y) + ", x=" + std::to_string(x);
}

} // namespace

std::vector<RunRecord> EncodeRow(const uint8_t* cells, std::size_t length) {
    std::vector<RunRecord> runs;
    std::size_t x = 0;
    while (x < length) {
        const uint8_t value = cells[x] ? 1 : 0;
        std::size_t end = x + 1;
        while (end < length && (cells[end] ? 1 : 0) == value) {
            ++end;
        }
        std::size_t remaining = end - x;
        while (remaining > 0) {
            const std::size_t chunk = std::min<std::size_t>(remaining, kMaxRunLength);
            runs.push_back({static_cast<uint16_t>(chunk), value});
            remaining -= chunk;
        }
        x = end;
    }
    return runs;
}

std::vector<uint8_t> Encode(const VoxelField& field) {
    const glm::uvec3& dims = field.getDims();
    const glm::vec3& origin = field.getOrigin();

    std::vector<uint8_t> out;
    out.reserve(kHeaderSize + static_cast<std::size_t>(dims.y) * dims.z * kRunRecordSize * 2);

    out.insert(out.end(), kMagic.begin(), kMagic.end());
    PutU16(out, kVersion);
    PutU16(out, kHeaderSize);
    PutU32(out, dims.x);
    PutU32(out, dims.y);
    PutU32(out, dims.z);
    PutF32(out, field.getVoxelSize());
    PutF32(out, origin.x);
    PutF32(out, origin.y);
    PutF32(out, origin.z);
    out.insert(out.end(), kEncodingRle1.begin(), kEncodingRle1.end());
    PutU32(out, 0);
    out.resize(kHeaderSize, 0);

    for (uint32_t z = 0; z < dims.z; ++z) {
        for (uint32_t y = 0; y < dims.y; ++y) {
            for (const auto& run : EncodeRow(field.row(y, z), dims.x)) {
                PutU16(out, run.length);
                out.push_back(run.value);
                out.push_back(0);
            }
        }
    }

    spdlog::debug("RLEVOX: Encoded {}x{}x{} field into {} bytes", dims.x, dims.y, dims.z, out.size());
    return out;
}

Header ReadHeader(const uint8_t* data, std::size_t size) {
    if (size < kMagic.size()) {
        throw CorruptPayloadError(CodecErrorCode::UnexpectedEof,
                                  "Unexpected EOF in header: got " + std::to_string(size) + " bytes");
    }
    if (!std::equal(kMagic.begin(), kMagic.end(), data)) {
        throw FormatError(CodecErrorCode::BadMagic, "Invalid magic: " + TagText(data) + ", expected STVX");
    }
    if (size < kMinHeaderSize) {
        throw CorruptPayloadError(CodecErrorCode::UnexpectedEof,
                                  "Unexpected EOF in header: got " + std::to_string(size) + " bytes, need "
                                  + std::to_string(kMinHeaderSize));
    }

    Header header;
    header.version = GetU16(data + kVersionOffset);
    if (header.version != kVersion) {
        throw FormatError(CodecErrorCode::UnsupportedVersion,
                          "Unsupported version: " + std::to_string(header.version));
    }
    if (!std::equal(kEncodingRle1.begin(), kEncodingRle1.end(), data + kEncodingOffset)) {
        throw FormatError(CodecErrorCode::UnsupportedEncoding,
                          "Unsupported encoding: " + TagText(data + kEncodingOffset));
    }

    header.headerSize = GetU16(data + kHeaderSizeOffset);
    if (header.headerSize < kMinHeaderSize) {
        throw FormatError(CodecErrorCode::InvalidHeader,
                          "Invalid header size: " + std::to_string(header.headerSize));
    }
    header.dims = glm::uvec3(GetU32(data + kDimsOffset),
                             GetU32(data + kDimsOffset + 4),
                             GetU32(data + kDimsOffset + 8));
    if (header.dims.x == 0 || header.dims.y == 0 || header.dims.z == 0) {
        throw FormatError(CodecErrorCode::InvalidHeader,
                          "Invalid dimensions: " + std::to_string(header.dims.x) + "x"
                          + std::to_string(header.dims.y) + "x" + std::to_string(header.dims.z));
    }
    header.voxelSize = GetF32(data + kVoxelSizeOffset);
    header.origin = glm::vec3(GetF32(data + kOriginOffset),
                              GetF32(data + kOriginOffset + 4),
                              GetF32(data + kOriginOffset + 8));
    // Bytes 40..43 are reserved and ignored on read.
    return header;
}

VoxelField Decode(const uint8_t* data, std::size_t size) {
    const Header header = ReadHeader(data, size);
    const glm::uvec3& dims = header.dims;

    if (header.headerSize > size) {
        throw CorruptPayloadError(CodecErrorCode::UnexpectedEof,
                                  "Unexpected EOF: header_size " + std::to_string(header.headerSize)
                                  + " exceeds data size " + std::to_string(size));
    }

    // Larger fields must first show a payload big enough to fill them: every row needs at
    // least ceil(dim_x / kMaxRunLength) records.
    const uint64_t rows = static_cast<uint64_t>(dims.y) * dims.z;
    const uint64_t recordsPerRow = (static_cast<uint64_t>(dims.x) + kMaxRunLength - 1) / kMaxRunLength;
    const uint64_t availableRecords = (size - header.headerSize) / kRunRecordSize;
    if (rows > kEagerDecodeCells / dims.x && rows > availableRecords / recordsPerRow) {
        throw CorruptPayloadError(CodecErrorCode::UnexpectedEof,
                                  "Unexpected EOF: payload of " + std::to_string(size - header.headerSize)
                                  + " bytes cannot hold " + std::to_string(rows) + " rows");
    }
    if (rows > std::numeric_limits<std::size_t>::max() / dims.x) {
        throw FormatError(CodecErrorCode::InvalidHeader, "Invalid dimensions: cell count not addressable");
    }

    VoxelField field(dims, header.voxelSize, header.origin);
    std::size_t pos = header.headerSize;

    for (uint32_t z = 0; z < dims.z; ++z) {
        for (uint32_t y = 0; y < dims.y; ++y) {
            uint8_t* rowCells = field.row(y, z);
            uint64_t x = 0;
            while (x < dims.x) {
                if (size - pos < kRunRecordSize) {
                    throw CorruptPayloadError(CodecErrorCode::UnexpectedEof,
                                              "Unexpected EOF at " + RowLocation(z, y, x));
                }
                const uint16_t runLength = GetU16(data + pos);
                const uint8_t value = data[pos + 2];
                pos += kRunRecordSize;

                if (runLength == 0) {
                    throw CorruptPayloadError(CodecErrorCode::InvalidRun,
                                              "Invalid run_length=0 at " + RowLocation(z, y, x));
                }
                if (value > 1) {
                    throw CorruptPayloadError(CodecErrorCode::InvalidRun,
                                              "Invalid run value " + std::to_string(value) + " at "
                                              + RowLocation(z, y, x));
                }
                if (x + runLength > dims.x) {
                    throw CorruptPayloadError(CodecErrorCode::RowLengthMismatch,
                                              "Row length mismatch at z=" + std::to_string(z) + ", y="
                                              + std::to_string(y) + ": got " + std::to_string(x + runLength)
                                              + ", expected " + std::to_string(dims.x));
                }
                if (value == 1) {
                    std::fill(rowCells + x, rowCells + x + runLength, static_cast<uint8_t>(1));
                }
                x += runLength;
            }
        }
    }

    if (pos != size) {
        spdlog::warn("RLEVOX: Ignoring {} trailing bytes after payload", size - pos);
    }
    spdlog::debug("RLEVOX: Decoded {}x{}x{} field ({} solid)", dims.x, dims.y, dims.z, field.solidCount());
    return field;
}

VoxelField Decode(const std::vector<uint8_t>& bytes) {
    return Decode(bytes.data(), bytes.size());
}

void WriteFile(const std::filesystem::path& path, const VoxelField& field) {
    file::WriteFileBytes(path, Encode(field));
}

VoxelField ReadFile(const std::filesystem::path& path) {
    return Decode(file::ReadFileBytes(path));
}

} // namespace stella::voxel::rlevox
