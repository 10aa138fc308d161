#include "common/error.hpp"
#include "test_support.hpp"
#include "voxel/rlevox.hpp"

#include <gtest/gtest.h>

#include <cstring>
#include <random>

namespace stella::voxel {
namespace {

uint32_t ReadU32(const std::vector<uint8_t>& bytes, std::size_t offset) {
    return static_cast<uint32_t>(bytes[offset]) | (static_cast<uint32_t>(bytes[offset + 1]) << 8)
        | (static_cast<uint32_t>(bytes[offset + 2]) << 16) | (static_cast<uint32_t>(bytes[offset + 3]) << 24);
}

void WriteU16(std::vector<uint8_t>& bytes, std::size_t offset, uint16_t value) {
    bytes[offset] = static_cast<uint8_t>(value & 0xFF);
    bytes[offset + 1] = static_cast<uint8_t>(value >> 8);
}

void WriteU32(std::vector<uint8_t>& bytes, std::size_t offset, uint32_t value) {
    for (int i = 0; i < 4; ++i) {
        bytes[offset + i] = static_cast<uint8_t>((value >> (8 * i)) & 0xFF);
    }
}

template <typename ErrorType>
CodecErrorCode DecodeError(const std::vector<uint8_t>& bytes) {
    try {
        rlevox::Decode(bytes);
    } catch (const ErrorType& e) {
        return e.code();
    }
    ADD_FAILURE() << "decode unexpectedly succeeded";
    return CodecErrorCode::InvalidHeader;
}

TEST(RlevoxTest, CubeScenario) {
    const VoxelField field = test::MakeCubeField();
    ASSERT_EQ(field.solidCount(), 216u);

    const std::vector<uint8_t> bytes = rlevox::Encode(field);
    ASSERT_GE(bytes.size(), 64u);
    EXPECT_EQ(std::memcmp(bytes.data(), "STVX", 4), 0);
    EXPECT_EQ(bytes[4], 1);
    EXPECT_EQ(bytes[5], 0);
    EXPECT_EQ(bytes[6], 64);
    EXPECT_EQ(bytes[7], 0);
    EXPECT_EQ(ReadU32(bytes, 8), 10u);
    EXPECT_EQ(ReadU32(bytes, 12), 10u);
    EXPECT_EQ(ReadU32(bytes, 16), 10u);
    EXPECT_EQ(std::memcmp(bytes.data() + 36, "RLE1", 4), 0);
    for (std::size_t i = 40; i < 64; ++i) {
        EXPECT_EQ(bytes[i], 0) << "header byte " << i;
    }

    // The first row (y=0, z=0) is empty: one run of 10 zeros right after the header.
    EXPECT_EQ(bytes[64], 10);
    EXPECT_EQ(bytes[65], 0);
    EXPECT_EQ(bytes[66], 0);
    EXPECT_EQ(bytes[67], 0);

    const VoxelField decoded = rlevox::Decode(bytes);
    EXPECT_EQ(decoded.solidCount(), 216u);
    EXPECT_EQ(decoded, field);
}

TEST(RlevoxTest, RoundTripsEmptyFullAndRandomFields) {
    VoxelField empty(glm::uvec3(7, 3, 5), 0.25f, glm::vec3(1.0f, -2.0f, 3.5f));
    EXPECT_EQ(rlevox::Decode(rlevox::Encode(empty)), empty);

    VoxelField full(glm::uvec3(4, 4, 4));
    full.fillBox(glm::uvec3(0), glm::uvec3(4), true);
    EXPECT_EQ(rlevox::Decode(rlevox::Encode(full)), full);

    std::mt19937 rng(1234);
    std::bernoulli_distribution coin(0.3);
    for (int trial = 0; trial < 5; ++trial) {
        const glm::uvec3 dims(1 + rng() % 17, 1 + rng() % 9, 1 + rng() % 6);
        VoxelField field(dims, 0.05f * static_cast<float>(trial + 1), glm::vec3(-0.3f, 0.1f, 7.7f));
        for (uint32_t z = 0; z < dims.z; ++z) {
            for (uint32_t y = 0; y < dims.y; ++y) {
                for (uint32_t x = 0; x < dims.x; ++x) {
                    field.setSolid(x, y, z, coin(rng));
                }
            }
        }
        const VoxelField decoded = rlevox::Decode(rlevox::Encode(field));
        EXPECT_EQ(decoded, field) << "trial " << trial;
        EXPECT_EQ(decoded.getVoxelSize(), field.getVoxelSize());
        EXPECT_EQ(decoded.getOrigin(), field.getOrigin());
    }
}

TEST(RlevoxTest, RunsAreMaximal) {
    const uint8_t row[] = {0, 0, 1, 1, 1, 0, 1, 1};
    const auto runs = rlevox::EncodeRow(row, sizeof(row));
    ASSERT_EQ(runs.size(), 4u);
    EXPECT_EQ(runs[0].length, 2);
    EXPECT_EQ(runs[0].value, 0);
    EXPECT_EQ(runs[1].length, 3);
    EXPECT_EQ(runs[1].value, 1);
    EXPECT_EQ(runs[2].length, 1);
    EXPECT_EQ(runs[3].length, 2);
    EXPECT_EQ(runs[3].value, 1);
}

TEST(RlevoxTest, LongRunsSplitAtRecordLimit) {
    VoxelField field(glm::uvec3(200000, 1, 1));
    field.fillBox(glm::uvec3(0), glm::uvec3(200000, 1, 1), true);

    const std::vector<uint8_t> bytes = rlevox::Encode(field);
    ASSERT_EQ(bytes.size(), 64u + 4u * rlevox::kRunRecordSize);
    const auto runs = rlevox::EncodeRow(field.row(0, 0), 200000);
    ASSERT_EQ(runs.size(), 4u);
    EXPECT_EQ(runs[0].length, 65535);
    EXPECT_EQ(runs[1].length, 65535);
    EXPECT_EQ(runs[2].length, 65535);
    EXPECT_EQ(runs[3].length, 200000 - 3 * 65535);

    EXPECT_EQ(rlevox::Decode(bytes), field);
}

TEST(RlevoxTest, HeaderErrors) {
    const std::vector<uint8_t> valid = rlevox::Encode(VoxelField(glm::uvec3(2, 2, 2)));

    auto badMagic = valid;
    badMagic[0] = 'X';
    EXPECT_EQ(DecodeError<FormatError>(badMagic), CodecErrorCode::BadMagic);

    auto badVersion = valid;
    WriteU16(badVersion, 4, 2);
    EXPECT_EQ(DecodeError<FormatError>(badVersion), CodecErrorCode::UnsupportedVersion);

    auto badEncoding = valid;
    badEncoding[39] = '2';
    EXPECT_EQ(DecodeError<FormatError>(badEncoding), CodecErrorCode::UnsupportedEncoding);

    auto smallHeader = valid;
    WriteU16(smallHeader, 6, 40);
    EXPECT_EQ(DecodeError<FormatError>(smallHeader), CodecErrorCode::InvalidHeader);

    auto zeroDim = valid;
    WriteU32(zeroDim, 12, 0);
    EXPECT_EQ(DecodeError<FormatError>(zeroDim), CodecErrorCode::InvalidHeader);
}

TEST(RlevoxTest, TruncatedInputIsUnexpectedEof) {
    const std::vector<uint8_t> valid = rlevox::Encode(test::MakeCubeField());

    EXPECT_EQ(DecodeError<CorruptPayloadError>(std::vector<uint8_t>(valid.begin(), valid.begin() + 2)),
              CodecErrorCode::UnexpectedEof);
    EXPECT_EQ(DecodeError<CorruptPayloadError>(std::vector<uint8_t>(valid.begin(), valid.begin() + 30)),
              CodecErrorCode::UnexpectedEof);
    EXPECT_EQ(DecodeError<CorruptPayloadError>(std::vector<uint8_t>(valid.begin(), valid.begin() + 50)),
              CodecErrorCode::UnexpectedEof);
    EXPECT_EQ(DecodeError<CorruptPayloadError>(std::vector<uint8_t>(valid.begin(), valid.end() - 4)),
              CodecErrorCode::UnexpectedEof);
}

TEST(RlevoxTest, HugeDeclaredDimsFailBeforeAllocating) {
    auto bytes = rlevox::Encode(VoxelField(glm::uvec3(1, 1, 1)));
    WriteU32(bytes, 8, 0xFFFFFFFFu);
    WriteU32(bytes, 12, 0xFFFFFFFFu);
    WriteU32(bytes, 16, 0xFFFFFFFFu);
    EXPECT_EQ(DecodeError<CorruptPayloadError>(bytes), CodecErrorCode::UnexpectedEof);
}

TEST(RlevoxTest, ErrorsCarryKindAndCodeNames) {
    auto bytes = rlevox::Encode(VoxelField(glm::uvec3(1, 1, 1)));
    bytes[2] = 'Z';
    try {
        rlevox::Decode(bytes);
        FAIL() << "expected FormatError";
    } catch (const Error& e) {
        EXPECT_EQ(e.kind(), ErrorKind::Format);
        EXPECT_STREQ(ErrorKindName(e.kind()), "FormatError");
        EXPECT_STREQ(CodecErrorCodeName(dynamic_cast<const FormatError&>(e).code()), "BadMagic");
        EXPECT_STREQ(e.what(), "Invalid magic: STZX, expected STVX");
    }
}

TEST(RlevoxTest, InvalidRunsAreRejected) {
    const std::vector<uint8_t> valid = rlevox::Encode(VoxelField(glm::uvec3(4, 1, 1)));
    ASSERT_EQ(valid.size(), 68u);

    auto zeroLength = valid;
    WriteU16(zeroLength, 64, 0);
    EXPECT_EQ(DecodeError<CorruptPayloadError>(zeroLength), CodecErrorCode::InvalidRun);

    auto badValue = valid;
    badValue[66] = 2;
    EXPECT_EQ(DecodeError<CorruptPayloadError>(badValue), CodecErrorCode::InvalidRun);

    auto overshoot = valid;
    WriteU16(overshoot, 64, 5);
    EXPECT_EQ(DecodeError<CorruptPayloadError>(overshoot), CodecErrorCode::RowLengthMismatch);
}

TEST(RlevoxTest, ShortStreamReportsFirstBadRecord) {
    std::vector<uint8_t> bytes = rlevox::Encode(VoxelField(glm::uvec3(4, 3, 2)));
    bytes.resize(68);

    WriteU16(bytes, 64, 0);
    EXPECT_EQ(DecodeError<CorruptPayloadError>(bytes), CodecErrorCode::InvalidRun);

    WriteU16(bytes, 64, 9);
    EXPECT_EQ(DecodeError<CorruptPayloadError>(bytes), CodecErrorCode::RowLengthMismatch);

    WriteU16(bytes, 64, 4);
    EXPECT_EQ(DecodeError<CorruptPayloadError>(bytes), CodecErrorCode::UnexpectedEof);
}

TEST(RlevoxTest, ReservedBytesAreIgnored) {
    const VoxelField field = test::MakeCubeField();
    std::vector<uint8_t> bytes = rlevox::Encode(field);
    WriteU32(bytes, 40, 0xDEADBEEFu);
    EXPECT_EQ(rlevox::Decode(bytes), field);
}

TEST(RlevoxTest, FlagsByteIsIgnored) {
    VoxelField field(glm::uvec3(4, 1, 1));
    field.setSolid(1, 0, 0, true);
    auto bytes = rlevox::Encode(field);
    for (std::size_t offset = 64; offset < bytes.size(); offset += rlevox::kRunRecordSize) {
        bytes[offset + 3] = 0xAB;
    }
    EXPECT_EQ(rlevox::Decode(bytes), field);
}

TEST(RlevoxTest, LargerHeaderAndTrailingBytesAreTolerated) {
    VoxelField field(glm::uvec3(3, 2, 1), 0.5f);
    field.setSolid(2, 1, 0, true);
    const std::vector<uint8_t> encoded = rlevox::Encode(field);

    // Re-home the payload behind a 96 byte header.
    std::vector<uint8_t> widened(encoded.begin(), encoded.begin() + 64);
    widened.resize(96, 0);
    widened.insert(widened.end(), encoded.begin() + 64, encoded.end());
    WriteU16(widened, 6, 96);
    widened.push_back(0xEE);
    widened.push_back(0xEE);

    EXPECT_EQ(rlevox::Decode(widened), field);
}

TEST(RlevoxTest, ReadHeaderReportsFields) {
    const VoxelField field(glm::uvec3(5, 6, 7), 0.2f, glm::vec3(1.0f, 2.0f, 3.0f));
    const auto bytes = rlevox::Encode(field);
    const rlevox::Header header = rlevox::ReadHeader(bytes.data(), bytes.size());
    EXPECT_EQ(header.version, 1);
    EXPECT_EQ(header.headerSize, 64);
    EXPECT_EQ(header.dims, glm::uvec3(5, 6, 7));
    EXPECT_EQ(header.voxelSize, 0.2f);
    EXPECT_EQ(header.origin, glm::vec3(1.0f, 2.0f, 3.0f));
}

TEST(RlevoxTest, FileRoundTrip) {
    test::ScopedTempDir dir;
    const auto path = dir / "nested/dir/collision.rlevox";
    const VoxelField field = test::MakeCubeField();

    rlevox::WriteFile(path, field);
    EXPECT_EQ(rlevox::ReadFile(path), field);
    EXPECT_THROW(rlevox::ReadFile(dir / "missing.rlevox"), IOError);
}

TEST(VoxelFieldTest, RejectsEmptyDimensionsAndMismatchedCells) {
    EXPECT_THROW(static_cast<void>(VoxelField(glm::uvec3(0, 1, 1))), std::invalid_argument);
    EXPECT_THROW(static_cast<void>(VoxelField(glm::uvec3(2, 2, 2), std::vector<uint8_t>(7, 0), 0.1f, glm::vec3(0.0f))),
                 std::invalid_argument);

    VoxelField field(glm::uvec3(2, 2, 2));
    EXPECT_THROW(field.isSolid(2, 0, 0), std::out_of_range);
}

TEST(VoxelFieldTest, StatsDescribeTheGrid) {
    const VoxelStats stats = ComputeStats(test::MakeCubeField());
    EXPECT_EQ(stats.totalVoxels, 1000u);
    EXPECT_EQ(stats.solidVoxels, 216u);
    EXPECT_EQ(stats.emptyVoxels, 784u);
    EXPECT_DOUBLE_EQ(stats.fillRatio, 0.216);
    EXPECT_FLOAT_EQ(stats.worldSize.x, 1.0f);
}

} // namespace
} // namespace stella::voxel
