#pragma once

#include "common/json.hpp"

#include <ctime>
#include <optional>

namespace stella::package {

// miniz's MZ_DEFAULT_LEVEL; valid levels are 0 (store) through 10.
inline constexpr int kDefaultCompressionLevel = 6;

struct PackOptions {
    bool includeChecksums = true;
    int compressionLevel = kDefaultCompressionLevel;
    // Modification time written for every entry. Set it to get byte-identical archives across runs.
    std::optional<std::time_t> fixedTimestamp;
};

// Reads package.includeChecksums, package.compressionLevel and package.fixedTimestamp.
PackOptions PackOptionsFromConfig(const json::Value& root);

} // namespace stella::package
