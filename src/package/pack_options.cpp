#include "package/pack_options.hpp"

#include "common/config_helpers.hpp"

#include <spdlog/spdlog.h>

namespace stella::package {

PackOptions PackOptionsFromConfig(const json::Value& root) {
    PackOptions options;
    options.includeChecksums = config::ReadBoolConfig(root, {"package.includeChecksums"}, options.includeChecksums);

    const int64_t level = config::ReadIntConfig(root, {"package.compressionLevel"}, options.compressionLevel);
    if (level < 0 || level > 10) {
        spdlog::warn("Config 'package.compressionLevel' must be in [0, 10], got {}; using {}",
                     level, options.compressionLevel);
    } else {
        options.compressionLevel = static_cast<int>(level);
    }

    if (const auto timestamp = config::ReadOptionalIntConfig(root, "package.fixedTimestamp")) {
        if (*timestamp < 0) {
            spdlog::warn("Config 'package.fixedTimestamp' must not be negative; ignoring");
        } else {
            options.fixedTimestamp = static_cast<std::time_t>(*timestamp);
        }
    }
    return options;
}

} // namespace stella::package
