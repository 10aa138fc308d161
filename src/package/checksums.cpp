#include "package/checksums.hpp"

#include "common/error.hpp"
#include "common/sha256.hpp"

#include <spdlog/spdlog.h>

namespace stella::package {

std::string ComputeSha256(const Bytes& data) {
    return digest::Sha256Hex(data);
}

std::string BuildChecksumManifest(const std::map<std::string, Bytes>& entries) {
    std::string text;
    for (const auto& [path, data] : entries) {
        if (path == kChecksumsPath) {
            continue;
        }
        if (!text.empty()) {
            text += '\n';
        }
        text += ComputeSha256(data);
        text += "  ";
        text += path;
    }
    return text;
}

CheckReport VerifyChecksums(const ArchiveReader& archive) {
    CheckReport report;
    if (!archive.contains(kChecksumsPath)) {
        report.messages.push_back(kNoChecksumsNote);
        return report;
    }

    const Bytes raw = archive.read(kChecksumsPath);
    const std::string content(raw.begin(), raw.end());

    std::size_t lineStart = 0;
    std::size_t checked = 0;
    while (lineStart < content.size()) {
        std::size_t lineEnd = content.find('\n', lineStart);
        if (lineEnd == std::string::npos) {
            lineEnd = content.size();
        }
        std::string line = content.substr(lineStart, lineEnd - lineStart);
        lineStart = lineEnd + 1;
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }
        if (line.empty()) {
            continue;
        }

        const std::size_t separator = line.find("  ");
        if (separator == std::string::npos) {
            report.messages.push_back("Malformed checksum line: " + line);
            continue;
        }
        const std::string expected = line.substr(0, separator);
        const std::string path = line.substr(separator + 2);

        if (path == kChecksumsPath) {
            continue;
        }
        if (!archive.contains(path)) {
            report.messages.push_back("Missing file: " + path);
            continue;
        }

        std::string actual;
        try {
            actual = ComputeSha256(archive.read(path));
        } catch (const Error& e) {
            report.messages.push_back("Failed to read " + path + ": " + e.what());
            continue;
        }
        ++checked;
        if (actual != expected) {
            report.messages.push_back("Checksum mismatch for " + path);
        }
    }

    report.ok = report.messages.empty();
    spdlog::debug("Checksums: Verified {} entries in {} ({} problems)", checked, archive.path().string(),
                  report.messages.size());
    return report;
}

CheckReport VerifyChecksums(const std::filesystem::path& archivePath) {
    const ArchiveReader archive = ArchiveReader::Open(archivePath);
    return VerifyChecksums(archive);
}

} // namespace stella::package
