#include "common/file_utils.hpp"

#include "common/error.hpp"

#include <fstream>
#include <random>
#include <spdlog/spdlog.h>
#include <system_error>

namespace fs = std::filesystem;

namespace {

std::string RandomSuffix() {
    static constexpr char kAlphabet[] = "0123456789abcdef";
    std::random_device device;
    std::mt19937 generator(device());
    std::uniform_int_distribution<int> pick(0, 15);
    std::string suffix(12, '0');
    for (char& ch : suffix) {
        ch = kAlphabet[pick(generator)];
    }
    return suffix;
}

} // namespace

namespace stella::file {

Bytes ReadFileBytes(const fs::path& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file.is_open()) {
        throw IOError("Failed to open file: " + path.string());
    }
    file.seekg(0, std::ios::end);
    const std::streamsize size = file.tellg();
    if (size < 0) {
        throw IOError("Failed to determine size of file: " + path.string());
    }
    if (size == 0) {
        return {};
    }
    file.seekg(0, std::ios::beg);
    Bytes buffer(static_cast<size_t>(size));
    if (!file.read(reinterpret_cast<char*>(buffer.data()), size)) {
        throw IOError("Failed to read file: " + path.string());
    }
    return buffer;
}

void WriteFileBytes(const fs::path& path, const Bytes& bytes) {
    ScopedTempFile temp(path);
    {
        std::ofstream out(temp.path(), std::ios::binary | std::ios::trunc);
        if (!out) {
            throw IOError("Failed to open file for writing: " + temp.path().string());
        }
        if (!bytes.empty()) {
            out.write(reinterpret_cast<const char*>(bytes.data()), static_cast<std::streamsize>(bytes.size()));
        }
        out.flush();
        if (!out) {
            throw IOError("Failed to write file: " + temp.path().string());
        }
    }
    temp.commit();
}

ScopedTempFile::ScopedTempFile(const fs::path& destination)
    : destinationPath(destination) {
    const fs::path parent = destination.has_parent_path() ? destination.parent_path() : fs::path(".");
    std::error_code ec;
    fs::create_directories(parent, ec);
    if (ec) {
        throw IOError("Failed to create directory " + parent.string() + ": " + ec.message());
    }
    tempPath = parent / ("." + destination.filename().string() + ".tmp-" + RandomSuffix());
}

ScopedTempFile::~ScopedTempFile() {
    if (committed) {
        return;
    }
    std::error_code ec;
    fs::remove(tempPath, ec);
    if (ec) {
        spdlog::warn("ScopedTempFile: Failed to remove {}: {}", tempPath.string(), ec.message());
    }
}

void ScopedTempFile::commit() {
    std::error_code ec;
    fs::rename(tempPath, destinationPath, ec);
    if (ec) {
        spdlog::error("ScopedTempFile: Failed to move {} to {}", tempPath.string(), destinationPath.string());
        throw IOError("Failed to move " + tempPath.string() + " into place at "
                      + destinationPath.string() + ": " + ec.message());
    }
    committed = true;
}

} // namespace stella::file
