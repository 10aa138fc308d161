#include "package/zip_archive.hpp"

#include "common/error.hpp"

#include <limits>
#include <miniz.h>
#include <spdlog/spdlog.h>
#include <stdexcept>
#include <system_error>

namespace fs = std::filesystem;

namespace stella::package {

namespace {

std::string LastZipError(mz_zip_archive* zip) {
    return mz_zip_get_error_string(mz_zip_get_last_error(zip));
}

} // namespace

bool IsSafeEntryPath(std::string_view path) {
    if (path.empty() || path.front() == '/' || path.find('\\') != std::string_view::npos) {
        return false;
    }
    std::size_t start = 0;
    while (start <= path.size()) {
        const std::size_t slash = path.find('/', start);
        const std::size_t end = (slash == std::string_view::npos) ? path.size() : slash;
        const std::string_view segment = path.substr(start, end - start);
        if (segment.empty() || segment == "." || segment == "..") {
            return false;
        }
        if (slash == std::string_view::npos) {
            break;
        }
        start = slash + 1;
    }
    return true;
}

struct ArchiveReader::Handle {
    mz_zip_archive zip{};
    bool open = false;

    ~Handle() {
        if (open) {
            mz_zip_reader_end(&zip);
        }
    }
};

ArchiveReader ArchiveReader::Open(const fs::path& path) {
    std::error_code ec;
    if (!fs::is_regular_file(path, ec)) {
        throw IOError("File not found: " + path.string());
    }

    auto handle = std::make_unique<Handle>();
    if (!mz_zip_reader_init_file(&handle->zip, path.string().c_str(), 0)) {
        const std::string reason = LastZipError(&handle->zip);
        throw StructuralError(StructuralErrorCode::NotAnArchive,
                              "Not a valid ZIP file: " + path.string() + " (" + reason + ")");
    }
    handle->open = true;
    return ArchiveReader(path, std::move(handle));
}

ArchiveReader::ArchiveReader(fs::path path, std::unique_ptr<Handle> handle)
    : archivePath(std::move(path)),
      handle(std::move(handle)) {}

ArchiveReader::ArchiveReader(ArchiveReader&& other) noexcept = default;
ArchiveReader& ArchiveReader::operator=(ArchiveReader&& other) noexcept = default;
ArchiveReader::~ArchiveReader() = default;

bool ArchiveReader::contains(const std::string& entry) const {
    return mz_zip_reader_locate_file(&handle->zip, entry.c_str(), nullptr, MZ_ZIP_FLAG_CASE_SENSITIVE) >= 0;
}

std::vector<std::string> ArchiveReader::entryNames() const {
    std::vector<std::string> names;
    for (const auto& info : entries()) {
        names.push_back(info.path);
    }
    return names;
}

std::vector<EntryInfo> ArchiveReader::entries() const {
    const mz_uint count = mz_zip_reader_get_num_files(&handle->zip);
    std::vector<EntryInfo> out;
    out.reserve(count);
    for (mz_uint i = 0; i < count; ++i) {
        mz_zip_archive_file_stat stat;
        if (!mz_zip_reader_file_stat(&handle->zip, i, &stat)) {
            throw IOError("Failed to stat entry " + std::to_string(i) + " in " + archivePath.string() + ": "
                          + LastZipError(&handle->zip));
        }
        out.push_back({stat.m_filename, stat.m_comp_size, stat.m_uncomp_size});
    }
    return out;
}

Bytes ArchiveReader::read(const std::string& entry) const {
    const int index = mz_zip_reader_locate_file(&handle->zip, entry.c_str(), nullptr, MZ_ZIP_FLAG_CASE_SENSITIVE);
    if (index < 0) {
        throw StructuralError(StructuralErrorCode::MissingEntry,
                              "Entry not found in " + archivePath.string() + ": " + entry);
    }

    mz_zip_archive_file_stat stat;
    if (!mz_zip_reader_file_stat(&handle->zip, static_cast<mz_uint>(index), &stat)) {
        throw IOError("Failed to stat " + entry + ": " + LastZipError(&handle->zip));
    }
    if (stat.m_uncomp_size > std::numeric_limits<std::size_t>::max()) {
        throw IOError("Entry too large to read: " + entry);
    }

    Bytes data(static_cast<std::size_t>(stat.m_uncomp_size));
    if (data.empty()) {
        return data;
    }
    if (!mz_zip_reader_extract_to_mem(&handle->zip, static_cast<mz_uint>(index), data.data(), data.size(), 0)) {
        throw IOError("Failed to extract " + entry + ": " + LastZipError(&handle->zip));
    }
    return data;
}

void ArchiveReader::extractAll(const fs::path& destDir) const {
    const mz_uint count = mz_zip_reader_get_num_files(&handle->zip);
    std::error_code ec;
    fs::create_directories(destDir, ec);
    if (ec) {
        throw IOError("Failed to create directory " + destDir.string() + ": " + ec.message());
    }

    for (mz_uint i = 0; i < count; ++i) {
        mz_zip_archive_file_stat stat;
        if (!mz_zip_reader_file_stat(&handle->zip, i, &stat)) {
            throw IOError("Failed to stat entry " + std::to_string(i) + ": " + LastZipError(&handle->zip));
        }

        std::string name = stat.m_filename;
        const bool isDirectory = mz_zip_reader_is_file_a_directory(&handle->zip, i);
        if (isDirectory && !name.empty() && name.back() == '/') {
            name.pop_back();
        }
        if (!IsSafeEntryPath(name)) {
            throw StructuralError(StructuralErrorCode::UnsafePath, "Refusing to extract unsafe entry: " + name);
        }

        const fs::path outPath = destDir / fs::path(name);
        if (isDirectory) {
            fs::create_directories(outPath, ec);
        } else {
            fs::create_directories(outPath.parent_path(), ec);
        }
        if (ec) {
            throw IOError("Failed to create directory for " + outPath.string() + ": " + ec.message());
        }
        if (isDirectory) {
            continue;
        }
        if (!mz_zip_reader_extract_to_file(&handle->zip, i, outPath.string().c_str(), 0)) {
            spdlog::error("ArchiveReader: Failed to extract: {}", name);
            throw IOError("Failed to extract " + name + ": " + LastZipError(&handle->zip));
        }
    }

    spdlog::info("ArchiveReader: Extracted {} entries to {}", count, destDir.string());
}

struct ArchiveWriter::Handle {
    mz_zip_archive zip{};
    bool open = false;

    ~Handle() {
        if (open) {
            mz_zip_writer_end(&zip);
        }
    }
};

ArchiveWriter::ArchiveWriter(const fs::path& path, int compressionLevel, std::optional<std::time_t> timestamp)
    : archivePath(path),
      compressionLevel(compressionLevel),
      timestamp(timestamp),
      handle(std::make_unique<Handle>()) {
    if (compressionLevel < MZ_NO_COMPRESSION || compressionLevel > MZ_UBER_COMPRESSION) {
        throw std::invalid_argument("ArchiveWriter: compression level must be in [0, 10], got "
                                    + std::to_string(compressionLevel));
    }
    if (!mz_zip_writer_init_file(&handle->zip, path.string().c_str(), 0)) {
        throw IOError("Failed to create zip file " + path.string() + ": " + LastZipError(&handle->zip));
    }
    handle->open = true;
}

ArchiveWriter::~ArchiveWriter() = default;

void ArchiveWriter::add(const std::string& entry, const Bytes& data) {
    if (!handle->open) {
        throw std::logic_error("ArchiveWriter: add() after finalize()");
    }
    MZ_TIME_T modified = timestamp.value_or(0);
    if (!mz_zip_writer_add_mem_ex_v2(&handle->zip,
                                     entry.c_str(),
                                     data.data(),
                                     data.size(),
                                     nullptr,
                                     0,
                                     static_cast<mz_uint>(compressionLevel),
                                     0,
                                     0,
                                     timestamp ? &modified : nullptr,
                                     nullptr,
                                     0,
                                     nullptr,
                                     0)) {
        throw IOError("Failed to add file: " + entry + " (" + LastZipError(&handle->zip) + ")");
    }
}

void ArchiveWriter::finalize() {
    if (!handle->open) {
        return;
    }
    if (!mz_zip_writer_finalize_archive(&handle->zip)) {
        throw IOError("Failed to finalize zip " + archivePath.string() + ": " + LastZipError(&handle->zip));
    }
    handle->open = false;
    if (!mz_zip_writer_end(&handle->zip)) {
        throw IOError("Failed to close zip " + archivePath.string());
    }
}

} // namespace stella::package
