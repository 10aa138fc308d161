#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace stella::digest {

// Lowercase hex SHA-256 of the buffer. Throws IOError if the digest backend fails.
std::string Sha256Hex(const uint8_t* data, std::size_t size);
std::string Sha256Hex(const std::vector<uint8_t>& bytes);

} // namespace stella::digest
