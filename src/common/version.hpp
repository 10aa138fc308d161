#pragma once

// Set by the build from the CMake project version.
#ifndef STELLA_VERSION
#define STELLA_VERSION "0.1.0"
#endif

namespace stella {

inline constexpr const char* kLibraryVersion = STELLA_VERSION;

} // namespace stella
