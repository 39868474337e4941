#pragma once

/**
 * @file version.hpp
 * @brief cvec library version information
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace cvec {

/// cvec library version string
constexpr const char* kLibraryVersion = "0.1.0";

/// Build identifier
constexpr const char* kBuildId = "dev";

}  // namespace cvec
