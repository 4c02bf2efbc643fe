#pragma once

/**
 * @file version.hpp
 * @brief CSAF schema version modeled by csafpp
 *
 * Naming convention: kPascalCase for constants (Google C++ Style Guide)
 */

namespace csafpp {

/// Value of document.csaf_version written by this library
constexpr const char* kCsafVersion = "2.0";

}  // namespace csafpp
