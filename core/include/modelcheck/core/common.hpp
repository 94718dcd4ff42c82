#pragma once

/**
 * @file common.hpp
 * @brief Common utilities and macros for modelcheck
 */

#include <algorithm>
#include <cctype>
#include <cstdint>
#include <string>
#include <string_view>
#include <cpptrace/cpptrace.hpp>

#include "logger.hpp"

// ============================================================================
// Assertion Macros (Debug-only)
// ============================================================================

#ifdef DEBUG
#define MODELCHECK_ASSERT(condition, message)                                  \
  do {                                                                         \
    if (!(condition)) {                                                        \
        std::string trace = cpptrace::generate_trace().to_string();            \
        modelcheck::core::Logger::critical(                                    \
            "ASSERTION FAILED: {}\nStack Trace:\n{}", message, trace);         \
      throw cpptrace::runtime_error(                                           \
          "ASSERTION FAILED: " + std::string(message) +                        \
          "\nFile: " __FILE__ "\nLine: " + std::to_string(__LINE__));          \
    }                                                                          \
  } while (0)
#else
#define MODELCHECK_ASSERT(condition, message) (void)(0)
#endif

// ============================================================================
// Utilities
// ============================================================================

namespace modelcheck::util {

/**
 * @brief ASCII case-insensitive string comparison.
 * File names in a model folder are matched the same way regardless of the
 * host file system.
 */
inline bool equalsIgnoreCase(std::string_view a, std::string_view b) {
  return std::ranges::equal(a, b, [](char x, char y) {
    return std::tolower(static_cast<unsigned char>(x)) ==
           std::tolower(static_cast<unsigned char>(y));
  });
}

/**
 * @brief Removes the final extension from a file name.
 * "def_mario_001_col.nutexb" -> "def_mario_001_col"
 */
inline std::string_view stripExtension(std::string_view fileName) {
  const auto slash = fileName.find_last_of("/\\");
  const auto dot = fileName.rfind('.');
  if (dot == std::string_view::npos ||
      (slash != std::string_view::npos && dot < slash) || dot == 0 ||
      (slash != std::string_view::npos && dot == slash + 1)) {
    return fileName;
  }
  return fileName.substr(0, dot);
}

} // namespace modelcheck::util
