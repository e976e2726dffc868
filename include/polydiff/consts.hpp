#pragma once
#include <cstddef>
#include <limits>
#include <string_view>

namespace polydiff::consts {

// Grid markers
inline constexpr std::size_t kGap      = std::numeric_limits<std::size_t>::max(); // no line in this cell
inline constexpr std::size_t kNoOrigin = std::numeric_limits<std::size_t>::max(); // line created by an edit

// Options file
inline constexpr std::string_view kOptionsFile = ".polydiff";

inline constexpr std::string_view kKeyIgnoreCase             = "ignore-case:";
inline constexpr std::string_view kKeyIgnoreWhitespace       = "ignore-whitespace:";
inline constexpr std::string_view kKeyIgnoreWhitespaceChange = "ignore-whitespace-change:";
inline constexpr std::string_view kKeyIgnoreEol              = "ignore-eol:";
inline constexpr std::string_view kKeyIgnoreBlankLines       = "ignore-blank-lines:";
inline constexpr std::string_view kKeyReferencePane          = "reference-pane:";

// Unified diff output
inline constexpr std::size_t kUnifiedContext = 3;

// Common characters
inline constexpr char kSpace = ' ';
inline constexpr char kTab   = '\t';
inline constexpr char kCR    = '\r';
inline constexpr char kLF    = '\n';

} // namespace polydiff::consts
