#pragma once

/// @file text.h
/// @brief Text helpers shared by the heuristic metrics

#include <string>
#include <vector>

#include <absl/strings/string_view.h>

namespace evalkit::eval::heuristic {

/// @brief Decode UTF-8 into code points; malformed bytes become U+FFFD
std::u32string DecodeUtf8(absl::string_view text);

/// @brief Encode one code point as UTF-8
std::string EncodeUtf8(char32_t code_point);

/// @brief Unicode simple lower-case mapping applied per code point
///
/// Malformed UTF-8 bytes come back as U+FFFD.
std::string ToLower(absl::string_view text);

/// @brief Split on runs of ASCII whitespace, dropping empty fields
std::vector<std::string> Fields(absl::string_view text);

/// @brief Strip leading and trailing code points outside the Unicode letter
///        and number categories
std::string TrimNonAlphanumeric(absl::string_view word);

/// @brief Copy with leading and trailing ASCII whitespace removed
std::string TrimSpace(absl::string_view text);

}  // namespace evalkit::eval::heuristic
