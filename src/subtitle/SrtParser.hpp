// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>

#include <string_view>
#include <vector>

namespace srtvoice
{

/// @brief Parses an SRT timestamp such as "00:01:02,345" (a '.' decimal separator is also accepted).
/// @param text The timestamp text, without surrounding whitespace.
/// @return The timestamp as milliseconds, or a ParseError.
[[nodiscard]] auto parseSrtTimestamp(std::string_view text) -> Result<Milliseconds>;

/// @brief Parses SubRip subtitle content into cues ordered by start time.
///
/// Accepts an optional UTF-8 BOM, LF or CRLF line endings, and blocks separated by one or
/// more blank lines. The numeric index line is optional; when missing, cues are numbered
/// by position. Multi-line cue text is joined with '\n'.
/// @param content The full file content.
/// @return The cues, or a ParseError naming the offending line.
[[nodiscard]] auto parseSrt(std::string_view content) -> Result<std::vector<Cue>>;

/// @brief Reads and parses an SRT file.
/// @param path The file path.
/// @return The cues, or an IoError/ParseError.
[[nodiscard]] auto loadSrtFile(std::string_view path) -> Result<std::vector<Cue>>;

} // namespace srtvoice
