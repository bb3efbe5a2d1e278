// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <string>
#include <string_view>

namespace srtvoice
{

/// @brief Returns true if the UTF-8 text contains any code point in the Cyrillic block (U+0400..U+04FF).
[[nodiscard]] auto containsCyrillic(std::string_view text) -> bool;

/// @brief Transliterates Serbian Latin script to Serbian Cyrillic.
///
/// Handles the digraphs lj, nj and dž (in lower, title and upper case) before single
/// letters. Characters without a Serbian Latin mapping are copied unchanged.
[[nodiscard]] auto toSerbianCyrillic(std::string_view text) -> std::string;

} // namespace srtvoice
