// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>

#include <string>
#include <string_view>

namespace srtvoice
{

/// @brief Computes the SHA-1 digest of the input as 40 lowercase hex characters.
/// @param input The bytes to hash.
/// @return The hex digest, or an error if the digest could not be computed.
[[nodiscard]] auto sha1Hex(std::string_view input) -> Result<std::string>;

} // namespace srtvoice
