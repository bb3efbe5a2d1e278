// SPDX-License-Identifier: Apache-2.0
#include "Hash.hpp"

#include <openssl/evp.h>

#include <array>
#include <format>
#include <memory>

namespace srtvoice
{

auto sha1Hex(std::string_view input) -> Result<std::string>
{
    auto const* const md = EVP_sha1();
    if (!md)
        return makeError(ErrorCode::Unknown, "EVP_sha1 unavailable");

    auto context = std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)>(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    if (!context)
        return makeError(ErrorCode::Unknown, "Failed to allocate EVP_MD_CTX");

    auto digest = std::array<unsigned char, EVP_MAX_MD_SIZE> {};
    auto digestLength = 0u;

    if (EVP_DigestInit_ex(context.get(), md, nullptr) != 1
        || EVP_DigestUpdate(context.get(), input.data(), input.size()) != 1
        || EVP_DigestFinal_ex(context.get(), digest.data(), &digestLength) != 1)
        return makeError(ErrorCode::Unknown, "Failed to compute SHA-1 digest");

    auto hex = std::string {};
    hex.reserve(digestLength * 2);
    for (auto i = 0u; i < digestLength; ++i)
        hex += std::format("{:02x}", digest[i]);
    return hex;
}

} // namespace srtvoice
