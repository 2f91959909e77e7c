//----------------------------------------------------------------------------------------------------------------------
// File: CryptoUtils.hpp
// Description: OpenSSL backed helpers for generating random identifiers and deriving digests of record content.
//----------------------------------------------------------------------------------------------------------------------
#pragma once
//----------------------------------------------------------------------------------------------------------------------
#include <boost/algorithm/hex.hpp>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>
#include <openssl/sha.h>
//----------------------------------------------------------------------------------------------------------------------
#include <array>
#include <cstdint>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>
//----------------------------------------------------------------------------------------------------------------------

//----------------------------------------------------------------------------------------------------------------------
namespace CryptoUtils {
//----------------------------------------------------------------------------------------------------------------------

using Digest = std::array<std::uint8_t, SHA256_DIGEST_LENGTH>;
using ReadableView = std::span<std::uint8_t const>;

[[nodiscard]] bool FillRandom(std::span<std::uint8_t> buffer);
[[nodiscard]] std::optional<Digest> Sha256(std::initializer_list<ReadableView> segments);

[[nodiscard]] std::string ToHex(ReadableView buffer);
[[nodiscard]] std::optional<std::vector<std::uint8_t>> FromHex(std::string_view hex);

//----------------------------------------------------------------------------------------------------------------------
} // CryptoUtils namespace
//----------------------------------------------------------------------------------------------------------------------

inline bool CryptoUtils::FillRandom(std::span<std::uint8_t> buffer)
{
    if (buffer.empty()) { return true; }
    return RAND_bytes(buffer.data(), static_cast<std::int32_t>(buffer.size())) == 1;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<CryptoUtils::Digest> CryptoUtils::Sha256(std::initializer_list<ReadableView> segments)
{
    std::unique_ptr<EVP_MD_CTX, decltype(&EVP_MD_CTX_free)> upDigestContext(EVP_MD_CTX_new(), &EVP_MD_CTX_free);
    Digest digest{ 0 };

    if (ERR_get_error() != 0 || upDigestContext == nullptr) { return {}; }

    if (!EVP_DigestInit_ex(upDigestContext.get(), EVP_sha256(), nullptr)) { return {}; }

    for (auto const& segment : segments) {
        if (!EVP_DigestUpdate(upDigestContext.get(), segment.data(), segment.size())) { return {}; }
    }

    std::uint32_t length = SHA256_DIGEST_LENGTH;
    if (!EVP_DigestFinal_ex(upDigestContext.get(), digest.data(), &length)) { return {}; }
    if (length != digest.size()) { return {}; }

    return digest;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::string CryptoUtils::ToHex(ReadableView buffer)
{
    std::string hex;
    hex.reserve(buffer.size() * 2);
    boost::algorithm::hex_lower(buffer.begin(), buffer.end(), std::back_inserter(hex));
    return hex;
}

//----------------------------------------------------------------------------------------------------------------------

inline std::optional<std::vector<std::uint8_t>> CryptoUtils::FromHex(std::string_view hex)
{
    if (hex.size() % 2 != 0) { return {}; }

    std::vector<std::uint8_t> buffer;
    buffer.reserve(hex.size() / 2);
    try {
        boost::algorithm::unhex(hex.begin(), hex.end(), std::back_inserter(buffer));
    } catch (boost::algorithm::hex_decode_error const&) {
        return {};
    }

    return buffer;
}

//----------------------------------------------------------------------------------------------------------------------
