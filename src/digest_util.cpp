/**
 * @file digest_util.cpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Up to Boost 1.85 the digest classes report their result as an array of words,
 * the canonical byte sequence being each word written most significant byte first.
 * Boost 1.86 and later report the canonical bytes directly.
 */
#include "digest_util.hpp"
#include <algorithm>
#include <type_traits>
#include <boost/beast/core/detail/base64.hpp>
#include <boost/uuid/detail/md5.hpp>
#include <boost/uuid/detail/sha1.hpp>

namespace camscout
{

template <std::size_t N, class Digest>
static std::array<uint8_t, N> digest_bytes(const Digest& digest)
{
    typedef std::remove_extent_t<Digest> element_t;
    static_assert(sizeof(element_t) == 1 || sizeof(element_t) == 4, "unexpected digest layout");
    static_assert(std::extent_v<Digest> * sizeof(element_t) == N, "unexpected digest size");

    std::array<uint8_t, N> result {};
    if constexpr (sizeof(element_t) == 1)
    {
        std::copy(digest, digest + N, result.begin());
    }
    else
    {
        for (std::size_t i = 0; i < N / 4; ++i)
        {
            const uint32_t w = static_cast<uint32_t>(digest[i]);
            result[4 * i + 0] = static_cast<uint8_t>(w >> 24);
            result[4 * i + 1] = static_cast<uint8_t>(w >> 16);
            result[4 * i + 2] = static_cast<uint8_t>(w >> 8);
            result[4 * i + 3] = static_cast<uint8_t>(w);
        }
    }
    return result;
}

std::array<uint8_t, 16> md5_digest(const std::string& data)
{
    boost::uuids::detail::md5 hash;
    boost::uuids::detail::md5::digest_type digest;
    hash.process_bytes(data.data(), data.size());
    hash.get_digest(digest);
    return digest_bytes<16>(digest);
}

std::array<uint8_t, 20> sha1_digest(const std::string& data)
{
    boost::uuids::detail::sha1 hash;
    boost::uuids::detail::sha1::digest_type digest;
    hash.process_bytes(data.data(), data.size());
    hash.get_digest(digest);
    return digest_bytes<20>(digest);
}

std::string base64_encode(const std::string& data)
{
    namespace base64 = boost::beast::detail::base64;
    std::string result(base64::encoded_size(data.size()), '\0');
    result.resize(base64::encode(&result[0], data.data(), data.size()));
    return result;
}

std::string base64_decode(const std::string& data)
{
    namespace base64 = boost::beast::detail::base64;
    std::string result(base64::decoded_size(data.size()), '\0');
    auto written = base64::decode(&result[0], data.data(), data.size());
    result.resize(written.first);
    return result;
}

} // namespace camscout
