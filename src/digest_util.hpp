#ifndef CAMSCOUT_DIGEST_UTIL_HPP
#define CAMSCOUT_DIGEST_UTIL_HPP
/**
 * @file digest_util.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Hash and encoding helpers for camera authentication schemes.
 */
#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace camscout
{

std::array<uint8_t, 16> md5_digest(const std::string& data);
std::array<uint8_t, 20> sha1_digest(const std::string& data);
std::string base64_encode(const std::string& data);
std::string base64_decode(const std::string& data);

} // namespace camscout

#endif // CAMSCOUT_DIGEST_UTIL_HPP
