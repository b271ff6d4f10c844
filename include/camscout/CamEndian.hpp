/**
 * @file CamEndian.hpp
 *
 * Copyright 2024 PreAct Technologies
 *
 * Support for endian conversions of wire fields
 * @{
 */
#ifndef CAMSCOUT_CAMENDIAN_HPP
#define CAMSCOUT_CAMENDIAN_HPP

#include <boost/endian/conversion.hpp>
#include <cstring>

namespace camscout
{

/**
 * Read a fixed-size numeric type stored big endian at a location that need not be
 * naturally aligned for that type.
 * @param dst Reference to the location to which the converted value is written.
 * @param src The non-NULL pointer to the location from which the data is read.
 */
template <class NumericType> inline void BE_Get(NumericType& dst, const void* src)
{
    if (src != nullptr)
    {
        NumericType tmp;
        memmove(&tmp, src, sizeof(tmp));
        dst = boost::endian::big_to_native(tmp);
    }
}

/**
 * Store a fixed-size numeric type big endian at a location that need not be
 * naturally aligned for that type.
 */
template <class NumericType> inline void BE_Put(void* dst, const NumericType src)
{
    if (dst != nullptr)
    {
        const NumericType tmp { boost::endian::native_to_big(src) };
        memmove(dst, &tmp, sizeof(tmp));
    }
}

/**
 * Read a fixed-size numeric type stored little endian at a location that need not be
 * naturally aligned for that type.
 */
template <class NumericType> inline void LE_Get(NumericType& dst, const void* src)
{
    if (src != nullptr)
    {
        NumericType tmp;
        memmove(&tmp, src, sizeof(tmp));
        dst = boost::endian::little_to_native(tmp);
    }
}

/**
 * Store a fixed-size numeric type little endian at a location that need not be
 * naturally aligned for that type.
 */
template <class NumericType> inline void LE_Put(void* dst, const NumericType src)
{
    if (dst != nullptr)
    {
        const NumericType tmp { boost::endian::native_to_little(src) };
        memmove(dst, &tmp, sizeof(tmp));
    }
}

} // namespace camscout

#endif // CAMSCOUT_CAMENDIAN_HPP

/** @} */
